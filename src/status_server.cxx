#include "status_server.h"
#include "config.h"
#include <format>
#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace swarm {

namespace {

void reply(httplib::Response &res, int status, const json &body) {
  res.status = status;
  res.set_content(body.dump(), "application/json");
}

} // namespace

StatusServer::StatusServer(Engine &engine, Logger &logger)
    : engine_{engine}, logger_{logger},
      server_{std::make_unique<httplib::Server>()} {
  routes();
}

StatusServer::~StatusServer() { stop(); }

void StatusServer::routes() {
  server_->Get("/health", [this](const httplib::Request &, httplib::Response &res) {
    reply(res, 200, {{"running", engine_.is_running()}});
  });

  server_->Get("/status", [this](const httplib::Request &, httplib::Response &res) {
    reply(res, 200, engine_.status().to_json());
  });

  server_->Post("/reload", [this](const httplib::Request &req, httplib::Response &res) {
    auto body = json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
      reply(res, 400, {{"error", "invalid JSON"}});
      return;
    }

    auto update = update_from_json(body);
    if (not update) {
      reply(res, 400, {{"error", std::string{to_string(update.error())}}});
      return;
    }

    auto result = engine_.reload(*update);
    if (not result) {
      reply(res, 422, {{"error", std::string{to_string(result.error())}}});
      return;
    }
    reply(res, 200, {{"running", engine_.is_running()}});
  });
}

int StatusServer::start(const std::string &host, int port) {
  if (thread_.joinable())
    return port_;

  port_ = port == 0 ? server_->bind_to_any_port(host) : (server_->bind_to_port(host, port) ? port : 0);
  if (port_ <= 0) {
    logger_.error(LogCategory::System,
                  std::format("❌ Status server could not bind {}:{}", host, port));
    port_ = 0;
    return 0;
  }

  thread_ = std::jthread{[this] { server_->listen_after_bind(); }};
  logger_.info(LogCategory::System,
               std::format("🌐 Status server on http://{}:{}", host, port_));
  return port_;
}

void StatusServer::stop() {
  if (not thread_.joinable())
    return;

  server_->stop();
  thread_.join();
}

} // namespace swarm
