#pragma once

#include "engine.h"
#include "logger.h"
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace swarm {

// Read-only HTTP view of a running engine plus a reload hook:
//   GET  /health  {"running": bool}
//   GET  /status  full engine status
//   POST /reload  partial config as JSON
class StatusServer {
public:
    StatusServer(Engine &engine, Logger &logger);
    ~StatusServer();

    StatusServer(const StatusServer &) = delete;
    StatusServer &operator=(const StatusServer &) = delete;

    // Bind and serve on a background thread; port 0 picks a free port.
    // Returns the bound port, or 0 if binding failed.
    int start(const std::string &host, int port);
    void stop();

    int port() const { return port_; }

private:
    void routes();

    Engine &engine_;
    Logger &logger_;
    std::unique_ptr<httplib::Server> server_;
    int port_{};
    std::jthread thread_;
};

} // namespace swarm
