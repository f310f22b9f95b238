#pragma once

#include <string_view>

namespace swarm {

// Failures that abort engine start
enum class EngineError {
    ConnectivityError,
    ConfigurationError,
    StrategyError,
    RiskError,
    Cancelled, // stop() arrived while starting
};

// Failures reported by a trading adapter
enum class AdapterError {
    NetworkError,
    AuthError,
    RateLimitError,
    InvalidSymbol,
    ParseError,
    Timeout,
    UnknownError
};

enum class ConfigError {
    FileNotFound,
    ParseError,
    InvalidValue
};

constexpr std::string_view to_string(EngineError e) {
    switch (e) {
    case EngineError::ConnectivityError:
        return "ConnectivityError";
    case EngineError::ConfigurationError:
        return "ConfigurationError";
    case EngineError::StrategyError:
        return "StrategyError";
    case EngineError::RiskError:
        return "RiskError";
    case EngineError::Cancelled:
        return "Cancelled";
    }
    return "UnknownError";
}

constexpr std::string_view to_string(AdapterError e) {
    switch (e) {
    case AdapterError::NetworkError:
        return "NetworkError";
    case AdapterError::AuthError:
        return "AuthError";
    case AdapterError::RateLimitError:
        return "RateLimitError";
    case AdapterError::InvalidSymbol:
        return "InvalidSymbol";
    case AdapterError::ParseError:
        return "ParseError";
    case AdapterError::Timeout:
        return "Timeout";
    case AdapterError::UnknownError:
        return "UnknownError";
    }
    return "UnknownError";
}

constexpr std::string_view to_string(ConfigError e) {
    switch (e) {
    case ConfigError::FileNotFound:
        return "FileNotFound";
    case ConfigError::ParseError:
        return "ParseError";
    case ConfigError::InvalidValue:
        return "InvalidValue";
    }
    return "UnknownError";
}

} // namespace swarm
