#pragma once

#include <stdexcept>
#include <string>

namespace gitea_mcp {

/**
 * @brief Base class for all errors raised by gitea-mcp
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A tool argument is missing or malformed
 *
 * Raised by tool handlers before any network call is made.
 */
class ValidationError : public Error {
public:
    using Error::Error;
};

/**
 * @brief The backend answered with an HTTP status >= 400
 */
class ApiError : public Error {
public:
    ApiError(long status, std::string body)
        : Error("API error " + std::to_string(status) + ": " + body),
          status_(status),
          body_(std::move(body)) {}

    long status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    long status_;
    std::string body_;
};

/**
 * @brief The backend could not be reached or the exchange failed mid-way
 */
class HttpError : public Error {
public:
    using Error::Error;
};

/**
 * @brief Framing or stream fault on the protocol transport
 *
 * Terminal for the server loop.
 */
class TransportError : public Error {
public:
    using Error::Error;
};

/**
 * @brief tools/call named a tool that is not registered
 */
class UnknownToolError : public Error {
public:
    explicit UnknownToolError(const std::string& name)
        : Error("unknown tool: " + name) {}
};

/**
 * @brief Invalid startup configuration
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace gitea_mcp
