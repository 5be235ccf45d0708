#pragma once
#include <boost/beast/http.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace imitatus {
namespace http = boost::beast::http;

// Base for every error that is reported to the client as a structured
// {"error": {"code", "message"}} body.
class ApiError : public std::runtime_error {
public:
    ApiError(http::status status, std::string code, const std::string& message)
        : std::runtime_error(message), status_(status), code_(std::move(code)) {}

    http::status status() const { return status_; }
    const std::string& code() const { return code_; }

private:
    http::status status_;
    std::string code_;
};

class ValidationError : public ApiError {
public:
    ValidationError(std::string code, const std::string& message)
        : ApiError(http::status::bad_request, std::move(code), message) {}
};

class UnauthorizedError : public ApiError {
public:
    UnauthorizedError(std::string code, const std::string& message)
        : ApiError(http::status::unauthorized, std::move(code), message) {}
};

class NotFoundError : public ApiError {
public:
    explicit NotFoundError(const std::string& message)
        : ApiError(http::status::not_found, "not_found", message) {}
};

class MethodNotAllowedError : public ApiError {
public:
    explicit MethodNotAllowedError(std::vector<http::verb> allowed)
        : ApiError(http::status::method_not_allowed, "method_not_allowed",
                   "Method not allowed for this endpoint"),
          allowed_(std::move(allowed)) {}

    const std::vector<http::verb>& allowed() const { return allowed_; }

private:
    std::vector<http::verb> allowed_;
};

class PayloadTooLargeError : public ApiError {
public:
    PayloadTooLargeError()
        : ApiError(http::status::payload_too_large, "payload_too_large",
                   "Request entity too large") {}
};

} // namespace imitatus
