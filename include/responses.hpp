#pragma once
#include <boost/beast/http.hpp>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "api_error.hpp"

namespace imitatus {
namespace http = boost::beast::http;

using Response = http::response<http::string_body>;

// Every verb the server understands, in the order it is advertised
const std::vector<http::verb>& supported_methods();

std::string join_methods(const std::vector<http::verb>& methods);

Response make_json_response(http::status status, const nlohmann::json& body, unsigned version);

// Response with no body (204, or HEAD where the caller sets Content-Length)
Response make_empty_response(http::status status, unsigned version);

Response make_error_response(const ApiError& error, unsigned version);

Response make_internal_error_response(unsigned version);

// Server identification and permissive CORS headers
void apply_standard_headers(Response& res);

} // namespace imitatus
