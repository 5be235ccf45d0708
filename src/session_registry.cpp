#include "session_registry.hpp"
#include "api_error.hpp"
#include "logging.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace imitatus {

namespace {

std::vector<unsigned char> random_bytes(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    return bytes;
}

std::string to_hex(const unsigned char* data, std::size_t size) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

} // namespace

std::string generate_token(std::size_t num_bytes) {
    auto bytes = random_bytes(num_bytes);
    return to_hex(bytes.data(), bytes.size());
}

std::string generate_uuid() {
    auto bytes = random_bytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);

    std::string hex = to_hex(bytes.data(), bytes.size());
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string SessionRegistry::issue(const std::string& user_id) {
    SessionToken session{generate_token(), user_id, std::chrono::system_clock::now()};
    std::string token = session.token;

    std::unique_lock lock(mutex_);
    tokens_.emplace(token, std::move(session));
    Logger::get().debug("Issued token for user {} ({} active)", user_id, tokens_.size());
    return token;
}

std::string SessionRegistry::validate(const std::string& token) const {
    if (token.empty()) {
        throw UnauthorizedError("missing_token", "No token provided");
    }
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        throw UnauthorizedError("invalid_token", "Invalid token");
    }
    return it->second.user_id;
}

std::optional<SessionToken> SessionRegistry::find(const std::string& token) const {
    std::shared_lock lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::revoke(const std::string& token) {
    std::unique_lock lock(mutex_);
    return tokens_.erase(token) > 0;
}

std::size_t SessionRegistry::size() const {
    std::shared_lock lock(mutex_);
    return tokens_.size();
}

} // namespace imitatus
