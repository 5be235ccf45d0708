#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace imitatus {

struct SessionToken {
    std::string token;
    std::string user_id;
    std::chrono::system_clock::time_point issued_at;
};

// Bearer tokens issued at login. Tokens never expire; they live until the
// process exits or they are revoked.
class SessionRegistry {
public:
    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    std::string issue(const std::string& user_id);

    // Returns the principal bound to the token, or throws UnauthorizedError.
    std::string validate(const std::string& token) const;

    std::optional<SessionToken> find(const std::string& token) const;
    bool revoke(const std::string& token);
    std::size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, SessionToken> tokens_;
};

// Hex encoding of `num_bytes` bytes from the OpenSSL CSPRNG.
std::string generate_token(std::size_t num_bytes = 32);

// Random (version 4) UUID in canonical text form.
std::string generate_uuid();

} // namespace imitatus
