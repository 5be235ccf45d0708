#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace imitatus {

struct RequestRecord {
    double timestamp = 0.0;
    std::string method;
    std::string path;
    unsigned status = 0;
    std::string client_address;
};

void to_json(nlohmann::json& j, const RequestRecord& record);

// Process-wide request counters for /debug/vars
class RequestStats {
public:
    explicit RequestStats(std::size_t recent_limit = 5);

    RequestStats(const RequestStats&) = delete;
    RequestStats& operator=(const RequestStats&) = delete;

    void count(const std::string& route_key);
    void record(RequestRecord record);

    std::map<std::string, std::uint64_t> counts() const;
    std::vector<RequestRecord> recent() const;
    std::uint64_t total() const;
    double uptime_seconds() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> counts_;
    std::deque<RequestRecord> recent_;
    std::uint64_t total_ = 0;
    std::size_t recent_limit_;
    const std::chrono::steady_clock::time_point started_;
};

} // namespace imitatus
