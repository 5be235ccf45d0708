#include "request_stats.hpp"

namespace imitatus {

void to_json(nlohmann::json& j, const RequestRecord& record) {
    j = nlohmann::json{
        {"timestamp", record.timestamp},
        {"method", record.method},
        {"path", record.path},
        {"status", record.status},
        {"client_address", record.client_address}
    };
}

RequestStats::RequestStats(std::size_t recent_limit)
    : recent_limit_(recent_limit), started_(std::chrono::steady_clock::now()) {}

void RequestStats::count(const std::string& route_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[route_key];
    ++total_;
}

void RequestStats::record(RequestRecord record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (recent_limit_ == 0) {
        return;
    }
    recent_.push_back(std::move(record));
    while (recent_.size() > recent_limit_) {
        recent_.pop_front();
    }
}

std::map<std::string, std::uint64_t> RequestStats::counts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counts_;
}

std::vector<RequestRecord> RequestStats::recent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {recent_.begin(), recent_.end()};
}

std::uint64_t RequestStats::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

double RequestStats::uptime_seconds() const {
    using seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<seconds>(std::chrono::steady_clock::now() - started_).count();
}

} // namespace imitatus
