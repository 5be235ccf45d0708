#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace imitatus {

struct Item {
    std::uint64_t id = 0;
    std::string name;
    std::optional<std::string> description;
    double price = 0.0;
    std::optional<nlohmann::json> metadata;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
};

// Full mode requires name and price (create, PUT); partial mode accepts any
// subset of fields (PATCH).
enum class FieldMode { Full, Partial };

// Typed request payload for an item. Absent optionals mean "not supplied".
struct ItemFields {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<double> price;
    std::optional<nlohmann::json> metadata;

    // Parses and validates a request body. Throws ValidationError.
    static ItemFields from_json(const nlohmann::json& body, FieldMode mode);

    // Checks presence and value constraints. Throws ValidationError.
    void validate(FieldMode mode) const;

    bool empty() const {
        return !name && !description && !price && !metadata;
    }
};

double to_unix_seconds(std::chrono::system_clock::time_point tp);

void to_json(nlohmann::json& j, const Item& item);

} // namespace imitatus
