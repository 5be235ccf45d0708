#include "item.hpp"
#include "api_error.hpp"
#include <cmath>
#include <cctype>

namespace imitatus {

namespace {

std::optional<double> coerce_price(const nlohmann::json& value) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        // Only a bare JSON number literal is accepted, independent of locale
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty() || std::isspace(static_cast<unsigned char>(text.front())) ||
            std::isspace(static_cast<unsigned char>(text.back()))) {
            return std::nullopt;
        }
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (!parsed.is_number()) {
            return std::nullopt;
        }
        return parsed.get<double>();
    }
    return std::nullopt;
}

} // namespace

ItemFields ItemFields::from_json(const nlohmann::json& body, FieldMode mode) {
    if (!body.is_object()) {
        throw ValidationError("invalid_body", "Invalid item format - expected object");
    }

    ItemFields fields;

    if (auto it = body.find("name"); it != body.end()) {
        if (!it->is_string()) {
            throw ValidationError("invalid_field", "Field 'name' must be a string");
        }
        fields.name = it->get<std::string>();
    }

    if (auto it = body.find("description"); it != body.end()) {
        if (!it->is_string()) {
            throw ValidationError("invalid_field", "Field 'description' must be a string");
        }
        fields.description = it->get<std::string>();
    }

    if (auto it = body.find("price"); it != body.end()) {
        auto price = coerce_price(*it);
        if (!price) {
            throw ValidationError("invalid_field", "Field 'price' must be a number");
        }
        fields.price = *price;
    }

    if (auto it = body.find("metadata"); it != body.end()) {
        if (!it->is_object()) {
            throw ValidationError("invalid_field", "Field 'metadata' must be an object");
        }
        fields.metadata = *it;
    }

    fields.validate(mode);
    return fields;
}

void ItemFields::validate(FieldMode mode) const {
    if (mode == FieldMode::Full) {
        if (!name) {
            throw ValidationError("missing_field", "Missing required field: name");
        }
        if (!price) {
            throw ValidationError("missing_field", "Missing required field: price");
        }
    }
    if (name && name->empty()) {
        throw ValidationError("invalid_field", "Field 'name' must not be empty");
    }
    if (price && (!std::isfinite(*price) || *price < 0.0)) {
        throw ValidationError("invalid_field", "Field 'price' must be a non-negative number");
    }
}

double to_unix_seconds(std::chrono::system_clock::time_point tp) {
    using seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<seconds>(tp.time_since_epoch()).count();
}

void to_json(nlohmann::json& j, const Item& item) {
    j = nlohmann::json{
        {"id", item.id},
        {"name", item.name},
        {"price", item.price}
    };
    if (item.description) {
        j["description"] = *item.description;
    }
    if (item.metadata) {
        j["metadata"] = *item.metadata;
    }
    j["created_at"] = to_unix_seconds(item.created_at);
    j["updated_at"] = to_unix_seconds(item.updated_at);
}

} // namespace imitatus
