#include "config.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <filesystem>
#include <algorithm>
#include <stdexcept>
#include <set>
#include <thread>
#include <type_traits>
#include <CLI/CLI.hpp>

// Declaration for environ
extern char** environ;

namespace fs = std::filesystem;
namespace imitatus {

Config::Config() {
    // Empty constructor
}

namespace {

// Keys whose values are free text; "1234" stays a string here
const std::set<std::string> TEXT_KEYS = {
    "host", "log.level", "log.file", "auth.username", "auth.password"
};

} // namespace

void Config::set_parsed(const std::string& key, const std::string& value, bool numeric_bools) {
    if (TEXT_KEYS.count(key) > 0) {
        set<std::string>(key, value);
        return;
    }

    // Try to parse value as bool
    if (value == "true" || (numeric_bools && value == "1")) {
        set<bool>(key, true);
    } else if (value == "false" || (numeric_bools && value == "0")) {
        set<bool>(key, false);
    } else {
        // Try to parse value as int; only accept it if the whole value is numeric
        try {
            std::size_t consumed = 0;
            int int_value = std::stoi(value, &consumed);
            if (consumed == value.size()) {
                set<int>(key, int_value);
            } else {
                set<std::string>(key, value);
            }
        } catch (const std::exception&) {
            // Default to string
            set<std::string>(key, value);
        }
    }
}

void Config::load_from_env() {
    const std::string prefix = ENV_PREFIX;

    // Iterate through all environment variables
    for (char** env = environ; env && *env; ++env) {
        std::string env_var = *env;
        size_t equals_pos = env_var.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }

        std::string key = env_var.substr(0, equals_pos);
        std::string value = env_var.substr(equals_pos + 1);

        // Only process environment variables with IMITATUS_ prefix
        if (key.compare(0, prefix.size(), prefix) != 0 || key.size() == prefix.size()) {
            continue;
        }

        // Convert IMITATUS_VARIABLE_NAME to variable.name
        std::string normalized_key = key.substr(prefix.size());
        std::transform(normalized_key.begin(), normalized_key.end(), normalized_key.begin(), ::tolower);
        std::replace(normalized_key.begin(), normalized_key.end(), '_', '.');

        set_parsed(normalized_key, value, true);
    }
}

void Config::load_from_args(int argc, char* argv[]) {
    CLI::App app{"Imitatus mock HTTP server"};

    // Store unknown options and positionals
    app.allow_extras();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::cerr << "Error parsing configuration arguments: " << e.what() << std::endl;
        return;
    }

    // Extract all --key=value options
    for (const auto& option : app.remaining()) {
        if (option.size() <= 2 || option.substr(0, 2) != "--") {
            continue;
        }
        std::string key = option.substr(2);

        // Check if option contains an equal sign
        size_t equals_pos = key.find('=');
        if (equals_pos != std::string::npos) {
            std::string value = key.substr(equals_pos + 1);
            key = key.substr(0, equals_pos);
            set_parsed(key, value, false);
        } else {
            // Boolean flag (--flag with no value is treated as true)
            set<bool>(key, true);
        }
    }
}

bool Config::load_from_toml(const std::string& file_path) {
    try {
        if (fs::exists(file_path)) {
            auto data = toml::parse(file_path);
            load_nested_toml(data);
            return true;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error loading TOML configuration: " << e.what() << std::endl;
    }
    return false;
}

void Config::load_nested_toml(const toml::value& toml_value, const std::string& prefix) {
    if (!toml_value.is_table()) {
        return;
    }

    for (const auto& [key, value] : toml_value.as_table()) {
        std::string full_key = prefix.empty() ? key : prefix + "." + key;

        if (value.is_table()) {
            // Recursively process nested tables
            load_nested_toml(value, full_key);
        } else if (value.is_string()) {
            set<std::string>(full_key, toml::get<std::string>(value));
        } else if (value.is_integer()) {
            set<int>(full_key, static_cast<int>(value.as_integer()));
        } else if (value.is_boolean()) {
            set<bool>(full_key, value.as_boolean());
        }
    }
}

std::vector<std::string> Config::split_key(const std::string& key) const {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;

    while (std::getline(ss, part, '.')) {
        parts.push_back(part);
    }

    return parts;
}

template<typename T>
std::optional<T> Config::get_value(const std::string& key) const {
    auto it = config_values_.find(key);
    if (it != config_values_.end()) {
        if (const T* value = std::get_if<T>(&it->second)) {
            return *value;
        }
        // Type mismatch
        return std::nullopt;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> Config::get(const std::string& key) const {
    return get_value<T>(key);
}

template<typename T>
T Config::get(const std::string& key, const T& default_value) const {
    auto value = get<T>(key);
    return value.value_or(default_value);
}

template<typename T>
void Config::set(const std::string& key, const T& value) {
    config_values_[key] = value;
}

std::string Config::get_text(const std::string& key, const std::string& default_value) const {
    auto it = config_values_.find(key);
    if (it == config_values_.end()) {
        return default_value;
    }
    return std::visit([](const auto& v) -> std::string {
        using V = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<V, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<V, bool>) {
            return v ? "true" : "false";
        } else {
            return std::to_string(v);
        }
    }, it->second);
}

bool Config::has(const std::string& key) const {
    return config_values_.find(key) != config_values_.end();
}

nlohmann::json Config::to_json() const {
    nlohmann::json result = nlohmann::json::object();

    for (const auto& [key, value] : config_values_) {
        std::vector<std::string> parts = split_key(key);
        if (parts.empty()) {
            continue;
        }

        nlohmann::json* current = &result;
        for (size_t i = 0; i < parts.size() - 1; ++i) {
            if (!current->contains(parts[i]) || !(*current)[parts[i]].is_object()) {
                (*current)[parts[i]] = nlohmann::json::object();
            }
            current = &(*current)[parts[i]];
        }

        const std::string& last_part = parts.back();
        std::visit([&](const auto& v) { (*current)[last_part] = v; }, value);
    }

    return result;
}

std::string Config::host() const {
    return get_text("host", "0.0.0.0");
}

unsigned short Config::port() const {
    int port = get<int>("port", 8000);
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("Invalid port: " + std::to_string(port));
    }
    return static_cast<unsigned short>(port);
}

bool Config::debug() const {
    return get<bool>("debug", false);
}

int Config::threads() const {
    int fallback = static_cast<int>(std::thread::hardware_concurrency());
    return std::max(1, get<int>("threads", fallback));
}

std::string Config::log_level() const {
    return get_text("log.level", debug() ? "debug" : "info");
}

std::string Config::log_file() const {
    return get_text("log.file", "");
}

std::string Config::username() const {
    return get_text("auth.username", "admin");
}

std::string Config::password() const {
    return get_text("auth.password", "password");
}

std::uint64_t Config::body_limit() const {
    int limit = get<int>("limits.body", 5 * 1024 * 1024);
    return limit > 0 ? static_cast<std::uint64_t>(limit) : 0;
}

std::size_t Config::recent_request_limit() const {
    return static_cast<std::size_t>(std::max(0, get<int>("stats.recent", 5)));
}

// Template instantiations for common types
template std::optional<std::string> Config::get<std::string>(const std::string&) const;
template std::optional<int> Config::get<int>(const std::string&) const;
template std::optional<bool> Config::get<bool>(const std::string&) const;
template std::string Config::get<std::string>(const std::string&, const std::string&) const;
template int Config::get<int>(const std::string&, const int&) const;
template bool Config::get<bool>(const std::string&, const bool&) const;
template void Config::set<std::string>(const std::string&, const std::string&);
template void Config::set<int>(const std::string&, const int&);
template void Config::set<bool>(const std::string&, const bool&);

} // namespace imitatus
