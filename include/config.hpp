#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>
// Disable warning about redundant moves in toml11
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wredundant-move"
#include <toml.hpp>
#pragma GCC diagnostic pop

namespace imitatus {

// Version information
constexpr const char* VERSION = "0.1.0";
constexpr const char* SERVER_NAME = "Imitatus";
constexpr const char* API_VERSION = "1.0";

// Environment variables with this prefix are loaded into the configuration
constexpr const char* ENV_PREFIX = "IMITATUS_";

class Config {
public:
    using ConfigValue = std::variant<std::string, int, bool>;

    Config();

    // Load configuration from different sources
    void load_from_env();
    void load_from_args(int argc, char* argv[]);
    bool load_from_toml(const std::string& file_path = "imitatus.toml");

    // Get configuration values
    template<typename T>
    std::optional<T> get(const std::string& key) const;

    template<typename T>
    T get(const std::string& key, const T& default_value) const;

    // Set configuration values
    template<typename T>
    void set(const std::string& key, const T& value);

    // Check if a key exists
    bool has(const std::string& key) const;

    // Dump configuration as JSON
    nlohmann::json to_json() const;

    // Typed accessors for the server settings, with defaults applied
    std::string host() const;
    unsigned short port() const;
    bool debug() const;
    int threads() const;
    std::string log_level() const;
    std::string log_file() const;
    std::string username() const;
    std::string password() const;
    std::uint64_t body_limit() const;
    std::size_t recent_request_limit() const;

private:
    std::map<std::string, ConfigValue> config_values_;

    // Helper methods
    std::vector<std::string> split_key(const std::string& key) const;
    void set_parsed(const std::string& key, const std::string& value, bool numeric_bools);
    // Reads a value as text whatever type it was loaded as
    std::string get_text(const std::string& key, const std::string& default_value) const;
    void load_nested_toml(const toml::value& toml_value, const std::string& prefix = "");

    // Get value from nested structure
    template<typename T>
    std::optional<T> get_value(const std::string& key) const;
};

} // namespace imitatus
