#include <cstdlib>
#include <iostream>
#include <string>
#include <filesystem>
#include <CLI/CLI.hpp>
#include "config.hpp"
#include "commands.hpp"

namespace fs = std::filesystem;

// Try to find and load configuration file
void find_and_load_config(imitatus::Config& config) {
    // First check environment variable
    const char* env_config_path = std::getenv("IMITATUS_CONFIG");
    if (env_config_path && fs::exists(env_config_path)) {
        config.load_from_toml(env_config_path);
        return;
    }

    // Search for imitatus.toml in current and parent directories
    fs::path current_path = fs::current_path();
    fs::path config_file = "imitatus.toml";

    while (true) {
        fs::path full_path = current_path / config_file;
        if (fs::exists(full_path)) {
            config.load_from_toml(full_path.string());
            return;
        }

        // Stop if we reached the root directory
        if (current_path == current_path.parent_path()) {
            break;
        }

        // Move up to parent directory
        current_path = current_path.parent_path();
    }
}

int main(int argc, char* argv[]) {
    // Create config and load settings from different sources
    imitatus::Config config;

    // Main command group
    CLI::App app{"Imitatus mock HTTP server"};
    app.require_subcommand(1);
    app.set_version_flag("--version", std::string(imitatus::SERVER_NAME) + " " + imitatus::VERSION);

    std::string config_file;

    // serve subcommand
    auto serve = app.add_subcommand("serve", "Start the mock HTTP server");
    std::string host, log_file, username, password;
    int port = -1;
    int threads = 0;
    bool debug_mode = false;

    serve->add_option("--config", config_file, "Configuration file (default: imitatus.toml)");
    serve->add_flag("--debug", debug_mode, "Enable debug logging");
    serve->add_option("--host", host, "Address to bind to (default: 0.0.0.0)");
    serve->add_option("--port", port, "Port to listen on (default: 8000)");
    serve->add_option("--threads", threads, "Worker threads (default: hardware concurrency)");
    serve->add_option("--log-file", log_file, "Also write logs to this file");
    serve->add_option("--username", username, "Login username (default: admin)");
    serve->add_option("--password", password, "Login password (default: password)");
    // Any other --key=value (e.g. --limits.body=1024) goes straight into the config
    serve->allow_extras();

    // config subcommand
    auto show_config = app.add_subcommand("config", "Print the effective configuration as JSON");
    show_config->add_option("--config", config_file, "Configuration file (default: imitatus.toml)");

    try {
        app.parse(argc, argv);

        // Config file first (lowest priority), then environment variables
        if (!config_file.empty()) {
            if (!config.load_from_toml(config_file)) {
                std::cerr << "Error: could not load configuration file " << config_file << std::endl;
                return 1;
            }
        } else {
            find_and_load_config(config);
        }
        config.load_from_env();

        // Load command line arguments not handled by CLI11
        config.load_from_args(argc, argv);

        // Update config with CLI options (highest priority)
        if (debug_mode) config.set("debug", debug_mode);
        if (!host.empty()) config.set("host", host);
        if (port >= 0) config.set("port", port);
        if (threads > 0) config.set("threads", threads);
        if (!log_file.empty()) config.set("log.file", log_file);
        if (!username.empty()) config.set("auth.username", username);
        if (!password.empty()) config.set("auth.password", password);

        // Handle subcommands
        if (*serve) {
            return imitatus::serve_command(config) ? 0 : 1;
        }
        else if (*show_config) {
            return imitatus::config_command(config) ? 0 : 1;
        }

    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
