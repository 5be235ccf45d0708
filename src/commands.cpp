#include "commands.hpp"
#include <iostream>
#include <string>
#include "logging.hpp"
#include "routes.hpp"
#include "server.hpp"
#include "server_context.hpp"

namespace imitatus {

bool serve_command(const Config& config) {
    // Initialize logging with debug level if --debug flag is present, otherwise info
    Logger::init(config.log_level(), config.log_file());

    try {
        std::string address = config.host();
        unsigned short port = config.port();
        int threads = config.threads();

        auto context = ServerContext::from_config(config);
        auto router = build_router(context);

        Server server(address, port, router, threads, config.body_limit());
        server.handle_signals();

        Logger::get().info("Starting {} {} on {}:{} with {} worker thread(s)",
                           SERVER_NAME, VERSION, address, server.port(), threads);
        Logger::get().debug("Effective configuration: {}", config.to_json().dump());
        Logger::get().info("Server is ready to accept requests...");

        server.run();
        Logger::get().info("Server stopped");
        return true;
    } catch (const std::exception& e) {
        Logger::get().error("Failed to start server: {}", e.what());
        return false;
    }
}

bool config_command(const Config& config) {
    try {
        // Explicit settings plus the defaults the server would apply
        nlohmann::json effective = config.to_json();
        effective["host"] = config.host();
        effective["port"] = config.port();
        effective["debug"] = config.debug();
        effective["threads"] = config.threads();
        effective["log"]["level"] = config.log_level();
        effective["log"]["file"] = config.log_file();
        effective["auth"]["username"] = config.username();
        effective["auth"]["password"] = config.password();
        effective["limits"]["body"] = config.body_limit();
        effective["stats"]["recent"] = config.recent_request_limit();
        std::cout << effective.dump(2) << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }
}

} // namespace imitatus
