#include "web_server.hpp"
#include <curl/curl.h>
#include <iostream>
#include <string>
#include <filesystem>
#include <signal.h>

// Global server instance for signal handling
std::unique_ptr<WebServer> global_server;

void signalHandler(int signal) {
    std::cout << "\nReceived signal " << signal << ". Shutting down gracefully..." << std::endl;
    if (global_server) {
        global_server->stop();
    }
}

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Options:\n"
              << "  --port PORT          Server port (default: 8080)\n"
              << "  --models PATH        Models directory (default: config file value, else ./models)\n"
              << "  --config FILE        Verification thresholds JSON file\n"
              << "  --threads N          Worker threads (default: hardware concurrency)\n"
              << "  --profile-dir PATH   Directory of <student_id>.jpg|.jpeg|.png profile images\n"
              << "  --profile-url URL    Base URL serving GET <url>/<student_id>\n"
              << "  --help               Show this help message\n"
              << "Environment:\n"
              << "  REDIS_URL            redis://[user:][password@]host[:port][/db] for the audit log\n"
              << std::endl;
}

bool parseIntArgument(const std::string& value, int min, int max, int& out) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < min || parsed > max) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    // Default configuration, environment overrides defaults, flags override both
    ServiceConfig service_config;
    service_config.applyEnvironment();

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--port" && i + 1 < argc) {
            if (!parseIntArgument(argv[++i], 1, 65535, service_config.port)) {
                std::cerr << "Error: Port must be between 1 and 65535" << std::endl;
                return 1;
            }
        } else if (arg == "--threads" && i + 1 < argc) {
            int threads = 0;
            if (!parseIntArgument(argv[++i], 1, 1024, threads)) {
                std::cerr << "Error: Threads must be between 1 and 1024" << std::endl;
                return 1;
            }
            service_config.workers = static_cast<unsigned int>(threads);
        } else if (arg == "--models" && i + 1 < argc) {
            service_config.models_path = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            service_config.config_path = argv[++i];
        } else if (arg == "--profile-dir" && i + 1 < argc) {
            service_config.profile_directory = argv[++i];
        } else if (arg == "--profile-url" && i + 1 < argc) {
            service_config.profile_base_url = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    VerificationConfig verification_config;
    try {
        verification_config = service_config.loadVerificationConfig();
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid configuration " << service_config.config_path << ": " << e.what() << std::endl;
        return 1;
    }
    const std::string& models_path = verification_config.models.models_path;

    // Validate models directory
    if (!std::filesystem::exists(models_path)) {
        std::cerr << "Error: Models directory does not exist: " << models_path << std::endl;
        std::cerr << "Please ensure the models directory exists and contains the cascade and model files." << std::endl;
        return 1;
    }

    // Setup signal handlers for graceful shutdown
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    curl_global_init(CURL_GLOBAL_DEFAULT);

    int exit_code = 0;
    try {
        std::cout << "=== Face Verification Service ===" << std::endl;
        std::cout << "Port: " << service_config.port << std::endl;
        std::cout << "Workers: " << service_config.workers << std::endl;
        std::cout << "Models path: " << models_path << std::endl;
        std::cout << "=================================" << std::endl;

        // Create and initialize server
        global_server = std::make_unique<WebServer>();

        if (!global_server->initialize(service_config, verification_config)) {
            std::cerr << "Failed to initialize server" << std::endl;
            exit_code = 1;
        } else {
            std::cout << "\nServer ready! Available endpoints:" << std::endl;
            std::cout << "  GET  /health   - Model and audit sink status" << std::endl;
            std::cout << "  POST /verify   - Verify a live capture against a reference face" << std::endl;
            std::cout << "\nPress Ctrl+C to stop the server." << std::endl;

            // Start server (blocking call)
            global_server->start();
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        exit_code = 1;
    }

    // Releases the shared models
    global_server.reset();
    curl_global_cleanup();
    return exit_code;
}
