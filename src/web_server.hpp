#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "audit_sink.hpp"
#include "face_verifier.hpp"
#include "profile_store.hpp"
#include "service_config.hpp"
#include "shared_models.hpp"
#include "verification_config.hpp"
#include <crow.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <chrono>
#include <optional>
#include <string>

using json = nlohmann::json;

// Validate a /verify request body: "image" is required; "strategy" and
// "include_match_details" are optional. On failure error holds the message for the client.
bool validateVerifyRequest(const json& request_data, std::string& error);

// Options carried by a validated /verify request
VerifyOptions parseVerifyOptions(const json& request_data);

class WebServer {
public:
    WebServer();
    ~WebServer() = default;

    // Load models, connect the audit sink and profile store, and register routes
    bool initialize(const ServiceConfig& service_config, const VerificationConfig& verification_config);

    // Start server (blocking call)
    void start();

    // Stop server
    void stop();

private:
    // Core components
    std::shared_ptr<const SharedModels> models;
    std::shared_ptr<AuditSink> audit_sink;
    std::unique_ptr<ProfileStore> profile_store;
    std::unique_ptr<FaceVerifier> verifier;

    // Crow app
    crow::SimpleApp app;

    // Server state
    bool initialized;
    ServiceConfig service_config;

    // Endpoint handlers
    crow::response handleVerify(const crow::request& req);
    crow::response handleHealthCheck(const crow::request& req);

    // Helper methods
    json parseRequestBody(const std::string& body);
    std::shared_ptr<AuditSink> createAuditSink();
    std::unique_ptr<ProfileStore> createProfileStore();
    json createErrorResponse(const std::string& error_message, int status_code = 400);
    json createSuccessResponse(const json& data);
    crow::response createResponse(int status_code, const json& data);

    // Timing utility
    class Timer {
    private:
        std::chrono::high_resolution_clock::time_point start_time;
    public:
        Timer() : start_time(std::chrono::high_resolution_clock::now()) {}

        int64_t elapsed_ms() const {
            auto end_time = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
        }
    };
};

#endif // WEB_SERVER_HPP
