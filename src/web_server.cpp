#include "web_server.hpp"
#include "redis_audit_sink.hpp"
#include <iostream>
#include <ctime>
#include <utility>

bool validateVerifyRequest(const json& request_data, std::string& error) {
    if (!request_data.is_object()) {
        error = "Request body must be a JSON object";
        return false;
    }

    if (!request_data.contains("image") || !request_data["image"].is_string() ||
        request_data["image"].get<std::string>().empty()) {
        error = "Invalid request format. Required: image";
        return false;
    }

    if (request_data.contains("reference_image") && !request_data["reference_image"].is_string()) {
        error = "reference_image must be a string";
        return false;
    }

    if (request_data.contains("student_id") &&
        (!request_data["student_id"].is_string() || !isValidStudentId(request_data["student_id"].get<std::string>()))) {
        error = "student_id must be a string of letters, digits, '-', '_' or '.'";
        return false;
    }

    if (request_data.contains("strategy")) {
        if (!request_data["strategy"].is_string() ||
            !parseMatchPolicy(request_data["strategy"].get<std::string>())) {
            error = "strategy must be one of: strict, default, relaxed";
            return false;
        }
    }

    if (request_data.contains("include_match_details") && !request_data["include_match_details"].is_boolean()) {
        error = "include_match_details must be a boolean";
        return false;
    }

    return true;
}

VerifyOptions parseVerifyOptions(const json& request_data) {
    VerifyOptions options;
    if (request_data.contains("strategy") && request_data["strategy"].is_string()) {
        options.policy = parseMatchPolicy(request_data["strategy"].get<std::string>()).value_or(MatchPolicy::DEFAULT);
    }
    if (request_data.contains("include_match_details") && request_data["include_match_details"].is_boolean()) {
        options.include_match_details = request_data["include_match_details"].get<bool>();
    }
    return options;
}

WebServer::WebServer() : initialized(false) {
}

bool WebServer::initialize(const ServiceConfig& service_config_param,
                           const VerificationConfig& verification_config) {
    service_config = service_config_param;

    try {
        models = SharedModels::load(verification_config);

        audit_sink = createAuditSink();
        profile_store = createProfileStore();

        verifier = std::make_unique<FaceVerifier>(verification_config, models->locator,
                                                  models->embedder, audit_sink);

        // Health check endpoint
        CROW_ROUTE(app, "/health").methods("GET"_method)
        ([this](const crow::request& req) {
            return handleHealthCheck(req);
        });

        // Face verification endpoint
        CROW_ROUTE(app, "/verify").methods("POST"_method)
        ([this](const crow::request& req) {
            return handleVerify(req);
        });

        initialized = true;
        std::cout << "Web server initialized successfully" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error initializing web server: " << e.what() << std::endl;
        return false;
    }
}

void WebServer::start() {
    if (!initialized) {
        std::cerr << "Server not initialized. Call initialize() first." << std::endl;
        return;
    }

    std::cout << "Starting server on port " << service_config.port
              << " with " << service_config.workers << " worker threads" << std::endl;
    app.port(static_cast<uint16_t>(service_config.port))
       .concurrency(static_cast<uint16_t>(service_config.workers))
       .run();
}

void WebServer::stop() {
    app.stop();
}

crow::response WebServer::handleVerify(const crow::request& req) {
    Timer timer;

    try {
        // Parse request body
        json request_data = parseRequestBody(req.body);

        std::string validation_error;
        if (!validateVerifyRequest(request_data, validation_error)) {
            return createResponse(400, createErrorResponse(validation_error));
        }

        std::string candidate = request_data["image"].get<std::string>();
        VerifyOptions options = parseVerifyOptions(request_data);

        // Reference lookup happens here, before the pipeline runs
        std::optional<std::string> reference;
        bool reference_unusable = false;
        if (request_data.contains("reference_image")) {
            reference = request_data["reference_image"].get<std::string>();
        } else if (request_data.contains("student_id")) {
            if (!profile_store) {
                return createResponse(503, createErrorResponse("Profile store not configured", 503));
            }
            ProfileImage profile = profile_store->fetchReferenceImage(request_data["student_id"].get<std::string>());
            if (profile.status == ProfileImage::Status::FOUND) {
                reference = std::move(profile.bytes);
            } else if (profile.status == ProfileImage::Status::UNUSABLE) {
                reference_unusable = true;
            }
        }

        VerificationResult result = reference_unusable ? verifier->rejectUnusableReference(options)
                                                       : verifier->verify(candidate, reference, options);

        json response_data = result.toJson();
        response_data["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(200, createSuccessResponse(response_data));

    } catch (const ProfileStoreError& e) {
        std::cerr << "Profile store unavailable: " << e.what() << std::endl;
        json error_response = createErrorResponse("Profile store unavailable", 503);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(503, error_response);
    } catch (const VerificationError& e) {
        std::cerr << "Verification fault: " << e.what() << std::endl;
        json error_response = createErrorResponse("Internal verification error", 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    } catch (const std::runtime_error& e) {
        json error_response = createErrorResponse(e.what());
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(400, error_response);
    } catch (const std::exception& e) {
        std::cerr << "Error in verification: " << e.what() << std::endl;
        json error_response = createErrorResponse("Internal server error", 500);
        error_response["processing_time_ms"] = timer.elapsed_ms();
        return createResponse(500, error_response);
    }
}

crow::response WebServer::handleHealthCheck(const crow::request& req) {
    (void)req;
    bool cascades_loaded = models && models->locator && models->locator->isInitialized();
    bool embedding_loaded = models && models->embeddingAvailable();

    json health_data = {
        {"status", cascades_loaded ? "healthy" : "degraded"},
        {"cascades_loaded", cascades_loaded},
        {"embedding_model_loaded", embedding_loaded},
        {"match_strategy", verifier ? matchStrategyToString(verifier->selectStrategy()) : "unavailable"},
        {"audit_sink", audit_sink ? audit_sink->getStatus() : "none"},
        {"audit_sink_healthy", audit_sink && audit_sink->isHealthy()},
        {"profile_store", profile_store ? profile_store->describe() : "none"},
        {"version", "1.0.0"},
        {"timestamp", std::time(nullptr)}
    };

    return createResponse(200, createSuccessResponse(health_data));
}

json WebServer::parseRequestBody(const std::string& body) {
    try {
        return json::parse(body);
    } catch (const json::exception&) {
        throw std::runtime_error("Invalid JSON in request body");
    }
}

std::shared_ptr<AuditSink> WebServer::createAuditSink() {
    if (service_config.redis_url.empty()) {
        std::cout << "Audit events will be written to stdout" << std::endl;
        return std::make_shared<LogAuditSink>();
    }

    RedisEndpoint endpoint = parseRedisUrl(service_config.redis_url);
    std::cout << "Attempting to connect to Redis at " << endpoint.host << ":" << endpoint.port << std::endl;

    auto redis_sink = std::make_shared<RedisAuditSink>(service_config.audit_list_key,
                                                       service_config.audit_max_entries);
    if (!redis_sink->initialize(endpoint)) {
        std::cerr << "Warning: Failed to connect Redis audit sink - falling back to stdout audit log" << std::endl;
        return std::make_shared<LogAuditSink>();
    }
    return redis_sink;
}

std::unique_ptr<ProfileStore> WebServer::createProfileStore() {
    if (!service_config.profile_base_url.empty()) {
        std::cout << "Profile images fetched from " << service_config.profile_base_url << std::endl;
        return std::make_unique<HttpProfileStore>(service_config.profile_base_url,
                                                  service_config.profile_timeout_seconds);
    }
    if (!service_config.profile_directory.empty()) {
        std::cout << "Profile images read from " << service_config.profile_directory << std::endl;
        return std::make_unique<DirectoryProfileStore>(service_config.profile_directory);
    }
    std::cout << "No profile store configured; requests must carry reference_image" << std::endl;
    return nullptr;
}

json WebServer::createErrorResponse(const std::string& error_message, int status_code) {
    return json{
        {"success", false},
        {"error", error_message},
        {"status_code", status_code}
    };
}

json WebServer::createSuccessResponse(const json& data) {
    json response = data;
    response["success"] = true;
    return response;
}

crow::response WebServer::createResponse(int status_code, const json& data) {
    crow::response res(status_code, data.dump());
    res.add_header("Access-Control-Allow-Origin", "*");
    res.add_header("Content-Type", "application/json");
    return res;
}
