#include "service_config.hpp"
#include <cstdlib>
#include <thread>

namespace {

std::string envOrEmpty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

RedisEndpoint parseRedisUrl(const std::string& redis_url) {
    RedisEndpoint endpoint;
    std::string url = redis_url;

    // Remove redis:// prefix
    if (url.find("redis://") == 0) {
        url = url.substr(8);
    } else if (url.find("rediss://") == 0) {
        url = url.substr(9); // rediss:// for SSL
    } else {
        return endpoint;
    }

    // Database index (/db)
    size_t db_pos = url.find('/');
    if (db_pos != std::string::npos) {
        std::string db_part = url.substr(db_pos + 1);
        url = url.substr(0, db_pos);
        try {
            if (!db_part.empty()) {
                endpoint.database = std::stoi(db_part);
            }
        } catch (const std::exception&) {
            endpoint.database = 0;
        }
    }

    // Parse authentication part
    size_t at_pos = url.rfind('@');
    if (at_pos != std::string::npos) {
        std::string auth_part = url.substr(0, at_pos);
        url = url.substr(at_pos + 1);

        // username:password or :password
        size_t colon_pos = auth_part.find(':');
        if (colon_pos != std::string::npos) {
            endpoint.password = auth_part.substr(colon_pos + 1);
        } else {
            endpoint.password = auth_part;
        }
    }

    // Bracketed IPv6 host
    if (!url.empty() && url[0] == '[') {
        size_t close_pos = url.find(']');
        if (close_pos != std::string::npos) {
            endpoint.host = url.substr(1, close_pos - 1);
            url = url.substr(close_pos + 1);
            if (!url.empty() && url[0] == ':') {
                try {
                    endpoint.port = std::stoi(url.substr(1));
                } catch (const std::exception&) {
                    endpoint.port = 6379;
                }
            }
            return endpoint;
        }
    }

    // Parse host:port
    size_t colon_pos = url.find(':');
    if (colon_pos != std::string::npos) {
        endpoint.host = url.substr(0, colon_pos);
        try {
            endpoint.port = std::stoi(url.substr(colon_pos + 1));
        } catch (const std::exception&) {
            // Invalid port, keep default
            endpoint.port = 6379;
        }
    } else if (!url.empty()) {
        endpoint.host = url;
    }

    if (endpoint.host.empty()) {
        endpoint.host = "127.0.0.1";
    }
    return endpoint;
}

ServiceConfig::ServiceConfig() : workers(std::thread::hardware_concurrency()) {
    if (workers == 0) {
        workers = 1;
    }
}

void ServiceConfig::applyEnvironment() {
    std::string value = envOrEmpty("REDIS_URL");
    if (!value.empty()) {
        redis_url = value;
    }

    value = envOrEmpty("FACEVERIFY_MODELS");
    if (!value.empty()) {
        models_path = value;
    }

    value = envOrEmpty("FACEVERIFY_PROFILE_DIR");
    if (!value.empty()) {
        profile_directory = value;
    }

    value = envOrEmpty("FACEVERIFY_PROFILE_URL");
    if (!value.empty()) {
        profile_base_url = value;
    }
}

VerificationConfig ServiceConfig::loadVerificationConfig() const {
    VerificationConfig config;
    if (!config_path.empty()) {
        config = VerificationConfig::loadFromFile(config_path);
    }
    if (!models_path.empty()) {
        config.models.models_path = models_path;
    }
    return config;
}
