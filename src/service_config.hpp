#ifndef SERVICE_CONFIG_HPP
#define SERVICE_CONFIG_HPP

#include "verification_config.hpp"
#include <string>

// Connection settings parsed from redis://[username:][password@]host[:port][/db]
struct RedisEndpoint {
    std::string host = "127.0.0.1";
    int port = 6379;
    std::string password;
    int database = 0;
};

// Unparseable parts fall back to the defaults above
RedisEndpoint parseRedisUrl(const std::string& redis_url);

struct ServiceConfig {
    int port = 8080;
    unsigned int workers;                        // defaults to hardware concurrency
    std::string models_path;                     // empty keeps the config file's models_path
    std::string config_path;                     // optional VerificationConfig JSON

    // Reference image lookup for requests that carry a student_id
    std::string profile_directory;
    std::string profile_base_url;
    long profile_timeout_seconds = 10;

    // Empty means audit events go to stdout
    std::string redis_url;
    std::string audit_list_key = "faceverify:audit";
    long audit_max_entries = 10000;

    ServiceConfig();

    // REDIS_URL, FACEVERIFY_MODELS, FACEVERIFY_PROFILE_DIR, FACEVERIFY_PROFILE_URL
    void applyEnvironment();

    // Thresholds from config_path (defaults when unset) with an explicit models_path applied on top.
    // Throws std::runtime_error for an unreadable or invalid file.
    VerificationConfig loadVerificationConfig() const;
};

#endif // SERVICE_CONFIG_HPP
