#ifndef REDIS_AUDIT_SINK_HPP
#define REDIS_AUDIT_SINK_HPP

#include "audit_sink.hpp"
#include "service_config.hpp"
#include <hiredis/hiredis.h>
#include <mutex>
#include <string>

// Pushes audit events onto a capped Redis list (LPUSH + LTRIM)
class RedisAuditSink : public AuditSink {
public:
    RedisAuditSink(const std::string& list_key, long max_entries);
    ~RedisAuditSink() override;

    RedisAuditSink(const RedisAuditSink&) = delete;
    RedisAuditSink& operator=(const RedisAuditSink&) = delete;

    // Initialize connection to Redis
    bool initialize(const RedisEndpoint& endpoint);

    void record(const json& event) override;

    // Check if Redis connection is healthy
    bool isHealthy() const override;

    // Get connection status
    std::string getStatus() const override;

private:
    redisContext* context;
    RedisEndpoint endpoint_;
    std::string list_key_;
    long max_entries_;
    bool connected_;
    mutable std::mutex context_mutex;

    // Helper methods; callers hold context_mutex
    bool connect();
    void cleanup();
    bool pushEvent(const std::string& payload);
};

#endif // REDIS_AUDIT_SINK_HPP
