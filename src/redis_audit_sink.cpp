#include "redis_audit_sink.hpp"
#include <iostream>
#include <sstream>

namespace {

bool replyFailed(redisReply* reply) {
    return reply == nullptr || reply->type == REDIS_REPLY_ERROR;
}

} // namespace

RedisAuditSink::RedisAuditSink(const std::string& list_key, long max_entries)
    : context(nullptr), list_key_(list_key), max_entries_(max_entries), connected_(false) {
}

RedisAuditSink::~RedisAuditSink() {
    std::lock_guard<std::mutex> lock(context_mutex);
    cleanup();
}

bool RedisAuditSink::initialize(const RedisEndpoint& endpoint) {
    std::lock_guard<std::mutex> lock(context_mutex);
    endpoint_ = endpoint;
    return connect();
}

bool RedisAuditSink::connect() {
    // Cleanup any existing connection
    cleanup();

    context = redisConnect(endpoint_.host.c_str(), endpoint_.port);

    if (context == nullptr || context->err) {
        if (context) {
            std::cerr << "Redis connection error: " << context->errstr << std::endl;
            redisFree(context);
            context = nullptr;
        } else {
            std::cerr << "Redis connection error: Can't allocate redis context" << std::endl;
        }
        connected_ = false;
        return false;
    }

    // Authenticate if password is provided
    if (!endpoint_.password.empty()) {
        redisReply* reply = static_cast<redisReply*>(redisCommand(context, "AUTH %s", endpoint_.password.c_str()));
        if (replyFailed(reply)) {
            std::cerr << "Redis authentication failed";
            if (reply && reply->str) {
                std::cerr << ": " << reply->str;
            }
            std::cerr << std::endl;

            if (reply) freeReplyObject(reply);
            cleanup();
            return false;
        }
        freeReplyObject(reply);
    }

    if (endpoint_.database != 0) {
        redisReply* reply = static_cast<redisReply*>(redisCommand(context, "SELECT %d", endpoint_.database));
        if (replyFailed(reply)) {
            std::cerr << "Redis SELECT " << endpoint_.database << " failed" << std::endl;
            if (reply) freeReplyObject(reply);
            cleanup();
            return false;
        }
        freeReplyObject(reply);
    }

    // Test connection with PING
    redisReply* ping_reply = static_cast<redisReply*>(redisCommand(context, "PING"));
    if (ping_reply == nullptr || ping_reply->type != REDIS_REPLY_STATUS ||
        std::string(ping_reply->str) != "PONG") {
        std::cerr << "Redis PING test failed" << std::endl;
        if (ping_reply) freeReplyObject(ping_reply);
        cleanup();
        return false;
    }
    freeReplyObject(ping_reply);

    connected_ = true;
    std::cout << "Redis audit sink connected to " << endpoint_.host << ":" << endpoint_.port
              << " (list " << list_key_ << ")" << std::endl;
    return true;
}

void RedisAuditSink::record(const json& event) {
    std::string payload;
    try {
        payload = event.dump();
    } catch (const json::exception& e) {
        std::cerr << "Failed to serialize audit event: " << e.what() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(context_mutex);

    if (pushEvent(payload)) {
        return;
    }

    // One reconnect attempt per event; the verification result never depends on it
    std::cerr << "Redis audit write failed, reconnecting" << std::endl;
    if (!connect() || !pushEvent(payload)) {
        std::cerr << "Audit event dropped: Redis unavailable" << std::endl;
    }
}

bool RedisAuditSink::pushEvent(const std::string& payload) {
    if (!connected_ || !context) {
        return false;
    }

    redisReply* reply = static_cast<redisReply*>(redisCommand(context, "LPUSH %s %b",
        list_key_.c_str(), payload.data(), payload.size()));
    if (replyFailed(reply)) {
        std::cerr << "Failed to push audit event";
        if (reply && reply->str) {
            std::cerr << ": " << reply->str;
        }
        std::cerr << std::endl;

        if (reply) freeReplyObject(reply);
        if (context->err) {
            connected_ = false;
        }
        return false;
    }
    freeReplyObject(reply);

    if (max_entries_ > 0) {
        redisReply* trim_reply = static_cast<redisReply*>(redisCommand(context, "LTRIM %s 0 %ld",
            list_key_.c_str(), max_entries_ - 1));
        if (replyFailed(trim_reply)) {
            std::cerr << "Failed to trim audit list " << list_key_ << std::endl;
        }
        if (trim_reply) freeReplyObject(trim_reply);
    }

    return true;
}

bool RedisAuditSink::isHealthy() const {
    std::lock_guard<std::mutex> lock(context_mutex);
    return connected_ && context != nullptr && context->err == 0;
}

std::string RedisAuditSink::getStatus() const {
    std::lock_guard<std::mutex> lock(context_mutex);
    std::ostringstream status;
    if (connected_ && context) {
        status << "Connected to " << endpoint_.host << ":" << endpoint_.port;
    } else {
        status << "Disconnected";
    }
    return status.str();
}

void RedisAuditSink::cleanup() {
    if (context) {
        redisFree(context);
        context = nullptr;
    }
    connected_ = false;
}
