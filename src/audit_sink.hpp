#ifndef AUDIT_SINK_HPP
#define AUDIT_SINK_HPP

#include <nlohmann/json.hpp>
#include <mutex>
#include <string>

using json = nlohmann::json;

// Receives one structured event per verification call.
// Implementations must be safe for concurrent calls and must not throw.
class AuditSink {
public:
    virtual ~AuditSink() = default;

    virtual void record(const json& event) = 0;

    // Reported by the health endpoint
    virtual bool isHealthy() const = 0;
    virtual std::string getStatus() const = 0;
};

// Writes each event as a single JSON line on stdout
class LogAuditSink : public AuditSink {
public:
    LogAuditSink() = default;
    ~LogAuditSink() override = default;

    void record(const json& event) override;

    bool isHealthy() const override { return true; }
    std::string getStatus() const override { return "log"; }

private:
    std::mutex output_mutex;
};

// Discards events; used when auditing is disabled and in tests
class NullAuditSink : public AuditSink {
public:
    void record(const json&) override {}

    bool isHealthy() const override { return true; }
    std::string getStatus() const override { return "disabled"; }
};

#endif // AUDIT_SINK_HPP
