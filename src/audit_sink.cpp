#include "audit_sink.hpp"
#include <iostream>

void LogAuditSink::record(const json& event) {
    std::string line;
    try {
        line = event.dump();
    } catch (const json::exception& e) {
        std::cerr << "Failed to serialize audit event: " << e.what() << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << "AUDIT " << line << std::endl;
}
