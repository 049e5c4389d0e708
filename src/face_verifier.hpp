#ifndef FACE_VERIFIER_HPP
#define FACE_VERIFIER_HPP

#include "antispoof/spoof_battery.hpp"
#include "audit_sink.hpp"
#include "face_locator.hpp"
#include "face_matcher.hpp"
#include "face_recognizer.hpp"
#include "image_processor.hpp"
#include "verification_config.hpp"
#include "verification_types.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

// Sequences decode -> quality -> locate -> eyes -> spoof battery -> match into one decision.
// Every stage short-circuits on its first failure. Holds only read-only state, so one
// instance serves concurrent verify() calls.
class FaceVerifier {
public:
    FaceVerifier(const VerificationConfig& config,
                 std::shared_ptr<const FaceLocator> locator,
                 std::shared_ptr<const FaceEmbedder> embedder,
                 std::shared_ptr<AuditSink> audit_sink);

    // Same, with a caller-assembled spoof battery in place of the standard six techniques
    FaceVerifier(const VerificationConfig& config,
                 std::shared_ptr<const FaceLocator> locator,
                 std::shared_ptr<const FaceEmbedder> embedder,
                 std::shared_ptr<AuditSink> audit_sink,
                 antispoof::SpoofBattery battery);

    ~FaceVerifier() = default;

    // candidate and reference are raw image bytes, bare Base64 or data URIs.
    // An absent reference is rejected before any image processing.
    // Throws VerificationError for faults outside the rejection taxonomy.
    VerificationResult verify(const std::string& candidate_image,
                              const std::optional<std::string>& reference_image,
                              const VerifyOptions& options = VerifyOptions()) const;

    // Rejection for a stored reference that exists but cannot be read; audited like verify()
    VerificationResult rejectUnusableReference(const VerifyOptions& options = VerifyOptions()) const;

    // Strategy the next call would bind at its start
    MatchStrategy selectStrategy() const { return matcher.selectStrategy(); }

    const VerificationConfig& getConfig() const { return config; }

private:
    VerificationConfig config;
    std::shared_ptr<const FaceLocator> locator;
    std::shared_ptr<AuditSink> audit_sink;
    ImageProcessor image_processor;
    antispoof::SpoofBattery battery;
    FaceMatcher matcher;

    VerificationResult runPipeline(const std::string& candidate_image,
                                   const std::optional<std::string>& reference_image,
                                   const VerifyOptions& options) const;

    json buildAuditEvent(const VerificationResult& result, const VerifyOptions& options,
                         int64_t elapsed_ms) const;

    void emitAudit(const json& event) const;
};

#endif // FACE_VERIFIER_HPP
