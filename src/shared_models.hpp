#ifndef SHARED_MODELS_HPP
#define SHARED_MODELS_HPP

#include "face_locator.hpp"
#include "face_recognizer.hpp"
#include "verification_config.hpp"
#include <memory>

// Immutable detector and embedding artifacts loaded once at startup and shared by all workers.
// Released when the last reference goes away.
struct SharedModels {
    std::shared_ptr<const CascadeFaceLocator> locator;
    std::shared_ptr<const DlibFaceEmbedder> embedder;   // may report isAvailable() == false

    // Throws VerificationError when the cascade artifacts are missing or corrupt.
    // A missing embedding model only selects the histogram fallback.
    static std::shared_ptr<const SharedModels> load(const VerificationConfig& config);

    bool embeddingAvailable() const { return embedder && embedder->isAvailable(); }
};

#endif // SHARED_MODELS_HPP
