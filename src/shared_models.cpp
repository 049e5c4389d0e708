#include "shared_models.hpp"
#include <filesystem>
#include <iostream>

std::shared_ptr<const SharedModels> SharedModels::load(const VerificationConfig& config) {
    std::cout << "Initializing models from: " << config.models.models_path << std::endl;

    auto locator = std::make_shared<CascadeFaceLocator>(config.locator);
    if (!locator->initialize(config.models.models_path)) {
        throw VerificationError("Haar cascade artifacts missing or corrupt");
    }

    auto embedder = std::make_shared<DlibFaceEmbedder>();
    std::string face_recognition_model = config.models.resolve(config.models.face_recognition_model);
    std::string shape_predictor_model = config.models.resolve(config.models.shape_predictor);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(face_recognition_model, ec) ||
        !std::filesystem::is_regular_file(shape_predictor_model, ec)) {
        std::cerr << "Warning: embedding model files not found in " << config.models.models_path << std::endl;
        std::cerr << "Required files:" << std::endl;
        std::cerr << "  - " << config.models.face_recognition_model << std::endl;
        std::cerr << "  - " << config.models.shape_predictor << std::endl;
        std::cerr << "Face matching will use the histogram fallback" << std::endl;
    } else if (!embedder->initialize(face_recognition_model, shape_predictor_model)) {
        std::cerr << "Warning: embedding model failed to load, face matching will use the histogram fallback"
                  << std::endl;
    }

    auto models = std::make_shared<SharedModels>();
    models->locator = locator;
    models->embedder = embedder;
    return models;
}
