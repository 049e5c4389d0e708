#include "face_recognizer.hpp"
#include <iostream>
#include <memory>

DlibFaceEmbedder::DlibFaceEmbedder()
    : models_loaded(false) {
    // Models will be loaded in initialize()
}

bool DlibFaceEmbedder::initialize(const std::string& face_recognition_model_path,
                                  const std::string& shape_predictor_path) {
    try {
        std::cout << "Loading face embedding models..." << std::endl;

        dlib::deserialize(shape_predictor_path) >> pose_model;
        std::cout << "Shape predictor loaded: " << shape_predictor_path << std::endl;

        dlib::deserialize(face_recognition_model_path) >> face_encoder;
        std::cout << "Face recognition model loaded: " << face_recognition_model_path << std::endl;

        models_loaded = true;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Embedding model unavailable: " << e.what() << std::endl;
        models_loaded = false;
        return false;
    }
}

std::optional<FaceEmbedding> DlibFaceEmbedder::encode(const cv::Mat& frame, const FaceRegion& face) const {
    if (!models_loaded || frame.empty() || frame.type() != CV_8UC3) {
        return std::nullopt;
    }

    dlib::cv_image<dlib::bgr_pixel> dlib_image(frame);

    dlib::rectangle face_rect(face.bounds.x, face.bounds.y,
                              face.bounds.x + face.bounds.width - 1,
                              face.bounds.y + face.bounds.height - 1);

    dlib::full_object_detection landmarks = pose_model(dlib_image, face_rect);
    if (landmarks.num_parts() == 0) {
        return std::nullopt;
    }

    dlib::matrix<dlib::rgb_pixel> face_chip;
    dlib::extract_image_chip(dlib_image, dlib::get_face_chip_details(landmarks, CHIP_SIZE, CHIP_PADDING), face_chip);

    FaceEmbedding embedding = threadEncoder()(face_chip);
    return embedding;
}

anet_type& DlibFaceEmbedder::threadEncoder() const {
    return encoders.get([this]() {
        return std::make_unique<anet_type>(face_encoder);
    });
}
