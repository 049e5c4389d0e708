#ifndef FACE_RECOGNIZER_HPP
#define FACE_RECOGNIZER_HPP

#include "thread_cache.hpp"
#include "verification_types.hpp"
#include <opencv2/core.hpp>
#include <dlib/opencv.h>
#include <dlib/image_processing.h>
#include <dlib/dnn.h>
#include <optional>
#include <string>

// Face embedding network type (layout of dlib_face_recognition_resnet_model_v1)
template <template <int,template<typename>class,int,typename> class block, int N, template<typename>class BN, typename SUBNET>
using residual = dlib::add_prev1<block<N,BN,1,dlib::tag1<SUBNET>>>;

template <template <int,template<typename>class,int,typename> class block, int N, template<typename>class BN, typename SUBNET>
using residual_down = dlib::add_prev2<dlib::avg_pool<2,2,2,2,dlib::skip1<dlib::tag2<block<N,BN,2,dlib::tag1<SUBNET>>>>>>;

template <int N, template <typename> class BN, int stride, typename SUBNET>
using block  = BN<dlib::con<N,3,3,1,1,dlib::relu<BN<dlib::con<N,3,3,stride,stride,SUBNET>>>>>;

template <int N, typename SUBNET> using ares      = dlib::relu<residual<block,N,dlib::affine,SUBNET>>;
template <int N, typename SUBNET> using ares_down = dlib::relu<residual_down<block,N,dlib::affine,SUBNET>>;

template <typename SUBNET> using alevel0 = ares_down<256,SUBNET>;
template <typename SUBNET> using alevel1 = ares<256,ares<256,ares_down<256,SUBNET>>>;
template <typename SUBNET> using alevel2 = ares<128,ares<128,ares_down<128,SUBNET>>>;
template <typename SUBNET> using alevel3 = ares<64,ares<64,ares<64,ares_down<64,SUBNET>>>>;
template <typename SUBNET> using alevel4 = ares<32,ares<32,ares<32,SUBNET>>>;

using anet_type = dlib::loss_metric<dlib::fc_no_bias<128,dlib::avg_pool_everything<
                            alevel0<
                            alevel1<
                            alevel2<
                            alevel3<
                            alevel4<
                            dlib::max_pool<3,3,2,2,dlib::relu<dlib::affine<dlib::con<32,7,7,2,2,
                            dlib::input_rgb_image_sized<150>
                            >>>>>>>>>>>>;

// Embedding seam; the matcher checks isAvailable() once per call before choosing a strategy
class FaceEmbedder {
public:
    virtual ~FaceEmbedder() = default;

    virtual bool isAvailable() const = 0;

    // Embedding of the face inside frame, or nullopt when no aligned chip can be produced
    virtual std::optional<FaceEmbedding> encode(const cv::Mat& frame, const FaceRegion& face) const = 0;
};

class DlibFaceEmbedder : public FaceEmbedder {
public:
    DlibFaceEmbedder();
    ~DlibFaceEmbedder() override = default;

    // Load the ResNet weights and the landmark model used for chip alignment
    bool initialize(const std::string& face_recognition_model_path,
                    const std::string& shape_predictor_path);

    bool isAvailable() const override { return models_loaded; }

    std::optional<FaceEmbedding> encode(const cv::Mat& frame, const FaceRegion& face) const override;

private:
    dlib::shape_predictor pose_model;
    anet_type face_encoder;     // read-only prototype
    bool models_loaded;

    static constexpr unsigned long CHIP_SIZE = 150;
    static constexpr double CHIP_PADDING = 0.25;

    // Network forward passes reuse internal tensors, so each worker thread runs its own copy
    ThreadCache<anet_type> encoders;
    anet_type& threadEncoder() const;
};

#endif // FACE_RECOGNIZER_HPP
