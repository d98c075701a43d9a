/**
 * @file face_mesh_detector.cpp
 * @brief FaceMeshDetector 구현 - TensorFlow Lite 통합
 *
 * BlazeFace 얼굴 검출 → 얼굴 영역 크롭 → Face Mesh 랜드마크 추론
 */

#include "facemask/face_mesh_detector.h"

#include <algorithm>  // std::clamp
#include <cmath>      // std::exp
#include <cstring>    // std::memcpy
#include <filesystem>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

// TensorFlow Lite 헤더 (조건부 컴파일)
#ifdef FACEMASK_HAS_TFLITE
#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/kernels/register.h"
#include "tensorflow/lite/model.h"
#endif

#include "logging.h"

namespace facemask {

namespace {
    /// 정규화 좌표 사각형 (0.0~1.0)
    struct NormalizedRect {
        float x = 0.0f;
        float y = 0.0f;
        float width = 0.0f;
        float height = 0.0f;
    };

#ifdef FACEMASK_HAS_TFLITE
    // Face Detection 모델: 128x128 RGB
    constexpr int FACE_DETECTION_INPUT_SIZE = 128;

    // Face Landmark 모델: 192x192 RGB
    constexpr int FACE_LANDMARK_INPUT_SIZE = 192;

    constexpr int INPUT_CHANNELS = 3;

    // BlazeFace 회귀 출력 길이 (box 4 + keypoint 12)
    constexpr int DETECTION_REGRESSOR_STRIDE = 16;

    // 얼굴 영역 크롭 마진 비율
    constexpr float FACE_CROP_MARGIN = 0.1f;
#endif
}

// ============================================================
// Pimpl 구현 클래스
// ============================================================
class FaceMeshDetector::Impl {
public:
    bool initialized = false;
    std::string model_path;

    float min_detection_confidence = 0.5f;
    float min_tracking_confidence = 0.5f;
    int num_threads = 4;
    bool use_tracking = true;

    // 추적 캐시
    bool has_prev_face = false;
    NormalizedRect prev_face_rect;
    float prev_confidence = 0.0f;

    // 필요한 모델 파일 목록
    static constexpr const char* REQUIRED_MODELS[] = {
        "face_detection_short_range.tflite",
        "face_landmark.tflite"
    };

#ifdef FACEMASK_HAS_TFLITE
    std::unique_ptr<tflite::FlatBufferModel> face_detection_model;
    std::unique_ptr<tflite::FlatBufferModel> face_landmark_model;

    std::unique_ptr<tflite::Interpreter> face_detection_interpreter;
    std::unique_ptr<tflite::Interpreter> face_landmark_interpreter;

    struct Anchor {
        float x_center;
        float y_center;
    };
    std::vector<Anchor> anchors;

    // 재사용 버퍼
    std::vector<float> detection_input;
    std::vector<float> landmark_input;
    std::vector<float> landmark_output;
    cv::Mat rgb_buffer;
    cv::Mat resized_buffer;
    cv::Mat float_buffer;
#endif

    /**
     * @brief 모델 디렉토리 및 필수 파일 존재 확인
     */
    bool validateModelPath(const std::string& path) {
        if (path.empty() || !std::filesystem::is_directory(path)) {
            return false;
        }

        for (const auto& model : REQUIRED_MODELS) {
            if (!std::filesystem::exists(std::filesystem::path(path) / model)) {
                detail::getLogger("facemask.detector")->error(
                    "model file missing: {}", (std::filesystem::path(path) / model).string());
                return false;
            }
        }
        return true;
    }

    void resetTrackingCache() {
        has_prev_face = false;
        prev_face_rect = NormalizedRect{};
        prev_confidence = 0.0f;
    }

#ifdef FACEMASK_HAS_TFLITE
    static float sigmoid(float x) {
        return 1.0f / (1.0f + std::exp(-x));
    }

    /**
     * @brief BlazeFace short range 앵커 생성
     *
     * 16x16 (stride 8) 셀당 2개 + 8x8 (stride 16) 셀당 6개 = 896개
     */
    void generateAnchors() {
        if (!anchors.empty()) return;

        struct AnchorOption {
            int feature_map_size;
            int num_anchors;
            float stride;
        };
        const AnchorOption options[] = {
            {16, 2, 8.0f},
            {8, 6, 16.0f}
        };

        const float input_size = static_cast<float>(FACE_DETECTION_INPUT_SIZE);
        for (const auto& opt : options) {
            for (int y = 0; y < opt.feature_map_size; ++y) {
                for (int x = 0; x < opt.feature_map_size; ++x) {
                    const float x_center = (static_cast<float>(x) + 0.5f) * opt.stride / input_size;
                    const float y_center = (static_cast<float>(y) + 0.5f) * opt.stride / input_size;
                    for (int n = 0; n < opt.num_anchors; ++n) {
                        anchors.push_back(Anchor{x_center, y_center});
                    }
                }
            }
        }
    }

    bool loadModel(const std::string& model_file,
                   std::unique_ptr<tflite::FlatBufferModel>& model,
                   std::unique_ptr<tflite::Interpreter>& interpreter) {
        model = tflite::FlatBufferModel::BuildFromFile(model_file.c_str());
        if (!model) {
            return false;
        }

        tflite::ops::builtin::BuiltinOpResolver resolver;
        tflite::InterpreterBuilder builder(*model, resolver);
        builder.SetNumThreads(num_threads);

        if (builder(&interpreter) != kTfLiteOk || !interpreter) {
            return false;
        }
        if (interpreter->AllocateTensors() != kTfLiteOk) {
            return false;
        }
        return !interpreter->inputs().empty() && !interpreter->outputs().empty();
    }

    bool loadAllModels(const std::string& base_path) {
        const std::filesystem::path base(base_path);

        if (!loadModel((base / REQUIRED_MODELS[0]).string(),
                       face_detection_model, face_detection_interpreter)) {
            return false;
        }
        if (!loadModel((base / REQUIRED_MODELS[1]).string(),
                       face_landmark_model, face_landmark_interpreter)) {
            return false;
        }

        detection_input.resize(FACE_DETECTION_INPUT_SIZE * FACE_DETECTION_INPUT_SIZE * INPUT_CHANNELS);
        landmark_input.resize(FACE_LANDMARK_INPUT_SIZE * FACE_LANDMARK_INPUT_SIZE * INPUT_CHANNELS);
        landmark_output.resize(FACE_LANDMARK_COUNT * 3);
        generateAnchors();
        return true;
    }

    void releaseAllModels() {
        face_detection_interpreter.reset();
        face_landmark_interpreter.reset();
        face_detection_model.reset();
        face_landmark_model.reset();
    }

    /**
     * @brief RGB 이미지를 정사각 입력 크기로 리사이즈하고 [0, 1] float로 복사
     */
    void toInputTensor(const cv::Mat& rgb, int size, float* output) {
        cv::resize(rgb, resized_buffer, cv::Size(size, size), 0, 0, cv::INTER_LINEAR);
        resized_buffer.convertTo(float_buffer, CV_32FC3, 1.0 / 255.0);

        if (float_buffer.isContinuous()) {
            std::memcpy(output, float_buffer.ptr<float>(),
                        static_cast<size_t>(size) * size * INPUT_CHANNELS * sizeof(float));
        } else {
            float* dst = output;
            for (int y = 0; y < size; ++y) {
                std::memcpy(dst, float_buffer.ptr<float>(y),
                            static_cast<size_t>(size) * INPUT_CHANNELS * sizeof(float));
                dst += size * INPUT_CHANNELS;
            }
        }
    }

    /**
     * @brief BlazeFace 실행 (최고 점수 앵커 1개 디코딩)
     *
     * 출력 0 (regressors): [1, 896, 16] = yc, xc, h, w 오프셋 + 키포인트
     * 출력 1 (classificators): [1, 896, 1] logit
     */
    bool runFaceDetection(const cv::Mat& rgb, NormalizedRect& face_rect, float& confidence) {
        toInputTensor(rgb, FACE_DETECTION_INPUT_SIZE, detection_input.data());

        float* input_tensor = face_detection_interpreter->typed_input_tensor<float>(0);
        if (!input_tensor) {
            return false;
        }
        std::memcpy(input_tensor, detection_input.data(), detection_input.size() * sizeof(float));

        if (face_detection_interpreter->Invoke() != kTfLiteOk) {
            detail::getLogger("facemask.detector")->warn("face detection inference failed");
            return false;
        }

        const TfLiteTensor* boxes_tensor = face_detection_interpreter->tensor(
            face_detection_interpreter->outputs()[0]);
        const float* boxes = face_detection_interpreter->typed_output_tensor<float>(0);
        if (!boxes_tensor || !boxes || face_detection_interpreter->outputs().size() < 2) {
            return false;
        }
        const float* scores = face_detection_interpreter->typed_output_tensor<float>(1);
        if (!scores) {
            return false;
        }

        const int num_dims = boxes_tensor->dims->size;
        int num_anchors = 0;
        if (num_dims >= 2) {
            num_anchors = (num_dims == 3) ? boxes_tensor->dims->data[1] : boxes_tensor->dims->data[0];
        }
        const int effective = std::min(num_anchors, static_cast<int>(anchors.size()));

        float best_score = 0.0f;
        int best_idx = -1;
        for (int i = 0; i < effective; ++i) {
            const float score = sigmoid(scores[i]);
            if (score > best_score && score > min_detection_confidence) {
                best_score = score;
                best_idx = i;
            }
        }
        if (best_idx < 0) {
            return false;
        }

        const Anchor& anchor = anchors[best_idx];
        const float* box = boxes + best_idx * DETECTION_REGRESSOR_STRIDE;
        const float input_size = static_cast<float>(FACE_DETECTION_INPUT_SIZE);

        const float cx = anchor.x_center + box[1] / input_size;
        const float cy = anchor.y_center + box[0] / input_size;
        const float w = box[3] / input_size;
        const float h = box[2] / input_size;

        face_rect.x = std::clamp(cx - w / 2.0f, 0.0f, 1.0f);
        face_rect.y = std::clamp(cy - h / 2.0f, 0.0f, 1.0f);
        face_rect.width = std::clamp(w, 0.0f, 1.0f - face_rect.x);
        face_rect.height = std::clamp(h, 0.0f, 1.0f - face_rect.y);
        confidence = best_score;
        return face_rect.width > 0.0f && face_rect.height > 0.0f;
    }

    /**
     * @brief 얼굴 영역(마진 포함)을 크롭하여 랜드마크 추론
     * @param crop_rect 실제 크롭한 영역 (출력, 정규화 좌표)
     * @param presence 얼굴 존재 점수 (출력, 출력 텐서가 없으면 1.0)
     */
    bool runFaceLandmark(const cv::Mat& rgb, const NormalizedRect& face_rect,
                         NormalizedRect& crop_rect, float& presence) {
        const int img_width = rgb.cols;
        const int img_height = rgb.rows;

        const float margin_x = face_rect.width * FACE_CROP_MARGIN;
        const float margin_y = face_rect.height * FACE_CROP_MARGIN;

        int px_min_x = static_cast<int>(std::max(0.0f, face_rect.x - margin_x) * img_width);
        int px_min_y = static_cast<int>(std::max(0.0f, face_rect.y - margin_y) * img_height);
        int px_max_x = static_cast<int>(std::min(1.0f, face_rect.x + face_rect.width + margin_x) * img_width);
        int px_max_y = static_cast<int>(std::min(1.0f, face_rect.y + face_rect.height + margin_y) * img_height);

        px_min_x = std::clamp(px_min_x, 0, img_width - 1);
        px_min_y = std::clamp(px_min_y, 0, img_height - 1);
        px_max_x = std::clamp(px_max_x, px_min_x + 1, img_width);
        px_max_y = std::clamp(px_max_y, px_min_y + 1, img_height);

        const cv::Rect roi(px_min_x, px_min_y, px_max_x - px_min_x, px_max_y - px_min_y);
        crop_rect.x = static_cast<float>(roi.x) / img_width;
        crop_rect.y = static_cast<float>(roi.y) / img_height;
        crop_rect.width = static_cast<float>(roi.width) / img_width;
        crop_rect.height = static_cast<float>(roi.height) / img_height;

        toInputTensor(rgb(roi), FACE_LANDMARK_INPUT_SIZE, landmark_input.data());

        float* input_tensor = face_landmark_interpreter->typed_input_tensor<float>(0);
        if (!input_tensor) {
            return false;
        }
        std::memcpy(input_tensor, landmark_input.data(), landmark_input.size() * sizeof(float));

        if (face_landmark_interpreter->Invoke() != kTfLiteOk) {
            detail::getLogger("facemask.detector")->warn("face landmark inference failed");
            return false;
        }

        const float* output = face_landmark_interpreter->typed_output_tensor<float>(0);
        if (!output) {
            return false;
        }
        std::memcpy(landmark_output.data(), output, landmark_output.size() * sizeof(float));

        presence = 1.0f;
        if (face_landmark_interpreter->outputs().size() >= 2) {
            const float* score = face_landmark_interpreter->typed_output_tensor<float>(1);
            if (score) {
                presence = sigmoid(score[0]);
            }
        }
        return true;
    }
#endif  // FACEMASK_HAS_TFLITE
};

// ============================================================
// 생성자/소멸자
// ============================================================

FaceMeshDetector::FaceMeshDetector()
    : impl_(std::make_unique<Impl>()) {
}

FaceMeshDetector::~FaceMeshDetector() = default;

// ============================================================
// LandmarkDetector 인터페이스 구현
// ============================================================

bool FaceMeshDetector::initialize(const std::string& model_path) {
    auto logger = detail::getLogger("facemask.detector");

    if (impl_->initialized) {
        logger->warn("detector already initialized");
        return false;
    }

    if (!impl_->validateModelPath(model_path)) {
        logger->error("invalid model directory: {}", model_path);
        return false;
    }

#ifdef FACEMASK_HAS_TFLITE
    if (!impl_->loadAllModels(model_path)) {
        logger->error("failed to load TFLite models from {}", model_path);
        impl_->releaseAllModels();
        return false;
    }
#else
    logger->error("built without TensorFlow Lite, face mesh detector unavailable");
    return false;
#endif

    impl_->resetTrackingCache();
    impl_->model_path = model_path;
    impl_->initialized = true;
    logger->info("face mesh models loaded from {}", model_path);
    return true;
}

LandmarkResult FaceMeshDetector::detect(const cv::Mat& frame_bgr) {
    LandmarkResult result;

    if (!impl_->initialized || frame_bgr.empty() || frame_bgr.type() != CV_8UC3) {
        return result;
    }

#ifdef FACEMASK_HAS_TFLITE
    cv::cvtColor(frame_bgr, impl_->rgb_buffer, cv::COLOR_BGR2RGB);
    const cv::Mat& rgb = impl_->rgb_buffer;

    // 1. 얼굴 영역: 추적 캐시 또는 BlazeFace
    NormalizedRect face_rect;
    float face_confidence = 0.0f;
    if (impl_->use_tracking && impl_->has_prev_face) {
        face_rect = impl_->prev_face_rect;
        face_confidence = impl_->prev_confidence;
    } else if (!impl_->runFaceDetection(rgb, face_rect, face_confidence)) {
        impl_->resetTrackingCache();
        return result;
    }

    // 2. 랜드마크 추론
    NormalizedRect crop_rect;
    float presence = 0.0f;
    if (!impl_->runFaceLandmark(rgb, face_rect, crop_rect, presence) ||
        presence < impl_->min_tracking_confidence) {
        impl_->resetTrackingCache();
        return result;
    }

    // 3. 크롭 픽셀 좌표 → 프레임 정규화 좌표
    result.landmarks.resize(FACE_LANDMARK_COUNT);
    float min_x = 1.0f, min_y = 1.0f, max_x = 0.0f, max_y = 0.0f;
    for (int i = 0; i < FACE_LANDMARK_COUNT; ++i) {
        const float local_x = impl_->landmark_output[i * 3 + 0] / static_cast<float>(FACE_LANDMARK_INPUT_SIZE);
        const float local_y = impl_->landmark_output[i * 3 + 1] / static_cast<float>(FACE_LANDMARK_INPUT_SIZE);

        NormalizedLandmark& lm = result.landmarks[i];
        lm.x = crop_rect.x + local_x * crop_rect.width;
        lm.y = crop_rect.y + local_y * crop_rect.height;
        lm.z = impl_->landmark_output[i * 3 + 2];

        min_x = std::min(min_x, lm.x);
        min_y = std::min(min_y, lm.y);
        max_x = std::max(max_x, lm.x);
        max_y = std::max(max_y, lm.y);
    }

    result.detected = true;
    result.confidence = face_confidence * presence;

    // 4. 추적 캐시: 다음 프레임은 이번 랜드마크 범위에서 시작
    impl_->prev_face_rect.x = std::clamp(min_x, 0.0f, 1.0f);
    impl_->prev_face_rect.y = std::clamp(min_y, 0.0f, 1.0f);
    impl_->prev_face_rect.width = std::clamp(max_x - min_x, 0.0f, 1.0f - impl_->prev_face_rect.x);
    impl_->prev_face_rect.height = std::clamp(max_y - min_y, 0.0f, 1.0f - impl_->prev_face_rect.y);
    impl_->prev_confidence = face_confidence;
    impl_->has_prev_face = impl_->prev_face_rect.width > 0.0f && impl_->prev_face_rect.height > 0.0f;
#endif  // FACEMASK_HAS_TFLITE

    return result;
}

void FaceMeshDetector::release() {
#ifdef FACEMASK_HAS_TFLITE
    impl_->releaseAllModels();
#endif
    impl_->resetTrackingCache();
    impl_->initialized = false;
    impl_->model_path.clear();
}

bool FaceMeshDetector::isInitialized() const {
    return impl_->initialized;
}

DetectorType FaceMeshDetector::getDetectorType() const {
    return DetectorType::FaceMesh;
}

// ============================================================
// 검출 설정
// ============================================================

void FaceMeshDetector::setMinDetectionConfidence(float confidence) {
    impl_->min_detection_confidence = std::clamp(confidence, 0.0f, 1.0f);
}

void FaceMeshDetector::setMinTrackingConfidence(float confidence) {
    impl_->min_tracking_confidence = std::clamp(confidence, 0.0f, 1.0f);
}

void FaceMeshDetector::setNumThreads(int num_threads) {
    impl_->num_threads = std::clamp(num_threads, 1, 16);
}

void FaceMeshDetector::setTrackingEnabled(bool enable) {
    impl_->use_tracking = enable;
    if (!enable) {
        impl_->resetTrackingCache();
    }
}

// 추적 캐시를 비워 다음 detect()에서 얼굴 검출을 강제
void FaceMeshDetector::reset() {
    impl_->resetTrackingCache();
}

} // namespace facemask
