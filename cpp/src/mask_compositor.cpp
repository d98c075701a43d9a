/**
 * @file mask_compositor.cpp
 * @brief 영역 마스크 합성 구현
 */

#include "facemask/mask_compositor.h"
#include "facemask/config.h"

#include <algorithm>

#include "logging.h"

namespace facemask {

namespace {

const CompositeRecipe FACE_OUTLINE_RECIPE = {
    "faceOutline",
    {RegionId::FaceOval},
    {}
};

const CompositeRecipe FACE_SKIN_RECIPE = {
    "faceSkin",
    {RegionId::FaceOval},
    {RegionId::LeftEye, RegionId::RightEye, RegionId::Lips}
};

const CompositeRecipe FACE_CHEEKS_RECIPE = {
    "faceCheeks",
    {RegionId::LeftCheek, RegionId::RightCheek},
    {}
};

/**
 * @brief 마스크 유효성 검사 (단일 채널 8비트, 기준 크기 일치)
 */
bool isCompatibleMask(const cv::Mat& mask, const cv::Size& size) {
    return !mask.empty() && mask.type() == CV_8UC1 && mask.size() == size;
}

} // anonymous namespace

const CompositeRecipe& getCompositeRecipe(MaskType type) {
    switch (type) {
        case MaskType::FaceOutline: return FACE_OUTLINE_RECIPE;
        case MaskType::FaceCheeks:  return FACE_CHEEKS_RECIPE;
        case MaskType::FaceSkin:
        default:                    return FACE_SKIN_RECIPE;
    }
}

std::vector<RegionId> requiredRegions(MaskType type) {
    const CompositeRecipe& recipe = getCompositeRecipe(type);

    std::vector<RegionId> regions = recipe.include;
    for (RegionId region : recipe.exclude) {
        if (std::find(regions.begin(), regions.end(), region) == regions.end()) {
            regions.push_back(region);
        }
    }
    return regions;
}

ErrorCode composeRegion(const CompositeRecipe& recipe,
                        const RegionMaskSet& masks,
                        cv::Mat& out_mask) {
    auto logger = detail::getLogger("facemask.mask");

    if (recipe.include.empty()) {
        return ErrorCode::InvalidParameter;
    }

    // 기준 크기: 첫 include 마스크
    auto first = masks.find(recipe.include.front());
    if (first == masks.end() || first->second.empty()) {
        logger->error("composite {} is missing region {}",
                      recipe.name, toString(recipe.include.front()));
        return ErrorCode::InvalidRegion;
    }
    const cv::Size size = first->second.size();

    cv::Mat result = cv::Mat::zeros(size, CV_8UC1);

    for (RegionId region : recipe.include) {
        auto it = masks.find(region);
        if (it == masks.end()) {
            logger->error("composite {} is missing region {}", recipe.name, toString(region));
            return ErrorCode::InvalidRegion;
        }
        if (!isCompatibleMask(it->second, size)) {
            return ErrorCode::FrameSizeMismatch;
        }
        cv::bitwise_or(result, it->second, result);
    }

    for (RegionId region : recipe.exclude) {
        auto it = masks.find(region);
        if (it == masks.end()) {
            logger->error("composite {} is missing exclusion {}", recipe.name, toString(region));
            return ErrorCode::InvalidRegion;
        }
        if (!isCompatibleMask(it->second, size)) {
            return ErrorCode::FrameSizeMismatch;
        }
        result = subtractMask(result, it->second);
    }

    out_mask = result;
    return ErrorCode::Success;
}

ErrorCode composeRegion(MaskType type, const RegionMaskSet& masks, cv::Mat& out_mask) {
    return composeRegion(getCompositeRecipe(type), masks, out_mask);
}

cv::Mat subtractMask(const cv::Mat& base, const cv::Mat& removal) {
    cv::Mat inverted;
    cv::bitwise_not(removal, inverted);

    cv::Mat result;
    cv::bitwise_and(base, inverted, result);
    return result;
}

} // namespace facemask
