/**
 * @file facemask.h
 * @brief FaceMask SDK - Main header file
 *
 * Facial region isolation, color statistics and color filter pipeline
 * for recorded video.
 *
 * @version 0.1.0
 */

#ifndef FACEMASK_H
#define FACEMASK_H

// Version info
#define FACEMASK_VERSION_MAJOR 0
#define FACEMASK_VERSION_MINOR 1
#define FACEMASK_VERSION_PATCH 0
#define FACEMASK_VERSION_STRING "0.1.0"

// Core headers
#include "facemask/types.h"
#include "facemask/config.h"
#include "facemask/face_regions.h"
#include "facemask/region_mask.h"
#include "facemask/mask_compositor.h"
#include "facemask/artifact_cleaner.h"
#include "facemask/color_aggregator.h"
#include "facemask/extremum_tracker.h"
#include "facemask/overlay_blender.h"
#include "facemask/landmark_detector.h"
#include "facemask/video_io.h"
#include "facemask/sample_writer.h"
#include "facemask/frame_processor.h"
#include "facemask/video_processor.h"

namespace facemask {

/**
 * @brief Get SDK version string
 * @return Version string (e.g., "0.1.0")
 */
FACEMASK_EXPORT const char* get_version();

} // namespace facemask

#endif // FACEMASK_H
