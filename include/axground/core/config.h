#ifndef AXGROUND_CORE_CONFIG_H
#define AXGROUND_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace axground::core::config {

// Screen used when a snapshot carries no viewport.
inline constexpr std::int32_t kDefaultScreenWidth = 1920;
inline constexpr std::int32_t kDefaultScreenHeight = 1080;

// A ~5x5 sliver; anything smaller is not considered on screen.
inline constexpr std::int64_t kMinVisibleArea = 25;

// Fraction of a candidate's visible area a later element must cover.
inline constexpr double kOcclusionCoverageRatio = 0.5;

inline constexpr const char kNodeIdPrefix[] = "node_";

inline constexpr const char kUiTreeFilename[] = "ui_tree.json";
inline constexpr const char kFilteredFilename[] = "filtered.json";
inline constexpr const char kScreenshotFilename[] = "screenshot_cropped.png";
inline constexpr const char kDefaultImageFilename[] = "screenshot.png";

inline constexpr std::size_t kUnmappedRoleReportLimit = 10;

}  // namespace axground::core::config

#endif  // AXGROUND_CORE_CONFIG_H
