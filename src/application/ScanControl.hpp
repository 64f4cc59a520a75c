/**
 * @file ScanControl.hpp
 * @brief Cooperative cancellation and progress hooks for long correlation scans.
 */

#pragma once
#include <functional>

namespace metriclens::application {

/**
 * @struct ScanControl
 * @brief Optional callbacks polled by the engine between pair evaluations.
 *
 * The engine serializes calls to both callbacks, so they may be invoked from
 * any worker thread but never concurrently.
 */
struct ScanControl {
    std::function<bool()> isCancelled;       ///< Return true to stop starting new pairs.
    std::function<void(float)> onProgress;   ///< Completed fraction in [0, 1].
};

} // namespace metriclens::application
