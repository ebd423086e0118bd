// fade_compositor.hpp

#pragma once

#include <opencv2/core.hpp>

#include "day_sequence.hpp"

// Blend strength toward black in [0, 1]. 1 at the first and last frame of a
// day group, falling linearly to 0 once fade_seconds away from both ends.
// fade_seconds <= 0 disables fading.
double fade_weight(const CorrectedFrame& frame, const DayGroup& group, long fade_seconds);

// (1 - weight) * image + weight * black, per channel, rounded and saturated
cv::Mat apply_fade(const cv::Mat& image, double weight);
