// fade_compositor.cpp

#include <algorithm>

#include "fade_compositor.hpp"

double fade_weight(const CorrectedFrame& frame, const DayGroup& group, long fade_seconds) {
    if (fade_seconds <= 0 || group.frames.empty()) {
        return 0.0;
    }

    double since_start = static_cast<double>(frame.corrected_timestamp - group.first_timestamp());
    double until_end = static_cast<double>(group.last_timestamp() - frame.corrected_timestamp);
    since_start = std::max(0.0, since_start);
    until_end = std::max(0.0, until_end);

    double fade = static_cast<double>(fade_seconds);
    double start_weight = 1.0 - std::min(1.0, since_start / fade);
    double end_weight = 1.0 - std::min(1.0, until_end / fade);
    return std::max(start_weight, end_weight);
}

cv::Mat apply_fade(const cv::Mat& image, double weight) {
    if (weight <= 0.0) {
        return image.clone();
    }

    // Blending toward black reduces to a scale of the original
    cv::Mat faded;
    image.convertTo(faded, -1, 1.0 - std::min(1.0, weight), 0.0);
    return faded;
}
