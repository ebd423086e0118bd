// classifier.hpp

#pragma once

#include <ctime>

#include "frame.hpp"
#include "sun_calculator.hpp"

// Day:      sunrise <= t <= sunset
// Twilight: within margin_seconds before sunrise or after sunset (accepted)
// Night:    everything else (dropped)
Classification classify(std::time_t corrected_timestamp, const SunWindow& window, long margin_seconds);

inline bool is_accepted(Classification classification) {
    return classification != Classification::Night;
}

const char* classification_name(Classification classification);
