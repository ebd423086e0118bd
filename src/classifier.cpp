// classifier.cpp

#include "classifier.hpp"

Classification classify(std::time_t corrected_timestamp, const SunWindow& window, long margin_seconds) {
    if (corrected_timestamp >= window.sunrise && corrected_timestamp <= window.sunset) {
        return Classification::Day;
    }
    if (corrected_timestamp >= window.sunrise - margin_seconds &&
        corrected_timestamp <= window.sunset + margin_seconds) {
        return Classification::Twilight;
    }
    return Classification::Night;
}

const char* classification_name(Classification classification) {
    switch (classification) {
        case Classification::Day:
            return "day";
        case Classification::Twilight:
            return "twilight";
        case Classification::Night:
            return "night";
    }
    return "unknown";
}
