// frame.hpp

#pragma once

#include <ctime>
#include <string>

// --- Time representation ---
// All capture timestamps are "naive local seconds": the camera's wall clock
// fields (Y-m-d H:M:S) encoded with timegm(). They carry no zone, so adding
// or comparing them never depends on the process timezone.
#define SECONDS_PER_DAY 86400L

// Day number of a naive local timestamp (days since 1970-01-01)
inline long local_day_index(std::time_t local_seconds) {
    long day = static_cast<long>(local_seconds / SECONDS_PER_DAY);
    if (local_seconds < 0 && local_seconds % SECONDS_PER_DAY != 0) {
        day--;
    }
    return day;
}

inline std::time_t local_day_start(long day_index) {
    return static_cast<std::time_t>(day_index) * SECONDS_PER_DAY;
}

// --- Frames ---
struct SourceFrame {
    std::string file_path;
    std::time_t raw_timestamp = 0;
    int source_order = 0;

    // Location from EXIF GPS, if the file carries it
    bool has_gps = false;
    double gps_latitude = 0.0;
    double gps_longitude = 0.0;
};

enum class Classification {
    Day,
    Twilight,
    Night
};

struct CorrectedFrame {
    SourceFrame source;
    std::time_t corrected_timestamp = 0;
    Classification classification = Classification::Day;
    // Set when the sun has not risen yet (only meaningful for Twilight)
    bool before_sunrise = false;

    bool dst_corrected() const { return corrected_timestamp != source.raw_timestamp; }
};
