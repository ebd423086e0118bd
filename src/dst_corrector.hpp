// dst_corrector.hpp

#pragma once

#include <ctime>
#include <string>

#include "time_zone.hpp"

#define DST_SHIFT_SECONDS 3600L

// Decided once per run from the first frame, then shared read-only
struct TimeZoneContext {
    std::string timezone_id;
    bool dst_anomaly = false;
    // Camera wall clock reading at which the missed transition happened
    std::time_t transition_instant = 0;
    // +3600 for a missed spring-forward, -3600 for a missed fall-back
    long correction_seconds = DST_SHIFT_SECONDS;
    // Camera wall clock reading at the following transition, where the zone
    // returns to the camera's offset. Frames from there on are not shifted.
    bool has_range_end = false;
    std::time_t range_end = 0;
};

// A camera clock set at the first frame keeps that frame's offset. When the
// zone changes DST state after the first frame, every later frame is off by
// the size of that change. ignore_flag trusts the device clock instead.
bool detect_dst_anomaly(std::time_t first_timestamp, const TimeZone& zone, bool ignore_flag);

// As above, also returning the missed transition when the flag is set
bool detect_dst_anomaly(std::time_t first_timestamp, const TimeZone& zone, bool ignore_flag,
                        ZoneTransition& transition);

TimeZoneContext make_time_zone_context(std::time_t first_timestamp, const TimeZone& zone, bool ignore_flag);

// Frames at or after transition_instant are shifted (inclusive boundary)
std::time_t correct_timestamp(std::time_t raw_timestamp, bool anomaly_flag,
                              std::time_t transition_instant,
                              long shift_seconds = DST_SHIFT_SECONDS);

// Shifts frames in [transition_instant, range_end)
std::time_t correct_timestamp(std::time_t raw_timestamp, const TimeZoneContext& context);
