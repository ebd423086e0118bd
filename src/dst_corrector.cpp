// dst_corrector.cpp

#include "dst_corrector.hpp"
#include "utils.hpp"

bool detect_dst_anomaly(std::time_t first_timestamp, const TimeZone& zone, bool ignore_flag) {
    ZoneTransition transition;
    return detect_dst_anomaly(first_timestamp, zone, ignore_flag, transition);
}

bool detect_dst_anomaly(std::time_t first_timestamp, const TimeZone& zone, bool ignore_flag,
                        ZoneTransition& transition) {
    if (ignore_flag) {
        return false;
    }
    return zone.next_dst_transition(first_timestamp, transition);
}

TimeZoneContext make_time_zone_context(std::time_t first_timestamp, const TimeZone& zone, bool ignore_flag) {
    TimeZoneContext context;
    context.timezone_id = zone.id();

    bool first_in_dst = zone.is_dst(first_timestamp);
    log_status("First frame " + format_local_time(first_timestamp, "%Y-%m-%d %H:%M:%S")
               + (first_in_dst ? " is in daylight saving time (" : " is in standard time (")
               + zone.id() + ")");

    ZoneTransition transition;
    context.dst_anomaly = detect_dst_anomaly(first_timestamp, zone, ignore_flag, transition);
    if (!context.dst_anomaly) {
        if (ignore_flag) {
            log_status("DST correction disabled, trusting camera clock");
        } else {
            log_status("No DST transition follows the first frame, no correction needed");
        }
        return context;
    }

    context.transition_instant = transition.local_instant();
    context.correction_seconds = transition.shift_seconds();

    log_status("DST anomaly assumed: frames at or after "
               + format_local_time(context.transition_instant, "%Y-%m-%d %H:%M:%S")
               + " (camera clock) shift by " + std::to_string(context.correction_seconds) + " s");

    // After the next change the zone is back on the camera's offset
    ZoneTransition next;
    if (zone.next_dst_transition_utc(transition.utc_instant, next)) {
        context.has_range_end = true;
        context.range_end = next.utc_instant + transition.offset_before;
        log_status("  Correction ends at the following transition, "
                   + format_local_time(context.range_end, "%Y-%m-%d %H:%M:%S") + " (camera clock)");
    }
    return context;
}

std::time_t correct_timestamp(std::time_t raw_timestamp, bool anomaly_flag,
                              std::time_t transition_instant, long shift_seconds) {
    if (!anomaly_flag || raw_timestamp < transition_instant) {
        return raw_timestamp;
    }
    return raw_timestamp + shift_seconds;
}

std::time_t correct_timestamp(std::time_t raw_timestamp, const TimeZoneContext& context) {
    if (context.has_range_end && raw_timestamp >= context.range_end) {
        return raw_timestamp;
    }
    return correct_timestamp(raw_timestamp, context.dst_anomaly,
                             context.transition_instant, context.correction_seconds);
}
