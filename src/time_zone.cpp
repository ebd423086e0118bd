// time_zone.cpp

#include <cstdlib>
#include <sys/stat.h>
#include <time.h>

#include "errors.hpp"
#include "frame.hpp"
#include "time_zone.hpp"

#define TRANSITION_SCAN_STEP_S (6 * 3600L)

TimeZone::TimeZone(const std::string& id) : zone_id(id) {
    if (!is_known(id)) {
        throw ConfigurationError("Unknown timezone: '" + id + "'");
    }
    activate();
}

bool TimeZone::is_known(const std::string& id) {
    if (id.empty() || id[0] == '/' || id.find("..") != std::string::npos) {
        return false;
    }

    const char* tz_dir = std::getenv("TZDIR");
    std::string path = (tz_dir != nullptr && tz_dir[0] != '\0')
        ? std::string(tz_dir) + "/" + id
        : std::string(ZONEINFO_PATH) + id;

    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

void TimeZone::activate() const {
    std::string tz_value = ":" + zone_id;
    setenv("TZ", tz_value.c_str(), 1);
    tzset();
}

long TimeZone::offset_at_utc(std::time_t utc, bool* is_dst) const {
    std::tm tm;
    if (localtime_r(&utc, &tm) == nullptr) {
        if (is_dst != nullptr) {
            *is_dst = false;
        }
        return 0;
    }
    if (is_dst != nullptr) {
        *is_dst = tm.tm_isdst > 0;
    }
    return tm.tm_gmtoff;
}

std::time_t TimeZone::utc_to_local(std::time_t utc) const {
    return utc + offset_at_utc(utc, nullptr);
}

namespace {

// UTC instants whose wall clock reading equals local. 0 candidates means the
// time falls in a gap, 2 means it is repeated.
int resolve_local(const TimeZone& zone, std::time_t local, long offset_early, long offset_late,
                  std::time_t& first, std::time_t& second) {
    std::time_t early = local - offset_early;
    std::time_t late = local - offset_late;
    bool early_ok = zone.utc_to_local(early) == local;
    bool late_ok = zone.utc_to_local(late) == local;

    if (offset_early == offset_late || (early_ok && !late_ok)) {
        first = second = early;
        return early_ok ? 1 : 0;
    }
    if (late_ok && !early_ok) {
        first = second = late;
        return 1;
    }
    if (!early_ok && !late_ok) {
        first = second = early;
        return 0;
    }
    first = early < late ? early : late;
    second = early < late ? late : early;
    return 2;
}

}

std::time_t TimeZone::local_to_utc(std::time_t local) const {
    // At most one transition is expected within a day on either side
    long offset_early = offset_at_utc(local - SECONDS_PER_DAY, nullptr);
    long offset_late = offset_at_utc(local + SECONDS_PER_DAY, nullptr);

    std::time_t first = 0;
    std::time_t second = 0;
    resolve_local(*this, local, offset_early, offset_late, first, second);
    return first;
}

long TimeZone::utc_offset_at_local(std::time_t local) const {
    return offset_at_utc(local_to_utc(local), nullptr);
}

bool TimeZone::is_dst(std::time_t local) const {
    long offset_early = offset_at_utc(local - SECONDS_PER_DAY, nullptr);
    long offset_late = offset_at_utc(local + SECONDS_PER_DAY, nullptr);

    std::time_t first = 0;
    std::time_t second = 0;
    int matches = resolve_local(*this, local, offset_early, offset_late, first, second);
    if (matches != 1) {
        // Repeated hour or skipped hour: treated as standard time
        return false;
    }

    bool dst = false;
    offset_at_utc(first, &dst);
    return dst;
}

bool TimeZone::next_dst_transition(std::time_t local, ZoneTransition& transition, int max_days) const {
    return next_dst_transition_utc(local_to_utc(local), transition, max_days);
}

bool TimeZone::next_dst_transition_utc(std::time_t start, ZoneTransition& transition, int max_days) const {
    bool start_dst = false;
    offset_at_utc(start, &start_dst);

    std::time_t limit = start + static_cast<std::time_t>(max_days) * SECONDS_PER_DAY;
    std::time_t previous = start;
    for (std::time_t t = start + TRANSITION_SCAN_STEP_S; t <= limit; t += TRANSITION_SCAN_STEP_S) {
        bool dst = false;
        offset_at_utc(t, &dst);
        if (dst == start_dst) {
            previous = t;
            continue;
        }

        // Bisect down to the first second with the new DST state
        std::time_t lo = previous;
        std::time_t hi = t;
        while (hi - lo > 1) {
            std::time_t mid = lo + (hi - lo) / 2;
            bool mid_dst = false;
            offset_at_utc(mid, &mid_dst);
            if (mid_dst == start_dst) {
                lo = mid;
            } else {
                hi = mid;
            }
        }

        transition.utc_instant = hi;
        transition.offset_before = offset_at_utc(lo, &transition.dst_before);
        transition.offset_after = offset_at_utc(hi, &transition.dst_after);
        return true;
    }
    return false;
}
