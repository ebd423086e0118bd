// time_zone.hpp

#pragma once

#include <ctime>
#include <string>

#define ZONEINFO_PATH "/usr/share/zoneinfo/"

// A DST (or other offset) change of the zone
struct ZoneTransition {
    std::time_t utc_instant = 0;
    long offset_before = 0;  // seconds east of UTC
    long offset_after = 0;
    bool dst_before = false;
    bool dst_after = false;

    // Wall clock reading at the transition for a clock that keeps the old offset
    std::time_t local_instant() const { return utc_instant + offset_before; }
    long shift_seconds() const { return offset_after - offset_before; }
};

// IANA zone backed by the C library's zoneinfo support.
//
// The C library keeps a single active zone per process: constructing a
// TimeZone exports TZ and calls tzset(). All later conversions assume no
// other zone has been activated in between (one zone per run).
class TimeZone {
private:
    std::string zone_id;

    long offset_at_utc(std::time_t utc, bool* is_dst) const;

public:
    // Throws ConfigurationError for unknown identifiers
    explicit TimeZone(const std::string& id);

    const std::string& id() const { return zone_id; }

    // Re-exports this zone as the process zone
    void activate() const;

    std::time_t utc_to_local(std::time_t utc) const;

    // Wall clock -> UTC. Repeated (fall-back) times resolve to the first
    // occurrence, skipped (spring-forward) times use the pre-transition offset.
    std::time_t local_to_utc(std::time_t local) const;

    long utc_offset_at_local(std::time_t local) const;

    // False for times in the repeated hour and in the spring-forward gap
    bool is_dst(std::time_t local) const;

    // First DST change strictly after the given wall clock time, searched up
    // to max_days ahead
    bool next_dst_transition(std::time_t local, ZoneTransition& transition, int max_days = 366) const;

    // Same, starting strictly after a UTC instant
    bool next_dst_transition_utc(std::time_t utc, ZoneTransition& transition, int max_days = 366) const;

    static bool is_known(const std::string& id);
};
