// sun_calculator.hpp

#pragma once

#include <ctime>
#include <map>
#include <mutex>

#include "time_zone.hpp"

// Sunrise/sunset for one calendar date, as naive local seconds
struct SunWindow {
    long day_index = 0;
    std::time_t sunrise = 0;
    std::time_t sunset = 0;
};

void validate_coordinates(double latitude, double longitude);

// NOAA solar calculation (https://gml.noaa.gov/grad/solcalc/calcdetails.html).
// Throws InvalidCoordinate for latitude outside +-90 or longitude outside +-180.
SunWindow sun_window(long day_index, double latitude, double longitude, const TimeZone& zone);

// Per date cache shared by all frames of a run
class SunWindowCache {
private:
    double latitude;
    double longitude;
    const TimeZone& zone;

    std::mutex cache_mutex;
    std::map<long, SunWindow> windows;

public:
    SunWindowCache(double latitude, double longitude, const TimeZone& zone);

    SunWindow get(long day_index);

    size_t size();
};
