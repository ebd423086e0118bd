// sun_calculator.cpp

#include <cmath>
#include <sstream>

#include "errors.hpp"
#include "frame.hpp"
#include "sun_calculator.hpp"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

// Zenith of the sun's centre at rise/set, refraction and semi-diameter included
#define SUNRISE_ZENITH_DEG 90.833
#define MINUTES_PER_DAY 1440.0

namespace {

double radians(const double deg) {
    return deg * M_PI / 180.0;
}

double degrees(const double rad) {
    return rad * 180.0 / M_PI;
}

double time_to_julian_date(const std::time_t utc) {
    return static_cast<double>(utc) / SECONDS_PER_DAY + 2440587.5;
}

}

void validate_coordinates(double latitude, double longitude) {
    if (!(latitude >= -90.0 && latitude <= 90.0)) {
        std::stringstream ss;
        ss << "Latitude " << latitude << " out of range [-90, 90]";
        throw InvalidCoordinate(ss.str());
    }
    if (!(longitude >= -180.0 && longitude <= 180.0)) {
        std::stringstream ss;
        ss << "Longitude " << longitude << " out of range [-180, 180]";
        throw InvalidCoordinate(ss.str());
    }
}

SunWindow sun_window(long day_index, double latitude, double longitude, const TimeZone& zone) {
    validate_coordinates(latitude, longitude);

    std::time_t midnight = local_day_start(day_index);
    std::time_t local_noon = midnight + SECONDS_PER_DAY / 2;
    std::time_t utc_noon = zone.local_to_utc(local_noon);
    double offset_minutes = zone.utc_offset_at_local(local_noon) / 60.0;

    // Column letters refer to the NOAA spreadsheet
    double julian_day = time_to_julian_date(utc_noon);	// F
    double julian_century = (julian_day - 2451545) / 36525;	// G
    double geom_mean_long_sun = std::fmod(280.46646 + julian_century * (36000.76983 + julian_century * 0.0003032), 360);	// I
    double geom_mean_anom_sun = 357.52911 + julian_century * (35999.05029 - 0.0001537 * julian_century);	// J
    double eccent_earth_orbit = 0.016708634 - julian_century * (0.000042037 + 0.0000001267 * julian_century);	// K
    double sun_eq_of_ctr = std::sin(radians(geom_mean_anom_sun)) * (1.914602 - julian_century * (0.004817 + 0.000014 * julian_century))
        + std::sin(radians(2 * geom_mean_anom_sun)) * (0.019993 - 0.000101 * julian_century)
        + std::sin(radians(3 * geom_mean_anom_sun)) * 0.000289;	// L
    double sun_true_long = geom_mean_long_sun + sun_eq_of_ctr;	// M
    double sun_app_long = sun_true_long - 0.00569 - 0.00478 * std::sin(radians(125.04 - 1934.136 * julian_century));	// P
    double mean_obliq_ecliptic = 23 + (26 + ((21.448 - julian_century * (46.815 + julian_century * (0.00059 - julian_century * 0.001813)))) / 60) / 60;	// Q
    double obliq_corr = mean_obliq_ecliptic + 0.00256 * std::cos(radians(125.04 - 1934.136 * julian_century));	// R
    double sun_declin = degrees(std::asin(std::sin(radians(obliq_corr)) * std::sin(radians(sun_app_long))));	// T
    double var_y = std::tan(radians(obliq_corr / 2)) * std::tan(radians(obliq_corr / 2));	// U
    double equation_of_time = 4 * degrees(var_y * std::sin(2 * radians(geom_mean_long_sun))
        - 2 * eccent_earth_orbit * std::sin(radians(geom_mean_anom_sun))
        + 4 * eccent_earth_orbit * var_y * std::sin(radians(geom_mean_anom_sun)) * std::cos(2 * radians(geom_mean_long_sun))
        - 0.5 * var_y * var_y * std::sin(4 * radians(geom_mean_long_sun))
        - 1.25 * eccent_earth_orbit * eccent_earth_orbit * std::sin(2 * radians(geom_mean_anom_sun)));	// V

    // Hour angle. Outside [-1, 1] the sun never sets (< -1) or never rises (> 1).
    double cos_hour_angle = std::cos(radians(SUNRISE_ZENITH_DEG)) / (std::cos(radians(latitude)) * std::cos(radians(sun_declin)))
        - std::tan(radians(latitude)) * std::tan(radians(sun_declin));
    double ha_sunrise_deg;
    if (cos_hour_angle <= -1.0) {
        ha_sunrise_deg = 180.0;
    } else if (cos_hour_angle >= 1.0) {
        ha_sunrise_deg = 0.0;
    } else {
        ha_sunrise_deg = degrees(std::acos(cos_hour_angle));	// W
    }

    double solar_noon = (720 - 4 * longitude - equation_of_time + offset_minutes) / MINUTES_PER_DAY;	// X
    double sunrise_time = solar_noon - ha_sunrise_deg * 4 / MINUTES_PER_DAY;	// Y
    double sunset_time = solar_noon + ha_sunrise_deg * 4 / MINUTES_PER_DAY;	// Z

    SunWindow window;
    window.day_index = day_index;
    window.sunrise = midnight + static_cast<std::time_t>(std::lround(sunrise_time * SECONDS_PER_DAY));
    window.sunset = midnight + static_cast<std::time_t>(std::lround(sunset_time * SECONDS_PER_DAY));
    return window;
}

SunWindowCache::SunWindowCache(double latitude, double longitude, const TimeZone& zone)
    : latitude(latitude), longitude(longitude), zone(zone) {
    validate_coordinates(latitude, longitude);
}

SunWindow SunWindowCache::get(long day_index) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex);
        auto it = windows.find(day_index);
        if (it != windows.end()) {
            return it->second;
        }
    }

    // Computed outside the lock; a concurrent duplicate yields the same value
    SunWindow window = sun_window(day_index, latitude, longitude, zone);

    std::lock_guard<std::mutex> lock(cache_mutex);
    windows.emplace(day_index, window);
    return window;
}

size_t SunWindowCache::size() {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return windows.size();
}
