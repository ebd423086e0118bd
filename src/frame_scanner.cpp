// frame_scanner.cpp

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <iomanip>
#include <regex>
#include <sstream>
#include <sys/stat.h>
#include <time.h>

#include <exiv2/exiv2.hpp>

#include "errors.hpp"
#include "frame_scanner.hpp"
#include "utils.hpp"

namespace {

const char* const IMAGE_EXTENSIONS[] = {".jpg", ".jpeg", ".png"};

// Priority order for the capture time
const char* const EXIF_TIME_KEYS[] = {
    "Exif.Photo.DateTimeOriginal",
    "Exif.Photo.DateTimeDigitized",
    "Exif.Image.DateTime"
};

bool make_local_seconds(int year, int month, int day, int hour, int minute, int second,
                        std::time_t& local_seconds) {
    if (year < 1970 || month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    std::tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    local_seconds = timegm(&tm);

    // timegm normalizes Feb 31 into March; reject those
    return tm.tm_mday == day && tm.tm_mon == month - 1;
}

void walk_dir(const std::string& dir, std::vector<std::string>& files) {
    DIR* handle = opendir(dir.c_str());
    if (handle == nullptr) {
        log_status("Warning: Could not open directory " + dir + ": " + strerror(errno));
        return;
    }

    std::string prefix = dir;
    if (!prefix.empty() && prefix.back() != '/') {
        prefix += '/';
    }

    struct dirent* entry;
    while ((entry = readdir(handle)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") {
            continue;
        }

        std::string path = prefix + name;
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            continue;
        }
        if (S_ISDIR(st.st_mode)) {
            walk_dir(path, files);
        } else if (S_ISREG(st.st_mode) && is_image_file(path)) {
            files.push_back(path);
        }
    }
    closedir(handle);
}

double gps_coordinate(const Exiv2::ExifData& exif, const char* value_key, const char* ref_key, bool& found) {
    found = false;
    auto value = exif.findKey(Exiv2::ExifKey(value_key));
    auto ref = exif.findKey(Exiv2::ExifKey(ref_key));
    if (value == exif.end() || ref == exif.end() || value->count() != 3) {
        return 0.0;
    }

    double degrees = value->toFloat(0);
    double minutes = value->toFloat(1);
    double seconds = value->toFloat(2);
    std::string hemisphere = ref->toString();
    double sign = (hemisphere == "S" || hemisphere == "W") ? -1.0 : 1.0;

    found = true;
    return sign * (degrees + minutes / 60.0 + seconds / 3600.0);
}

}

bool is_image_file(const std::string& path) {
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return false;
    }

    std::string extension = to_lower(path.substr(dot));
    for (const char* candidate : IMAGE_EXTENSIONS) {
        if (extension == candidate) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> list_image_files(const std::string& dir) {
    std::vector<std::string> files;
    walk_dir(dir, files);
    std::sort(files.begin(), files.end());
    return files;
}

bool parse_exif_datetime(const std::string& value, std::time_t& local_seconds) {
    std::string trimmed = trim(value);
    if (trimmed.size() < 19 || trimmed.compare(0, 10, "0000:00:00") == 0) {
        return false;
    }

    std::tm tm = {};
    std::istringstream iss(trimmed.substr(0, 19));
    iss >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
    if (iss.fail()) {
        return false;
    }

    return make_local_seconds(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                              tm.tm_hour, tm.tm_min, tm.tm_sec, local_seconds);
}

bool parse_filename_timestamp(const std::string& path, std::time_t& local_seconds) {
    // Only the file name; directories often carry dates of their own
    std::string name = path;
    size_t slash = name.find_last_of('/');
    if (slash != std::string::npos) {
        name = name.substr(slash + 1);
    }

    static const std::regex patterns[] = {
        std::regex(R"((\d{4})(\d{2})(\d{2})[_-]?(\d{2})(\d{2})(\d{2}))"),
        std::regex(R"((\d{4})-(\d{2})-(\d{2})[_\s-]?(\d{2})[-_]?(\d{2})[-_]?(\d{2}))")
    };

    for (const auto& re : patterns) {
        std::smatch m;
        if (std::regex_search(name, m, re)) {
            if (make_local_seconds(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()),
                                   std::stoi(m[4].str()), std::stoi(m[5].str()), std::stoi(m[6].str()),
                                   local_seconds)) {
                return true;
            }
        }
    }
    return false;
}

bool read_exif_metadata(const std::string& path, SourceFrame& frame) {
    try {
        auto image = Exiv2::ImageFactory::open(path);
        if (!image.get()) {
            return false;
        }

        image->readMetadata();
        const Exiv2::ExifData& exif = image->exifData();
        if (exif.empty()) {
            return false;
        }

        bool found_lat = false;
        bool found_lon = false;
        double latitude = gps_coordinate(exif, "Exif.GPSInfo.GPSLatitude", "Exif.GPSInfo.GPSLatitudeRef", found_lat);
        double longitude = gps_coordinate(exif, "Exif.GPSInfo.GPSLongitude", "Exif.GPSInfo.GPSLongitudeRef", found_lon);
        if (found_lat && found_lon) {
            frame.has_gps = true;
            frame.gps_latitude = latitude;
            frame.gps_longitude = longitude;
        }

        for (const char* key : EXIF_TIME_KEYS) {
            auto it = exif.findKey(Exiv2::ExifKey(key));
            if (it == exif.end()) {
                continue;
            }
            std::time_t local_seconds = 0;
            if (parse_exif_datetime(it->toString(), local_seconds)) {
                frame.raw_timestamp = local_seconds;
                return true;
            }
        }
    } catch (const Exiv2::Error& e) {
        log_status("Warning: Could not read EXIF data from " + path + ": " + e.what());
    }
    return false;
}

ScanResult scan_frames(const std::vector<std::string>& input_dirs) {
    ScanResult result;
    int order = 0;

    for (const auto& dir : input_dirs) {
        std::vector<std::string> files = list_image_files(dir);
        log_status("Found " + std::to_string(files.size()) + " images in " + dir);
        result.images_found += static_cast<int>(files.size());

        for (const auto& path : files) {
            SourceFrame frame;
            frame.file_path = path;
            frame.source_order = order++;

            if (!read_exif_metadata(path, frame) &&
                !parse_filename_timestamp(path, frame.raw_timestamp)) {
                log_status("Warning: No capture time for " + path + ", skipping");
                result.skipped.push_back(path);
                continue;
            }
            result.frames.push_back(frame);
        }
    }

    if (result.images_found == 0) {
        throw EmptyInputError("No images found in input directories");
    }
    if (result.frames.empty()) {
        throw EmptyInputError("None of the " + std::to_string(result.images_found)
                              + " images has a capture timestamp");
    }
    return result;
}
