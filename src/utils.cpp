// utils.cpp

#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <cmath>
#include <iostream>
#include <fstream>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <sys/stat.h>

namespace {

std::mutex log_mutex;
std::string log_dir = "logs/";

}

// Creates a directory. Returns true if successful or if it already exists.
bool create_dir(const std::string& path) {
    // 0777 grants read/write/execute permission for everyone
    if (mkdir(path.c_str(), 0777) == -1) {
        if (errno == EEXIST) {
            return true;
        } else {
            std::cerr << "Error creating directory " << path << ": " << strerror(errno) << std::endl;
            return false;
        }
    }
    return true;
}

bool create_dirs(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    // Walk every separator so that parents exist before children
    size_t pos = 0;
    while ((pos = path.find('/', pos + 1)) != std::string::npos) {
        std::string parent = path.substr(0, pos);
        if (!parent.empty() && !dir_exists(parent) && !create_dir(parent)) {
            return false;
        }
    }
    return create_dir(path) && dir_exists(path);
}

bool dir_exists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

// Formats seconds (double) into HH:MM:SS string format.
std::string format_duration(double seconds) {
    // Round to the nearest second
    long total_seconds = static_cast<long>(std::round(seconds));
    long h = total_seconds / 3600;
    long m = (total_seconds % 3600) / 60;
    long s = total_seconds % 60;

    std::stringstream ss;
    ss << std::setfill('0') << std::setw(2) << h << ":"
       << std::setfill('0') << std::setw(2) << m << ":"
       << std::setfill('0') << std::setw(2) << s;
    return ss.str();
}

// Reads the system CPU temperature file and returns a formatted string (e.g., "68.5°C").
std::string get_cpu_temp() {
    std::ifstream temp_file("/sys/class/thermal/thermal_zone0/temp");
    if (!temp_file.is_open()) {
        return "Temp N/A";
    }

    int temp_milli = 0;
    if (temp_file >> temp_milli) {
        // Convert millidegrees (e.g., 54200) to degrees Celsius (e.g., 54.2)
        double temp_c = static_cast<double>(temp_milli) / 1000.0;

        std::stringstream ss;
        ss << std::fixed << std::setprecision(1) << temp_c << "°C";
        return ss.str();
    }

    return "Temp Read Error";
}

std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm;
    localtime_r(&time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return ss.str();
}

void set_log_dir(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_dir = path;
    if (!log_dir.empty() && log_dir.back() != '/') {
        log_dir += '/';
    }
}

void log_status(const std::string& message) {
    auto timestamp = get_timestamp();
    std::lock_guard<std::mutex> lock(log_mutex);

    // Log to STDOUT
    std::cout << "[" << timestamp << "] " << message << std::endl;

    if (log_dir.empty()) {
        return;
    }

    // Log to a backup file inside the logs directory
    std::string logfile_path = log_dir + LOG_FILENAME;
    std::ofstream logfile(logfile_path, std::ios::app);
    if (logfile.is_open()) {
        logfile << "[" << timestamp << "] " << message << std::endl;
        logfile.close();
    }
}

std::string format_local_time(std::time_t local_seconds, const char* format) {
    // Naive local seconds are encoded with timegm, so decode with gmtime
    std::tm tm;
    gmtime_r(&local_seconds, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, format);
    return ss.str();
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}
