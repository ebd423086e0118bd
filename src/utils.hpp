// utils.hpp

#pragma once

#include <ctime>
#include <string>

#define LOG_FILENAME "preprocess_frames.log"

bool create_dir(const std::string& path);

// Creates every missing component of path (like mkdir -p)
bool create_dirs(const std::string& path);

bool dir_exists(const std::string& path);

// Changes seconds into HH:MM:SS format
std::string format_duration(double seconds);

// Reads CPU temp and returns a formatted string
std::string get_cpu_temp();

// Wall clock timestamp used as log line prefix (YYYYmmdd_HHMMSS)
std::string get_timestamp();

// Directory for the backup log file. Empty string disables file logging.
void set_log_dir(const std::string& path);

// Thread safe. Writes to STDOUT and appends to <log dir>/preprocess_frames.log
void log_status(const std::string& message);

// Formats a naive local timestamp (see frame.hpp) with strftime syntax
std::string format_local_time(std::time_t local_seconds, const char* format);

// Strips leading/trailing whitespace
std::string trim(const std::string& str);

std::string to_lower(std::string str);
