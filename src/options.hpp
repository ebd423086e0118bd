// options.hpp

#pragma once

#include <string>
#include <vector>

// --- Defaults ---
#define DEFAULT_CONFIG_FILE "conf/preprocess_frames.conf"
#define DEFAULT_LOGS_PATH "logs/"
#define DEFAULT_STATUS_FILE "/tmp/preprocess_frames_status.json"
#define DEFAULT_TIMEZONE "UTC"
#define DEFAULT_WORKER_THREAD_COUNT 20
#define DEFAULT_JPEG_QUALITY 95
#define DEFAULT_SEQUENCE_DIGITS 6
#define DEFAULT_OUTPUT_EXTENSION "jpg"
#define DEFAULT_TIME_FORMAT "%Y-%m-%d %H:%M"

// --- Limits ---
#define MAX_RESIZE_WIDTH 10000
#define MAX_DURATION_SECONDS 14400  // fade and night margin

struct PreprocessOptions {
    std::string output_dir;
    std::vector<std::string> input_dirs;

    std::string timezone = DEFAULT_TIMEZONE;
    bool has_latitude = false;
    bool has_longitude = false;
    double latitude = 0.0;
    double longitude = 0.0;

    int resize_width = 0;  // 0 keeps the source size
    long fade_seconds = 0;
    long night_margin_seconds = 0;
    bool ignore_dst_switch = false;
    int worker_thread_count = DEFAULT_WORKER_THREAD_COUNT;
    bool render_timestamp = false;

    std::string output_extension = DEFAULT_OUTPUT_EXTENSION;
    int jpeg_quality = DEFAULT_JPEG_QUALITY;
    int sequence_digits = DEFAULT_SEQUENCE_DIGITS;
    std::string time_format = DEFAULT_TIME_FORMAT;

    std::string logs_dir = DEFAULT_LOGS_PATH;
    std::string status_file = DEFAULT_STATUS_FILE;
};

// Applies one "key = value" setting. Returns false for unknown keys, throws
// ConfigurationError for malformed values.
bool apply_option(PreprocessOptions& options, const std::string& key, const std::string& value);

// Reads a "key = value" file on top of options. Throws ConfigurationError if
// the file cannot be opened.
void load_config_file(const std::string& path, PreprocessOptions& options);

// Range checks. Throws ConfigurationError / InvalidCoordinate.
void validate_options(const PreprocessOptions& options);

// Outcome of command line parsing
enum class ArgsStatus {
    Ok,
    Help,
    Usage
};

// preprocess_frames <output_dir> <image_dir>... [--option value]...
// A --config file (or DEFAULT_CONFIG_FILE, relative to the working directory,
// when it exists) is applied first; explicit flags override it.
ArgsStatus parse_args(int argc, char** argv, PreprocessOptions& options, std::string& error);

void print_usage();
