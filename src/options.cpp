// options.cpp

#include <algorithm>
#include <fstream>
#include <iostream>
#include <set>
#include <stdexcept>

#include "errors.hpp"
#include "options.hpp"
#include "sun_calculator.hpp"
#include "time_zone.hpp"
#include "utils.hpp"

namespace {

long parse_long(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        long result = std::stol(value, &used);
        if (used != value.size()) {
            throw ConfigurationError("Invalid integer for '" + key + "': " + value);
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError("Invalid integer for '" + key + "': " + value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Integer out of range for '" + key + "': " + value);
    }
}

int parse_int(const std::string& key, const std::string& value) {
    long result = parse_long(key, value);
    if (result < -2147483647L || result > 2147483647L) {
        throw ConfigurationError("Integer out of range for '" + key + "': " + value);
    }
    return static_cast<int>(result);
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        size_t used = 0;
        double result = std::stod(value, &used);
        if (used != value.size()) {
            throw ConfigurationError("Invalid number for '" + key + "': " + value);
        }
        return result;
    } catch (const std::invalid_argument&) {
        throw ConfigurationError("Invalid number for '" + key + "': " + value);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Number out of range for '" + key + "': " + value);
    }
}

bool parse_bool(const std::string& key, const std::string& value) {
    std::string lowered = to_lower(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw ConfigurationError("Invalid boolean for '" + key + "': " + value);
}

// "--fade-seconds" -> "fade_seconds"
std::string flag_to_key(const std::string& flag) {
    std::string key = flag.substr(2);
    std::replace(key.begin(), key.end(), '-', '_');
    return key;
}

bool is_switch(const std::string& key) {
    return key == "ignore_dst_switch" || key == "render_timestamp";
}

}

bool apply_option(PreprocessOptions& options, const std::string& key, const std::string& value) {
    if (key == "timezone") {
        options.timezone = value;
    } else if (key == "latitude") {
        options.latitude = parse_double(key, value);
        options.has_latitude = true;
    } else if (key == "longitude") {
        options.longitude = parse_double(key, value);
        options.has_longitude = true;
    } else if (key == "resize_width") {
        options.resize_width = parse_int(key, value);
    } else if (key == "fade_seconds") {
        options.fade_seconds = parse_long(key, value);
    } else if (key == "night_margin_seconds") {
        options.night_margin_seconds = parse_long(key, value);
    } else if (key == "ignore_dst_switch") {
        options.ignore_dst_switch = parse_bool(key, value);
    } else if (key == "worker_thread_count") {
        options.worker_thread_count = parse_int(key, value);
    } else if (key == "render_timestamp") {
        options.render_timestamp = parse_bool(key, value);
    } else if (key == "output_extension") {
        options.output_extension = to_lower(value);
    } else if (key == "jpeg_quality") {
        options.jpeg_quality = parse_int(key, value);
    } else if (key == "sequence_digits") {
        options.sequence_digits = parse_int(key, value);
    } else if (key == "time_format") {
        options.time_format = value;
    } else if (key == "logs_dir") {
        options.logs_dir = value;
    } else if (key == "status_file") {
        options.status_file = value;
    } else {
        return false;
    }
    return true;
}

void load_config_file(const std::string& path, PreprocessOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Could not open config file: " + path);
    }

    std::string line;
    int line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        size_t equals_pos = content.find('=');
        if (equals_pos == std::string::npos) {
            log_status("Warning: " + path + ":" + std::to_string(line_number) + " is not a key = value line");
            continue;
        }

        std::string key = trim(content.substr(0, equals_pos));
        std::string value = trim(content.substr(equals_pos + 1));
        if (!apply_option(options, key, value)) {
            log_status("Warning: Unknown config key '" + key + "' in " + path);
        }
    }
}

void validate_options(const PreprocessOptions& options) {
    if (options.output_dir.empty()) {
        throw ConfigurationError("No output directory provided");
    }
    if (options.input_dirs.empty()) {
        throw ConfigurationError("No input directories provided");
    }

    std::set<std::string> unique_dirs(options.input_dirs.begin(), options.input_dirs.end());
    if (unique_dirs.size() != options.input_dirs.size()) {
        throw ConfigurationError("Duplicate input directories");
    }
    for (const auto& dir : options.input_dirs) {
        if (!dir_exists(dir)) {
            throw ConfigurationError("Input directory " + dir + " does not exist");
        }
    }

    if (!TimeZone::is_known(options.timezone)) {
        throw ConfigurationError("Invalid timezone " + options.timezone);
    }

    if (options.has_latitude != options.has_longitude) {
        throw ConfigurationError("Latitude and longitude must be given together");
    }
    if (options.has_latitude) {
        validate_coordinates(options.latitude, options.longitude);
    }

    if (options.resize_width < 0 || options.resize_width > MAX_RESIZE_WIDTH) {
        throw ConfigurationError("Resize width " + std::to_string(options.resize_width) + " unsupported");
    }
    if (options.fade_seconds < 0 || options.fade_seconds > MAX_DURATION_SECONDS) {
        throw ConfigurationError("Fade seconds " + std::to_string(options.fade_seconds)
                                 + " out of range [0, " + std::to_string(MAX_DURATION_SECONDS) + "]");
    }
    if (options.night_margin_seconds < 0 || options.night_margin_seconds > MAX_DURATION_SECONDS) {
        throw ConfigurationError("Night margin seconds " + std::to_string(options.night_margin_seconds)
                                 + " out of range [0, " + std::to_string(MAX_DURATION_SECONDS) + "]");
    }
    if (options.worker_thread_count <= 0) {
        throw ConfigurationError("Invalid worker thread count " + std::to_string(options.worker_thread_count));
    }
    if (options.jpeg_quality < 1 || options.jpeg_quality > 100) {
        throw ConfigurationError("JPEG quality " + std::to_string(options.jpeg_quality) + " out of range [1, 100]");
    }
    if (options.sequence_digits < 1 || options.sequence_digits > 12) {
        throw ConfigurationError("Sequence digits " + std::to_string(options.sequence_digits) + " out of range [1, 12]");
    }
    if (options.output_extension != "jpg" && options.output_extension != "jpeg" &&
        options.output_extension != "png") {
        throw ConfigurationError("Unsupported output extension " + options.output_extension);
    }
}

ArgsStatus parse_args(int argc, char** argv, PreprocessOptions& options, std::string& error) {
    // 1. Config file first so that flags override it
    bool config_given = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return ArgsStatus::Help;
        }
        if (arg == "--config") {
            if (i + 1 >= argc) {
                error = "--config requires a value";
                return ArgsStatus::Usage;
            }
            load_config_file(argv[i + 1], options);
            config_given = true;
        }
    }
    if (!config_given && std::ifstream(DEFAULT_CONFIG_FILE).is_open()) {
        load_config_file(DEFAULT_CONFIG_FILE, options);
    }

    // 2. Positionals and flags
    std::vector<std::string> positionals;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.compare(0, 2, "--") != 0) {
            positionals.push_back(arg);
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }

        std::string key = flag_to_key(arg);
        if (is_switch(key)) {
            apply_option(options, key, "true");
            continue;
        }
        if (i + 1 >= argc) {
            error = arg + " requires a value";
            return ArgsStatus::Usage;
        }
        if (!apply_option(options, key, argv[++i])) {
            error = "Unknown option " + arg;
            return ArgsStatus::Usage;
        }
    }

    if (positionals.size() < 2) {
        error = "Expected an output directory and at least one image directory";
        return ArgsStatus::Usage;
    }
    options.output_dir = positionals[0];
    options.input_dirs.assign(positionals.begin() + 1, positionals.end());
    return ArgsStatus::Ok;
}

void print_usage() {
    std::cout << "preprocess_frames <output_dir> <image_dir> [<image_dir>...]\n"
              << "  --config <path>                 key = value config file [" << DEFAULT_CONFIG_FILE << " if present]\n"
              << "  --timezone <IANA id>            [" << DEFAULT_TIMEZONE << "]\n"
              << "  --latitude <deg>                not required if images carry GPS data\n"
              << "  --longitude <deg>               not required if images carry GPS data\n"
              << "  --resize-width <px>             0 keeps the source size [0]\n"
              << "  --fade-seconds <s>              fade in/out length per day [0]\n"
              << "  --night-margin-seconds <s>      twilight kept before sunrise / after sunset [0]\n"
              << "  --ignore-dst-switch             trust the camera clock across DST changes\n"
              << "  --worker-thread-count <n>       [" << DEFAULT_WORKER_THREAD_COUNT << "]\n"
              << "  --render-timestamp              draw date/time on every frame\n"
              << "  --time-format <strftime>        [" << DEFAULT_TIME_FORMAT << "]\n"
              << "  --output-extension <jpg|png>    [" << DEFAULT_OUTPUT_EXTENSION << "]\n"
              << "  --jpeg-quality <1-100>          [" << DEFAULT_JPEG_QUALITY << "]\n"
              << "  --sequence-digits <n>           [" << DEFAULT_SEQUENCE_DIGITS << "]\n"
              << "  --logs-dir <dir>                [" << DEFAULT_LOGS_PATH << "]\n"
              << "  --status-file <path>            empty disables [" << DEFAULT_STATUS_FILE << "]\n";
}
