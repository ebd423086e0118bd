// frame_scanner.hpp

#pragma once

#include <ctime>
#include <string>
#include <vector>

#include "frame.hpp"

struct ScanResult {
    std::vector<SourceFrame> frames;
    int images_found = 0;
    // Images without EXIF capture time or a timestamp in the file name
    std::vector<std::string> skipped;
};

bool is_image_file(const std::string& path);

// Recursive, sorted by path
std::vector<std::string> list_image_files(const std::string& dir);

// "YYYY:MM:DD HH:MM:SS" (EXIF) -> naive local seconds
bool parse_exif_datetime(const std::string& value, std::time_t& local_seconds);

// Patterns like 20240615_120000, 20240615120000, 2024-06-15_12-00-00
bool parse_filename_timestamp(const std::string& path, std::time_t& local_seconds);

// Capture time and GPS from EXIF (Exiv2). Returns false when no capture time
// could be found in the metadata.
bool read_exif_metadata(const std::string& path, SourceFrame& frame);

// Walks the input directories in argument order. source_order follows that
// walk. Throws EmptyInputError when no image files exist at all.
ScanResult scan_frames(const std::vector<std::string>& input_dirs);
