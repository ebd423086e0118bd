// frame_preprocessor.cpp

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "classifier.hpp"
#include "day_sequence.hpp"
#include "frame_exporter.hpp"
#include "frame_preprocessor.hpp"
#include "frame_scanner.hpp"
#include "time_zone.hpp"
#include "utils.hpp"

// constructor
FramePreprocessor::FramePreprocessor(const PreprocessOptions& options)
    : options(options), latitude(options.latitude), longitude(options.longitude) {
    // 1. Ensure logs directory exists
    if (!options.logs_dir.empty() && !create_dirs(options.logs_dir)) {
        throw IoError("Failed to create logs directory: " + options.logs_dir);
    }
    set_log_dir(options.logs_dir);

    // 2. Fail early on bad settings
    validate_options(options);

    log_status("FramePreprocessor initialized - Output: " + options.output_dir);
    for (const auto& dir : options.input_dirs) {
        log_status("  Input: " + dir);
    }
    log_status("  Timezone: " + options.timezone
               + (options.ignore_dst_switch ? " (DST correction disabled)" : ""));
    log_status("  Fade: " + std::to_string(options.fade_seconds) + " s, night margin: "
               + std::to_string(options.night_margin_seconds) + " s");
    log_status("  Resize width: " + (options.resize_width > 0 ? std::to_string(options.resize_width) : std::string("source"))
               + ", workers: " + std::to_string(options.worker_thread_count));
}

void FramePreprocessor::write_status_file(const std::string& status) {
    if (options.status_file.empty()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
        now.time_since_epoch()).count();

    std::ofstream f(options.status_file);
    if (!f.is_open()) {
        log_status("Warning: Could not write status file");
        return;
    }

    f << "{\n"
      << "  \"status\": \"" << status << "\",\n"
      << "  \"output_dir\": \"" << options.output_dir << "\",\n"
      << "  \"timezone\": \"" << options.timezone << "\",\n"
      << "  \"images_found\": " << report.images_found << ",\n"
      << "  \"frames_accepted\": " << report.accepted << ",\n"
      << "  \"frames_rejected_night\": " << report.rejected_night << ",\n"
      << "  \"frames_dst_corrected\": " << report.dst_corrected << ",\n"
      << "  \"second_dst_transition\": " << (report.second_dst_transition ? "true" : "false") << ",\n"
      << "  \"frames_written\": " << report.written << ",\n"
      << "  \"frames_failed\": " << report.failures.size() << ",\n"
      << "  \"elapsed_seconds\": " << std::fixed << std::setprecision(1) << report.elapsed_seconds << ",\n"
      << "  \"updated_at\": " << epoch << "\n"
      << "}\n";
    f.close();
}

void FramePreprocessor::resolve_location(const std::vector<SourceFrame>& frames) {
    if (options.has_latitude && options.has_longitude) {
        latitude = options.latitude;
        longitude = options.longitude;
        return;
    }

    // Chronologically first frame with GPS data
    const SourceFrame* located = nullptr;
    for (const auto& frame : frames) {
        if (frame.has_gps && (located == nullptr || frame.raw_timestamp < located->raw_timestamp)) {
            located = &frame;
        }
    }
    if (located == nullptr) {
        throw ConfigurationError("No latitude/longitude given and no image carries GPS data");
    }

    validate_coordinates(located->gps_latitude, located->gps_longitude);
    latitude = located->gps_latitude;
    longitude = located->gps_longitude;

    std::stringstream ss;
    ss << "Using GPS location " << std::fixed << std::setprecision(5)
       << latitude << ", " << longitude << " from " << located->file_path;
    log_status(ss.str());
}

std::vector<CorrectedFrame> FramePreprocessor::classify_frames(const std::vector<SourceFrame>& frames,
                                                                const TimeZoneContext& context,
                                                                SunWindowCache& sun_windows) {
    std::vector<CorrectedFrame> accepted;
    accepted.reserve(frames.size());

    for (const auto& source : frames) {
        CorrectedFrame frame;
        frame.source = source;
        frame.corrected_timestamp = correct_timestamp(source.raw_timestamp, context);

        SunWindow window = sun_windows.get(local_day_index(frame.corrected_timestamp));
        frame.classification = classify(frame.corrected_timestamp, window, options.night_margin_seconds);
        frame.before_sunrise = frame.corrected_timestamp < window.sunrise;

        if (!is_accepted(frame.classification)) {
            report.rejected_night++;
            continue;
        }
        if (frame.dst_corrected()) {
            report.dst_corrected++;
        }
        accepted.push_back(frame);
    }

    report.accepted = static_cast<int>(accepted.size());
    return accepted;
}

void FramePreprocessor::log_report() {
    log_status("Frames found: " + std::to_string(report.images_found)
               + " (" + std::to_string(report.skipped_no_timestamp) + " without timestamp)");
    log_status("Frames accepted: " + std::to_string(report.accepted)
               + " over " + std::to_string(report.day_count) + " days");
    log_status("Frames rejected as night: " + std::to_string(report.rejected_night));
    log_status("Frames DST corrected: " + std::to_string(report.dst_corrected));
    log_status("Frames written: " + std::to_string(report.written));
    log_status("Frames failed during export: " + std::to_string(report.failures.size()));
    for (const auto& failure : report.failures) {
        log_status("  #" + std::to_string(failure.sequence) + " " + failure.source_path + ": " + failure.reason);
    }
    log_status("Total elapsed time: " + format_duration(report.elapsed_seconds));
}

PreprocessReport FramePreprocessor::run() {
    auto start_time = std::chrono::steady_clock::now();
    report = PreprocessReport();

    // 1. Discover frames
    write_status_file("scanning");
    ScanResult scan = scan_frames(options.input_dirs);
    report.images_found = scan.images_found;
    report.skipped_no_timestamp = static_cast<int>(scan.skipped.size());

    // 2. Zone, location and the run wide DST decision
    TimeZone zone(options.timezone);
    resolve_location(scan.frames);
    report.latitude = latitude;
    report.longitude = longitude;

    auto range = std::minmax_element(scan.frames.begin(), scan.frames.end(),
        [](const SourceFrame& a, const SourceFrame& b) {
            if (a.raw_timestamp != b.raw_timestamp) {
                return a.raw_timestamp < b.raw_timestamp;
            }
            return a.source_order < b.source_order;
        });
    const TimeZoneContext context = make_time_zone_context(range.first->raw_timestamp, zone, options.ignore_dst_switch);
    if (context.has_range_end && range.second->raw_timestamp >= context.range_end) {
        report.second_dst_transition = true;
        log_status("Warning: A second DST transition falls inside the run ("
                   + format_local_time(context.range_end, "%Y-%m-%d %H:%M") + "). Frames from there on are left as recorded.");
    }

    // 3. Day/night filter
    write_status_file("classifying");
    SunWindowCache sun_windows(latitude, longitude, zone);
    std::vector<CorrectedFrame> accepted = classify_frames(scan.frames, context, sun_windows);
    log_status("Classified " + std::to_string(scan.frames.size()) + " frames over "
               + std::to_string(sun_windows.size()) + " dates: " + std::to_string(report.accepted)
               + " accepted, " + std::to_string(report.rejected_night) + " night");

    if (accepted.empty()) {
        throw EmptyInputError("No frames survived day/night classification ("
                              + std::to_string(scan.frames.size()) + " frames, "
                              + std::to_string(report.rejected_night) + " rejected as night)");
    }

    // 4. Day groups
    std::vector<DayGroup> groups = group_by_day(accepted);
    report.day_count = static_cast<int>(groups.size());
    for (const auto& group : groups) {
        SunWindow window = sun_windows.get(group.day_index);
        log_status("  " + group.date_string() + ": " + std::to_string(group.frames.size()) + " frames "
                   + format_local_time(group.first_timestamp(), "%H:%M:%S") + " - "
                   + format_local_time(group.last_timestamp(), "%H:%M:%S")
                   + " (sun " + format_local_time(window.sunrise, "%H:%M") + " - "
                   + format_local_time(window.sunset, "%H:%M") + ")");
    }

    // 5. Export
    write_status_file("exporting");
    ExportOptions export_options;
    export_options.output_dir = options.output_dir;
    export_options.resize_width = options.resize_width;
    export_options.worker_count = options.worker_thread_count;
    export_options.fade_seconds = options.fade_seconds;
    export_options.render_timestamp = options.render_timestamp;
    export_options.time_format = options.time_format;
    export_options.output_extension = options.output_extension;
    export_options.jpeg_quality = options.jpeg_quality;
    export_options.sequence_digits = options.sequence_digits;

    FrameExporter exporter(export_options);
    ExportReport export_report = exporter.export_frames(groups);
    report.written = export_report.written;
    report.failures = export_report.failures;

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;
    report.elapsed_seconds = elapsed.count();

    write_status_file("finished");
    log_report();
    return report;
}
