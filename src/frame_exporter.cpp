// frame_exporter.cpp

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cmath>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <thread>

#include <opencv2/opencv.hpp>

#include "classifier.hpp"
#include "fade_compositor.hpp"
#include "frame_exporter.hpp"
#include "utils.hpp"

namespace {

bool dir_is_empty(const std::string& path) {
    DIR* handle = opendir(path.c_str());
    if (handle == nullptr) {
        return false;
    }

    bool empty = true;
    struct dirent* entry;
    while ((entry = readdir(handle)) != nullptr) {
        std::string name = entry->d_name;
        if (name != "." && name != "..") {
            empty = false;
            break;
        }
    }
    closedir(handle);
    return empty;
}

std::string file_extension(const std::string& path) {
    size_t dot = path.find_last_of('.');
    size_t slash = path.find_last_of('/');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
        return "";
    }
    std::string extension = to_lower(path.substr(dot + 1));
    return extension == "jpeg" ? "jpg" : extension;
}

bool copy_file(const std::string& from, const std::string& to, std::string& error) {
    std::ifstream in(from, std::ios::binary);
    if (!in.is_open()) {
        error = "could not open " + from;
        return false;
    }
    std::ofstream out(to, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        error = "could not create " + to;
        return false;
    }
    out << in.rdbuf();
    out.close();
    if (!out) {
        error = "write failed for " + to;
        return false;
    }
    return true;
}

std::string csv_quote(const std::string& value) {
    if (value.find_first_of(",\"\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    return quoted + "\"";
}

std::string classification_label(const CorrectedFrame& frame) {
    if (frame.classification == Classification::Twilight) {
        return frame.before_sunrise ? "twilight_before_sunrise" : "twilight_after_sunset";
    }
    return classification_name(frame.classification);
}

}

cv::Mat resize_to_width(const cv::Mat& image, int width) {
    if (width <= 0 || image.empty() || image.cols == width) {
        return image;
    }

    int height = std::max(1, static_cast<int>(std::lround(
        static_cast<double>(image.rows) * width / image.cols)));
    int interpolation = width < image.cols ? cv::INTER_AREA : cv::INTER_LINEAR;

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, height), 0, 0, interpolation);
    return resized;
}

void render_timestamp(cv::Mat& image, const std::string& text) {
    double font_size = std::max(0.4, image.rows * TEXT_FONT_SIZE_MULTIPLIER);
    int font_weight = std::max(1, static_cast<int>(TEXT_FONT_WEIGHT * font_size));
    cv::Point origin(TEXT_OFFSET_FROM_LEFT_PX, image.rows - TEXT_OFFSET_FROM_BOTTOM_PX);

    // Outline first so that the text stays readable on bright sky
    cv::putText(image, text, origin, cv::FONT_HERSHEY_SIMPLEX, font_size,
                cv::Scalar(0, 0, 0), font_weight + 4, cv::LINE_AA);
    cv::putText(image, text, origin, cv::FONT_HERSHEY_SIMPLEX, font_size,
                cv::Scalar(255, 255, 255), font_weight, cv::LINE_AA);
}

FrameExporter::FrameExporter(const ExportOptions& options) : options(options) {
    if (this->options.worker_count < 1) {
        this->options.worker_count = 1;
    }
    if (!this->options.output_dir.empty() && this->options.output_dir.back() != '/') {
        this->options.output_dir += '/';
    }
}

void FrameExporter::prepare_output_dir() const {
    if (!create_dirs(options.output_dir)) {
        throw IoError("Failed to create output directory: " + options.output_dir);
    }
    if (!dir_is_empty(options.output_dir)) {
        throw IoError("Output directory " + options.output_dir + " is not empty");
    }

    std::string write_test_path = options.output_dir + ".write_test";
    std::ofstream write_test(write_test_path);
    if (!write_test.is_open()) {
        throw IoError("Output directory " + options.output_dir + " is not writable: " + strerror(errno));
    }
    write_test.close();
    std::remove(write_test_path.c_str());
}

std::string FrameExporter::output_path(int sequence) const {
    std::stringstream ss;
    ss << options.output_dir
       << std::setfill('0')
       << std::setw(options.sequence_digits)
       << sequence
       << "." << options.output_extension;
    return ss.str();
}

std::vector<ExportTask> FrameExporter::plan(const std::vector<DayGroup>& groups) const {
    std::vector<ExportTask> tasks;
    tasks.reserve(count_frames(groups));

    int sequence = 0;
    for (const auto& group : groups) {
        for (const auto& frame : group.frames) {
            ExportTask task;
            task.sequence = ++sequence;
            task.frame = frame;
            task.fade_weight = fade_weight(frame, group, options.fade_seconds);
            task.output_path = output_path(task.sequence);
            tasks.push_back(task);
        }
    }
    return tasks;
}

void FrameExporter::write_manifest(const std::vector<ExportTask>& tasks) const {
    std::string manifest_path = options.output_dir + MANIFEST_FILENAME;
    std::ofstream manifest(manifest_path);
    if (!manifest.is_open()) {
        throw IoError("Could not write manifest: " + manifest_path);
    }

    manifest << "sequence,output_file,source_path,raw_time,corrected_time,classification,dst_corrected,fade_weight\n";
    for (const auto& task : tasks) {
        std::string output_file = task.output_path.substr(options.output_dir.size());
        manifest << task.sequence << ","
                 << csv_quote(output_file) << ","
                 << csv_quote(task.frame.source.file_path) << ","
                 << format_local_time(task.frame.source.raw_timestamp, "%Y-%m-%d %H:%M:%S") << ","
                 << format_local_time(task.frame.corrected_timestamp, "%Y-%m-%d %H:%M:%S") << ","
                 << classification_label(task.frame) << ","
                 << (task.frame.dst_corrected() ? 1 : 0) << ","
                 << std::fixed << std::setprecision(4) << task.fade_weight << "\n";
    }

    manifest.close();
    if (!manifest) {
        throw IoError("Could not write manifest: " + manifest_path);
    }
}

cv::Mat FrameExporter::read_frame(const std::string& path) const {
    return cv::imread(path, cv::IMREAD_COLOR);
}

bool FrameExporter::can_copy_source(const ExportTask& task) const {
    return task.fade_weight <= 0.0
        && options.resize_width <= 0
        && !options.render_timestamp
        && file_extension(task.frame.source.file_path) == file_extension(task.output_path);
}

bool FrameExporter::process_task(const ExportTask& task, std::string& error) const {
    const std::string& source_path = task.frame.source.file_path;

    // Untouched frames keep their original bytes (and EXIF block)
    if (can_copy_source(task)) {
        return copy_file(source_path, task.output_path, error);
    }

    try {
        cv::Mat image = read_frame(source_path);
        if (image.empty()) {
            error = "could not read image";
            return false;
        }

        cv::Mat frame = apply_fade(image, task.fade_weight);
        frame = resize_to_width(frame, options.resize_width);
        if (options.render_timestamp) {
            render_timestamp(frame, format_local_time(task.frame.corrected_timestamp, options.time_format.c_str()));
        }

        std::vector<int> params;
        if (file_extension(task.output_path) == "jpg") {
            params.push_back(cv::IMWRITE_JPEG_QUALITY);
            params.push_back(options.jpeg_quality);
        }
        if (!cv::imwrite(task.output_path, frame, params)) {
            error = "could not write " + task.output_path;
            return false;
        }
    } catch (const cv::Exception& e) {
        error = std::string("OpenCV error: ") + e.what();
        return false;
    } catch (const std::exception& e) {
        // e.g. std::bad_alloc on a huge image; must not leave the worker thread
        error = std::string("Error: ") + e.what();
        return false;
    }
    return true;
}

ExportReport FrameExporter::run(const std::vector<ExportTask>& tasks) const {
    ExportReport report;
    auto start_time = std::chrono::steady_clock::now();

    std::atomic<size_t> next_task{0};
    std::atomic<int> written{0};
    std::atomic<int> completed{0};
    std::mutex failures_mutex;

    auto process_next = [&]() {
        while (true) {
            size_t index = next_task.fetch_add(1);
            if (index >= tasks.size()) {
                break;
            }

            const ExportTask& task = tasks[index];
            std::string error;
            if (process_task(task, error)) {
                written++;
            } else {
                log_status("Frame " + std::to_string(task.sequence) + " failed ("
                           + task.frame.source.file_path + "): " + error);
                std::lock_guard<std::mutex> lock(failures_mutex);
                report.failures.push_back(FrameFailure{task.sequence, task.frame.source.file_path, error});
            }

            int done = ++completed;
            if (done % PROGRESS_LOG_EVERY == 0) {
                log_status("Export progress: " + std::to_string(done) + "/" + std::to_string(tasks.size())
                           + "   ||   CPU: " + get_cpu_temp());
            }
        }
    };

    size_t worker_count = std::min(static_cast<size_t>(options.worker_count), tasks.size());
    if (worker_count > 1) {
        // Frames are the unit of parallelism; keep OpenCV from oversubscribing
        int previous_cv_threads = cv::getNumThreads();
        cv::setNumThreads(1);

        std::vector<std::thread> workers;
        for (size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back(process_next);
        }
        for (auto& worker : workers) {
            worker.join();
        }

        cv::setNumThreads(previous_cv_threads);
    } else {
        process_next();
    }

    std::sort(report.failures.begin(), report.failures.end(),
        [](const FrameFailure& a, const FrameFailure& b) { return a.sequence < b.sequence; });
    report.written = written.load();

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_time;
    report.elapsed_seconds = elapsed.count();
    return report;
}

ExportReport FrameExporter::export_frames(const std::vector<DayGroup>& groups) const {
    // 1. Everything fatal happens before the first worker starts
    prepare_output_dir();
    std::vector<ExportTask> tasks = plan(groups);
    write_manifest(tasks);

    // 2. Parallel per frame work
    log_status("Exporting " + std::to_string(tasks.size()) + " frames with "
               + std::to_string(options.worker_count) + " workers to " + options.output_dir);
    ExportReport report = run(tasks);

    log_status("Export finished: " + std::to_string(report.written) + " written, "
               + std::to_string(report.failures.size()) + " failed in "
               + format_duration(report.elapsed_seconds));
    return report;
}
