// frame_exporter.hpp

#pragma once

#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "day_sequence.hpp"
#include "errors.hpp"

#define MANIFEST_FILENAME "manifest.csv"
#define PROGRESS_LOG_EVERY 100

// Text overlay look (see render_timestamp)
#define TEXT_OFFSET_FROM_LEFT_PX 15
#define TEXT_OFFSET_FROM_BOTTOM_PX 20
#define TEXT_FONT_SIZE_MULTIPLIER 0.0012  // font scale per pixel of image height
#define TEXT_FONT_WEIGHT 2

struct ExportOptions {
    std::string output_dir;
    int resize_width = 0;
    int worker_count = 1;
    long fade_seconds = 0;
    bool render_timestamp = false;
    std::string time_format = "%Y-%m-%d %H:%M";
    std::string output_extension = "jpg";
    int jpeg_quality = 95;
    int sequence_digits = 6;
};

// One unit of work. Built single threaded before any worker starts.
struct ExportTask {
    int sequence = 0;
    CorrectedFrame frame;
    double fade_weight = 0.0;
    std::string output_path;
};

struct ExportReport {
    int written = 0;
    std::vector<FrameFailure> failures;  // sorted by sequence
    double elapsed_seconds = 0.0;
};

// Keeps aspect ratio. width <= 0 or equal to the current width is a no-op.
cv::Mat resize_to_width(const cv::Mat& image, int width);

// Outlined text in the bottom left corner
void render_timestamp(cv::Mat& image, const std::string& text);

class FrameExporter {
private:
    ExportOptions options;

    bool can_copy_source(const ExportTask& task) const;
    bool process_task(const ExportTask& task, std::string& error) const;

protected:
    // Decodes one source image. An empty Mat means unreadable.
    virtual cv::Mat read_frame(const std::string& path) const;

public:
    explicit FrameExporter(const ExportOptions& options);
    virtual ~FrameExporter() = default;

    // Creates the directory. Throws IoError if it cannot be created or
    // written, or if it already holds files from another run.
    void prepare_output_dir() const;

    std::string output_path(int sequence) const;

    // Global sequence numbers 1..N in day/time order
    std::vector<ExportTask> plan(const std::vector<DayGroup>& groups) const;

    // Sequence -> source mapping for the whole run. Throws IoError.
    void write_manifest(const std::vector<ExportTask>& tasks) const;

    // Runs the worker pool. Per frame failures are collected, never thrown.
    ExportReport run(const std::vector<ExportTask>& tasks) const;

    // prepare_output_dir + plan + write_manifest + run
    ExportReport export_frames(const std::vector<DayGroup>& groups) const;
};
