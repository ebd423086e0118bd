// frame_preprocessor.hpp

#pragma once

#include <string>
#include <vector>

#include "dst_corrector.hpp"
#include "errors.hpp"
#include "frame.hpp"
#include "options.hpp"
#include "sun_calculator.hpp"

struct PreprocessReport {
    int images_found = 0;
    int skipped_no_timestamp = 0;
    int accepted = 0;
    int rejected_night = 0;
    int dst_corrected = 0;
    // The run reaches past the transition that ends the DST correction
    bool second_dst_transition = false;
    int day_count = 0;
    // Location used for the sun calculation
    double latitude = 0.0;
    double longitude = 0.0;
    int written = 0;
    std::vector<FrameFailure> failures;
    double elapsed_seconds = 0.0;
};

// --- Class Definition ---
class FramePreprocessor {
private:
    PreprocessOptions options;
    PreprocessReport report;

    // Fixed location used for every frame
    double latitude;
    double longitude;

    void write_status_file(const std::string& status);
    void resolve_location(const std::vector<SourceFrame>& frames);
    std::vector<CorrectedFrame> classify_frames(const std::vector<SourceFrame>& frames,
                                                const TimeZoneContext& context,
                                                SunWindowCache& sun_windows);
    void log_report();

public:
    // Validates options and prepares the logs directory.
    // Throws ConfigurationError / IoError.
    explicit FramePreprocessor(const PreprocessOptions& options);

    // scan -> correct -> classify -> group -> export.
    // Throws EmptyInputError / IoError / ConfigurationError before any frame
    // is written; per frame failures end up in the report.
    PreprocessReport run();
};
