// frame_preprocessor_test.cpp

#include <fstream>
#include <sstream>
#include <gtest/gtest.h>

#include "frame_preprocessor.hpp"
#include "test_helpers.hpp"
#include "time_zone.hpp"

namespace {

const double BERLIN_LATITUDE = 52.52;
const double BERLIN_LONGITUDE = 13.405;

PreprocessOptions make_options(const std::string& output_dir, const std::string& input_dir) {
    PreprocessOptions options;
    options.output_dir = output_dir;
    options.input_dirs = {input_dir};
    options.timezone = "Europe/Berlin";
    options.has_latitude = true;
    options.has_longitude = true;
    options.latitude = BERLIN_LATITUDE;
    options.longitude = BERLIN_LONGITUDE;
    options.night_margin_seconds = 1800;
    options.logs_dir = "";
    options.status_file = "";
    return options;
}

std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    return fields;
}

// Noon, 02:00 and ten minutes after sunset for every day. Returns the
// expected (accepted) files in output order.
std::vector<std::string> write_summer_days(const std::string& dir, int first_day, int last_day) {
    TimeZone zone("Europe/Berlin");
    std::vector<std::string> accepted;
    for (int day = first_day; day <= last_day; ++day) {
        std::time_t midnight = make_local(2024, 6, day, 0, 0);
        SunWindow window = sun_window(local_day_index(midnight), BERLIN_LATITUDE, BERLIN_LONGITUDE, zone);

        write_timestamped_image(dir, make_local(2024, 6, day, 2, 0));
        accepted.push_back(write_timestamped_image(dir, make_local(2024, 6, day, 12, 0)));
        accepted.push_back(write_timestamped_image(dir, window.sunset + 600));
    }
    return accepted;
}

}

TEST(FramePreprocessorTest, DropsNightFramesAndNumbersTheRest) {
    TempDir input;
    TempDir output_root;
    std::vector<std::string> expected = write_summer_days(input.path(), 15, 16);

    FramePreprocessor preprocessor(make_options(output_root.file("out"), input.path()));
    PreprocessReport report = preprocessor.run();

    EXPECT_EQ(report.images_found, 6);
    EXPECT_EQ(report.accepted, 4);
    EXPECT_EQ(report.rejected_night, 2);
    EXPECT_EQ(report.dst_corrected, 0);
    EXPECT_EQ(report.day_count, 2);
    EXPECT_EQ(report.written, 4);
    EXPECT_TRUE(report.failures.empty());

    for (int sequence = 1; sequence <= 4; ++sequence) {
        EXPECT_TRUE(file_exists(output_root.file("out/00000" + std::to_string(sequence) + ".jpg")));
    }
    EXPECT_FALSE(file_exists(output_root.file("out/000005.jpg")));

    std::vector<std::string> manifest = read_lines(output_root.file("out/manifest.csv"));
    ASSERT_EQ(manifest.size(), 5u);
    for (size_t i = 0; i < expected.size(); ++i) {
        std::vector<std::string> fields = split_csv(manifest[i + 1]);
        ASSERT_EQ(fields.size(), 8u);
        EXPECT_EQ(fields[0], std::to_string(i + 1));
        EXPECT_EQ(fields[2], expected[i]);
    }
    EXPECT_EQ(split_csv(manifest[1])[5], "day");
    EXPECT_EQ(split_csv(manifest[2])[5], "twilight_after_sunset");
}

TEST(FramePreprocessorTest, WorkerCountDoesNotChangeOutput) {
    TempDir input;
    TempDir output_root;
    write_summer_days(input.path(), 10, 20);

    PreprocessOptions serial = make_options(output_root.file("serial"), input.path());
    serial.worker_thread_count = 1;
    serial.fade_seconds = 3600;
    PreprocessOptions parallel = make_options(output_root.file("parallel"), input.path());
    parallel.worker_thread_count = 20;
    parallel.fade_seconds = 3600;

    PreprocessReport serial_report = FramePreprocessor(serial).run();
    PreprocessReport parallel_report = FramePreprocessor(parallel).run();

    EXPECT_EQ(serial_report.written, 22);
    EXPECT_EQ(parallel_report.written, serial_report.written);
    EXPECT_EQ(read_lines(output_root.file("serial/manifest.csv")),
              read_lines(output_root.file("parallel/manifest.csv")));
}

TEST(FramePreprocessorTest, CorrectsMissedSpringForward) {
    TempDir input;
    TempDir output_root;

    // Camera clock stays on CET after Berlin switches to CEST on 2024-03-31
    std::string before = write_timestamped_image(input.path(), make_local(2024, 3, 30, 12, 0));
    std::string after = write_timestamped_image(input.path(), make_local(2024, 3, 31, 12, 0));

    FramePreprocessor preprocessor(make_options(output_root.file("out"), input.path()));
    PreprocessReport report = preprocessor.run();
    EXPECT_EQ(report.written, 2);
    EXPECT_EQ(report.dst_corrected, 1);

    std::vector<std::string> manifest = read_lines(output_root.file("out/manifest.csv"));
    ASSERT_EQ(manifest.size(), 3u);

    std::vector<std::string> first = split_csv(manifest[1]);
    EXPECT_EQ(first[2], before);
    EXPECT_EQ(first[4], "2024-03-30 12:00:00");
    EXPECT_EQ(first[6], "0");

    std::vector<std::string> second = split_csv(manifest[2]);
    EXPECT_EQ(second[2], after);
    EXPECT_EQ(second[3], "2024-03-31 12:00:00");
    EXPECT_EQ(second[4], "2024-03-31 13:00:00");
    EXPECT_EQ(second[6], "1");
}

TEST(FramePreprocessorTest, StopsCorrectingAfterSecondTransition) {
    TempDir input;
    TempDir output_root;

    // Spring-forward missed, then the autumn fall-back puts the CET camera back in step
    write_timestamped_image(input.path(), make_local(2024, 3, 30, 12, 0));
    write_timestamped_image(input.path(), make_local(2024, 3, 31, 12, 0));
    std::string winter = write_timestamped_image(input.path(), make_local(2024, 11, 15, 12, 0));

    FramePreprocessor preprocessor(make_options(output_root.file("out"), input.path()));
    PreprocessReport report = preprocessor.run();
    EXPECT_EQ(report.written, 3);
    EXPECT_EQ(report.dst_corrected, 1);
    EXPECT_TRUE(report.second_dst_transition);

    std::vector<std::string> manifest = read_lines(output_root.file("out/manifest.csv"));
    ASSERT_EQ(manifest.size(), 4u);
    EXPECT_EQ(split_csv(manifest[2])[4], "2024-03-31 13:00:00");

    std::vector<std::string> last = split_csv(manifest[3]);
    EXPECT_EQ(last[2], winter);
    EXPECT_EQ(last[4], "2024-11-15 12:00:00");
    EXPECT_EQ(last[6], "0");
}

TEST(FramePreprocessorTest, IgnoreDstSwitchKeepsCameraTime) {
    TempDir input;
    TempDir output_root;
    write_timestamped_image(input.path(), make_local(2024, 3, 30, 12, 0));
    write_timestamped_image(input.path(), make_local(2024, 3, 31, 12, 0));

    PreprocessOptions options = make_options(output_root.file("out"), input.path());
    options.ignore_dst_switch = true;
    PreprocessReport report = FramePreprocessor(options).run();
    EXPECT_EQ(report.dst_corrected, 0);

    std::vector<std::string> manifest = read_lines(output_root.file("out/manifest.csv"));
    ASSERT_EQ(manifest.size(), 3u);
    EXPECT_EQ(split_csv(manifest[2])[4], "2024-03-31 12:00:00");
}

TEST(FramePreprocessorTest, OnlyNightFramesIsEmptyInput) {
    TempDir input;
    TempDir output_root;
    write_timestamped_image(input.path(), make_local(2024, 6, 15, 1, 0));
    write_timestamped_image(input.path(), make_local(2024, 6, 16, 2, 0));

    FramePreprocessor preprocessor(make_options(output_root.file("out"), input.path()));
    EXPECT_THROW(preprocessor.run(), EmptyInputError);
    EXPECT_FALSE(file_exists(output_root.file("out/manifest.csv")));
}

TEST(FramePreprocessorTest, MissingLocationIsConfigurationError) {
    TempDir input;
    TempDir output_root;
    write_timestamped_image(input.path(), make_local(2024, 6, 15, 12, 0));

    PreprocessOptions options = make_options(output_root.file("out"), input.path());
    options.has_latitude = false;
    options.has_longitude = false;

    FramePreprocessor preprocessor(options);
    EXPECT_THROW(preprocessor.run(), ConfigurationError);
}

TEST(FramePreprocessorTest, RejectsBadOptionsUpFront) {
    TempDir input;
    TempDir output_root;

    PreprocessOptions options = make_options(output_root.file("out"), input.path());
    options.timezone = "Mars/Olympus_Mons";
    EXPECT_THROW(FramePreprocessor{options}, ConfigurationError);

    options = make_options(output_root.file("out"), input.path());
    options.latitude = 91.0;
    EXPECT_THROW(FramePreprocessor{options}, InvalidCoordinate);
}

TEST(FramePreprocessorTest, WritesStatusFile) {
    TempDir input;
    TempDir output_root;
    write_summer_days(input.path(), 15, 15);

    PreprocessOptions options = make_options(output_root.file("out"), input.path());
    options.status_file = output_root.file("status.json");
    FramePreprocessor(options).run();

    std::vector<std::string> status = read_lines(options.status_file);
    ASSERT_FALSE(status.empty());
    EXPECT_EQ(status[1], "  \"status\": \"finished\",");

    bool found_written = false;
    for (const auto& line : status) {
        if (line == "  \"frames_written\": 2,") {
            found_written = true;
        }
    }
    EXPECT_TRUE(found_written);
}

TEST(FramePreprocessorTest, LocationFromEarliestGpsFrame) {
    TempDir input;
    TempDir output_root;

    // Sorted first by name but captured a day later
    std::string later = input.file("a_frame.jpg");
    std::string earlier = input.file("b_frame.jpg");
    write_test_image(later);
    write_test_image(earlier);
    write_exif_tags(later, {{"Exif.Photo.DateTimeOriginal", "2024:06:16 12:00:00"},
                            {"Exif.GPSInfo.GPSLatitudeRef", "N"},
                            {"Exif.GPSInfo.GPSLatitude", "48/1 0/1 0/1"},
                            {"Exif.GPSInfo.GPSLongitudeRef", "E"},
                            {"Exif.GPSInfo.GPSLongitude", "11/1 30/1 0/1"}});
    write_exif_tags(earlier, {{"Exif.Photo.DateTimeOriginal", "2024:06:15 12:00:00"},
                              {"Exif.GPSInfo.GPSLatitudeRef", "N"},
                              {"Exif.GPSInfo.GPSLatitude", "52/1 31/1 12/1"},
                              {"Exif.GPSInfo.GPSLongitudeRef", "E"},
                              {"Exif.GPSInfo.GPSLongitude", "13/1 24/1 18/1"}});

    PreprocessOptions options = make_options(output_root.file("out"), input.path());
    options.has_latitude = false;
    options.has_longitude = false;

    PreprocessReport report = FramePreprocessor(options).run();
    EXPECT_NEAR(report.latitude, BERLIN_LATITUDE, 1e-6);
    EXPECT_NEAR(report.longitude, BERLIN_LONGITUDE, 1e-6);
    EXPECT_EQ(report.written, 2);
}

TEST(FramePreprocessorTest, ConfiguredLocationBeatsGps) {
    TempDir input;
    TempDir output_root;
    std::string path = input.file("frame.jpg");
    write_test_image(path);
    write_exif_tags(path, {{"Exif.Photo.DateTimeOriginal", "2024:06:15 12:00:00"},
                           {"Exif.GPSInfo.GPSLatitudeRef", "N"},
                           {"Exif.GPSInfo.GPSLatitude", "48/1 0/1 0/1"},
                           {"Exif.GPSInfo.GPSLongitudeRef", "E"},
                           {"Exif.GPSInfo.GPSLongitude", "11/1 30/1 0/1"}});

    PreprocessReport report = FramePreprocessor(make_options(output_root.file("out"), input.path())).run();
    EXPECT_DOUBLE_EQ(report.latitude, BERLIN_LATITUDE);
    EXPECT_DOUBLE_EQ(report.longitude, BERLIN_LONGITUDE);
}
