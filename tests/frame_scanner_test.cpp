// frame_scanner_test.cpp

#include <fstream>
#include <gtest/gtest.h>
#include <sys/stat.h>

#include "errors.hpp"
#include "frame_scanner.hpp"
#include "test_helpers.hpp"

TEST(FrameScannerTest, RecognizesImageExtensions) {
    EXPECT_TRUE(is_image_file("a/b/IMG_0001.JPG"));
    EXPECT_TRUE(is_image_file("frame.jpeg"));
    EXPECT_TRUE(is_image_file("frame.png"));
    EXPECT_FALSE(is_image_file("notes.txt"));
    EXPECT_FALSE(is_image_file("dir.jpg/README"));
    EXPECT_FALSE(is_image_file("no_extension"));
}

TEST(FrameScannerTest, ParsesExifDateTime) {
    std::time_t t = 0;
    ASSERT_TRUE(parse_exif_datetime("2024:06:15 12:34:56", t));
    EXPECT_EQ(t, make_local(2024, 6, 15, 12, 34, 56));

    EXPECT_FALSE(parse_exif_datetime("0000:00:00 00:00:00", t));
    EXPECT_FALSE(parse_exif_datetime("2024:02:31 10:00:00", t));
    EXPECT_FALSE(parse_exif_datetime("garbage", t));
}

TEST(FrameScannerTest, ParsesTimestampsFromFileNames) {
    std::time_t t = 0;
    ASSERT_TRUE(parse_filename_timestamp("/data/cam/20240615_120000.jpg", t));
    EXPECT_EQ(t, make_local(2024, 6, 15, 12, 0));

    ASSERT_TRUE(parse_filename_timestamp("IMG_20240615-063015.jpg", t));
    EXPECT_EQ(t, make_local(2024, 6, 15, 6, 30, 15));

    ASSERT_TRUE(parse_filename_timestamp("cam_2024-06-15_21-05-09.png", t));
    EXPECT_EQ(t, make_local(2024, 6, 15, 21, 5, 9));

    // Dates in directory names do not count
    EXPECT_FALSE(parse_filename_timestamp("/data/20240615_120000/IMG_0001.jpg", t));
    EXPECT_FALSE(parse_filename_timestamp("IMG_0001.jpg", t));
}

TEST(FrameScannerTest, ScansDirectoriesInArgumentOrder) {
    TempDir first_dir;
    TempDir second_dir;
    mkdir(first_dir.file("sub").c_str(), 0777);

    write_timestamped_image(first_dir.path(), make_local(2024, 6, 16, 12, 0));
    write_timestamped_image(first_dir.file("sub"), make_local(2024, 6, 15, 12, 0));
    write_timestamped_image(second_dir.path(), make_local(2024, 6, 14, 12, 0), ".png");
    std::ofstream(first_dir.file("notes.txt")) << "not an image";

    ScanResult result = scan_frames({first_dir.path(), second_dir.path()});
    EXPECT_EQ(result.images_found, 3);
    EXPECT_TRUE(result.skipped.empty());
    ASSERT_EQ(result.frames.size(), 3u);

    // Sorted by path inside a directory, directories concatenated
    EXPECT_EQ(result.frames[0].file_path, first_dir.file("20240616_120000.jpg"));
    EXPECT_EQ(result.frames[1].file_path, first_dir.file("sub/20240615_120000.jpg"));
    EXPECT_EQ(result.frames[2].file_path, second_dir.file("20240614_120000.png"));
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(result.frames[i].source_order, i);
        EXPECT_FALSE(result.frames[i].has_gps);
    }
    EXPECT_EQ(result.frames[2].raw_timestamp, make_local(2024, 6, 14, 12, 0));
}

TEST(FrameScannerTest, SkipsImagesWithoutTimestamp) {
    TempDir dir;
    write_test_image(dir.file("IMG_0001.jpg"));
    write_timestamped_image(dir.path(), make_local(2024, 6, 15, 12, 0));

    ScanResult result = scan_frames({dir.path()});
    EXPECT_EQ(result.images_found, 2);
    ASSERT_EQ(result.skipped.size(), 1u);
    EXPECT_EQ(result.skipped[0], dir.file("IMG_0001.jpg"));
    EXPECT_EQ(result.frames.size(), 1u);
}

TEST(FrameScannerTest, EmptyInputThrows) {
    TempDir dir;
    EXPECT_THROW(scan_frames({dir.path()}), EmptyInputError);

    write_test_image(dir.file("IMG_0001.jpg"));
    EXPECT_THROW(scan_frames({dir.path()}), EmptyInputError);
}

TEST(FrameScannerTest, ExifCaptureTimePriority) {
    TempDir dir;
    std::string path = dir.file("IMG_0001.jpg");
    write_test_image(path);
    SourceFrame frame;

    write_exif_tags(path, {{"Exif.Image.DateTime", "2024:06:15 09:00:00"}});
    ASSERT_TRUE(read_exif_metadata(path, frame));
    EXPECT_EQ(frame.raw_timestamp, make_local(2024, 6, 15, 9, 0));

    write_exif_tags(path, {{"Exif.Image.DateTime", "2024:06:15 09:00:00"},
                           {"Exif.Photo.DateTimeDigitized", "2024:06:15 08:00:00"}});
    ASSERT_TRUE(read_exif_metadata(path, frame));
    EXPECT_EQ(frame.raw_timestamp, make_local(2024, 6, 15, 8, 0));

    write_exif_tags(path, {{"Exif.Image.DateTime", "2024:06:15 09:00:00"},
                           {"Exif.Photo.DateTimeDigitized", "2024:06:15 08:00:00"},
                           {"Exif.Photo.DateTimeOriginal", "2024:06:15 07:00:00"}});
    ASSERT_TRUE(read_exif_metadata(path, frame));
    EXPECT_EQ(frame.raw_timestamp, make_local(2024, 6, 15, 7, 0));

    // An unset original falls through to the next tag
    write_exif_tags(path, {{"Exif.Photo.DateTimeOriginal", "0000:00:00 00:00:00"},
                           {"Exif.Image.DateTime", "2024:06:15 09:00:00"}});
    ASSERT_TRUE(read_exif_metadata(path, frame));
    EXPECT_EQ(frame.raw_timestamp, make_local(2024, 6, 15, 9, 0));
}

TEST(FrameScannerTest, ExifTimeWinsOverFileName) {
    TempDir dir;
    std::string path = write_timestamped_image(dir.path(), make_local(2024, 6, 15, 12, 0));
    write_exif_tags(path, {{"Exif.Photo.DateTimeOriginal", "2024:06:14 08:30:00"}});

    ScanResult result = scan_frames({dir.path()});
    ASSERT_EQ(result.frames.size(), 1u);
    EXPECT_EQ(result.frames[0].raw_timestamp, make_local(2024, 6, 14, 8, 30));
}

TEST(FrameScannerTest, ReadsGpsWithHemisphereSign) {
    TempDir dir;
    std::string north_east = dir.file("berlin.jpg");
    std::string south_west = dir.file("santiago.jpg");
    write_test_image(north_east);
    write_test_image(south_west);

    write_exif_tags(north_east, {{"Exif.Photo.DateTimeOriginal", "2024:06:15 12:00:00"},
                                 {"Exif.GPSInfo.GPSLatitudeRef", "N"},
                                 {"Exif.GPSInfo.GPSLatitude", "52/1 31/1 12/1"},
                                 {"Exif.GPSInfo.GPSLongitudeRef", "E"},
                                 {"Exif.GPSInfo.GPSLongitude", "13/1 24/1 18/1"}});
    write_exif_tags(south_west, {{"Exif.Photo.DateTimeOriginal", "2024:06:15 12:00:00"},
                                 {"Exif.GPSInfo.GPSLatitudeRef", "S"},
                                 {"Exif.GPSInfo.GPSLatitude", "33/1 27/1 0/1"},
                                 {"Exif.GPSInfo.GPSLongitudeRef", "W"},
                                 {"Exif.GPSInfo.GPSLongitude", "70/1 39/1 36/1"}});

    SourceFrame frame;
    ASSERT_TRUE(read_exif_metadata(north_east, frame));
    ASSERT_TRUE(frame.has_gps);
    EXPECT_NEAR(frame.gps_latitude, 52.52, 1e-6);
    EXPECT_NEAR(frame.gps_longitude, 13.405, 1e-6);

    SourceFrame southern;
    ASSERT_TRUE(read_exif_metadata(south_west, southern));
    ASSERT_TRUE(southern.has_gps);
    EXPECT_NEAR(southern.gps_latitude, -33.45, 1e-6);
    EXPECT_NEAR(southern.gps_longitude, -70.66, 1e-6);
}
