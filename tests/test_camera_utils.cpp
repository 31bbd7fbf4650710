#include <gtest/gtest.h>
#include "camera.hpp"
#include <cstdlib>
#include <vector>

using namespace camera;

TEST(CameraUtilsTest, GreyYuvGivesGreyRgb) {
    // 2x2: four Y samples, one U, one V
    std::vector<uint8_t> yuv = {128, 128, 128, 128, 128, 128};
    std::vector<uint8_t> rgb(2 * 2 * 3, 0);
    utils::yuv420_to_rgb888(yuv.data(), rgb.data(), 2, 2);
    for (uint8_t v : rgb) EXPECT_EQ(v, 128);
}

TEST(CameraUtilsTest, ChromaShiftsChannels) {
    std::vector<uint8_t> yuv = {100, 100, 100, 100, 128, 255};  // V high -> red
    std::vector<uint8_t> rgb(2 * 2 * 3, 0);
    utils::yuv420_to_rgb888(yuv.data(), rgb.data(), 2, 2);
    EXPECT_EQ(rgb[0], 255);   // R clamped
    EXPECT_LT(rgb[1], 100);   // G reduced
    EXPECT_EQ(rgb[2], 100);   // B unchanged
}

TEST(CameraUtilsTest, MirrorHorizontal) {
    // 3x1 RGB
    std::vector<uint8_t> img = {1, 2, 3, 4, 5, 6, 7, 8, 9};
    utils::mirror_horizontal(img.data(), 3, 1, 3);
    std::vector<uint8_t> expected = {7, 8, 9, 4, 5, 6, 1, 2, 3};
    EXPECT_EQ(img, expected);
}

class CameraPipeTest : public ::testing::Test {
protected:
    void SetUp() override { unsetenv("TOUCHCALC_CAMERA_CMD"); }
    void TearDown() override { unsetenv("TOUCHCALC_CAMERA_CMD"); }
};

TEST_F(CameraPipeTest, BuildCommand) {
    CameraConfig cfg;
    EXPECT_EQ(Camera::build_command(cfg),
              "rpicam-vid -t 0 -n --codec yuv420 --width 1280 --height 720 --framerate 30 -o -");
    cfg.command = "cat frames.yuv";
    EXPECT_EQ(Camera::build_command(cfg), "cat frames.yuv");
    setenv("TOUCHCALC_CAMERA_CMD", "my-capture", 1);
    EXPECT_EQ(Camera::build_command(cfg), "my-capture");
}

TEST_F(CameraPipeTest, RejectsOddResolution) {
    Camera cam;
    CameraConfig cfg;
    cfg.width = 641;
    EXPECT_FALSE(cam.init(cfg));
    EXPECT_FALSE(cam.get_error().empty());
    EXPECT_FALSE(cam.start());
}

TEST_F(CameraPipeTest, ReadsFramesUntilEndOfStream) {
    // Two 4x2 YUV420 frames of 12 bytes each
    CameraConfig cfg;
    cfg.width = 4;
    cfg.height = 2;
    cfg.command = "head -c 24 /dev/zero";
    Camera cam;
    ASSERT_TRUE(cam.init(cfg));
    ASSERT_TRUE(cam.start());

    Frame *f1 = cam.capture_frame();
    ASSERT_NE(f1, nullptr);
    EXPECT_EQ(f1->width, 4u);
    EXPECT_EQ(f1->height, 2u);
    EXPECT_EQ(f1->format, PixelFormat::RGB888);
    EXPECT_EQ(f1->data.size(), 4u * 2u * 3u);
    EXPECT_EQ(f1->sequence, 1u);
    // Y=0, U=V=0 -> (0, 135, 0)
    EXPECT_EQ(f1->data[0], 0);
    EXPECT_EQ(f1->data[1], 135);
    EXPECT_EQ(f1->data[2], 0);

    Frame *f2 = cam.capture_frame();
    ASSERT_NE(f2, nullptr);
    EXPECT_EQ(f2->sequence, 2u);

    EXPECT_EQ(cam.capture_frame(), nullptr);
    EXPECT_FALSE(cam.is_running());
    EXPECT_FALSE(cam.get_error().empty());
}
