#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <vector>

namespace camera
{

    // Frame format for image processing
    enum class PixelFormat
    {
        RGB888,   // 24-bit RGB
        YUV420,   // YUV 4:2:0
        UNKNOWN
    };

    // Represents a single camera frame
    struct Frame
    {
        std::vector<uint8_t> data; // Raw pixel data
        size_t size;           // Data size in bytes
        uint32_t width;        // Frame width
        uint32_t height;       // Frame height
        PixelFormat format;    // Pixel format
        uint64_t timestamp_ns; // Capture timestamp (nanoseconds, steady clock)
        uint64_t sequence;     // Monotonic capture counter
        int stride;            // Bytes per row

        Frame() : data(), size(0), width(0), height(0),
                  format(PixelFormat::UNKNOWN), timestamp_ns(0), sequence(0), stride(0) {}

        bool empty() const { return data.empty() || width == 0 || height == 0; }
    };

    // Camera configuration
    struct CameraConfig
    {
        uint32_t width;      // Desired width (default: 1280)
        uint32_t height;     // Desired height (default: 720)
        uint32_t framerate;  // Desired FPS (default: 30)
        bool mirror;         // Flip horizontally for a selfie view
        bool verbose;        // Enable verbose logging
        std::string command; // Capture command; empty selects rpicam-vid

        CameraConfig() : width(1280), height(720), framerate(30),
                         mirror(true), verbose(false) {}
    };

    // Camera capture through a raw YUV420 pipe (rpicam-vid or a compatible command)
    class Camera
    {
    public:
        Camera();
        ~Camera();

        // Initialize camera with configuration
        // Returns true on success
        bool init(const CameraConfig &config);

        // Start camera capture
        bool start();

        // Stop camera capture
        void stop();

        // Capture a single frame (blocking)
        // Returns pointer to frame data (valid until next capture)
        // Returns nullptr on error
        Frame *capture_frame();

        // Get current configuration
        const CameraConfig &get_config() const { return config_; }

        // Check if camera is running
        bool is_running() const { return running_; }

        // Get last error message
        const std::string &get_error() const { return last_error_; }

        // Resolve the capture command (TOUCHCALC_CAMERA_CMD overrides config)
        static std::string build_command(const CameraConfig &config);

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;

        CameraConfig config_;
        bool running_;
        std::string last_error_;
        Frame current_frame_;

        // Internal frame buffer
        std::vector<uint8_t> frame_buffer_;

        // Disable copy
        Camera(const Camera &) = delete;
        Camera &operator=(const Camera &) = delete;
    };

    // Utility functions for image processing
    namespace utils
    {
        // Convert YUV420 to RGB888
        void yuv420_to_rgb888(const uint8_t *yuv, uint8_t *rgb,
                              uint32_t width, uint32_t height);

        // Mirror an image in place around its vertical axis
        void mirror_horizontal(uint8_t *data, uint32_t width, uint32_t height,
                               int channels);
    }

} // namespace camera
