#include "camera.hpp"
#include <iostream>
#include <cstring>
#include <cstdlib>
#include <cerrno>
#include <algorithm>
#include <chrono>
#include <thread>
#include <cstdio>

// Camera capture from a raw YUV420 stream piped via popen (rpicam-vid by default).
//  - Resilient to short reads (retries until a full frame or the retry budget runs out)
//  - Capture command can be overridden with TOUCHCALC_CAMERA_CMD
//  - Converts YUV420 -> RGB888 and optionally mirrors for downstream processing

namespace camera
{

    class Camera::Impl
    {
    public:
        Impl() : initialized_(false), running_(false), frame_count_(0), pipe_(nullptr), expected_yuv_size_(0) {}
        ~Impl() { stop(); }

        bool init(const CameraConfig &config)
        {
            if (config.width == 0 || config.height == 0 || (config.width % 2) != 0 || (config.height % 2) != 0)
            {
                last_error_ = "Invalid camera resolution (must be even and non-zero)";
                return false;
            }
            config_ = config;
            expected_yuv_size_ = static_cast<size_t>(config_.width) * config_.height * 3 / 2;
            initialized_ = true;
            if (config_.verbose)
                std::cerr << "[Camera] Initialized: " << config_.width << "x" << config_.height << "@" << config_.framerate << "fps" << std::endl;
            return true;
        }

        bool start()
        {
            if (!initialized_)
            {
                last_error_ = "Camera not initialized";
                return false;
            }
            if (running_)
                return true;

            std::string cmd = Camera::build_command(config_);
            std::cerr << "[Camera] Capture command: " << cmd << std::endl;
            pipe_ = popen(cmd.c_str(), "r");
            if (!pipe_)
            {
                last_error_ = "Failed to start capture pipe";
                std::cerr << "[Camera][ERROR] popen() failed for: " << cmd << std::endl;
                return false;
            }
            running_ = true;
            frame_count_ = 0;
            return true;
        }

        void stop()
        {
            if (pipe_)
            {
                pclose(pipe_);
                pipe_ = nullptr;
            }
            if (running_ && config_.verbose)
            {
                std::cerr << "[Camera] Stopped after " << frame_count_ << " frames" << std::endl;
            }
            running_ = false;
        }

        Frame *capture_frame(std::vector<uint8_t> &buffer, Frame &frame)
        {
            if (!running_ || !pipe_)
            {
                last_error_ = "Camera not running";
                return nullptr;
            }

            yuv_temp_.resize(expected_yuv_size_);
            size_t read_total = 0;
            const int max_retries = 4;
            int retries = 0;
            while (read_total < expected_yuv_size_)
            {
                size_t n = fread(yuv_temp_.data() + read_total, 1, expected_yuv_size_ - read_total, pipe_);
                if (n == 0)
                {
                    int err = errno;
                    if (feof(pipe_))
                    {
                        last_error_ = "End of stream";
                        std::cerr << "[Camera][ERROR] End of stream after " << read_total << " bytes.\n";
                        stop();
                        return nullptr;
                    }
                    if (ferror(pipe_))
                    {
                        last_error_ = std::string("Read error: ") + std::strerror(err);
                        std::cerr << "[Camera][ERROR] Read error after " << read_total << " bytes: " << std::strerror(err) << "\n";
                        stop();
                        return nullptr;
                    }
                    if (++retries > max_retries)
                    {
                        last_error_ = "Short read retries exceeded (" + std::to_string(read_total) + "/" + std::to_string(expected_yuv_size_) + " bytes)";
                        std::cerr << "[Camera][ERROR] " << last_error_ << "\n";
                        stop();
                        return nullptr;
                    }
                    std::cerr << "[Camera][WARN] Short read: " << read_total << "/" << expected_yuv_size_ << " bytes, retry " << retries << ".\n";
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    continue;
                }
                read_total += n;
            }

            size_t rgb_size = static_cast<size_t>(config_.width) * config_.height * 3;
            buffer.resize(rgb_size);
            utils::yuv420_to_rgb888(yuv_temp_.data(), buffer.data(), config_.width, config_.height);
            if (config_.mirror)
                utils::mirror_horizontal(buffer.data(), config_.width, config_.height, 3);

            auto now = std::chrono::steady_clock::now();
            frame.timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
            frame.data = buffer;
            frame.size = buffer.size();
            frame.width = config_.width;
            frame.height = config_.height;
            frame.format = PixelFormat::RGB888;
            frame.stride = config_.width * 3;
            frame.sequence = ++frame_count_;
            return &frame;
        }

        const std::string &get_error() const { return last_error_; }

    private:
        CameraConfig config_{};
        bool initialized_{};
        bool running_{};
        uint64_t frame_count_{};
        std::string last_error_{};
        std::vector<uint8_t> yuv_temp_{}; // YUV read buffer
        FILE *pipe_{};
        size_t expected_yuv_size_{};
    };

    Camera::Camera() : impl_(new Impl()), running_(false) {}

    Camera::~Camera()
    {
        stop();
    }

    bool Camera::init(const CameraConfig &config)
    {
        config_ = config;
        bool result = impl_->init(config);
        if (!result)
        {
            last_error_ = impl_->get_error();
        }
        return result;
    }

    bool Camera::start()
    {
        bool result = impl_->start();
        if (result)
        {
            running_ = true;
        }
        else
        {
            last_error_ = impl_->get_error();
        }
        return result;
    }

    void Camera::stop()
    {
        impl_->stop();
        running_ = false;
    }

    Frame *Camera::capture_frame()
    {
        Frame *frame = impl_->capture_frame(frame_buffer_, current_frame_);
        if (!frame)
        {
            last_error_ = impl_->get_error();
            running_ = false;
        }
        return frame;
    }

    std::string Camera::build_command(const CameraConfig &config)
    {
        const char *env_cmd = std::getenv("TOUCHCALC_CAMERA_CMD");
        if (env_cmd && *env_cmd)
            return env_cmd;
        if (!config.command.empty())
            return config.command;
        return "rpicam-vid -t 0 -n --codec yuv420 --width " + std::to_string(config.width) +
               " --height " + std::to_string(config.height) +
               " --framerate " + std::to_string(config.framerate) + " -o -";
    }

    namespace utils
    {

        void yuv420_to_rgb888(const uint8_t *yuv, uint8_t *rgb,
                              uint32_t width, uint32_t height)
        {
            size_t y_size = static_cast<size_t>(width) * height;
            size_t uv_size = (width / 2) * (height / 2);

            const uint8_t *y_plane = yuv;
            const uint8_t *u_plane = yuv + y_size;
            const uint8_t *v_plane = yuv + y_size + uv_size;

            for (uint32_t y = 0; y < height; y++)
            {
                for (uint32_t x = 0; x < width; x++)
                {
                    size_t y_idx = static_cast<size_t>(y) * width + x;
                    size_t uv_idx = (y / 2) * (width / 2) + (x / 2);

                    int Y = y_plane[y_idx];
                    int U = u_plane[uv_idx] - 128;
                    int V = v_plane[uv_idx] - 128;

                    int R = Y + static_cast<int>(1.402 * V);
                    int G = Y - static_cast<int>(0.344136 * U) - static_cast<int>(0.714136 * V);
                    int B = Y + static_cast<int>(1.772 * U);

                    size_t rgb_idx = y_idx * 3;
                    rgb[rgb_idx] = static_cast<uint8_t>(std::clamp(R, 0, 255));
                    rgb[rgb_idx + 1] = static_cast<uint8_t>(std::clamp(G, 0, 255));
                    rgb[rgb_idx + 2] = static_cast<uint8_t>(std::clamp(B, 0, 255));
                }
            }
        }

        void mirror_horizontal(uint8_t *data, uint32_t width, uint32_t height,
                               int channels)
        {
            for (uint32_t y = 0; y < height; y++)
            {
                uint8_t *row = data + static_cast<size_t>(y) * width * channels;
                for (uint32_t x = 0; x < width / 2; x++)
                {
                    uint8_t *left = row + static_cast<size_t>(x) * channels;
                    uint8_t *right = row + static_cast<size_t>(width - 1 - x) * channels;
                    for (int c = 0; c < channels; c++)
                        std::swap(left[c], right[c]);
                }
            }
        }

    } // namespace utils

} // namespace camera
