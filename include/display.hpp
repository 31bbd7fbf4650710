#pragma once

#include "renderer.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <xf86drmMode.h>

struct gbm_device;
struct gbm_bo;

namespace display
{

    // Single scan-out buffer on the first /dev/dri/card* with a connected output.
    // Uses a GBM buffer object when possible, a DRM dumb buffer otherwise.
    class DrmDisplay : public renderer::FrameSink
    {
    public:
        DrmDisplay();
        ~DrmDisplay() override;

        // Open the device, pick the preferred mode, create the buffer and show it
        bool init();
        // Restore the previous CRTC and release everything. Safe to call twice.
        void shutdown();

        bool begin_frame(renderer::Surface &surface) override;
        bool end_frame() override;

        uint32_t width() const override { return width_; }
        uint32_t height() const override { return height_; }

        const std::string &device_path() const { return device_path_; }
        bool uses_gbm() const { return use_gbm_; }
        const std::string &get_error() const { return last_error_; }

    private:
        bool find_connector();
        bool find_crtc();
        bool create_gbm_buffer();
        bool create_dumb_buffer();

        int fd_ = -1;
        drmModeRes *res_ = nullptr;
        drmModeConnector *conn_ = nullptr;
        drmModeModeInfo mode_{};
        drmModeCrtc *old_crtc_ = nullptr;
        uint32_t conn_id_ = 0;
        uint32_t crtc_id_ = 0;
        uint32_t fb_id_ = 0;
        uint32_t width_ = 0;
        uint32_t height_ = 0;
        std::string device_path_;

        bool use_gbm_ = false;
        gbm_device *gbm_ = nullptr;
        gbm_bo *bo_ = nullptr;
        void *gbm_map_data_ = nullptr;

        void *dumb_map_ = nullptr;
        uint32_t dumb_pitch_ = 0;
        size_t dumb_size_ = 0;
        uint32_t dumb_handle_ = 0;

        std::string last_error_;

        DrmDisplay(const DrmDisplay &) = delete;
        DrmDisplay &operator=(const DrmDisplay &) = delete;
    };

} // namespace display
