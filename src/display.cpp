#include "display.hpp"

#include <cerrno>
#include <cstring>
#include <dirent.h>
#include <drm.h>
#include <drm_fourcc.h>
#include <drm_mode.h>
#include <fcntl.h>
#include <gbm.h>
#include <iostream>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <unistd.h>
#include <xf86drm.h>

namespace display
{

    DrmDisplay::DrmDisplay() = default;

    DrmDisplay::~DrmDisplay() { shutdown(); }

    bool DrmDisplay::find_connector()
    {
        DIR *d = opendir("/dev/dri");
        if (!d)
        {
            last_error_ = std::string("Cannot open /dev/dri: ") + strerror(errno);
            return false;
        }
        struct dirent *ent;
        while ((ent = readdir(d)) != nullptr)
        {
            if (strncmp(ent->d_name, "card", 4) != 0)
                continue;
            std::string path = std::string("/dev/dri/") + ent->d_name;
            int tryfd = open(path.c_str(), O_RDWR | O_CLOEXEC);
            if (tryfd < 0)
                continue;
            drmModeRes *tryres = drmModeGetResources(tryfd);
            if (!tryres)
            {
                close(tryfd);
                continue;
            }

            // search for a connected connector on this device
            for (int i = 0; i < tryres->count_connectors; ++i)
            {
                drmModeConnector *c = drmModeGetConnector(tryfd, tryres->connectors[i]);
                if (!c)
                    continue;
                if (c->connection == DRM_MODE_CONNECTED && c->count_modes > 0)
                {
                    fd_ = tryfd;
                    res_ = tryres;
                    conn_ = c;
                    mode_ = c->modes[0];
                    conn_id_ = c->connector_id;
                    device_path_ = path;
                    break;
                }
                drmModeFreeConnector(c);
            }
            if (fd_ >= 0)
                break;
            drmModeFreeResources(tryres);
            close(tryfd);
        }
        closedir(d);

        if (fd_ < 0)
        {
            last_error_ = "No /dev/dri/card* with a connected connector";
            return false;
        }
        width_ = mode_.hdisplay;
        height_ = mode_.vdisplay;
        return true;
    }

    bool DrmDisplay::find_crtc()
    {
        drmModeEncoder *enc = drmModeGetEncoder(fd_, conn_->encoder_id);
        if (enc)
        {
            crtc_id_ = enc->crtc_id;
            drmModeFreeEncoder(enc);
        }
        if (!crtc_id_)
        {
            // try to find a possible crtc
            for (int i = 0; i < res_->count_encoders && !crtc_id_; ++i)
            {
                drmModeEncoder *e = drmModeGetEncoder(fd_, res_->encoders[i]);
                if (!e)
                    continue;
                for (int j = 0; j < res_->count_crtcs; ++j)
                {
                    if (e->possible_crtcs & (1 << j))
                    {
                        crtc_id_ = res_->crtcs[j];
                        break;
                    }
                }
                drmModeFreeEncoder(e);
            }
        }
        if (!crtc_id_)
        {
            last_error_ = "No usable CRTC for connector " + std::to_string(conn_id_);
            return false;
        }
        old_crtc_ = drmModeGetCrtc(fd_, crtc_id_);
        return true;
    }

    bool DrmDisplay::create_gbm_buffer()
    {
        gbm_ = gbm_create_device(fd_);
        if (!gbm_)
            return false;
        bo_ = gbm_bo_create(gbm_, width_, height_, GBM_FORMAT_XRGB8888,
                            GBM_BO_USE_SCANOUT | GBM_BO_USE_LINEAR);
        if (!bo_)
        {
            gbm_device_destroy(gbm_);
            gbm_ = nullptr;
            return false;
        }
        if (drmModeAddFB(fd_, width_, height_, 24, 32, gbm_bo_get_stride(bo_),
                         gbm_bo_get_handle(bo_).u32, &fb_id_))
        {
            std::cerr << "[Display][WARN] drmModeAddFB failed for GBM buffer: " << strerror(errno) << "\n";
            gbm_bo_destroy(bo_);
            bo_ = nullptr;
            gbm_device_destroy(gbm_);
            gbm_ = nullptr;
            return false;
        }
        use_gbm_ = true;
        return true;
    }

    bool DrmDisplay::create_dumb_buffer()
    {
        struct drm_mode_create_dumb creq = {};
        creq.width = width_;
        creq.height = height_;
        creq.bpp = 32;
        if (ioctl(fd_, DRM_IOCTL_MODE_CREATE_DUMB, &creq) < 0)
        {
            last_error_ = std::string("DRM_IOCTL_MODE_CREATE_DUMB failed: ") + strerror(errno);
            return false;
        }
        dumb_handle_ = creq.handle;
        dumb_pitch_ = creq.pitch;
        dumb_size_ = creq.size;

        if (drmModeAddFB(fd_, width_, height_, 24, 32, dumb_pitch_, dumb_handle_, &fb_id_))
        {
            last_error_ = std::string("drmModeAddFB failed: ") + strerror(errno);
            return false;
        }

        struct drm_mode_map_dumb mreq = {};
        mreq.handle = dumb_handle_;
        if (ioctl(fd_, DRM_IOCTL_MODE_MAP_DUMB, &mreq) < 0)
        {
            last_error_ = std::string("DRM_IOCTL_MODE_MAP_DUMB failed: ") + strerror(errno);
            return false;
        }
        dumb_map_ = mmap(nullptr, dumb_size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, mreq.offset);
        if (dumb_map_ == MAP_FAILED)
        {
            dumb_map_ = nullptr;
            last_error_ = std::string("mmap of dumb buffer failed: ") + strerror(errno);
            return false;
        }
        return true;
    }

    bool DrmDisplay::init()
    {
        if (!find_connector() || !find_crtc())
        {
            std::cerr << "[Display][ERROR] " << last_error_ << "\n";
            shutdown();
            return false;
        }
        std::cerr << "[Display] Using DRM device: " << device_path_ << " (fd=" << fd_ << "), mode "
                  << width_ << "x" << height_ << "@" << mode_.vrefresh << "Hz\n";

        if (!create_gbm_buffer())
        {
            std::cerr << "[Display] GBM buffer unavailable, using dumb buffer\n";
            if (!create_dumb_buffer())
            {
                std::cerr << "[Display][ERROR] " << last_error_ << "\n";
                shutdown();
                return false;
            }
        }

        if (drmModeSetCrtc(fd_, crtc_id_, fb_id_, 0, 0, &conn_id_, 1, &mode_))
        {
            last_error_ = std::string("drmModeSetCrtc failed: ") + strerror(errno);
            std::cerr << "[Display][ERROR] " << last_error_ << "\n";
            shutdown();
            return false;
        }
        return true;
    }

    bool DrmDisplay::begin_frame(renderer::Surface &surface)
    {
        if (fd_ < 0 || !fb_id_)
            return false;
        if (use_gbm_ && bo_)
        {
            uint32_t stride = 0;
            void *ret = gbm_bo_map(bo_, 0, 0, width_, height_, GBM_BO_TRANSFER_WRITE, &stride, &gbm_map_data_);
            if (!ret)
            {
                std::cerr << "[Display][ERROR] gbm_bo_map failed\n";
                return false;
            }
            surface.map = ret;
            surface.stride = stride;
        }
        else if (dumb_map_)
        {
            surface.map = dumb_map_;
            surface.stride = dumb_pitch_;
        }
        else
        {
            return false;
        }
        surface.width = width_;
        surface.height = height_;
        return true;
    }

    bool DrmDisplay::end_frame()
    {
        if (use_gbm_ && bo_ && gbm_map_data_)
        {
            gbm_bo_unmap(bo_, gbm_map_data_);
            gbm_map_data_ = nullptr;
        }
        if (drmModeSetCrtc(fd_, crtc_id_, fb_id_, 0, 0, &conn_id_, 1, &mode_))
        {
            last_error_ = std::string("drmModeSetCrtc failed during render: ") + strerror(errno);
            return false;
        }
        return true;
    }

    void DrmDisplay::shutdown()
    {
        if (fd_ < 0)
            return;

        // restore old crtc if present
        if (old_crtc_)
        {
            drmModeSetCrtc(fd_, old_crtc_->crtc_id, old_crtc_->buffer_id, old_crtc_->x, old_crtc_->y,
                           &conn_id_, 1, &old_crtc_->mode);
            drmModeFreeCrtc(old_crtc_);
            old_crtc_ = nullptr;
        }

        if (fb_id_)
        {
            drmModeRmFB(fd_, fb_id_);
            fb_id_ = 0;
        }
        if (use_gbm_)
        {
            if (bo_)
                gbm_bo_destroy(bo_);
            if (gbm_)
                gbm_device_destroy(gbm_);
            bo_ = nullptr;
            gbm_ = nullptr;
            use_gbm_ = false;
        }
        else if (dumb_handle_)
        {
            if (dumb_map_)
                munmap(dumb_map_, dumb_size_);
            dumb_map_ = nullptr;
            struct drm_mode_destroy_dumb dreq = {};
            dreq.handle = dumb_handle_;
            ioctl(fd_, DRM_IOCTL_MODE_DESTROY_DUMB, &dreq);
            dumb_handle_ = 0;
        }
        if (conn_)
            drmModeFreeConnector(conn_);
        if (res_)
            drmModeFreeResources(res_);
        conn_ = nullptr;
        res_ = nullptr;
        close(fd_);
        fd_ = -1;
    }

} // namespace display
