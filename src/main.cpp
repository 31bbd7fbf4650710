#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#include "app_config.hpp"
#include "display.hpp"
#include "pipeline.hpp"
#include "tflite_landmark_source.hpp"

namespace
{
    pipeline::Pipeline *g_pipeline = nullptr;

    void on_signal(int)
    {
        if (g_pipeline)
            g_pipeline->stop();
    }

    void print_usage(const char *argv0)
    {
        std::cerr << "Usage: " << argv0 << " [options]\n"
                  << "  --config <file>      Load settings from a key/value config file\n"
                  << "  --model <path>       Hand landmark model (env TOUCHCALC_MODEL_PATH)\n"
                  << "  --camera-cmd <cmd>   Raw YUV420 capture command (env TOUCHCALC_CAMERA_CMD)\n"
                  << "  --no-mirror          Do not mirror the camera image\n"
                  << "  --verbose            Per-frame logging\n"
                  << "  --save-config <file> Write the effective settings and exit\n"
                  << "  --help               Show this help\n";
    }
}

int main(int argc, char **argv)
{
    // ---------------------------------------------------------------------------
    // Startup argument parsing (lightweight, no external deps)
    // Path overrides are exported so they take precedence over .env values.
    // ---------------------------------------------------------------------------
    std::string config_path;
    std::string save_config_path;
    bool no_mirror = false;
    bool verbose = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg == "--model" && i + 1 < argc)
        {
            setenv("TOUCHCALC_MODEL_PATH", argv[++i], 1);
        }
        else if (arg == "--camera-cmd" && i + 1 < argc)
        {
            setenv("TOUCHCALC_CAMERA_CMD", argv[++i], 1);
        }
        else if (arg == "--save-config" && i + 1 < argc)
        {
            save_config_path = argv[++i];
        }
        else if (arg == "--no-mirror")
        {
            no_mirror = true;
        }
        else if (arg == "--verbose")
        {
            verbose = true;
        }
        else
        {
            std::cerr << "[Config][ERROR] Unknown or incomplete argument: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    config::load_dotenv(config::default_dotenv_candidates());

    config::AppConfig cfg;
    if (config_path.empty())
    {
        if (const char *env_cfg = std::getenv("TOUCHCALC_CONFIG"); env_cfg && *env_cfg)
            config_path = config::trim_ws(env_cfg);
    }
    if (!config_path.empty())
    {
        if (!cfg.load_from_file(config_path))
            return 1;
        std::cerr << "[Config] Loaded " << config_path << "\n";
    }
    cfg.apply_env();
    if (no_mirror)
        cfg.camera.mirror = false;
    if (verbose)
        cfg.camera.verbose = cfg.gesture.verbose = cfg.pipeline.verbose = cfg.model.verbose = true;
    if (!cfg.validate())
    {
        std::cerr << "[Config][ERROR] Invalid configuration\n";
        return 1;
    }
    if (!save_config_path.empty())
    {
        if (!cfg.save_to_file(save_config_path))
            return 1;
        std::cerr << "[Config] Saved " << save_config_path << "\n";
        return 0;
    }

    std::cerr << "\n=== Virtual Touch Calculator ===\n"
              << "Point with your index finger and touch the buttons.\n"
              << "Keys: q quit, t theme, i instructions, r reset history, c clear, d/Backspace delete\n\n";

    if (!hand_detector::TFLiteLandmarkSource::is_available())
    {
        std::cerr << "[SYSTEM] Built without TensorFlow Lite; hand tracking is not possible\n";
        return 1;
    }
    hand_detector::TFLiteLandmarkSource source(cfg.model);
    if (!source.init())
    {
        std::cerr << "[SYSTEM] Landmark model unavailable: " << source.get_error() << "\n";
        return 1;
    }

    display::DrmDisplay drm;
    if (!drm.init())
    {
        std::cerr << "[SYSTEM] Display unavailable: " << drm.get_error() << "\n";
        return 1;
    }
    std::cerr << "[Display] " << drm.device_path() << " " << drm.width() << "x" << drm.height()
              << (drm.uses_gbm() ? " (gbm)" : " (dumb buffer)") << "\n";

    pipeline::Pipeline pipe(cfg, source, drm);
    g_pipeline = &pipe;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    int rc = pipe.run();
    g_pipeline = nullptr;
    if (rc != 0)
        std::cerr << "[SYSTEM] " << pipe.get_error() << "\n";

    hand_detector::DetectionStats st = source.get_stats();
    std::cout << "[Landmarks] frames=" << st.frames_processed
              << " hands=" << st.hands_detected
              << " avg=" << st.avg_process_time_ms << "ms\n";

    drm.shutdown();
    std::cerr << "[SYSTEM] Goodbye\n";
    return rc;
}
