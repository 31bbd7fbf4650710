#include "pipeline.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fcntl.h>
#include <iomanip>
#include <iostream>
#include <termios.h>
#include <unistd.h>

using namespace std::chrono;

namespace pipeline
{

    namespace
    {
        constexpr size_t kVisibleHistory = 4;
    }

    void FrameSlot::publish(camera::Frame &&frame)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (has_frame_)
                dropped_++;
            frame_ = std::move(frame);
            has_frame_ = true;
            published_++;
        }
        cv_.notify_one();
    }

    bool FrameSlot::take(camera::Frame &out)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!has_frame_)
            return false;
        std::swap(out, frame_);
        has_frame_ = false;
        return true;
    }

    bool FrameSlot::wait_take(camera::Frame &out, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&]
                     { return has_frame_ || closed_; });
        if (!has_frame_)
            return false;
        std::swap(out, frame_);
        has_frame_ = false;
        return true;
    }

    void FrameSlot::close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool FrameSlot::closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    uint64_t FrameSlot::published() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    uint64_t FrameSlot::dropped() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    KeyCommand key_to_command(int key)
    {
        switch (std::tolower(key))
        {
        case 'q':
            return KeyCommand::QUIT;
        case 't':
            return KeyCommand::TOGGLE_THEME;
        case 'i':
            return KeyCommand::TOGGLE_INSTRUCTIONS;
        case 'r':
            return KeyCommand::RESET_HISTORY;
        case 'c':
            return KeyCommand::CLEAR;
        case 'd':
        case 8:   // Backspace
        case 127: // DEL
            return KeyCommand::DELETE;
        default:
            return KeyCommand::NONE;
        }
    }

    FrameProcessor::FrameProcessor(const config::AppConfig &cfg,
                                   uint32_t display_width, uint32_t display_height,
                                   uint32_t frame_width, uint32_t frame_height)
        : config_(cfg),
          layout_(layout::ButtonLayout::build(display_width, display_height, cfg.layout)),
          mapper_(frame_width, frame_height, display_width, display_height, cfg.pipeline.mirror_landmarks),
          stabilizer_(cfg.gesture.gesture_history),
          touch_(cfg.touch),
          history_(cfg.pipeline.history_name),
          theme_(cfg.pipeline.theme == "light" ? renderer::ThemeKind::LIGHT : renderer::ThemeKind::DARK),
          show_instructions_(cfg.pipeline.show_instructions)
    {
    }

    std::optional<touch::PressEvent> FrameProcessor::process(const std::vector<hand_detector::HandLandmarks> &hands,
                                                             touch::Clock::time_point now)
    {
        auto t0 = steady_clock::now();
        stats_.frames_processed++;

        hand_detector::PoseClassification current = hand_detector::classify(hands, mapper_, config_.gesture);
        hand_detector::Pose previous = pose_.pose;
        pose_ = stabilizer_.push(current);
        if (config_.pipeline.verbose && pose_.pose != previous)
            std::cerr << "[Landmarks] Pose " << hand_detector::pose_to_string(previous)
                      << " -> " << hand_detector::pose_to_string(pose_.pose) << "\n";

        skeleton_.clear();
        if (current.pose != hand_detector::Pose::NO_HAND)
        {
            stats_.frames_with_hand++;
            auto best = std::max_element(hands.begin(), hands.end(),
                                         [](const hand_detector::HandLandmarks &a, const hand_detector::HandLandmarks &b)
                                         { return a.confidence < b.confidence; });
            for (const auto &p : best->points)
                skeleton_.push_back(mapper_.map(p));
        }

        touch::TouchPhase phase = touch_state_.phase;
        std::optional<touch::PressEvent> press = touch_.advance(touch_state_, pose_, layout_, now);
        if (config_.pipeline.verbose && touch_state_.phase != phase)
            std::cerr << "[Touch] " << touch::phase_to_string(phase) << " -> "
                      << touch::phase_to_string(touch_state_.phase) << "\n";
        if (press)
        {
            stats_.presses++;
            std::cerr << "[Touch] Button pressed: " << layout::button_label(press->id) << "\n";
            engine_.apply(press->id);
            if (auto calc = engine_.take_calculation())
            {
                history_.add(*calc);
                if (config_.pipeline.verbose)
                    std::cerr << "[Calculator] " << calc->to_string() << "\n";
            }
        }

        double ms = duration<double, std::milli>(steady_clock::now() - t0).count();
        stats_.avg_process_time_ms += (ms - stats_.avg_process_time_ms) / static_cast<double>(stats_.frames_processed);
        return press;
    }

    bool FrameProcessor::apply_command(KeyCommand cmd)
    {
        switch (cmd)
        {
        case KeyCommand::QUIT:
            std::cerr << "[Pipeline] Quit requested\n";
            return false;
        case KeyCommand::TOGGLE_THEME:
            theme_ = renderer::toggle_theme(theme_);
            std::cerr << "[Pipeline] Theme: " << renderer::theme_for(theme_).name << "\n";
            break;
        case KeyCommand::TOGGLE_INSTRUCTIONS:
            show_instructions_ = !show_instructions_;
            break;
        case KeyCommand::RESET_HISTORY:
            history_.clear();
            std::cerr << "[History] Cleared\n";
            break;
        case KeyCommand::CLEAR:
            engine_.apply(layout::ButtonId::CLEAR);
            break;
        case KeyCommand::DELETE:
            engine_.apply(layout::ButtonId::DEL);
            break;
        case KeyCommand::NONE:
            break;
        }
        return true;
    }

    renderer::ViewModel FrameProcessor::view(touch::Clock::time_point now) const
    {
        renderer::ViewModel v;
        v.layout = &layout_;
        v.hovered = touch_state_.hovered;
        if (touch_state_.last_pressed && touch_.is_flashing(touch_state_, *touch_state_.last_pressed, now))
            v.flashing = touch_state_.last_pressed;

        v.display_text = engine_.display();
        v.display_error = engine_.is_error();
        if (auto op = engine_.pending_operator())
            v.pending_operator = layout::button_label(*op);
        v.history = history_.recent(kVisibleHistory);

        v.pose = pose_.pose;
        v.fingertip = pose_.fingertip;
        if (pose_.fingertip && touch_state_.hovered)
        {
            const layout::Button *b = layout_.find(*touch_state_.hovered);
            v.touching = b && pose_.fingertip->distance(b->center()) < config_.touch.touch_threshold;
        }
        v.skeleton = skeleton_;
        v.show_instructions = show_instructions_;
        v.theme = theme_;
        return v;
    }

    Pipeline::Pipeline(const config::AppConfig &cfg,
                       hand_detector::LandmarkSource &source,
                       renderer::FrameSink &sink)
        : config_(cfg), source_(source), sink_(sink)
    {
    }

    Pipeline::~Pipeline()
    {
        stop();
        if (camera_thread_.joinable())
            camera_thread_.join();
    }

    void Pipeline::stop() { running_ = false; }

    void Pipeline::camera_thread_fn()
    {
        while (running_)
        {
            camera::Frame *frame = camera_.capture_frame();
            if (!frame)
                break;
            camera::Frame copy = *frame;
            slot_.publish(std::move(copy));
        }
        slot_.close();
    }

    void Pipeline::handle_keys()
    {
        char buf[16];
        ssize_t n;
        while ((n = read(STDIN_FILENO, buf, sizeof(buf))) > 0)
        {
            for (ssize_t i = 0; i < n; ++i)
            {
                if (!processor_->apply_command(key_to_command(static_cast<unsigned char>(buf[i]))))
                    running_ = false;
            }
        }
    }

    void Pipeline::print_stats(std::ostream &out) const
    {
        const ProcessorStats &st = processor_->stats();
        out << "[Pipeline] frames=" << st.frames_processed
            << " with_hand=" << st.frames_with_hand
            << " presses=" << st.presses
            << " captured=" << slot_.published()
            << " dropped=" << slot_.dropped()
            << " avg=" << std::fixed << std::setprecision(2) << st.avg_process_time_ms << "ms"
            << std::defaultfloat << "\n";
    }

    int Pipeline::run()
    {
        if (!camera_.init(config_.camera))
        {
            last_error_ = "Camera init failed: " + camera_.get_error();
            std::cerr << "[Camera][ERROR] " << last_error_ << "\n";
            return 1;
        }
        if (!camera_.start())
        {
            last_error_ = "Camera start failed: " + camera_.get_error();
            std::cerr << "[Camera][ERROR] " << last_error_ << "\n";
            return 1;
        }

        uint32_t dw = config_.pipeline.display_width ? config_.pipeline.display_width : sink_.width();
        uint32_t dh = config_.pipeline.display_height ? config_.pipeline.display_height : sink_.height();
        processor_ = std::make_unique<FrameProcessor>(config_, dw, dh, config_.camera.width, config_.camera.height);
        if (processor_->history().load())
            std::cerr << "[History] Loaded " << processor_->history().size() << " entries\n";
        else
            std::cerr << "[History] Starting with an empty history\n";

        // Keys arrive without Enter: non-blocking, non-canonical stdin
        int stdin_flags = -1;
        bool restore_tty = false;
        struct termios old_tio{};
        if (keyboard_)
        {
            stdin_flags = fcntl(STDIN_FILENO, F_GETFL, 0);
            fcntl(STDIN_FILENO, F_SETFL, stdin_flags | O_NONBLOCK);
            if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_tio) == 0)
            {
                struct termios raw = old_tio;
                raw.c_lflag &= ~(ICANON | ECHO);
                restore_tty = tcsetattr(STDIN_FILENO, TCSANOW, &raw) == 0;
            }
        }

        std::cerr << "[Pipeline] Running: camera " << config_.camera.width << "x" << config_.camera.height
                  << ", display " << dw << "x" << dh << ", landmarks " << source_.name() << "\n";

        running_ = true;
        camera_thread_ = std::thread(&Pipeline::camera_thread_fn, this);

        camera::Frame frame;
        while (running_)
        {
            if (!slot_.wait_take(frame, milliseconds(100)))
            {
                if (slot_.closed())
                    break;
                if (keyboard_)
                    handle_keys();
                continue;
            }

            std::vector<hand_detector::HandLandmarks> hands = source_.detect(frame);
            auto now = touch::Clock::now();
            processor_->process(hands, now);

            renderer::Surface surface;
            if (sink_.begin_frame(surface))
            {
                renderer::ViewModel view = processor_->view(now);
                view.camera_rgb = frame.data.data();
                view.camera_width = frame.width;
                view.camera_height = frame.height;
                renderer::render_frame(surface, view);
                if (!sink_.end_frame())
                    std::cerr << "[Display][WARN] Failed to present frame " << frame.sequence << "\n";
            }

            if (keyboard_)
                handle_keys();

            int interval = config_.pipeline.stats_interval;
            if (interval > 0 && processor_->stats().frames_processed % static_cast<uint64_t>(interval) == 0)
                print_stats(std::cout);
        }

        bool stream_ended = slot_.closed();
        running_ = false;
        if (camera_thread_.joinable())
            camera_thread_.join();
        camera_.stop();

        if (restore_tty)
            tcsetattr(STDIN_FILENO, TCSANOW, &old_tio);
        if (stdin_flags >= 0)
            fcntl(STDIN_FILENO, F_SETFL, stdin_flags);

        if (stream_ended && !camera_.get_error().empty())
            std::cerr << "[Camera] Capture ended: " << camera_.get_error() << "\n";

        if (config_.pipeline.autosave_history && !processor_->history().empty())
        {
            if (!processor_->history().save())
                std::cerr << "[History][ERROR] " << processor_->history().get_error() << "\n";
        }

        std::cout << "\n=== Session statistics ===\n";
        print_stats(std::cout);
        return 0;
    }

} // namespace pipeline
