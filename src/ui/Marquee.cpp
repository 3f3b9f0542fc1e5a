#include "ui/Marquee.hpp"
#include <algorithm>

namespace castbar::ui {

Marquee::Marquee(const std::string& text, int width, double speed, double pause, TimePoint start)
    : text_(text),
      codepoints_(util::to_codepoints(text)),
      width_(std::max(width, 0)),
      fits_(codepoints_.size() <= static_cast<size_t>(std::max(width, 0))),
      start_(start) {
    state_.phase_started_at = start_;

    if (fits_) {
        static_frame_ = util::to_utf8(codepoints_) +
            std::string(static_cast<size_t>(width_) - codepoints_.size(), ' ');
        return;
    }

    // NaN and non-positive values fall through to 0; inf caps at kMaxInterval
    const double max_seconds = std::chrono::duration<double>(kMaxInterval).count();
    if (speed > 0) {
        step_ = std::chrono::duration_cast<Duration>(
            std::chrono::duration<double>(std::min(1.0 / speed, max_seconds)));
        if (step_.count() <= 0) {
            step_ = Duration(1);
        }
    }
    if (pause > 0) {
        pause_ = std::chrono::duration_cast<Duration>(
            std::chrono::duration<double>(std::min(pause, max_seconds)));
    }
}

std::string Marquee::frame(TimePoint now) {
    if (fits_) {
        return static_frame_;
    }
    state_ = position_at(std::chrono::duration_cast<Duration>(now - start_));
    return frame_at_offset(state_.offset);
}

std::string Marquee::frame_at(Duration elapsed) const {
    if (fits_) {
        return static_frame_;
    }
    return frame_at_offset(position_at(elapsed).offset);
}

std::string Marquee::frame_at_offset(size_t offset) const {
    if (fits_) {
        return static_frame_;
    }

    // Loop is the text followed by one separator space
    const size_t loop = codepoints_.size() + 1;
    util::Codepoints window;
    window.reserve(static_cast<size_t>(width_));
    for (size_t k = 0; k < static_cast<size_t>(width_); ++k) {
        size_t idx = (offset + k) % loop;
        window.push_back(idx < codepoints_.size() ? codepoints_[idx] : U' ');
    }
    return util::to_utf8(window);
}

Marquee::State Marquee::position_at(Duration elapsed) const {
    State pos;
    pos.phase_started_at = start_;

    if (fits_ || step_.count() == 0) {
        // Static, or speed 0: hold the first slice forever
        return pos;
    }
    if (elapsed.count() < 0) {
        elapsed = Duration(0);
    }

    const auto loop = static_cast<Duration::rep>(codepoints_.size() + 1);
    const Duration cycle = pause_ + step_ * loop;
    const auto cycles = elapsed / cycle;
    const Duration into_cycle = elapsed % cycle;
    const TimePoint cycle_start = start_ + std::chrono::duration_cast<Clock::duration>(cycle * cycles);

    if (into_cycle < pause_) {
        pos.phase_started_at = cycle_start;
        return pos;
    }

    pos.phase = Phase::Scrolling;
    pos.offset = static_cast<size_t>((into_cycle - pause_) / step_);
    pos.phase_started_at = cycle_start + std::chrono::duration_cast<Clock::duration>(pause_);
    return pos;
}

void Marquee::restart(TimePoint start) {
    start_ = start;
    state_ = State{};
    state_.phase_started_at = start_;
}

Marquee::Duration Marquee::cycle_duration() const {
    if (fits_ || step_.count() == 0) {
        return Duration(0);
    }
    return pause_ + step_ * static_cast<Duration::rep>(codepoints_.size() + 1);
}

}  // namespace castbar::ui
