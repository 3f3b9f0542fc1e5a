#pragma once

#include "util/UnicodeUtils.hpp"
#include <chrono>
#include <string>

namespace castbar::ui {

/**
 * Fixed-width scrolling view of one formatted status line.
 *
 * Text that fits in `width` codepoints is shown as-is, space padded, and
 * never scrolls. Longer text is treated as the loop "text + ' '": each cycle
 * holds offset 0 for `pause`, then moves one codepoint every 1/speed until
 * it has gone length+1 steps and is back at offset 0.
 *
 * Frames are a pure function of the time elapsed since start, so the
 * sequence is infinite and can be restarted at will. A marquee never
 * changes its text or width; build a new one instead.
 */
class Marquee {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::nanoseconds;

    enum class Phase { Paused, Scrolling };

    struct State {
        size_t offset = 0;
        Phase phase = Phase::Paused;
        TimePoint phase_started_at;
    };

    // Longest pause or step a marquee will hold; larger values are capped
    static constexpr std::chrono::hours kMaxInterval{24};

    Marquee(const std::string& text, int width, double speed, double pause,
            TimePoint start = Clock::now());

    /**
     * Frame for `now`; also records the scroll state at that instant.
     */
    std::string frame(TimePoint now);

    /**
     * Frame after `elapsed` since start, without touching state.
     */
    std::string frame_at(Duration elapsed) const;

    /**
     * Frame for a raw scroll offset (taken modulo length+1).
     */
    std::string frame_at_offset(size_t offset) const;

    /**
     * Scroll position after `elapsed` since start.
     */
    State position_at(Duration elapsed) const;

    void restart(TimePoint start);

    bool fits() const { return fits_; }
    size_t length() const { return codepoints_.size(); }
    int width() const { return width_; }
    const std::string& text() const { return text_; }
    const State& state() const { return state_; }

    // Pause plus one full loop; zero when the marquee never moves
    Duration cycle_duration() const;

private:
    std::string text_;
    util::Codepoints codepoints_;
    int width_;
    bool fits_;
    std::string static_frame_;

    Duration step_{0};
    Duration pause_{0};

    TimePoint start_;
    State state_;
};

}  // namespace castbar::ui
