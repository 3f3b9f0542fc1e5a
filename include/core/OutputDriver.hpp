#pragma once

#include "backend/DeviceRegistry.hpp"
#include "backend/SelectionPublisher.hpp"
#include "output/Sink.hpp"
#include "ui/Marquee.hpp"
#include "ui/StatusFormatter.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace castbar::core {

struct OutputOptions {
    int width = 85;
    double speed = 5.0;
    double pause = 2.0;
    bool dedupe = false;
};

/**
 * Fast-tick frame writer.
 *
 * Each tick takes the current selection, refreshes the device from the
 * registry, formats it and writes the marquee frame for `now` to the sink.
 * The marquee restarts whenever the formatted text changes. Sink errors
 * propagate to the caller.
 */
class OutputDriver {
public:
    using Clock = std::chrono::steady_clock;

    OutputDriver(const backend::DeviceRegistry& registry,
                 const backend::SelectionPublisher& selection,
                 ui::StatusFormatter formatter,
                 output::Sink& sink,
                 OutputOptions options);

    // Returns the frame for `now` (written unless deduped)
    std::string tick(Clock::time_point now = Clock::now());

    // Fast timer interval for a marquee speed
    static std::chrono::milliseconds frame_interval(double speed);

    const std::string& current_text() const { return current_text_; }
    uint64_t frames_written() const { return frames_written_; }

private:
    model::DeviceSnapshot resolve(const model::Selection& selection) const;

    const backend::DeviceRegistry& registry_;
    const backend::SelectionPublisher& selection_;
    ui::StatusFormatter formatter_;
    output::Sink& sink_;
    OutputOptions options_;

    std::unique_ptr<ui::Marquee> marquee_;
    std::string current_text_;
    std::string last_frame_;
    bool has_last_frame_ = false;
    uint64_t frames_written_ = 0;
};

}  // namespace castbar::core
