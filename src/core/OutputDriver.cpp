#include "core/OutputDriver.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace castbar::core {

OutputDriver::OutputDriver(const backend::DeviceRegistry& registry,
                           const backend::SelectionPublisher& selection,
                           ui::StatusFormatter formatter,
                           output::Sink& sink,
                           OutputOptions options)
    : registry_(registry),
      selection_(selection),
      formatter_(std::move(formatter)),
      sink_(sink),
      options_(options) {
}

std::string OutputDriver::tick(Clock::time_point now) {
    auto selection = selection_.get_current();
    std::string text = formatter_.format(resolve(*selection));

    if (!marquee_ || text != current_text_) {
        util::Logger::debug("OutputDriver: New text (" + std::to_string(text.size()) + " bytes)");
        current_text_ = text;
        marquee_ = std::make_unique<ui::Marquee>(text, options_.width, options_.speed, options_.pause, now);
    }

    std::string frame = marquee_->frame(now);

    if (options_.dedupe && has_last_frame_ && frame == last_frame_) {
        return frame;
    }

    sink_.write_line(frame);
    last_frame_ = frame;
    has_last_frame_ = true;
    ++frames_written_;
    return frame;
}

model::DeviceSnapshot OutputDriver::resolve(const model::Selection& selection) const {
    if (selection.placeholder) {
        return selection.device;
    }
    // Artist/title may have changed since the cycler's tick
    if (auto latest = registry_.find(selection.device.id)) {
        return *latest;
    }
    return selection.device;
}

std::chrono::milliseconds OutputDriver::frame_interval(double speed) {
    constexpr double kMinMs = 10.0;
    constexpr double kMaxMs = 250.0;
    if (!(speed > 0)) {
        return std::chrono::milliseconds(static_cast<int>(kMaxMs));
    }
    double ms = std::clamp(1000.0 / speed, kMinMs, kMaxMs);
    return std::chrono::milliseconds(static_cast<int>(std::lround(ms)));
}

}  // namespace castbar::core
