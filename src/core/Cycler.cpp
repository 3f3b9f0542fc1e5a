#include "core/Cycler.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <utility>

namespace castbar::core {

Cycler::Cycler(const backend::DeviceRegistry& registry,
               backend::SelectionPublisher& selection,
               Filter filter)
    : registry_(registry), selection_(selection), filter_(std::move(filter)) {
}

model::Selection Cycler::tick(Clock::time_point now) {
    auto devices = registry_.active_devices();
    if (filter_) {
        devices.erase(std::remove_if(devices.begin(), devices.end(),
                          [this](const model::DeviceSnapshot& d) { return !filter_(d); }),
                      devices.end());
    }

    model::Selection next;

    if (devices.empty()) {
        if (state_ != State::Empty) {
            util::Logger::info("Cycler: No active devices");
            last_switch_time_ = now;
        }
        state_ = State::Empty;
        index_ = 0;
        last_count_ = 0;
        selected_id_.clear();

        next.device = model::placeholder_snapshot();
        next.placeholder = true;
        selection_.publish(next);
        return next;
    }

    bool previous_present = std::any_of(devices.begin(), devices.end(),
        [this](const model::DeviceSnapshot& d) { return d.id == selected_id_; });

    if (state_ == State::Empty || !previous_present) {
        index_ = 0;
    } else {
        if (devices.size() != last_count_) {
            index_ %= devices.size();
        }
        index_ = (index_ + 1) % devices.size();
    }

    const auto& chosen = devices[index_];
    if (chosen.id != selected_id_) {
        util::Logger::debug("Cycler: Selected " + chosen.id + " (" +
            std::to_string(index_ + 1) + "/" + std::to_string(devices.size()) + ")");
        last_switch_time_ = now;
    }

    state_ = State::Cycling;
    last_count_ = devices.size();
    selected_id_ = chosen.id;

    next.device = chosen;
    next.placeholder = false;
    selection_.publish(next);
    return next;
}

}  // namespace castbar::core
