#pragma once

#include "backend/DeviceRegistry.hpp"
#include "backend/SelectionPublisher.hpp"
#include "model/Selection.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace castbar::core {

/**
 * Round-robin selection over the registry's active devices.
 *
 * tick() is driven by the slow timer. Starting from Empty, or after the
 * selected device left the active set, selection restarts at index 0;
 * otherwise it advances one place with wraparound. A shrunken list clamps
 * the index by modulo before advancing.
 */
class Cycler {
public:
    using Clock = std::chrono::steady_clock;

    // Returns false for devices that must not be shown (blacklist)
    using Filter = std::function<bool(const model::DeviceSnapshot&)>;

    enum class State { Empty, Cycling };

    Cycler(const backend::DeviceRegistry& registry,
           backend::SelectionPublisher& selection,
           Filter filter = nullptr);

    // One period tick; publishes and returns the new selection
    model::Selection tick(Clock::time_point now = Clock::now());

    State state() const { return state_; }
    size_t index() const { return index_; }
    const std::string& selected_id() const { return selected_id_; }
    Clock::time_point last_switch_time() const { return last_switch_time_; }

private:
    const backend::DeviceRegistry& registry_;
    backend::SelectionPublisher& selection_;
    Filter filter_;

    State state_ = State::Empty;
    size_t index_ = 0;
    size_t last_count_ = 0;
    std::string selected_id_;
    Clock::time_point last_switch_time_{};
};

}  // namespace castbar::core
