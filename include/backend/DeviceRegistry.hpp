#pragma once

#include "model/DeviceSnapshot.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace castbar::backend {

/**
 * Live set of known cast devices, keyed by id.
 *
 * Written from the discovery thread, read by the cycler and the output
 * driver. Every call takes the one registry mutex and returns copies, so
 * no caller ever holds a reference into registry state.
 */
class DeviceRegistry {
public:
    // Insert or replace; last write wins.
    void update(const model::DeviceSnapshot& snapshot);

    // No-op when the id is unknown.
    void remove(const std::string& id);

    // Non-idle devices, ascending by id.
    std::vector<model::DeviceSnapshot> active_devices() const;

    std::optional<model::DeviceSnapshot> find(const std::string& id) const;

    size_t size() const;

    // Bumped on every mutation.
    uint64_t version() const;

private:
    std::map<std::string, model::DeviceSnapshot> devices_;
    uint64_t version_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace castbar::backend
