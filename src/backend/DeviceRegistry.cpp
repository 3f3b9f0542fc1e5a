#include "backend/DeviceRegistry.hpp"
#include "util/Logger.hpp"

namespace castbar::backend {

void DeviceRegistry::update(const model::DeviceSnapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = devices_.insert_or_assign(snapshot.id, snapshot);
    ++version_;
    if (inserted) {
        util::Logger::info("DeviceRegistry: Registered device " + snapshot.id +
            " (" + snapshot.name + ")");
    }
}

void DeviceRegistry::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (devices_.erase(id) > 0) {
        ++version_;
        util::Logger::info("DeviceRegistry: Removed device " + id);
    }
}

std::vector<model::DeviceSnapshot> DeviceRegistry::active_devices() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<model::DeviceSnapshot> active;
    active.reserve(devices_.size());
    // std::map iterates in ascending key order
    for (const auto& [id, snap] : devices_) {
        if (snap.is_active()) {
            active.push_back(snap);
        }
    }
    return active;
}

std::optional<model::DeviceSnapshot> DeviceRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

uint64_t DeviceRegistry::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return version_;
}

}  // namespace castbar::backend
