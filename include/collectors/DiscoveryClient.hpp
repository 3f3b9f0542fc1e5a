#pragma once

#include "model/DeviceSnapshot.hpp"
#include <functional>
#include <stop_token>
#include <string>
#include <vector>

namespace castbar::collectors {

/**
 * Source of device state. Implementations push updates through the
 * listener from their own thread; callbacks may repeat or arrive out of
 * order, so consumers must be idempotent.
 */
class DiscoveryClient {
public:
    using UpdateHandler = std::function<void(const std::string& id, const model::DeviceSnapshot&)>;
    using RemoveHandler = std::function<void(const std::string& id)>;

    virtual ~DiscoveryClient() = default;

    // Ids currently known to the client
    virtual std::vector<std::string> list_devices() const = 0;

    // Must be called before run()
    virtual void set_listener(UpdateHandler on_update, RemoveHandler on_remove) = 0;

    // Blocks, delivering callbacks, until stop is requested
    virtual void run(std::stop_token stop_token) = 0;
};

}  // namespace castbar::collectors
