#pragma once

#include "model/DeviceSnapshot.hpp"
#include <cstdint>

namespace castbar::model {

// What the cycler chose to display for the current period.
struct Selection {
    DeviceSnapshot device;
    bool placeholder = true;
    uint64_t seq = 0;      // Set by SelectionPublisher on publish
};

}  // namespace castbar::model
