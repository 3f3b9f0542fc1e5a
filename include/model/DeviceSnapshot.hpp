#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace castbar::model {

enum class PlaybackStatus {
    Idle,
    Playing,
    Paused,
};

// Last-known state of one cast device.
struct DeviceSnapshot {
    std::string id;                     // Stable identifier (cast UUID)
    std::string name;                   // Friendly name
    std::optional<std::string> artist;
    std::optional<std::string> title;
    std::optional<std::string> album;
    std::optional<std::string> app;     // Running cast application
    PlaybackStatus status = PlaybackStatus::Idle;

    bool is_active() const { return status != PlaybackStatus::Idle; }

    // Media fields go blank while idle, whatever the device last reported
    std::string artist_or_empty() const;
    std::string title_or_empty() const;
    std::string album_or_empty() const;
    std::string app_or_empty() const;

    bool operator==(const DeviceSnapshot&) const = default;
};

// "Nothing playing" stand-in used when no device is active.
DeviceSnapshot placeholder_snapshot();

// PLAYING/BUFFERING -> Playing, PAUSED -> Paused, anything else -> Idle.
PlaybackStatus parse_status(std::string_view word);

const char* status_name(PlaybackStatus status);

}  // namespace castbar::model
