#include "model/DeviceSnapshot.hpp"
#include <algorithm>
#include <cctype>

namespace castbar::model {

namespace {

std::string media_field(const DeviceSnapshot& snap, const std::optional<std::string>& field) {
    if (snap.status == PlaybackStatus::Idle || !field) {
        return "";
    }
    return *field;
}

}  // namespace

std::string DeviceSnapshot::artist_or_empty() const { return media_field(*this, artist); }
std::string DeviceSnapshot::title_or_empty() const { return media_field(*this, title); }
std::string DeviceSnapshot::album_or_empty() const { return media_field(*this, album); }

std::string DeviceSnapshot::app_or_empty() const {
    return app.value_or("");
}

DeviceSnapshot placeholder_snapshot() {
    DeviceSnapshot snap;
    snap.status = PlaybackStatus::Idle;
    return snap;
}

PlaybackStatus parse_status(std::string_view word) {
    std::string upper(word);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "PLAYING" || upper == "BUFFERING") return PlaybackStatus::Playing;
    if (upper == "PAUSED") return PlaybackStatus::Paused;
    return PlaybackStatus::Idle;
}

const char* status_name(PlaybackStatus status) {
    switch (status) {
        case PlaybackStatus::Playing: return "PLAYING";
        case PlaybackStatus::Paused:  return "PAUSED";
        case PlaybackStatus::Idle:    return "IDLE";
    }
    return "IDLE";
}

}  // namespace castbar::model
