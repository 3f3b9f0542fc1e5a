#pragma once

#include "model/DeviceSnapshot.hpp"
#include <string>

namespace castbar::ui {

/**
 * Renders a device snapshot through a user template.
 *
 * Placeholders: {id} {name} {artist} {title} {album} {app} {status}
 * {status_text} {unicode_status} {artist_title}. "{p.name}" is accepted
 * as a spelling of "{name}". "{{" and "}}" are literal braces. Unknown
 * placeholders are copied through unchanged. An empty template selects
 * default_layout().
 */
class StatusFormatter {
public:
    StatusFormatter(std::string format, bool unicode_mode);

    std::string format(const model::DeviceSnapshot& snap) const;

    static std::string format(const std::string& format,
                              const model::DeviceSnapshot& snap,
                              bool unicode_mode);

    // "name : app | artist - title", skipping empty parts
    static std::string default_layout(const model::DeviceSnapshot& snap);

    static const char* status_glyph(model::PlaybackStatus status);
    static const char* status_label(model::PlaybackStatus status);

private:
    std::string format_;
    bool unicode_mode_;
};

}  // namespace castbar::ui
