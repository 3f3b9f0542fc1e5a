#include "ui/StatusFormatter.hpp"
#include <optional>
#include <string_view>
#include <utility>

namespace castbar::ui {

namespace {

std::optional<std::string> resolve(std::string_view key,
                                   const model::DeviceSnapshot& snap,
                                   bool unicode_mode) {
    if (key.starts_with("p.")) {
        key.remove_prefix(2);
    }

    if (key == "id") return snap.id;
    if (key == "name") return snap.name;
    if (key == "artist") return snap.artist_or_empty();
    if (key == "title") return snap.title_or_empty();
    if (key == "album") return snap.album_or_empty();
    if (key == "app") return snap.app_or_empty();
    if (key == "status") {
        return std::string(unicode_mode ? StatusFormatter::status_glyph(snap.status)
                                        : StatusFormatter::status_label(snap.status));
    }
    if (key == "status_text") return std::string(StatusFormatter::status_label(snap.status));
    if (key == "unicode_status") return std::string(StatusFormatter::status_glyph(snap.status));
    if (key == "artist_title") {
        std::string artist = snap.artist_or_empty();
        std::string title = snap.title_or_empty();
        if (!artist.empty() && !title.empty()) return artist + " - " + title;
        return artist.empty() ? title : artist;
    }
    return std::nullopt;
}

}  // namespace

StatusFormatter::StatusFormatter(std::string format, bool unicode_mode)
    : format_(std::move(format)), unicode_mode_(unicode_mode) {
}

std::string StatusFormatter::format(const model::DeviceSnapshot& snap) const {
    return format(format_, snap, unicode_mode_);
}

std::string StatusFormatter::format(const std::string& format,
                                    const model::DeviceSnapshot& snap,
                                    bool unicode_mode) {
    if (format.empty()) {
        return default_layout(snap);
    }

    std::string out;
    out.reserve(format.size() + 32);

    size_t i = 0;
    while (i < format.size()) {
        char c = format[i];

        if (c == '{' && i + 1 < format.size() && format[i + 1] == '{') {
            out += '{';
            i += 2;
            continue;
        }
        if (c == '}' && i + 1 < format.size() && format[i + 1] == '}') {
            out += '}';
            i += 2;
            continue;
        }
        if (c != '{') {
            out += c;
            ++i;
            continue;
        }

        auto close = format.find('}', i + 1);
        if (close == std::string::npos) {
            // Unterminated: rest of the template is literal
            out.append(format, i, std::string::npos);
            break;
        }

        std::string_view key(format.data() + i + 1, close - i - 1);
        if (auto value = resolve(key, snap, unicode_mode)) {
            out += *value;
        } else {
            out.append(format, i, close - i + 1);
        }
        i = close + 1;
    }

    return out;
}

std::string StatusFormatter::default_layout(const model::DeviceSnapshot& snap) {
    std::string out = snap.name;

    auto append = [&out](const std::string& value, const char* separator) {
        if (value.empty()) return;
        if (!out.empty()) out += separator;
        out += value;
    };

    append(snap.app_or_empty(), " : ");
    append(snap.artist_or_empty(), " | ");
    append(snap.title_or_empty(), " - ");
    return out;
}

const char* StatusFormatter::status_glyph(model::PlaybackStatus status) {
    switch (status) {
        case model::PlaybackStatus::Playing: return "▶";
        case model::PlaybackStatus::Paused:  return "⏸";
        case model::PlaybackStatus::Idle:    return "⏹";
    }
    return "⏹";
}

const char* StatusFormatter::status_label(model::PlaybackStatus status) {
    switch (status) {
        case model::PlaybackStatus::Playing: return ">";
        case model::PlaybackStatus::Paused:  return "||";
        case model::PlaybackStatus::Idle:    return "#";
    }
    return "#";
}

}  // namespace castbar::ui
