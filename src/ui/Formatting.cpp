#include "ui/Formatting.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>

namespace castbar::ui {

int display_cols(const std::string& s) {
    return static_cast<int>(util::codepoint_count(s));
}

std::string take_cols(const std::string& s, int cols) {
    if (cols <= 0) return "";

    auto cps = util::to_codepoints(s);
    size_t n = std::min(cps.size(), static_cast<size_t>(cols));
    return util::to_utf8(cps.data(), n);
}

std::string trunc_pad(const std::string& s, int w) {
    if (w <= 0) return "";

    auto cps = util::to_codepoints(s);
    size_t width = static_cast<size_t>(w);

    if (cps.size() >= width) {
        return util::to_utf8(cps.data(), width);
    }

    // Pad with spaces
    return util::to_utf8(cps) + std::string(width - cps.size(), ' ');
}

} // namespace castbar::ui
