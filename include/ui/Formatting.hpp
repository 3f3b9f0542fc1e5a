#pragma once

#include <string>

namespace castbar::ui {

/**
 * Display width of a string in the status bar's column budget:
 * one column per Unicode codepoint (after NFC), not per byte.
 */
int display_cols(const std::string& s);

/**
 * First `width` codepoints of `s`.
 */
std::string take_cols(const std::string& s, int width);

/**
 * Truncate to `width` codepoints, then right-pad with spaces.
 * Result is exactly `width` columns.
 */
std::string trunc_pad(const std::string& s, int width);

} // namespace castbar::ui
