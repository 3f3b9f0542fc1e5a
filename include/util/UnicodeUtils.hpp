#pragma once

#include <string>
#include <vector>
#include <unicode/unistr.h>
#include <unicode/normalizer2.h>

namespace castbar::util {

using Codepoints = std::vector<UChar32>;

/// NFC-normalize UTF-8 text so composed and decomposed spellings of the same
/// character (é vs e + U+0301) count as the same number of codepoints.
/// Invalid UTF-8 sequences become U+FFFD.
inline icu::UnicodeString normalize_nfc(const std::string& text) {
    icu::UnicodeString unicode_text = icu::UnicodeString::fromUTF8(text);

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfc = icu::Normalizer2::getNFCInstance(status);
    if (U_FAILURE(status) || !nfc) {
        // No normalization data: count the text as given
        return unicode_text;
    }

    icu::UnicodeString normalized = nfc->normalize(unicode_text, status);
    if (U_FAILURE(status)) {
        return unicode_text;
    }
    return normalized;
}

/// Decode UTF-8 into NFC codepoints
inline Codepoints to_codepoints(const std::string& text) {
    if (text.empty()) {
        return {};
    }

    icu::UnicodeString unicode_text = normalize_nfc(text);

    Codepoints out(static_cast<size_t>(unicode_text.countChar32()));
    UErrorCode status = U_ZERO_ERROR;
    int32_t written = unicode_text.toUTF32(out.data(), static_cast<int32_t>(out.size()), status);
    if (U_FAILURE(status)) {
        return {};
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

/// Encode codepoints back to UTF-8
inline std::string to_utf8(const UChar32* codepoints, size_t count) {
    std::string result;
    if (count == 0) {
        return result;
    }
    icu::UnicodeString::fromUTF32(codepoints, static_cast<int32_t>(count)).toUTF8String(result);
    return result;
}

inline std::string to_utf8(const Codepoints& codepoints) {
    return to_utf8(codepoints.data(), codepoints.size());
}

/// Codepoint length of UTF-8 text after NFC normalization
inline size_t codepoint_count(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    return static_cast<size_t>(normalize_nfc(text).countChar32());
}

} // namespace castbar::util
