#pragma once

#include <unicode/unistr.h>
#include <unicode/utf8.h>
#include <unicode/utypes.h>
#include <unicode/uchar.h>
#include <string>

namespace palincheck {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 * Invalid byte sequences become U+FFFD
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), static_cast<int32_t>(utf8_str.length())));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Decode a UTF-8 string into code points
 * Surrogate pairs are combined, so each element is one Unicode scalar value
 */
inline std::u32string to_code_points(const std::string& utf8_str) {
    std::u32string result;
    if (utf8_str.empty()) {
        return result;
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    result.reserve(static_cast<size_t>(ustr.countChar32()));
    for (int32_t i = 0; i < ustr.length(); i = ustr.moveIndex32(i, 1)) {
        result.push_back(static_cast<char32_t>(ustr.char32At(i)));
    }
    return result;
}

/**
 * Encode code points as UTF-8
 */
inline std::string from_code_points(const std::u32string& code_points) {
    icu::UnicodeString ustr;
    for (char32_t cp : code_points) {
        ustr.append(static_cast<UChar32>(cp));
    }
    return from_unicode_string(ustr);
}

/**
 * Count Unicode characters (code points) in a UTF-8 string
 */
inline size_t char_count(const std::string& utf8_str) {
    if (utf8_str.empty()) {
        return 0;
    }
    return static_cast<size_t>(to_unicode_string(utf8_str).countChar32());
}

/**
 * Letter (Lu, Ll, Lt, Lm, Lo) or number (Nd, Nl, No)
 */
inline bool is_alnum(char32_t cp) {
    int32_t mask = U_GET_GC_MASK(static_cast<UChar32>(cp));
    return (mask & (U_GC_L_MASK | U_GC_N_MASK)) != 0;
}

/**
 * Simple (one-to-one) lowercase mapping of a single code point
 */
inline char32_t to_lower(char32_t cp) {
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(cp)));
}

inline bool is_ascii_alnum(char32_t cp) {
    return (cp >= U'0' && cp <= U'9') || (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

inline char32_t ascii_to_lower(char32_t cp) {
    return (cp >= U'A' && cp <= U'Z') ? cp + (U'a' - U'A') : cp;
}

/**
 * Sanitize a string to ensure it's valid UTF-8
 * Replaces invalid sequences with replacement character (U+FFFD)
 */
inline std::string sanitize_utf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }
    // ICU automatically handles invalid UTF-8 by replacing with U+FFFD
    icu::UnicodeString ustr = to_unicode_string(str);
    return from_unicode_string(ustr);
}

}  // namespace unicode
}  // namespace palincheck
