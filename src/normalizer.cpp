#include "palincheck/normalizer.h"
#include "palincheck/unicode_utils.h"

namespace palincheck {

Normalizer::Normalizer(ClassificationTable table) : table_(table) {}

bool Normalizer::is_alnum(char32_t cp) const {
    if (table_ == ClassificationTable::Ascii) {
        return unicode::is_ascii_alnum(cp);
    }
    return unicode::is_alnum(cp);
}

char32_t Normalizer::to_lower(char32_t cp) const {
    if (table_ == ClassificationTable::Ascii) {
        return unicode::ascii_to_lower(cp);
    }
    return unicode::to_lower(cp);
}

CanonicalSequence Normalizer::normalize(const CharacterSequence& input) const {
    CharacterSequence out;
    out.reserve(input.size());
    for (char32_t cp : input) {
        if (is_alnum(cp)) {
            out.push_back(to_lower(cp));
        }
    }
    return CanonicalSequence(std::move(out));
}

CanonicalSequence Normalizer::normalize_utf8(const std::string& text) const {
    return normalize(unicode::to_code_points(text));
}

bool Normalizer::is_canonical(const CharacterSequence& seq) const {
    for (char32_t cp : seq) {
        if (!is_alnum(cp) || to_lower(cp) != cp) {
            return false;
        }
    }
    return true;
}

CanonicalSequence normalize(const CharacterSequence& input, ClassificationTable table) {
    return Normalizer(table).normalize(input);
}

CanonicalSequence normalize(const std::string& text, ClassificationTable table) {
    return Normalizer(table).normalize_utf8(text);
}

} // namespace palincheck
