#pragma once

#include "types.h"

#include <string>

namespace palincheck {

class Normalizer {
public:
    explicit Normalizer(ClassificationTable table = ClassificationTable::Unicode);

    ClassificationTable table() const { return table_; }

    // Keep alphanumeric characters, lower-cased, in input order; drop the rest.
    // Total: empty or punctuation-only input gives an empty sequence.
    CanonicalSequence normalize(const CharacterSequence& input) const;

    // Decodes UTF-8 first (invalid bytes become U+FFFD, which is dropped)
    CanonicalSequence normalize_utf8(const std::string& text) const;

    // True if normalize(seq) would return seq unchanged
    bool is_canonical(const CharacterSequence& seq) const;

    bool is_alnum(char32_t cp) const;
    char32_t to_lower(char32_t cp) const;

private:
    ClassificationTable table_;
};

// Shorthand for Normalizer(table).normalize(...)
CanonicalSequence normalize(const CharacterSequence& input, ClassificationTable table = ClassificationTable::Unicode);
CanonicalSequence normalize(const std::string& text, ClassificationTable table = ClassificationTable::Unicode);

} // namespace palincheck
