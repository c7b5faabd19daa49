#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace palincheck {

// Ordered, finite sequence of Unicode scalar values
using CharacterSequence = std::u32string;

// Which code points count as alphanumeric and how they lower-case
enum class ClassificationTable {
    Unicode,  // general category L* or N*, ICU simple lowercase
    Ascii     // [A-Za-z0-9] only
};

std::string table_name(ClassificationTable table);
// Throws std::invalid_argument on an unknown name
ClassificationTable parse_table(const std::string& name);

// Output of Normalizer: lower-case alphanumerics only.
// Only Normalizer constructs non-empty values.
class CanonicalSequence {
public:
    CanonicalSequence() = default;

    const CharacterSequence& chars() const { return chars_; }
    std::size_t size() const { return chars_.size(); }
    bool empty() const { return chars_.empty(); }
    std::string utf8() const;

    bool operator==(const CanonicalSequence& other) const { return chars_ == other.chars_; }
    bool operator!=(const CanonicalSequence& other) const { return chars_ != other.chars_; }

private:
    friend class Normalizer;
    explicit CanonicalSequence(CharacterSequence chars) : chars_(std::move(chars)) {}

    CharacterSequence chars_;
};

struct SymmetryResult {
    bool symmetric = true;
    CharacterSequence compared;
    std::optional<std::size_t> first_mismatch;  // Left index of the first differing pair
};

struct PalindromeAnalysis {
    std::string text;
    std::string normalized;  // UTF-8 canonical form
    bool palindrome = false;
    bool exact = false;
};

} // namespace palincheck
