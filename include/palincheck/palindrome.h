#pragma once

#include "types.h"

#include <string>

namespace palincheck {

// Case, space and punctuation insensitive: is_symmetric(normalize(text))
bool is_palindrome(const std::string& text, ClassificationTable table = ClassificationTable::Unicode);
bool is_palindrome(const CharacterSequence& text, ClassificationTable table = ClassificationTable::Unicode);

// Exact mirror image, every code point counts: is_symmetric(text)
bool is_palindrome_exact(const std::string& text);
bool is_palindrome_exact(const CharacterSequence& text);

// Both checks plus the canonical form, for reporting
PalindromeAnalysis analyze(const std::string& text, ClassificationTable table = ClassificationTable::Unicode);

} // namespace palincheck
