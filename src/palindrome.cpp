#include "palincheck/palindrome.h"
#include "palincheck/normalizer.h"
#include "palincheck/symmetry.h"
#include "palincheck/unicode_utils.h"

namespace palincheck {

bool is_palindrome(const CharacterSequence& text, ClassificationTable table) {
    return is_symmetric(Normalizer(table).normalize(text));
}

bool is_palindrome(const std::string& text, ClassificationTable table) {
    return is_palindrome(unicode::to_code_points(text), table);
}

bool is_palindrome_exact(const CharacterSequence& text) {
    return is_symmetric(text);
}

bool is_palindrome_exact(const std::string& text) {
    return is_symmetric(unicode::to_code_points(text));
}

PalindromeAnalysis analyze(const std::string& text, ClassificationTable table) {
    CharacterSequence chars = unicode::to_code_points(text);
    CanonicalSequence canonical = Normalizer(table).normalize(chars);

    PalindromeAnalysis analysis;
    analysis.text = text;
    analysis.normalized = canonical.utf8();
    analysis.palindrome = is_symmetric(canonical);
    analysis.exact = is_symmetric(chars);
    return analysis;
}

} // namespace palincheck
