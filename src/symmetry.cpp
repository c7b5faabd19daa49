#include "palincheck/symmetry.h"

namespace palincheck {

bool is_symmetric(const CharacterSequence& seq) {
    if (seq.size() < 2) {
        return true;
    }
    std::size_t left = 0;
    std::size_t right = seq.size() - 1;
    while (left < right) {
        if (seq[left] != seq[right]) {
            return false;
        }
        ++left;
        --right;
    }
    return true;
}

bool is_symmetric(const CanonicalSequence& seq) {
    return is_symmetric(seq.chars());
}

SymmetryResult SymmetryChecker::check(const CharacterSequence& seq) const {
    SymmetryResult result;
    result.compared = seq;
    auto mismatch = find_asymmetry(seq.begin(), seq.end());
    if (mismatch.first != seq.end()) {
        result.symmetric = false;
        result.first_mismatch = static_cast<std::size_t>(mismatch.first - seq.begin());
    }
    return result;
}

} // namespace palincheck
