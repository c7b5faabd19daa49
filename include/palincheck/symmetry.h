#pragma once

#include "types.h"

#include <iterator>

namespace palincheck {

// Two-index walk from both ends towards the middle. Returns the pair of
// iterators at the first mismatch, or {last, last} if the range mirrors itself.
template <typename BidirIt>
std::pair<BidirIt, BidirIt> find_asymmetry(BidirIt first, BidirIt last) {
    if (first == last) {
        return {last, last};
    }
    BidirIt back = last;
    --back;
    while (first != back) {
        if (!(*first == *back)) {
            return {first, back};
        }
        ++first;
        if (first == back) {
            break;
        }
        --back;
    }
    return {last, last};
}

template <typename BidirIt>
bool is_symmetric(BidirIt first, BidirIt last) {
    return find_asymmetry(first, last).first == last;
}

// Empty and single-character sequences are symmetric
bool is_symmetric(const CharacterSequence& seq);
bool is_symmetric(const CanonicalSequence& seq);

class SymmetryChecker {
public:
    bool operator()(const CharacterSequence& seq) const { return is_symmetric(seq); }

    // Verdict plus the compared sequence and, on failure, the first mismatch
    SymmetryResult check(const CharacterSequence& seq) const;
    SymmetryResult check(const CanonicalSequence& seq) const { return check(seq.chars()); }
};

} // namespace palincheck
