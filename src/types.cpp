#include "palincheck/types.h"
#include "palincheck/unicode_utils.h"

#include <stdexcept>

namespace palincheck {

std::string table_name(ClassificationTable table) {
    switch (table) {
        case ClassificationTable::Ascii:
            return "ascii";
        case ClassificationTable::Unicode:
            break;
    }
    return "unicode";
}

ClassificationTable parse_table(const std::string& name) {
    if (name == "unicode") {
        return ClassificationTable::Unicode;
    }
    if (name == "ascii") {
        return ClassificationTable::Ascii;
    }
    throw std::invalid_argument("Unknown classification table: " + name + " (expected unicode or ascii)");
}

std::string CanonicalSequence::utf8() const {
    return unicode::from_code_points(chars_);
}

} // namespace palincheck
