#pragma once

#include "types.h"

#include <ostream>
#include <string>
#include <vector>

namespace palincheck {

enum class ReportFormat {
    Text,
    Json
};

// Throws std::invalid_argument on an unknown name
ReportFormat parse_format(const std::string& name);

// Sample inputs covering words, phrases and numbers
const std::vector<std::string>& demonstration_inputs();

// Short explanatory text on palindromes
std::string explanation();

// "Palindrome Analysis Results:" listing; the cleaned version is only
// printed for texts that pass the normalized check
void write_text_report(std::ostream& out, const std::vector<PalindromeAnalysis>& analyses);

// JSON array of {text, normalized, palindrome, exact}
void write_json_report(std::ostream& out, const std::vector<PalindromeAnalysis>& analyses);

void write_report(std::ostream& out, const std::vector<PalindromeAnalysis>& analyses, ReportFormat format);

} // namespace palincheck
