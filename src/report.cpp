#include "palincheck/report.h"
#include "palincheck/unicode_utils.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace palincheck {

namespace {

const char* py_bool(bool value) {
    return value ? "True" : "False";
}

} // namespace

ReportFormat parse_format(const std::string& name) {
    if (name == "text") {
        return ReportFormat::Text;
    }
    if (name == "json") {
        return ReportFormat::Json;
    }
    throw std::invalid_argument("Unknown report format: " + name + " (expected text or json)");
}

const std::vector<std::string>& demonstration_inputs() {
    static const std::vector<std::string> inputs = {
        "racecar",
        "A man a plan a canal Panama",
        "race a car",
        "Madam",
        "Was it a car or a cat I saw?",
        "hello world",
        "12321",
        "12345",
    };
    return inputs;
}

std::string explanation() {
    return
        "PALINDROMES IN ENGLISH LANGUAGE\n"
        "===============================\n"
        "\n"
        "A palindrome is a word, phrase or sentence that reads the same forwards\n"
        "and backwards. The term comes from the Greek 'palin' (again) and\n"
        "'dromos' (way, direction).\n"
        "\n"
        "Types of Palindromes:\n"
        "\n"
        "1. Single Words:\n"
        "   - racecar, level, radar, civic, rotor\n"
        "\n"
        "2. Phrases (ignoring spaces and punctuation):\n"
        "   - \"A man a plan a canal Panama\"\n"
        "   - \"Madam, I'm Adam\"\n"
        "   - \"Was it a car or a cat I saw?\"\n"
        "\n"
        "3. Names:\n"
        "   - Hannah, Otto, Ada\n"
        "\n"
        "4. Numbers:\n"
        "   - 12321, 1001, 7337\n"
        "\n"
        "Palindromes show the playful side of language and turn up in wordplay,\n"
        "literature and puzzles, where they test our sense of symmetry in\n"
        "written text.\n";
}

void write_text_report(std::ostream& out, const std::vector<PalindromeAnalysis>& analyses) {
    out << "Palindrome Analysis Results:\n";
    out << std::string(50, '=') << "\n";
    for (const auto& analysis : analyses) {
        out << "Text: '" << analysis.text << "'\n";
        out << "  Advanced check (ignoring case/punctuation): " << py_bool(analysis.palindrome) << "\n";
        out << "  Simple check (exact matching): " << py_bool(analysis.exact) << "\n";
        if (analysis.palindrome) {
            out << "  Cleaned version: '" << analysis.normalized << "'\n";
        }
        out << std::string(30, '-') << "\n";
    }
}

void write_json_report(std::ostream& out, const std::vector<PalindromeAnalysis>& analyses) {
    nlohmann::json root = nlohmann::json::array();
    for (const auto& analysis : analyses) {
        nlohmann::json item;
        // dump() throws on invalid UTF-8
        item["text"] = unicode::sanitize_utf8(analysis.text);
        item["normalized"] = analysis.normalized;
        item["palindrome"] = analysis.palindrome;
        item["exact"] = analysis.exact;
        root.push_back(std::move(item));
    }
    out << root.dump(2) << "\n";
}

void write_report(std::ostream& out, const std::vector<PalindromeAnalysis>& analyses, ReportFormat format) {
    if (format == ReportFormat::Json) {
        write_json_report(out, analyses);
    } else {
        write_text_report(out, analyses);
    }
}

} // namespace palincheck
