#pragma once

#include "types.h"
#include "report.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace palincheck {

struct CheckerSettings {
    std::unordered_map<std::string, std::string> options;
    std::vector<std::string> texts;  // Positional arguments
    std::string infile;
    std::string settings_file;
    ClassificationTable table = ClassificationTable::Unicode;
    ReportFormat format = ReportFormat::Text;
    bool demo = false;
    bool explain = false;
    bool check = false;  // Non-zero exit status if any text fails
    bool verbose = false;
    bool debug = false;

    std::string get(const std::string& key, const std::string& fallback = "") const;
    bool get_bool(const std::string& key, bool fallback) const;
};

// --key=value and --key options; anything else is a text to analyze
CheckerSettings parse_arguments(int argc, char** argv);

// Merge <palincheck><options .../></palincheck> from base.settings_file
// underneath the options already set in base
CheckerSettings load_settings(const CheckerSettings& base);

// Non-empty lines of a UTF-8 file, trailing \r stripped
std::vector<std::string> read_lines(const std::string& path);

} // namespace palincheck
