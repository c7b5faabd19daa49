#include "palincheck/settings.h"

#include <pugixml.hpp>

#include <fstream>
#include <stdexcept>

namespace palincheck {

std::string CheckerSettings::get(const std::string& key, const std::string& fallback) const {
    auto it = options.find(key);
    return it == options.end() ? fallback : it->second;
}

bool CheckerSettings::get_bool(const std::string& key, bool fallback) const {
    auto it = options.find(key);
    if (it == options.end()) {
        return fallback;
    }
    const std::string& val = it->second;
    return val == "1" || val == "true" || val == "TRUE" || val == "yes";
}

namespace {

void push_option(CheckerSettings& settings, const std::string& key, const std::string& value) {
    settings.options[key] = value;
    if (key == "infile") {
        settings.infile = value;
    } else if (key == "settings") {
        settings.settings_file = value;
    } else if (key == "table") {
        settings.table = parse_table(value);
    } else if (key == "format") {
        settings.format = parse_format(value);
    } else if (key == "demo") {
        settings.demo = settings.get_bool(key, false);
    } else if (key == "explain") {
        settings.explain = settings.get_bool(key, false);
    } else if (key == "check") {
        settings.check = settings.get_bool(key, false);
    } else if (key == "verbose") {
        settings.verbose = settings.get_bool(key, false);
    } else if (key == "debug") {
        settings.debug = settings.get_bool(key, false);
    }
}

// Command-line values win over the settings file
void push_default(CheckerSettings& settings, const std::string& key, const std::string& value) {
    if (settings.options.count(key) != 0) {
        return;
    }
    push_option(settings, key, value);
}

} // namespace

CheckerSettings parse_arguments(int argc, char** argv) {
    CheckerSettings settings;
    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (options_done || arg.rfind("--", 0) != 0) {
            settings.texts.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }
        std::size_t eq = arg.find('=');
        if (eq == std::string::npos) {
            std::string key = arg.substr(2);
            push_option(settings, key, "1");
        } else {
            std::string key = arg.substr(2, eq - 2);
            std::string value = arg.substr(eq + 1);
            push_option(settings, key, value);
        }
    }
    return settings;
}

CheckerSettings load_settings(const CheckerSettings& base) {
    CheckerSettings combined = base;
    std::string settings_path = base.settings_file.empty() ? "./Resources/settings.xml" : base.settings_file;

    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_file(settings_path.c_str());
    if (!parsed) {
        throw std::runtime_error("Failed to load settings file: " + settings_path + " (" + parsed.description() + ")");
    }

    pugi::xml_node root = doc.child("palincheck");
    if (!root) {
        throw std::runtime_error("Settings file has no <palincheck> root: " + settings_path);
    }

    // A named profile if one was asked for, otherwise the first one
    const std::string profile = base.get("profile");
    pugi::xml_node selected;
    for (pugi::xml_node item : root.child("profiles").children("item")) {
        if (profile.empty() || profile == item.attribute("name").value()) {
            selected = item;
            break;
        }
    }
    if (!profile.empty() && !selected) {
        throw std::runtime_error("No profile named '" + profile + "' in " + settings_path);
    }

    if (selected) {
        for (const auto& attr : selected.attributes()) {
            if (std::string(attr.name()) == "name") {
                continue;
            }
            push_default(combined, attr.name(), attr.value());
        }
    }
    for (const auto& attr : root.child("options").attributes()) {
        push_default(combined, attr.name(), attr.value());
    }

    return combined;
}

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (lines.empty() && line.rfind("\xEF\xBB\xBF", 0) == 0) {
            line.erase(0, 3);
        }
        if (!line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

} // namespace palincheck
