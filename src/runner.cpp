#include "palincheck/runner.h"
#include "palincheck/palindrome.h"
#include "palincheck/report.h"

#include <exception>

namespace palincheck {

bool is_bare_run(const CheckerSettings& settings) {
    return settings.texts.empty() && settings.infile.empty() && !settings.demo;
}

std::vector<std::string> collect_texts(const CheckerSettings& settings) {
    std::vector<std::string> texts = settings.texts;
    if (!settings.infile.empty()) {
        std::vector<std::string> lines = read_lines(settings.infile);
        texts.insert(texts.end(), lines.begin(), lines.end());
    }
    if (settings.demo || is_bare_run(settings)) {
        const auto& demo = demonstration_inputs();
        texts.insert(texts.end(), demo.begin(), demo.end());
    }
    return texts;
}

int run(const CheckerSettings& settings, std::ostream& out, std::ostream& err) {
    std::vector<std::string> texts = collect_texts(settings);
    if (settings.verbose) {
        err << "Collected " << texts.size() << " texts";
        if (!settings.infile.empty()) {
            err << " (including " << settings.infile << ")";
        }
        if (settings.demo || is_bare_run(settings)) {
            err << " (including demonstration inputs)";
        }
        err << std::endl;
    }

    // The explanation is plain prose and would break a JSON report
    bool explain = settings.explain || (is_bare_run(settings) && settings.format == ReportFormat::Text);
    if (explain) {
        out << explanation() << "\n" << std::endl;
    }

    std::vector<PalindromeAnalysis> analyses;
    analyses.reserve(texts.size());
    std::size_t failures = 0;
    for (const auto& text : texts) {
        PalindromeAnalysis analysis = analyze(text, settings.table);
        if (settings.debug) {
            err << "'" << text << "' -> '" << analysis.normalized << "'" << std::endl;
        }
        if (!analysis.palindrome) {
            ++failures;
        }
        analyses.push_back(std::move(analysis));
    }

    write_report(out, analyses, settings.format);

    if (settings.verbose) {
        err << analyses.size() << " texts checked with the " << table_name(settings.table)
            << " table, " << (analyses.size() - failures) << " palindromes" << std::endl;
    }

    if (settings.check && failures > 0) {
        return ExitNotPalindrome;
    }
    return ExitOk;
}

int run_main(int argc, char** argv, std::ostream& out, std::ostream& err) {
    try {
        auto cli_settings = parse_arguments(argc, argv);
        CheckerSettings settings;

        // A profile lives in a settings file, the default one if none was named
        if (!cli_settings.settings_file.empty() || !cli_settings.get("profile").empty()) {
            settings = load_settings(cli_settings);
        } else {
            settings = cli_settings;
        }

        return run(settings, out, err);
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << std::endl;
        return ExitError;
    }
}

} // namespace palincheck
