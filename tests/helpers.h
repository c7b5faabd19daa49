#ifndef PALINCHECK_TESTS_HELPERS_H
#define PALINCHECK_TESTS_HELPERS_H

#include "palincheck/settings.h"
#include "palincheck/runner.h"

#include <ostream>

#include <string>
#include <vector>

inline palincheck::CheckerSettings parse(std::vector<std::string> args)
{
    args.insert(args.begin(), "palincheck");
    std::vector<char*> argv;
    for (std::string& a : args) {
        argv.push_back(&a[0]);
    }
    return palincheck::parse_arguments(static_cast<int>(argv.size()), argv.data());
}

inline int run_cli(std::vector<std::string> args, std::ostream& out, std::ostream& err)
{
    args.insert(args.begin(), "palincheck");
    std::vector<char*> argv;
    for (std::string& a : args) {
        argv.push_back(&a[0]);
    }
    return palincheck::run_main(static_cast<int>(argv.size()), argv.data(), out, err);
}

inline std::string testfile(const std::string& name)
{
    return std::string(TESTFILES_DIRECTORY) + "/" + name;
}

#endif // PALINCHECK_TESTS_HELPERS_H
