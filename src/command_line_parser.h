#pragma once

#include <map>
#include <string>
#include <vector>

#include "config.h"

namespace rls {

class CommandLineParser {
public:
    // Exits through CLI11 on --help, --version and invalid arguments.
    Config Parse(int argc, char** argv) const;

    // Same as Parse, but lets CLI::ParseError escape. `args` excludes the
    // program name.
    Config ParseArguments(const std::vector<std::string>& args) const;

    static const std::map<std::string, SortField>& SortKeyMap();

private:
    Config Run(const std::vector<std::string>& args, bool exit_on_error) const;
};

}  // namespace rls
