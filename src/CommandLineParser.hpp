#pragma once

#include <boost/program_options.hpp>
#include <expected>
#include <string>
#include <vector>

namespace po = boost::program_options;

namespace ledger {

struct ParsedCommand {
    std::string command;
    po::variables_map options;
    std::vector<std::string> positional;
};

class CommandLineParser {
public:
    CommandLineParser() = default;

    std::expected<ParsedCommand, std::string> parse(int argc, char* argv[]);

    po::options_description createMigrateOptions();
    po::options_description createBootstrapOptions();
};

}  // namespace ledger
