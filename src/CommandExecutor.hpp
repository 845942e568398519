#pragma once

#include "CommandLineParser.hpp"
#include <expected>
#include <iostream>
#include <string>
#include <string_view>

namespace ledger {

class CommandExecutor {
public:
    explicit CommandExecutor(std::ostream& out = std::cout);

    std::expected<void, std::string> execute(const ParsedCommand& cmd);

private:
    std::ostream& out_;

    // Help
    std::expected<void, std::string> executeHelp(const ParsedCommand& cmd);
    void printHelp(std::string_view topic = "");

    // Storage
    std::expected<void, std::string> executeMigrate(const ParsedCommand& cmd);
    std::expected<void, std::string> executeBootstrap(const ParsedCommand& cmd);
};

}  // namespace ledger
