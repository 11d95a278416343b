#pragma once
#include <ostream>
#include <string>
#include <vector>

namespace cli {
    // name shown in usage text when argv[0] is unavailable
    extern const char* const kDefaultProgramName;

    void printUsage(std::ostream& out, const std::string& program);
    void printToken(std::ostream& out, const std::string& tenant, const std::string& token);

    // args includes the program name. Expects exactly <tenant> <secret>.
    // Returns process exit status: 0 on success, 1 on bad usage or crypto failure.
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
}
