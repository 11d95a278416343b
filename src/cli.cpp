#include "cli.h"
#include "token_generator.h"

#include <stdexcept>

namespace cli {

const char* const kDefaultProgramName = "generate-token";

// example request targets the log ingestion service on its default port
static const char* const kIngestUrl = "http://localhost:8080/logs";
static const char* const kIngestContentType = "application/x-ndjson";
static const char* const kExamplePayload = "example-log.jsonl";

void printUsage(std::ostream& out, const std::string& program) {
    out << "Usage: " << program << " <tenant> <secret>\n"
        << "\n"
        << "Example:\n"
        << "  " << program << " amba my-secret-key\n";
}

void printToken(std::ostream& out, const std::string& tenant, const std::string& token) {
    out << "Tenant: " << tenant << "\n"
        << "Token:  " << token << "\n"
        << "\n"
        << "Use in Authorization header:\n"
        << "  Authorization: Bearer " << token << "\n"
        << "\n"
        << "Example curl command:\n"
        << "  curl -X POST \"" << kIngestUrl << "?tenant=" << tenant << "\" \\\n"
        << "    -H \"Authorization: Bearer " << token << "\" \\\n"
        << "    -H \"Content-Type: " << kIngestContentType << "\" \\\n"
        << "    --data-binary @" << kExamplePayload << "\n";
}

int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.size() != 3) {
        printUsage(out, args.empty() ? kDefaultProgramName : args[0]);
        return 1;
    }

    const std::string& tenant = args[1];
    const std::string& secret = args[2];

    std::string tok;
    try {
        tok = token::generateToken(tenant, secret);
    } catch (const std::runtime_error& e) {
        err << "token generation failed: " << e.what() << "\n";
        return 1;
    }

    printToken(out, tenant, tok);
    out.flush();
    return 0;
}

}
