#include "ReadinessClassifier.hpp"
#include <algorithm>
#include <cctype>

namespace mcp_relay {

namespace {

const KeywordTable& generic_table() {
    static const KeywordTable table{
        {"ready", "started", "listening", "server running", "mcp server",
         "initialized", "connected", "installed"},
        {"error", "failed", "exception", "crash", "exit", "not found",
         "command failed", "npm error"}
    };
    return table;
}

const KeywordTable& package_runner_table() {
    static const KeywordTable table{
        {"ready", "started", "listening", "server running", "server is running",
         "server is ready", "server started", "mcp server", "initialized",
         "connected", "package installed", "npm", "node_modules", "successfully",
         "running on", "ready to accept connections", "mcp server is running",
         "mcp server is ready", "installed"},
        {"error", "failed", "exception", "crash", "exit", "not found",
         "command failed", "npm error"}
    };
    return table;
}

bool contains_any(const std::string& haystack, const std::vector<std::string_view>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

} // namespace

LaunchMechanism ReadinessClassifier::detect_mechanism(const std::string& command,
                                                      const std::vector<std::string>& args) {
    if (command == "npx") {
        return LaunchMechanism::PACKAGE_RUNNER;
    }

    for (const auto& arg : args) {
        if (arg.find("npx") != std::string::npos) {
            return LaunchMechanism::PACKAGE_RUNNER;
        }
    }

    return LaunchMechanism::GENERIC;
}

ReadinessVerdict ReadinessClassifier::classify(std::string_view line, LaunchMechanism mechanism) {
    std::string lower(line);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    const auto& table = table_for(mechanism);

    if (contains_any(lower, table.success)) {
        return ReadinessVerdict::READY;
    }
    if (contains_any(lower, table.error)) {
        return ReadinessVerdict::FAILED;
    }
    return ReadinessVerdict::UNDECIDED;
}

const KeywordTable& ReadinessClassifier::table_for(LaunchMechanism mechanism) {
    switch (mechanism) {
        case LaunchMechanism::PACKAGE_RUNNER:
            return package_runner_table();
        case LaunchMechanism::GENERIC:
        default:
            return generic_table();
    }
}

std::string_view ReadinessClassifier::to_string(LaunchMechanism mechanism) {
    switch (mechanism) {
        case LaunchMechanism::PACKAGE_RUNNER:
            return "package_runner";
        case LaunchMechanism::GENERIC:
        default:
            return "generic";
    }
}

std::string_view ReadinessClassifier::to_string(ReadinessVerdict verdict) {
    switch (verdict) {
        case ReadinessVerdict::READY:
            return "ready";
        case ReadinessVerdict::FAILED:
            return "failed";
        case ReadinessVerdict::UNDECIDED:
        default:
            return "undecided";
    }
}

} // namespace mcp_relay
