#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcp_relay {

/**
 * @brief How the child server is launched
 *
 * Package runners (npx) print install/progress chatter before the server
 * itself starts, so they get a wider success vocabulary.
 */
enum class LaunchMechanism {
    GENERIC,         // plain executable
    PACKAGE_RUNNER   // npx-style launcher
};

/**
 * @brief Verdict for a single startup output line
 */
enum class ReadinessVerdict {
    READY,      // line contains a success indicator
    FAILED,     // line contains an error indicator
    UNDECIDED   // neither, keep polling
};

/**
 * @brief Ordered keyword tables for one launch mechanism
 */
struct KeywordTable {
    std::vector<std::string_view> success;
    std::vector<std::string_view> error;
};

/**
 * @brief Table-driven startup log classifier
 *
 * Pure functions only; the supervisor feeds it every line the child
 * prints on stdout/stderr while starting.
 */
class ReadinessClassifier {
public:
    /**
     * @brief Detect the launch mechanism from a command line
     *
     * @param command Executable name
     * @param args Argument list
     * @return PACKAGE_RUNNER if the command is npx or any argument mentions npx
     */
    static LaunchMechanism detect_mechanism(const std::string& command,
                                            const std::vector<std::string>& args);

    /**
     * @brief Classify one line of startup output
     *
     * Matching is a case-insensitive substring search. The success table is
     * consulted before the error table.
     *
     * @param line Output line
     * @param mechanism Launch mechanism selecting the keyword table
     * @return READY, FAILED or UNDECIDED
     */
    static ReadinessVerdict classify(std::string_view line, LaunchMechanism mechanism);

    /**
     * @brief Keyword table used for a mechanism
     */
    static const KeywordTable& table_for(LaunchMechanism mechanism);

    static std::string_view to_string(LaunchMechanism mechanism);
    static std::string_view to_string(ReadinessVerdict verdict);
};

} // namespace mcp_relay
