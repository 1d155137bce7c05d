#pragma once

#include <regex>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/enums.hpp"

namespace tracewatch {

// Rule-based mapping of (process name, window title) to an activity
// category. Process names are compared lowercased with any ".exe" suffix
// removed, so Linux and Windows spellings share one table.
class Categorizer {
public:
    Categorizer();
    explicit Categorizer(const UserRules &rules);

    ActivityCategory categorize(const std::string &appName,
                                const std::string &windowTitle) const;

    static std::string normalizeProcessName(const std::string &appName);
    static bool isBrowser(const std::string &appName);

private:
    bool matchesUserKeyword(const std::vector<std::string> &keywords,
                            const std::string &lowerTitle) const;

    UserRules m_rules;
    std::vector<std::regex> m_researchPatterns;
    std::vector<std::regex> m_distractionPatterns;
};

} // namespace tracewatch
