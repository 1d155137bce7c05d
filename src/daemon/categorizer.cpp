#include "daemon/categorizer.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace tracewatch {

namespace {

const std::set<std::string> kDevProcesses = {
    "code", "code - insiders", "code-oss", "codium", "idea", "idea64",
    "webstorm", "webstorm64", "pycharm", "pycharm64", "clion", "goland",
    "rider", "qtcreator", "kdevelop", "emacs", "vim", "nvim", "gvim",
    "sublime_text", "zed", "windowsterminal", "powershell", "cmd", "wt",
    "terminal", "gnome-terminal-server", "konsole", "alacritty", "kitty",
    "wezterm-gui", "xterm", "tilix",
};

const std::set<std::string> kBrowserProcesses = {
    "chrome", "google-chrome", "chromium", "chromium-browser", "msedge",
    "microsoft-edge", "firefox", "firefox-esr", "brave", "brave-browser",
    "opera", "vivaldi", "vivaldi-bin", "arc", "librewolf",
};

const std::set<std::string> kCommunicationProcesses = {
    "slack", "discord", "teams", "teams-for-linux", "zoom", "skype",
    "thunderbird", "outlook", "telegram", "telegram-desktop", "signal",
    "signal-desktop", "element",
};

const std::set<std::string> kProductivityProcesses = {
    "winword", "excel", "powerpnt", "onenote", "notion", "obsidian", "typora",
    "figma", "acrobat", "acrord32", "soffice.bin", "libreoffice", "evince",
    "okular", "xournalpp", "inkscape", "gimp",
};

const std::set<std::string> kDistractionProcesses = {
    "spotify", "vlc", "wmplayer", "netflix", "steam", "epicgameslauncher",
    "battle.net", "tiktok", "whatsapp", "mpv", "lutris", "heroic",
};

const char *const kResearchPatterns[] = {
    R"(stack\s*overflow)", R"(github\.com)", R"(documentation)", R"(\bdocs\b)",
    R"(pypi\.org)", R"(npmjs\.com)", R"(cppreference)", R"(chatgpt)", R"(claude)",
    R"(google\..*search)",
};

const char *const kDistractionPatterns[] = {
    R"(youtube)", R"(netflix)", R"(twitch\.tv)", R"(\breddit\b)", R"(twitter|x\.com)",
    R"(facebook)", R"(instagram)", R"(discord)",
};

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool containsName(const std::vector<std::string> &names, const std::string &normalized)
{
    return std::any_of(names.begin(), names.end(), [&normalized](const std::string &name) {
        return Categorizer::normalizeProcessName(name) == normalized;
    });
}

bool anyMatch(const std::vector<std::regex> &patterns, const std::string &title)
{
    return std::any_of(patterns.begin(), patterns.end(), [&title](const std::regex &pattern) {
        return std::regex_search(title, pattern);
    });
}

} // namespace

Categorizer::Categorizer()
    : Categorizer(UserRules{})
{
}

Categorizer::Categorizer(const UserRules &rules)
    : m_rules(rules)
{
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    for (const char *pattern : kResearchPatterns) {
        m_researchPatterns.emplace_back(pattern, flags);
    }
    for (const char *pattern : kDistractionPatterns) {
        m_distractionPatterns.emplace_back(pattern, flags);
    }
}

std::string Categorizer::normalizeProcessName(const std::string &appName)
{
    std::string name = toLower(appName);
    const auto first = name.find_first_not_of(" \t");
    const auto last = name.find_last_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    name = name.substr(first, last - first + 1);

    const std::string suffix = ".exe";
    if (name.size() > suffix.size()
        && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        name.erase(name.size() - suffix.size());
    }
    return name;
}

bool Categorizer::isBrowser(const std::string &appName)
{
    return kBrowserProcesses.count(normalizeProcessName(appName)) > 0;
}

bool Categorizer::matchesUserKeyword(const std::vector<std::string> &keywords,
                                     const std::string &lowerTitle) const
{
    return std::any_of(keywords.begin(), keywords.end(), [&lowerTitle](const std::string &kw) {
        return !kw.empty() && lowerTitle.find(toLower(kw)) != std::string::npos;
    });
}

ActivityCategory Categorizer::categorize(const std::string &appName,
                                         const std::string &windowTitle) const
{
    const std::string name = normalizeProcessName(appName);
    const std::string lowerTitle = toLower(windowTitle);

    // User process rules take precedence over the built-in tables.
    if (containsName(m_rules.distractionProcesses, name)) {
        return ActivityCategory::Distraction;
    }
    if (containsName(m_rules.productiveProcesses, name)) {
        return ActivityCategory::Productivity;
    }

    if (kDevProcesses.count(name) > 0) {
        return ActivityCategory::Development;
    }

    if (kBrowserProcesses.count(name) > 0) {
        if (matchesUserKeyword(m_rules.distractionKeywords, lowerTitle)
            || anyMatch(m_distractionPatterns, windowTitle)) {
            return ActivityCategory::Distraction;
        }
        if (matchesUserKeyword(m_rules.productiveKeywords, lowerTitle)
            || anyMatch(m_researchPatterns, windowTitle)) {
            return ActivityCategory::Research;
        }
        return ActivityCategory::Browsing;
    }

    if (kCommunicationProcesses.count(name) > 0) {
        return ActivityCategory::Communication;
    }
    if (kProductivityProcesses.count(name) > 0) {
        return ActivityCategory::Productivity;
    }
    if (kDistractionProcesses.count(name) > 0) {
        return ActivityCategory::Distraction;
    }

    if (matchesUserKeyword(m_rules.distractionKeywords, lowerTitle)) {
        return ActivityCategory::Distraction;
    }
    if (matchesUserKeyword(m_rules.productiveKeywords, lowerTitle)) {
        return ActivityCategory::Productivity;
    }
    return ActivityCategory::Other;
}

} // namespace tracewatch
