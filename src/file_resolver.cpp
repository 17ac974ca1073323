#include "file_resolver.hpp"
#include "verbose.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <regex>
#include <pwd.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace incfile {

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    size_t slash = path.find('/');
    std::string user = path.substr(1, slash == std::string::npos ? std::string::npos : slash - 1);
    std::string rest = slash == std::string::npos ? "" : path.substr(slash);

    std::string home;
    if (user.empty()) {
        const char* env = std::getenv("HOME");
        if (env && *env) {
            home = env;
        } else if (const passwd* pw = getpwuid(getuid())) {
            home = pw->pw_dir;
        }
    } else if (const passwd* pw = getpwnam(user.c_str())) {
        home = pw->pw_dir;
    }

    if (home.empty()) {
        return path;
    }
    // Avoid a double slash when home is "/".
    if (!rest.empty() && home.back() == '/') {
        home.pop_back();
    }
    return home + rest;
}

bool is_glob_pattern(const std::string& pattern) {
    return pattern.find('*') != std::string::npos ||
           pattern.find('?') != std::string::npos ||
           pattern.find('[') != std::string::npos;
}

std::string glob_to_regex(const std::string& glob, bool recursive) {
    // Wildcards at the start of a component never match hidden entries.
    static const std::string NOT_HIDDEN = "(?!\\.)";
    std::string regex;
    regex.reserve(glob.size() * 2);

    size_t i = 0;
    while (i < glob.size()) {
        char c = glob[i];
        bool component_start = (i == 0 || glob[i - 1] == '/');

        if (c == '*') {
            bool double_star = i + 1 < glob.size() && glob[i + 1] == '*';
            if (double_star && recursive && component_start) {
                if (i + 2 < glob.size() && glob[i + 2] == '/') {
                    // **/ matches zero or more directories
                    regex += "(?:" + NOT_HIDDEN + "[^/]*/)*";
                    i += 3;
                } else {
                    regex += NOT_HIDDEN + "[^/]*(?:/" + NOT_HIDDEN + "[^/]*)*";
                    i += 2;
                }
                continue;
            }
            // * (and ** when not recursive) stays within one component
            if (component_start) {
                regex += NOT_HIDDEN;
            }
            regex += "[^/]*";
            i += double_star ? 2 : 1;
        } else if (c == '?') {
            regex += component_start ? "[^/.]" : "[^/]";
            i++;
        } else if (c == '[' && glob.find(']', i + 2) != std::string::npos) {
            // Character class; "[!...]" negates
            regex += '[';
            i++;
            if (glob[i] == '!') {
                regex += '^';
                i++;
            }
            // A leading ']' is part of the class
            if (glob[i] == ']') {
                regex += "\\]";
                i++;
            }
            while (i < glob.size() && glob[i] != ']') {
                if (glob[i] == '\\' || glob[i] == '[') {
                    regex += '\\';
                }
                regex += glob[i];
                i++;
            }
            regex += ']';
            i++;
        } else if (c == '.' || c == '(' || c == ')' || c == '{' || c == '}' ||
                   c == '+' || c == '|' || c == '^' || c == '$' || c == '\\' ||
                   c == '[' || c == ']') {
            // Escape regex special characters
            regex += '\\';
            regex += c;
            i++;
        } else {
            regex += c;
            i++;
        }
    }

    return "^" + regex + "$";
}

std::vector<std::string> expand_glob(const std::string& pattern, bool recursive) {
    std::vector<std::string> matches;
    std::error_code ec;

    if (!is_glob_pattern(pattern)) {
        if (fs::exists(pattern, ec)) {
            matches.push_back(pattern);
        }
        return matches;
    }

    // Split into the literal leading directory and the wildcard remainder.
    fs::path base;
    std::string glob_part;
    size_t glob_depth = 0;
    bool deep = false;
    for (const auto& component : fs::path(pattern)) {
        std::string comp_str = component.string();
        if (comp_str.empty()) {
            continue;
        }
        if (glob_depth == 0 && !is_glob_pattern(comp_str)) {
            base /= component;
            continue;
        }
        if (!glob_part.empty()) {
            glob_part += '/';
        }
        glob_part += comp_str;
        ++glob_depth;
        if (recursive && comp_str == "**") {
            deep = true;
        }
    }

    fs::path base_dir = base.empty() ? fs::path(".") : base;
    if (!fs::is_directory(base_dir, ec)) {
        return matches;
    }

    std::regex re;
    try {
        re = std::regex(glob_to_regex(glob_part, recursive));
    } catch (const std::regex_error& e) {
        verbose_err("GLOB", "Invalid pattern " + pattern + ": " + e.what());
        return matches;
    }

    verbose_log("GLOB", "Walking " + base_dir.string() + " for " + glob_part);

    try {
        auto it = fs::recursive_directory_iterator(
            base_dir, fs::directory_options::skip_permission_denied);
        for (; it != fs::recursive_directory_iterator(); ++it) {
            size_t depth = static_cast<size_t>(it.depth()) + 1;
            if (!deep && depth >= glob_depth) {
                it.disable_recursion_pending();
            }
            if (!deep && depth != glob_depth) {
                continue;
            }

            std::string rel = it->path().lexically_relative(base_dir).generic_string();
            if (std::regex_match(rel, re)) {
                matches.push_back(base.empty() ? rel : (base / rel).string());
            }
        }
    } catch (const fs::filesystem_error& e) {
        // Skip directories we can't access
        verbose_err("GLOB", e.what());
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

} // namespace incfile
