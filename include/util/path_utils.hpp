#pragma once

#include <cctype>
#include <string>
#include <string_view>

namespace fwbundle {

// Normalize a manifest/archive path to a clean relative form:
// - strip leading "./"
// - collapse duplicate slashes
// Absolute paths are kept absolute so the path policy can reject them.
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// Trim, then replace every whitespace run with a single '_'. Path separators
// become '_' as well, so the result is a single file name component.
inline std::string SanitizeReleaseName(std::string_view name) {
    std::string out;
    bool pending_ws = false;
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_ws = true;
            continue;
        }
        if (pending_ws && !out.empty()) out.push_back('_');
        pending_ws = false;
        out.push_back(c == '/' || c == '\\' ? '_' : c);
    }
    return out;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace fwbundle
