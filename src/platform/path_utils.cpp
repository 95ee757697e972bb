#include "debpack/path_utils.hpp"
#include "debpack/platform.hpp"

#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace debpack {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

} // namespace

const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::Empty: return "path is empty";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::EscapesRoot: return "path escapes staging root";
    }
    return "unknown";
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split(to_portable_path(relative_path), '/')) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    if (normalized.empty()) {
        return {false, {}, PathError::Empty};
    }

    std::filesystem::path p(root);
    for (const auto& c : normalized) {
        p /= c;
    }
    return {true, to_portable_path(p.lexically_normal().string()), PathError::None};
}

} // namespace debpack
