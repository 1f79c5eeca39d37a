#include "RegistryStore.hpp"
#include <algorithm>
#include <cctype>

namespace usb_power {

RegistryError::RegistryError(Code code, const std::string& path, const std::string& message, long status)
    : std::runtime_error(message + (path.empty() ? "" : ": " + path))
    , m_code(code)
    , m_path(path)
    , m_status(status) {
}

namespace registry_path {

std::string join(const std::string& parent, const std::string& child) {
    if (parent.empty()) return child;
    if (child.empty()) return parent;
    return parent + "\\" + child;
}

std::string parent(const std::string& path) {
    auto pos = path.find_last_of('\\');
    if (pos == std::string::npos) return "";
    return path.substr(0, pos);
}

std::string leaf(const std::string& path) {
    auto pos = path.find_last_of('\\');
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

std::vector<std::string> split(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '\\') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

bool isUnder(const std::string& path, const std::string& root) {
    auto pathParts = split(path);
    auto rootParts = split(root);
    if (pathParts.size() <= rootParts.size()) return false;

    for (size_t i = 0; i < rootParts.size(); ++i) {
        if (!equalsIgnoreCase(pathParts[i], rootParts[i])) return false;
    }
    // Reject traversal-looking components
    for (const auto& part : pathParts) {
        if (part == "." || part == "..") return false;
    }
    return true;
}

} // namespace registry_path

} // namespace usb_power
