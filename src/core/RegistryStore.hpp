#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace usb_power {

class RegistryError : public std::runtime_error {
public:
    enum class Code {
        AccessDenied,
        NotFound,
        IoError
    };

    RegistryError(Code code, const std::string& path, const std::string& message, long status = 0);

    Code code() const { return m_code; }
    const std::string& path() const { return m_path; }
    long status() const { return m_status; }

private:
    Code m_code;
    std::string m_path;
    long m_status;
};

// Hierarchical key/value store holding device configuration. Paths are
// backslash separated and relative to the store's hive.
class RegistryStore {
public:
    virtual ~RegistryStore() = default;

    // Throws RegistryError when the key cannot be opened for reading.
    virtual std::vector<std::string> subKeys(const std::string& path) const = 0;

    // Empty when the value is absent, unreadable or of another type.
    virtual std::optional<std::string> readString(const std::string& path,
                                                  const std::string& name) const = 0;
    virtual std::optional<uint32_t> readDword(const std::string& path,
                                              const std::string& name) const = 0;

    // Throws RegistryError on failure.
    virtual void writeDword(const std::string& path, const std::string& name, uint32_t value) = 0;

    // Whether the current process may set values on the key without elevation.
    virtual bool canWrite(const std::string& path) const = 0;
};

namespace registry_path {
    std::string join(const std::string& parent, const std::string& child);
    std::string parent(const std::string& path);
    std::string leaf(const std::string& path);
    std::vector<std::string> split(const std::string& path);
    bool equalsIgnoreCase(const std::string& a, const std::string& b);
    // True when path lies strictly below root.
    bool isUnder(const std::string& path, const std::string& root);
}

}
