#include "WinRegistryStore.hpp"
#include <QString>
#include <windows.h>
#include <vector>

namespace usb_power {

namespace {

std::wstring toWide(const std::string& text) {
    return QString::fromStdString(text).toStdWString();
}

std::string fromWide(const wchar_t* text, size_t length) {
    return QString::fromWCharArray(text, static_cast<int>(length)).toStdString();
}

RegistryError::Code codeFor(LSTATUS status) {
    switch (status) {
        case ERROR_ACCESS_DENIED:  return RegistryError::Code::AccessDenied;
        case ERROR_FILE_NOT_FOUND:
        case ERROR_PATH_NOT_FOUND: return RegistryError::Code::NotFound;
        default:                   return RegistryError::Code::IoError;
    }
}

// Owns an open HKEY.
class KeyHandle {
public:
    KeyHandle() = default;
    ~KeyHandle() {
        if (m_key) {
            RegCloseKey(m_key);
        }
    }
    KeyHandle(const KeyHandle&) = delete;
    KeyHandle& operator=(const KeyHandle&) = delete;

    LSTATUS open(const std::string& path, REGSAM access) {
        return RegOpenKeyExW(HKEY_LOCAL_MACHINE, toWide(path).c_str(), 0, access, &m_key);
    }

    HKEY get() const { return m_key; }

private:
    HKEY m_key{nullptr};
};

}

std::vector<std::string> WinRegistryStore::subKeys(const std::string& path) const {
    KeyHandle key;
    LSTATUS status = key.open(path, KEY_READ);
    if (status != ERROR_SUCCESS) {
        throw RegistryError(codeFor(status), path, "RegOpenKeyExW failed", status);
    }

    std::vector<std::string> result;
    std::vector<wchar_t> name(256);  // registry key names are limited to 255 chars
    for (DWORD index = 0;; ++index) {
        DWORD length = static_cast<DWORD>(name.size());
        status = RegEnumKeyExW(key.get(), index, name.data(), &length,
                               nullptr, nullptr, nullptr, nullptr);
        if (status == ERROR_NO_MORE_ITEMS) {
            break;
        }
        if (status != ERROR_SUCCESS) {
            throw RegistryError(codeFor(status), path, "RegEnumKeyExW failed", status);
        }
        result.push_back(fromWide(name.data(), length));
    }
    return result;
}

std::optional<std::string> WinRegistryStore::readString(const std::string& path,
                                                        const std::string& name) const {
    KeyHandle key;
    if (key.open(path, KEY_QUERY_VALUE) != ERROR_SUCCESS) {
        return std::nullopt;
    }

    std::wstring valueName = toWide(name);
    DWORD type = 0;
    DWORD size = 0;
    if (RegQueryValueExW(key.get(), valueName.c_str(), nullptr, &type, nullptr, &size) != ERROR_SUCCESS ||
        (type != REG_SZ && type != REG_EXPAND_SZ)) {
        return std::nullopt;
    }

    std::vector<wchar_t> buffer(size / sizeof(wchar_t) + 1, L'\0');
    DWORD actual = static_cast<DWORD>(buffer.size() * sizeof(wchar_t));
    if (RegQueryValueExW(key.get(), valueName.c_str(), nullptr, &type,
                         reinterpret_cast<LPBYTE>(buffer.data()), &actual) != ERROR_SUCCESS) {
        return std::nullopt;
    }

    // Stored strings are not guaranteed to be terminated
    size_t length = actual / sizeof(wchar_t);
    while (length > 0 && buffer[length - 1] == L'\0') {
        --length;
    }
    return fromWide(buffer.data(), length);
}

std::optional<uint32_t> WinRegistryStore::readDword(const std::string& path,
                                                    const std::string& name) const {
    KeyHandle key;
    if (key.open(path, KEY_QUERY_VALUE) != ERROR_SUCCESS) {
        return std::nullopt;
    }

    DWORD type = 0;
    DWORD data = 0;
    DWORD size = sizeof(data);
    LSTATUS status = RegQueryValueExW(key.get(), toWide(name).c_str(), nullptr, &type,
                                      reinterpret_cast<LPBYTE>(&data), &size);
    if (status != ERROR_SUCCESS || type != REG_DWORD || size != sizeof(data)) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(data);
}

void WinRegistryStore::writeDword(const std::string& path, const std::string& name, uint32_t value) {
    KeyHandle key;
    LSTATUS status = key.open(path, KEY_SET_VALUE | KEY_QUERY_VALUE);
    if (status != ERROR_SUCCESS) {
        throw RegistryError(codeFor(status), path, "RegOpenKeyExW failed", status);
    }

    DWORD data = value;
    status = RegSetValueExW(key.get(), toWide(name).c_str(), 0, REG_DWORD,
                            reinterpret_cast<const BYTE*>(&data), sizeof(data));
    if (status != ERROR_SUCCESS) {
        throw RegistryError(codeFor(status), path, "RegSetValueExW failed", status);
    }
}

bool WinRegistryStore::canWrite(const std::string& path) const {
    KeyHandle key;
    return key.open(path, KEY_SET_VALUE) == ERROR_SUCCESS;
}

} // namespace usb_power
