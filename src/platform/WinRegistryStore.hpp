#pragma once
#include "../core/RegistryStore.hpp"

namespace usb_power {

// RegistryStore over HKEY_LOCAL_MACHINE through the Win32 registry API.
class WinRegistryStore : public RegistryStore {
public:
    WinRegistryStore() = default;

    std::vector<std::string> subKeys(const std::string& path) const override;
    std::optional<std::string> readString(const std::string& path,
                                          const std::string& name) const override;
    std::optional<uint32_t> readDword(const std::string& path,
                                      const std::string& name) const override;
    void writeDword(const std::string& path, const std::string& name, uint32_t value) override;
    bool canWrite(const std::string& path) const override;
};

}
