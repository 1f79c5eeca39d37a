#pragma once
#include "RegistryStore.hpp"
#include <QJsonObject>
#include <QString>
#include <memory>

namespace usb_power {

// Registry image kept as JSON. Every key is an object with optional "keys",
// "values", "readable" and "writable" members; the document root is the hive
// root. String values map to REG_SZ, integral numbers to REG_DWORD. Key names
// match case-insensitively.
//
// A file-backed store re-reads the file on every call so that writes made by
// another process (the elevated helper) are visible to the next read.
//
// "writable": false plays the part of a key ACL that only an administrator
// passes. Opened with Access::Administrator, as the elevated helper does,
// the store writes such keys; file system permissions on the image still
// apply and surface as AccessDenied.
class JsonRegistryStore : public RegistryStore {
public:
    enum class Access {
        User,
        Administrator
    };

    explicit JsonRegistryStore(const QString& filePath, Access access = Access::User);
    explicit JsonRegistryStore(const QJsonObject& image, Access access = Access::User);
    ~JsonRegistryStore() override;

    std::vector<std::string> subKeys(const std::string& path) const override;
    std::optional<std::string> readString(const std::string& path,
                                          const std::string& name) const override;
    std::optional<uint32_t> readDword(const std::string& path,
                                      const std::string& name) const override;
    void writeDword(const std::string& path, const std::string& name, uint32_t value) override;
    bool canWrite(const std::string& path) const override;

    QString filePath() const;

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
