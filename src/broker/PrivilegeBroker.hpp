#pragma once
#include <usb-power/Types.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <variant>
#include <vector>

namespace usb_power {

class RegistryStore;
class ElevationLauncher;

struct DirectWrite {};
struct ElevatedWrite {};

// Resolved once per batch; both alternatives report through WriteResult.
using WriteStrategy = std::variant<DirectWrite, ElevatedWrite>;

class PrivilegeBroker {
public:
    using PrivilegeCheck = std::function<bool()>;
    using ConsentHandler = std::function<bool(size_t operationCount)>;

    PrivilegeBroker(RegistryStore& store, std::unique_ptr<ElevationLauncher> launcher);
    ~PrivilegeBroker();

    // Defaults to isProcessElevated().
    void setPrivilegeCheck(PrivilegeCheck check);
    // Asked before every elevation; no handler means consent is given.
    void setConsentHandler(ConsentHandler handler);
    void setTimeout(std::chrono::milliseconds timeout);
    std::chrono::milliseconds timeout() const;

    WriteStrategy selectStrategy(const std::vector<WriteOp>& operations) const;

    // Blocks until every op has an outcome; returns one result per op, in
    // order. Calls are serialized: one elevation round-trip at a time.
    std::vector<WriteResult> requestWrite(const std::vector<WriteOp>& operations);

private:
    std::vector<WriteResult> writeDirect(const std::vector<WriteOp>& operations);
    std::vector<WriteResult> writeElevated(const std::vector<WriteOp>& operations);

    class Private;
    std::unique_ptr<Private> d;
};

}
