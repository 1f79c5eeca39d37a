#pragma once
#include <usb-power/Types.hpp>
#include <QDateTime>
#include <QString>
#include <string>
#include <vector>

namespace usb_power {

class RegistryStore;

// Writes EnhancedPowerManagementEnabled for each op, in order. A failing op
// never stops the ones after it. Shared by the direct broker path and the
// elevated helper so both report through the same contract.
std::vector<WriteResult> performWrites(RegistryStore& store,
                                       const std::vector<WriteOp>& operations);

// Logic of the elevated helper process: one request file in, one response
// file out, nothing kept between runs. Ops that do not target a
// Device Parameters key below the enumeration root, or carry a value other
// than 0 or 1, are refused without touching the store.
class ElevatedExecutor {
public:
    explicit ElevatedExecutor(RegistryStore& store, std::string enumerationRoot = {});

    // After the deadline the caller has already reported the batch as
    // unanswered: nothing is started, remaining ops fail as no-response.
    void setDeadline(const QDateTime& deadline);

    // Returns the process exit code (see ExitCodes).
    int run(const QString& requestPath, const QString& responsePath);

    std::vector<WriteResult> execute(const std::vector<WriteOp>& operations);

private:
    bool isPermitted(const WriteOp& op, std::string& why) const;
    bool deadlinePassed() const;

    RegistryStore& m_store;
    std::string m_root;
    QDateTime m_deadline;
};

}
