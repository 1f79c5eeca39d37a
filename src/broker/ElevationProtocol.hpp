#pragma once
#include <usb-power/Types.hpp>
#include <QByteArray>
#include <QString>
#include <optional>
#include <vector>

namespace usb_power {
namespace protocol {

// Request:  {"version":1,"attribute":"EnhancedPowerManagementEnabled",
//            "operations":[{"path":"...","value":0}, ...]}
// Response: {"version":1,"results":[{"path":"...","value":0,
//            "outcome":"succeeded"|"failed","reason":"...","message":"..."}, ...]}

QByteArray encodeRequest(const std::vector<WriteOp>& operations);
std::optional<std::vector<WriteOp>> decodeRequest(const QByteArray& payload);

QByteArray encodeResponse(const std::vector<WriteResult>& results);
std::optional<std::vector<WriteResult>> decodeResponse(const QByteArray& payload);

// Pairs each submitted op with the report entry at the same position when
// path and value agree. Ops without a matching entry are Failed(no-response).
std::vector<WriteResult> matchResponse(const std::vector<WriteOp>& operations,
                                       const std::vector<WriteResult>& response);

// Atomic write (temporary file + rename).
bool writeFile(const QString& path, const QByteArray& payload);
std::optional<QByteArray> readFile(const QString& path);

} // namespace protocol
} // namespace usb_power
