#include "ElevationProtocol.hpp"
#include "../core/Logger.hpp"
#include <usb-power/Constants.hpp>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSaveFile>
#include <cmath>
#include <limits>

namespace usb_power {
namespace protocol {

namespace {

std::optional<QJsonObject> parseEnvelope(const QByteArray& payload) {
    QJsonParseError error{};
    QJsonDocument doc = QJsonDocument::fromJson(payload, &error);
    if (doc.isNull() || !doc.isObject()) {
        LOG_WARNING("Malformed elevation payload: " + error.errorString().toStdString());
        return std::nullopt;
    }

    QJsonObject root = doc.object();
    if (root.value("version").toInt(-1) != PROTOCOL_VERSION) {
        LOG_WARNING("Unsupported elevation payload version");
        return std::nullopt;
    }
    return root;
}

std::optional<WriteOp> opFromJson(const QJsonValue& value) {
    if (!value.isObject()) {
        return std::nullopt;
    }
    QJsonObject object = value.toObject();
    QJsonValue path = object.value("path");
    QJsonValue number = object.value("value");
    if (!path.isString() || !number.isDouble()) {
        return std::nullopt;
    }

    double raw = number.toDouble();
    if (raw < 0 || raw > std::numeric_limits<uint32_t>::max() || std::floor(raw) != raw) {
        return std::nullopt;
    }
    return WriteOp{path.toString().toStdString(), static_cast<uint32_t>(raw)};
}

QJsonObject opToJson(const WriteOp& op) {
    QJsonObject object;
    object["path"] = QString::fromStdString(op.registryPath);
    object["value"] = static_cast<double>(op.value);
    return object;
}

}

QByteArray encodeRequest(const std::vector<WriteOp>& operations) {
    QJsonArray list;
    for (const auto& op : operations) {
        list.append(opToJson(op));
    }

    QJsonObject root;
    root["version"] = PROTOCOL_VERSION;
    root["attribute"] = QString::fromLatin1(Attributes::ENHANCED_POWER_MANAGEMENT);
    root["operations"] = list;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

std::optional<std::vector<WriteOp>> decodeRequest(const QByteArray& payload) {
    auto root = parseEnvelope(payload);
    if (!root) {
        return std::nullopt;
    }
    if (root->value("attribute").toString() !=
        QString::fromLatin1(Attributes::ENHANCED_POWER_MANAGEMENT)) {
        LOG_WARNING("Elevation request names an unsupported attribute");
        return std::nullopt;
    }

    QJsonValue list = root->value("operations");
    if (!list.isArray()) {
        return std::nullopt;
    }

    std::vector<WriteOp> operations;
    for (const auto& entry : list.toArray()) {
        auto op = opFromJson(entry);
        if (!op) {
            return std::nullopt;
        }
        operations.push_back(std::move(*op));
    }
    return operations;
}

QByteArray encodeResponse(const std::vector<WriteResult>& results) {
    QJsonArray list;
    for (const auto& result : results) {
        QJsonObject object = opToJson(result.op);
        object["outcome"] = QString::fromLatin1(toString(result.outcome.status));
        if (result.outcome.isFailed()) {
            object["reason"] = QString::fromLatin1(toString(result.outcome.reason));
        }
        if (!result.outcome.message.empty()) {
            object["message"] = QString::fromStdString(result.outcome.message);
        }
        list.append(object);
    }

    QJsonObject root;
    root["version"] = PROTOCOL_VERSION;
    root["results"] = list;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

std::optional<std::vector<WriteResult>> decodeResponse(const QByteArray& payload) {
    auto root = parseEnvelope(payload);
    if (!root) {
        return std::nullopt;
    }

    QJsonValue list = root->value("results");
    if (!list.isArray()) {
        return std::nullopt;
    }

    std::vector<WriteResult> results;
    for (const auto& entry : list.toArray()) {
        auto op = opFromJson(entry);
        if (!op) {
            return std::nullopt;
        }

        QJsonObject object = entry.toObject();
        QString outcome = object.value("outcome").toString();
        std::string message = object.value("message").toString().toStdString();

        WriteResult result;
        result.op = std::move(*op);
        if (outcome == QLatin1String(toString(OutcomeStatus::Succeeded))) {
            result.outcome = WriteOutcome::succeeded();
            result.outcome.message = message;
        } else if (outcome == QLatin1String(toString(OutcomeStatus::Failed))) {
            auto reason = failureReasonFromString(object.value("reason").toString().toStdString());
            if (!reason || *reason == FailureReason::None) {
                reason = FailureReason::WriteError;
            }
            result.outcome = WriteOutcome::failed(*reason, message);
        } else {
            return std::nullopt;
        }
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<WriteResult> matchResponse(const std::vector<WriteOp>& operations,
                                       const std::vector<WriteResult>& response) {
    std::vector<WriteResult> matched;
    matched.reserve(operations.size());

    for (size_t i = 0; i < operations.size(); ++i) {
        WriteResult result;
        result.op = operations[i];
        if (i < response.size() && response[i].op == operations[i]) {
            result.outcome = response[i].outcome;
        } else {
            result.outcome = WriteOutcome::failed(FailureReason::NoResponse,
                                                  "No report entry for this operation");
        }
        matched.push_back(std::move(result));
    }

    if (response.size() > operations.size()) {
        LOG_WARNING("Elevation report has " + std::to_string(response.size() - operations.size()) +
                    " unexpected extra entries");
    }
    return matched;
}

bool writeFile(const QString& path, const QByteArray& payload) {
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR("Cannot open " + path.toStdString() + ": " + file.errorString().toStdString());
        return false;
    }
    if (file.write(payload) != payload.size()) {
        LOG_ERROR("Short write to " + path.toStdString());
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

std::optional<QByteArray> readFile(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        return std::nullopt;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING("Cannot open " + path.toStdString() + ": " + file.errorString().toStdString());
        return std::nullopt;
    }
    return file.readAll();
}

} // namespace protocol
} // namespace usb_power
