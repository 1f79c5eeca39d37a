// tests/test_ElevationProtocol.cpp
#include <gtest/gtest.h>
#include "ElevationProtocol.hpp"
#include <usb-power/Constants.hpp>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

namespace usb_power {
namespace testing {

namespace {

const std::string PATH_A = "SYSTEM\\CurrentControlSet\\Enum\\USB\\VID_1&PID_1\\A\\Device Parameters";
const std::string PATH_B = "SYSTEM\\CurrentControlSet\\Enum\\USB\\VID_2&PID_2\\B\\Device Parameters";

QByteArray requestWith(const QJsonValue& value, int version = PROTOCOL_VERSION,
                       const QString& attribute = Attributes::ENHANCED_POWER_MANAGEMENT) {
    QJsonObject op;
    op["path"] = QString::fromStdString(PATH_A);
    op["value"] = value;

    QJsonObject root;
    root["version"] = version;
    root["attribute"] = attribute;
    root["operations"] = QJsonArray{op};
    return QJsonDocument(root).toJson();
}

}

TEST(ElevationProtocolTest, RequestCarriesAttributeAndOperationsInOrder) {
    QByteArray payload = protocol::encodeRequest({{PATH_A, 0}, {PATH_B, 1}});
    QJsonObject root = QJsonDocument::fromJson(payload).object();

    EXPECT_EQ(root["version"].toInt(), PROTOCOL_VERSION);
    EXPECT_EQ(root["attribute"].toString(), QString(Attributes::ENHANCED_POWER_MANAGEMENT));

    QJsonArray operations = root["operations"].toArray();
    ASSERT_EQ(operations.size(), 2);
    EXPECT_EQ(operations[0].toObject()["path"].toString().toStdString(), PATH_A);
    EXPECT_EQ(operations[1].toObject()["value"].toInt(), 1);

    auto decoded = protocol::decodeRequest(payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->size(), 2u);
    EXPECT_EQ((*decoded)[1], (WriteOp{PATH_B, 1}));
}

TEST(ElevationProtocolTest, RequestValueMustBeDword) {
    EXPECT_TRUE(protocol::decodeRequest(requestWith(1)).has_value());
    EXPECT_FALSE(protocol::decodeRequest(requestWith(-1)).has_value());
    EXPECT_FALSE(protocol::decodeRequest(requestWith(0.5)).has_value());
    EXPECT_FALSE(protocol::decodeRequest(requestWith(4294967296.0)).has_value());
    EXPECT_FALSE(protocol::decodeRequest(requestWith(QString("0"))).has_value());
}

TEST(ElevationProtocolTest, RequestMustNameThePowerAttribute) {
    EXPECT_FALSE(protocol::decodeRequest(requestWith(0, PROTOCOL_VERSION, "Start")).has_value());
}

TEST(ElevationProtocolTest, RequestVersionIsChecked) {
    EXPECT_FALSE(protocol::decodeRequest(requestWith(0, PROTOCOL_VERSION + 1)).has_value());
    EXPECT_FALSE(protocol::decodeRequest("not json").has_value());
}

TEST(ElevationProtocolTest, ResponseKeepsFailureReasons) {
    QByteArray payload = protocol::encodeResponse({
        {{PATH_A, 0}, WriteOutcome::succeeded()},
        {{PATH_B, 0}, WriteOutcome::failed(FailureReason::WriteDenied, "Access denied")}
    });

    auto decoded = protocol::decodeResponse(payload);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_EQ(decoded->size(), 2u);
    EXPECT_EQ((*decoded)[0].outcome.status, OutcomeStatus::Succeeded);
    EXPECT_EQ((*decoded)[1].outcome.reason, FailureReason::WriteDenied);
    EXPECT_EQ((*decoded)[1].outcome.message, "Access denied");
}

TEST(ElevationProtocolTest, UnknownFailureReasonBecomesWriteError) {
    QJsonObject entry;
    entry["path"] = QString::fromStdString(PATH_A);
    entry["value"] = 0;
    entry["outcome"] = "failed";
    entry["reason"] = "cosmic-ray";

    QJsonObject root;
    root["version"] = PROTOCOL_VERSION;
    root["results"] = QJsonArray{entry};

    auto decoded = protocol::decodeResponse(QJsonDocument(root).toJson());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ((*decoded)[0].outcome.reason, FailureReason::WriteError);
}

TEST(ElevationProtocolTest, UnknownOutcomeRejectsResponse) {
    QJsonObject entry;
    entry["path"] = QString::fromStdString(PATH_A);
    entry["value"] = 0;
    entry["outcome"] = "maybe";

    QJsonObject root;
    root["version"] = PROTOCOL_VERSION;
    root["results"] = QJsonArray{entry};

    EXPECT_FALSE(protocol::decodeResponse(QJsonDocument(root).toJson()).has_value());
}

TEST(ElevationProtocolTest, MatchPairsByPosition) {
    std::vector<WriteOp> ops = {{PATH_A, 0}, {PATH_B, 0}};
    std::vector<WriteResult> response = {
        {{PATH_A, 0}, WriteOutcome::succeeded()},
        {{PATH_B, 0}, WriteOutcome::failed(FailureReason::WriteError, "io")}
    };

    auto matched = protocol::matchResponse(ops, response);
    ASSERT_EQ(matched.size(), 2u);
    EXPECT_EQ(matched[0].outcome.status, OutcomeStatus::Succeeded);
    EXPECT_EQ(matched[1].outcome.reason, FailureReason::WriteError);
}

TEST(ElevationProtocolTest, MissingEntriesAreNoResponse) {
    std::vector<WriteOp> ops = {{PATH_A, 0}, {PATH_B, 0}};
    std::vector<WriteResult> response = {{{PATH_A, 0}, WriteOutcome::succeeded()}};

    auto matched = protocol::matchResponse(ops, response);
    ASSERT_EQ(matched.size(), 2u);
    EXPECT_EQ(matched[0].outcome.status, OutcomeStatus::Succeeded);
    EXPECT_EQ(matched[1].outcome.reason, FailureReason::NoResponse);
    EXPECT_EQ(matched[1].op, ops[1]);
}

TEST(ElevationProtocolTest, MismatchedEntryIsNoResponse) {
    std::vector<WriteOp> ops = {{PATH_A, 0}, {PATH_B, 0}};
    std::vector<WriteResult> swapped = {
        {{PATH_B, 0}, WriteOutcome::succeeded()},
        {{PATH_A, 0}, WriteOutcome::succeeded()}
    };

    auto matched = protocol::matchResponse(ops, swapped);
    EXPECT_EQ(matched[0].outcome.reason, FailureReason::NoResponse);
    EXPECT_EQ(matched[1].outcome.reason, FailureReason::NoResponse);

    // Same path, different value is not a match either
    auto wrongValue = protocol::matchResponse({{PATH_A, 0}}, {{{PATH_A, 1}, WriteOutcome::succeeded()}});
    EXPECT_EQ(wrongValue[0].outcome.reason, FailureReason::NoResponse);
}

TEST(ElevationProtocolTest, ExtraEntriesAreIgnored) {
    auto matched = protocol::matchResponse({{PATH_A, 0}}, {
        {{PATH_A, 0}, WriteOutcome::succeeded()},
        {{PATH_B, 0}, WriteOutcome::succeeded()}
    });

    ASSERT_EQ(matched.size(), 1u);
    EXPECT_EQ(matched[0].outcome.status, OutcomeStatus::Succeeded);
}

TEST(ElevationProtocolTest, FilesAreWrittenWhole) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("request.json");

    EXPECT_FALSE(protocol::readFile(path).has_value());
    ASSERT_TRUE(protocol::writeFile(path, "{\"version\":1}"));

    auto payload = protocol::readFile(path);
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ(*payload, QByteArray("{\"version\":1}"));
}

} // namespace testing
} // namespace usb_power
