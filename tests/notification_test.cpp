#include "notification.hpp"

#include <stdexcept>

#include <gtest/gtest.h>

#include "test_support.hpp"

using testing_support::TempDir;
using testing_support::readFile;

namespace {

class RecordingChannel : public NotificationStrategy {
public:
    explicit RecordingChannel(std::vector<NotificationPayload>& sent, bool fails = false)
        : sent_(sent), fails_(fails) {}

    std::expected<void, std::string> notify(const NotificationPayload& payload) override {
        if (fails_) {
            return std::unexpected("HTTP 502");
        }
        sent_.push_back(payload);
        return {};
    }

private:
    std::vector<NotificationPayload>& sent_;
    bool fails_;
};

RestoreEvent failureEvent() {
    RestoreEvent event;
    event.type = RestoreEventType::RestoreFailure;
    event.executionId = "exec-9";
    event.sourceName = "backups/shop.sql.gz.enc";
    event.targetDatabase = "shop";
    event.durationMs = 2400;
    event.error = "Decryption failed: authentication tag mismatch";
    event.timestamp = "2024-05-01T10:00:00.000Z";
    return event;
}

} // namespace

TEST(RenderRestoreEventTest, FailureCarriesTheErrorAndDuration) {
    NotificationPayload payload = renderRestoreEvent(failureEvent());
    EXPECT_EQ(payload.eventId, "RESTORE_FAILURE");
    EXPECT_FALSE(payload.success);
    EXPECT_NE(payload.message.find("authentication tag mismatch"), std::string::npos);

    auto field = [&payload](const std::string& name) -> std::string {
        for (const auto& [key, value] : payload.fields) {
            if (key == name) return value;
        }
        return {};
    };
    EXPECT_EQ(field("Execution"), "exec-9");
    EXPECT_EQ(field("Source"), "backups/shop.sql.gz.enc");
    EXPECT_EQ(field("Duration"), "2s");
    EXPECT_EQ(field("Time"), "2024-05-01T10:00:00.000Z");
}

TEST(RenderRestoreEventTest, CompletionOmitsAbsentFields) {
    RestoreEvent event;
    event.executionId = "exec-1";
    event.timestamp = "2024-05-01T10:00:00.000Z";

    NotificationPayload payload = renderRestoreEvent(event);
    EXPECT_EQ(payload.eventId, "RESTORE_COMPLETE");
    EXPECT_TRUE(payload.success);
    EXPECT_EQ(payload.fields.size(), 2u);
    EXPECT_EQ(payload.text(), "Restore Completed\nDatabase restore completed successfully.\n"
                              "Execution: exec-1\nTime: 2024-05-01T10:00:00.000Z");

    Json::Value json = payload.toJson();
    EXPECT_EQ(json["event"].asString(), "RESTORE_COMPLETE");
    EXPECT_EQ(json["fields"].size(), 2u);
}

TEST(NotificationStrategyTest, ChannelsRejectIncompleteConfig) {
    Json::Value telegram;
    telegram["bot_token"] = "123:abc";
    EXPECT_THROW(TelegramNotificationStrategy{telegram}, std::runtime_error);
    EXPECT_THROW(WebhookNotificationStrategy{Json::Value(Json::objectValue)}, std::runtime_error);
}

TEST(RestoreNotifierTest, DeliveryFailuresAreLoggedAndDoNotStopOtherChannels) {
    TempDir dir;
    ServiceLog serviceLog(dir.file("service.log"), dir.file("error.log"), false);

    std::vector<NotificationPayload> sent;
    std::vector<std::unique_ptr<NotificationStrategy>> channels;
    channels.push_back(std::make_unique<RecordingChannel>(sent, true));
    channels.push_back(std::make_unique<RecordingChannel>(sent));
    RestoreNotifier notifier(std::move(channels), serviceLog);

    EXPECT_EQ(notifier.dispatch(failureEvent()), 1u);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].eventId, "RESTORE_FAILURE");
    EXPECT_NE(readFile(dir.file("error.log")).find("HTTP 502"), std::string::npos);
}

TEST(RestoreNotifierTest, EmptyConfigBuildsNoChannels) {
    TempDir dir;
    ServiceLog serviceLog(dir.file("service.log"), dir.file("error.log"), false);
    auto notifier = RestoreNotifier::fromConfig(Json::Value(), Json::Value(), serviceLog);
    ASSERT_NE(notifier, nullptr);
    EXPECT_EQ(notifier->dispatch(failureEvent()), 0u);
}
