/**
 * @file notification.hpp
 * @brief Defines notification strategies for RestoreVault.
 *
 * Restore outcomes are announced through Telegram and generic JSON webhooks. Delivery
 * failures are reported to the caller and never affect the outcome of the restore.
 *
 * @note Requires libcurl.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <expected>
#include <utility>
#include <json/json.h>
#include "service_log.hpp"

/**
 * @brief Restore event types.
 */
enum class RestoreEventType {
    RestoreComplete, ///< "RESTORE_COMPLETE"
    RestoreFailure   ///< "RESTORE_FAILURE"
};

/**
 * @brief Data attached to a restore event.
 */
struct RestoreEvent {
    RestoreEventType type = RestoreEventType::RestoreComplete;
    std::string executionId;
    std::string sourceName;                    ///< Remote artifact path.
    std::optional<std::string> targetDatabase; ///< Target adapter config or database name.
    std::optional<long long> durationMs;
    std::optional<std::string> error;
    std::string timestamp;
};

/**
 * @brief Rendered notification, independent of the channel.
 */
struct NotificationPayload {
    std::string eventId; ///< "RESTORE_COMPLETE" or "RESTORE_FAILURE".
    std::string title;
    std::string message;
    std::vector<std::pair<std::string, std::string>> fields;
    bool success = true;

    /**
     * @brief Plain text form: title, message and one "name: value" line per field.
     */
    std::string text() const;

    Json::Value toJson() const;
};

/**
 * @brief Renders an event into a payload.
 */
NotificationPayload renderRestoreEvent(const RestoreEvent& event);

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Delivers the payload via the configured channel.
     *
     * @param payload Rendered notification.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const NotificationPayload& payload) = 0;
};

/**
 * @brief Telegram notification strategy.
 *
 * Sends notifications using the Telegram Bot API.
 */
class TelegramNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a Telegram notification strategy.
     *
     * @param config JSON configuration with bot_token and chat_id.
     * @throws std::runtime_error If configuration is invalid.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const NotificationPayload& payload) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId; ///< Telegram chat ID.
};

/**
 * @brief Webhook notification strategy.
 *
 * POSTs the payload as JSON to a configured URL.
 */
class WebhookNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @param config JSON configuration with url.
     * @throws std::runtime_error If the url is missing.
     */
    explicit WebhookNotificationStrategy(const Json::Value& config);

    std::expected<void, std::string> notify(const NotificationPayload& payload) override;

private:
    std::string url; ///< Endpoint receiving the JSON payload.
};

/**
 * @brief Fans a restore event out to every configured channel.
 */
class RestoreNotifier {
public:
    RestoreNotifier(std::vector<std::unique_ptr<NotificationStrategy>> channels, const ServiceLog& serviceLog);

    /**
     * @brief Builds channels from the "telegram" and "webhook" configuration sections.
     */
    static std::unique_ptr<RestoreNotifier> fromConfig(const Json::Value& telegramConfig,
                                                       const Json::Value& webhookConfig,
                                                       const ServiceLog& serviceLog);

    /**
     * @brief Sends the event on all channels. Failures are written to the service log.
     * @return Number of channels that accepted the notification.
     */
    std::size_t dispatch(const RestoreEvent& event);

private:
    std::vector<std::unique_ptr<NotificationStrategy>> channels_;
    const ServiceLog& serviceLog_;
};

#endif // NOTIFICATION_HPP
