#include "notification.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <fmt/format.h>

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

constexpr long kRequestTimeoutSeconds = 15;

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

std::expected<void, std::string> checkedPerform(CURL* curl, const char* channel) {
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        return std::unexpected(fmt::format("Failed to send {} notification: {}", channel, curl_easy_strerror(res)));
    }
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    if (status >= 400) {
        return std::unexpected(fmt::format("Failed to send {} notification: HTTP {}", channel, status));
    }
    return {};
}

} // namespace

std::string NotificationPayload::text() const {
    std::string out = fmt::format("{}\n{}", title, message);
    for (const auto& [name, value] : fields) {
        out += fmt::format("\n{}: {}", name, value);
    }
    return out;
}

Json::Value NotificationPayload::toJson() const {
    Json::Value root(Json::objectValue);
    root["event"] = eventId;
    root["title"] = title;
    root["message"] = message;
    root["success"] = success;
    Json::Value list(Json::arrayValue);
    for (const auto& [name, value] : fields) {
        Json::Value field(Json::objectValue);
        field["name"] = name;
        field["value"] = value;
        list.append(field);
    }
    root["fields"] = list;
    return root;
}

NotificationPayload renderRestoreEvent(const RestoreEvent& event) {
    NotificationPayload payload;
    if (event.type == RestoreEventType::RestoreComplete) {
        payload.eventId = "RESTORE_COMPLETE";
        payload.title = "Restore Completed";
        payload.message = "Database restore completed successfully.";
        if (event.targetDatabase) {
            payload.message += fmt::format(" Target: {}", *event.targetDatabase);
        }
        payload.success = true;
    } else {
        payload.eventId = "RESTORE_FAILURE";
        payload.title = "Restore Failed";
        payload.message = "Database restore failed.";
        if (event.error) {
            payload.message += fmt::format(" Error: {}", *event.error);
        }
        payload.success = false;
    }

    payload.fields.emplace_back("Execution", event.executionId);
    if (!event.sourceName.empty()) {
        payload.fields.emplace_back("Source", event.sourceName);
    }
    if (event.targetDatabase) {
        payload.fields.emplace_back("Target DB", *event.targetDatabase);
    }
    if (event.durationMs) {
        payload.fields.emplace_back("Duration", fmt::format("{}s", (*event.durationMs + 500) / 1000));
    }
    if (event.error) {
        payload.fields.emplace_back("Error", *event.error);
    }
    payload.fields.emplace_back("Time", event.timestamp);
    return payload;
}

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(config["bot_token"].asString()), chatId(config["chat_id"].asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw std::runtime_error("Telegram notifications require bot_token and chat_id");
    }
}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const NotificationPayload& payload) {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::string message = payload.text();
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(curl.get(), message.c_str(), static_cast<int>(message.length())), &curl_free);
    if (!escaped) {
        return std::unexpected("Failed to encode Telegram message");
    }
    std::string url = fmt::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}",
        botToken, chatId, escaped.get());

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, kRequestTimeoutSeconds);
    return checkedPerform(curl.get(), "Telegram");
}

WebhookNotificationStrategy::WebhookNotificationStrategy(const Json::Value& config)
    : url(config["url"].asString()) {
    if (url.empty()) {
        throw std::runtime_error("Webhook notifications require a url");
    }
}

std::expected<void, std::string> WebhookNotificationStrategy::notify(const NotificationPayload& payload) {
    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::string body = Json::writeString(builder, payload.toJson());

    CurlHeaders headers(curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, kRequestTimeoutSeconds);
    return checkedPerform(curl.get(), "webhook");
}

RestoreNotifier::RestoreNotifier(std::vector<std::unique_ptr<NotificationStrategy>> channels, const ServiceLog& serviceLog)
    : channels_(std::move(channels)), serviceLog_(serviceLog) {}

std::unique_ptr<RestoreNotifier> RestoreNotifier::fromConfig(const Json::Value& telegramConfig,
                                                             const Json::Value& webhookConfig,
                                                             const ServiceLog& serviceLog) {
    std::vector<std::unique_ptr<NotificationStrategy>> channels;
    if (!telegramConfig.empty()) {
        channels.push_back(std::make_unique<TelegramNotificationStrategy>(telegramConfig));
    }
    if (!webhookConfig.empty()) {
        channels.push_back(std::make_unique<WebhookNotificationStrategy>(webhookConfig));
    }
    return std::make_unique<RestoreNotifier>(std::move(channels), serviceLog);
}

std::size_t RestoreNotifier::dispatch(const RestoreEvent& event) {
    NotificationPayload payload = renderRestoreEvent(event);
    std::size_t delivered = 0;
    for (auto& channel : channels_) {
        auto result = channel->notify(payload);
        if (result) {
            ++delivered;
        } else {
            serviceLog_.logError(fmt::format("Notification for execution {} failed: {}", event.executionId, result.error()));
        }
    }
    return delivered;
}
