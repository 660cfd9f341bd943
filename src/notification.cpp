#include "notification.hpp"
#include <curl/curl.h>
#include <format>
#include <memory>
#include <stdexcept>

namespace {

size_t writeCallback([[maybe_unused]] void* contents, size_t size, size_t nmemb, [[maybe_unused]] void* userp) {
    return size * nmemb;
}

} // namespace

TelegramNotificationStrategy::TelegramNotificationStrategy(const Json::Value& config)
    : botToken(config["bot_token"].asString()), chatId(config["chat_id"].asString()) {
    if (botToken.empty() || chatId.empty()) {
        throw std::runtime_error("Telegram configuration requires bot_token and chat_id");
    }
}

std::expected<void, std::string> TelegramNotificationStrategy::notify(const std::string& message) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(curl.get(), message.c_str(), static_cast<int>(message.length())), &curl_free);
    if (!escaped) {
        return std::unexpected("Failed to escape Telegram message");
    }
    std::string url = std::format("https://api.telegram.org/bot{}/sendMessage?chat_id={}&text={}", botToken, chatId,
                                  escaped.get());

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 30L);
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::format("Failed to send Telegram notification: {}", curl_easy_strerror(res)));
    }

    long httpStatus = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &httpStatus);
    if (httpStatus != 200) {
        return std::unexpected(std::format("Telegram API rejected notification with HTTP status {}", httpStatus));
    }
    return {};
}
