/**
 * @file notification.hpp
 * @brief Defines notification strategies for autobackup.
 *
 * Scheduled backups have no synchronous caller; their outcome is logged, kept as the
 * last run record and, when configured, pushed through a notification strategy.
 *
 * @note Requires libcurl for Telegram notifications. Install via apt on Linux or
 * Homebrew on macOS.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <expected>
#include <string>
#include <json/json.h>

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param message Message to send.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& message) = 0;
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
     * @throws std::runtime_error If bot_token or chat_id is missing.
     */
    explicit TelegramNotificationStrategy(const Json::Value& config);

    /**
     * @brief Sends the message to the configured Telegram chat.
     */
    std::expected<void, std::string> notify(const std::string& message) override;

private:
    std::string botToken; ///< Telegram bot token.
    std::string chatId;   ///< Telegram chat ID.
};

#endif // NOTIFICATION_HPP
