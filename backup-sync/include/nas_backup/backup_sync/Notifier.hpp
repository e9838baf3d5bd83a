/**
 * @file Notifier.hpp
 * @brief E-mails a summary of failed jobs to the configured operator
 */

#pragma once

// Standard Library Includes
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Third Party Library Includes
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/BackupConfig.hpp>
#include <nas_backup/backup_sync/RunResult.hpp>

namespace nas_backup::backup_sync
{
struct MailMessage
{
    std::string from;
    std::string to;
    std::string subject;
    std::string body;
};

class Notifier
{
  public: // Constructors
    Notifier(
        NotificationSettings            settings,
        std::shared_ptr<spdlog::logger> logger
    );
    Notifier(Notifier&) = delete;
    Notifier(Notifier&&) = delete;
    auto operator=(Notifier&) -> Notifier = delete;
    auto operator=(Notifier&&) -> Notifier = delete;

    virtual ~Notifier() = default;

  public: // Methods
    /**
     * @brief Send one message listing every job in `failedJobs`
     *
     * Does nothing (with a warning) when the list is empty or no recipient
     * is configured. Delivery failures are logged, never thrown.
     *
     * @return true if a message was handed to the mail relay
     */
    auto notify(const std::vector<RunResult>& failedJobs) -> bool;

    [[nodiscard]]
    auto compose_message(const std::vector<RunResult>& failedJobs) const
        -> MailMessage;

  protected: // Methods
    /**
     * @brief Hand `message` to the SMTP relay (STARTTLS, then AUTH)
     *
     * @throws sync_exception with ErrorKind::NOTIFICATION_DELIVERY
     */
    virtual auto deliver(const MailMessage& message) -> void;

  private: // Static Methods
    static auto format_payload(const MailMessage& message) -> std::string;
    static auto read_payload(
        char*       buffer,
        std::size_t size,
        std::size_t count,
        void*       userdata
    ) -> std::size_t;

  private: // Members
    NotificationSettings            m_Settings;
    std::shared_ptr<spdlog::logger> m_Logger;
};
} // namespace nas_backup::backup_sync
