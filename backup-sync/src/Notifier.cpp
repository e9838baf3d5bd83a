/**
 * @file Notifier.cpp
 * @brief
 */

// Header Being Defined
#include <nas_backup/backup_sync/Notifier.hpp>

// System Includes
#include <time.h>

// Standard Library Includes
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <ctime>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Third Party Library Includes
#include <curl/curl.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/logger.h>

// Project Includes
#include <nas_backup/backup_sync/SyncError.hpp>

namespace nas_backup::backup_sync
{
namespace
{
struct PayloadCursor
{
    std::string_view remaining;
};

auto current_rfc2822_date() -> std::string
{
    const std::time_t now = std::time(nullptr);
    std::tm           localTime {};
    ::localtime_r(&now, &localTime);

    std::array<char, 64> buffer {};
    const auto           length = std::strftime(
        buffer.data(),
        buffer.size(),
        "%a, %d %b %Y %H:%M:%S %z",
        &localTime
    );

    return { buffer.data(), length };
}

// SMTP requires CRLF line endings
auto to_crlf(std::string_view text) -> std::string
{
    std::string converted;
    converted.reserve(text.size() + text.size() / 16);

    for (const char character : text)
    {
        if (character == '\n')
        {
            converted += "\r\n";
        }
        else if (character != '\r')
        {
            converted += character;
        }
    }

    return converted;
}
} // namespace

Notifier::Notifier(
    NotificationSettings            settings,
    std::shared_ptr<spdlog::logger> logger
)
    : m_Settings(std::move(settings)),
      m_Logger(std::move(logger))
{
}

auto Notifier::notify(const std::vector<RunResult>& failedJobs) -> bool
{
    if (failedJobs.empty())
    {
        m_Logger->warn("No failed jobs to report, skipping notification");
        return false;
    }

    if (m_Settings.email.empty())
    {
        m_Logger->warn("No email configuration found, skipping notification");
        return false;
    }

    try
    {
        this->deliver(this->compose_message(failedJobs));
    }
    catch (const sync_exception& se)
    {
        m_Logger->error(
            "Failed to send notification email ({}): {}",
            to_string(se.kind()),
            se.what()
        );
        return false;
    }
    catch (const std::exception& e)
    {
        m_Logger->error(
            "Failed to send notification email ({}): {}",
            to_string(ErrorKind::NOTIFICATION_DELIVERY),
            e.what()
        );
        return false;
    }

    m_Logger->info("Notification email sent successfully");
    return true;
}

auto Notifier::compose_message(const std::vector<RunResult>& failedJobs) const
    -> MailMessage
{
    std::string body = "The following backup jobs failed:\n\n";

    for (const auto& job : failedJobs)
    {
        const auto error
            = job.error.value_or(
                fmt::format("Unknown error (return code {})", job.returnCode)
            );

        body += fmt::format(
            "• {}\n  Source: {}\n  Error: {}\n\n",
            job.name,
            job.source,
            error
        );
    }

    return MailMessage {
        .from    = m_Settings.smtpUser,
        .to      = m_Settings.email,
        .subject = fmt::format("Backup Sync Failed - {} job(s)", failedJobs.size()),
        .body    = std::move(body),
    };
}

auto Notifier::format_payload(const MailMessage& message) -> std::string
{
    return to_crlf(
        fmt::format(
            "Date: {}\n"
            "To: {}\n"
            "From: {}\n"
            "Subject: {}\n"
            "MIME-Version: 1.0\n"
            "Content-Type: text/plain; charset=utf-8\n"
            "Content-Transfer-Encoding: 8bit\n"
            "\n"
            "{}",
            current_rfc2822_date(),
            message.to,
            message.from,
            message.subject,
            message.body
        )
    );
}

auto Notifier::read_payload(
    char*             buffer,
    const std::size_t size,
    const std::size_t count,
    void*             userdata
) -> std::size_t
{
    auto*      cursor = static_cast<PayloadCursor*>(userdata);
    const auto chunk  = std::min(size * count, cursor->remaining.size());

    std::memcpy(buffer, cursor->remaining.data(), chunk);
    cursor->remaining.remove_prefix(chunk);

    return chunk;
}

auto Notifier::deliver(const MailMessage& message) -> void
{
    const std::unique_ptr<CURL, decltype(&::curl_easy_cleanup)> curl(
        ::curl_easy_init(),
        &::curl_easy_cleanup
    );

    if (!curl)
    {
        throw sync_exception(
            ErrorKind::NOTIFICATION_DELIVERY,
            "cURL failed to initialize"
        );
    }

    const std::string recipient = fmt::format("<{}>", message.to);
    const std::unique_ptr<curl_slist, decltype(&::curl_slist_free_all)>
        recipients(
            ::curl_slist_append(nullptr, recipient.c_str()),
            &::curl_slist_free_all
        );

    const std::string url = fmt::format(
        "smtp://{}:{}",
        m_Settings.smtpServer,
        m_Settings.smtpPort
    );
    const std::string sender  = fmt::format("<{}>", message.from);
    const std::string payload = Notifier::format_payload(message);
    PayloadCursor     cursor { payload };

    constexpr long SMTP_TIMEOUT_SECONDS = 60L;

    ::curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    ::curl_easy_setopt(curl.get(), CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));

    if (!m_Settings.smtpUser.empty())
    {
        ::curl_easy_setopt(curl.get(), CURLOPT_USERNAME, m_Settings.smtpUser.c_str());
        ::curl_easy_setopt(curl.get(), CURLOPT_PASSWORD, m_Settings.smtpPass.c_str());
    }

    ::curl_easy_setopt(curl.get(), CURLOPT_MAIL_FROM, sender.c_str());
    ::curl_easy_setopt(curl.get(), CURLOPT_MAIL_RCPT, recipients.get());
    ::curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, &Notifier::read_payload);
    ::curl_easy_setopt(curl.get(), CURLOPT_READDATA, &cursor);
    ::curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
    ::curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, SMTP_TIMEOUT_SECONDS);

    m_Logger->debug(
        "Sending failure notification to {} through {}",
        message.to,
        url
    );

    const CURLcode result = ::curl_easy_perform(curl.get());

    if (result != CURLE_OK)
    {
        throw sync_exception(
            ErrorKind::NOTIFICATION_DELIVERY,
            fmt::format(
                "SMTP delivery through {} failed: {}",
                url,
                ::curl_easy_strerror(result)
            )
        );
    }
}
} // namespace nas_backup::backup_sync
