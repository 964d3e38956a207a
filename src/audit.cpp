#include "veil/audit.hpp"
#include "veil/crypto.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <format>

namespace veil
{

    namespace
    {
        std::string now_ts()
        {
            auto now = std::chrono::system_clock::now();
            auto t = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
            std::tm tm_buf;
            gmtime_r(&t, &tm_buf);
            return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                               tm_buf.tm_year + 1900,
                               tm_buf.tm_mon + 1,
                               tm_buf.tm_mday,
                               tm_buf.tm_hour,
                               tm_buf.tm_min,
                               tm_buf.tm_sec,
                               static_cast<int>(ms.count()));
        }
    } // namespace

    nlohmann::json AuditEvent::to_json() const
    {
        return nlohmann::json{{"ts", ts},
                              {"actor", actor},
                              {"action", action},
                              {"class_id", class_id},
                              {"reason", reason}};
    }

    AuditChain::AuditChain() = default;

    std::string AuditChain::link(const std::string &previous, const AuditEvent &event)
    {
        return crypto::SHA256::to_hex(crypto::SHA256::hash(previous + event.to_json().dump()));
    }

    std::string AuditChain::append(const AuditEvent &event)
    {
        auto hash = link(head().value_or(""), event);
        hashes_.push_back(hash);
        return hash;
    }

    std::optional<std::string> AuditChain::head() const
    {
        if (hashes_.empty())
            return std::nullopt;
        return hashes_.back();
    }

    bool AuditChain::verify(const std::vector<AuditEvent> &events) const
    {
        if (events.size() != hashes_.size())
            return false;

        std::string previous;
        for (std::size_t i = 0; i < events.size(); ++i)
        {
            previous = link(previous, events[i]);
            if (previous != hashes_[i])
                return false;
        }
        return true;
    }

    AuditLogger::AuditLogger(std::shared_ptr<spdlog::logger> logger)
        : logger_(logger ? std::move(logger) : spdlog::default_logger())
    {
    }

    void AuditLogger::log(const AuditEvent &event, const std::string &chain_hash)
    {
        nlohmann::json j = event.to_json();
        j["chain_hash"] = chain_hash;
        logger_->info(j.dump());
    }

    DeclassificationAudit::DeclassificationAudit(std::shared_ptr<spdlog::logger> logger)
        : logger_(std::move(logger))
    {
    }

    std::string DeclassificationAudit::record(const ClassId &class_id, std::string_view actor, std::string_view reason)
    {
        AuditEvent event{now_ts(), std::string(actor), "declassify", class_id.to_string(), std::string(reason)};

        std::lock_guard lock(mutex_);
        auto hash = chain_.append(event);
        events_.push_back(event);
        logger_.log(event, hash);
        return hash;
    }

    std::vector<AuditEvent> DeclassificationAudit::events() const
    {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::optional<std::string> DeclassificationAudit::head() const
    {
        std::lock_guard lock(mutex_);
        return chain_.head();
    }

    bool DeclassificationAudit::verify() const
    {
        std::lock_guard lock(mutex_);
        return chain_.verify(events_);
    }

} // namespace veil
