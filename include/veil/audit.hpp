#pragma once

#include "classified.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/logger.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veil
{
    /** A declassification decision. Never carries the payload. */
    struct AuditEvent
    {
        std::string ts;
        std::string actor;
        std::string action;
        std::string class_id;
        std::string reason;

        nlohmann::json to_json() const;
    };

    /**
     * AuditChain links events with hashes for tamper detection. Each link is
     * SHA-256 over the previous link followed by the event's JSON.
     */
    class AuditChain
    {
    public:
        AuditChain();

        /** Append an event, returning its chain hash */
        std::string append(const AuditEvent &event);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        const std::vector<std::string> &hashes() const { return hashes_; }

        /** Recompute the chain over events and compare with the stored hashes. */
        bool verify(const std::vector<AuditEvent> &events) const;

        static std::string link(const std::string &previous, const AuditEvent &event);

    private:
        std::vector<std::string> hashes_;
    };

    /** Writes one JSON line per event through a spdlog logger. */
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::shared_ptr<spdlog::logger> logger = nullptr);

        void log(const AuditEvent &event, const std::string &chain_hash);

    private:
        std::shared_ptr<spdlog::logger> logger_;
    };

    /**
     * Records who declassified which class of data and why, then hands the
     * payload over. Thread-safe.
     *
     *   auto email = audit.declassify(std::move(user.email), "mailer", "send receipt");
     */
    class DeclassificationAudit
    {
    public:
        explicit DeclassificationAudit(std::shared_ptr<spdlog::logger> logger = nullptr);

        template <DataClassTag Tag, typename T>
        [[nodiscard]] T declassify(Classified<Tag, T> &&value, std::string_view actor, std::string_view reason)
        {
            record(Classified<Tag, T>::class_id(), actor, reason);
            return std::move(value).declassify();
        }

        /** Record a declassification of class_id, returning the chain hash. */
        std::string record(const ClassId &class_id, std::string_view actor, std::string_view reason);

        std::vector<AuditEvent> events() const;

        std::optional<std::string> head() const;

        bool verify() const;

    private:
        mutable std::mutex mutex_;
        AuditChain chain_;
        AuditLogger logger_;
        std::vector<AuditEvent> events_;
    };

} // namespace veil
