#pragma once

#include "crypto.hpp"
#include "redactor.hpp"
#include <utility>

namespace veil
{

    /**
     * Replaces a value with a 16-character lowercase hex digest of a keyed
     * 64-bit hash of its UTF-8 bytes.
     *
     * Equal inputs under the same secret always produce equal digests, which
     * keeps redacted telemetry correlatable without exposing the value. The
     * class id never enters the hash; the tagged variant only wraps the
     * digest as "<taxonomy.class:digest>".
     */
    class HashRedactor : public Redactor
    {
    public:
        static constexpr std::size_t REDACTED_LEN = 16;

        /**
         * Uses a fixed, publicly known key. Suitable for development only:
         * anyone can recompute digests of guessed values.
         */
        HashRedactor();

        /**
         * @throws VeilError (InvalidSecret) unless
         *         KeyedHash::KEY_MIN <= secret.size() <= KeyedHash::KEY_MAX
         */
        explicit HashRedactor(crypto::Bytes secret, bool tagged = false);

        static HashRedactor with_secret(crypto::Bytes secret) { return HashRedactor(std::move(secret)); }
        static HashRedactor with_secret_and_tag(crypto::Bytes secret) { return HashRedactor(std::move(secret), true); }

        /** The development key used by the default constructor. */
        static const crypto::Bytes &default_secret();

        bool tagged() const { return tagged_; }

        void redact(const ClassId &class_id, std::string_view value, const RedactionOutput &output) const override;

        std::optional<std::size_t> exact_len(const ClassId &class_id) const override;

    private:
        crypto::Bytes secret_;
        bool tagged_{false};
    };

} // namespace veil
