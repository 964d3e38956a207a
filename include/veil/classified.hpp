#pragma once

#include "class_id.hpp"
#include "extractor.hpp"
#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace veil
{

    /**
     * Tag types name a data class at compile time. A tag is a plain struct
     * with two static members:
     *
     *   struct EmailAddressClass
     *   {
     *       static constexpr std::string_view taxonomy{"pii"};
     *       static constexpr std::string_view name{"email_address"};
     *   };
     *
     *   template <typename T>
     *   using EmailAddress = veil::Classified<EmailAddressClass, T>;
     *
     * VEIL_DATA_CLASS (data_class.hpp) writes the same two declarations.
     */
    template <typename Tag>
    concept DataClassTag = requires {
        { Tag::taxonomy } -> std::convertible_to<std::string_view>;
        { Tag::name } -> std::convertible_to<std::string_view>;
    };

    /** Payload types that std::format can render. */
    template <typename T>
    concept TextRenderable = std::semiregular<std::formatter<std::remove_cvref_t<T>, char>>;

    template <DataClassTag Tag>
    ClassId class_id_of()
    {
        return ClassId(std::string(Tag::taxonomy), std::string(Tag::name));
    }

    /** Longest asterisk run produced by Classified::masked(). */
    inline constexpr std::size_t MAX_MASK_LENGTH = 32;

    /**
     * Container holding a payload of data class Tag.
     *
     * The payload never leaves the container except through declassify(),
     * visit()/visit_mut() and extract(). It has no stream operator and no
     * std::formatter; telemetry goes through RedactionDispatcher.
     *
     * Equality, ordering, hashing, copying and default construction are
     * available exactly when the payload supports them.
     */
    template <DataClassTag Tag, typename T>
    class Classified
    {
    public:
        using tag_type = Tag;
        using payload_type = T;

        Classified()
            requires std::default_initializable<T>
            : payload_()
        {
        }

        explicit Classified(T payload) noexcept(std::is_nothrow_move_constructible_v<T>)
            : payload_(std::move(payload))
        {
        }

        /** Identity of this container's data class; the same for every instance of the type. */
        static ClassId class_id() { return class_id_of<Tag>(); }

        /**
         * Give up the classification and return the payload. Every call site
         * is a deliberate escape and should be easy to find in review.
         */
        [[nodiscard]] T declassify() && { return std::move(payload_); }

        /**
         * Run op on the payload. op's result is returned by value; references
         * to the payload cannot escape.
         */
        template <typename F>
            requires std::invocable<F, const T &> &&
                     (!std::is_reference_v<std::invoke_result_t<F, const T &>>)
        std::invoke_result_t<F, const T &> visit(F &&op) const
        {
            return std::invoke(std::forward<F>(op), payload_);
        }

        template <typename F>
            requires std::invocable<F, T &> &&
                     (!std::is_reference_v<std::invoke_result_t<F, T &>>)
        std::invoke_result_t<F, T &> visit_mut(F &&op)
        {
            return std::invoke(std::forward<F>(op), payload_);
        }

        /** Hand the payload's text form and class id to the extractor. */
        void extract(Extractor extractor) const
            requires TextRenderable<T>
        {
            if constexpr (std::is_convertible_v<const T &, std::string_view>)
            {
                std::move(extractor).write(class_id(), std::string_view(payload_));
            }
            else
            {
                std::move(extractor).write(class_id(), std::format("{}", payload_));
            }
        }

        /**
         * Debugging aid: "taxonomy.class<****>" with one asterisk per byte of
         * text, capped at MAX_MASK_LENGTH.
         */
        std::string masked() const
            requires TextRenderable<T>
        {
            std::size_t len = 0;
            if constexpr (std::is_convertible_v<const T &, std::string_view>)
            {
                len = std::string_view(payload_).size();
            }
            else
            {
                len = std::formatted_size("{}", payload_);
            }
            return std::format("{}<{}>", class_id().to_string(),
                               std::string(std::min(len, MAX_MASK_LENGTH), '*'));
        }

        bool operator==(const Classified &other) const
            requires std::equality_comparable<T>
        {
            return payload_ == other.payload_;
        }

        auto operator<=>(const Classified &other) const
            requires std::three_way_comparable<T>
        {
            return payload_ <=> other.payload_;
        }

    private:
        T payload_;
    };

    template <DataClassTag Tag, typename T>
    Classified<Tag, std::decay_t<T>> make_classified(T &&payload)
    {
        return Classified<Tag, std::decay_t<T>>(std::forward<T>(payload));
    }

    template <DataClassTag Tag, typename T>
    std::ostream &operator<<(std::ostream &, const Classified<Tag, T> &) = delete;

} // namespace veil

template <veil::DataClassTag Tag, typename T>
    requires requires(const T &v) { std::hash<T>{}(v); }
struct std::hash<veil::Classified<Tag, T>>
{
    std::size_t operator()(const veil::Classified<Tag, T> &value) const
    {
        return value.visit([](const T &payload) { return std::hash<T>{}(payload); });
    }
};
