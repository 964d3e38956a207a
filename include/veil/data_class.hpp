#pragma once

#include "classified.hpp"
#include <string_view>

/**
 * Shorthand for declaring a data class tag and its container alias. The
 * hand-written form is documented at DataClassTag in classified.hpp; this
 * macro expands to exactly that.
 *
 *   VEIL_DATA_CLASS(EmailAddress, "pii", "email_address");
 *
 * expands to a tag struct EmailAddressClass and
 *
 *   template <typename T> using EmailAddress = veil::Classified<EmailAddressClass, T>;
 *
 * Use at namespace scope. The class name is conventionally snake_case.
 */
#define VEIL_DATA_CLASS(wrapper, taxonomy_name, class_name)          \
    struct wrapper##Class                                            \
    {                                                                \
        static constexpr std::string_view taxonomy{taxonomy_name};   \
        static constexpr std::string_view name{class_name};          \
    };                                                               \
    template <typename T>                                            \
    using wrapper = ::veil::Classified<wrapper##Class, T>
