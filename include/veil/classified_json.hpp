#pragma once

#include "classified.hpp"
#include <nlohmann/json.hpp>

/**
 * JSON support for classified containers.
 *
 * A container serializes as its bare payload, with no redaction and no class
 * marker, and deserializes from the same shape. This is a storage channel,
 * not a telemetry one: whatever persists the JSON is responsible for
 * protecting it.
 */
namespace nlohmann
{
    template <veil::DataClassTag Tag, typename T>
    struct adl_serializer<veil::Classified<Tag, T>>
    {
        static void to_json(json &j, const veil::Classified<Tag, T> &value)
        {
            value.visit([&j](const T &payload) { j = payload; });
        }

        static veil::Classified<Tag, T> from_json(const json &j)
        {
            return veil::Classified<Tag, T>(j.template get<T>());
        }
    };

} // namespace nlohmann
