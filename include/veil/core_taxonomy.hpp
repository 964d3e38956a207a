#pragma once

#include "class_id.hpp"
#include "data_class.hpp"

/**
 * Universal data classes for code that is agnostic of an application's own
 * taxonomy (libraries, shared infrastructure).
 */
namespace veil::core_taxonomy
{
    inline constexpr std::string_view TAXONOMY = "core";

    /** Data that must be treated carefully, without saying why. */
    VEIL_DATA_CLASS(Sensitive, "core", "sensitive");

    /** Data that is explicitly not classified. */
    VEIL_DATA_CLASS(Insensitive, "core", "insensitive");

    /** Data whose classification is not known. */
    VEIL_DATA_CLASS(UnknownSensitivity, "core", "unknown_sensitivity");

    inline const ClassId SENSITIVE = class_id_of<SensitiveClass>();
    inline const ClassId INSENSITIVE = class_id_of<InsensitiveClass>();
    inline const ClassId UNKNOWN_SENSITIVITY = class_id_of<UnknownSensitivityClass>();

} // namespace veil::core_taxonomy
