#pragma once

#include <expected>
#include <stdexcept>
#include <string>

namespace veil
{

    /**
     * Error categories for veil operations
     */
    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        InvalidSecret,
        InvalidInput,
        IOError
    };

    /**
     * Convert ErrorCode to string representation
     */
    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::CryptoError:
            return "CryptoError";
        case ErrorCode::InvalidSecret:
            return "InvalidSecret";
        case ErrorCode::InvalidInput:
            return "InvalidInput";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * veil error with code and message
     */
    class VeilError : public std::runtime_error
    {
    public:
        ErrorCode code;

        VeilError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static VeilError config(const std::string &msg)
        {
            return VeilError(ErrorCode::ConfigError, msg);
        }

        static VeilError crypto(const std::string &msg)
        {
            return VeilError(ErrorCode::CryptoError, msg);
        }

        static VeilError invalid_secret(const std::string &msg)
        {
            return VeilError(ErrorCode::InvalidSecret, msg);
        }

        static VeilError invalid_input(const std::string &msg)
        {
            return VeilError(ErrorCode::InvalidInput, msg);
        }

        static VeilError io(const std::string &msg)
        {
            return VeilError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, VeilError>;

} // namespace veil
