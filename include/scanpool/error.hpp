#pragma once
#include <string>

namespace scanpool {
    /**
     * @brief Represents an error raised by a transport, a pool, a batch or
     * the configuration surface.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,         /**< The request URL is malformed. */
            ConnectionFailed,   /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed, /**< Failed to perform TLS handshake. */
            Timeout,            /**< A transport ceiling expired. */
            SendFailed,         /**< Failed to send the request. */
            ReceiveFailed,      /**< Failed to receive the response. */
            NetworkError,       /**< General network error. */
            InvalidConfiguration, /**< Unknown key or mistyped value. */
            Interrupted,        /**< External interrupt, batch cancelled. */
            UserQuit,           /**< User asked to quit the scan. */
            SkipTarget,         /**< User asked to skip the current target. */
            UnitFailure,        /**< A unit of work failed. */
            Unknown,            /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Convert an error code to its name for logging or diagnostics
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::Timeout:
                return "Timeout";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::NetworkError:
                return "NetworkError";
            case Error::Code::InvalidConfiguration:
                return "InvalidConfiguration";
            case Error::Code::Interrupted:
                return "Interrupted";
            case Error::Code::UserQuit:
                return "UserQuit";
            case Error::Code::SkipTarget:
                return "SkipTarget";
            case Error::Code::UnitFailure:
                return "UnitFailure";
            case Error::Code::Unknown:
                return "Unknown";
        }
        return "Unknown";
    }

    /// @brief True for codes a user raises on purpose to stop the scan or
    /// the current target. These are never logged as errors.
    inline constexpr bool is_intentional_abort(Error::Code code) noexcept {
        return code == Error::Code::UserQuit || code == Error::Code::SkipTarget;
    }

    /// @brief True for every code that short-circuits a batch.
    inline constexpr bool is_cancellation(Error::Code code) noexcept {
        return code == Error::Code::Interrupted || is_intentional_abort(code);
    }

    /// @brief True for failures that originate in the transport layer.
    inline constexpr bool is_transport_error(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::ConnectionFailed:
            case Error::Code::TlsHandshakeFailed:
            case Error::Code::Timeout:
            case Error::Code::SendFailed:
            case Error::Code::ReceiveFailed:
            case Error::Code::NetworkError:
                return true;
            default:
                return false;
        }
    }
}  // namespace scanpool
