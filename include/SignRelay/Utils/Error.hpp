#pragma once

#include <expected>        // std::{unexpected, expected}
#include <format>          // std::{format, formatter}
#include <matchit.hpp>     // matchit::{match, is, or_, _}
#include <source_location> // std::source_location
#include <system_error>    // std::error_code

#include "Definitions.hpp"
#include "Types.hpp"

namespace signrelay::utils {
  namespace error {
    namespace {
      using types::Exception;
      using types::String;
      using types::u8;
    } // namespace

    /**
     * @enum RelayErrorCode
     * @brief Error categories reported by the caches, stores and pipeline.
     */
    enum class RelayErrorCode : u8 {
      ApiUnavailable,         ///< An external collaborator (mediator, speech engine) is not available.
      InternalError,          ///< A logic error inside SignRelay itself.
      InvalidArgument,        ///< An invalid argument was passed to a function or method.
      IoError,                ///< General I/O error (filesystem, database file, etc.).
      NotFound,               ///< A required resource was not found.
      NotSupported,           ///< The requested operation is not supported by this instance.
      Other,                  ///< A generic or unclassified error from an external library.
      ParseError,             ///< Failed to parse input (config file, command line).
      PermissionDenied,       ///< Insufficient permissions to perform the operation.
      Timeout,                ///< A generic operation timed out.
      MediationFailure,       ///< The mediator errored or returned unusable output.
      MediationTimeout,       ///< The mediator did not answer before the configured ceiling.
      PersistenceFailure,     ///< The durable key-value store failed to read or write.
      DeserializationFailure, ///< A persisted blob could not be decoded.
      SpeechFailure,          ///< The speech output reported an error while speaking.
    };

    /**
     * @struct RelayError
     * @brief Holds structured information about a failed operation.
     *
     * Used as the error type in Result throughout the library.
     */
    struct RelayError {
      String               message;  ///< A descriptive error message.
      std::source_location location; ///< The source location where the error occurred (file, line, function).
      RelayErrorCode       code;     ///< The general category of the error.

      RelayError(const RelayErrorCode errc, String msg, const std::source_location& loc = std::source_location::current())
        : message(std::move(msg)), location(loc), code(errc) {}

      explicit RelayError(const Exception& exc, const std::source_location& loc = std::source_location::current())
        : message(exc.what()), location(loc), code(RelayErrorCode::InternalError) {}

      explicit RelayError(const std::error_code& errc, const std::source_location& loc = std::source_location::current())
        : message(errc.message()), location(loc) {
        using matchit::match, matchit::is, matchit::or_, matchit::_;
        using enum RelayErrorCode;
        using enum std::errc;

        code = match(errc)(
          is | or_(file_too_large, io_error, no_space_on_device)                            = IoError,
          is | invalid_argument                                                             = InvalidArgument,
          is | or_(operation_not_supported, not_supported)                                  = NotSupported,
          is | or_(no_such_file_or_directory, not_a_directory, is_a_directory, file_exists) = NotFound,
          is | permission_denied                                                            = PermissionDenied,
          is | timed_out                                                                    = Timeout,
          is | _                                                                            = Other
        );
      }
    };
  } // namespace error

  namespace types {
    /**
     * @typedef Result
     * @brief Alias for std::expected<Tp, Er>: either a success value of type Tp
     * or an error value of type Er.
     */
    template <typename Tp = void, typename Er = error::RelayError>
    using Result = std::expected<Tp, Er>;

    /**
     * @typedef Err
     * @brief Alias for std::unexpected<Er>. Used to construct a Result in an error state.
     */
    template <typename Er = error::RelayError>
    using Err = std::unexpected<Er>;
  } // namespace types
} // namespace signrelay::utils

namespace std {
  template <>
  struct formatter<::signrelay::utils::error::RelayErrorCode> : formatter<::signrelay::utils::types::StringView> {
    template <typename FormatContext>
    fn format(signrelay::utils::error::RelayErrorCode code, FormatContext& ctx) const {
      using enum signrelay::utils::error::RelayErrorCode;
      using matchit::match, matchit::is, matchit::_;

      signrelay::utils::types::StringView name = match(code)(
        is | ApiUnavailable         = "ApiUnavailable",
        is | InternalError          = "InternalError",
        is | InvalidArgument        = "InvalidArgument",
        is | IoError                = "IoError",
        is | NotFound               = "NotFound",
        is | NotSupported           = "NotSupported",
        is | Other                  = "Other",
        is | ParseError             = "ParseError",
        is | PermissionDenied       = "PermissionDenied",
        is | Timeout                = "Timeout",
        is | MediationFailure       = "MediationFailure",
        is | MediationTimeout       = "MediationTimeout",
        is | PersistenceFailure     = "PersistenceFailure",
        is | DeserializationFailure = "DeserializationFailure",
        is | SpeechFailure          = "SpeechFailure",
        is | _                      = "Unknown"
      );

      return formatter<signrelay::utils::types::StringView>::format(name, ctx);
    }
  };
} // namespace std

#define ERR(errc, msg)          return ::signrelay::utils::types::Err(::signrelay::utils::error::RelayError(errc, msg))
#define ERR_FROM(err)           return ::signrelay::utils::types::Err(::signrelay::utils::error::RelayError(err))
#define ERR_FMT(errc, fmt, ...) return ::signrelay::utils::types::Err(::signrelay::utils::error::RelayError(errc, std::format(fmt, __VA_ARGS__)))
