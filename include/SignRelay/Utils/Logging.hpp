#pragma once

#include <atomic>      // std::atomic
#include <chrono>      // std::chrono::system_clock
#include <ctime>       // localtime_r/s, strftime, time_t, tm
#include <filesystem>  // std::filesystem::path
#include <format>      // std::format
#include <matchit.hpp> // matchit::{match, is}
#include <utility>     // std::forward

#ifdef __cpp_lib_print
  #include <cstdio> // stderr
  #include <print>  // std::print
#else
  #include <iostream> // std::{cout, cerr}
#endif

#ifndef NDEBUG
  #include <source_location> // std::source_location
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace signrelay::utils::logging {
  namespace {
    using types::Array;
    using types::LockGuard;
    using types::Mutex;
    using types::PCStr;
    using types::String;
    using types::StringView;
    using types::u8;
    using types::Unit;
    using types::usize;
  } // namespace

  inline fn GetLogMutex() -> Mutex& {
    static Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  /**
   * @enum LogColor
   * @brief The 16 basic terminal colors, in ANSI palette order.
   */
  enum class LogColor : u8 {
    Black,
    Red,
    Green,
    Yellow,
    Blue,
    Magenta,
    Cyan,
    Gray,
    DarkGray,
    BrightRed,
    BrightGreen,
    BrightYellow,
    BrightBlue,
    BrightMagenta,
    BrightCyan,
    White,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr Array<StringView, 16> COLOR_CODE_LITERALS = {
      "\033[38;5;0m",  "\033[38;5;1m",  "\033[38;5;2m",  "\033[38;5;3m",
      "\033[38;5;4m",  "\033[38;5;5m",  "\033[38;5;6m",  "\033[38;5;7m",
      "\033[38;5;8m",  "\033[38;5;9m",  "\033[38;5;10m", "\033[38;5;11m",
      "\033[38;5;12m", "\033[38;5;13m", "\033[38;5;14m", "\033[38;5;15m",
    };
    // clang-format on

    static constexpr PCStr RESET_CODE   = "\033[0m";
    static constexpr PCStr BOLD_START   = "\033[1m";
    static constexpr PCStr BOLD_END     = "\033[22m";
    static constexpr PCStr ITALIC_START = "\033[3m";
    static constexpr PCStr ITALIC_END   = "\033[23m";

    static constexpr StringView DEBUG_STR = "DEBUG";
    static constexpr StringView INFO_STR  = "INFO ";
    static constexpr StringView WARN_STR  = "WARN ";
    static constexpr StringView ERROR_STR = "ERROR";

    static constexpr LogColor DEBUG_COLOR      = LogColor::Cyan;
    static constexpr LogColor INFO_COLOR       = LogColor::Green;
    static constexpr LogColor WARN_COLOR       = LogColor::Yellow;
    static constexpr LogColor ERROR_COLOR      = LogColor::Red;
    static constexpr LogColor DEBUG_INFO_COLOR = LogColor::Gray;

    static constexpr PCStr TIMESTAMP_FORMAT = "%X";
    static constexpr PCStr LOG_FORMAT       = "{} {} {}";

#ifndef NDEBUG
    static constexpr PCStr FILE_LINE_FORMAT  = "{}:{}";
    static constexpr PCStr DEBUG_LINE_PREFIX = "           ╰──── ";
#endif
  };

  /**
   * @enum LogLevel
   * @brief Represents different log levels.
   */
  enum class LogLevel : u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  inline fn GetRuntimeLogLevel() -> std::atomic<LogLevel>& {
    static std::atomic<LogLevel> RuntimeLogLevel = LogLevel::Info;
    return RuntimeLogLevel;
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) -> Unit {
    GetRuntimeLogLevel().store(level);
  }

  /**
   * @brief Wraps text in the ANSI escape for a palette color.
   * @param text The text to colorize
   * @param color The palette color
   * @return Styled string with ANSI codes
   */
  inline fn Colorize(const StringView text, const LogColor color) -> String {
    return std::format("{}{}{}", LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<usize>(color)), text, LogLevelConst::RESET_CODE);
  }

  inline fn Bold(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::BOLD_START, text, LogLevelConst::BOLD_END);
  }

  inline fn Italic(const StringView text) -> String {
    return std::format("{}{}{}", LogLevelConst::ITALIC_START, text, LogLevelConst::ITALIC_END);
  }

  /**
   * @brief Returns the pre-formatted and styled log level strings.
   * @note Function-local static to sidestep static initialization order.
   */
  inline fn GetLevelInfo() -> const Array<String, 4>& {
    static const Array<String, 4> LEVEL_INFO_INSTANCE = {
      Bold(Colorize(LogLevelConst::DEBUG_STR, LogLevelConst::DEBUG_COLOR)),
      Bold(Colorize(LogLevelConst::INFO_STR, LogLevelConst::INFO_COLOR)),
      Bold(Colorize(LogLevelConst::WARN_STR, LogLevelConst::WARN_COLOR)),
      Bold(Colorize(LogLevelConst::ERROR_STR, LogLevelConst::ERROR_COLOR)),
    };
    return LEVEL_INFO_INSTANCE;
  }

  constexpr fn GetLevelColor(const LogLevel level) -> LogColor {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogLevelConst::DEBUG_COLOR,
      is | Info  = LogLevelConst::INFO_COLOR,
      is | Warn  = LogLevelConst::WARN_COLOR,
      is | Error = LogLevelConst::ERROR_COLOR
    );
  }

  constexpr fn GetLevelString(const LogLevel level) -> StringView {
    using namespace matchit;
    using enum LogLevel;

    return match(level)(
      is | Debug = LogLevelConst::DEBUG_STR,
      is | Info  = LogLevelConst::INFO_STR,
      is | Warn  = LogLevelConst::WARN_STR,
      is | Error = LogLevelConst::ERROR_STR
    );
  }

  template <typename... Args>
  inline fn Print(std::format_string<Args...> fmt, Args&&... args) -> Unit {
#ifdef __cpp_lib_print
    std::print(fmt, std::forward<Args>(args)...);
#else
    std::cout << std::format(fmt, std::forward<Args>(args)...);
#endif
  }

  inline fn Print(const StringView text) -> Unit {
#ifdef __cpp_lib_print
    std::print("{}", text);
#else
    std::cout << text;
#endif
  }

  template <typename... Args>
  inline fn Println(std::format_string<Args...> fmt, Args&&... args) -> Unit {
#ifdef __cpp_lib_print
    std::println(fmt, std::forward<Args>(args)...);
#else
    std::cout << std::format(fmt, std::forward<Args>(args)...) << '\n';
#endif
  }

  inline fn Println(const StringView text) -> Unit {
#ifdef __cpp_lib_print
    std::println("{}", text);
#else
    std::cout << text << '\n';
#endif
  }

  inline fn Println() -> Unit {
#ifdef __cpp_lib_print
    std::println();
#else
    std::cout << '\n';
#endif
  }

  /**
   * @brief Formats the current local time with TIMESTAMP_FORMAT.
   * @return The formatted time, or "??:??:??" if the local time is unavailable.
   */
  inline fn CurrentTimestamp() -> String {
    using std::chrono::system_clock;

    const std::time_t nowTt = system_clock::to_time_t(system_clock::now());
    std::tm           localTm {};

#ifdef _WIN32
    if (localtime_s(&localTm, &nowTt) != 0)
#else
    if (localtime_r(&nowTt, &localTm) == nullptr)
#endif
      return "??:??:??";

    Array<char, 64> timeBuffer {};

    if (std::strftime(timeBuffer.data(), timeBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
      return "??:??:??";

    return timeBuffer.data();
  }

  /**
   * @brief Writes one finished log record to stderr.
   * @note stdout is reserved for program output (subtitles, spoken text, JSON statistics).
   */
  inline fn WriteRecord(const StringView record) -> Unit {
#ifdef __cpp_lib_print
    std::print(stderr, "{}", record);
#else
    std::cerr << record;
#endif
  }

  /**
   * @brief Logs a message with the specified log level, source location, and format string.
   *
   * Each record is written with a single call under the log mutex.
   *
   * @tparam Args Parameter pack for format arguments.
   * @param level The log level (DEBUG, INFO, WARN, ERROR).
   * @param loc The source location of the log message (only in Debug builds).
   * @param fmt The format string.
   * @param args The arguments for the format string.
   */
  template <typename... Args>
  fn LogImpl(
    const LogLevel level,
#ifndef NDEBUG
    const std::source_location& loc,
#endif
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> Unit {
    if (level < GetRuntimeLogLevel().load())
      return;

    String record = std::format(
      LogLevelConst::LOG_FORMAT,
      Colorize(std::format("[{}]", CurrentTimestamp()), LogLevelConst::DEBUG_INFO_COLOR),
      GetLevelInfo().at(static_cast<usize>(level)),
      std::format(fmt, std::forward<Args>(args)...)
    );

#ifndef NDEBUG
    const String fileLine = std::format(LogLevelConst::FILE_LINE_FORMAT, std::filesystem::path(loc.file_name()).lexically_normal().string(), loc.line());
    record += std::format("\n{}{}", Italic(Colorize(std::format("{}{}", LogLevelConst::DEBUG_LINE_PREFIX, fileLine), LogLevelConst::DEBUG_INFO_COLOR)), LogLevelConst::RESET_CODE);
#else
    record += LogLevelConst::RESET_CODE;
#endif

    record += '\n';

    const LockGuard lock(GetLogMutex());
    WriteRecord(record);
  }

  template <typename ErrorType>
  fn LogError(const LogLevel level, const ErrorType& errorObj) -> Unit {
    using DecayedErrorType = std::decay_t<ErrorType>;

#ifndef NDEBUG
    std::source_location logLocation = std::source_location::current();
#endif

    String errorMessagePart;

    if constexpr (std::is_same_v<DecayedErrorType, error::RelayError>) {
#ifndef NDEBUG
      logLocation = errorObj.location;
#endif
      errorMessagePart = std::format("{} ({})", errorObj.message, errorObj.code);
    } else if constexpr (std::is_base_of_v<std::exception, DecayedErrorType>)
      errorMessagePart = errorObj.what();
    else if constexpr (requires { errorObj.message; })
      errorMessagePart = errorObj.message;
    else
      errorMessagePart = "Unknown error type logged";

#ifndef NDEBUG
    LogImpl(level, logLocation, "{}", errorMessagePart);
#else
    LogImpl(level, "{}", errorMessagePart);
#endif
  }

#define debug_at(error_obj) ::signrelay::utils::logging::LogError(::signrelay::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::signrelay::utils::logging::LogError(::signrelay::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::signrelay::utils::logging::LogError(::signrelay::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::signrelay::utils::logging::LogError(::signrelay::utils::logging::LogLevel::Error, error_obj)

#ifdef NDEBUG
  #define debug_log(fmt, ...) ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Debug, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...)  ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Info, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...)  ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Warn, fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Error, fmt __VA_OPT__(, ) __VA_ARGS__)
#else
  #define debug_log(fmt, ...) \
    ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define info_log(fmt, ...) \
    ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define warn_log(fmt, ...) \
    ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
  #define error_log(fmt, ...) \
    ::signrelay::utils::logging::LogImpl(::signrelay::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#endif
} // namespace signrelay::utils::logging
