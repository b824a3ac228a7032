#pragma once

#include <algorithm>       // std::copy_n
#include <chrono>          // std::chrono::system_clock
#include <ctime>           // localtime_r, strftime, time_t, tm
#include <filesystem>      // std::filesystem::path
#include <format>          // std::format
#include <source_location> // std::source_location
#include <utility>         // std::forward

#ifdef __cpp_lib_print
  #include <print> // std::print
#else
  #include <iostream> // std::cout, std::cerr
#endif

#include "Error.hpp"
#include "Types.hpp"

namespace plm::utils::logging {
  namespace types = ::plm::utils::types;

  inline fn GetLogMutex() -> types::Mutex& {
    static types::Mutex LogMutexInstance;
    return LogMutexInstance;
  }

  inline fn WriteToConsole(const types::StringView text, const bool useStderr = false) -> void {
#ifdef __cpp_lib_print
    if (useStderr)
      std::print(stderr, "{}", text);
    else
      std::print("{}", text);
#else
    if (useStderr)
      std::cerr << text;
    else
      std::cout << text;
#endif
  }

  enum class LogColor : types::u8 {
    Black   = 0,
    Red     = 1,
    Green   = 2,
    Yellow  = 3,
    Blue    = 4,
    Magenta = 5,
    Cyan    = 6,
    White   = 7,
    Gray    = 8,
  };

  struct LogLevelConst {
    // clang-format off
    static constexpr types::Array<types::StringView, 9> COLOR_CODE_LITERALS = {
      "\033[38;5;0m", "\033[38;5;1m", "\033[38;5;2m",
      "\033[38;5;3m", "\033[38;5;4m", "\033[38;5;5m",
      "\033[38;5;6m", "\033[38;5;7m", "\033[38;5;8m",
    };
    // clang-format on

    static constexpr types::PCStr RESET_CODE   = "\033[0m";
    static constexpr types::PCStr BOLD_START   = "\033[1m";
    static constexpr types::PCStr ITALIC_START = "\033[3m";

    static constexpr types::StringView DEBUG_STYLED = "\033[1m\033[38;5;6mDEBUG\033[0m";
    static constexpr types::StringView INFO_STYLED  = "\033[1m\033[38;5;2mINFO \033[0m";
    static constexpr types::StringView WARN_STYLED  = "\033[1m\033[38;5;3mWARN \033[0m";
    static constexpr types::StringView ERROR_STYLED = "\033[1m\033[38;5;1mERROR\033[0m";

    static constexpr types::PCStr TIMESTAMP_FORMAT  = "%X";
    static constexpr types::PCStr DEBUG_LINE_PREFIX = "           ╰──── ";
  };

  /**
   * @enum LogLevel
   * @brief Minimum severity a message needs to be printed.
   */
  enum class LogLevel : types::u8 {
    Debug,
    Info,
    Warn,
    Error,
  };

  inline fn GetLogLevelPtrStorage() -> LogLevel*& {
    static LogLevel* Ptr = nullptr;
    return Ptr;
  }

  inline fn GetLocalLogLevel() -> LogLevel& {
    static LogLevel Level = LogLevel::Info;
    return Level;
  }

  /**
   * @brief Points this module's logger at another module's level storage.
   * @details Dynamically loaded plugins carry their own copy of this header;
   *          the loader hands them the host's level so both stay in sync.
   */
  inline fn SetLogLevelPtr(LogLevel* ptr) -> void {
    GetLogLevelPtrStorage() = ptr;
  }

  inline fn GetLogLevelPtr() -> LogLevel* {
    return &GetLocalLogLevel();
  }

  inline fn GetRuntimeLogLevel() -> LogLevel& {
    if (LogLevel* ptr = GetLogLevelPtrStorage())
      return *ptr;

    return GetLocalLogLevel();
  }

  inline fn SetRuntimeLogLevel(const LogLevel level) -> void {
    GetRuntimeLogLevel() = level;
  }

  struct Style {
    LogColor color  = LogColor::White;
    bool     bold   = false;
    bool     italic = false;
  };

  /**
   * @brief Wraps text in ANSI codes for the requested style.
   * @details Order is bold, italic, color, text, reset. Plain white text is returned unchanged.
   */
  inline fn Stylize(const types::StringView text, const Style& style) -> types::String {
    if (!style.bold && !style.italic && style.color == LogColor::White)
      return types::String(text);

    types::String result;
    result.reserve(text.size() + 24);

    if (style.bold)
      result += LogLevelConst::BOLD_START;
    if (style.italic)
      result += LogLevelConst::ITALIC_START;
    if (style.color != LogColor::White)
      result += LogLevelConst::COLOR_CODE_LITERALS.at(static_cast<types::usize>(style.color));

    result += text;
    result += LogLevelConst::RESET_CODE;

    return result;
  }

  constexpr fn GetLevelTag(const LogLevel level) -> types::StringView {
    switch (level) {
      case LogLevel::Debug: return LogLevelConst::DEBUG_STYLED;
      case LogLevel::Info:  return LogLevelConst::INFO_STYLED;
      case LogLevel::Warn:  return LogLevelConst::WARN_STYLED;
      case LogLevel::Error: return LogLevelConst::ERROR_STYLED;
    }

    return LogLevelConst::INFO_STYLED;
  }

  constexpr fn ShouldUseStderr(const LogLevel level) -> bool {
    return level == LogLevel::Warn || level == LogLevel::Error;
  }

  /**
   * @brief HH:MM:SS for the given epoch second, cached per thread.
   */
  inline fn GetCachedTimestamp(const std::time_t timeT) -> types::StringView {
    thread_local auto                  LastTt   = static_cast<std::time_t>(-1);
    thread_local types::Array<char, 9> TsBuffer = { '\0' };

    if (timeT != LastTt) {
      std::tm localTm {};

      if (localtime_r(&timeT, &localTm) == nullptr ||
          std::strftime(TsBuffer.data(), TsBuffer.size(), LogLevelConst::TIMESTAMP_FORMAT, &localTm) == 0)
        std::copy_n("??:??:??", 9, TsBuffer.data());

      LastTt = timeT;
    }

    return { TsBuffer.data(), 8 };
  }

  template <typename... Args>
  fn LogImpl(
    const LogLevel              level,
    const std::source_location& loc,
    std::format_string<Args...> fmt,
    Args&&... args
  ) -> void {
    using std::chrono::system_clock;

    if (level < GetRuntimeLogLevel())
      return;

    const std::time_t       nowTt     = system_clock::to_time_t(system_clock::now());
    const types::StringView timestamp = GetCachedTimestamp(nowTt);

    types::String line = std::format(
      "{} {} {}\n",
      Stylize(std::format("[{}]", timestamp), { .color = LogColor::Gray }),
      GetLevelTag(level),
      std::format(fmt, std::forward<Args>(args)...)
    );

#ifndef NDEBUG
    const types::String fileLine = std::format(
      "{}{}:{}",
      LogLevelConst::DEBUG_LINE_PREFIX,
      std::filesystem::path(loc.file_name()).lexically_normal().string(),
      loc.line()
    );

    line += Stylize(fileLine, { .color = LogColor::Gray, .italic = true });
    line += '\n';
#else
    (void)loc;
#endif

    const types::LockGuard lock(GetLogMutex());
    WriteToConsole(line, ShouldUseStderr(level));
  }

  /**
   * @brief Logs a PlmError, attributing it to the place it was raised.
   */
  inline fn LogError(const LogLevel level, const error::PlmError& err) -> void {
    LogImpl(level, err.location, "{}", err.message);
  }

#define debug_at(error_obj) ::plm::utils::logging::LogError(::plm::utils::logging::LogLevel::Debug, error_obj)
#define info_at(error_obj)  ::plm::utils::logging::LogError(::plm::utils::logging::LogLevel::Info, error_obj)
#define warn_at(error_obj)  ::plm::utils::logging::LogError(::plm::utils::logging::LogLevel::Warn, error_obj)
#define error_at(error_obj) ::plm::utils::logging::LogError(::plm::utils::logging::LogLevel::Error, error_obj)

#define debug_log(fmt, ...) \
  ::plm::utils::logging::LogImpl(::plm::utils::logging::LogLevel::Debug, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#define info_log(fmt, ...) \
  ::plm::utils::logging::LogImpl(::plm::utils::logging::LogLevel::Info, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#define warn_log(fmt, ...) \
  ::plm::utils::logging::LogImpl(::plm::utils::logging::LogLevel::Warn, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
#define error_log(fmt, ...) \
  ::plm::utils::logging::LogImpl(::plm::utils::logging::LogLevel::Error, std::source_location::current(), fmt __VA_OPT__(, ) __VA_ARGS__)
} // namespace plm::utils::logging
