// ----------------------------------------------------------------------------
// -                  MapNav: SpaceMouse navigation for QGIS                  -
// ----------------------------------------------------------------------------
// The MIT License (MIT)
//
// Copyright (c) 2026 MapNav contributors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
// FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
// IN THE SOFTWARE.
// ----------------------------------------------------------------------------

#pragma once

#include <functional>
#include <memory>
#include <string>

#include <fmt/format.h>

#ifdef _MSC_VER
#define MAPNAV_FUNCTION __FUNCSIG__
#else
#define MAPNAV_FUNCTION __PRETTY_FUNCTION__
#endif

// Mimic "macro in namespace" by concatenating `utility::` and a macro.
//
// Usage:
// utility::LogError("Hello {}", "World");
#define LogError(...)                     \
    Logger::LogError_(__FILE__, __LINE__, \
                      static_cast<const char *>(MAPNAV_FUNCTION), __VA_ARGS__)
#define LogWarning(...)                                             \
    Logger::LogWarning_(__FILE__, __LINE__,                         \
                        static_cast<const char *>(MAPNAV_FUNCTION), \
                        __VA_ARGS__)
#define LogInfo(...)                     \
    Logger::LogInfo_(__FILE__, __LINE__, \
                     static_cast<const char *>(MAPNAV_FUNCTION), __VA_ARGS__)
#define LogDebug(...)                     \
    Logger::LogDebug_(__FILE__, __LINE__, \
                      static_cast<const char *>(MAPNAV_FUNCTION), __VA_ARGS__)

namespace mapnav {
namespace utility {

enum class VerbosityLevel {
    /// LogError throws a std::runtime_error with the given message. Use it
    /// when there is no point in continuing and the error is not reported
    /// through a return value.
    Error = 0,
    /// LogWarning reports a problem that is also signaled another way, or a
    /// state that does not stop the caller but is probably not what the
    /// user expected (a device that could not be opened, a bad setting).
    Warning = 1,
    /// LogInfo informs the user about expected events, e.g. a device was
    /// connected.
    Info = 2,
    /// LogDebug prints additional information on internal state.
    Debug = 3,
};

/// Logger class should be used as a global singleton object (GetInstance()).
class Logger {
public:
    Logger(Logger const &) = delete;
    void operator=(Logger const &) = delete;

    /// Get Logger global singleton instance.
    static Logger &GetInstance();

    /// Overwrite the default print function. The QGIS plugin uses this to
    /// route messages into the QGIS message log instead of stdout.
    ///
    /// \param print_fcn The function for printing. It should take a string
    /// input and return nothing.
    void SetPrintFunction(std::function<void(const std::string &)> print_fcn);

    /// Reset the print function to the default one (print to console).
    void ResetPrintFunction();

    /// Get the print function used by the Logger.
    const std::function<void(const std::string &)> GetPrintFunction();

    /// Set global verbosity level.
    ///
    /// \param verbosity_level Messages with equal or less than
    /// verbosity_level verbosity will be printed.
    void SetVerbosityLevel(VerbosityLevel verbosity_level);

    /// Get global verbosity level.
    VerbosityLevel GetVerbosityLevel() const;

    template <typename... Args>
    static void LogError_ [[noreturn]] (const char *file,
                                        int line,
                                        const char *function,
                                        const char *format,
                                        Args &&... args) {
        Logger::GetInstance().VError(file, line, function,
                                     FormatArgs(format, args...));
    }

    template <typename... Args>
    static void LogWarning_(const char *file,
                            int line,
                            const char *function,
                            const char *format,
                            Args &&... args) {
        if (Logger::GetInstance().GetVerbosityLevel() >=
            VerbosityLevel::Warning) {
            Logger::GetInstance().VWarning(file, line, function,
                                           FormatArgs(format, args...));
        }
    }

    template <typename... Args>
    static void LogInfo_(const char *file,
                         int line,
                         const char *function,
                         const char *format,
                         Args &&... args) {
        if (Logger::GetInstance().GetVerbosityLevel() >=
            VerbosityLevel::Info) {
            Logger::GetInstance().VInfo(file, line, function,
                                        FormatArgs(format, args...));
        }
    }

    template <typename... Args>
    static void LogDebug_(const char *file,
                          int line,
                          const char *function,
                          const char *format,
                          Args &&... args) {
        if (Logger::GetInstance().GetVerbosityLevel() >=
            VerbosityLevel::Debug) {
            Logger::GetInstance().VDebug(file, line, function,
                                         FormatArgs(format, args...));
        }
    }

private:
    Logger();

    static std::string FormatArgs(const char *format) {
        return std::string(format);
    }

    template <typename... Args>
    static std::string FormatArgs(const char *format, Args &... args) {
        return fmt::vformat(format, fmt::make_format_args(args...));
    }

    void VError [[noreturn]] (const char *file,
                              int line,
                              const char *function,
                              const std::string &message) const;
    void VWarning(const char *file,
                  int line,
                  const char *function,
                  const std::string &message) const;
    void VInfo(const char *file,
               int line,
               const char *function,
               const std::string &message) const;
    void VDebug(const char *file,
                int line,
                const char *function,
                const std::string &message) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Set global verbosity level.
///
/// \param level Messages with equal or less than verbosity_level verbosity
/// will be printed.
void SetVerbosityLevel(VerbosityLevel level);

/// Get global verbosity level.
VerbosityLevel GetVerbosityLevel();

/// Temporarily changes the verbosity level. The previous level is restored
/// when the object goes out of scope.
class VerbosityContextManager {
public:
    explicit VerbosityContextManager(VerbosityLevel level)
        : level_backup_(Logger::GetInstance().GetVerbosityLevel()) {
        Logger::GetInstance().SetVerbosityLevel(level);
    }
    ~VerbosityContextManager() {
        Logger::GetInstance().SetVerbosityLevel(level_backup_);
    }

    VerbosityContextManager(const VerbosityContextManager &) = delete;
    VerbosityContextManager &operator=(const VerbosityContextManager &) =
            delete;

private:
    VerbosityLevel level_backup_;
};

}  // namespace utility
}  // namespace mapnav
