// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <absl/time/time.h>

namespace custos::log {

//! Severity of a log line, ordered from always shown to most verbose
enum class Level {
    kNone,  // unconditional lines
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace
};

struct Settings {
    //! Console lines go to std::cout instead of std::cerr
    bool log_std_out{false};
    //! Timestamps in UTC instead of the local time zone
    bool log_utc{true};
    bool log_nocolor{false};
    //! Add the id of the emitting thread to each line
    bool log_threads{false};
    Level log_verbosity{Level::kNone};
    //! When not empty every line is also appended, uncolored, to this file
    std::string log_file;
};

//! Applies settings process-wide; call once at startup
//! \throws std::runtime_error if the log file cannot be opened
void init(const Settings& settings = {});

Level get_verbosity();
void set_verbosity(Level level);

//! Whether a line at level would be written with the current settings
bool test_verbosity(Level level);

//! Appends every following line to the file at path
//! \throws std::runtime_error if the file cannot be opened
void tee_file(const std::filesystem::path& path);

//! Alternating keys and values; a trailing odd element is printed on its own
using Args = std::vector<std::string>;

//! Everything a line is made of, before rendering
struct Record {
    Level level{Level::kNone};
    absl::Time time;
    //! Default constructed unless thread ids are enabled
    std::thread::id thread;
    std::string message;
    Args args;
};

//! Renders record on a single line, with ANSI colors when colorized is set
std::string format(const Record& record, bool colorized);

//! One log line, written on destruction when its level passes the verbosity check
class Line {
  public:
    explicit Line(Level level, std::string_view message = {}, Args args = {});
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <class T>
    Line& operator<<(const T& value) {
        if (enabled_) text_ << value;
        return *this;
    }
    Line& operator<<(const Args& args);

    bool enabled() const { return enabled_; }

    //! The record as it would be written now
    Record record() const;

  private:
    const bool enabled_;
    Record record_;
    std::ostringstream text_;
};

template <Level kLevel>
class LineAt : public Line {
  public:
    explicit LineAt(std::string_view message = {}, Args args = {}) : Line(kLevel, message, std::move(args)) {}
};

using Trace = LineAt<Level::kTrace>;
using Debug = LineAt<Level::kDebug>;
using Info = LineAt<Level::kInfo>;
using Warning = LineAt<Level::kWarning>;
using Error = LineAt<Level::kError>;

}  // namespace custos::log

// Streamed arguments are not evaluated when the level is filtered out
#define CUSTOS_LOG(level_)                          \
    if (!custos::log::test_verbosity(level_)) {     \
    } else                                          \
        custos::log::Line(level_)

#define CUSTOS_TRACE CUSTOS_LOG(custos::log::Level::kTrace)
#define CUSTOS_DEBUG CUSTOS_LOG(custos::log::Level::kDebug)
#define CUSTOS_INFO CUSTOS_LOG(custos::log::Level::kInfo)
#define CUSTOS_WARN CUSTOS_LOG(custos::log::Level::kWarning)
#define CUSTOS_ERROR CUSTOS_LOG(custos::log::Level::kError)
