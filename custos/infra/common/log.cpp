// Copyright 2025 The Custos Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <absl/time/clock.h>

#include <custos/infra/common/terminal.hpp>

namespace custos::log {

namespace {

Settings settings;
bool console_colorized{false};
std::mutex output_mutex;
std::unique_ptr<std::ofstream> tee;

// Message column width when key/value pairs follow
constexpr size_t kMessageWidth{36};

struct LevelStyle {
    std::string_view tag;
    std::string_view color;
};

LevelStyle style_of(Level level) {
    switch (level) {
        case Level::kCritical:
            return {"CRIT ", kBackgroundRed};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kWarning:
            return {"WARN ", kColorOrangeHigh};
        case Level::kInfo:
            return {"INFO ", kColorGreen};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kNone:
            break;
    }
    return {"     ", kColorReset};
}

std::ostream& console() { return settings.log_std_out ? std::cout : std::cerr; }

}  // namespace

void init(const Settings& new_settings) {
    settings = new_settings;
    tee.reset();
    if (!settings.log_file.empty()) {
        tee_file(settings.log_file);
    }
    console_colorized = !settings.log_nocolor && is_terminal(settings.log_std_out ? stdout : stderr);
}

Level get_verbosity() { return settings.log_verbosity; }

void set_verbosity(Level level) { settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings.log_verbosity; }

void tee_file(const std::filesystem::path& path) {
    auto file{std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app)};
    if (!file->is_open()) {
        throw std::runtime_error("Could not open log file " + path.string());
    }
    std::scoped_lock lock{output_mutex};
    tee = std::move(file);
}

std::string format(const Record& record, bool colorized) {
    const auto paint = [colorized](std::string_view color, std::string_view text) {
        return colorized ? std::string{color} + std::string{text} + std::string{kColorReset} : std::string{text};
    };

    const LevelStyle style{style_of(record.level)};
    const absl::TimeZone zone{settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};

    std::string line{paint(style.color, style.tag)};
    line += ' ';
    line += paint(kColorCoal, "[" + absl::FormatTime("%Y-%m-%dT%H:%M:%E3S%Ez", record.time, zone) + "]");
    if (record.thread != std::thread::id{}) {
        std::ostringstream id;
        id << record.thread;
        line += " [" + id.str() + "]";
    }
    line += ' ';
    line += record.message;

    if (!record.args.empty()) {
        if (record.message.size() < kMessageWidth) {
            line.append(kMessageWidth - record.message.size(), ' ');
        }
        for (size_t i{0}; i < record.args.size(); i += 2) {
            line += ' ';
            if (i + 1 == record.args.size()) {
                line += paint(kColorWhite, record.args[i]);
                break;
            }
            line += paint(kColorGreen, record.args[i]);
            line += '=';
            line += paint(kColorWhite, record.args[i + 1]);
        }
    }
    return line;
}

Line::Line(Level level, std::string_view message, Args args) : enabled_{test_verbosity(level)} {
    if (!enabled_) return;
    record_.level = level;
    record_.time = absl::Now();
    if (settings.log_threads) {
        record_.thread = std::this_thread::get_id();
    }
    record_.args = std::move(args);
    text_ << message;
}

Line& Line::operator<<(const Args& args) {
    if (enabled_) {
        record_.args.insert(record_.args.end(), args.begin(), args.end());
    }
    return *this;
}

Record Line::record() const {
    Record record{record_};
    record.message = text_.str();
    return record;
}

Line::~Line() {
    if (!enabled_) return;
    const Record complete{record()};
    const std::string console_line{format(complete, console_colorized)};

    std::scoped_lock lock{output_mutex};
    console() << console_line << '\n';
    if (tee) {
        *tee << format(complete, /*colorized=*/false) << '\n' << std::flush;
    }
}

}  // namespace custos::log
