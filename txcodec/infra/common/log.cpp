// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <locale>
#include <memory>
#include <mutex>
#include <regex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace txcodec::log {

static Settings settings_{};
static std::mutex out_mtx{};
static std::unique_ptr<std::fstream> file_{nullptr};
static bool is_terminal{false};

void init(const Settings& settings) {
    settings_ = settings;
    if (!settings_.log_file.empty()) {
        tee_file(std::filesystem::path(settings.log_file));
        // Escape sequences never go to the log file
        settings_.log_nocolor = true;
    } else {
        file_.reset();
    }

    init_terminal();
    is_terminal = settings_.log_std_out ? is_terminal_stdout() : is_terminal_stderr();
    settings_.log_nocolor = settings_.log_nocolor || !is_terminal;
}

void tee_file(const std::filesystem::path& path) {
    file_ = std::make_unique<std::fstream>(path.string(), std::ios::out | std::ios::app);
    if (!file_->is_open()) {
        file_.reset();
        throw std::runtime_error("Could not open file " + path.string());
    }
}

Level get_verbosity() { return settings_.log_verbosity; }

void set_verbosity(Level level) { settings_.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= settings_.log_verbosity; }

static std::string thread_id() {
    std::stringstream ss;
    ss << std::this_thread::get_id();
    return ss.str();
}

static std::pair<std::string_view, std::string_view> get_level_settings(Level level) {
    switch (level) {
        case Level::kTrace:
            return {"TRACE", kColorCoal};
        case Level::kDebug:
            return {"DEBUG", kBackgroundPurple};
        case Level::kInfo:
            return {" INFO", kColorGreen};
        case Level::kWarning:
            return {" WARN", kColorOrangeHigh};
        case Level::kError:
            return {"ERROR", kColorRed};
        case Level::kCritical:
            return {" CRIT", kBackgroundRed};
        default:
            return {"     ", kColorReset};
    }
}

struct SeparateThousands : std::numpunct<char> {
    char separator;
    explicit SeparateThousands(char sep) : separator(sep) {}
    char do_thousands_sep() const override { return separator; }
    string_type do_grouping() const override { return "\3"; }  // groups of 3 digit
};

BufferBase::BufferBase(Level level) : should_print_(level <= settings_.log_verbosity) {
    if (!should_print_) return;

    if (settings_.log_thousands_sep != 0) {
        ss_.imbue(std::locale(ss_.getloc(), new SeparateThousands(settings_.log_thousands_sep)));
    }

    auto [log_level, color] = get_level_settings(level);

    // Prefix
    auto log_tag{settings_.log_trim ? absl::StripAsciiWhitespace(log_level).substr(0, 4) : log_level};
    std::string_view padding = settings_.log_trim ? "" : " ";
    ss_ << kColorReset
        << (settings_.log_trim && !is_terminal ? "[" : padding) << color << log_tag
        << kColorReset
        << (settings_.log_trim && !is_terminal ? "] " : padding);

    // TimeStamp
    const absl::TimeZone tz{settings_.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
    const absl::Time now{absl::Now()};
    const std::string log_timezone{settings_.log_timezone ? " " + tz.name() : ""};
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", now, tz) << log_timezone << "] " << kColorReset;

    // ThreadId
    if (settings_.log_threads) {
        ss_ << "[" << thread_id() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    append(msg, args);
}

void BufferBase::flush() {
    if (!should_print_) return;

    // Pattern to identify colorization
    static const std::regex kColorPattern("(\\\x1b\\[[0-9;]{1,}m)");

    bool colorized{true};
    std::string line{ss_.str()};
    if (settings_.log_nocolor) {
        line = std::regex_replace(line, kColorPattern, "");
        colorized = false;
    }
    std::scoped_lock out_lck{out_mtx};
    auto& out = settings_.log_std_out ? std::cout : std::cerr;
    out << line << '\n';
    if (file_ && file_->is_open()) {
        if (colorized) {
            line = std::regex_replace(line, kColorPattern, "");
        }
        *file_ << line << '\n';
    }
}

}  // namespace txcodec::log
