#include <verchain/log.hpp>
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace verchain::log {

namespace {

enum class ColorMode { Detect, On, Off };

struct Sink {
    Level level = Info;
    std::FILE* out = nullptr;
    ColorMode color = ColorMode::Detect;
    bool detected = false;
};

Sink& sink() {
    static Sink s;
    return s;
}

std::FILE* stream() {
    return sink().out ? sink().out : stderr;
}

// Explicit settings win; otherwise color follows whether the stream is a tty.
bool use_color() {
    Sink& s = sink();
    if (s.color == ColorMode::Detect) {
        s.color = isatty(fileno(stream())) ? ColorMode::On : ColorMode::Off;
        s.detected = true;
    }
    return s.color == ColorMode::On;
}

const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";
        case Debug: return "\033[36m";
        case Info:  return "\033[32m";
        case Warn:  return "\033[33m";
        case Error: return "\033[31m";
    }
    return "";
}

void emit(Level lvl, const char* fmt, va_list args) {
    if (lvl < sink().level) return;

    std::FILE* out = stream();
    if (use_color()) {
        std::fprintf(out, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(out, "%s: ", level_name(lvl));
    }
    std::vfprintf(out, fmt, args);
    std::fputc('\n', out);
}

} // namespace

void set_level(Level lvl) {
    sink().level = lvl;
}

Level get_level() {
    return sink().level;
}

void set_output(std::FILE* out) {
    Sink& s = sink();
    s.out = out;
    if (s.detected) {
        s.color = ColorMode::Detect;
        s.detected = false;
    }
}

void set_color_enabled(bool enabled) {
    Sink& s = sink();
    s.color = enabled ? ColorMode::On : ColorMode::Off;
    s.detected = false;
}

bool is_color_enabled() {
    return use_color();
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return Result<Level>::ok(lvl);
    }
    return VerchainError{VerchainError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    emit(Error, fmt, args);
    va_end(args);
}

} // namespace verchain::log
