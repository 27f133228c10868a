#pragma once

#include <cstdarg>
#include <cstdio>

namespace fastaclass {

// Leveled printf-style logger. Writes "[LEVEL] message" lines to a stdio
// sink (stderr unless told otherwise).
class Logger {
public:
    enum Level { kError = 0, kWarn = 1, kInfo = 2, kDebug = 3 };

    explicit Logger(Level level = kInfo, std::FILE* sink = stderr)
        : level_(level), sink_(sink) {}

    Level level() const { return level_; }
    bool verbose() const { return level_ >= kDebug; }

    void error(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kError, "ERROR", fmt, ap);
        va_end(ap);
    }

    void warn(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kWarn, "WARN", fmt, ap);
        va_end(ap);
    }

    void info(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kInfo, "INFO", fmt, ap);
        va_end(ap);
    }

    void debug(const char* fmt, ...) const {
        va_list ap;
        va_start(ap, fmt);
        emit(kDebug, "DEBUG", fmt, ap);
        va_end(ap);
    }

private:
    Level level_;
    std::FILE* sink_;

    void emit(Level msg_level, const char* tag, const char* fmt, va_list ap) const {
        if (level_ < msg_level || sink_ == nullptr) return;
        std::fprintf(sink_, "[%s] ", tag);
        std::vfprintf(sink_, fmt, ap);
        std::fputc('\n', sink_);
    }
};

} // namespace fastaclass
