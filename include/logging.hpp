// Header-only logging with per-component compile-time levels.
//   LOG_EMMC_*  protocol model, Reader and CLI
//   LOG_HAL_*   GPIO session and transports
// Levels: 0=NONE, 1=ERROR, 2=WARN, 3=INFO, 4=DEBUG, 5=TRACE. Statements above
// the configured level expand to nothing. The build sets both levels from the
// LOG_EMMC_LEVEL / LOG_HAL_LEVEL cache variables.
//
//   LOG_EMMC_DEBUG("Sanity round %zu ok", round);
//   LOG_HAL_WARN_IF(!ok, "spidev read returned %d", rc);

#ifndef EMMCSPI_LOGGING_HPP
#define EMMCSPI_LOGGING_HPP

#include <cstdarg>
#include <cstdint>
#include <cstdio>

#include "timing.hpp"

#ifndef LOG_EMMC_LEVEL
#define LOG_EMMC_LEVEL 0
#endif

#ifndef LOG_HAL_LEVEL
#define LOG_HAL_LEVEL 0
#endif

namespace emmcspi::log {

inline std::FILE*& output_slot() {
    static std::FILE* out = stderr;
    return out;
}

// nullptr goes back to stderr. The caller keeps ownership of `file`.
inline void set_output_file(std::FILE* file) {
    std::fflush(output_slot());
    output_slot() = file ? file : stderr;
}

// One line: "[sec.usec] [LEVEL] [component] message"
inline void write(const char* component, const char* level, const char* fmt, ...) {
    const uint64_t ts_us = get_timestamp_ns() / 1000;
    std::FILE* out = output_slot();
    flockfile(out);
    std::fprintf(out, "[%llu.%06llu] [%s] [%s] ",
                 static_cast<unsigned long long>(ts_us / 1000000ULL),
                 static_cast<unsigned long long>(ts_us % 1000000ULL),
                 level, component);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(out, fmt, ap);
    va_end(ap);
    std::fputc('\n', out);
    funlockfile(out);
}

} // namespace emmcspi::log

#define EMMCSPI_LOG_EMIT(component, level, ...) ::emmcspi::log::write(component, level, __VA_ARGS__)
#define EMMCSPI_LOG_EMIT_IF(cond, component, level, ...) \
    do { if (cond) EMMCSPI_LOG_EMIT(component, level, __VA_ARGS__); } while (0)
#define EMMCSPI_LOG_NOOP(...) do {} while (0)

#if LOG_EMMC_LEVEL >= 1
#define LOG_EMMC_ERROR(...) EMMCSPI_LOG_EMIT("emmc", "ERROR", __VA_ARGS__)
#define LOG_EMMC_ERROR_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "emmc", "ERROR", __VA_ARGS__)
#else
#define LOG_EMMC_ERROR(...) EMMCSPI_LOG_NOOP()
#define LOG_EMMC_ERROR_IF(...) EMMCSPI_LOG_NOOP()
#endif

#if LOG_EMMC_LEVEL >= 2
#define LOG_EMMC_WARN(...) EMMCSPI_LOG_EMIT("emmc", "WARN", __VA_ARGS__)
#define LOG_EMMC_WARN_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "emmc", "WARN", __VA_ARGS__)
#else
#define LOG_EMMC_WARN(...) EMMCSPI_LOG_NOOP()
#define LOG_EMMC_WARN_IF(...) EMMCSPI_LOG_NOOP()
#endif

#if LOG_EMMC_LEVEL >= 3
#define LOG_EMMC_INFO(...) EMMCSPI_LOG_EMIT("emmc", "INFO", __VA_ARGS__)
#define LOG_EMMC_INFO_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "emmc", "INFO", __VA_ARGS__)
#else
#define LOG_EMMC_INFO(...) EMMCSPI_LOG_NOOP()
#define LOG_EMMC_INFO_IF(...) EMMCSPI_LOG_NOOP()
#endif

#if LOG_EMMC_LEVEL >= 4
#define LOG_EMMC_DEBUG(...) EMMCSPI_LOG_EMIT("emmc", "DEBUG", __VA_ARGS__)
#define LOG_EMMC_DEBUG_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "emmc", "DEBUG", __VA_ARGS__)
#else
#define LOG_EMMC_DEBUG(...) EMMCSPI_LOG_NOOP()
#define LOG_EMMC_DEBUG_IF(...) EMMCSPI_LOG_NOOP()
#endif

// every register transaction; very chatty
#if LOG_EMMC_LEVEL >= 5
#define LOG_EMMC_TRACE(...) EMMCSPI_LOG_EMIT("emmc", "TRACE", __VA_ARGS__)
#define LOG_EMMC_TRACE_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "emmc", "TRACE", __VA_ARGS__)
#else
#define LOG_EMMC_TRACE(...) EMMCSPI_LOG_NOOP()
#define LOG_EMMC_TRACE_IF(...) EMMCSPI_LOG_NOOP()
#endif

#if LOG_HAL_LEVEL >= 1
#define LOG_HAL_ERROR(...) EMMCSPI_LOG_EMIT("hal", "ERROR", __VA_ARGS__)
#define LOG_HAL_ERROR_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "hal", "ERROR", __VA_ARGS__)
#else
#define LOG_HAL_ERROR(...) EMMCSPI_LOG_NOOP()
#define LOG_HAL_ERROR_IF(...) EMMCSPI_LOG_NOOP()
#endif

#if LOG_HAL_LEVEL >= 2
#define LOG_HAL_WARN(...) EMMCSPI_LOG_EMIT("hal", "WARN", __VA_ARGS__)
#define LOG_HAL_WARN_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "hal", "WARN", __VA_ARGS__)
#else
#define LOG_HAL_WARN(...) EMMCSPI_LOG_NOOP()
#define LOG_HAL_WARN_IF(...) EMMCSPI_LOG_NOOP()
#endif

#if LOG_HAL_LEVEL >= 3
#define LOG_HAL_INFO(...) EMMCSPI_LOG_EMIT("hal", "INFO", __VA_ARGS__)
#define LOG_HAL_INFO_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "hal", "INFO", __VA_ARGS__)
#else
#define LOG_HAL_INFO(...) EMMCSPI_LOG_NOOP()
#define LOG_HAL_INFO_IF(...) EMMCSPI_LOG_NOOP()
#endif

#if LOG_HAL_LEVEL >= 4
#define LOG_HAL_DEBUG(...) EMMCSPI_LOG_EMIT("hal", "DEBUG", __VA_ARGS__)
#define LOG_HAL_DEBUG_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "hal", "DEBUG", __VA_ARGS__)
#else
#define LOG_HAL_DEBUG(...) EMMCSPI_LOG_NOOP()
#define LOG_HAL_DEBUG_IF(...) EMMCSPI_LOG_NOOP()
#endif

// bit-level framing
#if LOG_HAL_LEVEL >= 5
#define LOG_HAL_TRACE(...) EMMCSPI_LOG_EMIT("hal", "TRACE", __VA_ARGS__)
#define LOG_HAL_TRACE_IF(cond, ...) EMMCSPI_LOG_EMIT_IF(cond, "hal", "TRACE", __VA_ARGS__)
#else
#define LOG_HAL_TRACE(...) EMMCSPI_LOG_NOOP()
#define LOG_HAL_TRACE_IF(...) EMMCSPI_LOG_NOOP()
#endif

#endif // EMMCSPI_LOGGING_HPP
