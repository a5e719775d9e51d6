#include "timing.hpp"
#include <errno.h>
#include <time.h>

// Get a timestamp in nanoseconds.
uint64_t get_timestamp_ns() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC_RAW, &ts);
    return static_cast<uint64_t>(ts.tv_sec) * 1000000000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Busy-wait for a specific number of nanoseconds.
void busy_wait_ns(uint64_t ns) {
    uint64_t start = get_timestamp_ns();
    while (get_timestamp_ns() - start < ns);
}

void sleep_us(uint64_t us) {
    struct timespec req;
    req.tv_sec = static_cast<time_t>(us / 1000000ULL);
    req.tv_nsec = static_cast<long>((us % 1000000ULL) * 1000ULL);
    // resume after signals until the full interval has elapsed
    while (nanosleep(&req, &req) != 0 && errno == EINTR) {
    }
}
