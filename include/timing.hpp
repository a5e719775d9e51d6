#ifndef TIMING_H
#define TIMING_H

#include <stdint.h>

// Get the current timestamp in nanoseconds
uint64_t get_timestamp_ns();

// Busy-wait for a specified number of nanoseconds
void busy_wait_ns(uint64_t ns);

// Block the calling thread for at least the given number of microseconds.
// Used for the millisecond-scale protocol delays where spinning would only burn a core.
void sleep_us(uint64_t us);

#endif // TIMING_H
