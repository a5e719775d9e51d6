#ifndef EMMC_TRANSPORT_HPP
#define EMMC_TRANSPORT_HPP

#include "emmc/commands.hpp"
#include "emmc/transaction.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace emmc {

/**
Register/bulk access to the controller. The protocol logic only ever talks to
the device through this interface; concrete transports decide how the frames
reach the wire. Every primitive throws emmc::Error (kind Transport) when the
link fails.
*/
class SpiBackend {
public:
    virtual ~SpiBackend() = default;

    // 32-bit value goes out little-endian
    virtual void write_register(Register reg, uint32_t data) = 0;

    virtual uint32_t read_register(Register reg) = 0;

    // Transfers exactly `length` bytes; callers size the buffer (normally kPageSize)
    virtual void read_data(Register reg, uint8_t* buffer, std::size_t length) = 0;

    // Assert then release the device reset line (nominally 100 ms hold)
    virtual void reset() = 0;

    // Bring the link to a known idle state, cycle reset, set up clocking
    virtual void initialize() = 0;

    // Routes any transaction to the primitives above. Reads return the
    // response bytes (little-endian for registers), writes return nothing.
    virtual std::optional<std::vector<uint8_t>> execute_transaction(const TransactionType& txn);
};

/**
Discrete control lines for transports that have them. Arguments are logical
("asserted"/"enabled"); any active-low inversion happens in the transport.
Transports without a given line implement the call as a no-op.
*/
class GpioControl {
public:
    virtual ~GpioControl() = default;

    virtual void set_chip_select(bool asserted) = 0;
    virtual void set_reset(bool asserted) = 0;
    virtual void set_enable(bool enabled) = 0;
};

} // namespace emmc

#endif // EMMC_TRANSPORT_HPP
