// Hardware-independent transaction model for the eMMC SPI protocol
#ifndef EMMC_TRANSACTION_HPP
#define EMMC_TRANSACTION_HPP

#include "emmc/commands.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace emmc {

/**
One protocol exchange: a register write, a register read, or a bulk read of
one page. Built, dispatched once through a backend and dropped.
*/
class TransactionType {
public:
    enum class Kind : uint8_t {
        Write,
        Read,
        ReadData,
    };

    static TransactionType write(Register reg, uint32_t data) { return {Kind::Write, reg, data}; }
    static TransactionType read(Register reg) { return {Kind::Read, reg, 0}; }
    static TransactionType read_data(Register reg) { return {Kind::ReadData, reg, 0}; }

    Kind kind() const noexcept { return kind_; }
    Register target() const noexcept { return reg_; }

    Command command() const noexcept;

    // None for writes, 4 bytes for register reads, 512 for data reads
    std::optional<DataSize> response_size() const noexcept;

    // Present only for writes
    std::optional<uint32_t> write_data() const noexcept;

    // Little-endian bytes of write_data()
    std::optional<std::array<uint8_t, 4>> write_payload() const noexcept;

    bool operator==(const TransactionType&) const = default;

private:
    TransactionType(Kind kind, Register reg, uint32_t data) : kind_(kind), reg_(reg), data_(data) {}

    Kind kind_;
    Register reg_;
    uint32_t data_;
};

std::array<uint8_t, 4> encode_u32_le(uint32_t value);
uint32_t decode_u32_le(const uint8_t* bytes);

// {command, address} as the byte-framed transports put it on the wire
std::array<uint8_t, 2> encode_header(Command command, Register reg);

// Header followed by the payload for writes (6 bytes), header only for reads
std::vector<uint8_t> encode_frame(const TransactionType& txn);

} // namespace emmc

#endif // EMMC_TRANSACTION_HPP
