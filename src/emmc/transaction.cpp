#include "emmc/transaction.hpp"

namespace emmc {

Command TransactionType::command() const noexcept {
    return kind_ == Kind::Write ? Command::Write : Command::Read;
}

std::optional<DataSize> TransactionType::response_size() const noexcept {
    switch (kind_) {
    case Kind::Read:
        return DataSize::Register;
    case Kind::ReadData:
        return DataSize::Page;
    case Kind::Write:
        break;
    }
    return std::nullopt;
}

std::optional<uint32_t> TransactionType::write_data() const noexcept {
    if (kind_ != Kind::Write) return std::nullopt;
    return data_;
}

std::optional<std::array<uint8_t, 4>> TransactionType::write_payload() const noexcept {
    if (kind_ != Kind::Write) return std::nullopt;
    return encode_u32_le(data_);
}

std::array<uint8_t, 4> encode_u32_le(uint32_t value) {
    return {
        static_cast<uint8_t>(value & 0xFF),
        static_cast<uint8_t>((value >> 8) & 0xFF),
        static_cast<uint8_t>((value >> 16) & 0xFF),
        static_cast<uint8_t>((value >> 24) & 0xFF),
    };
}

uint32_t decode_u32_le(const uint8_t* bytes) {
    return static_cast<uint32_t>(bytes[0]) |
           (static_cast<uint32_t>(bytes[1]) << 8) |
           (static_cast<uint32_t>(bytes[2]) << 16) |
           (static_cast<uint32_t>(bytes[3]) << 24);
}

std::array<uint8_t, 2> encode_header(Command command, Register reg) {
    return {bits(command), address(reg)};
}

std::vector<uint8_t> encode_frame(const TransactionType& txn) {
    const auto header = encode_header(txn.command(), txn.target());
    std::vector<uint8_t> frame(header.begin(), header.end());
    if (auto payload = txn.write_payload()) {
        frame.insert(frame.end(), payload->begin(), payload->end());
    }
    return frame;
}

} // namespace emmc
