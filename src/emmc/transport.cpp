#include "emmc/transport.hpp"

namespace emmc {

std::optional<std::vector<uint8_t>> SpiBackend::execute_transaction(const TransactionType& txn) {
    switch (txn.kind()) {
    case TransactionType::Kind::Write:
        write_register(txn.target(), *txn.write_data());
        return std::nullopt;
    case TransactionType::Kind::Read: {
        const auto value = encode_u32_le(read_register(txn.target()));
        return std::vector<uint8_t>(value.begin(), value.end());
    }
    case TransactionType::Kind::ReadData: {
        std::vector<uint8_t> buffer(bytes(DataSize::Page), 0);
        read_data(txn.target(), buffer.data(), buffer.size());
        return buffer;
    }
    }
    return std::nullopt;
}

} // namespace emmc
