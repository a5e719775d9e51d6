#undef NDEBUG
#include "emmc/commands.hpp"
#include "emmc/error.hpp"
#include "emmc/mmc_status.hpp"
#include "emmc/pins.hpp"
#include "emmc/transaction.hpp"
#include "mock_backend.hpp"

#include <cassert>
#include <cstring>
#include <iterator>
#include <string>

using namespace emmc;

namespace {

constexpr Register kAllRegisters[] = {
    Register::Reg01, Register::Argument, Register::CommandAndTransferMode,
    Register::Response0And1, Register::Response2And3, Register::Response4And5,
    Register::Response6And7, Register::DataFifo, Register::PresentState,
    Register::Reg0A, Register::StatusConfig, Register::InterruptStatus,
    Register::Config1, Register::Config2, Register::Reg0F,
    Register::InitCommand, Register::XipOutputDelay,
};

void check_commands() {
    assert(bits(Command::Read) == 0x1);
    assert(bits(Command::Write) == 0x2);
    assert(command_bit_length() == 2);
    assert(register_bit_length() == 8);
    assert(std::string(to_string(Command::Read)) == "Read");
}

void check_register_map() {
    assert(address(Register::Argument) == 0x02);
    assert(address(Register::DataFifo) == 0x08);
    assert(address(Register::StatusConfig) == 0x0B);
    assert(address(Register::InterruptStatus) == 0x0C);
    assert(address(Register::InitCommand) == 0x44);
    assert(address(Register::XipOutputDelay) == 0x88);

    for (Register reg : kAllRegisters) {
        auto back = register_from_address(address(reg));
        assert(back.has_value());
        assert(*back == reg);

        auto by_name = register_from_name(to_string(reg));
        assert(by_name.has_value());
        assert(*by_name == reg);
    }

    std::size_t named = 0;
    for (unsigned addr = 0; addr <= 0xFF; ++addr) {
        if (register_from_address(static_cast<uint8_t>(addr))) ++named;
    }
    assert(named == std::size(kAllRegisters));

    assert(!register_from_address(0x00).has_value());
    assert(!register_from_address(0x10).has_value());
    assert(!register_from_address(0xFF).has_value());

    assert(register_from_name("interruptstatus") == Register::InterruptStatus);
    assert(register_from_name("ARGUMENT") == Register::Argument);
    assert(!register_from_name("bogus").has_value());
    assert(!register_from_name("").has_value());
}

void check_sizes_and_constants() {
    assert(bytes(DataSize::Register) == 4);
    assert(bytes(DataSize::Page) == 512);
    assert(kPageSize == 512);

    assert(status::DATA_READY == 0x20);
    assert(status::CMD_ACCEPTED == 0x21);
    assert(status::TRANSFER_COMPLETE == 0x2);
    assert(status::STATUS_CLEAR == 0xFFFFFFFF);
    assert(transfer_config::PAGE_READ == 0x113A0010);
    assert(!transfer_config::PAGE_ERASE.has_value());
    assert(!transfer_config::PAGE_WRITE.has_value());
}

void check_transactions() {
    const auto w = TransactionType::write(Register::Argument, 0xDEADBEEF);
    assert(w.kind() == TransactionType::Kind::Write);
    assert(w.command() == Command::Write);
    assert(w.target() == Register::Argument);
    assert(!w.response_size().has_value());
    assert(w.write_data() == 0xDEADBEEFu);
    const auto payload = w.write_payload();
    assert(payload.has_value());
    assert((*payload)[0] == 0xEF && (*payload)[1] == 0xBE && (*payload)[2] == 0xAD && (*payload)[3] == 0xDE);

    const auto r = TransactionType::read(Register::InterruptStatus);
    assert(r.command() == Command::Read);
    assert(r.response_size() == DataSize::Register);
    assert(!r.write_data().has_value());
    assert(!r.write_payload().has_value());

    const auto d = TransactionType::read_data(Register::DataFifo);
    assert(d.command() == Command::Read);
    assert(d.response_size() == DataSize::Page);

    assert(TransactionType::read(Register::Argument) == TransactionType::read(Register::Argument));
    assert(!(TransactionType::read(Register::Argument) == TransactionType::read_data(Register::Argument)));
}

void check_wire_encoding() {
    const auto le = encode_u32_le(0x12345678);
    assert(le[0] == 0x78 && le[1] == 0x56 && le[2] == 0x34 && le[3] == 0x12);
    assert(decode_u32_le(le.data()) == 0x12345678);

    const auto header = encode_header(Command::Read, Register::InterruptStatus);
    assert(header[0] == 0x01);
    assert(header[1] == 0x0C);

    const auto write_frame = encode_frame(TransactionType::write(Register::InitCommand, 0x3));
    assert(write_frame.size() == 6);
    assert(write_frame[0] == 0x02);
    assert(write_frame[1] == 0x44);
    assert(write_frame[2] == 0x03);
    assert(write_frame[3] == 0 && write_frame[4] == 0 && write_frame[5] == 0);

    const auto read_frame = encode_frame(TransactionType::read_data(Register::DataFifo));
    assert(read_frame.size() == 2);
    assert(read_frame[0] == 0x01 && read_frame[1] == 0x08);
}

void check_dispatch_helper() {
    testing::MockBackend mock;

    auto none = mock.execute_transaction(TransactionType::write(Register::Argument, 0xA1B2C3D4));
    assert(!none.has_value());
    assert(mock.registers[Register::Argument] == 0xA1B2C3D4);

    auto reg = mock.execute_transaction(TransactionType::read(Register::Argument));
    assert(reg.has_value());
    assert(reg->size() == 4);
    assert(decode_u32_le(reg->data()) == 0xA1B2C3D4);

    auto page = mock.execute_transaction(TransactionType::read_data(Register::DataFifo));
    assert(page.has_value());
    assert(page->size() == 512);
    assert((*page)[0] == 0xD4);
    assert(mock.count(testing::MockBackend::Op::Kind::ReadData, Register::DataFifo) == 1);
}

void check_pins() {
    assert(pin_mask(0) == 0x1);
    assert(pin_mask(25) == (1u << 25));

    assert(apply_pin_level(0x0, 0x8, true) == 0x8);
    assert(apply_pin_level(0xF, 0x8, false) == 0x7);
    assert(apply_pin_level(0x8, 0x8, true) == 0x8);

    for (uint32_t bad : {0x0u, 0x3u, 0x80000001u}) {
        bool threw = false;
        try {
            (void)apply_pin_level(0, bad, true);
        } catch (const Error& ex) {
            threw = ex.kind() == ErrorKind::InvalidPinMask;
        }
        assert(threw);
    }
}

void check_mmc_status() {
    assert(mmc_state_from_bits(0) == MmcState::Idle);
    assert(mmc_state_from_bits(4) == MmcState::Transfer);
    assert(mmc_state_from_bits(10) == MmcState::Sleep);
    assert(mmc_state_from_bits(0x14) == MmcState::Transfer);
    assert(!mmc_state_from_bits(11).has_value());
    assert(!mmc_state_from_bits(15).has_value());
    assert(std::string(to_string(MmcState::Standby)) == "Standby");

    const ErrorFlags clean(0x00000900);
    assert(!clean.has_error());
    assert(clean.describe() == "none");

    const ErrorFlags bad(ErrorFlags::CRC_ERROR | ErrorFlags::ADDRESS_MISALIGN | 0x1);
    assert(bad.has_error());
    assert(bad.contains(ErrorFlags::CRC_ERROR));
    assert(!bad.contains(ErrorFlags::ERROR));
    assert(bad.bits() == (ErrorFlags::CRC_ERROR | ErrorFlags::ADDRESS_MISALIGN));
    assert(bad.describe() == "CRC_ERROR|ADDRESS_MISALIGN");
}

void check_errors() {
    const Error plain(ErrorKind::NotImplemented);
    assert(plain.kind() == ErrorKind::NotImplemented);
    assert(std::string(plain.what()) == to_string(ErrorKind::NotImplemented));

    const Error detailed(ErrorKind::Timeout, "nothing happened");
    assert(std::string(detailed.what()).find("nothing happened") != std::string::npos);

    const SanityCheckError sanity(0x12345678, 0x0);
    assert(sanity.kind() == ErrorKind::SanityCheckFailed);
    assert(sanity.expected() == 0x12345678);
    assert(sanity.actual() == 0x0);
    assert(std::string(sanity.what()).find("0x12345678") != std::string::npos);

    const HandshakeError handshake(Register::InterruptStatus, 0x1, 0x0);
    assert(handshake.kind() == ErrorKind::InitializationFailed);
    assert(handshake.reg() == Register::InterruptStatus);

    assert(format_hex32(0xABCDEF) == "0x00ABCDEF");
}

} // namespace

int main() {
    check_commands();
    check_register_map();
    check_sizes_and_constants();
    check_transactions();
    check_wire_encoding();
    check_dispatch_helper();
    check_pins();
    check_mmc_status();
    check_errors();
    return 0;
}
