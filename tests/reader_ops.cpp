#undef NDEBUG
#include "emmc/error.hpp"
#include "emmc/reader.hpp"
#include "logging.hpp"
#include "mock_backend.hpp"

#include <cassert>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>

using namespace emmc;
using testing::MockBackend;
using Kind = MockBackend::Op::Kind;

namespace {

ReaderConfig fast_config() {
    ReaderConfig config;
    config.poll_interval_us = 0;
    config.training_interval_us = 0;
    return config;
}

// The reader owns the backend; tests keep a raw pointer to inspect it
Reader make_reader(MockBackend*& mock) {
    auto backend = std::make_unique<MockBackend>();
    mock = backend.get();
    return Reader(std::move(backend), fast_config());
}

template <typename Fn>
ErrorKind expect_error(Fn&& fn) {
    try {
        fn();
    } catch (const Error& ex) {
        return ex.kind();
    }
    assert(false && "expected emmc::Error");
    return ErrorKind::Transport;
}

void null_backend_is_rejected() {
    bool threw = false;
    try {
        Reader reader(nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

void argument_register_loops_back() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    reader.write_register(Register::Argument, 0xCAFEF00D);
    assert(reader.read_register(Register::Argument) == 0xCAFEF00D);
    assert(!reader.is_initialized());
}

void sanity_mismatch_aborts_init() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->queue(Register::Argument, 0x00000BAD);

    bool threw = false;
    try {
        reader.init();
    } catch (const SanityCheckError& ex) {
        threw = true;
        assert(ex.kind() == ErrorKind::SanityCheckFailed);
        assert(ex.expected() == Reader::kSanityPatterns[0]);
        assert(ex.actual() == 0x00000BAD);
    }
    assert(threw);
    assert(!reader.is_initialized());
    assert(mock->initialize_calls == 1);
    assert(mock->count_writes(Register::InitCommand, Reader::kEnterCommandMode) == 1);
    // nothing past the sanity check ran
    assert(mock->count(Kind::Read, Register::StatusConfig) == 0);
}

void sanity_mismatch_on_later_round() {
    for (std::size_t failing = 1; failing < Reader::kSanityPatterns.size(); ++failing) {
        MockBackend* mock = nullptr;
        Reader reader = make_reader(mock);
        for (std::size_t round = 0; round < failing; ++round) {
            mock->queue(Register::Argument, Reader::kSanityPatterns[round]);
        }
        mock->queue(Register::Argument, 0x00000000);

        bool threw = false;
        try {
            reader.init();
        } catch (const SanityCheckError& ex) {
            threw = true;
            assert(ex.expected() == Reader::kSanityPatterns[failing]);
            assert(ex.actual() == 0x00000000);
        }
        assert(threw);
        assert(!reader.is_initialized());
        assert(mock->reads[Register::Argument] == failing + 1);
        assert(mock->count(Kind::Read, Register::StatusConfig) == 0);
    }
}

void poll_times_out_after_max_polls() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->registers[Register::InterruptStatus] = 0x0;

    const ErrorKind kind = expect_error([&] {
        reader.poll_for_value(Register::InterruptStatus, status::DATA_READY);
    });
    assert(kind == ErrorKind::Timeout);
    assert(mock->reads[Register::InterruptStatus] == reader.config().max_polls);
    assert(mock->reads[Register::InterruptStatus] == 10);
}

void poll_timeout_is_logged() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->registers[Register::InterruptStatus] = 0x0;

    std::FILE* capture = std::tmpfile();
    assert(capture != nullptr);
    emmcspi::log::set_output_file(capture);
    const ErrorKind kind = expect_error([&] {
        reader.poll_for_value(Register::InterruptStatus, status::CMD_ACCEPTED);
    });
    emmcspi::log::set_output_file(nullptr);
    assert(kind == ErrorKind::Timeout);

    char line[256] = {};
    std::rewind(capture);
    const bool got_line = std::fgets(line, sizeof(line), capture) != nullptr;
    std::fclose(capture);
#if LOG_EMMC_LEVEL >= 2
    assert(got_line);
    assert(std::strstr(line, "[WARN] [emmc]") != nullptr);
    assert(std::strstr(line, "InterruptStatus") != nullptr);
#else
    assert(!got_line);
#endif
}

void poll_stops_at_first_match() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->queue(Register::InterruptStatus, {0x0, 0x1, status::CMD_ACCEPTED, 0x0});

    reader.poll_for_value(Register::InterruptStatus, status::CMD_ACCEPTED);
    assert(mock->reads[Register::InterruptStatus] == 3);
}

void response_index_is_bounded() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->registers[Register::Response4And5] = 0x30303847;

    assert(reader.read_response(2) == 0x30303847);
    assert(mock->reads[Register::Response4And5] == 1);
    assert(expect_error([&] { (void)reader.read_response(4); }) == ErrorKind::RegisterAccessFailed);
}

void status_shortcuts_read_their_registers() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->registers[Register::PresentState] = 0x1FF0000;
    mock->registers[Register::InterruptStatus] = 0x1;
    mock->registers[Register::StatusConfig] = 0xE0047;

    assert(reader.read_present_state() == 0x1FF0000);
    assert(reader.read_interrupt_status() == 0x1);
    assert(reader.read_status_config() == 0xE0047);
}

void read_page_follows_handshake() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->queue(Register::InterruptStatus, {0x0, status::CMD_ACCEPTED, status::DATA_READY, 0x2});

    PageBuffer page{};
    reader.read_page(0x40, page);

    const auto writes = mock->writes();
    assert(writes.size() == 5);
    assert(writes[0].reg == Register::InterruptStatus && writes[0].value == status::STATUS_CLEAR);
    assert(writes[1].reg == Register::Argument && writes[1].value == 0x40);
    assert(writes[2].reg == Register::CommandAndTransferMode && writes[2].value == transfer_config::PAGE_READ);
    assert(writes[3].reg == Register::InterruptStatus && writes[3].value == status::DATA_READY);
    assert(writes[4].reg == Register::InterruptStatus && writes[4].value == status::TRANSFER_COMPLETE);

    assert(mock->count(Kind::ReadData, Register::DataFifo) == 1);
    assert(mock->log.back().kind == Kind::Write);
    for (std::size_t i = 0; i < page.size(); ++i) {
        assert(page[i] == static_cast<uint8_t>(0x40 + i));
    }
}

void read_page_timeout_skips_fifo() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);

    PageBuffer page{};
    assert(expect_error([&] { reader.read_page(7, page); }) == ErrorKind::Timeout);
    assert(mock->count(Kind::ReadData, Register::DataFifo) == 0);
    assert(mock->count_writes(Register::InterruptStatus, status::TRANSFER_COMPLETE) == 0);
}

void read_page_data_ready_timeout() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->queue(Register::InterruptStatus, status::CMD_ACCEPTED);

    PageBuffer page{};
    assert(expect_error([&] { reader.read_page(1, page); }) == ErrorKind::Timeout);
    assert(mock->count(Kind::ReadData, Register::DataFifo) == 0);
}

void erase_and_write_are_not_implemented() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);

    assert(expect_error([&] { reader.erase_page(3); }) == ErrorKind::NotImplemented);
    PageBuffer page{};
    assert(expect_error([&] { reader.write_page(3, page); }) == ErrorKind::NotImplemented);
    assert(mock->log.empty());
}

void transport_failures_propagate() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);
    mock->fail_on_read = Register::InterruptStatus;

    assert(expect_error([&] { (void)reader.read_interrupt_status(); }) == ErrorKind::Transport);
}

void execute_routes_through_backend() {
    MockBackend* mock = nullptr;
    Reader reader = make_reader(mock);

    assert(!reader.execute(TransactionType::write(Register::Config1, 0x1FFF0033)).has_value());
    auto bytes = reader.execute(TransactionType::read(Register::Config1));
    assert(bytes && bytes->size() == 4);
    assert(decode_u32_le(bytes->data()) == 0x1FFF0033);
}

} // namespace

int main() {
    null_backend_is_rejected();
    argument_register_loops_back();
    sanity_mismatch_aborts_init();
    sanity_mismatch_on_later_round();
    poll_times_out_after_max_polls();
    poll_timeout_is_logged();
    poll_stops_at_first_match();
    response_index_is_bounded();
    status_shortcuts_read_their_registers();
    read_page_follows_handshake();
    read_page_timeout_skips_fifo();
    read_page_data_ready_timeout();
    erase_and_write_are_not_implemented();
    transport_failures_propagate();
    execute_routes_through_backend();
    return 0;
}
