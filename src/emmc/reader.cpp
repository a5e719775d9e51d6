#include "emmc/reader.hpp"
#include "emmc/error.hpp"
#include "timing.hpp"
#include "logging.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace emmc {

Reader::Reader(std::unique_ptr<SpiBackend> backend, ReaderConfig config)
    : backend_(std::move(backend)), config_(config) {
    if (!backend_) {
        throw std::invalid_argument("Reader requires a backend");
    }
}

void Reader::init() {
    if (initialized_) {
        LOG_EMMC_DEBUG("init: already initialized");
        return;
    }

    try {
        LOG_EMMC_INFO("Initializing transport");
        backend_->initialize();

        LOG_EMMC_DEBUG("Entering command mode");
        backend_->write_register(Register::InitCommand, kEnterCommandMode);

        sanity_check();

        LOG_EMMC_DEBUG("Replaying controller setup (%zu steps)", controller_setup_script().size());
        run_script(controller_setup_script());
        train_memory();
        LOG_EMMC_DEBUG("Replaying card setup (%zu steps)", card_setup_script().size());
        run_script(card_setup_script());
    } catch (const Error& ex) {
        LOG_EMMC_ERROR("init failed: %s", ex.what());
        throw;
    }

    initialized_ = true;
    LOG_EMMC_INFO("Device initialized");
}

void Reader::sanity_check() {
    for (std::size_t round = 0; round < kSanityPatterns.size(); ++round) {
        const uint32_t pattern = kSanityPatterns[round];
        backend_->write_register(Register::Argument, pattern);
        const uint32_t echoed = backend_->read_register(Register::Argument);
        if (echoed != pattern) {
            throw SanityCheckError(pattern, echoed);
        }
        LOG_EMMC_DEBUG("Sanity round %zu ok (0x%08X)", round + 1, pattern);
    }
}

void Reader::run_script(const std::vector<ScriptStep>& steps) {
    for (const auto& step : steps) {
        if (step.op == ScriptStep::Op::Write) {
            write_register(step.reg, step.value);
        } else {
            expect_register(step.reg, step.value);
        }
    }
}

void Reader::expect_register(Register reg, uint32_t expected) {
    const uint32_t actual = read_register(reg);
    if (actual != expected) {
        throw HandshakeError(reg, expected, actual);
    }
}

void Reader::train_memory() {
    std::optional<uint32_t> baseline;
    for (uint32_t iteration = 0; iteration < config_.max_training_iterations; ++iteration) {
        write_register(Register::Argument, training::ARGUMENT);
        write_register(Register::CommandAndTransferMode, training::COMMAND);
        expect_register(Register::InterruptStatus, 0x0);
        expect_register(Register::InterruptStatus, 0x1);
        write_register(Register::InterruptStatus, 0x1);
        const uint32_t response = read_register(Register::Response0And1);

        if (!baseline) {
            if (response != training::INITIAL_RESPONSE) {
                throw HandshakeError(Register::Response0And1, training::INITIAL_RESPONSE, response);
            }
            baseline = response;
            LOG_EMMC_DEBUG("Training baseline 0x%08X", response);
        } else if (response != *baseline) {
            if (response != training::READY_RESPONSE) {
                throw HandshakeError(Register::Response0And1, training::READY_RESPONSE, response);
            }
            LOG_EMMC_DEBUG("Training done after %u iterations (0x%08X -> 0x%08X)",
                           iteration + 1, *baseline, response);
            return;
        }

        sleep_us(config_.training_interval_us);
    }

    throw Error(ErrorKind::Timeout,
                "memory training did not complete after " +
                    std::to_string(config_.max_training_iterations) + " iterations");
}

void Reader::write_register(Register reg, uint32_t value) {
    LOG_EMMC_TRACE("W %-22s <- 0x%08X", to_string(reg), value);
    backend_->write_register(reg, value);
}

uint32_t Reader::read_register(Register reg) {
    const uint32_t value = backend_->read_register(reg);
    LOG_EMMC_TRACE("R %-22s -> 0x%08X", to_string(reg), value);
    return value;
}

void Reader::read_data(Register reg, uint8_t* buffer, std::size_t length) {
    LOG_EMMC_TRACE("D %-22s %zu bytes", to_string(reg), length);
    backend_->read_data(reg, buffer, length);
}

std::optional<std::vector<uint8_t>> Reader::execute(const TransactionType& txn) {
    return backend_->execute_transaction(txn);
}

uint32_t Reader::read_present_state() {
    return read_register(Register::PresentState);
}

uint32_t Reader::read_interrupt_status() {
    return read_register(Register::InterruptStatus);
}

uint32_t Reader::read_status_config() {
    return read_register(Register::StatusConfig);
}

uint32_t Reader::read_response(uint8_t index) {
    static constexpr Register kResponses[] = {
        Register::Response0And1,
        Register::Response2And3,
        Register::Response4And5,
        Register::Response6And7,
    };
    if (index >= std::size(kResponses)) {
        throw Error(ErrorKind::RegisterAccessFailed,
                    "response index " + std::to_string(index) + " out of range");
    }
    return read_register(kResponses[index]);
}

void Reader::poll_for_value(Register reg, uint32_t value) {
    uint32_t last = 0;
    for (uint32_t attempt = 0; attempt < config_.max_polls; ++attempt) {
        last = read_register(reg);
        if (last == value) {
            return;
        }
        sleep_us(config_.poll_interval_us);
    }
    LOG_EMMC_WARN("%s never reached 0x%08X (last 0x%08X)", to_string(reg), value, last);
    throw Error(ErrorKind::Timeout,
                std::string(to_string(reg)) + " never reported " + format_hex32(value) +
                    " after " + std::to_string(config_.max_polls) + " polls (last " +
                    format_hex32(last) + ")");
}

void Reader::read_page(uint32_t page_number, PageBuffer& buffer) {
    LOG_EMMC_WARN_IF(!initialized_, "read_page(%u) on an uninitialized device", page_number);

    write_register(Register::InterruptStatus, status::STATUS_CLEAR);
    write_register(Register::Argument, page_number);
    write_register(Register::CommandAndTransferMode, transfer_config::PAGE_READ);

    poll_for_value(Register::InterruptStatus, status::CMD_ACCEPTED);
    poll_for_value(Register::InterruptStatus, status::DATA_READY);
    write_register(Register::InterruptStatus, status::DATA_READY);

    read_data(Register::DataFifo, buffer.data(), buffer.size());

    // completion status is not checked, only acknowledged
    (void)read_register(Register::InterruptStatus);
    write_register(Register::InterruptStatus, status::TRANSFER_COMPLETE);
}

void Reader::erase_page(uint32_t page_number) {
    if (!transfer_config::PAGE_ERASE) {
        throw Error(ErrorKind::NotImplemented, "page erase transfer configuration is unknown");
    }

    write_register(Register::InterruptStatus, status::STATUS_CLEAR);
    write_register(Register::Argument, page_number);
    write_register(Register::CommandAndTransferMode, *transfer_config::PAGE_ERASE);
    poll_for_value(Register::InterruptStatus, status::CMD_ACCEPTED);
    poll_for_value(Register::InterruptStatus, status::TRANSFER_COMPLETE);
    write_register(Register::InterruptStatus, status::TRANSFER_COMPLETE);
}

void Reader::write_page(uint32_t page_number, const PageBuffer& buffer) {
    // Besides the transfer configuration, SpiBackend has no primitive to push
    // data into the FIFO; the wire format for that has never been observed.
    (void)page_number;
    (void)buffer;
    throw Error(ErrorKind::NotImplemented,
                "page write transfer configuration and FIFO write format are unknown");
}

} // namespace emmc
