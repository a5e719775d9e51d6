#ifndef EMMC_READER_HPP
#define EMMC_READER_HPP

#include "emmc/commands.hpp"
#include "emmc/init_script.hpp"
#include "emmc/transaction.hpp"
#include "emmc/transport.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace emmc {

// Timing policy for the driver. Defaults match the captured protocol.
struct ReaderConfig {
    uint32_t max_polls = 10;
    uint32_t poll_interval_us = 10'000;
    uint32_t training_interval_us = 100;
    // Training never ends on its own if the card stops answering
    uint32_t max_training_iterations = 10'000;
};

using PageBuffer = std::array<uint8_t, kPageSize>;

/**
Drives the eMMC SPI controller handshake over any SpiBackend.

The reader owns its backend. init() must succeed once before page operations
are meaningful; it is idempotent afterwards. Every failure is thrown as
emmc::Error and leaves the reader exactly as initialized as it was before.
*/
class Reader {
public:
    // Value written to InitCommand to put the controller in command mode
    static constexpr uint32_t kEnterCommandMode = 0x00000003;

    // Loopback patterns for the bring-up sanity check
    static constexpr std::array<uint32_t, 4> kSanityPatterns = {
        0x12345678, 0xEDCBA987, 0x12345678, 0xEDCBA987,
    };

    explicit Reader(std::unique_ptr<SpiBackend> backend, ReaderConfig config = {});

    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    Reader(Reader&&) noexcept = default;
    Reader& operator=(Reader&&) noexcept = default;

    /**
    Bring-up: backend initialize, enter command mode, loopback sanity check,
    captured init script (with memory training). No-op once initialized.
    */
    void init();

    bool is_initialized() const noexcept { return initialized_; }
    const ReaderConfig& config() const noexcept { return config_; }
    SpiBackend& backend() noexcept { return *backend_; }

    void write_register(Register reg, uint32_t value);
    uint32_t read_register(Register reg);
    void read_data(Register reg, uint8_t* buffer, std::size_t length);
    std::optional<std::vector<uint8_t>> execute(const TransactionType& txn);

    uint32_t read_present_state();
    uint32_t read_interrupt_status();
    uint32_t read_status_config();

    // index 0..3 selects Response0And1..Response6And7
    uint32_t read_response(uint8_t index);

    // Reads `reg` up to config().max_polls times, config().poll_interval_us
    // apart. Throws Error{Timeout} when the value never shows up.
    void poll_for_value(Register reg, uint32_t value);

    void read_page(uint32_t page_number, PageBuffer& buffer);

    // Erase and write sequences have not been captured from hardware yet;
    // both throw Error{NotImplemented} without touching the device.
    void erase_page(uint32_t page_number);
    void write_page(uint32_t page_number, const PageBuffer& buffer);

private:
    void sanity_check();
    void run_script(const std::vector<ScriptStep>& steps);
    void expect_register(Register reg, uint32_t expected);
    void train_memory();

    std::unique_ptr<SpiBackend> backend_;
    ReaderConfig config_;
    bool initialized_ = false;
};

} // namespace emmc

#endif // EMMC_READER_HPP
