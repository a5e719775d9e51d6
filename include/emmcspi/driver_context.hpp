#ifndef EMMCSPI_DRIVER_CONTEXT_HPP
#define EMMCSPI_DRIVER_CONTEXT_HPP

#include "emmc/reader.hpp"
#include "emmc/transport.hpp"
#include "hardware_locations.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace emmcspi {

enum class TransportKind {
    Gpio,
    Spidev
};

// "gpio" or "spidev"; throws std::invalid_argument otherwise
TransportKind transport_from_name(std::string_view name);
const char* to_string(TransportKind kind);

struct DriverOptions {
    TransportKind transport = TransportKind::Gpio;
    std::string device = "/dev/spidev0.0";
    uint32_t speed_hz = EMMC_SPI_CLOCK_HZ;
    emmc::ReaderConfig reader;
};

using BackendFactory = std::function<std::unique_ptr<emmc::SpiBackend>(const DriverOptions&)>;

// Builds the transport named by options.transport
std::unique_ptr<emmc::SpiBackend> make_backend(const DriverOptions& options);

/**
Owns the Reader for one CLI invocation (or one script run). The transport is
created on first use and the init handshake only runs when a command actually
needs an initialized device.
*/
class DriverContext {
public:
    explicit DriverContext(bool verbose, DriverOptions options = {});
    DriverContext(bool verbose, DriverOptions options, BackendFactory factory);
    ~DriverContext();

    DriverContext(const DriverContext&) = delete;
    DriverContext& operator=(const DriverContext&) = delete;

    DriverContext(DriverContext&&) = delete;
    DriverContext& operator=(DriverContext&&) = delete;

    bool verbose() const noexcept { return verbose_; }
    void set_verbose(bool verbose) noexcept { verbose_ = verbose; }

    const DriverOptions& options() const noexcept { return options_; }

    emmc::Reader& require_reader();
    emmc::Reader& require_initialized();

    bool has_reader() const noexcept { return static_cast<bool>(reader_); }
    bool initialized() const noexcept { return reader_ && reader_->is_initialized(); }

    void shutdown() noexcept;

private:
    bool verbose_;
    DriverOptions options_;
    BackendFactory factory_;
    std::unique_ptr<emmc::Reader> reader_;
};

} // namespace emmcspi

#endif // EMMCSPI_DRIVER_CONTEXT_HPP
