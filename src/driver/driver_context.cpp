#include "emmcspi/driver_context.hpp"
#include "emmc/transports/gpio_bitbang.hpp"
#include "emmc/transports/spidev.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace emmcspi {

TransportKind transport_from_name(std::string_view name) {
    std::string lowered{name};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "gpio" || lowered == "bitbang") {
        return TransportKind::Gpio;
    }
    if (lowered == "spidev" || lowered == "spi") {
        return TransportKind::Spidev;
    }
    throw std::invalid_argument("Unknown transport '" + std::string(name) + "' (expected gpio or spidev)");
}

const char* to_string(TransportKind kind) {
    switch (kind) {
    case TransportKind::Gpio: return "gpio";
    case TransportKind::Spidev: return "spidev";
    }
    return "unknown";
}

std::unique_ptr<emmc::SpiBackend> make_backend(const DriverOptions& options) {
    if (options.transport == TransportKind::Spidev) {
        emmc::transports::SpidevConfig config;
        config.device = options.device;
        config.speed_hz = options.speed_hz;
        return std::make_unique<emmc::transports::SpidevTransport>(std::move(config));
    }
    emmc::transports::BitbangPins pins;
    pins.clock_hz = options.speed_hz;
    return std::make_unique<emmc::transports::GpioBitbangTransport>(pins);
}

DriverContext::DriverContext(bool verbose, DriverOptions options)
    : DriverContext(verbose, std::move(options), make_backend) {}

DriverContext::DriverContext(bool verbose, DriverOptions options, BackendFactory factory)
    : verbose_(verbose), options_(std::move(options)), factory_(std::move(factory)) {
    if (!factory_) {
        throw std::invalid_argument("DriverContext requires a backend factory");
    }
}

DriverContext::~DriverContext() {
    shutdown();
}

emmc::Reader& DriverContext::require_reader() {
    if (!reader_) {
        LOG_EMMC_DEBUG("Opening %s transport", to_string(options_.transport));
        reader_ = std::make_unique<emmc::Reader>(factory_(options_), options_.reader);
    }
    return *reader_;
}

emmc::Reader& DriverContext::require_initialized() {
    emmc::Reader& reader = require_reader();
    if (!reader.is_initialized()) {
        try {
            reader.init();
        } catch (const std::exception&) {
            // next attempt starts from a fresh transport
            reader_.reset();
            throw;
        }
    }
    return reader;
}

void DriverContext::shutdown() noexcept {
    reader_.reset();
}

} // namespace emmcspi
