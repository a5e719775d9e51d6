#include "emmcspi/commands/emmc.hpp"
#include "emmcspi/command_context.hpp"
#include "emmcspi/driver_context.hpp"
#include "emmc/commands.hpp"
#include "emmc/data_sink.hpp"
#include "emmc/error.hpp"
#include "emmc/mmc_status.hpp"
#include "emmc/reader.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <limits>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace emmcspi::commands {
namespace {

// Card status words carry the current state in bits 9..12
constexpr unsigned kCardStateShift = 9;

emmc::Register parse_register(const std::string& token) {
    if (auto reg = emmc::register_from_name(token)) {
        return *reg;
    }
    const uint32_t addr = parse_u32(token, "Register");
    if (addr > 0xFF) {
        throw std::invalid_argument("Register address '" + token + "' does not fit in 8 bits");
    }
    if (auto reg = emmc::register_from_address(static_cast<uint8_t>(addr))) {
        return *reg;
    }
    throw std::invalid_argument("No known register at address " + token);
}

void print_register_line(std::ostream& out, emmc::Register reg, uint32_t value) {
    out << std::left << std::setw(24) << emmc::to_string(reg) << std::right
        << "(0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<unsigned>(emmc::address(reg)) << ") = " << emmc::format_hex32(value)
        << std::dec << std::nouppercase << std::setfill(' ') << "\n";
}

// Both words carry the card state in bits 9..12: the R1 status returned in
// Response0And1 and the controller's PresentState snapshot.
void print_card_state(std::ostream& out, const char* source, uint32_t word) {
    const auto state = emmc::mmc_state_from_bits(static_cast<uint8_t>(word >> kCardStateShift));
    out << "Card state (" << source << "): " << (state ? emmc::to_string(*state) : "none") << "\n";
}

// --no-init brings up the transport only and skips the handshake. A device
// that already went through init is left alone: initialize() resets it.
emmc::Reader& reader_for(const CommandContext& context) {
    if (!context.arguments.has("no-init")) {
        return context.driver.require_initialized();
    }
    auto& reader = context.driver.require_reader();
    if (!reader.is_initialized()) {
        reader.backend().initialize();
    }
    return reader;
}

int init_command(const CommandContext& context) {
    const bool was_initialized = context.driver.initialized();
    auto& reader = context.driver.require_initialized();
    context.out << (was_initialized ? "Device already initialized" : "Device initialized")
                << " over " << to_string(context.driver.options().transport) << "\n";
    if (context.arguments.has("show-id")) {
        for (uint8_t i = 0; i < 4; ++i) {
            context.out << "Response[" << static_cast<unsigned>(i) << "]: "
                        << emmc::format_hex32(reader.read_response(i)) << "\n";
        }
    }
    return 0;
}

int status_command(const CommandContext& context) {
    auto& reader = reader_for(context);

    const uint32_t interrupt_status = reader.read_interrupt_status();
    const uint32_t present_state = reader.read_present_state();
    const uint32_t status_config = reader.read_status_config();
    const uint32_t card_status = reader.read_response(0);

    print_register_line(context.out, emmc::Register::InterruptStatus, interrupt_status);
    print_register_line(context.out, emmc::Register::PresentState, present_state);
    print_register_line(context.out, emmc::Register::StatusConfig, status_config);
    print_register_line(context.out, emmc::Register::Response0And1, card_status);
    print_card_state(context.out, "R1 response", card_status);
    print_card_state(context.out, "PresentState", present_state);
    context.out << "Card errors: " << emmc::ErrorFlags(card_status).describe() << "\n";
    return 0;
}

int read_register_command(const CommandContext& context) {
    auto& reader = reader_for(context);
    for (const auto& token : context.arguments.positionals()) {
        const emmc::Register reg = parse_register(token);
        print_register_line(context.out, reg, reader.read_register(reg));
    }
    return 0;
}

int write_register_command(const CommandContext& context) {
    const emmc::Register reg = parse_register(context.arguments.positional(0));
    const uint32_t value = context.arguments.positional_u32(1, "Value");
    auto& reader = context.driver.require_initialized();
    reader.write_register(reg, value);
    if (context.arguments.has("verify")) {
        const uint32_t readback = reader.read_register(reg);
        print_register_line(context.out, reg, readback);
        if (readback != value) {
            context.err << "Readback mismatch: wrote " << emmc::format_hex32(value) << "\n";
            return 1;
        }
    } else {
        context.out << "Wrote " << emmc::format_hex32(value) << " to " << emmc::to_string(reg) << "\n";
    }
    return 0;
}

std::unique_ptr<emmc::DataSink> make_sink(const CommandContext& context, uint32_t base_offset) {
    if (auto output = context.arguments.value("output")) {
        return std::make_unique<emmc::FileDataSink>(*output);
    }
    return std::make_unique<emmc::HexOstreamDataSink>(context.out, base_offset);
}

int read_page_command(const CommandContext& context) {
    const uint32_t page = context.arguments.positional_u32(0, "Page");
    const uint32_t count = context.arguments.value_as_u32("count", 1);
    if (count == 0) {
        throw std::invalid_argument("--count must be at least 1");
    }
    if (count - 1 > std::numeric_limits<uint32_t>::max() - page) {
        throw std::invalid_argument("Page range " + std::to_string(page) + " + " + std::to_string(count) +
                                    " runs past the last page argument");
    }
    auto& reader = context.driver.require_initialized();
    auto sink = make_sink(context, 0);

    emmc::PageBuffer buffer{};
    for (uint32_t i = 0; i < count; ++i) {
        reader.read_page(page + i, buffer);
        sink->write(buffer.data(), buffer.size());
    }
    sink->flush();
    return 0;
}

int dump_command(const CommandContext& context) {
    const uint32_t start = context.arguments.value_as_u32("start", 0);
    const uint32_t end = context.arguments.value_as_u32("end", kDumpEnd);
    const uint32_t stride = context.arguments.value_as_u32("stride", kDumpStride);
    const std::string output = context.arguments.value_or("output", "dump.bin");
    if (stride == 0) {
        throw std::invalid_argument("--stride must be non-zero");
    }
    if (end <= start) {
        throw std::invalid_argument("--end must be greater than --start");
    }

    auto& reader = context.driver.require_initialized();
    emmc::FileDataSink sink(output);

    const uint64_t total = (static_cast<uint64_t>(end - start) + stride - 1) / stride;
    const uint64_t report_every = std::max<uint64_t>(1, total / 20);
    uint64_t done = 0;
    emmc::PageBuffer buffer{};
    for (uint64_t arg = start; arg < end; arg += stride) {
        reader.read_page(static_cast<uint32_t>(arg), buffer);
        sink.write(buffer.data(), buffer.size());
        ++done;
        if (context.verbose && (done % report_every == 0 || done == total)) {
            context.err << "dump: " << done << "/" << total << " pages\n";
        }
    }
    sink.flush();
    context.out << "Dumped " << done << " pages (" << done * emmc::kPageSize << " bytes) to " << output << "\n";
    return 0;
}

int erase_page_command(const CommandContext& context) {
    const uint32_t page = context.arguments.positional_u32(0, "Page");
    auto& reader = context.driver.require_initialized();
    reader.erase_page(page);
    context.out << "Erased page " << page << "\n";
    return 0;
}

int write_page_command(const CommandContext& context) {
    const uint32_t page = context.arguments.positional_u32(0, "Page");
    const std::string input = context.arguments.positional(1);

    emmc::PageBuffer buffer{};
    std::ifstream ifs(input, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Failed to open input file: " + input);
    }
    ifs.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (ifs.gcount() != static_cast<std::streamsize>(buffer.size())) {
        throw std::invalid_argument("Input file must hold at least " + std::to_string(buffer.size()) + " bytes");
    }

    auto& reader = context.driver.require_initialized();
    reader.write_page(page, buffer);
    context.out << "Wrote page " << page << "\n";
    return 0;
}

int registers_command(const CommandContext& context) {
    for (unsigned addr = 0; addr <= 0xFF; ++addr) {
        if (auto reg = emmc::register_from_address(static_cast<uint8_t>(addr))) {
            context.out << "0x" << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << addr
                        << std::dec << std::nouppercase << std::setfill(' ') << "  " << emmc::to_string(*reg) << "\n";
        }
    }
    return 0;
}

} // namespace

void register_emmc_commands(CommandRegistry& registry) {
    registry.register_command({
        .name = "init",
        .aliases = {"bringup"},
        .summary = "Run the controller bring-up and init handshake.",
        .description = "Initializes the transport, checks the Argument register loopback, replays the captured init script including memory training, and reports success.",
        .usage = "emmcspi init [--show-id]",
        .options = {
            OptionSpec{"show-id", '\0', false, false, false, "", "Print the four identification response registers afterwards."}
        },
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::Safe,
        .requires_device = true,
        .handler = init_command,
    });

    registry.register_command({
        .name = "status",
        .aliases = {},
        .summary = "Show controller status registers and decoded card state.",
        .description = "Reads InterruptStatus, PresentState, StatusConfig and Response0And1, then decodes the card state and error bits of the latter.",
        .usage = "emmcspi status [--no-init]",
        .options = {
            OptionSpec{"no-init", '\0', false, false, false, "", "Skip the init handshake (reads whatever the controller holds)."}
        },
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::Safe,
        .requires_device = true,
        .handler = status_command,
    });

    registry.register_command({
        .name = "registers",
        .aliases = {"regs"},
        .summary = "List the known controller registers.",
        .description = "Prints every named register address; useful with read-register and write-register.",
        .usage = "emmcspi registers",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::Safe,
        .requires_device = false,
        .handler = registers_command,
    });

    registry.register_command({
        .name = "read-register",
        .aliases = {"rr"},
        .summary = "Read one or more controller registers.",
        .description = "Registers are given by name (case-insensitive) or address. With --no-init only the transport is brought up.",
        .usage = "emmcspi read-register [--no-init] <register>...",
        .options = {
            OptionSpec{"no-init", '\0', false, false, false, "", "Skip the init handshake."}
        },
        .min_positionals = 1,
        .max_positionals = static_cast<std::size_t>(-1),
        .safety = CommandSafety::Safe,
        .requires_device = true,
        .handler = read_register_command,
    });

    registry.register_command({
        .name = "write-register",
        .aliases = {"wr"},
        .summary = "Write a 32-bit value to a controller register.",
        .description = "Writes after the init handshake. --verify reads the register back and fails on mismatch.",
        .usage = "emmcspi write-register --force [--verify] <register> <value>",
        .options = {
            OptionSpec{"verify", '\0', false, false, false, "", "Read the register back after writing."}
        },
        .min_positionals = 2,
        .max_positionals = 2,
        .safety = CommandSafety::RequiresForce,
        .requires_device = true,
        .handler = write_register_command,
    });

    registry.register_command({
        .name = "read-page",
        .aliases = {"rp"},
        .summary = "Read 512-byte pages and hex dump them or save them.",
        .description = "Reads --count consecutive pages starting at <page> using the captured read sequence.",
        .usage = "emmcspi read-page <page> [--count <n>] [--output <file>]",
        .options = {
            OptionSpec{"count", 'n', true, false, false, "n", "Number of consecutive pages (default 1)."},
            OptionSpec{"output", 'o', true, false, false, "file", "Write raw page data to a file instead of a hex dump."}
        },
        .min_positionals = 1,
        .max_positionals = 1,
        .safety = CommandSafety::Safe,
        .requires_device = true,
        .handler = read_page_command,
    });

    registry.register_command({
        .name = "dump",
        .aliases = {},
        .summary = "Dump a range of pages to a file.",
        .description = "Issues a page read for every argument from --start to --end (exclusive) in steps of --stride and appends each 512-byte page to --output. Defaults cover the whole card: 0..0x9E0000 step 512 into dump.bin.",
        .usage = "emmcspi dump [--start <arg>] [--end <arg>] [--stride <n>] [--output <file>]",
        .options = {
            OptionSpec{"start", '\0', true, false, false, "arg", "First page argument (default 0)."},
            OptionSpec{"end", '\0', true, false, false, "arg", "Exclusive end argument (default 0x9E0000)."},
            OptionSpec{"stride", '\0', true, false, false, "n", "Argument increment between reads (default 512)."},
            OptionSpec{"output", 'o', true, false, false, "file", "Output file (default dump.bin)."}
        },
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::Safe,
        .requires_device = true,
        .handler = dump_command,
    });

    registry.register_command({
        .name = "erase-page",
        .aliases = {},
        .summary = "Erase one page (not yet supported by the controller model).",
        .description = "The erase sequence has not been captured; the command reports NotImplemented without touching the card.",
        .usage = "emmcspi erase-page --force <page>",
        .options = {},
        .min_positionals = 1,
        .max_positionals = 1,
        .safety = CommandSafety::RequiresForce,
        .requires_device = true,
        .handler = erase_page_command,
    });

    registry.register_command({
        .name = "write-page",
        .aliases = {},
        .summary = "Write one page from a file (not yet supported by the controller model).",
        .description = "Reads 512 bytes from <file>. The write sequence has not been captured; the command reports NotImplemented without touching the card.",
        .usage = "emmcspi write-page --force <page> <file>",
        .options = {},
        .min_positionals = 2,
        .max_positionals = 2,
        .safety = CommandSafety::RequiresForce,
        .requires_device = true,
        .handler = write_page_command,
    });
}

} // namespace emmcspi::commands
