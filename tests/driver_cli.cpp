#undef NDEBUG
#include "emmcspi/cli_parser.hpp"
#include "emmcspi/command_context.hpp"
#include "emmcspi/command_registry.hpp"
#include "emmcspi/commands/emmc.hpp"
#include "emmcspi/driver_context.hpp"
#include "emmcspi/scripting/lua_engine.hpp"
#include "emmc/error.hpp"
#include "mock_backend.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace emmcspi;
using emmc::testing::MockBackend;

namespace {

struct Harness {
    CommandRegistry registry;
    MockBackend* mock = nullptr;
    int backends_created = 0;
    std::unique_ptr<DriverContext> driver;

    Harness() {
        commands::register_emmc_commands(registry);
        DriverOptions options;
        options.reader.poll_interval_us = 0;
        options.reader.training_interval_us = 0;
        driver = std::make_unique<DriverContext>(false, options, [this](const DriverOptions&) {
            auto backend = std::make_unique<MockBackend>();
            emmc::testing::queue_healthy_init(*backend, 2);
            mock = backend.get();
            ++backends_created;
            return std::unique_ptr<emmc::SpiBackend>(std::move(backend));
        });
    }

    int run(const std::vector<std::string>& argv, std::string* out_text = nullptr) {
        const Command* command = registry.find(argv.front());
        assert(command != nullptr);
        ParsedCommand parsed = parse_command_arguments(*command, {argv.begin() + 1, argv.end()});
        std::ostringstream out;
        std::ostringstream err;
        CommandContext context{registry, *driver, *command, std::move(parsed.arguments), out, err, false, parsed.force, parsed.help_requested};
        const int status = command->handler(context);
        if (out_text) *out_text = out.str();
        return status;
    }

    // Answers for one read_page handshake
    void queue_page() {
        mock->queue(emmc::Register::InterruptStatus,
                    {emmc::status::CMD_ACCEPTED, emmc::status::DATA_READY, emmc::status::TRANSFER_COMPLETE});
    }
};

template <typename Fn>
bool throws_invalid_argument(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void registry_and_parser() {
    CommandRegistry registry;

    Command parse_cmd{
        .name = "sample",
        .aliases = {"alias"},
        .summary = "",
        .description = "",
        .usage = "emmcspi sample --count <n> <a> [b]",
        .options = {
            OptionSpec{"count", 'c', true, true, false, "n", ""}
        },
        .min_positionals = 1,
        .max_positionals = 2,
        .safety = CommandSafety::Safe,
        .requires_device = false,
        .handler = [](const CommandContext&) { return 0; }
    };

    Command& stored = registry.register_command(parse_cmd);

    ParsedCommand parsed = parse_command_arguments(stored, {"--count", "0x10", "alpha", "beta"});
    assert(!parsed.help_requested);
    assert(!parsed.force);
    auto count_value = parsed.arguments.value("count");
    assert(count_value.has_value());
    assert(*count_value == "0x10");
    assert(parsed.arguments.require_u32("count") == 16);
    assert(parsed.arguments.value_as_u32("missing", 7) == 7);
    assert(parsed.arguments.positional_count() == 2);
    assert(parsed.arguments.positional(0) == "alpha");
    assert(parsed.arguments.positional(1) == "beta");

    ParsedCommand short_form = parse_command_arguments(stored, {"-c", "3", "alpha"});
    assert(short_form.arguments.require_u32("count") == 3);

    assert(registry.find("alias") == &stored);
    assert(registry.find("SAMPLE") == &stored);
    assert(registry.find("nope") == nullptr);

    // missing required option and positionals
    assert(throws_invalid_argument([&] { (void)parse_command_arguments(stored, {}); }));
    assert(throws_invalid_argument([&] { (void)parse_command_arguments(stored, {"--count", "1"}); }));
    assert(throws_invalid_argument([&] { (void)parse_command_arguments(stored, {"--count", "1", "a", "b", "c"}); }));
    assert(throws_invalid_argument([&] { (void)parse_command_arguments(stored, {"--bogus", "a"}); }));

    ParsedCommand help_parse = parse_command_arguments(stored, {"--help"});
    assert(help_parse.help_requested);

    // duplicate names and aliases are refused without side effects
    Command clash = parse_cmd;
    clash.name = "other";
    assert(throws_invalid_argument([&] { registry.register_command(clash); }));
    assert(registry.find("other") == nullptr);

    Command destructive{
        .name = "danger",
        .aliases = {},
        .summary = "",
        .description = "",
        .usage = "emmcspi danger",
        .options = {},
        .min_positionals = 0,
        .max_positionals = 0,
        .safety = CommandSafety::RequiresForce,
        .requires_device = true,
        .handler = [](const CommandContext&) { return 0; }
    };

    Command& stored_destructive = registry.register_command(destructive);
    assert(throws_invalid_argument([&] { (void)parse_command_arguments(stored_destructive, {}); }));
    ParsedCommand forced = parse_command_arguments(stored_destructive, {"--force"});
    assert(forced.force);

    std::ostringstream usage;
    print_command_usage(stored, usage);
    assert(usage.str().find("--count") != std::string::npos);
}

void number_parsing() {
    assert(parse_u32("31", "n") == 31);
    assert(parse_u32("0x1F", "n") == 31);
    assert(parse_u32("0XFFFFFFFF", "n") == 0xFFFFFFFF);
    assert(throws_invalid_argument([] { (void)parse_u32("-5", "n"); }));
    assert(throws_invalid_argument([] { (void)parse_u32("0x100000000", "n"); }));
    assert(throws_invalid_argument([] { (void)parse_u32("12abc", "n"); }));
    assert(throws_invalid_argument([] { (void)parse_u32("", "n"); }));

    assert(u32_from_number(0.0) == 0u);
    assert(u32_from_number(4294967295.0) == 0xFFFFFFFFu);
    assert(!u32_from_number(4294967296.0).has_value());
    assert(!u32_from_number(-1.0).has_value());
    assert(!u32_from_number(1.5).has_value());
    assert(!u32_from_number(std::nan("")).has_value());
    assert(!u32_from_number(std::numeric_limits<double>::infinity()).has_value());
}

void transport_names() {
    assert(transport_from_name("gpio") == TransportKind::Gpio);
    assert(transport_from_name("SPIDEV") == TransportKind::Spidev);
    assert(std::string(to_string(TransportKind::Spidev)) == "spidev");
    assert(throws_invalid_argument([] { (void)transport_from_name("ftdi"); }));
}

void emmc_commands_are_registered() {
    CommandRegistry registry;
    commands::register_emmc_commands(registry);
    for (const char* name : {"init", "bringup", "status", "registers", "regs", "read-register", "rr",
                             "write-register", "wr", "read-page", "rp", "dump", "erase-page", "write-page"}) {
        assert(registry.find(name) != nullptr);
    }
    assert(registry.find("write-register")->safety == CommandSafety::RequiresForce);
    assert(registry.find("erase-page")->safety == CommandSafety::RequiresForce);
    assert(!registry.find("registers")->requires_device);
}

void init_runs_once_per_context() {
    Harness h;
    std::string text;
    assert(h.run({"init"}, &text) == 0);
    assert(text.find("Device initialized") != std::string::npos);
    assert(h.driver->initialized());

    assert(h.run({"init", "--show-id"}, &text) == 0);
    assert(text.find("already initialized") != std::string::npos);
    assert(h.backends_created == 1);
    assert(h.mock->initialize_calls == 1);
}

void register_access() {
    Harness h;
    std::string text;
    assert(h.run({"read-register", "--no-init", "argument", "0x09"}, &text) == 0);
    assert(text.find("Argument") != std::string::npos);
    assert(text.find("PresentState") != std::string::npos);
    assert(!h.driver->initialized());

    assert(h.run({"write-register", "--force", "--verify", "Config1", "0x1FFF0033"}, &text) == 0);
    assert(text.find("0x1FFF0033") != std::string::npos);
    assert(h.driver->initialized());

    assert(throws_invalid_argument([&] { h.run({"read-register", "--no-init", "0x10"}); }));
    assert(throws_invalid_argument([&] { h.run({"read-register", "--no-init", "0x1FF"}); }));
}

void read_page_prints_hex() {
    Harness h;
    assert(h.run({"init"}) == 0);
    h.queue_page();

    std::string text;
    assert(h.run({"read-page", "0x41"}, &text) == 0);
    // 512 bytes, 16 per line
    assert(std::count(text.begin(), text.end(), '\n') == 32);
    assert(text.rfind("00000000: 41 42", 0) == 0);
}

void dump_writes_file() {
    Harness h;
    assert(h.run({"init"}) == 0);
    h.queue_page();
    h.queue_page();

    const auto path = std::filesystem::temp_directory_path() / "emmcspi_dump_test.bin";
    std::string text;
    assert(h.run({"dump", "--start", "0", "--end", "1024", "--stride", "512", "--output", path.string()}, &text) == 0);
    assert(text.find("Dumped 2 pages") != std::string::npos);

    std::ifstream in(path, std::ios::binary);
    std::vector<char> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    assert(bytes.size() == 1024);
    // page argument 512 seeds the second buffer with 0x00
    assert(static_cast<uint8_t>(bytes[0]) == 0x00);
    assert(static_cast<uint8_t>(bytes[513]) == 0x01);
    in.close();
    std::filesystem::remove(path);

    assert(throws_invalid_argument([&] { h.run({"dump", "--start", "10", "--end", "10"}); }));
    assert(throws_invalid_argument([&] { h.run({"dump", "--stride", "0"}); }));
}

void unsupported_operations_report_not_implemented() {
    Harness h;
    bool threw = false;
    try {
        h.run({"erase-page", "--force", "5"});
    } catch (const emmc::Error& ex) {
        threw = ex.kind() == emmc::ErrorKind::NotImplemented;
    }
    assert(threw);
    assert(h.driver->initialized());
}

void failed_init_drops_the_transport() {
    Harness h;
    assert(h.driver->require_reader().read_register(emmc::Register::Argument) == 0);
    h.mock->fail_initialize = true;

    bool threw = false;
    try {
        h.run({"status"});
    } catch (const emmc::Error& ex) {
        threw = ex.kind() == emmc::ErrorKind::Transport;
    }
    assert(threw);
    assert(!h.driver->has_reader());

    std::string text;
    assert(h.run({"status"}, &text) == 0);
    assert(h.backends_created == 2);
    assert(text.find("Card state (R1 response):") != std::string::npos);
}

void status_without_init_keeps_handshake() {
    Harness h;
    assert(h.run({"init"}) == 0);
    assert(h.mock->initialize_calls == 1);

    h.mock->registers[emmc::Register::Response0And1] = 3u << 9;
    h.mock->registers[emmc::Register::PresentState] = 4u << 9;
    std::string text;
    assert(h.run({"status", "--no-init"}, &text) == 0);
    assert(h.mock->initialize_calls == 1);
    assert(h.driver->initialized());
    assert(text.find("Card state (R1 response): Standby") != std::string::npos);
    assert(text.find("Card state (PresentState): Transfer") != std::string::npos);
    assert(text.find("Card errors: none") != std::string::npos);

    // the handshake still holds for page reads afterwards
    h.queue_page();
    assert(h.run({"read-page", "2"}) == 0);
    assert(h.mock->initialize_calls == 1);
}

void page_range_must_fit_in_32_bits() {
    Harness h;
    assert(throws_invalid_argument([&] { h.run({"read-page", "--count", "2", "0xFFFFFFFF"}); }));
    assert(throws_invalid_argument([&] { h.run({"read-page", "-n", "0x10", "0xFFFFFFF8"}); }));
    assert(h.backends_created == 0);

    assert(h.run({"init"}) == 0);
    h.queue_page();
    h.queue_page();
    assert(h.run({"read-page", "--count", "2", "0xFFFFFFFE"}) == 0);
    assert(h.mock->count(MockBackend::Op::Kind::ReadData, emmc::Register::DataFifo) == 2);
}

#if EMMCSPI_WITH_LUAJIT
void lua_errors_stay_catchable() {
    Harness h;
    assert(h.run({"init"}) == 0);
    h.mock->fail_on_read = emmc::Register::PresentState;

    std::ostringstream out;
    std::ostringstream err;
    scripting::LuaEngine engine(h.registry, *h.driver, out, err, false);
    engine.open_standard_libraries(false);
    engine.register_bindings();
    const int status = engine.run_string(
        "local ok, msg = pcall(emmc.read_register, 'PresentState')\n"
        "assert(not ok and msg:find('read_register failed', 1, true))\n"
        "assert(not pcall(emmc.write_register, 'Argument', 1.5))\n"
        "assert(not pcall(emmc.write_register, 'Argument', -1))\n"
        "emmc.write_register('Argument', 0xCAFEF00D)\n"
        "assert(emmc.read_register('Argument') == 0xCAFEF00D)\n");
    assert(status == 0);
    assert(err.str().empty());
    assert(h.mock->registers[emmc::Register::Argument] == 0xCAFEF00D);
}
#endif

} // namespace

int main() {
    registry_and_parser();
    number_parsing();
    transport_names();
    emmc_commands_are_registered();
    init_runs_once_per_context();
    register_access();
    read_page_prints_hex();
    dump_writes_file();
    unsupported_operations_report_not_implemented();
    failed_init_drops_the_transport();
    status_without_init_keeps_handshake();
    page_range_must_fit_in_32_bits();
#if EMMCSPI_WITH_LUAJIT
    lua_errors_stay_catchable();
#endif
    return 0;
}
