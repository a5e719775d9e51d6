#include "emmc/commands.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace emmc {

namespace {

struct RegisterName {
    Register reg;
    const char* name;
};

constexpr std::array<RegisterName, 17> kRegisterNames = {{
    {Register::Reg01, "Reg01"},
    {Register::Argument, "Argument"},
    {Register::CommandAndTransferMode, "CommandAndTransferMode"},
    {Register::Response0And1, "Response0And1"},
    {Register::Response2And3, "Response2And3"},
    {Register::Response4And5, "Response4And5"},
    {Register::Response6And7, "Response6And7"},
    {Register::DataFifo, "DataFifo"},
    {Register::PresentState, "PresentState"},
    {Register::Reg0A, "Reg0A"},
    {Register::StatusConfig, "StatusConfig"},
    {Register::InterruptStatus, "InterruptStatus"},
    {Register::Config1, "Config1"},
    {Register::Config2, "Config2"},
    {Register::Reg0F, "Reg0F"},
    {Register::InitCommand, "InitCommand"},
    {Register::XipOutputDelay, "XipOutputDelay"},
}};

std::string lowercase(std::string_view text) {
    std::string lowered{text};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered;
}

} // namespace

std::optional<Register> register_from_address(uint8_t addr) {
    for (const auto& entry : kRegisterNames) {
        if (address(entry.reg) == addr) return entry.reg;
    }
    return std::nullopt;
}

std::optional<Register> register_from_name(std::string_view name) {
    const std::string wanted = lowercase(name);
    for (const auto& entry : kRegisterNames) {
        if (lowercase(entry.name) == wanted) return entry.reg;
    }
    return std::nullopt;
}

const char* to_string(Register reg) {
    for (const auto& entry : kRegisterNames) {
        if (entry.reg == reg) return entry.name;
    }
    return "Unknown";
}

const char* to_string(Command command) {
    switch (command) {
    case Command::Read:
        return "Read";
    case Command::Write:
        return "Write";
    }
    return "Unknown";
}

} // namespace emmc
