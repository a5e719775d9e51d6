#include "emmc/init_script.hpp"

namespace emmc {

namespace {

constexpr ScriptStep W(Register reg, uint32_t value) { return {ScriptStep::Op::Write, reg, value}; }
constexpr ScriptStep E(Register reg, uint32_t value) { return {ScriptStep::Op::Expect, reg, value}; }

using R = Register;

} // namespace

const std::vector<ScriptStep>& controller_setup_script() {
    static const std::vector<ScriptStep> steps = {
        E(R::StatusConfig, 0x0),
        W(R::StatusConfig, 0x1),
        E(R::StatusConfig, 0x3),
        E(R::StatusConfig, 0x3),

        W(R::StatusConfig, 0x3),
        W(R::StatusConfig, 0x43),
        W(R::StatusConfig, 0x47),
        E(R::Config1, 0x0),

        W(R::Config1, 0x1FFF0033),
        E(R::Config2, 0x0),
        W(R::Config2, 0x17FF0033),
        W(R::Argument, 0x0),
        W(R::CommandAndTransferMode, 0x0),
        E(R::InterruptStatus, 0x1),
        W(R::InterruptStatus, 0x1),
        E(R::StatusConfig, 0x47),
        W(R::StatusConfig, 0xE0047),
    };
    return steps;
}

const std::vector<ScriptStep>& card_setup_script() {
    static const std::vector<ScriptStep> steps = {
        // identification
        W(R::Argument, 0x0),
        W(R::CommandAndTransferMode, 0x2090000),
        E(R::InterruptStatus, 0x0),
        E(R::InterruptStatus, 0x0),
        E(R::InterruptStatus, 0x1),
        W(R::InterruptStatus, 0x1),
        E(R::Response0And1, device_id::RESPONSE_0_1),
        E(R::Response2And3, device_id::RESPONSE_2_3),
        E(R::Response4And5, device_id::RESPONSE_4_5),
        E(R::Response6And7, device_id::RESPONSE_6_7),

        W(R::Argument, 0xA0000),
        W(R::CommandAndTransferMode, 0x31A0000),
        E(R::InterruptStatus, 0x0),
        E(R::InterruptStatus, 0x1),
        W(R::InterruptStatus, 0x1),

        W(R::Argument, 0xA0000),
        W(R::CommandAndTransferMode, 0x71A0000),
        E(R::InterruptStatus, 0x0),
        E(R::InterruptStatus, 0x1),
        W(R::InterruptStatus, 0x1),

        W(R::Argument, 0x3B70200),
        W(R::CommandAndTransferMode, 0x61B0000),
        E(R::InterruptStatus, 0x0),
        E(R::InterruptStatus, 0x3),
        W(R::InterruptStatus, 0x1),
        E(R::InterruptStatus, 0x2),
        W(R::InterruptStatus, 0x2),
        E(R::Reg0A, 0x800000),
        W(R::Reg0A, 0x800020),

        W(R::Argument, 0x200),
        W(R::CommandAndTransferMode, 0x101A0000),
        E(R::InterruptStatus, 0x0),
        E(R::InterruptStatus, 0x1),
        W(R::InterruptStatus, 0x1),

        W(R::Argument, 0x3B90100),
        W(R::CommandAndTransferMode, 0x61B0000),
        E(R::InterruptStatus, 0x0),
        E(R::InterruptStatus, 0x3),
        W(R::InterruptStatus, 0x1),
        E(R::InterruptStatus, 0x2),
        W(R::InterruptStatus, 0x2),
        E(R::Reg0F, 0x0),

        // bus timing
        W(R::Reg0F, 0x80000),
        W(R::Reg0A, 0x800024),
        W(R::XipOutputDelay, 0x70001),
        E(R::XipOutputDelay, 0x70001),
        E(R::StatusConfig, 0xE0047),
        W(R::StatusConfig, 0xE0047),
        E(R::StatusConfig, 0xE0047),
        W(R::StatusConfig, 0xE0043),
        W(R::StatusConfig, 0xE0203),
        W(R::StatusConfig, 0xE0207),
        W(R::Reg01, 0x10200),
    };
    return steps;
}

} // namespace emmc
