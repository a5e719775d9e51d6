#include "emmcspi/command_arguments.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace emmcspi {

namespace {
const std::vector<std::string> kEmptyValues;
}

uint32_t parse_u32(const std::string& token, std::string_view what) {
    const std::string label{what};
    if (token.empty() || token.front() == '-' || token.front() == '+') {
        throw std::invalid_argument(label + " expects an unsigned integer, got '" + token + "'");
    }
    std::size_t idx = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(token, &idx, 0);
    } catch (const std::exception&) {
        throw std::invalid_argument(label + " expects an unsigned integer, got '" + token + "'");
    }
    if (idx != token.size()) {
        throw std::invalid_argument(label + " expects an unsigned integer, got '" + token + "'");
    }
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument(label + " value '" + token + "' does not fit in 32 bits");
    }
    return static_cast<uint32_t>(parsed);
}

std::optional<uint32_t> u32_from_number(double value) {
    if (std::isnan(value) || value != std::floor(value)) {
        return std::nullopt;
    }
    if (value < 0.0 || value > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
        return std::nullopt;
    }
    return static_cast<uint32_t>(value);
}

CommandArguments::CommandArguments() = default;

CommandArguments::CommandArguments(std::unordered_map<std::string, std::vector<std::string>> options,
                                   std::vector<std::string> positionals)
    : options_(std::move(options)), positionals_(std::move(positionals)) {}

bool CommandArguments::has(std::string_view long_name) const {
    return options_.find(std::string(long_name)) != options_.end();
}

const std::vector<std::string>& CommandArguments::values(std::string_view long_name) const {
    const auto it = options_.find(std::string(long_name));
    return it == options_.end() ? kEmptyValues : it->second;
}

std::optional<std::string> CommandArguments::value(std::string_view long_name) const {
    const auto& all = values(long_name);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::string CommandArguments::value_or(std::string_view long_name, std::string_view fallback) const {
    auto opt = value(long_name);
    return opt ? *opt : std::string(fallback);
}

uint32_t CommandArguments::value_as_u32(std::string_view long_name, uint32_t fallback) const {
    auto opt = value(long_name);
    if (!opt) {
        return fallback;
    }
    return parse_u32(*opt, "Option '--" + std::string(long_name) + "'");
}

uint32_t CommandArguments::require_u32(std::string_view long_name) const {
    auto opt = value(long_name);
    if (!opt) {
        throw std::invalid_argument("Missing required option '--" + std::string(long_name) + "'");
    }
    return parse_u32(*opt, "Option '--" + std::string(long_name) + "'");
}

std::size_t CommandArguments::positional_count() const noexcept {
    return positionals_.size();
}

const std::string& CommandArguments::positional(std::size_t index) const {
    if (index >= positionals_.size()) {
        throw std::out_of_range("positional argument index out of range");
    }
    return positionals_[index];
}

uint32_t CommandArguments::positional_u32(std::size_t index, std::string_view what) const {
    return parse_u32(positional(index), what);
}

} // namespace emmcspi
