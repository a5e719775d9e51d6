#ifndef EMMCSPI_COMMAND_ARGUMENTS_HPP
#define EMMCSPI_COMMAND_ARGUMENTS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace emmcspi {

// Parse "0x1F", "017" or "31" as an unsigned 32-bit value; throws std::invalid_argument.
uint32_t parse_u32(const std::string& token, std::string_view what);

// Numeric values coming from scripts: integral and within 0..UINT32_MAX,
// otherwise nullopt (NaN and fractions included).
std::optional<uint32_t> u32_from_number(double value);

class CommandArguments {
public:
    CommandArguments();
    CommandArguments(std::unordered_map<std::string, std::vector<std::string>> options,
                     std::vector<std::string> positionals);

    bool has(std::string_view long_name) const;
    const std::vector<std::string>& values(std::string_view long_name) const;
    std::optional<std::string> value(std::string_view long_name) const;
    std::string value_or(std::string_view long_name, std::string_view fallback) const;

    uint32_t value_as_u32(std::string_view long_name, uint32_t fallback) const;
    uint32_t require_u32(std::string_view long_name) const;

    std::size_t positional_count() const noexcept;
    const std::string& positional(std::size_t index) const;
    uint32_t positional_u32(std::size_t index, std::string_view what) const;
    const std::vector<std::string>& positionals() const noexcept { return positionals_; }

private:
    std::unordered_map<std::string, std::vector<std::string>> options_;
    std::vector<std::string> positionals_;
};

} // namespace emmcspi

#endif // EMMCSPI_COMMAND_ARGUMENTS_HPP
