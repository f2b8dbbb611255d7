#include "command_line.hpp"
#include <stdexcept>

namespace ghack {

std::optional<uint16_t> parse_port(const std::string& text) {
    int value = 0;
    size_t used = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (used != text.size() || value < 1 || value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(value);
}

} // namespace ghack
