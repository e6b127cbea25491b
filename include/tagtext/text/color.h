#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tagtext::text {

struct TextColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    uint32_t value() const {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) | b;
    }

    // "#rrggbb", lowercase
    std::string as_hex_string() const;

    static TextColor from_rgb(uint32_t rgb);

    // Accepts "#rrggbb" only.
    static std::optional<TextColor> from_hex(std::string_view text);

    // One of the 16 named colors, case-insensitive ("grey" spellings included).
    static std::optional<TextColor> named(std::string_view name);

    // Named color or "#rrggbb".
    static std::optional<TextColor> parse(std::string_view text);

    bool operator==(const TextColor& other) const { return value() == other.value(); }
    bool operator!=(const TextColor& other) const { return !(*this == other); }
};

// Reverse lookup for output; nullptr when the color has no name.
const char* color_name(const TextColor& color);

} // namespace tagtext::text
