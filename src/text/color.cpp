#include <tagtext/text/color.h>
#include <cctype>
#include <cstdio>

namespace tagtext::text {

namespace {

struct NamedColor {
    const char* name;
    uint32_t rgb;
};

const NamedColor kNamedColors[] = {
    {"black",        0x000000},
    {"dark_blue",    0x0000aa},
    {"dark_green",   0x00aa00},
    {"dark_aqua",    0x00aaaa},
    {"dark_red",     0xaa0000},
    {"dark_purple",  0xaa00aa},
    {"gold",         0xffaa00},
    {"gray",         0xaaaaaa},
    {"dark_gray",    0x555555},
    {"blue",         0x5555ff},
    {"green",        0x55ff55},
    {"aqua",         0x55ffff},
    {"red",          0xff5555},
    {"light_purple", 0xff55ff},
    {"yellow",       0xffff55},
    {"white",        0xffffff},
};

std::string to_lower_ascii(std::string_view text) {
    std::string lowered;
    lowered.reserve(text.size());
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return lowered;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

} // namespace

std::string TextColor::as_hex_string() const {
    char buffer[8];
    std::snprintf(buffer, sizeof(buffer), "#%02x%02x%02x", r, g, b);
    return buffer;
}

TextColor TextColor::from_rgb(uint32_t rgb) {
    TextColor c;
    c.r = static_cast<uint8_t>((rgb >> 16) & 0xFF);
    c.g = static_cast<uint8_t>((rgb >> 8) & 0xFF);
    c.b = static_cast<uint8_t>(rgb & 0xFF);
    return c;
}

std::optional<TextColor> TextColor::from_hex(std::string_view text) {
    if (text.size() != 7 || text[0] != '#') {
        return std::nullopt;
    }
    uint32_t rgb = 0;
    for (size_t i = 1; i < text.size(); ++i) {
        int digit = hex_digit(text[i]);
        if (digit < 0) return std::nullopt;
        rgb = (rgb << 4) | static_cast<uint32_t>(digit);
    }
    return from_rgb(rgb);
}

std::optional<TextColor> TextColor::named(std::string_view name) {
    std::string lowered = to_lower_ascii(name);
    if (lowered == "grey") lowered = "gray";
    if (lowered == "dark_grey") lowered = "dark_gray";
    for (const auto& entry : kNamedColors) {
        if (lowered == entry.name) {
            return from_rgb(entry.rgb);
        }
    }
    return std::nullopt;
}

std::optional<TextColor> TextColor::parse(std::string_view text) {
    if (!text.empty() && text[0] == '#') {
        return from_hex(text);
    }
    return named(text);
}

const char* color_name(const TextColor& color) {
    for (const auto& entry : kNamedColors) {
        if (entry.rgb == color.value()) {
            return entry.name;
        }
    }
    return nullptr;
}

} // namespace tagtext::text
