#include "core/color_space.hpp"
#include <cmath>
#include <cstdio>

namespace seasonal {

int ColorSpace::hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<RGB> ColorSpace::hex_to_rgb(const std::string& hex) {
    size_t begin = 0;
    size_t end = hex.size();
    while (begin < end && (hex[begin] == ' ' || hex[begin] == '\t' || hex[begin] == '\n' || hex[begin] == '\r')) {
        ++begin;
    }
    while (end > begin && (hex[end - 1] == ' ' || hex[end - 1] == '\t' || hex[end - 1] == '\n' || hex[end - 1] == '\r')) {
        --end;
    }
    if (begin < end && hex[begin] == '#') ++begin;

    std::string digits = hex.substr(begin, end - begin);
    if (digits.size() == 3) {
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }
    if (digits.size() != 6) return std::nullopt;

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(digits[i * 2]);
        int lo = hex_digit(digits[i * 2 + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return RGB{channels[0], channels[1], channels[2]};
}

double ColorSpace::srgb_decode(uint8_t c) {
    double cv = c / 255.0;
    if (cv <= 0.04045) {
        return cv / 12.92;
    }
    return std::pow((cv + 0.055) / 1.055, 2.4);
}

XYZ ColorSpace::rgb_to_xyz(const RGB& rgb) {
    double r = srgb_decode(rgb.r);
    double g = srgb_decode(rgb.g);
    double b = srgb_decode(rgb.b);

    XYZ xyz;
    xyz.x = (r * 0.4124564 + g * 0.3575761 + b * 0.1804375) * 100.0;
    xyz.y = (r * 0.2126729 + g * 0.7151522 + b * 0.0721750) * 100.0;
    xyz.z = (r * 0.0193339 + g * 0.1191920 + b * 0.9503041) * 100.0;
    return xyz;
}

double ColorSpace::lab_f(double t) {
    constexpr double delta = 6.0 / 29.0;
    if (t > delta * delta * delta) {
        return std::cbrt(t);
    }
    return t / (3.0 * delta * delta) + 4.0 / 29.0;
}

Lab ColorSpace::xyz_to_lab(const XYZ& xyz) {
    double fx = lab_f(xyz.x / D65_XN);
    double fy = lab_f(xyz.y / D65_YN);
    double fz = lab_f(xyz.z / D65_ZN);

    return {116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

std::optional<Lab> ColorSpace::hex_to_lab(const std::string& hex) {
    auto rgb = hex_to_rgb(hex);
    if (!rgb) return std::nullopt;
    return xyz_to_lab(rgb_to_xyz(*rgb));
}

std::string ColorSpace::rgb_to_hex(const RGB& rgb) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", rgb.r, rgb.g, rgb.b);
    return std::string(buf);
}

std::optional<std::string> ColorSpace::normalize_hex(const std::string& hex) {
    auto rgb = hex_to_rgb(hex);
    if (!rgb) return std::nullopt;
    return rgb_to_hex(*rgb);
}

}
