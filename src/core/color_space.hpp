#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace seasonal {

// D65 reference white, scaled to Y = 100.
constexpr double D65_XN = 95.047;
constexpr double D65_YN = 100.0;
constexpr double D65_ZN = 108.883;

class ColorSpace {
public:
    // Accepts "#RRGGBB" or "#RGB", case-insensitive, '#' optional.
    // Returns nullopt for anything else; never throws.
    static std::optional<RGB> hex_to_rgb(const std::string& hex);
    static XYZ rgb_to_xyz(const RGB& rgb);
    static Lab xyz_to_lab(const XYZ& xyz);
    static std::optional<Lab> hex_to_lab(const std::string& hex);

    static std::string rgb_to_hex(const RGB& rgb);
    static std::optional<std::string> normalize_hex(const std::string& hex);

    static double srgb_decode(uint8_t c);

private:
    static double lab_f(double t);
    static int hex_digit(char c);
};

}
