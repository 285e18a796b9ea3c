#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace seasonal {

struct PaletteEntry {
    MicroSeason micro_season;
    ColorGroup group;
    std::string name;
    std::string hex;
};

// Curated reference colors: 12 micro-seasons x 4 groups x 5 colors,
// listed in micro-season enumeration order.
const std::vector<PaletteEntry>& builtin_palette_entries();

}
