#pragma once

#include "core/types.hpp"
#include "palette/palette_data.hpp"
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace seasonal {

struct PaletteColor {
    std::string name;
    std::string hex;
    Lab lab;
};

struct SeasonPalette {
    std::vector<PaletteColor> neutrals;
    std::vector<PaletteColor> accents;
    std::vector<PaletteColor> brights;
    std::vector<PaletteColor> softs;

    const std::vector<PaletteColor>& group(ColorGroup g) const;
    std::vector<PaletteColor>& group(ColorGroup g);
    size_t size() const { return neutrals.size() + accents.size() + brights.size() + softs.size(); }
};

struct RegistryEntry {
    MicroSeason micro_season;
    ColorGroup group;
    PaletteColor color;
};

// Immutable set of reference colors with their Lab values computed once at
// construction. There is no mutation API; share it by const reference.
class PaletteRegistry {
public:
    // Throws std::invalid_argument if any entry carries a malformed hex.
    explicit PaletteRegistry(const std::vector<PaletteEntry>& entries);

    // Process-wide registry over the compiled-in dataset.
    static const PaletteRegistry& builtin();

    static Result load_file(const std::string& path, std::optional<PaletteRegistry>& out);
    static Result parse_toml(const std::string& text, std::optional<PaletteRegistry>& out);
    std::string to_toml() const;

    const SeasonPalette& micro_season_palette(MicroSeason micro) const;
    static std::vector<MicroSeason> micro_seasons_for_parent(ParentSeason parent);

    // Every (micro-season, group, color) triple in micro-season enumeration
    // order, then group order, then declaration order.
    const std::vector<RegistryEntry>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::array<SeasonPalette, MICRO_SEASON_COUNT> palettes_;
    std::vector<RegistryEntry> entries_;
};

}
