#include "palette/palette_registry.hpp"
#include "core/color_space.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace seasonal {

namespace {

constexpr int PALETTE_FILE_VERSION = 1;

size_t micro_index(MicroSeason micro) {
    return static_cast<size_t>(micro);
}

size_t group_index(ColorGroup group) {
    return static_cast<size_t>(group);
}

std::string describe_source(const toml::source_region& src) {
    std::ostringstream ss;
    ss << "line " << src.begin.line << ", column " << src.begin.column;
    return ss.str();
}

Result collect_entries(const toml::table& tbl, std::vector<PaletteEntry>& entries) {
    if (const toml::node* version = tbl.get("palette_version")) {
        auto v = version->value_exact<int64_t>();
        if (!v) {
            return Result::fail(ErrorCode::INVALID_FORMAT, "palette_version must be an integer");
        }
        if (*v != PALETTE_FILE_VERSION) {
            return Result::fail(ErrorCode::INVALID_FORMAT,
                                "unsupported palette_version " + std::to_string(*v));
        }
    }

    for (auto&& [key, node] : tbl) {
        std::string micro_key(key.str());
        if (micro_key == "palette_version") continue;

        auto micro = parse_micro_season(micro_key);
        if (!micro) {
            return Result::fail(ErrorCode::INVALID_FORMAT, "unknown micro-season '" + micro_key + "'");
        }
        const toml::table* groups = node.as_table();
        if (!groups) {
            return Result::fail(ErrorCode::INVALID_FORMAT, "'" + micro_key + "' must be a table of color groups");
        }

        for (auto&& [group_key, group_node] : *groups) {
            std::string group_name(group_key.str());
            std::string path = micro_key + "." + group_name;

            auto group = parse_color_group(group_name);
            if (!group) {
                return Result::fail(ErrorCode::INVALID_FORMAT, "unknown color group '" + path + "'");
            }
            const toml::array* colors = group_node.as_array();
            if (!colors) {
                return Result::fail(ErrorCode::INVALID_FORMAT, "'" + path + "' must be an array of tables");
            }

            for (size_t i = 0; i < colors->size(); ++i) {
                std::string item = path + "[" + std::to_string(i) + "]";
                const toml::table* color = colors->get(i)->as_table();
                if (!color) {
                    return Result::fail(ErrorCode::INVALID_FORMAT, "'" + item + "' must be a table");
                }
                auto name = (*color)["name"].value<std::string>();
                auto hex = (*color)["hex"].value<std::string>();
                if (!name || name->empty()) {
                    return Result::fail(ErrorCode::INVALID_FORMAT, "'" + item + "' is missing 'name'");
                }
                if (!hex) {
                    return Result::fail(ErrorCode::INVALID_FORMAT, "'" + item + "' is missing 'hex'");
                }
                if (!ColorSpace::hex_to_rgb(*hex)) {
                    return Result::fail(ErrorCode::INVALID_FORMAT,
                                        "'" + item + "' has malformed hex '" + *hex + "'");
                }
                entries.push_back({*micro, *group, *name, *hex});
            }
        }
    }

    if (entries.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "palette defines no colors");
    }
    return Result::ok();
}

}

const std::vector<PaletteColor>& SeasonPalette::group(ColorGroup g) const {
    switch (g) {
        case ColorGroup::Neutrals: return neutrals;
        case ColorGroup::Accents: return accents;
        case ColorGroup::Brights: return brights;
        case ColorGroup::Softs: return softs;
    }
    throw std::out_of_range("SeasonPalette: unknown color group");
}

std::vector<PaletteColor>& SeasonPalette::group(ColorGroup g) {
    switch (g) {
        case ColorGroup::Neutrals: return neutrals;
        case ColorGroup::Accents: return accents;
        case ColorGroup::Brights: return brights;
        case ColorGroup::Softs: return softs;
    }
    throw std::out_of_range("SeasonPalette: unknown color group");
}

PaletteRegistry::PaletteRegistry(const std::vector<PaletteEntry>& entries) {
    entries_.reserve(entries.size());
    for (const auto& entry : entries) {
        auto lab = ColorSpace::hex_to_lab(entry.hex);
        if (!lab) {
            throw std::invalid_argument("PaletteRegistry: malformed hex '" + entry.hex + "' for '" +
                                        entry.name + "' in " + to_string(entry.micro_season) + "." +
                                        to_string(entry.group));
        }
        entries_.push_back({entry.micro_season, entry.group, {entry.name, entry.hex, *lab}});
    }

    std::stable_sort(entries_.begin(), entries_.end(), [](const RegistryEntry& a, const RegistryEntry& b) {
        if (a.micro_season != b.micro_season) {
            return micro_index(a.micro_season) < micro_index(b.micro_season);
        }
        return group_index(a.group) < group_index(b.group);
    });

    for (const auto& entry : entries_) {
        palettes_[micro_index(entry.micro_season)].group(entry.group).push_back(entry.color);
    }
}

const PaletteRegistry& PaletteRegistry::builtin() {
    static const PaletteRegistry registry(builtin_palette_entries());
    return registry;
}

Result PaletteRegistry::load_file(const std::string& path, std::optional<PaletteRegistry>& out) {
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::path(path), ec) || ec) {
        return Result::fail(ErrorCode::FILE_NOT_FOUND, "palette file not found: " + path);
    }

    try {
        auto tbl = toml::parse_file(path);
        std::vector<PaletteEntry> entries;
        Result r = collect_entries(tbl, entries);
        if (r.failure()) {
            return Result::fail(r.error, path + ": " + r.message);
        }
        out.emplace(entries);
        return Result::ok();
    } catch (const toml::parse_error& e) {
        return Result::fail(ErrorCode::INVALID_FORMAT,
                            path + ": " + std::string(e.description()) + " at " + describe_source(e.source()));
    }
}

Result PaletteRegistry::parse_toml(const std::string& text, std::optional<PaletteRegistry>& out) {
    try {
        auto tbl = toml::parse(text);
        std::vector<PaletteEntry> entries;
        Result r = collect_entries(tbl, entries);
        if (r.failure()) return r;
        out.emplace(entries);
        return Result::ok();
    } catch (const toml::parse_error& e) {
        return Result::fail(ErrorCode::INVALID_FORMAT,
                            std::string(e.description()) + " at " + describe_source(e.source()));
    }
}

std::string PaletteRegistry::to_toml() const {
    toml::table root;
    root.insert("palette_version", PALETTE_FILE_VERSION);

    for (MicroSeason micro : all_micro_seasons()) {
        const SeasonPalette& palette = palettes_[micro_index(micro)];
        if (palette.size() == 0) continue;

        toml::table groups;
        for (ColorGroup group : all_color_groups()) {
            const auto& colors = palette.group(group);
            if (colors.empty()) continue;

            toml::array arr;
            for (const auto& color : colors) {
                arr.push_back(toml::table{{"name", color.name}, {"hex", color.hex}});
            }
            groups.insert(to_string(group), std::move(arr));
        }
        root.insert(to_string(micro), std::move(groups));
    }

    std::ostringstream ss;
    ss << root << "\n";
    return ss.str();
}

const SeasonPalette& PaletteRegistry::micro_season_palette(MicroSeason micro) const {
    return palettes_[micro_index(micro)];
}

std::vector<MicroSeason> PaletteRegistry::micro_seasons_for_parent(ParentSeason parent) {
    std::vector<MicroSeason> result;
    for (MicroSeason micro : all_micro_seasons()) {
        if (parent_of(micro) == parent) {
            result.push_back(micro);
        }
    }
    return result;
}

}
