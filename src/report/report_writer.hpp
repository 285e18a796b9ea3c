#pragma once

#include "core/types.hpp"
#include "classify/classifier.hpp"
#include "classify/color_scorer.hpp"
#include "classify/garment_attributes.hpp"
#include "palette/palette_registry.hpp"
#include <toml++/toml.hpp>
#include <optional>
#include <string>
#include <vector>

namespace seasonal {

enum class ReportFormat {
    Text,
    Json,
    Toml
};

std::optional<ReportFormat> parse_report_format(const std::string& s);

struct ProfileSummary {
    ParentSeason season;
    MicroSeason home_micro_season;
};

struct GarmentReport {
    ClassificationResult result;
    std::optional<GarmentAttributes> attributes;
    std::optional<bool> suits_profile;
    std::optional<ColorScore> score;
};

toml::table garment_to_table(const GarmentReport& report);
toml::table report_to_table(const std::vector<GarmentReport>& reports,
                            const std::optional<ProfileSummary>& profile);

std::string render_report(ReportFormat format,
                          const std::vector<GarmentReport>& reports,
                          const std::optional<ProfileSummary>& profile);

std::string render_palette_listing(const PaletteRegistry& registry, MicroSeason micro);

}
