#pragma once

#include "core/types.hpp"
#include "palette/palette_registry.hpp"
#include <optional>
#include <string>

namespace seasonal {

struct NearestColor {
    std::string name;
    std::string hex;

    bool operator==(const NearestColor& o) const { return name == o.name && hex == o.hex; }
    bool operator!=(const NearestColor& o) const { return !(*this == o); }
};

struct ClassificationResult {
    std::string dominant_hex;
    std::optional<Lab> lab;

    std::optional<MicroSeason> micro_season_tag;
    std::optional<ParentSeason> season_tag;
    std::optional<ColorGroup> group_tag;
    std::optional<NearestColor> nearest_palette_color;
    std::optional<double> min_delta_e;

    // Crossover match from a different parent season.
    std::optional<MicroSeason> secondary_micro_season_tag;
    std::optional<ParentSeason> secondary_season_tag;
    std::optional<ColorGroup> secondary_group_tag;
    std::optional<double> secondary_delta_e;

    ClassificationStatus classification_status = ClassificationStatus::Unclassified;

    bool has_secondary() const { return secondary_micro_season_tag.has_value(); }

    bool operator==(const ClassificationResult& o) const;
    bool operator!=(const ClassificationResult& o) const { return !(*this == o); }
};

class Classifier {
public:
    struct Config {
        double unclassified_threshold = 12.0;
        double crossover_threshold = 10.0;
        double ambiguous_gap = 2.0;
        double great_gap = 4.0;
    };

    explicit Classifier(const PaletteRegistry& registry) : Classifier(registry, Config{}) {}
    Classifier(const PaletteRegistry& registry, const Config& config);

    const Config& config() const { return config_; }
    const PaletteRegistry& registry() const { return registry_; }

    // Stateless and reentrant; malformed hex yields an unclassified result.
    ClassificationResult classify(const std::string& hex) const;

    ClassificationStatus status_for_gap(double gap) const;

private:
    const PaletteRegistry& registry_;
    Config config_;
};

// Classifies against the built-in registry with the default thresholds.
ClassificationResult classify_garment(const std::string& hex);

// True for a great/good result whose primary or crossover parent season is `season`.
bool suits_profile(const ClassificationResult& result, ParentSeason season);

}
