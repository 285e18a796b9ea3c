#pragma once

#include "core/types.hpp"
#include "classify/classifier.hpp"
#include "classify/garment_attributes.hpp"
#include "palette/palette_registry.hpp"
#include <optional>
#include <string>

namespace seasonal {

enum class ColorRating { Great, Good, Ok, Risky };

const char* to_string(ColorRating rating);

enum class ChromaLevel { Soft, Mild, Vivid, VeryVivid, Neon };

const char* to_string(ChromaLevel level);

struct UserProfile {
    ParentSeason season = ParentSeason::Spring;
    std::optional<Clarity> clarity;
};

// Spring and autumn are warm, summer and winter cool.
Undertone season_undertone(ParentSeason season);

struct ColorScore {
    ColorRating rating = ColorRating::Risky;
    // Rating from distance alone, before undertone and clarity rules.
    ColorRating base_rating = ColorRating::Risky;

    double delta_e = 0.0;
    MicroSeason closest_micro_season = MicroSeason::LightSpring;
    ColorGroup closest_group = ColorGroup::Neutrals;
    NearestColor closest_color;

    GarmentAttributes garment;
    ChromaLevel chroma_level = ChromaLevel::Soft;
    Undertone user_undertone = Undertone::Neutral;

    bool deep_thresholds = false;
    bool undertone_conflict = false;
    bool clarity_capped = false;
    bool vivid_warning = false;
};

// Rates a garment color against every sub-palette of the user's parent
// season. Distance sets the base rating; an undertone clash forces risky and
// otherwise the user's clarity can cap the rating.
class ColorScorer {
public:
    struct Config {
        double great_max = 6.0;
        double good_max = 12.0;
        double ok_max = 22.0;

        // Dark garments read as closer than their ΔE suggests.
        double deep_max_l = 40.0;
        double deep_great_max = 8.0;
        double deep_good_max = 16.0;
        double deep_ok_max = 30.0;

        double neon_chroma = 70.0;
        double very_vivid_chroma = 55.0;
        double vivid_chroma = 45.0;
        double mild_chroma = 30.0;
        double muted_chroma = 20.0;

        // An ok rating this close to the palette is lifted to good.
        double palette_match_max = 4.5;

        // Worn next to the face, where intensity matters most.
        bool near_face = true;
    };

    explicit ColorScorer(const PaletteRegistry& registry) : ColorScorer(registry, Config{}) {}
    ColorScorer(const PaletteRegistry& registry, const Config& config);

    const Config& config() const { return config_; }

    // Empty for malformed hex or when the parent season has no colors.
    std::optional<ColorScore> score(const std::string& hex, const UserProfile& user) const;
    std::optional<ColorScore> score(const Lab& lab, const UserProfile& user) const;

    ColorRating base_rating(double delta_e, bool deep) const;
    ChromaLevel chroma_level(double chroma) const;

private:
    void apply_clarity_caps(ColorScore& score, Clarity user_clarity) const;

    const PaletteRegistry& registry_;
    Config config_;
    GarmentAnalyzer analyzer_;
};

// True when the garment undertone fights the user's: warm or olive on a cool
// user, cool on a warm user. Neutral garments and neutral users never clash.
bool undertone_conflict(Undertone garment, Undertone user);

}
