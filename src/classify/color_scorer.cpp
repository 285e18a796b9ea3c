#include "classify/color_scorer.hpp"
#include "core/color_space.hpp"
#include "core/delta_e.hpp"

#include <limits>

namespace seasonal {

const char* to_string(ColorRating rating) {
    switch (rating) {
        case ColorRating::Great: return "great";
        case ColorRating::Good:  return "good";
        case ColorRating::Ok:    return "ok";
        case ColorRating::Risky: return "risky";
    }
    return "risky";
}

const char* to_string(ChromaLevel level) {
    switch (level) {
        case ChromaLevel::Soft:      return "soft";
        case ChromaLevel::Mild:      return "mild";
        case ChromaLevel::Vivid:     return "vivid";
        case ChromaLevel::VeryVivid: return "very_vivid";
        case ChromaLevel::Neon:      return "neon";
    }
    return "soft";
}

Undertone season_undertone(ParentSeason season) {
    switch (season) {
        case ParentSeason::Spring:
        case ParentSeason::Autumn:
            return Undertone::Warm;
        case ParentSeason::Summer:
        case ParentSeason::Winter:
            return Undertone::Cool;
    }
    return Undertone::Neutral;
}

bool undertone_conflict(Undertone garment, Undertone user) {
    if (garment == Undertone::Neutral || user == Undertone::Neutral) return false;
    if (garment == Undertone::Olive && user == Undertone::Warm) return false;

    bool garment_warm = garment == Undertone::Warm || garment == Undertone::Olive;
    if (garment_warm && user == Undertone::Cool) return true;
    return garment == Undertone::Cool && user == Undertone::Warm;
}

ColorScorer::ColorScorer(const PaletteRegistry& registry, const Config& config)
    : registry_(registry), config_(config) {}

ColorRating ColorScorer::base_rating(double delta_e, bool deep) const {
    double great = deep ? config_.deep_great_max : config_.great_max;
    double good = deep ? config_.deep_good_max : config_.good_max;
    double ok = deep ? config_.deep_ok_max : config_.ok_max;

    if (delta_e <= great) return ColorRating::Great;
    if (delta_e <= good) return ColorRating::Good;
    if (delta_e <= ok) return ColorRating::Ok;
    return ColorRating::Risky;
}

ChromaLevel ColorScorer::chroma_level(double chroma) const {
    if (chroma >= config_.neon_chroma) return ChromaLevel::Neon;
    if (chroma >= config_.very_vivid_chroma) return ChromaLevel::VeryVivid;
    if (chroma >= config_.vivid_chroma) return ChromaLevel::Vivid;
    if (chroma >= config_.mild_chroma) return ChromaLevel::Mild;
    return ChromaLevel::Soft;
}

std::optional<ColorScore> ColorScorer::score(const std::string& hex, const UserProfile& user) const {
    auto lab = ColorSpace::hex_to_lab(hex);
    if (!lab) return std::nullopt;
    return score(*lab, user);
}

std::optional<ColorScore> ColorScorer::score(const Lab& lab, const UserProfile& user) const {
    ColorScore result;
    result.delta_e = std::numeric_limits<double>::infinity();

    const PaletteColor* closest = nullptr;
    for (MicroSeason micro : PaletteRegistry::micro_seasons_for_parent(user.season)) {
        const SeasonPalette& palette = registry_.micro_season_palette(micro);
        for (ColorGroup group : all_color_groups()) {
            for (const auto& color : palette.group(group)) {
                double dE = delta_e_2000(lab, color.lab);
                if (dE < result.delta_e) {
                    result.delta_e = dE;
                    result.closest_micro_season = micro;
                    result.closest_group = group;
                    closest = &color;
                }
            }
        }
    }
    if (!closest) return std::nullopt;
    result.closest_color = NearestColor{closest->name, closest->hex};

    result.garment = analyzer_.analyze(lab);
    result.chroma_level = chroma_level(result.garment.chroma);
    result.user_undertone = season_undertone(user.season);

    result.deep_thresholds = lab.L < config_.deep_max_l;
    result.base_rating = base_rating(result.delta_e, result.deep_thresholds);
    result.rating = result.base_rating;

    if (undertone_conflict(result.garment.undertone, result.user_undertone)) {
        result.undertone_conflict = true;
        result.rating = ColorRating::Risky;
        return result;
    }

    if (user.clarity) {
        Clarity clarity = *user.clarity == Clarity::Vivid ? Clarity::Clear : *user.clarity;
        apply_clarity_caps(result, clarity);
    }

    bool neon_near_face = result.chroma_level == ChromaLevel::Neon && config_.near_face;
    if (result.rating == ColorRating::Ok && !neon_near_face &&
        result.delta_e <= config_.palette_match_max) {
        result.rating = ColorRating::Good;
    }
    return result;
}

void ColorScorer::apply_clarity_caps(ColorScore& score, Clarity user_clarity) const {
    const GarmentAttributes& garment = score.garment;
    bool garment_vivid = garment.clarity == Clarity::Clear || garment.chroma >= config_.vivid_chroma;
    bool garment_muted = garment.clarity == Clarity::Muted || garment.chroma < config_.muted_chroma;
    bool vivid_level = score.chroma_level == ChromaLevel::Vivid ||
                       score.chroma_level == ChromaLevel::VeryVivid ||
                       score.chroma_level == ChromaLevel::Neon;

    if (user_clarity == Clarity::Muted && garment_vivid) {
        if (score.chroma_level == ChromaLevel::Neon && config_.near_face) {
            if (score.rating == ColorRating::Great || score.rating == ColorRating::Good) {
                score.rating = ColorRating::Ok;
                score.clarity_capped = true;
            }
            score.vivid_warning = true;
        } else if (vivid_level && config_.near_face) {
            if (score.rating == ColorRating::Great) {
                score.rating = ColorRating::Good;
                score.clarity_capped = true;
            }
            score.vivid_warning = true;
        } else {
            if (score.rating == ColorRating::Great) {
                score.rating = ColorRating::Good;
                score.clarity_capped = true;
            }
            score.vivid_warning = vivid_level;
        }
    }

    if (user_clarity == Clarity::Clear && garment_muted && score.rating == ColorRating::Great) {
        score.rating = ColorRating::Good;
        score.clarity_capped = true;
    }
}

}
