#include "classify/classifier.hpp"
#include "core/color_space.hpp"
#include "core/delta_e.hpp"

#include <limits>
#include <vector>

namespace seasonal {

namespace {

// Closest color within one (micro-season, group) pair.
struct BucketMatch {
    MicroSeason micro_season;
    ColorGroup group;
    const PaletteColor* color = nullptr;
    double delta_e = 0.0;
};

std::vector<BucketMatch> scan_buckets(const PaletteRegistry& registry, const Lab& lab) {
    std::vector<BucketMatch> buckets;
    buckets.reserve(MICRO_SEASON_COUNT * COLOR_GROUP_COUNT);

    for (const auto& entry : registry.entries()) {
        double dE = delta_e_2000(lab, entry.color.lab);

        bool same_bucket = !buckets.empty() &&
                           buckets.back().micro_season == entry.micro_season &&
                           buckets.back().group == entry.group;
        if (!same_bucket) {
            buckets.push_back({entry.micro_season, entry.group, &entry.color, dE});
        } else if (dE < buckets.back().delta_e) {
            buckets.back().color = &entry.color;
            buckets.back().delta_e = dE;
        }
    }
    return buckets;
}

}

bool ClassificationResult::operator==(const ClassificationResult& o) const {
    return dominant_hex == o.dominant_hex &&
           lab == o.lab &&
           micro_season_tag == o.micro_season_tag &&
           season_tag == o.season_tag &&
           group_tag == o.group_tag &&
           nearest_palette_color == o.nearest_palette_color &&
           min_delta_e == o.min_delta_e &&
           secondary_micro_season_tag == o.secondary_micro_season_tag &&
           secondary_season_tag == o.secondary_season_tag &&
           secondary_group_tag == o.secondary_group_tag &&
           secondary_delta_e == o.secondary_delta_e &&
           classification_status == o.classification_status;
}

Classifier::Classifier(const PaletteRegistry& registry, const Config& config)
    : registry_(registry), config_(config) {}

ClassificationStatus Classifier::status_for_gap(double gap) const {
    if (gap < config_.ambiguous_gap) return ClassificationStatus::Ambiguous;
    if (gap < config_.great_gap) return ClassificationStatus::Good;
    return ClassificationStatus::Great;
}

ClassificationResult Classifier::classify(const std::string& hex) const {
    ClassificationResult result;
    result.dominant_hex = hex;
    result.classification_status = ClassificationStatus::Unclassified;

    auto lab = ColorSpace::hex_to_lab(hex);
    if (!lab) {
        return result;
    }
    result.lab = *lab;

    std::vector<BucketMatch> buckets = scan_buckets(registry_, *lab);
    if (buckets.empty()) {
        return result;
    }

    // Strict comparisons keep the first bucket in enumeration order on ties.
    size_t best = 0;
    for (size_t i = 1; i < buckets.size(); ++i) {
        if (buckets[i].delta_e < buckets[best].delta_e) best = i;
    }
    const BucketMatch* runner_up = nullptr;
    for (size_t i = 0; i < buckets.size(); ++i) {
        if (i == best) continue;
        if (!runner_up || buckets[i].delta_e < runner_up->delta_e) runner_up = &buckets[i];
    }

    const BucketMatch& best_match = buckets[best];
    result.nearest_palette_color = NearestColor{best_match.color->name, best_match.color->hex};
    result.min_delta_e = best_match.delta_e;

    if (best_match.delta_e > config_.unclassified_threshold) {
        return result;
    }

    ParentSeason primary_parent = parent_of(best_match.micro_season);
    result.micro_season_tag = best_match.micro_season;
    result.season_tag = primary_parent;
    result.group_tag = best_match.group;

    if (runner_up && runner_up->delta_e <= config_.crossover_threshold &&
        parent_of(runner_up->micro_season) != primary_parent) {
        result.secondary_micro_season_tag = runner_up->micro_season;
        result.secondary_season_tag = parent_of(runner_up->micro_season);
        result.secondary_group_tag = runner_up->group;
        result.secondary_delta_e = runner_up->delta_e;
    }

    double gap = runner_up ? runner_up->delta_e - best_match.delta_e
                           : std::numeric_limits<double>::infinity();
    result.classification_status = status_for_gap(gap);
    return result;
}

ClassificationResult classify_garment(const std::string& hex) {
    static const Classifier classifier(PaletteRegistry::builtin());
    return classifier.classify(hex);
}

bool suits_profile(const ClassificationResult& result, ParentSeason season) {
    if (result.classification_status != ClassificationStatus::Great &&
        result.classification_status != ClassificationStatus::Good) {
        return false;
    }
    return result.season_tag == season || result.secondary_season_tag == season;
}

}
