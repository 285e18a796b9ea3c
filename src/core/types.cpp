#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace seasonal {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

template <typename E, size_t N>
std::optional<E> parse_tag(const std::string& s, const std::array<E, N>& values) {
    std::string lowered = to_lower(s);
    for (E v : values) {
        if (lowered == to_string(v)) return v;
    }
    return std::nullopt;
}

constexpr std::array<ParentSeason, 4> PARENT_SEASONS = {
    ParentSeason::Spring, ParentSeason::Summer, ParentSeason::Autumn, ParentSeason::Winter
};

constexpr std::array<ClassificationStatus, 4> STATUSES = {
    ClassificationStatus::Great, ClassificationStatus::Good,
    ClassificationStatus::Ambiguous, ClassificationStatus::Unclassified
};

constexpr std::array<Depth, 3> DEPTHS = {Depth::Light, Depth::Medium, Depth::Deep};
constexpr std::array<Clarity, 4> CLARITIES = {
    Clarity::Muted, Clarity::Medium, Clarity::Clear, Clarity::Vivid
};
constexpr std::array<Undertone, 4> UNDERTONES = {
    Undertone::Warm, Undertone::Cool, Undertone::Neutral, Undertone::Olive
};

}

const std::array<MicroSeason, MICRO_SEASON_COUNT>& all_micro_seasons() {
    static const std::array<MicroSeason, MICRO_SEASON_COUNT> seasons = {
        MicroSeason::LightSpring, MicroSeason::WarmSpring, MicroSeason::BrightSpring,
        MicroSeason::SoftSummer, MicroSeason::CoolSummer, MicroSeason::LightSummer,
        MicroSeason::DeepAutumn, MicroSeason::SoftAutumn, MicroSeason::WarmAutumn,
        MicroSeason::BrightWinter, MicroSeason::CoolWinter, MicroSeason::DeepWinter
    };
    return seasons;
}

const std::array<ColorGroup, COLOR_GROUP_COUNT>& all_color_groups() {
    static const std::array<ColorGroup, COLOR_GROUP_COUNT> groups = {
        ColorGroup::Neutrals, ColorGroup::Accents, ColorGroup::Brights, ColorGroup::Softs
    };
    return groups;
}

ParentSeason parent_of(MicroSeason micro) {
    switch (micro) {
        case MicroSeason::LightSpring:
        case MicroSeason::WarmSpring:
        case MicroSeason::BrightSpring:
            return ParentSeason::Spring;
        case MicroSeason::SoftSummer:
        case MicroSeason::CoolSummer:
        case MicroSeason::LightSummer:
            return ParentSeason::Summer;
        case MicroSeason::DeepAutumn:
        case MicroSeason::SoftAutumn:
        case MicroSeason::WarmAutumn:
            return ParentSeason::Autumn;
        case MicroSeason::BrightWinter:
        case MicroSeason::CoolWinter:
        case MicroSeason::DeepWinter:
            return ParentSeason::Winter;
    }
    return ParentSeason::Spring;
}

const char* to_string(ParentSeason season) {
    switch (season) {
        case ParentSeason::Spring: return "spring";
        case ParentSeason::Summer: return "summer";
        case ParentSeason::Autumn: return "autumn";
        case ParentSeason::Winter: return "winter";
    }
    return "unknown";
}

const char* to_string(MicroSeason micro) {
    switch (micro) {
        case MicroSeason::LightSpring: return "light_spring";
        case MicroSeason::WarmSpring: return "warm_spring";
        case MicroSeason::BrightSpring: return "bright_spring";
        case MicroSeason::SoftSummer: return "soft_summer";
        case MicroSeason::CoolSummer: return "cool_summer";
        case MicroSeason::LightSummer: return "light_summer";
        case MicroSeason::DeepAutumn: return "deep_autumn";
        case MicroSeason::SoftAutumn: return "soft_autumn";
        case MicroSeason::WarmAutumn: return "warm_autumn";
        case MicroSeason::BrightWinter: return "bright_winter";
        case MicroSeason::CoolWinter: return "cool_winter";
        case MicroSeason::DeepWinter: return "deep_winter";
    }
    return "unknown";
}

const char* to_string(ColorGroup group) {
    switch (group) {
        case ColorGroup::Neutrals: return "neutrals";
        case ColorGroup::Accents: return "accents";
        case ColorGroup::Brights: return "brights";
        case ColorGroup::Softs: return "softs";
    }
    return "unknown";
}

const char* to_string(ClassificationStatus status) {
    switch (status) {
        case ClassificationStatus::Great: return "great";
        case ClassificationStatus::Good: return "good";
        case ClassificationStatus::Ambiguous: return "ambiguous";
        case ClassificationStatus::Unclassified: return "unclassified";
    }
    return "unknown";
}

const char* to_string(Depth depth) {
    switch (depth) {
        case Depth::Light: return "light";
        case Depth::Medium: return "medium";
        case Depth::Deep: return "deep";
    }
    return "unknown";
}

const char* to_string(Clarity clarity) {
    switch (clarity) {
        case Clarity::Muted: return "muted";
        case Clarity::Medium: return "medium";
        case Clarity::Clear: return "clear";
        case Clarity::Vivid: return "vivid";
    }
    return "unknown";
}

const char* to_string(Undertone undertone) {
    switch (undertone) {
        case Undertone::Warm: return "warm";
        case Undertone::Cool: return "cool";
        case Undertone::Neutral: return "neutral";
        case Undertone::Olive: return "olive";
    }
    return "unknown";
}

std::optional<ParentSeason> parse_parent_season(const std::string& s) {
    return parse_tag(s, PARENT_SEASONS);
}

std::optional<MicroSeason> parse_micro_season(const std::string& s) {
    return parse_tag(s, all_micro_seasons());
}

std::optional<ColorGroup> parse_color_group(const std::string& s) {
    return parse_tag(s, all_color_groups());
}

std::optional<ClassificationStatus> parse_classification_status(const std::string& s) {
    return parse_tag(s, STATUSES);
}

std::optional<Depth> parse_depth(const std::string& s) {
    return parse_tag(s, DEPTHS);
}

std::optional<Clarity> parse_clarity(const std::string& s) {
    return parse_tag(s, CLARITIES);
}

std::optional<Undertone> parse_undertone(const std::string& s) {
    return parse_tag(s, UNDERTONES);
}

}
