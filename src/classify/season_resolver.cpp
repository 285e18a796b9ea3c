#include "classify/season_resolver.hpp"

namespace seasonal {

MicroSeason default_micro_season(ParentSeason parent) {
    switch (parent) {
        case ParentSeason::Spring: return MicroSeason::WarmSpring;
        case ParentSeason::Summer: return MicroSeason::CoolSummer;
        case ParentSeason::Autumn: return MicroSeason::WarmAutumn;
        case ParentSeason::Winter: return MicroSeason::CoolWinter;
    }
    return MicroSeason::WarmSpring;
}

MicroSeason determine_micro_season(ParentSeason parent,
                                   std::optional<Depth> depth,
                                   std::optional<Clarity> clarity,
                                   std::optional<Undertone> undertone) {
    if (clarity == Clarity::Vivid) {
        clarity = Clarity::Clear;
    }

    if (!depth && !clarity) {
        return default_micro_season(parent);
    }

    switch (parent) {
        case ParentSeason::Spring:
            if (depth == Depth::Light) return MicroSeason::LightSpring;
            if (clarity == Clarity::Clear) return MicroSeason::BrightSpring;
            return MicroSeason::WarmSpring;

        case ParentSeason::Summer:
            if (depth == Depth::Light) return MicroSeason::LightSummer;
            if (clarity == Clarity::Muted) return MicroSeason::SoftSummer;
            return MicroSeason::CoolSummer;

        case ParentSeason::Autumn:
            if (clarity == Clarity::Muted) return MicroSeason::SoftAutumn;
            if (depth == Depth::Deep) return MicroSeason::DeepAutumn;
            return MicroSeason::WarmAutumn;

        case ParentSeason::Winter:
            if (clarity == Clarity::Clear) return MicroSeason::BrightWinter;
            if (undertone == Undertone::Cool && depth == Depth::Deep) return MicroSeason::DeepWinter;
            return MicroSeason::CoolWinter;
    }
    return default_micro_season(parent);
}

}
