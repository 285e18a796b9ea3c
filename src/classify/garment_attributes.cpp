#include "classify/garment_attributes.hpp"
#include "core/color_space.hpp"
#include <cmath>

namespace seasonal {

double GarmentAnalyzer::chroma(const Lab& lab) {
    return std::sqrt(lab.a * lab.a + lab.b * lab.b);
}

double GarmentAnalyzer::hue_degrees(const Lab& lab) {
    double h = std::atan2(lab.b, lab.a) * (180.0 / 3.14159265358979323846);
    if (h < 0.0) h += 360.0;
    if (h >= 360.0) h -= 360.0;
    return h;
}

Undertone GarmentAnalyzer::undertone(const Lab& lab) const {
    if (chroma(lab) < config_.neutral_chroma) {
        return Undertone::Neutral;
    }

    // Yellow-dominant with a slight green cast: khaki, sage, olive.
    if (lab.b > config_.olive_min_b && lab.a < 0.0 && std::abs(lab.a) <= config_.olive_max_green) {
        return Undertone::Olive;
    }

    double hue = hue_degrees(lab);
    if (hue >= 90.0 && hue <= 140.0 && lab.b > 0.0) {
        return Undertone::Olive;
    }
    if (hue <= 110.0 || hue >= 320.0) {
        return Undertone::Warm;
    }
    return Undertone::Cool;
}

Depth GarmentAnalyzer::depth(const Lab& lab) const {
    if (lab.L > config_.light_min_l) return Depth::Light;
    if (lab.L > config_.medium_min_l) return Depth::Medium;
    return Depth::Deep;
}

Clarity GarmentAnalyzer::clarity(const Lab& lab) const {
    double c = chroma(lab);
    if (c < config_.muted_max_chroma) return Clarity::Muted;
    if (c <= config_.medium_max_chroma) return Clarity::Medium;
    return Clarity::Clear;
}

GarmentAttributes GarmentAnalyzer::analyze(const Lab& lab) const {
    GarmentAttributes attrs;
    attrs.undertone = undertone(lab);
    attrs.depth = depth(lab);
    attrs.clarity = clarity(lab);
    attrs.chroma = chroma(lab);
    attrs.hue_degrees = hue_degrees(lab);
    return attrs;
}

std::optional<GarmentAttributes> GarmentAnalyzer::analyze_hex(const std::string& hex) const {
    auto lab = ColorSpace::hex_to_lab(hex);
    if (!lab) return std::nullopt;
    return analyze(*lab);
}

}
