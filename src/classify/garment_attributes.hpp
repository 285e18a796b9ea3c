#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace seasonal {

struct GarmentAttributes {
    Undertone undertone = Undertone::Neutral;
    Depth depth = Depth::Medium;
    Clarity clarity = Clarity::Muted;
    double chroma = 0.0;
    double hue_degrees = 0.0;
};

class GarmentAnalyzer {
public:
    struct Config {
        double neutral_chroma = 10.0;
        double olive_min_b = 8.0;
        double olive_max_green = 12.0;
        double light_min_l = 70.0;
        double medium_min_l = 45.0;
        double muted_max_chroma = 20.0;
        double medium_max_chroma = 30.0;
    };

    GarmentAnalyzer() : GarmentAnalyzer(Config{}) {}
    explicit GarmentAnalyzer(const Config& config) : config_(config) {}

    GarmentAttributes analyze(const Lab& lab) const;
    std::optional<GarmentAttributes> analyze_hex(const std::string& hex) const;

    Undertone undertone(const Lab& lab) const;
    Depth depth(const Lab& lab) const;
    Clarity clarity(const Lab& lab) const;

    static double chroma(const Lab& lab);
    static double hue_degrees(const Lab& lab);

private:
    Config config_;
};

}
