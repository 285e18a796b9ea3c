#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace seasonal {

enum class ErrorCode {
    SUCCESS = 0,
    FILE_NOT_FOUND,
    INVALID_FORMAT,
    INVALID_ARGUMENT
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, ""}; }
    static Result fail(ErrorCode code, const std::string& msg) { return {code, msg}; }
};

struct RGB {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const RGB& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const RGB& o) const { return !(*this == o); }
};

// CIE tristimulus values, scaled 0-100.
struct XYZ {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct Lab {
    double L = 0.0;
    double a = 0.0;
    double b = 0.0;

    Lab() = default;
    Lab(double L, double a, double b) : L(L), a(a), b(b) {}

    bool operator==(const Lab& o) const { return L == o.L && a == o.a && b == o.b; }
    bool operator!=(const Lab& o) const { return !(*this == o); }
};

enum class ParentSeason { Spring, Summer, Autumn, Winter };

// Declaration order is the fixed scan order used for tie-breaking.
enum class MicroSeason {
    LightSpring,
    WarmSpring,
    BrightSpring,
    SoftSummer,
    CoolSummer,
    LightSummer,
    DeepAutumn,
    SoftAutumn,
    WarmAutumn,
    BrightWinter,
    CoolWinter,
    DeepWinter
};

enum class ColorGroup { Neutrals, Accents, Brights, Softs };

enum class ClassificationStatus { Great, Good, Ambiguous, Unclassified };

enum class Depth { Light, Medium, Deep };
enum class Clarity { Muted, Medium, Clear, Vivid };
enum class Undertone { Warm, Cool, Neutral, Olive };

constexpr int MICRO_SEASON_COUNT = 12;
constexpr int COLOR_GROUP_COUNT = 4;

const std::array<MicroSeason, MICRO_SEASON_COUNT>& all_micro_seasons();
const std::array<ColorGroup, COLOR_GROUP_COUNT>& all_color_groups();

ParentSeason parent_of(MicroSeason micro);

const char* to_string(ParentSeason season);
const char* to_string(MicroSeason micro);
const char* to_string(ColorGroup group);
const char* to_string(ClassificationStatus status);
const char* to_string(Depth depth);
const char* to_string(Clarity clarity);
const char* to_string(Undertone undertone);

std::optional<ParentSeason> parse_parent_season(const std::string& s);
std::optional<MicroSeason> parse_micro_season(const std::string& s);
std::optional<ColorGroup> parse_color_group(const std::string& s);
std::optional<ClassificationStatus> parse_classification_status(const std::string& s);
std::optional<Depth> parse_depth(const std::string& s);
std::optional<Clarity> parse_clarity(const std::string& s);
std::optional<Undertone> parse_undertone(const std::string& s);

}
