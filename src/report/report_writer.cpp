#include "report/report_writer.hpp"

#include <iomanip>
#include <sstream>

namespace seasonal {

namespace {

constexpr const char* MISSING = "-";

void write_delta(std::ostringstream& out, const std::optional<double>& value) {
    if (value) {
        out << std::fixed << std::setprecision(2) << *value;
    } else {
        out << MISSING;
    }
}

template <typename E>
const char* tag_or_missing(const std::optional<E>& value) {
    return value ? to_string(*value) : MISSING;
}

void write_text_garment(std::ostringstream& out, const GarmentReport& report) {
    const ClassificationResult& r = report.result;

    out << r.dominant_hex << "\n";
    out << "  status:     " << to_string(r.classification_status) << "\n";
    out << "  match:      " << tag_or_missing(r.micro_season_tag) << " / "
        << tag_or_missing(r.season_tag) << " / " << tag_or_missing(r.group_tag) << "\n";

    out << "  nearest:    ";
    if (r.nearest_palette_color) {
        out << r.nearest_palette_color->name << " (" << r.nearest_palette_color->hex << ")";
    } else {
        out << MISSING;
    }
    out << "  dE ";
    write_delta(out, r.min_delta_e);
    out << "\n";

    out << "  crossover:  ";
    if (r.has_secondary()) {
        out << tag_or_missing(r.secondary_micro_season_tag) << " / "
            << tag_or_missing(r.secondary_season_tag) << " / "
            << tag_or_missing(r.secondary_group_tag) << "  dE ";
        write_delta(out, r.secondary_delta_e);
    } else {
        out << MISSING;
    }
    out << "\n";

    if (report.attributes) {
        const GarmentAttributes& a = *report.attributes;
        out << "  attributes: " << to_string(a.undertone) << " / " << to_string(a.depth) << " / "
            << to_string(a.clarity) << "  (chroma " << std::fixed << std::setprecision(1) << a.chroma
            << ", hue " << a.hue_degrees << ")\n";
    }

    if (report.suits_profile) {
        out << "  suits:      " << (*report.suits_profile ? "yes" : "no") << "\n";
    }

    if (report.score) {
        const ColorScore& sc = *report.score;
        out << "  score:      " << to_string(sc.rating) << "  dE " << std::fixed << std::setprecision(2)
            << sc.delta_e << " to " << sc.closest_color.name << " (" << to_string(sc.closest_micro_season)
            << " / " << to_string(sc.closest_group) << ")";
        if (sc.undertone_conflict) out << "  undertone clash";
        if (sc.clarity_capped) out << "  clarity capped";
        if (sc.vivid_warning) out << "  vivid";
        out << "\n";
    }
}

}

std::optional<ReportFormat> parse_report_format(const std::string& s) {
    if (s == "text") return ReportFormat::Text;
    if (s == "json") return ReportFormat::Json;
    if (s == "toml") return ReportFormat::Toml;
    return std::nullopt;
}

toml::table garment_to_table(const GarmentReport& report) {
    const ClassificationResult& r = report.result;

    toml::table tbl;
    tbl.insert("dominant_hex", r.dominant_hex);
    tbl.insert("classification_status", to_string(r.classification_status));

    if (r.lab) {
        tbl.insert("lab", toml::table{{"L", r.lab->L}, {"a", r.lab->a}, {"b", r.lab->b}});
    }
    if (r.micro_season_tag) tbl.insert("micro_season_tag", to_string(*r.micro_season_tag));
    if (r.season_tag) tbl.insert("season_tag", to_string(*r.season_tag));
    if (r.group_tag) tbl.insert("group_tag", to_string(*r.group_tag));
    if (r.nearest_palette_color) {
        tbl.insert("nearest_palette_color", toml::table{{"name", r.nearest_palette_color->name},
                                                        {"hex", r.nearest_palette_color->hex}});
    }
    if (r.min_delta_e) tbl.insert("min_delta_e", *r.min_delta_e);

    if (r.secondary_micro_season_tag) tbl.insert("secondary_micro_season_tag", to_string(*r.secondary_micro_season_tag));
    if (r.secondary_season_tag) tbl.insert("secondary_season_tag", to_string(*r.secondary_season_tag));
    if (r.secondary_group_tag) tbl.insert("secondary_group_tag", to_string(*r.secondary_group_tag));
    if (r.secondary_delta_e) tbl.insert("secondary_delta_e", *r.secondary_delta_e);

    if (report.attributes) {
        const GarmentAttributes& a = *report.attributes;
        tbl.insert("attributes", toml::table{{"undertone", to_string(a.undertone)},
                                             {"depth", to_string(a.depth)},
                                             {"clarity", to_string(a.clarity)},
                                             {"chroma", a.chroma},
                                             {"hue_degrees", a.hue_degrees}});
    }
    if (report.suits_profile) tbl.insert("suits_profile", *report.suits_profile);

    if (report.score) {
        const ColorScore& sc = *report.score;
        tbl.insert("score", toml::table{{"rating", to_string(sc.rating)},
                                        {"base_rating", to_string(sc.base_rating)},
                                        {"delta_e", sc.delta_e},
                                        {"closest_micro_season", to_string(sc.closest_micro_season)},
                                        {"closest_group", to_string(sc.closest_group)},
                                        {"closest_color", toml::table{{"name", sc.closest_color.name},
                                                                      {"hex", sc.closest_color.hex}}},
                                        {"chroma_level", to_string(sc.chroma_level)},
                                        {"undertone_conflict", sc.undertone_conflict},
                                        {"clarity_capped", sc.clarity_capped},
                                        {"vivid_warning", sc.vivid_warning}});
    }
    return tbl;
}

toml::table report_to_table(const std::vector<GarmentReport>& reports,
                            const std::optional<ProfileSummary>& profile) {
    toml::table root;
    if (profile) {
        root.insert("profile", toml::table{{"season", to_string(profile->season)},
                                           {"home_micro_season", to_string(profile->home_micro_season)}});
    }

    toml::array garments;
    for (const auto& report : reports) {
        garments.push_back(garment_to_table(report));
    }
    root.insert("garments", std::move(garments));
    return root;
}

std::string render_report(ReportFormat format,
                          const std::vector<GarmentReport>& reports,
                          const std::optional<ProfileSummary>& profile) {
    std::ostringstream out;

    switch (format) {
        case ReportFormat::Json:
            out << toml::json_formatter{report_to_table(reports, profile)} << "\n";
            break;
        case ReportFormat::Toml:
            out << report_to_table(reports, profile) << "\n";
            break;
        case ReportFormat::Text:
            if (profile) {
                out << "profile: " << to_string(profile->season) << " -> "
                    << to_string(profile->home_micro_season) << "\n\n";
            }
            for (size_t i = 0; i < reports.size(); ++i) {
                if (i > 0) out << "\n";
                write_text_garment(out, reports[i]);
            }
            break;
    }
    return out.str();
}

std::string render_palette_listing(const PaletteRegistry& registry, MicroSeason micro) {
    std::ostringstream out;
    const SeasonPalette& palette = registry.micro_season_palette(micro);

    out << to_string(micro) << " (" << to_string(parent_of(micro)) << "), "
        << palette.size() << " colors\n";
    for (ColorGroup group : all_color_groups()) {
        const auto& colors = palette.group(group);
        if (colors.empty()) continue;

        out << "  " << to_string(group) << "\n";
        for (const auto& color : colors) {
            out << "    " << std::left << std::setw(24) << color.name << color.hex << "\n";
        }
    }
    return out.str();
}

}
