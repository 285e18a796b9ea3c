#include "core/delta_e.hpp"
#include <cmath>

namespace seasonal {

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;
constexpr double POW25_7 = 6103515625.0;

double pow7(double v) {
    double v2 = v * v;
    return v2 * v2 * v2 * v;
}

double hue_degrees(double b, double a_prime) {
    if (b == 0.0 && a_prime == 0.0) return 0.0;
    double h = std::atan2(b, a_prime) * RAD_TO_DEG;
    if (h < 0.0) h += 360.0;
    // a tiny negative angle rounds up to exactly 360 after the shift
    if (h >= 360.0) h -= 360.0;
    return h;
}

}

double delta_e_2000(const Lab& lab1, const Lab& lab2) {
    double c1 = std::sqrt(lab1.a * lab1.a + lab1.b * lab1.b);
    double c2 = std::sqrt(lab2.a * lab2.a + lab2.b * lab2.b);
    double c_bar7 = pow7((c1 + c2) / 2.0);
    double g = 0.5 * (1.0 - std::sqrt(c_bar7 / (c_bar7 + POW25_7)));

    double a1p = lab1.a * (1.0 + g);
    double a2p = lab2.a * (1.0 + g);
    double c1p = std::sqrt(a1p * a1p + lab1.b * lab1.b);
    double c2p = std::sqrt(a2p * a2p + lab2.b * lab2.b);
    double h1p = hue_degrees(lab1.b, a1p);
    double h2p = hue_degrees(lab2.b, a2p);

    double delta_lp = lab2.L - lab1.L;
    double delta_cp = c2p - c1p;

    double chroma_product = c1p * c2p;
    double h_diff = h2p - h1p;
    double delta_hp;
    if (chroma_product == 0.0) {
        delta_hp = 0.0;
    } else if (std::abs(h_diff) <= 180.0) {
        delta_hp = h_diff;
    } else if (h_diff > 180.0) {
        delta_hp = h_diff - 360.0;
    } else {
        delta_hp = h_diff + 360.0;
    }
    double delta_big_hp = 2.0 * std::sqrt(chroma_product) * std::sin(delta_hp * DEG_TO_RAD / 2.0);

    double l_bar_p = (lab1.L + lab2.L) / 2.0;
    double c_bar_p = (c1p + c2p) / 2.0;

    double h_bar_p;
    if (chroma_product == 0.0) {
        h_bar_p = h1p + h2p;
    } else if (std::abs(h1p - h2p) <= 180.0) {
        h_bar_p = (h1p + h2p) / 2.0;
    } else if (h1p + h2p < 360.0) {
        h_bar_p = (h1p + h2p + 360.0) / 2.0;
    } else {
        h_bar_p = (h1p + h2p - 360.0) / 2.0;
    }

    double t = 1.0
        - 0.17 * std::cos((h_bar_p - 30.0) * DEG_TO_RAD)
        + 0.24 * std::cos((2.0 * h_bar_p) * DEG_TO_RAD)
        + 0.32 * std::cos((3.0 * h_bar_p + 6.0) * DEG_TO_RAD)
        - 0.20 * std::cos((4.0 * h_bar_p - 63.0) * DEG_TO_RAD);

    double h_offset = (h_bar_p - 275.0) / 25.0;
    double delta_theta = 30.0 * std::exp(-(h_offset * h_offset));

    double c_bar_p7 = pow7(c_bar_p);
    double rc = 2.0 * std::sqrt(c_bar_p7 / (c_bar_p7 + POW25_7));

    double l_offset2 = (l_bar_p - 50.0) * (l_bar_p - 50.0);
    double sl = 1.0 + (0.015 * l_offset2) / std::sqrt(20.0 + l_offset2);
    double sc = 1.0 + 0.045 * c_bar_p;
    double sh = 1.0 + 0.015 * c_bar_p * t;
    double rt = -std::sin(2.0 * delta_theta * DEG_TO_RAD) * rc;

    constexpr double kL = 1.0;
    constexpr double kC = 1.0;
    constexpr double kH = 1.0;

    double dl = delta_lp / (kL * sl);
    double dc = delta_cp / (kC * sc);
    double dh = delta_big_hp / (kH * sh);

    double sum = dl * dl + dc * dc + dh * dh + rt * dc * dh;
    return sum > 0.0 ? std::sqrt(sum) : 0.0;
}

double delta_e_76(const Lab& lab1, const Lab& lab2) {
    double dL = lab1.L - lab2.L;
    double da = lab1.a - lab2.a;
    double db = lab1.b - lab2.b;
    return std::sqrt(dL * dL + da * da + db * db);
}

}
