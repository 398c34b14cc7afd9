#include "color_metric.hpp"
#include <cmath>

// D65 reference white, Y normalised to 1
static const double WHITE_X = 0.95047;
static const double WHITE_Y = 1.00000;
static const double WHITE_Z = 1.08883;

static double srgb_to_linear(uint8_t v) {
    double c = v / 255.0;
    if (c <= 0.04045) {
        return c / 12.92;
    }
    return std::pow((c + 0.055) / 1.055, 2.4);
}

static double lab_f(double t) {
    const double delta = 6.0 / 29.0;
    if (t > delta * delta * delta) {
        return std::cbrt(t);
    }
    return t / (3.0 * delta * delta) + 4.0 / 29.0;
}

LabColor to_lab(const Color& c) {
    double r = srgb_to_linear(c.r);
    double g = srgb_to_linear(c.g);
    double b = srgb_to_linear(c.b);

    double x = 0.4124564 * r + 0.3575761 * g + 0.1804375 * b;
    double y = 0.2126729 * r + 0.7151522 * g + 0.0721750 * b;
    double z = 0.0193339 * r + 0.1191920 * g + 0.9503041 * b;

    double fx = lab_f(x / WHITE_X);
    double fy = lab_f(y / WHITE_Y);
    double fz = lab_f(z / WHITE_Z);

    return {116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

double lab_distance(const LabColor& x, const LabColor& y) {
    double dl = x.l - y.l;
    double da = x.a - y.a;
    double db = x.b - y.b;
    return std::sqrt(dl * dl + da * da + db * db);
}

double color_distance(const Color& x, const Color& y) {
    return lab_distance(to_lab(x), to_lab(y));
}
