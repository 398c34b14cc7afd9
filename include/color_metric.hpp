#pragma once

#include "image.hpp"

/// CIELAB color (D65 reference white)
struct LabColor {
    double l = 0.0;
    double a = 0.0;
    double b = 0.0;
};

/// sRGB -> linear RGB -> CIEXYZ -> CIELAB; alpha ignored
LabColor to_lab(const Color& c);

/// CIE76 difference: Euclidean distance in L*a*b*
double lab_distance(const LabColor& x, const LabColor& y);

/// lab_distance(to_lab(x), to_lab(y))
double color_distance(const Color& x, const Color& y);
