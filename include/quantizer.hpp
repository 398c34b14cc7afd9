#pragma once

#include "color_metric.hpp"
#include <cstddef>
#include <unordered_map>
#include <vector>

/// Original color (as Color::rgb24) -> cluster representative
using ColorMap = std::unordered_map<uint32_t, Color>;

/// Sequential tolerance clustering in CIELAB space.
///
/// Colors are fed in a fixed order. A color joins the nearest existing
/// cluster whose representative lies within `tolerance` (ties go to the
/// earliest cluster), otherwise it starts a new cluster. The first color
/// of a cluster stays its representative, so earlier assignments never
/// move. A tolerance <= 0 maps every color to itself.
class ColorQuantizer {
public:
    struct Cluster {
        Color representative;
        LabColor lab;
        std::vector<Color> members;
    };

    explicit ColorQuantizer(double tolerance) : tolerance_(tolerance) {}

    /// Assign a color (if new) and return its representative; alpha of the
    /// input is preserved
    Color map(const Color& c);

    bool enabled() const { return tolerance_ > 0.0; }
    double tolerance() const { return tolerance_; }

    size_t cluster_count() const { return clusters_.size(); }
    const std::vector<Cluster>& clusters() const { return clusters_; }

    /// Snapshot of every assignment made so far
    ColorMap mapping() const;

private:
    size_t assign(const Color& c);

    double tolerance_;
    std::vector<Cluster> clusters_;
    std::unordered_map<uint32_t, size_t> assignment_;  // rgb24 -> cluster index
};

/// Fold `colors` through a ColorQuantizer in order and return the mapping
ColorMap quantize(const std::vector<Color>& colors, double tolerance);
