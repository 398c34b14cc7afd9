#include "quantizer.hpp"

size_t ColorQuantizer::assign(const Color& c) {
    uint32_t key = c.rgb24();
    auto it = assignment_.find(key);
    if (it != assignment_.end()) {
        return it->second;
    }

    LabColor lab = to_lab(c);
    size_t best_idx = clusters_.size();
    double best_dist = tolerance_;
    for (size_t i = 0; i < clusters_.size(); i++) {
        double dist = lab_distance(lab, clusters_[i].lab);
        // strict compare keeps the earliest cluster on ties
        if (dist < best_dist || (best_idx == clusters_.size() && dist <= best_dist)) {
            best_dist = dist;
            best_idx = i;
        }
    }

    Color rgb = c;
    rgb.a = 255;
    if (best_idx == clusters_.size()) {
        clusters_.push_back({rgb, lab, {}});
    }
    clusters_[best_idx].members.push_back(rgb);
    assignment_.emplace(key, best_idx);
    return best_idx;
}

Color ColorQuantizer::map(const Color& c) {
    if (!enabled()) {
        return c;
    }
    Color out = clusters_[assign(c)].representative;
    out.a = c.a;
    return out;
}

ColorMap ColorQuantizer::mapping() const {
    ColorMap result;
    for (const auto& entry : assignment_) {
        result.emplace(entry.first, clusters_[entry.second].representative);
    }
    return result;
}

ColorMap quantize(const std::vector<Color>& colors, double tolerance) {
    ColorQuantizer quantizer(tolerance);
    ColorMap result;
    for (const auto& c : colors) {
        Color rgb = c;
        rgb.a = 255;
        result.emplace(c.rgb24(), quantizer.map(rgb));
    }
    return result;
}
