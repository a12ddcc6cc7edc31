#pragma once
// Alerts: session health against the configured baselines

#include "types.hpp"
#include <cmath>
#include <cstdio>
#include <string>
#include <vector>

namespace liminal {

// One glyph per value in [0,1], blank for zero
inline std::string sparkline(const std::vector<float>& values) {
    static const char* const GLYPHS[] = {
        " ", "\u2581", "\u2582", "\u2583", "\u2584", "\u2585", "\u2586", "\u2587", "\u2588"
    };
    constexpr int MAX_INDEX = 8;

    std::string out;
    for (float v : values) {
        float c = std::isfinite(v) ? clamp01(v) : 0.0f;
        int idx = static_cast<int>(std::lround(c * MAX_INDEX));
        out += GLYPHS[std::min(idx, MAX_INDEX)];
    }
    return out;
}

struct AlertStats {
    size_t drift_breaches = 0;
    size_t res_breaches = 0;
    size_t total = 0;
    float max_drift = 0.0f;
    float min_res = 1.0f;

    void update(float drift, float res, float base_drift, float base_res) {
        total++;
        if (drift > base_drift) drift_breaches++;
        if (res < base_res) res_breaches++;
        if (drift > max_drift) max_drift = drift;
        if (res < min_res) min_res = res;
    }

    bool ok() const { return drift_breaches == 0 && res_breaches == 0; }

    std::vector<std::string> summary_lines(float base_drift, float base_res) const {
        std::vector<std::string> lines;
        char buf[128];

        snprintf(buf, sizeof(buf), "[health] baseline_drift>%.2f, baseline_res<%.2f",
                 base_drift, base_res);
        lines.emplace_back(buf);

        snprintf(buf, sizeof(buf), "[health] breaches: drift=%zu, res=%zu, total=%zu",
                 drift_breaches, res_breaches, total);
        lines.emplace_back(buf);

        snprintf(buf, sizeof(buf), "[health] worst: drift_max=%.2f, res_min=%.2f",
                 max_drift, total > 0 ? min_res : 0.0f);
        lines.emplace_back(buf);

        lines.emplace_back(std::string("[health] status: ") + (ok() ? "OK" : "ATTENTION"));
        return lines;
    }
};

} // namespace liminal
