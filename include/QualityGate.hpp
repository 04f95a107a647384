#pragma once
#include "Detection.hpp"
#include <string>

/** Confidence and geometry bounds for one gate. All bounds are inclusive. */
struct GateConfig
{
    double conf_threshold   = 0.5;
    double min_bbox_area    = 2000.0;
    double max_bbox_area    = 500000.0;
    double min_aspect_ratio = 0.3;    // height / width
    double max_aspect_ratio = 4.0;

    /** Throws std::invalid_argument naming the offending field. */
    void validate(const std::string& section) const;
};

class QualityGate
{
public:
    explicit QualityGate(const GateConfig& cfg);

    bool accepts(const Detection& d) const;

    const GateConfig& config() const { return cfg_; }

    // ─── helpers, exposed for diagnostics and tests ─────────────────
    static double area(const BBox& b);
    static double aspect_ratio(const BBox& b);
    static bool   degenerate(const BBox& b);
    static double normalized_confidence(double conf);

private:
    GateConfig cfg_;
};
