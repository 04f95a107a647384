#include "QualityGate.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

using namespace std;

// -------- config validation --------------

static void require(bool ok, const string& section, const string& what)
{
    if (ok) return;
    ostringstream msg;
    msg << "invalid [" << section << "] configuration: " << what;
    throw invalid_argument(msg.str());
}

void GateConfig::validate(const string& section) const
{
    require(isfinite(conf_threshold) && conf_threshold >= 0.0 && conf_threshold <= 1.0,
            section, "confidence threshold must lie in [0, 1]");
    require(isfinite(min_bbox_area) && isfinite(max_bbox_area),
            section, "bbox area bounds must be finite");
    require(min_bbox_area >= 0.0, section, "min_bbox_area must be >= 0");
    require(min_bbox_area <= max_bbox_area, section, "min_bbox_area > max_bbox_area");
    require(isfinite(min_aspect_ratio) && isfinite(max_aspect_ratio),
            section, "aspect ratio bounds must be finite");
    require(min_aspect_ratio >= 0.0, section, "min_aspect_ratio must be >= 0");
    require(min_aspect_ratio <= max_aspect_ratio, section, "min_aspect_ratio > max_aspect_ratio");
}

// -------- geometry helpers --------------

bool QualityGate::degenerate(const BBox& b)
{
    if (!isfinite(b.x1) || !isfinite(b.y1) || !isfinite(b.x2) || !isfinite(b.y2))
        return true;
    return b.width() <= 0.0 || b.height() <= 0.0;
}

// Inverted boxes collapse to zero extent instead of producing a positive
// area from two negative sides.
double QualityGate::area(const BBox& b)
{
    if (degenerate(b)) return 0.0;
    return b.width() * b.height();
}

double QualityGate::aspect_ratio(const BBox& b)
{
    if (degenerate(b)) return 0.0;
    return b.height() / b.width();
}

double QualityGate::normalized_confidence(double conf)
{
    if (!isfinite(conf) || conf < 0.0 || conf > 1.0) return 0.0;
    return conf;
}

// -------- gate --------------

QualityGate::QualityGate(const GateConfig& cfg) : cfg_(cfg) {}

bool QualityGate::accepts(const Detection& d) const
{
    if (degenerate(d.bbox)) return false;

    if (normalized_confidence(d.confidence) < cfg_.conf_threshold) return false;

    const double a = area(d.bbox);
    if (a < cfg_.min_bbox_area || a > cfg_.max_bbox_area) return false;

    const double ar = aspect_ratio(d.bbox);
    return ar >= cfg_.min_aspect_ratio && ar <= cfg_.max_aspect_ratio;
}
