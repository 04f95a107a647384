#include "ActivityFilter.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

void ActivityConfig::validate() const
{
    gate.validate("activity_filter");
    if (min_person_frames < 0)
        throw invalid_argument("invalid [activity_filter] configuration: min_person_frames must be >= 0");
    if (!isfinite(motion_threshold) || motion_threshold < 0.0 || motion_threshold > 1.0)
        throw invalid_argument("invalid [activity_filter] configuration: motion_threshold must lie in [0, 1]");
    if (motion_pixel_threshold < 0 || motion_pixel_threshold > 255)
        throw invalid_argument("invalid [activity_filter] configuration: motion_pixel_threshold must lie in [0, 255]");
    if (motion_sample_rate < 1)
        throw invalid_argument("invalid [activity_filter] configuration: motion_sample_rate must be >= 1");
}

const char* rejection_to_str(ActivityRejection r)
{
    switch (r) {
        case ActivityRejection::None:   return "none";
        case ActivityRejection::Motion: return "motion";
        case ActivityRejection::Person: return "person";
    }
    return "none";
}

ActivityFilter::ActivityFilter(const ActivityConfig& cfg) : cfg_(cfg), gate_(cfg.gate) {}

bool ActivityFilter::frame_active(const SampledFrame& frame) const
{
    return any_of(frame.detections.begin(), frame.detections.end(),
                  [&](const Detection& d) { return gate_.accepts(d); });
}

ActivityResult ActivityFilter::evaluate(const vector<SampledFrame>& frames) const
{
    ActivityResult res;
    res.sampled_frames = static_cast<int>(frames.size());
    for (const auto& f : frames)
        if (frame_active(f)) res.active_frames++;

    res.activity_score = res.sampled_frames > 0
        ? double(res.active_frames) / res.sampled_frames : 0.0;
    res.active    = res.active_frames >= cfg_.min_person_frames && res.sampled_frames > 0;
    res.rejection = res.active ? ActivityRejection::None : ActivityRejection::Person;
    return res;
}

ActivityResult ActivityFilter::evaluate(const vector<SampledFrame>& frames, bool has_motion) const
{
    if (!has_motion) {
        ActivityResult res;
        res.motion_checked = true;
        res.has_motion     = false;
        res.rejection      = ActivityRejection::Motion;
        return res;
    }
    ActivityResult res = evaluate(frames);
    res.motion_checked = true;
    res.has_motion     = true;
    return res;
}

// -------- motion pre-check --------------

static cv::Mat to_grey(const cv::Mat& img)
{
    if (img.channels() == 1) return img;
    cv::Mat grey;
    cv::cvtColor(img, grey, img.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    return grey;
}

double ActivityFilter::motion_ratio(const cv::Mat& prev, const cv::Mat& cur, int pixel_threshold)
{
    if (prev.empty() || cur.empty()) return 0.0;
    if (prev.size() != cur.size())
        throw invalid_argument("motion_ratio: frame sizes differ");

    cv::Mat diff, moving;
    cv::absdiff(to_grey(prev), to_grey(cur), diff);
    cv::threshold(diff, moving, pixel_threshold, 255, cv::THRESH_BINARY);

    const double total = double(moving.rows) * moving.cols;
    return total > 0 ? cv::countNonZero(moving) / total : 0.0;
}

MotionDetector::MotionDetector(double motion_threshold, int pixel_threshold)
    : motion_threshold_(motion_threshold), pixel_threshold_(pixel_threshold) {}

bool MotionDetector::feed(const cv::Mat& frame)
{
    if (detected_ || frame.empty()) return detected_;
    ++frames_seen_;
    if (!prev_.empty() &&
        ActivityFilter::motion_ratio(prev_, frame, pixel_threshold_) > motion_threshold_)
        detected_ = true;
    // readers may reuse their buffer
    frame.copyTo(prev_);
    return detected_;
}

MotionDetector ActivityFilter::motion_detector() const
{
    return MotionDetector(cfg_.motion_threshold, cfg_.motion_pixel_threshold);
}

// A chunk moves if any consecutive pair of sampled frames moves enough.
bool ActivityFilter::has_motion(const vector<cv::Mat>& frames) const
{
    MotionDetector detector = motion_detector();
    for (const auto& f : frames)
        if (detector.feed(f)) return true;
    return false;
}
