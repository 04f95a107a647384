#pragma once
#include "Detection.hpp"
#include "QualityGate.hpp"
#include <opencv2/core.hpp>
#include <vector>

struct ActivityConfig
{
    GateConfig gate;                   // person_conf_threshold + bbox bounds
    int    min_person_frames      = 30;

    // motion pre-check
    double motion_threshold       = 0.02;  // fraction of moving pixels
    int    motion_pixel_threshold = 25;    // grey-level difference
    int    motion_sample_rate     = 10;    // read 1 of N frames

    void validate() const;
};

enum class ActivityRejection { None, Motion, Person };

struct ActivityResult
{
    bool   active         = false;
    int    active_frames  = 0;
    int    sampled_frames = 0;
    double activity_score = 0.0;   // active_frames / sampled_frames
    bool   motion_checked = false;
    bool   has_motion     = false;
    ActivityRejection rejection = ActivityRejection::Person;
};

const char* rejection_to_str(ActivityRejection r);

/** Compares each frame with the previous one; holds a single frame at a time. */
class MotionDetector
{
public:
    MotionDetector(double motion_threshold, int pixel_threshold);

    /** Returns true once any pair has moved; later frames are ignored. */
    bool feed(const cv::Mat& frame);

    bool detected() const { return detected_; }
    int  frames_seen() const { return frames_seen_; }

private:
    double  motion_threshold_;
    int     pixel_threshold_;
    cv::Mat prev_;
    bool    detected_    = false;
    int     frames_seen_ = 0;
};

/**
 * Reads frame 0, then 1 of every `sample_rate` frames, passing each to `visit` until it
 * returns false or the capture runs out. `Capture` provides grab() and read(cv::Mat&),
 * as cv::VideoCapture does. Returns the number of frames visited.
 */
template <typename Capture, typename Visitor>
int sample_frames(Capture& cap, int sample_rate, Visitor&& visit)
{
    cv::Mat frame;
    int visited = 0;
    while (cap.read(frame)) {
        ++visited;
        if (!visit(frame)) break;
        for (int i = 1; i < sample_rate; ++i)
            if (!cap.grab()) return visited;
    }
    return visited;
}

class ActivityFilter
{
public:
    explicit ActivityFilter(const ActivityConfig& cfg);

    /** Person check only. */
    ActivityResult evaluate(const std::vector<SampledFrame>& frames) const;

    /** Person check behind an already computed motion verdict. */
    ActivityResult evaluate(const std::vector<SampledFrame>& frames, bool has_motion) const;

    bool frame_active(const SampledFrame& frame) const;
    bool has_motion(const std::vector<cv::Mat>& frames) const;
    MotionDetector motion_detector() const;

    /** Fraction of pixels whose grey level changed by more than `pixel_threshold`. */
    static double motion_ratio(const cv::Mat& prev, const cv::Mat& cur, int pixel_threshold);

    const ActivityConfig& config() const { return cfg_; }

private:
    ActivityConfig cfg_;
    QualityGate    gate_;
};
