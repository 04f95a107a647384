#pragma once
#include "Detection.hpp"
#include "QualityGate.hpp"
#include <map>
#include <optional>
#include <vector>

struct SegmenterConfig
{
    GateConfig gate;                              // conf_threshold + bbox bounds
    int    min_track_length           = 15;
    double min_event_duration_seconds = 1.0;
    std::optional<int> max_gap_frames;            // unset: one second of frames

    // optional post gates
    double min_track_confidence_avg   = 0.0;
    bool   require_motion_for_event   = false;
    double min_track_movement_pixels  = 12.0;

    void validate() const;

    /** Gap (in frames) above which a track is split, for a chunk at `fps`. */
    int gap_frames(double fps) const;
};

/** Surviving detections of one contiguous run of a track, in frame order. */
struct SubTrack
{
    int                    track_id = -1;
    std::vector<Detection> detections;

    int    start_frame() const { return detections.front().frame_index; }
    int    end_frame()   const { return detections.back().frame_index; }
    int    size()        const { return static_cast<int>(detections.size()); }
    double duration_seconds(double fps) const;
    double mean_confidence() const;
    double movement_pixels() const;
};

struct SegmentStats
{
    int tracks              = 0;
    int subtracks           = 0;   // after gap splitting on raw frames
    int fragments           = 0;   // evaluated against the length/duration gates
    int detections_in       = 0;
    int detections_dropped  = 0;   // failed the quality gate
    int rejected_length     = 0;
    int rejected_duration   = 0;
    int rejected_confidence = 0;
    int rejected_movement   = 0;
    int accepted            = 0;
};

struct SegmentResult
{
    std::vector<SubTrack> subtracks;   // accepted, ordered by track id then start frame
    SegmentStats          stats;
};

class TrackSegmenter
{
public:
    explicit TrackSegmenter(const SegmenterConfig& cfg);

    /** Throws std::invalid_argument when the chunk fps is unusable. */
    SegmentResult segment(const Chunk& chunk, const std::vector<Detection>& dets) const;

    const SegmenterConfig& config() const { return cfg_; }

    // ─── stages, exposed for tests ──────────────────────────────────
    static std::map<int, std::vector<Detection>> group_by_track(const std::vector<Detection>& dets);
    static std::vector<std::vector<Detection>> split_on_gaps(const std::vector<Detection>& sorted,
                                                             int max_gap);

private:
    enum class Verdict { Accepted, Length, Duration, Confidence, Movement };
    Verdict judge(const SubTrack& st, double fps) const;

    SegmenterConfig cfg_;
    QualityGate     gate_;
};
