#include "TrackSegmenter.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace std;

// -------- config --------------

void SegmenterConfig::validate() const
{
    gate.validate("event_detector");
    auto fail = [](const char* what) {
        throw invalid_argument(string("invalid [event_detector] configuration: ") + what);
    };
    if (min_track_length < 1) fail("min_track_length must be >= 1");
    if (!isfinite(min_event_duration_seconds) || min_event_duration_seconds < 0.0)
        fail("min_event_duration_seconds must be >= 0");
    if (max_gap_frames && *max_gap_frames < 0) fail("max_gap_frames must be >= 0");
    if (!isfinite(min_track_confidence_avg) || min_track_confidence_avg < 0.0 || min_track_confidence_avg > 1.0)
        fail("min_track_confidence_avg must lie in [0, 1]");
    if (!isfinite(min_track_movement_pixels) || min_track_movement_pixels < 0.0)
        fail("min_track_movement_pixels must be >= 0");
}

int SegmenterConfig::gap_frames(double fps) const
{
    if (max_gap_frames) return *max_gap_frames;
    return max(1, static_cast<int>(lround(fps)));
}

// -------- sub-track aggregates --------------

double SubTrack::duration_seconds(double fps) const
{
    if (detections.empty()) return 0.0;
    return (double(end_frame()) - double(start_frame())) / fps;
}

double SubTrack::mean_confidence() const
{
    if (detections.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& d : detections) sum += QualityGate::normalized_confidence(d.confidence);
    return sum / detections.size();
}

double SubTrack::movement_pixels() const
{
    if (detections.size() < 2) return 0.0;
    const BBox& a = detections.front().bbox;
    const BBox& b = detections.back().bbox;
    return hypot((b.x1 + b.x2) * 0.5 - (a.x1 + a.x2) * 0.5,
                 (b.y1 + b.y2) * 0.5 - (a.y1 + a.y2) * 0.5);
}

// -------- stages --------------

TrackSegmenter::TrackSegmenter(const SegmenterConfig& cfg) : cfg_(cfg), gate_(cfg.gate) {}

map<int, vector<Detection>> TrackSegmenter::group_by_track(const vector<Detection>& dets)
{
    map<int, vector<Detection>> tracks;
    for (const auto& d : dets) tracks[d.track_id].push_back(d);

    // stable: duplicate frames keep detector order
    for (auto& [id, seq] : tracks) {
        stable_sort(seq.begin(), seq.end(),
            [](const Detection& a, const Detection& b) { return a.frame_index < b.frame_index; });
    }
    return tracks;
}

vector<vector<Detection>> TrackSegmenter::split_on_gaps(const vector<Detection>& sorted, int max_gap)
{
    vector<vector<Detection>> runs;
    for (const auto& d : sorted) {
        if (runs.empty() ||
            static_cast<long long>(d.frame_index) - runs.back().back().frame_index > max_gap)
            runs.emplace_back();
        runs.back().push_back(d);
    }
    return runs;
}

TrackSegmenter::Verdict TrackSegmenter::judge(const SubTrack& st, double fps) const
{
    if (st.size() < cfg_.min_track_length)                           return Verdict::Length;
    if (st.duration_seconds(fps) < cfg_.min_event_duration_seconds)  return Verdict::Duration;
    if (st.mean_confidence() < cfg_.min_track_confidence_avg)        return Verdict::Confidence;
    if (cfg_.require_motion_for_event &&
        st.movement_pixels() < cfg_.min_track_movement_pixels)       return Verdict::Movement;
    return Verdict::Accepted;
}

SegmentResult TrackSegmenter::segment(const Chunk& chunk, const vector<Detection>& dets) const
{
    if (!isfinite(chunk.fps) || chunk.fps <= 0.0)
        throw invalid_argument("chunk " + chunk.chunk_id + ": fps must be positive");

    SegmentResult out;
    SegmentStats& st = out.stats;
    st.detections_in = static_cast<int>(dets.size());

    const int max_gap = cfg_.gap_frames(chunk.fps);
    const auto tracks = group_by_track(dets);
    st.tracks = static_cast<int>(tracks.size());

    for (const auto& [track_id, seq] : tracks) {
        for (const auto& run : split_on_gaps(seq, max_gap)) {
            st.subtracks++;

            vector<Detection> survivors;
            survivors.reserve(run.size());
            for (const auto& d : run) {
                if (gate_.accepts(d)) survivors.push_back(d);
                else                  st.detections_dropped++;
            }

            if (survivors.empty()) {
                st.fragments++;
                st.rejected_length++;
                continue;
            }

            // dropped detections may open gaps wider than max_gap between survivors
            for (auto& frag : split_on_gaps(survivors, max_gap)) {
                st.fragments++;
                SubTrack sub{track_id, std::move(frag)};
                switch (judge(sub, chunk.fps)) {
                    case Verdict::Length:     st.rejected_length++;     break;
                    case Verdict::Duration:   st.rejected_duration++;   break;
                    case Verdict::Confidence: st.rejected_confidence++; break;
                    case Verdict::Movement:   st.rejected_movement++;   break;
                    case Verdict::Accepted:
                        st.accepted++;
                        out.subtracks.push_back(std::move(sub));
                        break;
                }
            }
        }
    }
    return out;
}
