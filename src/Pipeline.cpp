#include "Pipeline.hpp"
#include "EventAssembler.hpp"
#include <algorithm>
#include <set>
#include <thread>
#include <utility>

using namespace std;

const char* status_to_str(ChunkStatus s)
{
    switch (s) {
        case ChunkStatus::Active:         return "active";
        case ChunkStatus::Inactive:       return "inactive";
        case ChunkStatus::DetectorFailed: return "detector_failed";
        case ChunkStatus::Failed:         return "failed";
        case ChunkStatus::Cancelled:      return "cancelled";
    }
    return "failed";
}

int PipelineSummary::duration_bucket(double seconds)
{
    if (seconds < 1.0)  return 0;
    if (seconds < 5.0)  return 1;
    if (seconds < 15.0) return 2;
    if (seconds < 30.0) return 3;
    return 4;
}

// -------- per chunk --------------

static PipelineConfig validated(const PipelineConfig& cfg)
{
    cfg.validate();
    return cfg;
}

Pipeline::Pipeline(const PipelineConfig& cfg)
    : cfg_(validated(cfg)), activity_(cfg.activity), segmenter_(cfg.detector) {}

ChunkResult Pipeline::process_unchecked(const ChunkInput& in) const
{
    ChunkResult res;
    res.chunk = in.chunk;

    if (!in.load_error.empty()) {
        res.status = ChunkStatus::Failed;
        res.error  = in.load_error;
        return res;
    }
    // Upstream failure degrades to "no detections" for this chunk only.
    if (!in.detector_error.empty()) {
        res.status = ChunkStatus::DetectorFailed;
        res.error  = in.detector_error;
        return res;
    }

    if (frame_reader_) {
        MotionDetector motion = activity_.motion_detector();
        frame_reader_(in.chunk, [&motion](const cv::Mat& frame) { return !motion.feed(frame); });
        res.activity = activity_.evaluate(in.sampled_frames, motion.detected());
    } else {
        res.activity = activity_.evaluate(in.sampled_frames);
    }

    if (!res.activity.active) {
        res.status = ChunkStatus::Inactive;
        return res;
    }

    SegmentResult seg = segmenter_.segment(in.chunk, in.detections);
    res.stats  = seg.stats;
    res.events = EventAssembler::assemble_all(in.chunk, seg.subtracks);
    res.status = ChunkStatus::Active;
    return res;
}

ChunkResult Pipeline::process_chunk(const ChunkInput& in) const
{
    try {
        return process_unchecked(in);
    } catch (const exception& e) {
        ChunkResult res;
        res.chunk  = in.chunk;
        res.status = ChunkStatus::Failed;
        res.error  = e.what();
        return res;
    }
}

// -------- batch --------------

vector<ChunkResult> Pipeline::run(const vector<ChunkInput>& inputs)
{
    // One slot per chunk, each written by exactly one worker.
    vector<ChunkResult> results(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) results[i].chunk = inputs[i].chunk;

    atomic<size_t> next{0};
    auto worker = [&]() {
        while (!stop_.load()) {
            const size_t i = next.fetch_add(1);
            if (i >= inputs.size()) break;
            results[i] = process_chunk(inputs[i]);
        }
    };

    const size_t n_workers = min<size_t>(static_cast<size_t>(cfg_.workers), max<size_t>(inputs.size(), 1));
    if (n_workers <= 1) {
        worker();
        return results;
    }

    vector<thread> pool;
    pool.reserve(n_workers);
    for (size_t w = 0; w < n_workers; ++w) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
    return results;
}

PipelineSummary Pipeline::summarize(const vector<ChunkResult>& results, double seconds)
{
    PipelineSummary s;
    s.total_chunks = static_cast<int>(results.size());
    s.processing_time_seconds = seconds;

    set<pair<string, int>> tracks;
    for (const auto& r : results) {
        switch (r.status) {
            case ChunkStatus::Active:
                s.active_chunks++;
                break;
            case ChunkStatus::Inactive:
                s.inactive_chunks++;
                if (r.activity.rejection == ActivityRejection::Motion) s.motion_rejected++;
                else                                                   s.person_rejected++;
                break;
            case ChunkStatus::DetectorFailed:
            case ChunkStatus::Failed:
                s.failed_chunks++;
                break;
            case ChunkStatus::Cancelled:
                s.cancelled++;
                break;
        }
        for (const auto& ev : r.events) {
            s.total_events++;
            s.events_by_duration[PipelineSummary::duration_bucket(ev.duration_seconds)]++;
            tracks.emplace(ev.chunk_id, ev.track_id);
        }
    }
    s.unique_tracks = static_cast<int>(tracks.size());
    return s;
}
