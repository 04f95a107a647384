#pragma once
#include "ActivityFilter.hpp"
#include "Config.hpp"
#include "Detection.hpp"
#include "Event.hpp"
#include "TrackSegmenter.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <string>
#include <utility>
#include <vector>

/** Everything the detector/tracker produced for one chunk. */
struct ChunkInput
{
    Chunk                     chunk;
    std::vector<SampledFrame> sampled_frames;   // activity sampler output
    std::vector<Detection>    detections;       // full tracked stream
    std::string               detector_error;   // set when the detector failed upstream
    std::string               load_error;       // set when the entry could not be parsed
};

enum class ChunkStatus { Active, Inactive, DetectorFailed, Failed, Cancelled };

const char* status_to_str(ChunkStatus s);

struct ChunkResult
{
    Chunk              chunk;
    ChunkStatus        status = ChunkStatus::Cancelled;
    ActivityResult     activity;
    SegmentStats       stats;
    std::vector<Event> events;
    std::string        error;
};

struct PipelineSummary
{
    static constexpr std::array<const char*, 5> duration_buckets{ "<1s", "1-5s", "5-15s", "15-30s", ">30s" };

    int total_chunks    = 0;
    int active_chunks   = 0;
    int inactive_chunks = 0;
    int motion_rejected = 0;
    int person_rejected = 0;
    int failed_chunks   = 0;   // detector failures included
    int cancelled       = 0;
    int total_events    = 0;
    int unique_tracks   = 0;   // distinct (chunk, track) pairs with an event
    std::array<int, 5> events_by_duration{};
    double processing_time_seconds = 0.0;

    static int duration_bucket(double seconds);
};

class Pipeline
{
public:
    /** Receives one frame; returning false stops the reader. */
    using FrameVisitor = std::function<bool(const cv::Mat&)>;
    /** Streams grey or BGR frames of a chunk to the visitor for the motion pre-check. */
    using FrameReader  = std::function<void(const Chunk&, const FrameVisitor&)>;

    explicit Pipeline(const PipelineConfig& cfg);

    /** Enables the motion pre-check. */
    void set_frame_reader(FrameReader reader) { frame_reader_ = std::move(reader); }

    /** Never throws: failures are reported in the result. */
    ChunkResult process_chunk(const ChunkInput& in) const;

    /** Runs every chunk on `workers` threads; results keep input order. */
    std::vector<ChunkResult> run(const std::vector<ChunkInput>& inputs);

    /** Chunks not yet started when this is called come back as Cancelled. */
    void request_stop() { stop_.store(true); }

    static PipelineSummary summarize(const std::vector<ChunkResult>& results, double seconds);

    const PipelineConfig& config() const { return cfg_; }

private:
    ChunkResult process_unchecked(const ChunkInput& in) const;

    PipelineConfig    cfg_;
    ActivityFilter    activity_;
    TrackSegmenter    segmenter_;
    FrameReader       frame_reader_;
    std::atomic<bool> stop_{false};
};
