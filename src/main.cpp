#include "ChunkIO.hpp"
#include "Config.hpp"
#include "Pipeline.hpp"
#include <CLI/CLI.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <stdexcept>

static Pipeline* g_pipeline = nullptr;

static void on_sigint(int)
{
    if (g_pipeline) g_pipeline->request_stop();
}

// -----------------------------------------------------------------------------
// Streams frame 0, then 1 of every `sample_rate` frames of the chunk video, grey-level.
static Pipeline::FrameReader video_frame_reader(int sample_rate)
{
    return [sample_rate](const Chunk& chunk, const Pipeline::FrameVisitor& visit) {
        cv::VideoCapture cap(chunk.filepath);
        if (!cap.isOpened())
            throw std::runtime_error("cannot open video " + chunk.filepath);

        cv::Mat grey;
        sample_frames(cap, sample_rate, [&](const cv::Mat& frame) {
            cv::cvtColor(frame, grey, cv::COLOR_BGR2GRAY);
            return visit(grey);
        });
    };
}

static void log_result(const ChunkResult& r)
{
    const auto& a = r.activity;
    switch (r.status) {
        case ChunkStatus::Active:
            std::cout << r.chunk.chunk_id << ": active (" << a.active_frames << "/" << a.sampled_frames
                      << " frames) tracks=" << r.stats.tracks
                      << " rej_length=" << r.stats.rejected_length
                      << " rej_duration=" << r.stats.rejected_duration
                      << " rej_conf=" << r.stats.rejected_confidence
                      << " rej_motion=" << r.stats.rejected_movement
                      << " events=" << r.events.size() << "\n";
            break;
        case ChunkStatus::Inactive:
            std::cout << r.chunk.chunk_id << ": inactive, rejected by " << rejection_to_str(a.rejection)
                      << " (" << a.active_frames << "/" << a.sampled_frames << " frames)\n";
            break;
        case ChunkStatus::Cancelled:
            std::cout << r.chunk.chunk_id << ": cancelled\n";
            break;
        case ChunkStatus::DetectorFailed:
        case ChunkStatus::Failed:
            std::cerr << r.chunk.chunk_id << ": " << status_to_str(r.status) << ": " << r.error << std::endl;
            break;
    }
}

// -----------------------------------------------------------------------------

int main(int argc, char** argv)
{
    std::string config_path = "defaults.ini";
    std::string in_path;
    std::string out_path    = "events_summary.json";
    std::string activity_path;
    int    workers      = 1;
    double conf         = 0.5;
    double min_duration = 1.0;
    int    min_length   = 15;
    int    max_gap      = 0;
    bool   motion_check = false;

    CLI::App app{"Quality-gated event extraction"};
    app.add_option("--config", config_path, "Threshold defaults (.ini)");
    app.add_option("--input", in_path, "Chunk detections JSON path")->required();
    app.add_option("--output", out_path, "Events summary JSON path");
    app.add_option("--activity-report", activity_path, "Active chunks report JSON path");
    auto* o_workers = app.add_option("--workers", workers, "Chunks processed in parallel");
    auto* o_conf    = app.add_option("--conf", conf, "Event detector confidence threshold");
    auto* o_dur     = app.add_option("--min-duration", min_duration, "Minimum event duration (s)");
    auto* o_len     = app.add_option("--min-track-length", min_length, "Minimum detections per event");
    auto* o_gap     = app.add_option("--max-gap", max_gap, "Frame gap that splits a track");
    app.add_flag("--motion-check", motion_check, "Run the motion pre-check on chunk videos");
    CLI11_PARSE(app, argc, argv);

    // ini values first, command line on top, then validate the merge
    PipelineConfig cfg;
    try {
        if (app.count("--config") || std::filesystem::exists(config_path))
            cfg = load_config(config_path);
        else
            std::cout << "no " << config_path << ", using built-in defaults" << std::endl;

        if (o_workers->count()) cfg.workers = workers;
        if (o_conf->count())    cfg.detector.gate.conf_threshold = conf;
        if (o_dur->count())     cfg.detector.min_event_duration_seconds = min_duration;
        if (o_len->count())     cfg.detector.min_track_length = min_length;
        if (o_gap->count())     cfg.detector.max_gap_frames = max_gap;
        cfg.validate();
    } catch (const std::exception& e) {
        std::cerr << "configuration error: " << e.what() << std::endl;
        return 2;
    }

    std::vector<ChunkInput> chunks;
    try {
        chunks = load_chunks(in_path);
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    std::cout << "loaded " << chunks.size() << " chunks from " << in_path << std::endl;

    Pipeline pipeline(cfg);
    if (motion_check) pipeline.set_frame_reader(video_frame_reader(cfg.activity.motion_sample_rate));
    g_pipeline = &pipeline;
    std::signal(SIGINT, on_sigint);

    const auto t0 = std::chrono::steady_clock::now();
    const std::vector<ChunkResult> results = pipeline.run(chunks);
    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    std::signal(SIGINT, SIG_DFL);
    g_pipeline = nullptr;

    for (const auto& r : results) log_result(r);
    const PipelineSummary summary = Pipeline::summarize(results, seconds);

    try {
        save_json(out_path, events_report(results, summary, cfg));
        if (!activity_path.empty())
            save_json(activity_path, activity_report(results, summary, cfg));
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    std::cout << "Event extraction complete. Chunks: " << summary.total_chunks
              << " active: " << summary.active_chunks
              << " failed: " << summary.failed_chunks
              << " events: " << summary.total_events
              << " (" << std::fixed << std::setprecision(1) << seconds << "s)\n";
    return 0;
}
