#include "ChunkIO.hpp"
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>
#include <stdexcept>

using namespace std;
using nlohmann::json;
using nlohmann::ordered_json;

// -----------------------------------------------------------------------------
// Input

static BBox bbox_from_json(const json& b)
{
    if (!b.is_array() || b.size() != 4)
        throw runtime_error("bbox must be [x1, y1, x2, y2]");
    return { b[0].get<double>(), b[1].get<double>(), b[2].get<double>(), b[3].get<double>() };
}

static int frame_from_json(const json& f)
{
    const int frame = f.at("frame").get<int>();
    if (frame < 0)
        throw runtime_error("frame must be >= 0, got " + to_string(frame));
    return frame;
}

static Detection detection_from_json(const json& d, int frame_index, bool tracked)
{
    Detection det;
    det.frame_index = frame_index;
    det.track_id    = tracked ? d.at("track_id").get<int>() : d.value("track_id", -1);
    det.confidence  = d.at("confidence").get<double>();
    det.bbox        = bbox_from_json(d.at("bbox"));
    return det;
}

ChunkInput chunk_from_json(const json& j, size_t index)
{
    ChunkInput in;
    ostringstream fallback_id;
    fallback_id << "chunk_" << setw(4) << setfill('0') << index;
    in.chunk.chunk_id = fallback_id.str();

    try {
        in.chunk.chunk_id         = j.value("chunk_id", in.chunk.chunk_id);
        in.chunk.start_offset     = j.value("start_offset", 0.0);
        in.chunk.duration_seconds = j.value("duration_seconds", 0.0);
        in.chunk.fps              = j.at("fps").get<double>();
        in.chunk.filepath         = j.value("filepath", string());
        in.detector_error         = j.value("error", string());

        if (j.contains("sampled_frames")) {
            for (const auto& f : j.at("sampled_frames")) {
                SampledFrame sf;
                sf.frame_index = frame_from_json(f);
                for (const auto& d : f.at("detections"))
                    sf.detections.push_back(detection_from_json(d, sf.frame_index, false));
                in.sampled_frames.push_back(std::move(sf));
            }
        }
        if (j.contains("detections")) {
            for (const auto& d : j.at("detections"))
                in.detections.push_back(detection_from_json(d, frame_from_json(d), true));
        }
    } catch (const exception& e) {
        in.sampled_frames.clear();
        in.detections.clear();
        in.load_error = string("malformed chunk entry: ") + e.what();
    }
    return in;
}

vector<ChunkInput> load_chunks(const string& path)
{
    ifstream file(path);
    if (!file.is_open())
        throw runtime_error("cannot open input file " + path);

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw runtime_error("invalid JSON in " + path + ": " + e.what());
    }
    if (!j.is_array())
        throw runtime_error(path + ": expected a JSON array of chunks");

    // event ids embed the chunk id, so it must be unique within a run
    vector<ChunkInput> chunks;
    set<string> seen;
    chunks.reserve(j.size());
    for (size_t i = 0; i < j.size(); ++i) {
        ChunkInput in = chunk_from_json(j[i], i);
        if (!seen.insert(in.chunk.chunk_id).second && in.load_error.empty()) {
            in.sampled_frames.clear();
            in.detections.clear();
            in.load_error = "duplicate chunk_id " + in.chunk.chunk_id;
        }
        chunks.push_back(std::move(in));
    }
    return chunks;
}

// -----------------------------------------------------------------------------
// Output

static ordered_json bbox_to_json(const BBox& b)
{
    return ordered_json::array({ b.x1, b.y1, b.x2, b.y2 });
}

ordered_json event_to_json(const Event& ev)
{
    ordered_json o;
    o["event_id"]            = ev.event_id;
    o["chunk_id"]            = ev.chunk_id;
    o["track_id"]            = ev.track_id;
    o["start_frame"]         = ev.start_frame;
    o["end_frame"]           = ev.end_frame;
    o["start_time"]          = ev.start_time;
    o["end_time"]            = ev.end_time;
    o["absolute_start_time"] = ev.absolute_start_time;
    o["absolute_end_time"]   = ev.absolute_end_time;
    o["duration_seconds"]    = ev.duration_seconds;
    o["detection_count"]     = ev.detection_count;
    o["mean_confidence"]     = ev.mean_confidence;
    o["min_confidence"]      = ev.min_confidence;
    o["max_confidence"]      = ev.max_confidence;
    o["movement_pixels"]     = ev.movement_pixels;
    o["representative_bboxes"] = ordered_json::array();
    for (const auto& b : ev.representative_bboxes)
        o["representative_bboxes"].push_back(bbox_to_json(b));
    return o;
}

ordered_json summary_to_json(const PipelineSummary& s)
{
    ordered_json o;
    o["total_chunks"]    = s.total_chunks;
    o["active_chunks"]   = s.active_chunks;
    o["inactive_chunks"] = s.inactive_chunks;
    o["motion_rejected"] = s.motion_rejected;
    o["person_rejected"] = s.person_rejected;
    o["failed_chunks"]   = s.failed_chunks;
    o["cancelled_chunks"] = s.cancelled;
    o["total_events"]    = s.total_events;
    o["total_tracks"]    = s.unique_tracks;
    ordered_json buckets;
    for (size_t i = 0; i < s.events_by_duration.size(); ++i)
        buckets[PipelineSummary::duration_buckets[i]] = s.events_by_duration[i];
    o["events_by_duration"]      = buckets;
    o["processing_time_seconds"] = s.processing_time_seconds;
    return o;
}

static ordered_json gate_to_json(const GateConfig& g, const char* conf_key)
{
    ordered_json o;
    o[conf_key]           = g.conf_threshold;
    o["min_bbox_area"]    = g.min_bbox_area;
    o["max_bbox_area"]    = g.max_bbox_area;
    o["min_aspect_ratio"] = g.min_aspect_ratio;
    o["max_aspect_ratio"] = g.max_aspect_ratio;
    return o;
}

static ordered_json segment_stats_to_json(const SegmentStats& st)
{
    return ordered_json{
        {"tracks", st.tracks},
        {"subtracks", st.subtracks},
        {"fragments", st.fragments},
        {"detections_in", st.detections_in},
        {"detections_dropped", st.detections_dropped},
        {"rejected_track_length", st.rejected_length},
        {"rejected_duration", st.rejected_duration},
        {"rejected_confidence", st.rejected_confidence},
        {"rejected_movement", st.rejected_movement},
        {"accepted", st.accepted}
    };
}

ordered_json events_report(const vector<ChunkResult>& results,
                           const PipelineSummary& summary,
                           const PipelineConfig& cfg)
{
    ordered_json report;
    report["statistics"] = summary_to_json(summary);

    ordered_json chunks = ordered_json::array();
    ordered_json events = ordered_json::array();
    for (const auto& r : results) {
        ordered_json c;
        c["chunk_id"] = r.chunk.chunk_id;
        c["status"]   = status_to_str(r.status);
        if (!r.error.empty()) c["error"] = r.error;
        if (r.status == ChunkStatus::Active) c["filtering"] = segment_stats_to_json(r.stats);
        chunks.push_back(c);

        for (const auto& ev : r.events) events.push_back(event_to_json(ev));
    }
    report["chunks"] = chunks;
    report["events"] = events;

    const SegmenterConfig& d = cfg.detector;
    ordered_json dc = gate_to_json(d.gate, "conf_threshold");
    dc["min_track_length"]           = d.min_track_length;
    dc["min_event_duration_seconds"] = d.min_event_duration_seconds;
    if (d.max_gap_frames) dc["max_gap_frames"] = *d.max_gap_frames;
    else                  dc["max_gap_frames"] = "auto";
    dc["min_track_confidence_avg"]   = d.min_track_confidence_avg;
    dc["require_motion_for_event"]   = d.require_motion_for_event;
    dc["min_track_movement_pixels"]  = d.min_track_movement_pixels;
    report["detector_config"] = dc;
    return report;
}

ordered_json activity_report(const vector<ChunkResult>& results,
                             const PipelineSummary& summary,
                             const PipelineConfig& cfg)
{
    ordered_json report;
    report["statistics"] = summary_to_json(summary);

    ordered_json active = ordered_json::array();
    for (const auto& r : results) {
        if (r.status != ChunkStatus::Active) continue;
        ordered_json c;
        c["chunk_id"]             = r.chunk.chunk_id;
        c["filepath"]             = r.chunk.filepath;
        c["start_offset"]         = r.chunk.start_offset;
        c["duration_seconds"]     = r.chunk.duration_seconds;
        c["fps"]                  = r.chunk.fps;
        c["person_frames"]        = r.activity.active_frames;
        c["total_sampled_frames"] = r.activity.sampled_frames;
        c["activity_score"]       = r.activity.activity_score;
        active.push_back(c);
    }
    report["active_chunks"] = active;

    const ActivityConfig& a = cfg.activity;
    ordered_json fc = gate_to_json(a.gate, "person_conf_threshold");
    fc["min_person_frames"]      = a.min_person_frames;
    fc["motion_threshold"]       = a.motion_threshold;
    fc["motion_pixel_threshold"] = a.motion_pixel_threshold;
    fc["motion_sample_rate"]     = a.motion_sample_rate;
    report["filter_config"] = fc;
    return report;
}

void save_json(const string& path, const ordered_json& j)
{
    ofstream out(path);
    if (!out.is_open())
        throw runtime_error("cannot write " + path);
    out << setw(2) << j << '\n';
}
