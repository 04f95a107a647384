#include "EventAssembler.hpp"
#include "QualityGate.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using namespace std;

string EventAssembler::make_event_id(const string& chunk_id, int track_id, int start_frame)
{
    ostringstream id;
    id << chunk_id << "_t" << internal << setw(4) << setfill('0') << track_id
       << "_f" << setw(6) << setfill('0') << start_frame;
    return id.str();
}

Event EventAssembler::assemble(const Chunk& chunk, const SubTrack& sub)
{
    if (sub.detections.empty())
        throw invalid_argument("assemble: empty sub-track for track " + to_string(sub.track_id));

    Event ev;
    ev.chunk_id    = chunk.chunk_id;
    ev.track_id    = sub.track_id;
    ev.start_frame = sub.start_frame();
    ev.end_frame   = sub.end_frame();
    ev.event_id    = make_event_id(chunk.chunk_id, sub.track_id, ev.start_frame);

    ev.start_time          = ev.start_frame / chunk.fps;
    ev.end_time            = ev.end_frame / chunk.fps;
    ev.duration_seconds    = sub.duration_seconds(chunk.fps);
    ev.absolute_start_time = chunk.start_offset + ev.start_time;
    ev.absolute_end_time   = chunk.start_offset + ev.end_time;

    ev.detection_count = sub.size();
    ev.mean_confidence = sub.mean_confidence();
    ev.min_confidence  = 1.0;
    ev.max_confidence  = 0.0;
    for (const auto& d : sub.detections) {
        const double c = QualityGate::normalized_confidence(d.confidence);
        ev.min_confidence = min(ev.min_confidence, c);
        ev.max_confidence = max(ev.max_confidence, c);
    }
    ev.movement_pixels = sub.movement_pixels();

    const auto& dets = sub.detections;
    ev.representative_bboxes = { dets.front().bbox, dets[dets.size() / 2].bbox, dets.back().bbox };
    return ev;
}

vector<Event> EventAssembler::assemble_all(const Chunk& chunk, const vector<SubTrack>& subs)
{
    vector<Event> events;
    events.reserve(subs.size());
    for (const auto& s : subs) events.push_back(assemble(chunk, s));
    return events;
}
