#pragma once
#include "Detection.hpp"
#include "Event.hpp"
#include "TrackSegmenter.hpp"
#include <string>
#include <vector>

class EventAssembler
{
public:
    /** Build the event for one accepted sub-track. The sub-track must be non-empty. */
    static Event assemble(const Chunk& chunk, const SubTrack& sub);

    static std::vector<Event> assemble_all(const Chunk& chunk, const std::vector<SubTrack>& subs);

    /** `<chunk_id>_t<track_id>_f<start_frame>`, unique across sub-tracks of a chunk. */
    static std::string make_event_id(const std::string& chunk_id, int track_id, int start_frame);
};
