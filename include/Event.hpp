#pragma once
#include "Detection.hpp"
#include <string>
#include <vector>

/** Built once by EventAssembler; read-only afterwards. */
struct Event
{
    std::string event_id;
    std::string chunk_id;
    int         track_id    = -1;
    int         start_frame = 0;
    int         end_frame   = 0;

    double start_time       = 0.0;   // seconds, chunk-relative
    double end_time         = 0.0;
    double duration_seconds = 0.0;
    double absolute_start_time = 0.0; // seconds into the source video
    double absolute_end_time   = 0.0;

    int    detection_count = 0;
    double mean_confidence = 0.0;
    double min_confidence  = 0.0;
    double max_confidence  = 0.0;
    double movement_pixels = 0.0;     // first to last bbox centre

    std::vector<BBox> representative_bboxes;   // first, middle, last
};
