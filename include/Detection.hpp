#pragma once
#include <string>
#include <vector>

struct BBox
{
    double x1 = 0.0, y1 = 0.0, x2 = 0.0, y2 = 0.0;   // pixels, xyxy

    double width()  const { return x2 - x1; }
    double height() const { return y2 - y1; }
};

struct Detection
{
    int    frame_index = 0;
    int    track_id    = -1;   // -1 when the detector ran without tracking
    double confidence  = 0.0;
    BBox   bbox;
};

/** Detections produced on one frame picked by the activity sampler. */
struct SampledFrame
{
    int                    frame_index = 0;
    std::vector<Detection> detections;
};

struct Chunk
{
    std::string chunk_id;
    double      start_offset     = 0.0;   // seconds into the source video
    double      duration_seconds = 0.0;
    double      fps              = 0.0;
    std::string filepath;                 // optional, motion pre-check only
};
