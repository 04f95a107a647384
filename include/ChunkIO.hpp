#pragma once
#include "Config.hpp"
#include "Event.hpp"
#include "Pipeline.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

/** Parse one chunk entry. A malformed entry comes back with `load_error` set. */
ChunkInput chunk_from_json(const nlohmann::json& j, size_t index);

/**
 * Reads a JSON array of chunks. Throws std::runtime_error if the file is unusable.
 * A repeated chunk_id fails every entry after the first one.
 */
std::vector<ChunkInput> load_chunks(const std::string& path);

nlohmann::ordered_json event_to_json(const Event& ev);
nlohmann::ordered_json summary_to_json(const PipelineSummary& s);

/** `{"statistics", "events", "detector_config"}` */
nlohmann::ordered_json events_report(const std::vector<ChunkResult>& results,
                                     const PipelineSummary& summary,
                                     const PipelineConfig& cfg);

/** `{"statistics", "active_chunks", "filter_config"}` */
nlohmann::ordered_json activity_report(const std::vector<ChunkResult>& results,
                                       const PipelineSummary& summary,
                                       const PipelineConfig& cfg);

void save_json(const std::string& path, const nlohmann::ordered_json& j);
