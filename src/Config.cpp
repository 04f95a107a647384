#include "Config.hpp"
#include <fstream>
#include <iostream>
#include <regex>
#include <stdexcept>

using namespace std;

// -----------------------------------------------------------------------------
// Ini reader

bool IniFile::load(const string& path)
{
    ifstream file(path);
    if (!file.is_open()) return false;
    parse(file);
    return true;
}

void IniFile::parse(istream& in)
{
    static const regex section_re(R"(^\s*\[(.*?)\]\s*(?:[#;].*)?$)");
    static const regex keyval_re(R"(^\s*([^=#;]+?)\s*=\s*(.*?)\s*(?:[#;].*)?$)");

    string line, current_section;
    smatch match;
    while (getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (regex_match(line, match, section_re)) {
            current_section = match[1];
            sections_[current_section];
        } else if (regex_match(line, match, keyval_re)) {
            sections_[current_section][match[1].str()] = match[2].str();
        }
    }
}

optional<string> IniFile::get(const string& section, const string& key) const
{
    auto s = sections_.find(section);
    if (s == sections_.end()) return nullopt;
    auto k = s->second.find(key);
    if (k == s->second.end()) return nullopt;
    return k->second;
}

bool IniFile::has_section(const string& section) const
{
    return sections_.count(section) > 0;
}

// -----------------------------------------------------------------------------
// Typed lookups, a present but unparsable value is a load error

static string where(const string& section, const string& key, const string& value)
{
    return "[" + section + "] " + key + " = '" + value + "'";
}

static void read_double(const IniFile& ini, const string& sec, const string& key, double& out)
{
    auto v = ini.get(sec, key);
    if (!v) return;
    size_t used = 0;
    try {
        out = stod(*v, &used);
    } catch (const exception&) {
        used = 0;
    }
    if (used == 0 || used != v->size())
        throw invalid_argument(where(sec, key, *v) + " is not a number");
}

static void read_int(const IniFile& ini, const string& sec, const string& key, int& out)
{
    auto v = ini.get(sec, key);
    if (!v) return;
    size_t used = 0;
    try {
        out = stoi(*v, &used);
    } catch (const exception&) {
        used = 0;
    }
    if (used == 0 || used != v->size())
        throw invalid_argument(where(sec, key, *v) + " is not an integer");
}

static void read_bool(const IniFile& ini, const string& sec, const string& key, bool& out)
{
    auto v = ini.get(sec, key);
    if (!v) return;
    if (*v == "true" || *v == "1" || *v == "yes" || *v == "on")        out = true;
    else if (*v == "false" || *v == "0" || *v == "no" || *v == "off") out = false;
    else throw invalid_argument(where(sec, key, *v) + " is not a boolean");
}

static void read_gate(const IniFile& ini, const string& sec, const string& conf_key, GateConfig& g)
{
    read_double(ini, sec, conf_key,           g.conf_threshold);
    read_double(ini, sec, "min_bbox_area",    g.min_bbox_area);
    read_double(ini, sec, "max_bbox_area",    g.max_bbox_area);
    read_double(ini, sec, "min_aspect_ratio", g.min_aspect_ratio);
    read_double(ini, sec, "max_aspect_ratio", g.max_aspect_ratio);
}

// -----------------------------------------------------------------------------

void PipelineConfig::validate() const
{
    activity.validate();
    detector.validate();
    if (workers < 1)
        throw invalid_argument("invalid [pipeline] configuration: workers must be >= 1");
}

PipelineConfig config_from_ini(const IniFile& ini)
{
    PipelineConfig cfg;

    const string af = "activity_filter";
    read_gate(ini, af, "person_conf_threshold", cfg.activity.gate);
    read_int(ini, af, "min_person_frames",      cfg.activity.min_person_frames);
    read_double(ini, af, "motion_threshold",    cfg.activity.motion_threshold);
    read_int(ini, af, "motion_pixel_threshold", cfg.activity.motion_pixel_threshold);
    read_int(ini, af, "motion_sample_rate",     cfg.activity.motion_sample_rate);

    const string ed = "event_detector";
    read_gate(ini, ed, "conf_threshold", cfg.detector.gate);
    read_int(ini, ed, "min_track_length",                cfg.detector.min_track_length);
    read_double(ini, ed, "min_event_duration_seconds",   cfg.detector.min_event_duration_seconds);
    read_double(ini, ed, "min_track_confidence_avg",     cfg.detector.min_track_confidence_avg);
    read_bool(ini, ed, "require_motion_for_event",       cfg.detector.require_motion_for_event);
    read_double(ini, ed, "min_track_movement_pixels",    cfg.detector.min_track_movement_pixels);

    auto gap = ini.get(ed, "max_gap_frames");
    if (gap && !gap->empty() && *gap != "auto") {
        int frames = 0;
        read_int(ini, ed, "max_gap_frames", frames);
        cfg.detector.max_gap_frames = frames;
    }

    read_int(ini, "pipeline", "workers", cfg.workers);
    return cfg;
}

PipelineConfig load_config(const string& path)
{
    IniFile ini;
    if (!ini.load(path))
        throw runtime_error("cannot open config file " + path);

    cout << "loading config from " << path << endl;
    PipelineConfig cfg = config_from_ini(ini);
    cfg.validate();
    return cfg;
}
