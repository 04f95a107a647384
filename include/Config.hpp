#pragma once
#include "ActivityFilter.hpp"
#include "TrackSegmenter.hpp"
#include <iosfwd>
#include <map>
#include <optional>
#include <string>

/** `[section]` / `key = value` file, `#` and `;` start comments. */
class IniFile
{
public:
    /** Returns false when the file cannot be opened. */
    bool load(const std::string& path);
    void parse(std::istream& in);

    std::optional<std::string> get(const std::string& section, const std::string& key) const;
    bool has_section(const std::string& section) const;

private:
    std::map<std::string, std::map<std::string, std::string>> sections_;
};

struct PipelineConfig
{
    ActivityConfig  activity;
    SegmenterConfig detector;
    int             workers = 1;

    /** Throws std::invalid_argument on the first inconsistent field. */
    void validate() const;
};

/** Typed view of an ini file; keys left out keep their struct defaults. */
PipelineConfig config_from_ini(const IniFile& ini);

/** Reads, types and validates `path`. Throws std::runtime_error if unreadable. */
PipelineConfig load_config(const std::string& path);
