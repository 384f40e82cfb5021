#pragma once

#include <string>

#include <json/json.h>

namespace fastmarc {

class MarcReader;

// Summary of an open reader's index: record count, backend, scan outcome
// and record length statistics. The seek map is included on request.
Json::Value build_info_json(const MarcReader& reader, bool include_seek_map);

// Human-readable rendering of the same summary.
std::string format_info_text(const MarcReader& reader);

} // namespace fastmarc
