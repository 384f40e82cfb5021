#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fastmarc {

struct Subfield {
    char code;
    std::string value;
};

// One variable field. Control fields (tags 001-009) carry data only;
// data fields carry two indicators and a list of subfields.
struct MarcField {
    std::string tag;
    std::string data;  // control fields only
    char indicator1 = ' ';
    char indicator2 = ' ';
    std::vector<Subfield> subfields;

    bool is_control_field() const;

    // First value of subfield code, or nullptr.
    const std::string* subfield(char code) const;
    std::vector<std::string> subfield_values(char code) const;

    // Control data, or the subfield values joined by a space.
    std::string value() const;
};

struct MarcRecord {
    std::string leader;
    std::vector<MarcField> fields;

    uint32_t record_length() const;
    char record_status() const { return leader.size() > 5 ? leader[5] : ' '; }
    char record_type() const { return leader.size() > 6 ? leader[6] : ' '; }

    const MarcField* first_field(std::string_view tag) const;
    std::vector<const MarcField*> get_fields(std::string_view tag) const;

    // 245 $a and $b joined by a space; empty if there is no 245.
    std::string title() const;
};

// Decode one ISO 2709 record (leader, directory, fields). Bytes are kept
// as-is; no character set conversion is applied.
// Throws Error(kMalformedRecord) on any structural inconsistency.
MarcRecord parse_marc_record(std::string_view raw);

} // namespace fastmarc
