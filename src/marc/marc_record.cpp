#include "marc/marc_record.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/length_prefix.hpp"

namespace fastmarc {

static const uint8_t* bytes(std::string_view s, size_t pos) {
    return reinterpret_cast<const uint8_t*>(s.data()) + pos;
}

[[noreturn]] static void malformed(const std::string& msg) {
    throw Error(ErrorKind::kMalformedRecord, msg);
}

bool MarcField::is_control_field() const {
    return tag.size() == 3 && tag[0] == '0' && tag[1] == '0' &&
           tag[2] >= '0' && tag[2] <= '9';
}

const std::string* MarcField::subfield(char code) const {
    for (const auto& sf : subfields) {
        if (sf.code == code) return &sf.value;
    }
    return nullptr;
}

std::vector<std::string> MarcField::subfield_values(char code) const {
    std::vector<std::string> out;
    for (const auto& sf : subfields) {
        if (sf.code == code) out.push_back(sf.value);
    }
    return out;
}

std::string MarcField::value() const {
    if (is_control_field()) return data;
    std::string out;
    for (const auto& sf : subfields) {
        if (!out.empty()) out += ' ';
        out += sf.value;
    }
    return out;
}

uint32_t MarcRecord::record_length() const {
    if (leader.size() < kLengthPrefixDigits) return 0;
    int64_t len = decode_length_prefix(bytes(leader, 0));
    return len < 0 ? 0 : static_cast<uint32_t>(len);
}

const MarcField* MarcRecord::first_field(std::string_view tag) const {
    for (const auto& f : fields) {
        if (f.tag == tag) return &f;
    }
    return nullptr;
}

std::vector<const MarcField*> MarcRecord::get_fields(std::string_view tag) const {
    std::vector<const MarcField*> out;
    for (const auto& f : fields) {
        if (f.tag == tag) out.push_back(&f);
    }
    return out;
}

std::string MarcRecord::title() const {
    const MarcField* f = first_field("245");
    if (!f) return {};
    std::string out;
    if (const std::string* a = f->subfield('a')) out = *a;
    if (const std::string* b = f->subfield('b')) {
        if (!out.empty()) out += ' ';
        out += *b;
    }
    return out;
}

static void parse_data_field(std::string_view body, MarcField& field) {
    // Indicators precede the first subfield delimiter; pad missing ones.
    size_t first = body.find(kSubfieldDelimiter);
    std::string_view ind = body.substr(0, first);
    if (ind.size() > 0) field.indicator1 = ind[0];
    if (ind.size() > 1) field.indicator2 = ind[1];
    if (first == std::string_view::npos) return;

    size_t pos = first + 1;
    while (pos <= body.size()) {
        size_t next = body.find(kSubfieldDelimiter, pos);
        std::string_view chunk = body.substr(pos, next == std::string_view::npos
                                                      ? std::string_view::npos
                                                      : next - pos);
        if (!chunk.empty())
            field.subfields.push_back({chunk[0], std::string(chunk.substr(1))});
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
}

MarcRecord parse_marc_record(std::string_view raw) {
    if (raw.size() < kLeaderLength)
        malformed("record shorter than leader (" + std::to_string(raw.size()) + " bytes)");

    int64_t declared = decode_length_prefix(bytes(raw, 0));
    if (declared < 0 || static_cast<uint64_t>(declared) != raw.size())
        malformed("leader length does not match record size " +
                  std::to_string(raw.size()));
    if (raw.back() != kRecordTerminator)
        malformed("missing record terminator");

    int64_t base = decode_decimal(bytes(raw, 12), 5);
    if (base <= 0)
        malformed("base address of data not found");
    if (static_cast<uint64_t>(base) >= raw.size() ||
        static_cast<size_t>(base) < kLeaderLength + 1)
        malformed("base address " + std::to_string(base) + " out of range");

    // Directory sits between the leader and the field terminator before base.
    if (raw[static_cast<size_t>(base) - 1] != kFieldTerminator)
        malformed("directory not terminated before base address " +
                  std::to_string(base));
    size_t dir_len = static_cast<size_t>(base) - 1 - kLeaderLength;
    if (dir_len % kDirectoryEntryLength != 0)
        malformed("directory length " + std::to_string(dir_len) +
                  " is not a multiple of 12");

    MarcRecord rec;
    rec.leader.assign(raw.data(), kLeaderLength);
    size_t num_entries = dir_len / kDirectoryEntryLength;
    rec.fields.reserve(num_entries);

    for (size_t e = 0; e < num_entries; e++) {
        size_t d = kLeaderLength + e * kDirectoryEntryLength;
        int64_t flen = decode_decimal(bytes(raw, d + 3), 4);
        int64_t fstart = decode_decimal(bytes(raw, d + 7), 5);
        if (flen <= 0 || fstart < 0)
            malformed("invalid directory entry " + std::to_string(e));

        uint64_t begin = static_cast<uint64_t>(base) + static_cast<uint64_t>(fstart);
        uint64_t end = begin + static_cast<uint64_t>(flen);
        if (end > raw.size())
            malformed("field " + std::string(raw.substr(d, 3)) +
                      " extends past end of record");
        if (raw[static_cast<size_t>(end) - 1] != kFieldTerminator)
            malformed("field " + std::string(raw.substr(d, 3)) +
                      " is not terminated");

        // Drop the field terminator
        std::string_view body = raw.substr(static_cast<size_t>(begin),
                                           static_cast<size_t>(flen) - 1);

        MarcField field;
        field.tag.assign(raw.data() + d, 3);
        if (field.is_control_field())
            field.data.assign(body.data(), body.size());
        else
            parse_data_field(body, field);
        rec.fields.push_back(std::move(field));
    }

    return rec;
}

} // namespace fastmarc
