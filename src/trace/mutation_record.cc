#include "mutation_record.h"

#include <cstdio>
#include <sstream>

namespace Meshwork {

namespace {

void AppendEscaped(std::ostringstream& out, const std::string& s) {
    out << '"';
    for (unsigned char c : s) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out << buf;
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

void AppendMap(std::ostringstream& out, const absl::btree_map<std::string, std::string>& m) {
    out << '{';
    bool first = true;
    for (const auto& [key, value] : m) {
        if (!first) out << ',';
        first = false;
        AppendEscaped(out, key);
        out << ':';
        AppendEscaped(out, value);
    }
    out << '}';
}

} // namespace

const char* RecordKindName(RecordKind kind) {
    switch (kind) {
        case RecordKind::kExecution: return "execution";
        case RecordKind::kEvaluation: return "evaluation";
        case RecordKind::kSecurity: return "security";
    }
    return "unknown";
}

const char* OutcomeName(Outcome outcome) {
    switch (outcome) {
        case Outcome::kSuccess: return "Success";
        case Outcome::kFailed: return "Failed";
        case Outcome::kSuppressed: return "Suppressed";
        case Outcome::kQuarantined: return "Quarantined";
        case Outcome::kDeferred: return "Deferred";
        case Outcome::kNoOp: return "NoOp";
    }
    return "Unknown";
}

std::string ToJsonLine(const MutationRecord& record) {
    std::ostringstream out;
    out << "{\"seq\":" << record.sequence
        << ",\"kind\":\"" << RecordKindName(record.kind) << '"'
        << ",\"unit_id\":" << record.unit_id
        << ",\"unit\":";
    AppendEscaped(out, record.unit_name);
    out << ",\"snapshot_id\":" << record.snapshot_id
        << ",\"cycle_id\":" << record.cycle_id
        << ",\"keys_changed\":[";
    for (size_t i = 0; i < record.keys_changed.size(); ++i) {
        if (i > 0) out << ',';
        AppendEscaped(out, record.keys_changed[i]);
    }
    out << "],\"before\":";
    AppendMap(out, record.before);
    out << ",\"after\":";
    AppendMap(out, record.after);
    out << ",\"started_at_us\":" << ToMicros(record.started_at)
        << ",\"finished_at_us\":" << ToMicros(record.finished_at)
        << ",\"outcome\":\"" << OutcomeName(record.outcome) << '"'
        << ",\"error\":\"" << MeshErrorName(record.error) << '"'
        << ",\"detail\":";
    AppendEscaped(out, record.detail);
    out << '}';
    return out.str();
}

} // namespace Meshwork
