#include "ecs_logger/formatters/ecs_formatter.hpp"
#include "ecs_logger/ecs_fields.hpp"
#include "ecs_logger/source_location.hpp"
#include "ecs_logger/timestamp.hpp"
#include <string>
#include <string_view>
#include <utility>

namespace {

// U+FFFD
constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

void append_key(std::string& out, std::string_view key) {
    out += '"';
    out += key;
    out += "\":";
}

void append_string(std::string& out, std::string_view value) {
    out += '"';
    ecs_logger::EcsFormatter::AppendEscaped(value, out);
    out += '"';
}

// Length of the well-formed UTF-8 sequence at src[pos], or 0 when ill-formed.
// For an ill-formed sequence bad_len receives the length of its maximal subpart.
size_t utf8_sequence_length(std::string_view src, size_t pos, size_t& bad_len) {
    unsigned char lead = static_cast<unsigned char>(src[pos]);
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    size_t len = 0;
    if (lead >= 0xC2 && lead <= 0xDF) {
        len = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        len = 3;
        if (lead == 0xE0) lo = 0xA0;       // overlong
        else if (lead == 0xED) hi = 0x9F;  // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        len = 4;
        if (lead == 0xF0) lo = 0x90;       // overlong
        else if (lead == 0xF4) hi = 0x8F;  // > U+10FFFF
    } else {
        bad_len = 1;
        return 0;
    }
    for (size_t k = 1; k < len; ++k) {
        if (pos + k >= src.size()) {
            bad_len = k;
            return 0;
        }
        unsigned char c = static_cast<unsigned char>(src[pos + k]);
        if (c < lo || c > hi) {
            bad_len = k;
            return 0;
        }
        lo = 0x80;
        hi = 0xBF;
    }
    return len;
}

} // namespace

ecs_logger::EcsFormatter::EcsFormatter(std::shared_ptr<const ExtraFieldsStore> extra_fields)
    : extra_fields_(std::move(extra_fields)) {
}

void ecs_logger::EcsFormatter::AppendEscaped(std::string_view src, std::string& out) {
    const char* hex_digits = "0123456789abcdef";
    size_t i = 0;
    while (i < src.size()) {
        unsigned char c = static_cast<unsigned char>(src[i]);
        if (c >= 0x80) {
            size_t bad_len = 0;
            size_t len = utf8_sequence_length(src, i, bad_len);
            if (len > 0) {
                out.append(src.data() + i, len);
                i += len;
            } else {
                out += kReplacementCharacter;
                i += bad_len;
            }
            continue;
        }
        ++i;
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (c <= 0x1F) {
                    out += "\\u00";
                    out += hex_digits[(c >> 4) & 0x0F];
                    out += hex_digits[c & 0x0F];
                } else {
                    out += static_cast<char>(c);
                }
                break;
        }
    }
}

size_t ecs_logger::EcsFormatter::Format(const LogRecord& record, std::string& out) const {
    const size_t start = out.size();
    char tmp[kRfc3339NsBufferSize];

    out += '{';

    append_key(out, ecs::kTimestamp);
    out += '"';
    size_t ts_len = format_rfc3339_ns(record.wall_clock_ns, tmp, sizeof(tmp));
    out.append(tmp, ts_len);
    out += "\",";

    append_key(out, ecs::kLogLevel);
    append_string(out, to_string(record.level));
    out += ',';

    append_key(out, ecs::kMessage);
    append_string(out, record.message);
    out += ',';

    append_key(out, ecs::kEcsVersion);
    append_string(out, ecs::kVersion);
    out += ',';

    // log.origin
    append_key(out, ecs::kLogOrigin);
    out += '{';

    append_key(out, ecs::kOriginFile);
    out += '{';
    if (record.line) {
        append_key(out, ecs::kOriginLine);
        out += std::to_string(*record.line);
    }
    if (record.file_path) {
        if (record.line) {
            out += ',';
        }
        append_key(out, ecs::kOriginName);
        append_string(out, SourceLocation::extract_filename(*record.file_path));
    }
    out += "},";

    append_key(out, ecs::kOriginLanguage);
    out += '{';
    append_key(out, ecs::kOriginTarget);
    append_string(out, record.target);
    if (record.module_path) {
        out += ',';
        append_key(out, ecs::kOriginModule);
        append_string(out, *record.module_path);
    }
    if (record.file_path) {
        out += ',';
        append_key(out, ecs::kOriginFilePath);
        append_string(out, *record.file_path);
    }
    out += "}}";

    if (extra_fields_) {
        auto extra = extra_fields_->Snapshot();
        if (extra && !extra->members.empty()) {
            out += ',';
            out += extra->members;
        }
    }

    out += '}';
    return out.size() - start;
}
