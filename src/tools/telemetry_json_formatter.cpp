#include "rowpool/tools/telemetry_json_formatter.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace {

void append_json_string(std::string& out, const std::string& text)
{
    out.push_back('"');
    for (unsigned char ch : text) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp)
{
    if (tp.time_since_epoch().count() == 0) {
        return {};
    }

    const auto time_value = std::chrono::system_clock::to_time_t(tp);
    std::tm buffer{};
#if defined(_WIN32)
    gmtime_s(&buffer, &time_value);
#else
    gmtime_r(&time_value, &buffer);
#endif

    std::ostringstream stream;
    stream << std::put_time(&buffer, "%Y-%m-%dT%H:%M:%S");
    const auto fractional = tp - std::chrono::system_clock::from_time_t(time_value);
    const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(fractional).count();
    stream << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
    return stream.str();
}

}  // namespace

namespace rowpool::tools {

std::string format_mutation_run_json(const MutationRunReport& report)
{
    std::string json;
    json.reserve(512U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    auto append_time_field = [&](const char* name, std::chrono::system_clock::time_point tp) {
        append_field(name);
        const auto text = format_timestamp_iso(tp);
        if (text.empty()) {
            json.append("null");
        } else {
            append_json_string(json, text);
        }
    };

    append_field("label");
    append_json_string(json, report.label);
    append_time_field("started_at", report.started_at);
    append_time_field("finished_at", report.finished_at);
    append_number_field("rows_attempted", report.rows_attempted);
    append_number_field("mem_buffer_keys", report.mem_buffer_keys);
    append_number_field("mem_buffer_bytes", report.mem_buffer_bytes);
    append_number_field("replication_log_bytes", report.replication_log_bytes);

    const auto& telemetry = report.telemetry;
    append_number_field("encode_acquisitions", telemetry.encode_acquisitions);
    append_number_field("check_acquisitions", telemetry.check_acquisitions);
    append_number_field("encode_reallocations", telemetry.encode_reallocations);
    append_number_field("check_reallocations", telemetry.check_reallocations);
    append_number_field("scratch_reallocations", telemetry.scratch_reallocations);
    append_number_field("rows_written", telemetry.rows_written);
    append_number_field("flagged_writes", telemetry.flagged_writes);
    append_number_field("encoded_bytes", telemetry.encoded_bytes);
    append_number_field("replication_log_rows", telemetry.replication_log_rows);
    append_number_field("encode_errors", telemetry.encode_errors);
    append_number_field("encode_errors_suppressed", telemetry.encode_errors_suppressed);
    append_number_field("store_failures", telemetry.store_failures);

    append_field("warnings");
    json.push_back('[');
    for (std::size_t i = 0; i < report.warnings.size(); ++i) {
        if (i > 0U) {
            json.push_back(',');
        }
        append_json_string(json, report.warnings[i]);
    }
    json.push_back(']');

    json.push_back('}');
    return json;
}

}  // namespace rowpool::tools
