// modules/trace/trace_exporter.cpp
#include "trace/trace_exporter.h"
#include <algorithm>

namespace catalyst {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

TraceExporter::TraceExporter(size_t max_records) : max_records_(max_records) {}

void TraceExporter::on_atom_start(uint64_t pass_id, size_t stage_index, const AtomKey& key, bool refresh) {
    TraceRecord record;
    record.pass_id = pass_id;
    record.stage_index = stage_index;
    record.key = key;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running"; // Placeholder, will be updated in on_atom_end
    record.refresh = refresh;
    push(std::move(record));
}

void TraceExporter::on_atom_end(
    uint64_t pass_id,
    const AtomKey& key,
    const std::string& status,
    const std::optional<std::string>& error_message) {

    // Find the corresponding start record
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&](const TraceRecord& r) {
                               return r.pass_id == pass_id && r.key == key && r.status == "running";
                           });

    if (it != traces_.rend()) {
        it->end_time = std::chrono::system_clock::now();
        it->status = status;
        it->error_message = error_message;
    }
}

void TraceExporter::on_atom_skipped(uint64_t pass_id, size_t stage_index, const AtomKey& key, const std::string& status) {
    TraceRecord record;
    record.pass_id = pass_id;
    record.stage_index = stage_index;
    record.key = key;
    record.start_time = std::chrono::system_clock::now();
    record.end_time = record.start_time;
    record.status = status;
    push(std::move(record));
}

void TraceExporter::on_pass_abandoned(uint64_t pass_id) {
    const auto now = std::chrono::system_clock::now();
    for (auto& record : traces_) {
        if (record.pass_id == pass_id && record.status == "running") {
            record.end_time = now;
            record.status = "abandoned";
        }
    }
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    return {traces_.begin(), traces_.end()};
}

void TraceExporter::clear_traces() {
    traces_.clear();
}

nlohmann::json TraceExporter::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& record : traces_) {
        nlohmann::json tj;
        tj["pass_id"] = record.pass_id;
        tj["stage"] = record.stage_index;
        tj["key"] = record.key;
        tj["status"] = record.status;
        tj["refresh"] = record.refresh;
        tj["start_ms"] = to_epoch_ms(record.start_time);
        if (record.status != "running") {
            tj["end_ms"] = to_epoch_ms(record.end_time);
        }
        if (record.error_message.has_value()) {
            tj["error"] = record.error_message.value();
        }
        out.push_back(std::move(tj));
    }
    return out;
}

void TraceExporter::push(TraceRecord record) {
    if (max_records_ == 0) {
        return;
    }
    while (traces_.size() >= max_records_) {
        traces_.pop_front();
    }
    traces_.push_back(std::move(record));
}

} // namespace catalyst
