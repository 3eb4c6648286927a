// modules/trace/trace_exporter.h
#ifndef CATALYST_MODULES_TRACE_TRACE_EXPORTER_H
#define CATALYST_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/atom.h" // 引入 AtomKey
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace catalyst {

struct TraceRecord {
    uint64_t pass_id = 0;
    size_t stage_index = 0;
    AtomKey key;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "running", "resolved", "absent", "failed", "skipped", "abandoned"
    std::optional<std::string> error_message;
    bool refresh = false; // invoked while a previous value was known
};

// One record per atom per pass, bounded FIFO.
class TraceExporter {
public:
    explicit TraceExporter(size_t max_records = 1024);

    void on_atom_start(uint64_t pass_id, size_t stage_index, const AtomKey& key, bool refresh);

    void on_atom_end(
        uint64_t pass_id,
        const AtomKey& key,
        const std::string& status,
        const std::optional<std::string>& error_message = std::nullopt
    );

    // The atom was not invoked at all ("absent" or "skipped").
    void on_atom_skipped(uint64_t pass_id, size_t stage_index, const AtomKey& key, const std::string& status);

    // Closes whatever the pass still has running.
    void on_pass_abandoned(uint64_t pass_id);

    std::vector<TraceRecord> get_traces() const;
    void clear_traces();
    size_t max_records() const { return max_records_; }

    nlohmann::json to_json() const;

private:
    std::deque<TraceRecord> traces_;
    size_t max_records_;

    void push(TraceRecord record);
};

} // namespace catalyst

#endif // CATALYST_MODULES_TRACE_TRACE_EXPORTER_H
