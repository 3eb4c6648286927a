// modules/executor/stage_executor.h
#ifndef CATALYST_MODULES_EXECUTOR_STAGE_EXECUTOR_H
#define CATALYST_MODULES_EXECUTOR_STAGE_EXECUTOR_H

#include "core/types/atom.h"
#include "core/types/context.h"
#include "core/types/value_cell.h"
#include "trace/trace_exporter.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_set>
#include <vector>

namespace catalyst {

// StageExecutor 负责一次完整的遍历 (pass)
//
// Each stage takes two calls to advance(): the first dispatches the stage's
// atoms and returns the in-flight snapshot, the second waits for all of them
// and returns the settled snapshot. A failed cell ends the pass after its
// stage; no later stage is dispatched.
class StageExecutor {
public:
    enum class Phase : uint8_t {
        IN_FLIGHT,
        SETTLED
    };

    enum class Outcome : uint8_t {
        RUNNING,   // more stages to go
        FAILED,    // a cell of this stage failed, pass halted
        COMPLETED  // last stage settled without failure
    };

    struct Step {
        Phase phase;
        size_t stage_index;
        Outcome outcome;
        PropsBag props;
    };

    // `trace` may be null; when set it must outlive the executor.
    StageExecutor(std::shared_ptr<const Molecule> molecule,
                  PropsBag seed,
                  TraceExporter* trace = nullptr,
                  uint64_t pass_id = 0);

    // Runs the next segment with the caller's latest inputs merged over the
    // carried outputs. Returns std::nullopt once the pass is over.
    std::optional<Step> advance(const Context& inputs);

    // Stop observing the pass. Outstanding operations keep running; their
    // results are never read.
    void abandon();

    bool done() const { return done_; }
    size_t stage_index() const { return stage_index_; }
    uint64_t pass_id() const { return pass_id_; }
    const PropsBag& props() const { return props_; }

private:
    std::shared_ptr<const Molecule> molecule_;
    std::unordered_set<AtomKey> atom_keys_;
    PropsBag props_;
    TraceExporter* trace_;
    uint64_t pass_id_;

    size_t stage_index_ = 0;
    Phase next_phase_ = Phase::IN_FLIGHT;
    bool done_ = false;
    std::vector<AtomKey> in_flight_; // keys dispatched by the current stage

    void settle_carry_over(const AtomGroup& group);
    void dispatch(const AtomGroup& group, const Context& inputs);
    void await_settlement();
    bool stage_failed(const AtomGroup& group) const;
};

} // namespace catalyst

#endif // CATALYST_MODULES_EXECUTOR_STAGE_EXECUTOR_H
