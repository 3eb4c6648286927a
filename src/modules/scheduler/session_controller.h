// modules/scheduler/session_controller.h
#ifndef CATALYST_MODULES_SCHEDULER_SESSION_CONTROLLER_H
#define CATALYST_MODULES_SCHEDULER_SESSION_CONTROLLER_H

#include "core/types/atom.h"
#include "core/types/context.h"
#include "core/types/value_cell.h"
#include "common/config/session_config.h"
#include "executor/stage_executor.h"
#include "trace/trace_exporter.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_set>
#include <vector>

namespace catalyst {

// 整体状态
enum class SessionStatus : uint8_t {
    EXECUTING,
    INVALIDATING,
    ERROR,
    FINISHED
};

const char* to_string(SessionStatus status);

struct Observation {
    SessionStatus status;
    PropsBag props;
};

// SessionController 驱动 StageExecutor 反复执行整个 molecule
//
// Pull model: the embedding program calls advance() in a loop from a single
// driving thread and gets one observation per call. The first call only
// starts the session. After that every stage yields two observations, the
// in-flight one and the settled one; the settled observation of the last stage
// carries FINISHED, a stage with a failed cell carries ERROR.
//
// advance() blocks while a stage's fetches are outstanding, for the poll
// interval after FINISHED, and indefinitely after ERROR. The latter two waits
// end early when update_inputs() publishes a new inputs reference, or when
// release() is called; both are safe from any thread.
class SessionController {
public:
    explicit SessionController(Molecule molecule, SessionConfig config = {});
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Publishes `inputs` and returns the next observation, or std::nullopt
    // once the controller has been released.
    std::optional<Observation> advance(InputsRef inputs);
    // Same, with the last published inputs.
    std::optional<Observation> advance();

    // Publishes new inputs and wakes a poll or error wait.
    void update_inputs(InputsRef inputs);

    // Stops the session: wakes any waiter and makes advance() return
    // std::nullopt. Fetches already running are not interrupted.
    void release();

    bool released() const;

    // The accessors below read state owned by the driving thread. Call them
    // from that thread, or after it has been joined.
    SessionStatus status() const { return status_.load(); }
    uint64_t pass_count() const { return pass_count_; }
    const SessionConfig& config() const { return config_; }

    std::vector<TraceRecord> get_traces() const;
    nlohmann::json export_traces() const;

private:
    std::shared_ptr<const Molecule> molecule_;
    std::unordered_set<AtomKey> atom_keys_;
    SessionConfig config_;
    TraceExporter trace_exporter_;

    // driving thread only
    std::unique_ptr<StageExecutor> executor_;
    PropsBag carried_;        // bag the next pass is seeded with
    InputsRef pass_inputs_;   // inputs the current pass runs with
    bool started_ = false;
    uint64_t pass_count_ = 0;
    std::atomic<SessionStatus> status_{SessionStatus::EXECUTING};

    // shared with update_inputs() / release()
    mutable std::mutex mutex_;
    std::condition_variable inputs_changed_;
    InputsRef latest_inputs_;
    bool released_ = false;

    void start_pass();
    Observation run_segment();
    Observation invalidate(const InputsRef& inputs, bool keep_outputs);
    void drop_executor();
    void set_status(SessionStatus status);

    // Waits until the published inputs differ from the pass inputs or the
    // controller is released. Returns false on timeout.
    bool wait_for_new_inputs(std::optional<std::chrono::milliseconds> timeout);
    InputsRef published_inputs() const;
};

} // namespace catalyst

#endif // CATALYST_MODULES_SCHEDULER_SESSION_CONTROLLER_H
