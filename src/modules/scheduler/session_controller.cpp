// modules/scheduler/session_controller.cpp
#include "scheduler/session_controller.h"
#include "props/props_bag.h"
#include <iostream>
#include <stdexcept>

namespace catalyst {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::EXECUTING:    return "executing";
        case SessionStatus::INVALIDATING: return "invalidating";
        case SessionStatus::ERROR:        return "error";
        case SessionStatus::FINISHED:     return "finished";
    }
    return "unknown";
}

SessionController::SessionController(Molecule molecule, SessionConfig config)
    : molecule_(std::make_shared<const Molecule>(std::move(molecule))),
      config_(std::move(config)),
      trace_exporter_(config_.max_trace_records) {
    if (molecule_->empty()) {
        throw std::invalid_argument("Molecule has no atom groups");
    }
    for (const auto& group : *molecule_) {
        for (const auto& [key, atom] : group) {
            if (!atom_keys_.insert(key).second) {
                throw std::invalid_argument("Atom '" + key + "' appears in more than one group");
            }
        }
    }
}

SessionController::~SessionController() {
    release();
    drop_executor();
}

std::optional<Observation> SessionController::advance(InputsRef inputs) {
    update_inputs(std::move(inputs));
    return advance();
}

std::optional<Observation> SessionController::advance() {
    if (released()) {
        drop_executor();
        return std::nullopt;
    }
    InputsRef inputs = published_inputs();
    if (!inputs) {
        throw std::logic_error("advance() called before any inputs were published");
    }

    if (!started_) {
        // the first call only starts the session
        started_ = true;
        pass_inputs_ = inputs;
        start_pass();
        return Observation{SessionStatus::EXECUTING, merge_inputs(carried_, *inputs, atom_keys_)};
    }

    switch (status_.load()) {
        case SessionStatus::EXECUTING:
            if (inputs != pass_inputs_) {
                return invalidate(inputs, true);
            }
            return run_segment();

        case SessionStatus::INVALIDATING:
            pass_inputs_ = inputs;
            set_status(SessionStatus::EXECUTING);
            start_pass();
            return run_segment();

        case SessionStatus::ERROR:
            // latched until the inputs change
            if (inputs == pass_inputs_) {
                wait_for_new_inputs(std::nullopt);
                if (released()) {
                    return std::nullopt;
                }
                inputs = published_inputs();
            }
            return invalidate(inputs, false);

        case SessionStatus::FINISHED:
            // poll: wait out the interval unless the inputs change first
            if (inputs == pass_inputs_) {
                wait_for_new_inputs(config_.poll_interval);
                if (released()) {
                    return std::nullopt;
                }
                inputs = published_inputs();
            }
            pass_inputs_ = inputs;
            set_status(SessionStatus::EXECUTING);
            start_pass();
            return run_segment();
    }
    throw std::logic_error("Unknown session status");
}

void SessionController::update_inputs(InputsRef inputs) {
    if (!inputs) {
        throw std::invalid_argument("Inputs reference must not be null");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latest_inputs_ = std::move(inputs);
    }
    inputs_changed_.notify_all();
}

void SessionController::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
    }
    inputs_changed_.notify_all();
}

bool SessionController::released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

std::vector<TraceRecord> SessionController::get_traces() const {
    return trace_exporter_.get_traces();
}

nlohmann::json SessionController::export_traces() const {
    return trace_exporter_.to_json();
}

void SessionController::start_pass() {
    ++pass_count_;
    executor_ = std::make_unique<StageExecutor>(
        molecule_,
        carried_,
        config_.trace_enabled ? &trace_exporter_ : nullptr,
        pass_count_);
}

Observation SessionController::run_segment() {
    auto step = executor_->advance(*pass_inputs_);
    if (!step.has_value()) {
        throw std::logic_error("Stage executor advanced past the end of its pass");
    }

    switch (step->outcome) {
        case StageExecutor::Outcome::RUNNING:
            break;
        case StageExecutor::Outcome::FAILED:
            if (config_.verbose) {
                std::clog << "[catalyst] pass " << pass_count_ << " halted at stage "
                          << step->stage_index << ", failed:";
                for (const auto& key : failed_keys(step->props)) {
                    std::clog << " " << key;
                }
                std::clog << std::endl;
            }
            carried_ = step->props;
            drop_executor();
            set_status(SessionStatus::ERROR);
            break;
        case StageExecutor::Outcome::COMPLETED:
            carried_ = step->props;
            drop_executor();
            set_status(SessionStatus::FINISHED);
            break;
    }
    return Observation{status_.load(), std::move(step->props)};
}

Observation SessionController::invalidate(const InputsRef& inputs, bool keep_outputs) {
    if (!keep_outputs) {
        // restart out of ERROR: every engine output is dropped so failed atoms run again
        carried_.clear();
    } else if (executor_) {
        carried_ = revert_to_settled(executor_->props());
    }
    drop_executor();
    set_status(SessionStatus::INVALIDATING);
    return Observation{SessionStatus::INVALIDATING, merge_inputs(carried_, *inputs, atom_keys_)};
}

void SessionController::drop_executor() {
    if (executor_) {
        executor_->abandon();
        executor_.reset();
    }
}

void SessionController::set_status(SessionStatus status) {
    SessionStatus previous = status_.exchange(status);
    if (config_.verbose && previous != status) {
        std::clog << "[catalyst] pass " << pass_count_ << ": "
                  << to_string(previous) << " -> " << to_string(status) << std::endl;
    }
}

bool SessionController::wait_for_new_inputs(std::optional<std::chrono::milliseconds> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return released_ || latest_inputs_ != pass_inputs_; };
    if (timeout.has_value()) {
        return inputs_changed_.wait_for(lock, *timeout, ready);
    }
    inputs_changed_.wait(lock, ready);
    return true;
}

InputsRef SessionController::published_inputs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_inputs_;
}

} // namespace catalyst
