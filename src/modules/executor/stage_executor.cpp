// modules/executor/stage_executor.cpp
#include "executor/stage_executor.h"
#include "props/props_bag.h"
#include <stdexcept>

namespace catalyst {

StageExecutor::StageExecutor(std::shared_ptr<const Molecule> molecule,
                             PropsBag seed,
                             TraceExporter* trace,
                             uint64_t pass_id)
    : molecule_(std::move(molecule)),
      props_(std::move(seed)),
      trace_(trace),
      pass_id_(pass_id) {
    if (!molecule_) {
        throw std::invalid_argument("StageExecutor requires a molecule");
    }
    for (const auto& group : *molecule_) {
        for (const auto& [key, atom] : group) {
            if (!atom.fetch) {
                throw std::invalid_argument("Atom '" + key + "' has no fetch function");
            }
            atom_keys_.insert(key);
        }
    }
    done_ = molecule_->empty();
}

std::optional<StageExecutor::Step> StageExecutor::advance(const Context& inputs) {
    if (done_) {
        return std::nullopt;
    }

    const AtomGroup& group = (*molecule_)[stage_index_];
    props_ = merge_inputs(props_, inputs, atom_keys_);

    Step step;
    step.stage_index = stage_index_;
    step.outcome = Outcome::RUNNING;

    if (next_phase_ == Phase::IN_FLIGHT) {
        // 1. 先结算上一阶段遗留的 refreshing 值  2. 再并行派发本阶段的 atom
        settle_carry_over(group);
        dispatch(group, inputs);
        next_phase_ = Phase::SETTLED;
        step.phase = Phase::IN_FLIGHT;
        step.props = props_;
        return step;
    }

    await_settlement();
    step.phase = Phase::SETTLED;

    if (stage_failed(group)) {
        step.outcome = Outcome::FAILED;
        done_ = true;
    } else if (stage_index_ + 1 == molecule_->size()) {
        step.outcome = Outcome::COMPLETED;
        done_ = true;
    } else {
        ++stage_index_;
        next_phase_ = Phase::IN_FLIGHT;
    }
    step.props = props_;
    return step;
}

void StageExecutor::abandon() {
    if (trace_ && !in_flight_.empty()) {
        trace_->on_pass_abandoned(pass_id_);
    }
    in_flight_.clear();
    done_ = true;
}

void StageExecutor::settle_carry_over(const AtomGroup& group) {
    for (auto& [key, cell] : props_) {
        if (group.count(key) > 0) {
            continue;
        }
        // Pending without a previous value is left alone
        if (is_refreshing(cell)) {
            cell = settle(cell);
        }
    }
}

void StageExecutor::dispatch(const AtomGroup& group, const Context& inputs) {
    in_flight_.clear();
    const Context plain = to_context(props_);

    for (const auto& [key, atom] : group) {
        if (inputs.is_object() && inputs.contains(key)) {
            // supplied by the caller, nothing to fetch
            continue;
        }

        auto it = props_.find(key);
        if (it != props_.end() && is_failed(it->second)) {
            // don't re-execute an atom that already failed
            if (trace_) trace_->on_atom_skipped(pass_id_, stage_index_, key, "skipped");
            continue;
        }

        if (!has_required(plain, atom.required)) {
            props_[key] = AbsentCell{};
            if (trace_) trace_->on_atom_skipped(pass_id_, stage_index_, key, "absent");
            continue;
        }

        std::optional<Value> previous;
        if (it != props_.end()) {
            if (const auto* resolved = std::get_if<ResolvedCell>(&it->second)) {
                previous = resolved->value;
            } else if (const auto* refreshing = std::get_if<RefreshingCell>(&it->second)) {
                previous = refreshing->previous;
            }
        }

        if (trace_) trace_->on_atom_start(pass_id_, stage_index_, key, previous.has_value());

        AtomFuture future;
        try {
            future = atom.fetch(plain);
        } catch (...) {
            AtomError error = AtomError::from_exception(std::current_exception());
            if (trace_) trace_->on_atom_end(pass_id_, key, "failed", error.message);
            props_[key] = FailedCell{std::move(error)};
            continue;
        }

        if (!future.valid()) {
            AtomError error = AtomError::from_exception(std::make_exception_ptr(
                std::runtime_error("Atom '" + key + "' returned an empty future")));
            if (trace_) trace_->on_atom_end(pass_id_, key, "failed", error.message);
            props_[key] = FailedCell{std::move(error)};
            continue;
        }

        if (previous.has_value()) {
            props_[key] = RefreshingCell{std::move(future), std::move(*previous)};
        } else {
            props_[key] = PendingCell{std::move(future)};
        }
        in_flight_.push_back(key);
    }
}

void StageExecutor::await_settlement() {
    for (const auto& key : in_flight_) {
        auto it = props_.find(key);
        if (it == props_.end() || !is_pending(it->second)) {
            // overwritten by a caller input since dispatch
            if (trace_) trace_->on_atom_end(pass_id_, key, "abandoned");
            continue;
        }

        it->second = settle(it->second);

        if (trace_) {
            if (const AtomError* error = find_error(props_, key)) {
                trace_->on_atom_end(pass_id_, key, "failed", error->message);
            } else {
                trace_->on_atom_end(pass_id_, key, is_absent(it->second) ? "absent" : "resolved");
            }
        }
    }
    in_flight_.clear();
}

bool StageExecutor::stage_failed(const AtomGroup& group) const {
    for (const auto& [key, atom] : group) {
        const ValueCell* cell = find_cell(props_, key);
        if (cell && is_failed(*cell)) {
            return true;
        }
    }
    return false;
}

} // namespace catalyst
