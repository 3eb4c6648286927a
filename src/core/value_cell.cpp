// core/value_cell.cpp
#include "core/types/value_cell.h"
#include <stdexcept>

namespace catalyst {

AtomError AtomError::from_exception(std::exception_ptr error) {
    AtomError result;
    result.exception = error;
    if (!error) {
        result.message = "unknown atom failure";
        return result;
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        result.message = e.what();
    } catch (...) {
        // non-std payload: the exception_ptr still carries it
        result.message = "unknown atom failure";
    }
    return result;
}

void AtomError::rethrow() const {
    if (exception) {
        std::rethrow_exception(exception);
    }
    throw std::runtime_error(message);
}

CellState state_of(const ValueCell& cell) {
    return static_cast<CellState>(cell.index());
}

const char* to_string(CellState state) {
    switch (state) {
        case CellState::ABSENT:     return "absent";
        case CellState::PENDING:    return "pending";
        case CellState::REFRESHING: return "refreshing";
        case CellState::RESOLVED:   return "resolved";
        case CellState::FAILED:     return "failed";
    }
    return "unknown";
}

bool is_absent(const ValueCell& cell) {
    return std::holds_alternative<AbsentCell>(cell);
}

bool is_pending(const ValueCell& cell) {
    return std::holds_alternative<PendingCell>(cell) || std::holds_alternative<RefreshingCell>(cell);
}

bool is_refreshing(const ValueCell& cell) {
    return std::holds_alternative<RefreshingCell>(cell);
}

bool is_resolved(const ValueCell& cell) {
    return std::holds_alternative<ResolvedCell>(cell) || std::holds_alternative<RefreshingCell>(cell);
}

bool is_failed(const ValueCell& cell) {
    return std::holds_alternative<FailedCell>(cell);
}

std::optional<Value> resolved_value(const ValueCell& cell) {
    if (const auto* refreshing = std::get_if<RefreshingCell>(&cell)) {
        return refreshing->previous;
    }
    if (const auto* resolved = std::get_if<ResolvedCell>(&cell)) {
        return resolved->value;
    }
    return std::nullopt;
}

const ValueCell* find_cell(const PropsBag& props, const AtomKey& key) {
    auto it = props.find(key);
    return (it != props.end()) ? &it->second : nullptr;
}

std::optional<Value> resolved_value(const PropsBag& props, const AtomKey& key) {
    const ValueCell* cell = find_cell(props, key);
    return cell ? resolved_value(*cell) : std::nullopt;
}

const AtomError* find_error(const PropsBag& props, const AtomKey& key) {
    const ValueCell* cell = find_cell(props, key);
    if (!cell) return nullptr;
    const auto* failed = std::get_if<FailedCell>(cell);
    return failed ? &failed->error : nullptr;
}

nlohmann::json to_json(const ValueCell& cell) {
    nlohmann::json out;
    out["state"] = to_string(state_of(cell));
    if (const auto* refreshing = std::get_if<RefreshingCell>(&cell)) {
        out["previous"] = refreshing->previous;
    } else if (const auto* resolved = std::get_if<ResolvedCell>(&cell)) {
        out["value"] = resolved->value;
    } else if (const auto* failed = std::get_if<FailedCell>(&cell)) {
        out["error"] = failed->error.message;
    }
    return out;
}

nlohmann::json to_json(const PropsBag& props) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, cell] : props) {
        out[key] = to_json(cell);
    }
    return out;
}

} // namespace catalyst
