#ifndef CATALYST_TYPES_VALUE_CELL_H
#define CATALYST_TYPES_VALUE_CELL_H

#include "atom.h"
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace catalyst {

// Failure of an atom's operation. The original exception is kept so callers
// can rethrow and inspect it.
struct AtomError {
    std::string message;
    std::exception_ptr exception;

    static AtomError from_exception(std::exception_ptr error);
    [[noreturn]] void rethrow() const;
};

// 单个 atom 结果的五种状态
struct AbsentCell {};

struct PendingCell {
    AtomFuture future;
};

struct RefreshingCell {
    AtomFuture future;
    Value previous;
};

struct ResolvedCell {
    Value value;
};

struct FailedCell {
    AtomError error;
};

using ValueCell = std::variant<AbsentCell, PendingCell, RefreshingCell, ResolvedCell, FailedCell>;

// Inputs and atom outputs side by side, keyed by name.
using PropsBag = std::unordered_map<AtomKey, ValueCell>;

enum class CellState : uint8_t {
    ABSENT,
    PENDING,
    REFRESHING,
    RESOLVED,
    FAILED
};

CellState state_of(const ValueCell& cell);
const char* to_string(CellState state);

bool is_absent(const ValueCell& cell);
// true while a fetch is outstanding, refreshing included
bool is_pending(const ValueCell& cell);
bool is_refreshing(const ValueCell& cell);
// true once a value is known, refreshing included
bool is_resolved(const ValueCell& cell);
bool is_failed(const ValueCell& cell);

// Best known value: the previous one while refreshing, the settled one once
// resolved, nothing otherwise.
std::optional<Value> resolved_value(const ValueCell& cell);

// Bag lookups; a missing key reads as absent.
const ValueCell* find_cell(const PropsBag& props, const AtomKey& key);
std::optional<Value> resolved_value(const PropsBag& props, const AtomKey& key);
const AtomError* find_error(const PropsBag& props, const AtomKey& key);

nlohmann::json to_json(const ValueCell& cell);
nlohmann::json to_json(const PropsBag& props);

} // namespace catalyst

#endif // CATALYST_TYPES_VALUE_CELL_H
