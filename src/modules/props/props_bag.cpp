// modules/props/props_bag.cpp
#include "props/props_bag.h"
#include <algorithm>

namespace catalyst {

PropsBag merge_inputs(const PropsBag& carried, const Context& inputs,
                      const std::unordered_set<AtomKey>& atom_keys) {
    PropsBag merged;
    merged.reserve(carried.size() + inputs.size());
    for (const auto& [key, cell] : carried) {
        if (atom_keys.count(key) > 0) {
            merged.emplace(key, cell);
        }
    }
    if (!inputs.is_object()) {
        // Cannot merge non-object inputs
        return merged;
    }
    for (auto it = inputs.begin(); it != inputs.end(); ++it) {
        merged[it.key()] = ResolvedCell{it.value()};
    }
    return merged;
}

Context to_context(const PropsBag& props) {
    Context ctx = Context::object();
    for (const auto& [key, cell] : props) {
        if (auto value = resolved_value(cell)) {
            ctx[key] = std::move(*value);
        }
    }
    return ctx;
}

ValueCell settle(const ValueCell& cell) {
    const AtomFuture* future = nullptr;
    if (const auto* pending = std::get_if<PendingCell>(&cell)) {
        future = &pending->future;
    } else if (const auto* refreshing = std::get_if<RefreshingCell>(&cell)) {
        future = &refreshing->future;
    }
    if (!future) {
        return cell;
    }

    try {
        const AtomResult& result = future->get();
        if (!result.has_value()) {
            return AbsentCell{};
        }
        return ResolvedCell{*result};
    } catch (...) {
        // the failure becomes the cell's state; a failed refresh discards the previous value
        return FailedCell{AtomError::from_exception(std::current_exception())};
    }
}

PropsBag revert_to_settled(const PropsBag& props) {
    PropsBag reverted;
    reverted.reserve(props.size());
    for (const auto& [key, cell] : props) {
        if (const auto* refreshing = std::get_if<RefreshingCell>(&cell)) {
            reverted.emplace(key, ResolvedCell{refreshing->previous});
        } else if (!std::holds_alternative<PendingCell>(cell) && !is_failed(cell)) {
            reverted.emplace(key, cell);
        }
    }
    return reverted;
}

bool has_failures(const PropsBag& props) {
    return std::any_of(props.begin(), props.end(),
                       [](const auto& entry) { return is_failed(entry.second); });
}

std::vector<AtomKey> failed_keys(const PropsBag& props) {
    std::vector<AtomKey> keys;
    for (const auto& [key, cell] : props) {
        if (is_failed(cell)) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

bool has_required(const Context& props, const std::vector<std::string>& required) {
    for (const auto& name : required) {
        auto it = props.find(name);
        if (it == props.end() || it->is_null()) {
            return false;
        }
    }
    return true;
}

} // namespace catalyst
