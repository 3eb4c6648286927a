#ifndef CATALYST_TYPES_ATOM_H
#define CATALYST_TYPES_ATOM_H

#include "context.h"
#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace catalyst {

using AtomKey = std::string; // e.g., "designWorkflow"

// std::nullopt means the atom had nothing to fetch.
using AtomResult = std::optional<Value>;
using AtomFuture = std::shared_future<AtomResult>;
using AtomFunction = std::function<AtomFuture(const Context&)>;

// A single named fetch. `required` lists the props that must hold a value
// before the atom is worth invoking; otherwise the cell stays absent.
struct Atom {
    AtomFunction fetch;
    std::vector<std::string> required;

    Atom() = default;

    Atom(AtomFunction func, std::vector<std::string> required_props = {})
        : fetch(std::move(func)), required(std::move(required_props)) {}
};

// Atoms of one group are independent and run concurrently.
using AtomGroup = std::unordered_map<AtomKey, Atom>;

// Ordered groups; group i+1 may read anything produced by groups 0..i.
using Molecule = std::vector<AtomGroup>;

inline AtomFuture make_ready_future(AtomResult result) {
    std::promise<AtomResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

inline AtomFuture make_failed_future(std::exception_ptr error) {
    std::promise<AtomResult> promise;
    promise.set_exception(std::move(error));
    return promise.get_future().share();
}

} // namespace catalyst

#endif // CATALYST_TYPES_ATOM_H
