#ifndef CATALYST_COMMON_ATOMS_LAUNCH_H
#define CATALYST_COMMON_ATOMS_LAUNCH_H

#include "core/types/atom.h"
#include <future>
#include <memory>
#include <thread>
#include <utility>

namespace catalyst {

// Runs a blocking fetch `func(props)` on a detached thread.
//
// The future is backed by a std::promise rather than std::async, so dropping
// the last reference never blocks: an abandoned pass can release its futures
// while the fetch is still running. Exceptions land in the future.
template <typename Func>
AtomFuture launch_atom(Func&& func, Context props) {
    auto promise = std::make_shared<std::promise<AtomResult>>();
    AtomFuture future = promise->get_future().share();

    std::thread([promise, func = std::forward<Func>(func), props = std::move(props)]() mutable {
        try {
            promise->set_value(AtomResult(func(props)));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    return future;
}

// Wraps a blocking `Context -> AtomResult` function into an Atom that
// launches it per invocation.
template <typename Func>
Atom make_async_atom(Func func, std::vector<std::string> required = {}) {
    return Atom(
        [func = std::move(func)](const Context& props) -> AtomFuture {
            return launch_atom(func, props);
        },
        std::move(required));
}

} // namespace catalyst

#endif // CATALYST_COMMON_ATOMS_LAUNCH_H
