// modules/props/props_bag.h
#ifndef CATALYST_MODULES_PROPS_PROPS_BAG_H
#define CATALYST_MODULES_PROPS_PROPS_BAG_H

#include "core/types/context.h"
#include "core/types/value_cell.h"
#include <string>
#include <unordered_set>
#include <vector>

namespace catalyst {

// 合并外部输入与引擎产出的值
//
// Only cells owned by an atom survive from `carried`; every other key is a
// stale input and is dropped. Each input is then written over the result as a
// resolved cell, so an input always wins over an atom output of the same name.
PropsBag merge_inputs(const PropsBag& carried, const Context& inputs,
                      const std::unordered_set<AtomKey>& atom_keys);

// Plain view handed to atoms: only keys with a known value appear.
Context to_context(const PropsBag& props);

// Blocks until an in-flight cell completes and returns its settled form:
// resolved, absent (nothing fetched) or failed. Settled cells are returned as-is.
ValueCell settle(const ValueCell& cell);

// Drops everything an abandoned pass left in flight: refreshing cells fall
// back to their previous value, pending cells become absent. Failed cells are
// dropped too, so the restarted pass invokes those atoms again.
PropsBag revert_to_settled(const PropsBag& props);

bool has_failures(const PropsBag& props);
std::vector<AtomKey> failed_keys(const PropsBag& props);

// true when every name in `required` holds a non-null value in `props`
bool has_required(const Context& props, const std::vector<std::string>& required);

} // namespace catalyst

#endif // CATALYST_MODULES_PROPS_PROPS_BAG_H
