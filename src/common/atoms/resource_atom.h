#ifndef CATALYST_COMMON_ATOMS_RESOURCE_ATOM_H
#define CATALYST_COMMON_ATOMS_RESOURCE_ATOM_H

#include "core/types/atom.h"
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace catalyst {

// Fetches the resource named by a rendered locator. Runs off the driving
// thread; may block and may throw.
using ResourceFetcher = std::function<AtomResult(const std::string& locator, const Context& props)>;

// 渲染资源定位模板
// Renders an inja template such as "projects/{{ projectId }}/workflows/{{ workflowId }}"
// against `props`. Include statements are disabled. Throws std::runtime_error
// when a variable is missing or the template is malformed.
std::string render_locator(std::string_view locator_template, const Context& props);

// An atom that renders `locator_template` with the props it is invoked with
// and hands the locator to `fetcher` on a detached thread. `required` names the
// props the template reads; until they all hold values the atom stays absent.
// The template is parsed up front: a malformed one throws std::invalid_argument.
Atom make_resource_atom(std::string locator_template,
                        std::vector<std::string> required,
                        ResourceFetcher fetcher);

} // namespace catalyst

#endif // CATALYST_COMMON_ATOMS_RESOURCE_ATOM_H
