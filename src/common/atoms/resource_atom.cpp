// common/atoms/resource_atom.cpp
#include "common/atoms/resource_atom.h"
#include "common/atoms/launch.h"
#include <inja/inja.hpp>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace catalyst {

namespace {

void configure_environment(inja::Environment& env) {
    env.set_expression("{{", "}}");
    env.set_statement("{%", "%}");
    env.set_comment("{#", "#}");
    // a locator never pulls in other files
    env.set_include_callback([](const std::filesystem::path&, const std::string& name) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled in locator templates: " + name,
                              inja::SourceLocation{});
    });
}

} // namespace

std::string render_locator(std::string_view locator_template, const Context& props) {
    inja::Environment env;
    configure_environment(env);
    try {
        return env.render(locator_template, props);
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Locator render error: " + std::string(e.message));
    }
}

Atom make_resource_atom(std::string locator_template,
                        std::vector<std::string> required,
                        ResourceFetcher fetcher) {
    if (!fetcher) {
        throw std::invalid_argument("Resource atom '" + locator_template + "' has no fetcher");
    }

    auto env = std::make_shared<inja::Environment>();
    configure_environment(*env);

    std::shared_ptr<const inja::Template> parsed;
    try {
        parsed = std::make_shared<const inja::Template>(env->parse(locator_template));
    } catch (const inja::InjaError& e) {
        throw std::invalid_argument("Malformed locator template '" + locator_template + "': " + e.message);
    }

    return Atom(
        [env, parsed, fetcher = std::move(fetcher)](const Context& props) -> AtomFuture {
            std::string locator;
            try {
                locator = env->render(*parsed, props);
            } catch (const inja::InjaError& e) {
                throw std::runtime_error("Locator render error: " + std::string(e.message));
            }
            return launch_atom(
                [fetcher, locator = std::move(locator)](const Context& p) { return fetcher(locator, p); },
                props);
        },
        std::move(required));
}

} // namespace catalyst
