// main.cpp
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>
#include "catalyst/catalyst.h"

using namespace catalyst;

namespace {

// Stand-in for a remote store: answers after a short delay.
AtomResult fake_fetch(const std::string& locator, const Context& props) {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    if (locator.find("missing") != std::string::npos) {
        throw std::runtime_error("404 Not Found: " + locator);
    }
    return nlohmann::json{{"locator", locator}, {"project", props.value("projectId", "")}};
}

// A workflow first, then its design space and predictor in parallel.
Molecule workflow_molecule() {
    return {
        {
            {"designWorkflow", make_resource_atom(
                "projects/{{ projectId }}/workflows/{{ workflowId }}",
                {"projectId", "workflowId"}, fake_fetch)},
        },
        {
            {"designSpace", make_resource_atom(
                "projects/{{ projectId }}/design-spaces/{{ designWorkflow.locator }}",
                {"projectId", "designWorkflow"}, fake_fetch)},
            {"predictor", make_resource_atom(
                "projects/{{ projectId }}/predictors/{{ designWorkflow.locator }}",
                {"projectId", "designWorkflow"}, fake_fetch)},
        },
    };
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        SessionConfig config = (argc > 1) ? load_session_config(argv[1]) : SessionConfig{};
        config.poll_interval = std::chrono::milliseconds(500);

        SessionController controller(workflow_molecule(), config);
        controller.update_inputs(make_inputs({{"projectId", "p-1"}, {"workflowId", "w-1"}}));

        std::mutex out_mutex;
        std::thread driver([&controller, &out_mutex] {
            while (auto observation = controller.advance()) {
                std::lock_guard<std::mutex> lock(out_mutex);
                std::cout << "[" << to_string(observation->status) << "] "
                          << to_json(observation->props).dump() << "\n";
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(1200));
        controller.update_inputs(make_inputs({{"projectId", "p-1"}, {"workflowId", "missing"}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(600));
        controller.update_inputs(make_inputs({{"projectId", "p-2"}, {"workflowId", "w-9"}}));
        std::this_thread::sleep_for(std::chrono::milliseconds(600));

        controller.release();
        driver.join();

        std::cout << "Trace:\n" << controller.export_traces().dump(2) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
