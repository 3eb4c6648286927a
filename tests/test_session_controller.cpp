// tests/test_session_controller.cpp
#include <catch2/catch_test_macros.hpp>
#include "test_helpers.h"
#include <chrono>
#include <thread>

using namespace catalyst;
using namespace catalyst::testing;

namespace {

SessionConfig fast_poll(std::chrono::milliseconds interval) {
    SessionConfig config;
    config.poll_interval = interval;
    return config;
}

} // namespace

TEST_CASE("Single atom finishes after one stage", "[session]") {
    SessionController controller({{{"a", value_atom("x")}}});
    auto inputs = make_inputs(Context::object());

    auto start = controller.advance(inputs);
    REQUIRE(start->status == SessionStatus::EXECUTING);
    REQUIRE(start->props.empty());

    auto in_flight = controller.advance(inputs);
    REQUIRE(in_flight->status == SessionStatus::EXECUTING);
    REQUIRE(is_pending(*find_cell(in_flight->props, "a")));

    auto settled = controller.advance(inputs);
    REQUIRE(settled->status == SessionStatus::FINISHED);
    REQUIRE(resolved_value(settled->props, "a") == Value("x"));
    REQUIRE(controller.status() == SessionStatus::FINISHED);
    REQUIRE(controller.pass_count() == 1);
}

TEST_CASE("A failed stage latches the session in error", "[session]") {
    auto b_calls = std::make_shared<int>(0);
    SessionController controller({
        {{"a", failing_atom("boom")}},
        {{"b", value_atom("y", b_calls)}},
    });
    auto inputs = make_inputs(Context::object());

    controller.advance(inputs);
    controller.advance(inputs);
    auto settled = controller.advance(inputs);
    REQUIRE(settled->status == SessionStatus::ERROR);
    REQUIRE(find_error(settled->props, "a")->message == "boom");
    REQUIRE(find_cell(settled->props, "b") == nullptr);
    REQUIRE(*b_calls == 0);
}

TEST_CASE("A later stage waits for what it reads", "[session]") {
    Atom b([](const Context& props) -> AtomFuture {
        if (!props.contains("a")) {
            return make_ready_future(std::nullopt);
        }
        return make_ready_future(Value("y"));
    });
    SessionController controller({{{"a", value_atom("x")}}, {{"b", b}}}, fast_poll(std::chrono::milliseconds(0)));
    auto first = make_inputs(Context::object());

    controller.advance(first);
    auto stage0 = controller.advance(first);
    REQUIRE(is_pending(*find_cell(stage0->props, "a")));
    REQUIRE(state_at(stage0->props, "b") == CellState::ABSENT);

    controller.advance(first);
    controller.advance(first);
    auto finished = controller.advance(first);
    REQUIRE(finished->status == SessionStatus::FINISHED);
    REQUIRE(resolved_value(finished->props, "b") == Value("y"));

    auto second = make_inputs({{"k", 1}});
    auto refreshed = controller.advance(second);
    REQUIRE(refreshed->status == SessionStatus::EXECUTING);
    REQUIRE(is_refreshing(*find_cell(refreshed->props, "a")));
    REQUIRE(resolved_value(refreshed->props, "k") == Value(1));

    controller.advance(second);
    controller.advance(second);
    auto again = controller.advance(second);
    REQUIRE(again->status == SessionStatus::FINISHED);
    REQUIRE(resolved_value(again->props, "a") == Value("x"));
    REQUIRE(resolved_value(again->props, "b") == Value("y"));
}

TEST_CASE("Changed inputs abandon the pass in flight", "[session]") {
    ManualAtom a;
    SessionController controller({{{"a", a.atom()}}});
    auto first = make_inputs({{"k", 0}});
    auto second = make_inputs({{"k", 1}});

    controller.advance(first);
    auto pending = controller.advance(first);
    REQUIRE(is_pending(*find_cell(pending->props, "a")));

    auto invalidating = controller.advance(second);
    REQUIRE(invalidating->status == SessionStatus::INVALIDATING);
    REQUIRE(find_cell(invalidating->props, "a") == nullptr);
    REQUIRE(resolved_value(invalidating->props, "k") == Value(1));

    auto restarted = controller.advance(second);
    REQUIRE(restarted->status == SessionStatus::EXECUTING);
    REQUIRE(a.calls() == 2);
    REQUIRE(a.last_props() == Context{{"k", 1}});
    REQUIRE(is_pending(*find_cell(restarted->props, "a")));

    // the abandoned fetch completing late must not show up
    a.resolve_call(0, "stale");
    a.resolve_call(1, "fresh");
    auto settled = controller.advance(second);
    REQUIRE(settled->status == SessionStatus::FINISHED);
    REQUIRE(resolved_value(settled->props, "a") == Value("fresh"));
    REQUIRE(controller.pass_count() == 2);

    bool abandoned = false;
    for (const auto& record : controller.get_traces()) {
        if (record.pass_id == 1 && record.key == "a") {
            abandoned = record.status == "abandoned";
        }
    }
    REQUIRE(abandoned);
}

TEST_CASE("A synchronous failure is retried after the inputs change", "[session]") {
    auto calls = std::make_shared<int>(0);
    Atom a([calls](const Context& props) -> AtomFuture {
        ++*calls;
        if (props.value("k", 0) == 0) {
            throw std::runtime_error("bad k");
        }
        return make_ready_future(Value("ok"));
    });
    SessionController controller({{{"a", a}}});
    auto first = make_inputs({{"k", 0}});
    auto second = make_inputs({{"k", 1}});

    controller.advance(first);
    auto in_flight = controller.advance(first);
    REQUIRE(is_failed(*find_cell(in_flight->props, "a")));

    auto invalidating = controller.advance(second);
    REQUIRE(invalidating->status == SessionStatus::INVALIDATING);
    REQUIRE(find_cell(invalidating->props, "a") == nullptr);

    auto restarted = controller.advance(second);
    REQUIRE(restarted->status == SessionStatus::EXECUTING);
    REQUIRE(*calls == 2);

    auto settled = controller.advance(second);
    REQUIRE(settled->status == SessionStatus::FINISHED);
    REQUIRE(resolved_value(settled->props, "a") == Value("ok"));
}

TEST_CASE("Resolved values survive an invalidation as refreshing", "[session]") {
    ManualAtom b;
    SessionController controller({{{"a", value_atom("x")}}, {{"b", b.atom()}}});
    auto first = make_inputs({{"k", 0}});
    auto second = make_inputs({{"k", 1}});

    controller.advance(first);
    controller.advance(first);
    controller.advance(first);
    controller.advance(first); // b in flight

    auto invalidating = controller.advance(second);
    REQUIRE(invalidating->status == SessionStatus::INVALIDATING);
    REQUIRE(state_at(invalidating->props, "a") == CellState::RESOLVED);
    REQUIRE(find_cell(invalidating->props, "b") == nullptr);

    auto restarted = controller.advance(second);
    const ValueCell* a = find_cell(restarted->props, "a");
    REQUIRE(is_refreshing(*a));
    REQUIRE(resolved_value(*a) == Value("x"));
}

TEST_CASE("Each pass yields two observations per stage", "[session]") {
    SessionController controller({
        {{"a", value_atom(1)}},
        {{"b", value_atom(2)}, {"c", value_atom(3)}},
        {{"d", value_atom(4)}},
    });
    auto inputs = make_inputs(Context::object());

    controller.advance(inputs);
    std::vector<SessionStatus> statuses;
    do {
        statuses.push_back(controller.advance(inputs)->status);
    } while (statuses.back() == SessionStatus::EXECUTING);

    REQUIRE(statuses.size() == 6);
    REQUIRE(statuses.back() == SessionStatus::FINISHED);
}

TEST_CASE("A finished session polls with the same inputs", "[session]") {
    auto calls = std::make_shared<int>(0);
    SessionController controller({{{"a", value_atom("x", calls)}}}, fast_poll(std::chrono::milliseconds(10)));
    auto inputs = make_inputs(Context::object());

    controller.advance(inputs);
    controller.advance(inputs);
    REQUIRE(controller.advance(inputs)->status == SessionStatus::FINISHED);

    auto polled = controller.advance(inputs);
    REQUIRE(polled->status == SessionStatus::EXECUTING);
    const ValueCell* a = find_cell(polled->props, "a");
    REQUIRE(is_refreshing(*a));
    REQUIRE(resolved_value(*a) == Value("x"));

    auto settled = controller.advance(inputs);
    REQUIRE(settled->status == SessionStatus::FINISHED);
    REQUIRE(state_at(settled->props, "a") == CellState::RESOLVED);
    REQUIRE(*calls == 2);
    REQUIRE(controller.pass_count() == 2);
}

TEST_CASE("New inputs cut the poll delay short", "[session]") {
    SessionController controller({{{"a", value_atom("x")}}}, fast_poll(std::chrono::minutes(10)));
    controller.update_inputs(make_inputs({{"k", 0}}));

    controller.advance();
    controller.advance();
    REQUIRE(controller.advance()->status == SessionStatus::FINISHED);

    std::thread publisher([&controller] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        controller.update_inputs(make_inputs({{"k", 1}}));
    });

    auto begin = std::chrono::steady_clock::now();
    auto next = controller.advance();
    auto waited = std::chrono::steady_clock::now() - begin;
    publisher.join();

    REQUIRE(waited < std::chrono::seconds(30));
    REQUIRE(next->status == SessionStatus::EXECUTING);
    REQUIRE(resolved_value(next->props, "k") == Value(1));
}

TEST_CASE("An error clears once the inputs change", "[session]") {
    auto calls = std::make_shared<int>(0);
    SessionController controller({{{"a", failing_atom("boom", calls)}}});
    controller.update_inputs(make_inputs({{"k", 0}}));

    controller.advance();
    controller.advance();
    REQUIRE(controller.advance()->status == SessionStatus::ERROR);

    std::thread publisher([&controller] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        controller.update_inputs(make_inputs({{"k", 1}}));
    });
    auto invalidating = controller.advance();
    publisher.join();

    REQUIRE(invalidating->status == SessionStatus::INVALIDATING);
    REQUIRE(find_cell(invalidating->props, "a") == nullptr);

    // the failed atom runs again
    auto restarted = controller.advance();
    REQUIRE(restarted->status == SessionStatus::EXECUTING);
    REQUIRE(*calls == 2);
    REQUIRE(controller.advance()->status == SessionStatus::ERROR);
}

TEST_CASE("Release wakes a session waiting in error", "[session]") {
    SessionController controller({{{"a", failing_atom("boom")}}});
    controller.update_inputs(make_inputs(Context::object()));

    controller.advance();
    controller.advance();
    REQUIRE(controller.advance()->status == SessionStatus::ERROR);

    std::thread releaser([&controller] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        controller.release();
    });
    auto next = controller.advance();
    releaser.join();

    REQUIRE_FALSE(next.has_value());
    REQUIRE(controller.released());
    REQUIRE_FALSE(controller.advance().has_value());
}

TEST_CASE("Controller rejects misuse", "[session]") {
    Molecule empty;
    REQUIRE_THROWS_AS(SessionController(empty), std::invalid_argument);
    Molecule duplicated = {{{"a", value_atom(1)}}, {{"a", value_atom(2)}}};
    REQUIRE_THROWS_AS(SessionController(duplicated), std::invalid_argument);

    SessionController controller({{{"a", value_atom(1)}}});
    REQUIRE_THROWS_AS(controller.advance(), std::logic_error);
    REQUIRE_THROWS_AS(controller.update_inputs(nullptr), std::invalid_argument);
}

TEST_CASE("Tracing can be switched off", "[session][trace]") {
    SessionConfig config;
    config.trace_enabled = false;
    SessionController controller({{{"a", value_atom(1)}}}, config);
    auto inputs = make_inputs(Context::object());

    controller.advance(inputs);
    controller.advance(inputs);
    controller.advance(inputs);
    REQUIRE(controller.get_traces().empty());
    REQUIRE(controller.export_traces().empty());
}

TEST_CASE("Traces export as JSON", "[session][trace]") {
    SessionController controller({{{"a", value_atom(1)}}, {{"b", failing_atom("boom")}}});
    auto inputs = make_inputs(Context::object());

    for (int i = 0; i < 5; ++i) {
        controller.advance(inputs);
    }
    auto exported = controller.export_traces();
    REQUIRE(exported.size() == 2);
    REQUIRE(exported[0]["key"] == "a");
    REQUIRE(exported[0]["status"] == "resolved");
    REQUIRE(exported[1]["key"] == "b");
    REQUIRE(exported[1]["stage"] == 1);
    REQUIRE(exported[1]["error"] == "boom");
}
