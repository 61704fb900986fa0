#include <catch2/catch_test_macros.hpp>

#include "aggregator.hpp"

#include <string>

namespace {

SessionMap sessions_with(std::initializer_list<SessionStatus> statuses) {
    SessionMap m;
    int i = 0;
    for (auto s : statuses) {
        auto id = "s" + std::to_string(i++);
        m.emplace(id, Session{.id = id, .status = s});
    }
    return m;
}

} // namespace

TEST_CASE("Aggregator", "[aggregator]") {
    using S = SessionStatus;

    SECTION("EmptyIsNotRunning") {
        REQUIRE(aggregate({}) == AggregateStatus::NotRunning);
    }

    SECTION("NeedsInputOutranksEverything") {
        REQUIRE(aggregate(sessions_with({S::NeedsInput})) == AggregateStatus::NeedsInput);
        REQUIRE(aggregate(sessions_with({S::Working, S::NeedsInput})) == AggregateStatus::NeedsInput);
        REQUIRE(aggregate(sessions_with({S::Idle, S::Working, S::Working, S::NeedsInput, S::Idle})) ==
                AggregateStatus::NeedsInput);
    }

    SECTION("WorkingOutranksIdle") {
        REQUIRE(aggregate(sessions_with({S::Idle, S::Working, S::Idle})) == AggregateStatus::Working);
    }

    SECTION("AllIdle") {
        REQUIRE(aggregate(sessions_with({S::Idle, S::Idle})) == AggregateStatus::Idle);
    }

    SECTION("DisplayStrings") {
        REQUIRE(std::string(to_string(AggregateStatus::NeedsInput)) == "needs_input");
        REQUIRE(std::string(to_string(AggregateStatus::NotRunning)) == "not_running");
        REQUIRE(std::string(status_text(AggregateStatus::Working)) == "Working...");
        REQUIRE(std::string(status_text(AggregateStatus::Idle)) == "Ready");
        REQUIRE(std::string(status_text(AggregateStatus::NeedsInput)) == "Input needed");
    }
}
