/*
===============================================================================
TEST SOLUTION — Tests for solution.h
===============================================================================

OVERVIEW
--------
Metric vectors, Pareto dominance and the feasibility check used by the hybrid
strategy.

TEST ORGANIZATION
-----------------
• Section A: Metric computation
• Section B: Dominance
• Section C: Feasibility and formatting

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• solution.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <tpm_optimizer/solution.h>

using namespace tpmopt;

namespace {

    Program program(const std::string& id, double time, const std::string& portfolio = "Core",
                    const std::string& tz = "UTC")
    {
        Program p(id, id, tz, time, 1);
        p.portfolio = portfolio;
        return p;
    }

    struct Fixture {
        TpmMap tpms;
        ProgramMap programs;
        ScoringConfig scoring;
        ConstraintEngine engine;

        Fixture(TpmMap t, ProgramMap p)
            : tpms(std::move(t)), programs(std::move(p)),
              engine(tpms, programs, scoring, defaultTimezoneTable())
        {
        }
    };

    MetricVector mv(int unused, int overloaded, int tz, int portfolio) {
        MetricVector m{};
        m[index(Metric::UnusedTpms)] = unused;
        m[index(Metric::OverloadedTpms)] = overloaded;
        m[index(Metric::TimezoneViolations)] = tz;
        m[index(Metric::PortfolioViolations)] = portfolio;
        return m;
    }

} // namespace

// ============================================================================
// SECTION A: METRIC COMPUTATION
// ============================================================================

/**
 * @test Solution::Metrics
 * @given Three TPMs: T1 overloaded with three tags and a far-away program,
 *        T2 idle, T3 overloaded but tolerant
 * @then UnusedTpms=1, OverloadedTpms=1, TimezoneViolations=1,
 *       PortfolioViolations=1
 */
TEST_CASE("A1: Solution::Metrics", "[solution][metrics]")
{
    Tpm tolerant("T3", "", "UTC", 0.2, 3);
    tolerant.allow_overload = true;
    Fixture f(makeTpmMap({Tpm("T1", "", "UTC", 0.5, 3), Tpm("T2", "", "UTC", 1.0, 3), tolerant}),
              makeProgramMap({program("P1", 0.3, "A"), program("P2", 0.3, "B"),
                              program("P3", 0.1, "C", "Asia/Tokyo"), program("P4", 0.5, "A")}));

    Solution s(Assignment{{"P1", "T1"}, {"P2", "T1"}, {"P3", "T1"}, {"P4", "T3"}}, f.engine);

    REQUIRE(s.metric(Metric::UnusedTpms) == 1);
    REQUIRE(s.metric(Metric::OverloadedTpms) == 1);
    REQUIRE(s.metric(Metric::TimezoneViolations) == 1);
    REQUIRE(s.metric(Metric::PortfolioViolations) == 1);
}

TEST_CASE("A2: Solution::StateAndMappingAgree", "[solution][metrics]")
{
    Fixture f(makeTpmMap({Tpm("T1", "", "UTC", 1.0, 3), Tpm("T2", "", "UTC", 1.0, 3)}),
              makeProgramMap({program("P1", 0.3), program("P2", 0.3)}));
    Assignment a{{"P1", "T1"}, {"P2", "T1"}};

    Solution fromMapping(a, f.engine);
    Solution fromState(AssignmentState(f.programs, a), f.engine);

    REQUIRE(fromMapping.metrics() == fromState.metrics());
    REQUIRE(fromMapping.assignments() == fromState.assignments());
}

// ============================================================================
// SECTION B: DOMINANCE
// ============================================================================

/**
 * @test Dominance::Definition
 */
TEST_CASE("B1: Dominance::Definition", "[solution][dominance]")
{
    REQUIRE(dominates(mv(0, 0, 0, 0), mv(1, 0, 0, 0)));
    REQUIRE(dominates(mv(0, 0, 1, 0), mv(1, 0, 1, 2)));
    REQUIRE_FALSE(dominates(mv(0, 1, 0, 0), mv(1, 0, 0, 0)));   // trade-off
    REQUIRE_FALSE(dominates(mv(1, 0, 0, 0), mv(0, 0, 0, 0)));
}

/**
 * @test Dominance::IrreflexiveAndAntisymmetric
 * @brief Over a small grid, no vector dominates itself and no pair dominates
 *        both ways
 */
TEST_CASE("B2: Dominance::IrreflexiveAndAntisymmetric", "[solution][dominance]")
{
    std::vector<MetricVector> grid;
    for (int a = 0; a < 2; ++a)
        for (int b = 0; b < 2; ++b)
            for (int c = 0; c < 2; ++c)
                for (int d = 0; d < 2; ++d)
                    grid.push_back(mv(a, b, c, d));

    for (const auto& x : grid) {
        REQUIRE_FALSE(dominates(x, x));
        for (const auto& y : grid)
            REQUIRE_FALSE((dominates(x, y) && dominates(y, x)));
    }
}

TEST_CASE("B3: Solution::ImprovedMetricCount", "[solution][dominance]")
{
    Fixture f(makeTpmMap({Tpm("T1", "", "UTC", 0.5, 3), Tpm("T2", "", "UTC", 0.5, 3)}),
              makeProgramMap({program("P1", 0.4), program("P2", 0.4)}));

    Solution spread(Assignment{{"P1", "T1"}, {"P2", "T2"}}, f.engine);
    Solution stacked(Assignment{{"P1", "T1"}, {"P2", "T1"}}, f.engine);

    REQUIRE(spread.dominates(stacked));
    REQUIRE_FALSE(stacked.dominates(spread));
    REQUIRE(spread.improvedMetricCount(stacked) == 2);   // unused and overloaded
    REQUIRE(stacked.improvedMetricCount(spread) == 0);
}

// ============================================================================
// SECTION C: FEASIBILITY AND FORMATTING
// ============================================================================

/**
 * @test Solution::Feasibility
 * @brief Feasible means pins honored and no intolerant TPM over capacity
 */
TEST_CASE("C1: Solution::Feasibility", "[solution][feasible]")
{
    Program pinned = program("P1", 0.4);
    pinned.fixed_tpm = "T1";
    Fixture f(makeTpmMap({Tpm("T1", "", "UTC", 0.5, 3), Tpm("T2", "", "UTC", 0.5, 3)}),
              makeProgramMap({pinned, program("P2", 0.4)}));

    REQUIRE(Solution(Assignment{{"P1", "T1"}, {"P2", "T2"}}, f.engine).isFeasible());
    REQUIRE_FALSE(Solution(Assignment{{"P1", "T2"}, {"P2", "T1"}}, f.engine).isFeasible());   // pin moved
    REQUIRE_FALSE(Solution(Assignment{{"P1", "T1"}, {"P2", "T1"}}, f.engine).isFeasible());   // overload
}

TEST_CASE("C2: Solution::FormatMetrics", "[solution][format]")
{
    REQUIRE(formatMetrics(mv(1, 0, 2, 3)) ==
            "{UnusedTpms=1, OverloadedTpms=0, TimezoneViolations=2, PortfolioViolations=3}");
}
