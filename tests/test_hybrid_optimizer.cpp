/*
===============================================================================
TEST HYBRID OPTIMIZER — Tests for hybrid_optimizer.h
===============================================================================

OVERVIEW
--------
The hybrid strategy builds a mapping greedily under Pareto dominance and then
walks feasible neighbors. Tests check the construction rule, the feasibility
of every result, and the stop conditions recorded in the run statistics.

TEST ORGANIZATION
-----------------
• Section A: Construction
• Section B: Refinement and stop conditions

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• hybrid_optimizer.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

#include <tpm_optimizer/hybrid_optimizer.h>

using namespace tpmopt;

namespace {

    Tpm tpm(const std::string& id, double capacity, int level, const std::string& tz = "UTC") {
        return Tpm(id, id, tz, capacity, level);
    }

    Program program(const std::string& id, double time, int level, int complexity = 1,
                    const std::string& pin = "", const std::string& portfolio = "Core",
                    const std::string& tz = "UTC")
    {
        Program p(id, id, tz, time, level, complexity);
        p.fixed_tpm = pin;
        p.portfolio = portfolio;
        return p;
    }

    OptimizerConfig seeded(std::uint64_t seed = 42) {
        OptimizerConfig cfg;
        cfg.seed = seed;
        cfg.hybrid.maxIterations = 500;
        cfg.hybrid.noImprovementLimit = 200;
        return cfg;
    }

} // namespace

// ============================================================================
// SECTION A: CONSTRUCTION
// ============================================================================

/**
 * @test Construction::FirstUnlessDominated
 * @given Two equally good TPMs for the first program
 * @then The first TPM in id order is kept, because neither dominates
 */
TEST_CASE("A1: Construction::FirstUnlessDominated", "[hybrid][construct]")
{
    HybridOptimizer opt(makeTpmMap({tpm("T1", 1.0, 3), tpm("T2", 1.0, 3)}),
                        makeProgramMap({program("P1", 0.5, 3)}), seeded());

    AssignmentState state = opt.construct();
    REQUIRE(*state.tpmOf("P1") == "T1");
}

/**
 * @test Construction::DominatingCandidateWins
 * @given T1 in New York and T2 in Tokyo, a Tokyo program
 * @then T2 avoids the timezone violation and dominates T1
 */
TEST_CASE("A2: Construction::DominatingCandidateWins", "[hybrid][construct]")
{
    HybridOptimizer opt(makeTpmMap({tpm("T1", 1.0, 3, "America/New_York"),
                                    tpm("T2", 1.0, 3, "Asia/Tokyo")}),
                        makeProgramMap({program("P1", 0.5, 3, 1, "", "Core", "Asia/Tokyo")}),
                        seeded());

    AssignmentState state = opt.construct();
    REQUIRE(*state.tpmOf("P1") == "T2");
}

/**
 * @test Construction::SpreadsToUnusedTpms
 * @brief A second program prefers the idle TPM, which lowers UnusedTpms
 */
TEST_CASE("A3: Construction::SpreadsToUnusedTpms", "[hybrid][construct]")
{
    HybridOptimizer opt(makeTpmMap({tpm("T1", 1.0, 3), tpm("T2", 1.0, 3)}),
                        makeProgramMap({program("P1", 0.3, 3, 5), program("P2", 0.3, 3, 1)}),
                        seeded());

    AssignmentState state = opt.construct();
    REQUIRE(*state.tpmOf("P1") == "T1");
    REQUIRE(*state.tpmOf("P2") == "T2");
}

TEST_CASE("A4: Construction::NoLegalTpmLeavesUnassigned", "[hybrid][construct]")
{
    HybridOptimizer opt(makeTpmMap({tpm("T1", 1.0, 2)}),
                        makeProgramMap({program("P1", 0.3, 4), program("P2", 0.3, 1)}), seeded());

    AssignmentState state = opt.construct();
    REQUIRE_FALSE(state.isAssigned("P1"));
    REQUIRE(state.isAssigned("P2"));
}

// ============================================================================
// SECTION B: REFINEMENT AND STOP CONDITIONS
// ============================================================================

/**
 * @test Hybrid::ResultIsFeasible
 */
TEST_CASE("B1: Hybrid::ResultIsFeasible", "[hybrid][run]")
{
    HybridOptimizer opt(makeTpmMap({tpm("T1", 1.0, 3), tpm("T2", 0.8, 4), tpm("T3", 0.5, 2)}),
                        makeProgramMap({program("P1", 0.4, 3, 3, "T1"),
                                        program("P2", 0.3, 2, 2),
                                        program("P3", 0.4, 4, 4),
                                        program("P4", 0.2, 1, 1),
                                        program("P5", 0.3, 2, 2)}),
                        seeded());

    Assignment result = opt.optimize();

    REQUIRE(result.at("P1") == "T1");
    REQUIRE(Solution(result, opt.engine()).isFeasible());
    REQUIRE(opt.name() == "hybrid");
}

/**
 * @test Hybrid::StopReasons
 */
TEST_CASE("B2: Hybrid::StopReasons", "[hybrid][run]")
{
    auto tpms = makeTpmMap({tpm("T1", 1.0, 3), tpm("T2", 1.0, 3)});
    auto programs = makeProgramMap({program("P1", 0.3, 1), program("P2", 0.3, 1),
                                    program("P3", 0.3, 1)});

    SECTION("iteration cap") {
        auto cfg = seeded();
        cfg.hybrid.maxIterations = 10;
        cfg.hybrid.noImprovementLimit = 1000;
        HybridOptimizer opt(tpms, programs, cfg);
        opt.optimize();

        REQUIRE(opt.stats().get<std::string>("stop_reason") == "iterations");
        REQUIRE(opt.stats().get<int>("iterations") == 10);
    }

    SECTION("temperature floor") {
        auto cfg = seeded();
        cfg.hybrid.coolingRate = 0.5;
        cfg.hybrid.minTemperature = 0.1;
        cfg.hybrid.noImprovementLimit = 1000;
        HybridOptimizer opt(tpms, programs, cfg);
        opt.optimize();

        // 1.0 → 0.5 → 0.25 → 0.125 → 0.0625
        REQUIRE(opt.stats().get<std::string>("stop_reason") == "temperature");
        REQUIRE(opt.stats().get<int>("iterations") == 4);
    }

    SECTION("wall-clock budget") {
        auto cfg = seeded();
        cfg.hybrid.maxRuntimeSeconds = 0.0;
        cfg.hybrid.noImprovementLimit = 1000;
        HybridOptimizer opt(tpms, programs, cfg);
        Assignment result = opt.optimize();

        REQUIRE(opt.stats().get<std::string>("stop_reason") == "runtime");
        REQUIRE(opt.stats().get<int>("iterations") == 0);
        REQUIRE(result.size() == 3);
    }

    SECTION("stalled") {
        auto cfg = seeded();
        cfg.hybrid.noImprovementLimit = 5;
        HybridOptimizer opt(tpms, programs, cfg);
        opt.optimize();

        REQUIRE(opt.stats().get<std::string>("stop_reason") == "no_improvement");
    }
}

/**
 * @test Hybrid::BestMetricsRecorded
 */
TEST_CASE("B3: Hybrid::BestMetricsRecorded", "[hybrid][run]")
{
    HybridOptimizer opt(makeTpmMap({tpm("T1", 1.0, 3), tpm("T2", 1.0, 3)}),
                        makeProgramMap({program("P1", 0.3, 1), program("P2", 0.3, 1)}), seeded());

    std::ostringstream log;
    opt.verbose(log);
    Assignment result = opt.optimize();

    Solution best(result, opt.engine());
    forEachEnum<Metric>([&](Metric m) {
        REQUIRE(opt.stats().get<int>("best_" + std::string(enumName(m))) == best.metric(m));
    });
    REQUIRE(log.str().find("Hybrid finished") != std::string::npos);
}
