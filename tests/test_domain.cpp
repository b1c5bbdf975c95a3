/*
===============================================================================
TEST DOMAIN — Tests for domain.h and config.h
===============================================================================

OVERVIEW
--------
Entity validation, id-keyed maps, pin detection, configuration presets and
configuration validation.

TEST ORGANIZATION
-----------------
• Section A: Tpm validation
• Section B: Program validation and pins
• Section C: Entity maps
• Section D: Configuration

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• domain.h, config.h - System under test

===============================================================================
*/

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

#include <tpm_optimizer/config.h>
#include <tpm_optimizer/domain.h>

using namespace tpmopt;

// ============================================================================
// SECTION A: TPM VALIDATION
// ============================================================================

/**
 * @test Tpm::ValidConstruction
 */
TEST_CASE("A1: Tpm::ValidConstruction", "[domain][tpm]")
{
    Tpm t("T1", "Alice", "America/New_York", 0.8, 3);

    REQUIRE(t.id == "T1");
    REQUIRE(t.available_time == 0.8);
    REQUIRE(t.level == 3);
    REQUIRE_FALSE(t.allow_overload);
    REQUIRE(t.skills.empty());
}

/**
 * @test Tpm::BoundaryValues
 * @brief Capacity 0 and 1 and levels 1 and 5 are accepted
 */
TEST_CASE("A2: Tpm::BoundaryValues", "[domain][tpm]")
{
    REQUIRE_NOTHROW(Tpm("T1", "", "UTC", 0.0, 1));
    REQUIRE_NOTHROW(Tpm("T2", "", "UTC", 1.0, 5));
}

/**
 * @test Tpm::RejectsOutOfRange
 */
TEST_CASE("A3: Tpm::RejectsOutOfRange", "[domain][tpm]")
{
    REQUIRE_THROWS_AS(Tpm("", "Nobody", "UTC", 1.0, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(Tpm("T1", "", "UTC", 1.5, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(Tpm("T1", "", "UTC", -0.1, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(Tpm("T1", "", "UTC", 1.0, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(Tpm("T1", "", "UTC", 1.0, 6), std::invalid_argument);
}

/**
 * @test Tpm::MessageNamesRecord
 */
TEST_CASE("A4: Tpm::MessageNamesRecord", "[domain][tpm]")
{
    try {
        Tpm("T9", "", "UTC", 2.0, 3);
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        std::string what = e.what();
        REQUIRE(what.find("T9") != std::string::npos);
        REQUIRE(what.find("available_time") != std::string::npos);
    }
}

// ============================================================================
// SECTION B: PROGRAM VALIDATION AND PINS
// ============================================================================

TEST_CASE("B1: Program::ValidConstruction", "[domain][program]")
{
    Program p("P1", "Checkout", "America/Chicago", 0.5, 3, 4);

    REQUIRE(p.required_time == 0.5);
    REQUIRE(p.required_level == 3);
    REQUIRE(p.complexity_score == 4);
    REQUIRE_FALSE(p.isPinned());
}

/**
 * @test Program::RejectsOutOfRange
 * @brief required_time must be in (0, 1]; zero is rejected
 */
TEST_CASE("B2: Program::RejectsOutOfRange", "[domain][program]")
{
    REQUIRE_THROWS_AS(Program("", "", "UTC", 0.5, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(Program("P1", "", "UTC", 0.0, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(Program("P1", "", "UTC", 1.1, 3), std::invalid_argument);
    REQUIRE_THROWS_AS(Program("P1", "", "UTC", 0.5, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(Program("P1", "", "UTC", 0.5, 3, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(Program("P1", "", "UTC", 0.5, 3, 6), std::invalid_argument);
    REQUIRE_NOTHROW(Program("P1", "", "UTC", 1.0, 5, 5));
}

/**
 * @test Program::BlankPinIsNotAPin
 */
TEST_CASE("B3: Program::BlankPinIsNotAPin", "[domain][program]")
{
    Program p("P1", "", "UTC", 0.5, 3);

    p.fixed_tpm = "   ";
    REQUIRE_FALSE(p.isPinned());

    p.fixed_tpm = "T1";
    REQUIRE(p.isPinned());
}

// ============================================================================
// SECTION C: ENTITY MAPS
// ============================================================================

TEST_CASE("C1: EntityMaps::KeyedById", "[domain][maps]")
{
    auto tpms = makeTpmMap({Tpm("T2", "", "UTC", 1.0, 3), Tpm("T1", "", "UTC", 1.0, 3)});

    REQUIRE(tpms.size() == 2);
    REQUIRE(tpms.begin()->first == "T1");
    REQUIRE(tpms.at("T2").id == "T2");
}

TEST_CASE("C2: EntityMaps::DuplicateIdsRejected", "[domain][maps]")
{
    REQUIRE_THROWS_AS(makeTpmMap({Tpm("T1", "", "UTC", 1.0, 3), Tpm("T1", "", "UTC", 0.5, 2)}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(makeProgramMap({Program("P1", "", "UTC", 0.5, 3),
                                      Program("P1", "", "UTC", 0.2, 1)}),
                      std::invalid_argument);
}

// ============================================================================
// SECTION D: CONFIGURATION
// ============================================================================

/**
 * @test OptimizerConfig::Defaults
 */
TEST_CASE("D1: OptimizerConfig::Defaults", "[config]")
{
    OptimizerConfig cfg;

    REQUIRE(cfg.scoring.weights.timezone == 0.30);
    REQUIRE(cfg.scoring.weights.skill == 0.25);
    REQUIRE(cfg.scoring.weights.level == 0.20);
    REQUIRE(cfg.scoring.weights.portfolio == 0.15);
    REQUIRE(cfg.scoring.weights.preference == 0.10);
    REQUIRE(cfg.scoring.maxPortfolios == 2);
    REQUIRE(cfg.scoring.fixedAssignmentsBypassLegality);
    REQUIRE(cfg.annealing.maxIterations == 10000);
    REQUIRE(cfg.annealing.coolingRate == 0.995);
    REQUIRE(cfg.hybrid.maxIterations == 5000);
    REQUIRE(cfg.hybrid.noImprovementLimit == 1000);
    REQUIRE(cfg.twoPhase.belowSweetSpotLow == LoadTargets::MIN_LOAD);
    REQUIRE(cfg.twoPhase.sweetSpotHigh == LoadTargets::TARGET_LOAD);
    REQUIRE(cfg.twoPhase.aboveSweetSpotHigh == LoadTargets::MAX_LOAD);
    REQUIRE_FALSE(cfg.seed.has_value());
    REQUIRE_NOTHROW(cfg.validate());
}

/**
 * @test OptimizerConfig::Presets
 * @brief Every preset validates; Fast is shorter and Thorough longer
 */
TEST_CASE("D2: OptimizerConfig::Presets", "[config]")
{
    auto def = OptimizerConfig::preset(Preset::Default);
    auto fast = OptimizerConfig::preset(Preset::Fast);
    auto thorough = OptimizerConfig::preset(Preset::Thorough);

    REQUIRE_NOTHROW(def.validate());
    REQUIRE_NOTHROW(fast.validate());
    REQUIRE_NOTHROW(thorough.validate());

    REQUIRE(fast.annealing.maxIterations < def.annealing.maxIterations);
    REQUIRE(thorough.annealing.maxIterations > def.annealing.maxIterations);
    REQUIRE(fast.exact.timeLimitSeconds == 60.0);
}

/**
 * @test OptimizerConfig::ValidationFailures
 */
TEST_CASE("D3: OptimizerConfig::ValidationFailures", "[config]")
{
    SECTION("negative weight") {
        OptimizerConfig cfg;
        cfg.scoring.weights.skill = -0.1;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("cooling rate outside (0, 1)") {
        OptimizerConfig cfg;
        cfg.annealing.coolingRate = 1.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("non-positive temperature") {
        OptimizerConfig cfg;
        cfg.hybrid.initialTemperature = 0.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("floor above start") {
        OptimizerConfig cfg;
        cfg.annealing.minTemperature = 2.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("utilization bands out of order") {
        OptimizerConfig cfg;
        cfg.twoPhase.aboveSweetSpotHigh = 0.85;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("negative iteration bound") {
        OptimizerConfig cfg;
        cfg.hybrid.maxIterations = -1;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
    SECTION("negative time limit") {
        OptimizerConfig cfg;
        cfg.exact.timeLimitSeconds = -5.0;
        REQUIRE_THROWS_AS(cfg.validate(), std::invalid_argument);
    }
}
