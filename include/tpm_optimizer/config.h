#pragma once
/*
===============================================================================
CONFIGURATION — Weights, thresholds and strategy parameters
===============================================================================

OVERVIEW
--------
All tunable numbers of the optimizer live in one value type, OptimizerConfig,
which is copied into each strategy at construction and never changes during a
run. Nothing in the library reads process-wide mutable settings.

    OptimizerConfig
      ├── scoring    ScoringConfig    pair score weights, tier thresholds,
      │                               penalty weights, fixed-pin policy
      ├── exact      ExactConfig      solver limits, diagnostics switch
      ├── annealing  AnnealingConfig  temperature schedule, iteration cap
      ├── hybrid     HybridConfig     schedule, wall-clock and stall caps
      ├── twoPhase   TwoPhaseConfig   ranking bonuses and utilization bands
      └── seed       optional RNG seed for the randomized strategies

Presets
-------
    Preset::Default   Values of the reference behavior
    Preset::Fast      Short heuristic runs, 60 s solver limit, 5% MIP gap
    Preset::Thorough  Longer heuristic runs, 0.01% MIP gap

Validation
----------
OptimizerConfig::validate() throws std::invalid_argument for negative
weights, cooling rates outside (0, 1), non-positive temperatures, a floor
above the start temperature, or negative bounds. Every optimizer constructor
calls it.

USAGE EXAMPLES
--------------
    auto cfg = OptimizerConfig::preset(Preset::Fast);
    cfg.seed = 42;
    cfg.scoring.fixedAssignmentsBypassLegality = false;

    AnnealingOptimizer sa(tpms, programs, cfg);

===============================================================================
*/

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "domain.h"

namespace tpmopt {

    /// @brief Weights of the five components of a pair score
    struct ScoringWeights {
        double timezone = 0.30;
        double skill = 0.25;
        double level = 0.20;
        double portfolio = 0.15;
        double preference = 0.10;
    };

    /**
     * @brief Pair scoring, tiering and penalty parameters shared by all strategies
     */
    struct ScoringConfig {
        ScoringWeights weights;

        // Timezone tiers (hours)
        double preferredTimezoneSpread = TpmConstraints::PREFERRED_TIMEZONE_SPREAD;
        double maxTimezoneSpread = TpmConstraints::MAX_TIMEZONE_SPREAD;

        // Level fit table: exact / one above / more than one above / below
        double levelExact = 1.0;
        double levelOneAbove = 0.7;
        double levelWellAbove = 0.4;
        double levelBelow = 0.0;

        double portfolioContinuing = 1.0;
        double portfolioNew = 0.5;
        double preferenceBonus = 0.2;

        int maxPortfolios = TpmConstraints::MAX_PORTFOLIOS;
        int targetPortfolioDiversity = TpmConstraints::TARGET_PORTFOLIO_DIVERSITY;

        // Utilization bands
        double minUtilization = TpmConstraints::MIN_UTILIZATION;
        double severeUtilization = 0.5;

        // Objective evaluator weights
        double capacityObjectiveWeight = 100.0;
        double utilizationObjectiveWeight = 5.0;
        double portfolioObjectiveWeight = 2.0;

        // Absolute slack applied to every capacity comparison
        double capacityTolerance = 1e-9;

        /// Pins are always honored; when true their legality is only diagnosed.
        bool fixedAssignmentsBypassLegality = true;
    };

    struct ExactConfig {
        double timeLimitSeconds = 0.0;    ///< 0 = let the solver run to completion
        double mipGap = -1.0;             ///< < 0 = solver default
        int threads = 0;                  ///< 0 = solver default
        bool runDiagnostics = true;
    };

    struct AnnealingConfig {
        double initialTemperature = 1.0;
        double coolingRate = 0.995;
        double minTemperature = 0.001;
        int maxIterations = 10000;
        double swapProbability = 0.5;
        int progressInterval = 1000;

        // Energy penalty weights
        double portfolioPenalty = 2.0;
        double timezonePenalty = 1.5;
        double capacityPenalty = 10.0;
        double utilizationPenalty = 5.0;
        double severeUtilizationPenalty = 10.0;
        double idleWhileOverloadedPenalty = 5.0;
    };

    struct HybridConfig {
        double initialTemperature = 1.0;
        double coolingRate = 0.99;
        double minTemperature = 0.001;
        int maxIterations = 5000;
        double maxRuntimeSeconds = 300.0;
        int noImprovementLimit = 1000;
        int neighborAttempts = 50;
        double swapProbability = 0.5;
        int progressInterval = 100;
    };

    struct TwoPhaseConfig {
        // Capacity-fit bonus by resulting utilization
        double sweetSpotLow = 0.80;
        double sweetSpotHigh = LoadTargets::TARGET_LOAD;
        double sweetSpotBonus = 100.0;
        double belowSweetSpotLow = LoadTargets::MIN_LOAD;
        double belowSweetSpotBonus = 80.0;
        double aboveSweetSpotHigh = LoadTargets::MAX_LOAD;
        double aboveSweetSpotBonus = 60.0;

        double timezoneCloseBonus = 50.0;
        double timezoneFarBonus = 20.0;
        double portfolioAffinityBonus = 30.0;
    };

    enum class Preset { Default, Fast, Thorough };

    /**
     * @struct OptimizerConfig
     * @brief Immutable-per-run configuration shared by every strategy
     */
    struct OptimizerConfig {
        ScoringConfig scoring;
        ExactConfig exact;
        AnnealingConfig annealing;
        HybridConfig hybrid;
        TwoPhaseConfig twoPhase;
        std::optional<std::uint64_t> seed;

        static OptimizerConfig preset(Preset p) {
            OptimizerConfig cfg;
            switch (p) {
                case Preset::Default:
                    break;

                case Preset::Fast:
                    cfg.exact.timeLimitSeconds = 60.0;
                    cfg.exact.mipGap = 0.05;
                    cfg.annealing.coolingRate = 0.99;
                    cfg.annealing.maxIterations = 2000;
                    cfg.hybrid.maxIterations = 1000;
                    cfg.hybrid.maxRuntimeSeconds = 30.0;
                    cfg.hybrid.noImprovementLimit = 250;
                    break;

                case Preset::Thorough:
                    cfg.exact.mipGap = 0.0001;
                    cfg.annealing.coolingRate = 0.999;
                    cfg.annealing.maxIterations = 50000;
                    cfg.hybrid.coolingRate = 0.998;
                    cfg.hybrid.maxIterations = 20000;
                    cfg.hybrid.noImprovementLimit = 4000;
                    break;
            }
            return cfg;
        }

        /// @throws std::invalid_argument describing the first bad field
        void validate() const {
            auto fail = [](const std::string& what) {
                throw std::invalid_argument("OptimizerConfig: " + what);
            };

            const auto& w = scoring.weights;
            if (w.timezone < 0 || w.skill < 0 || w.level < 0 || w.portfolio < 0 || w.preference < 0)
                fail("scoring weights must be non-negative");
            if (scoring.preferredTimezoneSpread < 0 ||
                scoring.maxTimezoneSpread < scoring.preferredTimezoneSpread)
                fail("timezone spreads must satisfy 0 <= preferred <= max");
            if (scoring.maxPortfolios < 1)
                fail("maxPortfolios must be at least 1");
            if (scoring.capacityTolerance < 0)
                fail("capacityTolerance must be non-negative");

            if (exact.timeLimitSeconds < 0)
                fail("exact.timeLimitSeconds must be non-negative");
            if (exact.threads < 0)
                fail("exact.threads must be non-negative");

            checkSchedule("annealing", annealing.initialTemperature, annealing.minTemperature,
                          annealing.coolingRate, fail);
            if (annealing.maxIterations < 0)
                fail("annealing.maxIterations must be non-negative");
            if (annealing.swapProbability < 0 || annealing.swapProbability > 1)
                fail("annealing.swapProbability must be in [0, 1]");

            checkSchedule("hybrid", hybrid.initialTemperature, hybrid.minTemperature,
                          hybrid.coolingRate, fail);
            if (hybrid.maxIterations < 0 || hybrid.noImprovementLimit < 0 ||
                hybrid.neighborAttempts < 0 || hybrid.maxRuntimeSeconds < 0)
                fail("hybrid bounds must be non-negative");
            if (hybrid.swapProbability < 0 || hybrid.swapProbability > 1)
                fail("hybrid.swapProbability must be in [0, 1]");

            if (twoPhase.belowSweetSpotLow > twoPhase.sweetSpotLow ||
                twoPhase.sweetSpotLow > twoPhase.sweetSpotHigh ||
                twoPhase.sweetSpotHigh > twoPhase.aboveSweetSpotHigh)
                fail("twoPhase utilization bands must be ordered");
        }

    private:
        template<typename Fail>
        static void checkSchedule(const std::string& name, double start, double floor,
                                  double rate, Fail&& fail)
        {
            if (!(start > 0) || !(floor > 0))
                fail(name + " temperatures must be positive");
            if (floor > start)
                fail(name + ".minTemperature must not exceed initialTemperature");
            if (!(rate > 0 && rate < 1))
                fail(name + ".coolingRate must be in (0, 1)");
        }
    };

} // namespace tpmopt
