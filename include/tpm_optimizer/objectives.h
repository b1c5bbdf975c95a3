#pragma once
/*
===============================================================================
OBJECTIVES — Closed set of whole-solution evaluators
===============================================================================

OVERVIEW
--------
Four evaluators score a complete mapping from different angles. Each carries
a HARD/SOFT tag and a name; higher is better for all of them.

    Capacity     HARD  -w · Σ overload over TPMs that do not allow overload
    Utilization  SOFT  -w · Σ (minUtilization - utilization) over loaded TPMs
                       that sit below the threshold
    Timezone     SOFT  per assignment: +1 (≤3h), +0.5 (≤6h), -1 beyond
    Portfolio    SOFT  per TPM: -w · (tags - cap) above the cap,
                       +1 for exactly hitting the diversity target

The set is closed, so it is a std::variant rather than a class hierarchy.
Free functions dispatch over it with std::visit:

    Objective o = CapacityObjective{};
    double s = evaluate(o, solution, engine);
    ConstraintType t = constraintType(o);     // Hard
    std::string_view n = objectiveName(o);    // "Capacity"

Weights and thresholds come from the engine's ScoringConfig, so the
evaluators themselves are stateless.

Timezone distance here is the plain TPM zone to program zone distance, not the
stakeholder barycenter used by the pair score.

===============================================================================
*/

#include <map>
#include <set>
#include <string_view>
#include <variant>
#include <vector>

#include "assignment.h"
#include "constraints.h"
#include "domain.h"
#include "enum_utils.h"

namespace tpmopt {

    TPMOPT_DECLARE_ENUM_WITH_COUNT(ObjectiveKind, Capacity, Utilization, Timezone, Portfolio);

    struct CapacityObjective {
        static constexpr ObjectiveKind kind = ObjectiveKind::Capacity;
        static constexpr ConstraintType type = ConstraintType::Hard;

        double evaluate(const Assignment& solution, const ConstraintEngine& engine) const {
            AssignmentState state(engine.programs(), solution);
            double overload = 0.0;
            for (const auto& [tpmId, t] : engine.tpms()) {
                double load = state.load(tpmId);
                if (!t.allow_overload && engine.exceedsCapacity(t, load))
                    overload += load - t.available_time;
            }
            return -engine.config().capacityObjectiveWeight * overload;
        }
    };

    struct UtilizationObjective {
        static constexpr ObjectiveKind kind = ObjectiveKind::Utilization;
        static constexpr ConstraintType type = ConstraintType::Soft;

        double evaluate(const Assignment& solution, const ConstraintEngine& engine) const {
            const auto& cfg = engine.config();
            AssignmentState state(engine.programs(), solution);
            double score = 0.0;
            for (const auto& [tpmId, t] : engine.tpms()) {
                double load = state.load(tpmId);
                if (load <= 0.0 || t.available_time <= 0.0)
                    continue;
                double utilization = load / t.available_time;
                if (utilization < cfg.minUtilization)
                    score -= (cfg.minUtilization - utilization) * cfg.utilizationObjectiveWeight;
            }
            return score;
        }
    };

    struct TimezoneObjective {
        static constexpr ObjectiveKind kind = ObjectiveKind::Timezone;
        static constexpr ConstraintType type = ConstraintType::Soft;

        double evaluate(const Assignment& solution, const ConstraintEngine& engine) const {
            const auto& cfg = engine.config();
            double score = 0.0;
            for (const auto& [programId, tpmId] : solution) {
                double diff = engine.timezoneDifference(engine.tpm(tpmId), engine.program(programId));
                if (diff <= cfg.preferredTimezoneSpread)
                    score += 1.0;
                else if (diff <= cfg.maxTimezoneSpread)
                    score += 0.5;
                else
                    score -= 1.0;
            }
            return score;
        }
    };

    struct PortfolioObjective {
        static constexpr ObjectiveKind kind = ObjectiveKind::Portfolio;
        static constexpr ConstraintType type = ConstraintType::Soft;

        double evaluate(const Assignment& solution, const ConstraintEngine& engine) const {
            const auto& cfg = engine.config();
            AssignmentState state(engine.programs(), solution);
            double score = 0.0;
            for (const auto& tpmId : state.usedTpms()) {
                int tags = state.distinctPortfolios(tpmId);
                if (tags > cfg.maxPortfolios)
                    score -= (tags - cfg.maxPortfolios) * cfg.portfolioObjectiveWeight;
                else if (tags == cfg.targetPortfolioDiversity)
                    score += 1.0;
            }
            return score;
        }
    };

    using Objective = std::variant<CapacityObjective, UtilizationObjective,
                                   TimezoneObjective, PortfolioObjective>;

    inline double evaluate(const Objective& objective, const Assignment& solution,
                           const ConstraintEngine& engine)
    {
        return std::visit([&](const auto& o) { return o.evaluate(solution, engine); }, objective);
    }

    inline ConstraintType constraintType(const Objective& objective) {
        return std::visit([](const auto& o) { return o.type; }, objective);
    }

    inline ObjectiveKind objectiveKind(const Objective& objective) {
        return std::visit([](const auto& o) { return o.kind; }, objective);
    }

    inline std::string_view objectiveName(const Objective& objective) {
        return enumName(objectiveKind(objective));
    }

    /// @brief One instance of every objective, in ObjectiveKind order
    inline std::vector<Objective> standardObjectives() {
        return {CapacityObjective{}, UtilizationObjective{}, TimezoneObjective{},
                PortfolioObjective{}};
    }

    /// @brief Score of every standard objective, keyed by kind
    inline std::map<ObjectiveKind, double> evaluateAll(const Assignment& solution,
                                                       const ConstraintEngine& engine)
    {
        std::map<ObjectiveKind, double> scores;
        for (const auto& objective : standardObjectives())
            scores[objectiveKind(objective)] = evaluate(objective, solution, engine);
        return scores;
    }

} // namespace tpmopt
