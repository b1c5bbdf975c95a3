#pragma once
/*
===============================================================================
TWO-PHASE OPTIMIZER — Greedy ranking, then overload repair
===============================================================================

PHASE 1 — GREEDY
    Pins first. The other programs are visited in the hybrid construction
    order (complexity_score, required_time, both descending) and committed to
    their highest-ranked legal TPM:

        capacity fit   resulting utilization in [0.80, 0.90]   +100
                                              in [0.70, 0.80)   +80
                                              in (0.90, 1.00]   +60
        timezone       ≤ 3h +50, ≤ 6h +20 (TPM zone vs. program zone)
        affinity       program portfolio in tpm.portfolios      +30

    Illegal TPMs are never ranked; ties go to the lower TPM id.

PHASE 2 — BALANCE
    balanceWorkload() = optimizeDistribution(reachMinimumLoads(fixOverloads(m)))

    fixOverloads: overload-intolerant TPMs above capacity, most overloaded
    first. Their unpinned programs are taken smallest required_time first and
    each is moved to the least-loaded other TPM that has spare capacity (or
    tolerates overload) and accepts it legally, until the source fits.

    reachMinimumLoads and optimizeDistribution are virtual extension points
    that return their input unchanged.

===============================================================================
*/

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "assignment.h"
#include "optimizer.h"

namespace tpmopt {

    class TwoPhaseOptimizer : public Optimizer {
    public:
        using Optimizer::Optimizer;

        std::string_view name() const override { return "two-phase"; }

        Assignment optimize() override {
            stats_.clear();
            moves_ = 0;

            Assignment initial = createFeasibleSolution();
            log() << "Two-phase: " << initial.size() << " of " << programs_.size()
                  << " programs placed by ranking\n";

            assignments_ = balanceWorkload(initial);

            stats_["phase1_assigned"] = static_cast<int>(initial.size());
            stats_["assigned"] = static_cast<int>(assignments_.size());
            stats_["rebalance_moves"] = moves_;
            stats_["overloaded_after"] = static_cast<int>(overloadedTpms(
                AssignmentState(programs_, assignments_)).size());
            return assignments_;
        }

        /// @brief Rank of a TPM for a program under the state; INFEASIBLE_SCORE if illegal
        double rankTpm(const std::string& programId, const std::string& tpmId,
                       const AssignmentState& state) const
        {
            if (!engine_.validateAssignment(programId, tpmId, state))
                return INFEASIBLE_SCORE;

            const auto& tc = config_.twoPhase;
            const Program& p = engine_.program(programId);
            const Tpm& t = engine_.tpm(tpmId);
            double score = 0.0;

            double newLoad = engine_.loadWithout(programId, tpmId, state) + p.required_time;
            if (t.available_time > 0.0 && !engine_.exceedsCapacity(t, newLoad)) {
                double util = newLoad / t.available_time;
                if (util >= tc.sweetSpotLow && util <= tc.sweetSpotHigh)
                    score += tc.sweetSpotBonus;
                else if (util >= tc.belowSweetSpotLow && util < tc.sweetSpotLow)
                    score += tc.belowSweetSpotBonus;
                else if (util > tc.sweetSpotHigh && util <= tc.aboveSweetSpotHigh)
                    score += tc.aboveSweetSpotBonus;
            }

            double diff = engine_.timezoneDifference(t, p);
            if (diff <= config_.scoring.preferredTimezoneSpread)
                score += tc.timezoneCloseBonus;
            else if (diff <= config_.scoring.maxTimezoneSpread)
                score += tc.timezoneFarBonus;

            if (t.portfolios.count(p.portfolio))
                score += tc.portfolioAffinityBonus;

            return score;
        }

        /// @brief Phase 1
        Assignment createFeasibleSolution() const {
            AssignmentState state(programs_, engine_.fixedAssignments());

            for (const auto& programId : constructionOrder()) {
                const std::string* bestTpm = nullptr;
                double bestRank = INFEASIBLE_SCORE;
                for (const auto& [tpmId, t] : tpms_) {
                    double rank = rankTpm(programId, tpmId, state);
                    if (rank > bestRank) {
                        bestRank = rank;
                        bestTpm = &tpmId;
                    }
                }
                if (bestTpm)
                    state.assign(programId, *bestTpm);
            }
            return state.mapping();
        }

        /// @brief Phase 2
        Assignment balanceWorkload(const Assignment& solution) {
            return optimizeDistribution(reachMinimumLoads(fixOverloads(solution)));
        }

        Assignment fixOverloads(const Assignment& solution) {
            AssignmentState state(programs_, solution);

            for (const auto& source : overloadedTpms(state)) {
                const Tpm& from = engine_.tpm(source);

                std::vector<std::string> candidates;
                for (const auto& programId : state.programsOf(source)) {
                    if (!engine_.isFixed(programId))
                        candidates.push_back(programId);
                }
                std::stable_sort(candidates.begin(), candidates.end(), [&](const auto& a, const auto& b) {
                    return programs_.at(a).required_time < programs_.at(b).required_time;
                });

                for (const auto& programId : candidates) {
                    if (!engine_.exceedsCapacity(from, state.load(source)))
                        break;
                    if (auto target = relocationTarget(programId, source, state)) {
                        log() << "Moving " << programId << " from " << source << " to " << *target << "\n";
                        state.assign(programId, *target);
                        ++moves_;
                    }
                }

                if (engine_.exceedsCapacity(from, state.load(source)))
                    log() << "TPM " << source << " remains over capacity\n";
            }
            return state.mapping();
        }

        virtual Assignment reachMinimumLoads(const Assignment& solution) { return solution; }
        virtual Assignment optimizeDistribution(const Assignment& solution) { return solution; }

    protected:
        int moves_ = 0;

        /// @brief Overload-intolerant TPMs above capacity, most overloaded first
        std::vector<std::string> overloadedTpms(const AssignmentState& state) const {
            std::vector<std::pair<double, std::string>> over;
            for (const auto& [tpmId, t] : tpms_) {
                double load = state.load(tpmId);
                if (!t.allow_overload && engine_.exceedsCapacity(t, load))
                    over.emplace_back(load - t.available_time, tpmId);
            }
            std::stable_sort(over.begin(), over.end(), [](const auto& a, const auto& b) {
                return a.first > b.first;
            });
            std::vector<std::string> ids;
            for (auto& [amount, tpmId] : over)
                ids.push_back(std::move(tpmId));
            return ids;
        }

        /// @brief Least-loaded TPM other than source that can legally take the program
        std::optional<std::string> relocationTarget(const std::string& programId,
                                                    const std::string& source,
                                                    const AssignmentState& state) const
        {
            std::vector<std::pair<double, std::string>> targets;
            for (const auto& [tpmId, t] : tpms_) {
                if (tpmId == source)
                    continue;
                double load = state.load(tpmId);
                if (t.allow_overload || load < t.available_time)
                    targets.emplace_back(load, tpmId);
            }
            std::stable_sort(targets.begin(), targets.end(), [](const auto& a, const auto& b) {
                return a.first < b.first;
            });
            for (const auto& [load, tpmId] : targets) {
                if (engine_.validateAssignment(programId, tpmId, state))
                    return tpmId;
            }
            return std::nullopt;
        }
    };

} // namespace tpmopt
