#pragma once
/*
===============================================================================
ANNEALING OPTIMIZER — Simulated annealing over the assignment mapping
===============================================================================

OVERVIEW
--------
Starts from a random legal mapping and walks it with single-program moves,
accepting worse states with probability exp(Δ/T) under geometric cooling.

    initial     pins, then for each other program a random TPM that is legal
                against the mapping built so far; no legal TPM → unassigned

    energy      Σ pair scores                 (-inf if any pair is illegal)
              − 2.0  · portfolio violations   (assignments on TPMs above the
                                               portfolio cap)
              − 1.5  · timezone violations    (assignments > 6h away)
              − 10.0 · total overload         (overload-intolerant TPMs)
              − 5.0  · Σ (0.70 − util)        (used TPMs below 0.70)
              − 10.0 · Σ (0.50 − util)        (used TPMs below 0.50)
              − 5.0  · unused × overloaded    (idle TPMs while others overflow)

    neighbor    p = 0.5: swap the TPMs of two unpinned programs on different
                TPMs; otherwise move one unpinned program to a random legal
                TPM other than its current one

    schedule    T₀ = 1.0, T ← 0.995·T, stop at T ≤ 0.001 or 10 000 iterations

All figures come from AnnealingConfig and ScoringConfig.

Moves are applied in place on an AssignmentState and reverted when rejected;
the mapping is copied only when a new best state is found.

Pinned pairs contribute their unconditional composite score when
ScoringConfig::fixedAssignmentsBypassLegality is set, so an illegal pin does
not make every state -inf.

RESULT
------
The best finite-energy state seen (the initial state if none was finite, in
which case stats()["feasible"] is false). Throws std::logic_error if that
state does not honor every pin.

===============================================================================
*/

#include <chrono>
#include <cmath>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "assignment.h"
#include "optimizer.h"

namespace tpmopt {

    class AnnealingOptimizer : public Optimizer {
    public:
        using Optimizer::Optimizer;

        std::string_view name() const override { return "annealing"; }

        /// @brief Energy of a state; higher is better, -inf for an illegal pair
        double energy(const AssignmentState& state) const {
            const auto& sc = config_.scoring;
            const auto& ac = config_.annealing;

            double total = 0.0;
            int portfolioViolations = 0;
            int timezoneViolations = 0;

            for (const auto& [programId, tpmId] : state.mapping()) {
                double s = engine_.pairScore(programId, tpmId, state);
                if (s == INFEASIBLE_SCORE)
                    return INFEASIBLE_SCORE;
                total += s;

                if (state.distinctPortfolios(tpmId) > sc.maxPortfolios)
                    ++portfolioViolations;
                if (engine_.timezoneDifference(engine_.tpm(tpmId), engine_.program(programId)) >
                    sc.maxTimezoneSpread)
                    ++timezoneViolations;
            }

            double overload = 0.0;
            double utilization = 0.0;
            int unused = 0;
            int overloaded = 0;
            for (const auto& [tpmId, t] : tpms_) {
                double load = state.load(tpmId);
                if (state.programsOf(tpmId).empty()) {
                    ++unused;
                    continue;
                }
                if (!t.allow_overload && engine_.exceedsCapacity(t, load)) {
                    overload += load - t.available_time;
                    ++overloaded;
                }
                if (t.available_time <= 0.0)
                    continue;
                double util = load / t.available_time;
                if (util < sc.minUtilization)
                    utilization += (sc.minUtilization - util) * ac.utilizationPenalty;
                if (util < sc.severeUtilization)
                    utilization += (sc.severeUtilization - util) * ac.severeUtilizationPenalty;
            }

            if (unused > 0 && overloaded > 0)
                total -= unused * overloaded * ac.idleWhileOverloadedPenalty;

            total -= portfolioViolations * ac.portfolioPenalty +
                     timezoneViolations * ac.timezonePenalty +
                     overload * ac.capacityPenalty + utilization;
            return total;
        }

        Assignment optimize() override {
            const auto& ac = config_.annealing;
            const auto started = std::chrono::steady_clock::now();
            stats_.clear();

            AssignmentState state = initialState();
            double current = energy(state);
            Assignment best = state.mapping();
            double bestEnergy = current;

            log() << "Annealing: " << state.size() << " of " << programs_.size()
                  << " programs placed initially, energy " << current << "\n";

            double temperature = ac.initialTemperature;
            int iteration = 0;
            int accepted = 0;
            int improvements = 0;

            while (temperature > ac.minTemperature && iteration < ac.maxIterations) {
                std::optional<Move> move = proposeMove(state, ac.swapProbability);
                if (move) {
                    applyMove(state, *move);
                    double candidate = energy(state);

                    if (accept(candidate, current, temperature)) {
                        current = candidate;
                        ++accepted;
                        if (current > bestEnergy) {
                            best = state.mapping();
                            bestEnergy = current;
                            ++improvements;
                        }
                    } else {
                        revertMove(state, *move);
                    }
                }

                temperature *= ac.coolingRate;
                ++iteration;

                if (ac.progressInterval > 0 && iteration % ac.progressInterval == 0) {
                    std::ostringstream line;
                    line << "Iteration " << iteration << ", temperature " << std::fixed
                         << std::setprecision(4) << temperature << ", current "
                         << std::setprecision(2) << current << ", best " << bestEnergy << "\n";
                    log() << line.str();
                }
            }

            if (!engine_.validateFixedAssignmentsSolution(best))
                throw std::logic_error("AnnealingOptimizer: result does not honor fixed assignments");

            const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
            stats_["iterations"] = iteration;
            stats_["accepted"] = accepted;
            stats_["improvements"] = improvements;
            stats_["best_energy"] = bestEnergy;
            stats_["feasible"] = std::isfinite(bestEnergy);
            stats_["final_temperature"] = temperature;
            stats_["assigned"] = static_cast<int>(best.size());
            stats_["unassigned"] = static_cast<int>(programs_.size() - best.size());
            stats_["runtime_s"] = elapsed.count();

            log() << "Annealing finished after " << iteration << " iterations, best energy "
                  << bestEnergy << "\n";
            if (!std::isfinite(bestEnergy))
                log() << "Annealing: no feasible state found; returning the initial placement\n";

            assignments_ = std::move(best);
            return assignments_;
        }

    protected:
        /// @brief Pins plus a random legal TPM for every other program that has one
        virtual AssignmentState initialState() {
            AssignmentState state(programs_, engine_.fixedAssignments());
            for (const auto& [programId, p] : programs_) {
                if (engine_.isFixed(programId))
                    continue;
                auto candidates = engine_.feasibleTpms(programId, state);
                if (!candidates.empty())
                    state.assign(programId, candidates[pick(candidates.size())]);
            }
            return state;
        }

    private:
        bool accept(double candidate, double current, double temperature) {
            if (candidate == INFEASIBLE_SCORE)
                return false;
            if (candidate > current)
                return true;
            return uniform() < std::exp((candidate - current) / temperature);
        }
    };

} // namespace tpmopt
