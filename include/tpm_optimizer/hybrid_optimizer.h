#pragma once
/*
===============================================================================
HYBRID OPTIMIZER — Pareto-guided construction followed by local search
===============================================================================

OVERVIEW
--------
Works on the Solution metric vector instead of a scalar energy.

CONSTRUCTION
    Start from the pins. Visit the other programs by complexity_score, then
    required_time, both descending (id order breaks ties). For each, try every
    legal TPM; keep the first one tried unless a later candidate's Solution
    dominates it. Programs with no legal TPM stay unassigned.

REFINEMENT
    neighbor   up to 50 random moves (as in the annealing strategy) are tried;
               the first one whose result is feasible and whose moved pairs
               all pass validateAssignment is taken, else the state is kept
    accept     if the neighbor dominates the current Solution; otherwise with
               probability min(1, exp(improvedMetricCount / T))
    best       replaced only by a neighbor that dominates it
    stop       T ≤ 0.001, 5 000 iterations, 300 s, or 1 000 iterations since
               the best was last replaced

The exponent of the fallback acceptance is never negative, so a non-dominating
neighbor is always accepted: refinement behaves as a random walk over feasible
states, and the returned best is the last dominating state found.

Why the run stopped is recorded in stats()["stop_reason"].

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cmath>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "assignment.h"
#include "optimizer.h"
#include "solution.h"

namespace tpmopt {

    class HybridOptimizer : public Optimizer {
    public:
        using Optimizer::Optimizer;

        std::string_view name() const override { return "hybrid"; }

        /// @brief Dominance-guided greedy mapping
        AssignmentState construct() const {
            AssignmentState state(programs_, engine_.fixedAssignments());

            for (const auto& programId : constructionOrder()) {
                std::optional<std::string> chosen;
                std::optional<MetricVector> chosenMetrics;

                for (const auto& tpmId : engine_.feasibleTpms(programId, state)) {
                    Move trial = makeReassign(state, programId, tpmId);
                    applyMove(state, trial);
                    MetricVector metrics = computeMetrics(state, engine_);
                    revertMove(state, trial);

                    if (!chosenMetrics || dominates(metrics, *chosenMetrics)) {
                        chosen = tpmId;
                        chosenMetrics = metrics;
                    }
                }
                if (chosen)
                    state.assign(programId, *chosen);
            }
            return state;
        }

        Assignment optimize() override {
            const auto& hc = config_.hybrid;
            const auto started = std::chrono::steady_clock::now();
            auto elapsed = [&] {
                return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
            };
            stats_.clear();

            log() << "Hybrid: building initial solution\n";
            AssignmentState state = construct();
            Solution current(state, engine_);
            Solution best = current;
            log() << "Initial metrics: " << formatMetrics(current.metrics()) << "\n";

            double temperature = hc.initialTemperature;
            int iteration = 0;
            int sinceImprovement = 0;
            int accepted = 0;
            int improvements = 0;
            std::string stopReason;

            while (true) {
                if (!(temperature > hc.minTemperature)) {
                    stopReason = "temperature";
                    break;
                }
                if (iteration >= hc.maxIterations) {
                    stopReason = "iterations";
                    break;
                }
                if (elapsed() >= hc.maxRuntimeSeconds) {
                    stopReason = "runtime";
                    break;
                }
                if (sinceImprovement >= hc.noImprovementLimit) {
                    stopReason = "no_improvement";
                    break;
                }

                if (hc.progressInterval > 0 && iteration % hc.progressInterval == 0)
                    log() << "Iteration " << iteration << ", temperature " << temperature
                          << ", metrics " << formatMetrics(current.metrics()) << "\n";

                std::optional<Move> move = feasibleNeighbor(state);
                Solution neighbor = move ? Solution(state, engine_) : current;

                if (neighbor.dominates(current)) {
                    current = neighbor;
                    ++accepted;
                    if (neighbor.dominates(best)) {
                        best = neighbor;
                        sinceImprovement = 0;
                        ++improvements;
                        log() << "New best: " << formatMetrics(best.metrics()) << "\n";
                    }
                } else {
                    int improved = neighbor.improvedMetricCount(current);
                    double probability = std::min(1.0, std::exp(improved / temperature));
                    if (uniform() < probability) {
                        current = neighbor;
                        ++accepted;
                    } else if (move) {
                        revertMove(state, *move);
                    }
                }

                temperature *= hc.coolingRate;
                ++iteration;
                ++sinceImprovement;
            }

            stats_["iterations"] = iteration;
            stats_["accepted"] = accepted;
            stats_["improvements"] = improvements;
            stats_["stop_reason"] = stopReason;
            stats_["final_temperature"] = temperature;
            stats_["runtime_s"] = elapsed();
            forEachEnum<Metric>([&](Metric m) {
                stats_["best_" + std::string(enumName(m))] = best.metric(m);
            });

            log() << "Hybrid finished after " << iteration << " iterations (" << stopReason
                  << "), best " << formatMetrics(best.metrics()) << "\n";

            assignments_ = best.assignments();
            return assignments_;
        }

    private:
        /**
         * @brief Apply the first of up to neighborAttempts random moves that
         *        keeps the state feasible
         * @return The applied move, or nullopt with the state unchanged
         */
        std::optional<Move> feasibleNeighbor(AssignmentState& state) {
            for (int attempt = 0; attempt < config_.hybrid.neighborAttempts; ++attempt) {
                std::optional<Move> move = proposeMove(state, config_.hybrid.swapProbability);
                if (!move)
                    continue;

                applyMove(state, *move);
                if (movedPairsLegal(state, *move) && Solution(state, engine_).isFeasible())
                    return move;
                revertMove(state, *move);
            }
            return std::nullopt;
        }

        bool movedPairsLegal(const AssignmentState& state, const Move& move) const {
            for (const auto& programId : movedPrograms(move)) {
                const std::string* tpmId = state.tpmOf(programId);
                if (!tpmId || !engine_.validateAssignment(programId, *tpmId, state))
                    return false;
            }
            return true;
        }
    };

} // namespace tpmopt
