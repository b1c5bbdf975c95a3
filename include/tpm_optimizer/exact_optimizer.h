#pragma once
/*
===============================================================================
EXACT OPTIMIZER — Binary assignment model solved with Gurobi
===============================================================================

OVERVIEW
--------
Formulates the remaining (unpinned) part of the problem as a 0/1 program and
hands it to Gurobi through ModelBuilder.

    pre-assign  every program with a resolvable pin goes to its TPM

    variables   x[t,p] ∈ {0,1}    for each TPM t, each unpinned program p

    maximize    Σ score(p,t) · x[t,p]        over pairs with a finite score

    subject to  Σ_t x[t,p] = 1                       each unpinned program
                Σ_p req(p) · x[t,p] ≤ max(0, cap(t) − pinned(t))
                                                     each TPM without overload
                x[t,p] = 0                           each illegal pair

Scores and legality are taken against the pinned-only snapshot.

A capacity right-hand side that pins already push below zero is clamped at 0:
the overloaded TPM receives nothing more, and the overload itself is reported
by the fixed-assignment analysis rather than making the whole model
infeasible.

BEFORE SOLVING
--------------
Three analyses run (config.exact.runDiagnostics) and are kept on the
optimizer for inspection: capacityReport(), fixedAssignmentReport(),
levelReport(). In verbose mode they are also printed.

RESULT
------
    OPTIMAL     pins plus every x[t,p] > 0.5
    otherwise   pins only; the status is recorded in stats()["solver_status"]
                and stats()["incumbent"] tells whether a feasible but
                unproven solution was discarded

GRBException (missing license, bad parameter) propagates to the caller.

===============================================================================
*/

#include <algorithm>
#include <cmath>
#include <string>
#include <string_view>
#include <vector>

#include "gurobi_c++.h"

#include "diagnostics.h"
#include "model_builder.h"
#include "optimizer.h"
#include "variables.h"

namespace tpmopt {

    /**
     * @class ExactAssignmentModel
     * @brief The 0/1 assignment model over the unpinned programs
     */
    class ExactAssignmentModel : public ModelBuilder {
        const ConstraintEngine& engine_;
        const ExactConfig& config_;
        AssignmentState pinned_;
        std::vector<std::string> open_;       ///< Unpinned program ids

        PairVariableSet x_;
        GRBLinExpr objective_;
        int forcedZero_ = 0;

    public:
        ExactAssignmentModel(const ConstraintEngine& engine, const ExactConfig& config)
            : engine_(engine), config_(config),
              pinned_(engine.programs(), engine.fixedAssignments())
        {
            for (const auto& [programId, p] : engine_.programs()) {
                if (!engine_.isFixed(programId))
                    open_.push_back(programId);
            }
        }

        const PairVariableSet& variables() const noexcept { return x_; }
        const std::vector<std::string>& openPrograms() const noexcept { return open_; }
        int forcedZeroCount() const noexcept { return forcedZero_; }

        void addVariables() override {
            for (const auto& [tpmId, t] : engine_.tpms()) {
                for (const auto& programId : open_)
                    x_.add(model(), tpmId, programId);
            }
        }

        void addConstraints() override {
            GRBModel& m = model();

            for (const auto& programId : open_) {
                GRBLinExpr cover;
                for (const auto& [tpmId, t] : engine_.tpms())
                    cover += x_.at(tpmId, programId);
                m.addConstr(cover == 1.0, "cover[" + programId + "]");
            }

            for (const auto& [tpmId, t] : engine_.tpms()) {
                if (t.allow_overload)
                    continue;
                GRBLinExpr load;
                for (const auto& programId : open_)
                    load += engine_.program(programId).required_time * x_.at(tpmId, programId);
                double rhs = std::max(0.0, t.available_time - pinned_.load(tpmId));
                m.addConstr(load <= rhs, "capacity[" + tpmId + "]");
            }

            for (auto& e : x_) {
                if (!engine_.validateAssignment(e.program, e.tpm, pinned_)) {
                    m.addConstr(e.var == 0.0, "illegal[" + e.tpm + "," + e.program + "]");
                    ++forcedZero_;
                }
            }
        }

        void addParameters() override {
            timeLimit(config_.timeLimitSeconds);
            mipGapLimit(config_.mipGap);
            threads(config_.threads);
        }

        void addObjective() override {
            objective_ = GRBLinExpr();
            for (auto& e : x_) {
                double score = engine_.calculateAssignmentScore(e.program, e.tpm, pinned_);
                if (std::isfinite(score))
                    objective_ += score * e.var;
            }
            maximize(objective_);
        }

        /// @brief Pins plus the selected pairs; pins only unless optimal
        Assignment extract() const {
            Assignment result = engine_.fixedAssignments();
            if (!isOptimal())
                return result;
            for (const auto& e : x_) {
                if (value(e.var) > 0.5)
                    result[e.program] = e.tpm;
            }
            return result;
        }
    };

    /**
     * @class ExactOptimizer
     * @brief Optimal assignment of the unpinned programs via Gurobi
     */
    class ExactOptimizer : public Optimizer {
        CapacityReport capacityReport_;
        FixedAssignmentReport fixedReport_;
        LevelReport levelReport_;
        std::string status_ = "NOT_RUN";
        std::string modelSummary_;

    public:
        using Optimizer::Optimizer;

        std::string_view name() const override { return "exact"; }

        Assignment optimize() override {
            stats_.clear();

            if (config_.exact.runDiagnostics)
                runDiagnostics();

            log() << "Pre-assigning " << engine_.fixedAssignments().size()
                  << " fixed program(s)\n";

            ExactAssignmentModel model(engine_, config_.exact);
            if (isVerbose())
                model.verbose();
            else
                model.quiet();

            model.optimize();

            status_ = statusString(model.status());
            modelSummary_ = tpmopt::modelSummary(model.model());
            assignments_ = model.extract();

            stats_["solver_status"] = status_;
            stats_["optimal"] = model.isOptimal();
            stats_["model"] = modelSummary_;
            stats_["variables"] = static_cast<int>(model.variables().size());
            stats_["forced_zero"] = model.forcedZeroCount();
            stats_["fixed"] = static_cast<int>(engine_.fixedAssignments().size());
            stats_["assigned"] = static_cast<int>(assignments_.size());
            stats_["runtime_s"] = model.runtime();
            stats_["incumbent"] = model.hasSolution();
            if (model.isOptimal())
                stats_["objective"] = model.objVal();

            log() << "Solver status: " << status_ << " (" << modelSummary_ << ")\n";
            if (!model.isOptimal()) {
                if (model.hasSolution())
                    log() << "Incumbent with " << model.solutionCount()
                          << " solution(s) discarded: not proven optimal\n";
                log() << "No optimal solution; returning fixed assignments only\n";
            }

            return assignments_;
        }

        const CapacityReport& capacityReport() const noexcept { return capacityReport_; }
        const FixedAssignmentReport& fixedAssignmentReport() const noexcept { return fixedReport_; }
        const LevelReport& levelReport() const noexcept { return levelReport_; }
        const std::string& solverStatus() const noexcept { return status_; }
        const std::string& modelSize() const noexcept { return modelSummary_; }

        /// @brief Run the three pre-solve analyses without building a model
        void runDiagnostics() {
            capacityReport_ = analyzeTpmCapacities(engine_);
            fixedReport_ = analyzeFixedAssignments(engine_);
            levelReport_ = analyzeLevelRequirements(engine_);

            stats_["fixed_issues"] = static_cast<int>(fixedReport_.issues.size());
            stats_["level_issues"] = static_cast<int>(levelReport_.issues.size());

            capacityReport_.print(log());
            fixedReport_.print(log());
            levelReport_.print(log());
        }
    };

} // namespace tpmopt
