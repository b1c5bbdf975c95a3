#pragma once
/*
===============================================================================
MODEL BUILDER — Template-method lifecycle for a Gurobi model
===============================================================================

Overview
--------
ModelBuilder owns the solver plumbing of the exact strategy: environment,
model, parameters and post-solve status queries. Derived builders only fill
in the hooks:

    optimize() {
        initialize();          // GRBEnv(true) → OutputFlag → start
        addVariables();
        addConstraints();
        addParameters();
        addObjective();
        beforeOptimize();
        model.optimize();
        afterOptimize();
    }

Key Features
------------
1. Lazy initialization: the constructor never touches the solver, so a
   builder can be created and configured without a license. The environment
   is started on the first model() or optimize() call.

2. Parameter setters: quiet(), verbose(), timeLimit(), mipGapLimit(),
   threads(). Each is recorded in params() as "param:<Name>" so a run can
   report what it was solved with.

3. Status helpers: status(), isOptimal(), hasSolution(), objVal(),
   runtime(), solutionCount().

Typical Usage
-------------
    class Knapsack : public ModelBuilder {
        void addVariables() override   { ... }
        void addConstraints() override { ... }
        void addObjective() override   { maximize(expr); }
    };

    Knapsack k;
    k.quiet();
    k.optimize();
    if (k.isOptimal()) { ... }

Design Notes
------------
* Parameter setters called before the environment exists are buffered and
  applied to the environment in initialize(); OutputFlag must be set on the
  environment before start() to silence the license banner.
* GRBException is never caught here.

===============================================================================
*/

#include <memory>
#include <string>

#include "gurobi_c++.h"

#include "run_stats.h"

namespace tpmopt {

    class ModelBuilder {
        std::unique_ptr<GRBEnv> env_;
        std::unique_ptr<GRBModel> model_;
        bool initialized_ = false;

        // Buffered until the environment exists
        int outputFlag_ = 1;
        double timeLimit_ = -1.0;
        double mipGap_ = -1.0;
        int threads_ = -1;

    protected:
        RunStats params_;

    public:
        ModelBuilder() = default;
        virtual ~ModelBuilder() = default;

        ModelBuilder(const ModelBuilder&) = delete;
        ModelBuilder& operator=(const ModelBuilder&) = delete;

        // ---------------------------------------------------------------------
        // Initialization
        // ---------------------------------------------------------------------

        void initialize() {
            if (initialized_)
                return;

            env_ = std::make_unique<GRBEnv>(true);
            env_->set(GRB_IntParam_OutputFlag, outputFlag_);
            env_->start();
            model_ = std::make_unique<GRBModel>(*env_);
            initialized_ = true;

            applyBufferedParameters();
        }

        GRBModel& model() {
            if (!initialized_)
                initialize();
            return *model_;
        }

        const GRBModel& model() const {
            return *model_;
        }

        bool initialized() const noexcept { return initialized_; }

        const RunStats& params() const noexcept { return params_; }

        // ---------------------------------------------------------------------
        // Parameters
        // ---------------------------------------------------------------------

        void quiet() {
            outputFlag_ = 0;
            params_["param:OutputFlag"] = 0;
            applyBufferedParameters();
        }

        void verbose() {
            outputFlag_ = 1;
            params_["param:OutputFlag"] = 1;
            applyBufferedParameters();
        }

        /// @param seconds Wall-clock limit; values <= 0 leave the solver default
        void timeLimit(double seconds) {
            if (seconds <= 0.0)
                return;
            timeLimit_ = seconds;
            params_["param:TimeLimit"] = seconds;
            applyBufferedParameters();
        }

        /// @param gap Relative gap (0.01 = 1%); negative values leave the default
        void mipGapLimit(double gap) {
            if (gap < 0.0)
                return;
            mipGap_ = gap;
            params_["param:MIPGap"] = gap;
            applyBufferedParameters();
        }

        /// @param n Thread count; 0 leaves the solver default
        void threads(int n) {
            if (n <= 0)
                return;
            threads_ = n;
            params_["param:Threads"] = n;
            applyBufferedParameters();
        }

        // ---------------------------------------------------------------------
        // Objective
        // ---------------------------------------------------------------------

        void maximize(const GRBLinExpr& expr) { model().setObjective(expr, GRB_MAXIMIZE); }

        // ---------------------------------------------------------------------
        // Status
        // ---------------------------------------------------------------------

        int status() const { return model().get(GRB_IntAttr_Status); }
        bool isOptimal() const { return status() == GRB_OPTIMAL; }

        bool hasSolution() const {
            int s = status();
            return s == GRB_OPTIMAL || s == GRB_SUBOPTIMAL || s == GRB_SOLUTION_LIMIT ||
                   ((s == GRB_TIME_LIMIT || s == GRB_NODE_LIMIT) && solutionCount() > 0);
        }

        double objVal() const { return model().get(GRB_DoubleAttr_ObjVal); }
        double runtime() const { return model().get(GRB_DoubleAttr_Runtime); }
        int solutionCount() const { return model().get(GRB_IntAttr_SolCount); }

        // ---------------------------------------------------------------------
        // Hooks
        // ---------------------------------------------------------------------

        virtual void addVariables() {}
        virtual void addConstraints() {}
        virtual void addParameters() {}
        virtual void addObjective() {}
        virtual void beforeOptimize() {}
        virtual void afterOptimize() {}

        GRBModel& optimize() {
            initialize();

            addVariables();
            addConstraints();
            addParameters();
            addObjective();

            beforeOptimize();
            model().optimize();
            afterOptimize();

            return model();
        }

    private:
        void applyBufferedParameters() {
            if (!initialized_)
                return;
            GRBModel& m = *model_;
            m.set(GRB_IntParam_OutputFlag, outputFlag_);
            if (timeLimit_ > 0.0)
                m.set(GRB_DoubleParam_TimeLimit, timeLimit_);
            if (mipGap_ >= 0.0)
                m.set(GRB_DoubleParam_MIPGap, mipGap_);
            if (threads_ > 0)
                m.set(GRB_IntParam_Threads, threads_);
        }
    };

} // namespace tpmopt
