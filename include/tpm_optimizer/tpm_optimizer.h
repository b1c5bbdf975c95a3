#pragma once
/*
===============================================================================
TPM OPTIMIZER — Umbrella header
===============================================================================

Assigns programs to TPMs under capacity, level, conflict and portfolio
constraints with one of four interchangeable strategies.

    #include "tpm_optimizer/tpm_optimizer.h"
    using namespace tpmopt;

    TpmMap tpms = makeTpmMap({...});
    ProgramMap programs = makeProgramMap({...});

    auto cfg = OptimizerConfig::preset(Preset::Default);
    cfg.seed = 42;

    auto opt = makeOptimizer(parseStrategy("hybrid"), tpms, programs, cfg);
    opt->verbose(std::cout);
    Assignment result = opt->optimize();

    summarize(result, opt->engine()).print(std::cout);

Headers, leaves first:

    enum_utils.h           named enums with COUNT sentinel
    run_stats.h            per-run key/value statistics
    domain.h               Tpm, Program, problem constants
    config.h               OptimizerConfig and presets
    timezone.h             TimezoneScorer, StaticTimezoneTable
    assignment.h           Assignment, AssignmentState, moves with undo
    constraints.h          ConstraintEngine (legality and pair score)
    objectives.h           Capacity / Utilization / Timezone / Portfolio
    solution.h             metric vector and Pareto dominance
    optimizer.h            Optimizer base class
    model_builder.h        Gurobi model lifecycle
    variables.h            sparse (TPM, program) binaries
    diagnostics.h          solver status and pre-solve analyses
    exact_optimizer.h      Gurobi strategy
    annealing_optimizer.h  simulated annealing strategy
    hybrid_optimizer.h     Pareto-guided strategy
    two_phase_optimizer.h  greedy + rebalancing strategy
    strategies.h           parseStrategy, makeOptimizer
    summary.h              utilization rows and headline metrics

===============================================================================
*/

#include "enum_utils.h"
#include "run_stats.h"
#include "domain.h"
#include "config.h"
#include "timezone.h"
#include "assignment.h"
#include "constraints.h"
#include "objectives.h"
#include "solution.h"
#include "optimizer.h"
#include "model_builder.h"
#include "variables.h"
#include "diagnostics.h"
#include "exact_optimizer.h"
#include "annealing_optimizer.h"
#include "hybrid_optimizer.h"
#include "two_phase_optimizer.h"
#include "strategies.h"
#include "summary.h"
