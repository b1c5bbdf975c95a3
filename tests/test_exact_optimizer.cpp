/*
===============================================================================
TEST EXACT OPTIMIZER — Tests for model_builder.h, variables.h and
exact_optimizer.h
===============================================================================

OVERVIEW
--------
The exact strategy formulates the unpinned programs as a 0/1 model and solves
it with Gurobi. Section A needs no solver; every test tagged [gurobi] starts
an environment and therefore needs a license.

TEST ORGANIZATION
-----------------
• Section A: ModelBuilder parameter buffering (no solver)
• Section B: Model structure
• Section C: Solutions
• Section D: Diagnostics and run statistics

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• exact_optimizer.h - System under test
• Gurobi C++ API - Solver backend

===============================================================================
*/

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

#include <tpm_optimizer/exact_optimizer.h>

using namespace tpmopt;
using Catch::Approx;

namespace {

    Tpm tpm(const std::string& id, double capacity, int level) {
        return Tpm(id, id, "UTC", capacity, level);
    }

    Program program(const std::string& id, double time, int level,
                    const std::string& pin = "", const std::string& portfolio = "Core")
    {
        Program p(id, id, "UTC", time, level);
        p.fixed_tpm = pin;
        p.portfolio = portfolio;
        return p;
    }

    /// Records hook order without building anything
    class RecordingBuilder : public ModelBuilder {
    public:
        std::string trace;

        void addVariables() override { trace += "V"; }
        void addConstraints() override { trace += "C"; }
        void addParameters() override { trace += "P"; }
        void addObjective() override { trace += "O"; }
        void beforeOptimize() override { trace += "<"; }
        void afterOptimize() override { trace += ">"; }
    };

} // namespace

// ============================================================================
// SECTION A: MODELBUILDER PARAMETER BUFFERING
// ============================================================================

/**
 * @test ModelBuilder::LazyConstruction
 * @brief Construction and parameter setters never start an environment
 */
TEST_CASE("A1: ModelBuilder::LazyConstruction", "[exact][builder]")
{
    RecordingBuilder b;
    b.quiet();
    b.timeLimit(30.0);
    b.mipGapLimit(0.01);
    b.threads(2);

    REQUIRE_FALSE(b.initialized());
    REQUIRE(b.params().get<int>("param:OutputFlag") == 0);
    REQUIRE(b.params().get<double>("param:TimeLimit") == 30.0);
    REQUIRE(b.params().get<double>("param:MIPGap") == 0.01);
    REQUIRE(b.params().get<int>("param:Threads") == 2);
}

/**
 * @test ModelBuilder::IgnoredValues
 * @brief Non-positive limits and a negative gap leave the solver default
 */
TEST_CASE("A2: ModelBuilder::IgnoredValues", "[exact][builder]")
{
    RecordingBuilder b;
    b.timeLimit(0.0);
    b.mipGapLimit(-1.0);
    b.threads(0);

    REQUIRE_FALSE(b.params().contains("param:TimeLimit"));
    REQUIRE_FALSE(b.params().contains("param:MIPGap"));
    REQUIRE_FALSE(b.params().contains("param:Threads"));
}

TEST_CASE("A3: PairVariableSet::Naming", "[exact][variables]")
{
    REQUIRE(pairVariableName("T1", "P3") == "assign[T1,P3]");

    PairVariableSet x;
    REQUIRE(x.empty());
    REQUIRE_FALSE(x.contains("T1", "P3"));
    REQUIRE(x.try_get("T1", "P3") == nullptr);
    REQUIRE_THROWS_AS(x.at("T1", "P3"), std::out_of_range);
}

// ============================================================================
// SECTION B: MODEL STRUCTURE
// ============================================================================

/**
 * @test ModelBuilder::HookOrder
 */
TEST_CASE("B1: ModelBuilder::HookOrder", "[exact][builder][gurobi]")
{
    RecordingBuilder b;
    b.quiet();
    b.optimize();

    REQUIRE(b.trace == "VCPO<>");
    REQUIRE(b.initialized());
}

/**
 * @test ExactAssignmentModel::Structure
 * @given 2 TPMs, 3 programs of which one is pinned and one is illegal on T1
 * @then 4 binaries, 2 cover + 2 capacity + 1 illegal constraints
 */
TEST_CASE("B2: ExactAssignmentModel::Structure", "[exact][model][gurobi]")
{
    TpmMap tpms = makeTpmMap({tpm("T1", 1.0, 2), tpm("T2", 1.0, 4)});
    ProgramMap programs = makeProgramMap({program("P1", 0.3, 1, "T1"), program("P2", 0.3, 1),
                                          program("P3", 0.3, 4)});
    ScoringConfig scoring;
    ExactConfig exact;
    ConstraintEngine engine(tpms, programs, scoring, defaultTimezoneTable());

    ExactAssignmentModel model(engine, exact);
    model.quiet();
    model.optimize();

    REQUIRE(model.openPrograms() == std::vector<std::string>{"P2", "P3"});
    REQUIRE(model.variables().size() == 4);
    REQUIRE(model.forcedZeroCount() == 1);

    auto stats = computeStatistics(model.model());
    REQUIRE(stats.numVars == 4);
    REQUIRE(stats.numBinary == 4);
    REQUIRE(stats.numConstrs == 5);
    REQUIRE(model.isOptimal());
    REQUIRE(model.hasSolution());
    REQUIRE(model.solutionCount() >= 1);
}

// ============================================================================
// SECTION C: SOLUTIONS
// ============================================================================

/**
 * @test ExactOptimizer::RespectsCapacity
 * @given T1 (0.5) and T2 (1.0); programs of 0.4, 0.4, 0.4
 * @then Every program is placed and no TPM exceeds capacity
 */
TEST_CASE("C1: ExactOptimizer::RespectsCapacity", "[exact][solve][gurobi]")
{
    ExactOptimizer opt(makeTpmMap({tpm("T1", 0.5, 3), tpm("T2", 1.0, 3)}),
                       makeProgramMap({program("P1", 0.4, 1), program("P2", 0.4, 1),
                                       program("P3", 0.4, 1)}));
    Assignment result = opt.optimize();

    REQUIRE(opt.solverStatus() == "OPTIMAL");
    REQUIRE(result.size() == 3);

    AssignmentState state(opt.programs(), result);
    REQUIRE(state.load("T1") <= 0.5 + 1e-9);
    REQUIRE(state.load("T2") <= 1.0 + 1e-9);
}

/**
 * @test ExactOptimizer::PrefersHigherScore
 * @brief With capacity to spare, each program goes to its exact-level TPM
 */
TEST_CASE("C2: ExactOptimizer::PrefersHigherScore", "[exact][solve][gurobi]")
{
    ExactOptimizer opt(makeTpmMap({tpm("T3", 1.0, 3), tpm("T5", 1.0, 5)}),
                       makeProgramMap({program("P3", 0.3, 3), program("P5", 0.3, 5)}));

    Assignment result = opt.optimize();
    REQUIRE(result == Assignment{{"P3", "T3"}, {"P5", "T5"}});
}

/**
 * @test ExactOptimizer::InfeasibleReturnsPinsOnly
 * @given A program no TPM can take
 * @then The model is infeasible and only the pins come back
 */
TEST_CASE("C3: ExactOptimizer::InfeasibleReturnsPinsOnly", "[exact][solve][gurobi]")
{
    ExactOptimizer opt(makeTpmMap({tpm("T1", 1.0, 2)}),
                       makeProgramMap({program("P1", 0.2, 1, "T1"), program("P2", 0.2, 5)}));

    Assignment result = opt.optimize();

    REQUIRE(result == Assignment{{"P1", "T1"}});
    REQUIRE_FALSE(opt.stats().get<bool>("optimal"));
    REQUIRE_FALSE(opt.stats().get<bool>("incumbent"));
    REQUIRE(opt.solverStatus() != "OPTIMAL");
}

/**
 * @test ExactOptimizer::OverloadedPinClampsCapacity
 * @brief Pins above capacity leave the TPM closed to new work, not infeasible
 */
TEST_CASE("C4: ExactOptimizer::OverloadedPinClampsCapacity", "[exact][solve][gurobi]")
{
    ExactOptimizer opt(makeTpmMap({tpm("T1", 0.5, 3), tpm("T2", 1.0, 3)}),
                       makeProgramMap({program("P1", 0.6, 1, "T1"), program("P2", 0.2, 1)}));

    Assignment result = opt.optimize();

    REQUIRE(opt.solverStatus() == "OPTIMAL");
    REQUIRE(result.at("P1") == "T1");
    REQUIRE(result.at("P2") == "T2");
    REQUIRE(opt.fixedAssignmentReport().overloads.count("T1") == 1);
}

// ============================================================================
// SECTION D: DIAGNOSTICS AND RUN STATISTICS
// ============================================================================

/**
 * @test ExactOptimizer::DiagnosticsWithoutSolver
 * @brief runDiagnostics() fills the three reports without a model
 */
TEST_CASE("D1: ExactOptimizer::DiagnosticsWithoutSolver", "[exact][diagnostics]")
{
    ExactOptimizer opt(makeTpmMap({tpm("T1", 1.0, 2)}),
                       makeProgramMap({program("P1", 0.5, 3, "T1")}));

    std::ostringstream log;
    opt.verbose(log);
    opt.runDiagnostics();

    REQUIRE_FALSE(opt.fixedAssignmentReport().ok);
    REQUIRE(opt.capacityReport().rows.size() == 1);
    REQUIRE(opt.levelReport().rows.size() == 5);
    REQUIRE(opt.stats().get<int>("fixed_issues") == 1);
    REQUIRE(log.str().find("Program P1") != std::string::npos);
    REQUIRE(opt.solverStatus() == "NOT_RUN");
}

TEST_CASE("D2: ExactOptimizer::RunStats", "[exact][stats][gurobi]")
{
    ExactOptimizer opt(makeTpmMap({tpm("T1", 1.0, 3)}),
                       makeProgramMap({program("P1", 0.5, 3), program("P2", 0.2, 1, "T1")}));
    opt.optimize();

    const auto& s = opt.stats();
    REQUIRE(s.get<std::string>("solver_status") == "OPTIMAL");
    REQUIRE(s.get<bool>("optimal"));
    REQUIRE(s.get<bool>("incumbent"));
    REQUIRE(s.get<int>("variables") == 1);
    REQUIRE(s.get<int>("fixed") == 1);
    REQUIRE(s.get<int>("assigned") == 2);
    REQUIRE(s.contains("objective"));
    REQUIRE(s.get<std::string>("model") == opt.modelSize());
    REQUIRE(opt.name() == "exact");
}
