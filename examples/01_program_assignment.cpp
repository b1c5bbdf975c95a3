/*
================================================================================
EXAMPLE 01: PROGRAM ASSIGNMENT - Staffing a Program Portfolio
================================================================================
DIFFICULTY: Beginner
PROBLEM TYPE: Generalized assignment (MILP and heuristics)

PROBLEM DESCRIPTION
-------------------
A PMO staffs 10 programs with 5 technical program managers (TPMs). Each TPM has
a fraction of an FTE available, a seniority level, a home timezone, skills and
portfolio affinities. Each program needs a share of an FTE, a minimum level and
ideally a TPM near its stakeholders. Two programs are already pinned.

The same portfolio is solved by every strategy and the results are compared:

    milp       exact Gurobi model, maximizes the summed pair scores
    sa         simulated annealing over legal moves
    hybrid     Pareto-dominance construction plus feasible random walk
    two-phase  deterministic ranking plus overload repair

USAGE
-----
    01_program_assignment              run every strategy
    01_program_assignment sa           run one strategy

FEATURES DEMONSTRATED
---------------------
- Tpm / Program / makeTpmMap()        In-memory portfolio
- OptimizerConfig::preset()           Tuning presets, fixed seed
- parseStrategy(), makeOptimizer()    Strategy selection by name
- ExactOptimizer::runDiagnostics()    Pre-solve analysis reports
- Solution, formatMetrics()           Pareto metrics of a result
- summarize().print()                 Post-run summary

================================================================================
*/

#include <iomanip>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <tpm_optimizer/tpm_optimizer.h>

using namespace tpmopt;

// ============================================================================
// PORTFOLIO DATA
// ============================================================================

static TpmMap buildTpms() {
    Tpm alice("T1", "Alice", "America/New_York", 1.0, 4);
    alice.skills = {"payments", "infra"};
    alice.portfolios = {"Payments"};

    Tpm bruno("T2", "Bruno", "Europe/Berlin", 0.8, 3);
    bruno.skills = {"identity", "security"};
    bruno.portfolios = {"Identity"};

    Tpm chen("T3", "Chen", "Asia/Singapore", 1.0, 5);
    chen.skills = {"infra", "ml"};
    chen.portfolios = {"Platform"};

    Tpm dana("T4", "Dana", "America/Los_Angeles", 0.5, 2);
    dana.skills = {"growth"};
    dana.conflicts = {"P07"};

    Tpm eli("T5", "Eli", "Europe/London", 0.6, 3);
    eli.skills = {"payments", "growth"};
    eli.allow_overload = true;

    return makeTpmMap({alice, bruno, chen, dana, eli});
}

static Program makeProgram(const std::string& id, const std::string& name, const std::string& tz,
                           double time, int level, int complexity, const std::string& portfolio,
                           std::set<std::string> skills, const std::string& pin = "")
{
    Program p(id, name, tz, time, level, complexity);
    p.portfolio = portfolio;
    p.required_skills = std::move(skills);
    p.fixed_tpm = pin;
    return p;
}

static ProgramMap buildPrograms() {
    return makeProgramMap({
        makeProgram("P01", "Card Network Migration", "America/Chicago", 0.4, 4, 5, "Payments",
                    {"payments", "infra"}, "T1"),
        makeProgram("P02", "Refund Automation", "America/New_York", 0.3, 3, 3, "Payments",
                    {"payments"}),
        makeProgram("P03", "Single Sign-On", "Europe/Paris", 0.3, 3, 4, "Identity",
                    {"identity", "security"}),
        makeProgram("P04", "Passkeys Rollout", "Europe/Berlin", 0.2, 2, 2, "Identity",
                    {"security"}, "T2"),
        makeProgram("P05", "Feature Store", "Asia/Singapore", 0.4, 4, 4, "Platform",
                    {"ml", "infra"}),
        makeProgram("P06", "Cluster Upgrade", "Asia/Tokyo", 0.3, 3, 3, "Platform", {"infra"}),
        makeProgram("P07", "Referral Program", "America/Los_Angeles", 0.2, 1, 1, "Growth",
                    {"growth"}),
        makeProgram("P08", "Onboarding Funnel", "America/Denver", 0.2, 2, 2, "Growth",
                    {"growth"}),
        makeProgram("P09", "Ledger Reconciliation", "Europe/London", 0.3, 3, 3, "Payments",
                    {"payments"}),
        makeProgram("P10", "Audit Logging", "UTC", 0.2, 2, 2, "Identity", {"security"}),
    });
}

// ============================================================================
// REPORTING
// ============================================================================

static void printAssignment(const Optimizer& opt, const Assignment& result) {
    std::cout << "\nAssignments (" << opt.name() << "):\n";
    for (const auto& [programId, tpmId] : result) {
        const Program& p = opt.programs().at(programId);
        const Tpm& t = opt.tpms().at(tpmId);
        std::cout << "  " << std::setw(4) << programId << "  " << std::left << std::setw(24)
                  << p.name << std::right << " -> " << tpmId << " (" << t.name << ")"
                  << (opt.engine().isFixed(programId) ? "  [pinned]" : "") << "\n";
    }
    std::cout << "Metrics: " << formatMetrics(Solution(result, opt.engine()).metrics()) << "\n";
}

static void runStrategy(StrategyKind kind, const TpmMap& tpms, const ProgramMap& programs,
                        const OptimizerConfig& cfg)
{
    std::cout << "\n----------------------------------------------------------------\n";
    std::cout << "Strategy: " << enumName(kind) << "\n";
    std::cout << "----------------------------------------------------------------\n";

    auto opt = makeOptimizer(kind, tpms, programs, cfg);
    if (auto* exact = dynamic_cast<ExactOptimizer*>(opt.get()))
        exact->verbose(std::cout);

    Assignment result = opt->optimize();

    printAssignment(*opt, result);
    std::cout << "Run statistics:\n";
    opt->stats().print(std::cout);
    std::cout << "\n";
    summarize(result, opt->engine()).print(std::cout);
}

// ============================================================================
// MAIN PROGRAM
// ============================================================================
int main(int argc, char** argv) {
    std::cout << "================================================================\n";
    std::cout << "EXAMPLE 01: Program Assignment\n";
    std::cout << "================================================================\n";

    try {
        TpmMap tpms = buildTpms();
        ProgramMap programs = buildPrograms();

        OptimizerConfig cfg = OptimizerConfig::preset(Preset::Fast);
        cfg.seed = 7;

        std::vector<StrategyKind> kinds;
        if (argc > 1)
            kinds.push_back(parseStrategy(argv[1]));
        else
            forEachEnum<StrategyKind>([&](StrategyKind k) { kinds.push_back(k); });

        int failures = 0;
        for (StrategyKind kind : kinds) {
            try {
                runStrategy(kind, tpms, programs, cfg);
            } catch (GRBException& e) {
                std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage()
                          << " (strategy " << enumName(kind) << ")\n";
                ++failures;
            }
        }
        if (failures > 0)
            return 1;

    } catch (GRBException& e) {
        std::cerr << "Gurobi Error " << e.getErrorCode() << ": " << e.getMessage() << "\n";
        return 1;
    } catch (std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n================================================================\n";
    return 0;
}
