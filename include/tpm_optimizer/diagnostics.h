#pragma once
/*
===============================================================================
DIAGNOSTICS — Solver status, model statistics and pre-solve analyses
===============================================================================

Overview
--------
Two kinds of diagnostics live here.

Solver side (free functions over a GRBModel):

    * statusString(status)       "OPTIMAL", "INFEASIBLE", "TIME_LIMIT", ...
    * computeStatistics(model)   variable / constraint counts by type
    * modelSummary(model)        "12 vars (12 bin), 7 constrs"

Problem side (free functions over a ConstraintEngine, no solver needed). They
run before the exact model is built and explain up front why a model may be
infeasible or why a pinned TPM ends up over capacity:

    * analyzeTpmCapacities       base capacity vs. load already pinned
    * analyzeFixedAssignments    legality of every pin, pin-only overloads,
                                 pins naming an unknown TPM
    * analyzeLevelRequirements   per level: demand at that level vs. capacity
                                 of all TPMs at or above it

The reports are plain structs with print(std::ostream&) helpers. Issues are
human-readable sentences that always name the program or TPM concerned.

Typical Usage
-------------
    auto fixed = analyzeFixedAssignments(engine);
    if (!fixed.ok) {
        for (const auto& issue : fixed.issues) std::cerr << issue << "\n";
    }

    builder.optimize();
    std::cout << statusString(builder.status()) << "\n";

===============================================================================
*/

#include <iomanip>
#include <map>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include "gurobi_c++.h"

#include "constraints.h"
#include "domain.h"

namespace tpmopt {

// =============================================================================
// SOLVER STATUS
// =============================================================================

inline std::string statusString(int status) {
    switch (status) {
        case GRB_LOADED:          return "LOADED";
        case GRB_OPTIMAL:         return "OPTIMAL";
        case GRB_INFEASIBLE:      return "INFEASIBLE";
        case GRB_INF_OR_UNBD:     return "INF_OR_UNBD";
        case GRB_UNBOUNDED:       return "UNBOUNDED";
        case GRB_CUTOFF:          return "CUTOFF";
        case GRB_ITERATION_LIMIT: return "ITERATION_LIMIT";
        case GRB_NODE_LIMIT:      return "NODE_LIMIT";
        case GRB_TIME_LIMIT:      return "TIME_LIMIT";
        case GRB_SOLUTION_LIMIT:  return "SOLUTION_LIMIT";
        case GRB_INTERRUPTED:     return "INTERRUPTED";
        case GRB_NUMERIC:         return "NUMERIC";
        case GRB_SUBOPTIMAL:      return "SUBOPTIMAL";
        case GRB_INPROGRESS:      return "INPROGRESS";
        case GRB_USER_OBJ_LIMIT:  return "USER_OBJ_LIMIT";
        default:                  return "UNKNOWN(" + std::to_string(status) + ")";
    }
}

// =============================================================================
// MODEL STATISTICS
// =============================================================================

struct ModelStatistics {
    int numVars = 0;
    int numConstrs = 0;
    int numBinary = 0;
    int numInteger = 0;     ///< General integers, binaries excluded
    int numContinuous = 0;
    int numNonZeros = 0;
};

inline ModelStatistics computeStatistics(const GRBModel& model) {
    ModelStatistics stats;
    stats.numVars = model.get(GRB_IntAttr_NumVars);
    stats.numConstrs = model.get(GRB_IntAttr_NumConstrs);
    stats.numBinary = model.get(GRB_IntAttr_NumBinVars);
    // NumIntVars counts binaries too
    stats.numInteger = model.get(GRB_IntAttr_NumIntVars) - stats.numBinary;
    stats.numNonZeros = model.get(GRB_IntAttr_NumNZs);
    stats.numContinuous = stats.numVars - stats.numBinary - stats.numInteger;
    return stats;
}

/// @return e.g. "12 vars (12 bin), 7 constrs"
inline std::string modelSummary(const ModelStatistics& stats) {
    std::string result = std::to_string(stats.numVars) + " vars";
    if (stats.numBinary > 0 || stats.numInteger > 0) {
        result += " (";
        if (stats.numBinary > 0) {
            result += std::to_string(stats.numBinary) + " bin";
            if (stats.numInteger > 0)
                result += ", ";
        }
        if (stats.numInteger > 0)
            result += std::to_string(stats.numInteger) + " int";
        result += ")";
    }
    result += ", " + std::to_string(stats.numConstrs) + " constrs";
    return result;
}

inline std::string modelSummary(const GRBModel& model) {
    return modelSummary(computeStatistics(model));
}

// =============================================================================
// PRE-SOLVE ANALYSES
// =============================================================================

namespace diagnostics_detail {

    inline std::string fte(double value) {
        std::ostringstream os;
        os << std::fixed << std::setprecision(2) << value;
        return os.str();
    }

} // namespace diagnostics_detail

/// @brief Load each TPM already carries through resolvable pins
inline std::map<std::string, double> fixedLoads(const ConstraintEngine& engine) {
    std::map<std::string, double> loads;
    for (const auto& [tpmId, t] : engine.tpms())
        loads[tpmId] = 0.0;
    for (const auto& [programId, tpmId] : engine.fixedAssignments())
        loads[tpmId] += engine.program(programId).required_time;
    return loads;
}

// -----------------------------------------------------------------------------
// (a) Capacity
// -----------------------------------------------------------------------------

struct TpmCapacityRow {
    std::string tpm;
    std::string name;
    double baseCapacity = 0.0;
    double fixedLoad = 0.0;
    double remaining = 0.0;      ///< base - fixed, may be negative
    bool allowOverload = false;
};

struct CapacityReport {
    std::vector<TpmCapacityRow> rows;

    void print(std::ostream& os) const {
        os << "TPM capacities:\n";
        for (const auto& r : rows) {
            os << "  TPM " << r.tpm << " (" << r.name << "): base "
               << diagnostics_detail::fte(r.baseCapacity) << ", fixed load "
               << diagnostics_detail::fte(r.fixedLoad) << ", remaining "
               << diagnostics_detail::fte(r.remaining)
               << (r.allowOverload ? ", overload allowed" : "") << "\n";
        }
    }
};

inline CapacityReport analyzeTpmCapacities(const ConstraintEngine& engine) {
    CapacityReport report;
    auto loads = fixedLoads(engine);
    for (const auto& [tpmId, t] : engine.tpms()) {
        double fixed = loads[tpmId];
        report.rows.push_back(TpmCapacityRow{tpmId, t.name, t.available_time, fixed,
                                             t.available_time - fixed, t.allow_overload});
    }
    return report;
}

// -----------------------------------------------------------------------------
// (b) Fixed assignments
// -----------------------------------------------------------------------------

struct FixedAssignmentReport {
    bool ok = true;
    std::vector<std::string> issues;
    std::map<std::string, double> overloads;   ///< TPM → pinned load above capacity
    std::vector<std::string> notes;            ///< Overloads on overload-tolerant TPMs

    void print(std::ostream& os) const {
        os << "Fixed assignments: " << (ok ? "OK" : "ISSUES FOUND") << "\n";
        for (const auto& issue : issues)
            os << "  - " << issue << "\n";
        for (const auto& note : notes)
            os << "  Note: " << note << "\n";
    }
};

inline FixedAssignmentReport analyzeFixedAssignments(const ConstraintEngine& engine) {
    using diagnostics_detail::fte;
    FixedAssignmentReport report;

    for (const auto& [programId, tpmId] : engine.danglingPins())
        report.issues.push_back("Program " + programId + ": fixed TPM " + tpmId +
                                " does not exist");

    std::map<std::string, std::set<std::string>> pinnedTags;
    for (const auto& [programId, tpmId] : engine.fixedAssignments()) {
        const Program& p = engine.program(programId);
        const Tpm& t = engine.tpm(tpmId);
        pinnedTags[tpmId].insert(p.portfolio);

        if (t.level < p.required_level)
            report.issues.push_back("Program " + programId + ": fixed TPM " + tpmId + " level " +
                                    std::to_string(t.level) + " is below required level " +
                                    std::to_string(p.required_level));
        if (t.conflicts.count(programId))
            report.issues.push_back("Program " + programId + ": fixed TPM " + tpmId +
                                    " lists the program as a conflict");
        if (!t.allow_overload && engine.exceedsCapacity(t, p.required_time))
            report.issues.push_back("Program " + programId + ": requires " + fte(p.required_time) +
                                    " FTE but fixed TPM " + tpmId + " has " +
                                    fte(t.available_time) + " FTE");
    }

    for (const auto& [tpmId, tags] : pinnedTags) {
        if (static_cast<int>(tags.size()) > engine.config().maxPortfolios)
            report.issues.push_back("TPM " + tpmId + " is pinned to " + std::to_string(tags.size()) +
                                    " portfolios, above the limit of " +
                                    std::to_string(engine.config().maxPortfolios));
    }

    for (const auto& [tpmId, load] : fixedLoads(engine)) {
        const Tpm& t = engine.tpm(tpmId);
        if (!engine.exceedsCapacity(t, load))
            continue;
        report.overloads[tpmId] = load;
        std::string what = "TPM " + tpmId + " (" + t.name + ") is overloaded: fixed assignments require " +
                           fte(load) + " FTE, but capacity is " + fte(t.available_time) + " FTE";
        if (t.allow_overload)
            report.notes.push_back(what + " (overload allowed)");
        else
            report.issues.push_back(what + " and overload is not allowed");
    }

    report.ok = report.issues.empty();
    return report;
}

// -----------------------------------------------------------------------------
// (c) Level supply and demand
// -----------------------------------------------------------------------------

struct LevelRow {
    int level = MIN_LEVEL;
    double programTime = 0.0;          ///< Demand requiring exactly this level
    double fixedTime = 0.0;            ///< Part of that demand already pinned
    double remainingTime = 0.0;
    double capacityAtOrAbove = 0.0;    ///< Σ available_time of TPMs with level >= this
    double remainingCapacity = 0.0;
};

struct LevelReport {
    bool ok = true;
    std::vector<LevelRow> rows;
    std::vector<std::string> issues;

    void print(std::ostream& os) const {
        using diagnostics_detail::fte;
        os << "Level requirements:\n";
        for (const auto& r : rows) {
            os << "  Level " << r.level << ": demand " << fte(r.programTime) << " (fixed "
               << fte(r.fixedTime) << "), capacity at or above " << fte(r.capacityAtOrAbove)
               << ", remaining " << fte(r.remainingTime) << " / " << fte(r.remainingCapacity)
               << "\n";
        }
        for (const auto& issue : issues)
            os << "  - " << issue << "\n";
    }
};

inline LevelReport analyzeLevelRequirements(const ConstraintEngine& engine) {
    using diagnostics_detail::fte;
    LevelReport report;

    for (int level = MIN_LEVEL; level <= MAX_LEVEL; ++level) {
        LevelRow row;
        row.level = level;
        for (const auto& [programId, p] : engine.programs()) {
            if (p.required_level != level)
                continue;
            row.programTime += p.required_time;
            if (engine.isFixed(programId))
                row.fixedTime += p.required_time;
        }
        for (const auto& [tpmId, t] : engine.tpms()) {
            if (t.level >= level)
                row.capacityAtOrAbove += t.available_time;
        }
        row.remainingTime = row.programTime - row.fixedTime;
        row.remainingCapacity = row.capacityAtOrAbove - row.fixedTime;

        if (row.remainingTime > row.remainingCapacity + engine.config().capacityTolerance)
            report.issues.push_back("Insufficient capacity at level " + std::to_string(level) +
                                    ": required " + fte(row.remainingTime) + ", available " +
                                    fte(row.remainingCapacity));
        report.rows.push_back(row);
    }

    report.ok = report.issues.empty();
    return report;
}

} // namespace tpmopt
