#pragma once
/*
===============================================================================
SOLUTION — Metric vector and Pareto dominance over one mapping
===============================================================================

OVERVIEW
--------
A Solution pairs a mapping with four lower-is-better counters:

    UnusedTpms           TPMs that hold no program
    OverloadedTpms       TPMs above capacity that do not allow overload
    TimezoneViolations   assignments more than maxTimezoneSpread hours away
    PortfolioViolations  TPMs carrying more than maxPortfolios distinct tags

Solutions are compared by Pareto dominance: A dominates B when A is no worse
on every metric and strictly better on at least one. Dominance is irreflexive
and antisymmetric; two solutions with equal metrics dominate neither way.

    Solution a(mapping, engine);
    if (a.dominates(b)) ...
    if (a.isFeasible()) ...          // pins honored, nothing overloaded

computeMetrics() also works directly on an AssignmentState so the hybrid
search can score a trial move without copying the mapping.

===============================================================================
*/

#include <sstream>
#include <string>
#include <utility>

#include "assignment.h"
#include "constraints.h"
#include "enum_utils.h"

namespace tpmopt {

    TPMOPT_DECLARE_ENUM_WITH_COUNT(Metric, UnusedTpms, OverloadedTpms,
                                   TimezoneViolations, PortfolioViolations);

    using MetricVector = EnumArray<Metric, int>;

    inline MetricVector computeMetrics(const AssignmentState& state, const ConstraintEngine& engine) {
        const auto& cfg = engine.config();
        MetricVector m{};

        int used = 0;
        for (const auto& [tpmId, t] : engine.tpms()) {
            if (!state.programsOf(tpmId).empty())
                ++used;
            if (!t.allow_overload && engine.exceedsCapacity(t, state.load(tpmId)))
                ++m[index(Metric::OverloadedTpms)];
            if (state.distinctPortfolios(tpmId) > cfg.maxPortfolios)
                ++m[index(Metric::PortfolioViolations)];
        }
        m[index(Metric::UnusedTpms)] = static_cast<int>(engine.tpms().size()) - used;

        for (const auto& [programId, tpmId] : state.mapping()) {
            if (engine.timezoneDifference(engine.tpm(tpmId), engine.program(programId)) >
                cfg.maxTimezoneSpread)
                ++m[index(Metric::TimezoneViolations)];
        }
        return m;
    }

    /// @brief Pareto dominance over lower-is-better metrics
    inline bool dominates(const MetricVector& a, const MetricVector& b) noexcept {
        bool strictlyBetter = false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (a[i] > b[i])
                return false;
            if (a[i] < b[i])
                strictlyBetter = true;
        }
        return strictlyBetter;
    }

    /**
     * @class Solution
     * @brief A mapping together with its metric vector
     *
     * @details Keeps a reference to the engine that produced the metrics; the
     *          engine must outlive the Solution.
     */
    class Solution {
        Assignment assignments_;
        MetricVector metrics_;
        const ConstraintEngine* engine_;

    public:
        Solution(Assignment assignments, const ConstraintEngine& engine)
            : assignments_(std::move(assignments)), engine_(&engine)
        {
            metrics_ = computeMetrics(AssignmentState(engine.programs(), assignments_), engine);
        }

        explicit Solution(const AssignmentState& state, const ConstraintEngine& engine)
            : assignments_(state.mapping()), metrics_(computeMetrics(state, engine)), engine_(&engine)
        {
        }

        const Assignment& assignments() const noexcept { return assignments_; }
        const MetricVector& metrics() const noexcept { return metrics_; }
        int metric(Metric m) const noexcept { return metrics_[index(m)]; }

        bool dominates(const Solution& other) const noexcept {
            return tpmopt::dominates(metrics_, other.metrics_);
        }

        /// @brief Every pin honored and no overload-intolerant TPM over capacity
        bool isFeasible() const {
            return engine_->validateFixedAssignmentsSolution(assignments_) &&
                   metric(Metric::OverloadedTpms) == 0;
        }

        /// @brief Number of metrics on which this solution is strictly lower
        int improvedMetricCount(const Solution& other) const noexcept {
            int improved = 0;
            for (std::size_t i = 0; i < metrics_.size(); ++i) {
                if (metrics_[i] < other.metrics_[i])
                    ++improved;
            }
            return improved;
        }
    };

    /// @brief "{UnusedTpms=0, OverloadedTpms=1, ...}" for logs
    inline std::string formatMetrics(const MetricVector& m) {
        std::ostringstream os;
        os << "{";
        forEachEnum<Metric>([&](Metric metric) {
            if (index(metric) > 0)
                os << ", ";
            os << enumName(metric) << "=" << m[index(metric)];
        });
        os << "}";
        return os.str();
    }

} // namespace tpmopt
