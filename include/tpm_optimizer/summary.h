#pragma once
/*
===============================================================================
SUMMARY — Utilization rows and headline metrics of a finished mapping
===============================================================================

    AssignmentSummary s = summarize(result, optimizer.engine());
    s.coveragePercent          share of programs that received a TPM
    s.averageTimezoneSpread    mean hours between program and its TPM
    s.timezoneRespectPercent   share of assignments within the preferred spread
    s.averagePortfolioDiversity, s.averageUtilizationPercent   over all TPMs
    s.rows                     one TpmUtilization per TPM, in id order
    s.unassigned               program ids without a TPM, in id order

Averages over an empty set are 0. Percentages are on a 0..100 scale and are
not rounded; formatting belongs to whoever prints them.

===============================================================================
*/

#include <algorithm>
#include <ostream>
#include <string>
#include <vector>

#include "assignment.h"
#include "constraints.h"

namespace tpmopt {

    struct TpmUtilization {
        std::string tpm;
        std::string name;
        double capacity = 0.0;
        double used = 0.0;
        double remaining = 0.0;            ///< Never negative
        double utilizationPercent = 0.0;   ///< 0 when capacity is 0
        int programCount = 0;
        int portfolioDiversity = 0;
    };

    struct AssignmentSummary {
        std::vector<TpmUtilization> rows;
        std::vector<std::string> unassigned;

        double coveragePercent = 0.0;
        double averageTimezoneSpread = 0.0;
        double averagePortfolioDiversity = 0.0;
        double averageUtilizationPercent = 0.0;
        double timezoneRespectPercent = 0.0;

        void print(std::ostream& os) const {
            os << "Assignment coverage:       " << coveragePercent << "%\n"
               << "Average timezone spread:   " << averageTimezoneSpread << "h\n"
               << "Average portfolio count:   " << averagePortfolioDiversity << "\n"
               << "Average TPM utilization:   " << averageUtilizationPercent << "%\n"
               << "Timezone respect:          " << timezoneRespectPercent << "%\n";
            for (const auto& r : rows) {
                os << "  " << r.tpm << " (" << r.name << "): " << r.used << " / " << r.capacity
                   << " FTE, " << r.programCount << " program(s), " << r.portfolioDiversity
                   << " portfolio(s)\n";
            }
            if (!unassigned.empty()) {
                os << "Unassigned:";
                for (const auto& id : unassigned)
                    os << " " << id;
                os << "\n";
            }
        }
    };

    inline AssignmentSummary summarize(const Assignment& assignment, const ConstraintEngine& engine) {
        AssignmentSummary s;
        AssignmentState state(engine.programs(), assignment);
        const auto& cfg = engine.config();

        int assigned = 0;
        int respected = 0;
        double spread = 0.0;
        for (const auto& [programId, p] : engine.programs()) {
            const std::string* tpmId = state.tpmOf(programId);
            if (!tpmId) {
                s.unassigned.push_back(programId);
                continue;
            }
            double diff = engine.timezoneDifference(engine.tpm(*tpmId), p);
            spread += diff;
            if (diff <= cfg.preferredTimezoneSpread)
                ++respected;
            ++assigned;
        }

        double diversity = 0.0;
        double utilization = 0.0;
        for (const auto& [tpmId, t] : engine.tpms()) {
            TpmUtilization row;
            row.tpm = tpmId;
            row.name = t.name;
            row.capacity = t.available_time;
            row.used = state.load(tpmId);
            row.remaining = std::max(0.0, t.available_time - row.used);
            row.utilizationPercent = t.available_time > 0.0 ? row.used / t.available_time * 100.0 : 0.0;
            row.programCount = static_cast<int>(state.programsOf(tpmId).size());
            row.portfolioDiversity = state.distinctPortfolios(tpmId);
            diversity += row.portfolioDiversity;
            utilization += row.utilizationPercent;
            s.rows.push_back(row);
        }

        const auto programCount = engine.programs().size();
        const auto tpmCount = engine.tpms().size();
        if (programCount > 0)
            s.coveragePercent = 100.0 * assigned / static_cast<double>(programCount);
        if (assigned > 0) {
            s.averageTimezoneSpread = spread / assigned;
            s.timezoneRespectPercent = 100.0 * respected / assigned;
        }
        if (tpmCount > 0) {
            s.averagePortfolioDiversity = diversity / static_cast<double>(tpmCount);
            s.averageUtilizationPercent = utilization / static_cast<double>(tpmCount);
        }
        return s;
    }

} // namespace tpmopt
