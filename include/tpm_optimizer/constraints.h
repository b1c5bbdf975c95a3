#pragma once
/*
===============================================================================
CONSTRAINT & SCORING ENGINE — Legality checks and pair desirability
===============================================================================

OVERVIEW
--------
ConstraintEngine is the contract shared by all four strategies. It answers
three questions about the problem it was built for:

    validateAssignment(program, tpm, snapshot)       may the pair exist?
    calculateAssignmentScore(program, tpm, snapshot) how good is the pair?
    validateFixedAssignmentsSolution(solution)       are all pins honored?

All three are pure functions of their arguments; the engine itself holds only
read-only references to the entity maps, the scoring configuration and the
timezone scorer.

LEGALITY
--------
A (program, tpm) pair is legal under a snapshot when all of these hold. The
program's own placement in the snapshot, if any, is left out of the TPM's
load and portfolio tallies.

    level     tpm.level >= program.required_level
    conflict  program.id not in tpm.conflicts
    capacity  allow_overload, or load + required_time <= available_time
    diversity program.portfolio already on the TPM, or fewer than
              maxPortfolios distinct tags there

SCORE
-----
    -inf                                        if the pair is illegal
    0.30·tz + 0.25·skill + 0.20·level + 0.15·portfolio + 0.10·preference

    tz         1.0 (≤3h) / 0.5 (≤6h) / 0.0 against the barycenter of the
               program's home and stakeholder zones
    skill      |required ∩ skills| / |required|, 1.0 when nothing is required
    level      1.0 exact / 0.7 one above / 0.4 further above / 0.0 below
    portfolio  1.0 if the TPM already carries the tag, else 0.5
    preference 0.2 if the program is on the TPM's desired list

FIXED PINS
----------
fixedAssignments() holds every program whose fixed_tpm names a known TPM.
Pins naming an unknown TPM are listed by danglingPins() and treated as
unpinned.

USAGE EXAMPLES
--------------
    ConstraintEngine engine(tpms, programs, cfg.scoring, defaultTimezoneTable());
    AssignmentState state(programs, engine.fixedAssignments());

    if (engine.validateAssignment("P2", "T1", state)) {
        double s = engine.calculateAssignmentScore("P2", "T1", state);
    }

EXCEPTION SAFETY
----------------
• Unknown program or TPM ids throw std::out_of_range naming the id.

===============================================================================
*/

#include <algorithm>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "assignment.h"
#include "config.h"
#include "domain.h"
#include "timezone.h"

namespace tpmopt {

    /// @brief Score returned for an illegal pair
    inline constexpr double INFEASIBLE_SCORE = -std::numeric_limits<double>::infinity();

    /// @brief Component scores of one (program, tpm) pair
    struct ScoreBreakdown {
        double timezone = 0.0;
        double skill = 0.0;
        double level = 0.0;
        double portfolio = 0.0;
        double preference = 0.0;
        double total = 0.0;      ///< Weighted sum, computed without the legality gate
    };

    /**
     * @class ConstraintEngine
     * @brief Legality, scoring and fixed-pin checks over one problem instance
     *
     * @details Holds references only; the maps, config and timezone scorer
     *          must outlive the engine.
     */
    class ConstraintEngine {
        const TpmMap& tpms_;
        const ProgramMap& programs_;
        const ScoringConfig& config_;
        const TimezoneScorer& timezones_;

        Assignment fixed_;
        Assignment dangling_;

    public:
        ConstraintEngine(const TpmMap& tpms, const ProgramMap& programs,
                         const ScoringConfig& config, const TimezoneScorer& timezones)
            : tpms_(tpms), programs_(programs), config_(config), timezones_(timezones)
        {
            for (const auto& [programId, program] : programs_) {
                if (!program.isPinned())
                    continue;
                if (tpms_.count(program.fixed_tpm))
                    fixed_.emplace(programId, program.fixed_tpm);
                else
                    dangling_.emplace(programId, program.fixed_tpm);
            }
        }

        // ---------------------------------------------------------------------
        // Accessors
        // ---------------------------------------------------------------------

        const TpmMap& tpms() const noexcept { return tpms_; }
        const ProgramMap& programs() const noexcept { return programs_; }
        const ScoringConfig& config() const noexcept { return config_; }
        const TimezoneScorer& timezones() const noexcept { return timezones_; }

        /// @brief program → TPM pins that resolve to a known TPM
        const Assignment& fixedAssignments() const noexcept { return fixed_; }

        /// @brief program → TPM pins whose TPM id is not in the TPM map
        const Assignment& danglingPins() const noexcept { return dangling_; }

        bool isFixed(const std::string& programId) const {
            return fixed_.count(programId) > 0;
        }

        /// @throws std::out_of_range for an unknown id
        const Tpm& tpm(const std::string& tpmId) const {
            auto it = tpms_.find(tpmId);
            if (it == tpms_.end())
                throw std::out_of_range("ConstraintEngine: unknown TPM '" + tpmId + "'");
            return it->second;
        }

        /// @throws std::out_of_range for an unknown id
        const Program& program(const std::string& programId) const {
            auto it = programs_.find(programId);
            if (it == programs_.end())
                throw std::out_of_range("ConstraintEngine: unknown program '" + programId + "'");
            return it->second;
        }

        // ---------------------------------------------------------------------
        // Tallies relative to a snapshot, excluding the program itself
        // ---------------------------------------------------------------------

        /// @brief TPM load without the program's own contribution
        double loadWithout(const std::string& programId, const std::string& tpmId,
                           const AssignmentState& state) const
        {
            double load = state.load(tpmId);
            const std::string* current = state.tpmOf(programId);
            if (current && *current == tpmId)
                load -= program(programId).required_time;
            return load;
        }

        /// @brief Does the TPM carry the program's portfolio through other programs?
        bool carriesPortfolio(const std::string& programId, const std::string& tpmId,
                              const AssignmentState& state) const
        {
            const Program& p = program(programId);
            int count = state.portfolioCount(tpmId, p.portfolio);
            const std::string* current = state.tpmOf(programId);
            if (current && *current == tpmId)
                --count;
            return count > 0;
        }

        /// @brief Distinct tags on the TPM without the program's own contribution
        int portfoliosWithout(const std::string& programId, const std::string& tpmId,
                              const AssignmentState& state) const
        {
            int distinct = state.distinctPortfolios(tpmId);
            const std::string* current = state.tpmOf(programId);
            if (current && *current == tpmId &&
                state.portfolioCount(tpmId, program(programId).portfolio) == 1)
                --distinct;
            return distinct;
        }

        bool exceedsCapacity(const Tpm& t, double load) const noexcept {
            return load > t.available_time + config_.capacityTolerance;
        }

        // ---------------------------------------------------------------------
        // Legality
        // ---------------------------------------------------------------------

        bool validateAssignment(const std::string& programId, const std::string& tpmId,
                                const AssignmentState& state) const
        {
            const Program& p = program(programId);
            const Tpm& t = tpm(tpmId);

            if (t.level < p.required_level)
                return false;

            if (t.conflicts.count(programId))
                return false;

            if (!t.allow_overload &&
                exceedsCapacity(t, loadWithout(programId, tpmId, state) + p.required_time))
                return false;

            if (!carriesPortfolio(programId, tpmId, state) &&
                portfoliosWithout(programId, tpmId, state) >= config_.maxPortfolios)
                return false;

            return true;
        }

        bool validateAssignment(const std::string& programId, const std::string& tpmId,
                                const Assignment& snapshot) const
        {
            return validateAssignment(programId, tpmId, AssignmentState(programs_, snapshot));
        }

        /// @brief TPMs that may legally take the program under the snapshot, in id order
        std::vector<std::string> feasibleTpms(const std::string& programId,
                                              const AssignmentState& state) const
        {
            std::vector<std::string> out;
            for (const auto& [tpmId, t] : tpms_) {
                if (validateAssignment(programId, tpmId, state))
                    out.push_back(tpmId);
            }
            return out;
        }

        // ---------------------------------------------------------------------
        // Scoring
        // ---------------------------------------------------------------------

        double levelFit(int tpmLevel, int requiredLevel) const noexcept {
            if (tpmLevel == requiredLevel)
                return config_.levelExact;
            if (tpmLevel == requiredLevel + 1)
                return config_.levelOneAbove;
            if (tpmLevel > requiredLevel + 1)
                return config_.levelWellAbove;
            return config_.levelBelow;
        }

        double timezoneFit(const Tpm& t, const Program& p) const {
            double diff = barycentricDifference(timezones_, t.timezone, p.timezone,
                                                p.stakeholder_timezones);
            if (diff <= config_.preferredTimezoneSpread)
                return 1.0;
            if (diff <= config_.maxTimezoneSpread)
                return 0.5;
            return 0.0;
        }

        static double skillOverlap(const Tpm& t, const Program& p) {
            if (p.required_skills.empty())
                return 1.0;
            std::size_t shared = 0;
            for (const auto& skill : p.required_skills) {
                if (t.skills.count(skill))
                    ++shared;
            }
            return static_cast<double>(shared) / static_cast<double>(p.required_skills.size());
        }

        /// @brief Plain zone-to-zone distance between a TPM and a program's home zone
        double timezoneDifference(const Tpm& t, const Program& p) const {
            return timezones_.differenceInHours(t.timezone, p.timezone);
        }

        /// @brief Component scores and weighted total, without the legality gate
        ScoreBreakdown scoreBreakdown(const std::string& programId, const std::string& tpmId,
                                      const AssignmentState& state) const
        {
            const Program& p = program(programId);
            const Tpm& t = tpm(tpmId);
            const auto& w = config_.weights;

            ScoreBreakdown s;
            s.timezone = timezoneFit(t, p);
            s.skill = skillOverlap(t, p);
            s.level = levelFit(t.level, p.required_level);
            s.portfolio = carriesPortfolio(programId, tpmId, state)
                              ? config_.portfolioContinuing
                              : config_.portfolioNew;
            s.preference = t.desired_programs.count(programId) ? config_.preferenceBonus : 0.0;
            s.total = w.timezone * s.timezone + w.skill * s.skill + w.level * s.level +
                      w.portfolio * s.portfolio + w.preference * s.preference;
            return s;
        }

        /// @return INFEASIBLE_SCORE if the pair is illegal, else the weighted score
        double calculateAssignmentScore(const std::string& programId, const std::string& tpmId,
                                        const AssignmentState& state) const
        {
            if (!validateAssignment(programId, tpmId, state))
                return INFEASIBLE_SCORE;
            return scoreBreakdown(programId, tpmId, state).total;
        }

        double calculateAssignmentScore(const std::string& programId, const std::string& tpmId,
                                        const Assignment& snapshot) const
        {
            return calculateAssignmentScore(programId, tpmId, AssignmentState(programs_, snapshot));
        }

        /**
         * @brief Score of a pair already present in a solution
         *
         * @details Pinned pairs bypass the legality gate when the configuration
         *          says pins are only diagnosed.
         */
        double pairScore(const std::string& programId, const std::string& tpmId,
                         const AssignmentState& state) const
        {
            if (config_.fixedAssignmentsBypassLegality && isFixed(programId) &&
                fixed_.at(programId) == tpmId)
                return scoreBreakdown(programId, tpmId, state).total;
            return calculateAssignmentScore(programId, tpmId, state);
        }

        // ---------------------------------------------------------------------
        // Fixed pins
        // ---------------------------------------------------------------------

        bool validateFixedAssignmentsSolution(const Assignment& solution) const {
            return std::all_of(fixed_.begin(), fixed_.end(), [&](const auto& pin) {
                auto it = solution.find(pin.first);
                return it != solution.end() && it->second == pin.second;
            });
        }
    };

} // namespace tpmopt
