#pragma once
/*
===============================================================================
DOMAIN MODEL — TPMs, Programs and the constants that bound them
===============================================================================

OVERVIEW
--------
The two entity types every strategy reasons about, plus the named constraint
constants and load targets of the assignment problem.

    Tpm      — a capacity-bounded agent that receives Programs
    Program  — a work item that needs exactly one TPM

Entities are validated in their constructors and then treated as read-only
reference data for a whole optimization run. Strategies keep their own
program → TPM mapping; they never write into the entities.

KEY COMPONENTS
--------------
• TpmConstraints / LoadTargets: named problem constants
• ConstraintType: HARD / SOFT tag for objectives
• Tpm, Program: validated records
• TpmMap, ProgramMap: id-keyed, ordered maps used throughout the optimizer
• makeTpmMap / makeProgramMap: build maps, reject duplicate ids

VALIDATION RULES
----------------
    Tpm:      id non-empty, available_time ∈ [0, 1], level ∈ [1, 5]
    Program:  id non-empty, required_time ∈ (0, 1], required_level ∈ [1, 5],
              complexity_score ∈ [1, 5]

A violation throws std::invalid_argument naming the record and the value; only
that record is lost.

USAGE EXAMPLES
--------------
    Tpm alice("T1", "Alice", "America/New_York", 1.0, 3);
    alice.skills = {"ml", "infra"};
    alice.portfolios = {"Payments"};

    Program p("P1", "Checkout revamp", "America/Chicago", 0.5, 3);
    p.required_skills = {"infra"};
    p.portfolio = "Payments";

    TpmMap tpms = makeTpmMap({alice});
    ProgramMap programs = makeProgramMap({p});

===============================================================================
*/

#include <map>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tpmopt {

    // =========================================================================
    // PROBLEM CONSTANTS
    // =========================================================================

    struct TpmConstraints {
        // Hard constraints
        static constexpr double MAX_CAPACITY = 1.0;
        static constexpr int MAX_PORTFOLIOS = 2;
        static constexpr double MAX_TIMEZONE_SPREAD = 6.0;

        // Soft constraints
        static constexpr double MIN_UTILIZATION = 0.7;
        static constexpr int TARGET_PORTFOLIO_DIVERSITY = 2;
        static constexpr double PREFERRED_TIMEZONE_SPREAD = 3.0;
    };

    struct LoadTargets {
        static constexpr double MIN_LOAD = 0.7;
        static constexpr double TARGET_LOAD = 0.9;
        static constexpr double MAX_LOAD = 1.0;
    };

    enum class ConstraintType { Hard, Soft };

    inline constexpr int MIN_LEVEL = 1;
    inline constexpr int MAX_LEVEL = 5;

    namespace domain_detail {

        inline std::string describe(const char* what, const std::string& id,
                                    const char* field, double value, const char* range)
        {
            std::ostringstream os;
            os << what << " '" << id << "': " << field << " must be in " << range
               << ", got " << value;
            return os.str();
        }

        inline bool isBlank(const std::string& s) noexcept {
            return s.find_first_not_of(" \t\r\n") == std::string::npos;
        }

    } // namespace domain_detail

    // =========================================================================
    // TPM
    // =========================================================================

    /**
     * @struct Tpm
     * @brief A technical program manager: the agent that receives Programs
     *
     * @details The constructor validates the numeric fields; set-valued fields
     *          are plain members filled in after construction.
     */
    struct Tpm {
        std::string id;
        std::string name;
        std::string timezone;
        std::set<std::string> skills;
        double available_time = 1.0;              ///< Fractional capacity (FTE)
        int level = MIN_LEVEL;                    ///< Seniority tier
        std::set<std::string> conflicts;          ///< Programs this TPM must never get
        bool allow_overload = false;
        std::string fixed_program;                ///< Informational; pins live on Program
        std::set<std::string> desired_programs;
        std::set<std::string> portfolios;         ///< Declared portfolio affinity

        /// Maintained by callers that want to mirror a result; never by strategies.
        std::vector<std::string> assigned_programs;

        /**
         * @throws std::invalid_argument on empty id, capacity outside [0,1] or
         *         level outside [1,5]
         */
        Tpm(std::string tpmId, std::string displayName, std::string tz,
            double availableTime, int tpmLevel)
            : id(std::move(tpmId)), name(std::move(displayName)), timezone(std::move(tz)),
              available_time(availableTime), level(tpmLevel)
        {
            if (id.empty())
                throw std::invalid_argument("Tpm: id must not be empty");
            if (!(available_time >= 0.0 && available_time <= TpmConstraints::MAX_CAPACITY))
                throw std::invalid_argument(domain_detail::describe(
                    "Tpm", id, "available_time", available_time, "[0, 1]"));
            if (level < MIN_LEVEL || level > MAX_LEVEL)
                throw std::invalid_argument(domain_detail::describe(
                    "Tpm", id, "level", level, "[1, 5]"));
        }
    };

    // =========================================================================
    // PROGRAM
    // =========================================================================

    /**
     * @struct Program
     * @brief A work item to be staffed by exactly one TPM
     */
    struct Program {
        std::string id;
        std::string name;
        std::string timezone;
        std::set<std::string> required_skills;
        double required_time = 0.1;               ///< FTE demand, (0, 1]
        int required_level = MIN_LEVEL;
        std::string fixed_tpm;                    ///< Blank means "not pinned"
        std::set<std::string> stakeholder_timezones;
        int complexity_score = 1;
        std::string portfolio;

        /**
         * @throws std::invalid_argument on empty id or an out-of-range
         *         required_time, required_level or complexity
         */
        Program(std::string programId, std::string displayName, std::string tz,
                double requiredTime, int requiredLevel, int complexity = 1)
            : id(std::move(programId)), name(std::move(displayName)), timezone(std::move(tz)),
              required_time(requiredTime), required_level(requiredLevel),
              complexity_score(complexity)
        {
            if (id.empty())
                throw std::invalid_argument("Program: id must not be empty");
            if (!(required_time > 0.0 && required_time <= TpmConstraints::MAX_CAPACITY))
                throw std::invalid_argument(domain_detail::describe(
                    "Program", id, "required_time", required_time, "(0, 1]"));
            if (required_level < MIN_LEVEL || required_level > MAX_LEVEL)
                throw std::invalid_argument(domain_detail::describe(
                    "Program", id, "required_level", required_level, "[1, 5]"));
            if (complexity_score < 1 || complexity_score > 5)
                throw std::invalid_argument(domain_detail::describe(
                    "Program", id, "complexity_score", complexity_score, "[1, 5]"));
        }

        /// @brief True if the program carries a non-blank fixed_tpm pin
        bool isPinned() const noexcept { return !domain_detail::isBlank(fixed_tpm); }
    };

    // =========================================================================
    // ENTITY MAPS
    // =========================================================================

    using TpmMap = std::map<std::string, Tpm>;
    using ProgramMap = std::map<std::string, Program>;

    /// @throws std::invalid_argument on a duplicate id
    inline TpmMap makeTpmMap(const std::vector<Tpm>& tpms) {
        TpmMap out;
        for (const auto& t : tpms) {
            if (!out.emplace(t.id, t).second)
                throw std::invalid_argument("makeTpmMap: duplicate TPM id '" + t.id + "'");
        }
        return out;
    }

    /// @throws std::invalid_argument on a duplicate id
    inline ProgramMap makeProgramMap(const std::vector<Program>& programs) {
        ProgramMap out;
        for (const auto& p : programs) {
            if (!out.emplace(p.id, p).second)
                throw std::invalid_argument("makeProgramMap: duplicate program id '" + p.id + "'");
        }
        return out;
    }

} // namespace tpmopt
