#pragma once
/*
===============================================================================
ASSIGNMENT STATE — Program → TPM mapping with incremental bookkeeping
===============================================================================

OVERVIEW
--------
Assignment is the plain result type every strategy returns: an ordered map
from program id to TPM id, at most one entry per program, unassigned programs
simply absent.

AssignmentState wraps an Assignment together with the two aggregates the
constraint checks need on every call:

    load(tpm)                 Σ required_time of the TPM's programs
    portfolioCount(tpm, tag)  how many of the TPM's programs carry tag

Both are updated in O(log n) on assign()/unassign(), so local search can
evaluate a neighbor without re-scanning the mapping.

MOVES AND UNDO
--------------
Local search never copies the mapping per trial. A Move is applied in place
and carries what is needed to revert it exactly:

    Reassign { program, from, to }   from == "" means "was unassigned"
    Swap     { first, second }       exchanges two programs' TPMs

    Move m = makeReassign(state, "P3", "T2");
    applyMove(state, m);
    if (rejected) revertMove(state, m);   // state is bit-for-bit what it was

USAGE EXAMPLES
--------------
    AssignmentState state(programs, engine.fixedAssignments());
    state.assign("P7", "T1");
    double used = state.load("T1");
    const Assignment& snapshot = state.mapping();

EXCEPTION SAFETY
----------------
• assign()/unassign() throw std::out_of_range for a program id that is not in
  the ProgramMap; the state is unchanged in that case.

===============================================================================
*/

#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "domain.h"

namespace tpmopt {

    /// @brief program id → TPM id
    using Assignment = std::map<std::string, std::string>;

    /**
     * @class AssignmentState
     * @brief Mutable mapping plus per-TPM load and portfolio tallies
     *
     * @details Holds a non-owning reference to the ProgramMap; the map must
     *          outlive the state.
     */
    class AssignmentState {
        const ProgramMap* programs_;
        Assignment mapping_;
        std::unordered_map<std::string, double> load_;
        std::unordered_map<std::string, std::map<std::string, int>> portfolios_;
        std::unordered_map<std::string, std::set<std::string>> members_;

    public:
        explicit AssignmentState(const ProgramMap& programs)
            : programs_(&programs)
        {
        }

        AssignmentState(const ProgramMap& programs, const Assignment& initial)
            : programs_(&programs)
        {
            for (const auto& [programId, tpmId] : initial)
                assign(programId, tpmId);
        }

        const Assignment& mapping() const noexcept { return mapping_; }
        std::size_t size() const noexcept { return mapping_.size(); }

        /// @brief TPM currently holding the program, or nullptr
        const std::string* tpmOf(const std::string& programId) const {
            auto it = mapping_.find(programId);
            return it == mapping_.end() ? nullptr : &it->second;
        }

        bool isAssigned(const std::string& programId) const {
            return mapping_.count(programId) > 0;
        }

        double load(const std::string& tpmId) const {
            auto it = load_.find(tpmId);
            return it == load_.end() ? 0.0 : it->second;
        }

        /// @brief Number of the TPM's programs tagged with portfolio
        int portfolioCount(const std::string& tpmId, const std::string& portfolio) const {
            auto it = portfolios_.find(tpmId);
            if (it == portfolios_.end())
                return 0;
            auto jt = it->second.find(portfolio);
            return jt == it->second.end() ? 0 : jt->second;
        }

        /// @brief Number of distinct portfolio tags on the TPM
        int distinctPortfolios(const std::string& tpmId) const {
            auto it = portfolios_.find(tpmId);
            return it == portfolios_.end() ? 0 : static_cast<int>(it->second.size());
        }

        /// @brief Programs currently on the TPM, ordered by id
        const std::set<std::string>& programsOf(const std::string& tpmId) const {
            static const std::set<std::string> none;
            auto it = members_.find(tpmId);
            return it == members_.end() ? none : it->second;
        }

        /// @brief TPM ids that hold at least one program
        std::set<std::string> usedTpms() const {
            std::set<std::string> used;
            for (const auto& [tpmId, members] : members_) {
                if (!members.empty())
                    used.insert(tpmId);
            }
            return used;
        }

        /**
         * @brief Place a program on a TPM, moving it if already placed
         * @throws std::out_of_range if programId is not a known program
         */
        void assign(const std::string& programId, const std::string& tpmId) {
            const Program& program = lookup(programId);
            auto it = mapping_.find(programId);
            if (it != mapping_.end()) {
                if (it->second == tpmId)
                    return;
                detach(program, it->second);
                it->second = tpmId;
            } else {
                mapping_.emplace(programId, tpmId);
            }
            attach(program, tpmId);
        }

        /// @throws std::out_of_range if programId is not a known program
        void unassign(const std::string& programId) {
            const Program& program = lookup(programId);
            auto it = mapping_.find(programId);
            if (it == mapping_.end())
                return;
            detach(program, it->second);
            mapping_.erase(it);
        }

    private:
        const Program& lookup(const std::string& programId) const {
            auto it = programs_->find(programId);
            if (it == programs_->end())
                throw std::out_of_range("AssignmentState: unknown program '" + programId + "'");
            return it->second;
        }

        void attach(const Program& program, const std::string& tpmId) {
            load_[tpmId] += program.required_time;
            ++portfolios_[tpmId][program.portfolio];
            members_[tpmId].insert(program.id);
        }

        void detach(const Program& program, const std::string& tpmId) {
            double& l = load_[tpmId];
            l -= program.required_time;
            auto& members = members_[tpmId];
            members.erase(program.id);
            if (members.empty())
                l = 0.0;   // drop accumulated rounding once the TPM is empty

            auto& tags = portfolios_[tpmId];
            auto it = tags.find(program.portfolio);
            if (it != tags.end() && --it->second == 0)
                tags.erase(it);
        }
    };

    // =========================================================================
    // MOVES
    // =========================================================================

    struct Reassign {
        std::string program;
        std::string from;     ///< Empty if the program was unassigned
        std::string to;
    };

    struct Swap {
        std::string first;
        std::string second;
    };

    using Move = std::variant<Reassign, Swap>;

    /// @brief Build a Reassign that records the program's current TPM
    inline Move makeReassign(const AssignmentState& state, const std::string& programId,
                             const std::string& target)
    {
        const std::string* current = state.tpmOf(programId);
        return Reassign{programId, current ? *current : std::string(), target};
    }

    inline void applyMove(AssignmentState& state, const Move& move) {
        if (const auto* r = std::get_if<Reassign>(&move)) {
            state.assign(r->program, r->to);
            return;
        }
        const auto& s = std::get<Swap>(move);
        const std::string* a = state.tpmOf(s.first);
        const std::string* b = state.tpmOf(s.second);
        if (!a || !b)
            throw std::logic_error("applyMove(Swap): both programs must be assigned");
        const std::string tpmA = *a;
        const std::string tpmB = *b;
        state.assign(s.first, tpmB);
        state.assign(s.second, tpmA);
    }

    inline void revertMove(AssignmentState& state, const Move& move) {
        if (const auto* r = std::get_if<Reassign>(&move)) {
            if (r->from.empty())
                state.unassign(r->program);
            else
                state.assign(r->program, r->from);
            return;
        }
        // A swap is its own inverse.
        applyMove(state, move);
    }

    /// @brief Programs the move relocates
    inline std::vector<std::string> movedPrograms(const Move& move) {
        if (const auto* r = std::get_if<Reassign>(&move))
            return {r->program};
        const auto& s = std::get<Swap>(move);
        return {s.first, s.second};
    }

} // namespace tpmopt
