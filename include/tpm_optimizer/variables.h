#pragma once
/*
===============================================================================
VARIABLES — Sparse (TPM, Program) decision variables
===============================================================================

OVERVIEW
--------
The exact model only creates a binary for each (TPM, unfixed program) pair,
so its variables are a sparse set keyed by the two string ids rather than a
dense matrix. PairVariableSet stores them in creation order with an ordered
index for lookup.

    PairVariableSet x;
    x.add(model, "T1", "P3");            // binary named "assign[T1,P3]"
    GRBVar* v = x.try_get("T1", "P3");   // nullptr if never created

    for (const auto& e : x) {
        if (value(e.var) > 0.5) mapping[e.program] = e.tpm;
    }

The free helper value() reads a solved variable.

===============================================================================
*/

#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "gurobi_c++.h"

namespace tpmopt {

    /// @brief Solver name for an assignment binary: "assign[T1,P3]"
    inline std::string pairVariableName(const std::string& tpmId, const std::string& programId) {
        return "assign[" + tpmId + "," + programId + "]";
    }

    /**
     * @class PairVariableSet
     * @brief Binary variables indexed by (tpm id, program id)
     */
    class PairVariableSet {
    public:
        struct Entry {
            std::string tpm;
            std::string program;
            GRBVar var;
        };

    private:
        std::vector<Entry> entries_;
        std::map<std::pair<std::string, std::string>, std::size_t> index_;

    public:
        /**
         * @brief Create a binary for the pair and register it
         * @throws std::logic_error if the pair already has a variable
         */
        GRBVar& add(GRBModel& model, const std::string& tpmId, const std::string& programId,
                    double objective = 0.0)
        {
            auto key = std::make_pair(tpmId, programId);
            if (index_.count(key))
                throw std::logic_error("PairVariableSet: duplicate variable " +
                                       pairVariableName(tpmId, programId));
            GRBVar v = model.addVar(0.0, 1.0, objective, GRB_BINARY,
                                    pairVariableName(tpmId, programId));
            index_.emplace(std::move(key), entries_.size());
            entries_.push_back(Entry{tpmId, programId, v});
            return entries_.back().var;
        }

        GRBVar* try_get(const std::string& tpmId, const std::string& programId) {
            auto it = index_.find({tpmId, programId});
            return it == index_.end() ? nullptr : &entries_[it->second].var;
        }

        /// @throws std::out_of_range if the pair has no variable
        GRBVar& at(const std::string& tpmId, const std::string& programId) {
            GRBVar* v = try_get(tpmId, programId);
            if (!v)
                throw std::out_of_range("PairVariableSet: no variable " +
                                        pairVariableName(tpmId, programId));
            return *v;
        }

        bool contains(const std::string& tpmId, const std::string& programId) const {
            return index_.count({tpmId, programId}) > 0;
        }

        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }
        void clear() noexcept {
            entries_.clear();
            index_.clear();
        }

        auto begin() noexcept { return entries_.begin(); }
        auto end() noexcept { return entries_.end(); }
        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }
    };

    /// @brief Solution value of a variable after a successful solve
    inline double value(const GRBVar& v) {
        return v.get(GRB_DoubleAttr_X);
    }

} // namespace tpmopt
