#pragma once
/*
===============================================================================
OPTIMIZER — Shared lifecycle of the assignment strategies
===============================================================================

OVERVIEW
--------
Optimizer is the abstract base of the four strategies. It owns everything a
run needs and nothing a caller has to manage:

    * private copies of the TPM and program maps
    * a validated copy of the OptimizerConfig
    * the ConstraintEngine built over those copies
    * the current mapping, a RunStats record and a std::mt19937_64

Derived classes implement optimize() and name(). The base class fixes the
lifecycle:

    construct  → config.validate(), engine built, RNG seeded
    optimize() → strategy-specific; stores and returns the mapping
    read back  → assignments(), stats(), fixedAssignments()

The local-search strategies share proposeMove(): with the configured
probability a swap of two unpinned programs sitting on different TPMs,
otherwise a move of one unpinned program to another TPM that is legal for it.
Pinned programs are never proposed.

OUTPUT
------
Optimizers are quiet by default. verbose(os) sends progress lines and
diagnostic reports to os; quiet() silences them again. Derived classes write
through log(), which is a null stream while quiet.

REPRODUCIBILITY
---------------
The RNG is seeded from OptimizerConfig::seed when set, otherwise from
std::random_device. seed(n) reseeds at any time between runs.

USAGE EXAMPLES
--------------
    AnnealingOptimizer sa(tpms, programs, cfg);
    sa.verbose(std::clog).seed(7);
    Assignment result = sa.optimize();
    sa.stats().print(std::cout);

DESIGN NOTES
------------
* Optimizers are neither copyable nor movable: the engine refers to the maps
  held by the same object.
* The TimezoneScorer is held by reference and must outlive the optimizer; the
  default table is a process-wide static.

===============================================================================
*/

#include <algorithm>
#include <cstdint>
#include <optional>
#include <iostream>
#include <ostream>
#include <random>
#include <streambuf>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "assignment.h"
#include "config.h"
#include "constraints.h"
#include "domain.h"
#include "run_stats.h"
#include "timezone.h"

namespace tpmopt {

    namespace optimizer_detail {

        class NullBuffer : public std::streambuf {
        protected:
            int overflow(int c) override { return traits_type::not_eof(c); }
        };

        inline std::ostream& nullStream() {
            static NullBuffer buffer;
            static std::ostream stream(&buffer);
            return stream;
        }

    } // namespace optimizer_detail

    /**
     * @class Optimizer
     * @brief Abstract base class of every assignment strategy
     */
    class Optimizer {
    protected:
        TpmMap tpms_;
        ProgramMap programs_;
        OptimizerConfig config_;
        const TimezoneScorer& timezones_;
        ConstraintEngine engine_;

        Assignment assignments_;
        RunStats stats_;
        std::mt19937_64 rng_;

    private:
        std::ostream* log_ = nullptr;

    public:
        /// @throws std::invalid_argument if the configuration does not validate
        Optimizer(TpmMap tpms, ProgramMap programs, OptimizerConfig config = {},
                  const TimezoneScorer& timezones = defaultTimezoneTable())
            : tpms_(std::move(tpms)),
              programs_(std::move(programs)),
              config_(validated(std::move(config))),
              timezones_(timezones),
              engine_(tpms_, programs_, config_.scoring, timezones_),
              rng_(config_.seed ? *config_.seed : std::random_device{}())
        {
        }

        virtual ~Optimizer() = default;

        Optimizer(const Optimizer&) = delete;
        Optimizer& operator=(const Optimizer&) = delete;

        /// @brief Run the strategy and return (and retain) the mapping
        virtual Assignment optimize() = 0;

        /// @brief Short strategy name for logs and reports
        virtual std::string_view name() const = 0;

        // ---------------------------------------------------------------------
        // Accessors
        // ---------------------------------------------------------------------

        const Assignment& assignments() const noexcept { return assignments_; }
        const TpmMap& tpms() const noexcept { return tpms_; }
        const ProgramMap& programs() const noexcept { return programs_; }
        const Assignment& fixedAssignments() const noexcept { return engine_.fixedAssignments(); }
        const ConstraintEngine& engine() const noexcept { return engine_; }
        const RunStats& stats() const noexcept { return stats_; }
        const OptimizerConfig& config() const noexcept { return config_; }

        // ---------------------------------------------------------------------
        // Output and RNG control
        // ---------------------------------------------------------------------

        Optimizer& quiet() noexcept {
            log_ = nullptr;
            return *this;
        }

        Optimizer& verbose(std::ostream& os = std::cout) noexcept {
            log_ = &os;
            return *this;
        }

        /// @brief Unpinned programs by complexity_score, then required_time, both descending
        std::vector<std::string> constructionOrder() const {
            std::vector<std::string> order;
            for (const auto& [programId, p] : programs_) {
                if (!engine_.isFixed(programId))
                    order.push_back(programId);
            }
            std::stable_sort(order.begin(), order.end(), [&](const auto& a, const auto& b) {
                const Program& pa = programs_.at(a);
                const Program& pb = programs_.at(b);
                if (pa.complexity_score != pb.complexity_score)
                    return pa.complexity_score > pb.complexity_score;
                return pa.required_time > pb.required_time;
            });
            return order;
        }

        bool isVerbose() const noexcept { return log_ != nullptr; }

        Optimizer& seed(std::uint64_t value) {
            rng_.seed(value);
            return *this;
        }

    protected:
        std::ostream& log() const {
            return log_ ? *log_ : optimizer_detail::nullStream();
        }

        /// @brief Uniform draw in [0, 1)
        double uniform() {
            return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
        }

        /// @brief Uniform index in [0, n); n must be positive
        std::size_t pick(std::size_t n) {
            return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng_);
        }

        /// @brief Random swap or reassignment of unpinned programs; nullopt if none exists
        std::optional<Move> proposeMove(const AssignmentState& state, double swapProbability) {
            if (uniform() < swapProbability) {
                if (auto swap = proposeSwap(state))
                    return swap;
            }
            return proposeReassign(state);
        }

        std::optional<Move> proposeSwap(const AssignmentState& state) {
            std::vector<std::string> placed;
            for (const auto& [programId, tpmId] : state.mapping()) {
                if (!engine_.isFixed(programId))
                    placed.push_back(programId);
            }
            if (placed.size() < 2)
                return std::nullopt;

            const std::string& first = placed[pick(placed.size())];
            const std::string& firstTpm = *state.tpmOf(first);

            std::vector<std::string> partners;
            for (const auto& programId : placed) {
                if (*state.tpmOf(programId) != firstTpm)
                    partners.push_back(programId);
            }
            if (partners.empty())
                return std::nullopt;

            return Move{Swap{first, partners[pick(partners.size())]}};
        }

        std::optional<Move> proposeReassign(const AssignmentState& state) {
            std::vector<std::string> movable;
            for (const auto& [programId, p] : programs_) {
                if (!engine_.isFixed(programId))
                    movable.push_back(programId);
            }
            if (movable.empty())
                return std::nullopt;

            const std::string& programId = movable[pick(movable.size())];
            const std::string* current = state.tpmOf(programId);

            std::vector<std::string> targets;
            for (const auto& tpmId : engine_.feasibleTpms(programId, state)) {
                if (!current || *current != tpmId)
                    targets.push_back(tpmId);
            }
            if (targets.empty())
                return std::nullopt;

            return makeReassign(state, programId, targets[pick(targets.size())]);
        }

    private:
        static OptimizerConfig validated(OptimizerConfig config) {
            config.validate();
            return config;
        }
    };

} // namespace tpmopt
