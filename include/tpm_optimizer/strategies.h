#pragma once
/*
===============================================================================
STRATEGIES — Choosing an optimizer by name
===============================================================================

    StrategyKind kind = parseStrategy("sa");          // StrategyKind::Annealing
    auto opt = makeOptimizer(kind, tpms, programs, cfg);
    Assignment result = opt->optimize();

Accepted names (case-insensitive): "milp", "sa", "hybrid", "two-phase", plus
the enumerator spellings "Exact", "Annealing", "Hybrid", "TwoPhase".

===============================================================================
*/

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "annealing_optimizer.h"
#include "enum_utils.h"
#include "exact_optimizer.h"
#include "hybrid_optimizer.h"
#include "optimizer.h"
#include "two_phase_optimizer.h"

namespace tpmopt {

    TPMOPT_DECLARE_ENUM_WITH_COUNT(StrategyKind, Exact, Annealing, Hybrid, TwoPhase);

    /// @throws std::invalid_argument for an unrecognized name
    inline StrategyKind parseStrategy(std::string_view name) {
        static constexpr std::pair<std::string_view, StrategyKind> aliases[] = {
            {"milp", StrategyKind::Exact},
            {"sa", StrategyKind::Annealing},
            {"hybrid", StrategyKind::Hybrid},
            {"two-phase", StrategyKind::TwoPhase},
        };

        const std::string_view key = enum_detail::trim(name);
        for (const auto& [alias, kind] : aliases) {
            if (enum_detail::equalsIgnoreCase(alias, key))
                return kind;
        }
        if (auto kind = enumFromName<StrategyKind>(key))
            return *kind;

        throw std::invalid_argument("Unknown strategy '" + std::string(name) +
                                    "' (expected milp, sa, hybrid or two-phase)");
    }

    inline std::unique_ptr<Optimizer> makeOptimizer(StrategyKind kind, TpmMap tpms, ProgramMap programs,
                                                    OptimizerConfig config = {},
                                                    const TimezoneScorer& timezones = defaultTimezoneTable())
    {
        switch (kind) {
            case StrategyKind::Exact:
                return std::make_unique<ExactOptimizer>(std::move(tpms), std::move(programs),
                                                        std::move(config), timezones);
            case StrategyKind::Annealing:
                return std::make_unique<AnnealingOptimizer>(std::move(tpms), std::move(programs),
                                                            std::move(config), timezones);
            case StrategyKind::Hybrid:
                return std::make_unique<HybridOptimizer>(std::move(tpms), std::move(programs),
                                                         std::move(config), timezones);
            case StrategyKind::TwoPhase:
                return std::make_unique<TwoPhaseOptimizer>(std::move(tpms), std::move(programs),
                                                           std::move(config), timezones);
            case StrategyKind::COUNT:
                break;
        }
        throw std::invalid_argument("makeOptimizer: invalid strategy kind");
    }

} // namespace tpmopt
