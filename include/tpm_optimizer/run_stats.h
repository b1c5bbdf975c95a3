#pragma once
/*
===============================================================================
RUN STATS — Typed key/value record of what an optimization run did
===============================================================================

OVERVIEW
--------
Every optimizer owns a RunStats. Strategies write counters and outcomes into
it ("iterations", "best_energy", "solver_status", "stop_reason", ...) and
callers read them back after optimize() without the strategy having to grow a
dedicated accessor for each figure.

KEY COMPONENTS
--------------
• StatValue: std::variant<bool, int, double, std::string>
• RunStats: ordered string → StatValue map with typed access
• get<T>(key), get_or<T>(key, fallback), try_get<T>(key)
• print(os): one "key = value" line per entry, keys in lexical order

USAGE EXAMPLES
--------------
    RunStats stats;
    stats["iterations"] = 1378;
    stats["best_energy"] = 4.25;
    stats["stop_reason"] = std::string("temperature");

    int it = stats.get<int>("iterations");
    double t = stats.get_or<double>("runtime_s", 0.0);

EXCEPTION SAFETY
----------------
• get<T>(): std::out_of_range for a missing key, std::bad_variant_access on a
  type mismatch
• get_or<T>() / try_get<T>(): no-throw

===============================================================================
*/

#include <map>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace tpmopt {

    using StatValue = std::variant<bool, int, double, std::string>;

    /**
     * @class RunStats
     * @brief Named statistics recorded by a single optimization run
     *
     * @details Ordered by key so that printed reports are stable across runs.
     *          Writing through operator[] replaces any previous value and type.
     */
    class RunStats {
        std::map<std::string, StatValue> entries_;

    public:
        StatValue& operator[](const std::string& key) { return entries_[key]; }

        bool contains(const std::string& key) const {
            return entries_.find(key) != entries_.end();
        }

        std::size_t size() const noexcept { return entries_.size(); }
        bool empty() const noexcept { return entries_.empty(); }
        void clear() noexcept { entries_.clear(); }

        /**
         * @brief Strict typed access
         * @throws std::out_of_range if key is absent
         * @throws std::bad_variant_access if the stored type differs
         */
        template<typename T>
        const T& get(const std::string& key) const {
            auto it = entries_.find(key);
            if (it == entries_.end())
                throw std::out_of_range("RunStats::get: no entry named '" + key + "'");
            return std::get<T>(it->second);
        }

        /// @brief Typed access returning nullptr on a missing key or type mismatch
        template<typename T>
        const T* try_get(const std::string& key) const noexcept {
            auto it = entries_.find(key);
            if (it == entries_.end())
                return nullptr;
            return std::get_if<T>(&it->second);
        }

        template<typename T>
        T get_or(const std::string& key, T fallback) const noexcept {
            const T* value = try_get<T>(key);
            return value ? *value : fallback;
        }

        auto begin() const noexcept { return entries_.begin(); }
        auto end() const noexcept { return entries_.end(); }

        void print(std::ostream& os) const {
            for (const auto& [key, value] : entries_) {
                os << "  " << key << " = ";
                std::visit([&os](const auto& v) {
                    using V = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<V, bool>)
                        os << (v ? "true" : "false");
                    else
                        os << v;
                }, value);
                os << "\n";
            }
        }
    };

} // namespace tpmopt
