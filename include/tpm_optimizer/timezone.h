#pragma once
/*
===============================================================================
TIMEZONES — Offset lookup behind the scoring and objective layers
===============================================================================

OVERVIEW
--------
The optimizer only needs one question answered about timezones: how many
hours apart are two identifiers? TimezoneScorer is that interface.
StaticTimezoneTable is the in-process implementation used by default.

    difference = | utcOffsetHours(a) - utcOffsetHours(b) |

Blank and unknown identifiers are treated as UTC (offset 0).

RECOGNIZED IDENTIFIERS (StaticTimezoneTable)
--------------------------------------------
• Catalog of common IANA names at their standard (non-DST) offset,
  e.g. "America/New_York" = -5, "Asia/Kolkata" = +5.5, "Europe/Berlin" = +1
• Literal offsets: "UTC", "GMT", "UTC+2", "UTC-03:30", "GMT+5:45", "+09:00"
• POSIX-style "Etc/GMT+5" (sign inverted: Etc/GMT+5 is UTC-5)
• Anything registered through set(name, hours), which takes precedence

BARYCENTRIC DIFFERENCE
----------------------
Programs have a home timezone plus stakeholder timezones. Their "center" is
the mean offset of all non-blank identifiers; barycentricDifference() measures
a TPM against that center. With no identifiers at all the difference is 0.

USAGE EXAMPLES
--------------
    const TimezoneScorer& tz = defaultTimezoneTable();
    double h = tz.differenceInHours("America/New_York", "Europe/London"); // 5

    StaticTimezoneTable custom;
    custom.set("HQ", -8.0);

===============================================================================
*/

#include <cctype>
#include <cmath>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace tpmopt {

    /**
     * @class TimezoneScorer
     * @brief Source of UTC offsets for timezone identifiers
     */
    class TimezoneScorer {
    public:
        virtual ~TimezoneScorer() = default;

        /// @brief UTC offset in hours; blank/unknown identifiers return 0
        virtual double utcOffsetHours(std::string_view tz) const = 0;

        double differenceInHours(std::string_view a, std::string_view b) const {
            return std::abs(utcOffsetHours(a) - utcOffsetHours(b));
        }
    };

    /**
     * @class StaticTimezoneTable
     * @brief Fixed offsets for a catalog of zone names and literal UTC offsets
     */
    class StaticTimezoneTable : public TimezoneScorer {
        std::map<std::string, double, std::less<>> overrides_;

    public:
        StaticTimezoneTable() = default;

        /// @brief Register or replace an identifier's offset
        void set(std::string name, double hours) { overrides_[std::move(name)] = hours; }

        double utcOffsetHours(std::string_view tz) const override {
            tz = trim(tz);
            if (tz.empty())
                return 0.0;

            if (auto it = overrides_.find(tz); it != overrides_.end())
                return it->second;

            const auto& cat = catalog();
            if (auto it = cat.find(tz); it != cat.end())
                return it->second;

            if (auto literal = parseLiteral(tz))
                return *literal;

            return 0.0;
        }

        /// @brief True if the identifier resolves without falling back to UTC
        bool knows(std::string_view tz) const {
            tz = trim(tz);
            if (tz.empty())
                return false;
            return overrides_.count(tz) > 0 || catalog().count(tz) > 0 ||
                   parseLiteral(tz).has_value();
        }

    private:
        static std::string_view trim(std::string_view s) noexcept {
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
                s.remove_prefix(1);
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
                s.remove_suffix(1);
            return s;
        }

        /// Parses "[UTC|GMT][+|-]H[:MM]" and "Etc/GMT[+|-]H".
        static std::optional<double> parseLiteral(std::string_view tz) {
            bool inverted = false;
            if (tz.substr(0, 7) == "Etc/GMT") {
                tz.remove_prefix(7);
                inverted = true;
            } else if (tz.substr(0, 3) == "UTC" || tz.substr(0, 3) == "GMT") {
                tz.remove_prefix(3);
            }
            if (tz.empty())
                return 0.0;

            double sign = 1.0;
            if (tz.front() == '+') {
                tz.remove_prefix(1);
            } else if (tz.front() == '-') {
                sign = -1.0;
                tz.remove_prefix(1);
            } else {
                return std::nullopt;
            }

            int hours = 0, minutes = 0, digits = 0;
            while (!tz.empty() && std::isdigit(static_cast<unsigned char>(tz.front()))) {
                hours = hours * 10 + (tz.front() - '0');
                tz.remove_prefix(1);
                ++digits;
            }
            if (digits == 0 || digits > 2)
                return std::nullopt;

            if (!tz.empty()) {
                if (tz.front() != ':' || tz.size() != 3)
                    return std::nullopt;
                if (!std::isdigit(static_cast<unsigned char>(tz[1])) ||
                    !std::isdigit(static_cast<unsigned char>(tz[2])))
                    return std::nullopt;
                minutes = (tz[1] - '0') * 10 + (tz[2] - '0');
                if (minutes >= 60)
                    return std::nullopt;
            }
            if (hours > 14)
                return std::nullopt;

            double offset = sign * (hours + minutes / 60.0);
            return inverted ? -offset : offset;
        }

        static const std::map<std::string, double, std::less<>>& catalog() {
            static const std::map<std::string, double, std::less<>> table = {
                {"UTC", 0.0},  {"GMT", 0.0},  {"Etc/UTC", 0.0},
                // Americas
                {"America/Anchorage", -9.0},   {"America/Los_Angeles", -8.0},
                {"America/Vancouver", -8.0},   {"America/Tijuana", -8.0},
                {"America/Denver", -7.0},      {"America/Phoenix", -7.0},
                {"America/Chicago", -6.0},     {"America/Mexico_City", -6.0},
                {"America/New_York", -5.0},    {"America/Toronto", -5.0},
                {"America/Bogota", -5.0},      {"America/Lima", -5.0},
                {"America/Halifax", -4.0},     {"America/Santiago", -4.0},
                {"America/Caracas", -4.0},     {"America/Sao_Paulo", -3.0},
                {"America/Argentina/Buenos_Aires", -3.0},
                {"America/St_Johns", -3.5},    {"Pacific/Honolulu", -10.0},
                {"US/Pacific", -8.0}, {"US/Mountain", -7.0},
                {"US/Central", -6.0}, {"US/Eastern", -5.0},
                // Europe / Africa
                {"Europe/London", 0.0},        {"Europe/Dublin", 0.0},
                {"Europe/Lisbon", 0.0},        {"Africa/Casablanca", 0.0},
                {"Europe/Paris", 1.0},         {"Europe/Berlin", 1.0},
                {"Europe/Madrid", 1.0},        {"Europe/Rome", 1.0},
                {"Europe/Amsterdam", 1.0},     {"Europe/Zurich", 1.0},
                {"Europe/Stockholm", 1.0},     {"Europe/Warsaw", 1.0},
                {"Africa/Lagos", 1.0},         {"Europe/Athens", 2.0},
                {"Europe/Helsinki", 2.0},      {"Europe/Kiev", 2.0},
                {"Europe/Kyiv", 2.0},          {"Africa/Cairo", 2.0},
                {"Africa/Johannesburg", 2.0},  {"Asia/Jerusalem", 2.0},
                {"Europe/Istanbul", 3.0},      {"Europe/Moscow", 3.0},
                {"Africa/Nairobi", 3.0},       {"Asia/Riyadh", 3.0},
                // Asia / Pacific
                {"Asia/Tehran", 3.5},          {"Asia/Dubai", 4.0},
                {"Asia/Karachi", 5.0},         {"Asia/Kolkata", 5.5},
                {"Asia/Calcutta", 5.5},        {"Asia/Kathmandu", 5.75},
                {"Asia/Dhaka", 6.0},           {"Asia/Bangkok", 7.0},
                {"Asia/Jakarta", 7.0},         {"Asia/Ho_Chi_Minh", 7.0},
                {"Asia/Shanghai", 8.0},        {"Asia/Hong_Kong", 8.0},
                {"Asia/Singapore", 8.0},       {"Asia/Taipei", 8.0},
                {"Asia/Manila", 8.0},          {"Australia/Perth", 8.0},
                {"Asia/Tokyo", 9.0},           {"Asia/Seoul", 9.0},
                {"Australia/Adelaide", 9.5},   {"Australia/Brisbane", 10.0},
                {"Australia/Sydney", 10.0},    {"Australia/Melbourne", 10.0},
                {"Pacific/Auckland", 12.0},
            };
            return table;
        }
    };

    /// @brief Process-wide default table (read-only)
    inline const StaticTimezoneTable& defaultTimezoneTable() {
        static const StaticTimezoneTable table;
        return table;
    }

    /**
     * @brief Distance in hours from a TPM's zone to the mean offset of a
     *        program's home and stakeholder zones
     *
     * @return 0 when the program names no zone at all
     */
    inline double barycentricDifference(const TimezoneScorer& tz,
                                        std::string_view tpmZone,
                                        std::string_view programZone,
                                        const std::set<std::string>& stakeholderZones)
    {
        auto blank = [](std::string_view s) {
            return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
        };

        double sum = 0.0;
        int count = 0;
        if (!blank(programZone)) {
            sum += tz.utcOffsetHours(programZone);
            ++count;
        }
        for (const auto& zone : stakeholderZones) {
            if (blank(zone))
                continue;
            sum += tz.utcOffsetHours(zone);
            ++count;
        }
        if (count == 0)
            return 0.0;
        return std::abs(tz.utcOffsetHours(tpmZone) - sum / count);
    }

} // namespace tpmopt
