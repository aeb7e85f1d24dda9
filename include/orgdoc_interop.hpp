// orgdoc_interop.hpp - Orgdoc - Interop adapters
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Conversions from views to standard library types. Timestamps carry no
// time zone, so the chrono values are civil times expressed on the
// system_clock epoch.

#ifndef ORGDOC_INTEROP_HPP
#define ORGDOC_INTEROP_HPP

#include "orgdoc_ast.hpp"

#include <chrono>
#include <map>

namespace orgdoc::interop
{
    enum class endpoint
    {
        start,
        end
    };

//========================================================================
// Timestamps
//========================================================================

    // Date part. Absent for diary timestamps and impossible dates.
    inline std::optional<std::chrono::year_month_day> to_year_month_day(timestamp_view const & ts, endpoint which = endpoint::start)
    {
        bool const end = which == endpoint::end;
        auto y = end ? ts.year_end() : ts.year_start();
        auto m = end ? ts.month_end() : ts.month_start();
        auto d = end ? ts.day_end() : ts.day_start();
        if (!y || !m || !d)
            return std::nullopt;

        std::chrono::year_month_day ymd {
            std::chrono::year(static_cast<int>(*y)),
            std::chrono::month(*m),
            std::chrono::day(*d)
        };
        if (!ymd.ok())
            return std::nullopt;
        return ymd;
    }

    // Date and time. A timestamp without a time maps to midnight.
    inline std::optional<std::chrono::sys_seconds> to_sys_seconds(timestamp_view const & ts, endpoint which = endpoint::start)
    {
        auto ymd = to_year_month_day(ts, which);
        if (!ymd)
            return std::nullopt;

        bool const end = which == endpoint::end;
        unsigned const hour   = (end ? ts.hour_end() : ts.hour_start()).value_or(0);
        unsigned const minute = (end ? ts.minute_end() : ts.minute_start()).value_or(0);
        if (hour > 23 || minute > 59)
            return std::nullopt;

        return std::chrono::sys_days(*ymd) + std::chrono::hours(hour) + std::chrono::minutes(minute);
    }

    // CLOCK duration "H:MM"; absent on a running clock.
    inline std::optional<std::chrono::minutes> to_duration(clock_view const & clock)
    {
        auto text = clock.duration();
        if (!text)
            return std::nullopt;

        auto colon = text->find(':');
        if (colon == std::string::npos)
            return std::nullopt;

        auto h = detail::parse_unsigned(std::string_view(*text).substr(0, colon));
        auto m = detail::parse_unsigned(std::string_view(*text).substr(colon + 1));
        if (!h || !m)
            return std::nullopt;
        return std::chrono::hours(*h) + std::chrono::minutes(*m);
    }

//========================================================================
// Property drawers
//========================================================================

    // Entries in drawer order, exactly as written.
    inline std::vector<std::pair<std::string, std::string>> to_vector(property_drawer_view const & drawer)
    {
        std::vector<std::pair<std::string, std::string>> out;
        for (auto const & e : drawer.entries())
            out.emplace_back(e.key(), e.value());
        return out;
    }

    // Keys upper-cased; `:KEY+:` entries extend the earlier value.
    inline std::map<std::string, std::string> to_map(property_drawer_view const & drawer)
    {
        std::map<std::string, std::string> out;
        for (auto const & e : drawer.entries())
        {
            auto key = detail::upper_copy(e.key());
            auto it  = out.find(key);
            if (e.is_append() && it != out.end())
                it->second += " " + e.value();
            else
                out[key] = e.value();
        }
        return out;
    }

} // namespace orgdoc::interop

#endif // ORGDOC_INTEROP_HPP
