// orgdoc_core.hpp - Orgdoc - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef ORGDOC_CORE_HPP
#define ORGDOC_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <compare>

namespace orgdoc
{
//========================================================================
// Offsets and ranges
//========================================================================

    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

    // Half-open byte range [start, end) in the document buffer.
    struct text_range
    {
        size_t start = 0;
        size_t end   = 0;

        constexpr text_range() = default;
        constexpr text_range(size_t s, size_t e) : start(s), end(e) {}

        constexpr size_t length() const noexcept { return end - start; }
        constexpr bool   empty() const noexcept { return start == end; }

        constexpr bool contains(size_t offset) const noexcept
        {
            return start <= offset && offset < end;
        }

        constexpr bool contains_inclusive(size_t offset) const noexcept
        {
            return start <= offset && offset <= end;
        }

        constexpr bool contains_range(text_range const & r) const noexcept
        {
            return start <= r.start && r.end <= end;
        }

        auto operator<=>(text_range const &) const = default;
    };

//========================================================================
// Error reporting
//========================================================================

    template <typename Kind>
    struct error
    {
        Kind        kind;
        text_range  range;
        std::string message;
    };

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }

        T *       operator->()       { return &result; }
        T const * operator->() const { return &result; }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        inline bool is_space(char c) noexcept { return c == ' ' || c == '\t'; }
        inline bool is_eol(char c) noexcept { return c == '\n' || c == '\r'; }
        inline bool is_whitespace(char c) noexcept { return is_space(c) || is_eol(c); }
        inline bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }
        inline bool is_alpha(char c) noexcept { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'); }
        inline bool is_alnum(char c) noexcept { return is_alpha(c) || is_digit(c); }

        // Bytes >= 0x80 belong to multi-byte UTF-8 sequences and are treated as
        // word characters by the inline grammar.
        inline bool is_word(char c) noexcept
        {
            return is_alnum(c) || static_cast<unsigned char>(c) >= 0x80;
        }

        inline char to_upper(char c) noexcept
        {
            return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
        }

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string_view trim_start_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            return s.substr(start);
        }

        inline std::string_view trim_end_sv(std::string_view s)
        {
            size_t end = s.find_last_not_of(" \t\r\n");
            if (end == std::string_view::npos) return {};
            return s.substr(0, end + 1);
        }

        inline bool iequals(std::string_view a, std::string_view b) noexcept
        {
            if (a.size() != b.size())
                return false;
            for (size_t i = 0; i < a.size(); ++i)
                if (to_upper(a[i]) != to_upper(b[i]))
                    return false;
            return true;
        }

        inline bool istarts_with(std::string_view s, std::string_view prefix) noexcept
        {
            return s.size() >= prefix.size() && iequals(s.substr(0, prefix.size()), prefix);
        }

        inline std::string upper_copy(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](char c) { return to_upper(c); });
            return out;
        }

        inline bool contains_ci(std::vector<std::string> const & set, std::string_view s)
        {
            return std::any_of(set.begin(), set.end(),
                               [s](std::string const & e) { return iequals(e, s); });
        }

        inline bool contains(std::vector<std::string> const & set, std::string_view s)
        {
            return std::any_of(set.begin(), set.end(),
                               [s](std::string const & e) { return e == s; });
        }

        inline std::optional<unsigned> parse_unsigned(std::string_view s)
        {
            if (s.empty())
                return std::nullopt;
            unsigned v = 0;
            for (char c : s)
            {
                if (!is_digit(c))
                    return std::nullopt;
                v = v * 10 + static_cast<unsigned>(c - '0');
            }
            return v;
        }
    }

} // namespace orgdoc

#endif // ORGDOC_CORE_HPP
