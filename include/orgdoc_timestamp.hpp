// orgdoc_timestamp.hpp - Orgdoc - Timestamp grammar
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Recognised forms:
//   <2003-09-16 Tue>                active
//   [2003-09-16 Tue 09:39]          inactive
//   <2003-09-16 Tue 09:39-10:39>    time range
//   <2003-09-16>--<2003-09-18>      date range (either bracket style)
//   <2003-09-16 Tue 09:39 +1w -2d>  repeater (+ ++ .+) and warning delay (- --)
//   <%%(diary-sexp)>                diary

#ifndef ORGDOC_TIMESTAMP_HPP
#define ORGDOC_TIMESTAMP_HPP

#include "orgdoc_green.hpp"
#include "orgdoc_lexer.hpp"

namespace orgdoc
{
    struct timestamp_match
    {
        green_node_ptr node;
        size_t         length = 0;
    };

    // Parses a timestamp at the start of `s`. Trailing input is ignored.
    std::optional<timestamp_match> parse_timestamp(std::string_view s);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        struct ts_scanner
        {
            std::string_view s;
            size_t           pos = 0;
            node_builder     b;

            bool at_end() const { return pos >= s.size(); }
            char peek(size_t ahead = 0) const { return pos + ahead < s.size() ? s[pos + ahead] : '\0'; }

            bool digits(syntax_kind kind, size_t n)
            {
                if (pos + n > s.size())
                    return false;
                for (size_t i = 0; i < n; ++i)
                    if (!is_digit(s[pos + i]))
                        return false;
                b.token(kind, s.substr(pos, n));
                pos += n;
                return true;
            }

            bool literal(syntax_kind kind, std::string_view lit)
            {
                if (s.substr(pos).starts_with(lit))
                {
                    b.token(kind, lit);
                    pos += lit.size();
                    return true;
                }
                return false;
            }

            // Whitespace that must be followed by something matching `next`.
            size_t ws_len() const
            {
                size_t i = pos;
                while (i < s.size() && is_space(s[i]))
                    ++i;
                return i - pos;
            }

            // H:MM or HH:MM
            bool time()
            {
                size_t h = 0;
                while (pos + h < s.size() && is_digit(s[pos + h]) && h < 2)
                    ++h;
                if (h == 0 || peek(h) != ':' || !is_digit(peek(h + 1)) || !is_digit(peek(h + 2)))
                    return false;
                b.token(syntax_kind::timestamp_hour, s.substr(pos, h));
                pos += h;
                literal(syntax_kind::colon, ":");
                digits(syntax_kind::timestamp_minute, 2);
                return true;
            }

            // mark value unit, e.g. `.+2w` or `--1d`
            bool interval(syntax_kind mark_kind, std::string_view const * marks, size_t nmarks)
            {
                for (size_t m = 0; m < nmarks; ++m)
                {
                    auto mark = marks[m];
                    if (!s.substr(pos).starts_with(mark))
                        continue;
                    size_t v = count_while(s, pos + mark.size(), is_digit);
                    char unit = peek(mark.size() + v);
                    if (v == 0 || std::string_view("hdwmy").find(unit) == std::string_view::npos || unit == '\0')
                        continue;
                    b.token(mark_kind, mark);
                    pos += mark.size();
                    b.token(syntax_kind::timestamp_value, s.substr(pos, v));
                    pos += v;
                    b.token(syntax_kind::timestamp_unit, s.substr(pos, 1));
                    pos += 1;
                    return true;
                }
                return false;
            }
        };

        inline bool is_dayname_char(char c) noexcept
        {
            return !is_whitespace(c) && !is_digit(c) && c != '+' && c != '-' && c != ']' && c != '>' && c != '\0';
        }

        // One bracketed timestamp starting at `pos`. Appends its tokens to sc.b.
        inline bool scan_single(ts_scanner & sc, char open)
        {
            char close = open == '<' ? '>' : ']';
            syntax_kind lk = open == '<' ? syntax_kind::l_angle : syntax_kind::l_bracket;
            syntax_kind rk = open == '<' ? syntax_kind::r_angle : syntax_kind::r_bracket;

            if (sc.peek() != open)
                return false;
            sc.b.token(lk, sc.s.substr(sc.pos, 1));
            ++sc.pos;

            if (!sc.digits(syntax_kind::timestamp_year, 4)) return false;
            if (!sc.literal(syntax_kind::minus, "-"))       return false;
            if (!sc.digits(syntax_kind::timestamp_month, 2)) return false;
            if (!sc.literal(syntax_kind::minus, "-"))       return false;
            if (!sc.digits(syntax_kind::timestamp_day, 2))   return false;

            static constexpr std::string_view repeaters[] = { "++", ".+", "+" };
            static constexpr std::string_view delays[]    = { "--", "-" };

            bool seen_dayname = false, seen_time = false, seen_rep = false, seen_delay = false;
            for (;;)
            {
                size_t ws = sc.ws_len();
                if (ws == 0)
                    break;

                size_t save_pos = sc.pos;
                size_t save_len = sc.b.children.size();
                sc.b.ws(sc.s.substr(sc.pos, ws));
                sc.pos += ws;

                bool ok = false;
                if (!seen_time && !seen_rep && !seen_delay && is_digit(sc.peek()))
                {
                    ok = sc.time();
                    if (ok && sc.peek() == '-' && is_digit(sc.peek(1)))
                    {
                        size_t p2 = sc.pos;
                        size_t l2 = sc.b.children.size();
                        sc.literal(syntax_kind::minus, "-");
                        if (!sc.time())
                        {
                            sc.pos = p2;
                            sc.b.children.resize(l2);
                        }
                    }
                    seen_time = ok;
                }
                else if (!seen_rep && (sc.peek() == '+' || sc.peek() == '.'))
                {
                    ok = seen_rep = sc.interval(syntax_kind::timestamp_repeater_mark, repeaters, 3);
                }
                else if (!seen_delay && sc.peek() == '-')
                {
                    ok = seen_delay = sc.interval(syntax_kind::timestamp_delay_mark, delays, 2);
                }
                else if (!seen_dayname && !seen_time && !seen_rep && !seen_delay && is_dayname_char(sc.peek()))
                {
                    size_t n = 0;
                    while (is_dayname_char(sc.peek(n)))
                        ++n;
                    sc.b.token(syntax_kind::timestamp_dayname, sc.s.substr(sc.pos, n));
                    sc.pos += n;
                    ok = seen_dayname = true;
                }

                if (!ok)
                {
                    sc.pos = save_pos;
                    sc.b.children.resize(save_len);
                    break;
                }
            }

            if (sc.peek() != close)
                return false;
            sc.b.token(rk, sc.s.substr(sc.pos, 1));
            ++sc.pos;
            return true;
        }
    }

//---------------------------------------------------------------------------

    inline std::optional<timestamp_match> parse_timestamp(std::string_view s)
    {
        using namespace detail;

        if (s.empty() || (s[0] != '<' && s[0] != '['))
            return std::nullopt;

        // Diary sexp: <%%(...)>
        if (s.starts_with("<%%("))
        {
            size_t close = s.find(")>", 4);
            size_t nl    = s.find('\n');
            if (close == std::string_view::npos || (nl != std::string_view::npos && nl < close))
                return std::nullopt;

            node_builder b;
            b.token(syntax_kind::l_angle, s.substr(0, 1));
            b.token(syntax_kind::percent2, s.substr(1, 2));
            b.text(s.substr(3, close + 1 - 3));
            b.token(syntax_kind::r_angle, s.substr(close + 1, 1));
            return timestamp_match{ b.finish(syntax_kind::timestamp_diary), close + 2 };
        }

        ts_scanner sc{ s };
        char open = s[0];
        if (!scan_single(sc, open))
            return std::nullopt;

        // Date range: <a>--<b>, both halves of the same kind
        if (s.substr(sc.pos).starts_with("--"))
        {
            ts_scanner second{ s, sc.pos + 2 };
            if (scan_single(second, open))
            {
                sc.b.token(syntax_kind::minus2, s.substr(sc.pos, 2));
                sc.b.extend(std::move(second.b.children));
                sc.pos = second.pos;
            }
        }

        auto kind = open == '<' ? syntax_kind::timestamp_active : syntax_kind::timestamp_inactive;
        size_t len = sc.pos;
        return timestamp_match{ sc.b.finish(kind), len };
    }

} // namespace orgdoc

#endif // ORGDOC_TIMESTAMP_HPP
