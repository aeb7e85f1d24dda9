// orgdoc_lexer.hpp - Orgdoc - Line lexer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Block-level Org syntax is line oriented. The lexer splits the source into
// lines that keep their terminators and offers the small recognisers the
// element parser is built from. Nothing here allocates tree nodes.

#ifndef ORGDOC_LEXER_HPP
#define ORGDOC_LEXER_HPP

#include "orgdoc_core.hpp"

namespace orgdoc
{
//========================================================================
// Lines
//========================================================================

    struct line
    {
        std::string_view body;   // without terminator
        std::string_view eol;    // "\n", "\r\n" or empty on an unterminated last line

        std::string_view full() const noexcept
        {
            return { body.data(), body.size() + eol.size() };
        }

        size_t width() const noexcept { return body.size() + eol.size(); }
    };

    using line_list = std::vector<line>;

    // Splits `src` into lines. An empty source has no lines and a trailing
    // terminator does not open an empty last line.
    line_list split_lines(std::string_view src);

    // A line covering the tail of `l` from byte `from` of its body.
    line line_tail(line const & l, size_t from);

//========================================================================
// Recognisers
//========================================================================

    namespace detail
    {
        inline std::string_view leading_ws(std::string_view s) noexcept
        {
            size_t i = 0;
            while (i < s.size() && is_space(s[i]))
                ++i;
            return s.substr(0, i);
        }

        inline std::string_view trailing_ws(std::string_view s) noexcept
        {
            size_t i = s.size();
            while (i > 0 && is_space(s[i - 1]))
                --i;
            return s.substr(i);
        }

        // Column width of the leading whitespace, tabs expanding to the next stop.
        inline size_t indent_width(std::string_view s, size_t tab_width) noexcept
        {
            size_t col = 0;
            for (char c : s)
            {
                if (c == ' ')
                    ++col;
                else if (c == '\t')
                    col = tab_width ? (col / tab_width + 1) * tab_width : col + 1;
                else
                    break;
            }
            return col;
        }

        inline bool is_blank(std::string_view body) noexcept
        {
            return std::all_of(body.begin(), body.end(), [](char c) { return is_space(c); });
        }

        // Number of leading stars when the line is a headline, 0 otherwise.
        // A headline starts in column 0 and its stars are followed by a
        // literal space; a tab does not open a headline.
        inline size_t headline_level(std::string_view body) noexcept
        {
            size_t n = 0;
            while (n < body.size() && body[n] == '*')
                ++n;
            if (n == 0 || n >= body.size() || body[n] != ' ')
                return 0;
            return n;
        }

        inline size_t count_while(std::string_view s, size_t from, bool (*pred)(char) noexcept) noexcept
        {
            size_t i = from;
            while (i < s.size() && pred(s[i]))
                ++i;
            return i - from;
        }

        inline bool is_name_char(char c) noexcept
        {
            return is_word(c) || c == '_' || c == '-';
        }

        // `#+begin_NAME ...`, returns NAME.
        inline std::optional<std::string_view> block_begin_name(std::string_view body)
        {
            auto s = trim_start_sv(body);
            if (!istarts_with(s, "#+begin_"))
                return std::nullopt;
            s.remove_prefix(8);
            size_t n = 0;
            while (n < s.size() && !is_whitespace(s[n]))
                ++n;
            if (n == 0)
                return std::nullopt;
            return s.substr(0, n);
        }

        inline bool is_block_end(std::string_view body, std::string_view name)
        {
            auto s = trim_sv(body);
            return istarts_with(s, "#+end_") && iequals(s.substr(6), name);
        }

        inline bool is_dyn_block_begin(std::string_view body)
        {
            auto s = trim_start_sv(body);
            return istarts_with(s, "#+begin:") && !trim_sv(s.substr(8)).empty();
        }

        inline bool is_dyn_block_end(std::string_view body)
        {
            return iequals(trim_sv(body), "#+end:");
        }

        // `:NAME:` alone on its line, returns NAME.
        inline std::optional<std::string_view> drawer_name(std::string_view body)
        {
            auto s = trim_sv(body);
            if (s.size() < 3 || s.front() != ':' || s.back() != ':')
                return std::nullopt;
            auto name = s.substr(1, s.size() - 2);
            if (!std::all_of(name.begin(), name.end(), [](char c) { return is_name_char(c); }))
                return std::nullopt;
            return name;
        }

        inline bool is_drawer_end(std::string_view body)
        {
            return iequals(trim_sv(body), ":end:");
        }

        // `#+KEY: value`. Returns the key for any line of that shape.
        inline std::optional<std::string_view> keyword_key(std::string_view body)
        {
            auto s = trim_start_sv(body);
            if (s.size() < 3 || s[0] != '#' || s[1] != '+')
                return std::nullopt;
            size_t colon = s.find(':', 2);
            if (colon == std::string_view::npos || colon == 2)
                return std::nullopt;
            auto key = s.substr(2, colon - 2);
            if (std::any_of(key.begin(), key.end(), [](char c) { return is_whitespace(c); }))
                return std::nullopt;
            return key;
        }

        // Strips an optional `[secondary]` from an affiliated keyword key.
        inline std::string_view keyword_base(std::string_view key)
        {
            size_t br = key.find('[');
            return br == std::string_view::npos ? key : key.substr(0, br);
        }

        inline bool is_comment_line(std::string_view body)
        {
            auto s = trim_start_sv(body);
            return !s.empty() && s[0] == '#' && (s.size() == 1 || is_space(s[1]));
        }

        inline bool is_fixed_width_line(std::string_view body)
        {
            auto s = trim_start_sv(body);
            return !s.empty() && s[0] == ':' && (s.size() == 1 || is_space(s[1]));
        }

        inline bool is_rule_line(std::string_view body)
        {
            auto s = trim_sv(body);
            return s.size() >= 5 && std::all_of(s.begin(), s.end(), [](char c) { return c == '-'; });
        }

        inline bool is_table_line(std::string_view body)
        {
            auto s = trim_start_sv(body);
            return !s.empty() && s[0] == '|';
        }

        inline bool is_table_el_start(std::string_view body)
        {
            auto s = trim_start_sv(body);
            return s.size() >= 2 && s[0] == '+' && s[1] == '-';
        }

        inline bool is_table_el_line(std::string_view body)
        {
            auto s = trim_start_sv(body);
            return !s.empty() && (s[0] == '|' || s[0] == '+');
        }

        inline bool is_tblfm_line(std::string_view body)
        {
            auto k = keyword_key(body);
            return k && iequals(*k, "TBLFM");
        }

        // `[fn:LABEL]` at column 0, returns LABEL.
        inline std::optional<std::string_view> fn_def_label(std::string_view body)
        {
            if (!body.starts_with("[fn:"))
                return std::nullopt;
            size_t close = body.find(']', 4);
            if (close == std::string_view::npos || close == 4)
                return std::nullopt;
            auto label = body.substr(4, close - 4);
            if (!std::all_of(label.begin(), label.end(), [](char c) { return is_name_char(c); }))
                return std::nullopt;
            return label;
        }

        // `\begin{NAME}`, returns NAME.
        inline std::optional<std::string_view> latex_begin_name(std::string_view body)
        {
            auto s = trim_start_sv(body);
            if (!s.starts_with("\\begin{"))
                return std::nullopt;
            size_t close = s.find('}', 7);
            if (close == std::string_view::npos || close == 7)
                return std::nullopt;
            auto name = s.substr(7, close - 7);
            if (!std::all_of(name.begin(), name.end(), [](char c) { return is_alnum(c) || c == '*'; }))
                return std::nullopt;
            return name;
        }

        inline bool is_latex_end(std::string_view body, std::string_view name)
        {
            auto s = trim_sv(body);
            return s.starts_with("\\end{") && s.size() == name.size() + 6
                && s.substr(5, name.size()) == name && s.back() == '}';
        }

        inline bool is_clock_line(std::string_view body)
        {
            return trim_start_sv(body).starts_with("CLOCK:");
        }

        inline bool is_planning_word(std::string_view s)
        {
            return s.starts_with("SCHEDULED:") || s.starts_with("DEADLINE:") || s.starts_with("CLOSED:");
        }
    }

//========================================================================
// List bullets
//========================================================================

    struct bullet_match
    {
        size_t indent_len  = 0;   // bytes of leading whitespace
        size_t indent_cols = 0;   // columns of leading whitespace
        size_t bullet_len  = 0;   // bytes of the bullet itself
        bool   ordered     = false;
    };

    namespace detail
    {
        // Recognises `- `, `+ `, ` * `, `1. `, `1) `, `a. ` and `a) `. A bullet
        // must be followed by whitespace or the end of the line. A star bullet
        // needs indentation so that it cannot be confused with a headline.
        inline std::optional<bullet_match> match_bullet(std::string_view body, size_t tab_width)
        {
            bullet_match m;
            m.indent_len  = leading_ws(body).size();
            m.indent_cols = indent_width(body, tab_width);

            auto s = body.substr(m.indent_len);
            if (s.empty())
                return std::nullopt;

            if (s[0] == '-' || s[0] == '+' || (s[0] == '*' && m.indent_len > 0))
            {
                m.bullet_len = 1;
            }
            else
            {
                size_t n = count_while(s, 0, is_digit);
                if (n == 0 && is_alpha(s[0]))
                    n = 1;
                if (n == 0 || n >= s.size() || (s[n] != '.' && s[n] != ')'))
                    return std::nullopt;
                m.bullet_len = n + 1;
                m.ordered    = true;
            }

            if (m.bullet_len < s.size() && !is_space(s[m.bullet_len]))
                return std::nullopt;
            return m;
        }
    }

//========================================================================
// Implementation
//========================================================================

    inline line_list split_lines(std::string_view src)
    {
        line_list out;
        size_t pos = 0;
        while (pos < src.size())
        {
            size_t nl = src.find('\n', pos);
            if (nl == std::string_view::npos)
            {
                out.push_back({ src.substr(pos), src.substr(src.size(), 0) });
                break;
            }

            size_t body_end = (nl > pos && src[nl - 1] == '\r') ? nl - 1 : nl;
            out.push_back({ src.substr(pos, body_end - pos), src.substr(body_end, nl + 1 - body_end) });
            pos = nl + 1;
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline line line_tail(line const & l, size_t from)
    {
        return { l.body.substr(std::min(from, l.body.size())), l.eol };
    }

} // namespace orgdoc

#endif // ORGDOC_LEXER_HPP
