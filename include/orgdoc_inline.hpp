// orgdoc_inline.hpp - Orgdoc - Inline objects
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// The second parsing pass. Text owned by a title, paragraph, cell, tag,
// caption, description or verse block is scanned left to right; anything
// that does not complete as an object stays plain TEXT, so the pass never
// fails and never drops a byte.

#ifndef ORGDOC_INLINE_HPP
#define ORGDOC_INLINE_HPP

#include "orgdoc_green.hpp"
#include "orgdoc_config.hpp"
#include "orgdoc_timestamp.hpp"
#include "orgdoc_entities.hpp"

namespace orgdoc
{
    std::vector<green_element> parse_objects(std::string_view s, parse_config const & cfg);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        struct object_match
        {
            green_element elem;
            size_t        length = 0;
        };

        inline bool is_emphasis_pre(char c) noexcept
        {
            return is_whitespace(c) || c == '-' || c == '(' || c == '{' || c == '\'' || c == '"';
        }

        inline bool is_emphasis_post(char c) noexcept
        {
            return is_whitespace(c) || std::string_view("-.,;:!?')}[\"\\").find(c) != std::string_view::npos;
        }

        inline syntax_kind emphasis_kind(char m) noexcept
        {
            switch (m)
            {
                case '*': return syntax_kind::bold;
                case '/': return syntax_kind::italic;
                case '_': return syntax_kind::underline;
                case '+': return syntax_kind::strike;
                case '=': return syntax_kind::verbatim;
                default:  return syntax_kind::code;
            }
        }

        inline syntax_kind marker_kind(char m) noexcept
        {
            switch (m)
            {
                case '*': return syntax_kind::star;
                case '/': return syntax_kind::slash;
                case '_': return syntax_kind::underscore;
                case '+': return syntax_kind::plus;
                case '=': return syntax_kind::equal;
                default:  return syntax_kind::tilde;
            }
        }

        class inline_parser
        {
        public:
            inline_parser(std::string_view s, parse_config const & cfg, bool allow_links = true)
                : s_(s), cfg_(cfg), allow_links_(allow_links)
            {}

            std::vector<green_element> run();

        private:
            std::string_view      s_;
            parse_config const &  cfg_;
            bool                  allow_links_;

            char at(size_t i) const noexcept { return i < s_.size() ? s_[i] : '\0'; }
            bool starts(size_t i, std::string_view lit) const { return s_.substr(std::min(i, s_.size())).starts_with(lit); }

            std::vector<green_element> nested(std::string_view inner, bool allow_links) const
            {
                return inline_parser(inner, cfg_, allow_links).run();
            }

            std::optional<object_match> try_object(size_t i) const;

            std::optional<object_match> emphasis(size_t i) const;
            std::optional<object_match> link(size_t i) const;
            std::optional<object_match> fn_ref(size_t i) const;
            std::optional<object_match> cookie(size_t i) const;
            std::optional<object_match> timestamp(size_t i) const;
            std::optional<object_match> target(size_t i) const;
            std::optional<object_match> macros(size_t i) const;
            std::optional<object_match> snippet(size_t i) const;
            std::optional<object_match> latex(size_t i) const;
            std::optional<object_match> entity(size_t i) const;
            std::optional<object_match> line_break(size_t i) const;
            std::optional<object_match> script(size_t i) const;
            std::optional<object_match> inline_src(size_t i) const;
            std::optional<object_match> inline_call(size_t i) const;
            std::optional<object_match> cloze(size_t i) const;
        };

//---------------------------------------------------------------------------

        inline std::vector<green_element> inline_parser::run()
        {
            node_builder b;
            size_t text_start = 0;
            size_t i = 0;

            while (i < s_.size())
            {
                auto m = try_object(i);
                if (!m)
                {
                    ++i;
                    continue;
                }
                b.text(s_.substr(text_start, i - text_start));
                b.push(std::move(m->elem));
                i += m->length;
                text_start = i;
            }
            b.text(s_.substr(text_start));
            return std::move(b.children);
        }

//---------------------------------------------------------------------------

        inline std::optional<object_match> inline_parser::try_object(size_t i) const
        {
            std::optional<object_match> m;
            switch (s_[i])
            {
                case '*': case '/': case '+': case '=': case '~':
                    return emphasis(i);

                case '_':
                    if ((m = emphasis(i))) return m;
                    return script(i);

                case '^':
                    return script(i);

                case '[':
                    if ((m = link(i)))      return m;
                    if ((m = fn_ref(i)))    return m;
                    if ((m = timestamp(i))) return m;
                    return cookie(i);

                case '<':
                    if ((m = target(i))) return m;
                    return timestamp(i);

                case '{':
                    if ((m = macros(i))) return m;
                    return cloze(i);

                case '@':
                    return snippet(i);

                case '$':
                    return latex(i);

                case '\\':
                    if ((m = line_break(i))) return m;
                    if ((m = latex(i)))      return m;
                    return entity(i);

                case 's':
                    return inline_src(i);

                case 'c':
                    return inline_call(i);

                default:
                    return std::nullopt;
            }
        }

//---------------------------------------------------------------------------
// *bold* /italic/ _underline_ +strike+ =verbatim= ~code~

        inline std::optional<object_match> inline_parser::emphasis(size_t i) const
        {
            char m = s_[i];
            if (i > 0 && !is_emphasis_pre(s_[i - 1]))
                return std::nullopt;
            if (i + 2 >= s_.size() || is_whitespace(s_[i + 1]))
                return std::nullopt;

            int newlines = 0;
            for (size_t j = i + 1; j < s_.size(); ++j)
            {
                if (s_[j] == '\n' && ++newlines > 1)
                    return std::nullopt;
                if (s_[j] != m || j == i + 1)
                    continue;
                if (is_whitespace(s_[j - 1]))
                    continue;
                if (j + 1 < s_.size() && !is_emphasis_post(s_[j + 1]))
                    continue;

                auto inner = s_.substr(i + 1, j - i - 1);
                node_builder b;
                b.token(marker_kind(m), s_.substr(i, 1));
                if (m == '=' || m == '~')
                    b.text(inner);
                else
                    b.extend(nested(inner, allow_links_));
                b.token(marker_kind(m), s_.substr(j, 1));
                return object_match{ b.finish(emphasis_kind(m)), j + 1 - i };
            }
            return std::nullopt;
        }

//---------------------------------------------------------------------------
// [[path]] and [[path][description]]

        inline std::optional<object_match> inline_parser::link(size_t i) const
        {
            if (!allow_links_ || !starts(i, "[["))
                return std::nullopt;

            size_t p = i + 2;
            while (p < s_.size() && s_[p] != ']' && s_[p] != '[' && s_[p] != '\n')
                ++p;
            if (p == i + 2 || p >= s_.size() || s_[p] != ']')
                return std::nullopt;

            node_builder b;
            b.token(syntax_kind::l_bracket2, s_.substr(i, 2));
            b.token(syntax_kind::link_path, s_.substr(i + 2, p - i - 2));

            if (starts(p, "]]"))
            {
                b.token(syntax_kind::r_bracket2, s_.substr(p, 2));
                return object_match{ b.finish(syntax_kind::link), p + 2 - i };
            }
            if (!starts(p, "]["))
                return std::nullopt;

            size_t q = s_.find("]]", p + 2);
            if (q == std::string_view::npos || q == p + 2)
                return std::nullopt;

            b.token(syntax_kind::r_bracket, s_.substr(p, 1));
            b.token(syntax_kind::l_bracket, s_.substr(p + 1, 1));
            b.extend(nested(s_.substr(p + 2, q - p - 2), false));
            b.token(syntax_kind::r_bracket2, s_.substr(q, 2));
            return object_match{ b.finish(syntax_kind::link), q + 2 - i };
        }

//---------------------------------------------------------------------------
// [fn:label] [fn:label:definition] [fn::definition]

        inline std::optional<object_match> inline_parser::fn_ref(size_t i) const
        {
            if (!starts(i, "[fn:"))
                return std::nullopt;

            size_t p = i + 4;
            size_t label_len = count_while(s_, p, [](char c) noexcept { return is_word(c) || c == '_' || c == '-'; });

            node_builder b;
            b.token(syntax_kind::l_bracket, s_.substr(i, 1));
            b.text(s_.substr(i + 1, 2));
            b.token(syntax_kind::colon, s_.substr(i + 3, 1));
            b.token(syntax_kind::fn_label, s_.substr(p, label_len));
            p += label_len;

            if (at(p) == ']')
            {
                if (label_len == 0)
                    return std::nullopt;
                b.token(syntax_kind::r_bracket, s_.substr(p, 1));
                return object_match{ b.finish(syntax_kind::fn_ref), p + 1 - i };
            }
            if (at(p) != ':')
                return std::nullopt;

            // Inline definition: brackets inside must balance.
            size_t depth = 0;
            size_t q = p + 1;
            for (; q < s_.size(); ++q)
            {
                if (s_[q] == '[')
                    ++depth;
                else if (s_[q] == ']')
                {
                    if (depth == 0)
                        break;
                    --depth;
                }
            }
            if (q >= s_.size())
                return std::nullopt;

            b.token(syntax_kind::colon, s_.substr(p, 1));
            b.extend(nested(s_.substr(p + 1, q - p - 1), allow_links_));
            b.token(syntax_kind::r_bracket, s_.substr(q, 1));
            return object_match{ b.finish(syntax_kind::fn_ref), q + 1 - i };
        }

//---------------------------------------------------------------------------
// [1/3] [50%] [/] [%]

        inline std::optional<object_match> inline_parser::cookie(size_t i) const
        {
            size_t p = i + 1;
            size_t a = count_while(s_, p, is_digit);
            p += a;
            if (at(p) == '/')
                p += 1 + count_while(s_, p + 1, is_digit);
            else if (at(p) == '%')
                ++p;
            else
                return std::nullopt;
            if (at(p) != ']')
                return std::nullopt;

            node_builder b;
            b.token(syntax_kind::l_bracket, s_.substr(i, 1));
            b.text(s_.substr(i + 1, p - i - 1));
            b.token(syntax_kind::r_bracket, s_.substr(p, 1));
            return object_match{ b.finish(syntax_kind::cookie), p + 1 - i };
        }

//---------------------------------------------------------------------------

        inline std::optional<object_match> inline_parser::timestamp(size_t i) const
        {
            if (!is_digit(at(i + 1)) && !starts(i, "<%%("))
                return std::nullopt;
            auto ts = parse_timestamp(s_.substr(i));
            if (!ts)
                return std::nullopt;
            return object_match{ ts->node, ts->length };
        }

//---------------------------------------------------------------------------
// <<<radio>>> and <<target>>

        inline std::optional<object_match> inline_parser::target(size_t i) const
        {
            bool radio = starts(i, "<<<");
            if (!radio && !starts(i, "<<"))
                return std::nullopt;

            size_t open  = radio ? 3 : 2;
            auto   close = radio ? std::string_view(">>>") : std::string_view(">>");
            size_t p = i + open;
            size_t q = p;
            while (q < s_.size() && s_[q] != '<' && s_[q] != '>' && s_[q] != '\n')
                ++q;
            if (q == p || !starts(q, close) || is_whitespace(s_[p]) || is_whitespace(s_[q - 1]))
                return std::nullopt;

            node_builder b;
            b.token(radio ? syntax_kind::l_angle3 : syntax_kind::l_angle2, s_.substr(i, open));
            if (radio)
                b.extend(nested(s_.substr(p, q - p), allow_links_));
            else
                b.text(s_.substr(p, q - p));
            b.token(radio ? syntax_kind::r_angle3 : syntax_kind::r_angle2, s_.substr(q, close.size()));
            return object_match{ b.finish(radio ? syntax_kind::radio_target : syntax_kind::target), q + close.size() - i };
        }

//---------------------------------------------------------------------------
// {{{name}}} and {{{name(arguments)}}}

        inline std::optional<object_match> inline_parser::macros(size_t i) const
        {
            if (!starts(i, "{{{") || !is_alpha(at(i + 3)))
                return std::nullopt;

            size_t p = i + 3;
            size_t n = count_while(s_, p, is_name_char);

            node_builder b;
            b.token(syntax_kind::l_curly3, s_.substr(i, 3));
            b.text(s_.substr(p, n));
            p += n;

            if (starts(p, "}}}"))
            {
                b.token(syntax_kind::r_curly3, s_.substr(p, 3));
                return object_match{ b.finish(syntax_kind::macros), p + 3 - i };
            }
            if (at(p) != '(')
                return std::nullopt;

            size_t q = s_.find(")}}}", p + 1);
            if (q == std::string_view::npos)
                return std::nullopt;

            b.token(syntax_kind::l_parens, s_.substr(p, 1));
            b.token(syntax_kind::macros_argument, s_.substr(p + 1, q - p - 1));
            b.token(syntax_kind::r_parens, s_.substr(q, 1));
            b.token(syntax_kind::r_curly3, s_.substr(q + 1, 3));
            return object_match{ b.finish(syntax_kind::macros), q + 4 - i };
        }

//---------------------------------------------------------------------------
// @@backend:value@@

        inline std::optional<object_match> inline_parser::snippet(size_t i) const
        {
            if (!starts(i, "@@"))
                return std::nullopt;

            size_t p = i + 2;
            size_t n = count_while(s_, p, [](char c) noexcept { return is_alnum(c) || c == '-'; });
            if (n == 0 || at(p + n) != ':')
                return std::nullopt;

            size_t q = s_.find("@@", p + n + 1);
            if (q == std::string_view::npos)
                return std::nullopt;

            node_builder b;
            b.token(syntax_kind::at2, s_.substr(i, 2));
            b.text(s_.substr(p, n));
            b.token(syntax_kind::colon, s_.substr(p + n, 1));
            b.text(s_.substr(p + n + 1, q - p - n - 1));
            b.token(syntax_kind::at2, s_.substr(q, 2));
            return object_match{ b.finish(syntax_kind::snippet), q + 2 - i };
        }

//---------------------------------------------------------------------------
// $x$ $$x$$ \(x\) \[x\]

        inline std::optional<object_match> inline_parser::latex(size_t i) const
        {
            auto make = [&](size_t len) {
                node_builder b;
                b.text(s_.substr(i, len));
                return object_match{ b.finish(syntax_kind::latex_fragment), len };
            };

            if (starts(i, "\\(") || starts(i, "\\["))
            {
                auto close = s_[i + 1] == '(' ? std::string_view("\\)") : std::string_view("\\]");
                size_t q = s_.find(close, i + 2);
                if (q == std::string_view::npos)
                    return std::nullopt;
                return make(q + 2 - i);
            }

            if (s_[i] != '$' || (i > 0 && s_[i - 1] == '$'))
                return std::nullopt;

            if (starts(i, "$$"))
            {
                size_t q = s_.find("$$", i + 2);
                if (q == std::string_view::npos || q == i + 2)
                    return std::nullopt;
                return make(q + 2 - i);
            }

            char first = at(i + 1);
            if (first == '\0' || is_whitespace(first) || first == '.' || first == ',' || first == ';')
                return std::nullopt;

            for (size_t q = i + 1; q < s_.size(); ++q)
            {
                if (s_[q] != '$')
                    continue;
                char last = s_[q - 1];
                if (q == i + 1 || is_whitespace(last) || last == '.' || last == ',')
                    return std::nullopt;
                char post = at(q + 1);
                if (post != '\0' && !is_whitespace(post)
                    && std::string_view(".,?;:!'\")-").find(post) == std::string_view::npos)
                    return std::nullopt;
                return make(q + 1 - i);
            }
            return std::nullopt;
        }

//---------------------------------------------------------------------------
// \name and \name{}

        inline std::optional<object_match> inline_parser::entity(size_t i) const
        {
            size_t p = i + 1;
            size_t n = count_while(s_, p, is_alnum);
            if (n == 0 || !is_alpha(s_[p]))
                return std::nullopt;

            auto name = s_.substr(p, n);
            if (!find_entity(name))
            {
                n = count_while(s_, p, is_alpha);
                name = s_.substr(p, n);
                if (!find_entity(name))
                    return std::nullopt;
            }

            node_builder b;
            b.token(syntax_kind::backslash, s_.substr(i, 1));
            b.text(name);
            p += n;
            if (starts(p, "{}"))
            {
                b.token(syntax_kind::l_curly, s_.substr(p, 1));
                b.token(syntax_kind::r_curly, s_.substr(p + 1, 1));
                p += 2;
            }
            return object_match{ b.finish(syntax_kind::entity), p - i };
        }

//---------------------------------------------------------------------------
// \\ at the end of a line

        inline std::optional<object_match> inline_parser::line_break(size_t i) const
        {
            if (!starts(i, "\\\\"))
                return std::nullopt;

            size_t p = i + 2;
            size_t ws = count_while(s_, p, is_space);
            size_t eol = starts(p + ws, "\r\n") ? 2 : (at(p + ws) == '\n' ? 1 : 0);
            if (eol == 0 && p + ws < s_.size())
                return std::nullopt;

            node_builder b;
            b.token(syntax_kind::backslash2, s_.substr(i, 2));
            b.ws(s_.substr(p, ws));
            b.nl(s_.substr(p + ws, eol));
            return object_match{ b.finish(syntax_kind::line_break), p + ws + eol - i };
        }

//---------------------------------------------------------------------------
// a^b a_b a^{b} a_{b} a^*

        inline std::optional<object_match> inline_parser::script(size_t i) const
        {
            if (cfg_.use_sub_superscript == sub_superscript::no)
                return std::nullopt;
            if (i == 0 || is_whitespace(s_[i - 1]))
                return std::nullopt;

            bool sup = s_[i] == '^';
            auto kind   = sup ? syntax_kind::superscript : syntax_kind::subscript;
            auto marker = sup ? syntax_kind::caret : syntax_kind::underscore;
            size_t p = i + 1;

            node_builder b;
            b.token(marker, s_.substr(i, 1));

            if (at(p) == '{')
            {
                size_t depth = 0;
                size_t q = p + 1;
                for (; q < s_.size() && s_[q] != '\n'; ++q)
                {
                    if (s_[q] == '{')
                        ++depth;
                    else if (s_[q] == '}')
                    {
                        if (depth == 0)
                            break;
                        --depth;
                    }
                }
                if (q >= s_.size() || s_[q] != '}')
                    return std::nullopt;

                b.token(syntax_kind::l_curly, s_.substr(p, 1));
                b.extend(nested(s_.substr(p + 1, q - p - 1), allow_links_));
                b.token(syntax_kind::r_curly, s_.substr(q, 1));
                return object_match{ b.finish(kind), q + 1 - i };
            }

            if (cfg_.use_sub_superscript == sub_superscript::brace)
                return std::nullopt;

            if (at(p) == '*')
            {
                b.token(syntax_kind::star, s_.substr(p, 1));
                return object_match{ b.finish(kind), p + 1 - i };
            }

            // [+-]? [alnum.,\\]* alnum
            size_t q = p;
            if (at(q) == '+' || at(q) == '-')
                ++q;
            size_t last_alnum = 0;
            while (q < s_.size() && (is_word(s_[q]) || s_[q] == '.' || s_[q] == ',' || s_[q] == '\\'))
            {
                if (is_word(s_[q]))
                    last_alnum = q + 1;
                ++q;
            }
            if (last_alnum == 0)
                return std::nullopt;

            b.text(s_.substr(p, last_alnum - p));
            return object_match{ b.finish(kind), last_alnum - i };
        }

//---------------------------------------------------------------------------
// src_lang[params]{body}

        inline std::optional<object_match> inline_parser::inline_src(size_t i) const
        {
            if (!starts(i, "src_") || (i > 0 && is_word(s_[i - 1])))
                return std::nullopt;

            size_t p = i + 4;
            size_t n = 0;
            while (p + n < s_.size() && !is_whitespace(s_[p + n]) && s_[p + n] != '[' && s_[p + n] != '{')
                ++n;
            if (n == 0)
                return std::nullopt;

            node_builder b;
            b.text(s_.substr(i, 4));
            b.token(syntax_kind::src_block_language, s_.substr(p, n));
            p += n;

            if (at(p) == '[')
            {
                size_t q = s_.find_first_of("]\n", p + 1);
                if (q == std::string_view::npos || s_[q] != ']')
                    return std::nullopt;
                b.token(syntax_kind::l_bracket, s_.substr(p, 1));
                b.token(syntax_kind::src_block_parameters, s_.substr(p + 1, q - p - 1));
                b.token(syntax_kind::r_bracket, s_.substr(q, 1));
                p = q + 1;
            }
            if (at(p) != '{')
                return std::nullopt;

            size_t q = s_.find_first_of("}\n", p + 1);
            if (q == std::string_view::npos || s_[q] != '}')
                return std::nullopt;

            b.token(syntax_kind::l_curly, s_.substr(p, 1));
            b.text(s_.substr(p + 1, q - p - 1));
            b.token(syntax_kind::r_curly, s_.substr(q, 1));
            return object_match{ b.finish(syntax_kind::inline_src), q + 1 - i };
        }

//---------------------------------------------------------------------------
// call_name[inside-header](arguments)[end-header]

        inline std::optional<object_match> inline_parser::inline_call(size_t i) const
        {
            if (!starts(i, "call_") || (i > 0 && is_word(s_[i - 1])))
                return std::nullopt;

            size_t p = i + 5;
            size_t n = 0;
            while (p + n < s_.size() && !is_whitespace(s_[p + n]) && s_[p + n] != '[' && s_[p + n] != '(')
                ++n;
            if (n == 0)
                return std::nullopt;

            node_builder b;
            b.text(s_.substr(i, 5));
            b.text(s_.substr(p, n));
            p += n;

            auto header = [&](size_t & pos) {
                if (at(pos) != '[')
                    return true;
                size_t q = s_.find_first_of("]\n", pos + 1);
                if (q == std::string_view::npos || s_[q] != ']')
                    return false;
                b.token(syntax_kind::l_bracket, s_.substr(pos, 1));
                b.text(s_.substr(pos + 1, q - pos - 1));
                b.token(syntax_kind::r_bracket, s_.substr(q, 1));
                pos = q + 1;
                return true;
            };

            if (!header(p) || at(p) != '(')
                return std::nullopt;

            size_t q = s_.find_first_of(")\n", p + 1);
            if (q == std::string_view::npos || s_[q] != ')')
                return std::nullopt;

            b.token(syntax_kind::l_parens, s_.substr(p, 1));
            b.text(s_.substr(p + 1, q - p - 1));
            b.token(syntax_kind::r_parens, s_.substr(q, 1));
            p = q + 1;

            if (!header(p))
                return std::nullopt;
            return object_match{ b.finish(syntax_kind::inline_call), p - i };
        }

//---------------------------------------------------------------------------
// {{text}} {{text}{hint}} {{text}{hint}@id}

        inline std::optional<object_match> inline_parser::cloze(size_t i) const
        {
            if (!starts(i, "{{"))
                return std::nullopt;

            // The text ends at the first `}` outside a $...$ fragment.
            size_t p = i + 2;
            size_t q = p;
            bool in_latex = false;
            for (; q < s_.size(); ++q)
            {
                if (s_[q] == '}' && !in_latex)
                    break;
                if (s_[q] == '$')
                    in_latex = !in_latex;
            }
            if (q == p || q >= s_.size())
                return std::nullopt;

            node_builder b;
            b.token(syntax_kind::l_curly2, s_.substr(i, 2));
            b.extend(nested(s_.substr(p, q - p), allow_links_));
            b.token(syntax_kind::r_curly, s_.substr(q, 1));
            p = q + 1;

            if (at(p) == '{')
            {
                size_t close = s_.find('}', p + 1);
                if (close != std::string_view::npos)
                {
                    b.token(syntax_kind::l_curly, s_.substr(p, 1));
                    b.text(s_.substr(p + 1, close - p - 1));
                    b.token(syntax_kind::r_curly, s_.substr(close, 1));
                    p = close + 1;
                }
            }

            if (at(p) == '@')
            {
                size_t close = s_.find('}', p + 1);
                if (close != std::string_view::npos)
                {
                    b.token(syntax_kind::at, s_.substr(p, 1));
                    b.text(s_.substr(p + 1, close - p - 1));
                    p = close;
                }
            }

            if (at(p) != '}')
                return std::nullopt;
            b.token(syntax_kind::r_curly, s_.substr(p, 1));
            return object_match{ b.finish(syntax_kind::cloze), p + 1 - i };
        }
    }

//---------------------------------------------------------------------------

    inline std::vector<green_element> parse_objects(std::string_view s, parse_config const & cfg)
    {
        return detail::inline_parser(s, cfg).run();
    }

} // namespace orgdoc

#endif // ORGDOC_INLINE_HPP
