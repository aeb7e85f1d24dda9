// orgdoc_elements.hpp - Orgdoc - Element parser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Parses a run of lines into greater and lesser elements. Headlines are not
// elements; the document parser hands this parser the lines of one section,
// drawer, block or list item at a time.
//
// Every construct either completes or is not recognised. An unterminated
// block, drawer or environment degrades to paragraph text.

#ifndef ORGDOC_ELEMENTS_HPP
#define ORGDOC_ELEMENTS_HPP

#include "orgdoc_lexer.hpp"
#include "orgdoc_inline.hpp"

namespace orgdoc
{
    namespace detail
    {
        struct parsed
        {
            green_element elem;
            size_t        next = 0;   // first line after the element and its post blank
        };

        // Text of lines [first, last). Lines always view one contiguous buffer.
        inline std::string_view span_text(line_list const & lines, size_t first, size_t last)
        {
            if (first >= last)
                return {};
            char const * b = lines[first].body.data();
            char const * e = lines[last - 1].body.data() + lines[last - 1].width();
            return { b, static_cast<size_t>(e - b) };
        }

        // Pushes leading whitespace, the trimmed core as `kind`, then trailing whitespace.
        inline void push_trimmed(node_builder & b, syntax_kind kind, std::string_view s)
        {
            auto lead = leading_ws(s);
            auto rest = s.substr(lead.size());
            auto trail = trailing_ws(rest);
            b.ws(lead);
            b.token(kind, rest.substr(0, rest.size() - trail.size()));
            b.ws(trail);
        }

        inline bool is_raw_block(std::string_view name)
        {
            return iequals(name, "src") || iequals(name, "example") || iequals(name, "export") || iequals(name, "comment");
        }

        inline syntax_kind block_kind(std::string_view name)
        {
            if (iequals(name, "src"))     return syntax_kind::source_block;
            if (iequals(name, "example")) return syntax_kind::example_block;
            if (iequals(name, "export"))  return syntax_kind::export_block;
            if (iequals(name, "comment")) return syntax_kind::comment_block;
            if (iequals(name, "quote"))   return syntax_kind::quote_block;
            if (iequals(name, "center"))  return syntax_kind::center_block;
            if (iequals(name, "verse"))   return syntax_kind::verse_block;
            return syntax_kind::special_block;
        }

        inline bool accepts_affiliated(syntax_kind k)
        {
            switch (k)
            {
                case syntax_kind::paragraph:
                case syntax_kind::list:
                case syntax_kind::org_table:
                case syntax_kind::table_el:
                case syntax_kind::source_block:
                case syntax_kind::example_block:
                case syntax_kind::export_block:
                case syntax_kind::comment_block:
                case syntax_kind::quote_block:
                case syntax_kind::center_block:
                case syntax_kind::verse_block:
                case syntax_kind::special_block:
                case syntax_kind::dyn_block:
                case syntax_kind::drawer:
                case syntax_kind::fixed_width:
                case syntax_kind::latex_environment:
                    return true;
                default:
                    return false;
            }
        }

//========================================================================
// Element parser
//========================================================================

        class element_parser
        {
        public:
            explicit element_parser(parse_config const & cfg) : cfg_(cfg) {}

            // Parses lines [first, last) into a sequence of elements. Blank lines
            // before the first element become BLANK_LINE tokens of the sequence.
            std::vector<green_element> parse_elements(line_list const & lines, size_t first, size_t last) const;

            // Appends BLANK_LINE tokens for consecutive blank lines from `i`.
            size_t blank_lines(line_list const & lines, size_t i, size_t last, node_builder & b) const;

            std::optional<green_node_ptr> property_drawer(line_list const & lines, size_t i, size_t last, size_t & next) const;
            std::optional<green_node_ptr> node_property(line const & l) const;

            bool is_affiliated_line(std::string_view body) const;

            parse_config const & config() const noexcept { return cfg_; }

        private:
            parse_config const & cfg_;

            bool blank(line_list const & lines, size_t i) const { return is_blank(lines[i].body); }

            parsed element(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> special(line_list const & lines, size_t i, size_t last) const;
            parsed finish(node_builder & b, syntax_kind kind, line_list const & lines, size_t i, size_t last) const;

            std::optional<parsed> block(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> dyn_block(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> drawer(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> org_table(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> table_el(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> list(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> fn_def(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> latex_environment(line_list const & lines, size_t i, size_t last) const;
            std::optional<parsed> clock(line_list const & lines, size_t i, size_t last) const;
            parsed line_run(line_list const & lines, size_t i, size_t last, syntax_kind kind, bool (*pred)(std::string_view)) const;
            parsed keyword(line_list const & lines, size_t i, size_t last) const;
            parsed paragraph(line_list const & lines, size_t i, size_t last) const;

            green_node_ptr affiliated_keyword(line const & l) const;
            green_node_ptr list_item(line_list const & lines, size_t first, size_t last) const;
            green_node_ptr table_row(line const & l) const;
            green_node_ptr delimiter(line const & l, syntax_kind kind) const;
        };

//---------------------------------------------------------------------------

        inline std::vector<green_element> element_parser::parse_elements(line_list const & lines, size_t first, size_t last) const
        {
            node_builder b;
            size_t i = blank_lines(lines, first, last, b);
            while (i < last)
            {
                auto p = element(lines, i, last);
                b.push(std::move(p.elem));
                i = p.next;
            }
            return std::move(b.children);
        }

//---------------------------------------------------------------------------

        inline size_t element_parser::blank_lines(line_list const & lines, size_t i, size_t last, node_builder & b) const
        {
            while (i < last && blank(lines, i))
            {
                b.token(syntax_kind::blank_line, lines[i].full());
                ++i;
            }
            return i;
        }

//---------------------------------------------------------------------------

        inline parsed element_parser::finish(node_builder & b, syntax_kind kind, line_list const & lines, size_t i, size_t last) const
        {
            size_t next = blank_lines(lines, i, last, b);
            return { b.finish(kind), next };
        }

//---------------------------------------------------------------------------

        inline bool element_parser::is_affiliated_line(std::string_view body) const
        {
            auto key = keyword_key(body);
            if (!key)
                return false;

            auto base = keyword_base(*key);
            if (!contains_ci(cfg_.affiliated_keywords, base) && !istarts_with(base, "ATTR_"))
                return false;
            if (base.size() != key->size())
                return contains_ci(cfg_.dual_keywords, base) && key->back() == ']';
            return true;
        }

//---------------------------------------------------------------------------

        inline parsed element_parser::element(line_list const & lines, size_t i, size_t last) const
        {
            if (is_affiliated_line(lines[i].body))
            {
                size_t j = i;
                while (j < last && is_affiliated_line(lines[j].body))
                    ++j;

                if (j < last && !blank(lines, j))
                {
                    auto target = special(lines, j, last);
                    if (!target)
                        target = paragraph(lines, j, last);

                    auto node = std::get<green_node_ptr>(target->elem);
                    if (accepts_affiliated(node->kind()))
                    {
                        std::vector<green_element> kids;
                        for (size_t k = i; k < j; ++k)
                            kids.push_back(affiliated_keyword(lines[k]));
                        for (auto const & c : node->children())
                            kids.push_back(c);
                        return { make_node(node->kind(), std::move(kids)), target->next };
                    }
                }
                return keyword(lines, i, last);
            }

            if (auto p = special(lines, i, last))
                return std::move(*p);
            return paragraph(lines, i, last);
        }

//---------------------------------------------------------------------------

        inline std::optional<parsed> element_parser::special(line_list const & lines, size_t i, size_t last) const
        {
            auto body = lines[i].body;
            auto s = trim_start_sv(body);
            if (s.empty())
                return std::nullopt;

            std::optional<parsed> p;
            switch (s[0])
            {
                case '#':
                    if (block_begin_name(body) && (p = block(lines, i, last)))
                        return p;
                    if (is_dyn_block_begin(body) && (p = dyn_block(lines, i, last)))
                        return p;
                    if (keyword_key(body))
                        return keyword(lines, i, last);
                    if (is_comment_line(body))
                        return line_run(lines, i, last, syntax_kind::comment, is_comment_line);
                    return std::nullopt;

                case ':':
                    if ((p = drawer(lines, i, last)))
                        return p;
                    if (is_fixed_width_line(body))
                        return line_run(lines, i, last, syntax_kind::fixed_width, is_fixed_width_line);
                    return std::nullopt;

                case '|':
                    return org_table(lines, i, last);

                case '+':
                    if ((p = table_el(lines, i, last)))
                        return p;
                    return list(lines, i, last);

                case '-':
                    if (is_rule_line(body))
                    {
                        node_builder b;
                        push_trimmed(b, syntax_kind::text, body);
                        b.nl(lines[i].eol);
                        return finish(b, syntax_kind::rule, lines, i + 1, last);
                    }
                    return list(lines, i, last);

                case '[':
                    if (fn_def_label(body))
                        return fn_def(lines, i, last);
                    return std::nullopt;

                case '\\':
                    return latex_environment(lines, i, last);

                case 'C':
                    if (is_clock_line(body) && (p = clock(lines, i, last)))
                        return p;
                    return list(lines, i, last);

                default:
                    return list(lines, i, last);
            }
        }

//---------------------------------------------------------------------------
// #+KEY: value and #+CALL: value

        inline parsed element_parser::keyword(line_list const & lines, size_t i, size_t last) const
        {
            auto const & l = lines[i];
            auto lead = leading_ws(l.body);
            auto s    = l.body.substr(lead.size());
            size_t colon = s.find(':');
            auto key  = s.substr(2, colon - 2);
            auto rest = s.substr(colon + 1);
            auto ws   = leading_ws(rest);

            node_builder b;
            b.ws(lead);
            b.token(syntax_kind::hash_plus, s.substr(0, 2));
            b.text(key);
            b.token(syntax_kind::colon, s.substr(colon, 1));
            b.ws(ws);
            b.text(rest.substr(ws.size()));
            b.nl(l.eol);

            auto kind = iequals(key, "CALL") ? syntax_kind::babel_call : syntax_kind::keyword;
            return finish(b, kind, lines, i + 1, last);
        }

//---------------------------------------------------------------------------
// #+CAPTION[short]: long

        inline green_node_ptr element_parser::affiliated_keyword(line const & l) const
        {
            auto lead  = leading_ws(l.body);
            auto s     = l.body.substr(lead.size());
            size_t colon = s.find(':');
            auto key   = s.substr(2, colon - 2);
            auto base  = keyword_base(key);
            auto rest  = s.substr(colon + 1);
            auto ws    = leading_ws(rest);
            auto value = rest.substr(ws.size());

            node_builder b;
            b.ws(lead);
            b.token(syntax_kind::hash_plus, s.substr(0, 2));
            b.text(base);
            if (base.size() != key.size())
            {
                b.token(syntax_kind::l_bracket, key.substr(base.size(), 1));
                b.text(key.substr(base.size() + 1, key.size() - base.size() - 2));
                b.token(syntax_kind::r_bracket, key.substr(key.size() - 1));
            }
            b.token(syntax_kind::colon, s.substr(colon, 1));
            b.ws(ws);
            if (contains_ci(cfg_.parsed_keywords, base))
                b.extend(parse_objects(value, cfg_));
            else
                b.text(value);
            b.nl(l.eol);
            return b.finish(syntax_kind::affiliated_keyword);
        }

//---------------------------------------------------------------------------
// Consecutive comment or fixed-width lines

        inline parsed element_parser::line_run(line_list const & lines, size_t i, size_t last,
                                               syntax_kind kind, bool (*pred)(std::string_view)) const
        {
            node_builder b;
            while (i < last && pred(lines[i].body))
            {
                b.text(lines[i].body);
                b.nl(lines[i].eol);
                ++i;
            }
            return finish(b, kind, lines, i, last);
        }

//---------------------------------------------------------------------------
// #+begin_NAME ... #+end_NAME

        inline std::optional<parsed> element_parser::block(line_list const & lines, size_t i, size_t last) const
        {
            auto name = *block_begin_name(lines[i].body);

            size_t j = i + 1;
            while (j < last && !is_block_end(lines[j].body, name))
                ++j;
            if (j >= last)
                return std::nullopt;

            auto kind = block_kind(name);

            // Begin line: #+begin_NAME and its arguments
            node_builder begin;
            {
                auto body = lines[i].body;
                auto lead = leading_ws(body);
                size_t head_len = 8 + name.size();
                auto args = body.substr(lead.size() + head_len);

                begin.ws(lead);
                begin.text(body.substr(lead.size(), head_len));

                if (kind == syntax_kind::source_block)
                {
                    auto ws = leading_ws(args);
                    args.remove_prefix(ws.size());
                    size_t n = 0;
                    while (n < args.size() && !is_space(args[n]))
                        ++n;
                    begin.ws(ws);
                    begin.token(syntax_kind::src_block_language, args.substr(0, n));
                    args.remove_prefix(n);

                    // Switches run until the first word starting with ':'
                    size_t ps = args.size();
                    for (size_t k = 0; k < args.size(); ++k)
                        if (args[k] == ':' && (k == 0 || is_space(args[k - 1])))
                        {
                            ps = k;
                            break;
                        }
                    push_trimmed(begin, syntax_kind::src_block_switches, args.substr(0, ps));
                    push_trimmed(begin, syntax_kind::src_block_parameters, args.substr(ps));
                }
                else if (kind == syntax_kind::export_block)
                {
                    auto ws = leading_ws(args);
                    args.remove_prefix(ws.size());
                    size_t n = 0;
                    while (n < args.size() && !is_space(args[n]))
                        ++n;
                    begin.ws(ws);
                    begin.token(syntax_kind::export_block_type, args.substr(0, n));
                    push_trimmed(begin, syntax_kind::text, args.substr(n));
                }
                else
                {
                    push_trimmed(begin, syntax_kind::text, args);
                }
                begin.nl(lines[i].eol);
            }

            node_builder b;
            b.push(begin.finish(syntax_kind::block_begin));

            if (j > i + 1)
            {
                node_builder content;
                if (is_raw_block(name))
                {
                    for (size_t k = i + 1; k < j; ++k)
                    {
                        auto body = lines[k].body;
                        auto lead = leading_ws(body);
                        auto rest = body.substr(lead.size());
                        if (rest.starts_with(",*") || rest.starts_with(",#+"))
                        {
                            content.text(lead);
                            content.token(syntax_kind::comma, rest.substr(0, 1));
                            content.text(rest.substr(1));
                        }
                        else
                        {
                            content.text(body);
                        }
                        content.nl(lines[k].eol);
                    }
                }
                else if (kind == syntax_kind::verse_block)
                {
                    content.extend(parse_objects(span_text(lines, i + 1, j), cfg_));
                }
                else
                {
                    content.extend(parse_elements(lines, i + 1, j));
                }
                b.push(content.finish(syntax_kind::block_content));
            }

            b.push(delimiter(lines[j], syntax_kind::block_end));
            return finish(b, kind, lines, j + 1, last);
        }

//---------------------------------------------------------------------------
// #+BEGIN: name parameters ... #+END:

        inline std::optional<parsed> element_parser::dyn_block(line_list const & lines, size_t i, size_t last) const
        {
            size_t j = i + 1;
            while (j < last && !is_dyn_block_end(lines[j].body))
                ++j;
            if (j >= last)
                return std::nullopt;

            node_builder begin;
            {
                auto body = lines[i].body;
                auto lead = leading_ws(body);
                auto args = body.substr(lead.size() + 8);
                auto ws   = leading_ws(args);
                args.remove_prefix(ws.size());
                size_t n = 0;
                while (n < args.size() && !is_space(args[n]))
                    ++n;

                begin.ws(lead);
                begin.text(body.substr(lead.size(), 8));
                begin.ws(ws);
                begin.text(args.substr(0, n));
                push_trimmed(begin, syntax_kind::text, args.substr(n));
                begin.nl(lines[i].eol);
            }

            node_builder b;
            b.push(begin.finish(syntax_kind::block_begin));
            if (j > i + 1)
            {
                node_builder content;
                content.extend(parse_elements(lines, i + 1, j));
                b.push(content.finish(syntax_kind::block_content));
            }
            b.push(delimiter(lines[j], syntax_kind::block_end));
            return finish(b, syntax_kind::dyn_block, lines, j + 1, last);
        }

//---------------------------------------------------------------------------

        // A whole-line delimiter such as `#+end_src` or `:END:`.
        inline green_node_ptr element_parser::delimiter(line const & l, syntax_kind kind) const
        {
            node_builder b;
            if (kind == syntax_kind::drawer_begin || kind == syntax_kind::drawer_end)
            {
                auto lead = leading_ws(l.body);
                auto s    = l.body.substr(lead.size());
                auto core = trim_end_sv(s);
                b.ws(lead);
                b.token(syntax_kind::colon, core.substr(0, 1));
                b.text(core.substr(1, core.size() - 2));
                b.token(syntax_kind::colon, core.substr(core.size() - 1));
                b.ws(s.substr(core.size()));
            }
            else
            {
                push_trimmed(b, syntax_kind::text, l.body);
            }
            b.nl(l.eol);
            return b.finish(kind);
        }

//---------------------------------------------------------------------------
// :NAME: ... :END:

        inline std::optional<parsed> element_parser::drawer(line_list const & lines, size_t i, size_t last) const
        {
            auto name = drawer_name(lines[i].body);
            if (!name || iequals(*name, "END"))
                return std::nullopt;

            size_t j = i + 1;
            while (j < last && !is_drawer_end(lines[j].body))
                ++j;
            if (j >= last)
                return std::nullopt;

            node_builder b;
            b.push(delimiter(lines[i], syntax_kind::drawer_begin));
            if (j > i + 1)
            {
                node_builder content;
                content.extend(parse_elements(lines, i + 1, j));
                b.push(content.finish(syntax_kind::drawer_content));
            }
            b.push(delimiter(lines[j], syntax_kind::drawer_end));
            return finish(b, syntax_kind::drawer, lines, j + 1, last);
        }

//---------------------------------------------------------------------------
// :PROPERTIES: made only of node properties. Owns no blank lines.

        inline std::optional<green_node_ptr> element_parser::property_drawer(line_list const & lines, size_t i, size_t last, size_t & next) const
        {
            auto name = drawer_name(lines[i].body);
            if (!name || !iequals(*name, "PROPERTIES"))
                return std::nullopt;

            node_builder b;
            b.push(delimiter(lines[i], syntax_kind::drawer_begin));

            size_t j = i + 1;
            for (; j < last && !is_drawer_end(lines[j].body); ++j)
            {
                auto prop = node_property(lines[j]);
                if (!prop)
                    return std::nullopt;
                b.push(*prop);
            }
            if (j >= last)
                return std::nullopt;

            b.push(delimiter(lines[j], syntax_kind::drawer_end));
            next = j + 1;
            return b.finish(syntax_kind::property_drawer);
        }

//---------------------------------------------------------------------------
// :KEY: value and :KEY+: value

        inline std::optional<green_node_ptr> element_parser::node_property(line const & l) const
        {
            auto lead = leading_ws(l.body);
            auto s    = l.body.substr(lead.size());
            if (s.size() < 3 || s[0] != ':')
                return std::nullopt;

            size_t colon = s.find(':', 1);
            if (colon == std::string_view::npos || colon == 1)
                return std::nullopt;

            auto key = s.substr(1, colon - 1);
            bool plus = key.back() == '+';
            if (plus)
                key.remove_suffix(1);
            if (key.empty() || iequals(key, "END")
                || std::any_of(key.begin(), key.end(), [](char c) { return is_whitespace(c); }))
                return std::nullopt;

            auto rest = s.substr(colon + 1);
            if (!rest.empty() && !is_space(rest[0]))
                return std::nullopt;

            auto ws    = leading_ws(rest);
            auto value = rest.substr(ws.size());
            auto trail = trailing_ws(value);
            value.remove_suffix(trail.size());

            node_builder b;
            b.ws(lead);
            b.token(syntax_kind::colon, s.substr(0, 1));
            b.text(key);
            if (plus)
                b.token(syntax_kind::plus, s.substr(colon - 1, 1));
            b.token(syntax_kind::colon, s.substr(colon, 1));
            b.ws(ws);
            b.text(value);
            b.ws(trail);
            b.nl(l.eol);
            return b.finish(syntax_kind::node_property);
        }

//---------------------------------------------------------------------------
// | a | b |

        inline std::optional<parsed> element_parser::org_table(line_list const & lines, size_t i, size_t last) const
        {
            node_builder b;
            while (i < last && is_table_line(lines[i].body))
                b.push(table_row(lines[i++]));

            while (i < last && is_tblfm_line(lines[i].body))
            {
                auto kw = keyword(lines, i, i + 1);
                b.push(std::move(kw.elem));
                ++i;
            }
            return finish(b, syntax_kind::org_table, lines, i, last);
        }

//---------------------------------------------------------------------------

        inline green_node_ptr element_parser::table_row(line const & l) const
        {
            auto lead = leading_ws(l.body);
            auto s    = l.body.substr(lead.size());

            node_builder b;
            b.ws(lead);
            b.token(syntax_kind::pipe, s.substr(0, 1));

            if (s.size() > 1 && s[1] == '-')
            {
                b.text(s.substr(1));
                b.nl(l.eol);
                return b.finish(syntax_kind::org_table_rule_row);
            }

            size_t p = 1;
            while (p < s.size())
            {
                size_t q = s.find('|', p);
                auto seg = s.substr(p, q == std::string_view::npos ? std::string_view::npos : q - p);

                if (q == std::string_view::npos && is_blank(seg))
                {
                    b.ws(seg);
                    break;
                }

                node_builder cell;
                auto lw = leading_ws(seg);
                auto core = seg.substr(lw.size());
                auto tw = trailing_ws(core);
                core.remove_suffix(tw.size());
                cell.ws(lw);
                cell.extend(parse_objects(core, cfg_));
                cell.ws(tw);
                b.push(cell.finish(syntax_kind::org_table_cell));

                if (q == std::string_view::npos)
                    break;
                b.token(syntax_kind::pipe, s.substr(q, 1));
                p = q + 1;
            }
            b.nl(l.eol);
            return b.finish(syntax_kind::org_table_standard_row);
        }

//---------------------------------------------------------------------------
// +----+ table.el tables

        inline std::optional<parsed> element_parser::table_el(line_list const & lines, size_t i, size_t last) const
        {
            if (!is_table_el_start(lines[i].body))
                return std::nullopt;

            node_builder b;
            while (i < last && is_table_el_line(lines[i].body))
            {
                b.text(lines[i].body);
                b.nl(lines[i].eol);
                ++i;
            }
            return finish(b, syntax_kind::table_el, lines, i, last);
        }

//---------------------------------------------------------------------------
// Plain lists. Items share the indentation of the first bullet; deeper
// lines continue the current item; two blank lines end the list.

        inline std::optional<parsed> element_parser::list(line_list const & lines, size_t i, size_t last) const
        {
            auto first = match_bullet(lines[i].body, cfg_.tab_width);
            if (!first)
                return std::nullopt;

            size_t const indent = first->indent_cols;
            auto same_level = [&](size_t k) {
                auto m = match_bullet(lines[k].body, cfg_.tab_width);
                return m && m->indent_cols == indent;
            };

            node_builder b;
            size_t k = i;
            size_t tail_blank = 0;   // first of the trailing blank lines owned by the list
            for (;;)
            {
                size_t e = k + 1;
                bool list_end = false;
                while (e < last)
                {
                    if (blank(lines, e))
                    {
                        if (e + 1 < last && blank(lines, e + 1))
                        {
                            list_end = true;
                            break;
                        }
                        ++e;
                        continue;
                    }
                    if (indent_width(lines[e].body, cfg_.tab_width) > indent)
                    {
                        ++e;
                        continue;
                    }
                    break;
                }

                if (!list_end && e < last && same_level(e))
                {
                    b.push(list_item(lines, k, e));
                    k = e;
                    continue;
                }

                size_t item_end = e;
                while (item_end > k + 1 && blank(lines, item_end - 1))
                    --item_end;
                b.push(list_item(lines, k, item_end));
                tail_blank = item_end;
                break;
            }

            return finish(b, syntax_kind::list, lines, tail_blank, last);
        }

//---------------------------------------------------------------------------

        inline green_node_ptr element_parser::list_item(line_list const & lines, size_t first, size_t last) const
        {
            auto const & l = lines[first];
            auto m = *match_bullet(l.body, cfg_.tab_width);
            auto body = l.body;

            node_builder b;
            b.token(syntax_kind::list_item_indent, body.substr(0, m.indent_len));
            b.token(syntax_kind::list_item_bullet, body.substr(m.indent_len, m.bullet_len));

            size_t p = m.indent_len + m.bullet_len;
            auto ws_at = [&](size_t at) { return leading_ws(body.substr(at)); };
            auto ends_word = [&](size_t at) { return at >= body.size() || is_space(body[at]); };

            auto ws = ws_at(p);
            b.ws(ws);
            p += ws.size();

            // [@N]
            if (body.substr(p).starts_with("[@"))
            {
                size_t close = body.find(']', p + 2);
                if (close != std::string_view::npos && close > p + 2 && ends_word(close + 1))
                {
                    auto n = body.substr(p + 2, close - p - 2);
                    if (std::all_of(n.begin(), n.end(), [](char c) { return is_digit(c); }) || (n.size() == 1 && is_alpha(n[0])))
                    {
                        node_builder c;
                        c.token(syntax_kind::l_bracket, body.substr(p, 1));
                        c.token(syntax_kind::at, body.substr(p + 1, 1));
                        c.text(n);
                        c.token(syntax_kind::r_bracket, body.substr(close, 1));
                        b.push(c.finish(syntax_kind::list_item_counter));
                        p = close + 1;
                        ws = ws_at(p);
                        b.ws(ws);
                        p += ws.size();
                    }
                }
            }

            // [ ] [X] [-]
            if (p + 2 < body.size() && body[p] == '[' && body[p + 2] == ']' && ends_word(p + 3)
                && std::string_view(" xX-").find(body[p + 1]) != std::string_view::npos)
            {
                node_builder c;
                c.token(syntax_kind::l_bracket, body.substr(p, 1));
                c.text(body.substr(p + 1, 1));
                c.token(syntax_kind::r_bracket, body.substr(p + 2, 1));
                b.push(c.finish(syntax_kind::list_item_check_box));
                p += 3;
                ws = ws_at(p);
                b.ws(ws);
                p += ws.size();
            }

            // term :: description
            if (!m.ordered)
            {
                size_t q = p;
                while ((q = body.find("::", q)) != std::string_view::npos)
                {
                    if (q > p && is_space(body[q - 1]) && ends_word(q + 2))
                        break;
                    q += 2;
                }
                if (q != std::string_view::npos)
                {
                    auto before = body.substr(p, q - p);
                    auto gap    = trailing_ws(before);
                    auto term   = before.substr(0, before.size() - gap.size());
                    if (!term.empty())
                    {
                        node_builder t;
                        t.extend(parse_objects(term, cfg_));
                        b.push(t.finish(syntax_kind::list_item_tag));
                        b.ws(gap);
                        b.token(syntax_kind::colon2, body.substr(q, 2));
                        p = q + 2;
                        ws = ws_at(p);
                        b.ws(ws);
                        p += ws.size();
                    }
                }
            }

            line_list content;
            if (p < body.size())
            {
                content.push_back(line_tail(l, p));
            }
            else
            {
                b.nl(l.eol);
            }
            for (size_t k = first + 1; k < last; ++k)
                content.push_back(lines[k]);

            if (!content.empty())
            {
                node_builder c;
                c.extend(parse_elements(content, 0, content.size()));
                b.push(c.finish(syntax_kind::list_item_content));
            }
            return b.finish(syntax_kind::list_item);
        }

//---------------------------------------------------------------------------
// [fn:label] definition

        inline std::optional<parsed> element_parser::fn_def(line_list const & lines, size_t i, size_t last) const
        {
            auto const & l = lines[i];
            auto label = *fn_def_label(l.body);

            size_t e = i + 1;
            while (e < last && !fn_def_label(lines[e].body))
            {
                if (blank(lines, e) && e + 1 < last && blank(lines, e + 1))
                    break;
                ++e;
            }
            while (e > i + 1 && blank(lines, e - 1))
                --e;

            node_builder b;
            b.token(syntax_kind::l_bracket, l.body.substr(0, 1));
            b.text(l.body.substr(1, 2));
            b.token(syntax_kind::colon, l.body.substr(3, 1));
            b.token(syntax_kind::fn_label, label);
            size_t p = 4 + label.size();
            b.token(syntax_kind::r_bracket, l.body.substr(p, 1));
            ++p;
            auto ws = leading_ws(l.body.substr(p));
            b.ws(ws);
            p += ws.size();

            line_list content;
            if (p < l.body.size())
                content.push_back(line_tail(l, p));
            else
                b.nl(l.eol);
            for (size_t k = i + 1; k < e; ++k)
                content.push_back(lines[k]);

            if (!content.empty())
            {
                node_builder c;
                c.extend(parse_elements(content, 0, content.size()));
                b.push(c.finish(syntax_kind::fn_content));
            }
            return finish(b, syntax_kind::fn_def, lines, e, last);
        }

//---------------------------------------------------------------------------
// \begin{NAME} ... \end{NAME}

        inline std::optional<parsed> element_parser::latex_environment(line_list const & lines, size_t i, size_t last) const
        {
            auto name = latex_begin_name(lines[i].body);
            if (!name)
                return std::nullopt;

            size_t j = i + 1;
            while (j < last && !is_latex_end(lines[j].body, *name))
                ++j;
            if (j >= last)
                return std::nullopt;

            node_builder b;
            for (size_t k = i; k <= j; ++k)
            {
                b.text(lines[k].body);
                b.nl(lines[k].eol);
            }
            return finish(b, syntax_kind::latex_environment, lines, j + 1, last);
        }

//---------------------------------------------------------------------------
// CLOCK: [start]--[end] =>  1:00

        inline std::optional<parsed> element_parser::clock(line_list const & lines, size_t i, size_t last) const
        {
            auto const & l = lines[i];
            auto lead = leading_ws(l.body);
            auto s    = l.body.substr(lead.size());
            auto rest = s.substr(6);
            auto ws   = leading_ws(rest);
            rest.remove_prefix(ws.size());

            if (rest.empty() || rest[0] != '[')
                return std::nullopt;
            auto ts = parse_timestamp(rest);
            if (!ts)
                return std::nullopt;

            node_builder b;
            b.ws(lead);
            b.text(s.substr(0, 5));
            b.token(syntax_kind::colon, s.substr(5, 1));
            b.ws(ws);
            b.push(ts->node);
            rest.remove_prefix(ts->length);

            auto ws2 = leading_ws(rest);
            auto after = rest.substr(ws2.size());
            if (after.empty())
            {
                b.ws(ws2);
            }
            else
            {
                if (!after.starts_with("=>"))
                    return std::nullopt;
                b.ws(ws2);
                b.token(syntax_kind::double_arrow, after.substr(0, 2));
                push_trimmed(b, syntax_kind::text, after.substr(2));
            }
            b.nl(l.eol);
            return finish(b, syntax_kind::clock, lines, i + 1, last);
        }

//---------------------------------------------------------------------------

        inline parsed element_parser::paragraph(line_list const & lines, size_t i, size_t last) const
        {
            size_t e = i + 1;
            while (e < last && !blank(lines, e) && !special(lines, e, last))
                ++e;

            node_builder b;
            b.extend(parse_objects(span_text(lines, i, e), cfg_));
            return finish(b, syntax_kind::paragraph, lines, e, last);
        }
    }

} // namespace orgdoc

#endif // ORGDOC_ELEMENTS_HPP
