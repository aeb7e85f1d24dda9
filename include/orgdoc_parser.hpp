// orgdoc_parser.hpp - Orgdoc - Parser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Builds the green tree of a whole document, or of a single headline for the
// editor. Parsing never fails: every input has exactly one tree and that
// tree prints back to the input.
//
//   DOCUMENT  := BLANK_LINE* [PROPERTY_DRAWER BLANK_LINE*] [SECTION] HEADLINE*
//   HEADLINE  := headline-line [PLANNING] [PROPERTY_DRAWER] BLANK_LINE* [SECTION] HEADLINE*
//
// A headline owns every following headline of a greater level.

#ifndef ORGDOC_PARSER_HPP
#define ORGDOC_PARSER_HPP

#include "orgdoc_elements.hpp"

#include <plog/Log.h>

namespace orgdoc
{
//========================================================================
// PARSER API
//========================================================================

    green_node_ptr parse_green(std::string_view text, parse_config const & cfg);

    // Parses `text` as exactly one headline and its subtree. Fails when the
    // text does not start with a headline or holds more than one sibling.
    std::optional<green_node_ptr> parse_headline_green(std::string_view text, parse_config const & cfg);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        class document_parser
        {
        public:
            document_parser(std::string_view text, parse_config const & cfg)
                : lines_(split_lines(text)), elements_(cfg), cfg_(cfg)
            {}

            green_node_ptr document();
            parsed headline(size_t i);

            size_t line_count() const noexcept { return lines_.size(); }
            bool starts_with_headline() const { return !lines_.empty() && headline_level(lines_.front().body) > 0; }

        private:
            line_list      lines_;
            element_parser elements_;
            parse_config const & cfg_;

            void headline_line(line const & l, node_builder & b) const;
            std::optional<green_node_ptr> planning(line const & l) const;
            bool is_todo(std::string_view w) const { return contains(cfg_.todos.active, w); }
            bool is_done(std::string_view w) const { return contains(cfg_.todos.done, w); }
        };

//---------------------------------------------------------------------------

        inline bool is_tag_cluster(std::string_view s)
        {
            if (s.size() < 3 || s.front() != ':' || s.back() != ':')
                return false;

            bool prev_colon = true;
            for (size_t i = 1; i < s.size(); ++i)
            {
                char c = s[i];
                if (c == ':')
                {
                    if (prev_colon)
                        return false;
                    prev_colon = true;
                }
                else if (is_word(c) || c == '_' || c == '@' || c == '#' || c == '%')
                    prev_colon = false;
                else
                    return false;
            }
            return true;
        }

//---------------------------------------------------------------------------

        inline green_node_ptr document_parser::document()
        {
            node_builder b;
            size_t const n = lines_.size();
            size_t i = elements_.blank_lines(lines_, 0, n, b);

            if (i < n)
            {
                size_t next = 0;
                if (auto pd = elements_.property_drawer(lines_, i, n, next))
                {
                    b.push(*pd);
                    i = elements_.blank_lines(lines_, next, n, b);
                }
            }

            size_t e = i;
            while (e < n && headline_level(lines_[e].body) == 0)
                ++e;
            if (e > i)
            {
                node_builder section;
                section.extend(elements_.parse_elements(lines_, i, e));
                b.push(section.finish(syntax_kind::section));
            }

            while (e < n)
            {
                auto h = headline(e);
                b.push(std::move(h.elem));
                e = h.next;
            }
            return b.finish(syntax_kind::document);
        }

//---------------------------------------------------------------------------

        inline parsed document_parser::headline(size_t i)
        {
            size_t const n     = lines_.size();
            size_t const level = headline_level(lines_[i].body);

            node_builder b;
            headline_line(lines_[i], b);
            ++i;

            if (i < n && is_planning_word(trim_start_sv(lines_[i].body)))
            {
                if (auto p = planning(lines_[i]))
                {
                    b.push(*p);
                    ++i;
                }
            }

            if (i < n)
            {
                size_t next = 0;
                if (auto pd = elements_.property_drawer(lines_, i, n, next))
                {
                    b.push(*pd);
                    i = next;
                }
            }

            i = elements_.blank_lines(lines_, i, n, b);

            size_t e = i;
            while (e < n && headline_level(lines_[e].body) == 0)
                ++e;
            if (e > i)
            {
                node_builder section;
                section.extend(elements_.parse_elements(lines_, i, e));
                b.push(section.finish(syntax_kind::section));
            }

            while (e < n && headline_level(lines_[e].body) > level)
            {
                auto child = headline(e);
                b.push(std::move(child.elem));
                e = child.next;
            }
            return { b.finish(syntax_kind::headline), e };
        }

//---------------------------------------------------------------------------
// ** TODO [#A] Title :tag1:tag2:

        inline void document_parser::headline_line(line const & l, node_builder & b) const
        {
            auto body = l.body;
            size_t const level = headline_level(body);
            b.token(syntax_kind::headline_stars, body.substr(0, level));

            size_t p = level;
            auto take_ws = [&]() {
                auto ws = leading_ws(body.substr(p));
                b.ws(ws);
                p += ws.size();
            };
            take_ws();

            // Keyword
            {
                size_t w = 0;
                while (p + w < body.size() && !is_space(body[p + w]))
                    ++w;
                auto word = body.substr(p, w);
                if (w > 0 && (is_todo(word) || is_done(word)))
                {
                    b.token(is_todo(word) ? syntax_kind::headline_keyword_todo : syntax_kind::headline_keyword_done, word);
                    p += w;
                    take_ws();
                }
            }

            // Priority cookie
            if (body.substr(p).starts_with("[#") && p + 3 < body.size() && body[p + 3] == ']'
                && !is_whitespace(body[p + 2]) && (p + 4 == body.size() || is_space(body[p + 4])))
            {
                node_builder pr;
                pr.token(syntax_kind::l_bracket, body.substr(p, 1));
                pr.token(syntax_kind::hash, body.substr(p + 1, 1));
                pr.text(body.substr(p + 2, 1));
                pr.token(syntax_kind::r_bracket, body.substr(p + 3, 1));
                b.push(pr.finish(syntax_kind::headline_priority));
                p += 4;
                take_ws();
            }

            auto rest    = body.substr(p);
            auto trail   = trailing_ws(rest);
            auto trimmed = rest.substr(0, rest.size() - trail.size());

            std::string_view title = trimmed, gap, tags;
            {
                size_t sp = trimmed.find_last_of(" \t");
                auto cand = sp == std::string_view::npos ? trimmed : trimmed.substr(sp + 1);
                if (is_tag_cluster(cand))
                {
                    tags  = cand;
                    auto before = trimmed.substr(0, trimmed.size() - cand.size());
                    gap   = trailing_ws(before);
                    title = before.substr(0, before.size() - gap.size());
                }
            }

            if (!title.empty())
            {
                node_builder t;
                t.extend(parse_objects(title, cfg_));
                b.push(t.finish(syntax_kind::headline_title));
            }
            b.ws(gap);
            if (!tags.empty())
            {
                node_builder t;
                size_t start = 0;
                for (size_t k = 0; k < tags.size(); ++k)
                {
                    if (tags[k] != ':')
                        continue;
                    t.text(tags.substr(start, k - start));
                    t.token(syntax_kind::colon, tags.substr(k, 1));
                    start = k + 1;
                }
                b.push(t.finish(syntax_kind::headline_tags));
            }
            b.ws(trail);
            b.nl(l.eol);
        }

//---------------------------------------------------------------------------
// SCHEDULED: <ts> DEADLINE: <ts> CLOSED: [ts]

        inline std::optional<green_node_ptr> document_parser::planning(line const & l) const
        {
            auto s = l.body;
            node_builder b;
            size_t p = 0;
            auto take_ws = [&]() {
                auto ws = leading_ws(s.substr(p));
                b.ws(ws);
                p += ws.size();
            };

            take_ws();
            bool any = false;
            while (p < s.size())
            {
                auto r = s.substr(p);
                std::string_view word;
                syntax_kind kind = syntax_kind::planning;
                if (r.starts_with("SCHEDULED:"))     { word = "SCHEDULED"; kind = syntax_kind::planning_scheduled; }
                else if (r.starts_with("DEADLINE:")) { word = "DEADLINE";  kind = syntax_kind::planning_deadline; }
                else if (r.starts_with("CLOSED:"))   { word = "CLOSED";    kind = syntax_kind::planning_closed; }
                else
                    return std::nullopt;

                node_builder item;
                item.text(r.substr(0, word.size()));
                item.token(syntax_kind::colon, r.substr(word.size(), 1));
                size_t q = word.size() + 1;
                auto ws = leading_ws(r.substr(q));
                item.ws(ws);
                q += ws.size();

                auto ts = parse_timestamp(r.substr(q));
                if (!ts)
                    return std::nullopt;
                item.push(ts->node);
                q += ts->length;

                if (q < r.size() && !is_space(r[q]))
                    return std::nullopt;

                b.push(item.finish(kind));
                p += q;
                any = true;
                take_ws();
            }
            if (!any)
                return std::nullopt;

            b.nl(l.eol);
            return b.finish(syntax_kind::planning);
        }
    }

//========================================================================
// PARSER API implementation
//========================================================================

    inline green_node_ptr parse_green(std::string_view text, parse_config const & cfg)
    {
        detail::document_parser p(text, cfg);
        auto root = p.document();
        PLOGV << "orgdoc: parsed " << text.size() << " bytes, " << p.line_count()
              << " lines, " << root->child_count() << " top-level children";
        return root;
    }

//---------------------------------------------------------------------------

    inline std::optional<green_node_ptr> parse_headline_green(std::string_view text, parse_config const & cfg)
    {
        detail::document_parser p(text, cfg);
        if (!p.starts_with_headline())
            return std::nullopt;

        auto h = p.headline(0);
        if (h.next != p.line_count())
            return std::nullopt;
        return std::get<green_node_ptr>(h.elem);
    }

} // namespace orgdoc

#endif // ORGDOC_PARSER_HPP
