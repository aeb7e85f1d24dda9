// orgdoc_ast.hpp - Orgdoc - Typed views
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// A view is a value holding one syntax_node of a known kind. Views own no
// data of their own; every accessor walks the node's children on demand, so
// a view can never disagree with the tree it was taken from. Casting to the
// wrong kind yields std::nullopt rather than an error.

#ifndef ORGDOC_AST_HPP
#define ORGDOC_AST_HPP

#include "orgdoc_syntax.hpp"
#include "orgdoc_entities.hpp"
#include "orgdoc_lexer.hpp"

#include <initializer_list>
#include <utility>

namespace orgdoc
{
//========================================================================
// Casting
//========================================================================

    template <typename V>
    std::optional<V> as(syntax_node const & n)
    {
        if (!V::can_cast(n.kind()))
            return std::nullopt;
        return V{ { n } };
    }

    template <typename V>
    std::optional<V> as(syntax_element const & e)
    {
        if (auto n = std::get_if<syntax_node>(&e))
            return as<V>(*n);
        return std::nullopt;
    }

    // Direct children of `n` that cast to V.
    template <typename V>
    std::vector<V> children_as(syntax_node const & n)
    {
        std::vector<V> out;
        for (auto const & c : n.children())
            if (auto v = as<V>(c))
                out.push_back(std::move(*v));
        return out;
    }

    template <typename V>
    std::optional<V> first_child_as(syntax_node const & n)
    {
        for (auto const & c : n.children())
            if (auto v = as<V>(c))
                return v;
        return std::nullopt;
    }

    // Every node below (and including) `n` that casts to V, in document order.
    template <typename V>
    std::vector<V> descendants_as(syntax_node const & n)
    {
        std::vector<V> out;
        for (auto const & d : n.descendants())
            if (auto v = as<V>(d))
                out.push_back(std::move(*v));
        return out;
    }

//========================================================================
// Shared helpers
//========================================================================

    namespace detail
    {
        inline std::optional<std::string> token_text(syntax_node const & n, syntax_kind k)
        {
            if (auto t = n.first_token(k))
                return std::string(t->text());
            return std::nullopt;
        }

        // Text tokens that are direct children of `n`, in order.
        inline std::vector<std::string> token_texts(syntax_node const & n, syntax_kind k)
        {
            std::vector<std::string> out;
            for (auto const & c : n.children_with_tokens())
                if (auto t = std::get_if<syntax_token>(&c); t && t->kind() == k)
                    out.emplace_back(t->text());
            return out;
        }

        // Children of `n` excluding leading/trailing tokens of the given kinds.
        inline std::vector<syntax_element> inner_children(syntax_node const & n, std::initializer_list<syntax_kind> markers)
        {
            auto kids = n.children_with_tokens();
            auto is_marker = [&](syntax_element const & e) {
                if (!std::holds_alternative<syntax_token>(e))
                    return false;
                return std::find(markers.begin(), markers.end(), kind_of(e)) != markers.end();
            };

            size_t first = 0, last = kids.size();
            while (first < last && is_marker(kids[first]))
                ++first;
            while (last > first && is_marker(kids[last - 1]))
                --last;
            return { kids.begin() + static_cast<std::ptrdiff_t>(first), kids.begin() + static_cast<std::ptrdiff_t>(last) };
        }

        inline std::string join_text(std::vector<syntax_element> const & elems)
        {
            std::string out;
            for (auto const & e : elems)
                out += text_of(e);
            return out;
        }

        inline bool is_image_path(std::string_view path)
        {
            static constexpr std::string_view suffixes[] = {
                ".jpg", ".jpeg", ".png", ".gif", ".svg", ".webp", ".bmp", ".tif", ".tiff", ".xpm", ".pbm", ".pgm", ".ppm"
            };
            for (auto s : suffixes)
                if (path.size() >= s.size() && iequals(path.substr(path.size() - s.size()), s))
                    return true;
            return false;
        }

        inline void plain_text_into(syntax_node const & n, std::string & out);

        inline std::string plain_text(syntax_node const & n)
        {
            std::string out;
            plain_text_into(n, out);
            return out;
        }
    }

//========================================================================
// Base
//========================================================================

    struct view_base
    {
        syntax_node node;

        syntax_node const & syntax() const noexcept { return node; }
        orgdoc::text_range text_range() const noexcept { return node.range(); }
        size_t start() const noexcept { return node.start(); }
        size_t end() const noexcept { return node.end(); }
        std::string raw() const { return node.text(); }
    };

    struct section_view;
    struct headline_view;
    struct keyword_view;
    struct property_drawer_view;
    struct planning_view;
    struct timestamp_view;
    struct affiliated_keyword_view;

//========================================================================
// Affiliated keywords
//========================================================================

    // #+NAME / #+CAPTION[short]: long, attached to the element that follows.
    struct affiliated_keyword_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::affiliated_keyword; }

        std::string key() const { return detail::token_texts(node, syntax_kind::text).front(); }

        std::optional<std::string> optional() const
        {
            if (!node.first_token(syntax_kind::l_bracket))
                return std::nullopt;
            return detail::token_texts(node, syntax_kind::text).at(1);
        }

        // Value as written, without surrounding whitespace.
        std::string value() const
        {
            auto kids  = node.children_with_tokens();
            auto colon = std::find_if(kids.begin(), kids.end(),
                                      [](syntax_element const & e) { return kind_of(e) == syntax_kind::colon; });
            std::string out;
            for (auto it = colon == kids.end() ? colon : colon + 1; it != kids.end(); ++it)
                out += text_of(*it);
            return std::string(detail::trim_sv(out));
        }

        // Value children after the colon (objects for parsed keywords).
        std::vector<syntax_element> value_objects() const
        {
            auto kids  = node.children_with_tokens();
            std::vector<syntax_element> out;
            bool after = false;
            for (auto & k : kids)
            {
                auto kk = kind_of(k);
                if (after && kk != syntax_kind::new_line && !(out.empty() && kk == syntax_kind::whitespace))
                    out.push_back(k);
                if (kk == syntax_kind::colon)
                    after = true;
            }
            return out;
        }
    };

    namespace detail
    {
        inline std::vector<affiliated_keyword_view> affiliated_of(syntax_node const & n)
        {
            return children_as<affiliated_keyword_view>(n);
        }

        inline std::optional<affiliated_keyword_view> affiliated_of(syntax_node const & n, std::string_view key)
        {
            for (auto & a : affiliated_of(n))
                if (iequals(a.key(), key))
                    return a;
            return std::nullopt;
        }
    }

    // Mixin for elements that may carry affiliated keywords.
    struct affiliated_mixin : view_base
    {
        std::vector<affiliated_keyword_view> affiliated() const { return detail::affiliated_of(node); }

        std::optional<std::string> name() const
        {
            if (auto a = detail::affiliated_of(node, "NAME"))
                return a->value();
            return std::nullopt;
        }

        std::optional<std::string> caption() const
        {
            if (auto a = detail::affiliated_of(node, "CAPTION"))
                return a->value();
            return std::nullopt;
        }
    };

//========================================================================
// Timestamps
//========================================================================

    struct timestamp_interval
    {
        std::string mark;    // "+", "++", ".+", "-" or "--"
        unsigned    value = 0;
        char        unit  = 'd';

        bool operator==(timestamp_interval const &) const = default;
    };

    struct timestamp_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept
        {
            return k == syntax_kind::timestamp_active || k == syntax_kind::timestamp_inactive || k == syntax_kind::timestamp_diary;
        }

        bool is_active() const noexcept { return node.kind() == syntax_kind::timestamp_active; }
        bool is_inactive() const noexcept { return node.kind() == syntax_kind::timestamp_inactive; }
        bool is_diary() const noexcept { return node.kind() == syntax_kind::timestamp_diary; }

        // Date range (<a>--<b>) or time range (<a 10:00-11:00>).
        bool is_range() const
        {
            return node.first_token(syntax_kind::minus2).has_value() || tokens(syntax_kind::timestamp_hour).size() > 1;
        }

        std::optional<unsigned> year_start() const   { return nth(syntax_kind::timestamp_year, 0); }
        std::optional<unsigned> month_start() const  { return nth(syntax_kind::timestamp_month, 0); }
        std::optional<unsigned> day_start() const    { return nth(syntax_kind::timestamp_day, 0); }
        std::optional<unsigned> hour_start() const   { return hour_of(false); }
        std::optional<unsigned> minute_start() const { return minute_of(false); }

        std::optional<unsigned> year_end() const   { return last(syntax_kind::timestamp_year); }
        std::optional<unsigned> month_end() const  { return last(syntax_kind::timestamp_month); }
        std::optional<unsigned> day_end() const    { return last(syntax_kind::timestamp_day); }
        std::optional<unsigned> hour_end() const   { return hour_of(true); }
        std::optional<unsigned> minute_end() const { return minute_of(true); }

        std::optional<std::string> dayname() const { return detail::token_text(node, syntax_kind::timestamp_dayname); }

        std::optional<timestamp_interval> repeater() const { return interval(syntax_kind::timestamp_repeater_mark); }
        std::optional<timestamp_interval> warning() const  { return interval(syntax_kind::timestamp_delay_mark); }

        // Diary sexp including its parentheses.
        std::optional<std::string> diary_sexp() const
        {
            if (!is_diary())
                return std::nullopt;
            return detail::token_text(node, syntax_kind::text);
        }

    private:
        std::vector<syntax_token> tokens(syntax_kind k) const
        {
            std::vector<syntax_token> out;
            for (auto const & c : node.children_with_tokens())
                if (auto t = std::get_if<syntax_token>(&c); t && t->kind() == k)
                    out.push_back(*t);
            return out;
        }

        std::optional<unsigned> nth(syntax_kind k, size_t i) const
        {
            auto t = tokens(k);
            if (i >= t.size())
                return std::nullopt;
            return detail::parse_unsigned(t[i].text());
        }

        std::optional<unsigned> last(syntax_kind k) const
        {
            auto t = tokens(k);
            if (t.empty())
                return std::nullopt;
            return detail::parse_unsigned(t.back().text());
        }

        // Hours of the date range halves, or the two ends of a time range.
        std::optional<unsigned> hour_of(bool end) const
        {
            return end ? last(syntax_kind::timestamp_hour) : nth(syntax_kind::timestamp_hour, 0);
        }

        std::optional<unsigned> minute_of(bool end) const
        {
            return end ? last(syntax_kind::timestamp_minute) : nth(syntax_kind::timestamp_minute, 0);
        }

        std::optional<timestamp_interval> interval(syntax_kind mark) const
        {
            auto kids = node.children_with_tokens();
            for (size_t i = 0; i + 2 < kids.size(); ++i)
            {
                if (kind_of(kids[i]) != mark)
                    continue;
                timestamp_interval iv;
                iv.mark  = text_of(kids[i]);
                iv.value = detail::parse_unsigned(text_of(kids[i + 1])).value_or(0);
                iv.unit  = text_of(kids[i + 2]).front();
                return iv;
            }
            return std::nullopt;
        }
    };

//========================================================================
// Planning, clocks
//========================================================================

    struct planning_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::planning; }

        std::optional<timestamp_view> scheduled() const { return item(syntax_kind::planning_scheduled); }
        std::optional<timestamp_view> deadline() const  { return item(syntax_kind::planning_deadline); }
        std::optional<timestamp_view> closed() const    { return item(syntax_kind::planning_closed); }

    private:
        std::optional<timestamp_view> item(syntax_kind k) const
        {
            if (auto n = node.first_child(k))
                return first_child_as<timestamp_view>(*n);
            return std::nullopt;
        }
    };

    struct clock_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::clock; }

        timestamp_view value() const { return *first_child_as<timestamp_view>(node); }

        // "H:MM" after `=>`, absent on a running clock.
        std::optional<std::string> duration() const
        {
            if (!node.first_token(syntax_kind::double_arrow))
                return std::nullopt;
            return detail::token_texts(node, syntax_kind::text).back();
        }

        bool is_running() const { return !value().is_range(); }
    };

//========================================================================
// Properties
//========================================================================

    struct node_property_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::node_property; }

        std::string key() const { return detail::token_texts(node, syntax_kind::text).front(); }

        std::string value() const
        {
            auto t = detail::token_texts(node, syntax_kind::text);
            return t.size() > 1 ? t[1] : std::string();
        }

        // `:KEY+:` appends to an earlier value of the same key.
        bool is_append() const { return node.first_token(syntax_kind::plus).has_value(); }
    };

    struct property_drawer_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::property_drawer; }

        std::vector<node_property_view> entries() const { return children_as<node_property_view>(node); }

        // Case-insensitive lookup. `:KEY+:` lines extend the value with a space.
        std::optional<std::string> get(std::string_view key) const
        {
            std::optional<std::string> out;
            for (auto const & e : entries())
            {
                if (!detail::iequals(e.key(), key))
                    continue;
                if (e.is_append() && out)
                    *out += " " + e.value();
                else
                    out = e.value();
            }
            return out;
        }
    };

//========================================================================
// Keywords
//========================================================================

    struct keyword_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::keyword; }

        std::string key() const { return detail::token_texts(node, syntax_kind::text).front(); }

        std::string value() const
        {
            auto t = detail::token_texts(node, syntax_kind::text);
            return t.size() > 1 ? std::string(detail::trim_sv(t[1])) : std::string();
        }
    };

    struct babel_call_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::babel_call; }

        std::string value() const
        {
            auto t = detail::token_texts(node, syntax_kind::text);
            return t.size() > 1 ? std::string(detail::trim_sv(t[1])) : std::string();
        }
    };

//========================================================================
// Sections and paragraphs
//========================================================================

    struct section_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::section; }

        std::vector<syntax_node> elements() const { return node.children(); }
    };

    struct link_view;

    struct paragraph_view : affiliated_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::paragraph; }

        // Inline content without the affiliated keywords and post blank.
        std::vector<syntax_element> objects() const
        {
            std::vector<syntax_element> out;
            for (auto & c : node.children_with_tokens())
            {
                auto k = kind_of(c);
                if (k != syntax_kind::affiliated_keyword && k != syntax_kind::blank_line)
                    out.push_back(std::move(c));
            }
            return out;
        }

        // A paragraph holding nothing but one image link.
        bool is_image() const;
    };

//========================================================================
// Headlines
//========================================================================

    enum class todo_type
    {
        todo,
        done
    };

    struct headline_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::headline; }

        size_t level() const { return node.first_token(syntax_kind::headline_stars)->text().size(); }

        std::optional<std::string> todo_keyword() const
        {
            if (auto t = detail::token_text(node, syntax_kind::headline_keyword_todo))
                return t;
            return detail::token_text(node, syntax_kind::headline_keyword_done);
        }

        std::optional<orgdoc::todo_type> todo_type() const
        {
            if (node.first_token(syntax_kind::headline_keyword_todo))
                return orgdoc::todo_type::todo;
            if (node.first_token(syntax_kind::headline_keyword_done))
                return orgdoc::todo_type::done;
            return std::nullopt;
        }

        bool is_todo() const { return todo_type() == orgdoc::todo_type::todo; }
        bool is_done() const { return todo_type() == orgdoc::todo_type::done; }

        std::optional<char> priority() const
        {
            if (auto p = node.first_child(syntax_kind::headline_priority))
                if (auto t = p->first_token(syntax_kind::text))
                    return t->text().front();
            return std::nullopt;
        }

        std::optional<syntax_node> title_node() const { return node.first_child(syntax_kind::headline_title); }

        std::vector<syntax_element> title() const
        {
            if (auto t = title_node())
                return t->children_with_tokens();
            return {};
        }

        std::string title_raw() const
        {
            auto t = title_node();
            return t ? t->text() : std::string();
        }

        // Title with markup removed.
        std::string title_text() const
        {
            auto t = title_node();
            return t ? detail::plain_text(*t) : std::string();
        }

        std::vector<std::string> tags() const
        {
            if (auto t = node.first_child(syntax_kind::headline_tags))
                return detail::token_texts(*t, syntax_kind::text);
            return {};
        }

        bool is_archived() const
        {
            auto t = tags();
            return std::find(t.begin(), t.end(), "ARCHIVE") != t.end();
        }

        bool is_commented() const
        {
            auto t = title_raw();
            return t.starts_with("COMMENT") && (t.size() == 7 || detail::is_space(t[7]));
        }

        std::optional<planning_view> planning() const { return first_child_as<planning_view>(node); }

        std::optional<timestamp_view> scheduled() const { auto p = planning(); return p ? p->scheduled() : std::nullopt; }
        std::optional<timestamp_view> deadline() const  { auto p = planning(); return p ? p->deadline() : std::nullopt; }
        std::optional<timestamp_view> closed() const    { auto p = planning(); return p ? p->closed() : std::nullopt; }

        std::optional<property_drawer_view> properties() const { return first_child_as<property_drawer_view>(node); }

        std::optional<section_view> section() const { return first_child_as<section_view>(node); }

        std::vector<headline_view> headlines() const { return children_as<headline_view>(node); }

        std::optional<headline_view> parent_headline() const
        {
            if (auto p = node.parent())
                return as<headline_view>(*p);
            return std::nullopt;
        }
    };

//========================================================================
// Document
//========================================================================

    struct document_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::document; }

        std::optional<section_view> section() const { return first_child_as<section_view>(node); }
        std::optional<headline_view> first_headline() const { return first_child_as<headline_view>(node); }
        std::vector<headline_view> headlines() const { return children_as<headline_view>(node); }
        std::optional<property_drawer_view> properties() const { return first_child_as<property_drawer_view>(node); }

        // Keywords of the zeroth section.
        std::vector<keyword_view> keywords() const
        {
            if (auto s = section())
                return children_as<keyword_view>(s->node);
            return {};
        }

        // All #+TITLE values joined by a space.
        std::optional<std::string> title() const
        {
            std::optional<std::string> out;
            for (auto const & k : keywords())
            {
                if (!detail::iequals(k.key(), "TITLE"))
                    continue;
                if (out)
                    *out += " " + k.value();
                else
                    out = k.value();
            }
            return out;
        }
    };

//========================================================================
// Lists
//========================================================================

    enum class checkbox_state
    {
        unchecked,
        checked,
        partial
    };

    struct list_item_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::list_item; }

        std::string indent() const { return detail::token_text(node, syntax_kind::list_item_indent).value_or(""); }
        std::string bullet() const { return *detail::token_text(node, syntax_kind::list_item_bullet); }

        bool is_ordered() const
        {
            auto b = bullet();
            return b.back() == '.' || b.back() == ')';
        }

        std::optional<std::string> counter() const
        {
            if (auto c = node.first_child(syntax_kind::list_item_counter))
                return detail::token_text(*c, syntax_kind::text);
            return std::nullopt;
        }

        std::optional<checkbox_state> checkbox() const
        {
            auto c = node.first_child(syntax_kind::list_item_check_box);
            if (!c)
                return std::nullopt;
            switch (c->first_token(syntax_kind::text)->text().front())
            {
                case 'x': case 'X': return checkbox_state::checked;
                case '-':           return checkbox_state::partial;
                default:            return checkbox_state::unchecked;
            }
        }

        std::vector<syntax_element> tag() const
        {
            if (auto t = node.first_child(syntax_kind::list_item_tag))
                return t->children_with_tokens();
            return {};
        }

        std::optional<std::string> tag_raw() const
        {
            if (auto t = node.first_child(syntax_kind::list_item_tag))
                return t->text();
            return std::nullopt;
        }

        std::optional<syntax_node> content() const { return node.first_child(syntax_kind::list_item_content); }
    };

    struct list_view : affiliated_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::list; }

        std::vector<list_item_view> items() const { return children_as<list_item_view>(node); }

        bool is_ordered() const { return items().front().is_ordered(); }
        bool is_descriptive() const { return items().front().tag_raw().has_value(); }
    };

//========================================================================
// Tables
//========================================================================

    struct table_cell_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::org_table_cell; }

        std::string text() const { return std::string(detail::trim_sv(node.text())); }

        std::vector<syntax_element> objects() const
        {
            return detail::inner_children(node, { syntax_kind::whitespace });
        }
    };

    struct table_row_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept
        {
            return k == syntax_kind::org_table_standard_row || k == syntax_kind::org_table_rule_row;
        }

        bool is_rule() const noexcept { return node.kind() == syntax_kind::org_table_rule_row; }

        std::vector<table_cell_view> cells() const { return children_as<table_cell_view>(node); }
    };

    struct table_view : affiliated_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::org_table; }

        // Standard and rule rows in order.
        std::vector<table_row_view> rows() const { return children_as<table_row_view>(node); }

        size_t row_count() const
        {
            auto r = rows();
            return static_cast<size_t>(std::count_if(r.begin(), r.end(), [](auto const & x) { return !x.is_rule(); }));
        }

        size_t column_count() const
        {
            size_t n = 0;
            for (auto const & r : rows())
                n = std::max(n, r.cells().size());
            return n;
        }

        // Indices into rows() of the rule rows.
        std::vector<size_t> rule_positions() const
        {
            std::vector<size_t> out;
            auto r = rows();
            for (size_t i = 0; i < r.size(); ++i)
                if (r[i].is_rule())
                    out.push_back(i);
            return out;
        }

        // A rule row separating at least one standard row above from one below.
        bool has_header() const
        {
            auto r = rows();
            bool seen_standard = false;
            for (size_t i = 0; i < r.size(); ++i)
            {
                if (!r[i].is_rule())
                {
                    seen_standard = true;
                    continue;
                }
                if (seen_standard)
                    return std::any_of(r.begin() + static_cast<std::ptrdiff_t>(i), r.end(), [](auto const & x) { return !x.is_rule(); });
            }
            return false;
        }

        // `row` counts standard rows only.
        std::optional<std::string> cell_text(size_t row, size_t col) const
        {
            size_t n = 0;
            for (auto const & r : rows())
            {
                if (r.is_rule())
                    continue;
                if (n++ != row)
                    continue;
                auto c = r.cells();
                if (col >= c.size())
                    return std::nullopt;
                return c[col].text();
            }
            return std::nullopt;
        }

        std::vector<std::string> formulas() const
        {
            std::vector<std::string> out;
            for (auto const & k : children_as<keyword_view>(node))
                out.push_back(k.value());
            return out;
        }
    };

    struct table_el_view : affiliated_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::table_el; }
    };

//========================================================================
// Blocks
//========================================================================

    namespace detail
    {
        inline std::optional<syntax_node> block_part(syntax_node const & n, syntax_kind k)
        {
            return n.first_child(k);
        }

        // Raw block content with comma escapes removed.
        inline std::string raw_block_value(syntax_node const & n)
        {
            std::string out;
            if (auto c = n.first_child(syntax_kind::block_content))
                for (auto const & e : c->children_with_tokens())
                    if (kind_of(e) != syntax_kind::comma)
                        out += text_of(e);
            return out;
        }
    }

    struct block_mixin : affiliated_mixin
    {
        std::optional<syntax_node> content() const { return node.first_child(syntax_kind::block_content); }

        size_t content_start() const
        {
            return node.first_child(syntax_kind::block_begin)->end();
        }

        size_t content_end() const
        {
            return node.first_child(syntax_kind::block_end)->start();
        }

        std::string content_raw() const
        {
            auto c = content();
            return c ? c->text() : std::string();
        }

    protected:
        std::optional<std::string> begin_token(syntax_kind k) const
        {
            return detail::token_text(*node.first_child(syntax_kind::block_begin), k);
        }
    };

    struct source_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::source_block; }

        std::optional<std::string> language() const   { return begin_token(syntax_kind::src_block_language); }
        std::optional<std::string> switches() const   { return begin_token(syntax_kind::src_block_switches); }
        std::optional<std::string> parameters() const { return begin_token(syntax_kind::src_block_parameters); }

        std::string value() const { return detail::raw_block_value(node); }
    };

    struct export_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::export_block; }

        std::optional<std::string> type() const { return begin_token(syntax_kind::export_block_type); }
        std::string value() const { return detail::raw_block_value(node); }
    };

    struct example_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::example_block; }

        std::string value() const { return detail::raw_block_value(node); }
    };

    struct comment_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::comment_block; }

        std::string value() const { return detail::raw_block_value(node); }
    };

    struct quote_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::quote_block; }
    };

    struct center_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::center_block; }
    };

    struct verse_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::verse_block; }
    };

    struct special_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::special_block; }

        // NAME of #+begin_NAME
        std::string name() const
        {
            auto t = begin_token(syntax_kind::text).value_or("");
            return t.size() > 8 ? t.substr(8) : std::string();
        }

        std::optional<std::string> parameters() const
        {
            auto t = detail::token_texts(*node.first_child(syntax_kind::block_begin), syntax_kind::text);
            if (t.size() < 2)
                return std::nullopt;
            return t[1];
        }
    };

    struct dyn_block_view : block_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::dyn_block; }

        std::string name() const
        {
            auto t = detail::token_texts(*node.first_child(syntax_kind::block_begin), syntax_kind::text);
            return t.size() > 1 ? t[1] : std::string();
        }

        std::optional<std::string> parameters() const
        {
            auto t = detail::token_texts(*node.first_child(syntax_kind::block_begin), syntax_kind::text);
            if (t.size() < 3)
                return std::nullopt;
            return t[2];
        }
    };

//========================================================================
// Drawers and other elements
//========================================================================

    struct drawer_view : affiliated_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::drawer; }

        std::string name() const
        {
            return *detail::token_text(*node.first_child(syntax_kind::drawer_begin), syntax_kind::text);
        }

        std::optional<syntax_node> content() const { return node.first_child(syntax_kind::drawer_content); }

        std::string content_raw() const
        {
            auto c = content();
            return c ? c->text() : std::string();
        }
    };

    namespace detail
    {
        // Lines of a comment or fixed-width element with their `#`/`:` marker
        // and one following space removed.
        inline std::string strip_line_markers(syntax_node const & n)
        {
            std::string out;
            for (auto const & e : n.children_with_tokens())
            {
                auto k = kind_of(e);
                if (k == syntax_kind::new_line)
                {
                    out += '\n';
                    continue;
                }
                if (k != syntax_kind::text)
                    continue;
                auto s = trim_start_sv(std::get<syntax_token>(e).text());
                s.remove_prefix(1);
                if (!s.empty() && is_space(s[0]))
                    s.remove_prefix(1);
                out += s;
            }
            return out;
        }
    }

    struct comment_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::comment; }

        std::string value() const { return detail::strip_line_markers(node); }
    };

    struct fixed_width_view : affiliated_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::fixed_width; }

        std::string value() const { return detail::strip_line_markers(node); }
    };

    struct rule_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::rule; }
    };

    struct latex_environment_view : affiliated_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::latex_environment; }

        std::string name() const
        {
            auto first = detail::token_texts(node, syntax_kind::text).front();
            return std::string(detail::latex_begin_name(first).value_or(""));
        }

        // The environment including its \begin and \end lines.
        std::string value() const
        {
            std::string out;
            for (auto const & e : node.children_with_tokens())
                if (kind_of(e) != syntax_kind::blank_line)
                    out += text_of(e);
            return out;
        }
    };

    struct fn_def_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::fn_def; }

        std::string label() const { return *detail::token_text(node, syntax_kind::fn_label); }
        std::optional<syntax_node> content() const { return node.first_child(syntax_kind::fn_content); }
    };

//========================================================================
// Inline objects
//========================================================================

    struct emphasis_mixin : view_base
    {
        std::vector<syntax_element> contents() const
        {
            auto kids = node.children_with_tokens();
            if (kids.size() < 2)
                return {};
            return { kids.begin() + 1, kids.end() - 1 };
        }

        std::string text() const { return detail::join_text(contents()); }
    };

    struct bold_view : emphasis_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::bold; }
    };
    struct italic_view : emphasis_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::italic; }
    };
    struct underline_view : emphasis_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::underline; }
    };
    struct strike_view : emphasis_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::strike; }
    };
    struct verbatim_view : emphasis_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::verbatim; }
    };
    struct code_view : emphasis_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::code; }
    };

    struct link_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::link; }

        std::string path() const { return *detail::token_text(node, syntax_kind::link_path); }

        bool has_description() const { return node.first_token(syntax_kind::l_bracket).has_value(); }

        std::vector<syntax_element> description() const
        {
            if (!has_description())
                return {};
            auto kids = node.children_with_tokens();
            // [[ path ] [ ...description... ]]
            return { kids.begin() + 4, kids.end() - 1 };
        }

        std::optional<std::string> description_raw() const
        {
            if (!has_description())
                return std::nullopt;
            return detail::join_text(description());
        }

        bool is_image() const { return detail::is_image_path(path()); }

        // Caption of the paragraph holding the link.
        std::optional<std::string> caption() const
        {
            for (auto p = node.parent(); p; p = p->parent())
                if (auto para = as<paragraph_view>(*p))
                    return para->caption();
            return std::nullopt;
        }
    };

    inline bool paragraph_view::is_image() const
    {
        std::optional<link_view> link;
        for (auto const & e : objects())
        {
            if (auto l = as<link_view>(e); l && !link)
            {
                link = l;
                continue;
            }
            if (std::holds_alternative<syntax_token>(e) && detail::trim_sv(text_of(e)).empty())
                continue;
            return false;
        }
        return link && !link->has_description() && link->is_image();
    }

    struct fn_ref_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::fn_ref; }

        std::optional<std::string> label() const { return detail::token_text(node, syntax_kind::fn_label); }

        // [fn:label:definition] and [fn::definition]
        bool is_inline() const { return detail::token_texts(node, syntax_kind::colon).size() > 1; }

        std::vector<syntax_element> definition() const
        {
            if (!is_inline())
                return {};
            auto kids = node.children_with_tokens();
            size_t colons = 0, i = 0;
            while (i < kids.size() && colons < 2)
                if (kind_of(kids[i++]) == syntax_kind::colon)
                    ++colons;
            return { kids.begin() + static_cast<std::ptrdiff_t>(i), kids.end() - 1 };
        }
    };

    struct macros_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::macros; }

        std::string name() const { return *detail::token_text(node, syntax_kind::text); }

        std::optional<std::string> arguments_raw() const { return detail::token_text(node, syntax_kind::macros_argument); }

        // Comma separated, `\,` escapes a literal comma.
        std::vector<std::string> arguments() const
        {
            std::vector<std::string> out;
            auto raw = arguments_raw();
            if (!raw)
                return out;
            std::string cur;
            for (size_t i = 0; i < raw->size(); ++i)
            {
                char c = (*raw)[i];
                if (c == '\\' && i + 1 < raw->size() && (*raw)[i + 1] == ',')
                {
                    cur += ',';
                    ++i;
                }
                else if (c == ',')
                {
                    out.emplace_back(detail::trim_sv(cur));
                    cur.clear();
                }
                else
                    cur += c;
            }
            out.emplace_back(detail::trim_sv(cur));
            return out;
        }
    };

    struct cookie_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::cookie; }

        std::string value() const { return *detail::token_text(node, syntax_kind::text); }
        bool is_percent() const { return value().ends_with('%'); }
    };

    struct inline_src_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::inline_src; }

        std::string language() const { return *detail::token_text(node, syntax_kind::src_block_language); }
        std::optional<std::string> parameters() const { return detail::token_text(node, syntax_kind::src_block_parameters); }
        std::string body() const
        {
            auto kids = node.children_with_tokens();
            for (size_t i = 0; i + 1 < kids.size(); ++i)
                if (kind_of(kids[i]) == syntax_kind::l_curly)
                    return kind_of(kids[i + 1]) == syntax_kind::text ? text_of(kids[i + 1]) : std::string();
            return {};
        }
    };

    struct inline_call_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::inline_call; }

        std::string name() const { return detail::token_texts(node, syntax_kind::text).at(1); }

        std::optional<std::string> inside_header() const { return header(true); }
        std::optional<std::string> end_header() const { return header(false); }

        std::string arguments() const
        {
            auto kids = node.children_with_tokens();
            for (size_t i = 0; i + 1 < kids.size(); ++i)
                if (kind_of(kids[i]) == syntax_kind::l_parens)
                    return kind_of(kids[i + 1]) == syntax_kind::text ? text_of(kids[i + 1]) : std::string();
            return {};
        }

    private:
        std::optional<std::string> header(bool inside) const
        {
            auto kids = node.children_with_tokens();
            bool seen_args = false;
            for (size_t i = 0; i + 1 < kids.size(); ++i)
            {
                auto k = kind_of(kids[i]);
                if (k == syntax_kind::l_parens)
                    seen_args = true;
                if (k == syntax_kind::l_bracket && seen_args != inside)
                    return kind_of(kids[i + 1]) == syntax_kind::text ? text_of(kids[i + 1]) : std::string();
            }
            return std::nullopt;
        }
    };

    struct snippet_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::snippet; }

        std::string backend() const { return detail::token_texts(node, syntax_kind::text).front(); }

        std::string value() const
        {
            auto t = detail::token_texts(node, syntax_kind::text);
            return t.size() > 1 ? t[1] : std::string();
        }
    };

    struct target_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::target; }

        std::string value() const { return *detail::token_text(node, syntax_kind::text); }
    };

    struct radio_target_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::radio_target; }

        std::vector<syntax_element> contents() const
        {
            return detail::inner_children(node, { syntax_kind::l_angle3, syntax_kind::r_angle3 });
        }

        std::string value() const { return detail::join_text(contents()); }
    };

    struct entity_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::entity; }

        std::string name() const { return *detail::token_text(node, syntax_kind::text); }

        std::string_view html() const { return info().html; }
        std::string_view utf8() const { return info().utf8; }

    private:
        entity_info info() const
        {
            // The parser only produces entities present in the table.
            return find_entity(name()).value_or(entity_info{});
        }
    };

    struct latex_fragment_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::latex_fragment; }

        std::string value() const { return node.text(); }
    };

    struct line_break_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::line_break; }
    };

    struct script_mixin : view_base
    {
        bool is_braced() const { return node.first_token(syntax_kind::l_curly).has_value(); }

        std::vector<syntax_element> contents() const
        {
            return detail::inner_children(node, { syntax_kind::caret, syntax_kind::underscore,
                                                   syntax_kind::l_curly, syntax_kind::r_curly });
        }

        std::string text() const { return detail::join_text(contents()); }
    };

    struct superscript_view : script_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::superscript; }
    };
    struct subscript_view : script_mixin
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::subscript; }
    };

    // {{text}{hint}@id}
    struct cloze_view : view_base
    {
        static bool can_cast(syntax_kind k) noexcept { return k == syntax_kind::cloze; }

        std::vector<syntax_element> contents() const
        {
            auto kids = node.children_with_tokens();
            auto close = std::find_if(kids.begin() + 1, kids.end(),
                                      [](syntax_element const & e) { return kind_of(e) == syntax_kind::r_curly; });
            return { kids.begin() + 1, close };
        }

        std::string text_raw() const { return detail::join_text(contents()); }

        // Empty when written as `{}`.
        std::optional<std::string> hint() const { return text_after(syntax_kind::l_curly); }

        // Empty when written as `@}`.
        std::optional<std::string> id() const { return text_after(syntax_kind::at); }

    private:
        std::optional<std::string> text_after(syntax_kind marker) const
        {
            auto kids = node.children_with_tokens();
            for (size_t i = 0; i + 1 < kids.size(); ++i)
                if (kind_of(kids[i]) == marker)
                    return kind_of(kids[i + 1]) == syntax_kind::text ? text_of(kids[i + 1]) : std::string();
            return std::nullopt;
        }
    };

//========================================================================
// Plain text
//========================================================================

    inline void detail::plain_text_into(syntax_node const & n, std::string & out)
    {
        for (auto const & e : n.children_with_tokens())
        {
            if (auto t = std::get_if<syntax_token>(&e))
            {
                auto k = t->kind();
                if (k == syntax_kind::text || k == syntax_kind::whitespace || k == syntax_kind::new_line)
                    out += t->text();
                continue;
            }

            auto const & c = std::get<syntax_node>(e);
            switch (c.kind())
            {
                case syntax_kind::link:
                {
                    link_view l{ { c } };
                    if (l.has_description())
                        for (auto const & d : l.description())
                        {
                            if (auto dn = std::get_if<syntax_node>(&d))
                                plain_text_into(*dn, out);
                            else
                                out += std::get<syntax_token>(d).text();
                        }
                    else
                        out += l.path();
                    break;
                }
                case syntax_kind::entity:
                    out += entity_view{ { c } }.utf8();
                    break;
                case syntax_kind::line_break:
                    out += '\n';
                    break;
                case syntax_kind::cloze:
                    for (auto const & d : cloze_view{ { c } }.contents())
                    {
                        if (auto dn = std::get_if<syntax_node>(&d))
                            plain_text_into(*dn, out);
                        else
                            out += std::get<syntax_token>(d).text();
                    }
                    break;
                case syntax_kind::timestamp_active:
                case syntax_kind::timestamp_inactive:
                case syntax_kind::timestamp_diary:
                case syntax_kind::latex_fragment:
                case syntax_kind::cookie:
                    out += c.text();
                    break;
                case syntax_kind::fn_ref:
                case syntax_kind::macros:
                case syntax_kind::snippet:
                case syntax_kind::inline_src:
                case syntax_kind::inline_call:
                    break;
                default:
                    plain_text_into(c, out);
                    break;
            }
        }
    }

} // namespace orgdoc

#endif // ORGDOC_AST_HPP
