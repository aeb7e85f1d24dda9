// orgdoc_traverse.hpp - Orgdoc - Traversal
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Depth-first walk over a tree with an explicit worklist, so deep documents
// cannot exhaust the call stack. Container nodes produce enter/leave pairs
// carrying a typed view; leaf objects produce their own callbacks. Syntax
// that only exists to delimit (stars, brackets, block begin/end lines,
// affiliated keywords, planning) is not surfaced unless the handler asks for
// raw tokens.

#ifndef ORGDOC_TRAVERSE_HPP
#define ORGDOC_TRAVERSE_HPP

#include "orgdoc_ast.hpp"

namespace orgdoc
{
//========================================================================
// Containers
//========================================================================

    using container = std::variant<
        document_view, section_view, headline_view, paragraph_view,
        list_view, list_item_view, table_view, table_row_view, table_cell_view,
        source_block_view, example_block_view, export_block_view, comment_block_view,
        quote_block_view, center_block_view, verse_block_view, special_block_view, dyn_block_view,
        drawer_view, comment_view, fixed_width_view, fn_def_view, fn_ref_view,
        bold_view, italic_view, underline_view, strike_view, verbatim_view, code_view,
        link_view, radio_target_view, superscript_view, subscript_view, cloze_view>;

    inline syntax_node const & container_node(container const & c) noexcept
    {
        return std::visit([](auto const & v) -> syntax_node const & { return v.syntax(); }, c);
    }

    inline syntax_kind container_kind(container const & c) noexcept
    {
        return container_node(c).kind();
    }

    std::optional<container> to_container(syntax_node const & n);

//========================================================================
// Handler protocol
//========================================================================

    class traversal_handler;

    class traversal_context
    {
    public:
        // On enter: do not descend and do not report the matching leave.
        void skip() noexcept { skip_ = true; }

        // End the walk now. No further callbacks are made.
        void stop() noexcept { stop_ = true; }

        bool is_stopped() const noexcept { return stop_; }

    private:
        bool skip_ = false;
        bool stop_ = false;

        friend void walk(syntax_element const &, traversal_handler &, traversal_context &);
    };

    class traversal_handler
    {
    public:
        virtual ~traversal_handler() = default;

        // When true, token() is called for every token reached, in addition
        // to the other callbacks.
        virtual bool wants_tokens() const { return false; }

        // When true, the walk is structural: node() is called for every node
        // in document order and the walk descends into all of its children,
        // delimiters included. enter(), leave() and the leaf callbacks are
        // not made; skip() and stop() work from node().
        virtual bool wants_nodes() const { return false; }

        virtual void node(syntax_node const &, traversal_context &) {}

        virtual void enter(container const &, traversal_context &) {}
        virtual void leave(container const &, traversal_context &) {}

        virtual void text(syntax_token const &, traversal_context &) {}
        virtual void token(syntax_token const &, traversal_context &) {}
        virtual void fn_label(syntax_token const &, traversal_context &) {}

        virtual void timestamp(timestamp_view const &, traversal_context &) {}
        virtual void entity(entity_view const &, traversal_context &) {}
        virtual void line_break(line_break_view const &, traversal_context &) {}
        virtual void snippet(snippet_view const &, traversal_context &) {}
        virtual void rule(rule_view const &, traversal_context &) {}
        virtual void latex_fragment(latex_fragment_view const &, traversal_context &) {}
        virtual void latex_environment(latex_environment_view const &, traversal_context &) {}
        virtual void cookie(cookie_view const &, traversal_context &) {}
        virtual void macros(macros_view const &, traversal_context &) {}
        virtual void inline_call(inline_call_view const &, traversal_context &) {}
        virtual void inline_src(inline_src_view const &, traversal_context &) {}
        virtual void clock(clock_view const &, traversal_context &) {}
        virtual void target(target_view const &, traversal_context &) {}
        virtual void keyword(keyword_view const &, traversal_context &) {}
        virtual void babel_call(babel_call_view const &, traversal_context &) {}
        virtual void table_el(table_el_view const &, traversal_context &) {}
    };

    // Walks one element with an existing context. Handlers use this from
    // enter() to render parts that the walk itself does not visit, such as
    // headline titles and list item tags.
    void walk(syntax_element const & e, traversal_handler & h, traversal_context & ctx);

    void traverse(syntax_node const & root, traversal_handler & h);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        // Children the walk descends into for a container or transparent node.
        inline std::vector<syntax_element> walk_children(syntax_node const & n)
        {
            auto flatten = [](std::optional<syntax_node> const & inner) {
                return inner ? inner->children_with_tokens() : std::vector<syntax_element>{};
            };
            auto nodes_of = [&](std::initializer_list<syntax_kind> kinds) {
                std::vector<syntax_element> out;
                for (auto & c : n.children())
                    if (std::find(kinds.begin(), kinds.end(), c.kind()) != kinds.end())
                        out.push_back(c);
                return out;
            };

            switch (n.kind())
            {
                case syntax_kind::document:
                case syntax_kind::headline:
                    return nodes_of({ syntax_kind::section, syntax_kind::headline });

                case syntax_kind::list:
                    return nodes_of({ syntax_kind::list_item });
                case syntax_kind::list_item:
                    return flatten(n.first_child(syntax_kind::list_item_content));

                case syntax_kind::org_table:
                    return nodes_of({ syntax_kind::org_table_standard_row, syntax_kind::org_table_rule_row });
                case syntax_kind::org_table_standard_row:
                    return nodes_of({ syntax_kind::org_table_cell });
                case syntax_kind::org_table_rule_row:
                    return {};

                case syntax_kind::source_block:
                case syntax_kind::example_block:
                case syntax_kind::export_block:
                case syntax_kind::comment_block:
                case syntax_kind::quote_block:
                case syntax_kind::center_block:
                case syntax_kind::verse_block:
                case syntax_kind::special_block:
                case syntax_kind::dyn_block:
                    return flatten(n.first_child(syntax_kind::block_content));

                case syntax_kind::drawer:
                    return flatten(n.first_child(syntax_kind::drawer_content));

                case syntax_kind::fn_def:
                {
                    std::vector<syntax_element> out;
                    if (auto l = n.first_token(syntax_kind::fn_label))
                        out.push_back(*l);
                    for (auto & c : flatten(n.first_child(syntax_kind::fn_content)))
                        out.push_back(std::move(c));
                    return out;
                }
                case syntax_kind::fn_ref:
                {
                    std::vector<syntax_element> out;
                    if (auto l = n.first_token(syntax_kind::fn_label))
                        out.push_back(*l);
                    for (auto & c : fn_ref_view{ { n } }.definition())
                        out.push_back(std::move(c));
                    return out;
                }

                case syntax_kind::link:
                    return link_view{ { n } }.description();

                case syntax_kind::paragraph:
                    return paragraph_view{ { n } }.objects();

                case syntax_kind::superscript:
                case syntax_kind::subscript:
                    return superscript_view{ { n } }.contents();

                case syntax_kind::radio_target:
                    return radio_target_view{ { n } }.contents();

                case syntax_kind::cloze:
                    return cloze_view{ { n } }.contents();

                case syntax_kind::planning:
                case syntax_kind::property_drawer:
                case syntax_kind::affiliated_keyword:
                case syntax_kind::block_begin:
                case syntax_kind::block_end:
                case syntax_kind::drawer_begin:
                case syntax_kind::drawer_end:
                    return {};

                default:
                    return n.children_with_tokens();
            }
        }

        // Reports a leaf object. Returns false when `n` is not one.
        inline bool leaf_event(syntax_node const & n, traversal_handler & h, traversal_context & ctx)
        {
            switch (n.kind())
            {
                case syntax_kind::timestamp_active:
                case syntax_kind::timestamp_inactive:
                case syntax_kind::timestamp_diary:   h.timestamp({ { n } }, ctx); return true;
                case syntax_kind::entity:            h.entity({ { n } }, ctx); return true;
                case syntax_kind::line_break:        h.line_break({ { n } }, ctx); return true;
                case syntax_kind::snippet:           h.snippet({ { n } }, ctx); return true;
                case syntax_kind::rule:              h.rule({ { n } }, ctx); return true;
                case syntax_kind::latex_fragment:    h.latex_fragment({ { n } }, ctx); return true;
                case syntax_kind::latex_environment: h.latex_environment({ { n } }, ctx); return true;
                case syntax_kind::cookie:            h.cookie({ { n } }, ctx); return true;
                case syntax_kind::macros:            h.macros({ { n } }, ctx); return true;
                case syntax_kind::inline_call:       h.inline_call({ { n } }, ctx); return true;
                case syntax_kind::inline_src:        h.inline_src({ { n } }, ctx); return true;
                case syntax_kind::clock:             h.clock({ { n } }, ctx); return true;
                case syntax_kind::target:            h.target({ { n } }, ctx); return true;
                case syntax_kind::keyword:           h.keyword({ { n } }, ctx); return true;
                case syntax_kind::babel_call:        h.babel_call({ { n } }, ctx); return true;
                case syntax_kind::table_el:          h.table_el({ { n } }, ctx); return true;
                default:                             return false;
            }
        }

        // Line ends are content only inside verbatim line-oriented elements.
        inline bool is_content_new_line(syntax_token const & t)
        {
            if (t.kind() != syntax_kind::new_line)
                return false;
            auto p = t.parent().kind();
            return p == syntax_kind::block_content || p == syntax_kind::comment || p == syntax_kind::fixed_width;
        }

        inline void token_event(syntax_token const & t, traversal_handler & h, traversal_context & ctx)
        {
            if (h.wants_tokens())
            {
                h.token(t, ctx);
                if (ctx.is_stopped())
                    return;
            }

            if (t.kind() == syntax_kind::text || is_content_new_line(t))
                h.text(t, ctx);
            else if (t.kind() == syntax_kind::fn_label)
                h.fn_label(t, ctx);
        }
    }

//========================================================================
// Implementation
//========================================================================

    inline std::optional<container> to_container(syntax_node const & n)
    {
        switch (n.kind())
        {
            case syntax_kind::document:               return document_view{ { n } };
            case syntax_kind::section:                return section_view{ { n } };
            case syntax_kind::headline:               return headline_view{ { n } };
            case syntax_kind::paragraph:              return paragraph_view{ { n } };
            case syntax_kind::list:                   return list_view{ { n } };
            case syntax_kind::list_item:              return list_item_view{ { n } };
            case syntax_kind::org_table:              return table_view{ { n } };
            case syntax_kind::org_table_standard_row:
            case syntax_kind::org_table_rule_row:     return table_row_view{ { n } };
            case syntax_kind::org_table_cell:         return table_cell_view{ { n } };
            case syntax_kind::source_block:           return source_block_view{ { n } };
            case syntax_kind::example_block:          return example_block_view{ { n } };
            case syntax_kind::export_block:           return export_block_view{ { n } };
            case syntax_kind::comment_block:          return comment_block_view{ { n } };
            case syntax_kind::quote_block:            return quote_block_view{ { n } };
            case syntax_kind::center_block:           return center_block_view{ { n } };
            case syntax_kind::verse_block:            return verse_block_view{ { n } };
            case syntax_kind::special_block:          return special_block_view{ { n } };
            case syntax_kind::dyn_block:              return dyn_block_view{ { n } };
            case syntax_kind::drawer:                 return drawer_view{ { n } };
            case syntax_kind::comment:                return comment_view{ { n } };
            case syntax_kind::fixed_width:            return fixed_width_view{ { n } };
            case syntax_kind::fn_def:                 return fn_def_view{ { n } };
            case syntax_kind::fn_ref:                 return fn_ref_view{ { n } };
            case syntax_kind::bold:                   return bold_view{ { n } };
            case syntax_kind::italic:                 return italic_view{ { n } };
            case syntax_kind::underline:              return underline_view{ { n } };
            case syntax_kind::strike:                 return strike_view{ { n } };
            case syntax_kind::verbatim:               return verbatim_view{ { n } };
            case syntax_kind::code:                   return code_view{ { n } };
            case syntax_kind::link:                   return link_view{ { n } };
            case syntax_kind::radio_target:           return radio_target_view{ { n } };
            case syntax_kind::superscript:            return superscript_view{ { n } };
            case syntax_kind::subscript:              return subscript_view{ { n } };
            case syntax_kind::cloze:                  return cloze_view{ { n } };
            default:                                  return std::nullopt;
        }
    }

//---------------------------------------------------------------------------

    inline void walk(syntax_element const & e, traversal_handler & h, traversal_context & ctx)
    {
        struct work_item
        {
            syntax_element           elem;
            std::optional<container> leaving;   // set for the leave phase
        };

        // A nested walk from inside enter() must not disturb the caller's
        // pending skip.
        bool const outer_skip = ctx.skip_;

        std::vector<work_item> stack;
        stack.push_back({ e, std::nullopt });

        while (!stack.empty() && !ctx.stop_)
        {
            work_item item = std::move(stack.back());
            stack.pop_back();

            if (item.leaving)
            {
                h.leave(*item.leaving, ctx);
                continue;
            }

            if (auto t = std::get_if<syntax_token>(&item.elem))
            {
                detail::token_event(*t, h, ctx);
                continue;
            }

            auto const & n = std::get<syntax_node>(item.elem);
            if (h.wants_nodes())
            {
                ctx.skip_ = false;
                h.node(n, ctx);
                if (ctx.stop_)
                    break;
                if (ctx.skip_)
                {
                    ctx.skip_ = false;
                    continue;
                }

                auto kids = n.children_with_tokens();
                for (size_t i = kids.size(); i-- > 0; )
                    stack.push_back({ std::move(kids[i]), std::nullopt });
                continue;
            }

            if (detail::leaf_event(n, h, ctx))
                continue;

            auto kids = detail::walk_children(n);
            if (auto c = to_container(n))
            {
                ctx.skip_ = false;
                h.enter(*c, ctx);
                if (ctx.stop_)
                    break;
                if (ctx.skip_)
                {
                    ctx.skip_ = false;
                    continue;
                }
                stack.push_back({ n, std::move(c) });
            }

            for (size_t i = kids.size(); i-- > 0; )
                stack.push_back({ std::move(kids[i]), std::nullopt });
        }

        ctx.skip_ = outer_skip;
    }

//---------------------------------------------------------------------------

    inline void traverse(syntax_node const & root, traversal_handler & h)
    {
        traversal_context ctx;
        walk(root, h, ctx);
    }

} // namespace orgdoc

#endif // ORGDOC_TRAVERSE_HPP
