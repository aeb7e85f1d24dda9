// orgdoc_html.hpp - Orgdoc - HTML export
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Default rendering, by syntax kind:
//
//   document          <main>...</main>
//   headline          <hN>title</hN>, N = min(level, 6), followed by its section
//                     and sub-headlines (no wrapper of its own)
//   section           <section>...</section>
//   paragraph         <p>...</p>
//   bold italic       <b> <i>
//   underline strike  <u> <s>
//   verbatim code     <code>
//   superscript       <sup>, subscript <sub>
//   cloze             <span class="cloze" title="hint">text</span>
//   link              <a href="path">description or path</a>, image paths
//                     become <img src="path">; a "file:" prefix is dropped
//   list              <ol>, <ul> or <dl> (descriptive); items <li> or <dt>tag</dt><dd>
//   table             <table> with <thead> before the first rule when the table
//                     has a header, <tbody> otherwise; <tr>, <td>
//   source block      <pre><code class="language-L">
//   example block     <pre class="example">, fixed width likewise
//   quote block       <blockquote>
//   center block      <div class="center">
//   verse block       <p class="verse">
//   special block     <div class="NAME">
//   export block      raw value when the type is "html", otherwise dropped
//   comment (block)   <!-- ... -->
//   footnote ref      <a href="#footnote_L" class="footnote-reference">[L]</a>
//   footnote def      <aside class="footnote-definition">...</aside>
//   timestamp         <span class="timestamp-wrapper"><span class="timestamp">...</span></span>
//   entity            its HTML entity
//   snippet           raw value for the "html" backend, otherwise dropped
//   line break        <br/>
//   rule              <hr/>
//   target            <a id="value"></a>
//   inline source     <code>body</code>
//   latex             escaped source
//   keyword, babel call, clock, macros, inline call, planning, property drawers
//                     nothing
//
// All text is escaped. Any node kind can be re-rendered with on(kind, fn);
// the handler receives the enter, leave or leaf phase and may call
// render_default() to fall back.

#ifndef ORGDOC_HTML_HPP
#define ORGDOC_HTML_HPP

#include "orgdoc_document.hpp"

#include <functional>
#include <map>

namespace orgdoc
{
//========================================================================
// HTML API
//========================================================================

    std::string html_escape(std::string_view s);

    enum class render_phase
    {
        enter,
        leave,
        leaf
    };

    class html_export;

    using html_handler = std::function<void(html_export &, syntax_node const &, render_phase, traversal_context &)>;

    class html_export : public traversal_handler
    {
    public:
        // Replaces the default rendering of one node kind.
        html_export & on(syntax_kind kind, html_handler handler);

        // Renders `node` and everything below it into the output.
        void render(syntax_node const & node);

        void push_str(std::string_view s) { out_ += s; }

        std::string const & output() const noexcept { return out_; }
        std::string finish() { return std::move(out_); }

        void render_default(syntax_node const & node, render_phase phase, traversal_context & ctx);

    //------------------------------------------------------------
    // traversal_handler
    //------------------------------------------------------------

        void enter(container const & c, traversal_context & ctx) override { dispatch(container_node(c), render_phase::enter, ctx); }
        void leave(container const & c, traversal_context & ctx) override { dispatch(container_node(c), render_phase::leave, ctx); }

        void text(syntax_token const & t, traversal_context &) override { out_ += html_escape(t.text()); }

        void timestamp(timestamp_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void entity(entity_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void line_break(line_break_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void snippet(snippet_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void rule(rule_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void latex_fragment(latex_fragment_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void latex_environment(latex_environment_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void cookie(cookie_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void macros(macros_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void inline_call(inline_call_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void inline_src(inline_src_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void clock(clock_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void target(target_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void keyword(keyword_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void babel_call(babel_call_view const & v, traversal_context & ctx) override { leaf(v, ctx); }
        void table_el(table_el_view const & v, traversal_context & ctx) override { leaf(v, ctx); }

    private:
        enum class table_row_state
        {
            header_rule,
            header,
            body_rule,
            body
        };

        std::string                           out_;
        std::map<syntax_kind, html_handler>   overrides_;
        std::vector<bool>                     in_descriptive_list_;
        table_row_state                       table_row_ = table_row_state::body_rule;

        void leaf(view_base const & v, traversal_context & ctx) { dispatch(v.syntax(), render_phase::leaf, ctx); }
        void dispatch(syntax_node const & node, render_phase phase, traversal_context & ctx);

        void close_table_part();
        void render_timestamp(syntax_node const & node);
    };

//========================================================================
// Implementation
//========================================================================

    inline std::string html_escape(std::string_view s)
    {
        std::string out;
        out.reserve(s.size());
        for (char c : s)
        {
            switch (c)
            {
                case '<':  out += "&lt;"; break;
                case '>':  out += "&gt;"; break;
                case '&':  out += "&amp;"; break;
                case '\'': out += "&apos;"; break;
                case '"':  out += "&quot;"; break;
                default:   out += c; break;
            }
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline html_export & html_export::on(syntax_kind kind, html_handler handler)
    {
        if (is_token_kind(kind))
            PLOGD << "orgdoc: html override for token kind " << to_string(kind) << " will never be called";
        overrides_[kind] = std::move(handler);
        return *this;
    }

    inline void html_export::render(syntax_node const & node)
    {
        traversal_context ctx;
        walk(node, *this, ctx);
    }

    inline void html_export::dispatch(syntax_node const & node, render_phase phase, traversal_context & ctx)
    {
        if (auto it = overrides_.find(node.kind()); it != overrides_.end())
            it->second(*this, node, phase, ctx);
        else
            render_default(node, phase, ctx);
    }

//---------------------------------------------------------------------------

    inline void html_export::close_table_part()
    {
        if (table_row_ == table_row_state::body)
            out_ += "</tbody>";
        else if (table_row_ == table_row_state::header)
            out_ += "</thead>";
    }

    inline void html_export::render_timestamp(syntax_node const & node)
    {
        out_ += R"(<span class="timestamp-wrapper"><span class="timestamp">)";
        for (auto const & t : node.descendant_tokens())
        {
            if (t.kind() == syntax_kind::minus2)
                out_ += "&#x2013;";
            else
                out_ += html_escape(t.text());
        }
        out_ += "</span></span>";
    }

//---------------------------------------------------------------------------

    inline void html_export::render_default(syntax_node const & node, render_phase phase, traversal_context & ctx)
    {
        bool const entering = phase != render_phase::leave;
        auto tag = [&](std::string_view open, std::string_view close) { out_ += entering ? open : close; };

        switch (node.kind())
        {
            case syntax_kind::document:      tag("<main>", "</main>"); break;
            case syntax_kind::section:       tag("<section>", "</section>"); break;
            case syntax_kind::paragraph:     tag("<p>", "</p>"); break;
            case syntax_kind::bold:          tag("<b>", "</b>"); break;
            case syntax_kind::italic:        tag("<i>", "</i>"); break;
            case syntax_kind::underline:     tag("<u>", "</u>"); break;
            case syntax_kind::strike:        tag("<s>", "</s>"); break;
            case syntax_kind::verbatim:
            case syntax_kind::code:          tag("<code>", "</code>"); break;
            case syntax_kind::superscript:   tag("<sup>", "</sup>"); break;
            case syntax_kind::subscript:     tag("<sub>", "</sub>"); break;
            case syntax_kind::cloze:
            {
                if (!entering)
                {
                    out_ += "</span>";
                    break;
                }
                out_ += R"(<span class="cloze")";
                if (auto hint = cloze_view{ { node } }.hint(); hint && !hint->empty())
                    out_ += R"( title=")" + html_escape(*hint) + "\"";
                out_ += ">";
                break;
            }
            case syntax_kind::quote_block:   tag("<blockquote>", "</blockquote>"); break;
            case syntax_kind::center_block:  tag(R"(<div class="center">)", "</div>"); break;
            case syntax_kind::verse_block:   tag(R"(<p class="verse">)", "</p>"); break;
            case syntax_kind::example_block: tag(R"(<pre class="example">)", "</pre>"); break;
            case syntax_kind::comment_block:
            case syntax_kind::comment:       tag("<!--", "-->"); break;
            case syntax_kind::org_table_cell: tag("<td>", "</td>"); break;

            case syntax_kind::headline:
            {
                if (!entering)
                    break;
                headline_view h{ { node } };
                auto level = std::to_string(std::min<size_t>(h.level(), 6));
                out_ += "<h" + level + ">";
                if (auto t = h.title_node())
                    walk(*t, *this, ctx);
                out_ += "</h" + level + ">";
                break;
            }

            case syntax_kind::source_block:
            {
                if (!entering)
                {
                    out_ += "</code></pre>";
                    break;
                }
                if (auto lang = source_block_view{ { node } }.language())
                    out_ += R"(<pre><code class="language-)" + html_escape(*lang) + R"(">)";
                else
                    out_ += "<pre><code>";
                break;
            }

            case syntax_kind::special_block:
            {
                if (entering)
                    out_ += R"(<div class=")" + html_escape(special_block_view{ { node } }.name()) + R"(">)";
                else
                    out_ += "</div>";
                break;
            }

            case syntax_kind::fixed_width:
                out_ += R"(<pre class="example">)" + html_escape(fixed_width_view{ { node } }.value()) + "</pre>";
                ctx.skip();
                break;

            case syntax_kind::export_block:
            {
                export_block_view b{ { node } };
                if (detail::iequals(b.type().value_or(""), "html"))
                    out_ += b.value();
                ctx.skip();
                break;
            }

            case syntax_kind::list:
            {
                list_view l{ { node } };
                if (entering)
                {
                    bool const descriptive = !l.is_ordered() && l.is_descriptive();
                    in_descriptive_list_.push_back(descriptive);
                    out_ += l.is_ordered() ? "<ol>" : descriptive ? "<dl>" : "<ul>";
                }
                else
                {
                    out_ += l.is_ordered() ? "</ol>" : in_descriptive_list_.back() ? "</dl>" : "</ul>";
                    in_descriptive_list_.pop_back();
                }
                break;
            }

            case syntax_kind::list_item:
            {
                bool const descriptive = !in_descriptive_list_.empty() && in_descriptive_list_.back();
                if (!entering)
                {
                    out_ += descriptive ? "</dd>" : "</li>";
                    break;
                }
                if (!descriptive)
                {
                    out_ += "<li>";
                    break;
                }
                out_ += "<dt>";
                if (auto tag_node = node.first_child(syntax_kind::list_item_tag))
                    walk(*tag_node, *this, ctx);
                out_ += "</dt><dd>";
                break;
            }

            case syntax_kind::org_table:
            {
                if (entering)
                {
                    out_ += "<table>";
                    table_row_ = table_view{ { node } }.has_header() ? table_row_state::header_rule : table_row_state::body_rule;
                }
                else
                {
                    close_table_part();
                    out_ += "</table>";
                }
                break;
            }

            case syntax_kind::org_table_rule_row:
            {
                close_table_part();
                if (table_row_ == table_row_state::body || table_row_ == table_row_state::header)
                    table_row_ = table_row_state::body_rule;
                ctx.skip();
                break;
            }

            case syntax_kind::org_table_standard_row:
            {
                if (!entering)
                {
                    out_ += "</tr>";
                    break;
                }
                if (table_row_ == table_row_state::header_rule)
                {
                    table_row_ = table_row_state::header;
                    out_ += "<thead>";
                }
                else if (table_row_ == table_row_state::body_rule)
                {
                    table_row_ = table_row_state::body;
                    out_ += "<tbody>";
                }
                out_ += "<tr>";
                break;
            }

            case syntax_kind::link:
            {
                if (!entering)
                {
                    out_ += "</a>";
                    break;
                }
                link_view l{ { node } };
                std::string path = l.path();
                if (path.starts_with("file:"))
                    path.erase(0, 5);

                if (l.is_image())
                {
                    out_ += R"(<img src=")" + html_escape(path) + R"(">)";
                    ctx.skip();
                    break;
                }
                out_ += R"(<a href=")" + html_escape(path) + R"(">)";
                if (!l.has_description())
                {
                    out_ += html_escape(path) + "</a>";
                    ctx.skip();
                }
                break;
            }

            case syntax_kind::fn_ref:
            {
                if (auto label = fn_ref_view{ { node } }.label())
                    out_ += R"(<a href="#footnote_)" + html_escape(*label) + R"(" class="footnote-reference">[)"
                          + html_escape(*label) + "]</a>";
                ctx.skip();
                break;
            }

            case syntax_kind::fn_def:
            {
                if (!entering)
                {
                    out_ += "</span></aside>";
                    break;
                }
                auto label = html_escape(fn_def_view{ { node } }.label());
                out_ += R"(<aside class="footnote-definition">)";
                out_ += R"(<a href="#footnote_)" + label + R"(" class="footnote-reference">[)" + label + "]</a>";
                out_ += R"(<span class="footnote-content" id="footnote_)" + label + R"(">)";
                break;
            }

            case syntax_kind::timestamp_active:
            case syntax_kind::timestamp_inactive:
            case syntax_kind::timestamp_diary:
                render_timestamp(node);
                break;

            case syntax_kind::entity:
                out_ += entity_view{ { node } }.html();
                break;

            case syntax_kind::snippet:
            {
                snippet_view s{ { node } };
                if (detail::iequals(s.backend(), "html"))
                    out_ += s.value();
                break;
            }

            case syntax_kind::line_break:      out_ += "<br/>"; break;
            case syntax_kind::rule:            out_ += "<hr/>"; break;
            case syntax_kind::target:          out_ += R"(<a id=")" + html_escape(target_view{ { node } }.value()) + R"("></a>)"; break;
            case syntax_kind::inline_src:      out_ += "<code>" + html_escape(inline_src_view{ { node } }.body()) + "</code>"; break;
            case syntax_kind::cookie:          out_ += html_escape(node.text()); break;
            case syntax_kind::latex_fragment:  out_ += html_escape(node.text()); break;
            case syntax_kind::latex_environment: out_ += html_escape(latex_environment_view{ { node } }.value()); break;

            default:
                break;
        }
    }

//========================================================================
// Document integration
//========================================================================

    inline std::string document::to_html() const
    {
        html_export h;
        h.render(root());
        return h.finish();
    }

} // namespace orgdoc

#endif // ORGDOC_HTML_HPP
