// orgdoc_markdown.hpp - Orgdoc - Markdown export
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// CommonMark-flavoured output through the same traversal protocol as the
// HTML exporter. Org constructs without a Markdown counterpart either pass
// their content through (drawers, center and special blocks) or fall back
// to inline HTML (sub- and superscripts).

#ifndef ORGDOC_MARKDOWN_HPP
#define ORGDOC_MARKDOWN_HPP

#include "orgdoc_document.hpp"

namespace orgdoc
{
//========================================================================
// MARKDOWN API
//========================================================================

    class markdown_export : public traversal_handler
    {
    public:
        void render(syntax_node const & node)
        {
            traversal_context ctx;
            walk(node, *this, ctx);
        }

        std::string const & output() const noexcept { return out_; }
        std::string finish() { return std::move(out_); }

        void enter(container const & c, traversal_context & ctx) override;
        void leave(container const & c, traversal_context & ctx) override;

        void text(syntax_token const & t, traversal_context &) override { out_ += t.text(); }

        void timestamp(timestamp_view const & v, traversal_context &) override { out_ += v.raw(); }
        void entity(entity_view const & v, traversal_context &) override { out_ += v.utf8(); }
        void line_break(line_break_view const &, traversal_context &) override { out_ += "  \n"; }
        void rule(rule_view const &, traversal_context &) override { out_ += "-----\n\n"; }
        void latex_fragment(latex_fragment_view const & v, traversal_context &) override { out_ += v.value(); }
        void latex_environment(latex_environment_view const & v, traversal_context &) override { out_ += v.value() + "\n"; }
        void cookie(cookie_view const & v, traversal_context &) override { out_ += v.raw(); }
        void inline_src(inline_src_view const & v, traversal_context &) override { out_ += "`" + v.body() + "`"; }

        void snippet(snippet_view const & v, traversal_context &) override
        {
            if (detail::iequals(v.backend(), "markdown") || detail::iequals(v.backend(), "md"))
                out_ += v.value();
        }

    private:
        struct list_state
        {
            bool   ordered = false;
            size_t counter = 0;
        };

        std::string             out_;
        std::vector<list_state> lists_;
        std::vector<size_t>     quote_starts_;
        bool                    first_row_ = true;

        void trim_newlines()
        {
            while (!out_.empty() && out_.back() == '\n')
                out_.pop_back();
        }

        void block_end()
        {
            trim_newlines();
            out_ += lists_.empty() ? "\n\n" : "\n";
        }
    };

    // Convenience for whole documents.
    inline std::string to_markdown(document const & doc)
    {
        markdown_export md;
        md.render(doc.root());
        return md.finish();
    }

//========================================================================
// Implementation
//========================================================================

    inline void markdown_export::enter(container const & c, traversal_context & ctx)
    {
        auto const & node = container_node(c);
        switch (node.kind())
        {
            case syntax_kind::headline:
            {
                headline_view h{ { node } };
                out_ += std::string(std::min<size_t>(h.level(), 6), '#') + " ";
                if (auto t = h.title_node())
                    walk(*t, *this, ctx);
                out_ += "\n\n";
                break;
            }

            case syntax_kind::bold:      out_ += "**"; break;
            case syntax_kind::italic:    out_ += "*"; break;
            case syntax_kind::underline: out_ += "_"; break;
            case syntax_kind::strike:    out_ += "~~"; break;
            case syntax_kind::verbatim:
            case syntax_kind::code:      out_ += "`"; break;
            case syntax_kind::superscript: out_ += "<sup>"; break;
            case syntax_kind::subscript:   out_ += "<sub>"; break;

            case syntax_kind::link:
            {
                link_view l{ { node } };
                if (l.is_image() && !l.has_description())
                {
                    out_ += "![](" + l.path() + ")";
                    ctx.skip();
                }
                else if (!l.has_description())
                {
                    out_ += "<" + l.path() + ">";
                    ctx.skip();
                }
                else
                    out_ += "[";
                break;
            }

            case syntax_kind::list:
                lists_.push_back({ list_view{ { node } }.is_ordered(), 0 });
                break;

            case syntax_kind::list_item:
            {
                auto & l = lists_.back();
                out_ += std::string((lists_.size() - 1) * 2, ' ');
                out_ += l.ordered ? std::to_string(++l.counter) + ". " : "- ";
                list_item_view item{ { node } };
                if (auto cb = item.checkbox())
                    out_ += *cb == checkbox_state::checked ? "[x] " : "[ ] ";
                if (auto t = node.first_child(syntax_kind::list_item_tag))
                {
                    out_ += "**";
                    walk(*t, *this, ctx);
                    out_ += "** ";
                }
                break;
            }

            case syntax_kind::org_table:
                first_row_ = true;
                break;
            case syntax_kind::org_table_rule_row:
                ctx.skip();
                break;
            case syntax_kind::org_table_standard_row:
                out_ += "|";
                break;
            case syntax_kind::org_table_cell:
                out_ += " ";
                break;

            case syntax_kind::source_block:
                out_ += "```" + source_block_view{ { node } }.language().value_or("") + "\n";
                break;
            case syntax_kind::example_block:
                out_ += "```\n";
                break;
            case syntax_kind::fixed_width:
                out_ += "```\n" + fixed_width_view{ { node } }.value() + "```\n\n";
                ctx.skip();
                break;

            case syntax_kind::quote_block:
                quote_starts_.push_back(out_.size());
                break;

            case syntax_kind::export_block:
            {
                export_block_view b{ { node } };
                auto type = b.type().value_or("");
                if (detail::iequals(type, "markdown") || detail::iequals(type, "md"))
                    out_ += b.value();
                ctx.skip();
                break;
            }

            case syntax_kind::comment:
            case syntax_kind::comment_block:
                ctx.skip();
                break;

            case syntax_kind::fn_ref:
            {
                fn_ref_view f{ { node } };
                if (auto label = f.label())
                    out_ += "[^" + *label + "]";
                ctx.skip();
                break;
            }
            case syntax_kind::fn_def:
                out_ += "[^" + fn_def_view{ { node } }.label() + "]: ";
                break;

            default:
                break;
        }
    }

//---------------------------------------------------------------------------

    inline void markdown_export::leave(container const & c, traversal_context &)
    {
        auto const & node = container_node(c);
        switch (node.kind())
        {
            case syntax_kind::bold:      out_ += "**"; break;
            case syntax_kind::italic:    out_ += "*"; break;
            case syntax_kind::underline: out_ += "_"; break;
            case syntax_kind::strike:    out_ += "~~"; break;
            case syntax_kind::verbatim:
            case syntax_kind::code:      out_ += "`"; break;
            case syntax_kind::superscript: out_ += "</sup>"; break;
            case syntax_kind::subscript:   out_ += "</sub>"; break;

            case syntax_kind::link:
                out_ += "](" + link_view{ { node } }.path() + ")";
                break;

            case syntax_kind::paragraph:
            case syntax_kind::verse_block:
                block_end();
                break;

            case syntax_kind::list:
                lists_.pop_back();
                if (lists_.empty())
                    out_ += "\n";
                break;

            case syntax_kind::org_table_cell:
                out_ += " |";
                break;
            case syntax_kind::org_table_standard_row:
            {
                out_ += "\n";
                if (first_row_)
                {
                    first_row_ = false;
                    out_ += "|";
                    size_t cols = table_view{ { *node.parent() } }.column_count();
                    for (size_t i = 0; i < cols; ++i)
                        out_ += "---|";
                    out_ += "\n";
                }
                break;
            }
            case syntax_kind::org_table:
                out_ += "\n";
                break;

            case syntax_kind::source_block:
            case syntax_kind::example_block:
                out_ += "```\n\n";
                break;

            case syntax_kind::quote_block:
            {
                size_t start = quote_starts_.back();
                quote_starts_.pop_back();

                // Blocks inside the quote may have trimmed newlines that were
                // written before it.
                start = std::min(start, out_.size());
                while (out_.size() > start && out_.back() == '\n')
                    out_.pop_back();
                std::string body = out_.substr(start);
                out_.resize(start);
                if (body.empty())
                    break;
                size_t pos = 0;
                while (pos < body.size())
                {
                    size_t nl = body.find('\n', pos);
                    auto line = body.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
                    out_ += line.empty() ? ">" : "> " + line;
                    out_ += "\n";
                    pos = nl == std::string::npos ? body.size() : nl + 1;
                }
                out_ += "\n";
                break;
            }

            case syntax_kind::fn_def:
                out_ += "\n";
                break;

            default:
                break;
        }
    }

} // namespace orgdoc

#endif // ORGDOC_MARKDOWN_HPP
