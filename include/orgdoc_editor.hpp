// orgdoc_editor.hpp - Orgdoc - Document Editor
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// Range replacement with incremental re-parsing. The smallest headline that
// contains the edited range is re-parsed on its own and spliced back into
// the tree by path copying; if the new headline would not sit in the same
// place in a full parse, the next enclosing headline is tried, and finally
// the whole document. The resulting tree is always the one a full parse of
// the new text would give.

#ifndef ORGDOC_EDITOR_HPP
#define ORGDOC_EDITOR_HPP

#include "orgdoc_document.hpp"

namespace orgdoc
{
//========================================================================
// Results
//========================================================================

    enum class edit_error_kind
    {
        out_of_bounds   // range not within [0, size]
    };

    using edit_error = error<edit_error_kind>;

    template <typename T>
    using edit_context = context<T, edit_error>;

    struct edit_stats
    {
        bool   incremental    = false;  // false: whole document re-parsed
        size_t reparsed_bytes = 0;
        size_t attempts       = 0;      // headline candidates tried
    };

//========================================================================
// Editor
//========================================================================

    class editor
    {
    public:
        explicit editor(document & doc) noexcept
            : doc_(doc)
        {}

        // Replaces the bytes in `range` with `text`. An empty range inserts,
        // an empty text erases. On error the document is left untouched.
        edit_context<edit_stats> replace_range(text_range range, std::string_view text);

        edit_context<edit_stats> insert(size_t offset, std::string_view text)
        {
            return replace_range({ offset, offset }, text);
        }

        edit_context<edit_stats> erase(text_range range)
        {
            return replace_range(range, {});
        }

    private:
        document & doc_;

        std::optional<green_node_ptr> reparse_headline(syntax_node const & h, text_range range, std::string_view text) const;
        void commit(green_node_ptr root);
    };

    // Value-returning form: `doc` is copied, edited and returned.
    edit_context<document> replace_range(document doc, text_range range, std::string_view text);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline size_t headline_level_of(syntax_node const & n)
        {
            auto h = as<headline_view>(n);
            return h ? h->level() : 0;
        }

        // Innermost-last chain of headlines whose range holds `range`.
        inline std::vector<syntax_node> enclosing_headlines(syntax_node const & root, text_range range)
        {
            std::vector<syntax_node> chain;
            syntax_node cur = root;
            for (;;)
            {
                std::optional<syntax_node> next;
                for (auto & c : cur.children())
                {
                    if (c.kind() == syntax_kind::headline && c.start() <= range.start && range.end <= c.end())
                    {
                        next = c;
                        break;
                    }
                }
                if (!next)
                    return chain;
                chain.push_back(*next);
                cur = *next;
            }
        }

        // First headline that follows `h`'s subtree in document order.
        inline std::optional<syntax_node> following_headline(syntax_node const & h)
        {
            for (std::optional<syntax_node> n = h; n; n = n->parent())
            {
                // Headlines always come last among their parent's children.
                if (auto s = n->next_sibling(); s && s->kind() == syntax_kind::headline)
                    return s;
            }
            return std::nullopt;
        }

        inline bool ends_with_newline(std::string_view s) noexcept
        {
            return !s.empty() && s.back() == '\n';
        }
    }

//========================================================================
// Implementation
//========================================================================

    inline edit_context<edit_stats> editor::replace_range(text_range range, std::string_view text)
    {
        edit_context<edit_stats> ctx;
        size_t const len = doc_.size();

        if (range.start > range.end || range.end > len)
        {
            std::string msg = "range " + std::to_string(range.start) + ".." + std::to_string(range.end)
                            + " is outside the document (size " + std::to_string(len) + ")";
            PLOGW << "orgdoc: edit rejected: " << msg;
            ctx.errors.push_back({ edit_error_kind::out_of_bounds, range, std::move(msg) });
            return ctx;
        }

        auto root  = doc_.root();
        auto chain = detail::enclosing_headlines(root, range);

        for (size_t i = chain.size(); i-- > 0; )
        {
            ++ctx.result.attempts;
            if (auto g = reparse_headline(chain[i], range, text))
            {
                ctx.result.incremental    = true;
                ctx.result.reparsed_bytes = (*g)->width();
                PLOGD << "orgdoc: incremental edit at " << range.start << ".." << range.end
                      << ", re-parsed headline of " << (*g)->width() << " bytes";
                commit(chain[i].replace_with(*g));
                return ctx;
            }
        }

        std::string full = doc_.to_org();
        full.replace(range.start, range.end - range.start, text);

        ctx.result.incremental    = false;
        ctx.result.reparsed_bytes = full.size();
        PLOGD << "orgdoc: full re-parse after edit at " << range.start << ".." << range.end
              << " (" << ctx.result.attempts << " headline candidates rejected)";
        commit(parse_green(full, doc_.config()));
        return ctx;
    }

//---------------------------------------------------------------------------

    inline std::optional<green_node_ptr> editor::reparse_headline(syntax_node const & h, text_range range, std::string_view text) const
    {
        std::string spliced = h.text();
        spliced.replace(range.start - h.start(), range.end - range.start, text);

        auto g = parse_headline_green(spliced, doc_.config());
        if (!g)
            return std::nullopt;

        size_t const level = detail::headline_level_of(syntax_node::new_root(*g));

        auto parent = h.parent();
        if (parent && level <= detail::headline_level_of(*parent))
            return std::nullopt;

        if (auto prev = h.prev_sibling(); prev && prev->kind() == syntax_kind::headline)
            if (level > detail::headline_level_of(*prev))
                return std::nullopt;

        if (auto next = detail::following_headline(h); next && detail::headline_level_of(*next) > level)
            return std::nullopt;

        if (h.end() != doc_.size() && !detail::ends_with_newline(spliced))
            return std::nullopt;

        return g;
    }

//---------------------------------------------------------------------------

    inline void editor::commit(green_node_ptr root)
    {
        doc_.green_ = std::move(root);
        ++doc_.version_;
    }

//---------------------------------------------------------------------------

    inline edit_context<document> replace_range(document doc, text_range range, std::string_view text)
    {
        edit_context<document> out;
        auto r = editor(doc).replace_range(range, text);
        out.errors = std::move(r.errors);
        out.result = std::move(doc);
        return out;
    }

} // namespace orgdoc

#endif // ORGDOC_EDITOR_HPP
