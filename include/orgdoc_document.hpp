// orgdoc_document.hpp - Orgdoc - Document
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// A document owns the newest tree version and the configuration it was
// parsed with. Everything else (views, cursors, exports) is derived from
// root() on demand. Editing goes through orgdoc::editor.

#ifndef ORGDOC_DOCUMENT_HPP
#define ORGDOC_DOCUMENT_HPP

#include "orgdoc_parser.hpp"
#include "orgdoc_traverse.hpp"

namespace orgdoc
{
    class editor;

    class document
    {
    public:
        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        document()
            : document(std::string_view{}, parse_config{})
        {}

        document(std::string_view text, parse_config cfg)
            : config_(std::move(cfg))
        {
            green_ = parse_green(text, config_);
        }

        //------------------------------------------------------------------------
        // Tree access
        //------------------------------------------------------------------------

        // Positional root of the newest version. Nodes taken from an older
        // root keep that version alive and keep reporting its text.
        syntax_node root() const { return syntax_node::new_root(green_); }

        document_view view() const { return { { root() } }; }

        green_node_ptr const & green() const noexcept { return green_; }
        parse_config const & config() const noexcept { return config_; }

        size_t size() const noexcept { return green_->width(); }

        // Number of edits applied since parsing.
        size_t version() const noexcept { return version_; }

        //------------------------------------------------------------------------
        // Queries
        //------------------------------------------------------------------------

        // First node of type V in document order.
        template <typename V>
        std::optional<V> first_node() const;

        // Every node of type V in document order.
        template <typename V>
        std::vector<V> find_nodes() const;

        // Outermost node of type V covering `offset`.
        template <typename V>
        std::optional<V> node_at_offset(size_t offset) const;

        std::optional<std::string> title() const { return view().title(); }
        std::vector<keyword_view> keywords() const { return view().keywords(); }
        std::optional<property_drawer_view> properties() const { return view().properties(); }

        //------------------------------------------------------------------------
        // Output
        //------------------------------------------------------------------------

        std::string to_org() const { return green_->text(); }

        // Defined in orgdoc_html.hpp
        std::string to_html() const;

        void traverse(traversal_handler & h) const { orgdoc::traverse(root(), h); }

    private:
        green_node_ptr green_;
        parse_config   config_;
        size_t         version_ = 0;

        friend class editor;
    };

//========================================================================
// Entry point
//========================================================================

    inline document parse(std::string_view text, parse_config cfg = {})
    {
        return document(text, std::move(cfg));
    }

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        // Structural walk collecting nodes of type V; stops at the first one
        // when `first_only` is set.
        template <typename V>
        class node_collector : public traversal_handler
        {
        public:
            explicit node_collector(bool first_only) : first_only_(first_only) {}

            bool wants_nodes() const override { return true; }

            void node(syntax_node const & n, traversal_context & ctx) override
            {
                auto v = as<V>(n);
                if (!v)
                    return;
                found.push_back(std::move(*v));
                if (first_only_)
                    ctx.stop();
            }

            std::vector<V> found;

        private:
            bool first_only_;
        };
    }

    template <typename V>
    std::optional<V> document::first_node() const
    {
        detail::node_collector<V> c(true);
        orgdoc::traverse(root(), c);
        if (c.found.empty())
            return std::nullopt;
        return std::move(c.found.front());
    }

    template <typename V>
    std::vector<V> document::find_nodes() const
    {
        detail::node_collector<V> c(false);
        orgdoc::traverse(root(), c);
        return std::move(c.found);
    }

//---------------------------------------------------------------------------

    template <typename V>
    std::optional<V> document::node_at_offset(size_t offset) const
    {
        std::optional<syntax_node> n = root();
        while (n && n->range().contains(offset))
        {
            if (auto v = as<V>(*n))
                return v;

            std::optional<syntax_node> next;
            for (auto const & c : n->children())
            {
                if (c.range().contains(offset))
                {
                    next = c;
                    break;
                }
            }
            n = next;
        }
        return std::nullopt;
    }

} // namespace orgdoc

#endif // ORGDOC_DOCUMENT_HPP
