// orgdoc_syntax.hpp - Orgdoc - Positional syntax tree
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// syntax_node and syntax_token are cheap cursors over the green tree. They
// carry the absolute offset and the parent chain, which the green tree does
// not store. A cursor keeps its whole tree version alive.

#ifndef ORGDOC_SYNTAX_HPP
#define ORGDOC_SYNTAX_HPP

#include "orgdoc_green.hpp"

namespace orgdoc
{
    class syntax_node;
    class syntax_token;

    using syntax_element = std::variant<syntax_node, syntax_token>;

    namespace detail
    {
        struct red_data
        {
            green_node_ptr                  green;
            std::shared_ptr<const red_data> parent;
            size_t                          index  = 0;   // position among the parent's children
            size_t                          offset = 0;   // absolute start
        };
    }

//========================================================================
// Nodes
//========================================================================

    class syntax_node
    {
    public:
        static syntax_node new_root(green_node_ptr green);

        syntax_kind kind() const noexcept { return data_->green->kind(); }

        text_range range() const noexcept { return { data_->offset, data_->offset + data_->green->width() }; }
        size_t start() const noexcept { return data_->offset; }
        size_t end() const noexcept { return data_->offset + data_->green->width(); }
        size_t width() const noexcept { return data_->green->width(); }

        std::string text() const { return data_->green->text(); }

        green_node_ptr const & green() const noexcept { return data_->green; }

        std::optional<syntax_node> parent() const;
        size_t index_in_parent() const noexcept { return data_->index; }
        syntax_node root() const;

        // Direct children
        std::vector<syntax_element> children_with_tokens() const;
        std::vector<syntax_node>    children() const;

        std::optional<syntax_node>  first_child(syntax_kind k) const;
        std::optional<syntax_node>  last_child(syntax_kind k) const;
        std::optional<syntax_token> first_token(syntax_kind k) const;

        std::optional<syntax_node>  next_sibling() const;
        std::optional<syntax_node>  prev_sibling() const;

        // Every token below this node, in document order.
        std::vector<syntax_token> descendant_tokens() const;

        // Every node below this node (including itself), pre-order.
        std::vector<syntax_node> descendants() const;

        std::optional<syntax_token> token_at_offset(size_t offset) const;

        // Builds the root of a new tree version in which this node is
        // replaced by `replacement`. Only the path to the root is copied.
        green_node_ptr replace_with(green_node_ptr replacement) const;

        bool operator==(syntax_node const & o) const noexcept
        {
            return data_->green == o.data_->green && data_->offset == o.data_->offset;
        }

    private:
        explicit syntax_node(std::shared_ptr<const detail::red_data> d) : data_(std::move(d)) {}

        std::shared_ptr<const detail::red_data> data_;

        friend class syntax_token;
    };

//========================================================================
// Tokens
//========================================================================

    class syntax_token
    {
    public:
        syntax_kind kind() const noexcept { return green_->kind; }

        std::string_view text() const noexcept { return green_->text; }

        text_range range() const noexcept { return { offset_, offset_ + green_->width() }; }
        size_t start() const noexcept { return offset_; }
        size_t end() const noexcept { return offset_ + green_->width(); }

        green_token_ptr const & green() const noexcept { return green_; }

        syntax_node parent() const { return syntax_node(parent_); }
        size_t index_in_parent() const noexcept { return index_; }

        bool operator==(syntax_token const & o) const noexcept
        {
            return green_ == o.green_ && offset_ == o.offset_;
        }

    private:
        syntax_token(green_token_ptr g, std::shared_ptr<const detail::red_data> p, size_t index, size_t offset)
            : green_(std::move(g)), parent_(std::move(p)), index_(index), offset_(offset)
        {}

        green_token_ptr                         green_;
        std::shared_ptr<const detail::red_data> parent_;
        size_t                                  index_  = 0;
        size_t                                  offset_ = 0;

        friend class syntax_node;
    };

//========================================================================
// Element helpers
//========================================================================

    inline syntax_kind kind_of(syntax_element const & e) noexcept
    {
        return std::visit([](auto const & x) { return x.kind(); }, e);
    }

    inline text_range range_of(syntax_element const & e) noexcept
    {
        return std::visit([](auto const & x) { return x.range(); }, e);
    }

    inline std::string text_of(syntax_element const & e)
    {
        if (auto n = std::get_if<syntax_node>(&e))
            return n->text();
        return std::string(std::get<syntax_token>(e).text());
    }

    inline std::optional<syntax_node> as_node(syntax_element const & e)
    {
        if (auto n = std::get_if<syntax_node>(&e))
            return *n;
        return std::nullopt;
    }

    inline std::optional<syntax_token> as_token(syntax_element const & e)
    {
        if (auto t = std::get_if<syntax_token>(&e))
            return *t;
        return std::nullopt;
    }

//========================================================================
// syntax_node implementation
//========================================================================

    inline syntax_node syntax_node::new_root(green_node_ptr green)
    {
        auto d = std::make_shared<detail::red_data>();
        d->green = std::move(green);
        return syntax_node(std::move(d));
    }

//---------------------------------------------------------------------------

    inline std::optional<syntax_node> syntax_node::parent() const
    {
        if (!data_->parent)
            return std::nullopt;
        return syntax_node(data_->parent);
    }

//---------------------------------------------------------------------------

    inline syntax_node syntax_node::root() const
    {
        auto d = data_;
        while (d->parent)
            d = d->parent;
        return syntax_node(d);
    }

//---------------------------------------------------------------------------

    inline std::vector<syntax_element> syntax_node::children_with_tokens() const
    {
        std::vector<syntax_element> out;
        auto const & kids = data_->green->children();
        out.reserve(kids.size());

        size_t offset = data_->offset;
        for (size_t i = 0; i < kids.size(); ++i)
        {
            if (auto n = std::get_if<green_node_ptr>(&kids[i]))
            {
                auto d = std::make_shared<detail::red_data>();
                d->green  = *n;
                d->parent = data_;
                d->index  = i;
                d->offset = offset;
                out.push_back(syntax_node(std::move(d)));
            }
            else
            {
                out.push_back(syntax_token(std::get<green_token_ptr>(kids[i]), data_, i, offset));
            }
            offset += width_of(kids[i]);
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::vector<syntax_node> syntax_node::children() const
    {
        std::vector<syntax_node> out;
        auto const & kids = data_->green->children();

        size_t offset = data_->offset;
        for (size_t i = 0; i < kids.size(); ++i)
        {
            if (auto n = std::get_if<green_node_ptr>(&kids[i]))
            {
                auto d = std::make_shared<detail::red_data>();
                d->green  = *n;
                d->parent = data_;
                d->index  = i;
                d->offset = offset;
                out.push_back(syntax_node(std::move(d)));
            }
            offset += width_of(kids[i]);
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::optional<syntax_node> syntax_node::first_child(syntax_kind k) const
    {
        for (auto & c : children())
            if (c.kind() == k)
                return c;
        return std::nullopt;
    }

    inline std::optional<syntax_node> syntax_node::last_child(syntax_kind k) const
    {
        std::optional<syntax_node> found;
        for (auto & c : children())
            if (c.kind() == k)
                found = c;
        return found;
    }

    inline std::optional<syntax_token> syntax_node::first_token(syntax_kind k) const
    {
        for (auto & c : children_with_tokens())
            if (auto t = std::get_if<syntax_token>(&c); t && t->kind() == k)
                return *t;
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline std::optional<syntax_node> syntax_node::next_sibling() const
    {
        auto p = parent();
        if (!p)
            return std::nullopt;

        auto kids = p->children_with_tokens();
        for (size_t i = data_->index + 1; i < kids.size(); ++i)
            if (auto n = std::get_if<syntax_node>(&kids[i]))
                return *n;
        return std::nullopt;
    }

    inline std::optional<syntax_node> syntax_node::prev_sibling() const
    {
        auto p = parent();
        if (!p)
            return std::nullopt;

        auto kids = p->children_with_tokens();
        for (size_t i = data_->index; i-- > 0; )
            if (auto n = std::get_if<syntax_node>(&kids[i]))
                return *n;
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline std::vector<syntax_token> syntax_node::descendant_tokens() const
    {
        std::vector<syntax_token>   out;
        std::vector<syntax_element> stack { *this };

        while (!stack.empty())
        {
            syntax_element e = std::move(stack.back());
            stack.pop_back();

            if (auto t = std::get_if<syntax_token>(&e))
            {
                out.push_back(*t);
                continue;
            }

            auto kids = std::get<syntax_node>(e).children_with_tokens();
            for (size_t i = kids.size(); i-- > 0; )
                stack.push_back(std::move(kids[i]));
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::vector<syntax_node> syntax_node::descendants() const
    {
        std::vector<syntax_node> out;
        std::vector<syntax_node> stack { *this };

        while (!stack.empty())
        {
            syntax_node n = stack.back();
            stack.pop_back();
            out.push_back(n);

            auto kids = n.children();
            for (size_t i = kids.size(); i-- > 0; )
                stack.push_back(kids[i]);
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::optional<syntax_token> syntax_node::token_at_offset(size_t offset) const
    {
        if (!range().contains(offset))
            return std::nullopt;

        syntax_node cur = *this;
        for (;;)
        {
            bool descended = false;
            for (auto & c : cur.children_with_tokens())
            {
                if (!range_of(c).contains(offset))
                    continue;
                if (auto t = std::get_if<syntax_token>(&c))
                    return *t;
                cur = std::get<syntax_node>(c);
                descended = true;
                break;
            }
            if (!descended)
                return std::nullopt;
        }
    }

//---------------------------------------------------------------------------

    inline green_node_ptr syntax_node::replace_with(green_node_ptr replacement) const
    {
        green_node_ptr current = std::move(replacement);
        auto d = data_;
        while (d->parent)
        {
            current = d->parent->green->with_child(d->index, current);
            d = d->parent;
        }
        return current;
    }

} // namespace orgdoc

#endif // ORGDOC_SYNTAX_HPP
