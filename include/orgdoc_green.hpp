// orgdoc_green.hpp - Orgdoc - Immutable storage tree
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// The "green" tree is the storage layer of a document version. Elements know
// their kind and their width in bytes, never their absolute position, so a
// subtree can be shared unchanged by every version that contains it.

#ifndef ORGDOC_GREEN_HPP
#define ORGDOC_GREEN_HPP

#include "orgdoc_core.hpp"
#include "orgdoc_syntax_kind.hpp"

#include <memory>
#include <variant>

namespace orgdoc
{
    struct green_token;
    class  green_node;

    using green_token_ptr = std::shared_ptr<const green_token>;
    using green_node_ptr  = std::shared_ptr<const green_node>;
    using green_element   = std::variant<green_node_ptr, green_token_ptr>;

//========================================================================
// Tokens
//========================================================================

    struct green_token
    {
        syntax_kind kind;
        std::string text;

        size_t width() const noexcept { return text.size(); }
    };

//========================================================================
// Nodes
//========================================================================

    class green_node
    {
    public:
        green_node(syntax_kind kind, std::vector<green_element> children);

        syntax_kind kind() const noexcept { return kind_; }
        size_t width() const noexcept { return width_; }

        std::vector<green_element> const & children() const noexcept { return children_; }
        size_t child_count() const noexcept { return children_.size(); }

        void write_to(std::string & out) const;
        std::string text() const;

        // Path-copy helpers: return a new node, leave this one untouched.
        green_node_ptr with_child(size_t index, green_element replacement) const;
        green_node_ptr with_children(size_t first, size_t last, std::vector<green_element> replacement) const;

    private:
        syntax_kind                kind_;
        size_t                     width_ = 0;
        std::vector<green_element> children_;
    };

//========================================================================
// Element helpers
//========================================================================

    inline bool is_node(green_element const & e) noexcept
    {
        return std::holds_alternative<green_node_ptr>(e);
    }

    inline syntax_kind kind_of(green_element const & e) noexcept
    {
        if (auto n = std::get_if<green_node_ptr>(&e))
            return (*n)->kind();
        return std::get<green_token_ptr>(e)->kind;
    }

    inline size_t width_of(green_element const & e) noexcept
    {
        if (auto n = std::get_if<green_node_ptr>(&e))
            return (*n)->width();
        return std::get<green_token_ptr>(e)->width();
    }

    inline green_token_ptr make_token(syntax_kind kind, std::string_view text)
    {
        return std::make_shared<const green_token>(green_token{ kind, std::string(text) });
    }

    inline green_node_ptr make_node(syntax_kind kind, std::vector<green_element> children)
    {
        return std::make_shared<const green_node>(kind, std::move(children));
    }

//========================================================================
// green_node implementation
//========================================================================

    inline green_node::green_node(syntax_kind kind, std::vector<green_element> children)
        : kind_(kind)
        , children_(std::move(children))
    {
        for (auto const & c : children_)
            width_ += width_of(c);
    }

    inline void green_node::write_to(std::string & out) const
    {
        for (auto const & c : children_)
        {
            if (auto n = std::get_if<green_node_ptr>(&c))
                (*n)->write_to(out);
            else
                out += std::get<green_token_ptr>(c)->text;
        }
    }

    inline std::string green_node::text() const
    {
        std::string out;
        out.reserve(width_);
        write_to(out);
        return out;
    }

    inline green_node_ptr green_node::with_child(size_t index, green_element replacement) const
    {
        std::vector<green_element> kids = children_;
        kids.at(index) = std::move(replacement);
        return make_node(kind_, std::move(kids));
    }

    inline green_node_ptr green_node::with_children(size_t first, size_t last, std::vector<green_element> replacement) const
    {
        std::vector<green_element> kids;
        kids.reserve(children_.size() - (last - first) + replacement.size());
        kids.insert(kids.end(), children_.begin(), children_.begin() + static_cast<std::ptrdiff_t>(first));
        for (auto & r : replacement)
            kids.push_back(std::move(r));
        kids.insert(kids.end(), children_.begin() + static_cast<std::ptrdiff_t>(last), children_.end());
        return make_node(kind_, std::move(kids));
    }

//========================================================================
// Builder
//========================================================================

    // Accumulates the children of one node. Empty texts are dropped so that
    // no zero-width token ever enters a tree.
    struct node_builder
    {
        std::vector<green_element> children;

        void push(green_element e)
        {
            children.push_back(std::move(e));
        }

        void push_if(std::optional<green_element> e)
        {
            if (e)
                children.push_back(std::move(*e));
        }

        void extend(std::vector<green_element> elems)
        {
            for (auto & e : elems)
                children.push_back(std::move(e));
        }

        void token(syntax_kind kind, std::string_view text)
        {
            if (!text.empty())
                children.push_back(make_token(kind, text));
        }

        void text(std::string_view s) { token(syntax_kind::text, s); }
        void ws(std::string_view s)   { token(syntax_kind::whitespace, s); }
        void nl(std::string_view s)   { token(syntax_kind::new_line, s); }

        bool empty() const noexcept { return children.empty(); }

        green_node_ptr finish(syntax_kind kind)
        {
            return make_node(kind, std::move(children));
        }
    };

} // namespace orgdoc

#endif // ORGDOC_GREEN_HPP
