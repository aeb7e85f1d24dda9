#ifndef ORGDOC_TESTS_SYNTAX__
#define ORGDOC_TESTS_SYNTAX__

#include "orgdoc_test_harness.hpp"
#include "../include/orgdoc_document.hpp"

namespace orgdoc::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    // Tokens tile the buffer: no gaps, no overlaps, no empty tokens.
    inline bool tokens_tile(document const & doc)
    {
        size_t at = 0;
        for (auto const & t : doc.root().descendant_tokens())
        {
            if (t.start() != at || t.text().empty())
                return false;
            at = t.end();
        }
        return at == doc.size();
    }

    // Every node's children are contiguous and exactly cover the node.
    inline bool children_nest(document const & doc)
    {
        for (auto const & n : doc.root().descendants())
        {
            size_t at = n.start();
            for (auto const & c : n.children_with_tokens())
            {
                if (range_of(c).start != at)
                    return false;
                at = range_of(c).end;
            }
            if (at != n.end())
                return false;
        }
        return true;
    }

    inline constexpr std::string_view syntax_samples[] =
    {
        "",
        "\n\n",
        "no newline at end",
        "* a\r\n** b\r\nbody\r\n",
        "* TODO [#B] Task :work:\nSCHEDULED: <2024-01-01 Mon>\n:PROPERTIES:\n:ID: 1\n:END:\n\nbody\n",
        "#+begin_src c\nint x;\n",
        "#+begin_quote\n*quoted*\n#+end_quote\n",
        "| a | b\n|--\n| 1 |\n",
        "- a\n  - b\n\n\n- c",
        ":PROPERTIES:\n:ID: 1\n",
        "\\begin{equation}\nx^2\n\\end{equation}\n",
        "[fn:1] note\n\n[fn:2]\n",
        "CLOCK: [2024-01-01 Mon 10:00]--[2024-01-01 Mon 11:00] =>  1:00\n",
        "*bold /it/ ~code~* and [[https://x.org][x]]",
        "text\t\ttabs  \n   \n\t\n",
        "#+CAPTION: A table\n#+NAME: t1\n| x |\n",
        ": fixed\n: width\n# comment\n-----\n",
    };

//------------------------------------------
// TESTS
//------------------------------------------

static bool syntax_round_trips_varied_sources()
{
    for (auto src : syntax_samples)
    {
        auto doc = parse(src);
        EXPECT(doc.to_org() == src, "printed tree differs from source");
        EXPECT(doc.size() == src.size(), "root width differs from source length");
    }
    return true;
}

static bool syntax_tokens_cover_buffer_without_gaps()
{
    for (auto src : syntax_samples)
    {
        auto doc = parse(src);
        EXPECT(tokens_tile(doc), "tokens do not tile the buffer");
    }
    return true;
}

static bool syntax_children_nest_inside_parents()
{
    for (auto src : syntax_samples)
    {
        auto doc = parse(src);
        EXPECT(children_nest(doc), "child ranges do not cover parent range");
    }
    return true;
}

static bool syntax_empty_document_is_bare_root()
{
    auto doc = parse("");
    EXPECT(doc.root().kind() == syntax_kind::document, "root is not a document");
    EXPECT(doc.root().children_with_tokens().empty(), "empty source produced children");
    EXPECT(doc.size() == 0, "empty source has non-zero width");
    return true;
}

static bool syntax_token_at_offset_finds_title_text()
{
    auto doc = parse("* abc\n");

    auto t = doc.root().token_at_offset(3);
    EXPECT(t.has_value(), "no token at offset 3");
    EXPECT(t->kind() == syntax_kind::text, "token is not text");
    EXPECT(t->text() == "abc", "wrong token text");
    EXPECT(t->parent().kind() == syntax_kind::headline_title, "token parent is not the title");

    auto stars = doc.root().token_at_offset(0);
    EXPECT(stars && stars->kind() == syntax_kind::headline_stars, "offset 0 is not the stars");
    return true;
}

static bool syntax_parent_and_sibling_navigation()
{
    auto doc = parse("* a\n* b\n* c\n");
    auto hs = doc.root().children();
    EXPECT(hs.size() == 3, "expected three headlines");

    auto b = hs[1];
    EXPECT(b.index_in_parent() == 1, "wrong index in parent");
    EXPECT(b.parent() && b.parent()->kind() == syntax_kind::document, "parent is not the document");
    EXPECT(b.prev_sibling() && *b.prev_sibling() == hs[0], "wrong previous sibling");
    EXPECT(b.next_sibling() && *b.next_sibling() == hs[2], "wrong next sibling");
    EXPECT(!hs[0].prev_sibling(), "first headline has a previous sibling");
    EXPECT(!hs[2].next_sibling(), "last headline has a next sibling");
    EXPECT(b.root() == doc.root(), "root() does not reach the document");
    return true;
}

static bool syntax_first_child_and_token_lookups()
{
    auto doc = parse("** Title :tag:\n");
    auto h = doc.root().first_child(syntax_kind::headline);
    EXPECT(h.has_value(), "no headline child");
    EXPECT(h->first_child(syntax_kind::headline_tags).has_value(), "no tags child");
    EXPECT(!h->first_child(syntax_kind::section).has_value(), "unexpected section");

    auto stars = h->first_token(syntax_kind::headline_stars);
    EXPECT(stars && stars->text() == "**", "wrong stars token");
    EXPECT(!h->first_token(syntax_kind::headline_keyword_todo), "unexpected keyword token");
    return true;
}

static bool syntax_replace_with_shares_untouched_subtrees()
{
    auto doc = parse("* a\n* b\n* c\n");
    auto old_root = doc.green();
    auto second = doc.root().children()[1];

    auto g = parse_headline_green("* B\n", doc.config());
    EXPECT(g.has_value(), "replacement headline did not parse");

    auto new_root = second.replace_with(*g);
    EXPECT(new_root->text() == "* a\n* B\n* c\n", "wrong text after replacement");
    EXPECT(old_root->text() == "* a\n* b\n* c\n", "old root changed");

    auto const & oldk = old_root->children();
    auto const & newk = new_root->children();
    EXPECT(std::get<green_node_ptr>(oldk[0]) == std::get<green_node_ptr>(newk[0]), "first headline not shared");
    EXPECT(std::get<green_node_ptr>(oldk[2]) == std::get<green_node_ptr>(newk[2]), "last headline not shared");
    EXPECT(std::get<green_node_ptr>(oldk[1]) != std::get<green_node_ptr>(newk[1]), "replaced headline is shared");
    return true;
}

static bool syntax_green_with_child_leaves_original()
{
    auto g = make_node(syntax_kind::paragraph, { make_token(syntax_kind::text, "ab"), make_token(syntax_kind::new_line, "\n") });
    auto h = g->with_child(0, make_token(syntax_kind::text, "xyz"));

    EXPECT(g->text() == "ab\n", "original changed");
    EXPECT(h->text() == "xyz\n", "copy has wrong text");
    EXPECT(h->width() == 4, "copy has wrong width");
    EXPECT(std::get<green_token_ptr>(g->children()[1]) == std::get<green_token_ptr>(h->children()[1]), "untouched token not shared");
    return true;
}

static bool syntax_kind_names_and_classes()
{
    EXPECT(to_string(syntax_kind::headline) == "HEADLINE", "wrong headline name");
    EXPECT(to_string(syntax_kind::org_table_cell) == "ORG_TABLE_CELL", "wrong cell name");
    EXPECT(is_token_kind(syntax_kind::text), "text is not a token kind");
    EXPECT(!is_token_kind(syntax_kind::paragraph), "paragraph is a token kind");
    EXPECT(is_object_kind(syntax_kind::bold), "bold is not an object kind");
    EXPECT(!is_object_kind(syntax_kind::paragraph), "paragraph is an object kind");
    return true;
}

    inline void run_syntax_tests()
    {
        SUBCAT("Losslessness");
        RUN_TEST(syntax_round_trips_varied_sources);
        RUN_TEST(syntax_tokens_cover_buffer_without_gaps);
        RUN_TEST(syntax_children_nest_inside_parents);
        RUN_TEST(syntax_empty_document_is_bare_root);

        SUBCAT("Cursors");
        RUN_TEST(syntax_token_at_offset_finds_title_text);
        RUN_TEST(syntax_parent_and_sibling_navigation);
        RUN_TEST(syntax_first_child_and_token_lookups);

        SUBCAT("Structural sharing");
        RUN_TEST(syntax_replace_with_shares_untouched_subtrees);
        RUN_TEST(syntax_green_with_child_leaves_original);

        SUBCAT("Kinds");
        RUN_TEST(syntax_kind_names_and_classes);
    }

} // ns orgdoc::tests

#endif
