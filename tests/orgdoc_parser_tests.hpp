#ifndef ORGDOC_TESTS_PARSER__
#define ORGDOC_TESTS_PARSER__

#include "orgdoc_test_harness.hpp"
#include "../include/orgdoc_document.hpp"

namespace orgdoc::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline size_t count_kind(syntax_node const & root, syntax_kind k)
    {
        size_t n = 0;
        for (auto const & d : root.descendants())
            if (d.kind() == k)
                ++n;
        return n;
    }

    // Kinds of the first section's elements, in order.
    inline std::vector<syntax_kind> section_kinds(document const & doc)
    {
        std::vector<syntax_kind> out;
        if (auto s = doc.view().section())
            for (auto const & e : s->elements())
                out.push_back(e.kind());
        return out;
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool parser_reads_headline_line_parts()
{
    auto doc = parse("** TODO [#A] Write report :work:urgent:\n");
    auto h = doc.first_node<headline_view>();
    EXPECT(h.has_value(), "no headline");
    EXPECT(h->level() == 2, "wrong level");
    EXPECT(h->todo_keyword() == "TODO", "wrong keyword");
    EXPECT(h->is_todo() && !h->is_done(), "wrong todo type");
    EXPECT(h->priority() == 'A', "wrong priority");
    EXPECT(h->title_raw() == "Write report", "wrong title");

    auto tags = h->tags();
    EXPECT(tags.size() == 2, "wrong tag count");
    EXPECT(tags[0] == "work" && tags[1] == "urgent", "wrong tags");
    return true;
}

static bool parser_recognises_configured_todo_keywords()
{
    auto custom = parse("* TASK Title 1", parse_config::with_todo_keywords({ "TASK" }, {}));
    auto h = custom.first_node<headline_view>();
    EXPECT(h.has_value(), "no headline with custom keywords");
    EXPECT(h->todo_keyword() == "TASK", "custom keyword not recognised");
    EXPECT(h->title_raw() == "Title 1", "keyword left in title");

    auto plain = parse("* TASK Title 1");
    auto p = plain.first_node<headline_view>();
    EXPECT(p.has_value(), "no headline with default keywords");
    EXPECT(!p->todo_keyword().has_value(), "keyword recognised without configuration");
    EXPECT(p->title_raw() == "TASK Title 1", "title lost the word TASK");
    return true;
}

static bool parser_done_keywords_are_distinct()
{
    auto doc = parse("* DONE Finished\n");
    auto h = doc.first_node<headline_view>();
    EXPECT(h && h->is_done(), "DONE not recognised");
    EXPECT(h->todo_type() == todo_type::done, "wrong todo type");
    return true;
}

static bool parser_requires_space_after_stars()
{
    auto doc = parse("*bold*\n** x\n***\n");
    auto hs = doc.find_nodes<headline_view>();
    EXPECT(hs.size() == 1, "expected exactly one headline");
    EXPECT(hs[0].level() == 2, "wrong headline recognised");
    return true;
}

static bool parser_tab_after_stars_is_not_headline()
{
    std::string src = "*\tx\n** \ty\n";
    auto doc = parse(src);
    auto hs = doc.find_nodes<headline_view>();
    EXPECT(hs.size() == 1, "tab opened a headline");
    EXPECT(hs[0].level() == 2 && hs[0].title_raw() == "y", "wrong headline recognised");
    EXPECT(count_kind(doc.root(), syntax_kind::paragraph) == 1, "tab line should be a paragraph");
    EXPECT(doc.to_org() == src, "bytes lost");
    return true;
}

static bool parser_nests_headlines_by_level()
{
    auto doc = parse("* a\n** b\n*** c\n** d\n* e\n");
    auto top = doc.view().headlines();
    EXPECT(top.size() == 2, "wrong top-level count");
    EXPECT(top[0].headlines().size() == 2, "wrong child count under a");
    EXPECT(top[0].headlines()[0].headlines().size() == 1, "c not under b");
    EXPECT(top[1].headlines().empty(), "e has children");

    auto c = top[0].headlines()[0].headlines()[0];
    EXPECT(c.parent_headline() && c.parent_headline()->title_raw() == "b", "wrong parent of c");
    EXPECT(!top[0].parent_headline(), "top headline has a parent headline");
    return true;
}

static bool parser_shallower_headline_closes_deeper_ones()
{
    auto doc = parse("*** deep\n* shallow\n");
    auto top = doc.view().headlines();
    EXPECT(top.size() == 2, "shallow headline nested under deeper one");
    EXPECT(top[0].level() == 3 && top[1].level() == 1, "wrong levels");
    return true;
}

static bool parser_attaches_planning_and_properties()
{
    constexpr std::string_view src =
        "* Task\n"
        "SCHEDULED: <2024-03-01 Fri> DEADLINE: <2024-03-05 Tue>\n"
        ":PROPERTIES:\n"
        ":ID: 42\n"
        ":TAGS: a\n"
        ":TAGS+: b\n"
        ":END:\n"
        "Body\n";

    auto doc = parse(src);
    auto h = doc.first_node<headline_view>();
    EXPECT(h.has_value(), "no headline");

    EXPECT(h->scheduled() && h->scheduled()->day_start() == 1u, "wrong scheduled day");
    EXPECT(h->deadline() && h->deadline()->day_start() == 5u, "wrong deadline day");
    EXPECT(!h->closed(), "unexpected closed timestamp");

    auto props = h->properties();
    EXPECT(props.has_value(), "no property drawer");
    EXPECT(props->get("id") == "42", "case-insensitive lookup failed");
    EXPECT(props->get("TAGS") == "a b", "appended value not joined");
    EXPECT(!props->get("missing"), "missing key found");

    auto sec = h->section();
    EXPECT(sec && sec->elements().size() == 1, "body not in section");
    return true;
}

static bool parser_planning_must_follow_headline()
{
    auto doc = parse("* Task\nText\nSCHEDULED: <2024-03-01 Fri>\n");
    auto h = doc.first_node<headline_view>();
    EXPECT(h && !h->planning(), "planning recognised away from the headline");
    return true;
}

static bool parser_reads_document_properties_and_keywords()
{
    constexpr std::string_view src =
        ":PROPERTIES:\n"
        ":ID: doc\n"
        ":END:\n"
        "#+TITLE: Hello\n"
        "#+AUTHOR: Someone\n"
        "#+TITLE: World\n";

    auto doc = parse(src);
    EXPECT(doc.properties() && doc.properties()->get("ID") == "doc", "no document properties");

    auto kws = doc.keywords();
    EXPECT(kws.size() == 3, "wrong keyword count");
    EXPECT(kws[1].key() == "AUTHOR" && kws[1].value() == "Someone", "wrong keyword");
    EXPECT(doc.title() == "Hello World", "titles not joined");
    return true;
}

static bool parser_distinguishes_babel_calls()
{
    auto doc = parse("#+CALL: square(x=4)\n");
    auto call = doc.first_node<babel_call_view>();
    EXPECT(call.has_value(), "no babel call");
    EXPECT(call->value() == "square(x=4)", "wrong call value");
    EXPECT(doc.keywords().empty(), "babel call counted as keyword");
    return true;
}

static bool parser_builds_unordered_nested_lists()
{
    auto doc = parse("- one\n- two\n  - nested\n- three\n");
    auto lists = doc.find_nodes<list_view>();
    EXPECT(lists.size() == 2, "wrong list count");

    auto top = lists[0];
    EXPECT(!top.is_ordered(), "list is ordered");
    EXPECT(top.items().size() == 3, "wrong item count");

    auto content = top.items()[1].content();
    EXPECT(content.has_value(), "second item has no content");
    EXPECT(content->first_child(syntax_kind::list).has_value(), "nested list not inside item");
    EXPECT(lists[1].items().size() == 1, "nested list has wrong size");
    EXPECT(lists[1].items()[0].indent() == "  ", "wrong indent");
    return true;
}

static bool parser_reads_list_item_parts()
{
    auto doc = parse("1. [@3] [X] done\n2. [ ] open\n3. [-] half\n");
    auto list = doc.first_node<list_view>();
    EXPECT(list && list->is_ordered(), "ordered list not recognised");

    auto items = list->items();
    EXPECT(items.size() == 3, "wrong item count");
    EXPECT(items[0].bullet() == "1.", "wrong bullet");
    EXPECT(items[0].counter() == "3", "wrong counter");
    EXPECT(items[0].checkbox() == checkbox_state::checked, "wrong checkbox 1");
    EXPECT(items[1].checkbox() == checkbox_state::unchecked, "wrong checkbox 2");
    EXPECT(items[2].checkbox() == checkbox_state::partial, "wrong checkbox 3");
    EXPECT(!items[1].counter(), "unexpected counter");
    return true;
}

static bool parser_reads_descriptive_items()
{
    auto doc = parse("- term :: definition\n- other :: more\n");
    auto list = doc.first_node<list_view>();
    EXPECT(list && list->is_descriptive(), "descriptive list not recognised");
    EXPECT(list->items()[0].tag_raw() == "term", "wrong tag");
    return true;
}

static bool parser_ends_list_at_two_blank_lines()
{
    EXPECT(parse("- a\n\n- b\n").find_nodes<list_view>().size() == 1, "single blank split the list");
    EXPECT(parse("- a\n\n\n- b\n").find_nodes<list_view>().size() == 2, "double blank did not split");
    return true;
}

static bool parser_builds_tables()
{
    constexpr std::string_view src =
        "| Name | Qty |\n"
        "|------+-----|\n"
        "| a    | 1   |\n"
        "| b    | 2   |\n"
        "#+TBLFM: $2=$1*2\n";

    auto doc = parse(src);
    auto t = doc.first_node<table_view>();
    EXPECT(t.has_value(), "no table");
    EXPECT(t->rows().size() == 4, "wrong row count");
    EXPECT(t->row_count() == 3, "wrong standard row count");
    EXPECT(t->column_count() == 2, "wrong column count");
    EXPECT(t->has_header(), "header not detected");

    auto rules = t->rule_positions();
    EXPECT(rules.size() == 1 && rules[0] == 1, "wrong rule position");
    EXPECT(t->cell_text(0, 0) == "Name", "wrong header cell");
    EXPECT(t->cell_text(2, 1) == "2", "wrong body cell");
    EXPECT(!t->cell_text(5, 0), "cell beyond last row");

    auto f = t->formulas();
    EXPECT(f.size() == 1 && f[0] == "$2=$1*2", "wrong formula");
    return true;
}

static bool parser_table_without_rule_has_no_header()
{
    auto t = parse("| a | b |\n| c | d |\n").first_node<table_view>();
    EXPECT(t && !t->has_header(), "header detected without a rule");
    return true;
}

static bool parser_builds_source_blocks()
{
    constexpr std::string_view src =
        "#+begin_src python -n :results output\n"
        "print(1)\n"
        ",* not a headline\n"
        "#+end_src\n";

    auto doc = parse(src);
    auto b = doc.first_node<source_block_view>();
    EXPECT(b.has_value(), "no source block");
    EXPECT(b->language() == "python", "wrong language");
    EXPECT(b->switches() == "-n", "wrong switches");
    EXPECT(b->parameters() == ":results output", "wrong parameters");
    EXPECT(b->value() == "print(1)\n* not a headline\n", "comma escape not removed");
    EXPECT(doc.find_nodes<headline_view>().empty(), "escaped line became a headline");
    return true;
}

static bool parser_parses_greater_block_contents()
{
    auto doc = parse("#+begin_quote\nSome *bold* text\n#+end_quote\n");
    auto q = doc.first_node<quote_block_view>();
    EXPECT(q.has_value(), "no quote block");
    EXPECT(q->content() && q->content()->first_child(syntax_kind::paragraph), "no paragraph in quote");
    EXPECT(count_kind(doc.root(), syntax_kind::bold) == 1, "bold not parsed inside quote");
    return true;
}

static bool parser_reads_special_and_dynamic_blocks()
{
    auto doc = parse("#+begin_warning loud\nCareful\n#+end_warning\n#+BEGIN: clocktable :scope file\n#+END:\n");
    auto sb = doc.first_node<special_block_view>();
    EXPECT(sb && sb->name() == "warning", "wrong special block name");
    EXPECT(sb->parameters() == "loud", "wrong special block parameters");

    auto db = doc.first_node<dyn_block_view>();
    EXPECT(db && db->name() == "clocktable", "wrong dynamic block name");
    EXPECT(db->parameters() == ":scope file", "wrong dynamic block parameters");
    return true;
}

static bool parser_degrades_unterminated_constructs()
{
    auto doc = parse("#+begin_src c\nint x;\n:DRAWER:\nno end\n");
    EXPECT(doc.find_nodes<source_block_view>().empty(), "unterminated block recognised");
    EXPECT(doc.find_nodes<drawer_view>().empty(), "unterminated drawer recognised");
    EXPECT(count_kind(doc.root(), syntax_kind::paragraph) >= 1, "no paragraph fallback");
    EXPECT(doc.to_org() == "#+begin_src c\nint x;\n:DRAWER:\nno end\n", "bytes lost");
    return true;
}

static bool parser_builds_drawers()
{
    auto doc = parse(":LOGBOOK:\nCLOCK: [2024-01-01 Mon 10:00]--[2024-01-01 Mon 11:30] =>  1:30\n:END:\n");
    auto d = doc.first_node<drawer_view>();
    EXPECT(d && d->name() == "LOGBOOK", "wrong drawer name");

    auto c = doc.first_node<clock_view>();
    EXPECT(c.has_value(), "no clock in drawer");
    EXPECT(c->duration() == "1:30", "wrong clock duration");
    EXPECT(!c->is_running(), "closed clock reported running");
    return true;
}

static bool parser_attaches_affiliated_keywords()
{
    auto doc = parse("#+CAPTION: Results\n#+NAME: tbl\n| x |\n");
    EXPECT(doc.keywords().empty(), "affiliated keywords left standalone");

    auto t = doc.first_node<table_view>();
    EXPECT(t.has_value(), "no table");
    EXPECT(t->affiliated().size() == 2, "wrong affiliated count");
    EXPECT(t->name() == "tbl", "wrong name");
    EXPECT(t->caption() == "Results", "wrong caption");
    return true;
}

static bool parser_orphan_affiliated_keyword_is_keyword()
{
    auto doc = parse("#+NAME: lonely\n\nText\n");
    auto kws = doc.keywords();
    EXPECT(kws.size() == 1 && kws[0].key() == "NAME", "orphan affiliated keyword not a keyword");
    return true;
}

static bool parser_classifies_line_elements()
{
    auto doc = parse("# a comment\n: fixed\n-----\n\\begin{align}\nx\n\\end{align}\n[fn:n] Note text\n");
    auto kinds = section_kinds(doc);
    EXPECT(kinds.size() == 5, "wrong element count");
    EXPECT(kinds[0] == syntax_kind::comment, "no comment");
    EXPECT(kinds[1] == syntax_kind::fixed_width, "no fixed width");
    EXPECT(kinds[2] == syntax_kind::rule, "no rule");
    EXPECT(kinds[3] == syntax_kind::latex_environment, "no latex environment");
    EXPECT(kinds[4] == syntax_kind::fn_def, "no footnote definition");

    EXPECT(doc.first_node<comment_view>()->value() == "a comment\n", "wrong comment value");
    EXPECT(doc.first_node<fixed_width_view>()->value() == "fixed\n", "wrong fixed width value");
    EXPECT(doc.first_node<latex_environment_view>()->name() == "align", "wrong environment name");
    EXPECT(doc.first_node<fn_def_view>()->label() == "n", "wrong footnote label");
    return true;
}

static bool parser_splits_paragraphs_at_blank_lines()
{
    auto doc = parse("one\ntwo\n\nthree\n");
    auto ps = doc.find_nodes<paragraph_view>();
    EXPECT(ps.size() == 2, "wrong paragraph count");
    return true;
}

    inline void run_parser_tests()
    {
        SUBCAT("Headlines");
        RUN_TEST(parser_reads_headline_line_parts);
        RUN_TEST(parser_recognises_configured_todo_keywords);
        RUN_TEST(parser_done_keywords_are_distinct);
        RUN_TEST(parser_requires_space_after_stars);
        RUN_TEST(parser_tab_after_stars_is_not_headline);
        RUN_TEST(parser_nests_headlines_by_level);
        RUN_TEST(parser_shallower_headline_closes_deeper_ones);
        RUN_TEST(parser_attaches_planning_and_properties);
        RUN_TEST(parser_planning_must_follow_headline);

        SUBCAT("Zeroth section");
        RUN_TEST(parser_reads_document_properties_and_keywords);
        RUN_TEST(parser_distinguishes_babel_calls);

        SUBCAT("Lists");
        RUN_TEST(parser_builds_unordered_nested_lists);
        RUN_TEST(parser_reads_list_item_parts);
        RUN_TEST(parser_reads_descriptive_items);
        RUN_TEST(parser_ends_list_at_two_blank_lines);

        SUBCAT("Tables");
        RUN_TEST(parser_builds_tables);
        RUN_TEST(parser_table_without_rule_has_no_header);

        SUBCAT("Blocks and drawers");
        RUN_TEST(parser_builds_source_blocks);
        RUN_TEST(parser_parses_greater_block_contents);
        RUN_TEST(parser_reads_special_and_dynamic_blocks);
        RUN_TEST(parser_degrades_unterminated_constructs);
        RUN_TEST(parser_builds_drawers);

        SUBCAT("Other elements");
        RUN_TEST(parser_attaches_affiliated_keywords);
        RUN_TEST(parser_orphan_affiliated_keyword_is_keyword);
        RUN_TEST(parser_classifies_line_elements);
        RUN_TEST(parser_splits_paragraphs_at_blank_lines);
    }

} // ns orgdoc::tests

#endif
