#ifndef ORGDOC_TESTS_TRAVERSE__
#define ORGDOC_TESTS_TRAVERSE__

#include "orgdoc_test_harness.hpp"
#include "../include/orgdoc_traverse.hpp"
#include "../include/orgdoc_document.hpp"

namespace orgdoc::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    // Records every callback as a short line so that tests can compare
    // sequences.
    struct recording_handler : traversal_handler
    {
        std::vector<std::string> events;
        std::string              text_seen;
        bool                     tokens = false;
        size_t                   token_count = 0;

        // Kinds to skip on enter, and the kind that stops the walk.
        std::vector<syntax_kind>   skip_kinds;
        std::optional<syntax_kind> stop_kind;

        bool wants_tokens() const override { return tokens; }

        void enter(container const & c, traversal_context & ctx) override
        {
            auto k = container_kind(c);
            events.push_back("enter " + std::string(to_string(k)));
            if (stop_kind && *stop_kind == k)
                ctx.stop();
            else if (std::find(skip_kinds.begin(), skip_kinds.end(), k) != skip_kinds.end())
                ctx.skip();
        }

        void leave(container const & c, traversal_context &) override
        {
            events.push_back("leave " + std::string(to_string(container_kind(c))));
        }

        void text(syntax_token const & t, traversal_context &) override
        {
            text_seen += t.text();
        }

        void token(syntax_token const &, traversal_context &) override
        {
            ++token_count;
        }

        void timestamp(timestamp_view const &, traversal_context &) override { events.push_back("timestamp"); }
        void entity(entity_view const & e, traversal_context &) override { events.push_back("entity " + std::string(e.name())); }
        void keyword(keyword_view const & k, traversal_context &) override { events.push_back("keyword " + std::string(k.key())); }
        void clock(clock_view const &, traversal_context &) override { events.push_back("clock"); }

        size_t count(std::string_view ev) const
        {
            return static_cast<size_t>(std::count(events.begin(), events.end(), ev));
        }
    };

//------------------------------------------
// TESTS
//------------------------------------------

static bool traverse_counts_only_real_headlines()
{
    auto doc = parse("* 1\n** 2\n*** 3\n****4");
    recording_handler h;
    traverse(doc.root(), h);
    EXPECT(h.count("enter HEADLINE") == 3, "wrong number of headline enters");
    EXPECT(h.count("leave HEADLINE") == 3, "wrong number of headline leaves");
    return true;
}

static bool traverse_enter_and_leave_are_balanced()
{
    auto doc = parse("* a\ntext *b* /c/\n- x\n- y\n| 1 | 2 |\n");
    recording_handler h;
    traverse(doc.root(), h);

    std::vector<std::string> open;
    for (auto const & ev : h.events)
    {
        if (ev.starts_with("enter "))
            open.push_back(ev.substr(6));
        else if (ev.starts_with("leave "))
        {
            EXPECT(!open.empty() && open.back() == ev.substr(6), "leave does not match innermost enter");
            open.pop_back();
        }
    }
    EXPECT(open.empty(), "unmatched enter");
    EXPECT(h.events.front() == "enter DOCUMENT" && h.events.back() == "leave DOCUMENT", "document does not wrap the walk");
    return true;
}

static bool traverse_skip_hides_children_and_leave()
{
    auto doc = parse("* a\n** b\n* c\n");
    recording_handler h;
    h.skip_kinds = { syntax_kind::headline };
    traverse(doc.root(), h);

    EXPECT(h.count("enter HEADLINE") == 2, "skipped headline was descended into");
    EXPECT(h.count("leave HEADLINE") == 0, "leave reported for skipped headline");
    EXPECT(h.events.back() == "leave DOCUMENT", "walk did not continue after skip");
    return true;
}

static bool traverse_stop_ends_walk()
{
    auto doc = parse("para one\n\n- item\n\nlast para\n");
    recording_handler h;
    h.stop_kind = syntax_kind::list;
    traverse(doc.root(), h);

    EXPECT(h.events.back() == "enter LIST", "callbacks made after stop");
    EXPECT(h.count("leave DOCUMENT") == 0, "document left after stop");
    EXPECT(h.text_seen.find("last") == std::string::npos, "text after stop reported");
    return true;
}

static bool traverse_reports_leaf_objects()
{
    auto doc = parse("#+TITLE: T\nOn <2024-01-01 Mon> with \\alpha.\n:LOGBOOK:\nCLOCK: [2024-01-01 Mon 10:00]--[2024-01-01 Mon 11:00] =>  1:00\n:END:\n");
    recording_handler h;
    traverse(doc.root(), h);

    EXPECT(h.count("keyword TITLE") == 1, "keyword not reported");
    EXPECT(h.count("timestamp") == 1, "timestamp not reported");
    EXPECT(h.count("entity alpha") == 1, "entity not reported");
    EXPECT(h.count("clock") == 1, "clock not reported");
    EXPECT(h.count("enter DRAWER") == 1, "drawer not entered");
    return true;
}

static bool traverse_raw_tokens_on_request()
{
    auto doc = parse("a *b*\n");

    recording_handler quiet;
    traverse(doc.root(), quiet);
    EXPECT(quiet.token_count == 0, "tokens reported without request");

    recording_handler loud;
    loud.tokens = true;
    traverse(doc.root(), loud);
    EXPECT(loud.token_count > 0, "no tokens reported on request");
    EXPECT(loud.text_seen == quiet.text_seen, "token mode changed text events");
    EXPECT(quiet.text_seen == "a b\n", "wrong text events");
    return true;
}

static bool traverse_block_content_line_ends_are_text()
{
    auto doc = parse("#+begin_example\nx\ny\n#+end_example\n");
    recording_handler h;
    traverse(doc.root(), h);
    EXPECT(h.text_seen == "x\ny\n", "block lines not reported as text");
    EXPECT(h.count("enter EXAMPLE_BLOCK") == 1, "block not entered");
    return true;
}

static bool traverse_nested_walk_keeps_outer_skip()
{
    // A handler that renders the title from enter() and then skips.
    struct title_handler : traversal_handler
    {
        std::string titles;
        size_t      leaves = 0;

        void enter(container const & c, traversal_context & ctx) override
        {
            auto h = std::get_if<headline_view>(&c);
            if (!h)
                return;
            ctx.skip();
            if (auto t = h->title_node())
                walk(*t, *this, ctx);
        }
        void leave(container const & c, traversal_context &) override
        {
            if (std::holds_alternative<headline_view>(c))
                ++leaves;
        }
        void text(syntax_token const & t, traversal_context &) override
        {
            titles += t.text();
            titles += ";";
        }
    };

    auto doc = parse("* one\n** two\n* three\n");
    title_handler h;
    traverse(doc.root(), h);
    EXPECT(h.titles == "one;three;", "nested walk cleared pending skip");
    EXPECT(h.leaves == 0, "leave reported for skipped headline");
    return true;
}

    inline void run_traverse_tests()
    {
        SUBCAT("Containers");
        RUN_TEST(traverse_counts_only_real_headlines);
        RUN_TEST(traverse_enter_and_leave_are_balanced);

        SUBCAT("Control");
        RUN_TEST(traverse_skip_hides_children_and_leave);
        RUN_TEST(traverse_stop_ends_walk);
        RUN_TEST(traverse_nested_walk_keeps_outer_skip);

        SUBCAT("Leaves and tokens");
        RUN_TEST(traverse_reports_leaf_objects);
        RUN_TEST(traverse_raw_tokens_on_request);
        RUN_TEST(traverse_block_content_line_ends_are_text);
    }

} // ns orgdoc::tests

#endif
