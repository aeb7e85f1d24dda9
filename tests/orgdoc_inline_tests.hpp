#ifndef ORGDOC_TESTS_INLINE__
#define ORGDOC_TESTS_INLINE__

#include "orgdoc_test_harness.hpp"
#include "../include/orgdoc_document.hpp"
#include "../include/orgdoc_serializer.hpp"

namespace orgdoc::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    // Objects of the first paragraph of `src`.
    inline std::vector<syntax_element> paragraph_objects(document const & doc)
    {
        auto p = doc.first_node<paragraph_view>();
        return p ? p->objects() : std::vector<syntax_element>{};
    }

    inline size_t count_object(document const & doc, syntax_kind k)
    {
        size_t n = 0;
        for (auto const & d : doc.root().descendants())
            if (d.kind() == k)
                ++n;
        return n;
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool inline_parses_all_emphasis_markers()
{
    auto doc = parse("*b* /i/ _u_ +s+ =v= ~c~\n");
    EXPECT(count_object(doc, syntax_kind::bold) == 1, "no bold");
    EXPECT(count_object(doc, syntax_kind::italic) == 1, "no italic");
    EXPECT(count_object(doc, syntax_kind::underline) == 1, "no underline");
    EXPECT(count_object(doc, syntax_kind::strike) == 1, "no strike");
    EXPECT(count_object(doc, syntax_kind::verbatim) == 1, "no verbatim");
    EXPECT(count_object(doc, syntax_kind::code) == 1, "no code");

    EXPECT(doc.first_node<bold_view>()->text() == "b", "wrong bold text");
    EXPECT(doc.first_node<code_view>()->text() == "c", "wrong code text");
    return true;
}

static bool inline_nests_emphasis_but_not_verbatim()
{
    auto doc = parse("*bold /and italic/* =no *bold* here=\n");
    auto b = doc.first_node<bold_view>();
    EXPECT(b.has_value(), "no bold");
    EXPECT(count_object(doc, syntax_kind::italic) == 1, "italic not nested in bold");
    EXPECT(count_object(doc, syntax_kind::bold) == 1, "markup parsed inside verbatim");
    EXPECT(doc.first_node<verbatim_view>()->text() == "no *bold* here", "wrong verbatim text");
    return true;
}

static bool inline_rejects_emphasis_with_bad_borders()
{
    auto doc = parse("a*b*c and * not bold * and 2*3*4\n");
    EXPECT(count_object(doc, syntax_kind::bold) == 0, "bold inside a word or with spaces");
    return true;
}

static bool inline_parses_links()
{
    auto doc = parse("See [[https://orgmode.org][the *site*]] and [[file:img.png]]\n");
    auto links = doc.find_nodes<link_view>();
    EXPECT(links.size() == 2, "wrong link count");

    EXPECT(links[0].path() == "https://orgmode.org", "wrong path");
    EXPECT(links[0].has_description(), "description missing");
    EXPECT(links[0].description_raw() == "the *site*", "wrong description");
    EXPECT(count_object(doc, syntax_kind::bold) == 1, "description markup not parsed");
    EXPECT(!links[0].is_image(), "url reported as image");

    EXPECT(links[1].path() == "file:img.png", "wrong image path");
    EXPECT(!links[1].has_description(), "image has description");
    EXPECT(links[1].is_image(), "image not recognised");
    return true;
}

static bool inline_parses_footnote_references()
{
    auto doc = parse("A[fn:1] B[fn:note:inline *def*] C[fn::anonymous]\n");
    auto refs = doc.find_nodes<fn_ref_view>();
    EXPECT(refs.size() == 3, "wrong footnote count");

    EXPECT(refs[0].label() == "1" && !refs[0].is_inline(), "wrong plain reference");
    EXPECT(refs[1].label() == "note" && refs[1].is_inline(), "wrong inline reference");
    EXPECT(!refs[1].definition().empty(), "inline definition empty");
    EXPECT(!refs[2].label() && refs[2].is_inline(), "wrong anonymous reference");
    return true;
}

static bool inline_parses_timestamps()
{
    auto doc = parse("Due <2024-03-05 Tue 09:30 +1w -2d> since [2024-01-01 Mon]\n");
    auto ts = doc.find_nodes<timestamp_view>();
    EXPECT(ts.size() == 2, "wrong timestamp count");

    auto const & a = ts[0];
    EXPECT(a.is_active(), "first not active");
    EXPECT(a.year_start() == 2024u && a.month_start() == 3u && a.day_start() == 5u, "wrong date");
    EXPECT(a.hour_start() == 9u && a.minute_start() == 30u, "wrong time");
    EXPECT(a.dayname() == "Tue", "wrong day name");
    EXPECT(a.repeater() && a.repeater()->mark == "+" && a.repeater()->value == 1u && a.repeater()->unit == 'w', "wrong repeater");
    EXPECT(a.warning() && a.warning()->mark == "-" && a.warning()->value == 2u, "wrong warning");
    EXPECT(!a.is_range(), "single timestamp reported as range");

    EXPECT(ts[1].is_inactive(), "second not inactive");
    EXPECT(!ts[1].hour_start(), "inactive date has a time");
    return true;
}

static bool inline_parses_timestamp_ranges()
{
    auto doc = parse("<2024-01-01 Mon>--<2024-01-03 Wed> and <2024-01-05 Fri 10:00-11:30>\n");
    auto ts = doc.find_nodes<timestamp_view>();
    EXPECT(ts.size() == 2, "wrong timestamp count");

    EXPECT(ts[0].is_range(), "date range not a range");
    EXPECT(ts[0].day_start() == 1u && ts[0].day_end() == 3u, "wrong range days");

    EXPECT(ts[1].is_range(), "time range not a range");
    EXPECT(ts[1].hour_start() == 10u && ts[1].hour_end() == 11u && ts[1].minute_end() == 30u, "wrong time range");
    EXPECT(ts[1].day_end() == 5u, "time range end day differs");
    return true;
}

static bool inline_parses_diary_timestamps()
{
    auto doc = parse("<%%(diary-float t 4 2)>\n");
    auto ts = doc.first_node<timestamp_view>();
    EXPECT(ts && ts->is_diary(), "diary not recognised");
    EXPECT(ts->diary_sexp() == "(diary-float t 4 2)", "wrong sexp");
    EXPECT(!ts->year_start(), "diary has a date");
    return true;
}

static bool inline_parses_entities_and_line_breaks()
{
    auto doc = parse("\\alpha and \\beta{} ok\\\\\nnext \\unknownthing\n");
    auto es = doc.find_nodes<entity_view>();
    EXPECT(es.size() == 2, "wrong entity count");
    EXPECT(es[0].name() == "alpha" && es[0].utf8() == "α" && es[0].html() == "&alpha;", "wrong alpha");
    EXPECT(es[1].name() == "beta", "wrong beta");
    EXPECT(count_object(doc, syntax_kind::line_break) == 1, "no line break");
    return true;
}

static bool inline_parses_macros_and_cookies()
{
    auto doc = parse("{{{kbd(C-x\\, C-s, extra)}}} [2/3] [50%] {{{date}}}\n");
    auto ms = doc.find_nodes<macros_view>();
    EXPECT(ms.size() == 2, "wrong macro count");
    EXPECT(ms[0].name() == "kbd", "wrong macro name");

    auto args = ms[0].arguments();
    EXPECT(args.size() == 2, "wrong argument count");
    EXPECT(args[0] == "C-x, C-s" && args[1] == "extra", "wrong arguments");
    EXPECT(ms[1].name() == "date" && ms[1].arguments().empty(), "wrong bare macro");

    auto cs = doc.find_nodes<cookie_view>();
    EXPECT(cs.size() == 2, "wrong cookie count");
    EXPECT(cs[0].value() == "2/3" && !cs[0].is_percent(), "wrong fraction cookie");
    EXPECT(cs[1].value() == "50%" && cs[1].is_percent(), "wrong percent cookie");
    return true;
}

static bool inline_parses_targets_snippets_and_latex()
{
    auto doc = parse("<<anchor>> <<<radio>>> @@html:<br>@@ $x^2$ \\(y\\)\n");
    EXPECT(doc.first_node<target_view>() && doc.first_node<target_view>()->value() == "anchor", "no target");
    EXPECT(doc.first_node<radio_target_view>() && doc.first_node<radio_target_view>()->value() == "radio", "no radio target");

    auto s = doc.first_node<snippet_view>();
    EXPECT(s && s->backend() == "html" && s->value() == "<br>", "wrong snippet");

    auto l = doc.find_nodes<latex_fragment_view>();
    EXPECT(l.size() == 2, "wrong latex fragment count");
    EXPECT(l[0].value() == "$x^2$" && l[1].value() == "\\(y\\)", "wrong fragments");
    return true;
}

static bool inline_parses_inline_source_and_calls()
{
    auto doc = parse("src_python[:exports both]{print(1)} call_square[:x 1](4)[:results raw]\n");
    auto s = doc.first_node<inline_src_view>();
    EXPECT(s.has_value(), "no inline source");
    EXPECT(s->language() == "python", "wrong language");
    EXPECT(s->parameters() == ":exports both", "wrong parameters");
    EXPECT(s->body() == "print(1)", "wrong body");

    auto c = doc.first_node<inline_call_view>();
    EXPECT(c.has_value(), "no inline call");
    EXPECT(c->name() == "square", "wrong call name");
    EXPECT(c->inside_header() == ":x 1", "wrong inside header");
    EXPECT(c->arguments() == "4", "wrong arguments");
    EXPECT(c->end_header() == ":results raw", "wrong end header");
    return true;
}

static bool inline_parses_sub_and_superscripts()
{
    auto doc = parse("E=mc^2 and H_{2}O\n");
    auto sup = doc.first_node<superscript_view>();
    EXPECT(sup && sup->text() == "2" && !sup->is_braced(), "wrong superscript");
    auto sub = doc.first_node<subscript_view>();
    EXPECT(sub && sub->text() == "2" && sub->is_braced(), "wrong subscript");
    return true;
}

static bool inline_respects_sub_superscript_setting()
{
    parse_config cfg;
    cfg.use_sub_superscript = sub_superscript::brace;
    auto doc = parse("a_b and c_{d}\n", cfg);
    EXPECT(count_object(doc, syntax_kind::subscript) == 1, "plain subscript parsed in brace mode");

    cfg.use_sub_superscript = sub_superscript::no;
    auto off = parse("a_b and c_{d}\n", cfg);
    EXPECT(count_object(off, syntax_kind::subscript) == 0, "subscript parsed when disabled");
    return true;
}

static bool inline_leaves_incomplete_objects_as_text()
{
    constexpr std::string_view src = "[[unclosed and {{{macro and <2024-13 and *open\n";
    auto doc = parse(src);
    auto objs = paragraph_objects(doc);
    EXPECT(!objs.empty(), "paragraph has no objects");
    for (auto const & o : objs)
        EXPECT(std::holds_alternative<syntax_token>(o), "incomplete object became a node");
    EXPECT(doc.to_org() == src, "bytes lost");
    return true;
}

static bool inline_parses_headline_title_objects()
{
    auto doc = parse("* A /styled/ [[x][title]]\n");
    auto h = doc.first_node<headline_view>();
    EXPECT(h.has_value(), "no headline");
    EXPECT(h->title_text() == "A styled title", "wrong plain title");
    EXPECT(count_object(doc, syntax_kind::italic) == 1, "title markup not parsed");
    return true;
}

static bool inline_parses_cloze_shapes()
{
    auto full = parse("{{text}{hint}@id}\n");
    auto c = full.first_node<cloze_view>();
    EXPECT(c.has_value(), "no cloze");
    EXPECT(debug_dump(c->syntax()) ==
        "CLOZE@0..17\n"
        "  L_CURLY2@0..2 \"{{\"\n"
        "  TEXT@2..6 \"text\"\n"
        "  R_CURLY@6..7 \"}\"\n"
        "  L_CURLY@7..8 \"{\"\n"
        "  TEXT@8..12 \"hint\"\n"
        "  R_CURLY@12..13 \"}\"\n"
        "  AT@13..14 \"@\"\n"
        "  TEXT@14..16 \"id\"\n"
        "  R_CURLY@16..17 \"}\"\n", "wrong cloze tree");
    EXPECT(c->text_raw() == "text" && c->hint() == "hint" && c->id() == "id", "wrong cloze parts");

    auto plain = parse("{{text}}\n").first_node<cloze_view>();
    EXPECT(plain && plain->text_raw() == "text", "plain cloze");
    EXPECT(!plain->hint() && !plain->id(), "plain cloze has hint or id");

    auto with_id = parse("{{text}@id}\n").first_node<cloze_view>();
    EXPECT(with_id && !with_id->hint() && with_id->id() == "id", "cloze with id only");

    auto empty_parts = parse("{{text}{}@}\n").first_node<cloze_view>();
    EXPECT(empty_parts && empty_parts->hint() == "" && empty_parts->id() == "", "empty hint and id");
    return true;
}

static bool inline_parses_cloze_with_latex_and_links()
{
    auto doc = parse("{{$\\frac{a}{b}$}{fractions}}\n");
    auto c = doc.first_node<cloze_view>();
    EXPECT(c.has_value(), "no cloze");
    EXPECT(c->text_raw() == "$\\frac{a}{b}$", "closing brace inside latex ended the text");
    EXPECT(c->hint() == "fractions", "wrong hint");
    EXPECT(count_object(doc, syntax_kind::latex_fragment) == 1, "latex not parsed inside cloze");

    auto img = parse("{{ [[file:my_image.png]] }{hint}}\n");
    EXPECT(img.first_node<cloze_view>()->text_raw() == " [[file:my_image.png]] ", "wrong text with link");
    EXPECT(count_object(img, syntax_kind::link) == 1, "link not parsed inside cloze");
    return true;
}

static bool inline_rejects_malformed_cloze()
{
    for (std::string_view src : { "{{}}\n", "{{text}\n", "{text}}\n", "{{text}{}\n", "{{text}a}\n" })
    {
        auto doc = parse(src);
        EXPECT(count_object(doc, syntax_kind::cloze) == 0, "malformed cloze accepted");
        EXPECT(doc.to_org() == src, "bytes lost");
    }
    return true;
}

    inline void run_inline_tests()
    {
        SUBCAT("Emphasis");
        RUN_TEST(inline_parses_all_emphasis_markers);
        RUN_TEST(inline_nests_emphasis_but_not_verbatim);
        RUN_TEST(inline_rejects_emphasis_with_bad_borders);

        SUBCAT("Links and footnotes");
        RUN_TEST(inline_parses_links);
        RUN_TEST(inline_parses_footnote_references);

        SUBCAT("Timestamps");
        RUN_TEST(inline_parses_timestamps);
        RUN_TEST(inline_parses_timestamp_ranges);
        RUN_TEST(inline_parses_diary_timestamps);

        SUBCAT("Other objects");
        RUN_TEST(inline_parses_entities_and_line_breaks);
        RUN_TEST(inline_parses_macros_and_cookies);
        RUN_TEST(inline_parses_targets_snippets_and_latex);
        RUN_TEST(inline_parses_inline_source_and_calls);
        RUN_TEST(inline_parses_sub_and_superscripts);
        RUN_TEST(inline_respects_sub_superscript_setting);

        SUBCAT("Cloze");
        RUN_TEST(inline_parses_cloze_shapes);
        RUN_TEST(inline_parses_cloze_with_latex_and_links);
        RUN_TEST(inline_rejects_malformed_cloze);

        SUBCAT("Fallback");
        RUN_TEST(inline_leaves_incomplete_objects_as_text);
        RUN_TEST(inline_parses_headline_title_objects);
    }

} // ns orgdoc::tests

#endif
