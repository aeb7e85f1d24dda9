#include "include/orgdoc.hpp"

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

#include <iostream>
#include <iomanip>

// Example Org document
const char* example_notes = R"(#+TITLE: Release Notes
#+AUTHOR: Build Team

The next release ships the new /renderer/ and a rewritten [[https://example.org/docs][manual]].

* TODO [#A] Ship renderer :release:
  DEADLINE: <2025-12-01 Mon>
  :PROPERTIES:
  :OWNER: graphics
  :EFFORT: 3:00
  :END:
  - [X] shaders
  - [X] batching
  - [ ] profiling
** DONE Benchmarks
   CLOSED: [2025-11-10 Mon 17:00]
   :LOGBOOK:
   CLOCK: [2025-11-10 Mon 14:00]--[2025-11-10 Mon 17:00] =>  3:00
   :END:

   | scene   | frame ms |
   |---------+----------|
   | forest  |     12.5 |
   | city    |     16.1 |
   #+TBLFM: @>$2=vmean(@2..@-1)

* Manual
Quote from the review:
#+begin_quote
Fast enough to render a *city* at 60 fps.
#+end_quote

#+begin_src cpp :results none
auto doc = orgdoc::parse(text);
#+end_src
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void show_outline(orgdoc::document const & doc)
{
    print_separator("EXAMPLE 1: Outline");

    std::cout << "Title: " << doc.title().value_or("(untitled)") << "\n";
    for (auto const & k : doc.keywords())
        std::cout << "  #+" << k.key() << ": " << k.value() << "\n";
    std::cout << "\n";

    for (auto const & h : doc.find_nodes<orgdoc::headline_view>())
    {
        std::cout << std::string(h.level() * 2, ' ')
                  << h.todo_keyword().value_or("") << (h.todo_keyword() ? " " : "")
                  << h.title_text();
        for (auto const & t : h.tags())
            std::cout << " :" << t << ":";
        std::cout << "\n";
    }
}

void show_tasks(orgdoc::document const & doc)
{
    print_separator("EXAMPLE 2: Tasks and Clocks");

    for (auto const & h : doc.find_nodes<orgdoc::headline_view>())
    {
        if (!h.todo_type())
            continue;

        std::cout << (h.is_done() ? "✓ " : "• ") << h.title_text();
        if (auto p = h.priority())
            std::cout << " [#" << *p << "]";
        std::cout << "\n";

        if (auto d = h.deadline())
            if (auto ymd = orgdoc::interop::to_year_month_day(*d))
                std::cout << "    deadline " << static_cast<int>(ymd->year()) << "-"
                          << std::setw(2) << std::setfill('0') << static_cast<unsigned>(ymd->month()) << "-"
                          << std::setw(2) << static_cast<unsigned>(ymd->day()) << std::setfill(' ') << "\n";

        if (auto props = h.properties())
            for (auto const & [key, value] : orgdoc::interop::to_map(*props))
                std::cout << "    " << key << " = " << value << "\n";
    }

    std::chrono::minutes total{ 0 };
    for (auto const & c : doc.find_nodes<orgdoc::clock_view>())
        if (auto d = orgdoc::interop::to_duration(c))
            total += *d;
    std::cout << "\nClocked: " << total.count() << " minutes\n";

    size_t done = 0, all = 0;
    for (auto const & item : doc.find_nodes<orgdoc::list_item_view>())
    {
        if (auto cb = item.checkbox())
        {
            ++all;
            done += *cb == orgdoc::checkbox_state::checked;
        }
    }
    std::cout << "Checklist: " << done << "/" << all << "\n";
}

void show_tables(orgdoc::document const & doc)
{
    print_separator("EXAMPLE 3: Tables");

    for (auto const & t : doc.find_nodes<orgdoc::table_view>())
    {
        for (auto const & row : t.rows())
        {
            if (row.is_rule())
            {
                std::cout << std::string(30, '-') << "\n";
                continue;
            }
            for (auto const & cell : row.cells())
                std::cout << std::left << std::setw(15) << cell.text();
            std::cout << "\n";
        }
        for (auto const & f : t.formulas())
            std::cout << "formula: " << f << "\n";
    }
}

// Counts the words a reader sees, ignoring markup and code.
struct word_counter : orgdoc::traversal_handler
{
    size_t words = 0;

    void enter(orgdoc::container const & c, orgdoc::traversal_context & ctx) override
    {
        if (std::holds_alternative<orgdoc::source_block_view>(c))
            ctx.skip();
    }

    void text(orgdoc::syntax_token const & t, orgdoc::traversal_context &) override
    {
        bool in_word = false;
        for (char ch : t.text())
        {
            bool const w = !orgdoc::detail::is_whitespace(ch);
            words += w && !in_word;
            in_word = w;
        }
    }
};

void show_traversal(orgdoc::document const & doc)
{
    print_separator("EXAMPLE 4: Traversal");

    word_counter wc;
    doc.traverse(wc);
    std::cout << "Body words (headline titles and code excluded): " << wc.words << "\n";
}

void show_editing(orgdoc::document & doc)
{
    print_separator("EXAMPLE 5: Incremental Editing");

    auto h = doc.first_node<orgdoc::headline_view>();
    auto kw = h->syntax().first_token(orgdoc::syntax_kind::headline_keyword_todo);

    auto r = orgdoc::editor(doc).replace_range(kw->range(), "DONE");
    if (r.has_errors())
    {
        for (auto const & e : r.errors)
            std::cout << "✗ " << e.message << "\n";
        return;
    }

    std::cout << (r->incremental ? "✓ Incremental" : "✓ Full") << " re-parse, "
              << r->reparsed_bytes << " bytes, version " << doc.version() << "\n";
    std::cout << "First headline is now: " << doc.first_node<orgdoc::headline_view>()->todo_keyword().value_or("?") << "\n";

    auto bad = orgdoc::editor(doc).erase({ doc.size(), doc.size() + 10 });
    for (auto const & e : bad.errors)
        std::cout << "✗ Rejected as expected: " << e.message << "\n";
}

void show_exports(orgdoc::document const & doc)
{
    print_separator("EXAMPLE 6: Exports");

    std::cout << "HTML:\n" << doc.to_html() << "\n\n";
    std::cout << "Markdown:\n" << orgdoc::to_markdown(doc) << "\n";

    auto quote = doc.first_node<orgdoc::quote_block_view>();
    std::cout << "Syntax of the quote block:\n" << orgdoc::debug_dump(quote->syntax());
}

int main()
{
    static plog::ConsoleAppender<plog::TxtFormatter> console;
    plog::init(plog::info, &console);

    auto doc = orgdoc::parse(example_notes);

    show_outline(doc);
    show_tasks(doc);
    show_tables(doc);
    show_traversal(doc);
    show_editing(doc);
    show_exports(doc);

    print_separator("Round trip");
    std::cout << (orgdoc::serialize(doc).size() == doc.size() ? "✓ " : "✗ ")
              << "Serialized " << doc.size() << " bytes\n";
}
