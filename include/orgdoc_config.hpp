// orgdoc_config.hpp - Orgdoc - Parse configuration
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef ORGDOC_CONFIG_HPP
#define ORGDOC_CONFIG_HPP

#include "orgdoc_core.hpp"

namespace orgdoc
{
    // Controls `a_b` / `a^b` recognition.
    //   no:    never parsed
    //   brace: only the braced forms `a_{b}` / `a^{b}`
    //   yes:   braced, `a_*` and plain `a_b` forms
    enum class sub_superscript
    {
        no,
        brace,
        yes
    };

    struct todo_keywords
    {
        std::vector<std::string> active { "TODO" };
        std::vector<std::string> done   { "DONE" };
    };

    // Supplied once at parse time and kept by the document so that edits
    // re-parse with the same grammar.
    struct parse_config
    {
        // Headline status words. Matching is exact and case-sensitive.
        todo_keywords todos;

        // Affiliated keywords that accept a secondary value: #+CAPTION[short]: long
        std::vector<std::string> dual_keywords { "CAPTION", "RESULTS" };

        // Affiliated keywords whose value is parsed as inline objects.
        std::vector<std::string> parsed_keywords { "CAPTION" };

        sub_superscript use_sub_superscript = sub_superscript::yes;

        // Keywords that attach to the element that follows them.
        std::vector<std::string> affiliated_keywords
        {
            "CAPTION", "DATA", "HEADER", "HEADERS", "LABEL", "NAME", "PLOT",
            "RESNAME", "RESULT", "RESULTS", "SOURCE", "SRCNAME", "TBLNAME"
        };

        // Column width of a tab when comparing list indentation.
        size_t tab_width = 8;

        static parse_config with_todo_keywords(std::vector<std::string> active, std::vector<std::string> done)
        {
            parse_config c;
            c.todos.active = std::move(active);
            c.todos.done   = std::move(done);
            return c;
        }
    };

} // namespace orgdoc

#endif // ORGDOC_CONFIG_HPP
