// orgdoc_syntax_kind.hpp - Orgdoc - Syntax kinds
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef ORGDOC_SYNTAX_KIND_HPP
#define ORGDOC_SYNTAX_KIND_HPP

#include <string_view>
#include <cstdint>

namespace orgdoc
{
//========================================================================
// Syntax kinds
//========================================================================

    // One closed enumeration tags both tokens (leaves) and nodes.
    enum class syntax_kind : uint16_t
    {
    // Punctuation and trivia tokens
        l_bracket, r_bracket, l_bracket2, r_bracket2, l_parens, r_parens,
        l_curly, r_curly, l_curly2, l_curly3, r_curly3, l_angle, r_angle,
        l_angle2, r_angle2, l_angle3, r_angle3, at, at2,
        hash, hash_plus, percent2, colon, colon2, comma,
        pipe, plus, minus, minus2, star, slash,
        underscore, equal, tilde, caret, dollar, dollar2,
        backslash, backslash2, double_arrow, text, whitespace, new_line,
        blank_line, headline_stars, headline_keyword_todo, headline_keyword_done, list_item_indent, list_item_bullet,
        link_path, fn_label, macros_argument, src_block_language, src_block_switches, src_block_parameters,
        export_block_type, timestamp_year, timestamp_month, timestamp_day, timestamp_dayname, timestamp_hour,
        timestamp_minute, timestamp_repeater_mark, timestamp_delay_mark, timestamp_value, timestamp_unit,

    // Element and element-part nodes
        document, section, paragraph, headline, headline_priority, headline_title,
        headline_tags, planning, planning_deadline, planning_scheduled, planning_closed, property_drawer,
        node_property, drawer, drawer_begin, drawer_end, drawer_content, list,
        list_item, list_item_counter, list_item_check_box, list_item_tag, list_item_content, org_table,
        org_table_rule_row, org_table_standard_row, org_table_cell, table_el, source_block, example_block,
        export_block, comment_block, quote_block, center_block, verse_block, special_block,
        dyn_block, block_begin, block_end, block_content, keyword, babel_call,
        affiliated_keyword, comment, fixed_width, rule, clock, fn_def,
        fn_content, latex_environment,

    // Object (inline) nodes
        bold, italic, underline, strike, verbatim, code,
        link, radio_target, target, fn_ref, macros, cookie,
        timestamp_active, timestamp_inactive, timestamp_diary, inline_src, inline_call, snippet,
        latex_fragment, entity, line_break, superscript, subscript, cloze,
    };

    inline constexpr bool is_token_kind(syntax_kind k) noexcept
    {
        return k <= syntax_kind::timestamp_unit;
    }

    inline constexpr bool is_object_kind(syntax_kind k) noexcept
    {
        return k >= syntax_kind::bold;
    }

    inline std::string_view to_string(syntax_kind k) noexcept
    {
        switch (k)
        {
            case syntax_kind::l_bracket: return "L_BRACKET";
            case syntax_kind::r_bracket: return "R_BRACKET";
            case syntax_kind::l_bracket2: return "L_BRACKET2";
            case syntax_kind::r_bracket2: return "R_BRACKET2";
            case syntax_kind::l_parens: return "L_PARENS";
            case syntax_kind::r_parens: return "R_PARENS";
            case syntax_kind::l_curly: return "L_CURLY";
            case syntax_kind::r_curly: return "R_CURLY";
            case syntax_kind::l_curly2: return "L_CURLY2";
            case syntax_kind::l_curly3: return "L_CURLY3";
            case syntax_kind::r_curly3: return "R_CURLY3";
            case syntax_kind::l_angle: return "L_ANGLE";
            case syntax_kind::r_angle: return "R_ANGLE";
            case syntax_kind::l_angle2: return "L_ANGLE2";
            case syntax_kind::r_angle2: return "R_ANGLE2";
            case syntax_kind::l_angle3: return "L_ANGLE3";
            case syntax_kind::r_angle3: return "R_ANGLE3";
            case syntax_kind::at: return "AT";
            case syntax_kind::at2: return "AT2";
            case syntax_kind::hash: return "HASH";
            case syntax_kind::hash_plus: return "HASH_PLUS";
            case syntax_kind::percent2: return "PERCENT2";
            case syntax_kind::colon: return "COLON";
            case syntax_kind::colon2: return "COLON2";
            case syntax_kind::comma: return "COMMA";
            case syntax_kind::pipe: return "PIPE";
            case syntax_kind::plus: return "PLUS";
            case syntax_kind::minus: return "MINUS";
            case syntax_kind::minus2: return "MINUS2";
            case syntax_kind::star: return "STAR";
            case syntax_kind::slash: return "SLASH";
            case syntax_kind::underscore: return "UNDERSCORE";
            case syntax_kind::equal: return "EQUAL";
            case syntax_kind::tilde: return "TILDE";
            case syntax_kind::caret: return "CARET";
            case syntax_kind::dollar: return "DOLLAR";
            case syntax_kind::dollar2: return "DOLLAR2";
            case syntax_kind::backslash: return "BACKSLASH";
            case syntax_kind::backslash2: return "BACKSLASH2";
            case syntax_kind::double_arrow: return "DOUBLE_ARROW";
            case syntax_kind::text: return "TEXT";
            case syntax_kind::whitespace: return "WHITESPACE";
            case syntax_kind::new_line: return "NEW_LINE";
            case syntax_kind::blank_line: return "BLANK_LINE";
            case syntax_kind::headline_stars: return "HEADLINE_STARS";
            case syntax_kind::headline_keyword_todo: return "HEADLINE_KEYWORD_TODO";
            case syntax_kind::headline_keyword_done: return "HEADLINE_KEYWORD_DONE";
            case syntax_kind::list_item_indent: return "LIST_ITEM_INDENT";
            case syntax_kind::list_item_bullet: return "LIST_ITEM_BULLET";
            case syntax_kind::link_path: return "LINK_PATH";
            case syntax_kind::fn_label: return "FN_LABEL";
            case syntax_kind::macros_argument: return "MACROS_ARGUMENT";
            case syntax_kind::src_block_language: return "SRC_BLOCK_LANGUAGE";
            case syntax_kind::src_block_switches: return "SRC_BLOCK_SWITCHES";
            case syntax_kind::src_block_parameters: return "SRC_BLOCK_PARAMETERS";
            case syntax_kind::export_block_type: return "EXPORT_BLOCK_TYPE";
            case syntax_kind::timestamp_year: return "TIMESTAMP_YEAR";
            case syntax_kind::timestamp_month: return "TIMESTAMP_MONTH";
            case syntax_kind::timestamp_day: return "TIMESTAMP_DAY";
            case syntax_kind::timestamp_dayname: return "TIMESTAMP_DAYNAME";
            case syntax_kind::timestamp_hour: return "TIMESTAMP_HOUR";
            case syntax_kind::timestamp_minute: return "TIMESTAMP_MINUTE";
            case syntax_kind::timestamp_repeater_mark: return "TIMESTAMP_REPEATER_MARK";
            case syntax_kind::timestamp_delay_mark: return "TIMESTAMP_DELAY_MARK";
            case syntax_kind::timestamp_value: return "TIMESTAMP_VALUE";
            case syntax_kind::timestamp_unit: return "TIMESTAMP_UNIT";
            case syntax_kind::document: return "DOCUMENT";
            case syntax_kind::section: return "SECTION";
            case syntax_kind::paragraph: return "PARAGRAPH";
            case syntax_kind::headline: return "HEADLINE";
            case syntax_kind::headline_priority: return "HEADLINE_PRIORITY";
            case syntax_kind::headline_title: return "HEADLINE_TITLE";
            case syntax_kind::headline_tags: return "HEADLINE_TAGS";
            case syntax_kind::planning: return "PLANNING";
            case syntax_kind::planning_deadline: return "PLANNING_DEADLINE";
            case syntax_kind::planning_scheduled: return "PLANNING_SCHEDULED";
            case syntax_kind::planning_closed: return "PLANNING_CLOSED";
            case syntax_kind::property_drawer: return "PROPERTY_DRAWER";
            case syntax_kind::node_property: return "NODE_PROPERTY";
            case syntax_kind::drawer: return "DRAWER";
            case syntax_kind::drawer_begin: return "DRAWER_BEGIN";
            case syntax_kind::drawer_end: return "DRAWER_END";
            case syntax_kind::drawer_content: return "DRAWER_CONTENT";
            case syntax_kind::list: return "LIST";
            case syntax_kind::list_item: return "LIST_ITEM";
            case syntax_kind::list_item_counter: return "LIST_ITEM_COUNTER";
            case syntax_kind::list_item_check_box: return "LIST_ITEM_CHECK_BOX";
            case syntax_kind::list_item_tag: return "LIST_ITEM_TAG";
            case syntax_kind::list_item_content: return "LIST_ITEM_CONTENT";
            case syntax_kind::org_table: return "ORG_TABLE";
            case syntax_kind::org_table_rule_row: return "ORG_TABLE_RULE_ROW";
            case syntax_kind::org_table_standard_row: return "ORG_TABLE_STANDARD_ROW";
            case syntax_kind::org_table_cell: return "ORG_TABLE_CELL";
            case syntax_kind::table_el: return "TABLE_EL";
            case syntax_kind::source_block: return "SOURCE_BLOCK";
            case syntax_kind::example_block: return "EXAMPLE_BLOCK";
            case syntax_kind::export_block: return "EXPORT_BLOCK";
            case syntax_kind::comment_block: return "COMMENT_BLOCK";
            case syntax_kind::quote_block: return "QUOTE_BLOCK";
            case syntax_kind::center_block: return "CENTER_BLOCK";
            case syntax_kind::verse_block: return "VERSE_BLOCK";
            case syntax_kind::special_block: return "SPECIAL_BLOCK";
            case syntax_kind::dyn_block: return "DYN_BLOCK";
            case syntax_kind::block_begin: return "BLOCK_BEGIN";
            case syntax_kind::block_end: return "BLOCK_END";
            case syntax_kind::block_content: return "BLOCK_CONTENT";
            case syntax_kind::keyword: return "KEYWORD";
            case syntax_kind::babel_call: return "BABEL_CALL";
            case syntax_kind::affiliated_keyword: return "AFFILIATED_KEYWORD";
            case syntax_kind::comment: return "COMMENT";
            case syntax_kind::fixed_width: return "FIXED_WIDTH";
            case syntax_kind::rule: return "RULE";
            case syntax_kind::clock: return "CLOCK";
            case syntax_kind::fn_def: return "FN_DEF";
            case syntax_kind::fn_content: return "FN_CONTENT";
            case syntax_kind::latex_environment: return "LATEX_ENVIRONMENT";
            case syntax_kind::bold: return "BOLD";
            case syntax_kind::italic: return "ITALIC";
            case syntax_kind::underline: return "UNDERLINE";
            case syntax_kind::strike: return "STRIKE";
            case syntax_kind::verbatim: return "VERBATIM";
            case syntax_kind::code: return "CODE";
            case syntax_kind::link: return "LINK";
            case syntax_kind::radio_target: return "RADIO_TARGET";
            case syntax_kind::target: return "TARGET";
            case syntax_kind::fn_ref: return "FN_REF";
            case syntax_kind::macros: return "MACROS";
            case syntax_kind::cookie: return "COOKIE";
            case syntax_kind::timestamp_active: return "TIMESTAMP_ACTIVE";
            case syntax_kind::timestamp_inactive: return "TIMESTAMP_INACTIVE";
            case syntax_kind::timestamp_diary: return "TIMESTAMP_DIARY";
            case syntax_kind::inline_src: return "INLINE_SRC";
            case syntax_kind::inline_call: return "INLINE_CALL";
            case syntax_kind::snippet: return "SNIPPET";
            case syntax_kind::latex_fragment: return "LATEX_FRAGMENT";
            case syntax_kind::entity: return "ENTITY";
            case syntax_kind::line_break: return "LINE_BREAK";
            case syntax_kind::superscript: return "SUPERSCRIPT";
            case syntax_kind::subscript: return "SUBSCRIPT";
            case syntax_kind::cloze: return "CLOZE";
        }
        return "UNKNOWN";
    }

} // namespace orgdoc

#endif // ORGDOC_SYNTAX_KIND_HPP
