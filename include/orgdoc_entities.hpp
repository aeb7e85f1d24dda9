// orgdoc_entities.hpp - Orgdoc - Entity table
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// `\name` entities understood by the inline parser, with their HTML and
// UTF-8 renderings. A subset of Org's entity list covering Greek letters,
// arrows, common symbols and typographic punctuation.

#ifndef ORGDOC_ENTITIES_HPP
#define ORGDOC_ENTITIES_HPP

#include <string_view>
#include <optional>
#include <algorithm>
#include <iterator>

namespace orgdoc
{
    struct entity_info
    {
        std::string_view name;
        std::string_view html;
        std::string_view utf8;
    };

    namespace detail
    {
        // Sorted by name for binary search.
        inline constexpr entity_info entity_table[] =
        {
            { "Alpha",   "&Alpha;",   "Α" },
            { "Beta",    "&Beta;",    "Β" },
            { "Delta",   "&Delta;",   "Δ" },
            { "Gamma",   "&Gamma;",   "Γ" },
            { "Lambda",  "&Lambda;",  "Λ" },
            { "Omega",   "&Omega;",   "Ω" },
            { "Phi",     "&Phi;",     "Φ" },
            { "Pi",      "&Pi;",      "Π" },
            { "Psi",     "&Psi;",     "Ψ" },
            { "Sigma",   "&Sigma;",   "Σ" },
            { "Theta",   "&Theta;",   "Θ" },
            { "Xi",      "&Xi;",      "Ξ" },
            { "aacute",  "&aacute;",  "á" },
            { "aleph",   "&alefsym;", "ℵ" },
            { "alpha",   "&alpha;",   "α" },
            { "amp",     "&amp;",     "&" },
            { "ast",     "&lowast;",  "*" },
            { "beta",    "&beta;",    "β" },
            { "bull",    "&bull;",    "•" },
            { "cent",    "&cent;",    "¢" },
            { "checkmark", "&#10003;", "✓" },
            { "chi",     "&chi;",     "χ" },
            { "copy",    "&copy;",    "©" },
            { "dagger",  "&dagger;",  "†" },
            { "darr",    "&darr;",    "↓" },
            { "deg",     "&deg;",     "°" },
            { "delta",   "&delta;",   "δ" },
            { "div",     "&divide;",  "÷" },
            { "eacute",  "&eacute;",  "é" },
            { "egrave",  "&egrave;",  "è" },
            { "ell",     "&ell;",     "ℓ" },
            { "empty",   "&empty;",   "∅" },
            { "epsilon", "&epsilon;", "ε" },
            { "eta",     "&eta;",     "η" },
            { "euro",    "&euro;",    "€" },
            { "exist",   "&exist;",   "∃" },
            { "forall",  "&forall;",  "∀" },
            { "frac12",  "&frac12;",  "½" },
            { "frac14",  "&frac14;",  "¼" },
            { "gamma",   "&gamma;",   "γ" },
            { "ge",      "&ge;",      "≥" },
            { "gt",      "&gt;",      ">" },
            { "hellip",  "&hellip;",  "…" },
            { "in",      "&isin;",    "∈" },
            { "infin",   "&infin;",   "∞" },
            { "iota",    "&iota;",    "ι" },
            { "kappa",   "&kappa;",   "κ" },
            { "lambda",  "&lambda;",  "λ" },
            { "laquo",   "&laquo;",   "«" },
            { "larr",    "&larr;",    "←" },
            { "ldquo",   "&ldquo;",   "“" },
            { "le",      "&le;",      "≤" },
            { "lsquo",   "&lsquo;",   "‘" },
            { "lt",      "&lt;",      "<" },
            { "mdash",   "&mdash;",   "—" },
            { "micro",   "&micro;",   "µ" },
            { "middot",  "&middot;",  "·" },
            { "mu",      "&mu;",      "μ" },
            { "nbsp",    "&nbsp;",    " " },
            { "ndash",   "&ndash;",   "–" },
            { "ne",      "&ne;",      "≠" },
            { "not",     "&not;",     "¬" },
            { "nu",      "&nu;",      "ν" },
            { "omega",   "&omega;",   "ω" },
            { "para",    "&para;",    "¶" },
            { "partial", "&part;",    "∂" },
            { "phi",     "&phi;",     "φ" },
            { "pi",      "&pi;",      "π" },
            { "plusmn",  "&plusmn;",  "±" },
            { "pound",   "&pound;",   "£" },
            { "psi",     "&psi;",     "ψ" },
            { "raquo",   "&raquo;",   "»" },
            { "rarr",    "&rarr;",    "→" },
            { "rdquo",   "&rdquo;",   "”" },
            { "reg",     "&reg;",     "®" },
            { "rho",     "&rho;",     "ρ" },
            { "rsquo",   "&rsquo;",   "’" },
            { "sect",    "&sect;",    "§" },
            { "sigma",   "&sigma;",   "σ" },
            { "sum",     "&sum;",     "∑" },
            { "tau",     "&tau;",     "τ" },
            { "theta",   "&theta;",   "θ" },
            { "times",   "&times;",   "×" },
            { "trade",   "&trade;",   "™" },
            { "uarr",    "&uarr;",    "↑" },
            { "upsilon", "&upsilon;", "υ" },
            { "xi",      "&xi;",      "ξ" },
            { "yen",     "&yen;",     "¥" },
            { "zeta",    "&zeta;",    "ζ" },
        };
    }

    inline std::optional<entity_info> find_entity(std::string_view name)
    {
        auto first = std::begin(detail::entity_table);
        auto last  = std::end(detail::entity_table);
        auto it = std::lower_bound(first, last, name,
                                   [](entity_info const & e, std::string_view n) { return e.name < n; });
        if (it == last || it->name != name)
            return std::nullopt;
        return *it;
    }

} // namespace orgdoc

#endif // ORGDOC_ENTITIES_HPP
