// orgdoc_serializer.hpp - Orgdoc - Serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.
//
// The tree is lossless, so writing Org text back out is a concatenation of
// token texts in order. The output equals the parsed text plus every edit.

#ifndef ORGDOC_SERIALIZER_HPP
#define ORGDOC_SERIALIZER_HPP

#include "orgdoc_document.hpp"

#include <ostream>
#include <sstream>

namespace orgdoc
{
//========================================================================
// SERIALIZER API
//========================================================================

    class serializer
    {
    public:
        explicit serializer(document const & doc) noexcept
            : doc_(doc)
        {}

        void write(std::ostream & out) const
        {
            std::string buf;
            buf.reserve(doc_.size());
            doc_.green()->write_to(buf);
            out << buf;
        }

        std::string str() const
        {
            std::ostringstream out;
            write(out);
            return out.str();
        }

    private:
        document const & doc_;
    };

    std::string serialize(document const & doc);

    // Indented structural listing, one element per line:
    //   HEADLINE@0..8
    //     HEADLINE_STARS@0..1 "*"
    std::string debug_dump(syntax_node const & node);
    std::string debug_dump(document const & doc);

//========================================================================
// SERIALIZER IMPLEMENTATION
//========================================================================

    namespace detail
    {
        inline void write_escaped(std::ostream & out, std::string_view s)
        {
            for (char c : s)
            {
                switch (c)
                {
                    case '\n': out << "\\n"; break;
                    case '\r': out << "\\r"; break;
                    case '\t': out << "\\t"; break;
                    case '"':  out << "\\\""; break;
                    case '\\': out << "\\\\"; break;
                    default:   out << c; break;
                }
            }
        }
    }

//---------------------------------------------------------------------------

    inline std::string serialize(document const & doc)
    {
        return serializer(doc).str();
    }

//---------------------------------------------------------------------------

    inline std::string debug_dump(syntax_node const & node)
    {
        std::ostringstream out;

        std::vector<std::pair<syntax_element, size_t>> stack;
        stack.emplace_back(node, 0);

        while (!stack.empty())
        {
            auto [e, depth] = std::move(stack.back());
            stack.pop_back();

            out << std::string(depth * 2, ' ')
                << to_string(kind_of(e)) << '@' << range_of(e).start << ".." << range_of(e).end;

            if (auto t = std::get_if<syntax_token>(&e))
            {
                out << " \"";
                detail::write_escaped(out, t->text());
                out << "\"\n";
                continue;
            }
            out << '\n';

            auto kids = std::get<syntax_node>(e).children_with_tokens();
            for (size_t i = kids.size(); i-- > 0; )
                stack.emplace_back(std::move(kids[i]), depth + 1);
        }
        return out.str();
    }

    inline std::string debug_dump(document const & doc)
    {
        return debug_dump(doc.root());
    }

} // namespace orgdoc

#endif // ORGDOC_SERIALIZER_HPP
