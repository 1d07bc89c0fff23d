// formwork_parser.hpp - Formwork - Parser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_PARSER_HPP
#define FORMWORK_PARSER_HPP

#include "formwork_core.hpp"
#include "formwork_document.hpp"

namespace formwork
{
//========================================================================
// Concrete syntax record
//========================================================================

    using attribute_value = std::variant<std::string, int64_t, double, bool>;

    struct attribute
    {
        std::string     name;
        attribute_value value;
    };

    struct cst_directive
    {
        std::string            name;            // without the leading '/'
        bool                   closing      = false;
        bool                   self_closing = false;
        std::vector<attribute> attrs;
        source_location        loc;
    };

    struct cst_option
    {
        std::string     id;
        std::string     label;
        char            marker = ' ';
        source_location loc;
    };

    struct cst_field
    {
        cst_directive                           directive;
        std::vector<cst_option>                 options;
        std::vector<cst_directive>              columns;
        std::vector<std::string>                prompt_lines;
        std::optional<std::vector<std::string>> literal;      // raw lines of the value block
        source_location                         literal_loc;
        source_span                             span;
    };

    struct cst_group
    {
        std::optional<cst_directive> directive;   // none for an implicit group
        std::vector<cst_field>       fields;
    };

    struct cst_note
    {
        cst_directive            directive;
        std::vector<std::string> body;
        source_span              span;
    };

    struct cst_form
    {
        std::optional<cst_directive> directive;
        std::vector<cst_group>       groups;
        std::vector<cst_note>        notes;
        size_t                       close_offset = npos();
    };

    struct cst_document
    {
        std::string                text;
        std::optional<std::string> frontmatter;
        std::optional<source_span> frontmatter_span;
        source_location            frontmatter_loc;
        cst_form                   form;
    };

    using parse_context = context<cst_document, document_error>;

//========================================================================
// PARSER API
//========================================================================

    parse_context parse(std::string_view input);

    inline attribute const * find_attribute(cst_directive const & d, std::string_view name)
    {
        for (auto const & a : d.attrs)
            if (a.name == name)
                return &a;
        return nullptr;
    }

    // The "id" attribute if it is a string, else empty.
    inline std::string directive_id(cst_directive const & d)
    {
        if (auto a = find_attribute(d, "id"))
            if (auto s = std::get_if<std::string>(&a->value))
                return *s;
        return {};
    }

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct line_ref
        {
            std::string_view text;      // without line terminator
            size_t           begin;     // offset of first byte
            size_t           next;      // offset of the following line
            size_t           no;        // 1-based
        };

        inline std::vector<line_ref> split_lines_with_offsets(std::string_view input)
        {
            std::vector<line_ref> out;
            size_t pos = 0;
            size_t no  = 0;

            while (pos < input.size() && no < MAX_LINES)
            {
                size_t nl   = input.find('\n', pos);
                size_t end  = nl == std::string_view::npos ? input.size() : nl;
                size_t next = nl == std::string_view::npos ? input.size() : nl + 1;

                auto text = input.substr(pos, end - pos);
                if (!text.empty() && text.back() == '\r')
                    text.remove_suffix(1);

                out.push_back({ text, pos, next, ++no });
                pos = next;
            }
            return out;
        }

//---------------------------------------------------------------------------

        inline bool is_key_char(char c)
        {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
        }

        // Parses "{% name k=v ... %}", "{% /name %}" and "{% name ... /%}".
        inline std::optional<cst_directive>
        parse_directive_line(std::string_view t, source_location loc, std::string & err)
        {
            if (!t.starts_with("{%") || !t.ends_with("%}") || t.size() < 4)
            {
                err = "directive must open with {% and close with %} on one line";
                return std::nullopt;
            }

            cst_directive d;
            d.loc = loc;

            std::string_view body = trim_sv(t.substr(2, t.size() - 4));

            if (body.ends_with("/"))
            {
                d.self_closing = true;
                body.remove_suffix(1);
                body = trim_sv(body);
            }

            if (body.starts_with("/"))
            {
                d.closing = true;
                body.remove_prefix(1);
            }

            size_t i = 0;
            while (i < body.size() && is_key_char(body[i]))
                ++i;

            d.name = std::string(body.substr(0, i));
            if (d.name.empty())
            {
                err = "directive has no name";
                return std::nullopt;
            }

            while (true)
            {
                while (i < body.size() && std::isspace(static_cast<unsigned char>(body[i])))
                    ++i;
                if (i >= body.size())
                    break;

                size_t key_start = i;
                while (i < body.size() && is_key_char(body[i]))
                    ++i;

                std::string key(body.substr(key_start, i - key_start));
                if (key.empty() || i >= body.size() || body[i] != '=')
                {
                    err = "expected key=value in directive '" + d.name + "'";
                    return std::nullopt;
                }
                ++i;

                attribute attr;
                attr.name = key;

                if (i < body.size() && body[i] == '"')
                {
                    std::string s;
                    bool closed = false;
                    for (++i; i < body.size(); ++i)
                    {
                        char c = body[i];
                        if (c == '\\' && i + 1 < body.size())
                        {
                            char n = body[++i];
                            s += (n == 'n') ? '\n' : n;
                        }
                        else if (c == '"')
                        {
                            closed = true;
                            ++i;
                            break;
                        }
                        else
                            s += c;
                    }
                    if (!closed)
                    {
                        err = "unterminated string for attribute '" + key + "'";
                        return std::nullopt;
                    }
                    attr.value = std::move(s);
                }
                else
                {
                    size_t tok_start = i;
                    while (i < body.size() && !std::isspace(static_cast<unsigned char>(body[i])))
                        ++i;
                    auto tok = body.substr(tok_start, i - tok_start);

                    if (tok == "true")
                        attr.value = true;
                    else if (tok == "false")
                        attr.value = false;
                    else if (auto iv = parse_int(tok))
                        attr.value = *iv;
                    else if (auto dv = parse_double(tok))
                        attr.value = *dv;
                    else
                    {
                        err = "attribute '" + key + "' has an unquoted non-literal value '" + std::string(tok) + "'";
                        return std::nullopt;
                    }
                }

                for (auto const & existing : d.attrs)
                    if (existing.name == key)
                    {
                        err = "attribute '" + key + "' given twice";
                        return std::nullopt;
                    }

                d.attrs.push_back(std::move(attr));
            }

            if (d.closing && (!d.attrs.empty() || d.self_closing))
            {
                err = "closing directive '/" + d.name + "' takes no attributes";
                return std::nullopt;
            }

            return d;
        }

//---------------------------------------------------------------------------

        inline bool is_option_line(std::string_view t)
        {
            return t.size() >= 5 && t.starts_with("- [") && t[4] == ']';
        }

        // "- [m] Label {% #id %}"
        inline std::optional<cst_option>
        parse_option_line(std::string_view t, source_location loc, std::string & err)
        {
            cst_option o;
            o.marker = t[3];
            o.loc    = loc;

            auto rest = trim_sv(t.substr(5));
            auto tag  = rest.rfind("{%");

            if (tag == std::string_view::npos || !rest.ends_with("%}") || rest.size() - tag < 4)
            {
                err = "option line has no {% #id %} tag";
                return std::nullopt;
            }

            auto inner = trim_sv(rest.substr(tag + 2, rest.size() - tag - 4));
            if (inner.size() < 2 || inner.front() != '#')
            {
                err = "option tag must have the form {% #id %}";
                return std::nullopt;
            }

            o.id    = std::string(trim_sv(inner.substr(1)));
            o.label = std::string(trim_sv(rest.substr(0, tag)));
            return o;
        }

//========================================================================
// parser_impl
//========================================================================

        struct parser_impl
        {
            enum class scope
            {
                before_form,
                form,
                group,
                field,
                literal,
                note,
                after_form
            };

            parse_context ctx;

            scope     state  = scope::before_form;
            scope     resume = scope::form;       // scope to return to after a field or note
            cst_field current_field;
            cst_note  current_note;

            void parse(std::string_view input);
            void add_error(document_error_kind kind, size_t line, std::string message, std::string ref = {});

            void parse_line(line_ref const & l);
            void field_line(line_ref const & l, std::string_view t);
            void note_line(line_ref const & l, std::string_view t);
            void structural_directive(line_ref const & l, cst_directive d);

            void open_field(line_ref const & l, cst_directive d);
            void close_field(line_ref const & l);
            void open_note(line_ref const & l, cst_directive d);
            void close_note(line_ref const & l);

            void finish();
        };

//---------------------------------------------------------------------------

        inline void parser_impl::add_error(document_error_kind kind, size_t line, std::string message, std::string ref)
        {
            ctx.errors.push_back(document_error{
                kind,
                { line },
                std::move(message),
                std::move(ref)
            });
        }

//---------------------------------------------------------------------------

        inline void parser_impl::parse(std::string_view input)
        {
            ctx.result.text = std::string(input);
            std::string_view text = ctx.result.text;

            auto lines = split_lines_with_offsets(text);
            size_t i = 0;

            // Frontmatter: "---" on the first line up to the next "---" line.
            if (!lines.empty() && trim_sv(lines[0].text) == "---")
            {
                size_t close = 1;
                while (close < lines.size() && trim_sv(lines[close].text) != "---")
                    ++close;

                if (close >= lines.size())
                {
                    add_error(document_error_kind::malformed_frontmatter, 1,
                              "frontmatter opened with --- is never closed");
                    return;
                }

                size_t body_begin = lines.size() > 1 ? lines[1].begin : lines[0].next;
                ctx.result.frontmatter      = std::string(text.substr(body_begin, lines[close].begin - body_begin));
                ctx.result.frontmatter_span = source_span{ 0, lines[close].next };
                ctx.result.frontmatter_loc  = { 2 };
                i = close + 1;
            }

            for (; i < lines.size(); ++i)
                parse_line(lines[i]);

            finish();
        }

//---------------------------------------------------------------------------

        inline void parser_impl::parse_line(line_ref const & l)
        {
            std::string_view t = trim_sv(l.text);

            if (state == scope::literal)
            {
                if (t == "```")
                    state = scope::field;
                else
                    current_field.literal->push_back(std::string(l.text));
                return;
            }

            if (state == scope::field)
            {
                field_line(l, t);
                return;
            }

            if (state == scope::note)
            {
                note_line(l, t);
                return;
            }

            // Prose outside fields and notes is kept only in the source text.
            if (!t.starts_with("{%"))
                return;

            std::string err;
            auto d = parse_directive_line(t, { l.no }, err);
            if (!d)
            {
                add_error(document_error_kind::malformed_directive, l.no, err);
                return;
            }

            structural_directive(l, std::move(*d));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::field_line(line_ref const & l, std::string_view t)
        {
            if (t == "```value")
            {
                if (current_field.literal)
                    add_error(document_error_kind::malformed_directive, l.no,
                              "field has more than one value block", directive_id(current_field.directive));

                current_field.literal     = std::vector<std::string>{};
                current_field.literal_loc = { l.no };
                state = scope::literal;
                return;
            }

            if (is_option_line(t))
            {
                std::string err;
                if (auto o = parse_option_line(t, { l.no }, err))
                    current_field.options.push_back(std::move(*o));
                else
                    add_error(document_error_kind::malformed_directive, l.no, err,
                              directive_id(current_field.directive));
                return;
            }

            if (!t.starts_with("{%"))
            {
                current_field.prompt_lines.push_back(std::string(l.text));
                return;
            }

            std::string err;
            auto d = parse_directive_line(t, { l.no }, err);
            if (!d)
            {
                add_error(document_error_kind::malformed_directive, l.no, err,
                          directive_id(current_field.directive));
                return;
            }

            if (d->name == "field" && d->closing)
            {
                close_field(l);
            }
            else if (d->name == "column" && !d->closing)
            {
                if (!d->self_closing)
                    add_error(document_error_kind::malformed_directive, l.no,
                              "column directive must be self-closing (/%})", directive_id(*d));
                current_field.columns.push_back(std::move(*d));
            }
            else if (d->name == "form" || d->name == "group" || d->name == "field" ||
                     d->name == "note" || d->name == "column")
            {
                add_error(document_error_kind::unbalanced_directive, l.no,
                          "'" + std::string(d->closing ? "/" : "") + d->name + "' inside field '" +
                          directive_id(current_field.directive) + "'",
                          directive_id(current_field.directive));
            }
            else
            {
                add_error(document_error_kind::unknown_directive, l.no,
                          "unknown directive '" + d->name + "'");
            }
        }

//---------------------------------------------------------------------------

        inline void parser_impl::note_line(line_ref const & l, std::string_view t)
        {
            if (!t.starts_with("{%"))
            {
                current_note.body.push_back(std::string(l.text));
                return;
            }

            std::string err;
            auto d = parse_directive_line(t, { l.no }, err);
            if (d && d->name == "note" && d->closing)
            {
                close_note(l);
                return;
            }

            add_error(document_error_kind::unbalanced_directive, l.no,
                      "directive inside note '" + directive_id(current_note.directive) + "'",
                      directive_id(current_note.directive));
        }

//---------------------------------------------------------------------------

        inline void parser_impl::structural_directive(line_ref const & l, cst_directive d)
        {
            auto & form = ctx.result.form;
            bool in_form = state == scope::form || state == scope::group;

            if (d.self_closing && d.name != "column")
            {
                add_error(document_error_kind::malformed_directive, l.no,
                          "'" + d.name + "' cannot be self-closing", directive_id(d));
                return;
            }

            if (d.name == "form")
            {
                if (d.closing)
                {
                    if (state == scope::group)
                        add_error(document_error_kind::unbalanced_directive, l.no,
                                  "form closed while group '" + directive_id(*form.groups.back().directive) + "' is open");
                    else if (state != scope::form)
                    {
                        add_error(document_error_kind::unbalanced_directive, l.no, "'/form' without an open form");
                        return;
                    }
                    form.close_offset = l.begin;
                    state = scope::after_form;
                }
                else if (state == scope::before_form)
                {
                    form.directive = std::move(d);
                    state = scope::form;
                }
                else
                {
                    add_error(document_error_kind::unbalanced_directive, l.no,
                              "a document holds exactly one form", directive_id(d));
                }
            }
            else if (d.name == "group")
            {
                if (d.closing)
                {
                    if (state == scope::group)
                        state = scope::form;
                    else
                        add_error(document_error_kind::unbalanced_directive, l.no, "'/group' without an open group");
                }
                else if (state == scope::form)
                {
                    cst_group g;
                    g.directive = std::move(d);
                    form.groups.push_back(std::move(g));
                    state = scope::group;
                }
                else
                {
                    add_error(document_error_kind::unbalanced_directive, l.no,
                              state == scope::group ? "groups cannot be nested" : "group outside the form",
                              directive_id(d));
                }
            }
            else if (d.name == "field")
            {
                if (!d.closing && in_form)
                    open_field(l, std::move(d));
                else
                    add_error(document_error_kind::unbalanced_directive, l.no,
                              d.closing ? "'/field' without an open field" : "field outside the form",
                              directive_id(d));
            }
            else if (d.name == "note")
            {
                if (!d.closing && in_form)
                    open_note(l, std::move(d));
                else
                    add_error(document_error_kind::unbalanced_directive, l.no,
                              d.closing ? "'/note' without an open note" : "note outside the form",
                              directive_id(d));
            }
            else if (d.name == "column")
            {
                add_error(document_error_kind::unbalanced_directive, l.no,
                          "column outside a table field", directive_id(d));
            }
            else
            {
                add_error(document_error_kind::unknown_directive, l.no,
                          "unknown directive '" + d.name + "'", directive_id(d));
            }
        }

//---------------------------------------------------------------------------

        inline void parser_impl::open_field(line_ref const & l, cst_directive d)
        {
            current_field = cst_field{};
            current_field.directive  = std::move(d);
            current_field.span.begin = l.begin;

            resume = state;
            state  = scope::field;
        }

        inline void parser_impl::close_field(line_ref const & l)
        {
            current_field.span.end = l.next;

            auto & groups = ctx.result.form.groups;

            // Loose fields join the implicit group that directly precedes them.
            if (resume == scope::form && (groups.empty() || groups.back().directive))
                groups.push_back(cst_group{});

            groups.back().fields.push_back(std::move(current_field));
            current_field = cst_field{};
            state = resume;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::open_note(line_ref const & l, cst_directive d)
        {
            current_note = cst_note{};
            current_note.directive  = std::move(d);
            current_note.span.begin = l.begin;

            resume = state;
            state  = scope::note;
        }

        inline void parser_impl::close_note(line_ref const & l)
        {
            current_note.span.end = l.next;
            ctx.result.form.notes.push_back(std::move(current_note));
            current_note = cst_note{};
            state = resume;
        }

//---------------------------------------------------------------------------

        inline void parser_impl::finish()
        {
            size_t last = 0;
            switch (state)
            {
                case scope::before_form:
                    add_error(document_error_kind::malformed_directive, last, "document has no form directive");
                    break;
                case scope::literal:
                    add_error(document_error_kind::unbalanced_directive, current_field.literal_loc.line,
                              "value block is never closed", directive_id(current_field.directive));
                    break;
                case scope::field:
                    add_error(document_error_kind::unbalanced_directive, current_field.directive.loc.line,
                              "field is never closed", directive_id(current_field.directive));
                    break;
                case scope::note:
                    add_error(document_error_kind::unbalanced_directive, current_note.directive.loc.line,
                              "note is never closed", directive_id(current_note.directive));
                    break;
                case scope::group:
                case scope::form:
                    add_error(document_error_kind::unbalanced_directive, last, "form is never closed");
                    break;
                case scope::after_form:
                    break;
            }
        }
    }

//========================================================================
// PARSER API implementation
//========================================================================

    inline parse_context parse(std::string_view input)
    {
        detail::parser_impl impl;
        impl.parse(input);
        return std::move(impl.ctx);
    }

} // namespace formwork

#endif // FORMWORK_PARSER_HPP
