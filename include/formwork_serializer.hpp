// formwork_serializer.hpp - Formwork - Serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_SERIALIZER_HPP
#define FORMWORK_SERIALIZER_HPP

#include "formwork_core.hpp"
#include "formwork_document.hpp"
#include "formwork_frontmatter.hpp"

#include <sstream>

namespace formwork
{
    //========================================================================
    // SERIALIZER API
    //========================================================================

    struct serialize_options
    {
        // Copy unchanged regions from the source text. Off regenerates the
        // document from the model alone.
        bool preserve_original_formatting = true;
    };

    std::string serialize(document const & doc, serialize_options opts = {});

    //========================================================================
    // SERIALIZER IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        inline std::string quote_attribute(std::string_view s)
        {
            std::string out = "\"";
            for (char c : s)
            {
                switch (c)
                {
                    case '"':  out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n";  break;
                    default:   out += c;      break;
                }
            }
            out += '"';
            return out;
        }

        // Whether the value is written as a literal or markers. Otherwise an
        // answered field carries state="answered".
        inline bool has_written_value(field_value const & v)
        {
            switch (kind_of(v))
            {
                case field_kind::text:          return !std::get<text_value>(v).text.empty();
                case field_kind::number:        return true;
                case field_kind::text_list:     return !std::get<text_list_value>(v).items.empty();
                case field_kind::single_choice: return std::get<single_choice_value>(v).selected.has_value();
                case field_kind::multi_choice:  return !std::get<multi_choice_value>(v).selected.empty();
                case field_kind::checkbox_set:  return !is_empty_value(v);
                case field_kind::url:           return !std::get<url_value>(v).url.empty();
                case field_kind::url_list:      return !std::get<url_list_value>(v).items.empty();
                case field_kind::date:          return !std::get<date_value>(v).date.empty();
                case field_kind::year:          return true;
                case field_kind::table:         return !std::get<table_value>(v).rows.empty();
            }
            return false;
        }

        inline std::string escape_cell(std::string_view s)
        {
            std::string out;
            for (char c : s)
            {
                if (c == '|') out += "\\|";
                else          out += c;
            }
            return out;
        }

        // Line ending of the first line, "\r\n" or "\n".
        inline std::string_view detect_line_ending(std::string_view text)
        {
            auto nl = text.find('\n');
            if (nl != std::string_view::npos && nl > 0 && text[nl - 1] == '\r')
                return "\r\n";
            return "\n";
        }

        // Rewrites bare '\n' line ends of a generated block as eol.
        inline std::string with_line_ending(std::string const & block, std::string_view eol)
        {
            if (eol == "\n")
                return block;

            std::string out;
            out.reserve(block.size() + block.size() / 16);
            for (size_t i = 0; i < block.size(); ++i)
            {
                if (block[i] == '\n' && (i == 0 || block[i - 1] != '\r'))
                    out += eol;
                else
                    out += block[i];
            }
            return out;
        }

        class serializer_impl
        {
        public:
            explicit serializer_impl(document const & doc)
                : doc_(doc)
            {}

            std::string canonical()
            {
                std::ostringstream out;

                auto fm = write_frontmatter(doc_.metadata());
                if (!fm.empty())
                    out << fm << '\n';

                out << "{% form id=" << quote_attribute(doc_.id());
                if (!doc_.title().empty())
                    out << " title=" << quote_attribute(doc_.title());
                out << " %}\n\n";

                for (auto const & g : doc_.groups())
                    write_group(out, g);

                for (auto const & n : doc_.notes())
                {
                    write_note(out, n);
                    out << '\n';
                }

                out << "{% /form %}\n";
                return out.str();
            }

            std::string preserving()
            {
                auto const & src  = doc_.source();
                auto const & text = src.text;
                auto const   eol  = detect_line_ending(text);

                struct splice
                {
                    size_t      begin;
                    size_t      end;
                    std::string replacement;
                };
                std::vector<splice> edits;

                for (auto const & region : src.fields)
                {
                    auto const * f = doc_.find_field(region.id);
                    if (!f || doc_.response(region.id) == region.parsed)
                        continue;

                    std::ostringstream block;
                    write_field(block, *f);
                    edits.push_back({ region.span.begin, region.span.end, with_line_ending(block.str(), eol) });
                }

                for (auto const & region : src.notes)
                {
                    auto const * n = doc_.find_note(region.id);
                    if (n && *n == region.parsed)
                        continue;

                    if (n)
                    {
                        std::ostringstream block;
                        write_note(block, *n);
                        edits.push_back({ region.span.begin, region.span.end, with_line_ending(block.str(), eol) });
                    }
                    else
                    {
                        // Removed: take one following blank line with it.
                        size_t end = region.span.end;
                        if (end < text.size() && text[end] == '\n')
                            ++end;
                        else if (end + 1 < text.size() && text[end] == '\r' && text[end + 1] == '\n')
                            end += 2;
                        edits.push_back({ region.span.begin, end, {} });
                    }
                }

                std::string added;
                for (auto const & n : doc_.notes())
                {
                    bool known = std::any_of(src.notes.begin(), src.notes.end(),
                                             [&](auto const & r) { return r.id == n.id; });
                    if (known)
                        continue;

                    std::ostringstream block;
                    write_note(block, n);
                    added += with_line_ending(block.str() + "\n", eol);
                }

                if (!added.empty())
                {
                    size_t at = src.form_close == npos() ? text.size() : src.form_close;
                    edits.push_back({ at, at, std::move(added) });
                }

                std::stable_sort(edits.begin(), edits.end(),
                                 [](splice const & a, splice const & b) { return a.begin < b.begin; });

                std::string out;
                out.reserve(text.size() + 256);
                size_t cursor = 0;
                for (auto const & e : edits)
                {
                    out.append(text, cursor, e.begin - cursor);
                    out += e.replacement;
                    cursor = e.end;
                }
                out.append(text, cursor, std::string::npos);
                return out;
            }

        private:
            document const & doc_;

            void write_group(std::ostringstream & out, group const & g)
            {
                if (!g.implicit)
                {
                    out << "{% group id=" << quote_attribute(g.id);
                    if (!g.title.empty())
                        out << " title=" << quote_attribute(g.title);
                    if (g.order)
                        out << " order=" << *g.order;
                    if (g.parallel)
                        out << " parallel=" << quote_attribute(*g.parallel);
                    if (g.serial)
                        out << " serial=true";
                    out << " %}\n\n";
                }

                for (auto const & f : g.fields)
                {
                    write_field(out, f);
                    out << '\n';
                }

                if (!g.implicit)
                    out << "{% /group %}\n\n";
            }

            void write_field_attributes(std::ostringstream & out, field const & f)
            {
                out << "kind=" << quote_attribute(kind_to_string(f.kind))
                    << " id=" << quote_attribute(f.id)
                    << " label=" << quote_attribute(f.label);

                if (f.required)
                    out << " required=true";
                if (f.role != "agent")
                    out << " role=" << quote_attribute(f.role);
                if (f.priority != field_priority::medium)
                    out << " priority=" << quote_attribute(priority_to_string(f.priority));
                if (f.order)
                    out << " order=" << *f.order;
                if (f.parallel)
                    out << " parallel=" << quote_attribute(*f.parallel);
                if (f.serial)
                    out << " serial=true";
                if (f.depends_on)
                    out << " depends_on=" << quote_attribute(*f.depends_on);
                if (f.when)
                    out << " when=" << quote_attribute(*f.when);

                auto count = [&](char const * name, std::optional<int64_t> v)
                {
                    if (v) out << ' ' << name << '=' << *v;
                };
                auto number = [&](char const * name, std::optional<double> v)
                {
                    if (v) out << ' ' << name << '=' << format_number(*v);
                };

                switch (f.kind)
                {
                    case field_kind::text:
                        if (f.multiline) out << " multiline=true";
                        if (f.pattern)   out << " pattern=" << quote_attribute(*f.pattern);
                        count("min_length", f.min_length);
                        count("max_length", f.max_length);
                        break;
                    case field_kind::number:
                        number("min", f.min);
                        number("max", f.max);
                        if (f.integer) out << " integer=true";
                        break;
                    case field_kind::year:
                        number("min", f.min);
                        number("max", f.max);
                        break;
                    case field_kind::date:
                        if (f.min_date) out << " min=" << quote_attribute(*f.min_date);
                        if (f.max_date) out << " max=" << quote_attribute(*f.max_date);
                        break;
                    case field_kind::text_list:
                    case field_kind::url_list:
                        count("min_items", f.min_items);
                        count("max_items", f.max_items);
                        if (f.unique_items) out << " unique_items=true";
                        break;
                    case field_kind::multi_choice:
                        count("min_selections", f.min_selections);
                        count("max_selections", f.max_selections);
                        break;
                    case field_kind::checkbox_set:
                        if (f.mode != checkbox_mode::status)
                            out << " checkbox_mode=" << quote_attribute(mode_to_string(f.mode));
                        count("min_done", f.min_done);
                        if (f.approval != approval_mode::none)
                            out << " approval=" << quote_attribute(approval_to_string(f.approval));
                        break;
                    case field_kind::table:
                        count("min_rows", f.min_rows);
                        count("max_rows", f.max_rows);
                        break;
                    case field_kind::single_choice:
                    case field_kind::url:
                        break;
                }
            }

            void write_field(std::ostringstream & out, field const & f)
            {
                auto const & resp = doc_.response(f.id);
                bool written = resp.state == answer_state::answered && resp.value && has_written_value(*resp.value);

                out << "{% field ";
                write_field_attributes(out, f);

                switch (resp.state)
                {
                    case answer_state::skipped:
                    case answer_state::aborted:
                        out << " state=" << quote_attribute(state_to_string(resp.state));
                        if (resp.reason)
                            out << " reason=" << quote_attribute(*resp.reason);
                        break;
                    case answer_state::answered:
                        if (!written)
                            out << " state=\"answered\"";
                        break;
                    case answer_state::unanswered:
                        break;
                }
                out << " %}\n";

                if (!f.prompt.empty())
                    out << f.prompt << '\n';

                field_value const * value = written ? &*resp.value : nullptr;

                if (f.has_options())
                    write_options(out, f, resp.state == answer_state::answered && resp.value ? &*resp.value : nullptr);

                for (auto const & c : f.columns)
                {
                    out << "{% column id=" << quote_attribute(c.id)
                        << " label=" << quote_attribute(c.label);
                    if (c.type != column_type::text)
                        out << " type=" << quote_attribute(column_type_to_string(c.type));
                    if (c.required)
                        out << " required=true";
                    out << " /%}\n";
                }

                if (value && !f.has_options())
                {
                    out << "```value\n";
                    write_literal(out, f, *value);
                    out << "```\n";
                }

                out << "{% /field %}\n";
            }

            void write_options(std::ostringstream & out, field const & f, field_value const * value)
            {
                for (auto const & o : f.options)
                {
                    checkbox_status mark = checkbox_status::todo;
                    if (value)
                    {
                        std::visit([&](auto const & v)
                        {
                            using T = std::decay_t<decltype(v)>;
                            if constexpr (std::is_same_v<T, single_choice_value>)
                            {
                                if (v.selected == o.id) mark = checkbox_status::done;
                            }
                            else if constexpr (std::is_same_v<T, multi_choice_value>)
                            {
                                if (std::find(v.selected.begin(), v.selected.end(), o.id) != v.selected.end())
                                    mark = checkbox_status::done;
                            }
                            else if constexpr (std::is_same_v<T, checkbox_value>)
                            {
                                if (auto it = v.marks.find(o.id); it != v.marks.end())
                                    mark = it->second;
                            }
                        }, *value);
                    }
                    out << "- [" << status_to_marker(mark) << "] " << o.label << " {% #" << o.id << " %}\n";
                }
            }

            void write_literal(std::ostringstream & out, field const & f, field_value const & value)
            {
                std::visit([&](auto const & v)
                {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, text_value>)
                        out << v.text << '\n';
                    else if constexpr (std::is_same_v<T, number_value>)
                        out << format_number(v.number) << '\n';
                    else if constexpr (std::is_same_v<T, text_list_value> || std::is_same_v<T, url_list_value>)
                    {
                        for (auto const & item : v.items)
                            out << item << '\n';
                    }
                    else if constexpr (std::is_same_v<T, url_value>)
                        out << v.url << '\n';
                    else if constexpr (std::is_same_v<T, date_value>)
                        out << v.date << '\n';
                    else if constexpr (std::is_same_v<T, year_value>)
                        out << v.year << '\n';
                    else if constexpr (std::is_same_v<T, table_value>)
                        write_table(out, f, v);
                }, value);
            }

            void write_table(std::ostringstream & out, field const & f, table_value const & t)
            {
                // Labels head the table unless two columns share one.
                bool labels_unique = true;
                for (size_t i = 0; i < f.columns.size(); ++i)
                    for (size_t j = i + 1; j < f.columns.size(); ++j)
                        if (f.columns[i].label == f.columns[j].label)
                            labels_unique = false;

                std::vector<std::string> header;
                std::vector<std::string> sep;
                for (auto const & c : f.columns)
                {
                    header.push_back(escape_cell(labels_unique && !c.label.empty() ? c.label : c.id));
                    sep.push_back("---");
                }

                out << "| " << join(header, " | ") << " |\n";
                out << "| " << join(sep, " | ") << " |\n";

                for (auto const & row : t.rows)
                {
                    std::vector<std::string> cells;
                    for (auto const & c : f.columns)
                    {
                        auto it = row.find(c.id);
                        if (it == row.end())
                        {
                            cells.push_back({});
                            continue;
                        }

                        auto const & cell = it->second;
                        std::string text;
                        switch (cell.state)
                        {
                            case cell_state::skipped:
                            case cell_state::aborted:
                                text = cell.state == cell_state::skipped ? "%SKIP%" : "%ABORT%";
                                if (cell.reason)
                                    text += " (" + escape_cell(*cell.reason) + ")";
                                break;
                            case cell_state::answered:
                                if (auto d = std::get_if<double>(&cell.value))
                                    text = format_number(*d);
                                else
                                    text = escape_cell(std::get<std::string>(cell.value));
                                break;
                        }
                        cells.push_back(std::move(text));
                    }
                    out << "| " << join(cells, " | ") << " |\n";
                }
            }

            void write_note(std::ostringstream & out, note const & n)
            {
                out << "{% note id=" << quote_attribute(n.id)
                    << " ref=" << quote_attribute(n.ref)
                    << " role=" << quote_attribute(n.role) << " %}\n";
                if (!n.text.empty())
                    out << n.text << '\n';
                out << "{% /note %}\n";
            }
        };
    }

    //========================================================================
    // SERIALIZER API implementation
    //========================================================================

    inline std::string serialize(document const & doc, serialize_options opts)
    {
        detail::serializer_impl impl(doc);

        if (opts.preserve_original_formatting && doc.source().present)
            return impl.preserving();

        return impl.canonical();
    }

} // namespace formwork

#endif // FORMWORK_SERIALIZER_HPP
