// formwork_materialise.hpp - Formwork - Schema construction and value materialiser
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_MATERIALISE_HPP
#define FORMWORK_MATERIALISE_HPP

#include "formwork_core.hpp"
#include "formwork_parser.hpp"
#include "formwork_document.hpp"
#include "formwork_frontmatter.hpp"

#include <regex>
#include <set>

namespace formwork
{
    using load_context = context<document, document_error>;

    class attribute_reader;

    // Facade
    load_context materialise(parse_context const & ctx);

//========================================================================
// materialiser
//========================================================================

    struct materialiser
    {
        explicit materialiser(parse_context const & ctx);

        load_context run();

    private:
        // Immutable input
        parse_context const & ctx_;
        cst_document const &  cst_;

        // Output
        load_context          out_;
        document &            doc_;

        // State
        std::set<std::string> ids_;

        // Helpers
        void add_error(document_error_kind kind, source_location loc, std::string message, std::string ref = {});
        bool claim_id(std::string const & id, source_location loc);

        void handle_frontmatter();
        void handle_form();
        void handle_group(cst_group const & cg);
        void handle_field(cst_field const & cf, group & owner);
        void handle_note(cst_note const & cn);
        void check_references();
        bool on_dependency_cycle(field const & f) const;

        void read_kind_attributes(field & f, attribute_reader & r);
        bool read_options(field & f, cst_field const & cf);
        bool read_columns(field & f, cst_field const & cf);

        std::optional<field_value> read_markers(field const & f, cst_field const & cf, bool & any_marked);
        std::optional<field_value> read_literal(field const & f, cst_field const & cf);
        std::optional<table_value> read_table(field const & f, cst_field const & cf);
    };

//========================================================================
// Attribute reading
//========================================================================

    // Typed access to a directive's attributes. Attributes never read are reported by finish().
    class attribute_reader
    {
    public:
        attribute_reader(cst_directive const & d, std::vector<document_error> & errors)
            : d_(d)
            , errors_(errors)
            , used_(d.attrs.size(), false)
        {}

        bool has(std::string_view name) const
        {
            return find_attribute(d_, name) != nullptr;
        }

        std::optional<std::string> str(std::string_view name)
        {
            auto a = take(name);
            if (!a) return std::nullopt;
            if (auto s = std::get_if<std::string>(&a->value))
                return *s;
            invalid(name, "must be a quoted string");
            return std::nullopt;
        }

        std::optional<std::string> required_str(std::string_view name)
        {
            if (!has(name))
            {
                errors_.push_back({ document_error_kind::missing_attribute, d_.loc,
                                    "'" + d_.name + "' requires attribute '" + std::string(name) + "'",
                                    directive_id(d_) });
                return std::nullopt;
            }
            auto s = str(name);
            if (s && s->empty())
            {
                invalid(name, "must not be empty");
                return std::nullopt;
            }
            return s;
        }

        std::optional<int64_t> integer(std::string_view name)
        {
            auto a = take(name);
            if (!a) return std::nullopt;
            if (auto i = std::get_if<int64_t>(&a->value))
                return *i;
            invalid(name, "must be an integer");
            return std::nullopt;
        }

        std::optional<int64_t> count(std::string_view name)
        {
            auto v = integer(name);
            if (v && *v < 0)
            {
                invalid(name, "must not be negative");
                return std::nullopt;
            }
            return v;
        }

        std::optional<double> number(std::string_view name)
        {
            auto a = take(name);
            if (!a) return std::nullopt;
            if (auto i = std::get_if<int64_t>(&a->value))
                return static_cast<double>(*i);
            if (auto d = std::get_if<double>(&a->value))
                return *d;
            invalid(name, "must be a number");
            return std::nullopt;
        }

        std::optional<bool> boolean(std::string_view name)
        {
            auto a = take(name);
            if (!a) return std::nullopt;
            if (auto b = std::get_if<bool>(&a->value))
                return *b;
            invalid(name, "must be true or false");
            return std::nullopt;
        }

        void invalid(std::string_view name, std::string_view why)
        {
            errors_.push_back({ document_error_kind::invalid_attribute, d_.loc,
                                "attribute '" + std::string(name) + "' of '" + d_.name + "' " + std::string(why),
                                directive_id(d_) });
        }

        void finish()
        {
            for (size_t i = 0; i < d_.attrs.size(); ++i)
                if (!used_[i])
                    invalid(d_.attrs[i].name, "is not recognised here");
        }

    private:
        attribute const * take(std::string_view name)
        {
            for (size_t i = 0; i < d_.attrs.size(); ++i)
                if (d_.attrs[i].name == name)
                {
                    used_[i] = true;
                    return &d_.attrs[i];
                }
            return nullptr;
        }

        cst_directive const &         d_;
        std::vector<document_error> & errors_;
        std::vector<bool>             used_;
    };

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        // Splits a pipe-table row on unescaped '|'; "\|" becomes '|'.
        inline std::vector<std::string> split_pipe_row(std::string_view line)
        {
            auto t = trim_sv(line);
            if (t.starts_with("|"))
                t.remove_prefix(1);
            if (t.ends_with("|") && !t.ends_with("\\|"))
                t.remove_suffix(1);

            std::vector<std::string> cells;
            std::string current;
            for (size_t i = 0; i < t.size(); ++i)
            {
                if (t[i] == '\\' && i + 1 < t.size() && t[i + 1] == '|')
                {
                    current += '|';
                    ++i;
                }
                else if (t[i] == '|')
                {
                    cells.push_back(std::string(trim_sv(current)));
                    current.clear();
                }
                else
                    current += t[i];
            }
            cells.push_back(std::string(trim_sv(current)));
            return cells;
        }

        inline bool is_separator_cell(std::string_view c)
        {
            return !c.empty() && c.find_first_not_of("-:") == std::string_view::npos;
        }

        inline std::string join_trimmed_block(std::vector<std::string> const & lines)
        {
            std::string out;
            for (size_t i = 0; i < lines.size(); ++i)
            {
                if (i) out += '\n';
                out += lines[i];
            }
            return std::string(trim_sv(out));
        }

        // "%SKIP%", "%ABORT%" with an optional "(reason)".
        inline std::optional<table_cell> parse_sentinel_cell(std::string_view t, std::string & err)
        {
            table_cell cell;
            std::string_view rest;

            if (t.starts_with("%SKIP%"))
            {
                cell.state = cell_state::skipped;
                rest = trim_sv(t.substr(6));
            }
            else if (t.starts_with("%ABORT%"))
            {
                cell.state = cell_state::aborted;
                rest = trim_sv(t.substr(7));
            }
            else
                return std::nullopt;

            cell.value = std::string{};

            if (!rest.empty())
            {
                if (rest.front() != '(' || rest.back() != ')')
                {
                    err = "cell reason must be written in parentheses";
                    return std::nullopt;
                }
                cell.reason = std::string(trim_sv(rest.substr(1, rest.size() - 2)));
            }
            return cell;
        }
    }

//---------------------------------------------------------------------------

    inline materialiser::materialiser(parse_context const & ctx)
        : ctx_(ctx)
        , cst_(ctx.result)
        , out_{}
        , doc_(out_.result)
    {}

    inline load_context materialiser::run()
    {
        handle_frontmatter();
        handle_form();

        for (auto const & cg : cst_.form.groups)
            handle_group(cg);

        for (auto const & cn : cst_.form.notes)
            handle_note(cn);

        check_references();

        auto & src = doc_.source_;
        src.present          = true;
        src.text             = cst_.text;
        src.frontmatter      = cst_.frontmatter_span;
        src.form_close       = cst_.form.close_offset;

        return std::move(out_);
    }

//---------------------------------------------------------------------------

    inline void materialiser::add_error(document_error_kind kind, source_location loc, std::string message, std::string ref)
    {
        out_.errors.push_back({ kind, loc, std::move(message), std::move(ref) });
    }

    inline bool materialiser::claim_id(std::string const & id, source_location loc)
    {
        if (!ids_.insert(id).second)
        {
            add_error(document_error_kind::duplicate_id, loc, "id '" + id + "' is already declared", id);
            return false;
        }
        return true;
    }

//---------------------------------------------------------------------------

    inline void materialiser::handle_frontmatter()
    {
        if (!cst_.frontmatter)
            return;

        auto fm = read_frontmatter(*cst_.frontmatter, cst_.frontmatter_loc);
        doc_.metadata_ = std::move(fm.result);
        for (auto & e : fm.errors)
            out_.errors.push_back(std::move(e));
    }

    inline void materialiser::handle_form()
    {
        if (!cst_.form.directive)
            return;

        attribute_reader r(*cst_.form.directive, out_.errors);

        if (auto id = r.required_str("id"))
        {
            doc_.id_ = *id;
            claim_id(*id, cst_.form.directive->loc);
        }
        doc_.title_ = r.str("title").value_or("");
        r.finish();
    }

//---------------------------------------------------------------------------

    inline void materialiser::handle_group(cst_group const & cg)
    {
        group g;

        if (cg.directive)
        {
            attribute_reader r(*cg.directive, out_.errors);

            if (auto id = r.required_str("id"))
            {
                g.id = *id;
                claim_id(*id, cg.directive->loc);
            }
            g.title    = r.str("title").value_or("");
            g.order    = r.integer("order");
            g.parallel = r.str("parallel");
            g.serial   = r.boolean("serial").value_or(false);
            r.finish();
        }
        else
            g.implicit = true;

        for (auto const & cf : cg.fields)
            handle_field(cf, g);

        doc_.groups_.push_back(std::move(g));
    }

//---------------------------------------------------------------------------

    inline void materialiser::handle_field(cst_field const & cf, group & owner)
    {
        auto const & d = cf.directive;
        attribute_reader r(d, out_.errors);

        auto id        = r.required_str("id");
        auto kind_name = r.required_str("kind");

        std::optional<field_kind> kind;
        if (kind_name)
        {
            kind = detail::parse_kind(*kind_name);
            if (!kind)
                add_error(document_error_kind::unknown_field_kind, d.loc,
                          "unknown field kind '" + *kind_name + "'", id.value_or(""));
        }

        if (!id || !kind)
        {
            r.finish();
            return;
        }

        if (!claim_id(*id, d.loc))
        {
            r.finish();
            return;
        }

        field f;
        f.id    = *id;
        f.kind  = *kind;
        f.label = r.str("label").value_or(f.id);

        f.required = r.boolean("required").value_or(false);

        if (auto role = r.str("role"))
        {
            if (role->empty())
                r.invalid("role", "must not be empty");
            else
                f.role = *role;
        }

        if (auto p = r.str("priority"))
        {
            if (auto pr = detail::parse_priority(*p))
                f.priority = *pr;
            else
                r.invalid("priority", "must be high, medium or low");
        }

        f.order      = r.integer("order");
        f.parallel   = r.str("parallel");
        f.serial     = r.boolean("serial").value_or(false);
        f.depends_on = r.str("depends_on");
        f.when       = r.str("when");

        read_kind_attributes(f, r);

        std::optional<answer_state> declared_state;
        if (auto s = r.str("state"))
        {
            declared_state = detail::parse_state(*s);
            if (!declared_state)
                r.invalid("state", "must be answered, skipped or aborted");
        }

        auto reason = r.str("reason");
        r.finish();

        f.prompt = detail::join_trimmed_block(cf.prompt_lines);

        bool structure_ok = read_options(f, cf);
        structure_ok = read_columns(f, cf) && structure_ok;

        // Response
        field_response resp;
        std::optional<field_value> value;
        bool any_marked = false;

        if (structure_ok)
        {
            if (f.has_options())
            {
                if (cf.literal)
                    add_error(document_error_kind::type_mismatch_in_literal, cf.literal_loc,
                              "field '" + f.id + "' takes its value from option markers, not a value block", f.id);
                else
                    value = read_markers(f, cf, any_marked);
            }
            else if (cf.literal)
                value = read_literal(f, cf);
        }

        bool has_value = value.has_value() && (f.has_options() ? any_marked : cf.literal.has_value());

        if (reason && declared_state != answer_state::skipped && declared_state != answer_state::aborted)
            add_error(document_error_kind::invalid_attribute, d.loc,
                      "attribute 'reason' requires state=\"skipped\" or state=\"aborted\"", f.id);

        if (declared_state == answer_state::skipped || declared_state == answer_state::aborted)
        {
            if (has_value)
                add_error(document_error_kind::type_mismatch_in_literal, d.loc,
                          "field '" + f.id + "' is " + std::string(detail::state_to_string(*declared_state)) +
                          " but carries a value", f.id);
            resp.state  = *declared_state;
            resp.reason = reason;
        }
        else if (declared_state == answer_state::answered)
        {
            if (value)
                resp = field_response::answered(std::move(*value));
            else if (f.kind == field_kind::number || f.kind == field_kind::year)
                add_error(document_error_kind::type_mismatch_in_literal, d.loc,
                          "answered " + std::string(detail::kind_to_string(f.kind)) + " field '" + f.id +
                          "' has no value block", f.id);
            else
                resp = field_response::answered(make_empty_value(f.kind));
        }
        else if (has_value)
        {
            resp = field_response::answered(std::move(*value));
        }

        if (resp.state != answer_state::unanswered)
            doc_.responses_[f.id] = resp;

        doc_.source_.fields.push_back({ f.id, cf.span, resp });
        owner.fields.push_back(std::move(f));
    }

//---------------------------------------------------------------------------

    inline void materialiser::read_kind_attributes(field & f, attribute_reader & r)
    {
        switch (f.kind)
        {
            case field_kind::text:
                f.multiline  = r.boolean("multiline").value_or(false);
                f.pattern    = r.str("pattern");
                f.min_length = r.count("min_length");
                f.max_length = r.count("max_length");
                if (f.pattern)
                {
                    try
                    {
                        std::regex re(*f.pattern, std::regex::ECMAScript);
                    }
                    catch (std::regex_error const &)
                    {
                        r.invalid("pattern", "is not a valid regular expression");
                    }
                }
                break;

            case field_kind::number:
                f.min     = r.number("min");
                f.max     = r.number("max");
                f.integer = r.boolean("integer").value_or(false);
                break;

            case field_kind::year:
                f.min = r.number("min");
                f.max = r.number("max");
                break;

            case field_kind::date:
                f.min_date = r.str("min");
                f.max_date = r.str("max");
                if (f.min_date && !detail::is_calendar_date(*f.min_date))
                    r.invalid("min", "must be a YYYY-MM-DD date");
                if (f.max_date && !detail::is_calendar_date(*f.max_date))
                    r.invalid("max", "must be a YYYY-MM-DD date");
                break;

            case field_kind::text_list:
            case field_kind::url_list:
                f.min_items    = r.count("min_items");
                f.max_items    = r.count("max_items");
                f.unique_items = r.boolean("unique_items").value_or(false);
                break;

            case field_kind::multi_choice:
                f.min_selections = r.count("min_selections");
                f.max_selections = r.count("max_selections");
                break;

            case field_kind::checkbox_set:
                if (auto m = r.str("checkbox_mode"))
                {
                    if (auto mode = detail::parse_mode(*m))
                        f.mode = *mode;
                    else
                        r.invalid("checkbox_mode", "must be simple or status");
                }
                f.min_done = r.count("min_done");
                if (auto a = r.str("approval"))
                {
                    if (auto ap = detail::parse_approval(*a))
                        f.approval = *ap;
                    else
                        r.invalid("approval", "must be none or blocking");
                }
                break;

            case field_kind::table:
                f.min_rows = r.count("min_rows");
                f.max_rows = r.count("max_rows");
                break;

            case field_kind::single_choice:
            case field_kind::url:
                break;
        }
    }

//---------------------------------------------------------------------------

    inline bool materialiser::read_options(field & f, cst_field const & cf)
    {
        if (!f.has_options())
        {
            if (!cf.options.empty())
            {
                add_error(document_error_kind::malformed_directive, cf.options.front().loc,
                          "options are only allowed on choice and checkbox fields", f.id);
                return false;
            }
            return true;
        }

        if (cf.options.empty())
        {
            add_error(document_error_kind::malformed_directive, cf.directive.loc,
                      "field '" + f.id + "' declares no options", f.id);
            return false;
        }

        bool ok = true;
        for (auto const & co : cf.options)
        {
            if (f.find_option(co.id))
            {
                add_error(document_error_kind::duplicate_id, co.loc,
                          "option '" + co.id + "' is declared twice in field '" + f.id + "'", f.id);
                ok = false;
                continue;
            }
            f.options.push_back({ co.id, co.label });
        }
        return ok;
    }

//---------------------------------------------------------------------------

    inline bool materialiser::read_columns(field & f, cst_field const & cf)
    {
        if (f.kind != field_kind::table)
        {
            if (!cf.columns.empty())
            {
                add_error(document_error_kind::unbalanced_directive, cf.columns.front().loc,
                          "columns are only allowed on table fields", f.id);
                return false;
            }
            return true;
        }

        if (cf.columns.empty())
        {
            add_error(document_error_kind::malformed_directive, cf.directive.loc,
                      "table field '" + f.id + "' declares no columns", f.id);
            return false;
        }

        bool ok = true;
        for (auto const & cd : cf.columns)
        {
            attribute_reader r(cd, out_.errors);

            column c;
            auto id = r.required_str("id");
            c.label = r.str("label").value_or(id.value_or(""));
            if (auto t = r.str("type"))
            {
                if (auto ct = detail::parse_column_type(*t))
                    c.type = *ct;
                else
                {
                    r.invalid("type", "must be text, number, url, date or year");
                    ok = false;
                }
            }
            c.required = r.boolean("required").value_or(false);
            r.finish();

            if (!id)
            {
                ok = false;
                continue;
            }
            c.id = *id;

            if (f.find_column(c.id))
            {
                add_error(document_error_kind::duplicate_id, cd.loc,
                          "column '" + c.id + "' is declared twice in table '" + f.id + "'", f.id);
                ok = false;
                continue;
            }
            f.columns.push_back(std::move(c));
        }
        return ok;
    }

//---------------------------------------------------------------------------

    inline std::optional<field_value>
    materialiser::read_markers(field const & f, cst_field const & cf, bool & any_marked)
    {
        bool ok = true;
        auto bad_marker = [&](cst_option const & co)
        {
            add_error(document_error_kind::type_mismatch_in_literal, co.loc,
                      std::string("marker '") + co.marker + "' is not valid for " +
                      std::string(detail::kind_to_string(f.kind)) + " field '" + f.id + "'", f.id);
            ok = false;
        };

        switch (f.kind)
        {
            case field_kind::single_choice:
            {
                single_choice_value v;
                for (auto const & co : cf.options)
                {
                    auto st = detail::marker_to_status(co.marker);
                    if (st != checkbox_status::todo && st != checkbox_status::done)
                        bad_marker(co);
                    else if (st == checkbox_status::done)
                    {
                        if (v.selected)
                        {
                            add_error(document_error_kind::type_mismatch_in_literal, co.loc,
                                      "single-choice field '" + f.id + "' has more than one selection", f.id);
                            ok = false;
                        }
                        v.selected = co.id;
                    }
                }
                any_marked = v.selected.has_value();
                if (!ok) return std::nullopt;
                return v;
            }

            case field_kind::multi_choice:
            {
                multi_choice_value v;
                for (auto const & co : cf.options)
                {
                    auto st = detail::marker_to_status(co.marker);
                    if (st != checkbox_status::todo && st != checkbox_status::done)
                        bad_marker(co);
                    else if (st == checkbox_status::done)
                        v.selected.push_back(co.id);
                }
                any_marked = !v.selected.empty();
                if (!ok) return std::nullopt;
                return v;
            }

            case field_kind::checkbox_set:
            {
                checkbox_value v;
                for (auto const & co : cf.options)
                {
                    auto st = detail::marker_to_status(co.marker);
                    bool simple_ok = st == checkbox_status::todo || st == checkbox_status::done;
                    if (!st || (f.mode == checkbox_mode::simple && !simple_ok))
                    {
                        bad_marker(co);
                        continue;
                    }
                    v.marks[co.id] = *st;
                    if (*st != checkbox_status::todo)
                        any_marked = true;
                }
                if (!ok) return std::nullopt;
                return v;
            }

            default:
                return std::nullopt;
        }
    }

//---------------------------------------------------------------------------

    inline std::optional<field_value>
    materialiser::read_literal(field const & f, cst_field const & cf)
    {
        auto const & lines = *cf.literal;
        auto mismatch = [&](std::string const & what) -> std::optional<field_value>
        {
            add_error(document_error_kind::type_mismatch_in_literal, cf.literal_loc,
                      "value of " + std::string(detail::kind_to_string(f.kind)) + " field '" + f.id + "' " + what, f.id);
            return std::nullopt;
        };

        std::vector<std::string> items;
        for (auto const & l : lines)
            if (!detail::is_blank(l))
                items.push_back(std::string(detail::trim_sv(l)));

        switch (f.kind)
        {
            case field_kind::text:
            {
                std::string text;
                for (size_t i = 0; i < lines.size(); ++i)
                {
                    if (i) text += '\n';
                    text += lines[i];
                }
                return text_value{ std::move(text) };
            }

            case field_kind::number:
            {
                if (items.size() != 1)
                    return mismatch("must be a single number");
                auto d = detail::parse_double(items.front());
                if (!d)
                    return mismatch("'" + items.front() + "' is not a number");
                return number_value{ *d };
            }

            case field_kind::year:
            {
                if (items.size() != 1)
                    return mismatch("must be a single year");
                auto y = detail::parse_int(items.front());
                if (!y)
                    return mismatch("'" + items.front() + "' is not an integer year");
                return year_value{ *y };
            }

            case field_kind::text_list:
                return text_list_value{ std::move(items) };

            case field_kind::url_list:
                return url_list_value{ std::move(items) };

            case field_kind::url:
                if (items.size() > 1)
                    return mismatch("must be a single line");
                return url_value{ items.empty() ? std::string{} : items.front() };

            case field_kind::date:
                if (items.size() > 1)
                    return mismatch("must be a single line");
                if (!items.empty() && !detail::is_date_shaped(items.front()))
                    return mismatch("'" + items.front() + "' is not shaped YYYY-MM-DD");
                return date_value{ items.empty() ? std::string{} : items.front() };

            case field_kind::table:
            {
                auto t = read_table(f, cf);
                if (!t) return std::nullopt;
                return *t;
            }

            default:
                return mismatch("cannot be written as a value block");
        }
    }

//---------------------------------------------------------------------------

    inline std::optional<table_value>
    materialiser::read_table(field const & f, cst_field const & cf)
    {
        auto mismatch = [&](std::string const & what) -> std::optional<table_value>
        {
            add_error(document_error_kind::type_mismatch_in_literal, cf.literal_loc,
                      "table '" + f.id + "': " + what, f.id);
            return std::nullopt;
        };

        std::vector<std::string> lines;
        for (auto const & l : *cf.literal)
            if (!detail::is_blank(l))
                lines.push_back(l);

        if (lines.empty())
            return table_value{};

        if (lines.size() < 2)
            return mismatch("a header row and a separator row are required");

        std::vector<column const *> header;
        for (auto const & h : detail::split_pipe_row(lines[0]))
        {
            column const * col = f.find_column(h);
            if (!col)
                for (auto const & c : f.columns)
                    if (c.label == h) { col = &c; break; }

            if (!col)
                return mismatch("unknown column '" + h + "'");
            if (std::find(header.begin(), header.end(), col) != header.end())
                return mismatch("column '" + h + "' appears twice in the header");
            header.push_back(col);
        }

        auto sep = detail::split_pipe_row(lines[1]);
        if (sep.size() != header.size() ||
            !std::all_of(sep.begin(), sep.end(), [](auto const & c) { return detail::is_separator_cell(c); }))
            return mismatch("second row must separate the header with dashes");

        table_value tv;
        for (size_t r = 2; r < lines.size(); ++r)
        {
            auto cells = detail::split_pipe_row(lines[r]);
            if (cells.size() != header.size())
                return mismatch("row " + std::to_string(r - 1) + " has " + std::to_string(cells.size()) +
                                " cells, expected " + std::to_string(header.size()));

            table_row row;
            for (size_t c = 0; c < cells.size(); ++c)
            {
                auto const & text = cells[c];
                auto const & col  = *header[c];

                if (text.empty())
                    continue;

                std::string err;
                if (auto sentinel = detail::parse_sentinel_cell(text, err))
                {
                    row[col.id] = *sentinel;
                    continue;
                }
                if (!err.empty())
                    return mismatch(err);

                table_cell cell;
                switch (col.type)
                {
                    case column_type::number:
                    {
                        auto d = detail::parse_double(text);
                        if (!d)
                            return mismatch("'" + text + "' in column '" + col.id + "' is not a number");
                        cell.value = *d;
                        break;
                    }
                    case column_type::year:
                    {
                        auto y = detail::parse_int(text);
                        if (!y)
                            return mismatch("'" + text + "' in column '" + col.id + "' is not a year");
                        cell.value = static_cast<double>(*y);
                        break;
                    }
                    default:
                        cell.value = text;
                        break;
                }
                row[col.id] = std::move(cell);
            }
            tv.rows.push_back(std::move(row));
        }
        return tv;
    }

//---------------------------------------------------------------------------

    inline void materialiser::handle_note(cst_note const & cn)
    {
        attribute_reader r(cn.directive, out_.errors);

        auto id  = r.required_str("id");
        auto ref = r.required_str("ref");
        auto role = r.str("role").value_or("agent");
        r.finish();

        if (!id || !ref || !claim_id(*id, cn.directive.loc))
            return;

        note n{ *id, *ref, role, detail::join_trimmed_block(cn.body) };
        doc_.source_.notes.push_back({ n.id, cn.span, n });
        doc_.notes_.push_back(std::move(n));
    }

//---------------------------------------------------------------------------

    // True when following depends_on from f leads back to f.
    inline bool materialiser::on_dependency_cycle(field const & f) const
    {
        std::set<std::string> seen;
        auto const * cur = &f;

        while (cur->depends_on && seen.insert(cur->id).second)
        {
            cur = doc_.find_field(*cur->depends_on);
            if (!cur)
                return false;
            if (cur->id == f.id)
                return true;
        }
        return false;
    }

//---------------------------------------------------------------------------

    inline void materialiser::check_references()
    {
        auto line_of = [&](std::string const & id) -> source_location
        {
            for (auto const & cg : cst_.form.groups)
                for (auto const & cf : cg.fields)
                    if (directive_id(cf.directive) == id)
                        return cf.directive.loc;
            return {};
        };

        for (auto const & g : doc_.groups_)
            for (auto const & f : g.fields)
            {
                if (f.depends_on)
                {
                    if (*f.depends_on == f.id)
                        add_error(document_error_kind::unknown_reference, line_of(f.id),
                                  "field '" + f.id + "' depends on itself", f.id);
                    else if (!doc_.find_field(*f.depends_on))
                        add_error(document_error_kind::unknown_reference, line_of(f.id),
                                  "field '" + f.id + "' depends on unknown field '" + *f.depends_on + "'", f.id);
                    else if (on_dependency_cycle(f))
                        add_error(document_error_kind::unknown_reference, line_of(f.id),
                                  "field '" + f.id + "' is part of a dependency cycle", f.id);
                }
                else if (f.when)
                {
                    add_error(document_error_kind::missing_attribute, line_of(f.id),
                              "field '" + f.id + "' has 'when' without 'depends_on'", f.id);
                }
            }

        for (auto const & cn : cst_.form.notes)
        {
            auto const * n = doc_.find_note(directive_id(cn.directive));
            if (!n)
                continue;

            bool known = n->ref == doc_.id_ || doc_.find_group(n->ref) || doc_.find_field(n->ref);
            if (!known)
                add_error(document_error_kind::unknown_reference, cn.directive.loc,
                          "note '" + n->id + "' refers to unknown id '" + n->ref + "'", n->id);
        }
    }

//---------------------------------------------------------------------------

    inline load_context materialise(parse_context const & ctx)
    {
        materialiser m(ctx);
        return m.run();
    }

} // namespace formwork

#endif // FORMWORK_MATERIALISE_HPP
