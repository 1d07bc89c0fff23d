// formwork_validate.hpp - Formwork - Field validation and dependency evaluation
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_VALIDATE_HPP
#define FORMWORK_VALIDATE_HPP

#include "formwork_core.hpp"
#include "formwork_document.hpp"

#include <regex>
#include <set>

namespace formwork
{
//========================================================================
// Findings
//========================================================================

    enum class issue_reason
    {
        missing_required_value,
        invalid_value_for_kind,
        checkbox_incomplete,
        min_items_not_met,
        optional_unanswered,
        unmet_dependency
    };

    struct validation_finding
    {
        issue_reason reason = issue_reason::invalid_value_for_kind;
        std::string  message;
    };

    enum class dependency_status
    {
        none,           // no depends_on
        pending,        // dependency not yet answered with a valid value
        satisfied,
        unsatisfied     // dependency skipped, aborted or not matching 'when'
    };

    struct field_assessment
    {
        field const *                   f = nullptr;
        answer_state                    state = answer_state::unanswered;
        bool                            empty = true;
        std::vector<validation_finding> findings;
        dependency_status               dependency = dependency_status::none;
        std::string                     blocked_by;

        bool valid() const noexcept { return findings.empty(); }
        bool applicable() const noexcept { return dependency != dependency_status::unsatisfied; }
        bool blocked() const noexcept { return !blocked_by.empty(); }

        // An inapplicable field never counts against the form, whatever it holds.
        bool counts_valid() const noexcept { return !applicable() || valid(); }

        // Answered with a non-empty valid value, or skipped / aborted.
        bool settled() const noexcept
        {
            if (state == answer_state::skipped || state == answer_state::aborted)
                return true;
            return state == answer_state::answered && !empty && valid();
        }
    };

    struct document_assessment
    {
        std::vector<field_assessment> fields;   // declaration order

        field_assessment const * find(std::string_view id) const noexcept
        {
            for (auto const & a : fields)
                if (a.f->id == id)
                    return &a;
            return nullptr;
        }
    };

//========================================================================
// API
//========================================================================

    // Checks a non-empty value against its field's constraints.
    std::vector<validation_finding> validate_value(field const & f, field_value const & v);

    bool is_checkbox_complete(field const & f, field_response const & r);

    bool value_matches_when(field const & dependency, field_value const & v, std::string_view when);

    dependency_status evaluate_dependency(document const & doc, field const & f);

    field_assessment assess_field(document const & doc, field const & f);

    // All fields, with approval checkpoints applied.
    document_assessment assess_document(document const & doc);

    inline std::string_view reason_to_string(issue_reason r)
    {
        switch (r)
        {
            case issue_reason::missing_required_value: return "missing-required-value";
            case issue_reason::invalid_value_for_kind: return "invalid-value-for-kind";
            case issue_reason::checkbox_incomplete:    return "checkbox-incomplete";
            case issue_reason::min_items_not_met:      return "min-items-not-met";
            case issue_reason::optional_unanswered:    return "optional-unanswered";
            case issue_reason::unmet_dependency:       return "unmet-dependency";
        }
        return "invalid-value-for-kind";
    }

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline size_t utf8_length(std::string_view s)
        {
            return static_cast<size_t>(std::count_if(s.begin(), s.end(),
                [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; }));
        }

        class finding_sink
        {
        public:
            explicit finding_sink(field const & f) : f_(f) {}

            void invalid(std::string message)
            {
                out_.push_back({ issue_reason::invalid_value_for_kind, std::move(message) });
            }

            void too_few(std::string message)
            {
                out_.push_back({ issue_reason::min_items_not_met, std::move(message) });
            }

            void incomplete(std::string message)
            {
                out_.push_back({ issue_reason::checkbox_incomplete, std::move(message) });
            }

            std::string quoted_label() const
            {
                return "\"" + f_.label + "\"";
            }

            std::vector<validation_finding> take() { return std::move(out_); }

        private:
            field const &                   f_;
            std::vector<validation_finding> out_;
        };

//---------------------------------------------------------------------------

        inline void check_text(field const & f, std::string const & text, finding_sink & sink)
        {
            auto len = static_cast<int64_t>(utf8_length(text));

            if (!f.multiline && text.find('\n') != std::string::npos)
                sink.invalid(sink.quoted_label() + " must be a single line");
            if (f.min_length && len < *f.min_length)
                sink.invalid(sink.quoted_label() + " must be at least " + std::to_string(*f.min_length) +
                             " characters (got " + std::to_string(len) + ")");
            if (f.max_length && len > *f.max_length)
                sink.invalid(sink.quoted_label() + " must be at most " + std::to_string(*f.max_length) +
                             " characters (got " + std::to_string(len) + ")");
            if (f.pattern)
            {
                try
                {
                    std::regex re(*f.pattern, std::regex::ECMAScript);
                    if (!std::regex_search(text, re))
                        sink.invalid(sink.quoted_label() + " does not match pattern " + *f.pattern);
                }
                catch (std::regex_error const & e)
                {
                    sink.invalid(sink.quoted_label() + " has an unusable pattern: " + e.what());
                }
            }
        }

        inline void check_range(field const & f, double v, finding_sink & sink)
        {
            if (f.min && v < *f.min)
                sink.invalid(sink.quoted_label() + " must be at least " + format_number(*f.min) +
                             " (got " + format_number(v) + ")");
            if (f.max && v > *f.max)
                sink.invalid(sink.quoted_label() + " must be at most " + format_number(*f.max) +
                             " (got " + format_number(v) + ")");
        }

        inline void check_list(field const & f, std::vector<std::string> const & items, bool urls, finding_sink & sink)
        {
            auto n = static_cast<int64_t>(items.size());

            if (f.min_items && n < *f.min_items)
                sink.too_few(sink.quoted_label() + " needs at least " + std::to_string(*f.min_items) +
                             " items (got " + std::to_string(n) + ")");
            if (f.max_items && n > *f.max_items)
                sink.invalid(sink.quoted_label() + " allows at most " + std::to_string(*f.max_items) +
                             " items (got " + std::to_string(n) + ")");

            if (f.unique_items)
            {
                std::set<std::string> seen;
                for (auto const & item : items)
                    if (!seen.insert(item).second)
                    {
                        sink.invalid(sink.quoted_label() + " has duplicate item '" + item + "'");
                        break;
                    }
            }

            for (auto const & item : items)
            {
                if (is_blank(item))
                    sink.invalid(sink.quoted_label() + " has an empty item");
                else if (urls && !is_url(item))
                    sink.invalid(sink.quoted_label() + " item '" + item + "' is not an http(s) URL");
            }
        }

        inline void check_date(field const & f, std::string const & date, finding_sink & sink)
        {
            if (!is_calendar_date(date))
            {
                sink.invalid(sink.quoted_label() + " '" + date + "' is not a valid YYYY-MM-DD date");
                return;
            }
            if (f.min_date && date < *f.min_date)
                sink.invalid(sink.quoted_label() + " must be on or after " + *f.min_date);
            if (f.max_date && date > *f.max_date)
                sink.invalid(sink.quoted_label() + " must be on or before " + *f.max_date);
        }

        inline void check_table(field const & f, table_value const & t, finding_sink & sink)
        {
            auto n = static_cast<int64_t>(t.rows.size());

            if (f.min_rows && n < *f.min_rows)
                sink.too_few(sink.quoted_label() + " needs at least " + std::to_string(*f.min_rows) +
                             " rows (got " + std::to_string(n) + ")");
            if (f.max_rows && n > *f.max_rows)
                sink.invalid(sink.quoted_label() + " allows at most " + std::to_string(*f.max_rows) +
                             " rows (got " + std::to_string(n) + ")");

            for (size_t r = 0; r < t.rows.size(); ++r)
            {
                auto const & row = t.rows[r];
                std::string where = sink.quoted_label() + " row " + std::to_string(r + 1);

                for (auto const & [col_id, cell] : row)
                    if (!f.find_column(col_id))
                        sink.invalid(where + " has unknown column '" + col_id + "'");

                for (auto const & c : f.columns)
                {
                    auto it = row.find(c.id);
                    if (it == row.end())
                    {
                        if (c.required)
                            sink.invalid(where + ": column '" + c.label + "' is required");
                        continue;
                    }

                    auto const & cell = it->second;
                    if (cell.state != cell_state::answered)
                        continue;

                    auto const * s = std::get_if<std::string>(&cell.value);
                    auto const * d = std::get_if<double>(&cell.value);

                    switch (c.type)
                    {
                        case column_type::number:
                            if (!d)
                                sink.invalid(where + ": column '" + c.label + "' must be a number");
                            break;
                        case column_type::year:
                            if (!d || std::floor(*d) != *d)
                                sink.invalid(where + ": column '" + c.label + "' must be a whole year");
                            break;
                        case column_type::url:
                            if (!s || !is_url(*s))
                                sink.invalid(where + ": column '" + c.label + "' must be an http(s) URL");
                            break;
                        case column_type::date:
                            if (!s || !is_calendar_date(*s))
                                sink.invalid(where + ": column '" + c.label + "' must be a YYYY-MM-DD date");
                            break;
                        case column_type::text:
                            if (!s)
                                sink.invalid(where + ": column '" + c.label + "' must be text");
                            else if (c.required && is_blank(*s))
                                sink.invalid(where + ": column '" + c.label + "' is required");
                            break;
                    }
                }
            }
        }

        inline bool same_value_text(std::string_view a, std::string_view b)
        {
            return trim_sv(a) == trim_sv(b);
        }
    }

//---------------------------------------------------------------------------

    inline bool is_checkbox_complete(field const & f, field_response const & r)
    {
        if (f.kind != field_kind::checkbox_set)
            return true;
        if (r.state != answer_state::answered || !r.value)
            return false;

        auto const * v = std::get_if<checkbox_value>(&*r.value);
        if (!v)
            return false;

        auto status_of = [&](std::string const & id)
        {
            auto it = v->marks.find(id);
            return it == v->marks.end() ? checkbox_status::todo : it->second;
        };

        if (f.mode == checkbox_mode::simple)
            return std::all_of(f.options.begin(), f.options.end(),
                               [&](option const & o) { return status_of(o.id) == checkbox_status::done; });

        if (f.min_done)
        {
            auto done = std::count_if(f.options.begin(), f.options.end(),
                                      [&](option const & o) { return status_of(o.id) == checkbox_status::done; });
            return done >= *f.min_done;
        }

        return std::all_of(f.options.begin(), f.options.end(), [&](option const & o)
        {
            auto s = status_of(o.id);
            return s == checkbox_status::done || s == checkbox_status::na;
        });
    }

//---------------------------------------------------------------------------

    inline std::vector<validation_finding> validate_value(field const & f, field_value const & value)
    {
        detail::finding_sink sink(f);

        if (!value_matches_kind(value, f.kind))
        {
            sink.invalid(sink.quoted_label() + " holds a " + std::string(detail::kind_to_string(kind_of(value))) +
                         " value but is a " + std::string(detail::kind_to_string(f.kind)) + " field");
            return sink.take();
        }

        std::visit([&](auto const & v)
        {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, text_value>)
            {
                detail::check_text(f, v.text, sink);
            }
            else if constexpr (std::is_same_v<T, number_value>)
            {
                if (!std::isfinite(v.number))
                    sink.invalid(sink.quoted_label() + " must be a finite number");
                else
                {
                    if (f.integer && std::floor(v.number) != v.number)
                        sink.invalid(sink.quoted_label() + " must be an integer (got " + detail::format_number(v.number) + ")");
                    detail::check_range(f, v.number, sink);
                }
            }
            else if constexpr (std::is_same_v<T, text_list_value>)
            {
                detail::check_list(f, v.items, false, sink);
            }
            else if constexpr (std::is_same_v<T, url_list_value>)
            {
                detail::check_list(f, v.items, true, sink);
            }
            else if constexpr (std::is_same_v<T, single_choice_value>)
            {
                if (v.selected && !f.find_option(*v.selected))
                    sink.invalid(sink.quoted_label() + " has no option '" + *v.selected + "'");
            }
            else if constexpr (std::is_same_v<T, multi_choice_value>)
            {
                std::set<std::string> seen;
                for (auto const & id : v.selected)
                {
                    if (!f.find_option(id))
                        sink.invalid(sink.quoted_label() + " has no option '" + id + "'");
                    if (!seen.insert(id).second)
                        sink.invalid(sink.quoted_label() + " selects '" + id + "' twice");
                }

                auto n = static_cast<int64_t>(v.selected.size());
                if (f.min_selections && n < *f.min_selections)
                    sink.too_few(sink.quoted_label() + " needs at least " + std::to_string(*f.min_selections) +
                                 " selections (got " + std::to_string(n) + ")");
                if (f.max_selections && n > *f.max_selections)
                    sink.invalid(sink.quoted_label() + " allows at most " + std::to_string(*f.max_selections) +
                                 " selections (got " + std::to_string(n) + ")");
            }
            else if constexpr (std::is_same_v<T, checkbox_value>)
            {
                for (auto const & [id, status] : v.marks)
                {
                    if (!f.find_option(id))
                        sink.invalid(sink.quoted_label() + " has no option '" + id + "'");
                    else if (f.mode == checkbox_mode::simple &&
                             status != checkbox_status::todo && status != checkbox_status::done)
                        sink.invalid(sink.quoted_label() + " option '" + id + "' cannot be '" +
                                     std::string(detail::status_to_string(status)) + "' in simple mode");
                }

                auto resp = field_response::answered(v);
                if (f.min_done)
                {
                    auto done = std::count_if(v.marks.begin(), v.marks.end(),
                                              [](auto const & m) { return m.second == checkbox_status::done; });
                    if (done < *f.min_done)
                        sink.incomplete(sink.quoted_label() + " requires at least " + std::to_string(*f.min_done) +
                                        " items done (got " + std::to_string(done) + ")");
                }
                else if ((f.required || f.approval == approval_mode::blocking) && !is_checkbox_complete(f, resp))
                {
                    sink.incomplete(f.mode == checkbox_mode::simple
                        ? "All items in " + sink.quoted_label() + " must be checked"
                        : "All items in " + sink.quoted_label() + " must be done or n/a");
                }
            }
            else if constexpr (std::is_same_v<T, url_value>)
            {
                if (!detail::is_url(v.url))
                    sink.invalid(sink.quoted_label() + " '" + v.url + "' is not an http(s) URL");
            }
            else if constexpr (std::is_same_v<T, date_value>)
            {
                detail::check_date(f, v.date, sink);
            }
            else if constexpr (std::is_same_v<T, year_value>)
            {
                detail::check_range(f, static_cast<double>(v.year), sink);
            }
            else if constexpr (std::is_same_v<T, table_value>)
            {
                detail::check_table(f, v, sink);
            }
        }, value);

        return sink.take();
    }

//---------------------------------------------------------------------------

    inline bool value_matches_when(field const & dependency, field_value const & value, std::string_view when)
    {
        (void)dependency;

        return std::visit([&](auto const & v) -> bool
        {
            using T = std::decay_t<decltype(v)>;

            if constexpr (std::is_same_v<T, single_choice_value>)
                return v.selected && *v.selected == when;
            else if constexpr (std::is_same_v<T, multi_choice_value>)
                return std::find(v.selected.begin(), v.selected.end(), when) != v.selected.end();
            else if constexpr (std::is_same_v<T, checkbox_value>)
            {
                auto it = v.marks.find(std::string(when));
                return it != v.marks.end() && it->second == checkbox_status::done;
            }
            else if constexpr (std::is_same_v<T, text_value>)
                return detail::same_value_text(v.text, when);
            else if constexpr (std::is_same_v<T, url_value>)
                return detail::same_value_text(v.url, when);
            else if constexpr (std::is_same_v<T, date_value>)
                return detail::same_value_text(v.date, when);
            else if constexpr (std::is_same_v<T, number_value>)
            {
                auto d = detail::parse_double(when);
                return d && *d == v.number;
            }
            else if constexpr (std::is_same_v<T, year_value>)
            {
                auto y = detail::parse_int(when);
                return y && *y == v.year;
            }
            else if constexpr (std::is_same_v<T, text_list_value> || std::is_same_v<T, url_list_value>)
                return std::find(v.items.begin(), v.items.end(), when) != v.items.end();
            else
                return false;
        }, value);
    }

//---------------------------------------------------------------------------

    namespace detail
    {
        inline dependency_status evaluate_dependency_chain(document const & doc, field const & f, size_t depth)
        {
            if (!f.depends_on)
                return dependency_status::none;

            auto const * dep = doc.find_field(*f.depends_on);
            if (!dep || depth > doc.field_count())
                return dependency_status::pending;

            // Whatever an inapplicable dependency holds, it cannot enable anything.
            if (evaluate_dependency_chain(doc, *dep, depth + 1) == dependency_status::unsatisfied)
                return dependency_status::unsatisfied;

            auto const & r = doc.response(dep->id);

            if (r.state == answer_state::skipped || r.state == answer_state::aborted)
                return dependency_status::unsatisfied;

            if (r.state == answer_state::unanswered || !r.value || is_empty_value(*r.value))
                return dependency_status::pending;

            if (!validate_value(*dep, *r.value).empty())
                return dependency_status::pending;

            if (!f.when)
                return dependency_status::satisfied;

            return value_matches_when(*dep, *r.value, *f.when)
                ? dependency_status::satisfied
                : dependency_status::unsatisfied;
        }
    }

    inline dependency_status evaluate_dependency(document const & doc, field const & f)
    {
        return detail::evaluate_dependency_chain(doc, f, 0);
    }

//---------------------------------------------------------------------------

    inline field_assessment assess_field(document const & doc, field const & f)
    {
        field_assessment a;
        a.f = &f;

        auto const & r = doc.response(f.id);
        a.state = r.state;

        if (r.state == answer_state::answered && r.value)
        {
            a.empty = is_empty_value(*r.value);
            if (!a.empty)
                a.findings = validate_value(f, *r.value);
        }
        else if (r.state != answer_state::answered)
            a.empty = true;

        a.dependency = evaluate_dependency(doc, f);
        if (a.dependency == dependency_status::pending)
            a.blocked_by = *f.depends_on;

        return a;
    }

    inline document_assessment assess_document(document const & doc)
    {
        document_assessment out;
        std::string checkpoint;

        for (auto const * f : doc.fields())
        {
            auto a = assess_field(doc, *f);

            if (!a.blocked() && !checkpoint.empty())
                a.blocked_by = checkpoint;

            if (checkpoint.empty() && f->kind == field_kind::checkbox_set &&
                f->approval == approval_mode::blocking && a.applicable() &&
                (a.state == answer_state::unanswered || a.state == answer_state::answered) &&
                !is_checkbox_complete(*f, doc.response(f->id)))
                checkpoint = f->id;

            out.fields.push_back(std::move(a));
        }
        return out;
    }

} // namespace formwork

#endif // FORMWORK_VALIDATE_HPP
