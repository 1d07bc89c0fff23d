// formwork_inspect.hpp - Formwork - Inspection engine
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_INSPECT_HPP
#define FORMWORK_INSPECT_HPP

#include "formwork_core.hpp"
#include "formwork_document.hpp"
#include "formwork_validate.hpp"

namespace formwork
{
//========================================================================
// Issues
//========================================================================

    enum class issue_scope
    {
        field,
        group,
        form
    };

    enum class issue_severity
    {
        required,
        recommended
    };

    struct inspect_issue
    {
        std::string                ref;
        issue_scope                scope    = issue_scope::field;
        issue_reason               reason   = issue_reason::missing_required_value;
        std::string                message;
        issue_severity             severity = issue_severity::required;
        int                        priority = 1;      // 1 = most urgent
        std::optional<std::string> blocked_by;

        bool operator==(inspect_issue const &) const = default;
    };

//========================================================================
// Summaries
//========================================================================

    struct structure_summary
    {
        size_t                       group_count  = 0;    // explicit groups
        size_t                       field_count  = 0;
        size_t                       option_count = 0;
        size_t                       column_count = 0;
        std::map<field_kind, size_t> fields_by_kind;

        bool operator==(structure_summary const &) const = default;
    };

    struct field_progress
    {
        std::string  id;
        field_kind   kind     = field_kind::text;
        bool         required = false;
        answer_state state    = answer_state::unanswered;
        bool         empty    = true;
        bool         valid    = true;
        size_t       issue_count = 0;
        size_t       note_count  = 0;

        bool operator==(field_progress const &) const = default;
    };

    struct progress_counts
    {
        size_t total_fields      = 0;
        size_t required_fields   = 0;

        size_t unanswered_fields = 0;
        size_t answered_fields   = 0;
        size_t skipped_fields    = 0;
        size_t aborted_fields    = 0;

        size_t valid_fields      = 0;
        size_t invalid_fields    = 0;

        size_t empty_fields      = 0;
        size_t filled_fields     = 0;

        size_t empty_required_fields = 0;
        size_t total_notes           = 0;

        bool operator==(progress_counts const &) const = default;
    };

    struct progress_summary
    {
        progress_counts             counts;
        std::vector<field_progress> fields;     // declaration order

        field_progress const * find(std::string_view id) const noexcept
        {
            for (auto const & p : fields)
                if (p.id == id)
                    return &p;
            return nullptr;
        }

        bool operator==(progress_summary const &) const = default;
    };

    enum class form_state
    {
        empty,
        incomplete,
        invalid,
        complete
    };

    struct inspect_options
    {
        std::vector<std::string> target_roles;     // empty or "*" = all roles
    };

    struct inspect_result
    {
        structure_summary          structure;
        progress_summary           progress;
        form_state                 state = form_state::empty;
        std::vector<inspect_issue> issues;
        bool                       is_complete = false;

        bool operator==(inspect_result const &) const = default;
    };

//========================================================================
// API
//========================================================================

    inspect_result inspect(document const & doc, inspect_options const & opts = {});

    structure_summary compute_structure_summary(document const & doc);

    inline std::string_view form_state_to_string(form_state s)
    {
        switch (s)
        {
            case form_state::empty:      return "empty";
            case form_state::incomplete: return "incomplete";
            case form_state::invalid:    return "invalid";
            case form_state::complete:   return "complete";
        }
        return "empty";
    }

    inline std::string_view severity_to_string(issue_severity s)
    {
        return s == issue_severity::required ? "required" : "recommended";
    }

    inline std::string_view scope_to_string(issue_scope s)
    {
        switch (s)
        {
            case issue_scope::field: return "field";
            case issue_scope::group: return "group";
            case issue_scope::form:  return "form";
        }
        return "field";
    }

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline bool roles_match(std::vector<std::string> const & roles, std::string_view role)
        {
            if (roles.empty())
                return true;
            return std::any_of(roles.begin(), roles.end(),
                               [&](std::string const & r) { return r == "*" || r == role; });
        }

        // Role of the field an issue refers to. Group and form issues have none.
        inline std::optional<std::string> issue_role(document const & doc, inspect_issue const & issue)
        {
            if (issue.scope != issue_scope::field)
                return std::nullopt;
            if (auto f = doc.find_field(issue.ref))
                return f->role;
            return std::nullopt;
        }

        inline std::string join_findings(std::vector<validation_finding> const & findings)
        {
            std::string out;
            for (size_t i = 0; i < findings.size(); ++i)
            {
                if (i) out += "; ";
                out += findings[i].message;
            }
            return out;
        }

        inline std::optional<inspect_issue> issue_for(field_assessment const & a)
        {
            auto const & f = *a.f;

            inspect_issue issue;
            issue.ref   = f.id;
            issue.scope = issue_scope::field;
            if (a.blocked())
                issue.blocked_by = a.blocked_by;

            bool answered = a.state == answer_state::answered;

            if (!a.applicable())
            {
                if (!answered)
                    return std::nullopt;

                issue.reason   = issue_reason::unmet_dependency;
                issue.severity = issue_severity::recommended;
                issue.priority = 4;
                issue.message  = "\"" + f.label + "\" is answered but its condition on '" +
                                 f.depends_on.value_or("") + "' is not met";
                return issue;
            }

            if (a.state == answer_state::skipped || a.state == answer_state::aborted)
                return std::nullopt;

            if (answered && !a.empty && !a.valid())
            {
                issue.reason   = a.findings.front().reason;
                issue.severity = issue_severity::required;
                issue.priority = f.required ? 1 : 3;
                issue.message  = join_findings(a.findings);
                return issue;
            }

            if (f.required && a.empty)
            {
                issue.reason   = issue_reason::missing_required_value;
                issue.severity = issue_severity::required;
                issue.priority = 2;
                issue.message  = "Required field \"" + f.label + "\" has no value";
                return issue;
            }

            if (!f.required && a.state == answer_state::unanswered)
            {
                issue.reason   = issue_reason::optional_unanswered;
                issue.severity = issue_severity::recommended;
                issue.priority = f.priority == field_priority::low ? 5 : 4;
                issue.message  = "Optional field \"" + f.label + "\" is unanswered";
                return issue;
            }

            return std::nullopt;
        }

        inline form_state compute_form_state(progress_counts const & c)
        {
            if (c.invalid_fields > 0)
                return form_state::invalid;

            bool untouched = c.unanswered_fields == c.total_fields && c.total_fields > 0;

            if (c.empty_required_fields == 0 && !untouched)
                return form_state::complete;

            if (untouched && c.required_fields == 0)
                return form_state::empty;

            return form_state::incomplete;
        }
    }

//---------------------------------------------------------------------------

    inline structure_summary compute_structure_summary(document const & doc)
    {
        structure_summary s;
        for (auto const & g : doc.groups())
        {
            if (!g.implicit)
                ++s.group_count;

            for (auto const & f : g.fields)
            {
                ++s.field_count;
                s.option_count += f.options.size();
                s.column_count += f.columns.size();
                ++s.fields_by_kind[f.kind];
            }
        }
        return s;
    }

//---------------------------------------------------------------------------

    inline inspect_result inspect(document const & doc, inspect_options const & opts)
    {
        inspect_result out;
        out.structure = compute_structure_summary(doc);

        auto assessment = assess_document(doc);

        std::vector<inspect_issue> issues;
        std::map<std::string, size_t> declaration;

        auto & counts = out.progress.counts;
        counts.total_notes = doc.notes().size();

        for (size_t i = 0; i < assessment.fields.size(); ++i)
        {
            auto const & a = assessment.fields[i];
            auto const & f = *a.f;
            declaration[f.id] = i;

            auto issue = detail::issue_for(a);

            field_progress p;
            p.id          = f.id;
            p.kind        = f.kind;
            p.required    = f.required;
            p.state       = a.state;
            p.empty       = a.empty;
            p.valid       = a.counts_valid();
            p.issue_count = issue ? 1 : 0;
            p.note_count  = doc.note_count_for(f.id);

            ++counts.total_fields;
            if (p.required)
                ++counts.required_fields;

            switch (a.state)
            {
                case answer_state::unanswered: ++counts.unanswered_fields; break;
                case answer_state::answered:   ++counts.answered_fields;   break;
                case answer_state::skipped:    ++counts.skipped_fields;    break;
                case answer_state::aborted:    ++counts.aborted_fields;    break;
            }

            if (p.valid) ++counts.valid_fields;
            else         ++counts.invalid_fields;

            if (p.empty) ++counts.empty_fields;
            else         ++counts.filled_fields;

            bool settled_by_state = a.state == answer_state::skipped || a.state == answer_state::aborted;
            if (p.required && p.empty && a.applicable() && !settled_by_state)
                ++counts.empty_required_fields;

            out.progress.fields.push_back(std::move(p));

            if (issue)
                issues.push_back(std::move(*issue));
        }

        out.state = detail::compute_form_state(counts);

        std::stable_sort(issues.begin(), issues.end(), [&](inspect_issue const & a, inspect_issue const & b)
        {
            if (a.priority != b.priority)
                return a.priority < b.priority;
            if (a.severity != b.severity)
                return a.severity == issue_severity::required;

            auto da = declaration.count(a.ref) ? declaration[a.ref] : npos();
            auto db = declaration.count(b.ref) ? declaration[b.ref] : npos();
            if (da != db)
                return da < db;
            return a.ref < b.ref;
        });

        for (auto & issue : issues)
        {
            auto role = detail::issue_role(doc, issue);
            if (!role || detail::roles_match(opts.target_roles, *role))
                out.issues.push_back(std::move(issue));
        }

        out.is_complete = out.issues.empty();
        return out;
    }

} // namespace formwork

#endif // FORMWORK_INSPECT_HPP
