// formwork_issue_filter.hpp - Formwork - Issue filter pipeline
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_ISSUE_FILTER_HPP
#define FORMWORK_ISSUE_FILTER_HPP

#include "formwork_inspect.hpp"

#include <set>

namespace formwork
{
//========================================================================
// Filter stages
//
// Each stage is pure and keeps the relative order of the issues it passes.
//========================================================================

    // Keeps issues on fields whose role is listed. Empty roles or "*" keeps all.
    std::vector<inspect_issue> filter_issues_by_role(std::vector<inspect_issue> const & issues,
                                                     document const & doc,
                                                     std::vector<std::string> const & roles);

    // Readiness: drops blocked issues, then keeps the lowest open order level.
    std::vector<inspect_issue> filter_issues_by_order(std::vector<inspect_issue> const & issues,
                                                      document const & doc);

    // Caps the number of distinct fields and explicit groups touched.
    std::vector<inspect_issue> filter_issues_by_scope(std::vector<inspect_issue> const & issues,
                                                      document const & doc,
                                                      std::optional<size_t> max_fields,
                                                      std::optional<size_t> max_groups);

    std::vector<inspect_issue> filter_issues_by_count(std::vector<inspect_issue> const & issues,
                                                      std::optional<size_t> max_issues);

//========================================================================
// Implementation
//========================================================================

    inline std::vector<inspect_issue> filter_issues_by_role(std::vector<inspect_issue> const & issues,
                                                            document const & doc,
                                                            std::vector<std::string> const & roles)
    {
        std::vector<inspect_issue> out;
        for (auto const & issue : issues)
        {
            auto role = detail::issue_role(doc, issue);
            if (!role || detail::roles_match(roles, *role))
                out.push_back(issue);
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::vector<inspect_issue> filter_issues_by_order(std::vector<inspect_issue> const & issues,
                                                             document const & doc)
    {
        auto order_of = [&](inspect_issue const & issue) -> std::optional<int64_t>
        {
            if (issue.scope != issue_scope::field)
                return std::nullopt;
            if (auto f = doc.find_field(issue.ref))
                return doc.effective_order(*f);
            return std::nullopt;
        };

        std::vector<inspect_issue> ready;
        std::optional<int64_t> lowest;

        for (auto const & issue : issues)
        {
            if (issue.blocked_by)
                continue;

            if (auto o = order_of(issue); o && (!lowest || *o < *lowest))
                lowest = o;
            ready.push_back(issue);
        }

        std::vector<inspect_issue> out;
        for (auto & issue : ready)
        {
            auto o = order_of(issue);
            if (!o || o == lowest)
                out.push_back(std::move(issue));
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::vector<inspect_issue> filter_issues_by_scope(std::vector<inspect_issue> const & issues,
                                                             document const & doc,
                                                             std::optional<size_t> max_fields,
                                                             std::optional<size_t> max_groups)
    {
        if (!max_fields && !max_groups)
            return issues;

        std::vector<inspect_issue> out;
        std::set<std::string> seen_fields;
        std::set<std::string> seen_groups;

        for (auto const & issue : issues)
        {
            if (issue.scope == issue_scope::form)
            {
                out.push_back(issue);
                continue;
            }

            std::string field_id = issue.scope == issue_scope::field ? issue.ref : std::string{};
            std::string group_id;
            if (issue.scope == issue_scope::group)
                group_id = issue.ref;
            else if (auto g = doc.group_of(field_id); g && !g->implicit)
                group_id = g->id;

            if (max_fields && !field_id.empty() &&
                !seen_fields.count(field_id) && seen_fields.size() >= *max_fields)
                continue;

            if (max_groups && !group_id.empty() &&
                !seen_groups.count(group_id) && seen_groups.size() >= *max_groups)
                continue;

            out.push_back(issue);
            if (!field_id.empty()) seen_fields.insert(field_id);
            if (!group_id.empty()) seen_groups.insert(group_id);
        }
        return out;
    }

//---------------------------------------------------------------------------

    inline std::vector<inspect_issue> filter_issues_by_count(std::vector<inspect_issue> const & issues,
                                                             std::optional<size_t> max_issues)
    {
        if (!max_issues || issues.size() <= *max_issues)
            return issues;
        return std::vector<inspect_issue>(issues.begin(), issues.begin() + static_cast<std::ptrdiff_t>(*max_issues));
    }

} // namespace formwork

#endif // FORMWORK_ISSUE_FILTER_HPP
