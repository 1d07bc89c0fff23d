// formwork_config.hpp - Formwork - Harness configuration
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_CONFIG_HPP
#define FORMWORK_CONFIG_HPP

#include "formwork_document.hpp"
#include "formwork_inspect.hpp"
#include "formwork_issue_filter.hpp"
#include "formwork_patch.hpp"

namespace formwork
{
//========================================================================
// Configuration
//
// Resolved in three layers: built-in defaults, then the frontmatter
// harness block, then explicit overrides.
//========================================================================

    enum class fill_mode
    {
        continue_filling,   // keep existing answers
        overwrite           // clear target-role answers first
    };

    struct harness_config
    {
        int64_t                  max_turns            = 100;
        int64_t                  max_patches_per_turn = 20;
        int64_t                  max_issues_per_turn  = 10;
        std::optional<int64_t>   max_fields_per_turn;
        std::optional<int64_t>   max_groups_per_turn;
        std::vector<std::string> target_roles         = { "agent" };
        fill_mode                mode                 = fill_mode::continue_filling;

        bool operator==(harness_config const &) const = default;
    };

    struct config_overrides
    {
        std::optional<int64_t>                  max_turns;
        std::optional<int64_t>                  max_patches_per_turn;
        std::optional<int64_t>                  max_issues_per_turn;
        std::optional<int64_t>                  max_fields_per_turn;
        std::optional<int64_t>                  max_groups_per_turn;
        std::optional<std::vector<std::string>> target_roles;
        std::optional<fill_mode>                mode;
    };

    harness_config resolve_harness_config(form_metadata const & meta, config_overrides const & overrides = {});

    // The issues one turn hands to an actor: inspect with the configured
    // roles, then readiness, scope and count filters.
    std::vector<inspect_issue> next_issues(document const & doc, harness_config const & config);

    // In overwrite mode, the answers of target-role fields are cleared.
    document prepare_for_fill(document const & doc, harness_config const & config);

    inline std::string_view fill_mode_to_string(fill_mode m)
    {
        return m == fill_mode::overwrite ? "overwrite" : "continue";
    }

    inline std::optional<fill_mode> parse_fill_mode(std::string_view sv)
    {
        auto s = detail::to_lower(detail::trim_sv(sv));
        if (s == "continue")  return fill_mode::continue_filling;
        if (s == "overwrite") return fill_mode::overwrite;
        return std::nullopt;
    }

//========================================================================
// Implementation
//========================================================================

    inline harness_config resolve_harness_config(form_metadata const & meta, config_overrides const & overrides)
    {
        harness_config cfg;

        auto layer = [](auto & dst, auto const & src)
        {
            if (src)
                dst = *src;
        };

        auto const & h = meta.harness;
        layer(cfg.max_turns,            h.max_turns);
        layer(cfg.max_patches_per_turn, h.max_patches_per_turn);
        layer(cfg.max_issues_per_turn,  h.max_issues_per_turn);
        layer(cfg.max_fields_per_turn,  h.max_fields_per_turn);
        layer(cfg.max_groups_per_turn,  h.max_groups_per_turn);

        layer(cfg.max_turns,            overrides.max_turns);
        layer(cfg.max_patches_per_turn, overrides.max_patches_per_turn);
        layer(cfg.max_issues_per_turn,  overrides.max_issues_per_turn);
        layer(cfg.max_fields_per_turn,  overrides.max_fields_per_turn);
        layer(cfg.max_groups_per_turn,  overrides.max_groups_per_turn);
        layer(cfg.target_roles,         overrides.target_roles);
        layer(cfg.mode,                 overrides.mode);

        return cfg;
    }

//---------------------------------------------------------------------------

    inline std::vector<inspect_issue> next_issues(document const & doc, harness_config const & config)
    {
        auto cap = [](std::optional<int64_t> v) -> std::optional<size_t>
        {
            if (!v || *v < 0)
                return std::nullopt;
            return static_cast<size_t>(*v);
        };

        inspect_options opts;
        opts.target_roles = config.target_roles;

        auto issues = inspect(doc, opts).issues;
        issues = filter_issues_by_order(issues, doc);
        issues = filter_issues_by_scope(issues, doc, cap(config.max_fields_per_turn), cap(config.max_groups_per_turn));
        issues = filter_issues_by_count(issues, cap(config.max_issues_per_turn));
        return issues;
    }

//---------------------------------------------------------------------------

    inline document prepare_for_fill(document const & doc, harness_config const & config)
    {
        if (config.mode != fill_mode::overwrite)
            return doc;

        std::vector<patch> clears;
        for (auto const * f : doc.fields())
        {
            if (!detail::roles_match(config.target_roles, f->role))
                continue;
            if (doc.response(f->id).state == answer_state::unanswered)
                continue;

            patch p;
            p.op       = patch_op::clear;
            p.field_id = f->id;
            clears.push_back(std::move(p));
        }

        if (clears.empty())
            return doc;
        return apply_patches(doc, clears).doc;
    }

} // namespace formwork

#endif // FORMWORK_CONFIG_HPP
