// formwork_frontmatter.hpp - Formwork - YAML frontmatter
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_FRONTMATTER_HPP
#define FORMWORK_FRONTMATTER_HPP

#include "formwork_core.hpp"
#include "formwork_document.hpp"

#include <yaml-cpp/yaml.h>

namespace formwork
{
    using frontmatter_context = context<form_metadata, document_error>;

    // Reads the "formwork:" block of a frontmatter body. Other top-level keys are ignored.
    frontmatter_context read_frontmatter(std::string_view yaml, source_location loc = {});

    // Canonical "---" delimited block, or an empty string when there is nothing to write.
    std::string write_frontmatter(form_metadata const & meta);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline std::optional<int64_t> yaml_limit(YAML::Node const & harness, char const * key)
        {
            if (auto n = harness[key]; n && !n.IsNull())
                return n.as<int64_t>();
            return std::nullopt;
        }

        inline void emit_limit(YAML::Emitter & out, char const * key, std::optional<int64_t> v)
        {
            if (v)
                out << YAML::Key << key << YAML::Value << *v;
        }
    }

//---------------------------------------------------------------------------

    inline frontmatter_context read_frontmatter(std::string_view yaml, source_location loc)
    {
        frontmatter_context out;

        auto fail = [&](std::string message)
        {
            out.errors.push_back({ document_error_kind::malformed_frontmatter, loc, std::move(message), {} });
            return out;
        };

        YAML::Node root;
        try
        {
            root = YAML::Load(std::string(yaml));
        }
        catch (YAML::ParserException const & e)
        {
            return fail(std::string("frontmatter is not valid YAML: ") + e.what());
        }

        if (root.IsNull())
            return out;
        if (!root.IsMap())
            return fail("frontmatter must be a mapping");

        auto fw = root["formwork"];
        if (!fw)
            return out;
        if (!fw.IsMap())
            return fail("'formwork' frontmatter entry must be a mapping");

        auto & meta = out.result;
        meta.present = true;

        try
        {
            if (auto n = fw["spec"])
                meta.spec_version = n.as<std::string>();

            if (auto n = fw["title"])
                meta.title = n.as<std::string>();

            if (auto n = fw["run_mode"])
            {
                auto mode = detail::parse_run_mode(n.as<std::string>());
                if (!mode)
                    return fail("unknown run_mode '" + n.as<std::string>() + "'");
                meta.mode = mode;
            }

            if (auto n = fw["roles"])
            {
                if (!n.IsSequence())
                    return fail("'roles' must be a list");
                for (auto const & r : n)
                    meta.roles.push_back(r.as<std::string>());
            }

            if (auto n = fw["role_instructions"])
            {
                if (!n.IsMap())
                    return fail("'role_instructions' must be a mapping");
                for (auto const & kv : n)
                    meta.role_instructions[kv.first.as<std::string>()] = kv.second.as<std::string>();
            }

            if (auto h = fw["harness"])
            {
                if (!h.IsMap())
                    return fail("'harness' must be a mapping");

                meta.harness.max_turns            = detail::yaml_limit(h, "max_turns");
                meta.harness.max_patches_per_turn = detail::yaml_limit(h, "max_patches_per_turn");
                meta.harness.max_issues_per_turn  = detail::yaml_limit(h, "max_issues_per_turn");
                meta.harness.max_fields_per_turn  = detail::yaml_limit(h, "max_fields_per_turn");
                meta.harness.max_groups_per_turn  = detail::yaml_limit(h, "max_groups_per_turn");
            }
        }
        catch (YAML::Exception const & e)
        {
            return fail(std::string("frontmatter value has the wrong type: ") + e.what());
        }

        return out;
    }

//---------------------------------------------------------------------------

    inline std::string write_frontmatter(form_metadata const & meta)
    {
        if (!meta.present)
            return {};

        YAML::Emitter out;
        out << YAML::BeginMap;
        out << YAML::Key << "formwork" << YAML::Value << YAML::BeginMap;

        if (!meta.spec_version.empty())
            out << YAML::Key << "spec" << YAML::Value << meta.spec_version;
        if (!meta.title.empty())
            out << YAML::Key << "title" << YAML::Value << meta.title;
        if (meta.mode)
            out << YAML::Key << "run_mode" << YAML::Value << std::string(detail::run_mode_to_string(*meta.mode));

        if (!meta.roles.empty())
        {
            out << YAML::Key << "roles" << YAML::Value << YAML::Flow << YAML::BeginSeq;
            for (auto const & r : meta.roles)
                out << r;
            out << YAML::EndSeq;
        }

        if (!meta.role_instructions.empty())
        {
            out << YAML::Key << "role_instructions" << YAML::Value << YAML::BeginMap;
            for (auto const & [role, text] : meta.role_instructions)
                out << YAML::Key << role << YAML::Value << text;
            out << YAML::EndMap;
        }

        auto const & h = meta.harness;
        if (h != harness_limits{})
        {
            out << YAML::Key << "harness" << YAML::Value << YAML::BeginMap;
            detail::emit_limit(out, "max_turns", h.max_turns);
            detail::emit_limit(out, "max_patches_per_turn", h.max_patches_per_turn);
            detail::emit_limit(out, "max_issues_per_turn", h.max_issues_per_turn);
            detail::emit_limit(out, "max_fields_per_turn", h.max_fields_per_turn);
            detail::emit_limit(out, "max_groups_per_turn", h.max_groups_per_turn);
            out << YAML::EndMap;
        }

        out << YAML::EndMap;
        out << YAML::EndMap;

        return std::string("---\n") + out.c_str() + "\n---\n";
    }

} // namespace formwork

#endif // FORMWORK_FRONTMATTER_HPP
