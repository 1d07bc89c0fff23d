// formwork.hpp - Formwork
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Formwork Core Principles:
//========================================================================
//
// The Authored-Text Principle
// ---------------------------
// The form text is the only persistent state.
// What was not changed is written back byte for byte.
//
//
// The Value Principle
// -------------------
// A document is a value. Patches produce a new document;
// inspection and planning only read one.
//
//
// The Data-Not-Exceptions Principle
// ---------------------------------
// Load errors, patch rejections and validation issues are
// returned as data. Every problem is reported, not just the first.
//
//========================================================================

#ifndef FORMWORK_FORMWORK_HPP
#define FORMWORK_FORMWORK_HPP

#include "formwork_core.hpp"
#include "formwork_document.hpp"
#include "formwork_parser.hpp"
#include "formwork_materialise.hpp"
#include "formwork_serializer.hpp"
#include "formwork_validate.hpp"
#include "formwork_inspect.hpp"
#include "formwork_issue_filter.hpp"
#include "formwork_patch.hpp"
#include "formwork_patch_json.hpp"
#include "formwork_plan.hpp"
#include "formwork_config.hpp"
#include "formwork_export.hpp"

namespace formwork
{
//========================================================================
// Document creation
//========================================================================

    load_context load(std::string_view text);

    inline load_context load(std::string_view text)
    {
        load_context out{};

        auto parse_ctx = parse(text);
        auto mat_ctx   = materialise(parse_ctx);

        out.result = std::move(mat_ctx.result);

        out.errors.reserve(parse_ctx.errors.size() + mat_ctx.errors.size());

        for (auto & pe : parse_ctx.errors)
            out.errors.push_back(std::move(pe));

        for (auto & me : mat_ctx.errors)
            out.errors.push_back(std::move(me));

        return out;
    }

    inline std::string describe(document_error const & e)
    {
        std::string s = "line " + std::to_string(e.loc.line) + ": " +
                        std::string(detail::error_kind_to_string(e.kind)) + ": " + e.message;
        return s;
    }

} // namespace formwork

#endif // FORMWORK_FORMWORK_HPP
