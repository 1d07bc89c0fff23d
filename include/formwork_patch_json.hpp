// formwork_patch_json.hpp - Formwork - Patch submission decoding
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_PATCH_JSON_HPP
#define FORMWORK_PATCH_JSON_HPP

#include "formwork_patch.hpp"

#include <json/json.h>

#include <memory>

namespace formwork
{
    enum class patch_decode_error_kind
    {
        malformed_json,
        not_an_array,
        not_an_object,
        missing_op,
        unknown_op,
        invalid_member
    };

    // loc.line holds the 1-based patch position, 0 for document-level errors.
    using patch_decode_error   = error<patch_decode_error_kind>;
    using patch_decode_context = context<std::vector<patch>, patch_decode_error>;

    patch_decode_context decode_patches(std::string_view json);

    std::optional<patch_op> parse_op(std::string_view sv);

    inline std::string_view decode_error_kind_to_string(patch_decode_error_kind k)
    {
        switch (k)
        {
            case patch_decode_error_kind::malformed_json: return "malformed-json";
            case patch_decode_error_kind::not_an_array:   return "not-an-array";
            case patch_decode_error_kind::not_an_object:  return "not-an-object";
            case patch_decode_error_kind::missing_op:     return "missing-op";
            case patch_decode_error_kind::unknown_op:     return "unknown-op";
            case patch_decode_error_kind::invalid_member: return "invalid-member";
        }
        return "malformed-json";
    }

//========================================================================
// Implementation
//========================================================================

    inline std::optional<patch_op> parse_op(std::string_view sv)
    {
        auto s = detail::to_lower(detail::trim_sv(sv));
        for (auto & c : s)
            if (c == '-') c = '_';

        if (s == "set_value" || s == "set") return patch_op::set_value;
        if (s == "skip")                     return patch_op::skip;
        if (s == "abort")                    return patch_op::abort;
        if (s == "clear")                    return patch_op::clear;
        if (s == "add_note")                 return patch_op::add_note;
        if (s == "remove_note")              return patch_op::remove_note;
        return std::nullopt;
    }

    namespace detail
    {
        // First present spelling of a member, or null.
        inline Json::Value const & member(Json::Value const & obj, std::initializer_list<char const *> names)
        {
            static const Json::Value none;
            for (auto const * n : names)
                if (obj.isMember(n))
                    return obj[n];
            return none;
        }
    }

//---------------------------------------------------------------------------

    inline patch_decode_context decode_patches(std::string_view json)
    {
        patch_decode_context out;

        auto add_error = [&](patch_decode_error_kind kind, size_t index, std::string msg)
        {
            out.errors.push_back({ kind, { index }, std::move(msg), {} });
        };

        Json::Value root;
        std::string errs;

        Json::CharReaderBuilder builder;
        builder["collectComments"] = false;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        if (!reader->parse(json.data(), json.data() + json.size(), &root, &errs))
        {
            add_error(patch_decode_error_kind::malformed_json, 0, "patches are not valid JSON: " + errs);
            return out;
        }

        if (!root.isArray())
        {
            add_error(patch_decode_error_kind::not_an_array, 0, "patches must be a JSON array");
            return out;
        }

        for (Json::ArrayIndex i = 0; i < root.size(); ++i)
        {
            auto const & obj = root[i];
            size_t pos = i + 1;

            if (!obj.isObject())
            {
                add_error(patch_decode_error_kind::not_an_object, pos, "patch is not an object");
                continue;
            }

            auto const & op_v = detail::member(obj, { "op", "operation" });
            if (op_v.isNull())
            {
                add_error(patch_decode_error_kind::missing_op, pos, "patch has no 'op'");
                continue;
            }
            if (!op_v.isString())
            {
                add_error(patch_decode_error_kind::invalid_member, pos, "'op' must be a string");
                continue;
            }

            auto op = parse_op(op_v.asString());
            if (!op)
            {
                add_error(patch_decode_error_kind::unknown_op, pos, "unknown op '" + op_v.asString() + "'");
                continue;
            }

            patch p;
            p.op = *op;

            bool ok = true;
            auto read_string = [&](std::initializer_list<char const *> names, std::string & dst)
            {
                auto const & v = detail::member(obj, names);
                if (v.isNull())
                    return;
                if (!v.isString())
                {
                    add_error(patch_decode_error_kind::invalid_member, pos,
                              std::string("'") + *names.begin() + "' must be a string");
                    ok = false;
                    return;
                }
                dst = v.asString();
            };

            read_string({ "field_id", "fieldId" }, p.field_id);
            read_string({ "ref" }, p.ref);
            read_string({ "role" }, p.role);
            read_string({ "text" }, p.text);
            read_string({ "note_id", "noteId" }, p.note_id);

            std::string reason;
            read_string({ "reason" }, reason);
            if (obj.isMember("reason") && obj["reason"].isString())
                p.reason = reason;

            if (obj.isMember("value"))
                p.value = obj["value"];

            if (ok)
                out.result.push_back(std::move(p));
        }

        return out;
    }

} // namespace formwork

#endif // FORMWORK_PATCH_JSON_HPP
