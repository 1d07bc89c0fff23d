// formwork_patch.hpp - Formwork - Document Editor and Patch Engine
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_PATCH_HPP
#define FORMWORK_PATCH_HPP

#include "formwork_document.hpp"
#include "formwork_inspect.hpp"

#include <json/json.h>

#include <cmath>
#include <set>

namespace formwork
{
//========================================================================
// Editor
//
// The only code that writes to a document after materialisation.
// It performs no schema checking beyond kind agreement; the patch
// engine below decides what is allowed.
//========================================================================

    class editor
    {
    public:
        explicit editor(document& doc) noexcept
            : doc_(doc)
        {}

    //============================================================
    // Responses
    //============================================================

        // Fails if the field is unknown or an answered value has the wrong kind.
        bool set_response( std::string_view field_id, field_response r );

        // Back to unanswered.
        bool clear_response( std::string_view field_id );

    //============================================================
    // Notes
    //============================================================

        std::string append_note( std::string ref, std::string role, std::string text );
        bool erase_note( std::string_view note_id );

        // First unused of n1, n2, ...
        std::string next_note_id() const;

    private:

        document& doc_;
    };

//========================================================================
// Patches
//========================================================================

    enum class patch_op
    {
        set_value,
        skip,
        abort,
        clear,
        add_note,
        remove_note
    };

    struct patch
    {
        patch_op                   op = patch_op::set_value;
        std::string                field_id;
        Json::Value                value;          // set_value payload
        std::optional<std::string> reason;         // skip, abort

        // add_note
        std::string                ref;
        std::string                role;
        std::string                text;

        // remove_note
        std::string                note_id;
    };

    enum class apply_status
    {
        applied,
        partial,
        rejected
    };

    struct patch_rejection
    {
        size_t      patch_index = 0;
        std::string field_id;
        std::string message;
    };

    struct apply_result
    {
        apply_status                 status = apply_status::applied;
        document                     doc;
        structure_summary            structure;
        progress_summary             progress;
        form_state                   state = form_state::empty;
        std::vector<inspect_issue>   issues;
        std::vector<patch_rejection> rejections;
        std::vector<std::string>     warnings;
    };

    apply_result apply_patches(document const & doc, std::vector<patch> const & patches);

    inline std::string_view op_to_string(patch_op op)
    {
        switch (op)
        {
            case patch_op::set_value:   return "set_value";
            case patch_op::skip:        return "skip";
            case patch_op::abort:       return "abort";
            case patch_op::clear:       return "clear";
            case patch_op::add_note:    return "add_note";
            case patch_op::remove_note: return "remove_note";
        }
        return "set_value";
    }

    inline std::string_view apply_status_to_string(apply_status s)
    {
        switch (s)
        {
            case apply_status::applied:  return "applied";
            case apply_status::partial:  return "partial";
            case apply_status::rejected: return "rejected";
        }
        return "rejected";
    }

//================================================================================================================
//
// Editor implementations
//
//================================================================================================================

    inline bool editor::set_response(std::string_view field_id, field_response r)
    {
        auto const * f = doc_.find_field(field_id);
        if (!f)
            return false;

        if (r.state == answer_state::answered)
        {
            if (!r.value || !value_matches_kind(*r.value, f->kind))
                return false;
            r.reason.reset();
        }
        else
            r.value.reset();

        if (r.state == answer_state::unanswered)
            r.reason.reset();

        doc_.responses_.insert_or_assign(std::string(field_id), std::move(r));
        return true;
    }

    inline bool editor::clear_response(std::string_view field_id)
    {
        if (!doc_.find_field(field_id))
            return false;

        if (auto it = doc_.responses_.find(field_id); it != doc_.responses_.end())
            doc_.responses_.erase(it);
        return true;
    }

    inline std::string editor::next_note_id() const
    {
        for (size_t n = 1;; ++n)
        {
            std::string id = "n" + std::to_string(n);
            if (!doc_.has_id(id))
                return id;
        }
    }

    inline std::string editor::append_note(std::string ref, std::string role, std::string text)
    {
        note n{ next_note_id(), std::move(ref), std::move(role), std::move(text) };
        auto id = n.id;
        doc_.notes_.push_back(std::move(n));
        return id;
    }

    inline bool editor::erase_note(std::string_view note_id)
    {
        auto it = std::ranges::find_if(doc_.notes_, [&](note const & n) { return n.id == note_id; });
        if (it == doc_.notes_.end())
            return false;

        doc_.notes_.erase(it);
        return true;
    }

//================================================================================================================
//
// Payload conversion
//
//================================================================================================================

    namespace detail
    {
        // Outcome of turning a JSON payload into a field value.
        struct conversion
        {
            std::optional<field_value> value;
            std::string                error;
            std::vector<std::string>   warnings;

            conversion & fail(std::string msg)
            {
                value.reset();
                error = std::move(msg);
                return *this;
            }
        };

        inline std::string json_type_name(Json::Value const & v)
        {
            switch (v.type())
            {
                case Json::nullValue:    return "null";
                case Json::intValue:
                case Json::uintValue:
                case Json::realValue:    return "number";
                case Json::stringValue:  return "string";
                case Json::booleanValue: return "boolean";
                case Json::arrayValue:   return "array";
                case Json::objectValue:  return "object";
            }
            return "value";
        }

        inline bool is_json_number(Json::Value const & v)
        {
            return v.isNumeric() && !v.isBool();
        }

        // A line that would close the value fence early.
        inline bool has_fence_line(std::string_view text)
        {
            size_t pos = 0;
            while (pos <= text.size())
            {
                auto nl   = text.find('\n', pos);
                auto line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
                if (trim_sv(line).starts_with("```"))
                    return true;
                if (nl == std::string_view::npos)
                    break;
                pos = nl + 1;
            }
            return false;
        }

        inline bool has_directive_line(std::string_view text)
        {
            size_t pos = 0;
            while (pos <= text.size())
            {
                auto nl   = text.find('\n', pos);
                auto line = text.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
                if (trim_sv(line).starts_with("{%"))
                    return true;
                if (nl == std::string_view::npos)
                    break;
                pos = nl + 1;
            }
            return false;
        }

        inline bool is_sentinel_text(std::string_view s)
        {
            return s.find("%SKIP%") != std::string_view::npos
                || s.find("%ABORT%") != std::string_view::npos;
        }

        // One-line scalar as the text format can hold it.
        inline std::optional<std::string> single_line(Json::Value const & v, std::string const & what, conversion & out)
        {
            if (!v.isString())
            {
                out.fail(what + " must be a string, got " + json_type_name(v));
                return std::nullopt;
            }

            std::string s(trim_sv(v.asString()));
            if (s.find('\n') != std::string::npos)
            {
                out.fail(what + " must be a single line");
                return std::nullopt;
            }
            return s;
        }

        inline std::optional<std::vector<std::string>>
        string_items(field const & f, Json::Value const & v, conversion & out)
        {
            Json::Value items = v;
            if (v.isString())
            {
                items = Json::Value(Json::arrayValue);
                items.append(v);
                out.warnings.push_back("field '" + f.id + "': a single string was accepted as a one-item list");
            }

            if (!items.isArray())
            {
                out.fail("expected an array of strings, got " + json_type_name(v));
                return std::nullopt;
            }

            std::vector<std::string> result;
            for (Json::ArrayIndex i = 0; i < items.size(); ++i)
            {
                auto const & item = items[i];
                if (!item.isString())
                {
                    out.fail("item " + std::to_string(i + 1) + " must be a string, got " + json_type_name(item));
                    return std::nullopt;
                }

                std::string s(trim_sv(item.asString()));
                if (s.empty())
                {
                    out.fail("item " + std::to_string(i + 1) + " is blank");
                    return std::nullopt;
                }
                if (s.find('\n') != std::string::npos)
                {
                    out.fail("item " + std::to_string(i + 1) + " must be a single line");
                    return std::nullopt;
                }
                if (s == "```")
                {
                    out.fail("item " + std::to_string(i + 1) + " cannot be a fence line");
                    return std::nullopt;
                }
                result.push_back(std::move(s));
            }
            return result;
        }

        inline bool known_option(field const & f, std::string const & id, conversion & out)
        {
            if (f.find_option(id))
                return true;
            out.fail("'" + id + "' is not an option of field '" + f.id + "'");
            return false;
        }

        inline std::optional<checkbox_status>
        checkbox_mark(field const & f, std::string const & option_id, Json::Value const & v, conversion & out)
        {
            if (v.isBool())
            {
                if (f.mode == checkbox_mode::status)
                    out.warnings.push_back("field '" + f.id + "': boolean for option '" + option_id +
                                           "' was read as done/todo");
                return v.asBool() ? checkbox_status::done : checkbox_status::todo;
            }

            if (!v.isString())
            {
                out.fail("state of option '" + option_id + "' must be a string, got " + json_type_name(v));
                return std::nullopt;
            }

            auto s = parse_status(v.asString());
            if (!s)
            {
                out.fail("'" + v.asString() + "' is not a checkbox state");
                return std::nullopt;
            }

            if (f.mode == checkbox_mode::simple &&
                *s != checkbox_status::todo && *s != checkbox_status::done)
            {
                out.fail("checkbox '" + f.id + "' is in simple mode; '" + v.asString() + "' is not allowed");
                return std::nullopt;
            }
            return s;
        }

        inline std::optional<table_cell>
        table_cell_from_json(column const & col, Json::Value const & v, conversion & out)
        {
            table_cell cell;

            if (v.isObject())
            {
                std::string st = v["state"].isString() ? v["state"].asString() : std::string{};
                if (st == "skipped")
                    cell.state = cell_state::skipped;
                else if (st == "aborted")
                    cell.state = cell_state::aborted;
                else
                {
                    out.fail("column '" + col.id + "': a cell object needs state \"skipped\" or \"aborted\"");
                    return std::nullopt;
                }

                cell.value = std::string{};
                if (v.isMember("reason"))
                {
                    auto const & r = v["reason"];
                    if (!r.isString())
                    {
                        out.fail("column '" + col.id + "': reason must be a string");
                        return std::nullopt;
                    }
                    std::string reason(trim_sv(r.asString()));
                    if (reason.find_first_of("\n|()") != std::string::npos)
                    {
                        out.fail("column '" + col.id + "': reason cannot hold newlines, pipes or parentheses");
                        return std::nullopt;
                    }
                    cell.reason = std::move(reason);
                }
                return cell;
            }

            switch (col.type)
            {
                case column_type::number:
                    if (!is_json_number(v))
                    {
                        out.fail("column '" + col.id + "' expects a number, got " + json_type_name(v));
                        return std::nullopt;
                    }
                    cell.value = v.asDouble();
                    return cell;

                case column_type::year:
                {
                    if (!is_json_number(v) || std::trunc(v.asDouble()) != v.asDouble())
                    {
                        out.fail("column '" + col.id + "' expects an integral year, got " + json_type_name(v));
                        return std::nullopt;
                    }
                    cell.value = v.asDouble();
                    return cell;
                }

                default:
                {
                    auto s = single_line(v, "column '" + col.id + "'", out);
                    if (!s)
                        return std::nullopt;
                    if (is_sentinel_text(*s))
                    {
                        out.fail("column '" + col.id + "': use a {\"state\": ...} cell object instead of a sentinel");
                        return std::nullopt;
                    }
                    if (col.type == column_type::date && !is_date_shaped(*s))
                    {
                        out.fail("column '" + col.id + "': '" + *s + "' is not a YYYY-MM-DD date");
                        return std::nullopt;
                    }
                    cell.value = std::move(*s);
                    return cell;
                }
            }
        }

        inline std::optional<table_value> table_from_json(field const & f, Json::Value const & v, conversion & out)
        {
            if (!v.isArray())
            {
                out.fail("table '" + f.id + "' expects an array of row objects, got " + json_type_name(v));
                return std::nullopt;
            }

            table_value tv;
            for (Json::ArrayIndex r = 0; r < v.size(); ++r)
            {
                auto const & jrow = v[r];
                if (!jrow.isObject())
                {
                    out.fail("row " + std::to_string(r + 1) + " must be an object");
                    return std::nullopt;
                }

                table_row row;
                for (auto const & key : jrow.getMemberNames())
                {
                    auto const * col = f.find_column(key);
                    if (!col)
                    {
                        out.fail("row " + std::to_string(r + 1) + ": '" + key + "' is not a column of '" + f.id + "'");
                        return std::nullopt;
                    }

                    auto const & jcell = jrow[key];
                    if (jcell.isNull())
                        continue;
                    if (jcell.isString() && is_blank(jcell.asString()))
                        continue;

                    auto cell = table_cell_from_json(*col, jcell, out);
                    if (!cell)
                        return std::nullopt;
                    row[col->id] = std::move(*cell);
                }
                tv.rows.push_back(std::move(row));
            }
            return tv;
        }

//---------------------------------------------------------------------------

        inline conversion value_from_json(field const & f, Json::Value const & v)
        {
            conversion out;

            if (v.isNull())
                return out.fail("set_value needs a value; use clear to remove an answer");

            switch (f.kind)
            {
                case field_kind::text:
                {
                    if (!v.isString())
                        return out.fail("expected a string, got " + json_type_name(v));
                    auto s = v.asString();
                    if (has_fence_line(s))
                        return out.fail("text cannot contain a line starting with ```");
                    out.value = text_value{ std::move(s) };
                    break;
                }

                case field_kind::number:
                    if (!is_json_number(v))
                        return out.fail("expected a number, got " + json_type_name(v));
                    out.value = number_value{ v.asDouble() };
                    break;

                case field_kind::text_list:
                    if (auto items = string_items(f, v, out))
                        out.value = text_list_value{ std::move(*items) };
                    break;

                case field_kind::url_list:
                    if (auto items = string_items(f, v, out))
                        out.value = url_list_value{ std::move(*items) };
                    break;

                case field_kind::single_choice:
                {
                    if (!v.isString())
                        return out.fail("expected an option id, got " + json_type_name(v));
                    auto id = v.asString();
                    if (!known_option(f, id, out))
                        return out;
                    out.value = single_choice_value{ std::move(id) };
                    break;
                }

                case field_kind::multi_choice:
                {
                    Json::Value ids = v;
                    if (v.isString())
                    {
                        ids = Json::Value(Json::arrayValue);
                        ids.append(v);
                        out.warnings.push_back("field '" + f.id + "': a single option id was accepted as a selection");
                    }
                    if (!ids.isArray())
                        return out.fail("expected an array of option ids, got " + json_type_name(v));

                    multi_choice_value mv;
                    for (auto const & id : ids)
                    {
                        if (!id.isString())
                            return out.fail("option ids must be strings, got " + json_type_name(id));
                        if (!known_option(f, id.asString(), out))
                            return out;
                        mv.selected.push_back(id.asString());
                    }

                    // Markers are written in option order; keep the value in that order too.
                    auto rank = [&](std::string const & id)
                    {
                        return f.find_option(id) - f.options.data();
                    };
                    std::stable_sort(mv.selected.begin(), mv.selected.end(),
                                     [&](std::string const & a, std::string const & b) { return rank(a) < rank(b); });

                    out.value = std::move(mv);
                    break;
                }

                case field_kind::checkbox_set:
                {
                    checkbox_value cv;
                    for (auto const & o : f.options)
                        cv.marks[o.id] = checkbox_status::todo;

                    if (v.isArray())
                    {
                        out.warnings.push_back("field '" + f.id + "': an option id list was read as done marks");
                        for (auto const & id : v)
                        {
                            if (!id.isString())
                                return out.fail("option ids must be strings, got " + json_type_name(id));
                            if (!known_option(f, id.asString(), out))
                                return out;
                            cv.marks[id.asString()] = checkbox_status::done;
                        }
                    }
                    else if (v.isObject())
                    {
                        for (auto const & key : v.getMemberNames())
                        {
                            if (!known_option(f, key, out))
                                return out;
                            auto mark = checkbox_mark(f, key, v[key], out);
                            if (!mark)
                                return out;
                            cv.marks[key] = *mark;
                        }
                    }
                    else
                        return out.fail("expected an object of option states, got " + json_type_name(v));

                    out.value = std::move(cv);
                    break;
                }

                case field_kind::url:
                    if (auto s = single_line(v, "url", out))
                        out.value = url_value{ std::move(*s) };
                    break;

                case field_kind::date:
                {
                    auto s = single_line(v, "date", out);
                    if (!s)
                        return out;
                    if (!is_date_shaped(*s))
                        return out.fail("'" + *s + "' is not a YYYY-MM-DD date");
                    out.value = date_value{ std::move(*s) };
                    break;
                }

                case field_kind::year:
                {
                    if (!is_json_number(v))
                        return out.fail("expected an integral year, got " + json_type_name(v));
                    double d = v.asDouble();
                    if (std::trunc(d) != d || std::fabs(d) > 1e15)
                        return out.fail(format_number(d) + " is not an integral year");
                    out.value = year_value{ static_cast<int64_t>(d) };
                    break;
                }

                case field_kind::table:
                    if (auto t = table_from_json(f, v, out))
                        out.value = std::move(*t);
                    break;
            }

            return out;
        }

//---------------------------------------------------------------------------

        inline std::optional<std::string> check_reason(std::optional<std::string> const & reason)
        {
            if (reason && reason->find('\n') != std::string::npos)
                return std::string("reason must be a single line");
            return std::nullopt;
        }
    }

//================================================================================================================
//
// apply_patches
//
//================================================================================================================

    inline apply_result apply_patches(document const & doc, std::vector<patch> const & patches)
    {
        apply_result out;

        auto reject = [&](size_t i, std::string const & id, std::string msg)
        {
            out.rejections.push_back({ i, id, std::move(msg) });
        };

        // Pass 1: every patch is checked against the input document.
        std::vector<std::optional<field_value>> converted(patches.size());

        for (size_t i = 0; i < patches.size(); ++i)
        {
            auto const & p = patches[i];

            switch (p.op)
            {
                case patch_op::set_value:
                case patch_op::skip:
                case patch_op::abort:
                case patch_op::clear:
                {
                    auto const * f = doc.find_field(p.field_id);
                    if (!f)
                    {
                        reject(i, p.field_id, "unknown field '" + p.field_id + "'");
                        break;
                    }

                    if (p.op == patch_op::set_value)
                    {
                        auto c = detail::value_from_json(*f, p.value);
                        if (!c.value)
                            reject(i, p.field_id, c.error);
                        else
                        {
                            converted[i] = std::move(c.value);
                            for (auto & w : c.warnings)
                                out.warnings.push_back(std::move(w));
                        }
                    }
                    else if (auto err = detail::check_reason(p.reason))
                        reject(i, p.field_id, *err);
                    break;
                }

                case patch_op::add_note:
                {
                    bool ref_ok = !p.ref.empty() &&
                                  (p.ref == doc.id() || doc.find_group(p.ref) || doc.find_field(p.ref));
                    if (!ref_ok)
                        reject(i, p.field_id, "note refers to unknown id '" + p.ref + "'");
                    else if (detail::is_blank(p.text))
                        reject(i, p.field_id, "note text is empty");
                    else if (detail::has_directive_line(p.text))
                        reject(i, p.field_id, "note text cannot contain a line starting with {%");
                    break;
                }

                case patch_op::remove_note:
                    if (!doc.find_note(p.note_id))
                        reject(i, p.field_id, "unknown note '" + p.note_id + "'");
                    break;
            }
        }

        std::set<std::string> touched;

        if (!out.rejections.empty())
        {
            out.status = apply_status::rejected;
            out.doc    = doc;
            out.warnings.clear();
        }
        else
        {
            // Pass 2: apply in order to a copy.
            out.doc = doc;
            editor ed(out.doc);

            for (size_t i = 0; i < patches.size(); ++i)
            {
                auto const & p = patches[i];
                switch (p.op)
                {
                    case patch_op::set_value:
                        if (ed.set_response(p.field_id, field_response::answered(std::move(*converted[i]))))
                            touched.insert(p.field_id);
                        break;
                    case patch_op::skip:
                        if (ed.set_response(p.field_id, field_response::skipped(p.reason)))
                            touched.erase(p.field_id);
                        break;
                    case patch_op::abort:
                        if (ed.set_response(p.field_id, field_response::aborted(p.reason)))
                            touched.erase(p.field_id);
                        break;
                    case patch_op::clear:
                        if (ed.clear_response(p.field_id))
                            touched.erase(p.field_id);
                        break;
                    case patch_op::add_note:
                        ed.append_note(p.ref, p.role.empty() ? std::string("agent") : p.role,
                                       std::string(detail::trim_sv(p.text)));
                        break;
                    case patch_op::remove_note:
                        if (!ed.erase_note(p.note_id))
                            out.warnings.push_back("note '" + p.note_id + "' was already removed");
                        break;
                }
            }
        }

        auto assessment = assess_document(out.doc);
        auto report     = inspect(out.doc);

        out.structure = std::move(report.structure);
        out.progress  = std::move(report.progress);
        out.state     = report.state;
        out.issues    = std::move(report.issues);

        if (out.status != apply_status::rejected)
        {
            bool any_invalid = std::any_of(touched.begin(), touched.end(), [&](std::string const & id)
            {
                auto const * a = assessment.find(id);
                return a && !a->counts_valid();
            });
            out.status = any_invalid ? apply_status::partial : apply_status::applied;
        }

        return out;
    }

} // namespace formwork

#endif // FORMWORK_PATCH_HPP
