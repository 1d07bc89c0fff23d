// formwork_export.hpp - Formwork - Read-only projections
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_EXPORT_HPP
#define FORMWORK_EXPORT_HPP

#include "formwork_document.hpp"
#include "formwork_inspect.hpp"
#include "formwork_patch.hpp"
#include "formwork_plan.hpp"
#include "formwork_serializer.hpp"

#include <json/json.h>
#include <yaml-cpp/yaml.h>

#include <sstream>

namespace formwork
{
//========================================================================
// Projections
//
// None of these outputs is read back. They may drop response detail,
// but the schema export keeps everything needed to rebuild the schema.
//========================================================================

    std::string export_markdown(document const & doc);

    Json::Value export_json_schema(document const & doc);
    Json::Value export_values_json(document const & doc);

    // Field value in the same shape a set_value patch accepts.
    Json::Value value_to_json(field const & f, field_value const & v);

    Json::Value inspect_to_json(inspect_result const & r);
    std::string inspect_to_yaml(inspect_result const & r);
    std::string inspect_to_text(inspect_result const & r);

    Json::Value plan_to_json(execution_plan const & p);
    std::string plan_to_text(execution_plan const & p);

    Json::Value apply_result_to_json(apply_result const & r);

    // Two-space indented JSON text with a trailing newline.
    std::string to_json_string(Json::Value const & v);

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        inline Json::Value json_number(double d)
        {
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15)
                return Json::Value(static_cast<Json::Int64>(d));
            return Json::Value(d);
        }

        inline Json::Value json_strings(std::vector<std::string> const & items)
        {
            Json::Value arr(Json::arrayValue);
            for (auto const & s : items)
                arr.append(s);
            return arr;
        }

        inline Json::Value json_cell(table_cell const & cell)
        {
            if (cell.state != cell_state::answered)
            {
                Json::Value obj(Json::objectValue);
                obj["state"] = cell.state == cell_state::skipped ? "skipped" : "aborted";
                if (cell.reason)
                    obj["reason"] = *cell.reason;
                return obj;
            }

            return std::visit([](auto const & s) -> Json::Value
            {
                if constexpr (std::is_same_v<std::decay_t<decltype(s)>, double>)
                    return json_number(s);
                else
                    return Json::Value(s);
            }, cell.value);
        }

        inline std::string cell_text(table_cell const & cell)
        {
            if (cell.state != cell_state::answered)
            {
                std::string s = cell.state == cell_state::skipped ? "%SKIP%" : "%ABORT%";
                if (cell.reason)
                    s += " (" + *cell.reason + ")";
                return s;
            }

            if (auto d = std::get_if<double>(&cell.value))
                return format_number(*d);
            return std::get<std::string>(cell.value);
        }

        inline std::string option_label(field const & f, std::string const & id)
        {
            if (auto o = f.find_option(id))
                return o->label;
            return id;
        }

        inline void emit_json_as_yaml(YAML::Emitter & out, Json::Value const & v)
        {
            switch (v.type())
            {
                case Json::nullValue:    out << YAML::Null; break;
                case Json::intValue:     out << v.asInt64(); break;
                case Json::uintValue:    out << v.asUInt64(); break;
                case Json::realValue:    out << v.asDouble(); break;
                case Json::stringValue:  out << v.asString(); break;
                case Json::booleanValue: out << v.asBool(); break;

                case Json::arrayValue:
                    out << YAML::BeginSeq;
                    for (auto const & item : v)
                        emit_json_as_yaml(out, item);
                    out << YAML::EndSeq;
                    break;

                case Json::objectValue:
                    out << YAML::BeginMap;
                    for (auto const & key : v.getMemberNames())
                    {
                        out << YAML::Key << key << YAML::Value;
                        emit_json_as_yaml(out, v[key]);
                    }
                    out << YAML::EndMap;
                    break;
            }
        }
    }

//---------------------------------------------------------------------------

    inline std::string to_json_string(Json::Value const & v)
    {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        builder["precision"]   = 15;
        return Json::writeString(builder, v) + "\n";
    }

//---------------------------------------------------------------------------

    inline Json::Value value_to_json(field const & f, field_value const & v)
    {
        switch (kind_of(v))
        {
            case field_kind::text:          return std::get<text_value>(v).text;
            case field_kind::number:        return detail::json_number(std::get<number_value>(v).number);
            case field_kind::text_list:     return detail::json_strings(std::get<text_list_value>(v).items);
            case field_kind::url:           return std::get<url_value>(v).url;
            case field_kind::url_list:      return detail::json_strings(std::get<url_list_value>(v).items);
            case field_kind::date:          return std::get<date_value>(v).date;
            case field_kind::year:          return static_cast<Json::Int64>(std::get<year_value>(v).year);
            case field_kind::multi_choice:  return detail::json_strings(std::get<multi_choice_value>(v).selected);

            case field_kind::single_choice:
            {
                auto const & sel = std::get<single_choice_value>(v).selected;
                return sel ? Json::Value(*sel) : Json::Value(Json::nullValue);
            }

            case field_kind::checkbox_set:
            {
                Json::Value obj(Json::objectValue);
                for (auto const & [id, status] : std::get<checkbox_value>(v).marks)
                {
                    if (f.mode == checkbox_mode::simple)
                        obj[id] = status == checkbox_status::done;
                    else
                        obj[id] = std::string(detail::status_to_string(status));
                }
                return obj;
            }

            case field_kind::table:
            {
                Json::Value rows(Json::arrayValue);
                for (auto const & row : std::get<table_value>(v).rows)
                {
                    Json::Value obj(Json::objectValue);
                    for (auto const & [col, cell] : row)
                        obj[col] = detail::json_cell(cell);
                    rows.append(obj);
                }
                return rows;
            }
        }
        return Json::Value();
    }

//---------------------------------------------------------------------------

    inline Json::Value export_values_json(document const & doc)
    {
        Json::Value out(Json::objectValue);

        for (auto const * f : doc.fields())
        {
            auto const & r = doc.response(f->id);

            Json::Value entry(Json::objectValue);
            entry["state"] = std::string(detail::state_to_string(r.state));
            if (r.value)
                entry["value"] = value_to_json(*f, *r.value);
            if (r.reason)
                entry["reason"] = *r.reason;

            out[f->id] = entry;
        }
        return out;
    }

//---------------------------------------------------------------------------

    namespace detail
    {
        inline Json::Value field_extension(document const & doc, field const & f)
        {
            Json::Value x(Json::objectValue);
            x["kind"]     = std::string(kind_to_string(f.kind));
            x["role"]     = f.role;
            x["priority"] = std::string(priority_to_string(f.priority));

            if (auto g = doc.group_of(f.id); g && !g->implicit)
                x["group"] = g->id;
            if (f.order)      x["order"]      = static_cast<Json::Int64>(*f.order);
            if (f.parallel)   x["parallel"]   = *f.parallel;
            if (f.serial)     x["serial"]     = true;
            if (f.depends_on) x["depends_on"] = *f.depends_on;
            if (f.when)       x["when"]       = *f.when;

            if (f.kind == field_kind::text && f.multiline)
                x["multiline"] = true;

            if (f.kind == field_kind::checkbox_set)
            {
                x["checkbox_mode"] = std::string(mode_to_string(f.mode));
                x["approval"]      = std::string(approval_to_string(f.approval));
                if (f.min_done)
                    x["min_done"] = static_cast<Json::Int64>(*f.min_done);
            }

            if (f.kind == field_kind::date)
            {
                if (f.min_date) x["min_date"] = *f.min_date;
                if (f.max_date) x["max_date"] = *f.max_date;
            }

            if (!f.options.empty())
            {
                Json::Value labels(Json::objectValue);
                for (auto const & o : f.options)
                    labels[o.id] = o.label;
                x["option_labels"] = labels;
            }
            return x;
        }

        inline Json::Value column_schema(column const & c)
        {
            Json::Value s(Json::objectValue);
            s["title"] = c.label;
            switch (c.type)
            {
                case column_type::text:   s["type"] = "string"; break;
                case column_type::number: s["type"] = "number"; break;
                case column_type::year:   s["type"] = "integer"; break;
                case column_type::url:    s["type"] = "string"; s["format"] = "uri";  break;
                case column_type::date:   s["type"] = "string"; s["format"] = "date"; break;
            }
            return s;
        }

        inline Json::Value field_schema(document const & doc, field const & f)
        {
            Json::Value s(Json::objectValue);
            s["title"] = f.label;
            if (!f.prompt.empty())
                s["description"] = f.prompt;

            auto enum_of_options = [&]
            {
                Json::Value e(Json::arrayValue);
                for (auto const & o : f.options)
                    e.append(o.id);
                return e;
            };

            switch (f.kind)
            {
                case field_kind::text:
                    s["type"] = "string";
                    if (f.min_length) s["minLength"] = static_cast<Json::Int64>(*f.min_length);
                    if (f.max_length) s["maxLength"] = static_cast<Json::Int64>(*f.max_length);
                    if (f.pattern)    s["pattern"]   = *f.pattern;
                    break;

                case field_kind::number:
                    s["type"] = f.integer ? "integer" : "number";
                    if (f.min) s["minimum"] = json_number(*f.min);
                    if (f.max) s["maximum"] = json_number(*f.max);
                    break;

                case field_kind::year:
                    s["type"] = "integer";
                    if (f.min) s["minimum"] = json_number(*f.min);
                    if (f.max) s["maximum"] = json_number(*f.max);
                    break;

                case field_kind::url:
                    s["type"]   = "string";
                    s["format"] = "uri";
                    break;

                case field_kind::date:
                    s["type"]   = "string";
                    s["format"] = "date";
                    if (f.min_date) s["formatMinimum"] = *f.min_date;
                    if (f.max_date) s["formatMaximum"] = *f.max_date;
                    break;

                case field_kind::text_list:
                case field_kind::url_list:
                {
                    Json::Value item(Json::objectValue);
                    item["type"] = "string";
                    if (f.kind == field_kind::url_list)
                        item["format"] = "uri";

                    s["type"]  = "array";
                    s["items"] = item;
                    if (f.min_items)    s["minItems"]    = static_cast<Json::Int64>(*f.min_items);
                    if (f.max_items)    s["maxItems"]    = static_cast<Json::Int64>(*f.max_items);
                    if (f.unique_items) s["uniqueItems"] = true;
                    break;
                }

                case field_kind::single_choice:
                    s["type"] = "string";
                    s["enum"] = enum_of_options();
                    break;

                case field_kind::multi_choice:
                {
                    Json::Value item(Json::objectValue);
                    item["type"] = "string";
                    item["enum"] = enum_of_options();

                    s["type"]        = "array";
                    s["items"]       = item;
                    s["uniqueItems"] = true;
                    if (f.min_selections) s["minItems"] = static_cast<Json::Int64>(*f.min_selections);
                    if (f.max_selections) s["maxItems"] = static_cast<Json::Int64>(*f.max_selections);
                    break;
                }

                case field_kind::checkbox_set:
                {
                    Json::Value state(Json::objectValue);
                    if (f.mode == checkbox_mode::simple)
                        state["type"] = "boolean";
                    else
                    {
                        Json::Value e(Json::arrayValue);
                        for (auto st : { checkbox_status::todo, checkbox_status::done, checkbox_status::incomplete,
                                         checkbox_status::active, checkbox_status::na })
                            e.append(std::string(status_to_string(st)));
                        state["type"] = "string";
                        state["enum"] = e;
                    }

                    Json::Value props(Json::objectValue);
                    for (auto const & o : f.options)
                    {
                        Json::Value p = state;
                        p["title"] = o.label;
                        props[o.id] = p;
                    }

                    s["type"]                 = "object";
                    s["properties"]           = props;
                    s["additionalProperties"] = false;
                    break;
                }

                case field_kind::table:
                {
                    Json::Value props(Json::objectValue);
                    Json::Value req(Json::arrayValue);
                    for (auto const & c : f.columns)
                    {
                        props[c.id] = column_schema(c);
                        if (c.required)
                            req.append(c.id);
                    }

                    Json::Value row(Json::objectValue);
                    row["type"]                 = "object";
                    row["properties"]           = props;
                    row["additionalProperties"] = false;
                    if (!req.empty())
                        row["required"] = req;

                    s["type"]  = "array";
                    s["items"] = row;
                    if (f.min_rows) s["minItems"] = static_cast<Json::Int64>(*f.min_rows);
                    if (f.max_rows) s["maxItems"] = static_cast<Json::Int64>(*f.max_rows);
                    break;
                }
            }

            s["x-formwork"] = field_extension(doc, f);
            return s;
        }
    }

//---------------------------------------------------------------------------

    inline Json::Value export_json_schema(document const & doc)
    {
        auto const & meta = doc.metadata();

        Json::Value root(Json::objectValue);
        root["$schema"] = "https://json-schema.org/draft/2020-12/schema";
        root["$id"]     = doc.id();
        root["type"]    = "object";
        root["title"]   = doc.title().empty() ? doc.id() : doc.title();

        Json::Value props(Json::objectValue);
        Json::Value required(Json::arrayValue);

        for (auto const * f : doc.fields())
        {
            props[f->id] = detail::field_schema(doc, *f);
            if (f->required)
                required.append(f->id);
        }

        root["properties"] = props;
        if (!required.empty())
            root["required"] = required;

        Json::Value x(Json::objectValue);
        if (!meta.spec_version.empty())
            x["spec"] = meta.spec_version;
        if (meta.mode)
            x["run_mode"] = std::string(detail::run_mode_to_string(*meta.mode));
        if (!meta.roles.empty())
            x["roles"] = detail::json_strings(meta.roles);
        if (!meta.role_instructions.empty())
        {
            Json::Value ri(Json::objectValue);
            for (auto const & [role, text] : meta.role_instructions)
                ri[role] = text;
            x["role_instructions"] = ri;
        }

        Json::Value groups(Json::arrayValue);
        for (auto const & g : doc.groups())
        {
            if (g.implicit)
                continue;

            Json::Value jg(Json::objectValue);
            jg["id"] = g.id;
            if (!g.title.empty())
                jg["title"] = g.title;
            if (g.order)
                jg["order"] = static_cast<Json::Int64>(*g.order);
            if (g.parallel)
                jg["parallel"] = *g.parallel;

            Json::Value members(Json::arrayValue);
            for (auto const & f : g.fields)
                members.append(f.id);
            jg["fields"] = members;

            groups.append(jg);
        }
        x["groups"] = groups;

        root["x-formwork"] = x;
        return root;
    }

//---------------------------------------------------------------------------

    inline std::string export_markdown(document const & doc)
    {
        std::ostringstream out;

        out << "# " << (doc.title().empty() ? doc.id() : doc.title()) << "\n";

        auto answer = [&](field const & f)
        {
            auto const & r = doc.response(f.id);

            if (r.state != answer_state::answered || !r.value)
            {
                out << "_(" << detail::state_to_string(r.state);
                if (r.reason)
                    out << ": " << *r.reason;
                out << ")_\n";
                return;
            }

            auto const & v = *r.value;
            if (is_empty_value(v))
            {
                out << "_(no answer)_\n";
                return;
            }

            switch (f.kind)
            {
                case field_kind::text:   out << std::get<text_value>(v).text << "\n"; break;
                case field_kind::number: out << detail::format_number(std::get<number_value>(v).number) << "\n"; break;
                case field_kind::url:    out << std::get<url_value>(v).url << "\n"; break;
                case field_kind::date:   out << std::get<date_value>(v).date << "\n"; break;
                case field_kind::year:   out << std::get<year_value>(v).year << "\n"; break;

                case field_kind::text_list:
                    for (auto const & item : std::get<text_list_value>(v).items)
                        out << "- " << item << "\n";
                    break;

                case field_kind::url_list:
                    for (auto const & item : std::get<url_list_value>(v).items)
                        out << "- " << item << "\n";
                    break;

                case field_kind::single_choice:
                    out << detail::option_label(f, *std::get<single_choice_value>(v).selected) << "\n";
                    break;

                case field_kind::multi_choice:
                    for (auto const & id : std::get<multi_choice_value>(v).selected)
                        out << "- " << detail::option_label(f, id) << "\n";
                    break;

                case field_kind::checkbox_set:
                {
                    auto const & marks = std::get<checkbox_value>(v).marks;
                    for (auto const & o : f.options)
                    {
                        auto it = marks.find(o.id);
                        auto st = it == marks.end() ? checkbox_status::todo : it->second;
                        out << "- [" << detail::status_to_marker(st) << "] " << o.label << "\n";
                    }
                    break;
                }

                case field_kind::table:
                {
                    std::vector<std::string> head, rule;
                    for (auto const & c : f.columns)
                    {
                        head.push_back(detail::escape_cell(c.label.empty() ? c.id : c.label));
                        rule.push_back("---");
                    }
                    out << "| " << detail::join(head, " | ") << " |\n";
                    out << "| " << detail::join(rule, " | ") << " |\n";

                    for (auto const & row : std::get<table_value>(v).rows)
                    {
                        std::vector<std::string> cells;
                        for (auto const & c : f.columns)
                        {
                            auto it = row.find(c.id);
                            cells.push_back(it == row.end() ? std::string{} : detail::escape_cell(detail::cell_text(it->second)));
                        }
                        out << "| " << detail::join(cells, " | ") << " |\n";
                    }
                    break;
                }
            }
        };

        for (auto const & g : doc.groups())
        {
            if (!g.implicit)
                out << "\n## " << (g.title.empty() ? g.id : g.title) << "\n";

            for (auto const & f : g.fields)
            {
                out << "\n**" << f.label << "**" << (f.required ? " (required)" : "") << "\n\n";
                answer(f);
            }
        }

        if (!doc.notes().empty())
        {
            out << "\n## Notes\n\n";
            for (auto const & n : doc.notes())
                out << "- **" << n.ref << "** (" << n.role << "): " << n.text << "\n";
        }

        return out.str();
    }

//---------------------------------------------------------------------------

    namespace detail
    {
        inline Json::Value issue_to_json(inspect_issue const & i)
        {
            Json::Value j(Json::objectValue);
            j["ref"]      = i.ref;
            j["scope"]    = std::string(scope_to_string(i.scope));
            j["reason"]   = std::string(reason_to_string(i.reason));
            j["message"]  = i.message;
            j["severity"] = std::string(severity_to_string(i.severity));
            j["priority"] = i.priority;
            if (i.blocked_by)
                j["blocked_by"] = *i.blocked_by;
            return j;
        }

        inline Json::Value structure_to_json(structure_summary const & s)
        {
            Json::Value j(Json::objectValue);
            j["group_count"]  = static_cast<Json::UInt64>(s.group_count);
            j["field_count"]  = static_cast<Json::UInt64>(s.field_count);
            j["option_count"] = static_cast<Json::UInt64>(s.option_count);
            j["column_count"] = static_cast<Json::UInt64>(s.column_count);

            Json::Value kinds(Json::objectValue);
            for (auto const & [k, n] : s.fields_by_kind)
                kinds[std::string(kind_to_string(k))] = static_cast<Json::UInt64>(n);
            j["fields_by_kind"] = kinds;
            return j;
        }

        inline Json::Value progress_to_json(progress_summary const & p)
        {
            auto const & c = p.counts;
            auto n = [](size_t v) { return Json::Value(static_cast<Json::UInt64>(v)); };

            Json::Value counts(Json::objectValue);
            counts["total_fields"]          = n(c.total_fields);
            counts["required_fields"]       = n(c.required_fields);
            counts["unanswered_fields"]     = n(c.unanswered_fields);
            counts["answered_fields"]       = n(c.answered_fields);
            counts["skipped_fields"]        = n(c.skipped_fields);
            counts["aborted_fields"]        = n(c.aborted_fields);
            counts["valid_fields"]          = n(c.valid_fields);
            counts["invalid_fields"]        = n(c.invalid_fields);
            counts["empty_fields"]          = n(c.empty_fields);
            counts["filled_fields"]         = n(c.filled_fields);
            counts["empty_required_fields"] = n(c.empty_required_fields);
            counts["total_notes"]           = n(c.total_notes);

            Json::Value fields(Json::arrayValue);
            for (auto const & fp : p.fields)
            {
                Json::Value jf(Json::objectValue);
                jf["id"]          = fp.id;
                jf["kind"]        = std::string(kind_to_string(fp.kind));
                jf["required"]    = fp.required;
                jf["state"]       = std::string(state_to_string(fp.state));
                jf["empty"]       = fp.empty;
                jf["valid"]       = fp.valid;
                jf["issue_count"] = n(fp.issue_count);
                jf["note_count"]  = n(fp.note_count);
                fields.append(jf);
            }

            Json::Value j(Json::objectValue);
            j["counts"] = counts;
            j["fields"] = fields;
            return j;
        }

        inline Json::Value issues_to_json(std::vector<inspect_issue> const & issues)
        {
            Json::Value arr(Json::arrayValue);
            for (auto const & i : issues)
                arr.append(issue_to_json(i));
            return arr;
        }

        inline Json::Value plan_item_to_json(plan_item const & item)
        {
            Json::Value j(Json::objectValue);
            j["id"]    = item.id;
            j["type"]  = std::string(item_type_to_string(item.type));
            j["order"] = static_cast<Json::Int64>(item.order);
            if (item.role)
                j["role"] = *item.role;
            j["remaining_fields"] = json_strings(item.remaining_fields);
            return j;
        }
    }

//---------------------------------------------------------------------------

    inline Json::Value inspect_to_json(inspect_result const & r)
    {
        Json::Value j(Json::objectValue);
        j["form_state"]  = std::string(form_state_to_string(r.state));
        j["is_complete"] = r.is_complete;
        j["structure"]   = detail::structure_to_json(r.structure);
        j["progress"]    = detail::progress_to_json(r.progress);
        j["issues"]      = detail::issues_to_json(r.issues);
        return j;
    }

    inline std::string inspect_to_yaml(inspect_result const & r)
    {
        YAML::Emitter out;
        detail::emit_json_as_yaml(out, inspect_to_json(r));
        return std::string(out.c_str()) + "\n";
    }

    inline std::string inspect_to_text(inspect_result const & r)
    {
        auto const & c = r.progress.counts;
        std::ostringstream out;

        out << "state: " << form_state_to_string(r.state) << "\n";
        out << "fields: " << c.total_fields << " (" << c.required_fields << " required)\n";
        out << "answered: " << c.answered_fields
            << ", skipped: " << c.skipped_fields
            << ", aborted: " << c.aborted_fields
            << ", unanswered: " << c.unanswered_fields << "\n";
        out << "invalid: " << c.invalid_fields
            << ", empty required: " << c.empty_required_fields
            << ", notes: " << c.total_notes << "\n";

        if (r.issues.empty())
        {
            out << "no issues\n";
            return out.str();
        }

        out << "issues:\n";
        for (auto const & i : r.issues)
        {
            out << "  [P" << i.priority << " " << severity_to_string(i.severity) << "] "
                << i.ref << ": " << reason_to_string(i.reason) << " - " << i.message;
            if (i.blocked_by)
                out << " (blocked by " << *i.blocked_by << ")";
            out << "\n";
        }
        return out.str();
    }

//---------------------------------------------------------------------------

    inline Json::Value plan_to_json(execution_plan const & p)
    {
        Json::Value j(Json::objectValue);

        Json::Value levels(Json::arrayValue);
        for (auto l : p.order_levels)
            levels.append(static_cast<Json::Int64>(l));
        j["order_levels"] = levels;

        Json::Value loose(Json::arrayValue);
        for (auto const & item : p.loose_serial)
            loose.append(detail::plan_item_to_json(item));
        j["loose_serial"] = loose;

        Json::Value batches(Json::arrayValue);
        for (auto const & b : p.parallel_batches)
        {
            Json::Value jb(Json::objectValue);
            jb["id"]    = b.id;
            jb["order"] = static_cast<Json::Int64>(b.order);

            Json::Value items(Json::arrayValue);
            for (auto const & item : b.items)
                items.append(detail::plan_item_to_json(item));
            jb["items"] = items;
            batches.append(jb);
        }
        j["parallel_batches"] = batches;
        return j;
    }

    inline std::string plan_to_text(execution_plan const & p)
    {
        std::ostringstream out;
        if (p.empty())
        {
            out << "nothing left to do\n";
            return out.str();
        }

        auto item_line = [&](plan_item const & item)
        {
            out << "    " << item_type_to_string(item.type) << " " << item.id;
            if (item.role)
                out << " [" << *item.role << "]";
            out << ": " << detail::join(item.remaining_fields, ", ") << "\n";
        };

        for (auto level : p.order_levels)
        {
            out << "order " << level << ":\n";

            bool any_serial = false;
            for (auto const & item : p.loose_serial)
            {
                if (item.order != level)
                    continue;
                if (!any_serial)
                    out << "  serial:\n";
                any_serial = true;
                item_line(item);
            }

            for (auto const & b : p.parallel_batches)
            {
                if (b.order != level)
                    continue;
                out << "  batch " << b.id << ":\n";
                for (auto const & item : b.items)
                    item_line(item);
            }
        }
        return out.str();
    }

//---------------------------------------------------------------------------

    inline Json::Value apply_result_to_json(apply_result const & r)
    {
        Json::Value j(Json::objectValue);
        j["status"]     = std::string(apply_status_to_string(r.status));
        j["form_state"] = std::string(form_state_to_string(r.state));
        j["structure"]  = detail::structure_to_json(r.structure);
        j["progress"]   = detail::progress_to_json(r.progress);
        j["issues"]     = detail::issues_to_json(r.issues);

        Json::Value rejections(Json::arrayValue);
        for (auto const & rej : r.rejections)
        {
            Json::Value jr(Json::objectValue);
            jr["patch_index"] = static_cast<Json::UInt64>(rej.patch_index);
            jr["field_id"]    = rej.field_id;
            jr["message"]     = rej.message;
            rejections.append(jr);
        }
        j["rejections"] = rejections;
        j["warnings"]   = detail::json_strings(r.warnings);
        return j;
    }

} // namespace formwork

#endif // FORMWORK_EXPORT_HPP
