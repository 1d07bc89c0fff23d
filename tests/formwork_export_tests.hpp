#ifndef FORMWORK_TESTS_EXPORT__
#define FORMWORK_TESTS_EXPORT__

#include "formwork_test_harness.hpp"
#include "formwork_test_documents.hpp"
#include "../include/formwork_export.hpp"

#include <yaml-cpp/yaml.h>

namespace formwork::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline bool json_has_string(Json::Value const & arr, std::string const & s)
    {
        for (auto const & v : arr)
            if (v.isString() && v.asString() == s)
                return true;
        return false;
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool test_export_values()
{
    auto values = export_values_json(load_clean(intake_src));

    EXPECT(values["name"]["state"].asString() == "answered", "answered state");
    EXPECT(values["name"]["value"].asString() == "Alice", "text value");
    EXPECT(values["tier"]["value"].asString() == "pro", "choice value");

    auto const & rows = values["team"]["value"];
    EXPECT(rows.isArray() && rows.size() == 2, "table rows");
    EXPECT(rows[0]["age"].isIntegral() && rows[0]["age"].asInt() == 41, "whole number cell not integral");
    EXPECT(rows[1]["age"]["state"].asString() == "skipped", "skipped cell state");
    EXPECT(rows[1]["age"]["reason"].asString() == "declined", "skipped cell reason");

    auto empty = export_values_json(load_clean(all_kinds_src));
    EXPECT(empty["t"]["state"].asString() == "unanswered" && !empty["t"].isMember("value"), "unanswered value");

    return true;
}

static bool test_exported_values_are_patch_shaped()
{
    auto doc = load_clean(intake_src);
    auto values = export_values_json(doc);

    auto cleared = apply_patches(doc, {
        state_patch(patch_op::clear, "name"),
        state_patch(patch_op::clear, "tier"),
        state_patch(patch_op::clear, "team")
    }).doc;

    std::vector<patch> answers;
    for (auto const * f : doc.fields())
        answers.push_back(set_patch(f->id, values[f->id]["value"]));

    auto r = apply_patches(cleared, answers);
    EXPECT(r.status == apply_status::applied, "exported values not accepted as patches");
    EXPECT(semantically_equal(r.doc, doc), "exported values do not rebuild the answers");

    return true;
}

static bool test_export_json_schema()
{
    auto s = export_json_schema(load_clean(intake_src));

    EXPECT(s["$id"].asString() == "intake" && s["title"].asString() == "Project intake", "schema header");
    EXPECT(s["required"].size() == 2 && json_has_string(s["required"], "name") && json_has_string(s["required"], "tier"),
           "required list");

    auto const & name = s["properties"]["name"];
    EXPECT(name["type"].asString() == "string" && name["description"].asString() == "Your full name.", "text schema");
    EXPECT(name["x-formwork"]["role"].asString() == "user" && name["x-formwork"]["group"].asString() == "basics",
           "field extension");

    auto const & tier = s["properties"]["tier"];
    EXPECT(tier["enum"].size() == 2 && tier["x-formwork"]["option_labels"]["pro"].asString() == "Pro", "choice schema");

    auto const & team = s["properties"]["team"];
    EXPECT(team["type"].asString() == "array" && team["minItems"].asInt() == 1, "table schema");
    EXPECT(team["items"]["required"][0].asString() == "who", "required column");
    EXPECT(team["items"]["properties"]["age"]["type"].asString() == "number", "column type");

    auto const & x = s["x-formwork"];
    EXPECT(x["run_mode"].asString() == "fill" && x["roles"].size() == 2, "form extension");
    EXPECT(x["groups"][0]["id"].asString() == "basics" && x["groups"][0]["fields"].size() == 3, "group listing");

    auto k = export_json_schema(load_clean(all_kinds_src));
    auto const & p = k["properties"];
    EXPECT(p["n"]["type"].asString() == "integer" && p["n"]["maximum"].asInt() == 100, "integer number");
    EXPECT(p["mc"]["uniqueItems"].asBool() && p["mc"]["maxItems"].asInt() == 2, "multi-choice limits");
    EXPECT(p["scb"]["properties"]["terms"]["type"].asString() == "boolean", "simple checkbox state");
    EXPECT(p["cb"]["properties"]["plan"]["enum"].size() == 5, "status checkbox states");
    EXPECT(p["d"]["format"].asString() == "date" && p["d"]["formatMinimum"].asString() == "2020-01-01", "date bounds");
    EXPECT(p["ul"]["items"]["format"].asString() == "uri", "url list items");
    EXPECT(k["x-formwork"]["groups"].empty(), "implicit group exported");

    return true;
}

static bool test_export_markdown()
{
    auto doc = load_clean(intake_src);
    auto skipped = apply_patches(doc, { state_patch(patch_op::skip, "tier", "undecided") }).doc;
    auto md = export_markdown(skipped);

    EXPECT(md.starts_with("# Project intake\n"), "title heading");
    EXPECT(contains(md, "\n## Basics\n"), "group heading");
    EXPECT(contains(md, "**Name** (required)\n\nAlice\n"), "text answer");
    EXPECT(contains(md, "_(skipped: undecided)_"), "skipped answer");
    EXPECT(contains(md, "| Who | Age |\n| --- | --- |\n| Bob | 41 |\n| Eve | %SKIP% (declined) |\n"), "table answer");
    EXPECT(contains(md, "## Notes\n\n- **name** (agent): Confirm spelling.\n"), "notes");
    EXPECT(!contains(md, "{%"), "directives leaked");

    return true;
}

static bool test_export_inspect_projections()
{
    auto r = inspect(load_clean(all_kinds_src));

    auto j = inspect_to_json(r);
    EXPECT(j["form_state"].asString() == "incomplete" && !j["is_complete"].asBool(), "state members");
    EXPECT(j["progress"]["counts"]["total_fields"].asUInt() == 12, "counts");
    EXPECT(j["structure"]["fields_by_kind"]["checkbox-set"].asUInt() == 2, "kind counts");
    EXPECT(j["issues"][0]["ref"].asString() == "t", "first issue");
    EXPECT(j["issues"][0]["reason"].asString() == "missing-required-value", "reason spelling");
    EXPECT(j["issues"][0]["priority"].asInt() == 2, "priority");

    auto y = YAML::Load(inspect_to_yaml(r));
    EXPECT(y["form_state"].as<std::string>() == "incomplete", "YAML state");
    EXPECT(y["issues"][0]["severity"].as<std::string>() == "required", "YAML issue");
    EXPECT(y["progress"]["counts"]["required_fields"].as<int>() == 1, "YAML counts");

    auto text = inspect_to_text(r);
    EXPECT(contains(text, "state: incomplete\n"), "text state");
    EXPECT(contains(text, "  [P2 required] t: missing-required-value - Required field \"Text\" has no value\n"), "text issue");

    EXPECT(contains(inspect_to_text(inspect(load_clean(intake_src))), "no issues\n"), "clean text report");

    return true;
}

static bool test_export_plan_projections()
{
    constexpr std::string_view src =
        "{% form id=\"p\" %}\n"
        "{% field kind=\"text\" id=\"a\" label=\"A\" parallel=\"research\" %}\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"s\" label=\"S\" serial=true %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    auto plan = compute_execution_plan(load_clean(src));

    auto j = plan_to_json(plan);
    EXPECT(j["order_levels"][0].asInt() == 0, "levels");
    EXPECT(j["loose_serial"][0]["id"].asString() == "s", "serial item");
    EXPECT(j["parallel_batches"][0]["id"].asString() == "research", "batch");
    EXPECT(j["parallel_batches"][0]["items"][0]["remaining_fields"][0].asString() == "a", "batch item fields");

    auto text = plan_to_text(plan);
    EXPECT(text == "order 0:\n"
                   "  serial:\n"
                   "    field s [agent]: s\n"
                   "  batch research:\n"
                   "    field a [agent]: a\n", "plan text");

    EXPECT(plan_to_text(execution_plan{}) == "nothing left to do\n", "empty plan text");

    return true;
}

static bool test_export_apply_result()
{
    auto doc = load_clean(intake_src);
    auto r = apply_patches(doc, { set_patch("name", "Bob"), set_patch("tier", "gold") });
    auto j = apply_result_to_json(r);

    EXPECT(j["status"].asString() == "rejected", "status");
    EXPECT(j["rejections"].size() == 1 && j["rejections"][0]["patch_index"].asUInt() == 1, "rejection index");
    EXPECT(j["warnings"].isArray() && j["warnings"].empty(), "warnings");
    EXPECT(j["form_state"].asString() == "complete", "state of the unchanged document");

    auto text = to_json_string(j);
    EXPECT(text.starts_with("{\n  \"") && text.ends_with("}\n"), "indented JSON text");

    return true;
}

//------------------------------------------
// RUN ALL TESTS
//------------------------------------------

inline void run_export_tests()
{
    SUBCAT("Document exports");
    RUN_TEST(test_export_values);
    RUN_TEST(test_exported_values_are_patch_shaped);
    RUN_TEST(test_export_json_schema);
    RUN_TEST(test_export_markdown);

    SUBCAT("Reports");
    RUN_TEST(test_export_inspect_projections);
    RUN_TEST(test_export_plan_projections);
    RUN_TEST(test_export_apply_result);
}

} // ns formwork::tests

#endif
