#ifndef FORMWORK_TESTS_SCENARIO__
#define FORMWORK_TESTS_SCENARIO__

#include "formwork_test_harness.hpp"
#include "formwork_test_documents.hpp"
#include "../include/formwork.hpp"

namespace formwork::tests
{
//------------------------------------------
// TESTS
//------------------------------------------

static bool scenario_required_choice_cycle()
{
    constexpr std::string_view src =
        "{% form id=\"f\" %}\n"
        "{% field kind=\"single-choice\" id=\"pick\" label=\"Pick\" required=true %}\n"
        "- [ ] A {% #a %}\n"
        "- [ ] B {% #b %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    auto doc = load_clean(src);

    auto first = inspect(doc);
    EXPECT(first.issues.size() == 1, "one issue expected");
    EXPECT(first.issues[0].priority == 2, "missing required choice not P2");
    EXPECT(reason_to_string(first.issues[0].reason) == "missing-required-value", "wrong reason");
    EXPECT(first.state == form_state::incomplete, "form not incomplete");

    auto wrong = apply_patches(doc, { set_patch("pick", "c") });
    EXPECT(wrong.status == apply_status::rejected, "unknown option applied");
    EXPECT(contains(wrong.rejections[0].message, "'c'"), "rejection does not name the option");

    auto right = apply_patches(doc, { set_patch("pick", "a") });
    EXPECT(right.status == apply_status::applied, "valid option rejected");
    EXPECT(right.state == form_state::complete && right.issues.empty(), "answered form not complete");

    auto text = serialize(right.doc);
    EXPECT(contains(text, "- [x] A {% #a %}\n- [ ] B {% #b %}\n"), "answer not written as markers");

    return true;
}

static bool scenario_dependency_blocks_until_answered()
{
    constexpr std::string_view src =
        "{% form id=\"f\" %}\n"
        "{% field kind=\"text\" id=\"a\" label=\"A\" required=true %}\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"b\" label=\"B\" required=true depends_on=\"a\" %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    auto doc = load_clean(src);
    auto issues = inspect(doc).issues;

    auto const * a = find_issue(issues, "a");
    auto const * b = find_issue(issues, "b");
    EXPECT(a && a->priority == 2 && !a->blocked_by, "a should be open");
    EXPECT(b && b->blocked_by == std::optional<std::string>("a"), "b should wait on a");

    auto ready = filter_issues_by_order(issues, doc);
    EXPECT(ready.size() == 1 && ready[0].ref == "a", "readiness kept a blocked issue");

    auto answered = apply_patches(doc, { set_patch("a", "done") }).doc;
    auto next = filter_issues_by_order(inspect(answered).issues, answered);
    EXPECT(next.size() == 1 && next[0].ref == "b" && !next[0].blocked_by, "b not released");

    return true;
}

static bool scenario_roles_split_into_batches()
{
    constexpr std::string_view src =
        "{% form id=\"f\" %}\n"
        "{% field kind=\"text\" id=\"x\" label=\"X\" role=\"user\" %}\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"y\" label=\"Y\" role=\"agent\" %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    auto plan = compute_execution_plan(load_clean(src));

    EXPECT(plan.loose_serial.empty(), "role items left serial");
    EXPECT(plan.parallel_batches.size() == 2, "wrong batch count");
    EXPECT(plan.parallel_batches[0].id == "role-user", "user batch");
    EXPECT(plan.parallel_batches[1].id == "role-agent", "agent batch");

    return true;
}

static bool scenario_fill_turns_until_complete()
{
    auto doc = load_clean(all_kinds_src);
    auto cfg = resolve_harness_config(doc.metadata());
    cfg.max_issues_per_turn = 4;

    // Answers an agent would give for each field.
    std::map<std::string, Json::Value> answers;
    answers["t"]  = "short";
    answers["n"]  = 7;
    answers["tl"] = json_array({ "alpha", "beta" });
    answers["sc"] = "red";
    answers["mc"] = json_array({ "fish" });
    answers["u"]  = "https://example.org";
    answers["ul"] = json_array({ "https://a.example" });
    answers["d"]  = "2024-01-31";
    answers["y"]  = 1999;

    Json::Value steps(Json::objectValue);
    steps["plan"]  = "done";
    steps["build"] = "na";
    answers["cb"] = steps;

    Json::Value terms(Json::objectValue);
    terms["terms"] = true;
    answers["scb"] = terms;

    Json::Value row(Json::objectValue);
    row["who"] = "Ann";
    Json::Value rows(Json::arrayValue);
    rows.append(row);
    answers["tb"] = rows;

    int turns = 0;
    for (; turns < cfg.max_turns; ++turns)
    {
        auto issues = next_issues(doc, cfg);
        if (issues.empty())
            break;
        EXPECT(static_cast<int64_t>(issues.size()) <= cfg.max_issues_per_turn, "turn exceeded the issue cap");

        std::vector<patch> batch;
        for (auto const & i : issues)
            batch.push_back(set_patch(i.ref, answers.at(i.ref)));

        auto r = apply_patches(doc, batch);
        EXPECT(r.status == apply_status::applied, "turn not applied");

        // Each turn goes through the text format.
        doc = load_clean(serialize(r.doc));
    }

    EXPECT(turns == 3, "twelve issues at four per turn take three turns");
    auto final_report = inspect(doc);
    EXPECT(final_report.is_complete && final_report.state == form_state::complete, "filled form not complete");
    EXPECT(compute_execution_plan(doc).empty(), "filled form still planned");

    return true;
}

static bool scenario_cli_style_patch_file()
{
    auto doc = load_clean(intake_src);

    auto decoded = decode_patches(R"([
        { "op": "set_value", "field_id": "tier", "value": "free" },
        { "op": "add_note", "ref": "tier", "text": "Downgraded on request." }
    ])");
    EXPECT(!decoded.has_errors(), "patch file not decoded");

    auto r = apply_patches(doc, decoded.result);
    EXPECT(r.status == apply_status::applied, "patch file not applied");

    auto text = serialize(r.doc);
    bool ok = false;
    auto again = load_clean(text, &ok);
    EXPECT(ok && semantically_equal(again, r.doc), "written file does not reload");
    EXPECT(text.starts_with(std::string(intake_src.substr(0, intake_src.find("{% field kind=\"single-choice\"")))),
           "untouched prefix rewritten");

    return true;
}

//------------------------------------------
// RUN ALL TESTS
//------------------------------------------

inline void run_scenario_tests()
{
    SUBCAT("Engine scenarios");
    RUN_TEST(scenario_required_choice_cycle);
    RUN_TEST(scenario_dependency_blocks_until_answered);
    RUN_TEST(scenario_roles_split_into_batches);
    RUN_TEST(scenario_fill_turns_until_complete);
    RUN_TEST(scenario_cli_style_patch_file);
}

} // ns formwork::tests

#endif
