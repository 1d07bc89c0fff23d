#ifndef FORMWORK_TESTS_CONFIG__
#define FORMWORK_TESTS_CONFIG__

#include "formwork_test_harness.hpp"
#include "formwork_test_documents.hpp"
#include "../include/formwork_config.hpp"

namespace formwork::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline std::string issue_refs(std::vector<inspect_issue> const & issues)
    {
        std::string out;
        for (auto const & i : issues)
            out += i.ref + " ";
        return out;
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool test_config_defaults()
{
    auto cfg = resolve_harness_config(form_metadata{});

    EXPECT(cfg.max_turns == 100, "default max_turns");
    EXPECT(cfg.max_patches_per_turn == 20, "default max_patches_per_turn");
    EXPECT(cfg.max_issues_per_turn == 10, "default max_issues_per_turn");
    EXPECT(!cfg.max_fields_per_turn && !cfg.max_groups_per_turn, "scope caps set by default");
    EXPECT(cfg.target_roles == std::vector<std::string>{ "agent" }, "default target roles");
    EXPECT(cfg.mode == fill_mode::continue_filling, "default fill mode");

    return true;
}

static bool test_config_layers()
{
    auto doc = load_clean(intake_src);

    auto from_doc = resolve_harness_config(doc.metadata());
    EXPECT(from_doc.max_turns == 20, "frontmatter max_turns ignored");
    EXPECT(from_doc.max_patches_per_turn == 10, "frontmatter max_patches_per_turn ignored");

    config_overrides o;
    o.max_turns    = 5;
    o.target_roles = std::vector<std::string>{ "user" };
    o.mode         = fill_mode::overwrite;

    auto cfg = resolve_harness_config(doc.metadata(), o);
    EXPECT(cfg.max_turns == 5, "override lost to frontmatter");
    EXPECT(cfg.max_patches_per_turn == 10, "frontmatter value lost under unrelated override");
    EXPECT(cfg.target_roles == std::vector<std::string>{ "user" }, "role override");
    EXPECT(cfg.mode == fill_mode::overwrite, "mode override");

    return true;
}

static bool test_config_fill_mode_names()
{
    EXPECT(parse_fill_mode("continue") == fill_mode::continue_filling, "continue");
    EXPECT(parse_fill_mode(" Overwrite ") == fill_mode::overwrite, "overwrite");
    EXPECT(!parse_fill_mode("replace"), "unknown mode parsed");
    EXPECT(fill_mode_to_string(fill_mode::continue_filling) == "continue", "continue name");

    return true;
}

static bool test_next_issues_applies_every_stage()
{
    auto kinds = load_clean(all_kinds_src);

    harness_config cfg;
    cfg.max_issues_per_turn = 3;
    EXPECT(issue_refs(next_issues(kinds, cfg)) == "t n tl ", "count cap");

    cfg.target_roles = { "user" };
    EXPECT(next_issues(kinds, cfg).empty(), "role stage ignored");

    constexpr std::string_view grouped =
        "{% form id=\"g\" %}\n"
        "{% group id=\"g1\" %}\n"
        "{% field kind=\"text\" id=\"x\" label=\"X\" required=true %}\n"
        "{% /field %}\n"
        "{% /group %}\n"
        "{% group id=\"g2\" %}\n"
        "{% field kind=\"text\" id=\"z\" label=\"Z\" required=true %}\n"
        "{% /field %}\n"
        "{% /group %}\n"
        "{% /form %}\n";

    harness_config scoped;
    scoped.max_groups_per_turn = 1;
    EXPECT(issue_refs(next_issues(load_clean(grouped), scoped)) == "x ", "scope cap");

    auto pets = load_clean(pet_src);
    EXPECT(issue_refs(next_issues(pets, harness_config{})) == "has_pet ", "blocked issues handed out");

    return true;
}

static bool test_prepare_for_fill()
{
    auto doc = load_clean(intake_src);

    harness_config keep;
    EXPECT(semantically_equal(prepare_for_fill(doc, keep), doc), "continue mode changed answers");

    harness_config overwrite;
    overwrite.mode = fill_mode::overwrite;
    auto fresh = prepare_for_fill(doc, overwrite);

    EXPECT(fresh.response("name").state == answer_state::answered, "user answer cleared");
    EXPECT(fresh.response("tier").state == answer_state::unanswered, "agent answer kept");
    EXPECT(fresh.response("team").state == answer_state::unanswered, "agent table kept");
    EXPECT(fresh.notes().size() == 1, "notes dropped");

    overwrite.target_roles = { "*" };
    EXPECT(prepare_for_fill(doc, overwrite).response("name").state == answer_state::unanswered, "wildcard role");

    return true;
}

//------------------------------------------
// RUN ALL TESTS
//------------------------------------------

inline void run_config_tests()
{
    SUBCAT("Resolution");
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_layers);
    RUN_TEST(test_config_fill_mode_names);

    SUBCAT("Turns");
    RUN_TEST(test_next_issues_applies_every_stage);
    RUN_TEST(test_prepare_for_fill);
}

} // ns formwork::tests

#endif
