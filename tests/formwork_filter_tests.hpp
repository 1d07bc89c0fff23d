#ifndef FORMWORK_TESTS_FILTER__
#define FORMWORK_TESTS_FILTER__

#include "formwork_test_harness.hpp"
#include "formwork_test_documents.hpp"
#include "../include/formwork_issue_filter.hpp"

namespace formwork::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    constexpr std::string_view ordered_src =
        "{% form id=\"o\" %}\n"
        "{% field kind=\"text\" id=\"a\" label=\"A\" required=true order=2 %}\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"b\" label=\"B\" required=true order=1 %}\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"c\" label=\"C\" required=true order=1 depends_on=\"a\" %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    constexpr std::string_view grouped_src =
        "{% form id=\"g\" %}\n"
        "{% group id=\"g1\" %}\n"
        "{% field kind=\"text\" id=\"x\" label=\"X\" required=true %}\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"y\" label=\"Y\" required=true %}\n"
        "{% /field %}\n"
        "{% /group %}\n"
        "{% group id=\"g2\" %}\n"
        "{% field kind=\"text\" id=\"z\" label=\"Z\" required=true %}\n"
        "{% /field %}\n"
        "{% /group %}\n"
        "{% field kind=\"text\" id=\"w\" label=\"W\" required=true %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    inline std::string refs(std::vector<inspect_issue> const & issues)
    {
        std::string out;
        for (auto const & i : issues)
            out += i.ref + " ";
        return out;
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool test_filter_by_role()
{
    auto doc = load_clean(intake_src);
    auto cleared = apply_patches(doc, {
        state_patch(patch_op::clear, "name"),
        state_patch(patch_op::clear, "tier")
    }).doc;
    auto issues = inspect(cleared).issues;

    EXPECT(refs(filter_issues_by_role(issues, cleared, { "agent" })) == "tier ", "agent filter");
    EXPECT(refs(filter_issues_by_role(issues, cleared, { "user" })) == "name ", "user filter");
    EXPECT(filter_issues_by_role(issues, cleared, {}).size() == 2, "empty role list dropped issues");

    return true;
}

static bool test_filter_by_order_drops_blocked_then_keeps_lowest()
{
    auto doc = load_clean(ordered_src);
    auto issues = inspect(doc).issues;
    EXPECT(issues.size() == 3, "every required field reported");

    auto ready = filter_issues_by_order(issues, doc);
    EXPECT(refs(ready) == "b ", "readiness kept the wrong issues");

    auto answered = apply_patches(doc, { set_patch("b", "done") }).doc;
    auto next = filter_issues_by_order(inspect(answered).issues, answered);
    EXPECT(refs(next) == "a ", "next order level not reached");

    return true;
}

static bool test_filter_by_scope()
{
    auto doc = load_clean(grouped_src);
    auto issues = inspect(doc).issues;
    EXPECT(refs(issues) == "x y z w ", "issues not in declaration order");

    EXPECT(refs(filter_issues_by_scope(issues, doc, 2, std::nullopt)) == "x y ", "field cap");
    EXPECT(refs(filter_issues_by_scope(issues, doc, std::nullopt, 1)) == "x y w ", "group cap counted implicit group");
    EXPECT(refs(filter_issues_by_scope(issues, doc, 3, 1)) == "x y w ", "combined caps");
    EXPECT(filter_issues_by_scope(issues, doc, std::nullopt, std::nullopt).size() == 4, "no caps dropped issues");

    return true;
}

static bool test_filter_by_count()
{
    auto doc = load_clean(grouped_src);
    auto issues = inspect(doc).issues;

    EXPECT(refs(filter_issues_by_count(issues, 1)) == "x ", "count cap");
    EXPECT(filter_issues_by_count(issues, 10).size() == 4, "large cap dropped issues");
    EXPECT(filter_issues_by_count(issues, std::nullopt).size() == 4, "no cap dropped issues");

    return true;
}

//------------------------------------------
// RUN ALL TESTS
//------------------------------------------

inline void run_filter_tests()
{
    SUBCAT("Stages");
    RUN_TEST(test_filter_by_role);
    RUN_TEST(test_filter_by_order_drops_blocked_then_keeps_lowest);
    RUN_TEST(test_filter_by_scope);
    RUN_TEST(test_filter_by_count);
}

} // ns formwork::tests

#endif
