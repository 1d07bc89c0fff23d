#include "formwork_test_harness.hpp"
#include "formwork_parser_tests.hpp"
#include "formwork_materialiser_tests.hpp"
#include "formwork_serializer_tests.hpp"
#include "formwork_validate_tests.hpp"
#include "formwork_inspect_tests.hpp"
#include "formwork_filter_tests.hpp"
#include "formwork_patch_tests.hpp"
#include "formwork_patch_json_tests.hpp"
#include "formwork_plan_tests.hpp"
#include "formwork_export_tests.hpp"
#include "formwork_config_tests.hpp"
#include "formwork_scenario_tests.hpp"

#include <iostream>

namespace formwork::tests
{
    std::vector<test_result> results;
    char const * last_error = "";
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace formwork::tests;

    #ifdef FORMWORK_TESTS_PARSER__
        run_tests("Parser pass", run_parser_tests);
    #endif

    #ifdef FORMWORK_TESTS_MATERIALISER__
        run_tests("Materialiser pass", run_materialiser_tests);
    #endif

    #ifdef FORMWORK_TESTS_SERIALIZER__
        run_tests("Serialization", run_serializer_tests);
    #endif

    #ifdef FORMWORK_TESTS_VALIDATE__
        run_tests("Validation", run_validate_tests);
    #endif

    #ifdef FORMWORK_TESTS_INSPECT__
        run_tests("Inspection", run_inspect_tests);
    #endif

    #ifdef FORMWORK_TESTS_FILTER__
        run_tests("Issue filters", run_filter_tests);
    #endif

    #ifdef FORMWORK_TESTS_PATCH__
        run_tests("Patches", run_patch_tests);
    #endif

    #ifdef FORMWORK_TESTS_PATCH_JSON__
        run_tests("Patch decoding", run_patch_json_tests);
    #endif

    #ifdef FORMWORK_TESTS_PLAN__
        run_tests("Execution plan", run_plan_tests);
    #endif

    #ifdef FORMWORK_TESTS_EXPORT__
        run_tests("Exports", run_export_tests);
    #endif

    #ifdef FORMWORK_TESTS_CONFIG__
        run_tests("Harness configuration", run_config_tests);
    #endif

    #ifdef FORMWORK_TESTS_SCENARIO__
        run_tests("Scenarios", run_scenario_tests);
    #endif

    size_t failed = 0;
    for (auto const & r : results)
        if (!r.passed)
            ++failed;

    std::cout << '\n' << (results.size() - failed) << " of " << results.size() << " tests passed\n";
    return failed == 0 ? 0 : 1;
}
