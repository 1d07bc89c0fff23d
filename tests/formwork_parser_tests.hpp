#ifndef FORMWORK_TESTS_PARSER__
#define FORMWORK_TESTS_PARSER__

#include "formwork_test_harness.hpp"
#include "formwork_test_documents.hpp"
#include "../include/formwork_parser.hpp"

namespace formwork::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline bool has_parse_error(parse_context const & ctx, document_error_kind kind, size_t line)
    {
        return std::any_of(ctx.errors.begin(), ctx.errors.end(), [&](document_error const & e)
        {
            return e.kind == kind && e.loc.line == line;
        });
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool test_directive_attribute_literals()
{
    std::string err;
    auto d = detail::parse_directive_line(
        "{% field id=\"a\\\"b\" n=3 x=2.5 ok=true neg=-4 %}", { 7 }, err);

    EXPECT(d.has_value(), "directive not parsed");
    EXPECT(d->name == "field", "wrong directive name");
    EXPECT(!d->closing && !d->self_closing, "plain directive flagged as closer");
    EXPECT(d->loc.line == 7, "line not recorded");
    EXPECT(d->attrs.size() == 5, "wrong attribute count");

    EXPECT(std::get<std::string>(d->attrs[0].value) == "a\"b", "escaped quote not decoded");
    EXPECT(std::get<int64_t>(d->attrs[1].value) == 3, "integer attribute");
    EXPECT(std::get<double>(d->attrs[2].value) == 2.5, "decimal attribute");
    EXPECT(std::get<bool>(d->attrs[3].value) == true, "boolean attribute");
    EXPECT(std::get<int64_t>(d->attrs[4].value) == -4, "negative integer attribute");

    return true;
}

static bool test_directive_closing_and_self_closing()
{
    std::string err;

    auto close = detail::parse_directive_line("{% /field %}", {}, err);
    EXPECT(close && close->closing && close->name == "field", "closer not recognised");

    auto col = detail::parse_directive_line("{% column id=\"c\" /%}", {}, err);
    EXPECT(col && col->self_closing && col->name == "column", "self-closing column not recognised");
    EXPECT(directive_id(*col) == "c", "column id lost");

    return true;
}

static bool test_directive_rejects_bad_syntax()
{
    std::string err;

    EXPECT(!detail::parse_directive_line("{% field id=\"open %}", {}, err), "unterminated string accepted");
    EXPECT(!detail::parse_directive_line("{% field id=bare %}", {}, err), "bare word accepted");
    EXPECT(!detail::parse_directive_line("{% field id=\"a\" id=\"b\" %}", {}, err), "duplicate attribute accepted");
    EXPECT(!detail::parse_directive_line("{% /field id=\"a\" %}", {}, err), "closer with attributes accepted");
    EXPECT(!err.empty(), "no error message");

    return true;
}

static bool test_option_line()
{
    std::string err;
    auto o = detail::parse_option_line("- [x] Pro plan {% #pro %}", { 3 }, err);

    EXPECT(o.has_value(), "option not parsed");
    EXPECT(o->marker == 'x', "marker lost");
    EXPECT(o->id == "pro", "option id lost");
    EXPECT(o->label == "Pro plan", "label not trimmed");

    EXPECT(!detail::parse_option_line("- [ ] Untagged", {}, err), "option without tag accepted");

    return true;
}

static bool test_parser_builds_concrete_record()
{
    auto ctx = parse(intake_src);
    EXPECT(ctx.errors.empty(), "error emitted");

    auto const & cst = ctx.result;
    EXPECT(cst.frontmatter.has_value(), "frontmatter not captured");
    EXPECT(contains(*cst.frontmatter, "run_mode: fill"), "frontmatter body incomplete");
    EXPECT(cst.form.directive.has_value(), "form directive missing");

    EXPECT(cst.form.groups.size() == 1, "wrong group count");
    auto const & g = cst.form.groups.front();
    EXPECT(g.directive.has_value(), "explicit group lost its directive");
    EXPECT(g.fields.size() == 3, "wrong field count");

    auto const & name = g.fields[0];
    EXPECT(name.prompt_lines.size() == 1 && name.prompt_lines[0] == "Your full name.", "prompt not captured");
    EXPECT(name.literal && name.literal->size() == 1 && name.literal->front() == "Alice", "literal not captured");

    EXPECT(g.fields[1].options.size() == 2, "options not captured");
    EXPECT(g.fields[2].columns.size() == 2, "columns not captured");
    EXPECT(g.fields[2].literal->size() == 4, "table literal not captured");

    EXPECT(cst.form.notes.size() == 1, "note not captured");
    EXPECT(cst.form.notes.front().body.front() == "Confirm spelling.", "note body lost");
    EXPECT(cst.form.close_offset != npos(), "form close not located");

    return true;
}

static bool test_parser_field_spans_cover_region()
{
    auto ctx = parse(intake_src);
    auto const & cst = ctx.result;
    auto const & span = cst.form.groups.front().fields.front().span;

    std::string_view region(cst.text.data() + span.begin, span.end - span.begin);
    EXPECT(region.starts_with("{% field kind=\"text\" id=\"name\""), "span starts late");
    EXPECT(region.ends_with("{% /field %}\n"), "span ends early");

    auto close = std::string_view(cst.text).substr(cst.form.close_offset);
    EXPECT(close == "{% /form %}\n", "close offset misplaced");

    return true;
}

static bool test_parser_collects_loose_fields_into_implicit_group()
{
    constexpr std::string_view src =
        "{% form id=\"f\" %}\n"
        "{% field kind=\"text\" id=\"a\" %}\n"
        "{% /field %}\n"
        "{% group id=\"g\" %}\n"
        "{% field kind=\"text\" id=\"b\" %}\n"
        "{% /field %}\n"
        "{% /group %}\n"
        "{% field kind=\"text\" id=\"c\" %}\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"d\" %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    auto ctx = parse(src);
    EXPECT(ctx.errors.empty(), "error emitted");

    auto const & groups = ctx.result.form.groups;
    EXPECT(groups.size() == 3, "loose runs not split around the explicit group");
    EXPECT(!groups[0].directive && groups[0].fields.size() == 1, "first implicit group wrong");
    EXPECT(groups[1].directive && groups[1].fields.size() == 1, "explicit group wrong");
    EXPECT(!groups[2].directive && groups[2].fields.size() == 2, "trailing loose fields not joined");

    return true;
}

static bool test_parser_reports_unknown_directive_with_line()
{
    constexpr std::string_view src =
        "{% form id=\"f\" %}\n"
        "{% widget id=\"w\" %}\n"
        "{% /form %}\n";

    auto ctx = parse(src);
    EXPECT(has_parse_error(ctx, document_error_kind::unknown_directive, 2), "unknown directive not reported");

    return true;
}

static bool test_parser_reports_unclosed_regions()
{
    constexpr std::string_view open_field =
        "{% form id=\"f\" %}\n"
        "{% field kind=\"text\" id=\"a\" %}\n"
        "hello\n";

    auto a = parse(open_field);
    EXPECT(has_parse_error(a, document_error_kind::unbalanced_directive, 2), "open field not reported");

    constexpr std::string_view open_literal =
        "{% form id=\"f\" %}\n"
        "{% field kind=\"text\" id=\"a\" %}\n"
        "```value\n"
        "hello\n";

    auto b = parse(open_literal);
    EXPECT(has_parse_error(b, document_error_kind::unbalanced_directive, 3), "open value block not reported");

    auto c = parse("{% form id=\"f\" %}\n");
    EXPECT(has_parse_error(c, document_error_kind::unbalanced_directive, 0), "open form not reported");

    return true;
}

static bool test_parser_requires_form()
{
    auto ctx = parse("Just prose.\n");
    EXPECT(has_parse_error(ctx, document_error_kind::malformed_directive, 0), "missing form not reported");

    auto fm = parse("---\nformwork:\n  title: x\n");
    EXPECT(has_parse_error(fm, document_error_kind::malformed_frontmatter, 1), "open frontmatter not reported");

    return true;
}

static bool test_parser_structural_misuse()
{
    constexpr std::string_view src =
        "{% form id=\"f\" %}\n"                              // 1
        "{% group id=\"g\" %}\n"                             // 2
        "{% group id=\"h\" %}\n"                             // 3 nested
        "{% field kind=\"table\" id=\"t\" %}\n"              // 4
        "{% column id=\"c\" %}\n"                            // 5 not self-closing
        "{% /field %}\n"                                     // 6
        "{% field kind=\"text\" id=\"x\" /%}\n"              // 7 self-closing field
        "{% /group %}\n"                                     // 8
        "{% /group %}\n"                                     // 9 stray closer
        "{% /form %}\n";                                     // 10

    auto ctx = parse(src);
    EXPECT(has_parse_error(ctx, document_error_kind::unbalanced_directive, 3), "nested group accepted");
    EXPECT(has_parse_error(ctx, document_error_kind::malformed_directive, 5), "open column accepted");
    EXPECT(has_parse_error(ctx, document_error_kind::malformed_directive, 7), "self-closing field accepted");
    EXPECT(has_parse_error(ctx, document_error_kind::unbalanced_directive, 9), "stray closer accepted");
    EXPECT(ctx.errors.size() == 4, "every fault reported exactly once");

    return true;
}

static bool test_parser_keeps_crlf_offsets()
{
    constexpr std::string_view src =
        "{% form id=\"f\" %}\r\n"
        "{% field kind=\"text\" id=\"a\" %}\r\n"
        "```value\r\n"
        "hi\r\n"
        "```\r\n"
        "{% /field %}\r\n"
        "{% /form %}\r\n";

    auto ctx = parse(src);
    EXPECT(ctx.errors.empty(), "CRLF text rejected");

    auto const & f = ctx.result.form.groups.front().fields.front();
    EXPECT(f.literal->front() == "hi", "carriage return kept in literal");
    EXPECT(f.span.end == src.find("{% /form %}"), "span does not include the CRLF terminator");

    return true;
}

//------------------------------------------
// RUN ALL TESTS
//------------------------------------------

inline void run_parser_tests()
{
    SUBCAT("Directives");
    RUN_TEST(test_directive_attribute_literals);
    RUN_TEST(test_directive_closing_and_self_closing);
    RUN_TEST(test_directive_rejects_bad_syntax);
    RUN_TEST(test_option_line);

    SUBCAT("Concrete record");
    RUN_TEST(test_parser_builds_concrete_record);
    RUN_TEST(test_parser_field_spans_cover_region);
    RUN_TEST(test_parser_collects_loose_fields_into_implicit_group);
    RUN_TEST(test_parser_keeps_crlf_offsets);

    SUBCAT("Errors");
    RUN_TEST(test_parser_reports_unknown_directive_with_line);
    RUN_TEST(test_parser_reports_unclosed_regions);
    RUN_TEST(test_parser_requires_form);
    RUN_TEST(test_parser_structural_misuse);
}

} // ns formwork::tests

#endif
