#ifndef FORMWORK_TESTS_SERIALIZER__
#define FORMWORK_TESTS_SERIALIZER__

#include "formwork_test_harness.hpp"
#include "formwork_test_documents.hpp"
#include "../include/formwork.hpp"

namespace formwork::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline std::string replace_once(std::string text, std::string_view from, std::string_view to)
    {
        auto at = text.find(from);
        if (at != std::string::npos)
            text.replace(at, from.size(), to);
        return text;
    }

    inline std::string normalize(document const & doc)
    {
        serialize_options opts;
        opts.preserve_original_formatting = false;
        return serialize(doc, opts);
    }

//------------------------------------------
// TESTS
//------------------------------------------

static bool roundtrip_unmodified_is_byte_identical()
{
    auto intake = load_clean(intake_src);
    EXPECT(serialize(intake) == intake_src, "intake not reproduced");

    auto kinds = load_clean(all_kinds_src);
    EXPECT(serialize(kinds) == all_kinds_src, "all kinds not reproduced");

    constexpr std::string_view crlf =
        "{% form id=\"f\" %}\r\n"
        "{% field kind=\"text\" id=\"a\" %}\r\n"
        "```value\r\n"
        "hi\r\n"
        "```\r\n"
        "{% /field %}\r\n"
        "{% /form %}\r\n";
    EXPECT(serialize(load_clean(crlf)) == crlf, "CRLF text not reproduced");

    return true;
}

static bool roundtrip_rewrites_only_changed_field()
{
    auto doc = load_clean(intake_src);
    auto result = apply_patches(doc, { set_patch("tier", "free") });
    EXPECT(result.status == apply_status::applied, "patch not applied");

    auto expected = replace_once(std::string(intake_src), "- [ ] Free", "- [x] Free");
    expected = replace_once(expected, "- [x] Pro", "- [ ] Pro");

    auto out = serialize(result.doc);
    EXPECT(out == expected, "unchanged regions were not copied verbatim");
    EXPECT(semantically_equal(load_clean(out), result.doc), "rewritten text does not reload");

    return true;
}

static bool roundtrip_same_value_is_not_rewritten()
{
    auto doc = load_clean(intake_src);
    auto result = apply_patches(doc, { set_patch("name", "Alice") });

    EXPECT(serialize(result.doc) == intake_src, "unchanged answer was re-emitted");

    return true;
}

static bool roundtrip_new_note_before_form_close()
{
    auto doc = load_clean(intake_src);

    patch p;
    p.op   = patch_op::add_note;
    p.ref  = "tier";
    p.text = "Check tier.";

    auto result = apply_patches(doc, { p });
    EXPECT(result.status == apply_status::applied, "note not added");

    auto out = serialize(result.doc);
    EXPECT(contains(out,
        "{% /note %}\n"
        "\n"
        "{% note id=\"n2\" ref=\"tier\" role=\"agent\" %}\n"
        "Check tier.\n"
        "{% /note %}\n"
        "\n"
        "{% /form %}\n"), "new note not placed before the form close");
    EXPECT(out.starts_with(std::string(intake_src.substr(0, intake_src.find("{% /form %}")))), "prefix changed");

    return true;
}

static bool roundtrip_keeps_crlf_in_rewritten_blocks()
{
    constexpr std::string_view crlf =
        "{% form id=\"f\" %}\r\n"
        "{% field kind=\"text\" id=\"a\" label=\"A\" %}\r\n"
        "```value\r\n"
        "hi\r\n"
        "```\r\n"
        "{% /field %}\r\n"
        "{% field kind=\"text\" id=\"b\" label=\"B\" %}\r\n"
        "{% /field %}\r\n"
        "{% /form %}\r\n";

    patch note;
    note.op   = patch_op::add_note;
    note.ref  = "b";
    note.text = "Ask later.";

    auto doc = load_clean(crlf);
    auto result = apply_patches(doc, { set_patch("a", "bye"), note });
    EXPECT(result.status == apply_status::applied, "batch not applied");

    auto out = serialize(result.doc);
    EXPECT(contains(out, "bye\r\n"), "changed field not rewritten");
    EXPECT(contains(out, "Ask later.\r\n"), "new note not written");

    bool bare = false;
    for (size_t i = 0; i < out.size(); ++i)
        if (out[i] == '\n' && (i == 0 || out[i - 1] != '\r'))
            bare = true;
    EXPECT(!bare, "rewritten block mixed in bare line feeds");

    EXPECT(contains(out, "{% field kind=\"text\" id=\"b\" label=\"B\" %}\r\n{% /field %}\r\n"), "untouched field changed");
    EXPECT(semantically_equal(load_clean(out), result.doc), "CRLF output does not reload");

    return true;
}

static bool roundtrip_removed_note_dropped()
{
    auto doc = load_clean(intake_src);

    patch p;
    p.op      = patch_op::remove_note;
    p.note_id = "n1";

    auto out = serialize(apply_patches(doc, { p }).doc);
    EXPECT(!contains(out, "Confirm spelling."), "removed note still written");
    EXPECT(out.ends_with("{% /group %}\n\n{% /form %}\n"), "blank line after removed note kept");

    return true;
}

static bool normalize_exact_output()
{
    constexpr std::string_view src =
        "Intro prose.\n"
        "{% form id=\"f\" title=\"T\" %}\n"
        "{% field kind=\"number\" id=\"n\" label=\"N\" required=true %}\n"
        "```value\n"
        "7\n"
        "```\n"
        "{% /field %}\n"
        "{% field kind=\"text\" id=\"s\" state=\"skipped\" reason=\"later\" %}\n"
        "{% /field %}\n"
        "{% /form %}\n";

    constexpr std::string_view expected =
        "{% form id=\"f\" title=\"T\" %}\n"
        "\n"
        "{% field kind=\"number\" id=\"n\" label=\"N\" required=true %}\n"
        "```value\n"
        "7\n"
        "```\n"
        "{% /field %}\n"
        "\n"
        "{% field kind=\"text\" id=\"s\" label=\"s\" state=\"skipped\" reason=\"later\" %}\n"
        "{% /field %}\n"
        "\n"
        "{% /form %}\n";

    auto out = normalize(load_clean(src));
    EXPECT(out == expected, "canonical text differs");

    return true;
}

static bool normalize_reloads_semantically_equal()
{
    auto intake = load_clean(intake_src);
    auto text = normalize(intake);

    bool ok = false;
    auto again = load_clean(text, &ok);
    EXPECT(ok, "normalized text does not load");
    EXPECT(semantically_equal(intake, again), "normalized document differs");
    EXPECT(!contains(text, "Some prose"), "prose kept by normalize");
    EXPECT(text.starts_with("---\n"), "frontmatter not re-emitted");

    auto kinds = load_clean(all_kinds_src);
    EXPECT(semantically_equal(kinds, load_clean(normalize(kinds))), "all kinds differ after normalize");

    return true;
}

static bool normalize_written_answers_reload()
{
    auto kinds = load_clean(all_kinds_src);

    Json::Value checks(Json::objectValue);
    checks["plan"]  = "done";
    checks["build"] = "active";

    Json::Value agree(Json::objectValue);
    agree["terms"] = true;

    Json::Value row(Json::objectValue);
    row["who"]  = "Ann | Co";
    row["age"]  = 30;
    row["born"] = 1994;
    Json::Value skipped(Json::objectValue);
    skipped["state"]  = "skipped";
    skipped["reason"] = "private";
    Json::Value row2(Json::objectValue);
    row2["who"] = "Ben";
    row2["age"] = skipped;
    Json::Value rows(Json::arrayValue);
    rows.append(row);
    rows.append(row2);

    auto result = apply_patches(kinds, {
        set_patch("t", "say \"hi\""),
        set_patch("n", 12),
        set_patch("tl", json_array({ "x", "y" })),
        set_patch("sc", "blue"),
        set_patch("mc", json_array({ "dog", "cat" })),
        set_patch("cb", checks),
        set_patch("scb", agree),
        set_patch("u", "https://example.org/a"),
        set_patch("ul", json_array({ "https://a.example", "http://b.example" })),
        set_patch("d", "2024-05-01"),
        set_patch("y", 1901),
        set_patch("tb", rows)
    });
    EXPECT(result.status == apply_status::applied, "answers not applied");

    EXPECT(semantically_equal(result.doc, load_clean(serialize(result.doc))), "preserved answers do not reload");
    EXPECT(semantically_equal(result.doc, load_clean(normalize(result.doc))), "normalized answers do not reload");

    return true;
}

static bool normalize_empty_answers_use_state()
{
    auto kinds = load_clean(all_kinds_src);
    auto result = apply_patches(kinds, { set_patch("mc", Json::Value(Json::arrayValue)) });

    auto text = normalize(result.doc);
    EXPECT(contains(text, "id=\"mc\" label=\"Pets\" max_selections=2 state=\"answered\" %}"), "empty answer not marked");

    auto again = load_clean(text);
    EXPECT(again.response("mc").state == answer_state::answered, "empty answer lost");

    return true;
}

static bool escaped_attributes_roundtrip()
{
    constexpr std::string_view src =
        "{% form id=\"f\" title=\"Say \\\"hi\\\" \\\\ bye\" %}\n"
        "{% /form %}\n";

    auto doc = load_clean(src);
    EXPECT(doc.title() == "Say \"hi\" \\ bye", "escapes not decoded");
    EXPECT(load_clean(normalize(doc)).title() == doc.title(), "escapes not re-encoded");

    return true;
}

//------------------------------------------
// RUN ALL TESTS
//------------------------------------------

inline void run_serializer_tests()
{
    SUBCAT("Preserve");
    RUN_TEST(roundtrip_unmodified_is_byte_identical);
    RUN_TEST(roundtrip_rewrites_only_changed_field);
    RUN_TEST(roundtrip_same_value_is_not_rewritten);
    RUN_TEST(roundtrip_new_note_before_form_close);
    RUN_TEST(roundtrip_removed_note_dropped);
    RUN_TEST(roundtrip_keeps_crlf_in_rewritten_blocks);

    SUBCAT("Normalize");
    RUN_TEST(normalize_exact_output);
    RUN_TEST(normalize_reloads_semantically_equal);
    RUN_TEST(normalize_written_answers_reload);
    RUN_TEST(normalize_empty_answers_use_state);
    RUN_TEST(escaped_attributes_roundtrip);
}

} // ns formwork::tests

#endif
