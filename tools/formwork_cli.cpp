// formwork_cli.cpp - Formwork - Command line tool
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#include "formwork.hpp"
#include "formwork_log.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

using namespace formwork;

namespace
{
    constexpr int EXIT_OK     = 0;
    constexpr int EXIT_ERRORS = 1;
    constexpr int EXIT_USAGE  = 2;

    struct cli_args
    {
        std::string                command;
        std::string                file;
        std::optional<std::string> roles;
        std::string                format = "text";
        std::optional<std::string> patches;
        std::optional<std::string> output;
        std::optional<std::string> export_as;
        bool                       normalize = false;
        config_overrides           overrides;
    };

    void print_usage(std::ostream & os)
    {
        os << "Usage: formwork <command> <file> [options]\n"
           << "\n"
           << "Commands:\n"
           << "  inspect    [--roles r1,r2] [--format text|json|yaml]\n"
           << "  next       [--roles r1,r2] [--max-issues N] [--max-fields N] [--max-groups N] [--format text|json]\n"
           << "  apply      --patches FILE|- [--normalize] [--output FILE] [--format text|json] [--max-patches N]\n"
           << "  plan       [--format text|json]\n"
           << "  export     --as markdown|schema|values\n"
           << "  normalize  [--output FILE]\n"
           << "  validate\n"
           << "\n"
           << "Options:\n"
           << "  --fill-mode continue|overwrite   overwrite clears target-role answers first\n"
           << "  -v, --verbose   more diagnostics on stderr (repeat for debug)\n"
           << "  -h, --help      show this text\n";
    }

    std::optional<std::string> read_file(std::string const & path)
    {
        if (path == "-")
        {
            std::ostringstream ss;
            ss << std::cin.rdbuf();
            return ss.str();
        }

        std::ifstream in(path, std::ios::binary);
        if (!in)
            return std::nullopt;
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    bool write_output(std::optional<std::string> const & path, std::string const & text)
    {
        if (!path || *path == "-")
        {
            std::cout << text;
            return static_cast<bool>(std::cout);
        }

        std::ofstream out(*path, std::ios::binary | std::ios::trunc);
        if (!out)
            return false;
        out << text;
        return static_cast<bool>(out);
    }

    std::vector<std::string> split_roles(std::string const & s)
    {
        std::vector<std::string> out;
        std::string cur;
        for (char c : s + ",")
        {
            if (c == ',')
            {
                auto t = detail::trim_sv(cur);
                if (!t.empty())
                    out.emplace_back(t);
                cur.clear();
            }
            else
                cur += c;
        }
        return out;
    }

    // Returns false on a usage error, already reported.
    bool parse_args(int argc, char** argv, cli_args & args)
    {
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];

            auto value = [&](std::string & dst) -> bool
            {
                if (i + 1 >= argc)
                {
                    FW_LOGE("%s needs a value", a.c_str());
                    return false;
                }
                dst = argv[++i];
                return true;
            };

            auto count = [&](std::optional<int64_t> & dst) -> bool
            {
                std::string v;
                if (!value(v))
                    return false;
                auto n = detail::parse_int(v);
                if (!n || *n < 0)
                {
                    FW_LOGE("%s expects a non-negative integer, got '%s'", a.c_str(), v.c_str());
                    return false;
                }
                dst = *n;
                return true;
            };

            std::string v;

            if (a == "-v" || a == "--verbose")
                formwork::log::set_level(formwork::log::level() + 1);
            else if (a == "--roles")
            {
                if (!value(v)) return false;
                args.roles = v;
                args.overrides.target_roles = split_roles(v);
            }
            else if (a == "--format")
            {
                if (!value(args.format)) return false;
            }
            else if (a == "--patches")
            {
                if (!value(v)) return false;
                args.patches = v;
            }
            else if (a == "--output" || a == "-o")
            {
                if (!value(v)) return false;
                args.output = v;
            }
            else if (a == "--as")
            {
                if (!value(v)) return false;
                args.export_as = v;
            }
            else if (a == "--normalize")
                args.normalize = true;
            else if (a == "--max-issues")
            {
                if (!count(args.overrides.max_issues_per_turn)) return false;
            }
            else if (a == "--max-fields")
            {
                if (!count(args.overrides.max_fields_per_turn)) return false;
            }
            else if (a == "--max-patches")
            {
                if (!count(args.overrides.max_patches_per_turn)) return false;
            }
            else if (a == "--fill-mode")
            {
                if (!value(v)) return false;
                args.overrides.mode = parse_fill_mode(v);
                if (!args.overrides.mode)
                {
                    FW_LOGE("fill mode must be 'continue' or 'overwrite', got '%s'", v.c_str());
                    return false;
                }
            }
            else if (a == "--max-groups")
            {
                if (!count(args.overrides.max_groups_per_turn)) return false;
            }
            else if (a.size() > 1 && a.front() == '-' && a != "-")
            {
                FW_LOGE("unknown option '%s'", a.c_str());
                return false;
            }
            else
                positional.push_back(a);
        }

        if (positional.size() != 2)
        {
            FW_LOGE("expected a command and a file");
            return false;
        }

        args.command = positional[0];
        args.file    = positional[1];
        return true;
    }

//---------------------------------------------------------------------------

    std::optional<document> load_file(std::string const & path)
    {
        auto text = read_file(path);
        if (!text)
        {
            FW_LOGE("cannot read '%s'", path.c_str());
            return std::nullopt;
        }

        auto ctx = load(*text);
        if (ctx.has_errors())
        {
            for (auto const & e : ctx.errors)
                FW_LOGE("%s: %s", path.c_str(), describe(e).c_str());
            return std::nullopt;
        }

        FW_LOGD("loaded '%s': %zu fields, %zu notes", path.c_str(),
                ctx.result.field_count(), ctx.result.notes().size());
        return std::move(ctx.result);
    }

    bool check_format(cli_args const & args, std::initializer_list<char const *> allowed)
    {
        for (auto const * f : allowed)
            if (args.format == f)
                return true;
        FW_LOGE("format '%s' is not available for '%s'", args.format.c_str(), args.command.c_str());
        return false;
    }

//---------------------------------------------------------------------------
// Commands
//---------------------------------------------------------------------------

    int cmd_inspect(cli_args const & args, document const & doc)
    {
        if (!check_format(args, { "text", "json", "yaml" }))
            return EXIT_USAGE;

        inspect_options opts;
        if (args.roles)
            opts.target_roles = split_roles(*args.roles);

        auto result = inspect(doc, opts);

        if (args.format == "json")
            std::cout << to_json_string(inspect_to_json(result));
        else if (args.format == "yaml")
            std::cout << inspect_to_yaml(result);
        else
            std::cout << inspect_to_text(result);
        return EXIT_OK;
    }

    int cmd_next(cli_args const & args, document const & doc)
    {
        if (!check_format(args, { "text", "json" }))
            return EXIT_USAGE;

        auto config = resolve_harness_config(doc.metadata(), args.overrides);
        auto issues = next_issues(doc, config);

        FW_LOGI("roles %s, %zu issue(s) ready", detail::join(config.target_roles, ",").c_str(), issues.size());

        if (args.format == "json")
        {
            Json::Value arr(Json::arrayValue);
            for (auto const & i : issues)
                arr.append(detail::issue_to_json(i));
            std::cout << to_json_string(arr);
            return EXIT_OK;
        }

        inspect_options opts;
        opts.target_roles = config.target_roles;

        auto shown   = inspect(doc, opts);
        shown.issues = issues;
        std::cout << inspect_to_text(shown);
        return EXIT_OK;
    }

    int cmd_apply(cli_args const & args, document const & doc)
    {
        if (!check_format(args, { "text", "json" }))
            return EXIT_USAGE;

        if (!args.patches)
        {
            FW_LOGE("apply needs --patches FILE or --patches -");
            return EXIT_USAGE;
        }

        auto json = read_file(*args.patches);
        if (!json)
        {
            FW_LOGE("cannot read patches from '%s'", args.patches->c_str());
            return EXIT_ERRORS;
        }

        auto decoded = decode_patches(*json);
        if (decoded.has_errors())
        {
            for (auto const & e : decoded.errors)
                FW_LOGE("patch %zu: %s: %s", e.loc.line,
                        std::string(decode_error_kind_to_string(e.kind)).c_str(), e.message.c_str());
            return EXIT_ERRORS;
        }

        auto config = resolve_harness_config(doc.metadata(), args.overrides);
        if (static_cast<int64_t>(decoded.result.size()) > config.max_patches_per_turn)
            FW_LOGW("%zu patches exceed the per-turn limit of %lld", decoded.result.size(),
                    static_cast<long long>(config.max_patches_per_turn));

        auto result = apply_patches(doc, decoded.result);

        for (auto const & w : result.warnings)
            FW_LOGW("%s", w.c_str());
        for (auto const & r : result.rejections)
            FW_LOGE("patch %zu (%s): %s", r.patch_index + 1, r.field_id.c_str(), r.message.c_str());

        if (args.format == "json")
            std::cerr << to_json_string(apply_result_to_json(result));
        else
            FW_LOGI("%s, form is %s, %zu issue(s) remain",
                    std::string(apply_status_to_string(result.status)).c_str(),
                    std::string(form_state_to_string(result.state)).c_str(),
                    result.issues.size());

        if (result.status == apply_status::rejected)
            return EXIT_ERRORS;

        serialize_options opts;
        opts.preserve_original_formatting = !args.normalize;

        if (!write_output(args.output, serialize(result.doc, opts)))
        {
            FW_LOGE("cannot write '%s'", args.output.value_or("-").c_str());
            return EXIT_ERRORS;
        }
        return EXIT_OK;
    }

    int cmd_plan(cli_args const & args, document const & doc)
    {
        if (!check_format(args, { "text", "json" }))
            return EXIT_USAGE;

        auto plan = compute_execution_plan(doc);

        if (args.format == "json")
            std::cout << to_json_string(plan_to_json(plan));
        else
            std::cout << plan_to_text(plan);
        return EXIT_OK;
    }

    int cmd_export(cli_args const & args, document const & doc)
    {
        auto as = args.export_as.value_or("markdown");

        std::string text;
        if (as == "markdown")
            text = export_markdown(doc);
        else if (as == "schema")
            text = to_json_string(export_json_schema(doc));
        else if (as == "values")
            text = to_json_string(export_values_json(doc));
        else
        {
            FW_LOGE("unknown export '%s'", as.c_str());
            return EXIT_USAGE;
        }

        if (!write_output(args.output, text))
        {
            FW_LOGE("cannot write '%s'", args.output.value_or("-").c_str());
            return EXIT_ERRORS;
        }
        return EXIT_OK;
    }

    int cmd_normalize(cli_args const & args, document const & doc)
    {
        serialize_options opts;
        opts.preserve_original_formatting = false;

        if (!write_output(args.output, serialize(doc, opts)))
        {
            FW_LOGE("cannot write '%s'", args.output.value_or("-").c_str());
            return EXIT_ERRORS;
        }
        return EXIT_OK;
    }

    int cmd_validate(cli_args const &, document const & doc)
    {
        auto result = inspect(doc);
        auto invalid = result.progress.counts.invalid_fields;

        for (auto const & i : result.issues)
            if (i.priority == 1 || i.priority == 3)
                FW_LOGE("%s: %s", i.ref.c_str(), i.message.c_str());

        std::cout << (invalid == 0 ? "valid" : "invalid") << " (" << form_state_to_string(result.state) << ")\n";
        return invalid == 0 ? EXIT_OK : EXIT_ERRORS;
    }
}

//---------------------------------------------------------------------------

int main(int argc, char** argv)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "-h" || a == "--help")
        {
            print_usage(std::cout);
            return EXIT_OK;
        }
    }

    cli_args args;
    if (!parse_args(argc, argv, args))
    {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    using handler = int (*)(cli_args const &, document const &);
    std::map<std::string, handler> const commands =
    {
        { "inspect",   cmd_inspect   },
        { "next",      cmd_next      },
        { "apply",     cmd_apply     },
        { "plan",      cmd_plan      },
        { "export",    cmd_export    },
        { "normalize", cmd_normalize },
        { "validate",  cmd_validate  },
    };

    auto it = commands.find(args.command);
    if (it == commands.end())
    {
        FW_LOGE("unknown command '%s'", args.command.c_str());
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    auto doc = load_file(args.file);
    if (!doc)
        return EXIT_ERRORS;

    if (args.overrides.mode)
        *doc = prepare_for_fill(*doc, resolve_harness_config(doc->metadata(), args.overrides));

    return it->second(args, *doc);
}
