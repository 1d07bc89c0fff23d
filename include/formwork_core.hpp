// formwork_core.hpp - Formwork - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_CORE_HPP
#define FORMWORK_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <map>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cmath>
#include <cctype>

namespace formwork
{
//========================================================================
// Kinds and enumerations
//========================================================================

    // The order of this enumeration matches the alternatives of field_value.
    enum class field_kind
    {
        text,
        number,
        text_list,
        single_choice,
        multi_choice,
        checkbox_set,
        url,
        url_list,
        date,
        year,
        table
    };

    enum class answer_state
    {
        unanswered,
        answered,
        skipped,
        aborted
    };

    enum class checkbox_mode
    {
        simple,     // checked / unchecked
        status      // todo / done / incomplete / active / na
    };

    enum class checkbox_status
    {
        todo,
        done,
        incomplete,
        active,
        na
    };

    enum class column_type
    {
        text,
        number,
        url,
        date,
        year
    };

    enum class approval_mode
    {
        none,
        blocking
    };

    enum class field_priority
    {
        high,
        medium,
        low
    };

    enum class run_mode
    {
        interactive,
        fill,
        research
    };

//========================================================================
// Values
//========================================================================

    struct text_value
    {
        std::string text;
        bool operator==(text_value const &) const = default;
    };

    struct number_value
    {
        double number = 0.0;
        bool operator==(number_value const &) const = default;
    };

    struct text_list_value
    {
        std::vector<std::string> items;
        bool operator==(text_list_value const &) const = default;
    };

    struct single_choice_value
    {
        std::optional<std::string> selected;
        bool operator==(single_choice_value const &) const = default;
    };

    struct multi_choice_value
    {
        std::vector<std::string> selected;   // option ids, selection order
        bool operator==(multi_choice_value const &) const = default;
    };

    // Simple mode uses only todo (unchecked) and done (checked).
    struct checkbox_value
    {
        std::map<std::string, checkbox_status> marks;
        bool operator==(checkbox_value const &) const = default;
    };

    struct url_value
    {
        std::string url;
        bool operator==(url_value const &) const = default;
    };

    struct url_list_value
    {
        std::vector<std::string> items;
        bool operator==(url_list_value const &) const = default;
    };

    struct date_value
    {
        std::string date;    // YYYY-MM-DD
        bool operator==(date_value const &) const = default;
    };

    struct year_value
    {
        int64_t year = 0;
        bool operator==(year_value const &) const = default;
    };

    enum class cell_state
    {
        answered,
        skipped,
        aborted
    };

    using cell_scalar = std::variant<std::string, double>;

    struct table_cell
    {
        cell_state                 state = cell_state::answered;
        cell_scalar                value;
        std::optional<std::string> reason;
        bool operator==(table_cell const &) const = default;
    };

    // Column id -> cell. An absent column is an empty cell.
    using table_row = std::map<std::string, table_cell>;

    struct table_value
    {
        std::vector<table_row> rows;
        bool operator==(table_value const &) const = default;
    };

    using field_value = std::variant<
        text_value,
        number_value,
        text_list_value,
        single_choice_value,
        multi_choice_value,
        checkbox_value,
        url_value,
        url_list_value,
        date_value,
        year_value,
        table_value
    >;

    static_assert(std::variant_size_v<field_value> == static_cast<size_t>(field_kind::table) + 1);
    static_assert(std::is_same_v<std::variant_alternative_t<static_cast<size_t>(field_kind::checkbox_set), field_value>, checkbox_value>);
    static_assert(std::is_same_v<std::variant_alternative_t<static_cast<size_t>(field_kind::table), field_value>, table_value>);

    inline field_kind kind_of(field_value const & v) noexcept
    {
        return static_cast<field_kind>(v.index());
    }

    inline bool value_matches_kind(field_value const & v, field_kind k) noexcept
    {
        return kind_of(v) == k;
    }

    // An empty value of the given kind.
    inline field_value make_empty_value(field_kind k)
    {
        switch (k)
        {
            case field_kind::text:          return text_value{};
            case field_kind::number:        return number_value{};
            case field_kind::text_list:     return text_list_value{};
            case field_kind::single_choice: return single_choice_value{};
            case field_kind::multi_choice:  return multi_choice_value{};
            case field_kind::checkbox_set:  return checkbox_value{};
            case field_kind::url:           return url_value{};
            case field_kind::url_list:      return url_list_value{};
            case field_kind::date:          return date_value{};
            case field_kind::year:          return year_value{};
            case field_kind::table:         return table_value{};
        }
        return text_value{};
    }

    // Whitespace-only text, no items, no selection, nothing checked, no rows.
    inline bool is_empty_value(field_value const & v)
    {
        auto blank = [](std::string const & s)
        {
            return s.find_first_not_of(" \t\r\n") == std::string::npos;
        };

        switch (kind_of(v))
        {
            case field_kind::text:          return blank(std::get<text_value>(v).text);
            case field_kind::number:        return false;
            case field_kind::text_list:     return std::get<text_list_value>(v).items.empty();
            case field_kind::single_choice: return !std::get<single_choice_value>(v).selected.has_value();
            case field_kind::multi_choice:  return std::get<multi_choice_value>(v).selected.empty();
            case field_kind::checkbox_set:
            {
                auto const & marks = std::get<checkbox_value>(v).marks;
                return std::all_of(marks.begin(), marks.end(),
                    [](auto const & m) { return m.second == checkbox_status::todo; });
            }
            case field_kind::url:           return blank(std::get<url_value>(v).url);
            case field_kind::url_list:      return std::get<url_list_value>(v).items.empty();
            case field_kind::date:          return blank(std::get<date_value>(v).date);
            case field_kind::year:          return false;
            case field_kind::table:         return std::get<table_value>(v).rows.empty();
        }
        return true;
    }

//========================================================================
// Errors and generation context
//========================================================================

    struct source_location
    {
        size_t line = 0;
    };

    template <typename Kind>
    struct error
    {
        Kind            kind;
        source_location loc;
        std::string     message;
        std::string     ref;    // id the error concerns, if any
    };

    enum class document_error_kind
    {
        malformed_frontmatter,
        duplicate_id,
        unknown_directive,
        type_mismatch_in_literal,
        malformed_directive,
        unbalanced_directive,
        missing_attribute,
        invalid_attribute,
        unknown_field_kind,
        unknown_reference
    };

    using document_error = error<document_error_kind>;

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        constexpr size_t MAX_LINES = 1'000'000;

        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string to_lower(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        inline bool is_blank(std::string_view s)
        {
            return trim_sv(s).empty();
        }

    //------------------------------------------------------------------------
    // Enumeration names
    //------------------------------------------------------------------------

        inline std::string_view kind_to_string(field_kind k)
        {
            switch (k)
            {
                case field_kind::text:          return "text";
                case field_kind::number:        return "number";
                case field_kind::text_list:     return "text-list";
                case field_kind::single_choice: return "single-choice";
                case field_kind::multi_choice:  return "multi-choice";
                case field_kind::checkbox_set:  return "checkbox-set";
                case field_kind::url:           return "url";
                case field_kind::url_list:      return "url-list";
                case field_kind::date:          return "date";
                case field_kind::year:          return "year";
                case field_kind::table:         return "table";
            }
            return "text";
        }

        // Accepts hyphen or underscore spellings.
        inline std::optional<field_kind> parse_kind(std::string_view sv)
        {
            std::string s = to_lower(trim_sv(sv));
            std::replace(s.begin(), s.end(), '_', '-');

            if (s == "text")          return field_kind::text;
            if (s == "number")        return field_kind::number;
            if (s == "text-list")     return field_kind::text_list;
            if (s == "single-choice") return field_kind::single_choice;
            if (s == "multi-choice")  return field_kind::multi_choice;
            if (s == "checkbox-set")  return field_kind::checkbox_set;
            if (s == "url")           return field_kind::url;
            if (s == "url-list")      return field_kind::url_list;
            if (s == "date")          return field_kind::date;
            if (s == "year")          return field_kind::year;
            if (s == "table")         return field_kind::table;

            return std::nullopt;
        }

        inline std::string_view state_to_string(answer_state s)
        {
            switch (s)
            {
                case answer_state::unanswered: return "unanswered";
                case answer_state::answered:   return "answered";
                case answer_state::skipped:    return "skipped";
                case answer_state::aborted:    return "aborted";
            }
            return "unanswered";
        }

        inline std::optional<answer_state> parse_state(std::string_view sv)
        {
            auto s = to_lower(trim_sv(sv));
            if (s == "unanswered") return answer_state::unanswered;
            if (s == "answered")   return answer_state::answered;
            if (s == "skipped")    return answer_state::skipped;
            if (s == "aborted")    return answer_state::aborted;
            return std::nullopt;
        }

        inline std::string_view status_to_string(checkbox_status s)
        {
            switch (s)
            {
                case checkbox_status::todo:       return "todo";
                case checkbox_status::done:       return "done";
                case checkbox_status::incomplete: return "incomplete";
                case checkbox_status::active:     return "active";
                case checkbox_status::na:         return "na";
            }
            return "todo";
        }

        inline std::optional<checkbox_status> parse_status(std::string_view sv)
        {
            auto s = to_lower(trim_sv(sv));
            if (s == "todo")       return checkbox_status::todo;
            if (s == "done")       return checkbox_status::done;
            if (s == "incomplete") return checkbox_status::incomplete;
            if (s == "active")     return checkbox_status::active;
            if (s == "na")         return checkbox_status::na;
            return std::nullopt;
        }

        // Option line markers: "- [m] Label"
        inline char status_to_marker(checkbox_status s)
        {
            switch (s)
            {
                case checkbox_status::todo:       return ' ';
                case checkbox_status::done:       return 'x';
                case checkbox_status::incomplete: return '/';
                case checkbox_status::active:     return '*';
                case checkbox_status::na:         return '-';
            }
            return ' ';
        }

        inline std::optional<checkbox_status> marker_to_status(char m)
        {
            switch (m)
            {
                case ' ':           return checkbox_status::todo;
                case 'x': case 'X': return checkbox_status::done;
                case '/':           return checkbox_status::incomplete;
                case '*':           return checkbox_status::active;
                case '-':           return checkbox_status::na;
                default:            return std::nullopt;
            }
        }

        inline std::string_view mode_to_string(checkbox_mode m)
        {
            return m == checkbox_mode::simple ? "simple" : "status";
        }

        inline std::optional<checkbox_mode> parse_mode(std::string_view sv)
        {
            auto s = to_lower(trim_sv(sv));
            if (s == "simple") return checkbox_mode::simple;
            if (s == "status") return checkbox_mode::status;
            return std::nullopt;
        }

        inline std::string_view column_type_to_string(column_type t)
        {
            switch (t)
            {
                case column_type::text:   return "text";
                case column_type::number: return "number";
                case column_type::url:    return "url";
                case column_type::date:   return "date";
                case column_type::year:   return "year";
            }
            return "text";
        }

        inline std::optional<column_type> parse_column_type(std::string_view sv)
        {
            auto s = to_lower(trim_sv(sv));
            if (s == "text" || s == "string") return column_type::text;
            if (s == "number")                return column_type::number;
            if (s == "url")                   return column_type::url;
            if (s == "date")                  return column_type::date;
            if (s == "year")                  return column_type::year;
            return std::nullopt;
        }

        inline std::string_view priority_to_string(field_priority p)
        {
            switch (p)
            {
                case field_priority::high:   return "high";
                case field_priority::medium: return "medium";
                case field_priority::low:    return "low";
            }
            return "medium";
        }

        inline std::optional<field_priority> parse_priority(std::string_view sv)
        {
            auto s = to_lower(trim_sv(sv));
            if (s == "high")   return field_priority::high;
            if (s == "medium") return field_priority::medium;
            if (s == "low")    return field_priority::low;
            return std::nullopt;
        }

        inline std::string_view approval_to_string(approval_mode a)
        {
            return a == approval_mode::blocking ? "blocking" : "none";
        }

        inline std::optional<approval_mode> parse_approval(std::string_view sv)
        {
            auto s = to_lower(trim_sv(sv));
            if (s == "none")     return approval_mode::none;
            if (s == "blocking") return approval_mode::blocking;
            return std::nullopt;
        }

        inline std::string_view run_mode_to_string(run_mode m)
        {
            switch (m)
            {
                case run_mode::interactive: return "interactive";
                case run_mode::fill:        return "fill";
                case run_mode::research:    return "research";
            }
            return "interactive";
        }

        inline std::optional<run_mode> parse_run_mode(std::string_view sv)
        {
            auto s = to_lower(trim_sv(sv));
            if (s == "interactive") return run_mode::interactive;
            if (s == "fill")        return run_mode::fill;
            if (s == "research")    return run_mode::research;
            return std::nullopt;
        }

        inline std::string_view error_kind_to_string(document_error_kind k)
        {
            switch (k)
            {
                case document_error_kind::malformed_frontmatter:    return "malformed-frontmatter";
                case document_error_kind::duplicate_id:             return "duplicate-id";
                case document_error_kind::unknown_directive:        return "unknown-directive";
                case document_error_kind::type_mismatch_in_literal: return "type-mismatch-in-literal";
                case document_error_kind::malformed_directive:      return "malformed-directive";
                case document_error_kind::unbalanced_directive:     return "unbalanced-directive";
                case document_error_kind::missing_attribute:        return "missing-attribute";
                case document_error_kind::invalid_attribute:        return "invalid-attribute";
                case document_error_kind::unknown_field_kind:       return "unknown-field-kind";
                case document_error_kind::unknown_reference:        return "unknown-reference";
            }
            return "malformed-directive";
        }

    //------------------------------------------------------------------------
    // Numbers
    //------------------------------------------------------------------------

        // Whole numbers are written without a fractional part.
        inline std::string format_number(double d)
        {
            if (std::isfinite(d) && std::floor(d) == d && std::fabs(d) < 9.0e15)
                return std::to_string(static_cast<int64_t>(d));

            char buf[64];
            auto res = std::to_chars(buf, buf + sizeof(buf), d);
            return std::string(buf, res.ptr);
        }

        inline std::optional<int64_t> parse_int(std::string_view sv)
        {
            auto s = trim_sv(sv);
            if (s.empty()) return std::nullopt;
            if (s.front() == '+') s.remove_prefix(1);

            int64_t v = 0;
            auto res = std::from_chars(s.data(), s.data() + s.size(), v);
            if (res.ec != std::errc{} || res.ptr != s.data() + s.size())
                return std::nullopt;
            return v;
        }

        inline std::optional<double> parse_double(std::string_view sv)
        {
            auto s = std::string(trim_sv(sv));
            if (s.empty()) return std::nullopt;

            // strtod accepts hex, inf and nan; a literal number never needs them.
            for (char c : s)
                if (!(std::isdigit(static_cast<unsigned char>(c)) ||
                      c == '-' || c == '+' || c == '.' || c == 'e' || c == 'E'))
                    return std::nullopt;

            char* end = nullptr;
            double d = std::strtod(s.c_str(), &end);
            if (end != s.c_str() + s.size())
                return std::nullopt;
            return d;
        }

    //------------------------------------------------------------------------
    // Dates and URLs
    //------------------------------------------------------------------------

        inline bool is_date_shaped(std::string_view s)
        {
            if (s.size() != 10 || s[4] != '-' || s[7] != '-')
                return false;
            for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9})
                if (!std::isdigit(static_cast<unsigned char>(s[i])))
                    return false;
            return true;
        }

        inline bool is_calendar_date(std::string_view s)
        {
            if (!is_date_shaped(s))
                return false;

            int y = (s[0]-'0')*1000 + (s[1]-'0')*100 + (s[2]-'0')*10 + (s[3]-'0');
            int m = (s[5]-'0')*10 + (s[6]-'0');
            int d = (s[8]-'0')*10 + (s[9]-'0');

            if (m < 1 || m > 12 || d < 1)
                return false;

            static constexpr int days[] = { 31,28,31,30,31,30,31,31,30,31,30,31 };
            bool leap = (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
            int max_day = days[m - 1] + ((m == 2 && leap) ? 1 : 0);
            return d <= max_day;
        }

        // http or https scheme with a non-empty host.
        inline bool is_url(std::string_view sv)
        {
            auto s = trim_sv(sv);
            auto lower = to_lower(s);

            size_t scheme_len = 0;
            if (lower.rfind("http://", 0) == 0)       scheme_len = 7;
            else if (lower.rfind("https://", 0) == 0) scheme_len = 8;
            else return false;

            auto rest = s.substr(scheme_len);
            auto host = rest.substr(0, rest.find_first_of("/?#"));
            if (host.empty() || host.find(' ') != std::string_view::npos)
                return false;
            // drop userinfo and port
            if (auto at = host.rfind('@'); at != std::string_view::npos)
                host = host.substr(at + 1);
            if (auto colon = host.find(':'); colon != std::string_view::npos)
                host = host.substr(0, colon);
            return !host.empty() && s.find_first_of(" \t") == std::string_view::npos;
        }

        inline std::string join(std::vector<std::string> const & parts, std::string_view sep)
        {
            std::string out;
            for (size_t i = 0; i < parts.size(); ++i)
            {
                if (i) out += sep;
                out += parts[i];
            }
            return out;
        }
    }

} // namespace formwork

#endif
