// formwork_document.hpp - Formwork - Authoritative Document Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_DOCUMENT_HPP
#define FORMWORK_DOCUMENT_HPP

#include "formwork_core.hpp"

#include <span>
#include <ranges>

namespace formwork
{
    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

//========================================================================
// Schema
//========================================================================

    struct option
    {
        std::string id;
        std::string label;

        bool operator==(option const &) const = default;
    };

    struct column
    {
        std::string id;
        std::string label;
        column_type type     = column_type::text;
        bool        required = false;

        bool operator==(column const &) const = default;
    };

    struct field
    {
        std::string     id;
        field_kind      kind     = field_kind::text;
        std::string     label;
        bool            required = false;
        std::string     role     = "agent";
        field_priority  priority = field_priority::medium;
        std::string     prompt;

        // Planning
        std::optional<int64_t>     order;
        std::optional<std::string> parallel;
        bool                       serial = false;
        std::optional<std::string> depends_on;
        std::optional<std::string> when;

        // text
        bool                       multiline = false;
        std::optional<std::string> pattern;
        std::optional<int64_t>     min_length;
        std::optional<int64_t>     max_length;

        // number, year
        std::optional<double>      min;
        std::optional<double>      max;
        bool                       integer = false;

        // date
        std::optional<std::string> min_date;
        std::optional<std::string> max_date;

        // text-list, url-list
        std::optional<int64_t>     min_items;
        std::optional<int64_t>     max_items;
        bool                       unique_items = false;

        // single-choice, multi-choice, checkbox-set
        std::vector<option>        options;
        std::optional<int64_t>     min_selections;
        std::optional<int64_t>     max_selections;
        checkbox_mode              mode = checkbox_mode::status;
        std::optional<int64_t>     min_done;
        approval_mode              approval = approval_mode::none;

        // table
        std::vector<column>        columns;
        std::optional<int64_t>     min_rows;
        std::optional<int64_t>     max_rows;

        bool operator==(field const &) const = default;

        option const * find_option(std::string_view option_id) const noexcept
        {
            for (auto const & o : options)
                if (o.id == option_id) return &o;
            return nullptr;
        }

        column const * find_column(std::string_view column_id) const noexcept
        {
            for (auto const & c : columns)
                if (c.id == column_id) return &c;
            return nullptr;
        }

        bool has_options() const noexcept
        {
            return kind == field_kind::single_choice
                || kind == field_kind::multi_choice
                || kind == field_kind::checkbox_set;
        }
    };

    struct group
    {
        std::string                id;          // empty for implicit groups
        std::string                title;
        bool                       implicit = false;
        std::optional<int64_t>     order;
        std::optional<std::string> parallel;
        bool                       serial = false;
        std::vector<field>         fields;

        bool operator==(group const &) const = default;
    };

//========================================================================
// Responses, notes, metadata
//========================================================================

    struct field_response
    {
        answer_state               state = answer_state::unanswered;
        std::optional<field_value> value;
        std::optional<std::string> reason;

        bool operator==(field_response const &) const = default;

        static field_response answered(field_value v)
        {
            return { answer_state::answered, std::move(v), std::nullopt };
        }

        static field_response skipped(std::optional<std::string> why = std::nullopt)
        {
            return { answer_state::skipped, std::nullopt, std::move(why) };
        }

        static field_response aborted(std::optional<std::string> why = std::nullopt)
        {
            return { answer_state::aborted, std::nullopt, std::move(why) };
        }
    };

    struct note
    {
        std::string id;
        std::string ref;       // field, group or form id
        std::string role;
        std::string text;

        bool operator==(note const &) const = default;
    };

    struct harness_limits
    {
        std::optional<int64_t> max_turns;
        std::optional<int64_t> max_patches_per_turn;
        std::optional<int64_t> max_issues_per_turn;
        std::optional<int64_t> max_fields_per_turn;
        std::optional<int64_t> max_groups_per_turn;

        bool operator==(harness_limits const &) const = default;
    };

    struct form_metadata
    {
        bool                               present = false;
        std::string                        spec_version;
        std::string                        title;
        std::optional<run_mode>            mode;
        std::vector<std::string>           roles;
        std::map<std::string, std::string> role_instructions;
        harness_limits                     harness;

        bool operator==(form_metadata const &) const = default;
    };

//========================================================================
// Source record (serializer use only)
//========================================================================

    struct source_span
    {
        size_t begin = 0;    // byte offsets, [begin, end)
        size_t end   = 0;
    };

    struct source_record
    {
        struct field_region
        {
            std::string    id;
            source_span    span;
            field_response parsed;    // response as read from the span
        };

        struct note_region
        {
            std::string id;
            source_span span;
            note        parsed;
        };

        bool                       present = false;
        std::string                text;
        std::optional<source_span> frontmatter;
        std::vector<field_region>  fields;
        std::vector<note_region>   notes;
        size_t                     form_close = npos();   // offset of "{% /form %}" line
    };

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        document() = default;

        //------------------------------------------------------------------------
        // Form
        //------------------------------------------------------------------------

        std::string const & id() const noexcept { return id_; }
        std::string const & title() const noexcept { return title_; }

        form_metadata const & metadata() const noexcept { return metadata_; }
        source_record const & source() const noexcept { return source_; }

        //------------------------------------------------------------------------
        // Schema access
        //------------------------------------------------------------------------

        std::span<const group> groups() const noexcept
        {
            return groups_;
        }

        // All fields in declaration order.
        std::vector<field const *> fields() const
        {
            std::vector<field const *> out;
            for (auto const & g : groups_)
                for (auto const & f : g.fields)
                    out.push_back(&f);
            return out;
        }

        size_t field_count() const noexcept
        {
            size_t n = 0;
            for (auto const & g : groups_)
                n += g.fields.size();
            return n;
        }

        field const * find_field(std::string_view field_id) const noexcept;
        group const * find_group(std::string_view group_id) const noexcept;
        group const * group_of(std::string_view field_id) const noexcept;

        // Position of the field in declaration order, npos() if unknown.
        size_t declaration_index(std::string_view field_id) const noexcept;

        // field order, else its group's order, else 0
        int64_t effective_order(field const & f) const noexcept;

        // True if id names the form, a group, a field or a note.
        bool has_id(std::string_view any_id) const noexcept;

        //------------------------------------------------------------------------
        // Responses and notes
        //------------------------------------------------------------------------

        field_response const & response(std::string_view field_id) const noexcept;

        std::span<const note> notes() const noexcept
        {
            return notes_;
        }

        note const * find_note(std::string_view note_id) const noexcept
        {
            for (auto const & n : notes_)
                if (n.id == note_id) return &n;
            return nullptr;
        }

        size_t note_count_for(std::string_view ref) const noexcept
        {
            return static_cast<size_t>(std::ranges::count_if(notes_,
                [&](note const & n) { return n.ref == ref; }));
        }

    private:

        //------------------------------------------------------------------------
        // Internal storage
        //------------------------------------------------------------------------

        std::string                                          id_;
        std::string                                          title_;
        std::vector<group>                                   groups_;
        std::map<std::string, field_response, std::less<>>   responses_;
        std::vector<note>                                    notes_;
        form_metadata                                        metadata_;
        source_record                                        source_;

        friend struct materialiser;
        friend class editor;
        friend bool semantically_equal(document const &, document const &);
    };

    // Compares schema, responses, notes and metadata. The source record is ignored.
    inline bool semantically_equal(document const & a, document const & b);

//========================================================================
// document member implementations
//========================================================================

    inline field const * document::find_field(std::string_view field_id) const noexcept
    {
        for (auto const & g : groups_)
            for (auto const & f : g.fields)
                if (f.id == field_id)
                    return &f;
        return nullptr;
    }

    inline group const * document::find_group(std::string_view group_id) const noexcept
    {
        if (group_id.empty())
            return nullptr;

        for (auto const & g : groups_)
            if (g.id == group_id)
                return &g;
        return nullptr;
    }

    inline group const * document::group_of(std::string_view field_id) const noexcept
    {
        for (auto const & g : groups_)
            for (auto const & f : g.fields)
                if (f.id == field_id)
                    return &g;
        return nullptr;
    }

    inline size_t document::declaration_index(std::string_view field_id) const noexcept
    {
        size_t i = 0;
        for (auto const & g : groups_)
            for (auto const & f : g.fields)
            {
                if (f.id == field_id)
                    return i;
                ++i;
            }
        return npos();
    }

    inline int64_t document::effective_order(field const & f) const noexcept
    {
        if (f.order)
            return *f.order;
        if (auto g = group_of(f.id); g && g->order)
            return *g->order;
        return 0;
    }

    inline bool document::has_id(std::string_view any_id) const noexcept
    {
        if (any_id.empty())
            return false;
        return any_id == id_
            || find_group(any_id) != nullptr
            || find_field(any_id) != nullptr
            || find_note(any_id) != nullptr;
    }

    inline field_response const & document::response(std::string_view field_id) const noexcept
    {
        static const field_response unanswered{};

        if (auto it = responses_.find(field_id); it != responses_.end())
            return it->second;
        return unanswered;
    }

    inline bool semantically_equal(document const & a, document const & b)
    {
        if (a.id_ != b.id_ || a.title_ != b.title_ || a.groups_ != b.groups_)
            return false;
        if (a.notes_ != b.notes_ || a.metadata_ != b.metadata_)
            return false;

        // An absent entry and an unanswered entry are the same response.
        for (auto const * f : a.fields())
            if (a.response(f->id) != b.response(f->id))
                return false;

        return true;
    }

} // namespace formwork

#endif // FORMWORK_DOCUMENT_HPP
