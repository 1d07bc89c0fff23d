// formwork_plan.hpp - Formwork - Execution planner
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef FORMWORK_PLAN_HPP
#define FORMWORK_PLAN_HPP

#include "formwork_document.hpp"
#include "formwork_validate.hpp"

#include <set>

namespace formwork
{
//========================================================================
// Plan
//========================================================================

    enum class plan_item_type
    {
        field,      // field of an implicit group
        group       // explicit group
    };

    struct plan_item
    {
        std::string                id;
        plan_item_type             type  = plan_item_type::field;
        int64_t                    order = 0;
        std::optional<std::string> role;               // none when roles are mixed
        std::vector<std::string>   remaining_fields;   // declaration order

        bool operator==(plan_item const &) const = default;
    };

    struct parallel_batch
    {
        std::string            id;
        int64_t                order = 0;
        std::vector<plan_item> items;

        bool operator==(parallel_batch const &) const = default;
    };

    struct execution_plan
    {
        std::vector<int64_t>        order_levels;      // ascending
        std::vector<plan_item>      loose_serial;
        std::vector<parallel_batch> parallel_batches;

        bool empty() const noexcept
        {
            return loose_serial.empty() && parallel_batches.empty();
        }

        bool operator==(execution_plan const &) const = default;
    };

    execution_plan compute_execution_plan(document const & doc);

    inline std::string_view item_type_to_string(plan_item_type t)
    {
        return t == plan_item_type::group ? "group" : "field";
    }

//========================================================================
// Implementation
//========================================================================

    namespace detail
    {
        // Everything the planner knows about one item while partitioning.
        struct plan_candidate
        {
            plan_item                  item;
            size_t                     position = 0;
            std::optional<std::string> tag;
            bool                       serial = false;
            std::vector<field const *> members;    // all fields of the item
        };

        inline bool needs_work(field_assessment const & a)
        {
            if (!a.applicable())
                return false;
            if (a.state == answer_state::unanswered)
                return true;
            if (a.state != answer_state::answered)
                return false;
            return !a.valid() || (a.f->required && a.empty);
        }

        inline void finish_candidate(plan_candidate & c, document_assessment const & assessment)
        {
            std::set<std::string> roles;
            for (auto const * f : c.members)
            {
                auto const * a = assessment.find(f->id);
                if (a && needs_work(*a))
                {
                    c.item.remaining_fields.push_back(f->id);
                    roles.insert(f->role);
                }
            }

            if (roles.size() == 1)
                c.item.role = *roles.begin();
            else if (roles.size() > 1)
                c.serial = true;
        }

        inline std::string batch_key(plan_candidate const & c)
        {
            if (c.tag)
                return "tag:" + *c.tag;
            return "role:" + c.item.role.value_or("");
        }

        inline std::string batch_name(std::string const & key)
        {
            if (key.starts_with("tag:"))
                return key.substr(4);
            return "role-" + key.substr(5);
        }
    }

//---------------------------------------------------------------------------

    inline execution_plan compute_execution_plan(document const & doc)
    {
        auto assessment = assess_document(doc);

        std::vector<detail::plan_candidate> candidates;

        for (auto const & g : doc.groups())
        {
            if (g.implicit)
            {
                for (auto const & f : g.fields)
                {
                    detail::plan_candidate c;
                    c.item.id    = f.id;
                    c.item.type  = plan_item_type::field;
                    c.item.order = doc.effective_order(f);
                    c.tag        = f.parallel;
                    c.serial     = f.serial;
                    c.members    = { &f };
                    candidates.push_back(std::move(c));
                }
                continue;
            }

            detail::plan_candidate c;
            c.item.id    = g.id;
            c.item.type  = plan_item_type::group;
            c.item.order = g.order.value_or(0);
            c.tag        = g.parallel;
            c.serial     = g.serial;
            for (auto const & f : g.fields)
                c.members.push_back(&f);
            candidates.push_back(std::move(c));
        }

        for (size_t i = 0; i < candidates.size(); ++i)
        {
            candidates[i].position = i;
            detail::finish_candidate(candidates[i], assessment);
        }

        std::erase_if(candidates, [](auto const & c) { return c.item.remaining_fields.empty(); });

        // Field id -> candidate, for dependency checks.
        std::map<std::string, size_t> owner;
        for (size_t i = 0; i < candidates.size(); ++i)
            for (auto const * f : candidates[i].members)
                owner[f->id] = i;

        for (size_t i = 0; i < candidates.size(); ++i)
        {
            for (auto const & id : candidates[i].item.remaining_fields)
            {
                auto const * f = doc.find_field(id);
                if (!f || !f->depends_on)
                    continue;

                auto it = owner.find(*f->depends_on);
                if (it == owner.end() || it->second == i)
                    continue;

                auto & other = candidates[it->second];
                if (other.item.order == candidates[i].item.order)
                {
                    candidates[i].serial = true;
                    other.serial         = true;
                }
            }
        }

        execution_plan plan;

        std::set<int64_t> levels;
        for (auto const & c : candidates)
            levels.insert(c.item.order);
        plan.order_levels.assign(levels.begin(), levels.end());

        struct pending_batch
        {
            std::string         key;
            int64_t             order = 0;
            std::vector<size_t> members;
        };
        std::vector<pending_batch> batches;

        for (auto level : plan.order_levels)
        {
            // Keys in order of first appearance.
            std::vector<std::string>                keys;
            std::map<std::string, std::vector<size_t>> by_key;

            for (size_t i = 0; i < candidates.size(); ++i)
            {
                auto const & c = candidates[i];
                if (c.item.order != level)
                    continue;

                if (c.serial)
                {
                    plan.loose_serial.push_back(c.item);
                    continue;
                }

                auto key = detail::batch_key(c);
                if (!by_key.count(key))
                    keys.push_back(key);
                by_key[key].push_back(i);
            }

            for (auto const & key : keys)
            {
                auto const & members = by_key[key];
                bool tagged = key.starts_with("tag:");

                if (tagged || (members.size() == 1 && keys.size() >= 2))
                {
                    batches.push_back({ key, level, members });
                    continue;
                }

                for (auto i : members)
                    plan.loose_serial.push_back(candidates[i].item);
            }
        }

        // Loose items of one level were pushed in two passes; restore declaration order.
        std::map<std::string, size_t> position;
        for (auto const & c : candidates)
            position[c.item.id] = c.position;

        std::stable_sort(plan.loose_serial.begin(), plan.loose_serial.end(),
            [&](plan_item const & a, plan_item const & b)
            {
                if (a.order != b.order)
                    return a.order < b.order;
                return position[a.id] < position[b.id];
            });

        std::map<std::string, std::set<int64_t>> key_levels;
        for (auto const & b : batches)
            key_levels[b.key].insert(b.order);

        std::stable_sort(batches.begin(), batches.end(), [&](pending_batch const & a, pending_batch const & b)
        {
            if (a.order != b.order)
                return a.order < b.order;
            return candidates[a.members.front()].position < candidates[b.members.front()].position;
        });

        for (auto const & b : batches)
        {
            parallel_batch pb;
            pb.id    = detail::batch_name(b.key);
            pb.order = b.order;
            if (key_levels[b.key].size() > 1)
                pb.id += "@" + std::to_string(b.order);

            for (auto i : b.members)
                pb.items.push_back(candidates[i].item);
            plan.parallel_batches.push_back(std::move(pb));
        }

        return plan;
    }

} // namespace formwork

#endif // FORMWORK_PLAN_HPP
