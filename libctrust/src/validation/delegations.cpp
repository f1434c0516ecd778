// Copyright (c) 2025, QuantStack and Mamba Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <iterator>
#include <utility>

#include "ctrust/core/logging.hpp"
#include "ctrust/validation/delegations.hpp"
#include "ctrust/validation/errors.hpp"

namespace ctrust::validation
{
    namespace
    {
        [[nodiscard]] auto is_descendant_of(std::string_view name, std::string_view ancestor) -> bool
        {
            return name.size() > ancestor.size() && name.starts_with(ancestor)
                   && name[ancestor.size()] == '/';
        }

        void append_unique(std::vector<std::string>& out, const std::vector<std::string>& values)
        {
            for (const auto& v : values)
            {
                if (std::find(out.cbegin(), out.cend(), v) == out.cend())
                {
                    out.push_back(v);
                }
            }
        }
    }

    void DelegationResolver::set_root_paths(std::vector<std::string> paths)
    {
        m_root_paths = std::move(paths);
    }

    auto DelegationResolver::root_paths() const -> const std::vector<std::string>&
    {
        return m_root_paths;
    }

    auto DelegationResolver::list_delegations() const -> const std::vector<DelegationRole>&
    {
        return m_delegations;
    }

    auto DelegationResolver::find(std::string_view name) const -> const DelegationRole*
    {
        auto it = std::find_if(
            m_delegations.cbegin(),
            m_delegations.cend(),
            [&](const DelegationRole& d) { return d.name == name; }
        );
        return it != m_delegations.cend() ? &*it : nullptr;
    }

    auto DelegationResolver::find_mut(std::string_view name) -> DelegationRole*
    {
        return const_cast<DelegationRole*>(std::as_const(*this).find(name));
    }

    auto DelegationResolver::contains(std::string_view name) const -> bool
    {
        return find(name) != nullptr;
    }

    auto DelegationResolver::get(std::string_view name) const -> const DelegationRole&
    {
        if (const auto* d = find(name))
        {
            return *d;
        }
        LOG_ERROR << "Unknown delegation '" << name << "'";
        throw unknown_delegation_error(name);
    }

    auto DelegationResolver::get_mut(std::string_view name) -> DelegationRole&
    {
        return const_cast<DelegationRole&>(std::as_const(*this).get(name));
    }

    auto DelegationResolver::children_of(std::string_view name) const -> std::vector<DelegationRole>
    {
        std::vector<DelegationRole> out;
        std::copy_if(
            m_delegations.cbegin(),
            m_delegations.cend(),
            std::back_inserter(out),
            [&](const DelegationRole& d) { return d.parent_name() == name; }
        );
        return out;
    }

    auto DelegationResolver::resolve_for_path(std::string_view path) const
        -> std::vector<DelegationRole>
    {
        std::vector<DelegationRole> out;
        std::copy_if(
            m_delegations.cbegin(),
            m_delegations.cend(),
            std::back_inserter(out),
            [&](const DelegationRole& d) { return d.can_sign_for(path); }
        );
        std::stable_sort(
            out.begin(),
            out.end(),
            [](const DelegationRole& a, const DelegationRole& b)
            { return delegation_depth(a.name) > delegation_depth(b.name); }
        );
        return out;
    }

    auto DelegationResolver::parent_paths(std::string_view name) const
        -> const std::vector<std::string>&
    {
        const auto parent = parent_role_name(name);
        if (parent == targets_role_name)
        {
            return m_root_paths;
        }
        if (const auto* d = find(parent))
        {
            return d->paths;
        }
        LOG_ERROR << "Parent '" << parent << "' of delegation '" << name << "' does not exist";
        throw unknown_delegation_error(parent);
    }

    auto DelegationResolver::is_within_parent(std::string_view name, std::string_view path) const
        -> bool
    {
        return any_path_matches(parent_paths(name), path);
    }

    void DelegationResolver::add_delegation(
        std::string_view name,
        const std::map<std::string, PublicKey>& keys,
        const std::vector<std::string>& paths,
        std::optional<std::size_t> threshold
    )
    {
        if (!is_delegation_name(name))
        {
            LOG_ERROR << "'" << name << "' is not a valid delegation name";
            throw role_error(name, "delegation names must be of the form 'targets/<name>'");
        }
        for (const auto& path : paths)
        {
            if (!is_within_parent(name, path))
            {
                LOG_ERROR << "Path '" << path << "' of delegation '" << name
                          << "' is not within its parent's paths";
                throw path_conflict_error(name, path);
            }
        }

        if (auto* existing = find_mut(name))
        {
            for (const auto& [id, key] : keys)
            {
                existing->keys.insert_or_assign(id, key);
            }
            append_unique(existing->paths, paths);
            if (threshold)
            {
                existing->threshold = *threshold;
            }
            return;
        }

        auto delegation = DelegationRole{};
        delegation.name = std::string(name);
        delegation.keys = keys;
        delegation.threshold = threshold.value_or(1);
        append_unique(delegation.paths, paths);
        m_delegations.push_back(std::move(delegation));
    }

    void
    DelegationResolver::add_delegation_keys(std::string_view name, const std::map<std::string, PublicKey>& keys)
    {
        auto& delegation = get_mut(name);
        for (const auto& [id, key] : keys)
        {
            delegation.keys.insert_or_assign(id, key);
        }
    }

    void
    DelegationResolver::add_delegation_paths(std::string_view name, const std::vector<std::string>& paths)
    {
        auto& delegation = get_mut(name);
        for (const auto& path : paths)
        {
            if (!is_within_parent(name, path))
            {
                LOG_ERROR << "Path '" << path << "' of delegation '" << name
                          << "' is not within its parent's paths";
                throw path_conflict_error(name, path);
            }
        }
        append_unique(delegation.paths, paths);
    }

    void DelegationResolver::remove_delegation_keys(
        std::string_view name,
        const std::vector<std::string>& key_ids
    )
    {
        auto& delegation = get_mut(name);
        for (const auto& id : key_ids)
        {
            delegation.keys.erase(id);
        }
    }

    void DelegationResolver::remove_delegation_paths(
        std::string_view name,
        const std::vector<std::string>& paths
    )
    {
        auto& delegation = get_mut(name);
        std::erase_if(
            delegation.paths,
            [&](const std::string& p)
            { return std::find(paths.cbegin(), paths.cend(), p) != paths.cend(); }
        );
    }

    void DelegationResolver::clear_delegation_paths(std::string_view name)
    {
        get_mut(name).paths.clear();
    }

    void DelegationResolver::set_delegation_threshold(std::string_view name, std::size_t threshold)
    {
        get_mut(name).threshold = threshold;
    }

    auto DelegationResolver::remove_delegation(std::string_view name) -> std::vector<std::string>
    {
        if (!contains(name))
        {
            LOG_ERROR << "Unknown delegation '" << name << "'";
            throw unknown_delegation_error(name);
        }

        std::vector<std::string> removed;
        std::erase_if(
            m_delegations,
            [&](const DelegationRole& d)
            {
                if (d.name == name || is_descendant_of(d.name, name))
                {
                    removed.push_back(d.name);
                    return true;
                }
                return false;
            }
        );
        return removed;
    }

    void DelegationResolver::check_consistency() const
    {
        for (const auto& delegation : m_delegations)
        {
            if (!is_delegation_name(delegation.name))
            {
                throw role_error(delegation.name, "invalid delegation name");
            }
            for (const auto& path : delegation.paths)
            {
                if (!is_within_parent(delegation.name, path))
                {
                    LOG_ERROR << "Path '" << path << "' of delegation '" << delegation.name
                              << "' is not within its parent's paths";
                    throw path_conflict_error(delegation.name, path);
                }
            }
            if (!delegation.has_valid_threshold())
            {
                LOG_ERROR << "Delegation '" << delegation.name << "' has threshold "
                          << delegation.threshold << " with " << delegation.keys.size() << " keys";
                delegation.check_threshold_bounds();
            }
        }
    }
}
