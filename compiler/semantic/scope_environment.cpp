#include "scope_environment.hpp"

#include <algorithm>
#include <unordered_set>

namespace badlang::semantic
{
    ScopeEnvironment::ScopeEnvironment()
    {
        m_frames.emplace_back();
    }

    void ScopeEnvironment::pushScope(std::optional<ScalarType> returnType)
    {
        Frame frame;
        frame.parent = m_current;
        frame.returnType = returnType;
        m_frames.emplace_back(std::move(frame));
        m_current = m_frames.size() - 1;
    }

    bool ScopeEnvironment::popScope()
    {
        const auto& parent = m_frames[m_current].parent;
        if (!parent.has_value())
        {
            return false;
        }
        m_current = *parent;
        return true;
    }

    std::size_t ScopeEnvironment::depth() const noexcept
    {
        std::size_t result = 0;
        std::optional<FrameIndex> index = m_current;
        while (index.has_value())
        {
            ++result;
            index = m_frames[*index].parent;
        }
        return result;
    }

    bool ScopeEnvironment::declare(const std::string& name, IdentifierRecord record)
    {
        Frame& frame = m_frames[m_current];
        const auto [it, inserted] = frame.bindings.emplace(name, std::move(record));
        if (inserted)
        {
            frame.order.push_back(name);
        }
        return inserted;
    }

    bool ScopeEnvironment::isDeclaredInScope(std::string_view name) const
    {
        return lookupInScope(name) != nullptr;
    }

    bool ScopeEnvironment::isDeclared(std::string_view name) const
    {
        return lookup(name) != nullptr;
    }

    const IdentifierRecord* ScopeEnvironment::lookup(std::string_view name) const
    {
        const std::string key{name};
        const auto index = findFrame(key);
        return index.has_value() ? &m_frames[*index].bindings.at(key) : nullptr;
    }

    IdentifierRecord* ScopeEnvironment::lookup(std::string_view name)
    {
        const std::string key{name};
        const auto index = findFrame(key);
        return index.has_value() ? &m_frames[*index].bindings.at(key) : nullptr;
    }

    const IdentifierRecord* ScopeEnvironment::lookupInScope(std::string_view name) const
    {
        const Frame& frame = m_frames[m_current];
        const auto it = frame.bindings.find(std::string{name});
        return it == frame.bindings.end() ? nullptr : &it->second;
    }

    bool ScopeEnvironment::markInitialized(std::string_view name)
    {
        IdentifierRecord* record = lookup(name);
        if (record == nullptr)
        {
            return false;
        }
        record->initialized = true;
        return true;
    }

    std::optional<ScalarType> ScopeEnvironment::enclosingReturnType() const
    {
        std::optional<FrameIndex> index = m_current;
        while (index.has_value())
        {
            const Frame& frame = m_frames[*index];
            if (frame.returnType.has_value())
            {
                return frame.returnType;
            }
            index = frame.parent;
        }
        return std::nullopt;
    }

    std::vector<std::string> ScopeEnvironment::visibleNames(std::optional<IdentifierKind> kind) const
    {
        std::vector<std::string> names;
        std::unordered_set<std::string> seen;
        for (const FrameIndex index : chain())
        {
            const Frame& frame = m_frames[index];
            for (const auto& name : frame.order)
            {
                if (kind.has_value())
                {
                    // Only the innermost binding of a shadowed name decides its kind.
                    const IdentifierRecord* visible = lookup(name);
                    if (visible == nullptr || visible->kind != *kind)
                    {
                        continue;
                    }
                }
                if (seen.insert(name).second)
                {
                    names.push_back(name);
                }
            }
        }
        return names;
    }

    std::vector<FrameIndex> ScopeEnvironment::chain() const
    {
        std::vector<FrameIndex> frames;
        std::optional<FrameIndex> index = m_current;
        while (index.has_value())
        {
            frames.push_back(*index);
            index = m_frames[*index].parent;
        }
        std::reverse(frames.begin(), frames.end());
        return frames;
    }

    std::optional<FrameIndex> ScopeEnvironment::findFrame(const std::string& name) const
    {
        std::optional<FrameIndex> index = m_current;
        while (index.has_value())
        {
            const Frame& frame = m_frames[*index];
            if (frame.bindings.count(name) != 0)
            {
                return index;
            }
            index = frame.parent;
        }
        return std::nullopt;
    }
} // namespace badlang::semantic
