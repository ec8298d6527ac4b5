#include "symbol_table.hpp"

namespace badlang::mir
{
    std::string_view toString(SymbolKind kind) noexcept
    {
        switch (kind)
        {
        case SymbolKind::Variable: return "variable";
        case SymbolKind::Parameter: return "parameter";
        case SymbolKind::Function: return "function";
        }
        return "unknown";
    }

    FlatSymbolTable::FlatSymbolTable(std::uint32_t wordSize)
        : m_wordSize(wordSize)
    {
    }

    SymbolEntry* FlatSymbolTable::insert(const std::string& name, ScalarType type, SymbolKind kind)
    {
        if (contains(name))
        {
            return nullptr;
        }

        SymbolEntry entry;
        entry.name = name;
        entry.type = type;
        entry.kind = kind;
        m_index.emplace(name, m_entries.size());
        m_entries.emplace_back(std::move(entry));
        return &m_entries.back();
    }

    bool FlatSymbolTable::putVariable(const std::string& name, ScalarType type, std::optional<std::int32_t> initialValue)
    {
        SymbolEntry* entry = insert(name, type, SymbolKind::Variable);
        if (entry == nullptr)
        {
            return false;
        }

        entry->offset = m_nextVariableOffset;
        entry->initialValue = initialValue;
        m_nextVariableOffset += m_wordSize;
        return true;
    }

    bool FlatSymbolTable::putParameter(const std::string& name, ScalarType type)
    {
        SymbolEntry* entry = insert(name, type, SymbolKind::Parameter);
        if (entry == nullptr)
        {
            return false;
        }

        entry->offset = m_nextParameterOffset;
        m_nextParameterOffset += m_wordSize;
        return true;
    }

    FlatSymbolTable* FlatSymbolTable::putFunction(const std::string& name, ScalarType type)
    {
        SymbolEntry* entry = insert(name, type, SymbolKind::Function);
        if (entry == nullptr)
        {
            return nullptr;
        }

        entry->locals = std::make_unique<FlatSymbolTable>(m_wordSize);
        return entry->locals.get();
    }

    bool FlatSymbolTable::contains(std::string_view name) const
    {
        return m_index.find(std::string{name}) != m_index.end();
    }

    const SymbolEntry* FlatSymbolTable::find(std::string_view name) const
    {
        const auto it = m_index.find(std::string{name});
        if (it == m_index.end())
        {
            return nullptr;
        }
        return &m_entries[it->second];
    }

    std::vector<const SymbolEntry*> FlatSymbolTable::variables() const
    {
        std::vector<const SymbolEntry*> result;
        for (const auto& entry : m_entries)
        {
            if (entry.kind == SymbolKind::Variable)
            {
                result.push_back(&entry);
            }
        }
        return result;
    }

    std::vector<const SymbolEntry*> FlatSymbolTable::functions() const
    {
        std::vector<const SymbolEntry*> result;
        for (const auto& entry : m_entries)
        {
            if (entry.kind == SymbolKind::Function)
            {
                result.push_back(&entry);
            }
        }
        return result;
    }

    std::string FlatSymbolTable::describe() const
    {
        std::string out;
        describeInto(out, 0);
        return out;
    }

    void FlatSymbolTable::describeInto(std::string& out, std::size_t indent) const
    {
        for (const auto& entry : m_entries)
        {
            out.append(indent, ' ');
            out += entry.name;
            out += " : ";
            out += common::toString(entry.type);
            out += " (";
            out += toString(entry.kind);
            out += ")";

            if (entry.kind != SymbolKind::Function)
            {
                out += ", offset=" + std::to_string(entry.offset);
                if (entry.initialValue.has_value())
                {
                    out += ", initial=" + std::to_string(*entry.initialValue);
                }
            }
            else if (entry.locals)
            {
                out += ", locals=" + std::to_string(entry.locals->localSize());
            }
            out += '\n';

            if (entry.locals)
            {
                entry.locals->describeInto(out, indent + 4);
            }
        }
    }
} // namespace badlang::mir
