#pragma once

#include "../common/scalar_type.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace badlang::mir
{
    using common::ScalarType;

    enum class SymbolKind : std::uint8_t
    {
        Variable,
        Parameter,
        Function
    };

    [[nodiscard]] std::string_view toString(SymbolKind kind) noexcept;

    class FlatSymbolTable;

    struct SymbolEntry
    {
        std::string name;
        ScalarType type{ScalarType::Integer};
        SymbolKind kind{SymbolKind::Variable};
        // Byte offset within the variable or parameter sequence of the owning table
        std::uint32_t offset{0};
        // Compile-time initial value of a global variable (booleans are 0 or 1)
        std::optional<std::int32_t> initialValue;
        // Locals and parameters of a function entry
        std::unique_ptr<FlatSymbolTable> locals;
    };

    /**
     * Unscoped name table produced after identifier flattening. Variables and parameters draw offsets from
     * two independent sequences that start at zero and advance by the word size.
     */
    class FlatSymbolTable
    {
    public:
        explicit FlatSymbolTable(std::uint32_t wordSize = common::kWordSize);

        /// Returns false when `name` is already present.
        bool putVariable(const std::string& name, ScalarType type, std::optional<std::int32_t> initialValue = std::nullopt);
        bool putParameter(const std::string& name, ScalarType type);
        /// Adds a function entry and returns its (empty) local table, or nullptr when `name` is already present.
        FlatSymbolTable* putFunction(const std::string& name, ScalarType type);

        [[nodiscard]] bool contains(std::string_view name) const;
        [[nodiscard]] const SymbolEntry* find(std::string_view name) const;
        [[nodiscard]] const std::vector<SymbolEntry>& entries() const noexcept { return m_entries; }

        [[nodiscard]] std::vector<const SymbolEntry*> variables() const;
        [[nodiscard]] std::vector<const SymbolEntry*> functions() const;

        /// Bytes needed for the local-variable region of a function frame.
        [[nodiscard]] std::uint32_t localSize() const noexcept { return m_nextVariableOffset; }
        [[nodiscard]] std::uint32_t parameterSize() const noexcept { return m_nextParameterOffset; }
        [[nodiscard]] std::uint32_t wordSize() const noexcept { return m_wordSize; }

        [[nodiscard]] std::string describe() const;

    private:
        SymbolEntry* insert(const std::string& name, ScalarType type, SymbolKind kind);
        void describeInto(std::string& out, std::size_t indent) const;

        std::uint32_t m_wordSize;
        std::vector<SymbolEntry> m_entries;
        std::unordered_map<std::string, std::size_t> m_index;
        std::uint32_t m_nextVariableOffset{0};
        std::uint32_t m_nextParameterOffset{0};
    };
} // namespace badlang::mir
