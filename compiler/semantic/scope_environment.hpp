#pragma once

#include "../common/scalar_type.hpp"
#include "../frontend/ast.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace badlang::semantic
{
    using common::ScalarType;

    enum class IdentifierKind : std::uint8_t
    {
        Variable,
        Function
    };

    struct IdentifierRecord
    {
        IdentifierKind kind{IdentifierKind::Variable};
        // Variable type or function return type
        ScalarType type{ScalarType::Integer};
        std::vector<frontend::Parameter> parameters;
        bool initialized{false};
        // Globally unique name assigned by the identifier flattener
        std::string uniqueName;
    };

    using FrameIndex = std::size_t;

    /**
     * Nested lexical scopes stored as an arena of frames, each frame pointing at its parent by index.
     * Bindings are never removed from a frame; popping a scope only moves the current frame back to the
     * parent, so popped frames stay in the arena until the environment is discarded.
     */
    class ScopeEnvironment
    {
    public:
        ScopeEnvironment();

        /// Enters a child of the current frame. Function frames record the declared return type.
        void pushScope(std::optional<ScalarType> returnType = std::nullopt);
        /// Returns to the parent frame; the global frame is never popped.
        bool popScope();

        [[nodiscard]] std::size_t depth() const noexcept;
        [[nodiscard]] bool atGlobalScope() const noexcept { return m_current == 0; }

        /// Binds `name` in the current frame. Returns false and leaves the existing binding untouched when
        /// the name is already bound in this frame.
        bool declare(const std::string& name, IdentifierRecord record);

        [[nodiscard]] bool isDeclaredInScope(std::string_view name) const;
        [[nodiscard]] bool isDeclared(std::string_view name) const;

        [[nodiscard]] const IdentifierRecord* lookup(std::string_view name) const;
        [[nodiscard]] IdentifierRecord* lookup(std::string_view name);
        [[nodiscard]] const IdentifierRecord* lookupInScope(std::string_view name) const;

        /// Marks the nearest binding of `name` initialized; false when it is not declared.
        bool markInitialized(std::string_view name);

        /// Return type recorded on the nearest enclosing function frame.
        [[nodiscard]] std::optional<ScalarType> enclosingReturnType() const;

        /// Every visible name, outermost frame first and in binding order within a frame.
        [[nodiscard]] std::vector<std::string> visibleNames(std::optional<IdentifierKind> kind = std::nullopt) const;

    private:
        struct Frame
        {
            std::optional<FrameIndex> parent;
            std::optional<ScalarType> returnType;
            std::unordered_map<std::string, IdentifierRecord> bindings;
            std::vector<std::string> order;
        };

        [[nodiscard]] std::vector<FrameIndex> chain() const;
        // Innermost frame on the current chain that binds the name.
        [[nodiscard]] std::optional<FrameIndex> findFrame(const std::string& name) const;

        std::vector<Frame> m_frames;
        FrameIndex m_current{0};
    };
} // namespace badlang::semantic
