#pragma once

#include <cstdint>
#include <string_view>

namespace badlang::common
{
    /// Every value in the language is one machine word wide.
    inline constexpr std::uint32_t kWordSize = 4;

    enum class ScalarType : std::uint8_t
    {
        Integer,
        Boolean,
        Error
    };

    [[nodiscard]] inline std::string_view toString(ScalarType type) noexcept
    {
        switch (type)
        {
        case ScalarType::Integer: return "int";
        case ScalarType::Boolean: return "bool";
        case ScalarType::Error: return "ERROR";
        }
        return "ERROR";
    }

    [[nodiscard]] inline bool isConcrete(ScalarType type) noexcept
    {
        return type != ScalarType::Error;
    }
} // namespace badlang::common
