#pragma once

#include <string_view>

#include <NGIN/Hierarchy/Export.hpp>
#include <NGIN/Hierarchy/Types.hpp>
#include <NGIN/Hierarchy/Class.hpp>
#include <NGIN/Hierarchy/Pointer.hpp>
#include <NGIN/Hierarchy/VTable.hpp>
#include <NGIN/Hierarchy/ClassInfo.hpp>
#include <NGIN/Hierarchy/Handle.hpp>

namespace NGIN::Hierarchy
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Hierarchy"; }

} // namespace NGIN::Hierarchy
