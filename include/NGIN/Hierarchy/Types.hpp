// Types.hpp
// Primitive aliases and tag types shared by the hierarchy headers
#pragma once

#include <NGIN/Primitives.hpp>

namespace NGIN::Hierarchy
{

  // Stable per-class hash (FNV-1a 64 of the qualified type name). Used for names and diagnostics.
  using ClassId = NGIN::UInt64;

  // Per-class identity: the address of an anchor object owned by the class.
  // Distinct for distinct classes even when their names collide.
  using ClassKey = const void *;

  // Distance of a class from the root; the root sits at depth 0.
  using Depth = NGIN::UInt16;

  inline constexpr Depth MaxDepth = static_cast<Depth>(-1);

  template <class T>
  struct Tag
  {
    using type = T;
  };

} // namespace NGIN::Hierarchy
