// ClassInfo.hpp
// Per-class descriptor: depth, identity, downcast predicate and dispatch table
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <NGIN/Hierarchy/Export.hpp>
#include <NGIN/Hierarchy/Class.hpp>
#include <NGIN/Hierarchy/Types.hpp>
#include <NGIN/Hierarchy/VTable.hpp>

#include <string>
#include <string_view>

namespace NGIN::Hierarchy
{

  /**
   * Immutable, process-wide record describing one class. Handles keep a pointer
   * to the descriptor of the concrete class they were built from.
   */
  struct ClassInfo
  {
    Depth depth{0};
    ClassKey key{nullptr};
    ClassId id{0};
    std::string_view name{};
    const ClassInfo *parent{nullptr};
    // True iff the key names this class or one of its ancestors.
    bool (*downable)(ClassKey){nullptr};
    // First slot of the class's VTable (slot 0 = own level).
    const Slot *vtable{nullptr};
    // Deletes an object allocated as this class. Only used by owning handles.
    void (*destroy)(Object *){nullptr};

    [[nodiscard]] bool IsDownableTo(ClassKey target) const { return downable(target); }
    [[nodiscard]] bool IsRoot() const noexcept { return parent == nullptr; }
  };

  namespace detail
  {
    template <HierarchyClass C>
    bool Downable(ClassKey key)
    {
      if (key == ClassKeyOf<C>())
        return true;
      if constexpr (RootClass<C>)
        return false;
      else
        return Downable<ParentOf<C>>(key);
    }

    template <HierarchyClass C>
    void Destroy(Object *obj)
    {
      delete static_cast<C *>(obj);
    }
  } // namespace detail

  template <HierarchyClass C>
  const ClassInfo &InfoOf() noexcept;

  namespace detail
  {
    template <HierarchyClass C>
    ClassInfo MakeClassInfo() noexcept
    {
      ClassInfo info{};
      info.depth = DepthOf<C>;
      info.key = ClassKeyOf<C>();
      info.id = ClassIdOf<C>();
      info.name = NGIN::Meta::TypeName<C>::qualifiedName;
      if constexpr (!RootClass<C>)
        info.parent = &InfoOf<ParentOf<C>>();
      info.downable = &Downable<C>;
      info.vtable = TableOf<C>.Data();
      info.destroy = &Destroy<C>;
      return info;
    }
  } // namespace detail

  template <HierarchyClass C>
  const ClassInfo &InfoOf() noexcept
  {
    static const ClassInfo info = detail::MakeClassInfo<C>();
    return info;
  }

  // The class followed by its ancestors, e.g. "Dog : Animal : NGIN::Hierarchy::Object".
  [[nodiscard]] NGIN_HIERARCHY_API std::string DescribeChain(const ClassInfo &info);

  // Ancestor of `info` at `depth`, or nullptr when depth exceeds the class's own.
  [[nodiscard]] NGIN_HIERARCHY_API const ClassInfo *AncestorAt(const ClassInfo &info, Depth depth) noexcept;

  [[nodiscard]] NGIN_HIERARCHY_API bool IsSameOrAncestor(const ClassInfo &cls, const ClassInfo &ancestor) noexcept;

} // namespace NGIN::Hierarchy
