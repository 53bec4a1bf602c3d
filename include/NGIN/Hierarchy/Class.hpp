// Class.hpp
// Root object, parent declaration and the compile-time ancestor relation
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>

#include <NGIN/Hierarchy/Types.hpp>

#include <concepts>
#include <type_traits>

namespace NGIN::Hierarchy
{

  // Dynamic view exposed by the root. Carries no capability.
  struct ObjectView
  {
    constexpr ObjectView() noexcept = default;
    constexpr explicit ObjectView(const void *) noexcept {}
  };

  /**
   * Universal root of every hierarchy. Classes never derive from it directly;
   * they go through Extends<Self, Object> so their parent edge is recorded.
   */
  struct Object
  {
    using HierarchySelf = Object;
    using HierarchyParent = void;
    using Dyn = ObjectView;
  };

  template <class C>
  concept HierarchyClass = std::is_class_v<C> && requires {
    typename C::HierarchySelf;
    typename C::HierarchyParent;
    typename C::Dyn;
  } && std::same_as<typename C::HierarchySelf, C>;

  /**
   * Declares Self as a direct child of Parent.
   *
   * struct Animal : NGIN::Hierarchy::Extends<Animal, NGIN::Hierarchy::Object> { ... };
   * struct Dog : NGIN::Hierarchy::Extends<Dog, Animal> { ... };
   *
   * A class deriving from Dog without going through Extends inherits Dog's
   * HierarchySelf and is rejected by HierarchyClass.
   */
  template <class Self, class Parent>
  struct Extends : Parent
  {
    static_assert(HierarchyClass<Parent>, "Extends: parent must be a hierarchy class");

    using Parent::Parent;
    using HierarchySelf = Self;
    using HierarchyParent = Parent;
  };

  template <class C>
  using ParentOf = typename C::HierarchyParent;

  template <class C>
  concept RootClass = std::same_as<C, Object>;

  namespace detail
  {
    template <class C>
    consteval Depth ComputeDepth()
    {
      if constexpr (RootClass<C>)
      {
        return 0;
      }
      else
      {
        static_assert(HierarchyClass<C>, "class must derive through Extends<Self, Parent>");
        constexpr auto parent = ComputeDepth<ParentOf<C>>();
        static_assert(parent < MaxDepth, "hierarchy exceeds MaxDepth");
        return static_cast<Depth>(parent + 1);
      }
    }

    template <class From, class To>
    consteval bool ComputeIsAncestor()
    {
      if constexpr (std::same_as<From, To>)
        return true;
      else if constexpr (RootClass<From>)
        return false;
      else
        return ComputeIsAncestor<ParentOf<From>, To>();
    }
  } // namespace detail

  template <HierarchyClass C>
  inline constexpr Depth DepthOf = detail::ComputeDepth<C>();

  // To is From itself or one of its ancestors. Purely a compile-time proof.
  template <class From, class To>
  concept Upcastable = HierarchyClass<From> && HierarchyClass<To> && detail::ComputeIsAncestor<From, To>();

  namespace detail
  {
    // Non-const, so every class owns a distinct address.
    template <class T>
    inline char ClassKeyAnchor{};
  } // namespace detail

  template <class T>
  [[nodiscard]] constexpr ClassKey ClassKeyOf() noexcept
  {
    return &detail::ClassKeyAnchor<std::remove_cv_t<T>>;
  }

  template <class T>
  inline ClassId ClassIdOf()
  {
    static const ClassId id = []
    {
      const auto sv = NGIN::Meta::TypeName<std::remove_cv_t<T>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }();
    return id;
  }

} // namespace NGIN::Hierarchy
