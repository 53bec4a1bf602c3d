// Pointer.hpp
// Pointer abstraction: ownership kinds and raw conversions for hierarchy objects
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Hierarchy/Class.hpp>

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>

namespace NGIN::Hierarchy
{

  enum class Ownership : NGIN::UInt8
  {
    Owning = 0,
    SharedBorrow = 1,
    ExclusiveBorrow = 2,
  };

  /**
   * Describes a pointer into a hierarchy object.
   *
   * IntoRaw consumes the pointer and hands release responsibility to the
   * caller. FromRaw rebuilds the pointer; the address must be valid, aligned
   * and used according to the ownership kind, otherwise behaviour is undefined.
   */
  template <class P>
  struct PointerTraits;

  template <HierarchyClass T>
  struct PointerTraits<T *>
  {
    using Class = T;
    using Raw = T *;
    static constexpr Ownership Kind = Ownership::ExclusiveBorrow;

    template <class U>
    using Rebind = U *;

    static constexpr Raw IntoRaw(T *ptr) noexcept { return ptr; }
    static constexpr T *FromRaw(Raw raw) noexcept { return raw; }
  };

  template <HierarchyClass T>
  struct PointerTraits<const T *>
  {
    using Class = T;
    using Raw = const T *;
    static constexpr Ownership Kind = Ownership::SharedBorrow;

    template <class U>
    using Rebind = const U *;

    static constexpr Raw IntoRaw(const T *ptr) noexcept { return ptr; }
    static constexpr const T *FromRaw(Raw raw) noexcept { return raw; }
  };

  template <HierarchyClass T>
  struct PointerTraits<std::unique_ptr<T>>
  {
    using Class = T;
    using Raw = T *;
    static constexpr Ownership Kind = Ownership::Owning;

    template <class U>
    using Rebind = std::unique_ptr<U>;

    static Raw IntoRaw(std::unique_ptr<T> ptr) noexcept { return ptr.release(); }
    static std::unique_ptr<T> FromRaw(Raw raw) noexcept { return std::unique_ptr<T>(raw); }
  };

  template <class P>
  concept ObjectPointer = requires { typename PointerTraits<P>::Class; } &&
                          HierarchyClass<typename PointerTraits<P>::Class> &&
                          requires(P ptr, typename PointerTraits<P>::Raw raw) {
                            { PointerTraits<P>::IntoRaw(std::move(ptr)) } -> std::same_as<typename PointerTraits<P>::Raw>;
                            { PointerTraits<P>::FromRaw(raw) } -> std::same_as<P>;
                          };

  // Casts may only move between pointers of the same ownership kind.
  template <class P, class Q>
  concept SameOwnership = ObjectPointer<P> && ObjectPointer<Q> && (PointerTraits<P>::Kind == PointerTraits<Q>::Kind);

  template <ObjectPointer P, HierarchyClass U>
  using RebindPointer = typename PointerTraits<P>::template Rebind<U>;

  // A cast target is either a class (rebound to P's kind) or a pointer of P's kind.
  template <class P, class Target>
  concept CastTarget = ObjectPointer<P> && (HierarchyClass<Target> || SameOwnership<P, Target>);

  namespace detail
  {
    template <class P, class Target>
    struct CastPointerImpl
    {
      using type = RebindPointer<P, Target>;
    };

    template <class P, class Target>
      requires ObjectPointer<Target>
    struct CastPointerImpl<P, Target>
    {
      using type = Target;
    };
  } // namespace detail

  template <class P, class Target>
    requires CastTarget<P, Target>
  using CastPointer = typename detail::CastPointerImpl<P, Target>::type;

  template <class P, class Target>
    requires CastTarget<P, Target>
  using CastClass = typename PointerTraits<CastPointer<P, Target>>::Class;

} // namespace NGIN::Hierarchy
