// Handle.hpp
// Handle<P>: pointer + concrete class descriptor, with casts and level dispatch
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Hierarchy/Class.hpp>
#include <NGIN/Hierarchy/ClassInfo.hpp>
#include <NGIN/Hierarchy/Pointer.hpp>
#include <NGIN/Hierarchy/Types.hpp>
#include <NGIN/Hierarchy/VTable.hpp>

#include <expected>
#include <optional>
#include <ostream>
#include <type_traits>
#include <utility>

namespace NGIN::Hierarchy
{

  /**
   * Holds a dynamic view returned by dispatch. ViewRef<const Dyn> only exposes
   * the const interface of the view, ViewRef<Dyn> the full one.
   */
  template <class Dyn>
  class ViewRef
  {
  public:
    using View = std::remove_const_t<Dyn>;

    explicit ViewRef(View view) noexcept(std::is_nothrow_move_constructible_v<View>) : m_view(std::move(view)) {}

    Dyn *operator->() noexcept { return &m_view; }
    const View *operator->() const noexcept { return &m_view; }
    Dyn &operator*() noexcept { return m_view; }
    const View &operator*() const noexcept { return m_view; }

  private:
    View m_view;
  };

  /**
   * A pointer into a hierarchy object paired with the descriptor of the
   * object's concrete class.
   *
   * The descriptor is taken from the pointer's class when the handle is built
   * and survives every cast, so a handle upcast to an ancestor can always be
   * downcast back along its real chain. Wrapping a pointer that was already
   * upcast binds the handle to that ancestor instead of the real class.
   *
   * The pointer must be non-null. A null or moved-from handle fails every
   * downcast and Is() check; dispatching through it is undefined.
   */
  template <ObjectPointer P>
  class Handle
  {
    using Traits = PointerTraits<P>;

  public:
    using Pointer = P;
    using Class = typename Traits::Class;
    using Raw = typename Traits::Raw;
    using Element = std::remove_pointer_t<Raw>;
    using Dyn = DynOf<Class>;

    static constexpr Ownership Kind = Traits::Kind;
    static constexpr bool IsOwning = Kind == Ownership::Owning;
    static constexpr bool IsMutable = Kind != Ownership::SharedBorrow;
    static constexpr Depth StaticDepth = DepthOf<Class>;

    explicit Handle(P ptr) noexcept
        : m_ptr(Traits::IntoRaw(std::move(ptr))),
          m_info(&InfoOf<Class>())
    {
    }

    Handle(const Handle &) = delete;
    Handle &operator=(const Handle &) = delete;

    Handle(Handle &&other) noexcept
        : m_ptr(std::exchange(other.m_ptr, nullptr)),
          m_info(other.m_info)
    {
    }

    Handle &operator=(Handle &&other) noexcept
    {
      if (this != &other)
      {
        Reset();
        m_ptr = std::exchange(other.m_ptr, nullptr);
        m_info = other.m_info;
      }
      return *this;
    }

    ~Handle() { Reset(); }

    [[nodiscard]] explicit operator bool() const noexcept { return m_ptr != nullptr; }

    [[nodiscard]] const Element *Get() const noexcept { return m_ptr; }
    [[nodiscard]] Element *Get() noexcept { return m_ptr; }
    const Element &operator*() const noexcept { return *m_ptr; }
    Element &operator*() noexcept { return *m_ptr; }
    const Element *operator->() const noexcept { return m_ptr; }
    Element *operator->() noexcept { return m_ptr; }

    // Descriptor of the concrete class, never of the static one.
    [[nodiscard]] const ClassInfo &Info() const noexcept { return *m_info; }
    [[nodiscard]] Depth ConcreteDepth() const noexcept { return m_info->depth; }

    template <class Target>
      requires CastTarget<P, Target> && Upcastable<Class, CastClass<P, Target>>
    [[nodiscard]] Handle<CastPointer<P, Target>> Upcast() && noexcept
    {
      using To = CastPointer<P, Target>;
      typename PointerTraits<To>::Raw raw = std::exchange(m_ptr, nullptr);
      return Handle<To>{raw, m_info};
    }

    // On mismatch the untouched handle comes back as the error.
    template <class Target>
      requires CastTarget<P, Target> && Upcastable<CastClass<P, Target>, Class>
    [[nodiscard]] std::expected<Handle<CastPointer<P, Target>>, Handle> Downcast() && noexcept
    {
      using To = CastPointer<P, Target>;
      using ToRaw = typename PointerTraits<To>::Raw;
      if (!Matches(ClassKeyOf<CastClass<P, Target>>()))
        return std::unexpected(std::move(*this));
      auto raw = static_cast<ToRaw>(std::exchange(m_ptr, nullptr));
      return Handle<To>{raw, m_info};
    }

    template <class U>
      requires Upcastable<U, Class>
    [[nodiscard]] std::optional<Handle<const U *>> DowncastRef() const noexcept
    {
      if (!Matches(ClassKeyOf<U>()))
        return std::nullopt;
      return Handle<const U *>{static_cast<const U *>(m_ptr), m_info};
    }

    template <class U>
      requires Upcastable<U, Class> && IsMutable
    [[nodiscard]] std::optional<Handle<U *>> DowncastMut() noexcept
    {
      if (!Matches(ClassKeyOf<U>()))
        return std::nullopt;
      return Handle<U *>{static_cast<U *>(m_ptr), m_info};
    }

    template <class U>
      requires Upcastable<U, Class>
    [[nodiscard]] bool Is() const noexcept
    {
      return Matches(ClassKeyOf<U>());
    }

    // View of the object at this handle's static level, as the concrete class's table defines it.
    [[nodiscard]] ViewRef<const Dyn> DynamicView() const
    {
      return ViewRef<const Dyn>{Dispatch()};
    }

    [[nodiscard]] ViewRef<Dyn> DynamicViewMut()
      requires IsMutable
    {
      return ViewRef<Dyn>{Dispatch()};
    }

    [[nodiscard]] P IntoPointer() && noexcept
      requires(!IsOwning)
    {
      return Traits::FromRaw(std::exchange(m_ptr, nullptr));
    }

    // Only succeeds while the static class is the concrete one, so the unique_ptr deletes the right type.
    [[nodiscard]] std::expected<P, Handle> IntoPointer() && noexcept
      requires IsOwning
    {
      if (m_info->key != ClassKeyOf<Class>())
        return std::unexpected(std::move(*this));
      return Traits::FromRaw(std::exchange(m_ptr, nullptr));
    }

  private:
    template <ObjectPointer>
    friend class Handle;

    Handle(Raw raw, const ClassInfo *info) noexcept
        : m_ptr(raw),
          m_info(info)
    {
    }

    [[nodiscard]] bool Matches(ClassKey key) const noexcept
    {
      return m_ptr != nullptr && m_info->downable(key);
    }

    [[nodiscard]] Dyn Dispatch() const
    {
      const auto offset = static_cast<NGIN::UIntSize>(m_info->depth - StaticDepth);
      const auto convert = *static_cast<const Converter<Class> *>(m_info->vtable[offset]);
      return convert(const_cast<Class *>(m_ptr));
    }

    void Reset() noexcept
    {
      if constexpr (IsOwning)
      {
        if (m_ptr != nullptr)
          m_info->destroy(m_ptr);
      }
      m_ptr = nullptr;
    }

    Raw m_ptr{nullptr};
    const ClassInfo *m_info{nullptr};
  };

  template <ObjectPointer P>
    requires requires(std::ostream &os, const typename Handle<P>::Element &e) { os << e; }
  std::ostream &operator<<(std::ostream &os, const Handle<P> &handle)
  {
    return os << *handle;
  }

} // namespace NGIN::Hierarchy
