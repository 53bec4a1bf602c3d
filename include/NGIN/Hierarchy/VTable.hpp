// VTable.hpp
// Layered dispatch tables: one converter slot per hierarchy level
#pragma once

#include <NGIN/Primitives.hpp>

#include <NGIN/Hierarchy/Class.hpp>
#include <NGIN/Hierarchy/Types.hpp>

#include <array>
#include <concepts>
#include <type_traits>

namespace NGIN::Hierarchy
{

  template <HierarchyClass L>
  using DynOf = typename L::Dyn;

  // Turns a pointer to a level's class into that level's dynamic view.
  template <HierarchyClass L>
  using Converter = DynOf<L> (*)(L *);

  // Type-erased slot. Always points at a constexpr Converter<L> for the slot's level.
  using Slot = const void *;

  template <class L, class Impl>
  concept ViewConstructibleFrom = HierarchyClass<L> && Upcastable<Impl, L> && std::constructible_from<DynOf<L>, Impl *>;

  namespace detail
  {
    template <class L, class Impl>
    DynOf<L> DefaultConvert(L *self)
    {
      return DynOf<L>(static_cast<Impl *>(self));
    }

    template <class L, class Impl, auto Fn>
    DynOf<L> CustomConvert(L *self)
    {
      return Fn(static_cast<Impl *>(self));
    }

    template <class L, Converter<L> Fn>
    inline constexpr Converter<L> SlotEntry = Fn;

    // Not constexpr: reaching it while building a table aborts constant evaluation.
    inline void MissingOwnLevelConverter() {}
  } // namespace detail

  /**
   * Dispatch table of class C. Slot 0 is C's own level, slot k is the level at
   * depth DepthOf<C> - k. Slots 1..DepthOf<C> start out as the parent's table.
   */
  template <HierarchyClass C>
  struct VTable
  {
    static constexpr NGIN::UIntSize SlotCount = NGIN::UIntSize{DepthOf<C>} + 1;

    std::array<Slot, SlotCount> slots{};

    [[nodiscard]] constexpr const Slot *Data() const noexcept { return slots.data(); }

    // Slot holding the converter for the level at `depth`; depth must not exceed DepthOf<C>.
    [[nodiscard]] constexpr Slot SlotFor(Depth depth) const noexcept { return slots[DepthOf<C> - depth]; }

    template <HierarchyClass L>
      requires Upcastable<C, L>
    [[nodiscard]] Converter<L> ConverterFor() const noexcept
    {
      return *static_cast<const Converter<L> *>(SlotFor(DepthOf<L>));
    }
  };

  template <HierarchyClass C>
  class TableBuilder;

  // Optional external customization point for classes you cannot modify.
  // Specialize in namespace NGIN::Hierarchy:
  // template<> struct DescribeTable<MyType> { static constexpr void Do(TableBuilder<MyType>&); };
  template <class T>
  struct DescribeTable;

  template <class C>
  concept HasNginVirtualWithTableBuilder = requires(TableBuilder<C> &b) {
    // ADL friend should be declared as: friend constexpr void NginVirtual(Tag<C>, TableBuilder<C>&)
    { NginVirtual(Tag<C>{}, b) } -> std::same_as<void>;
  };

  template <class C>
  concept HasDescribeTable = requires(TableBuilder<C> &b) {
    { DescribeTable<C>::Do(b) } -> std::same_as<void>;
  };

  namespace detail
  {
    template <HierarchyClass C>
    consteval VTable<C> BuildTable();
  }

  template <HierarchyClass C>
  inline constexpr VTable<C> TableOf = detail::BuildTable<C>();

  template <HierarchyClass C>
  class TableBuilder
  {
  public:
    constexpr TableBuilder() noexcept
    {
      if constexpr (ViewConstructibleFrom<C, C>)
        m_table.slots[0] = &detail::SlotEntry<C, &detail::DefaultConvert<C, C>>;

      if constexpr (!RootClass<C>)
      {
        const auto &parent = TableOf<ParentOf<C>>;
        for (NGIN::UIntSize i = 0; i < parent.slots.size(); ++i)
          m_table.slots[i + 1] = parent.slots[i];
      }
    }

    // Rebuild the views of the given levels from C, so C's behaviour shows at those levels.
    template <class... Levels>
      requires(ViewConstructibleFrom<Levels, C> && ...)
    constexpr TableBuilder &Override() noexcept
    {
      ((m_table.slots[DepthOf<C> - DepthOf<Levels>] = &detail::SlotEntry<Levels, &detail::DefaultConvert<Levels, C>>), ...);
      return *this;
    }

    // Install Fn(C *) -> Level::Dyn as the converter for Level.
    template <class Level, auto Fn>
      requires Upcastable<C, Level> && std::is_invocable_r_v<DynOf<Level>, decltype(Fn), C *>
    constexpr TableBuilder &OverrideWith() noexcept
    {
      m_table.slots[DepthOf<C> - DepthOf<Level>] = &detail::SlotEntry<Level, &detail::CustomConvert<Level, C, Fn>>;
      return *this;
    }

    [[nodiscard]] constexpr VTable<C> Build() const
    {
      if (m_table.slots[0] == nullptr)
        detail::MissingOwnLevelConverter();
      return m_table;
    }

  private:
    VTable<C> m_table{};
  };

  namespace detail
  {
    template <HierarchyClass C>
    consteval VTable<C> BuildTable()
    {
      TableBuilder<C> b{};
      if constexpr (HasNginVirtualWithTableBuilder<C>)
        NginVirtual(Tag<C>{}, b); // ADL: class describes its overrides
      else if constexpr (HasDescribeTable<C>)
        NGIN::Hierarchy::DescribeTable<C>::Do(b);
      return b.Build();
    }
  } // namespace detail

} // namespace NGIN::Hierarchy
