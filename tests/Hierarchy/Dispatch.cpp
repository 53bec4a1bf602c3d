// Dispatch.cpp — level views chosen by the concrete class's table

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Hierarchy/Hierarchy.hpp>

#include "Zoo.hpp"

#include <concepts>
#include <memory>
#include <sstream>
#include <string_view>
#include <type_traits>
#include <utility>

namespace DispatchDemo
{
  // Mutable view: bumps the counter by the concrete class's step.
  class CounterView
  {
  public:
    template <class T>
    explicit CounterView(T *self) noexcept
        : m_value(&self->value),
          m_step(T::Step)
    {
    }

    void Bump() noexcept { *m_value += m_step; }
    [[nodiscard]] int Value() const noexcept { return *m_value; }
    [[nodiscard]] int Step() const noexcept { return m_step; }

  private:
    int *m_value{nullptr};
    int m_step{0};
  };

  struct Counter : NGIN::Hierarchy::Extends<Counter, NGIN::Hierarchy::Object>
  {
    using Dyn = CounterView;
    static constexpr int Step = 1;

    int value{0};
  };

  struct DoubleCounter : NGIN::Hierarchy::Extends<DoubleCounter, Counter>
  {
    static constexpr int Step = 2;

    friend constexpr void NginVirtual(NGIN::Hierarchy::Tag<DoubleCounter>, NGIN::Hierarchy::TableBuilder<DoubleCounter> &b)
    {
      b.Override<Counter>();
    }
  };

  struct Labelled : NGIN::Hierarchy::Extends<Labelled, NGIN::Hierarchy::Object>
  {
    std::string_view label{"unnamed"};

    friend std::ostream &operator<<(std::ostream &os, const Labelled &l) { return os << "Labelled(" << l.label << ')'; }
  };

  // Hand-written Animal-level converter installed from inside the class.
  struct Parrot : NGIN::Hierarchy::Extends<Parrot, Zoo::Animal>
  {
    std::string_view Speak() const { return "hello"; }

    static Zoo::AnimalView AsAnimal(Parrot *self)
    {
      return Zoo::AnimalView{self, [](const void *) -> std::string_view { return "squawk"; }};
    }

    friend constexpr void NginVirtual(NGIN::Hierarchy::Tag<Parrot>, NGIN::Hierarchy::TableBuilder<Parrot> &b)
    {
      b.OverrideWith<Zoo::Animal, &Parrot::AsAnimal>();
    }
  };

  // Dog-level converter installed from outside through DescribeTable.
  struct Fox : NGIN::Hierarchy::Extends<Fox, Zoo::Dog>
  {
    std::string_view Speak() const { return "yap"; }
  };

  inline Zoo::AnimalView FoxAsDog(Fox *self)
  {
    return Zoo::AnimalView{self, [](const void *) -> std::string_view { return "ring-ding-ding"; }};
  }

  template <class H>
  concept HasMutableView = requires(H &h) { h.DynamicViewMut(); };

  template <class V>
  concept CanBump = requires(V &v) { v->Bump(); };
} // namespace DispatchDemo

namespace NGIN::Hierarchy
{
  template <>
  struct DescribeTable<DispatchDemo::Fox>
  {
    static constexpr void Do(TableBuilder<DispatchDemo::Fox> &b) { b.OverrideWith<Zoo::Dog, &DispatchDemo::FoxAsDog>(); }
  };
} // namespace NGIN::Hierarchy

namespace
{
  using namespace NGIN::Hierarchy;
  using DispatchDemo::CanBump;
  using DispatchDemo::Counter;
  using DispatchDemo::CounterView;
  using DispatchDemo::HasMutableView;

  static_assert(HasMutableView<Handle<Counter *>>);
  static_assert(HasMutableView<Handle<std::unique_ptr<Counter>>>);
  static_assert(!HasMutableView<Handle<const Counter *>>);

  static_assert(CanBump<ViewRef<CounterView>>);
  static_assert(!CanBump<ViewRef<const CounterView>>);

  static_assert(std::same_as<Handle<Zoo::Dog *>::Dyn, Zoo::AnimalView>);
  static_assert(std::same_as<Handle<Object *>::Dyn, ObjectView>);
} // namespace

TEST_CASE("UpcastDogStillBarks", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;
  using namespace Zoo;

  Dog d{};
  auto animal = Handle<Dog *>{&d}.Upcast<Animal>();

  auto view = animal.DynamicView();
  CHECK(view->Speak() == "bark");
  CHECK(view->Self() == static_cast<const void *>(&d));
}

TEST_CASE("PlainAnimalUsesItsOwnView", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;
  using namespace Zoo;

  Animal a{};
  Handle<Animal *> h{&a};
  CHECK(h.DynamicView()->Speak() == "generic sound");
}

TEST_CASE("ClassWithoutOverridesKeepsTheInheritedView", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;
  using namespace Zoo;

  Cat c{};
  Handle<Cat *> own{&c};
  CHECK(own.DynamicView()->Speak() == "meow");

  auto animal = std::move(own).Upcast<Animal>();
  CHECK(animal.DynamicView()->Speak() == "generic sound");
}

TEST_CASE("EachLevelDispatchesThroughItsSlot", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;
  using namespace Zoo;

  Puppy p{};
  const Puppy *cp = &p;

  Handle<const Puppy *> puppy{cp};
  CHECK(puppy.DynamicView()->Speak() == "yip");

  auto dog = std::move(puppy).Upcast<Dog>();
  CHECK(dog.DynamicView()->Speak() == "bark");

  auto animal = std::move(dog).Upcast<Animal>();
  CHECK(animal.DynamicView()->Speak() == "bark");

  auto back = std::move(animal).Downcast<Puppy>();
  REQUIRE(back.has_value());
  CHECK(back->DynamicView()->Speak() == "yip");
}

TEST_CASE("CustomConvertersDispatchAfterUpcast", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;
  using namespace DispatchDemo;

  Parrot p{};
  Handle<Parrot *> parrot{&p};
  CHECK(parrot.DynamicView()->Speak() == "hello");
  auto asAnimal = std::move(parrot).Upcast<Zoo::Animal>();
  CHECK(asAnimal.DynamicView()->Speak() == "squawk");

  Fox f{};
  Handle<const Fox *> fox{&f};
  CHECK(fox.DynamicView()->Speak() == "yap");
  auto asDog = std::move(fox).Upcast<Zoo::Dog>();
  CHECK(asDog.DynamicView()->Speak() == "ring-ding-ding");
  auto foxAsAnimal = std::move(asDog).Upcast<Zoo::Animal>();
  CHECK(foxAsAnimal.DynamicView()->Speak() == "bark");

  auto backToFox = std::move(foxAsAnimal).Downcast<Fox>();
  REQUIRE(backToFox.has_value());
  CHECK(backToFox->DynamicView()->Speak() == "yap");
}

TEST_CASE("MutableViewsChangeTheObject", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;
  using namespace DispatchDemo;

  DoubleCounter dc{};
  auto counter = Handle<DoubleCounter *>{&dc}.Upcast<Counter>();

  auto view = counter.DynamicViewMut();
  CHECK(view->Step() == 2);
  view->Bump();
  view->Bump();
  CHECK(dc.value == 4);
  CHECK(counter.DynamicView()->Value() == 4);

  Counter plain{};
  Handle<Counter *> single{&plain};
  single.DynamicViewMut()->Bump();
  CHECK(plain.value == 1);
}

TEST_CASE("RootLevelYieldsTheEmptyView", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;

  Zoo::Dog d{};
  auto root = Handle<Zoo::Dog *>{&d}.Upcast<Object>();
  static_assert(std::same_as<decltype(root.DynamicView()), ViewRef<const ObjectView>>);
  [[maybe_unused]] auto view = root.DynamicView();
  static_assert(std::same_as<std::remove_cvref_t<decltype(*view)>, ObjectView>);
  CHECK(root.ConcreteDepth() == 2);
}

TEST_CASE("HandlesStreamTheirObject", "[hierarchy][Dispatch]")
{
  using namespace NGIN::Hierarchy;
  using DispatchDemo::Labelled;

  Labelled l{};
  l.label = "front door";
  Handle<Labelled *> h{&l};

  std::ostringstream os;
  os << h;
  CHECK(os.str() == "Labelled(front door)");
}
