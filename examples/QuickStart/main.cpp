#include <NGIN/Hierarchy/Hierarchy.hpp>

#include <iostream>
#include <string_view>
#include <utility>

namespace Demo
{
  class ShapeView
  {
  public:
    template <class T>
    explicit ShapeView(T *self) noexcept
        : m_self(self),
          m_area([](const void *p) { return static_cast<const T *>(p)->Area(); })
    {
    }

    double Area() const { return m_area(m_self); }

  private:
    const void *m_self;
    double (*m_area)(const void *);
  };

  struct Shape : NGIN::Hierarchy::Extends<Shape, NGIN::Hierarchy::Object>
  {
    using Dyn = ShapeView;
    double Area() const { return 0.0; }
  };

  struct Square : NGIN::Hierarchy::Extends<Square, Shape>
  {
    double side{2.0};
    double Area() const { return side * side; }

    friend constexpr void NginVirtual(NGIN::Hierarchy::Tag<Square>, NGIN::Hierarchy::TableBuilder<Square> &b)
    {
      b.Override<Shape>();
    }
  };
}

int main()
{
  using namespace NGIN::Hierarchy;
  std::cout << "Library: " << LibraryName() << "\n";

  Demo::Square sq{};
  sq.side = 3.0;

  // Upcast is free; the handle remembers the concrete class.
  auto shape = Handle<Demo::Square *>{&sq}.Upcast<Demo::Shape>();
  std::cout << "chain: " << DescribeChain(shape.Info()) << "\n";
  std::cout << "area through Shape: " << shape.DynamicView()->Area() << "\n";

  auto back = std::move(shape).Downcast<Demo::Square>();
  if (back)
    std::cout << "downcast ok, side = " << (*back)->side << "\n";

  return 0;
}
