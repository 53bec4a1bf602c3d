#include <NGIN/Hierarchy/Hierarchy.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <iostream>
#include <string_view>
#include <utility>

namespace Demo
{
  class GreeterView
  {
  public:
    GreeterView(const void *self, std::string_view (*greet)(const void *)) noexcept
        : m_self(self),
          m_greet(greet)
    {
    }

    template <class T>
    explicit GreeterView(T *self) noexcept
        : GreeterView(self, [](const void *p) { return static_cast<const T *>(p)->Greet(); })
    {
    }

    std::string_view Greet() const { return m_greet(m_self); }

  private:
    const void *m_self;
    std::string_view (*m_greet)(const void *);
  };

  struct Greeter : NGIN::Hierarchy::Extends<Greeter, NGIN::Hierarchy::Object>
  {
    using Dyn = GreeterView;
    std::string_view Greet() const { return "hello"; }
  };

  // Shows its own greeting at the Greeter level too.
  struct Formal : NGIN::Hierarchy::Extends<Formal, Greeter>
  {
    std::string_view Greet() const { return "good evening"; }

    friend constexpr void NginVirtual(NGIN::Hierarchy::Tag<Formal>, NGIN::Hierarchy::TableBuilder<Formal> &b)
    {
      b.Override<Greeter>();
    }
  };

  // Keeps its own greeting to itself.
  struct Shy : NGIN::Hierarchy::Extends<Shy, Greeter>
  {
    std::string_view Greet() const { return "..."; }
  };

  // Installs a hand-written converter for the Greeter level.
  struct Pirate : NGIN::Hierarchy::Extends<Pirate, Greeter>
  {
    std::string_view Greet() const { return "ahoy"; }

    static GreeterView Loud(Pirate *self)
    {
      return GreeterView{self, [](const void *) -> std::string_view { return "AHOY!"; }};
    }
  };
}

namespace NGIN::Hierarchy
{
  template <>
  struct DescribeTable<Demo::Pirate>
  {
    static constexpr void Do(TableBuilder<Demo::Pirate> &b) { b.OverrideWith<Demo::Greeter, &Demo::Pirate::Loud>(); }
  };
}

template <class C>
void Show(C &obj)
{
  using namespace NGIN::Hierarchy;
  auto own = Handle<C *>{&obj};
  std::cout << NGIN::Meta::TypeName<C>::unqualifiedName << ": own=" << own.DynamicView()->Greet();
  auto asGreeter = std::move(own).template Upcast<Demo::Greeter>();
  std::cout << " as Greeter=" << asGreeter.DynamicView()->Greet() << "\n";
}

int main()
{
  Demo::Formal f{};
  Demo::Shy s{};
  Demo::Pirate p{};
  Show(f);
  Show(s);
  Show(p);
  return 0;
}
