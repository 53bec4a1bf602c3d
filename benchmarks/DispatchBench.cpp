#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Hierarchy/Hierarchy.hpp>

using namespace NGIN;

namespace BenchDemo
{
  class ValueView
  {
  public:
    template <class T>
    explicit ValueView(T *self) noexcept
        : m_self(self),
          m_value([](const void *p) { return static_cast<const T *>(p)->Value(); })
    {
    }

    int Value() const { return m_value(m_self); }

  private:
    const void *m_self;
    int (*m_value)(const void *);
  };

  struct Base : Hierarchy::Extends<Base, Hierarchy::Object>
  {
    using Dyn = ValueView;
    int Value() const { return 1; }
  };

  struct Mid : Hierarchy::Extends<Mid, Base>
  {
    int Value() const { return 2; }
    friend constexpr void NginVirtual(Hierarchy::Tag<Mid>, Hierarchy::TableBuilder<Mid> &b) { b.Override<Base>(); }
  };

  struct Leaf : Hierarchy::Extends<Leaf, Mid>
  {
    int n{3};
    int Value() const { return n; }
    friend constexpr void NginVirtual(Hierarchy::Tag<Leaf>, Hierarchy::TableBuilder<Leaf> &b) { b.Override<Base, Mid>(); }
  };

  // Baseline with C++ virtual functions.
  struct VBase
  {
    virtual ~VBase() = default;
    virtual int Value() const { return 1; }
  };
  struct VLeaf : VBase
  {
    int n{3};
    int Value() const override { return n; }
  };
}

int main()
{
  using namespace NGIN::Hierarchy;
  using BenchDemo::Base;
  using BenchDemo::Leaf;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Leaf leaf{};
    auto h = Handle<Leaf *>{&leaf}.Upcast<Base>();
    ctx.start();
    int sum = 0;
    for (int i=0;i<100000;++i) {
      sum += h.DynamicView()->Value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Handle DynamicView Value 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Leaf leaf{};
    ctx.start();
    int sum = 0;
    for (int i=0;i<100000;++i) {
      sum += TableOf<Leaf>.ConverterFor<Base>()(&leaf).Value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Static table lookup Value 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    BenchDemo::VLeaf leaf{};
    const BenchDemo::VBase *base = &leaf;
    ctx.doNotOptimize(base);
    ctx.start();
    int sum = 0;
    for (int i=0;i<100000;++i) {
      sum += base->Value();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "C++ virtual Value 100k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
