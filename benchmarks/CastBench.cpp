#include <iostream>
#include <memory>
#include <utility>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Hierarchy/Hierarchy.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct A : Hierarchy::Extends<A, Hierarchy::Object>
  {
  };
  struct B : Hierarchy::Extends<B, A>
  {
  };
  struct C : Hierarchy::Extends<C, B>
  {
  };
  struct D : Hierarchy::Extends<D, C>
  {
    int n{1};
  };
  struct Other : Hierarchy::Extends<Other, A>
  {
  };
}

int main()
{
  using namespace NGIN::Hierarchy;
  using namespace BenchDemo;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    D d{};
    ctx.start();
    int hits = 0;
    for (int i=0;i<100000;++i) {
      auto root = Handle<D *>{&d}.Upcast<Object>();
      auto back = std::move(root).Downcast<D>();
      hits += back ? (*back)->n : 0;
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "Upcast+Downcast depth 4 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    D d{};
    auto a = Handle<D *>{&d}.Upcast<A>();
    ctx.start();
    int misses = 0;
    for (int i=0;i<100000;++i) {
      misses += a.Is<Other>() ? 0 : 1;
    }
    ctx.doNotOptimize(misses);
    ctx.stop(); }, "Rejected Is<Other> 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    D d{};
    A *a = &d;
    ctx.doNotOptimize(a);
    ctx.start();
    int hits = 0;
    for (int i=0;i<100000;++i) {
      hits += static_cast<D *>(a)->n;
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "Unchecked static_cast 100k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int alive = 0;
    for (int i=0;i<10000;++i) {
      auto root = Handle<std::unique_ptr<D>>{std::make_unique<D>()}.Upcast<Object>();
      alive += root ? 1 : 0;
    }
    ctx.doNotOptimize(alive);
    ctx.stop(); }, "Owning handle create+destroy 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
