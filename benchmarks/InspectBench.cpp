#include <iostream>
#include <string>
#include <vector>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Inspect/Inspect.hpp>

using namespace NGIN;

namespace BenchDemo
{
  struct Vec2
  {
    float x, y;
    friend void NginReflect(Inspect::Tag<Vec2>, Inspect::TypeBuilder<Vec2> &b)
    {
      b.Field<&Vec2::x>("x");
      b.Field<&Vec2::y>("y");
    }
  };
  struct Obj
  {
    int n{0};
    Vec2 p{1.0f, 2.0f};
    std::vector<int> samples{};
    int add(int v) const { return n + v; }
    friend void NginReflect(Inspect::Tag<Obj>, Inspect::TypeBuilder<Obj> &b)
    {
      b.Field<&Obj::n>("n");
      b.Field<&Obj::p>("p");
      b.Field<&Obj::samples>("samples");
      b.Method<&Obj::add>("add", {"v"});
    }
  };
}

int main()
{
  using BenchDemo::Obj;

  Obj obj{5};
  obj.samples.assign(1000, 3);
  auto table = Inspect::Dynamic::MakeMap();
  for (int i = 0; i < 200; ++i)
    table->Set("k" + std::to_string(i), Inspect::Dynamic::MakeList({i, i + 1, i + 2}));

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Inspect::Manager manager{};
    ctx.start();
    std::size_t nodes = 0;
    for (int i=0;i<10000;++i) {
      auto node = manager.Inspect("obj", obj).value();
      nodes += node.children.size();
    }
    ctx.doNotOptimize(nodes);
    ctx.stop(); }, "Inspect composite depth 2 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Inspect::Manager manager{Inspect::InspectOptions{3, 1000}};
    ctx.start();
    std::size_t nodes = 0;
    for (int i=0;i<100;++i) {
      auto node = manager.Inspect("table", table).value();
      nodes += node.children.size();
    }
    ctx.doNotOptimize(nodes);
    ctx.stop(); }, "Inspect dynamic map 200x3 100");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Inspect::Manager manager{};
    ctx.start();
    std::size_t bytes = 0;
    for (int i=0;i<10000;++i) {
      bytes += manager.Format("obj", obj).value().size();
    }
    ctx.doNotOptimize(bytes);
    ctx.stop(); }, "Format composite as text 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    std::size_t total = 0;
    for (int i=0;i<20000;++i) {
      total += Inspect::GetType<Obj>().MemberCount();
    }
    ctx.doNotOptimize(total);
    ctx.stop(); }, "GetType<Obj> lookup 20k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
