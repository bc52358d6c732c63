#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <NGIN/FFI/FFI.hpp>

using namespace NGIN;

int main()
{
  using namespace NGIN::FFI;

  auto params = std::make_shared<ValueList>();
  for (int i = 0; i < 6; ++i)
    params->PushBack(GetBuiltinType(i % 2 ? NativeType::Pointer : NativeType::Int64));
  const auto ret = GetBuiltinType(NativeType::Int32);

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int built = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto r = MakeCallback(ret, params);
                          built += (r && r->IsAvailable()) ? 1 : 0;
                        }
                        ctx.doNotOptimize(built);
                        ctx.stop(); }, "MakeCallback 6 params 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        auto bad = std::make_shared<ValueList>();
                        bad->PushBack(GetBuiltinType(NativeType::Int32));
                        bad->PushBack(std::make_shared<ValueList>());
                        ctx.start();
                        int rejected = 0;
                        for (int i = 0; i < N; ++i)
                          rejected += MakeCallback(ret, bad).has_value() ? 0 : 1;
                        ctx.doNotOptimize(rejected);
                        ctx.stop(); }, "MakeCallback rejection 10k");

  auto cb = MakeCallback(ret, params)->Descriptor();
  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        std::size_t total = 0;
                        for (int i = 0; i < N; ++i)
                          total += cb->Render().size();
                        ctx.doNotOptimize(total);
                        ctx.stop(); }, "Render 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
