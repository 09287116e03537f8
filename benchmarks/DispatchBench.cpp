#include <iostream>
#include <NGIN/Benchmark.hpp>
#include <TypeLoom/Runtime/Runtime.hpp>

#include <cstdint>
#include <string>

using namespace NGIN;

namespace DispatchBench
{
  using namespace TypeLoom::Runtime;

  MethodBody Constant(std::int32_t value)
  {
    return [value](const CallFrame &) -> std::expected<Any, Error> { return Any{value}; };
  }

  // Bench.Base { Value(); Pick(Int32); Pick(String) }, Bench.Derived : Base { Value() }
  LoadUnit Declare()
  {
    auto u = DeclareLoadUnit("Bench.Lib").value();
    (void)u.Declare(TypeDeclaration::Class("Bench.Base"),
                    [](TypeBuilder &b)
                    {
                      b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {}}, Constant(0));
                      b.method(MemberFlags::Public, "Value", MethodSignature{b.ref("System.Int32"), {}}, Constant(1));
                      b.method(MemberFlags::Public, "Pick", MethodSignature{b.ref("System.Int32"), {b.ref("System.Int32")}}, Constant(2));
                      b.method(MemberFlags::Public, "Pick", MethodSignature{b.ref("System.Int32"), {b.ref("System.String")}}, Constant(3));
                    });
    (void)u.Declare(TypeDeclaration::Class("Bench.Derived").base(u.Ref("Bench.Base")),
                    [](TypeBuilder &b)
                    {
                      b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {}}, Constant(0));
                      b.method(MemberFlags::Public, "Value", MethodSignature{b.ref("System.Int32"), {}}, Constant(4));
                    });
    u.Seal();
    return u;
  }
} // namespace DispatchBench

int main()
{
  using namespace TypeLoom::Runtime;

  auto unit = DispatchBench::Declare();
  auto derived = unit.GetType("Bench.Derived").value();
  auto instance = derived.CreateInstance().value();
  const MethodSignature value{unit.Ref("System.Int32"), {}};

  constexpr int N = 10000;

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        std::int64_t sum = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto r = Invoke(instance, "Value");
                          sum += r ? r->Cast<std::int32_t>() : 0;
                        }
                        ctx.doNotOptimize(sum);
                        ctx.stop(); }, "Invoke(name) 10k virtual");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        std::int64_t sum = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto r = CallVirtual(instance, "Value", value);
                          sum += r ? r->Cast<std::int32_t>() : 0;
                        }
                        ctx.doNotOptimize(sum);
                        ctx.stop(); }, "CallVirtual(signature) 10k");

  const Any stringArg[1] = {Any{std::string{"x"}}};
  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        std::int64_t sum = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto r = Invoke(instance, "Pick", stringArg);
                          sum += r ? r->Cast<std::int32_t>() : 0;
                        }
                        ctx.doNotOptimize(sum);
                        ctx.stop(); }, "Invoke(name) 10k overloaded");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
                        ctx.start();
                        int misses = 0;
                        for (int i = 0; i < N; ++i)
                        {
                          auto t = GetTypeByName("Bench.Missing");
                          misses += t.has_value() ? 0 : 1;
                        }
                        ctx.doNotOptimize(misses);
                        ctx.stop(); }, "GetTypeByName 10k misses");

  auto results = NGIN::Benchmark::RunAll<Milliseconds>();
  NGIN::Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
