// Externals.cpp - tests for native member implementations and placeholder stubs

#include <catch2/catch_test_macros.hpp>

#include <TypeLoom/Runtime/Runtime.hpp>

#include "TestSink.hpp"

#include <cstdint>
#include <string>

namespace ExternalsDemo
{
  using namespace TypeLoom::Runtime;

  MethodBody Returns(std::string text)
  {
    return [text](const CallFrame &) -> std::expected<Any, Error> { return Any{text}; };
  }
} // namespace ExternalsDemo

TEST_CASE("ExternalsSupplyNativeBodies", "[runtime][Externals]")
{
  using namespace TypeLoom::Runtime;
  const auto statics = MemberFlags::Public | MemberFlags::Static;

  // Registered before the type exists; applied when it is constructed.
  auto registered = ImplementExternals("Ext.Math",
                                       [statics](ExternalsBuilder &eb)
                                       {
                                         auto unit = eb.self().GetLoadUnit();
                                         eb.method(statics, "Twice", MethodSignature{unit.Ref("System.Int32"), {unit.Ref("System.Int32")}},
                                                   [](const CallFrame &f) -> std::expected<Any, Error>
                                                   { return Any{f.arguments[0].Cast<std::int32_t>() * 2}; });
                                         eb.method(statics, "Name", MethodSignature{unit.Ref("System.String"), {}},
                                                   ExternalsDemo::Returns("native"));
                                         eb.raw_method(statics, "Helper", ExternalsDemo::Returns("helper"));
                                       });
  REQUIRE(registered.has_value());

  auto u = DeclareLoadUnit("Ext.Lib").value();
  (void)u.Declare(TypeDeclaration::Class("Ext.Math"),
                  [statics](TypeBuilder &b)
                  {
                    b.external_method(statics, "Twice", MethodSignature{b.ref("System.Int32"), {b.ref("System.Int32")}});
                    b.method(statics, "Name", MethodSignature{b.ref("System.String"), {}}, ExternalsDemo::Returns("declared"));
                  });
  u.Seal();

  auto math = u.GetType("Ext.Math").value();
  CHECK(math.InvokeStatic<std::int32_t>("Twice", std::int32_t{21}).value() == 42);
  // A native implementation wins over the declared body.
  CHECK(math.InvokeStatic<std::string>("Name").value() == "native");
  CHECK(math.InvokeStatic<std::string>("Helper").value() == "helper");

  auto twice = math.GetMethod("Twice");
  REQUIRE(twice.has_value());
  CHECK_FALSE(twice->IsPlaceholder());
}

TEST_CASE("MissingExternalIsNotImplemented", "[runtime][Externals]")
{
  using namespace TypeLoom::Runtime;

  auto u = DeclareLoadUnit("ExtMissing.Lib").value();
  (void)u.Declare(TypeDeclaration::Class("ExtMissing.Native"),
                  [](TypeBuilder &b)
                  {
                    b.external_method(MemberFlags::Public | MemberFlags::Static, "Compute", MethodSignature{b.ref("System.Int32"), {}});
                  });
  u.Seal();

  auto native = u.GetType("ExtMissing.Native").value();
  auto compute = native.GetMethod("Compute");
  REQUIRE(compute.has_value());
  CHECK(compute->IsPlaceholder());

  auto r = native.CallStatic("Compute");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::NotImplemented);
  CHECK(r.error().message == "The external method 'ExtMissing.Native.Compute' of type 'ExtMissing.Native' has not been implemented.");
}

TEST_CASE("PlaceholderFallsBackToBase", "[runtime][Externals]")
{
  using namespace TypeLoom::Runtime;

  auto u = DeclareLoadUnit("ExtFallback.Lib").value();
  (void)u.Declare(TypeDeclaration::Class("ExtFallback.Shape"),
                  [](TypeBuilder &b)
                  {
                    b.method(MemberFlags::Public, "Describe", MethodSignature{b.ref("System.String"), {}}, ExternalsDemo::Returns("shape"));
                  });
  (void)u.Declare(TypeDeclaration::Class("ExtFallback.Circle").base(u.Ref("ExtFallback.Shape")),
                  [](TypeBuilder &b)
                  {
                    b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {}}, ExternalsDemo::Returns("ctor"));
                    b.external_method(MemberFlags::Public, "Describe", MethodSignature{b.ref("System.String"), {}});
                  });
  u.Seal();

  auto circle = u.GetType("ExtFallback.Circle").value().CreateInstance().value();
  const MethodSignature describe{u.Ref("System.String"), {}};

  {
    TypeLoomTests::ScopedSink sink;
    // The signature slot is the placeholder itself, which forwards to the base body.
    auto r = CallVirtual(circle, "Describe", describe);
    REQUIRE(r.has_value());
    CHECK(r->Cast<std::string>() == "shape");
    CHECK(sink.Count(ErrorCode::PlaceholderFallback) == 1);
    CHECK(sink.HasMessage("ExtFallback.Circle.Describe"));

    // By name the group already prefers the implemented base overload.
    sink.Clear();
    CHECK(InvokeAs<std::string>(circle, "Describe").value() == "shape");
    CHECK_FALSE(sink.Has(ErrorCode::PlaceholderFallback));
  }

  {
    RuntimeOptions options = GetRuntimeOptions();
    options.warnOnPlaceholderFallback = false;
    TypeLoomTests::ScopedOptions scoped{options};
    TypeLoomTests::ScopedSink sink;
    CHECK(CallVirtual(circle, "Describe", describe).value().Cast<std::string>() == "shape");
    CHECK_FALSE(sink.Has(ErrorCode::PlaceholderFallback));
  }
}

TEST_CASE("ExternalsReachConstructedTypes", "[runtime][Externals]")
{
  using namespace TypeLoom::Runtime;

  auto u = DeclareLoadUnit("ExtPending.Lib").value();
  auto binding = u.Declare(TypeDeclaration::Class("ExtPending.Clock"),
                           [](TypeBuilder &b)
                           {
                             b.external_method(MemberFlags::Public | MemberFlags::Static, "Now", MethodSignature{b.ref("System.Int64"), {}});
                           });
  REQUIRE(binding.has_value());
  auto constructed = binding->Get();
  REQUIRE(constructed.has_value());
  CHECK_FALSE(constructed->IsInitialized());

  auto registered = ImplementExternals("ExtPending.Clock",
                                       [](ExternalsBuilder &eb)
                                       {
                                         auto unit = eb.self().GetLoadUnit();
                                         eb.method(MemberFlags::Public | MemberFlags::Static, "Now", MethodSignature{unit.Ref("System.Int64"), {}},
                                                   [](const CallFrame &) -> std::expected<Any, Error> { return Any{std::int64_t{1234}}; });
                                       });
  REQUIRE(registered.has_value());

  u.Seal();
  auto clock = u.GetType("ExtPending.Clock").value();
  CHECK(clock.InvokeStatic<std::int64_t>("Now").value() == 1234);
}

TEST_CASE("LateExternalsAreRejected", "[runtime][Externals]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto u = DeclareLoadUnit("ExtLate.Lib").value();
  (void)u.Declare(TypeDeclaration::Class("ExtLate.Done"));
  u.Seal();
  REQUIRE(u.GetType("ExtLate.Done").value().IsInitialized());

  auto late = ImplementExternals("ExtLate.Done", [](ExternalsBuilder &) {});
  REQUIRE_FALSE(late.has_value());
  CHECK(late.error().code == ErrorCode::InvalidOperation);
  CHECK(sink.Has(ErrorCode::InvalidOperation));

  auto empty = ImplementExternals("ExtLate.Other", {});
  REQUIRE_FALSE(empty.has_value());
  CHECK(empty.error().code == ErrorCode::InvalidArgument);
}
