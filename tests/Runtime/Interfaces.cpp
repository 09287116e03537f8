// Interfaces.cpp - tests for interface lists, qualified member aliases and missing members

#include <catch2/catch_test_macros.hpp>

#include <TypeLoom/Runtime/Runtime.hpp>

#include "TestSink.hpp"

#include <cstdint>
#include <string>

namespace InterfaceDemo
{
  using namespace TypeLoom::Runtime;

  MethodBody Returns(Any value)
  {
    return [value](const CallFrame &) -> std::expected<Any, Error> { return value; };
  }

  // Shapes.INamed { Name }, Shapes.IShape : INamed { Area() }, Shapes.Square : IShape, Shapes.Tile : Square
  inline LoadUnit DeclareShapes()
  {
    static LoadUnit unit = []
    {
      auto u = DeclareLoadUnit("Shapes.Lib").value();
      (void)u.Declare(TypeDeclaration::Interface("Shapes.INamed"),
                      [](TypeBuilder &b) { b.interface_property("Name", b.ref("System.String")); });
      (void)u.Declare(TypeDeclaration::Interface("Shapes.IShape").implements(u.Ref("Shapes.INamed")),
                      [](TypeBuilder &b) { b.interface_method("Area", MethodSignature{b.ref("System.Int32"), {}}); });
      (void)u.Declare(TypeDeclaration::Class("Shapes.Square").implements(u.Ref("Shapes.IShape")),
                      [](TypeBuilder &b)
                      {
                        b.method(MemberFlags::Public, "Area", MethodSignature{b.ref("System.Int32"), {}}, Returns(Any{std::int32_t{16}}));
                        b.method(MemberFlags::Public, "get_Name", MethodSignature{b.ref("System.String"), {}},
                                 Returns(Any{std::string{"square"}}));
                      });
      (void)u.Declare(TypeDeclaration::Class("Shapes.Tile").base(u.Ref("Shapes.Square")));
      u.Seal();
      return u;
    }();
    return unit;
  }
} // namespace InterfaceDemo

TEST_CASE("QualifiedInterfaceAliases", "[runtime][Interfaces]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto u = InterfaceDemo::DeclareShapes();

  auto square = u.GetType("Shapes.Square").value();
  CHECK_FALSE(sink.Has(ErrorCode::MissingInterfaceMember));

  auto value = square.CreateInstance().value();
  CHECK(InvokeAs<std::int32_t>(value, "Area").value() == 16);
  CHECK(InvokeAs<std::int32_t>(value, "IShape.Area").value() == 16);
  CHECK(InvokeAs<std::string>(value, "INamed.get_Name").value() == "square");
  CHECK(GetProperty(value, "Name").value().Cast<std::string>() == "square");

  // A derived type inherits the alias of its base.
  auto tile = u.GetType("Shapes.Tile").value().CreateInstance().value();
  CHECK(InvokeAs<std::int32_t>(tile, "IShape.Area").value() == 16);
}

TEST_CASE("InterfaceListsAreTransitive", "[runtime][Interfaces]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto u = InterfaceDemo::DeclareShapes();
  auto square = u.GetType("Shapes.Square").value();
  auto shape = u.GetType("Shapes.IShape").value();
  auto named = u.GetType("Shapes.INamed").value();
  auto tile = u.GetType("Shapes.Tile").value();

  CHECK(shape.IsInterface());
  const auto interfaces = square.GetInterfaces();
  REQUIRE(interfaces.Size() == 2);
  CHECK(interfaces[0] == shape);
  CHECK(interfaces[1] == named);
  CHECK(tile.GetInterfaces().Size() == 2);

  CHECK(IsAssignable(square, shape));
  CHECK(IsAssignable(square, named));
  CHECK(IsAssignable(tile, named));
  CHECK(IsAssignable(shape, named));
  CHECK_FALSE(IsAssignable(named, shape));
  CHECK(IsAssignable(shape, GetTypeByName("System.Object").value()));

  auto instance = tile.CreateInstance().value();
  CHECK(CheckType(instance, named));

  auto create = shape.CreateInstance();
  REQUIRE_FALSE(create.has_value());
  CHECK(create.error().code == ErrorCode::InvalidOperation);
}

TEST_CASE("MissingInterfaceMembersWarnOnce", "[runtime][Interfaces]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto u = DeclareLoadUnit("Broken.Lib").value();
  (void)u.Declare(TypeDeclaration::Interface("Broken.IRun"),
                  [](TypeBuilder &b)
                  {
                    b.interface_method("Run", MethodSignature{TypeReference{}, {}});
                    b.interface_method("Stop", MethodSignature{TypeReference{}, {}});
                  });
  (void)u.Declare(TypeDeclaration::Class("Broken.Runner").implements(u.Ref("Broken.IRun")),
                  [](TypeBuilder &b)
                  { b.method(MemberFlags::Public, "Run", MethodSignature{TypeReference{}, {}}, InterfaceDemo::Returns(Any::MakeVoid())); });
  u.Seal();

  REQUIRE(u.GetType("Broken.Runner").has_value());
  CHECK(sink.Count(ErrorCode::MissingInterfaceMember) == 1);
  CHECK(sink.HasMessage("Broken.IRun.Stop"));
  CHECK_FALSE(sink.HasMessage("Broken.IRun.Run"));
}

TEST_CASE("UndefinedInterfaceIsSkipped", "[runtime][Interfaces]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto u = DeclareLoadUnit("Undefined.Lib").value();
  (void)u.Declare(TypeDeclaration::Class("Undefined.Thing").implements(u.Ref("Undefined.IMissing")));
  (void)u.Declare(TypeDeclaration::Class("Undefined.NotOne"));
  (void)u.Declare(TypeDeclaration::Class("Undefined.Other").implements(u.Ref("Undefined.NotOne")));
  u.Seal();

  auto thing = u.GetType("Undefined.Thing");
  REQUIRE(thing.has_value());
  CHECK(sink.Count(ErrorCode::UndefinedInterface) == 1);
  CHECK(thing->GetInterfaces().Size() == 0);

  REQUIRE(u.GetType("Undefined.Other").has_value());
  CHECK(sink.Has(ErrorCode::NotAnInterface));
}

TEST_CASE("QualifiedAliasIgnoresLaterSameNamedMember", "[runtime][Interfaces]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto u = DeclareLoadUnit("Greet.Lib").value();
  (void)u.Declare(TypeDeclaration::Interface("Greet.IGreeter"),
                  [](TypeBuilder &b) { b.interface_method("Greet", MethodSignature{b.ref("System.String"), {}}); });
  (void)u.Declare(TypeDeclaration::Class("Greet.Polite").implements(u.Ref("Greet.IGreeter")),
                  [](TypeBuilder &b)
                  {
                    b.method(MemberFlags::Public, "Greet", MethodSignature{b.ref("System.String"), {}},
                             InterfaceDemo::Returns(Any{std::string{"polite"}}));
                  });
  // Redeclares Greet without re-implementing the interface.
  (void)u.Declare(TypeDeclaration::Class("Greet.Rude").base(u.Ref("Greet.Polite")),
                  [](TypeBuilder &b)
                  {
                    b.method(MemberFlags::Public, "Greet", MethodSignature{b.ref("System.String"), {}},
                             InterfaceDemo::Returns(Any{std::string{"rude"}}));
                  });
  u.Seal();

  auto rude = u.GetType("Greet.Rude").value().CreateInstance().value();
  CHECK(InvokeAs<std::string>(rude, "Greet").value() == "rude");
  CHECK(InvokeAs<std::string>(rude, "IGreeter.Greet").value() == "polite");

  auto polite = u.GetType("Greet.Polite").value().CreateInstance().value();
  CHECK(InvokeAs<std::string>(polite, "IGreeter.Greet").value() == "polite");
}

TEST_CASE("ExternalPlaceholderSatisfiesInterface", "[runtime][Interfaces]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto u = DeclareLoadUnit("Stub.Lib").value();
  (void)u.Declare(TypeDeclaration::Interface("Stub.IClock"),
                  [](TypeBuilder &b) { b.interface_method("Now", MethodSignature{b.ref("System.Int64"), {}}); });
  (void)u.Declare(TypeDeclaration::Class("Stub.Clock").implements(u.Ref("Stub.IClock")),
                  [](TypeBuilder &b) { b.external_method(MemberFlags::Public, "Now", MethodSignature{b.ref("System.Int64"), {}}); });
  u.Seal();

  auto clock = u.GetType("Stub.Clock").value();
  CHECK_FALSE(sink.Has(ErrorCode::MissingInterfaceMember));
  CHECK(IsAssignable(clock, u.GetType("Stub.IClock").value()));

  // Only calling the member fails.
  auto value = clock.CreateInstance().value();
  auto now = Invoke(value, "IClock.Now");
  REQUIRE_FALSE(now.has_value());
  CHECK(now.error().code == ErrorCode::NotImplemented);
  CHECK(now.error().message == "The external method 'Stub.Clock.Now' of type 'Stub.Clock' has not been implemented.");
}
