// Values.cpp - tests for enumerations, arrays, casts and the runtime type of native values

#include <catch2/catch_test_macros.hpp>

#include <TypeLoom/Runtime/Runtime.hpp>

#include "TestSink.hpp"

#include <cstdint>
#include <string>

namespace ValuesDemo
{
  using namespace TypeLoom::Runtime;

  // Val.Color, Val.Access [Flags], Val.Animal, Val.Cat : Animal, Val.Pair (struct), Val.Palette { Primary : Color }
  inline LoadUnit DeclareValues()
  {
    static LoadUnit unit = []
    {
      auto u = DeclareLoadUnit("Val.Lib").value();
      (void)u.Declare(TypeDeclaration::Enum("Val.Color").value("Red", 0).value("Green", 1).value("Blue", 2).value("Verde", 1));
      (void)u.Declare(TypeDeclaration::Enum("Val.Access").flags().value("None", 0).value("Read", 1).value("Write", 2).value("Execute", 4));
      (void)u.Declare(TypeDeclaration::Class("Val.Animal"),
                      [](TypeBuilder &b)
                      {
                        b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {}},
                                      [](const CallFrame &) -> std::expected<Any, Error> { return Any::MakeVoid(); });
                      });
      (void)u.Declare(TypeDeclaration::Class("Val.Cat").base(u.Ref("Val.Animal")),
                      [](TypeBuilder &b)
                      {
                        b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {}},
                                      [](const CallFrame &) -> std::expected<Any, Error> { return Any::MakeVoid(); });
                      });
      (void)u.Declare(TypeDeclaration::Struct("Val.Pair"),
                      [](TypeBuilder &b)
                      {
                        b.field(MemberFlags::Public, "Left", b.ref("System.Int32"));
                        b.field(MemberFlags::Public, "Right", b.ref("System.Int32"));
                      });
      (void)u.Declare(TypeDeclaration::Class("Val.Palette"),
                      [](TypeBuilder &b)
                      {
                        b.field(MemberFlags::Public, "Primary", b.ref("Val.Color"));
                        b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {}},
                                      [](const CallFrame &) -> std::expected<Any, Error> { return Any::MakeVoid(); });
                      });
      u.Seal();
      return u;
    }();
    return unit;
  }
} // namespace ValuesDemo

TEST_CASE("EnumNamesAndValues", "[runtime][Values]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ValuesDemo::DeclareValues();
  auto color = unit.GetType("Val.Color").value();

  CHECK(color.IsEnum());
  CHECK(color.IsValueType());
  CHECK_FALSE(color.IsFlagsEnum());
  REQUIRE(color.BaseType().has_value());
  CHECK(color.BaseType()->FullName() == "System.Enum");
  CHECK(color.EnumValueCount() == 4);
  CHECK(color.EnumNameAt(2) == "Blue");

  auto blue = color.ParseEnum("Blue");
  REQUIRE(blue.has_value());
  CHECK(blue->Cast<EnumValue>().value == 2);
  CHECK(blue->Cast<EnumValue>().type == color.Handle());

  // The first name declared for a value wins.
  REQUIRE(color.EnumName(1).has_value());
  CHECK(*color.EnumName(1) == "Green");
  CHECK(color.ParseEnum("Verde").value().Cast<EnumValue>().value == 1);
  CHECK_FALSE(color.EnumName(7).has_value());

  auto purple = color.ParseEnum("Purple");
  REQUIRE_FALSE(purple.has_value());
  CHECK(purple.error().code == ErrorCode::InvalidArgument);
  CHECK(purple.error().message == "Requested value 'Purple' was not found.");

  // Only flags enums combine names.
  auto combined = color.ParseEnum("Red,Green");
  REQUIRE_FALSE(combined.has_value());
  CHECK(combined.error().message == "Requested value 'Red,Green' was not found.");

  auto notEnum = GetTypeByName("System.Int32").value().ParseEnum("Red");
  REQUIRE_FALSE(notEnum.has_value());
  CHECK(notEnum.error().code == ErrorCode::InvalidOperation);
  CHECK(notEnum.error().message == "'System.Int32' is not an enumeration");

  CHECK(color.CreateInstance().value().Cast<EnumValue>().value == 0);
}

TEST_CASE("FlagsEnumsCombineNames", "[runtime][Values]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ValuesDemo::DeclareValues();
  auto access = unit.GetType("Val.Access").value();

  CHECK(access.IsFlagsEnum());
  auto readWrite = access.ParseEnum("Read, Write");
  REQUIRE(readWrite.has_value());
  CHECK(readWrite->Cast<EnumValue>().value == 3);
  CHECK(access.ParseEnum("Read,Write,Execute").value().Cast<EnumValue>().value == 7);

  auto bad = access.ParseEnum("Read,Bogus");
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().message == "Requested value 'Bogus' was not found.");
}

TEST_CASE("EnumValuesBehaveAsValues", "[runtime][Values]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ValuesDemo::DeclareValues();
  auto color = unit.GetType("Val.Color").value();
  auto access = unit.GetType("Val.Access").value();

  auto green = color.EnumFromValue(1).value();
  CHECK(InvokeAs<std::string>(green, "ToString").value() == "Green");
  CHECK(InvokeAs<std::string>(color.EnumFromValue(9).value(), "ToString").value() == "9");

  CHECK(CheckType(green, color));
  CHECK(CheckType(green, GetTypeByName("System.Enum").value()));
  CHECK_FALSE(CheckType(green, access));
  CHECK_FALSE(CheckType(Any{std::int32_t{1}}, color));
  CHECK_FALSE(CheckType(Null(), color));
  CHECK(GetValueType(green).value() == color);

  // Enum fields default to the zero value.
  auto palette = unit.GetType("Val.Palette").value().CreateInstance().value();
  auto primary = GetField(palette, "Primary").value();
  CHECK(primary.Cast<EnumValue>().type == color.Handle());
  CHECK(primary.Cast<EnumValue>().value == 0);
}

TEST_CASE("ArraysOfElements", "[runtime][Values]")
{
  using namespace TypeLoom::Runtime;
  auto int32 = GetTypeByName("System.Int32").value();
  auto string = GetTypeByName("System.String").value();

  auto numbers = NewArray(int32, 3);
  REQUIRE(numbers.has_value());
  const auto &array = numbers->Cast<ArrayRef>();
  REQUIRE(array);
  REQUIRE(array->items.Size() == 3);
  CHECK(array->items[2].Cast<std::int32_t>() == 0);
  CHECK(InvokeAs<std::int32_t>(*numbers, "get_Length").value() == 3);
  CHECK(GetProperty(*numbers, "Length").value().Cast<std::int32_t>() == 3);

  auto intArray = GetArrayType(int32);
  auto stringArray = GetArrayType(string);
  REQUIRE(intArray.has_value());
  REQUIRE(stringArray.has_value());
  CHECK(intArray->FullName() == "System.Array[System.Int32]");
  CHECK(*intArray == GetArrayType(int32).value());
  CHECK(GetValueType(*numbers).value() == *intArray);

  CHECK(CheckType(*numbers, *intArray));
  CHECK_FALSE(CheckType(*numbers, *stringArray));
  CHECK_FALSE(CheckType(Any{std::int32_t{1}}, *intArray));
  CHECK(CheckType(Null(), *intArray));

  auto strings = NewArray(string, 2).value();
  CHECK(IsNull(strings.Cast<ArrayRef>()->items[0]));

  auto invalid = GetArrayType(Type{});
  REQUIRE_FALSE(invalid.has_value());
  CHECK(invalid.error().message == "Array element type is null or undefined");
}

TEST_CASE("ArraysAreCovariantAndStructElementsDistinct", "[runtime][Values]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ValuesDemo::DeclareValues();
  auto animal = unit.GetType("Val.Animal").value();
  auto cat = unit.GetType("Val.Cat").value();

  auto cats = NewArray(cat, 1).value();
  CHECK(CheckType(cats, GetArrayType(animal).value()));
  auto animals = NewArray(animal, 1).value();
  CHECK_FALSE(CheckType(animals, GetArrayType(cat).value()));

  auto pairs = NewArray(unit.GetType("Val.Pair").value(), 2).value();
  const auto &items = pairs.Cast<ArrayRef>()->items;
  REQUIRE(IsObject(items[0]));
  REQUIRE(IsObject(items[1]));
  CHECK(items[0].Cast<ObjectRef>() != items[1].Cast<ObjectRef>());
  CHECK(GetField(items[1], "Right").value().Cast<std::int32_t>() == 0);
}

TEST_CASE("CastAndTryCast", "[runtime][Values]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ValuesDemo::DeclareValues();
  auto animal = unit.GetType("Val.Animal").value();
  auto cat = unit.GetType("Val.Cat").value();
  auto int32 = GetTypeByName("System.Int32").value();

  auto tom = cat.CreateInstance().value();
  auto generic = animal.CreateInstance().value();

  auto up = Cast(tom, animal);
  REQUIRE(up.has_value());
  CHECK(up->Cast<ObjectRef>() == tom.Cast<ObjectRef>());
  CHECK(Cast(Null(), animal).has_value());

  auto down = Cast(generic, cat);
  REQUIRE_FALSE(down.has_value());
  CHECK(down.error().code == ErrorCode::InvalidCast);
  CHECK(down.error().message == "Unable to cast object of type 'Val.Animal' to type 'Val.Cat'");

  auto nullToValue = Cast(Null(), int32);
  REQUIRE_FALSE(nullToValue.has_value());
  CHECK(nullToValue.error().message == "Unable to cast object of type 'null' to type 'System.Int32'");

  auto maybe = TryCast(generic, cat);
  REQUIRE(maybe.has_value());
  CHECK(IsNull(*maybe));
  CHECK(TryCast(tom, animal).value().Cast<ObjectRef>() == tom.Cast<ObjectRef>());

  auto onValueType = TryCast(Any{std::int32_t{1}}, int32);
  REQUIRE_FALSE(onValueType.has_value());
  CHECK(onValueType.error().code == ErrorCode::InvalidOperation);
}

TEST_CASE("NativeValuesHaveCoreTypes", "[runtime][Values]")
{
  using namespace TypeLoom::Runtime;

  CHECK(GetValueType(Any{true})->FullName() == "System.Boolean");
  CHECK(GetValueType(Any{std::int32_t{1}})->FullName() == "System.Int32");
  CHECK(GetValueType(Any{std::int64_t{1}})->FullName() == "System.Int64");
  CHECK(GetValueType(Any{1.5})->FullName() == "System.Double");
  CHECK(GetValueType(Any{std::string{"s"}})->FullName() == "System.String");
  CHECK(GetValueType(Any{GetTypeByName("System.Object").value().Handle()})->FullName() == "System.RuntimeType");
  CHECK_FALSE(GetValueType(Null()).has_value());

  auto int32 = GetTypeByName("System.Int32").value();
  CHECK(CheckType(Any{std::int32_t{3}}, int32));
  CHECK_FALSE(CheckType(Any{std::int64_t{3}}, int32));
  CHECK(CheckType(Any{std::int32_t{3}}, GetTypeByName("System.Object").value()));
  CHECK(int32.CreateInstance().value().Cast<std::int32_t>() == 0);
}
