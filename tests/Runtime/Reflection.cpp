// Reflection.cpp - tests for member enumeration, binding flag filters and reflected accessors

#include <catch2/catch_test_macros.hpp>

#include <TypeLoom/Runtime/Runtime.hpp>

#include "TestSink.hpp"

#include <cstdint>
#include <string>

namespace ReflectionDemo
{
  using namespace TypeLoom::Runtime;

  MethodBody Returns(std::string text)
  {
    return [text](const CallFrame &) -> std::expected<Any, Error> { return Any{text}; };
  }

  MethodBody NoOp()
  {
    return [](const CallFrame &) -> std::expected<Any, Error> { return Any::MakeVoid(); };
  }

  // Refl.Base { Id; secret; static Instances; Run(); Helper(); Label; static Version }, Refl.Child : Base { Run(); Jump(Int32); Jump(String) }
  inline LoadUnit DeclareReflection()
  {
    static LoadUnit unit = []
    {
      auto u = DeclareLoadUnit("Refl.Lib").value();
      (void)u.Declare(TypeDeclaration::Class("Refl.Base"),
                      [](TypeBuilder &b)
                      {
                        const auto statics = MemberFlags::Public | MemberFlags::Static;
                        b.field(MemberFlags::Public, "Id", b.ref("System.Int32"));
                        b.field(MemberFlags::None, "secret", b.ref("System.String"));
                        b.field(statics, "Instances", b.ref("System.Int32"));
                        b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {}}, NoOp());
                        b.static_constructor(NoOp());
                        b.method(MemberFlags::Public, "Run", MethodSignature{b.ref("System.String"), {}}, Returns("base-run"));
                        b.method(MemberFlags::None, "Helper", MethodSignature{TypeReference{}, {}}, NoOp());
                        b.method(MemberFlags::Public, "get_Label", MethodSignature{b.ref("System.String"), {}},
                                 [](const CallFrame &f) -> std::expected<Any, Error> { return f.Self()->GetField("secret"); });
                        b.method(MemberFlags::Public, "set_Label", MethodSignature{TypeReference{}, {b.ref("System.String")}},
                                 [](const CallFrame &f) -> std::expected<Any, Error>
                                 {
                                   auto set = f.Self()->SetField("secret", f.arguments[0]);
                                   if (!set)
                                     return std::unexpected(set.error());
                                   return Any::MakeVoid();
                                 });
                        b.property(MemberFlags::Public, "Label", b.ref("System.String"));
                        b.method(statics, "get_Version", MethodSignature{b.ref("System.String"), {}}, Returns("1.0"));
                        b.property(statics, "Version", b.ref("System.String"));
                      });
      (void)u.Declare(TypeDeclaration::Class("Refl.Child").base(u.Ref("Refl.Base")),
                      [](TypeBuilder &b)
                      {
                        b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {b.ref("System.Int32")}},
                                      [](const CallFrame &f) -> std::expected<Any, Error>
                                      {
                                        auto set = f.Self()->SetField("Id", f.arguments[0]);
                                        if (!set)
                                          return std::unexpected(set.error());
                                        return Any::MakeVoid();
                                      });
                        b.method(MemberFlags::Public, "Run", MethodSignature{b.ref("System.String"), {}}, Returns("child-run"));
                        b.method(MemberFlags::Public, "Jump", MethodSignature{TypeReference{}, {b.ref("System.Int32")}}, NoOp());
                        b.method(MemberFlags::Public, "Jump", MethodSignature{TypeReference{}, {b.ref("System.String")}}, NoOp());
                      });
      u.Seal();
      return u;
    }();
    return unit;
  }
} // namespace ReflectionDemo

TEST_CASE("MembersComeBaseFirst", "[runtime][Reflection]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ReflectionDemo::DeclareReflection();

  auto child = unit.GetType("Refl.Child").value();
  auto base = unit.GetType("Refl.Base").value();
  auto object = GetTypeByName("System.Object").value();

  const auto methods = child.GetMethods();
  // Object: ToString, GetType, Equals. Base: Run, Helper, get_Label, set_Label, get_Version. Child: Run, Jump, Jump.
  REQUIRE(methods.Size() == 11);
  CHECK(methods[0].DeclaringType() == object);
  CHECK(methods[0].Name() == "ToString");
  CHECK(methods[3].DeclaringType() == base);
  CHECK(methods[3].Name() == "Run");
  CHECK(methods[8].DeclaringType() == child);

  // Raw members never show up.
  for (NGIN::UIntSize i = 0; i < methods.Size(); ++i)
    CHECK(methods[i].Name() != "MemberwiseClone");

  const auto declared = child.GetMethods(BindingFlags::DeclaredOnly);
  REQUIRE(declared.Size() == 3);
  CHECK(declared[0].Name() == "Run");
  CHECK(declared[1].Name() == "Jump");

  // Constructors are special names and stay out of plain member lists.
  const auto members = child.GetMembers();
  for (NGIN::UIntSize i = 0; i < members.Size(); ++i)
  {
    CHECK_FALSE(members[i].IsConstructor());
    CHECK_FALSE(members[i].IsSpecialName());
  }
}

TEST_CASE("BindingFlagsFilterPairs", "[runtime][Reflection]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ReflectionDemo::DeclareReflection();
  auto base = unit.GetType("Refl.Base").value();

  CHECK(base.GetFields().Size() == 3);
  CHECK(base.GetFields(BindingFlags::Instance).Size() == 2);
  CHECK(base.GetFields(BindingFlags::Static).Size() == 1);
  CHECK(base.GetFields(BindingFlags::Public).Size() == 2);
  // Both halves of a pair cancel out.
  CHECK(base.GetFields(BindingFlags::Public | BindingFlags::NonPublic).Size() == 3);

  const auto hidden = base.GetFields(BindingFlags::Instance | BindingFlags::NonPublic);
  REQUIRE(hidden.Size() == 1);
  CHECK(hidden[0].Name() == "secret");
  CHECK_FALSE(hidden[0].IsPublic());

  CHECK_FALSE(base.GetMethod("Helper", BindingFlags::Public).has_value());
  auto helper = base.GetMethod("Helper", BindingFlags::NonPublic);
  REQUIRE(helper.has_value());
  CHECK(helper->ReturnsVoid());

  const auto statics = base.GetProperties(BindingFlags::Static);
  REQUIRE(statics.Size() == 1);
  CHECK(statics[0].Name() == "Version");
  CHECK(statics[0].IsStatic());
}

TEST_CASE("ConstructorsAreListedPerType", "[runtime][Reflection]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ReflectionDemo::DeclareReflection();
  auto base = unit.GetType("Refl.Base").value();
  auto child = unit.GetType("Refl.Child").value();

  CHECK(base.GetConstructors().Size() == 2);
  CHECK(base.GetConstructors(BindingFlags::Static).Size() == 1);
  const auto baseCtors = base.GetConstructors(BindingFlags::Instance);
  REQUIRE(baseCtors.Size() == 1);
  CHECK(baseCtors[0].ParameterCount() == 0);

  // Constructors are not inherited.
  const auto ctors = child.GetConstructors();
  REQUIRE(ctors.Size() == 1);
  CHECK(ctors[0].IsConstructor());
  CHECK(ctors[0].ParameterCount() == 1);
  CHECK(ctors[0].DeclaringType() == child);

  const auto asMembers = child.GetMembers(BindingFlags::None, MemberKind::Constructor);
  REQUIRE(asMembers.Size() == 1);
  CHECK(asMembers[0].IsSpecialName());

  auto instance = child.New(std::int32_t{4}).value();
  CHECK(GetField(instance, "Id").value().Cast<std::int32_t>() == 4);
  Any again[1] = {Any{std::int32_t{9}}};
  REQUIRE(ctors[0].Invoke(instance, again).has_value());
  CHECK(GetField(instance, "Id").value().Cast<std::int32_t>() == 9);
}

TEST_CASE("GetMethodPicksMostDerived", "[runtime][Reflection]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ReflectionDemo::DeclareReflection();
  auto base = unit.GetType("Refl.Base").value();
  auto child = unit.GetType("Refl.Child").value();

  auto run = child.GetMethod("Run");
  REQUIRE(run.has_value());
  CHECK(run->DeclaringType() == child);
  CHECK(run->ToString() == "System.String Refl.Child.Run()");

  auto jump = child.GetMethod("Jump");
  REQUIRE_FALSE(jump.has_value());
  CHECK(jump.error().code == ErrorCode::InvalidOperation);
  CHECK(jump.error().message == "Ambiguous match for method 'Refl.Child.Jump'");

  auto none = child.GetMethod("Fly");
  REQUIRE_FALSE(none.has_value());
  CHECK(none.error().code == ErrorCode::NotFound);

  // A base method invoked through reflection still dispatches on the runtime type.
  auto instance = child.New(std::int32_t{1}).value();
  auto baseRun = base.GetMethod("Run").value();
  CHECK(baseRun.Invoke(instance).value().Cast<std::string>() == "child-run");

  Any extra[1] = {Any{std::int32_t{1}}};
  auto wrongArity = run->Invoke(instance, extra);
  REQUIRE_FALSE(wrongArity.has_value());
  CHECK(wrongArity.error().code == ErrorCode::InvalidArgument);
  CHECK(wrongArity.error().message == "Method 'Refl.Child.Run' expects 0 argument(s), but 1 were provided.");

  auto onNull = run->Invoke(Null());
  REQUIRE_FALSE(onNull.has_value());
  CHECK(onNull.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("ReflectedFieldAndPropertyAccess", "[runtime][Reflection]")
{
  using namespace TypeLoom::Runtime;
  auto unit = ReflectionDemo::DeclareReflection();
  auto base = unit.GetType("Refl.Base").value();
  auto int32 = GetTypeByName("System.Int32").value();
  auto string = GetTypeByName("System.String").value();

  auto instance = base.CreateInstance().value();

  auto id = base.GetField("Id").value();
  CHECK(id.FieldType().value() == int32);
  REQUIRE(id.SetValue(instance, Any{std::int32_t{12}}).has_value());
  CHECK(id.GetValue(instance).value().Cast<std::int32_t>() == 12);
  auto bad = id.SetValue(instance, Any{std::string{"twelve"}});
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::InvalidCast);
  CHECK(bad.error().message == "Cannot assign a value of type 'System.String' to field 'Refl.Base.Id' of type 'System.Int32'");

  auto instances = base.GetField("Instances").value();
  CHECK(instances.IsStatic());
  REQUIRE(instances.SetValue(Null(), Any{std::int32_t{5}}).has_value());
  CHECK(base.GetStaticField("Instances").value().Cast<std::int32_t>() == 5);
  CHECK(instances.GetValue(Null()).value().Cast<std::int32_t>() == 5);

  auto label = base.GetProperty("Label").value();
  CHECK(label.PropertyType().value() == string);
  REQUIRE(label.SetValue(instance, Any{std::string{"tag"}}).has_value());
  CHECK(label.GetValue(instance).value().Cast<std::string>() == "tag");
  CHECK(GetProperty(instance, "Label").value().Cast<std::string>() == "tag");
  CHECK_FALSE(label.GetValue(Null()).has_value());

  auto version = base.GetProperty("Version").value();
  CHECK(version.GetValue(Null()).value().Cast<std::string>() == "1.0");
  CHECK(base.GetStaticProperty("Version").value().Cast<std::string>() == "1.0");

  auto missing = base.GetField("Nope");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().message == "Type 'Refl.Base' has no field 'Nope'");
}
