// Names.cpp - tests for name escaping and type name parsing

#include <catch2/catch_test_macros.hpp>

#include <TypeLoom/Runtime/Runtime.hpp>

#include <string>

TEST_CASE("EscapeNameMangles", "[runtime][Names]")
{
  using namespace TypeLoom::Runtime;

  CHECK(EscapeName("List`1") == "List$b1");
  CHECK(EscapeName("A.B<C>") == "A_B$lC$g");
  CHECK(EscapeName("Outer+Inner/X") == "Outer_Inner_X");
  CHECK(EscapeName("Plain") == "Plain");
}

TEST_CASE("LocalAndNamespaceNames", "[runtime][Names]")
{
  using namespace TypeLoom::Runtime;

  CHECK(GetLocalName("System.Collections.List`1") == "List`1");
  CHECK(GetLocalName("Object") == "Object");
  CHECK(GetNamespaceName("System.Collections.List`1") == "System.Collections");
  CHECK(GetNamespaceName("Object").empty());
  // Dots inside a generic group are not separators.
  CHECK(GetLocalName("Ns.Outer<Ns.Inner>") == "Outer<Ns.Inner>");
  CHECK(GetShortLoadUnitName("mscorlib, Version=4.0.0.0, Culture=neutral") == "mscorlib");
}

TEST_CASE("ParseAssemblyQualifiedName", "[runtime][Names]")
{
  using namespace TypeLoom::Runtime;

  auto parsed = ParseTypeName("Ns.Pair`2[[System.Int32],[System.String]], MyLib");
  CHECK(parsed.type == "Ns.Pair`2");
  REQUIRE(parsed.assembly.has_value());
  CHECK(*parsed.assembly == "MyLib");
  REQUIRE(parsed.genericArguments.size() == 2);
  CHECK(parsed.genericArguments[0].type == "System.Int32");
  CHECK(parsed.genericArguments[1].type == "System.String");
  CHECK_FALSE(parsed.genericArguments[0].assembly.has_value());

  auto simple = ParseTypeName("System.Object");
  CHECK(simple.type == "System.Object");
  CHECK_FALSE(simple.assembly.has_value());
  CHECK(simple.genericArguments.empty());
}

TEST_CASE("ParseNestedArgumentsWithAssemblies", "[runtime][Names]")
{
  using namespace TypeLoom::Runtime;

  auto parsed = ParseTypeName("Ns.Map`2[[Ns.Key, KeyLib],[Ns.List`1[[System.Int32]], ListLib]]");
  CHECK(parsed.type == "Ns.Map`2");
  CHECK_FALSE(parsed.assembly.has_value());
  REQUIRE(parsed.genericArguments.size() == 2);
  CHECK(parsed.genericArguments[0].type == "Ns.Key");
  REQUIRE(parsed.genericArguments[0].assembly.has_value());
  CHECK(*parsed.genericArguments[0].assembly == "KeyLib");
  const auto &list = parsed.genericArguments[1];
  CHECK(list.type == "Ns.List`1");
  REQUIRE(list.assembly.has_value());
  CHECK(*list.assembly == "ListLib");
  REQUIRE(list.genericArguments.size() == 1);
  CHECK(list.genericArguments[0].type == "System.Int32");
}

TEST_CASE("GetTypeFromParsedNameClosesGenerics", "[runtime][Names]")
{
  using namespace TypeLoom::Runtime;

  auto unit = DeclareLoadUnit("ParseLib").value();
  REQUIRE(unit.Declare(TypeDeclaration::Class("Parse.Pair`2").generic_parameter("A").generic_parameter("B")).has_value());
  unit.Seal();

  auto closed = GetTypeFromParsedName(ParseTypeName("Parse.Pair`2[[System.Int32],[System.String]], ParseLib"));
  REQUIRE(closed.has_value());
  CHECK(closed->FullName() == "Parse.Pair`2[System.Int32,System.String]");
  CHECK(closed->IsClosed());
  CHECK(closed->GenericArgumentCount() == 2);

  auto missing = GetTypeFromParsedName(ParseTypeName("Parse.Pair`2, NoSuchLib"));
  CHECK_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::NotFound);
}
