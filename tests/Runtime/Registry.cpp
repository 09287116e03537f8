// Registry.cpp - tests for load units, name bindings and type identity

#include <catch2/catch_test_macros.hpp>

#include <TypeLoom/Runtime/Runtime.hpp>

#include "TestSink.hpp"

#include <stdexcept>
#include <string>

TEST_CASE("CoreTypesResolveByName", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;

  auto object = GetTypeByName("System.Object");
  REQUIRE(object.has_value());
  CHECK(object->FullName() == "System.Object");
  CHECK(object->ShortName() == "Object");
  CHECK(object->Namespace() == "System");
  CHECK_FALSE(object->BaseType().has_value());
  CHECK(object->InheritanceDepth() == 0);
  CHECK(object->IsInitialized());
  CHECK(object->GetLoadUnit().Name() == CoreLoadUnit().Name());

  auto value = GetTypeByName("System.Int32");
  REQUIRE(value.has_value());
  CHECK(value->IsValueType());
  CHECK(value->Kind() == TypeKind::Struct);
  REQUIRE(value->BaseType().has_value());
  CHECK(value->BaseType()->FullName() == "System.ValueType");
}

TEST_CASE("TypeIdIsStable", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;

  auto unit = DeclareLoadUnit("Identity.Lib").value();
  REQUIRE(unit.Declare(TypeDeclaration::Class("Identity.A")).has_value());
  REQUIRE(unit.Declare(TypeDeclaration::Class("Identity.B")).has_value());
  unit.Seal();

  auto a1 = unit.GetType("Identity.A").value();
  auto a2 = GetTypeByName("Identity.A").value();
  auto b = unit.GetType("Identity.B").value();
  CHECK(a1 == a2);
  CHECK(a1.TypeId() == a2.TypeId());
  CHECK(a1.TypeId() != b.TypeId());
  CHECK_FALSE(a1.TypeId().empty());
}

TEST_CASE("StandardLibraryEditionsShareIdentity", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;

  auto core = CoreLoadUnit();
  auto mscorlib = DeclareLoadUnit("mscorlib, Version=4.0.0.0").value();
  CHECK(mscorlib.ShortName() == "mscorlib");
  CHECK(mscorlib.AssemblyId() == core.AssemblyId());

  REQUIRE(core.Declare(TypeDeclaration::Class("System.EditionProbe").set_public(false)).has_value());
  REQUIRE(mscorlib.Declare(TypeDeclaration::Class("System.EditionProbe").set_public(false)).has_value());

  auto fromCore = core.GetType("System.EditionProbe").value();
  auto fromLib = mscorlib.GetType("System.EditionProbe").value();
  CHECK_FALSE(fromCore == fromLib);
  CHECK(fromCore.TypeId() == fromLib.TypeId());
  CHECK(IsAssignable(fromCore, fromLib));
  CHECK(IsAssignable(fromLib, fromCore));

  // The short name finds the unit too.
  auto byShort = GetLoadUnit("mscorlib");
  REQUIRE(byShort.has_value());
  CHECK(byShort->Handle() == mscorlib.Handle());
}

TEST_CASE("DuplicateDeclarationIsRejected", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto unit = DeclareLoadUnit("Dup.Lib").value();
  REQUIRE(unit.Declare(TypeDeclaration::Class("Dup.Thing")).has_value());
  auto again = unit.Declare(TypeDeclaration::Class("Dup.Thing"));
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().code == ErrorCode::DuplicateDefinition);
  CHECK(sink.Has(ErrorCode::DuplicateDefinition));
  CHECK(sink.Count(Severity::Error) == 1);
}

TEST_CASE("AmbiguousPublicNames", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;

  auto first = DeclareLoadUnit("Amb.First").value();
  auto second = DeclareLoadUnit("Amb.Second").value();
  REQUIRE(first.Declare(TypeDeclaration::Class("Amb.Shared")).has_value());
  REQUIRE(second.Declare(TypeDeclaration::Class("Amb.Shared")).has_value());
  first.Seal();
  second.Seal();

  auto global = GetTypeByName("Amb.Shared");
  REQUIRE_FALSE(global.has_value());
  CHECK(global.error().code == ErrorCode::AmbiguousType);
  CHECK(std::string{global.error().message}.find("multiple public definitions") != std::string::npos);

  auto viaFirst = first.GetType("Amb.Shared");
  auto viaSecond = second.GetType("Amb.Shared");
  REQUIRE(viaFirst.has_value());
  REQUIRE(viaSecond.has_value());
  CHECK_FALSE(*viaFirst == *viaSecond);
  CHECK(viaFirst->TypeId() != viaSecond->TypeId());
}

TEST_CASE("ResolveNameReportsMissingSegment", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;

  auto unit = DeclareLoadUnit("Resolve.Lib").value();
  REQUIRE(unit.Declare(TypeDeclaration::Class("Resolve.Present")).has_value());

  auto ok = ResolveName("Resolve.Present");
  REQUIRE(ok.has_value());
  CHECK(ok->Name() == "Resolve.Present");
  CHECK(ok->State() == BindingState::Unconstructed);

  auto badRoot = ResolveName("Nope.Thing");
  REQUIRE_FALSE(badRoot.has_value());
  CHECK(badRoot.error().code == ErrorCode::NameResolution);
  CHECK(badRoot.error().message == "Could not find the name 'Nope' in the namespace '<global>'.");

  auto badLeaf = ResolveName("Resolve.Missing");
  REQUIRE_FALSE(badLeaf.has_value());
  CHECK(badLeaf.error().message == "Could not find the name 'Missing' in the namespace 'Resolve'.");
}

TEST_CASE("PrivateNamesStayInTheirUnit", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;

  auto unit = DeclareLoadUnit("Private.Lib").value();
  REQUIRE(unit.Declare(TypeDeclaration::Class("Private.Hidden").set_public(false)).has_value());
  unit.Seal();

  CHECK(unit.GetType("Private.Hidden").has_value());
  auto global = GetTypeByName("Private.Hidden");
  REQUIRE_FALSE(global.has_value());
  CHECK(global.error().code == ErrorCode::NotFound);
}

TEST_CASE("ConstructionIsLazyAndSealingInitializes", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;

  int declared = 0;
  auto unit = DeclareLoadUnit("Lazy.Lib").value();
  auto binding = unit.Declare(TypeDeclaration::Class("Lazy.Thing"), [&declared](TypeBuilder &) { ++declared; });
  REQUIRE(binding.has_value());
  CHECK(declared == 0);
  CHECK_FALSE(binding->IsSealed());

  auto unsealed = binding->Get();
  REQUIRE(unsealed.has_value());
  CHECK(declared == 1);
  CHECK(binding->State() == BindingState::Constructed);
  CHECK_FALSE(unsealed->IsInitialized());

  SealLoadUnit(unit);
  auto sealed = binding->Get();
  REQUIRE(sealed.has_value());
  CHECK(*sealed == *unsealed);
  CHECK(declared == 1);
  CHECK(sealed->IsInitialized());
  CHECK(binding->State() == BindingState::Initialized);
  // Publishing is deferred work.
  CHECK(RunPendingLaterTasks() >= 1);
  CHECK(binding->Get().has_value());
}

TEST_CASE("RecursiveConstructionFails", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto unit = DeclareLoadUnit("Recursion.Lib").value();
  auto binding = unit.RegisterName("Recursion.Self", true,
                                   [unit](BindingHandle) -> std::expected<TypeHandle, Error>
                                   {
                                     auto self = unit.GetType("Recursion.Self");
                                     if (!self)
                                       return std::unexpected(self.error());
                                     return self->Handle();
                                   });
  REQUIRE(binding.has_value());

  auto first = binding->Get();
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().code == ErrorCode::RecursiveConstruction);
  CHECK(sink.Has(ErrorCode::RecursiveConstruction));
  CHECK(binding->State() == BindingState::Failed);

  auto second = binding->Get();
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error().code == ErrorCode::TypeInitialization);
}

TEST_CASE("ThrowingCreatorFailsTheBinding", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto unit = DeclareLoadUnit("Throwing.Lib").value();
  auto binding = unit.RegisterName("Throwing.Creator", true,
                                   [](BindingHandle) -> std::expected<TypeHandle, Error>
                                   { throw std::runtime_error("creator exploded"); });
  REQUIRE(binding.has_value());

  auto first = binding->Get();
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().code == ErrorCode::TypeInitialization);
  CHECK(first.error().message == "Type initialization failed for 'Throwing.Creator': creator exploded");
  CHECK(sink.Has(ErrorCode::TypeInitialization));
  CHECK(binding->State() == BindingState::Failed);

  // Not mistaken for a construction still in progress.
  auto second = binding->Get();
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error().code == ErrorCode::TypeInitialization);
}

TEST_CASE("ThrowingMemberDeclarationFailsTheBinding", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto unit = DeclareLoadUnit("ThrowingMembers.Lib").value();
  auto binding = unit.Declare(TypeDeclaration::Class("ThrowingMembers.Thing"),
                              [](TypeBuilder &b)
                              {
                                b.field(MemberFlags::Public, "Id", b.ref("System.Int32"));
                                // An unresolved lookup surfaces as an exception from value().
                                (void)GetTypeByName("ThrowingMembers.Missing").value();
                              });
  REQUIRE(binding.has_value());

  auto first = binding->Get();
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().code == ErrorCode::TypeInitialization);
  CHECK(binding->State() == BindingState::Failed);

  auto second = GetTypeByName("ThrowingMembers.Thing");
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error().code == ErrorCode::TypeInitialization);
}

TEST_CASE("MemberDeclarationFailureFailsTheBinding", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto unit = DeclareLoadUnit("BadMembers.Lib").value();
  auto binding = unit.Declare(TypeDeclaration::Class("BadMembers.Thing"),
                              [](TypeBuilder &b) { b.field(MemberFlags::Public, "", b.ref("System.Int32")); });
  REQUIRE(binding.has_value());

  auto first = binding->Get();
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().code == ErrorCode::InvalidArgument);

  auto second = GetTypeByName("BadMembers.Thing");
  REQUIRE_FALSE(second.has_value());
  CHECK(second.error().code == ErrorCode::TypeInitialization);
}

TEST_CASE("DeriveFromInterfaceIsRejected", "[runtime][Registry]")
{
  using namespace TypeLoom::Runtime;
  TypeLoomTests::ScopedSink sink;

  auto unit = DeclareLoadUnit("BadBase.Lib").value();
  REQUIRE(unit.Declare(TypeDeclaration::Interface("BadBase.IThing")).has_value());
  REQUIRE(unit.Declare(TypeDeclaration::Class("BadBase.Thing").base(unit.Ref("BadBase.IThing"))).has_value());

  auto r = unit.GetType("BadBase.Thing");
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::InvalidArgument);
}
