#include <TypeLoom/Runtime/Runtime.hpp>

#include <cstdint>
#include <iostream>
#include <string>

namespace Demo {
  using namespace TypeLoom::Runtime;

  void DeclareShapes(const LoadUnit &unit) {
    (void)unit.Declare(TypeDeclaration::Class("Demo.Shape"), [](TypeBuilder &b) {
      b.field(MemberFlags::Public, "Name", b.ref("System.String"));
      b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {b.ref("System.String")}},
                    [](const CallFrame &f) -> std::expected<Any, Error> {
                      auto set = f.Self()->SetField("Name", f.arguments[0]);
                      if (!set)
                        return std::unexpected(set.error());
                      return Any::MakeVoid();
                    });
      b.method(MemberFlags::Public, "Describe", MethodSignature{b.ref("System.String"), {}},
               [](const CallFrame &f) -> std::expected<Any, Error> {
                 auto name = f.Self()->GetField("Name");
                 if (!name)
                   return std::unexpected(name.error());
                 return Any{std::string{"shape "} + name->Cast<std::string>()};
               });
    });
    (void)unit.Declare(TypeDeclaration::Class("Demo.Square").base(unit.Ref("Demo.Shape")), [](TypeBuilder &b) {
      b.constructor(MemberFlags::Public, MethodSignature{TypeReference{}, {b.ref("System.String")}},
                    [](const CallFrame &f) -> std::expected<Any, Error> {
                      auto set = f.Self()->SetField("Name", f.arguments[0]);
                      if (!set)
                        return std::unexpected(set.error());
                      return Any::MakeVoid();
                    });
      b.method(MemberFlags::Public, "Describe", MethodSignature{b.ref("System.String"), {}},
               [](const CallFrame &) -> std::expected<Any, Error> { return Any{std::string{"a square"}}; });
    });
  }
}

int main() {
  using namespace TypeLoom::Runtime;

  auto unit = DeclareLoadUnit("Demo.Shapes");
  if (!unit) {
    std::cerr << unit.error().message << "\n";
    return 1;
  }
  Demo::DeclareShapes(*unit);
  unit->Seal();

  auto square = unit->GetType("Demo.Square");
  if (!square) {
    std::cerr << square.error().message << "\n";
    return 1;
  }
  std::cout << "Type: " << square->FullName() << "\n";
  std::cout << "Base: " << square->BaseType()->FullName() << "\n";

  auto instance = square->New(std::string{"s1"});
  if (!instance) {
    std::cerr << instance.error().message << "\n";
    return 1;
  }
  std::cout << "Describe(): " << InvokeAs<std::string>(*instance, "Describe").value_or("?") << "\n";
  std::cout << "ToString(): " << InvokeAs<std::string>(*instance, "ToString").value_or("?") << "\n";

  auto methods = square->GetMethods();
  std::cout << "Methods:\n";
  for (NGIN::UIntSize i = 0; i < methods.Size(); ++i)
    std::cout << "  " << methods[i].ToString() << "\n";

  auto array = GetArrayType(*square);
  if (array)
    std::cout << "Array type: " << array->FullName() << "\n";
  return 0;
}
