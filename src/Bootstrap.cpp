#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Type.hpp>
#include <TypeLoom/Runtime/TypeBuilder.hpp>

#include <cstdint>
#include <string>
#include <utility>

namespace TypeLoom::Runtime::detail
{

  namespace
  {
    template <class T>
    bool NativeEquals(const Any &a, const Any &b)
    {
      return a.GetTypeId() == TypeIdOf<T>() && b.GetTypeId() == TypeIdOf<T>() && a.Cast<T>() == b.Cast<T>();
    }

    bool ValuesEqual(const Any &a, const Any &b)
    {
      if (IsNull(a) || IsNull(b))
        return IsNull(a) && IsNull(b);
      if (a.GetTypeId() != b.GetTypeId())
        return false;
      if (a.GetTypeId() == TypeIdOf<ObjectRef>())
        return a.Cast<ObjectRef>() == b.Cast<ObjectRef>();
      if (a.GetTypeId() == TypeIdOf<ArrayRef>())
        return a.Cast<ArrayRef>() == b.Cast<ArrayRef>();
      if (a.GetTypeId() == TypeIdOf<EnumValue>())
        return a.Cast<EnumValue>().type == b.Cast<EnumValue>().type && a.Cast<EnumValue>().value == b.Cast<EnumValue>().value;
      if (a.GetTypeId() == TypeIdOf<TypeHandle>())
        return a.Cast<TypeHandle>() == b.Cast<TypeHandle>();
      return NativeEquals<bool>(a, b) || NativeEquals<std::int32_t>(a, b) || NativeEquals<std::int64_t>(a, b) ||
             NativeEquals<double>(a, b) || NativeEquals<std::string>(a, b);
    }

    // Element type of a closed System.Array instantiation; invalid for the definition itself.
    TypeHandle ArrayElementType(TypeHandle arrayType)
    {
      const auto &d = Desc(arrayType);
      if (d.genericArguments.Size() != 1)
        return TypeHandle{};
      auto element = ResolveToType(d.genericArguments[0], arrayType);
      return element ? *element : TypeHandle{};
    }

    bool ArrayValueCheck(const Any &value, TypeHandle expected)
    {
      if (value.GetTypeId() != TypeIdOf<ArrayRef>())
        return false;
      const auto &array = value.Cast<ArrayRef>();
      if (!array)
        return true;
      const auto element = ArrayElementType(expected);
      if (!IsTypeAlive(element))
        return true;
      return array->elementType == element || IsAssignableTo(array->elementType, element);
    }

    template <class T>
    void DeclareNative(LoadUnitHandle core, std::string_view name, T defaultValue,
                       std::function<std::string(const T &)> format)
    {
      auto r = DeclareType(core, TypeDeclaration::Struct(name),
                           [defaultValue, format = std::move(format)](TypeBuilder &b)
                           {
                             auto &d = Desc(b.handle());
                             d.isNativeType = true;
                             d.nativeTypeId = TypeIdOf<T>();
                             d.nativeDefault = [defaultValue]() { return Any{defaultValue}; };
                             BindNativeType<T>(d.binding);
                             b.method(MemberFlags::Public, "ToString", MethodSignature{b.ref("System.String"), {}},
                                      [format](const CallFrame &f) -> std::expected<Any, Error>
                                      {
                                        if (f.self.GetTypeId() != TypeIdOf<T>())
                                          return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is not a native value"});
                                        return Any{format(f.self.Cast<T>())};
                                      });
                           });
      if (!r)
        ReportError(r.error());
    }

    void Declare(LoadUnitHandle core, const TypeDeclaration &declaration, std::function<void(TypeBuilder &)> members = {})
    {
      auto r = DeclareType(core, declaration, std::move(members));
      if (!r)
        ReportError(r.error());
    }

    void DeclareObject(LoadUnitHandle core)
    {
      Declare(core, TypeDeclaration::Class("System.Object").no_base(),
              [](TypeBuilder &b)
              {
                b.method(MemberFlags::Public, "ToString", MethodSignature{b.ref("System.String"), {}},
                         [](const CallFrame &f) -> std::expected<Any, Error>
                         {
                           const auto type = ValueTypeOf(f.self);
                           if (!IsTypeAlive(type))
                             return std::unexpected(Error{ErrorCode::InvalidArgument, "ToString called without a receiver"});
                           return Any{std::string{Desc(type).fullName}};
                         });
                b.method(MemberFlags::Public, "GetType", MethodSignature{b.ref("System.Type"), {}},
                         [](const CallFrame &f) -> std::expected<Any, Error>
                         {
                           const auto type = ValueTypeOf(f.self);
                           if (!IsTypeAlive(type))
                             return std::unexpected(Error{ErrorCode::InvalidArgument, "GetType called without a receiver"});
                           return Any{GetRuntimeTypeObject(type)};
                         });
                b.method(MemberFlags::Public, "Equals", MethodSignature{b.ref("System.Boolean"), {b.self_ref()}},
                         [](const CallFrame &f) -> std::expected<Any, Error>
                         {
                           return Any{ValuesEqual(f.self, f.arguments[0])};
                         });
                b.raw_method(MemberFlags::None, "MemberwiseClone",
                             [](const CallFrame &f) -> std::expected<Any, Error>
                             {
                               return MemberwiseClone(f.self);
                             });
                // From here on type objects are real RuntimeType instances.
                GetRegistry().rootInitialized = true;
              });
    }

    void DeclareReflectionTypes(LoadUnitHandle core)
    {
      Declare(core, TypeDeclaration::Class("System.Reflection.MemberInfo"));
      Declare(core, TypeDeclaration::Class("System.Type").base(TypeReference::Named(core, "System.Reflection.MemberInfo")));
      Declare(core, TypeDeclaration::Class("System.RuntimeType").base(TypeReference::Named(core, "System.Type")),
              [](TypeBuilder &b)
              {
                auto fullName = [](const CallFrame &f) -> std::expected<Any, Error>
                {
                  const auto self = f.Self();
                  if (!self || !IsTypeAlive(self->ReflectedType()))
                    return std::unexpected(Error{ErrorCode::InvalidOperation, "type object does not describe a type"});
                  return Any{std::string{Desc(self->ReflectedType()).fullName}};
                };
                b.method(MemberFlags::Public, "get_FullName", MethodSignature{b.ref("System.String"), {}}, fullName);
                b.property(MemberFlags::Public, "FullName", b.ref("System.String"));
                b.method(MemberFlags::Public, "ToString", MethodSignature{b.ref("System.String"), {}}, fullName);
              });
    }
  } // namespace

  void DeclareCoreTypes()
  {
    auto &reg = GetRegistry();
    const auto core = GetOrCreateLoadUnit(CoreLoadUnitName);
    reg.coreUnit = core;

    DeclareObject(core);
    Declare(core, TypeDeclaration::Class("System.ValueType"));
    Declare(core, TypeDeclaration::Class("System.Enum").base(TypeReference::Named(core, "System.ValueType")),
            [](TypeBuilder &b)
            {
              b.method(MemberFlags::Public, "ToString", MethodSignature{b.ref("System.String"), {}},
                       [](const CallFrame &f) -> std::expected<Any, Error>
                       {
                         if (f.self.GetTypeId() != TypeIdOf<EnumValue>())
                           return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is not an enum value"});
                         const auto value = f.self.Cast<EnumValue>();
                         if (auto name = Type{value.type}.EnumName(value.value))
                           return Any{std::string{*name}};
                         return Any{std::to_string(value.value)};
                       });
            });

    Declare(core, TypeDeclaration::Class("System.String"),
            [](TypeBuilder &b)
            {
              auto &d = Desc(b.handle());
              d.isNativeType = true;
              d.nativeTypeId = TypeIdOf<std::string>();
              BindNativeType<std::string>(d.binding);
              b.method(MemberFlags::Public, "ToString", MethodSignature{b.self_ref(), {}},
                       [](const CallFrame &f) -> std::expected<Any, Error> { return f.self; });
              b.method(MemberFlags::Public, "get_Length", MethodSignature{b.ref("System.Int32"), {}},
                       [](const CallFrame &f) -> std::expected<Any, Error>
                       {
                         if (f.self.GetTypeId() != TypeIdOf<std::string>())
                           return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is not a string"});
                         return Any{static_cast<std::int32_t>(f.self.Cast<std::string>().size())};
                       });
              b.property(MemberFlags::Public, "Length", b.ref("System.Int32"));
            });

    DeclareNative<bool>(core, "System.Boolean", false, [](const bool &v) { return std::string{v ? "True" : "False"}; });
    DeclareNative<std::int32_t>(core, "System.Int32", 0, [](const std::int32_t &v) { return std::to_string(v); });
    DeclareNative<std::int64_t>(core, "System.Int64", 0, [](const std::int64_t &v) { return std::to_string(v); });
    DeclareNative<double>(core, "System.Double", 0.0, [](const double &v) { return std::to_string(v); });

    Declare(core, TypeDeclaration::Class("System.Array").generic_parameter("T").custom_check(&ArrayValueCheck),
            [](TypeBuilder &b)
            {
              b.method(MemberFlags::Public, "get_Length", MethodSignature{b.ref("System.Int32"), {}},
                       [](const CallFrame &f) -> std::expected<Any, Error>
                       {
                         if (f.self.GetTypeId() != TypeIdOf<ArrayRef>() || !f.self.Cast<ArrayRef>())
                           return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is not an array"});
                         return Any{static_cast<std::int32_t>(f.self.Cast<ArrayRef>()->items.Size())};
                       });
              b.property(MemberFlags::Public, "Length", b.ref("System.Int32"));
            });

    DeclareReflectionTypes(core);

    const auto &unit = *reg.loadUnits[core.index];
    for (NGIN::UIntSize i = 0; i < unit.bindingList.Size(); ++i)
      reg.bindings[unit.bindingList[i]]->sealed = true;
  }

  void EnsureCoreTypes()
  {
    auto &reg = GetRegistry();
    if (reg.coreDeclared)
      return;
    // Declaring the core types re-enters the public entry points.
    reg.coreDeclared = true;
    DeclareCoreTypes();
  }

  std::expected<TypeHandle, Error> GetCoreType(std::string_view name)
  {
    EnsureCoreTypes();
    auto binding = ResolveBindingName(GetRegistry().coreUnit, name);
    if (!binding)
      return std::unexpected(binding.error());
    return GetBoundType(*binding, true);
  }

  ObjectRef GetRuntimeTypeObject(TypeHandle h)
  {
    auto &reg = GetRegistry();
    if (!IsTypeAlive(h))
      return {};
    if (!reg.rootInitialized)
    {
      if (!reg.stubTypeObject)
        reg.stubTypeObject = std::make_shared<Instance>(TypeHandle{}, NGIN::Containers::Vector<Any>{});
      return reg.stubTypeObject;
    }
    if (Desc(h).typeObject && Desc(h).typeObject != reg.stubTypeObject)
      return Desc(h).typeObject;

    auto runtimeType = GetCoreType("System.RuntimeType");
    if (!runtimeType)
    {
      ReportError(runtimeType.error());
      return {};
    }
    auto object = AllocateInstance(*runtimeType);
    if (!object)
    {
      ReportError(object.error());
      return {};
    }
    (*object)->SetReflectedType(h);
    Desc(h).typeObject = *object;
    return *object;
  }

} // namespace TypeLoom::Runtime::detail
