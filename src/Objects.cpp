#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Type.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace TypeLoom::Runtime
{

  std::expected<Any, Error> Instance::GetField(std::string_view name) const
  {
    if (!detail::IsTypeAlive(m_type))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "instance has no type"});
    const auto &d = detail::Desc(m_type);
    NameId id{};
    if (detail::FindNameId(name, id))
    {
      if (auto *p = d.instanceFieldIndex.GetPtr(id); p && *p < m_fields.Size())
        return m_fields[*p];
    }
    return std::unexpected(Error{ErrorCode::NotFound,
                                 detail::FormatMessage({"Type '", d.fullName, "' has no instance field '", name, "'"})});
  }

  std::expected<void, Error> Instance::SetField(std::string_view name, Any value)
  {
    if (!detail::IsTypeAlive(m_type))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "instance has no type"});
    const auto &d = detail::Desc(m_type);
    NameId id{};
    if (detail::FindNameId(name, id))
    {
      if (auto *p = d.instanceFieldIndex.GetPtr(id); p && *p < m_fields.Size())
      {
        m_fields[*p] = std::move(value);
        return {};
      }
    }
    return std::unexpected(Error{ErrorCode::NotFound,
                                 detail::FormatMessage({"Type '", d.fullName, "' has no instance field '", name, "'"})});
  }

  ObjectRef CallFrame::Self() const
  {
    if (self.GetTypeId() != detail::TypeIdOf<ObjectRef>())
      return {};
    return self.Cast<ObjectRef>();
  }

  Any Null()
  {
    return Any{ObjectRef{}};
  }

  bool IsNull(const Any &value)
  {
    if (!value.HasValue())
      return true;
    if (value.GetTypeId() == detail::TypeIdOf<ObjectRef>())
      return !value.Cast<ObjectRef>();
    if (value.GetTypeId() == detail::TypeIdOf<ArrayRef>())
      return !value.Cast<ArrayRef>();
    return false;
  }

  bool IsObject(const Any &value)
  {
    return value.GetTypeId() == detail::TypeIdOf<ObjectRef>() && value.Cast<ObjectRef>() != nullptr;
  }

  Any MemberwiseClone(const Any &value)
  {
    if (IsObject(value))
      return Any{std::make_shared<Instance>(*value.Cast<ObjectRef>())};
    if (value.GetTypeId() == detail::TypeIdOf<ArrayRef>() && value.Cast<ArrayRef>())
      return Any{std::make_shared<ArrayInstance>(*value.Cast<ArrayRef>())};
    return value;
  }

  namespace detail
  {
    namespace
    {
      std::string_view CoreNameForNative(NGIN::UInt64 typeId)
      {
        if (typeId == TypeIdOf<bool>())
          return "System.Boolean";
        if (typeId == TypeIdOf<std::int32_t>())
          return "System.Int32";
        if (typeId == TypeIdOf<std::int64_t>())
          return "System.Int64";
        if (typeId == TypeIdOf<double>())
          return "System.Double";
        if (typeId == TypeIdOf<std::string>())
          return "System.String";
        return {};
      }

      std::string_view DisplayTypeOf(const Any &value)
      {
        if (IsNull(value))
          return "null";
        const auto type = ValueTypeOf(value);
        return IsTypeAlive(type) ? Desc(type).fullName : std::string_view{"<unknown>"};
      }
    } // namespace

    TypeHandle ValueTypeOf(const Any &value)
    {
      if (!value.HasValue())
        return TypeHandle{};
      const auto id = value.GetTypeId();
      if (id == TypeIdOf<ObjectRef>())
      {
        const auto &object = value.Cast<ObjectRef>();
        return object ? object->GetTypeHandle() : TypeHandle{};
      }
      if (id == TypeIdOf<ArrayRef>())
      {
        const auto &array = value.Cast<ArrayRef>();
        return array ? array->arrayType : TypeHandle{};
      }
      if (id == TypeIdOf<EnumValue>())
        return value.Cast<EnumValue>().type;
      if (id == TypeIdOf<TypeHandle>())
      {
        auto runtimeType = GetCoreType("System.RuntimeType");
        return runtimeType ? *runtimeType : TypeHandle{};
      }

      auto &reg = GetRegistry();
      if (auto *p = reg.nativeTypes.GetPtr(id))
      {
        auto bound = GetBoundType(BindingHandle{*p}, true);
        return bound ? *bound : TypeHandle{};
      }
      // Native types bind themselves when first constructed.
      const auto coreName = CoreNameForNative(id);
      if (coreName.empty())
        return TypeHandle{};
      auto core = GetCoreType(coreName);
      return core ? *core : TypeHandle{};
    }

    std::expected<Any, Error> InvokeSlot(const MemberSlot &slot, const Any &self, std::span<const Any> args, TypeHandle boundType)
    {
      if (slot.isRemoved || !slot.body)
        return std::unexpected(Error{ErrorCode::NotFound, "member slot has no body"});
      CallFrame frame{};
      frame.self = self;
      frame.arguments = args;
      frame.boundType = boundType;
      return slot.body(frame);
    }

    std::expected<Any, Error> InvokeMember(TypeHandle type, const Any &self, NameId key, bool isStatic, std::span<const Any> args)
    {
      if (!IsTypeAlive(type))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
      auto &d = Desc(type);
      if (!d.methodGroupsBuilt && d.isClosed && d.kind != TypeKind::Interface)
      {
        auto built = BuildMethodGroups(type);
        if (!built)
          ReportError(built.error());
      }
      const auto *found = FindSlot(type, key, isStatic);
      if (!found)
        return std::unexpected(Error{ErrorCode::NotFound,
                                     FormatMessage({"The ", isStatic ? "static" : "instance", " member '", d.fullName, ".",
                                                    NameFromId(key), "' is not defined."})});
      // Invoking may grow the table the slot lives in.
      MemberSlot slot = *found;
      if (slot.argumentCount && *slot.argumentCount != args.size())
      {
        OverloadDiagnostic diag{};
        diag.candidateIndex = 0;
        diag.arity = *slot.argumentCount;
        diag.code = DiagnosticCode::ArityMismatch;
        NGIN::Containers::Vector<OverloadDiagnostic> diags;
        diags.PushBack(diag);
        Error err{ErrorCode::NoApplicableOverload,
                  FormatMessage({"No overload of ", d.fullName, ".", NameFromId(key), " can accept ", std::to_string(args.size()),
                                 " argument(s)."}),
                  std::move(diags)};
        err.closestMethodIndex = 0u;
        return std::unexpected(std::move(err));
      }
      return InvokeSlot(slot, self, args, type);
    }

    std::expected<ObjectRef, Error> AllocateInstance(TypeHandle h)
    {
      if (!IsTypeAlive(h))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
      LayoutFields(h);
      const auto &d = Desc(h);
      NGIN::Containers::Vector<Any> fields;
      fields.Reserve(d.instanceFields.Size());
      for (NGIN::UIntSize i = 0; i < d.instanceFields.Size(); ++i)
      {
        const auto &f = d.instanceFields[i];
        if (f.defaultValue)
        {
          fields.PushBack(f.defaultValue());
          continue;
        }
        auto value = DefaultValueFor(f.fieldType, f.declaringType);
        if (!value)
          return std::unexpected(value.error());
        fields.PushBack(std::move(*value));
      }
      return std::make_shared<Instance>(h, std::move(fields));
    }
  } // namespace detail

  ExpectedValue Invoke(const Any &target, std::string_view name, std::span<const Any> args)
  {
    detail::EnsureCoreTypes();
    if (IsNull(target))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Cannot invoke '", name, "' on a null reference"})});
    const auto type = detail::ValueTypeOf(target);
    if (!detail::IsTypeAlive(type))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Cannot invoke '", name, "': the value has no runtime type"})});
    return detail::InvokeMember(type, target, detail::InternNameId(EscapeName(name)), false, args);
  }

  ExpectedValue InvokeGeneric(const Any &target, std::string_view name, std::span<const Type> genericArguments,
                              std::span<const Any> args)
  {
    std::vector<Any> all;
    all.reserve(genericArguments.size() + args.size());
    for (const auto &g : genericArguments)
      all.push_back(Any{g.Handle()});
    for (const auto &a : args)
      all.push_back(a);
    return Invoke(target, name, std::span<const Any>{all.data(), all.size()});
  }

  ExpectedValue CallVirtual(const Any &target, std::string_view name, const MethodSignature &signature, std::span<const Any> args)
  {
    detail::EnsureCoreTypes();
    if (IsNull(target))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Cannot invoke '", name, "' on a null reference"})});
    const auto type = detail::ValueTypeOf(target);
    if (!detail::IsTypeAlive(type))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Cannot invoke '", name, "': the value has no runtime type"})});
    auto key = signature.GetKey(EscapeName(name));
    if (!key)
      return std::unexpected(key.error());
    return detail::InvokeMember(type, target, detail::InternNameId(*key), false, args);
  }

  ExpectedValue GetField(const Any &target, std::string_view name)
  {
    if (!IsObject(target))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Cannot read field '", name, "' of a value that is not an object"})});
    return target.Cast<ObjectRef>()->GetField(name);
  }

  std::expected<void, Error> SetField(const Any &target, std::string_view name, Any value)
  {
    if (!IsObject(target))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Cannot write field '", name, "' of a value that is not an object"})});
    return target.Cast<ObjectRef>()->SetField(name, std::move(value));
  }

  ExpectedValue GetProperty(const Any &target, std::string_view name)
  {
    return Invoke(target, detail::FormatMessage({"get_", name}));
  }

  std::expected<void, Error> SetProperty(const Any &target, std::string_view name, Any value)
  {
    std::array<Any, 1> args{std::move(value)};
    auto r = Invoke(target, detail::FormatMessage({"set_", name}), std::span<const Any>{args.data(), args.size()});
    if (!r)
      return std::unexpected(r.error());
    return {};
  }

  ExpectedValue Cast(const Any &value, const Type &target)
  {
    if (!target.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    if (detail::CheckValue(value, target.Handle()))
      return value;
    return std::unexpected(Error{ErrorCode::InvalidCast,
                                 detail::FormatMessage({"Unable to cast object of type '", detail::DisplayTypeOf(value), "' to type '",
                                                        target.FullName(), "'"})});
  }

  ExpectedValue TryCast(const Any &value, const Type &target)
  {
    if (!target.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    if (!detail::Desc(target.Handle()).isReferenceType)
      return std::unexpected(Error{ErrorCode::InvalidOperation,
                                   detail::FormatMessage({"TryCast cannot be used with the value type '", target.FullName(), "'"})});
    if (detail::CheckValue(value, target.Handle()))
      return value;
    return Null();
  }

  std::optional<Type> GetValueType(const Any &value)
  {
    detail::EnsureCoreTypes();
    const auto type = detail::ValueTypeOf(value);
    if (!detail::IsTypeAlive(type))
      return std::nullopt;
    return Type{type};
  }

  ExpectedType GetArrayType(const Type &elementType)
  {
    if (!elementType.IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "Array element type is null or undefined"});
    auto array = detail::GetCoreType("System.Array");
    if (!array)
      return std::unexpected(array.error());
    return Type{*array}.Of({TypeReference::Of(elementType)});
  }

  ExpectedValue NewArray(const Type &elementType, NGIN::UIntSize length)
  {
    auto arrayType = GetArrayType(elementType);
    if (!arrayType)
      return std::unexpected(arrayType.error());
    auto fill = detail::DefaultValueFor(TypeReference::Of(elementType), elementType.Handle());
    if (!fill)
      return std::unexpected(fill.error());

    auto array = std::make_shared<ArrayInstance>();
    array->arrayType = arrayType->Handle();
    array->elementType = elementType.Handle();
    array->items.Reserve(length);
    for (NGIN::UIntSize i = 0; i < length; ++i)
      array->items.PushBack(MemberwiseClone(*fill));
    return Any{std::move(array)};
  }

} // namespace TypeLoom::Runtime
