#include <TypeLoom/Runtime/TypeReference.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Type.hpp>

#include <string>

namespace TypeLoom::Runtime
{

  namespace detail
  {
    struct TypeReferenceData
    {
      TypeReferenceKind kind{TypeReferenceKind::Null};
      TypeHandle handle{};
      LoadUnitHandle unit{};
      std::string_view name{};
      std::string_view ownerName{};
      NGIN::UInt32 position{0};
      NGIN::Containers::Vector<TypeReference> genericArguments{};
    };
  } // namespace detail

  namespace
  {
    constexpr NGIN::UInt32 kMaxBindingDepth = 64;

    std::string_view PositionalName(NGIN::UInt32 index)
    {
      std::string s{"!!"};
      s += std::to_string(index);
      return detail::InternName(s);
    }
  } // namespace

  TypeReference TypeReference::Of(TypeHandle handle)
  {
    auto data = std::make_shared<detail::TypeReferenceData>();
    data->kind = handle.IsValid() ? TypeReferenceKind::Resolved : TypeReferenceKind::Null;
    data->handle = handle;
    return TypeReference{std::move(data)};
  }

  TypeReference TypeReference::Of(const Type &type)
  {
    return Of(type.Handle());
  }

  TypeReference TypeReference::Named(LoadUnitHandle unit, std::string_view name)
  {
    auto data = std::make_shared<detail::TypeReferenceData>();
    data->kind = TypeReferenceKind::Named;
    data->unit = unit;
    data->name = detail::InternName(name);
    return TypeReference{std::move(data)};
  }

  TypeReference TypeReference::Named(LoadUnitHandle unit, std::string_view name, std::initializer_list<TypeReference> genericArguments)
  {
    auto data = std::make_shared<detail::TypeReferenceData>();
    data->kind = TypeReferenceKind::Named;
    data->unit = unit;
    data->name = detail::InternName(name);
    data->genericArguments.Reserve(genericArguments.size());
    for (const auto &arg : genericArguments)
      data->genericArguments.PushBack(arg);
    return TypeReference{std::move(data)};
  }

  TypeReference TypeReference::Named(LoadUnitHandle unit, std::string_view name, const NGIN::Containers::Vector<TypeReference> &genericArguments)
  {
    auto data = std::make_shared<detail::TypeReferenceData>();
    data->kind = TypeReferenceKind::Named;
    data->unit = unit;
    data->name = detail::InternName(name);
    data->genericArguments = genericArguments;
    return TypeReference{std::move(data)};
  }

  TypeReference TypeReference::Parameter(LoadUnitHandle unit, std::string_view ownerName, std::string_view name)
  {
    auto data = std::make_shared<detail::TypeReferenceData>();
    data->kind = TypeReferenceKind::GenericParameter;
    data->unit = unit;
    data->ownerName = detail::InternName(ownerName);
    data->name = detail::InternName(name);
    return TypeReference{std::move(data)};
  }

  TypeReference TypeReference::Positional(NGIN::UInt32 index)
  {
    auto data = std::make_shared<detail::TypeReferenceData>();
    data->kind = TypeReferenceKind::PositionalParameter;
    data->position = index;
    data->name = PositionalName(index);
    return TypeReference{std::move(data)};
  }

  TypeReferenceKind TypeReference::Kind() const noexcept
  {
    return m_data ? m_data->kind : TypeReferenceKind::Null;
  }

  TypeHandle TypeReference::GetHandle() const noexcept
  {
    return m_data ? m_data->handle : TypeHandle{};
  }

  LoadUnitHandle TypeReference::GetLoadUnit() const noexcept
  {
    return m_data ? m_data->unit : LoadUnitHandle{};
  }

  std::string_view TypeReference::GetName() const noexcept
  {
    return m_data ? m_data->name : std::string_view{};
  }

  std::string_view TypeReference::GetOwnerName() const noexcept
  {
    return m_data ? m_data->ownerName : std::string_view{};
  }

  NGIN::UInt32 TypeReference::GetPosition() const noexcept
  {
    return m_data ? m_data->position : 0;
  }

  NGIN::UIntSize TypeReference::GenericArgumentCount() const noexcept
  {
    return m_data ? m_data->genericArguments.Size() : 0;
  }

  const TypeReference &TypeReference::GenericArgumentAt(NGIN::UIntSize i) const
  {
    return m_data->genericArguments[i];
  }

  std::expected<std::string_view, Error> TypeReference::GetTypeId() const
  {
    switch (Kind())
    {
    case TypeReferenceKind::Null:
      return std::unexpected(Error{ErrorCode::InvalidArgument, "the null type reference has no identity"});
    case TypeReferenceKind::Resolved:
      if (!detail::IsTypeAlive(m_data->handle))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
      return detail::Desc(m_data->handle).typeId;
    case TypeReferenceKind::Named:
    {
      const auto id = detail::AssignTypeId(m_data->unit, m_data->name);
      if (m_data->genericArguments.Size() == 0)
        return id;
      auto args = HashTypeArgumentArray(m_data->genericArguments);
      if (!args)
        return std::unexpected(args.error());
      return detail::FormatMessage({id, "[", *args, "]"});
    }
    case TypeReferenceKind::GenericParameter:
      return detail::AssignGenericParameterId(m_data->unit, m_data->ownerName, m_data->name);
    case TypeReferenceKind::PositionalParameter:
      return m_data->name;
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "unknown reference kind"});
  }

  std::string TypeReference::ToString() const
  {
    switch (Kind())
    {
    case TypeReferenceKind::Null:
      return "void";
    case TypeReferenceKind::Resolved:
      if (!detail::IsTypeAlive(m_data->handle))
        return "<stale>";
      return std::string{detail::Desc(m_data->handle).fullName};
    case TypeReferenceKind::Named:
    {
      std::string s{m_data->name};
      if (m_data->genericArguments.Size() > 0)
      {
        s += '[';
        for (NGIN::UIntSize i = 0; i < m_data->genericArguments.Size(); ++i)
        {
          if (i > 0)
            s += ", ";
          s += m_data->genericArguments[i].ToString();
        }
        s += ']';
      }
      return s;
    }
    case TypeReferenceKind::GenericParameter:
    case TypeReferenceKind::PositionalParameter:
      return std::string{m_data->name};
    }
    return {};
  }

  // MethodSignature
  MethodSignature::MethodSignature(TypeReference returnType, std::initializer_list<TypeReference> argumentTypes)
      : m_returnType(std::move(returnType))
  {
    m_argumentTypes.Reserve(argumentTypes.size());
    for (const auto &arg : argumentTypes)
      m_argumentTypes.PushBack(arg);
  }

  MethodSignature::MethodSignature(TypeReference returnType, std::initializer_list<TypeReference> argumentTypes,
                                   std::initializer_list<std::string_view> genericParameterNames)
      : MethodSignature(std::move(returnType), argumentTypes)
  {
    m_genericParameterNames.Reserve(genericParameterNames.size());
    for (auto name : genericParameterNames)
      m_genericParameterNames.PushBack(detail::InternName(name));
  }

  MethodSignature::MethodSignature(TypeReference returnType, NGIN::Containers::Vector<TypeReference> argumentTypes,
                                   NGIN::Containers::Vector<std::string_view> genericParameterNames)
      : m_returnType(std::move(returnType)), m_argumentTypes(std::move(argumentTypes)),
        m_genericParameterNames(std::move(genericParameterNames))
  {
  }

  std::expected<std::string_view, Error> MethodSignature::Hash() const
  {
    if (!m_hash.empty())
      return m_hash;

    std::string h;
    if (m_genericParameterNames.Size() > 0)
    {
      h += '`';
      h += std::to_string(m_genericParameterNames.Size());
    }
    h += '$';
    auto args = HashTypeArgumentArray(m_argumentTypes);
    if (!args)
      return std::unexpected(args.error());
    h += *args;
    h += '=';
    if (m_returnType.IsNull())
    {
      h += "void";
    }
    else
    {
      auto ret = m_returnType.GetTypeId();
      if (!ret)
        return std::unexpected(ret.error());
      h += *ret;
    }
    m_hash = detail::InternName(h);
    return m_hash;
  }

  std::expected<std::string_view, Error> MethodSignature::GetKey(std::string_view escapedName) const
  {
    auto h = Hash();
    if (!h)
      return std::unexpected(h.error());
    return detail::FormatMessage({escapedName, *h});
  }

  std::string MethodSignature::ToString(std::string_view methodFullName) const
  {
    std::string s = m_returnType.ToString();
    s += ' ';
    s += methodFullName;
    if (m_genericParameterNames.Size() > 0)
    {
      s += '<';
      for (NGIN::UIntSize i = 0; i < m_genericParameterNames.Size(); ++i)
      {
        if (i > 0)
          s += ", ";
        s += m_genericParameterNames[i];
      }
      s += '>';
    }
    s += '(';
    for (NGIN::UIntSize i = 0; i < m_argumentTypes.Size(); ++i)
    {
      if (i > 0)
        s += ", ";
      s += m_argumentTypes[i].ToString();
    }
    s += ')';
    return s;
  }

  std::expected<std::string_view, Error> HashTypeArgumentArray(const NGIN::Containers::Vector<TypeReference> &arguments)
  {
    if (arguments.Size() == 0)
      return std::string_view{"void"};
    std::string s;
    for (NGIN::UIntSize i = 0; i < arguments.Size(); ++i)
    {
      if (arguments[i].IsNull())
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     detail::FormatMessage({"Type argument ", std::to_string(i), " is null or undefined"})});
      auto id = arguments[i].GetTypeId();
      if (!id)
        return std::unexpected(id.error());
      if (i > 0)
        s += ',';
      s += *id;
    }
    return detail::InternName(s);
  }

  namespace detail
  {
    std::expected<std::string_view, Error> ReferenceId(const TypeReference &ref)
    {
      if (ref.IsNull())
        return std::string_view{"void"};
      return ref.GetTypeId();
    }

    NameId GenericParameterIdOf(const TypeReference &ref)
    {
      if (ref.Kind() != TypeReferenceKind::GenericParameter)
        return InvalidNameId;
      auto id = ref.GetTypeId();
      if (!id)
        return InvalidNameId;
      return InternNameId(*id);
    }

    const TypeReference *FindGenericBinding(TypeHandle context, NameId parameterId)
    {
      TypeHandle cur = context;
      while (IsTypeAlive(cur))
      {
        const auto &d = Desc(cur);
        for (NGIN::UIntSize i = 0; i < d.genericBindings.Size(); ++i)
        {
          if (d.genericBindings[i].parameterId == parameterId)
            return &d.genericBindings[i].value;
        }
        cur = d.baseType;
      }
      return nullptr;
    }

    namespace
    {
      std::expected<TypeReference, Error> ResolveGeneric(const TypeReference &ref, TypeHandle context, NGIN::UInt32 depth)
      {
        if (depth > kMaxBindingDepth)
          return std::unexpected(Error{ErrorCode::InvalidOperation,
                                       FormatMessage({"Generic parameter '", ref.GetName(), "' could not be resolved: its bindings form a cycle"})});

        switch (ref.Kind())
        {
        case TypeReferenceKind::Null:
        case TypeReferenceKind::PositionalParameter:
          return ref;
        case TypeReferenceKind::GenericParameter:
        {
          if (!IsTypeAlive(context))
            return ref;
          const auto pid = GenericParameterIdOf(ref);
          const auto *bound = FindGenericBinding(context, pid);
          if (!bound)
            return ref;
          TypeReference value = *bound;
          // A parameter bound to itself stays unresolved.
          if (value.Kind() == TypeReferenceKind::GenericParameter && GenericParameterIdOf(value) == pid)
            return ref;
          return ResolveGeneric(value, context, depth + 1);
        }
        case TypeReferenceKind::Named:
        {
          if (ref.GenericArgumentCount() == 0)
            return ref;
          NGIN::Containers::Vector<TypeReference> args;
          args.Reserve(ref.GenericArgumentCount());
          for (NGIN::UIntSize i = 0; i < ref.GenericArgumentCount(); ++i)
          {
            auto arg = ResolveGeneric(ref.GenericArgumentAt(i), context, depth + 1);
            if (!arg)
              return std::unexpected(arg.error());
            args.PushBack(std::move(*arg));
          }
          return TypeReference::Named(ref.GetLoadUnit(), ref.GetName(), args);
        }
        case TypeReferenceKind::Resolved:
        {
          if (!IsTypeAlive(ref.GetHandle()))
            return ref;
          const auto &d = Desc(ref.GetHandle());
          if (d.isClosed || !d.openType.IsValid())
            return ref;
          // An instantiation over parameters is re-closed over whatever the context binds them to.
          NGIN::Containers::Vector<TypeReference> args;
          args.Reserve(d.genericArguments.Size());
          const auto openType = d.openType;
          const auto current = d.genericArguments;
          for (NGIN::UIntSize i = 0; i < current.Size(); ++i)
          {
            auto arg = ResolveGeneric(current[i], context, depth + 1);
            if (!arg)
              return std::unexpected(arg.error());
            args.PushBack(std::move(*arg));
          }
          auto closed = CloseNoInitialize(openType, args);
          if (!closed)
            return std::unexpected(closed.error());
          return TypeReference::Of(*closed);
        }
        }
        return ref;
      }
    } // namespace

    std::expected<TypeReference, Error> ResolveGenericReference(const TypeReference &ref, TypeHandle context)
    {
      return ResolveGeneric(ref, context, 0);
    }

    std::expected<TypeReference, Error> ResolveReference(const TypeReference &ref, TypeHandle context)
    {
      auto resolved = ResolveGenericReference(ref, context);
      if (!resolved)
        return resolved;
      if (resolved->Kind() != TypeReferenceKind::Named)
        return resolved;

      const auto &named = *resolved;
      auto binding = ResolveBindingName(named.GetLoadUnit(), named.GetName());
      if (!binding)
        return std::unexpected(binding.error());
      auto type = GetBoundType(*binding, true);
      if (!type)
        return std::unexpected(type.error());
      if (named.GenericArgumentCount() == 0)
        return TypeReference::Of(*type);

      NGIN::Containers::Vector<TypeReference> args;
      args.Reserve(named.GenericArgumentCount());
      for (NGIN::UIntSize i = 0; i < named.GenericArgumentCount(); ++i)
      {
        if (named.GenericArgumentAt(i).IsNull())
          return std::unexpected(Error{ErrorCode::InvalidArgument,
                                       FormatMessage({"Generic argument ", std::to_string(i), " of '", named.GetName(), "' is null or undefined"})});
        auto arg = ResolveReference(named.GenericArgumentAt(i), context);
        if (!arg)
          return arg;
        args.PushBack(std::move(*arg));
      }
      auto closed = Close(*type, args);
      if (!closed)
        return std::unexpected(closed.error());
      return TypeReference::Of(*closed);
    }

    std::expected<TypeHandle, Error> ResolveToType(const TypeReference &ref, TypeHandle context)
    {
      auto resolved = ResolveReference(ref, context);
      if (!resolved)
        return std::unexpected(resolved.error());
      switch (resolved->Kind())
      {
      case TypeReferenceKind::Resolved:
        return resolved->GetHandle();
      case TypeReferenceKind::Null:
        return std::unexpected(Error{ErrorCode::InvalidArgument, "cannot resolve the null type reference"});
      default:
        return std::unexpected(Error{ErrorCode::InvalidOperation,
                                     FormatMessage({"Generic parameter '", resolved->GetName(), "' is not bound in this context"})});
      }
    }

    std::expected<MethodSignature, Error> ResolveSignature(const MethodSignature &sig, TypeHandle context, bool &changed)
    {
      changed = IsOpenReference(sig.ReturnType());
      auto ret = ResolveGenericReference(sig.ReturnType(), context);
      if (!ret)
        return std::unexpected(ret.error());

      NGIN::Containers::Vector<TypeReference> args;
      args.Reserve(sig.ArgumentCount());
      for (NGIN::UIntSize i = 0; i < sig.ArgumentCount(); ++i)
      {
        if (IsOpenReference(sig.ArgumentAt(i)))
          changed = true;
        auto arg = ResolveGenericReference(sig.ArgumentAt(i), context);
        if (!arg)
          return std::unexpected(arg.error());
        args.PushBack(std::move(*arg));
      }
      if (!changed)
        return sig;

      NGIN::Containers::Vector<std::string_view> names;
      names.Reserve(sig.GenericParameterCount());
      for (NGIN::UIntSize i = 0; i < sig.GenericParameterCount(); ++i)
        names.PushBack(sig.GenericParameterAt(i));
      return MethodSignature{std::move(*ret), std::move(args), std::move(names)};
    }

    bool IsOpenReference(const TypeReference &ref)
    {
      switch (ref.Kind())
      {
      case TypeReferenceKind::GenericParameter:
      case TypeReferenceKind::PositionalParameter:
        return true;
      case TypeReferenceKind::Resolved:
        return IsTypeAlive(ref.GetHandle()) && !Desc(ref.GetHandle()).isClosed;
      case TypeReferenceKind::Named:
        for (NGIN::UIntSize i = 0; i < ref.GenericArgumentCount(); ++i)
        {
          if (IsOpenReference(ref.GenericArgumentAt(i)))
            return true;
        }
        return false;
      default:
        return false;
      }
    }

    TypeReference SubstitutePositional(const TypeReference &ref, std::span<const TypeHandle> genericArguments)
    {
      switch (ref.Kind())
      {
      case TypeReferenceKind::PositionalParameter:
        if (ref.GetPosition() < genericArguments.size())
          return TypeReference::Of(genericArguments[ref.GetPosition()]);
        return ref;
      case TypeReferenceKind::Named:
      {
        if (ref.GenericArgumentCount() == 0)
          return ref;
        NGIN::Containers::Vector<TypeReference> args;
        args.Reserve(ref.GenericArgumentCount());
        for (NGIN::UIntSize i = 0; i < ref.GenericArgumentCount(); ++i)
          args.PushBack(SubstitutePositional(ref.GenericArgumentAt(i), genericArguments));
        return TypeReference::Named(ref.GetLoadUnit(), ref.GetName(), args);
      }
      case TypeReferenceKind::Resolved:
      {
        if (!IsTypeAlive(ref.GetHandle()))
          return ref;
        const auto &d = Desc(ref.GetHandle());
        if (d.isClosed || !d.openType.IsValid())
          return ref;
        const auto openType = d.openType;
        const auto current = d.genericArguments;
        NGIN::Containers::Vector<TypeReference> args;
        args.Reserve(current.Size());
        for (NGIN::UIntSize i = 0; i < current.Size(); ++i)
          args.PushBack(SubstitutePositional(current[i], genericArguments));
        auto closed = CloseNoInitialize(openType, args);
        return closed ? TypeReference::Of(*closed) : ref;
      }
      default:
        return ref;
      }
    }
  } // namespace detail

} // namespace TypeLoom::Runtime
