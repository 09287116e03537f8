#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Type.hpp>

#include <string>
#include <utility>

namespace TypeLoom::Runtime
{

  namespace detail
  {
    namespace
    {
      // A filter pair is active only when exactly one half is requested.
      bool PassesPair(BindingFlags flags, BindingFlags yes, BindingFlags no, bool value)
      {
        const bool wantYes = HasFlag(flags, yes);
        const bool wantNo = HasFlag(flags, no);
        if (wantYes == wantNo)
          return true;
        return wantYes ? value : !value;
      }
    } // namespace

    const NGIN::Containers::Vector<MemberHandle> &GetReflectionCache(TypeHandle h)
    {
      auto &d = Desc(h);
      if (d.reflectionCacheBuilt)
        return d.reflectionCache;
      d.reflectionCacheBuilt = true;
      const auto &owner = MembersOwner(h);
      for (NGIN::UIntSize i = 0; i < owner.members.Size(); ++i)
      {
        const auto &m = owner.members[i];
        if (m.isRaw)
          continue;
        d.reflectionCache.PushBack(MemberHandle{m.kind, h.index, static_cast<NGIN::UInt32>(i)});
      }
      return d.reflectionCache;
    }

    NGIN::Containers::Vector<MemberHandle> GetMembersInternal(TypeHandle h, BindingFlags flags, std::optional<MemberKind> kind,
                                                              bool allowConstructors, std::string_view name)
    {
      NGIN::Containers::Vector<MemberHandle> out;
      if (!IsTypeAlive(h))
        return out;

      NGIN::Containers::Vector<TypeHandle> chain;
      for (TypeHandle cur = h; IsTypeAlive(cur); cur = Desc(cur).baseType)
      {
        chain.PushBack(cur);
        if (HasFlag(flags, BindingFlags::DeclaredOnly))
          break;
      }

      // Base members first.
      for (NGIN::UIntSize c = chain.Size(); c-- > 0;)
      {
        const auto level = chain[c];
        const auto &cache = GetReflectionCache(level);
        for (NGIN::UIntSize i = 0; i < cache.Size(); ++i)
        {
          const auto &m = RecordOf(cache[i]);
          if (kind && m.kind != *kind)
            continue;
          if (m.isSpecialName && !allowConstructors)
            continue;
          // Constructors are not inherited.
          if (m.kind == MemberKind::Constructor && level != h)
            continue;
          if (!PassesPair(flags, BindingFlags::Static, BindingFlags::Instance, m.isStatic))
            continue;
          if (!PassesPair(flags, BindingFlags::Public, BindingFlags::NonPublic, m.isPublic))
            continue;
          if (!name.empty() && m.name != name)
            continue;
          out.PushBack(cache[i]);
        }
      }
      return out;
    }

    namespace
    {
      std::expected<void, Error> RequireInstanceTarget(const Any &target, std::string_view member)
      {
        if (IsNull(target))
          return std::unexpected(Error{ErrorCode::InvalidArgument,
                                       FormatMessage({"Non-static member '", member, "' requires a target"})});
        return {};
      }

      std::string_view QualifiedName(MemberHandle h)
      {
        return FormatMessage({Desc(TypeHandle{h.typeIndex}).fullName, ".", RecordOf(h).name});
      }
    } // namespace
  } // namespace detail

  // Member
  std::string_view Member::Name() const
  {
    return IsValid() ? detail::RecordOf(m_h).name : std::string_view{};
  }

  bool Member::IsStatic() const
  {
    return IsValid() && detail::RecordOf(m_h).isStatic;
  }

  bool Member::IsPublic() const
  {
    return IsValid() && detail::RecordOf(m_h).isPublic;
  }

  bool Member::IsSpecialName() const
  {
    return IsValid() && detail::RecordOf(m_h).isSpecialName;
  }

  Field Member::AsField() const
  {
    return m_h.kind == MemberKind::Field ? Field{m_h} : Field{};
  }

  Method Member::AsMethod() const
  {
    return (m_h.kind == MemberKind::Method || m_h.kind == MemberKind::Constructor) ? Method{m_h} : Method{};
  }

  Property Member::AsProperty() const
  {
    return m_h.kind == MemberKind::Property ? Property{m_h} : Property{};
  }

  // Method
  std::string_view Method::Name() const
  {
    return IsValid() ? detail::RecordOf(m_h).name : std::string_view{};
  }

  bool Method::IsStatic() const
  {
    return IsValid() && detail::RecordOf(m_h).isStatic;
  }

  bool Method::IsPublic() const
  {
    return IsValid() && detail::RecordOf(m_h).isPublic;
  }

  bool Method::IsPlaceholder() const
  {
    if (!IsValid())
      return false;
    const auto &m = detail::RecordOf(m_h);
    const auto &owner = detail::MembersOwner(TypeHandle{m_h.typeIndex});
    auto key = m.signature.GetKey(m.escapedName);
    if (!key)
      return m.isPlaceholder;
    const auto *slot = detail::FindOwnSlot(m.isStatic ? owner.staticTable : owner.instanceTable, detail::InternNameId(*key));
    return slot ? slot->isPlaceholder : m.isPlaceholder;
  }

  NGIN::UIntSize Method::GenericParameterCount() const
  {
    return IsValid() ? detail::RecordOf(m_h).signature.GenericParameterCount() : 0;
  }

  NGIN::UIntSize Method::ParameterCount() const
  {
    return IsValid() ? detail::RecordOf(m_h).signature.ArgumentCount() : 0;
  }

  bool Method::ReturnsVoid() const
  {
    return !IsValid() || detail::RecordOf(m_h).signature.ReturnType().IsNull();
  }

  ExpectedType Method::ReturnType() const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid method"});
    const auto &ret = detail::RecordOf(m_h).signature.ReturnType();
    if (ret.IsNull())
      return std::unexpected(Error{ErrorCode::InvalidOperation,
                                   detail::FormatMessage({"Method '", detail::QualifiedName(m_h), "' returns void"})});
    auto r = detail::ResolveToType(ret, TypeHandle{m_h.typeIndex});
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  ExpectedType Method::ParameterType(NGIN::UIntSize i) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid method"});
    const auto &sig = detail::RecordOf(m_h).signature;
    if (i >= sig.ArgumentCount())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "parameter index out of range"});
    auto r = detail::ResolveToType(sig.ArgumentAt(i), TypeHandle{m_h.typeIndex});
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  std::expected<MethodSignature, Error> Method::Signature() const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid method"});
    bool changed = false;
    return detail::ResolveSignature(detail::RecordOf(m_h).signature, TypeHandle{m_h.typeIndex}, changed);
  }

  std::string Method::ToString() const
  {
    if (!IsValid())
      return {};
    const auto display = detail::QualifiedName(m_h);
    if (auto sig = Signature())
      return sig->ToString(display);
    return detail::RecordOf(m_h).signature.ToString(display);
  }

  ExpectedValue Method::Invoke(const Any &target, std::span<const Any> args) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid method"});
    const auto &m = detail::RecordOf(m_h);
    const auto expected = m.signature.ArgumentCount() + m.signature.GenericParameterCount();
    if (args.size() != expected)
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Method '", detail::QualifiedName(m_h), "' expects ", std::to_string(expected),
                                                          " argument(s), but ", std::to_string(args.size()), " were provided."})});
    auto sig = Signature();
    if (!sig)
      return std::unexpected(sig.error());
    auto key = sig->GetKey(m.escapedName);
    if (!key)
      return std::unexpected(key.error());
    const auto keyId = detail::InternNameId(*key);
    const TypeHandle level{m_h.typeIndex};

    if (m.isStatic)
      return detail::InvokeMember(level, Any::MakeVoid(), keyId, true, args);
    if (auto ok = detail::RequireInstanceTarget(target, m.name); !ok)
      return std::unexpected(ok.error());
    // Constructors run the declared body; other instance methods dispatch on the runtime type.
    const auto type = m.kind == MemberKind::Constructor ? level : detail::ValueTypeOf(target);
    return detail::InvokeMember(type, target, keyId, false, args);
  }

  // Field
  std::string_view Field::Name() const
  {
    return IsValid() ? detail::RecordOf(m_h).name : std::string_view{};
  }

  bool Field::IsStatic() const
  {
    return IsValid() && detail::RecordOf(m_h).isStatic;
  }

  bool Field::IsPublic() const
  {
    return IsValid() && detail::RecordOf(m_h).isPublic;
  }

  ExpectedType Field::FieldType() const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid field"});
    auto r = detail::ResolveToType(detail::RecordOf(m_h).valueType, TypeHandle{m_h.typeIndex});
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  ExpectedValue Field::GetValue(const Any &target) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid field"});
    const auto &m = detail::RecordOf(m_h);
    if (m.isStatic)
      return DeclaringType().GetStaticField(m.name);
    if (!IsObject(target))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Field '", detail::QualifiedName(m_h), "' requires an object target"})});
    const auto &object = target.Cast<ObjectRef>();
    const auto &layout = detail::Desc(object->GetTypeHandle()).instanceFields;
    const auto nameId = detail::InternNameId(m.name);
    // The slot declared at this level, even when a derived type hides it by name.
    for (NGIN::UIntSize i = 0; i < layout.Size() && i < object->FieldCount(); ++i)
    {
      if (layout[i].nameId == nameId && layout[i].declaringType.index == m_h.typeIndex)
        return object->FieldAt(i);
    }
    return object->GetField(m.name);
  }

  std::expected<void, Error> Field::SetValue(const Any &target, Any value) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid field"});
    const auto &m = detail::RecordOf(m_h);
    auto fieldType = FieldType();
    if (!fieldType)
      return std::unexpected(fieldType.error());
    if (!detail::CheckValue(value, fieldType->Handle()))
    {
      std::string_view actual{"null"};
      if (!IsNull(value))
      {
        const auto valueType = GetValueType(value);
        actual = valueType ? valueType->FullName() : std::string_view{"<unknown>"};
      }
      return std::unexpected(Error{ErrorCode::InvalidCast,
                                   detail::FormatMessage({"Cannot assign a value of type '", actual, "' to field '",
                                                          detail::QualifiedName(m_h), "' of type '", fieldType->FullName(), "'"})});
    }
    if (m.isStatic)
      return DeclaringType().SetStaticField(m.name, std::move(value));
    if (!IsObject(target))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Field '", detail::QualifiedName(m_h), "' requires an object target"})});
    const auto &object = target.Cast<ObjectRef>();
    const auto &layout = detail::Desc(object->GetTypeHandle()).instanceFields;
    const auto nameId = detail::InternNameId(m.name);
    for (NGIN::UIntSize i = 0; i < layout.Size() && i < object->FieldCount(); ++i)
    {
      if (layout[i].nameId == nameId && layout[i].declaringType.index == m_h.typeIndex)
      {
        object->FieldAt(i) = std::move(value);
        return {};
      }
    }
    return object->SetField(m.name, std::move(value));
  }

  // Property
  std::string_view Property::Name() const
  {
    return IsValid() ? detail::RecordOf(m_h).name : std::string_view{};
  }

  bool Property::IsStatic() const
  {
    return IsValid() && detail::RecordOf(m_h).isStatic;
  }

  bool Property::IsPublic() const
  {
    return IsValid() && detail::RecordOf(m_h).isPublic;
  }

  ExpectedType Property::PropertyType() const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid property"});
    const auto &type = detail::RecordOf(m_h).valueType;
    if (type.IsNull())
      return std::unexpected(Error{ErrorCode::InvalidOperation,
                                   detail::FormatMessage({"Property '", detail::QualifiedName(m_h), "' declares no type"})});
    auto r = detail::ResolveToType(type, TypeHandle{m_h.typeIndex});
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  ExpectedValue Property::GetValue(const Any &target) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid property"});
    const auto &m = detail::RecordOf(m_h);
    if (m.isStatic)
      return DeclaringType().GetStaticProperty(m.name);
    if (auto ok = detail::RequireInstanceTarget(target, m.name); !ok)
      return std::unexpected(ok.error());
    return Runtime::GetProperty(target, m.name);
  }

  std::expected<void, Error> Property::SetValue(const Any &target, Any value) const
  {
    if (!IsValid())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "invalid property"});
    const auto &m = detail::RecordOf(m_h);
    if (m.isStatic)
      return DeclaringType().SetStaticProperty(m.name, std::move(value));
    if (auto ok = detail::RequireInstanceTarget(target, m.name); !ok)
      return std::unexpected(ok.error());
    return Runtime::SetProperty(target, m.name, std::move(value));
  }

} // namespace TypeLoom::Runtime
