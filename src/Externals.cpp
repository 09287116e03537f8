#include <TypeLoom/Runtime/TypeBuilder.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Registry.hpp>

#include <utility>

namespace TypeLoom::Runtime
{

  namespace detail
  {
    namespace
    {
      ExternalsEntry &GetOrCreateExternals(std::string_view typeName)
      {
        auto &reg = GetRegistry();
        const auto nid = InternNameId(typeName);
        if (auto *p = reg.externalsByTypeName.GetPtr(nid))
          return reg.externals[*p];
        const auto idx = static_cast<NGIN::UInt32>(reg.externals.Size());
        ExternalsEntry entry{};
        entry.typeName = NameFromId(nid);
        reg.externals.PushBack(std::move(entry));
        reg.externalsByTypeName.Insert(nid, idx);
        return reg.externals[idx];
      }

      // Level of `from`'s base chain whose declarations are owned by `declaringType`.
      TypeHandle FindDeclaringLevel(TypeHandle from, TypeHandle declaringType)
      {
        TypeHandle cur = from;
        while (IsTypeAlive(cur))
        {
          const auto &d = Desc(cur);
          if (cur == declaringType || d.openType == declaringType)
            return cur;
          cur = d.baseType;
        }
        return declaringType;
      }
    } // namespace

    void ApplyExternals(TypeHandle h)
    {
      auto &reg = GetRegistry();
      const auto nid = Desc(h).fullNameId;
      auto *p = reg.externalsByTypeName.GetPtr(nid);
      if (!p)
        return;
      const auto idx = *p;
      for (NGIN::UIntSize i = 0; i < reg.externals[idx].implementations.Size(); ++i)
      {
        auto apply = reg.externals[idx].implementations[i];
        apply(h);
      }
    }

    MethodBody MakeExternalMemberStub(TypeHandle declaringType, NameId key, bool isStatic, std::string_view display)
    {
      return [declaringType, key, isStatic, display](const CallFrame &frame) -> std::expected<Any, Error>
      {
        if (!isStatic)
        {
          const auto level = FindDeclaringLevel(frame.boundType.IsValid() ? frame.boundType : declaringType, declaringType);
          const auto base = Desc(level).baseType;
          if (IsTypeAlive(base))
          {
            const auto *inherited = FindSlot(base, key, false);
            if (inherited && !inherited->isPlaceholder && inherited->body)
            {
              MemberSlot slot = *inherited;
              if (GetRuntimeOptions().warnOnPlaceholderFallback)
                ReportWarning(ErrorCode::PlaceholderFallback,
                              FormatMessage({"The external method '", display, "' has not been implemented; calling inherited method."}));
              return InvokeSlot(slot, frame.self, frame.arguments, frame.boundType);
            }
          }
        }
        return std::unexpected(Error{ErrorCode::NotImplemented,
                                     FormatMessage({"The external method '", display, "' of type '", Desc(declaringType).fullName,
                                                    "' has not been implemented."})});
      };
    }
  } // namespace detail

  ExternalsBuilder &ExternalsBuilder::method(MemberFlags flags, std::string_view name, const MethodSignature &signature, MethodBody body)
  {
    auto &d = detail::Desc(m_type);
    auto key = signature.GetKey(EscapeName(name));
    if (!key)
    {
      ReportError(key.error());
      return *this;
    }
    if (!body)
    {
      ReportError(Error{ErrorCode::InvalidArgument, detail::FormatMessage({"External '", name, "' of '", d.fullName, "' has no body"})});
      return *this;
    }
    auto &table = HasFlag(flags, MemberFlags::Static) ? d.staticTable : d.instanceTable;
    detail::SetSlot(table, detail::InternNameId(*key), detail::MemberSlot{std::move(body), m_type, false});
    return *this;
  }

  ExternalsBuilder &ExternalsBuilder::raw_method(MemberFlags flags, std::string_view name, MethodBody body)
  {
    auto &d = detail::Desc(m_type);
    if (!body)
    {
      ReportError(Error{ErrorCode::InvalidArgument, detail::FormatMessage({"External '", name, "' of '", d.fullName, "' has no body"})});
      return *this;
    }
    const bool isStatic = HasFlag(flags, MemberFlags::Static);
    const auto keyId = detail::InternNameId(EscapeName(name));

    bool declared = false;
    for (NGIN::UIntSize i = 0; i < d.members.Size(); ++i)
    {
      const auto &m = d.members[i];
      if (m.isRaw && m.escapedNameId == keyId && m.isStatic == isStatic)
      {
        declared = true;
        break;
      }
    }
    if (!declared)
    {
      detail::MemberRecord record{};
      record.kind = MemberKind::Method;
      record.name = detail::InternName(name);
      record.escapedNameId = keyId;
      record.escapedName = detail::NameFromId(keyId);
      record.isStatic = isStatic;
      record.isPublic = HasFlag(flags, MemberFlags::Public);
      record.isRaw = true;
      d.members.PushBack(std::move(record));
    }
    detail::SetSlot(isStatic ? d.staticTable : d.instanceTable, keyId, detail::MemberSlot{std::move(body), m_type, false});
    return *this;
  }

  std::expected<void, Error> ImplementExternals(std::string_view typeFullName, std::function<void(ExternalsBuilder &)> fn)
  {
    detail::EnsureCoreTypes();
    if (!fn)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "externals callback must be callable"});
    if (typeFullName.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "empty type name"});

    auto &reg = detail::GetRegistry();
    const auto nid = detail::InternNameId(typeFullName);
    NGIN::Containers::Vector<TypeHandle> existing;
    for (NGIN::UIntSize i = 0; i < reg.types.Size(); ++i)
    {
      const auto &d = *reg.types[i];
      if (d.fullNameId != nid || d.openType.IsValid())
        continue;
      if (d.initialized)
      {
        Error err{ErrorCode::InvalidOperation,
                  detail::FormatMessage({"Cannot implement externals for '", typeFullName, "' after it has been initialized."})};
        ReportError(err);
        return std::unexpected(std::move(err));
      }
      existing.PushBack(d.self);
    }

    std::function<void(TypeHandle)> apply = [fn = std::move(fn)](TypeHandle h)
    {
      ExternalsBuilder builder{h};
      fn(builder);
    };
    detail::GetOrCreateExternals(typeFullName).implementations.PushBack(apply);
    for (NGIN::UIntSize i = 0; i < existing.Size(); ++i)
      apply(existing[i]);
    return {};
  }

} // namespace TypeLoom::Runtime
