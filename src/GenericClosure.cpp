#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Type.hpp>

#include <string>
#include <utility>

namespace TypeLoom::Runtime::detail
{

  namespace
  {
    // Methods whose signature mentions a generic parameter are stored under their open key.
    // Map the key computed with the closed arguments onto it, and hide the open key.
    void RenameGenericMethods(TypeHandle h)
    {
      auto &d = Desc(h);
      const auto &od = Desc(d.openType);
      for (NGIN::UIntSize i = 0; i < od.members.Size(); ++i)
      {
        const auto &m = od.members[i];
        if ((m.kind != MemberKind::Method && m.kind != MemberKind::Constructor) || m.isRaw || m.isAbstract)
          continue;
        if (m.isStatic && m.kind == MemberKind::Constructor)
          continue;

        bool changed = false;
        auto resolved = ResolveSignature(m.signature, h, changed);
        if (!resolved || !changed)
          continue;
        auto oldKey = m.signature.GetKey(m.escapedName);
        auto newKey = resolved->GetKey(m.escapedName);
        if (!oldKey || !newKey || *oldKey == *newKey)
          continue;

        const auto oldId = InternNameId(*oldKey);
        const auto newId = InternNameId(*newKey);
        if (auto *p = d.renamedMethods.GetPtr(newId))
          *p = oldId;
        else
          d.renamedMethods.Insert(newId, oldId);
        if (!d.renamedMethods.GetPtr(oldId))
          SetSlot(m.isStatic ? d.staticTable : d.instanceTable, oldId, MemberSlot{{}, h, false, true});
      }
    }

    std::string JoinArgumentNames(const NGIN::Containers::Vector<TypeReference> &args)
    {
      std::string s;
      for (NGIN::UIntSize i = 0; i < args.Size(); ++i)
      {
        if (i > 0)
          s += ',';
        s += args[i].ToString();
      }
      return s;
    }
  } // namespace

  void RebindRawMethods(TypeHandle h)
  {
    auto &d = Desc(h);
    if (!d.openType.IsValid())
      return;
    const auto &od = Desc(d.openType);
    for (NGIN::UIntSize i = 0; i < od.members.Size(); ++i)
    {
      const auto &m = od.members[i];
      if (!m.isRaw || !m.isStatic)
        continue;
      const auto *slot = FindOwnSlot(od.staticTable, m.escapedNameId);
      if (!slot)
        continue;
      MemberSlot copy = *slot;
      copy.owner = h;
      SetSlot(d.staticTable, m.escapedNameId, std::move(copy));
    }
  }

  std::expected<TypeHandle, Error> CloseNoInitialize(TypeHandle open, const NGIN::Containers::Vector<TypeReference> &args)
  {
    if (!IsTypeAlive(open))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    auto &od = Desc(open);
    if (od.openType.IsValid() || od.genericParameterNames.Size() == 0)
      return std::unexpected(Error{ErrorCode::InvalidOperation,
                                   FormatMessage({"'", od.fullName, "' is not a generic type definition"})});
    if (args.Size() != od.genericParameterNames.Size())
      return std::unexpected(Error{ErrorCode::GenericArity,
                                   FormatMessage({"Type '", od.fullName, "' requires ", std::to_string(od.genericParameterNames.Size()),
                                                  " generic argument(s), but ", std::to_string(args.Size()), " were provided."})});

    NGIN::Containers::Vector<TypeReference> resolved;
    resolved.Reserve(args.Size());
    bool closed = true;
    for (NGIN::UIntSize i = 0; i < args.Size(); ++i)
    {
      if (args[i].IsNull())
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     FormatMessage({"Generic argument ", std::to_string(i), " of '", od.fullName, "' is null or undefined"})});
      auto arg = ResolveReference(args[i], TypeHandle{});
      if (!arg)
        return std::unexpected(arg.error());
      if (IsOpenReference(*arg))
        closed = false;
      resolved.PushBack(std::move(*arg));
    }

    auto hash = HashTypeArgumentArray(resolved);
    if (!hash)
      return std::unexpected(hash.error());
    const auto cacheKey = InternNameId(*hash);
    if (auto *p = od.closedCache.GetPtr(cacheKey))
      return TypeHandle{*p};

    auto desc = std::make_unique<TypeRuntimeDesc>();
    const auto argNames = JoinArgumentNames(resolved);
    desc->fullName = FormatMessage({od.fullName, "[", argNames, "]"});
    desc->fullNameWithoutArguments = od.fullName;
    desc->fullNameId = InternNameId(desc->fullName);
    desc->shortName = od.shortName;
    desc->typeId = FormatMessage({od.typeId, "[", *hash, "]"});
    desc->typeIdKey = InternNameId(desc->typeId);
    desc->kind = od.kind;
    desc->loadUnit = od.loadUnit;
    desc->binding = od.binding;
    desc->isReferenceType = od.isReferenceType;
    desc->isFlagsEnum = od.isFlagsEnum;
    desc->customCheck = od.customCheck;
    desc->baseReference = od.baseReference;
    desc->openType = open;
    desc->isClosed = closed;
    desc->genericArguments = resolved;
    desc->genericBindings.Reserve(resolved.Size());
    for (NGIN::UIntSize i = 0; i < resolved.Size(); ++i)
    {
      GenericBinding binding{};
      binding.parameterId = GenericParameterIdOf(TypeReference::Parameter(od.loadUnit, od.fullName, od.genericParameterNames[i]));
      binding.value = resolved[i];
      desc->genericBindings.PushBack(std::move(binding));
    }

    // Cached before the base is resolved: the base may mention this very instantiation.
    const auto h = PushType(std::move(desc));
    od.closedCache.Insert(cacheKey, h.index);
    auto &d = Desc(h);

    if (!od.baseReference.IsNull())
    {
      auto base = ResolveToType(od.baseReference, h);
      if (!base)
      {
        od.closedCache.Remove(cacheKey);
        return std::unexpected(base.error());
      }
      const auto &bd = Desc(*base);
      d.baseType = *base;
      d.inheritanceDepth = bd.inheritanceDepth + 1;
      for (NGIN::UIntSize i = 0; i < bd.interfaceReferences.Size(); ++i)
        d.interfaceReferences.PushBack(bd.interfaceReferences[i]);
      d.inheritedInterfaceCount = static_cast<NGIN::UInt32>(bd.interfaceReferences.Size());
      if (!bd.isClosed)
        d.isClosed = false;
    }
    for (NGIN::UIntSize i = od.inheritedInterfaceCount; i < od.interfaceReferences.Size(); ++i)
      d.interfaceReferences.PushBack(od.interfaceReferences[i]);

    od.closedTypes.PushBack(h);
    if (d.isClosed)
    {
      RenameGenericMethods(h);
      RebindRawMethods(h);
    }
    return h;
  }

  std::expected<TypeHandle, Error> Close(TypeHandle open, const NGIN::Containers::Vector<TypeReference> &args)
  {
    auto h = CloseNoInitialize(open, args);
    if (!h)
      return h;
    if (Desc(open).initialized && !Desc(*h).initialized)
      InitializeType(*h);
    return h;
  }

} // namespace TypeLoom::Runtime::detail

namespace TypeLoom::Runtime
{

  ExpectedType Type::Of(std::initializer_list<TypeReference> arguments) const
  {
    NGIN::Containers::Vector<TypeReference> args;
    args.Reserve(arguments.size());
    for (const auto &arg : arguments)
      args.PushBack(arg);
    return Of(args);
  }

  ExpectedType Type::Of(const NGIN::Containers::Vector<TypeReference> &arguments) const
  {
    auto r = detail::Close(m_h, arguments);
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  ExpectedType Type::OfNoInitialize(const NGIN::Containers::Vector<TypeReference> &arguments) const
  {
    auto r = detail::CloseNoInitialize(m_h, arguments);
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

} // namespace TypeLoom::Runtime
