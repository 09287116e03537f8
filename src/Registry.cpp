#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Type.hpp>
#include <TypeLoom/Runtime/TypeBuilder.hpp>

#include <exception>
#include <string>

namespace TypeLoom::Runtime::detail
{

  static Registry g_registry{};

  Registry &GetRegistry() noexcept { return g_registry; }

  NameId InternNameId(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    const auto id = reg.names.InsertOrGet(s);
    if (id == StringInterner::INVALID_ID)
      return InvalidNameId;
    return static_cast<NameId>(id);
  }

  bool FindNameId(std::string_view s, NameId &out) noexcept
  {
    auto &reg = GetRegistry();
    StringInterner::IdType id{};
    if (!reg.names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  std::string_view NameFromId(NameId id) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.View(static_cast<StringInterner::IdType>(id));
  }

  std::string_view InternName(std::string_view s) noexcept
  {
    auto &reg = GetRegistry();
    return reg.names.Intern(s);
  }

  std::string_view FormatMessage(std::initializer_list<std::string_view> parts)
  {
    std::string s;
    for (auto part : parts)
      s.append(part);
    return InternName(s);
  }

  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    void RegisterNamespaces(LoadUnitDesc &unit, std::string_view name, bool isPublic)
    {
      auto &reg = GetRegistry();
      for (std::size_t pos = name.find('.'); pos != std::string_view::npos; pos = name.find('.', pos + 1))
      {
        const auto id = InternNameId(name.substr(0, pos));
        if (!unit.namespaces.GetPtr(id))
          unit.namespaces.Insert(id, true);
        if (isPublic && !reg.globalNamespaces.GetPtr(id))
          reg.globalNamespaces.Insert(id, true);
      }
    }

    void MarkPublished(NGIN::UInt32 index)
    {
      auto &reg = GetRegistry();
      if (index < reg.bindings.Size())
        reg.bindings[index]->published = true;
    }
  } // namespace

  LoadUnitHandle GetOrCreateLoadUnit(std::string_view name)
  {
    auto &reg = GetRegistry();
    const auto nid = InternNameId(name);
    if (auto *p = reg.loadUnitsByName.GetPtr(nid))
      return LoadUnitHandle{*p};

    auto unit = std::make_unique<LoadUnitDesc>();
    unit->nameId = nid;
    unit->name = NameFromId(nid);
    unit->shortName = InternName(GetShortLoadUnitName(unit->name));
    // Both editions of the standard library share the core unit's identity space.
    if (unit->shortName == "mscorlib" && reg.coreUnit.IsValid())
      unit->assemblyId = reg.loadUnits[reg.coreUnit.index]->assemblyId;
    else
      unit->assemblyId = ++reg.nextAssemblyId;

    const auto idx = static_cast<NGIN::UInt32>(reg.loadUnits.Size());
    const auto shortId = InternNameId(unit->shortName);
    reg.loadUnits.PushBack(std::move(unit));
    reg.loadUnitsByName.Insert(nid, idx);
    if (shortId != nid)
    {
      if (auto *p = reg.loadUnitsByShortName.GetPtr(shortId))
        *p = AmbiguousBinding;
      else
        reg.loadUnitsByShortName.Insert(shortId, idx);
    }
    return LoadUnitHandle{idx};
  }

  std::optional<LoadUnitHandle> FindLoadUnit(std::string_view name)
  {
    auto &reg = GetRegistry();
    NameId nid{};
    if (!FindNameId(name, nid))
      return std::nullopt;
    if (auto *p = reg.loadUnitsByName.GetPtr(nid))
      return LoadUnitHandle{*p};
    if (auto *p = reg.loadUnitsByShortName.GetPtr(nid))
    {
      if (*p != AmbiguousBinding)
        return LoadUnitHandle{*p};
    }
    return std::nullopt;
  }

  std::string_view AssignTypeId(LoadUnitHandle unit, std::string_view typeName)
  {
    auto &reg = GetRegistry();
    const auto escaped = EscapeName(typeName);
    NGIN::UInt32 unitIndex = unit.IsValid() ? unit.index : reg.coreUnit.index;

    // A name the unit does not define itself belongs to whichever unit declared it public.
    const auto nameId = InternNameId(typeName);
    if (!reg.loadUnits[unitIndex]->bindings.GetPtr(nameId))
    {
      if (auto *p = reg.publicTypeUnits.GetPtr(InternNameId(escaped)))
        unitIndex = *p;
    }

    std::string key = std::to_string(reg.loadUnits[unitIndex]->assemblyId);
    key += '$';
    key += escaped;
    const auto keyId = InternNameId(key);
    if (auto *p = reg.assignedTypeIds.GetPtr(keyId))
      return NameFromId(*p);

    const auto id = InternNameId(std::to_string(++reg.nextTypeId));
    reg.assignedTypeIds.Insert(keyId, id);
    return NameFromId(id);
  }

  std::string_view AssignGenericParameterId(LoadUnitHandle unit, std::string_view ownerName, std::string_view name)
  {
    auto &reg = GetRegistry();
    std::string key{AssignTypeId(unit, ownerName)};
    key += '$';
    key += EscapeName(name);
    const auto keyId = InternNameId(key);
    if (auto *p = reg.genericParameterIds.GetPtr(keyId))
      return NameFromId(*p);

    const auto id = InternNameId(std::to_string(++reg.nextTypeId));
    reg.genericParameterIds.Insert(keyId, id);
    return NameFromId(id);
  }

  std::expected<BindingHandle, Error> RegisterBinding(LoadUnitHandle unit, std::string_view name, bool isPublic,
                                                      TypeCreator creator, TypeInitializerThunk initializer)
  {
    auto &reg = GetRegistry();
    if (!unit.IsValid() || unit.index >= reg.loadUnits.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    if (name.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "empty type name"});
    if (!creator)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "a creator thunk is required"});

    auto &ud = *reg.loadUnits[unit.index];
    const auto nameId = InternNameId(name);
    if (ud.bindings.GetPtr(nameId))
    {
      Error err{ErrorCode::DuplicateDefinition, FormatMessage({"Duplicate definition of '", name, "' in '", ud.name, "'"})};
      ReportError(err);
      return std::unexpected(std::move(err));
    }

    auto binding = std::make_unique<BindingDesc>();
    binding->nameId = nameId;
    binding->name = NameFromId(nameId);
    binding->escapedNameId = InternNameId(EscapeName(name));
    binding->escapedName = NameFromId(binding->escapedNameId);
    binding->loadUnit = unit;
    binding->isPublic = isPublic;
    binding->creator = std::move(creator);
    binding->initializer = std::move(initializer);

    const auto idx = static_cast<NGIN::UInt32>(reg.bindings.Size());
    const auto escapedId = binding->escapedNameId;
    reg.bindings.PushBack(std::move(binding));
    ud.bindings.Insert(nameId, idx);
    ud.bindingList.PushBack(idx);
    RegisterNamespaces(ud, name, isPublic);

    if (isPublic)
    {
      if (auto *p = reg.publicBindings.GetPtr(escapedId))
      {
        if (*p != AmbiguousBinding && reg.bindings[*p]->loadUnit.index != unit.index)
        {
          *p = AmbiguousBinding;
          reg.publicTypeUnits.Remove(escapedId);
        }
      }
      else
      {
        reg.publicBindings.Insert(escapedId, idx);
        reg.publicTypeUnits.Insert(escapedId, unit.index);
      }
    }
    return BindingHandle{idx};
  }

  std::expected<BindingHandle, Error> FindPublicBinding(std::string_view name)
  {
    auto &reg = GetRegistry();
    NameId escapedId{};
    if (FindNameId(EscapeName(name), escapedId))
    {
      if (auto *p = reg.publicBindings.GetPtr(escapedId))
      {
        if (*p == AmbiguousBinding)
          return std::unexpected(Error{ErrorCode::AmbiguousType,
                                       FormatMessage({"Type '", name,
                                                      "' has multiple public definitions. You must access it through a specific assembly."})});
        return BindingHandle{*p};
      }
    }
    return std::unexpected(Error{ErrorCode::NotFound, FormatMessage({"Type '", name, "' has not been defined."})});
  }

  std::expected<BindingHandle, Error> ResolveBindingName(LoadUnitHandle unit, std::string_view name)
  {
    auto &reg = GetRegistry();
    if (unit.IsValid() && unit.index < reg.loadUnits.Size())
    {
      NameId nid{};
      if (FindNameId(name, nid))
      {
        if (auto *p = reg.loadUnits[unit.index]->bindings.GetPtr(nid))
          return BindingHandle{*p};
      }
    }
    return FindPublicBinding(name);
  }

  std::expected<TypeHandle, Error> GetBoundType(BindingHandle h, bool initialize)
  {
    auto &reg = GetRegistry();
    if (!h.IsValid() || h.index >= reg.bindings.Size())
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    auto &b = *reg.bindings[h.index];
    if (b.published)
      return b.value;

    switch (b.state)
    {
    case BindingState::Failed:
      return std::unexpected(Error{ErrorCode::TypeInitialization, FormatMessage({"Type initialization failed for '", b.name, "'"})});
    case BindingState::Constructing:
      // Member declarations of the type itself may refer back to it.
      if (b.value.IsValid())
        return b.value;
      {
        Error err{ErrorCode::RecursiveConstruction, FormatMessage({"Recursive construction of '", b.name, "'"})};
        ReportError(err);
        return std::unexpected(std::move(err));
      }
    case BindingState::Unconstructed:
    {
      b.state = BindingState::Constructing;
      auto creator = std::move(b.creator);
      b.creator = {};
      auto fail = [&b](Error error) -> std::expected<TypeHandle, Error>
      {
        b.state = BindingState::Failed;
        b.failure = error.message;
        ReportError(error);
        return std::unexpected(std::move(error));
      };
      auto thrown = [&b](const std::exception &e)
      {
        return Error{ErrorCode::TypeInitialization,
                     FormatMessage({"Type initialization failed for '", b.name, "': ", e.what()})};
      };

      std::expected<TypeHandle, Error> made{};
      try
      {
        made = creator(h);
      }
      catch (const std::exception &e)
      {
        return fail(thrown(e));
      }
      if (!made)
        return fail(made.error());
      b.value = *made;

      auto init = std::move(b.initializer);
      b.initializer = {};
      if (init)
      {
        std::expected<void, Error> declared{};
        try
        {
          declared = init(b.value);
        }
        catch (const std::exception &e)
        {
          return fail(thrown(e));
        }
        if (!declared)
          return fail(declared.error());
      }
      b.state = BindingState::Constructed;
      break;
    }
    default:
      break;
    }

    if (initialize && b.sealed && !Desc(b.value).initialized)
      InitializeType(b.value);
    return b.value;
  }

  void MarkBindingInitialized(BindingHandle h)
  {
    auto &reg = GetRegistry();
    if (!h.IsValid() || h.index >= reg.bindings.Size())
      return;
    auto &b = *reg.bindings[h.index];
    if (b.state != BindingState::Constructed)
      return;
    b.state = BindingState::Initialized;
    const auto idx = h.index;
    RunLater([idx]() { MarkPublished(idx); });
  }

  TypeHandle PushType(std::unique_ptr<TypeRuntimeDesc> desc)
  {
    auto &reg = GetRegistry();
    const auto idx = static_cast<NGIN::UInt32>(reg.types.Size());
    desc->self = TypeHandle{idx};
    reg.types.PushBack(std::move(desc));
    return TypeHandle{idx};
  }

  void SetSlot(MemberTable &table, NameId key, MemberSlot slot)
  {
    if (auto *p = table.index.GetPtr(key))
    {
      table.slots[*p] = std::move(slot);
      return;
    }
    const auto idx = static_cast<NGIN::UInt32>(table.slots.Size());
    table.slots.PushBack(std::move(slot));
    table.index.Insert(key, idx);
  }

  const MemberSlot *FindOwnSlot(const MemberTable &table, NameId key)
  {
    if (auto *p = table.index.GetPtr(key))
      return &table.slots[*p];
    return nullptr;
  }

  NameId ApplyRename(TypeHandle type, NameId key)
  {
    if (auto *p = Desc(type).renamedMethods.GetPtr(key))
      return *p;
    return key;
  }

  const MemberSlot *FindSlot(TypeHandle type, NameId key, bool isStatic)
  {
    TypeHandle cur = type;
    while (cur.IsValid())
    {
      auto &d = Desc(cur);
      const auto k = ApplyRename(cur, key);
      // A renamed key lives on the open type; the closed type only tombstones the old one.
      if (k == key)
      {
        if (auto *s = FindOwnSlot(isStatic ? d.staticTable : d.instanceTable, k))
          return s->isRemoved ? nullptr : s;
      }
      if (d.openType.IsValid())
      {
        auto &od = Desc(d.openType);
        if (auto *s = FindOwnSlot(isStatic ? od.staticTable : od.instanceTable, k))
          return s->isRemoved ? nullptr : s;
      }
      if (isStatic)
        return nullptr;
      cur = d.baseType;
    }
    return nullptr;
  }

} // namespace TypeLoom::Runtime::detail

namespace TypeLoom::Runtime
{

  using detail::GetRegistry;
  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    bool IsUnitAlive(LoadUnitHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().loadUnits.Size();
    }

    bool IsBindingAlive(BindingHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().bindings.Size();
    }
  } // namespace

  // TypeBinding
  std::string_view TypeBinding::Name() const
  {
    if (!IsBindingAlive(m_h))
      return {};
    return GetRegistry().bindings[m_h.index]->name;
  }

  bool TypeBinding::IsPublic() const
  {
    return IsBindingAlive(m_h) && GetRegistry().bindings[m_h.index]->isPublic;
  }

  bool TypeBinding::IsSealed() const
  {
    return IsBindingAlive(m_h) && GetRegistry().bindings[m_h.index]->sealed;
  }

  BindingState TypeBinding::State() const
  {
    if (!IsBindingAlive(m_h))
      return BindingState::Failed;
    return GetRegistry().bindings[m_h.index]->state;
  }

  LoadUnit TypeBinding::GetLoadUnit() const
  {
    if (!IsBindingAlive(m_h))
      return LoadUnit{};
    return LoadUnit{GetRegistry().bindings[m_h.index]->loadUnit};
  }

  ExpectedType TypeBinding::Get() const
  {
    auto r = detail::GetBoundType(m_h, true);
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  ExpectedType TypeBinding::GetNoInitialize() const
  {
    auto r = detail::GetBoundType(m_h, false);
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  // LoadUnit
  std::string_view LoadUnit::Name() const
  {
    if (!IsUnitAlive(m_h))
      return {};
    return GetRegistry().loadUnits[m_h.index]->name;
  }

  std::string_view LoadUnit::ShortName() const
  {
    if (!IsUnitAlive(m_h))
      return {};
    return GetRegistry().loadUnits[m_h.index]->shortName;
  }

  NGIN::UInt32 LoadUnit::AssemblyId() const
  {
    if (!IsUnitAlive(m_h))
      return 0;
    return GetRegistry().loadUnits[m_h.index]->assemblyId;
  }

  ExpectedBinding LoadUnit::Declare(const TypeDeclaration &declaration, std::function<void(TypeBuilder &)> members) const
  {
    auto r = detail::DeclareType(m_h, declaration, std::move(members));
    if (!r)
      return std::unexpected(r.error());
    return TypeBinding{*r};
  }

  ExpectedBinding LoadUnit::RegisterName(std::string_view name, bool isPublic, TypeCreator creator,
                                         TypeInitializerThunk initializer) const
  {
    detail::EnsureCoreTypes();
    auto r = detail::RegisterBinding(m_h, name, isPublic, std::move(creator), std::move(initializer));
    if (!r)
      return std::unexpected(r.error());
    return TypeBinding{*r};
  }

  ExpectedBinding LoadUnit::GetBinding(std::string_view name) const
  {
    if (!IsUnitAlive(m_h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, kStaleHandle});
    auto r = detail::ResolveBindingName(m_h, name);
    if (!r)
      return std::unexpected(r.error());
    return TypeBinding{*r};
  }

  ExpectedType LoadUnit::GetType(std::string_view name) const
  {
    return GetTypeByName(name, *this);
  }

  void LoadUnit::Seal() const
  {
    if (!IsUnitAlive(m_h))
      return;
    auto &reg = GetRegistry();
    const auto &unit = *reg.loadUnits[m_h.index];
    for (NGIN::UIntSize i = 0; i < unit.bindingList.Size(); ++i)
      reg.bindings[unit.bindingList[i]]->sealed = true;
  }

  // Free functions
  ExpectedLoadUnit DeclareLoadUnit(std::string_view name)
  {
    detail::EnsureCoreTypes();
    if (name.empty())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "empty load unit name"});
    return LoadUnit{detail::GetOrCreateLoadUnit(name)};
  }

  ExpectedLoadUnit GetLoadUnit(std::string_view name)
  {
    detail::EnsureCoreTypes();
    if (auto h = detail::FindLoadUnit(name))
      return LoadUnit{*h};
    return std::unexpected(Error{ErrorCode::NotFound, detail::FormatMessage({"Load unit '", name, "' has not been declared."})});
  }

  LoadUnit CoreLoadUnit()
  {
    detail::EnsureCoreTypes();
    return LoadUnit{GetRegistry().coreUnit};
  }

  void SealLoadUnit(const LoadUnit &unit)
  {
    unit.Seal();
  }

  void Initialize()
  {
    detail::EnsureCoreTypes();
    auto &reg = GetRegistry();
    for (NGIN::UIntSize i = 0; i < reg.bindings.Size(); ++i)
      reg.bindings[i]->sealed = true;
  }

  ExpectedType GetTypeByName(std::string_view name, std::optional<LoadUnit> unit)
  {
    detail::EnsureCoreTypes();
    if (name.starts_with("!!"))
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   detail::FormatMessage({"Positional generic method parameter '", name,
                                                          "' cannot be resolved by GetTypeByName."})});
    const LoadUnitHandle uh = unit ? unit->Handle() : LoadUnitHandle{};
    auto binding = detail::ResolveBindingName(uh, name);
    if (!binding)
      return std::unexpected(binding.error());
    auto r = detail::GetBoundType(*binding, true);
    if (!r)
      return std::unexpected(r.error());
    return Type{*r};
  }

  ExpectedBinding ResolveName(std::string_view name, std::optional<LoadUnit> unit)
  {
    detail::EnsureCoreTypes();
    auto &reg = GetRegistry();
    const detail::LoadUnitDesc *ud = (unit && IsUnitAlive(unit->Handle())) ? reg.loadUnits[unit->Handle().index].get() : nullptr;

    std::string_view scope = "<global>";
    std::size_t start = 0;
    for (std::size_t pos = name.find('.'); pos != std::string_view::npos; pos = name.find('.', pos + 1))
    {
      NameId nid{};
      bool known = detail::FindNameId(name.substr(0, pos), nid);
      if (known)
        known = (ud && ud->namespaces.GetPtr(nid)) || reg.globalNamespaces.GetPtr(nid);
      if (!known)
        return std::unexpected(Error{ErrorCode::NameResolution,
                                     detail::FormatMessage({"Could not find the name '", name.substr(start, pos - start),
                                                            "' in the namespace '", scope, "'."})});
      scope = name.substr(0, pos);
      start = pos + 1;
    }

    auto binding = detail::ResolveBindingName(unit ? unit->Handle() : LoadUnitHandle{}, name);
    if (!binding)
    {
      if (binding.error().code == ErrorCode::AmbiguousType)
        return std::unexpected(binding.error());
      return std::unexpected(Error{ErrorCode::NameResolution,
                                   detail::FormatMessage({"Could not find the name '", name.substr(start),
                                                          "' in the namespace '", scope, "'."})});
    }
    return TypeBinding{*binding};
  }

  ExpectedType GetTypeFromParsedName(const ParsedTypeName &parsed, std::optional<LoadUnit> defaultUnit)
  {
    std::optional<LoadUnit> unit = defaultUnit;
    if (parsed.assembly)
    {
      auto found = GetLoadUnit(*parsed.assembly);
      if (!found)
        return std::unexpected(found.error());
      unit = *found;
    }
    auto type = GetTypeByName(parsed.type, unit);
    if (!type || parsed.genericArguments.empty())
      return type;

    NGIN::Containers::Vector<TypeReference> args;
    args.Reserve(parsed.genericArguments.size());
    for (const auto &argName : parsed.genericArguments)
    {
      auto arg = GetTypeFromParsedName(argName, defaultUnit);
      if (!arg)
        return std::unexpected(arg.error());
      args.PushBack(TypeReference::Of(*arg));
    }
    return type->Of(args);
  }

} // namespace TypeLoom::Runtime
