#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Type.hpp>

#include <string>

namespace TypeLoom::Runtime::detail
{

  namespace
  {
    void RunStaticConstructors(TypeHandle h)
    {
      const auto slots = GetRuntimeOptions().staticConstructorSlots;
      for (NGIN::UInt32 i = 0; i < slots; ++i)
      {
        std::string name{"_cctor"};
        if (i > 0)
          name += std::to_string(i + 1);
        NameId key{};
        if (!FindNameId(name, key))
          continue;
        const auto *found = FindSlot(h, key, true);
        if (!found)
          continue;
        MemberSlot slot = *found;
        auto r = InvokeSlot(slot, Any::MakeVoid(), {}, h);
        if (!r)
          ReportError(r.error());
      }
    }

    void RunQueuedInitializers(TypeHandle h)
    {
      const auto &owner = MembersOwner(h);
      const auto count = owner.initializers.Size();
      for (NGIN::UIntSize i = 0; i < count; ++i)
      {
        auto fn = MembersOwner(h).initializers[i];
        auto r = fn(h);
        if (!r)
          ReportError(r.error());
      }
    }
  } // namespace

  void InitializeType(TypeHandle h)
  {
    if (!IsTypeAlive(h))
      return;
    auto &reg = GetRegistry();
    auto &d = Desc(h);
    if (d.initialized)
      return;
    // Set first: the passes below may reach this type again through its members.
    d.initialized = true;

    if (d.isClosed && d.kind != TypeKind::Interface)
    {
      if (!GetRuntimeOptions().lazyMethodGroups)
      {
        auto built = BuildMethodGroups(h);
        if (!built)
          ReportError(built.error());
      }
      InstantiateProperties(h);
      FixupInterfaces(h);
      LayoutFields(h);
      RebindRawMethods(h);
    }
    if (d.isClosed)
      EnsureAssignableSet(h);

    if (d.typeObject && d.typeObject == reg.stubTypeObject)
      d.typeObject = nullptr;

    RunQueuedInitializers(h);
    if (d.isClosed)
      RunStaticConstructors(h);

    if (!d.openType.IsValid())
      MarkBindingInitialized(d.binding);

    // Instantiations created before the open type was initialized.
    for (NGIN::UIntSize i = 0; i < Desc(h).closedTypes.Size(); ++i)
      InitializeType(Desc(h).closedTypes[i]);

    if (IsTypeAlive(d.baseType))
      InitializeType(d.baseType);
  }

  void InstantiateProperties(TypeHandle h)
  {
    auto &d = Desc(h);
    if (d.properties.Size() > 0)
      return;
    const auto &owner = MembersOwner(h);
    for (NGIN::UIntSize i = 0; i < owner.members.Size(); ++i)
    {
      const auto &m = owner.members[i];
      if (m.kind != MemberKind::Property || m.isAbstract)
        continue;
      PropertySlotDesc p{};
      p.name = m.name;
      p.nameId = InternNameId(m.name);
      p.isStatic = m.isStatic;
      p.declaringType = h;
      p.getterId = InternNameId(FormatMessage({"get_", m.escapedName}));
      p.setterId = InternNameId(FormatMessage({"set_", m.escapedName}));
      const auto idx = static_cast<NGIN::UInt32>(d.properties.Size());
      d.properties.PushBack(p);
      auto &index = m.isStatic ? d.staticPropertyIndex : d.instancePropertyIndex;
      if (auto *existing = index.GetPtr(p.nameId))
        *existing = idx;
      else
        index.Insert(p.nameId, idx);
    }
  }

  void LayoutFields(TypeHandle h)
  {
    auto &d = Desc(h);
    if (d.fieldsLaidOut)
      return;
    d.fieldsLaidOut = true;

    if (IsTypeAlive(d.baseType))
    {
      LayoutFields(d.baseType);
      const auto &bd = Desc(d.baseType);
      d.instanceFields = bd.instanceFields;
      for (NGIN::UIntSize i = 0; i < d.instanceFields.Size(); ++i)
      {
        const auto id = d.instanceFields[i].nameId;
        if (auto *p = d.instanceFieldIndex.GetPtr(id))
          *p = static_cast<NGIN::UInt32>(i);
        else
          d.instanceFieldIndex.Insert(id, static_cast<NGIN::UInt32>(i));
      }
    }

    const auto &owner = MembersOwner(h);
    for (NGIN::UIntSize i = 0; i < owner.members.Size(); ++i)
    {
      const auto &m = owner.members[i];
      if (m.kind != MemberKind::Field)
        continue;
      FieldLayoutDesc f{};
      f.name = m.name;
      f.nameId = InternNameId(m.name);
      f.fieldType = m.valueType;
      f.declaringType = h;
      f.defaultValue = m.defaultValue;

      if (m.isStatic)
      {
        Any value = Null();
        if (f.defaultValue)
        {
          value = f.defaultValue();
        }
        else if (auto v = DefaultValueFor(f.fieldType, h))
        {
          value = std::move(*v);
        }
        else
        {
          ReportError(v.error());
        }
        const auto idx = static_cast<NGIN::UInt32>(d.staticFields.Size());
        d.staticFields.PushBack(std::move(f));
        d.staticFieldValues.PushBack(std::move(value));
        if (auto *p = d.staticFieldIndex.GetPtr(d.staticFields[idx].nameId))
          *p = idx;
        else
          d.staticFieldIndex.Insert(d.staticFields[idx].nameId, idx);
        continue;
      }

      // A field redeclared by a derived type hides the inherited one by name; both slots remain.
      const auto idx = static_cast<NGIN::UInt32>(d.instanceFields.Size());
      const auto nameId = f.nameId;
      d.instanceFields.PushBack(std::move(f));
      if (auto *p = d.instanceFieldIndex.GetPtr(nameId))
        *p = idx;
      else
        d.instanceFieldIndex.Insert(nameId, idx);
    }
  }

  std::expected<Any, Error> DefaultValueFor(const TypeReference &fieldType, TypeHandle context)
  {
    auto type = ResolveToType(fieldType, context);
    if (!type)
      return std::unexpected(type.error());
    const auto &td = Desc(*type);
    const auto &owner = MembersOwner(*type);
    if (owner.nativeDefault)
      return owner.nativeDefault();
    if (td.kind == TypeKind::Enum)
      return Any{EnumValue{*type, 0}};
    if (td.kind == TypeKind::Struct && !owner.isNativeType)
    {
      auto value = AllocateInstance(*type);
      if (!value)
        return std::unexpected(value.error());
      return Any{*value};
    }
    return Null();
  }

} // namespace TypeLoom::Runtime::detail

namespace TypeLoom::Runtime
{

  void Type::Initialize() const
  {
    if (!IsValid())
      return;
    detail::InitializeType(m_h);
  }

} // namespace TypeLoom::Runtime
