#include <TypeLoom/Runtime/TypeBuilder.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Registry.hpp>

#include <string>
#include <utility>

namespace TypeLoom::Runtime
{

  namespace detail
  {
    namespace
    {
      TypeReference DefaultBaseReference(const TypeDeclaration &declaration)
      {
        const auto core = GetRegistry().coreUnit;
        switch (declaration.Kind())
        {
        case TypeKind::Class:
          return TypeReference::Named(core, "System.Object");
        case TypeKind::Struct:
          return TypeReference::Named(core, "System.ValueType");
        case TypeKind::Enum:
          return TypeReference::Named(core, "System.Enum");
        case TypeKind::Interface:
          break;
        }
        return TypeReference{};
      }

      bool EnumValueCheck(const Any &value, TypeHandle expected)
      {
        if (value.GetTypeId() != TypeIdOf<EnumValue>())
          return false;
        return value.Cast<EnumValue>().type == expected;
      }

      void AddAssignable(TypeRuntimeDesc &d, NameId id)
      {
        if (!d.assignableSet.GetPtr(id))
          d.assignableSet.Insert(id, true);
      }

      void SetupEnum(TypeRuntimeDesc &d, const TypeDeclaration &declaration)
      {
        const auto &entries = declaration.EnumEntries();
        d.enumEntries.Reserve(entries.Size());
        for (NGIN::UIntSize i = 0; i < entries.Size(); ++i)
        {
          EnumEntryDesc entry{};
          entry.nameId = InternNameId(entries[i].name);
          entry.name = NameFromId(entry.nameId);
          entry.value = entries[i].value;
          const auto idx = static_cast<NGIN::UInt32>(d.enumEntries.Size());
          d.enumEntries.PushBack(entry);
          d.enumByName.Insert(entry.nameId, idx);
          // The first name declared for a value is its canonical name.
          if (!d.enumByValue.GetPtr(static_cast<NGIN::UInt64>(entry.value)))
            d.enumByValue.Insert(static_cast<NGIN::UInt64>(entry.value), idx);
        }
        if (!d.customCheck)
          d.customCheck = &EnumValueCheck;

        // Enum, ValueType and Object make up the whole set.
        d.assignableBuilt = true;
        AddAssignable(d, d.typeIdKey);
        TypeHandle cur = d.baseType;
        while (IsTypeAlive(cur))
        {
          AddAssignable(d, Desc(cur).typeIdKey);
          cur = Desc(cur).baseType;
        }
      }
    } // namespace

    std::expected<TypeHandle, Error> MakeType(LoadUnitHandle unit, BindingHandle binding, const TypeDeclaration &declaration)
    {
      auto &reg = GetRegistry();
      auto desc = std::make_unique<TypeRuntimeDesc>();
      desc->fullName = declaration.FullName();
      desc->fullNameWithoutArguments = desc->fullName;
      desc->fullNameId = InternNameId(desc->fullName);
      desc->shortName = InternName(GetLocalName(desc->fullName));
      desc->typeId = AssignTypeId(unit, desc->fullName);
      desc->typeIdKey = InternNameId(desc->typeId);
      desc->kind = declaration.Kind();
      desc->loadUnit = unit;
      desc->binding = binding;
      desc->isReferenceType = declaration.Kind() == TypeKind::Class || declaration.Kind() == TypeKind::Interface;
      desc->isFlagsEnum = declaration.IsFlags();
      desc->customCheck = declaration.CustomCheck();

      const auto &parameters = declaration.GenericParameters();
      desc->genericParameterNames.Reserve(parameters.Size());
      for (NGIN::UIntSize i = 0; i < parameters.Size(); ++i)
        desc->genericParameterNames.PushBack(InternName(parameters[i]));

      desc->baseReference = declaration.HasExplicitBase() ? declaration.BaseReference() : DefaultBaseReference(declaration);

      // Publish the handle before resolving the base so that base references may mention this type.
      const auto h = PushType(std::move(desc));
      reg.bindings[binding.index]->value = h;
      auto &d = Desc(h);
      // Types created while the root is bootstrapping share the stub type object.
      if (!reg.rootInitialized)
        d.typeObject = GetRuntimeTypeObject(h);

      if (!d.baseReference.IsNull())
      {
        auto base = ResolveToType(d.baseReference, h);
        if (!base)
          return std::unexpected(base.error());
        const auto &bd = Desc(*base);
        if (bd.kind == TypeKind::Interface)
          return std::unexpected(Error{ErrorCode::InvalidArgument,
                                       FormatMessage({"Type '", d.fullName, "' cannot derive from the interface '", bd.fullName, "'"})});
        d.baseType = *base;
        d.inheritanceDepth = bd.inheritanceDepth + 1;
        for (NGIN::UIntSize i = 0; i < bd.interfaceReferences.Size(); ++i)
          d.interfaceReferences.PushBack(bd.interfaceReferences[i]);
        d.inheritedInterfaceCount = static_cast<NGIN::UInt32>(bd.interfaceReferences.Size());

        if (d.kind == TypeKind::Class && bd.fullName == "System.ValueType" && d.fullName != "System.Enum")
        {
          d.kind = TypeKind::Struct;
          d.isReferenceType = false;
        }
      }

      const auto &interfaces = declaration.Interfaces();
      for (NGIN::UIntSize i = 0; i < interfaces.Size(); ++i)
        d.interfaceReferences.PushBack(interfaces[i]);

      d.isClosed = d.genericParameterNames.Size() == 0 && (!d.baseType.IsValid() || Desc(d.baseType).isClosed);

      if (d.kind == TypeKind::Enum)
        SetupEnum(d, declaration);

      ApplyExternals(h);
      return h;
    }

    std::expected<BindingHandle, Error> DeclareType(LoadUnitHandle unit, const TypeDeclaration &declaration,
                                                    std::function<void(TypeBuilder &)> members)
    {
      EnsureCoreTypes();
      if (declaration.Kind() != TypeKind::Enum && declaration.EnumEntries().Size() > 0)
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     FormatMessage({"Only enumerations declare named values ('", declaration.FullName(), "')"})});

      TypeCreator creator = [unit, declaration](BindingHandle binding) -> std::expected<TypeHandle, Error>
      {
        return MakeType(unit, binding, declaration);
      };
      TypeInitializerThunk initializer{};
      if (members)
      {
        initializer = [fn = std::move(members)](TypeHandle h) -> std::expected<void, Error>
        {
          TypeBuilder builder{h};
          fn(builder);
          return builder.status();
        };
      }
      return RegisterBinding(unit, declaration.FullName(), declaration.IsPublic(), std::move(creator), std::move(initializer));
    }
  } // namespace detail

  // TypeBuilder
  TypeReference TypeBuilder::ref(std::string_view name) const
  {
    return TypeReference::Named(detail::Desc(m_type).loadUnit, name);
  }

  TypeReference TypeBuilder::ref(std::string_view name, std::initializer_list<TypeReference> genericArguments) const
  {
    return TypeReference::Named(detail::Desc(m_type).loadUnit, name, genericArguments);
  }

  TypeReference TypeBuilder::generic_parameter(std::string_view name) const
  {
    const auto &d = detail::Desc(m_type);
    return TypeReference::Parameter(d.loadUnit, d.fullName, name);
  }

  TypeBuilder &TypeBuilder::Fail(Error error)
  {
    if (m_status)
      m_status = std::unexpected(std::move(error));
    return *this;
  }

  TypeBuilder &TypeBuilder::AddMethodRecord(MemberKind kind, MemberFlags flags, std::string_view name, std::string_view escapedName,
                                            MethodSignature signature, MethodBody body, bool isPlaceholder, bool isSpecialName)
  {
    if (!m_status)
      return *this;
    auto &d = detail::Desc(m_type);
    const bool isStatic = HasFlag(flags, MemberFlags::Static);
    auto key = signature.GetKey(escapedName);
    if (!key)
      return Fail(key.error());

    detail::MemberRecord record{};
    record.kind = kind;
    record.name = detail::InternName(name);
    record.escapedNameId = detail::InternNameId(escapedName);
    record.escapedName = detail::NameFromId(record.escapedNameId);
    record.isStatic = isStatic;
    record.isPublic = HasFlag(flags, MemberFlags::Public);
    record.isSpecialName = isSpecialName;
    record.isPlaceholder = isPlaceholder;
    record.isAbstract = d.kind == TypeKind::Interface;
    record.signature = std::move(signature);
    d.members.PushBack(std::move(record));

    if (d.kind == TypeKind::Interface)
      return *this;

    auto &table = isStatic ? d.staticTable : d.instanceTable;
    const auto keyId = detail::InternNameId(*key);
    const auto *existing = detail::FindOwnSlot(table, keyId);
    if (isPlaceholder)
    {
      if (!existing)
      {
        const auto display = detail::FormatMessage({d.fullName, ".", name});
        detail::SetSlot(table, keyId, detail::MemberSlot{detail::MakeExternalMemberStub(m_type, keyId, isStatic, display), m_type, true});
      }
      return *this;
    }
    // A native implementation supplied through externals wins over the declared body.
    if (existing && !existing->isPlaceholder)
      return *this;
    detail::SetSlot(table, keyId, detail::MemberSlot{std::move(body), m_type, false});
    return *this;
  }

  TypeBuilder &TypeBuilder::field(MemberFlags flags, std::string_view name, TypeReference fieldType, DefaultValueThunk defaultValue)
  {
    if (!m_status)
      return *this;
    if (name.empty())
      return Fail(Error{ErrorCode::InvalidArgument, "field name must not be empty"});
    if (fieldType.IsNull())
      return Fail(Error{ErrorCode::InvalidArgument, detail::FormatMessage({"Field '", name, "' has no type"})});
    detail::MemberRecord record{};
    record.kind = MemberKind::Field;
    record.name = detail::InternName(name);
    record.escapedNameId = detail::InternNameId(EscapeName(name));
    record.escapedName = detail::NameFromId(record.escapedNameId);
    record.isStatic = HasFlag(flags, MemberFlags::Static);
    record.isPublic = HasFlag(flags, MemberFlags::Public);
    record.valueType = std::move(fieldType);
    record.defaultValue = std::move(defaultValue);
    detail::Desc(m_type).members.PushBack(std::move(record));
    return *this;
  }

  TypeBuilder &TypeBuilder::method(MemberFlags flags, std::string_view name, MethodSignature signature, MethodBody body)
  {
    if (!body)
      return Fail(Error{ErrorCode::InvalidArgument, detail::FormatMessage({"Method '", name, "' has no body"})});
    return AddMethodRecord(MemberKind::Method, flags, name, EscapeName(name), std::move(signature), std::move(body), false, false);
  }

  TypeBuilder &TypeBuilder::external_method(MemberFlags flags, std::string_view name, MethodSignature signature)
  {
    return AddMethodRecord(MemberKind::Method, flags, name, EscapeName(name), std::move(signature), {}, true, false);
  }

  TypeBuilder &TypeBuilder::constructor(MemberFlags flags, MethodSignature signature, MethodBody body)
  {
    if (!body)
      return Fail(Error{ErrorCode::InvalidArgument, "constructor has no body"});
    const auto instanceFlags = HasFlag(flags, MemberFlags::Public) ? MemberFlags::Public : MemberFlags::None;
    return AddMethodRecord(MemberKind::Constructor, instanceFlags, ".ctor", "_ctor", std::move(signature), std::move(body), false, true);
  }

  TypeBuilder &TypeBuilder::static_constructor(MethodBody body)
  {
    if (!m_status)
      return *this;
    if (!body)
      return Fail(Error{ErrorCode::InvalidArgument, "static constructor has no body"});
    auto &d = detail::Desc(m_type);
    const auto n = ++d.staticConstructorCount;
    std::string escaped{"_cctor"};
    if (n > 1)
      escaped += std::to_string(n);

    detail::MemberRecord record{};
    record.kind = MemberKind::Constructor;
    record.name = ".cctor";
    record.escapedNameId = detail::InternNameId(escaped);
    record.escapedName = detail::NameFromId(record.escapedNameId);
    record.isStatic = true;
    record.isPublic = false;
    record.isSpecialName = true;
    const auto keyId = record.escapedNameId;
    d.members.PushBack(std::move(record));
    detail::SetSlot(d.staticTable, keyId, detail::MemberSlot{std::move(body), m_type, false});
    return *this;
  }

  TypeBuilder &TypeBuilder::raw_method(MemberFlags flags, std::string_view name, MethodBody body)
  {
    if (!m_status)
      return *this;
    if (!body)
      return Fail(Error{ErrorCode::InvalidArgument, detail::FormatMessage({"Method '", name, "' has no body"})});
    auto &d = detail::Desc(m_type);
    detail::MemberRecord record{};
    record.kind = MemberKind::Method;
    record.name = detail::InternName(name);
    record.escapedNameId = detail::InternNameId(EscapeName(name));
    record.escapedName = detail::NameFromId(record.escapedNameId);
    record.isStatic = HasFlag(flags, MemberFlags::Static);
    record.isPublic = HasFlag(flags, MemberFlags::Public);
    record.isRaw = true;
    const auto keyId = record.escapedNameId;
    const bool isStatic = record.isStatic;
    d.members.PushBack(std::move(record));

    auto &table = isStatic ? d.staticTable : d.instanceTable;
    const auto *existing = detail::FindOwnSlot(table, keyId);
    if (existing && !existing->isPlaceholder)
      return *this;
    detail::SetSlot(table, keyId, detail::MemberSlot{std::move(body), m_type, false});
    return *this;
  }

  TypeBuilder &TypeBuilder::property(MemberFlags flags, std::string_view name, TypeReference propertyType)
  {
    if (!m_status)
      return *this;
    if (name.empty())
      return Fail(Error{ErrorCode::InvalidArgument, "property name must not be empty"});
    detail::MemberRecord record{};
    record.kind = MemberKind::Property;
    record.name = detail::InternName(name);
    record.escapedNameId = detail::InternNameId(EscapeName(name));
    record.escapedName = detail::NameFromId(record.escapedNameId);
    record.isStatic = HasFlag(flags, MemberFlags::Static);
    record.isPublic = HasFlag(flags, MemberFlags::Public);
    record.valueType = std::move(propertyType);
    detail::Desc(m_type).members.PushBack(std::move(record));
    return *this;
  }

  TypeBuilder &TypeBuilder::interface_method(std::string_view name, MethodSignature signature)
  {
    if (!m_status)
      return *this;
    auto &d = detail::Desc(m_type);
    if (d.kind != TypeKind::Interface)
      return Fail(Error{ErrorCode::InvalidArgument,
                        detail::FormatMessage({"'", d.fullName, "' is not an interface; cannot declare '", name, "'"})});
    AddMethodRecord(MemberKind::Method, MemberFlags::Public, name, EscapeName(name), std::move(signature), {}, false, false);
    if (!m_status)
      return *this;
    detail::InterfaceMemberDesc member{};
    member.nameId = detail::InternNameId(name);
    member.name = detail::NameFromId(member.nameId);
    member.kind = detail::InterfaceMemberKind::Method;
    for (NGIN::UIntSize i = 0; i < d.interfaceMembers.Size(); ++i)
    {
      if (d.interfaceMembers[i].nameId == member.nameId)
        return *this;
    }
    d.interfaceMembers.PushBack(member);
    return *this;
  }

  TypeBuilder &TypeBuilder::interface_property(std::string_view name, TypeReference propertyType)
  {
    if (!m_status)
      return *this;
    auto &d = detail::Desc(m_type);
    if (d.kind != TypeKind::Interface)
      return Fail(Error{ErrorCode::InvalidArgument,
                        detail::FormatMessage({"'", d.fullName, "' is not an interface; cannot declare '", name, "'"})});
    detail::MemberRecord record{};
    record.kind = MemberKind::Property;
    record.name = detail::InternName(name);
    record.escapedNameId = detail::InternNameId(EscapeName(name));
    record.escapedName = detail::NameFromId(record.escapedNameId);
    record.isAbstract = true;
    record.valueType = std::move(propertyType);
    d.members.PushBack(std::move(record));

    detail::InterfaceMemberDesc member{};
    member.nameId = detail::InternNameId(name);
    member.name = detail::NameFromId(member.nameId);
    member.kind = detail::InterfaceMemberKind::Property;
    d.interfaceMembers.PushBack(member);
    return *this;
  }

  TypeBuilder &TypeBuilder::initializer(QueuedInitializer fn)
  {
    if (!m_status)
      return *this;
    if (!fn)
      return Fail(Error{ErrorCode::InvalidArgument, "initializer must be callable"});
    detail::Desc(m_type).initializers.PushBack(std::move(fn));
    return *this;
  }

} // namespace TypeLoom::Runtime
