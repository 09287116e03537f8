#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Type.hpp>

#include <string>
#include <utility>
#include <vector>

namespace TypeLoom::Runtime
{

  namespace
  {
    constexpr std::string_view kStaleHandle = "stale handle";

    Error Stale()
    {
      return Error{ErrorCode::InvalidArgument, kStaleHandle};
    }

    Error NotAnEnum(TypeHandle h)
    {
      return Error{ErrorCode::InvalidOperation, detail::FormatMessage({"'", detail::Desc(h).fullName, "' is not an enumeration"})};
    }

    template <class W>
    NGIN::Containers::Vector<W> Wrap(const NGIN::Containers::Vector<MemberHandle> &handles)
    {
      NGIN::Containers::Vector<W> out;
      out.Reserve(handles.Size());
      for (NGIN::UIntSize i = 0; i < handles.Size(); ++i)
        out.PushBack(W{handles[i]});
      return out;
    }

    // Most derived match by name; hidden base members come first in the list.
    std::expected<MemberHandle, Error> LastNamed(TypeHandle h, BindingFlags flags, MemberKind kind, std::string_view name,
                                                 std::string_view what)
    {
      auto found = detail::GetMembersInternal(h, flags, kind, false, name);
      if (found.Size() == 0)
        return std::unexpected(Error{ErrorCode::NotFound,
                                     detail::FormatMessage({"Type '", detail::Desc(h).fullName, "' has no ", what, " '", name, "'"})});
      return found[found.Size() - 1];
    }
  } // namespace

  std::string_view Type::FullName() const
  {
    return IsValid() ? detail::Desc(m_h).fullName : std::string_view{};
  }

  std::string_view Type::ShortName() const
  {
    return IsValid() ? detail::Desc(m_h).shortName : std::string_view{};
  }

  std::string_view Type::Namespace() const
  {
    return IsValid() ? GetNamespaceName(detail::Desc(m_h).fullNameWithoutArguments) : std::string_view{};
  }

  std::string_view Type::TypeId() const
  {
    return IsValid() ? detail::Desc(m_h).typeId : std::string_view{};
  }

  TypeKind Type::Kind() const
  {
    return IsValid() ? detail::Desc(m_h).kind : TypeKind::Class;
  }

  bool Type::IsValueType() const
  {
    return IsValid() && !detail::Desc(m_h).isReferenceType;
  }

  bool Type::IsClosed() const
  {
    return IsValid() && detail::Desc(m_h).isClosed;
  }

  bool Type::IsGenericTypeDefinition() const
  {
    if (!IsValid())
      return false;
    const auto &d = detail::Desc(m_h);
    return !d.openType.IsValid() && d.genericParameterNames.Size() > 0;
  }

  bool Type::IsInitialized() const
  {
    return IsValid() && detail::Desc(m_h).initialized;
  }

  NGIN::UInt32 Type::InheritanceDepth() const
  {
    return IsValid() ? detail::Desc(m_h).inheritanceDepth : 0;
  }

  LoadUnit Type::GetLoadUnit() const
  {
    return IsValid() ? LoadUnit{detail::Desc(m_h).loadUnit} : LoadUnit{};
  }

  std::optional<Type> Type::BaseType() const
  {
    if (!IsValid() || !detail::IsTypeAlive(detail::Desc(m_h).baseType))
      return std::nullopt;
    return Type{detail::Desc(m_h).baseType};
  }

  NGIN::UIntSize Type::GenericParameterCount() const
  {
    return IsValid() ? detail::MembersOwner(m_h).genericParameterNames.Size() : 0;
  }

  std::string_view Type::GenericParameterName(NGIN::UIntSize i) const
  {
    if (!IsValid())
      return {};
    const auto &names = detail::MembersOwner(m_h).genericParameterNames;
    return i < names.Size() ? names[i] : std::string_view{};
  }

  NGIN::UIntSize Type::GenericArgumentCount() const
  {
    return IsValid() ? detail::Desc(m_h).genericArguments.Size() : 0;
  }

  TypeReference Type::GenericArgumentAt(NGIN::UIntSize i) const
  {
    if (!IsValid() || i >= detail::Desc(m_h).genericArguments.Size())
      return TypeReference{};
    return detail::Desc(m_h).genericArguments[i];
  }

  std::optional<Type> Type::GenericTypeDefinition() const
  {
    if (!IsValid())
      return std::nullopt;
    const auto &d = detail::Desc(m_h);
    if (d.openType.IsValid())
      return Type{d.openType};
    if (d.genericParameterNames.Size() > 0)
      return *this;
    return std::nullopt;
  }

  ExpectedValue Type::CreateInstance(std::span<const Any> args) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    const auto &d = detail::Desc(m_h);
    if (!d.isClosed)
      return std::unexpected(Error{ErrorCode::InvalidOperation,
                                   detail::FormatMessage({"Cannot construct an instance of an open type ('", d.fullName, "')"})});
    if (d.kind == TypeKind::Interface)
      return std::unexpected(Error{ErrorCode::InvalidOperation,
                                   detail::FormatMessage({"Cannot create an instance of the interface '", d.fullName, "'"})});
    detail::InitializeType(m_h);

    if (d.kind == TypeKind::Enum && args.empty())
      return Any{EnumValue{m_h, 0}};
    if (detail::MembersOwner(m_h).nativeDefault && args.empty())
      return detail::MembersOwner(m_h).nativeDefault();

    auto object = detail::AllocateInstance(m_h);
    if (!object)
      return std::unexpected(object.error());
    Any self{*object};

    if (!d.methodGroupsBuilt)
    {
      auto built = detail::BuildMethodGroups(m_h);
      if (!built)
        ReportError(built.error());
    }
    // Constructors are looked up on the type itself; a base constructor is never inherited.
    const auto *ctor = detail::FindOwnSlot(d.instanceTable, detail::InternNameId("_ctor"));
    if (!ctor && d.openType.IsValid())
      ctor = detail::FindOwnSlot(detail::Desc(d.openType).instanceTable, detail::InternNameId("_ctor"));
    if (ctor && !ctor->isRemoved)
    {
      detail::MemberSlot slot = *ctor;
      auto r = detail::InvokeSlot(slot, self, args, m_h);
      if (!r)
        return std::unexpected(r.error());
      return self;
    }

    if (!args.empty())
      return std::unexpected(Error{ErrorCode::NoApplicableOverload,
                                   detail::FormatMessage({"Type '", d.fullName, "' has no constructor accepting ", std::to_string(args.size()),
                                                          " argument(s)."})});
    if (d.kind != TypeKind::Struct)
      ReportWarning(ErrorCode::NoDefaultConstructor,
                    detail::FormatMessage({"Type '", d.fullName, "' has no default constructor; the instance keeps its default field values."}));
    return self;
  }

  ExpectedValue Type::CallStatic(std::string_view name, std::span<const Any> args) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    detail::InitializeType(m_h);
    return detail::InvokeMember(m_h, Any::MakeVoid(), detail::InternNameId(EscapeName(name)), true, args);
  }

  ExpectedValue Type::CallStatic(std::string_view name, const MethodSignature &signature, std::span<const Any> args) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    detail::InitializeType(m_h);
    auto key = signature.GetKey(EscapeName(name));
    if (!key)
      return std::unexpected(key.error());
    return detail::InvokeMember(m_h, Any::MakeVoid(), detail::InternNameId(*key), true, args);
  }

  ExpectedValue Type::CallStaticGeneric(std::string_view name, std::span<const Type> genericArguments, std::span<const Any> args) const
  {
    std::vector<Any> all;
    all.reserve(genericArguments.size() + args.size());
    for (const auto &g : genericArguments)
      all.push_back(Any{g.Handle()});
    for (const auto &a : args)
      all.push_back(a);
    return CallStatic(name, std::span<const Any>{all.data(), all.size()});
  }

  ExpectedValue Type::GetStaticField(std::string_view name) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    detail::InitializeType(m_h);
    detail::LayoutFields(m_h);
    const auto &d = detail::Desc(m_h);
    NameId id{};
    if (detail::FindNameId(name, id))
    {
      if (auto *p = d.staticFieldIndex.GetPtr(id))
        return d.staticFieldValues[*p];
    }
    return std::unexpected(Error{ErrorCode::NotFound, detail::FormatMessage({"Type '", d.fullName, "' has no static field '", name, "'"})});
  }

  std::expected<void, Error> Type::SetStaticField(std::string_view name, Any value) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    detail::InitializeType(m_h);
    detail::LayoutFields(m_h);
    auto &d = detail::Desc(m_h);
    NameId id{};
    if (detail::FindNameId(name, id))
    {
      if (auto *p = d.staticFieldIndex.GetPtr(id))
      {
        const auto idx = *p;
        auto fieldType = detail::ResolveToType(d.staticFields[idx].fieldType, m_h);
        if (fieldType && !detail::CheckValue(value, *fieldType))
          return std::unexpected(Error{ErrorCode::InvalidCast,
                                       detail::FormatMessage({"Cannot assign the value to static field '", d.fullName, ".", name, "' of type '",
                                                              detail::Desc(*fieldType).fullName, "'"})});
        d.staticFieldValues[idx] = std::move(value);
        return {};
      }
    }
    return std::unexpected(Error{ErrorCode::NotFound, detail::FormatMessage({"Type '", d.fullName, "' has no static field '", name, "'"})});
  }

  ExpectedValue Type::GetStaticProperty(std::string_view name) const
  {
    return CallStatic(detail::FormatMessage({"get_", name}));
  }

  std::expected<void, Error> Type::SetStaticProperty(std::string_view name, Any value) const
  {
    std::array<Any, 1> args{std::move(value)};
    auto r = CallStatic(detail::FormatMessage({"set_", name}), std::span<const Any>{args.data(), args.size()});
    if (!r)
      return std::unexpected(r.error());
    return {};
  }

  ObjectRef Type::GetTypeObject() const
  {
    return detail::GetRuntimeTypeObject(m_h);
  }

  // Reflection
  NGIN::Containers::Vector<Member> Type::GetMembers(BindingFlags flags) const
  {
    return Wrap<Member>(detail::GetMembersInternal(m_h, flags, std::nullopt, false));
  }

  NGIN::Containers::Vector<Member> Type::GetMembers(BindingFlags flags, MemberKind kind, std::string_view name) const
  {
    return Wrap<Member>(detail::GetMembersInternal(m_h, flags, kind, kind == MemberKind::Constructor, name));
  }

  NGIN::Containers::Vector<Method> Type::GetMethods(BindingFlags flags) const
  {
    return Wrap<Method>(detail::GetMembersInternal(m_h, flags, MemberKind::Method, false));
  }

  ExpectedMethod Type::GetMethod(std::string_view name, BindingFlags flags) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    auto found = detail::GetMembersInternal(m_h, flags, MemberKind::Method, false, name);
    if (found.Size() == 0)
      return std::unexpected(Error{ErrorCode::NotFound,
                                   detail::FormatMessage({"Type '", FullName(), "' has no method '", name, "'"})});
    // Overloads with different signatures make the name ambiguous; a hidden base method does not.
    const auto last = Method{found[found.Size() - 1]};
    auto lastSig = last.Signature();
    for (NGIN::UIntSize i = 0; i + 1 < found.Size(); ++i)
    {
      auto sig = Method{found[i]}.Signature();
      if (!sig || !lastSig)
        continue;
      auto a = sig->Hash();
      auto b = lastSig->Hash();
      if (a && b && *a != *b)
        return std::unexpected(Error{ErrorCode::InvalidOperation,
                                     detail::FormatMessage({"Ambiguous match for method '", FullName(), ".", name, "'"})});
    }
    return last;
  }

  NGIN::Containers::Vector<Method> Type::GetConstructors(BindingFlags flags) const
  {
    return Wrap<Method>(detail::GetMembersInternal(m_h, flags, MemberKind::Constructor, true));
  }

  NGIN::Containers::Vector<Field> Type::GetFields(BindingFlags flags) const
  {
    return Wrap<Field>(detail::GetMembersInternal(m_h, flags, MemberKind::Field, false));
  }

  ExpectedField Type::GetField(std::string_view name, BindingFlags flags) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    auto r = LastNamed(m_h, flags, MemberKind::Field, name, "field");
    if (!r)
      return std::unexpected(r.error());
    return Field{*r};
  }

  NGIN::Containers::Vector<Property> Type::GetProperties(BindingFlags flags) const
  {
    return Wrap<Property>(detail::GetMembersInternal(m_h, flags, MemberKind::Property, false));
  }

  ExpectedProperty Type::GetProperty(std::string_view name, BindingFlags flags) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    auto r = LastNamed(m_h, flags, MemberKind::Property, name, "property");
    if (!r)
      return std::unexpected(r.error());
    return Property{*r};
  }

  // Enumerations
  bool Type::IsFlagsEnum() const
  {
    return IsValid() && detail::Desc(m_h).isFlagsEnum;
  }

  NGIN::UIntSize Type::EnumValueCount() const
  {
    return IsValid() ? detail::MembersOwner(m_h).enumEntries.Size() : 0;
  }

  std::string_view Type::EnumNameAt(NGIN::UIntSize i) const
  {
    if (!IsValid())
      return {};
    const auto &entries = detail::MembersOwner(m_h).enumEntries;
    return i < entries.Size() ? entries[i].name : std::string_view{};
  }

  ExpectedValue Type::ParseEnum(std::string_view name) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    if (Kind() != TypeKind::Enum)
      return std::unexpected(NotAnEnum(m_h));
    const auto &d = detail::Desc(m_h);

    auto lookup = [&d](std::string_view part, std::int64_t &out) -> bool
    {
      while (!part.empty() && part.front() == ' ')
        part.remove_prefix(1);
      while (!part.empty() && part.back() == ' ')
        part.remove_suffix(1);
      NameId id{};
      if (!detail::FindNameId(part, id))
        return false;
      auto *p = d.enumByName.GetPtr(id);
      if (!p)
        return false;
      out = d.enumEntries[*p].value;
      return true;
    };

    std::int64_t value = 0;
    if (d.isFlagsEnum && name.find(',') != std::string_view::npos)
    {
      std::size_t start = 0;
      while (start <= name.size())
      {
        const auto comma = name.find(',', start);
        const auto part = name.substr(start, comma == std::string_view::npos ? std::string_view::npos : comma - start);
        std::int64_t bits = 0;
        if (!lookup(part, bits))
          return std::unexpected(Error{ErrorCode::InvalidArgument, detail::FormatMessage({"Requested value '", part, "' was not found."})});
        value |= bits;
        if (comma == std::string_view::npos)
          break;
        start = comma + 1;
      }
      return Any{EnumValue{m_h, value}};
    }
    if (!lookup(name, value))
      return std::unexpected(Error{ErrorCode::InvalidArgument, detail::FormatMessage({"Requested value '", name, "' was not found."})});
    return Any{EnumValue{m_h, value}};
  }

  std::optional<std::string_view> Type::EnumName(std::int64_t value) const
  {
    if (!IsValid() || Kind() != TypeKind::Enum)
      return std::nullopt;
    const auto &d = detail::Desc(m_h);
    if (auto *p = d.enumByValue.GetPtr(static_cast<NGIN::UInt64>(value)))
      return d.enumEntries[*p].name;
    return std::nullopt;
  }

  ExpectedValue Type::EnumFromValue(std::int64_t value) const
  {
    if (!IsValid())
      return std::unexpected(Stale());
    if (Kind() != TypeKind::Enum)
      return std::unexpected(NotAnEnum(m_h));
    return Any{EnumValue{m_h, value}};
  }

} // namespace TypeLoom::Runtime
