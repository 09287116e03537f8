// TypeBuilder.hpp
// Type declarations and the builders used to describe members and external implementations
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string_view>

#include <TypeLoom/Runtime/Export.hpp>
#include <TypeLoom/Runtime/Object.hpp>
#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Type.hpp>
#include <TypeLoom/Runtime/TypeReference.hpp>
#include <TypeLoom/Runtime/Types.hpp>

namespace TypeLoom::Runtime
{

  /// Shape of a type as the translator declares it. Member declarations are supplied separately
  /// and run only when the type is first constructed.
  class TYPELOOM_RUNTIME_API TypeDeclaration
  {
  public:
    struct EnumEntry
    {
      std::string_view name;
      std::int64_t value{0};
    };

    [[nodiscard]] static TypeDeclaration Class(std::string_view fullName) { return TypeDeclaration{fullName, TypeKind::Class}; }
    [[nodiscard]] static TypeDeclaration Struct(std::string_view fullName) { return TypeDeclaration{fullName, TypeKind::Struct}; }
    [[nodiscard]] static TypeDeclaration Interface(std::string_view fullName) { return TypeDeclaration{fullName, TypeKind::Interface}; }
    [[nodiscard]] static TypeDeclaration Enum(std::string_view fullName) { return TypeDeclaration{fullName, TypeKind::Enum}; }

    TypeDeclaration &set_public(bool isPublic)
    {
      m_public = isPublic;
      return *this;
    }
    // Classes default to System.Object, structs to System.ValueType, enums to System.Enum.
    TypeDeclaration &base(TypeReference baseType)
    {
      m_base = std::move(baseType);
      m_hasBase = true;
      return *this;
    }
    // Only the root type has no base.
    TypeDeclaration &no_base()
    {
      m_base = TypeReference{};
      m_hasBase = true;
      return *this;
    }
    TypeDeclaration &generic_parameter(std::string_view name)
    {
      m_genericParameters.PushBack(name);
      return *this;
    }
    TypeDeclaration &implements(TypeReference interfaceType)
    {
      m_interfaces.PushBack(std::move(interfaceType));
      return *this;
    }
    TypeDeclaration &value(std::string_view name, std::int64_t v)
    {
      m_enumEntries.PushBack(EnumEntry{name, v});
      return *this;
    }
    TypeDeclaration &flags()
    {
      m_flags = true;
      return *this;
    }
    TypeDeclaration &custom_check(CheckTypeHook hook)
    {
      m_customCheck = std::move(hook);
      return *this;
    }

    [[nodiscard]] std::string_view FullName() const noexcept { return m_fullName; }
    [[nodiscard]] TypeKind Kind() const noexcept { return m_kind; }
    [[nodiscard]] bool IsPublic() const noexcept { return m_public; }
    [[nodiscard]] bool HasExplicitBase() const noexcept { return m_hasBase; }
    [[nodiscard]] const TypeReference &BaseReference() const noexcept { return m_base; }
    [[nodiscard]] const NGIN::Containers::Vector<std::string_view> &GenericParameters() const noexcept { return m_genericParameters; }
    [[nodiscard]] const NGIN::Containers::Vector<TypeReference> &Interfaces() const noexcept { return m_interfaces; }
    [[nodiscard]] const NGIN::Containers::Vector<EnumEntry> &EnumEntries() const noexcept { return m_enumEntries; }
    [[nodiscard]] bool IsFlags() const noexcept { return m_flags; }
    [[nodiscard]] const CheckTypeHook &CustomCheck() const noexcept { return m_customCheck; }

  private:
    TypeDeclaration(std::string_view fullName, TypeKind kind) : m_fullName(detail::InternName(fullName)), m_kind(kind) {}

    std::string_view m_fullName;
    TypeKind m_kind{TypeKind::Class};
    bool m_public{true};
    bool m_hasBase{false};
    bool m_flags{false};
    TypeReference m_base{};
    NGIN::Containers::Vector<std::string_view> m_genericParameters;
    NGIN::Containers::Vector<TypeReference> m_interfaces;
    NGIN::Containers::Vector<EnumEntry> m_enumEntries;
    CheckTypeHook m_customCheck{};
  };

  /// Passed to the member declaration callback of LoadUnit::Declare. Binds to the type being declared.
  /// The first failing declaration is kept and reported as the initializer's result.
  class TYPELOOM_RUNTIME_API TypeBuilder
  {
  public:
    explicit TypeBuilder(TypeHandle type) : m_type(type) {}

    [[nodiscard]] TypeHandle handle() const noexcept { return m_type; }
    [[nodiscard]] Type self() const noexcept { return Type{m_type}; }
    [[nodiscard]] TypeReference self_ref() const { return TypeReference::Of(m_type); }
    // Reference resolved against the declaring type's load unit, then the public table.
    [[nodiscard]] TypeReference ref(std::string_view name) const;
    [[nodiscard]] TypeReference ref(std::string_view name, std::initializer_list<TypeReference> genericArguments) const;
    // One of this type's own generic parameters.
    [[nodiscard]] TypeReference generic_parameter(std::string_view name) const;

    TypeBuilder &field(MemberFlags flags, std::string_view name, TypeReference fieldType, DefaultValueThunk defaultValue = {});
    TypeBuilder &method(MemberFlags flags, std::string_view name, MethodSignature signature, MethodBody body);
    // Declared without a body; a placeholder stands in until ImplementExternals supplies one.
    TypeBuilder &external_method(MemberFlags flags, std::string_view name, MethodSignature signature);
    TypeBuilder &constructor(MemberFlags flags, MethodSignature signature, MethodBody body);
    // Bodies are run in declaration order as _cctor, _cctor2, ...
    TypeBuilder &static_constructor(MethodBody body);
    // Stored under its plain name; never takes part in overload dispatch.
    TypeBuilder &raw_method(MemberFlags flags, std::string_view name, MethodBody body);
    // Accessors are the get_Name / set_Name methods declared separately.
    TypeBuilder &property(MemberFlags flags, std::string_view name, TypeReference propertyType);
    TypeBuilder &interface_method(std::string_view name, MethodSignature signature);
    TypeBuilder &interface_property(std::string_view name, TypeReference propertyType = {});
    // Queued; runs during type initialization before the static constructors.
    TypeBuilder &initializer(QueuedInitializer fn);

    [[nodiscard]] const std::expected<void, Error> &status() const noexcept { return m_status; }

  private:
    TypeBuilder &Fail(Error error);
    TypeBuilder &AddMethodRecord(MemberKind kind, MemberFlags flags, std::string_view name, std::string_view escapedName,
                                 MethodSignature signature, MethodBody body, bool isPlaceholder, bool isSpecialName);

    TypeHandle m_type{};
    std::expected<void, Error> m_status{};
  };

  /// Native stand-ins applied to every type with a given full name.
  class TYPELOOM_RUNTIME_API ExternalsBuilder
  {
  public:
    explicit ExternalsBuilder(TypeHandle type) : m_type(type) {}

    [[nodiscard]] Type self() const noexcept { return Type{m_type}; }
    // Replace the slot of the overload identified by `signature`.
    ExternalsBuilder &method(MemberFlags flags, std::string_view name, const MethodSignature &signature, MethodBody body);
    ExternalsBuilder &raw_method(MemberFlags flags, std::string_view name, MethodBody body);

  private:
    TypeHandle m_type{};
  };

  /// Register native implementations for the type named `typeFullName`. Applied immediately to an existing
  /// uninitialized type and to every type created later under that name.
  TYPELOOM_RUNTIME_API std::expected<void, Error> ImplementExternals(std::string_view typeFullName,
                                                                      std::function<void(ExternalsBuilder &)> fn);

  namespace detail
  {
    std::expected<BindingHandle, Error> DeclareType(LoadUnitHandle unit, const TypeDeclaration &declaration,
                                                    std::function<void(TypeBuilder &)> members);
  } // namespace detail

} // namespace TypeLoom::Runtime
