// TypeReference.hpp
// Forward type references, generic parameter references and content-addressed method signatures
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <expected>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include <TypeLoom/Runtime/Export.hpp>
#include <TypeLoom/Runtime/Types.hpp>

namespace TypeLoom::Runtime
{

  enum class TypeReferenceKind : unsigned char
  {
    Null = 0,
    Resolved = 1,
    Named = 2,
    GenericParameter = 3,
    PositionalParameter = 4,
  };

  namespace detail
  {
    struct TypeReferenceData;
  }

  /// Immutable reference to a type. Copies share the same data; resolving never mutates a reference,
  /// it produces a new one. A default-constructed reference is the null (void) reference.
  class TYPELOOM_RUNTIME_API TypeReference
  {
  public:
    TypeReference() = default;

    [[nodiscard]] static TypeReference Of(TypeHandle handle);
    [[nodiscard]] static TypeReference Of(const Type &type);
    [[nodiscard]] static TypeReference Named(LoadUnitHandle unit, std::string_view name);
    [[nodiscard]] static TypeReference Named(LoadUnitHandle unit, std::string_view name, std::initializer_list<TypeReference> genericArguments);
    [[nodiscard]] static TypeReference Named(LoadUnitHandle unit, std::string_view name, const NGIN::Containers::Vector<TypeReference> &genericArguments);
    /// Named generic parameter `name` introduced by the type `ownerName` of `unit`.
    [[nodiscard]] static TypeReference Parameter(LoadUnitHandle unit, std::string_view ownerName, std::string_view name);
    /// Method-level generic parameter "!!index", bound only at call time.
    [[nodiscard]] static TypeReference Positional(NGIN::UInt32 index);

    [[nodiscard]] TypeReferenceKind Kind() const noexcept;
    [[nodiscard]] bool IsNull() const noexcept { return Kind() == TypeReferenceKind::Null; }
    [[nodiscard]] bool IsGenericParameter() const noexcept
    {
      const auto k = Kind();
      return k == TypeReferenceKind::GenericParameter || k == TypeReferenceKind::PositionalParameter;
    }

    [[nodiscard]] TypeHandle GetHandle() const noexcept;
    [[nodiscard]] LoadUnitHandle GetLoadUnit() const noexcept;
    /// Type name for named references, parameter name for generic parameters.
    [[nodiscard]] std::string_view GetName() const noexcept;
    [[nodiscard]] std::string_view GetOwnerName() const noexcept;
    [[nodiscard]] NGIN::UInt32 GetPosition() const noexcept;
    [[nodiscard]] NGIN::UIntSize GenericArgumentCount() const noexcept;
    [[nodiscard]] const TypeReference &GenericArgumentAt(NGIN::UIntSize i) const;

    /// Identity key of the referenced type. Never constructs the type.
    [[nodiscard]] std::expected<std::string_view, Error> GetTypeId() const;

    /// Human readable form used in diagnostics.
    [[nodiscard]] std::string ToString() const;

  private:
    explicit TypeReference(std::shared_ptr<const detail::TypeReferenceData> data) : m_data(std::move(data)) {}

    std::shared_ptr<const detail::TypeReferenceData> m_data{};
  };

  /// Return type, ordered argument types and generic parameter names of a method.
  /// The hash is derived from the identities of the referenced types and is cached.
  class TYPELOOM_RUNTIME_API MethodSignature
  {
  public:
    MethodSignature() = default;
    MethodSignature(TypeReference returnType, std::initializer_list<TypeReference> argumentTypes);
    MethodSignature(TypeReference returnType, std::initializer_list<TypeReference> argumentTypes,
                    std::initializer_list<std::string_view> genericParameterNames);
    MethodSignature(TypeReference returnType, NGIN::Containers::Vector<TypeReference> argumentTypes,
                    NGIN::Containers::Vector<std::string_view> genericParameterNames);

    [[nodiscard]] const TypeReference &ReturnType() const noexcept { return m_returnType; }
    [[nodiscard]] NGIN::UIntSize ArgumentCount() const noexcept { return m_argumentTypes.Size(); }
    [[nodiscard]] const TypeReference &ArgumentAt(NGIN::UIntSize i) const { return m_argumentTypes[i]; }
    [[nodiscard]] const NGIN::Containers::Vector<TypeReference> &ArgumentTypes() const noexcept { return m_argumentTypes; }
    [[nodiscard]] NGIN::UIntSize GenericParameterCount() const noexcept { return m_genericParameterNames.Size(); }
    [[nodiscard]] std::string_view GenericParameterAt(NGIN::UIntSize i) const { return m_genericParameterNames[i]; }

    /// "`N" (generic only) + "$" + argument ids joined by "," ("void" if none) + "=" + return id ("void" if none).
    [[nodiscard]] std::expected<std::string_view, Error> Hash() const;
    /// Escaped member name followed by the hash; the key a single overload is stored under.
    [[nodiscard]] std::expected<std::string_view, Error> GetKey(std::string_view escapedName) const;

    [[nodiscard]] std::string ToString(std::string_view methodFullName) const;

  private:
    TypeReference m_returnType{};
    NGIN::Containers::Vector<TypeReference> m_argumentTypes{};
    NGIN::Containers::Vector<std::string_view> m_genericParameterNames{};
    mutable std::string_view m_hash{};
  };

  /// Join argument identities with ","; "void" for an empty list.
  [[nodiscard]] TYPELOOM_RUNTIME_API std::expected<std::string_view, Error>
  HashTypeArgumentArray(const NGIN::Containers::Vector<TypeReference> &arguments);

} // namespace TypeLoom::Runtime
