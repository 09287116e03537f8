// Type.hpp
// Public wrappers over registry handles: load units, bindings, types and reflected members
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <array>
#include <expected>
#include <functional>
#include <initializer_list>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

#include <TypeLoom/Runtime/Export.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/Object.hpp>
#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/TypeReference.hpp>
#include <TypeLoom/Runtime/Types.hpp>

namespace TypeLoom::Runtime
{

  class TypeDeclaration;
  class TypeBuilder;

  class TYPELOOM_RUNTIME_API Type
  {
  public:
    constexpr Type() = default;
    explicit constexpr Type(TypeHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept { return detail::IsTypeAlive(m_h); }
    [[nodiscard]] TypeHandle Handle() const noexcept { return m_h; }

    [[nodiscard]] std::string_view FullName() const;
    [[nodiscard]] std::string_view ShortName() const;
    [[nodiscard]] std::string_view Namespace() const;
    /// Process-wide identity key; equal keys mean the same type or instantiation.
    [[nodiscard]] std::string_view TypeId() const;
    [[nodiscard]] TypeKind Kind() const;
    [[nodiscard]] bool IsInterface() const { return Kind() == TypeKind::Interface; }
    [[nodiscard]] bool IsEnum() const { return Kind() == TypeKind::Enum; }
    [[nodiscard]] bool IsValueType() const;
    [[nodiscard]] bool IsClosed() const;
    [[nodiscard]] bool IsGenericTypeDefinition() const;
    [[nodiscard]] bool IsInitialized() const;
    [[nodiscard]] NGIN::UInt32 InheritanceDepth() const;
    [[nodiscard]] LoadUnit GetLoadUnit() const;

    [[nodiscard]] std::optional<Type> BaseType() const;
    /// Every interface the type implements, transitively and without duplicates.
    [[nodiscard]] NGIN::Containers::Vector<Type> GetInterfaces() const;

    [[nodiscard]] NGIN::UIntSize GenericParameterCount() const;
    [[nodiscard]] std::string_view GenericParameterName(NGIN::UIntSize i) const;
    [[nodiscard]] NGIN::UIntSize GenericArgumentCount() const;
    [[nodiscard]] TypeReference GenericArgumentAt(NGIN::UIntSize i) const;
    [[nodiscard]] std::optional<Type> GenericTypeDefinition() const;

    /// Close this generic type definition over `arguments`. Initializes the result when this type is initialized.
    [[nodiscard]] ExpectedType Of(std::initializer_list<TypeReference> arguments) const;
    [[nodiscard]] ExpectedType Of(const NGIN::Containers::Vector<TypeReference> &arguments) const;
    [[nodiscard]] ExpectedType OfNoInitialize(const NGIN::Containers::Vector<TypeReference> &arguments) const;

    /// Run the initialization pass now instead of waiting for the owning load unit to be sealed.
    void Initialize() const;

    [[nodiscard]] bool IsAssignableTo(const Type &target) const;
    [[nodiscard]] bool IsAssignableFrom(const Type &source) const { return source.IsAssignableTo(*this); }
    [[nodiscard]] bool IsInstance(const Any &value) const;

    [[nodiscard]] ExpectedValue CreateInstance(std::span<const Any> args = {}) const;
    template <class... A>
    [[nodiscard]] ExpectedValue New(A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      return CreateInstance(std::span<const Any>{tmp.data(), tmp.size()});
    }

    // Static members
    [[nodiscard]] ExpectedValue CallStatic(std::string_view name, std::span<const Any> args = {}) const;
    /// Call one specific overload; honors methods renamed by generic closure.
    [[nodiscard]] ExpectedValue CallStatic(std::string_view name, const MethodSignature &signature, std::span<const Any> args) const;
    [[nodiscard]] ExpectedValue CallStaticGeneric(std::string_view name, std::span<const Type> genericArguments,
                                                  std::span<const Any> args) const;
    template <class R, class... A>
    [[nodiscard]] std::expected<R, Error> InvokeStatic(std::string_view name, A &&...a) const
    {
      std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
      auto r = CallStatic(name, std::span<const Any>{tmp.data(), tmp.size()});
      if (!r.has_value())
        return std::unexpected(r.error());
      if constexpr (std::is_void_v<R>)
      {
        return {};
      }
      else
      {
        return r->template Cast<R>();
      }
    }
    [[nodiscard]] ExpectedValue GetStaticField(std::string_view name) const;
    [[nodiscard]] std::expected<void, Error> SetStaticField(std::string_view name, Any value) const;
    [[nodiscard]] ExpectedValue GetStaticProperty(std::string_view name) const;
    [[nodiscard]] std::expected<void, Error> SetStaticProperty(std::string_view name, Any value) const;

    /// The System.RuntimeType object describing this type (a shared stub while the root is bootstrapping).
    [[nodiscard]] ObjectRef GetTypeObject() const;

    // Reflection
    [[nodiscard]] NGIN::Containers::Vector<Member> GetMembers(BindingFlags flags = BindingFlags::None) const;
    [[nodiscard]] NGIN::Containers::Vector<Member> GetMembers(BindingFlags flags, MemberKind kind, std::string_view name = {}) const;
    [[nodiscard]] NGIN::Containers::Vector<Method> GetMethods(BindingFlags flags = BindingFlags::None) const;
    [[nodiscard]] ExpectedMethod GetMethod(std::string_view name, BindingFlags flags = BindingFlags::None) const;
    [[nodiscard]] NGIN::Containers::Vector<Method> GetConstructors(BindingFlags flags = BindingFlags::None) const;
    [[nodiscard]] NGIN::Containers::Vector<Field> GetFields(BindingFlags flags = BindingFlags::None) const;
    [[nodiscard]] ExpectedField GetField(std::string_view name, BindingFlags flags = BindingFlags::None) const;
    [[nodiscard]] NGIN::Containers::Vector<Property> GetProperties(BindingFlags flags = BindingFlags::None) const;
    [[nodiscard]] ExpectedProperty GetProperty(std::string_view name, BindingFlags flags = BindingFlags::None) const;

    // Enumerations
    [[nodiscard]] bool IsFlagsEnum() const;
    [[nodiscard]] NGIN::UIntSize EnumValueCount() const;
    [[nodiscard]] std::string_view EnumNameAt(NGIN::UIntSize i) const;
    [[nodiscard]] ExpectedValue ParseEnum(std::string_view name) const;
    [[nodiscard]] std::optional<std::string_view> EnumName(std::int64_t value) const;
    [[nodiscard]] ExpectedValue EnumFromValue(std::int64_t value) const;

    friend bool operator==(const Type &a, const Type &b) noexcept { return a.m_h == b.m_h; }

  private:
    TypeHandle m_h{};
  };

  class TYPELOOM_RUNTIME_API TypeBinding
  {
  public:
    constexpr TypeBinding() = default;
    explicit constexpr TypeBinding(BindingHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      return m_h.IsValid() && m_h.index < detail::GetRegistry().bindings.Size();
    }
    [[nodiscard]] BindingHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] bool IsPublic() const;
    [[nodiscard]] bool IsSealed() const;
    [[nodiscard]] BindingState State() const;
    [[nodiscard]] LoadUnit GetLoadUnit() const;

    /// Construct on first access; initializes too once the binding is sealed.
    [[nodiscard]] ExpectedType Get() const;
    [[nodiscard]] ExpectedType GetNoInitialize() const;

  private:
    BindingHandle m_h{};
  };

  class TYPELOOM_RUNTIME_API LoadUnit
  {
  public:
    constexpr LoadUnit() = default;
    explicit constexpr LoadUnit(LoadUnitHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept
    {
      return m_h.IsValid() && m_h.index < detail::GetRegistry().loadUnits.Size();
    }
    [[nodiscard]] LoadUnitHandle Handle() const noexcept { return m_h; }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] std::string_view ShortName() const;
    [[nodiscard]] NGIN::UInt32 AssemblyId() const;

    /// Register a declared type. Nothing is constructed until the binding is first accessed.
    ExpectedBinding Declare(const TypeDeclaration &declaration, std::function<void(TypeBuilder &)> members = {}) const;
    /// Low-level registration with explicit creator and initializer thunks.
    ExpectedBinding RegisterName(std::string_view name, bool isPublic, TypeCreator creator,
                                 TypeInitializerThunk initializer = {}) const;

    [[nodiscard]] ExpectedBinding GetBinding(std::string_view name) const;
    [[nodiscard]] ExpectedType GetType(std::string_view name) const;

    [[nodiscard]] TypeReference Ref(std::string_view name) const { return TypeReference::Named(m_h, name); }
    [[nodiscard]] TypeReference Ref(std::string_view name, std::initializer_list<TypeReference> genericArguments) const
    {
      return TypeReference::Named(m_h, name, genericArguments);
    }
    [[nodiscard]] TypeReference Parameter(std::string_view ownerName, std::string_view name) const
    {
      return TypeReference::Parameter(m_h, ownerName, name);
    }

    /// Mark every binding complete; later accesses run the initialization pass.
    void Seal() const;

  private:
    LoadUnitHandle m_h{};
  };

  class TYPELOOM_RUNTIME_API Member
  {
  public:
    constexpr Member() = default;
    explicit constexpr Member(MemberHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_h.IsValid(); }
    [[nodiscard]] MemberKind Kind() const noexcept { return m_h.kind; }
    [[nodiscard]] bool IsField() const noexcept { return m_h.kind == MemberKind::Field; }
    [[nodiscard]] bool IsProperty() const noexcept { return m_h.kind == MemberKind::Property; }
    [[nodiscard]] bool IsMethod() const noexcept { return m_h.kind == MemberKind::Method; }
    [[nodiscard]] bool IsConstructor() const noexcept { return m_h.kind == MemberKind::Constructor; }

    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] Type DeclaringType() const { return Type{TypeHandle{m_h.typeIndex}}; }
    [[nodiscard]] bool IsStatic() const;
    [[nodiscard]] bool IsPublic() const;
    [[nodiscard]] bool IsSpecialName() const;

    [[nodiscard]] Field AsField() const;
    [[nodiscard]] Method AsMethod() const;
    [[nodiscard]] Property AsProperty() const;

  private:
    MemberHandle m_h{};
  };

  class TYPELOOM_RUNTIME_API Method
  {
  public:
    constexpr Method() = default;
    explicit constexpr Method(MemberHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_h.IsValid(); }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] Type DeclaringType() const { return Type{TypeHandle{m_h.typeIndex}}; }
    [[nodiscard]] bool IsStatic() const;
    [[nodiscard]] bool IsPublic() const;
    [[nodiscard]] bool IsConstructor() const noexcept { return m_h.kind == MemberKind::Constructor; }
    [[nodiscard]] bool IsPlaceholder() const;
    [[nodiscard]] NGIN::UIntSize GenericParameterCount() const;
    [[nodiscard]] NGIN::UIntSize ParameterCount() const;

    [[nodiscard]] bool ReturnsVoid() const;
    [[nodiscard]] ExpectedType ReturnType() const;
    [[nodiscard]] ExpectedType ParameterType(NGIN::UIntSize i) const;
    /// Signature with the declaring type's generic arguments substituted.
    [[nodiscard]] std::expected<MethodSignature, Error> Signature() const;
    [[nodiscard]] std::string ToString() const;

    /// Dispatch this overload by signature on `target` (ignored for static methods).
    [[nodiscard]] ExpectedValue Invoke(const Any &target, std::span<const Any> args = {}) const;

  private:
    MemberHandle m_h{};
  };

  class TYPELOOM_RUNTIME_API Field
  {
  public:
    constexpr Field() = default;
    explicit constexpr Field(MemberHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_h.IsValid(); }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] Type DeclaringType() const { return Type{TypeHandle{m_h.typeIndex}}; }
    [[nodiscard]] bool IsStatic() const;
    [[nodiscard]] bool IsPublic() const;
    [[nodiscard]] ExpectedType FieldType() const;

    [[nodiscard]] ExpectedValue GetValue(const Any &target) const;
    /// Type-checks `value` against the resolved field type before storing it.
    [[nodiscard]] std::expected<void, Error> SetValue(const Any &target, Any value) const;

  private:
    MemberHandle m_h{};
  };

  class TYPELOOM_RUNTIME_API Property
  {
  public:
    constexpr Property() = default;
    explicit constexpr Property(MemberHandle h) : m_h(h) {}

    [[nodiscard]] bool IsValid() const noexcept { return m_h.IsValid(); }
    [[nodiscard]] std::string_view Name() const;
    [[nodiscard]] Type DeclaringType() const { return Type{TypeHandle{m_h.typeIndex}}; }
    [[nodiscard]] bool IsStatic() const;
    [[nodiscard]] bool IsPublic() const;
    [[nodiscard]] ExpectedType PropertyType() const;

    [[nodiscard]] ExpectedValue GetValue(const Any &target) const;
    [[nodiscard]] std::expected<void, Error> SetValue(const Any &target, Any value) const;

  private:
    MemberHandle m_h{};
  };

  // Load units
  TYPELOOM_RUNTIME_API ExpectedLoadUnit DeclareLoadUnit(std::string_view name);
  TYPELOOM_RUNTIME_API ExpectedLoadUnit GetLoadUnit(std::string_view name);
  [[nodiscard]] TYPELOOM_RUNTIME_API LoadUnit CoreLoadUnit();
  TYPELOOM_RUNTIME_API void SealLoadUnit(const LoadUnit &unit);
  /// Seal every registered binding.
  TYPELOOM_RUNTIME_API void Initialize();

  // Name lookup
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedType GetTypeByName(std::string_view name, std::optional<LoadUnit> unit = std::nullopt);
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedBinding ResolveName(std::string_view name, std::optional<LoadUnit> unit = std::nullopt);
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedType GetTypeFromParsedName(const ParsedTypeName &parsed,
                                                                        std::optional<LoadUnit> defaultUnit = std::nullopt);

  // Dispatch
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue Invoke(const Any &target, std::string_view name, std::span<const Any> args = {});
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue InvokeGeneric(const Any &target, std::string_view name,
                                                                std::span<const Type> genericArguments, std::span<const Any> args = {});
  /// Call the overload identified by `signature` on the runtime type of `target`.
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue CallVirtual(const Any &target, std::string_view name,
                                                              const MethodSignature &signature, std::span<const Any> args = {});

  template <class R, class... A>
  [[nodiscard]] std::expected<R, Error> InvokeAs(const Any &target, std::string_view name, A &&...a)
  {
    std::array<Any, sizeof...(A)> tmp{Any{std::forward<A>(a)}...};
    auto r = Invoke(target, name, std::span<const Any>{tmp.data(), tmp.size()});
    if (!r.has_value())
      return std::unexpected(r.error());
    if constexpr (std::is_void_v<R>)
    {
      return {};
    }
    else
    {
      return r->template Cast<R>();
    }
  }

  // Fields and properties of instances
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue GetField(const Any &target, std::string_view name);
  [[nodiscard]] TYPELOOM_RUNTIME_API std::expected<void, Error> SetField(const Any &target, std::string_view name, Any value);
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue GetProperty(const Any &target, std::string_view name);
  [[nodiscard]] TYPELOOM_RUNTIME_API std::expected<void, Error> SetProperty(const Any &target, std::string_view name, Any value);

  // Type checks
  [[nodiscard]] TYPELOOM_RUNTIME_API bool CheckType(const Any &value, const Type &expected);
  [[nodiscard]] TYPELOOM_RUNTIME_API bool IsAssignable(const Type &source, const Type &target);
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue Cast(const Any &value, const Type &target);
  /// Null instead of an error when the value is not an instance; fails for value types.
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue TryCast(const Any &value, const Type &target);
  [[nodiscard]] TYPELOOM_RUNTIME_API std::optional<Type> GetValueType(const Any &value);

  // Arrays
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedValue NewArray(const Type &elementType, NGIN::UIntSize length);
  [[nodiscard]] TYPELOOM_RUNTIME_API ExpectedType GetArrayType(const Type &elementType);

} // namespace TypeLoom::Runtime
