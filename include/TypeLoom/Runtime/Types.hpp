// Types.hpp
// Error codes, diagnostics and small handle types shared by the whole runtime
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <string_view>
#include <expected>
#include <utility>
#include <optional>
#include <memory>

namespace TypeLoom::Runtime
{

  using Any = NGIN::Utilities::Any<>;
  using NameId = NGIN::UInt32;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    DuplicateDefinition = 3,
    AmbiguousType = 4,
    NameResolution = 5,
    RecursiveConstruction = 6,
    TypeInitialization = 7,
    GenericArity = 8,
    NoApplicableOverload = 9,
    InvalidCast = 10,
    NotImplemented = 11,
    InvalidOperation = 12,

    // Reported as warnings only
    MissingInterfaceMember = 100,
    UndefinedInterface = 101,
    NotAnInterface = 102,
    PlaceholderFallback = 103,
    NoDefaultConstructor = 104,
  };

  enum class DiagnosticCode : unsigned
  {
    None = 0,
    ArityMismatch = 1,
    NonConvertible = 2,
    NoOverloads = 3,
    GenericArityMismatch = 4,
  };

  struct OverloadDiagnostic
  {
    NGIN::UInt32 candidateIndex{static_cast<NGIN::UInt32>(-1)};
    std::string_view signature{};
    NGIN::UIntSize arity{0};
    NGIN::UIntSize genericArity{0};
    DiagnosticCode code{DiagnosticCode::None};
    NGIN::UIntSize argIndex{static_cast<NGIN::UIntSize>(-1)};
  };

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
    NGIN::Containers::Vector<OverloadDiagnostic> diagnostics{};
    std::optional<NGIN::UInt32> closestMethodIndex{};

    constexpr Error() = default;
    Error(ErrorCode c, std::string_view m) : code(c), message(m) {}
    Error(ErrorCode c, std::string_view m, NGIN::Containers::Vector<OverloadDiagnostic> d)
        : code(c), message(m), diagnostics(std::move(d))
    {
    }
  };

  // Indices into the process-wide tables. Descriptors are never destroyed, so no generation is kept.
  struct TypeHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
    friend constexpr bool operator==(TypeHandle, TypeHandle) noexcept = default;
  };

  struct LoadUnitHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
    friend constexpr bool operator==(LoadUnitHandle, LoadUnitHandle) noexcept = default;
  };

  struct BindingHandle
  {
    NGIN::UInt32 index{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return index != static_cast<NGIN::UInt32>(-1); }
  };

  enum class MemberKind : unsigned char
  {
    Field = 0,
    Property = 1,
    Method = 2,
    Constructor = 3,
  };

  struct MemberHandle
  {
    MemberKind kind{MemberKind::Field};
    NGIN::UInt32 typeIndex{static_cast<NGIN::UInt32>(-1)};
    NGIN::UInt32 memberIndex{static_cast<NGIN::UInt32>(-1)};
    constexpr bool IsValid() const noexcept { return typeIndex != static_cast<NGIN::UInt32>(-1) && memberIndex != static_cast<NGIN::UInt32>(-1); }
  };

  enum class TypeKind : unsigned char
  {
    Class = 0,
    Struct = 1,
    Interface = 2,
    Enum = 3,
  };

  enum class BindingState : unsigned char
  {
    Unconstructed = 0,
    Constructing = 1,
    Constructed = 2,
    Initialized = 3,
    Failed = 4,
  };

  enum class BindingFlags : unsigned
  {
    None = 0,
    DeclaredOnly = 2,
    Instance = 4,
    Static = 8,
    Public = 16,
    NonPublic = 32,
  };

  constexpr BindingFlags operator|(BindingFlags a, BindingFlags b) noexcept
  {
    return static_cast<BindingFlags>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
  }

  constexpr bool HasFlag(BindingFlags flags, BindingFlags f) noexcept
  {
    return (static_cast<unsigned>(flags) & static_cast<unsigned>(f)) != 0;
  }

  enum class MemberFlags : unsigned
  {
    None = 0,
    Public = 1,
    Static = 2,
  };

  constexpr MemberFlags operator|(MemberFlags a, MemberFlags b) noexcept
  {
    return static_cast<MemberFlags>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
  }

  constexpr bool HasFlag(MemberFlags flags, MemberFlags f) noexcept
  {
    return (static_cast<unsigned>(flags) & static_cast<unsigned>(f)) != 0;
  }

  // Runtime values
  class Instance;
  struct ArrayInstance;
  using ObjectRef = std::shared_ptr<Instance>;
  using ArrayRef = std::shared_ptr<ArrayInstance>;

  // Forward decls of high-level wrappers
  class Type;
  class LoadUnit;
  class TypeBinding;
  class Member;
  class Method;
  class Field;
  class Property;
  class TypeReference;
  class MethodSignature;

  using ExpectedType = std::expected<Type, Error>;
  using ExpectedLoadUnit = std::expected<LoadUnit, Error>;
  using ExpectedBinding = std::expected<TypeBinding, Error>;
  using ExpectedMethod = std::expected<Method, Error>;
  using ExpectedField = std::expected<Field, Error>;
  using ExpectedProperty = std::expected<Property, Error>;
  using ExpectedValue = std::expected<Any, Error>;

} // namespace TypeLoom::Runtime
