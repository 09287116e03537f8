// Object.hpp
// Runtime values: object instances, arrays, enum values and the call frame seen by method bodies
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string_view>

#include <TypeLoom/Runtime/Export.hpp>
#include <TypeLoom/Runtime/Types.hpp>

namespace TypeLoom::Runtime
{

  /// Instance of a declared class or struct. Field slots follow the layout computed when the
  /// type was initialized, base fields first.
  class TYPELOOM_RUNTIME_API Instance
  {
  public:
    Instance(TypeHandle type, NGIN::Containers::Vector<Any> fields)
        : m_type(type), m_fields(std::move(fields))
    {
    }

    [[nodiscard]] TypeHandle GetTypeHandle() const noexcept { return m_type; }
    [[nodiscard]] NGIN::UIntSize FieldCount() const noexcept { return m_fields.Size(); }
    [[nodiscard]] Any &FieldAt(NGIN::UIntSize i) { return m_fields[i]; }
    [[nodiscard]] const Any &FieldAt(NGIN::UIntSize i) const { return m_fields[i]; }

    [[nodiscard]] std::expected<Any, Error> GetField(std::string_view name) const;
    std::expected<void, Error> SetField(std::string_view name, Any value);

    // Set only on System.RuntimeType instances: the type this object describes.
    [[nodiscard]] TypeHandle ReflectedType() const noexcept { return m_reflected; }
    void SetReflectedType(TypeHandle h) noexcept { m_reflected = h; }

  private:
    TypeHandle m_type{};
    NGIN::Containers::Vector<Any> m_fields;
    TypeHandle m_reflected{};
  };

  struct ArrayInstance
  {
    TypeHandle arrayType{};
    TypeHandle elementType{};
    NGIN::Containers::Vector<Any> items{};
  };

  struct EnumValue
  {
    TypeHandle type{};
    std::int64_t value{0};
  };

  /// Everything a method body receives. `self` is void for static calls; for generic methods the
  /// generic arguments (as TypeHandle values) lead the argument list.
  struct CallFrame
  {
    Any self{Any::MakeVoid()};
    std::span<const Any> arguments{};
    TypeHandle boundType{};

    [[nodiscard]] TYPELOOM_RUNTIME_API ObjectRef Self() const;
  };

  using MethodBody = std::function<std::expected<Any, Error>(const CallFrame &)>;
  using DefaultValueThunk = std::function<Any()>;

  /// The null reference.
  [[nodiscard]] TYPELOOM_RUNTIME_API Any Null();
  [[nodiscard]] TYPELOOM_RUNTIME_API bool IsNull(const Any &value);
  [[nodiscard]] TYPELOOM_RUNTIME_API bool IsObject(const Any &value);

  /// Shallow copy of an instance; used to give struct values copy semantics.
  [[nodiscard]] TYPELOOM_RUNTIME_API Any MemberwiseClone(const Any &value);

} // namespace TypeLoom::Runtime
