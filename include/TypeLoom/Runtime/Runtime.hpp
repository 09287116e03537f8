// Runtime.hpp
// Umbrella header for TypeLoom.Runtime
#pragma once

#include <TypeLoom/Runtime/Export.hpp>
#include <TypeLoom/Runtime/Types.hpp>
#include <TypeLoom/Runtime/Diagnostics.hpp>
#include <TypeLoom/Runtime/Names.hpp>
#include <TypeLoom/Runtime/TypeReference.hpp>
#include <TypeLoom/Runtime/Object.hpp>
#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Type.hpp>
#include <TypeLoom/Runtime/TypeBuilder.hpp>

namespace TypeLoom::Runtime
{
  [[nodiscard]] TYPELOOM_RUNTIME_API constexpr std::string_view LibraryName() noexcept { return "TypeLoom.Runtime"; }
} // namespace TypeLoom::Runtime
