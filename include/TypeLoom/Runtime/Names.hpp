// Names.hpp
// Name escaping, local names and assembly-qualified type name parsing
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <TypeLoom/Runtime/Export.hpp>

namespace TypeLoom::Runtime
{

  /// Mangle a declared name into the identifier form used for member keys and identity.
  /// "`" becomes "$b", "<" and ">" become "$l"/"$g", and ".", "/", "+" become "_".
  [[nodiscard]] TYPELOOM_RUNTIME_API std::string EscapeName(std::string_view name);

  /// Last dotted segment of a qualified name.
  [[nodiscard]] TYPELOOM_RUNTIME_API std::string_view GetLocalName(std::string_view name) noexcept;

  /// Everything before the last dotted segment; empty for an unqualified name.
  [[nodiscard]] TYPELOOM_RUNTIME_API std::string_view GetNamespaceName(std::string_view name) noexcept;

  /// Text before the first comma of a load unit name.
  [[nodiscard]] TYPELOOM_RUNTIME_API std::string_view GetShortLoadUnitName(std::string_view name) noexcept;

  struct ParsedTypeName
  {
    std::string type;
    std::optional<std::string> assembly;
    std::vector<ParsedTypeName> genericArguments;
  };

  /// Parse "Ns.Type`2[[Arg1],[Arg2]], Assembly".
  [[nodiscard]] TYPELOOM_RUNTIME_API ParsedTypeName ParseTypeName(std::string_view name);

} // namespace TypeLoom::Runtime
