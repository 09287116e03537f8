#include <TypeLoom/Runtime/Names.hpp>

namespace TypeLoom::Runtime
{

  namespace
  {
    std::string_view Trim(std::string_view s) noexcept
    {
      while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
      while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
        s.remove_suffix(1);
      return s;
    }

    // Position of the last '.' that is not inside an angle group.
    std::size_t LastSeparator(std::string_view name) noexcept
    {
      int depth = 0;
      std::size_t last = std::string_view::npos;
      for (std::size_t i = 0; i < name.size(); ++i)
      {
        const char ch = name[i];
        if (ch == '<')
          ++depth;
        else if (ch == '>' && depth > 0)
          --depth;
        else if (ch == '.' && depth == 0)
          last = i;
      }
      return last;
    }
  } // namespace

  std::string EscapeName(std::string_view name)
  {
    std::string out;
    out.reserve(name.size() + 8);
    for (const char ch : name)
    {
      switch (ch)
      {
      case '`':
        out += "$b";
        break;
      case '<':
        out += "$l";
        break;
      case '>':
        out += "$g";
        break;
      case '.':
      case '/':
      case '+':
        out += '_';
        break;
      default:
        out += ch;
        break;
      }
    }
    return out;
  }

  std::string_view GetLocalName(std::string_view name) noexcept
  {
    const auto pos = LastSeparator(name);
    if (pos == std::string_view::npos)
      return name;
    return name.substr(pos + 1);
  }

  std::string_view GetNamespaceName(std::string_view name) noexcept
  {
    const auto pos = LastSeparator(name);
    if (pos == std::string_view::npos)
      return {};
    return name.substr(0, pos);
  }

  std::string_view GetShortLoadUnitName(std::string_view name) noexcept
  {
    const auto comma = name.find(',');
    return Trim(comma == std::string_view::npos ? name : name.substr(0, comma));
  }

  ParsedTypeName ParseTypeName(std::string_view name)
  {
    ParsedTypeName result{};
    std::string typeName;
    std::string assemblyName;
    std::string argText;
    bool readingAssembly = false;
    int depth = 0;

    // Depth 1 is the argument list; bracketed arguments ([[A, Asm],[B]]) live at depth 2 and below.
    auto flushArgument = [&]()
    {
      if (!Trim(argText).empty())
        result.genericArguments.push_back(ParseTypeName(argText));
      argText.clear();
    };

    for (const char ch : name)
    {
      if (depth == 0)
      {
        if (ch == '[')
          depth = 1;
        else if (ch == ',' && !readingAssembly)
          readingAssembly = true;
        else if (readingAssembly)
          assemblyName += ch;
        else
          typeName += ch;
      }
      else if (depth == 1)
      {
        if (ch == '[')
        {
          flushArgument();
          depth = 2;
        }
        else if (ch == ']')
        {
          flushArgument();
          depth = 0;
        }
        else if (ch == ',')
        {
          flushArgument();
        }
        else
        {
          argText += ch;
        }
      }
      else if (ch == '[')
      {
        ++depth;
        argText += ch;
      }
      else if (ch == ']')
      {
        --depth;
        if (depth == 1)
          flushArgument();
        else
          argText += ch;
      }
      else
      {
        argText += ch;
      }
    }

    result.type = std::string{Trim(typeName)};
    const auto assembly = Trim(assemblyName);
    if (!assembly.empty())
      result.assembly = std::string{assembly};
    return result;
  }

} // namespace TypeLoom::Runtime
