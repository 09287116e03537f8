#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>

#include <string>

namespace TypeLoom::Runtime::detail
{

  namespace
  {
    // Declared (or installed) under `name` anywhere in the instance chain of `h`.
    bool HasInstanceMember(TypeHandle h, NameId name)
    {
      for (TypeHandle cur = h; IsTypeAlive(cur); cur = Desc(cur).baseType)
      {
        const auto &d = Desc(cur);
        if (FindOwnSlot(d.instanceTable, name))
          return true;
        const auto &owner = MembersOwner(cur);
        if (FindOwnSlot(owner.instanceTable, name))
          return true;
        for (NGIN::UIntSize i = 0; i < owner.members.Size(); ++i)
        {
          const auto &m = owner.members[i];
          if (!m.isStatic && m.escapedNameId == name && m.kind != MemberKind::Constructor)
            return true;
        }
      }
      return false;
    }

    // Forwards to the bare member as seen by the implementing type `h`, so a same-named member
    // declared further down the hierarchy cannot capture interface calls.
    MemberSlot MakeAlias(TypeHandle h, NameId target)
    {
      MethodBody forward = [h, target](const CallFrame &frame) -> std::expected<Any, Error>
      {
        return InvokeMember(h, frame.self, target, false, frame.arguments);
      };
      return MemberSlot{std::move(forward), h, false};
    }

    void AliasIfMissing(TypeHandle h, std::string_view bareName, std::string_view qualifiedName)
    {
      const auto bareId = InternNameId(EscapeName(bareName));
      const auto qualifiedId = InternNameId(EscapeName(qualifiedName));
      if (!HasInstanceMember(h, bareId) || HasInstanceMember(h, qualifiedId))
        return;
      SetSlot(Desc(h).instanceTable, qualifiedId, MakeAlias(h, bareId));
    }
  } // namespace

  void FixupInterfaces(TypeHandle h)
  {
    auto &d = Desc(h);
    if (d.kind == TypeKind::Interface)
      return;
    BuildTypeList(h);

    std::string missing;
    NGIN::UIntSize missingCount = 0;
    const auto interfaces = d.interfaces;
    for (NGIN::UIntSize i = 0; i < interfaces.Size(); ++i)
    {
      const auto iface = interfaces[i];
      const auto &id = Desc(iface);
      const auto local = GetLocalName(id.fullNameWithoutArguments);
      const auto &members = MembersOwner(iface).interfaceMembers;
      for (NGIN::UIntSize k = 0; k < members.Size(); ++k)
      {
        const auto &member = members[k];
        const auto qualified = std::string{local} + "." + std::string{member.name};
        const bool hasBare = HasInstanceMember(h, InternNameId(EscapeName(member.name)));
        const bool hasQualified = HasInstanceMember(h, InternNameId(EscapeName(qualified)));

        if (!hasBare && !hasQualified)
        {
          // A property may also be satisfied through its accessors alone.
          const auto getter = std::string{"get_"} + std::string{member.name};
          if (member.kind == InterfaceMemberKind::Property && HasInstanceMember(h, InternNameId(EscapeName(getter))))
          {
            AliasIfMissing(h, getter, std::string{local} + "." + getter);
            continue;
          }
          if (missingCount++ > 0)
            missing += ", ";
          missing += id.fullName;
          missing += ".";
          missing += member.name;
          continue;
        }

        if (member.kind == InterfaceMemberKind::Method)
        {
          AliasIfMissing(h, member.name, qualified);
        }
        else
        {
          const auto getter = std::string{"get_"} + std::string{member.name};
          const auto setter = std::string{"set_"} + std::string{member.name};
          AliasIfMissing(h, getter, std::string{local} + "." + getter);
          AliasIfMissing(h, setter, std::string{local} + "." + setter);
        }
      }
    }

    if (missingCount > 0)
      ReportWarning(ErrorCode::MissingInterfaceMember,
                    FormatMessage({"Type '", d.fullName, "' is missing implementation of interface member(s): ", missing}));
  }

} // namespace TypeLoom::Runtime::detail
