#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Type.hpp>

namespace TypeLoom::Runtime::detail
{

  namespace
  {
    void AddUnique(NGIN::Containers::Vector<TypeHandle> &list, TypeHandle h)
    {
      for (NGIN::UIntSize i = 0; i < list.Size(); ++i)
      {
        if (list[i] == h)
          return;
      }
      list.PushBack(h);
    }

    void Insert(TypeRuntimeDesc &d, NameId id)
    {
      if (!d.assignableSet.GetPtr(id))
        d.assignableSet.Insert(id, true);
    }

    bool IsRootObject(TypeHandle h)
    {
      const auto &d = Desc(h);
      return !d.baseType.IsValid() && d.kind == TypeKind::Class && d.fullName == "System.Object";
    }

    // Assignability of types that are still open: walk the chain instead of trusting a set.
    bool SlowIsAssignable(TypeHandle source, TypeHandle target)
    {
      const auto targetKey = Desc(target).typeIdKey;
      for (TypeHandle cur = source; IsTypeAlive(cur); cur = Desc(cur).baseType)
      {
        if (Desc(cur).typeIdKey == targetKey)
          return true;
        BuildTypeList(cur);
        const auto &interfaces = Desc(cur).interfaces;
        for (NGIN::UIntSize i = 0; i < interfaces.Size(); ++i)
        {
          if (Desc(interfaces[i]).typeIdKey == targetKey)
            return true;
        }
      }
      return false;
    }
  } // namespace

  void BuildTypeList(TypeHandle h)
  {
    auto &d = Desc(h);
    if (d.interfacesBuilt)
      return;
    d.interfacesBuilt = true;

    for (NGIN::UIntSize i = 0; i < d.interfaceReferences.Size(); ++i)
    {
      const auto ref = d.interfaceReferences[i];
      auto resolved = ResolveToType(ref, h);
      if (!resolved)
      {
        ReportWarning(ErrorCode::UndefinedInterface,
                      FormatMessage({"Type '", d.fullName, "' implements an undefined interface '", ref.ToString(), "': ",
                                     resolved.error().message}));
        continue;
      }
      if (Desc(*resolved).kind != TypeKind::Interface)
      {
        ReportWarning(ErrorCode::NotAnInterface,
                      FormatMessage({"Type '", d.fullName, "' lists '", Desc(*resolved).fullName, "' as an interface, but it is not one."}));
        continue;
      }
      AddUnique(d.interfaces, *resolved);
      // Interfaces extended by the interface.
      BuildTypeList(*resolved);
      const auto &inherited = Desc(*resolved).interfaces;
      for (NGIN::UIntSize k = 0; k < inherited.Size(); ++k)
        AddUnique(d.interfaces, inherited[k]);
    }
  }

  void EnsureAssignableSet(TypeHandle h)
  {
    auto &d = Desc(h);
    if (d.assignableBuilt)
      return;
    d.assignableBuilt = true;

    Insert(d, d.typeIdKey);
    for (TypeHandle cur = h; IsTypeAlive(cur); cur = Desc(cur).baseType)
    {
      Insert(d, Desc(cur).typeIdKey);
      BuildTypeList(cur);
      const auto &interfaces = Desc(cur).interfaces;
      for (NGIN::UIntSize i = 0; i < interfaces.Size(); ++i)
        Insert(d, Desc(interfaces[i]).typeIdKey);
    }
  }

  bool IsAssignableTo(TypeHandle source, TypeHandle target)
  {
    if (!IsTypeAlive(source) || !IsTypeAlive(target))
      return false;
    if (source == target)
      return true;
    // Every type, interfaces included, converts to the root.
    if (IsRootObject(target))
      return true;
    auto &sd = Desc(source);
    if (!sd.isClosed)
      return SlowIsAssignable(source, target);
    EnsureAssignableSet(source);
    return sd.assignableSet.GetPtr(Desc(target).typeIdKey) != nullptr;
  }

  bool CheckValue(const Any &value, TypeHandle expected)
  {
    if (!IsTypeAlive(expected))
      return false;
    const auto &ed = Desc(expected);
    if (IsNull(value))
      return ed.isReferenceType;
    if (ed.customCheck)
      return ed.customCheck(value, expected);
    const auto actual = ValueTypeOf(value);
    if (!IsTypeAlive(actual))
      return false;
    return IsAssignableTo(actual, expected);
  }

} // namespace TypeLoom::Runtime::detail

namespace TypeLoom::Runtime
{

  bool Type::IsAssignableTo(const Type &target) const
  {
    return detail::IsAssignableTo(m_h, target.Handle());
  }

  bool Type::IsInstance(const Any &value) const
  {
    return detail::CheckValue(value, m_h);
  }

  NGIN::Containers::Vector<Type> Type::GetInterfaces() const
  {
    NGIN::Containers::Vector<Type> out;
    if (!IsValid())
      return out;
    NGIN::Containers::Vector<TypeHandle> all;
    for (TypeHandle cur = m_h; detail::IsTypeAlive(cur); cur = detail::Desc(cur).baseType)
    {
      detail::BuildTypeList(cur);
      const auto &interfaces = detail::Desc(cur).interfaces;
      for (NGIN::UIntSize i = 0; i < interfaces.Size(); ++i)
        detail::AddUnique(all, interfaces[i]);
    }
    out.Reserve(all.Size());
    for (NGIN::UIntSize i = 0; i < all.Size(); ++i)
      out.PushBack(Type{all[i]});
    return out;
  }

  bool CheckType(const Any &value, const Type &expected)
  {
    return detail::CheckValue(value, expected.Handle());
  }

  bool IsAssignable(const Type &source, const Type &target)
  {
    return detail::IsAssignableTo(source.Handle(), target.Handle());
  }

} // namespace TypeLoom::Runtime
