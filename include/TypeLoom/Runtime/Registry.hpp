// Registry.hpp
// Process-wide registry: load units, name bindings, type descriptors and their member tables
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

#include <TypeLoom/Runtime/Diagnostics.hpp>
#include <TypeLoom/Runtime/Object.hpp>
#include <TypeLoom/Runtime/TypeReference.hpp>
#include <TypeLoom/Runtime/Types.hpp>

namespace TypeLoom::Runtime
{

  /// Value test installed on types whose membership is not decided by the assignable set.
  using CheckTypeHook = std::function<bool(const Any &value, TypeHandle expected)>;
  using TypeCreator = std::function<std::expected<TypeHandle, Error>(BindingHandle)>;
  using TypeInitializerThunk = std::function<std::expected<void, Error>(TypeHandle)>;
  using QueuedInitializer = std::function<std::expected<void, Error>(TypeHandle)>;

  class TypeDeclaration;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    inline constexpr NameId InvalidNameId = static_cast<NameId>(-1);
    inline constexpr NGIN::UInt32 InvalidIndex = static_cast<NGIN::UInt32>(-1);
    // Public table entry for a name declared public by more than one load unit.
    inline constexpr NGIN::UInt32 AmbiguousBinding = static_cast<NGIN::UInt32>(-2);

    // Convenience wrappers using the global registry interner
    NameId InternNameId(std::string_view s) noexcept;
    bool FindNameId(std::string_view s, NameId &out) noexcept;
    std::string_view NameFromId(NameId id) noexcept;
    // Intern a string into the registry's string storage and return a stable view
    std::string_view InternName(std::string_view s) noexcept;

    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    struct MemberSlot
    {
      MethodBody body{};
      TypeHandle owner{};
      bool isPlaceholder{false};
      // Set on a closed type to hide an entry of its open type after a rename.
      bool isRemoved{false};
      // Set when the slot is a lone overload bound without a dispatcher.
      std::optional<NGIN::UIntSize> argumentCount{};
    };

    struct MemberTable
    {
      NGIN::Containers::Vector<MemberSlot> slots;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> index;
    };

    struct MemberRecord
    {
      MemberKind kind{MemberKind::Method};
      std::string_view name;
      std::string_view escapedName;
      NameId escapedNameId{InvalidNameId};
      bool isStatic{false};
      bool isPublic{true};
      bool isSpecialName{false};
      bool isPlaceholder{false};
      // Raw methods never take part in overload dispatch.
      bool isRaw{false};
      // Interface members carry no body.
      bool isAbstract{false};
      MethodSignature signature{};
      TypeReference valueType{};
      DefaultValueThunk defaultValue{};
    };

    struct FieldLayoutDesc
    {
      std::string_view name;
      NameId nameId{InvalidNameId};
      TypeReference fieldType{};
      TypeHandle declaringType{};
      DefaultValueThunk defaultValue{};
    };

    struct PropertySlotDesc
    {
      std::string_view name;
      NameId nameId{InvalidNameId};
      bool isStatic{false};
      TypeHandle declaringType{};
      NameId getterId{InvalidNameId};
      NameId setterId{InvalidNameId};
    };

    struct GenericBinding
    {
      NameId parameterId{InvalidNameId};
      TypeReference value{};
    };

    enum class InterfaceMemberKind : unsigned char
    {
      Method = 0,
      Property = 1,
    };

    struct InterfaceMemberDesc
    {
      std::string_view name;
      NameId nameId{InvalidNameId};
      InterfaceMemberKind kind{InterfaceMemberKind::Method};
    };

    struct EnumEntryDesc
    {
      std::string_view name;
      NameId nameId{InvalidNameId};
      std::int64_t value{0};
    };

    struct TypeRuntimeDesc
    {
      std::string_view fullName;
      std::string_view fullNameWithoutArguments;
      std::string_view shortName;
      std::string_view typeId;
      NameId typeIdKey{InvalidNameId};
      NameId fullNameId{InvalidNameId};
      TypeHandle self{};
      TypeKind kind{TypeKind::Class};
      LoadUnitHandle loadUnit{};
      BindingHandle binding{};
      bool isReferenceType{true};
      bool isClosed{true};
      bool isNativeType{false};
      bool isFlagsEnum{false};
      bool initialized{false};

      TypeReference baseReference{};
      TypeHandle baseType{};
      NGIN::UInt32 inheritanceDepth{0};
      // Entries of interfaceReferences that come from the base type.
      NGIN::UInt32 inheritedInterfaceCount{0};
      bool interfacesBuilt{false};
      // Base type's list followed by the type's own declarations.
      NGIN::Containers::Vector<TypeReference> interfaceReferences;
      NGIN::Containers::Vector<TypeHandle> interfaces;

      NGIN::Containers::Vector<std::string_view> genericParameterNames;
      NGIN::Containers::Vector<GenericBinding> genericBindings;
      NGIN::Containers::Vector<TypeReference> genericArguments;
      TypeHandle openType{};
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> closedCache;
      NGIN::Containers::Vector<TypeHandle> closedTypes;

      // Declarations live on the open type; closed instantiations read them through openType.
      NGIN::Containers::Vector<MemberRecord> members;
      NGIN::Containers::FlatHashMap<NameId, NameId> renamedMethods;
      MemberTable instanceTable;
      MemberTable staticTable;
      bool methodGroupsBuilt{false};

      bool fieldsLaidOut{false};
      NGIN::Containers::Vector<FieldLayoutDesc> instanceFields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> instanceFieldIndex;
      NGIN::Containers::Vector<FieldLayoutDesc> staticFields;
      NGIN::Containers::Vector<Any> staticFieldValues;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> staticFieldIndex;

      NGIN::Containers::Vector<PropertySlotDesc> properties;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> instancePropertyIndex;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> staticPropertyIndex;

      bool assignableBuilt{false};
      NGIN::Containers::FlatHashMap<NameId, bool> assignableSet;
      CheckTypeHook customCheck{};

      NGIN::Containers::Vector<InterfaceMemberDesc> interfaceMembers;

      NGIN::Containers::Vector<EnumEntryDesc> enumEntries;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> enumByValue;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> enumByName;

      NGIN::Containers::Vector<QueuedInitializer> initializers;
      ObjectRef typeObject{};

      bool reflectionCacheBuilt{false};
      NGIN::Containers::Vector<MemberHandle> reflectionCache;

      NGIN::UInt64 nativeTypeId{0};
      DefaultValueThunk nativeDefault{};
      NGIN::UInt32 staticConstructorCount{0};
    };

    struct BindingDesc
    {
      std::string_view name;
      NameId nameId{InvalidNameId};
      std::string_view escapedName;
      NameId escapedNameId{InvalidNameId};
      LoadUnitHandle loadUnit{};
      bool isPublic{true};
      bool sealed{false};
      bool published{false};
      BindingState state{BindingState::Unconstructed};
      TypeCreator creator{};
      TypeInitializerThunk initializer{};
      TypeHandle value{};
      std::string_view failure{};
    };

    struct LoadUnitDesc
    {
      std::string_view name;
      std::string_view shortName;
      NameId nameId{InvalidNameId};
      NGIN::UInt32 assemblyId{0};
      // Private (unescaped) qualified names
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> bindings;
      NGIN::Containers::Vector<NGIN::UInt32> bindingList;
      NGIN::Containers::FlatHashMap<NameId, bool> namespaces;
    };

    struct ExternalsEntry
    {
      std::string_view typeName;
      NGIN::Containers::Vector<std::function<void(TypeHandle)>> implementations;
    };

    struct Registry
    {
      NGIN::Containers::Vector<std::unique_ptr<TypeRuntimeDesc>> types;
      NGIN::Containers::Vector<std::unique_ptr<BindingDesc>> bindings;
      NGIN::Containers::Vector<std::unique_ptr<LoadUnitDesc>> loadUnits;

      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> loadUnitsByName;
      // Short name -> full-name load unit, or AmbiguousBinding once two full names share it
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> loadUnitsByShortName;
      NGIN::Containers::FlatHashMap<NameId, bool> globalNamespaces;

      // Escaped name -> binding index (or AmbiguousBinding)
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> publicBindings;
      // Escaped name -> load unit that owns the single public definition
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> publicTypeUnits;

      NGIN::Containers::FlatHashMap<NameId, NameId> assignedTypeIds;
      NGIN::Containers::FlatHashMap<NameId, NameId> genericParameterIds;
      NGIN::UInt64 nextTypeId{0};
      NGIN::UInt32 nextAssemblyId{0};

      // Any::GetTypeId() of a native value -> binding of the runtime type it represents
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> nativeTypes;

      NGIN::Containers::Vector<ExternalsEntry> externals;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> externalsByTypeName;

      LoadUnitHandle coreUnit{};
      bool coreDeclared{false};
      bool rootInitialized{false};
      ObjectRef stubTypeObject{};

      NGIN::Containers::Vector<std::function<void()>> runLater;

      StringInterner names;
    };

    Registry &GetRegistry() noexcept;

    inline TypeRuntimeDesc &Desc(TypeHandle h) { return *GetRegistry().types[h.index]; }
    inline bool IsTypeAlive(TypeHandle h)
    {
      return h.IsValid() && h.index < GetRegistry().types.Size();
    }
    // Closed instantiations share the member declarations of their open type.
    inline TypeRuntimeDesc &MembersOwner(TypeHandle h)
    {
      auto &d = Desc(h);
      return d.openType.IsValid() ? Desc(d.openType) : d;
    }

    std::string_view FormatMessage(std::initializer_list<std::string_view> parts);

    // Core bootstrap (Bootstrap.cpp)
    void DeclareCoreTypes();
    // Declares the core load unit on first use; every public entry point calls it.
    void EnsureCoreTypes();
    inline constexpr std::string_view CoreLoadUnitName = "TypeLoom.Core";
    std::expected<TypeHandle, Error> GetCoreType(std::string_view name);
    ObjectRef GetRuntimeTypeObject(TypeHandle h);

    // Load units and names (Registry.cpp)
    LoadUnitHandle GetOrCreateLoadUnit(std::string_view name);
    std::optional<LoadUnitHandle> FindLoadUnit(std::string_view name);
    std::string_view AssignTypeId(LoadUnitHandle unit, std::string_view typeName);
    std::string_view AssignGenericParameterId(LoadUnitHandle unit, std::string_view ownerName, std::string_view name);
    std::expected<BindingHandle, Error> RegisterBinding(LoadUnitHandle unit, std::string_view name, bool isPublic,
                                                        TypeCreator creator, TypeInitializerThunk initializer);
    std::expected<BindingHandle, Error> ResolveBindingName(LoadUnitHandle unit, std::string_view name);
    std::expected<BindingHandle, Error> FindPublicBinding(std::string_view name);
    std::expected<TypeHandle, Error> GetBoundType(BindingHandle h, bool initialize = true);
    void MarkBindingInitialized(BindingHandle h);
    TypeHandle PushType(std::unique_ptr<TypeRuntimeDesc> desc);
    template <class T>
    void BindNativeType(BindingHandle binding)
    {
      GetRegistry().nativeTypes.Insert(TypeIdOf<T>(), binding.index);
    }

    // Member tables
    void SetSlot(MemberTable &table, NameId key, MemberSlot slot);
    const MemberSlot *FindOwnSlot(const MemberTable &table, NameId key);
    // Instance lookups walk the base chain; static lookups stop at the open type.
    const MemberSlot *FindSlot(TypeHandle type, NameId key, bool isStatic);
    NameId ApplyRename(TypeHandle type, NameId key);

    // Type references (TypeReference.cpp)
    std::expected<std::string_view, Error> ReferenceId(const TypeReference &ref);
    NameId GenericParameterIdOf(const TypeReference &ref);
    const TypeReference *FindGenericBinding(TypeHandle context, NameId parameterId);
    // Substitute generic parameters bound in `context`; named references stay unconstructed.
    std::expected<TypeReference, Error> ResolveGenericReference(const TypeReference &ref, TypeHandle context);
    // Substitute and construct: named references become resolved handles, closing generic arguments.
    std::expected<TypeReference, Error> ResolveReference(const TypeReference &ref, TypeHandle context);
    std::expected<TypeHandle, Error> ResolveToType(const TypeReference &ref, TypeHandle context);
    std::expected<MethodSignature, Error> ResolveSignature(const MethodSignature &sig, TypeHandle context, bool &changed);
    bool IsOpenReference(const TypeReference &ref);
    // Replace positional method parameters "!!i" with the call-site generic arguments.
    TypeReference SubstitutePositional(const TypeReference &ref, std::span<const TypeHandle> genericArguments);

    // Type construction (TypeConstruction.cpp, Externals.cpp)
    std::expected<TypeHandle, Error> MakeType(LoadUnitHandle unit, BindingHandle binding, const TypeDeclaration &declaration);
    void ApplyExternals(TypeHandle h);
    MethodBody MakeExternalMemberStub(TypeHandle declaringType, NameId key, bool isStatic, std::string_view display);

    // Generic closure (GenericClosure.cpp)
    std::expected<TypeHandle, Error> CloseNoInitialize(TypeHandle open, const NGIN::Containers::Vector<TypeReference> &args);
    std::expected<TypeHandle, Error> Close(TypeHandle open, const NGIN::Containers::Vector<TypeReference> &args);
    // Copy raw static methods of the open type onto a closed instantiation.
    void RebindRawMethods(TypeHandle h);

    // Initialization (Initialization.cpp, MethodGroups.cpp, Interfaces.cpp, Assignability.cpp)
    void InitializeType(TypeHandle h);
    std::expected<void, Error> BuildMethodGroups(TypeHandle h);
    void FixupInterfaces(TypeHandle h);
    void BuildTypeList(TypeHandle h);
    void EnsureAssignableSet(TypeHandle h);
    bool IsAssignableTo(TypeHandle source, TypeHandle target);
    bool CheckValue(const Any &value, TypeHandle expected);
    void InstantiateProperties(TypeHandle h);
    void LayoutFields(TypeHandle h);
    std::expected<Any, Error> DefaultValueFor(const TypeReference &fieldType, TypeHandle context);

    // Reflection (Reflection.cpp)
    const NGIN::Containers::Vector<MemberHandle> &GetReflectionCache(TypeHandle h);
    NGIN::Containers::Vector<MemberHandle> GetMembersInternal(TypeHandle h, BindingFlags flags, std::optional<MemberKind> kind,
                                                              bool allowConstructors, std::string_view name = {});
    inline const MemberRecord &RecordOf(MemberHandle m)
    {
      return MembersOwner(TypeHandle{m.typeIndex}).members[m.memberIndex];
    }

    // Objects (Objects.cpp)
    TypeHandle ValueTypeOf(const Any &value);
    std::expected<Any, Error> InvokeSlot(const MemberSlot &slot, const Any &self, std::span<const Any> args, TypeHandle boundType);
    // Call the member stored under `key` as seen from `type`, compiling method groups on demand.
    std::expected<Any, Error> InvokeMember(TypeHandle type, const Any &self, NameId key, bool isStatic, std::span<const Any> args);
    // Instance with every field set to its default; runs no constructor.
    std::expected<ObjectRef, Error> AllocateInstance(TypeHandle h);
  } // namespace detail

} // namespace TypeLoom::Runtime
