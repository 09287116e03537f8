#include <TypeLoom/Runtime/Registry.hpp>
#include <TypeLoom/Runtime/Names.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace TypeLoom::Runtime::detail
{

  namespace
  {
    struct Candidate
    {
      TypeHandle level{};
      NGIN::UInt32 recordIndex{0};
      NGIN::UInt32 depth{0};
      NGIN::UInt32 order{0};
      std::string_view hash{};
      MethodSignature signature{};
      MemberSlot slot{};
    };

    struct DispatchCandidate
    {
      TypeHandle level{};
      MethodSignature signature{};
      MemberSlot slot{};
      NGIN::UIntSize genericArity{0};
      NGIN::UIntSize totalArity{0};
      std::string_view display{};
      // Parameter types of non-generic candidates, resolved on first use.
      bool parametersResolved{false};
      NGIN::Containers::Vector<TypeHandle> parameterTypes{};
    };

    struct MethodGroup
    {
      std::string_view name{};
      NGIN::Containers::Vector<DispatchCandidate> candidates{};
    };

    enum class MatchTier : unsigned char
    {
      Exact = 0,
      Assignable = 1,
    };

    void ResolveParameters(DispatchCandidate &c)
    {
      if (c.parametersResolved)
        return;
      c.parametersResolved = true;
      c.parameterTypes.Reserve(c.signature.ArgumentCount());
      for (NGIN::UIntSize i = 0; i < c.signature.ArgumentCount(); ++i)
      {
        auto t = ResolveToType(c.signature.ArgumentAt(i), c.level);
        c.parameterTypes.PushBack(t ? *t : TypeHandle{});
      }
    }

    bool ArgumentMatches(const Any &arg, TypeHandle parameter, MatchTier tier)
    {
      if (!IsTypeAlive(parameter))
        return false;
      if (IsNull(arg))
        return Desc(parameter).isReferenceType;
      if (tier == MatchTier::Exact)
        return ValueTypeOf(arg) == parameter;
      return CheckValue(arg, parameter);
    }

    // Index of the first argument that does not match, or the argument count on success.
    NGIN::UIntSize MatchFixed(DispatchCandidate &c, std::span<const Any> args, MatchTier tier)
    {
      ResolveParameters(c);
      for (NGIN::UIntSize i = 0; i < args.size(); ++i)
      {
        if (!ArgumentMatches(args[i], c.parameterTypes[i], tier))
          return i;
      }
      return args.size();
    }

    NGIN::UIntSize MatchGeneric(const DispatchCandidate &c, std::span<const Any> args, DiagnosticCode &code)
    {
      std::vector<TypeHandle> genericArguments;
      genericArguments.reserve(c.genericArity);
      for (NGIN::UIntSize i = 0; i < c.genericArity; ++i)
      {
        if (args[i].GetTypeId() != TypeIdOf<TypeHandle>())
        {
          code = DiagnosticCode::GenericArityMismatch;
          return i;
        }
        genericArguments.push_back(args[i].Cast<TypeHandle>());
      }
      const std::span<const TypeHandle> bound{genericArguments.data(), genericArguments.size()};
      for (NGIN::UIntSize i = 0; i < c.signature.ArgumentCount(); ++i)
      {
        auto parameter = ResolveToType(SubstitutePositional(c.signature.ArgumentAt(i), bound), c.level);
        if (!parameter || !ArgumentMatches(args[c.genericArity + i], *parameter, MatchTier::Assignable))
        {
          code = DiagnosticCode::NonConvertible;
          return c.genericArity + i;
        }
      }
      return args.size();
    }

    std::expected<Any, Error> Call(const DispatchCandidate &c, const CallFrame &frame)
    {
      MemberSlot slot = c.slot;
      return InvokeSlot(slot, frame.self, frame.arguments, frame.boundType);
    }

    std::string RenderCandidates(const MethodGroup &group, const NGIN::Containers::Vector<OverloadDiagnostic> &diagnostics)
    {
      std::string s = std::to_string(group.candidates.Size());
      s += " candidate(s) for method invocation:";
      for (NGIN::UIntSize i = 0; i < diagnostics.Size(); ++i)
      {
        s += "\n";
        s += diagnostics[i].signature;
      }
      return s;
    }

    std::expected<Any, Error> Dispatch(MethodGroup &group, const CallFrame &frame)
    {
      const auto args = frame.arguments;
      const auto argc = args.size();

      NGIN::Containers::Vector<NGIN::UInt32> bucket;
      for (NGIN::UIntSize i = 0; i < group.candidates.Size(); ++i)
      {
        if (group.candidates[i].totalArity == argc)
          bucket.PushBack(static_cast<NGIN::UInt32>(i));
      }

      NGIN::Containers::Vector<OverloadDiagnostic> diags;
      diags.Reserve(group.candidates.Size());
      if (bucket.Size() == 0)
      {
        std::optional<NGIN::UInt32> closest{};
        NGIN::UIntSize closestDistance = static_cast<NGIN::UIntSize>(-1);
        for (NGIN::UIntSize i = 0; i < group.candidates.Size(); ++i)
        {
          const auto &c = group.candidates[i];
          OverloadDiagnostic diag{};
          diag.candidateIndex = static_cast<NGIN::UInt32>(i);
          diag.signature = c.display;
          diag.arity = c.signature.ArgumentCount();
          diag.genericArity = c.genericArity;
          diag.code = DiagnosticCode::ArityMismatch;
          diags.PushBack(diag);
          const auto distance = c.totalArity > argc ? c.totalArity - argc : argc - c.totalArity;
          if (distance < closestDistance)
          {
            closestDistance = distance;
            closest = static_cast<NGIN::UInt32>(i);
          }
        }
        Error err{ErrorCode::NoApplicableOverload,
                  FormatMessage({"No overload of ", group.name, " can accept ", std::to_string(argc), " argument(s)."}), std::move(diags)};
        err.closestMethodIndex = closest;
        return std::unexpected(std::move(err));
      }

      if (bucket.Size() == 1)
      {
        auto &c = group.candidates[bucket[0]];
        if (c.genericArity > 0)
        {
          DiagnosticCode code{DiagnosticCode::None};
          if (MatchGeneric(c, args, code) < c.genericArity)
            return std::unexpected(Error{ErrorCode::GenericArity,
                                         FormatMessage({"Method ", group.name, " expects ", std::to_string(c.genericArity),
                                                        " generic argument(s)."})});
        }
        return Call(c, frame);
      }

      // Exact runtime types are tried before assignable ones, ahead of declaration order, so F(Derived) beats an earlier F(Base).
      for (const auto tier : {MatchTier::Exact, MatchTier::Assignable})
      {
        for (NGIN::UIntSize k = 0; k < bucket.Size(); ++k)
        {
          auto &c = group.candidates[bucket[k]];
          if (c.genericArity == 0 && MatchFixed(c, args, tier) == argc)
            return Call(c, frame);
        }
      }
      for (NGIN::UIntSize k = 0; k < bucket.Size(); ++k)
      {
        auto &c = group.candidates[bucket[k]];
        DiagnosticCode code{DiagnosticCode::None};
        if (c.genericArity > 0 && MatchGeneric(c, args, code) == argc)
          return Call(c, frame);
      }

      std::optional<NGIN::UInt32> closest{};
      NGIN::UIntSize bestArg = 0;
      for (NGIN::UIntSize i = 0; i < group.candidates.Size(); ++i)
      {
        auto &c = group.candidates[i];
        OverloadDiagnostic diag{};
        diag.candidateIndex = static_cast<NGIN::UInt32>(i);
        diag.signature = c.display;
        diag.arity = c.signature.ArgumentCount();
        diag.genericArity = c.genericArity;
        if (c.totalArity != argc)
        {
          diag.code = DiagnosticCode::ArityMismatch;
        }
        else
        {
          DiagnosticCode code{DiagnosticCode::NonConvertible};
          diag.argIndex = c.genericArity > 0 ? MatchGeneric(c, args, code) : MatchFixed(c, args, MatchTier::Assignable);
          diag.code = code;
          if (!closest || diag.argIndex > bestArg)
          {
            bestArg = diag.argIndex;
            closest = static_cast<NGIN::UInt32>(i);
          }
        }
        diags.PushBack(diag);
      }
      const auto message = FormatMessage({RenderCandidates(group, diags)});
      Error err{ErrorCode::NoApplicableOverload, message, std::move(diags)};
      err.closestMethodIndex = closest;
      return std::unexpected(std::move(err));
    }

    NGIN::UInt64 PartitionKey(NameId name, bool isStatic)
    {
      return (static_cast<NGIN::UInt64>(name) << 1) | (isStatic ? 1u : 0u);
    }

    bool HasRawMember(const TypeRuntimeDesc &owner, NameId name, bool isStatic)
    {
      for (NGIN::UIntSize i = 0; i < owner.members.Size(); ++i)
      {
        const auto &m = owner.members[i];
        if (m.isRaw && m.escapedNameId == name && m.isStatic == isStatic)
          return true;
      }
      return false;
    }

    // Surviving overloads in declaration order, derived levels first.
    std::vector<Candidate> ApplyHiding(std::vector<Candidate> candidates)
    {
      std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b)
                       {
        if (a.hash != b.hash)
          return a.hash < b.hash;
        if (a.slot.isPlaceholder != b.slot.isPlaceholder)
          return !a.slot.isPlaceholder;
        return a.depth > b.depth; });

      std::vector<Candidate> kept;
      kept.reserve(candidates.size());
      for (std::size_t i = 0; i < candidates.size(); ++i)
      {
        if (!kept.empty() && kept.back().hash == candidates[i].hash)
        {
          const auto &hidden = candidates[i];
          const auto &record = MembersOwner(hidden.level).members[hidden.recordIndex];
          ReportTrace(FormatMessage({"Member '", Desc(hidden.level).fullName, ".", record.name, "' is hidden by '",
                                     Desc(kept.back().level).fullName, ".", record.name, "'"}));
          continue;
        }
        kept.push_back(candidates[i]);
      }
      std::stable_sort(kept.begin(), kept.end(), [](const Candidate &a, const Candidate &b)
                       { return a.order < b.order; });
      return kept;
    }
  } // namespace

  std::expected<void, Error> BuildMethodGroups(TypeHandle h)
  {
    if (!IsTypeAlive(h))
      return std::unexpected(Error{ErrorCode::InvalidArgument, "stale handle"});
    auto &d = Desc(h);
    if (d.methodGroupsBuilt)
      return {};
    d.methodGroupsBuilt = true;

    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> partitionIndex;
    std::vector<std::vector<Candidate>> partitions;
    NGIN::Containers::Vector<NameId> partitionNames;
    NGIN::Containers::Vector<bool> partitionStatic;
    std::expected<void, Error> status{};

    NGIN::UInt32 order = 0;
    NGIN::UInt32 levelIndex = 0;
    for (TypeHandle level = h; IsTypeAlive(level); level = Desc(level).baseType, ++levelIndex)
    {
      const auto &owner = MembersOwner(level);
      for (NGIN::UIntSize i = 0; i < owner.members.Size(); ++i)
      {
        const auto &m = owner.members[i];
        if ((m.kind != MemberKind::Method && m.kind != MemberKind::Constructor) || m.isRaw || m.isAbstract)
          continue;
        if (m.isStatic && m.kind == MemberKind::Constructor)
          continue;
        // Static methods and constructors belong to the declaring type alone.
        if (levelIndex > 0 && (m.isStatic || m.kind == MemberKind::Constructor))
          continue;

        auto storedKey = m.signature.GetKey(m.escapedName);
        if (!storedKey)
          continue;
        const auto *slot = FindOwnSlot(m.isStatic ? owner.staticTable : owner.instanceTable, InternNameId(*storedKey));
        if (!slot)
          continue;

        bool changed = false;
        auto signature = ResolveSignature(m.signature, level, changed);
        if (!signature)
        {
          ReportError(signature.error());
          if (status)
            status = std::unexpected(signature.error());
          continue;
        }
        auto hash = signature->Hash();
        if (!hash)
        {
          ReportError(hash.error());
          if (status)
            status = std::unexpected(hash.error());
          continue;
        }

        Candidate c{};
        c.level = level;
        c.recordIndex = static_cast<NGIN::UInt32>(i);
        c.depth = Desc(level).inheritanceDepth;
        c.order = order++;
        c.hash = *hash;
        c.signature = std::move(*signature);
        c.slot = *slot;

        const auto key = PartitionKey(m.escapedNameId, m.isStatic);
        if (auto *p = partitionIndex.GetPtr(key))
        {
          partitions[*p].push_back(std::move(c));
        }
        else
        {
          partitionIndex.Insert(key, static_cast<NGIN::UInt32>(partitions.size()));
          partitions.push_back({});
          partitions.back().push_back(std::move(c));
          partitionNames.PushBack(m.escapedNameId);
          partitionStatic.PushBack(m.isStatic);
        }
      }
    }

    for (std::size_t p = 0; p < partitions.size(); ++p)
    {
      const auto name = partitionNames[p];
      const bool isStatic = partitionStatic[p];
      if (HasRawMember(MembersOwner(h), name, isStatic))
        continue;

      auto kept = ApplyHiding(std::move(partitions[p]));
      auto &table = isStatic ? d.staticTable : d.instanceTable;
      if (kept.size() == 1 && kept[0].signature.GenericParameterCount() == 0)
      {
        MemberSlot slot = kept[0].slot;
        slot.argumentCount = kept[0].signature.ArgumentCount();
        SetSlot(table, name, std::move(slot));
        continue;
      }

      auto group = std::make_shared<MethodGroup>();
      const auto &firstRecord = MembersOwner(kept[0].level).members[kept[0].recordIndex];
      group->name = FormatMessage({d.fullName, ".", firstRecord.name});
      group->candidates.Reserve(kept.size());
      for (auto &c : kept)
      {
        const auto &record = MembersOwner(c.level).members[c.recordIndex];
        DispatchCandidate dc{};
        dc.level = c.level;
        dc.genericArity = c.signature.GenericParameterCount();
        dc.totalArity = c.signature.ArgumentCount() + dc.genericArity;
        dc.display = InternName(c.signature.ToString(FormatMessage({Desc(c.level).fullName, ".", record.name})));
        dc.signature = std::move(c.signature);
        dc.slot = std::move(c.slot);
        group->candidates.PushBack(std::move(dc));
      }
      MethodBody dispatcher = [group](const CallFrame &frame) -> std::expected<Any, Error>
      {
        return Dispatch(*group, frame);
      };
      SetSlot(table, name, MemberSlot{std::move(dispatcher), h, false});
    }
    return status;
  }

} // namespace TypeLoom::Runtime::detail
