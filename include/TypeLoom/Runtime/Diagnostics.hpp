// Diagnostics.hpp
// Pluggable diagnostic sink, runtime options and the deferred "run later" queue
#pragma once

#include <NGIN/Primitives.hpp>

#include <functional>
#include <string_view>

#include <TypeLoom/Runtime/Export.hpp>
#include <TypeLoom/Runtime/Types.hpp>

namespace TypeLoom::Runtime
{

  enum class Severity : unsigned char
  {
    Trace = 0,
    Warning = 1,
    Error = 2,
  };

  struct DiagnosticEvent
  {
    Severity severity{Severity::Warning};
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string_view message{};
  };

  using DiagnosticSink = void (*)(const DiagnosticEvent &, void *userData);

  /// Replace the process-wide sink. Passing nullptr restores the default stderr sink.
  TYPELOOM_RUNTIME_API void SetDiagnosticSink(DiagnosticSink sink, void *userData = nullptr) noexcept;
  TYPELOOM_RUNTIME_API void ResetDiagnosticSink() noexcept;

  TYPELOOM_RUNTIME_API void ReportWarning(ErrorCode code, std::string_view message);
  TYPELOOM_RUNTIME_API void ReportError(const Error &error);
  TYPELOOM_RUNTIME_API void ReportTrace(std::string_view message);

  struct RuntimeOptions
  {
    // Compile dispatch tables on first invocation instead of during type initialization.
    bool lazyMethodGroups{false};
    // Emit a trace event for every member removed by hiding.
    bool traceMemberHiding{false};
    // Warn when an external placeholder forwards to an inherited implementation.
    bool warnOnPlaceholderFallback{true};
    // Static constructor slots run by type initialization: _cctor, _cctor2, ...
    NGIN::UInt32 staticConstructorSlots{5};
  };

  [[nodiscard]] TYPELOOM_RUNTIME_API const RuntimeOptions &GetRuntimeOptions() noexcept;
  TYPELOOM_RUNTIME_API void SetRuntimeOptions(const RuntimeOptions &options) noexcept;

  /// Queue non-essential work for an idle tick. Nothing semantic may depend on it running.
  TYPELOOM_RUNTIME_API void RunLater(std::function<void()> task);
  /// Run everything queued so far; returns the number of tasks executed.
  TYPELOOM_RUNTIME_API NGIN::UIntSize RunPendingLaterTasks();

} // namespace TypeLoom::Runtime
