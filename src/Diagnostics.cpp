#include <TypeLoom/Runtime/Diagnostics.hpp>

#include <NGIN/Containers/Vector.hpp>

#include <iostream>
#include <utility>

namespace TypeLoom::Runtime
{

  namespace
  {
    void DefaultSink(const DiagnosticEvent &event, void *)
    {
      switch (event.severity)
      {
      case Severity::Trace:
        std::cerr << "[TypeLoom] trace: " << event.message << '\n';
        break;
      case Severity::Warning:
        std::cerr << "[TypeLoom] warning: " << event.message << '\n';
        break;
      case Severity::Error:
        std::cerr << "[TypeLoom] error: " << event.message << '\n';
        break;
      }
    }

    struct DiagnosticsState
    {
      DiagnosticSink sink{&DefaultSink};
      void *userData{nullptr};
      RuntimeOptions options{};
      NGIN::Containers::Vector<std::function<void()>> pending;
    };

    DiagnosticsState &State()
    {
      static DiagnosticsState state{};
      return state;
    }

    void Emit(Severity severity, ErrorCode code, std::string_view message)
    {
      auto &s = State();
      s.sink(DiagnosticEvent{severity, code, message}, s.userData);
    }
  } // namespace

  void SetDiagnosticSink(DiagnosticSink sink, void *userData) noexcept
  {
    auto &s = State();
    s.sink = sink ? sink : &DefaultSink;
    s.userData = sink ? userData : nullptr;
  }

  void ResetDiagnosticSink() noexcept
  {
    SetDiagnosticSink(nullptr);
  }

  void ReportWarning(ErrorCode code, std::string_view message)
  {
    Emit(Severity::Warning, code, message);
  }

  void ReportError(const Error &error)
  {
    Emit(Severity::Error, error.code, error.message);
  }

  void ReportTrace(std::string_view message)
  {
    if (!State().options.traceMemberHiding)
      return;
    Emit(Severity::Trace, ErrorCode::InvalidArgument, message);
  }

  const RuntimeOptions &GetRuntimeOptions() noexcept { return State().options; }

  void SetRuntimeOptions(const RuntimeOptions &options) noexcept { State().options = options; }

  void RunLater(std::function<void()> task)
  {
    State().pending.PushBack(std::move(task));
  }

  NGIN::UIntSize RunPendingLaterTasks()
  {
    auto &s = State();
    NGIN::UIntSize ran = 0;
    // Tasks may queue further tasks; those run in the same drain.
    while (s.pending.Size() > 0)
    {
      auto batch = std::move(s.pending);
      s.pending = NGIN::Containers::Vector<std::function<void()>>{};
      for (NGIN::UIntSize i = 0; i < batch.Size(); ++i)
      {
        if (batch[i])
          batch[i]();
        ++ran;
      }
    }
    return ran;
  }

} // namespace TypeLoom::Runtime
