#include "primitives/processing.hpp"

#include <array>
#include <utility>

namespace calcflow::primitives {

  namespace {
    constexpr std::array<std::pair<Step, const char *>, 9> kStepNames{{
        {Step::kCreated, "created"},
        {Step::kUploading, "uploading"},
        {Step::kSubmitting, "submitting"},
        {Step::kSubmitted, "submitted"},
        {Step::kPolling, "polling"},
        {Step::kDownloading, "downloading"},
        {Step::kParsing, "parsing"},
        {Step::kFinished, "finished"},
        {Step::kExcepted, "excepted"},
    }};

    constexpr std::array<std::pair<ProcessState, const char *>, 3> kStateNames{{
        {ProcessState::kPlaying, "playing"},
        {ProcessState::kFinished, "finished"},
        {ProcessState::kExcepted, "excepted"},
    }};

    constexpr std::array<std::pair<RemoteStatus, const char *>, 4> kRemoteNames{{
        {RemoteStatus::kRunning, "running"},
        {RemoteStatus::kCompleted, "completed"},
        {RemoteStatus::kFailed, "failed"},
        {RemoteStatus::kCancelled, "cancelled"},
    }};

    template <typename E, size_t N>
    const char *nameOf(const std::array<std::pair<E, const char *>, N> &names,
                       E value) {
      for (const auto &[e, name] : names) {
        if (e == value) {
          return name;
        }
      }
      return "unknown";
    }

    template <typename E, size_t N>
    std::optional<E> valueOf(
        const std::array<std::pair<E, const char *>, N> &names,
        const std::string &str) {
      for (const auto &[e, name] : names) {
        if (str == name) {
          return e;
        }
      }
      return std::nullopt;
    }
  }  // namespace

  const char *toString(Step step) {
    return nameOf(kStepNames, step);
  }

  const char *toString(ProcessState state) {
    return nameOf(kStateNames, state);
  }

  const char *toString(RemoteStatus status) {
    return nameOf(kRemoteNames, status);
  }

  std::optional<Step> stepFromString(const std::string &str) {
    return valueOf(kStepNames, str);
  }

  std::optional<ProcessState> stateFromString(const std::string &str) {
    return valueOf(kStateNames, str);
  }

  std::optional<RemoteStatus> remoteStatusFromString(const std::string &str) {
    return valueOf(kRemoteNames, str);
  }

  ProcessState stateForStep(Step step) {
    switch (step) {
      case Step::kFinished:
        return ProcessState::kFinished;
      case Step::kExcepted:
        return ProcessState::kExcepted;
      default:
        return ProcessState::kPlaying;
    }
  }

  std::ostream &operator<<(std::ostream &out, Step step) {
    return out << toString(step);
  }

  std::ostream &operator<<(std::ostream &out, ProcessState state) {
    return out << toString(state);
  }
}  // namespace calcflow::primitives
