#ifndef CALCFLOW_PRIMITIVES_PROCESSING_HPP
#define CALCFLOW_PRIMITIVES_PROCESSING_HPP

#include <optional>
#include <ostream>
#include <string>

#include "primitives/code.hpp"

namespace calcflow::primitives {

  /**
   * @brief Steps of a calcjob, in the only order they may be taken.
   * Any non terminal step may jump to kExcepted.
   */
  enum class Step : int {
    kCreated = 0,
    kUploading,
    kSubmitting,
    kSubmitted,
    kPolling,
    kDownloading,
    kParsing,
    kFinished,
    kExcepted,
  };

  /// coarse lifecycle flag, a pure function of the step
  enum class ProcessState : int {
    kPlaying = 0,
    kFinished,
    kExcepted,
  };

  /// status of a job as reported by the remote scheduler
  enum class RemoteStatus : int {
    kRunning = 0,
    kCompleted,
    kFailed,
    kCancelled,
  };

  const char *toString(Step step);
  const char *toString(ProcessState state);
  const char *toString(RemoteStatus status);

  std::optional<Step> stepFromString(const std::string &str);
  std::optional<ProcessState> stateFromString(const std::string &str);
  std::optional<RemoteStatus> remoteStatusFromString(const std::string &str);

  /// @return state which corresponds to @param step
  ProcessState stateForStep(Step step);

  inline bool isTerminal(Step step) {
    return step == Step::kFinished || step == Step::kExcepted;
  }

  inline bool isTerminal(RemoteStatus status) {
    return status != RemoteStatus::kRunning;
  }

  /**
   * @brief The mutable execution record of a calcjob, one to one with it
   */
  struct Processing {
    int64_t pk = 0;                           ///< primary key
    int64_t calcjob_pk = 0;                   ///< calcjob tracked
    Step step = Step::kCreated;               ///< current step
    std::optional<std::string> job_id;        ///< remote job id, once submitted
    std::optional<std::string> exception;     ///< captured error, if excepted
    PathMap retrieved_paths;                  ///< downloaded outputs
    std::optional<RemoteStatus> remote_state; ///< terminal remote job status
    std::optional<Step> failed_step;          ///< step which excepted

    ProcessState state() const {
      return stateForStep(step);
    }

    inline bool operator==(const Processing &rhs) const {
      return pk == rhs.pk && calcjob_pk == rhs.calcjob_pk && step == rhs.step
             && job_id == rhs.job_id && exception == rhs.exception
             && retrieved_paths == rhs.retrieved_paths
             && remote_state == rhs.remote_state
             && failed_step == rhs.failed_step;
    }

    inline bool operator!=(const Processing &rhs) const {
      return !operator==(rhs);
    }
  };

  std::ostream &operator<<(std::ostream &out, Step step);
  std::ostream &operator<<(std::ostream &out, ProcessState state);
}  // namespace calcflow::primitives

#endif  // CALCFLOW_PRIMITIVES_PROCESSING_HPP
