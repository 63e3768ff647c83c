#ifndef CALCFLOW_STORAGE_RUNNER_SLOT_HPP
#define CALCFLOW_STORAGE_RUNNER_SLOT_HPP

#include <memory>
#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/interprocess/sync/file_lock.hpp>

#include "outcome/outcome.hpp"

namespace calcflow::storage {

  /**
   * @brief A runner identity of a project, held through a lock file under
   * <project>/runners. Slots are numbered per host and the lowest free one is
   * taken, so a runner restarted after a crash gets its former identity back
   * and may claim its former calcjobs right away. The slot is freed when the
   * object is destroyed or the process ends.
   */
  class RunnerSlot {
   public:
    static constexpr const char *kRunnersFolder = "runners";
    static constexpr size_t kMaxSlots = 256;

    /**
     * @brief Locks the lowest free slot of the project at @param project_path
     * @return DatabaseError::BUSY when every slot is held
     */
    static outcome::result<std::unique_ptr<RunnerSlot>> acquire(
        const boost::filesystem::path &project_path,
        size_t max_slots = kMaxSlots);

    RunnerSlot(std::string owner,
               std::string lock_path,
               boost::interprocess::file_lock lock);
    ~RunnerSlot();

    RunnerSlot(const RunnerSlot &) = delete;
    RunnerSlot &operator=(const RunnerSlot &) = delete;

    /// claim owner name of the slot, e.g. runner-host-0
    const std::string &owner() const {
      return owner_;
    }

   private:
    std::string owner_;
    std::string lock_path_;
    boost::interprocess::file_lock lock_;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_RUNNER_SLOT_HPP
