#include "storage/runner_slot.hpp"

#include <fstream>
#include <mutex>
#include <set>

#include <boost/asio/ip/host_name.hpp>
#include <boost/filesystem.hpp>
#include <boost/interprocess/exceptions.hpp>

#include "base/logger.hpp"
#include "storage/database_error.hpp"

namespace fs = boost::filesystem;

namespace calcflow::storage {

  namespace {
    // fcntl locks do not exclude each other within one process
    std::mutex held_mutex;
    std::set<std::string> held;

    std::string hostName() {
      boost::system::error_code ec;
      auto host = boost::asio::ip::host_name(ec);
      return ec || host.empty() ? std::string("localhost") : host;
    }
  }  // namespace

  outcome::result<std::unique_ptr<RunnerSlot>> RunnerSlot::acquire(
      const fs::path &project_path, size_t max_slots) {
    auto logger = base::createLogger("RunnerSlot");
    const auto folder = project_path / kRunnersFolder;
    boost::system::error_code ec;
    fs::create_directories(folder, ec);
    if (ec) {
      logger->error("Cannot create {}: {}", folder.string(), ec.message());
      return DatabaseError::IO_ERROR;
    }

    const auto host = hostName();
    for (size_t slot = 0; slot < max_slots; ++slot) {
      const auto name = host + "-" + std::to_string(slot);
      const auto lock_path = (folder / (name + ".lock")).string();

      std::lock_guard<std::mutex> guard(held_mutex);
      if (held.count(lock_path) > 0) {
        continue;
      }
      {
        std::ofstream touch(lock_path, std::ios::app);
        if (!touch) {
          logger->error("Cannot create lock file {}", lock_path);
          return DatabaseError::IO_ERROR;
        }
      }
      try {
        boost::interprocess::file_lock lock(lock_path.c_str());
        if (!lock.try_lock()) {
          continue;
        }
        held.insert(lock_path);
        logger->debug("Runner slot {} acquired", name);
        return std::make_unique<RunnerSlot>(
            "runner-" + name, lock_path, std::move(lock));
      } catch (const boost::interprocess::interprocess_exception &e) {
        logger->error("Cannot lock {}: {}", lock_path, e.what());
        return DatabaseError::IO_ERROR;
      }
    }
    logger->error("All {} runner slots of {} are in use",
                  max_slots,
                  project_path.string());
    return DatabaseError::BUSY;
  }

  RunnerSlot::RunnerSlot(std::string owner,
                         std::string lock_path,
                         boost::interprocess::file_lock lock)
      : owner_(std::move(owner)),
        lock_path_(std::move(lock_path)),
        lock_(std::move(lock)) {}

  RunnerSlot::~RunnerSlot() {
    try {
      lock_.unlock();
    } catch (const boost::interprocess::interprocess_exception &e) {
      base::createLogger("RunnerSlot")
          ->warn("Cannot unlock {}: {}", lock_path_, e.what());
    }
    std::lock_guard<std::mutex> guard(held_mutex);
    held.erase(lock_path_);
  }

}  // namespace calcflow::storage
