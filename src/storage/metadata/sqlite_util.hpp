#ifndef CALCFLOW_STORAGE_SQLITE_UTIL_HPP
#define CALCFLOW_STORAGE_SQLITE_UTIL_HPP

#include <sqlite3.h>

#include <optional>
#include <string>
#include <string_view>

#include "base/logger.hpp"
#include "outcome/outcome.hpp"
#include "storage/database_error.hpp"

namespace calcflow::storage {

  inline DatabaseError error_from_sqlite(int rc) {
    switch (rc & 0xff) {
      case SQLITE_OK:
      case SQLITE_ROW:
      case SQLITE_DONE:
        return DatabaseError::OK;
      case SQLITE_CONSTRAINT:
        return DatabaseError::CONSTRAINT_VIOLATION;
      case SQLITE_BUSY:
      case SQLITE_LOCKED:
        return DatabaseError::BUSY;
      case SQLITE_CORRUPT:
      case SQLITE_NOTADB:
        return DatabaseError::CORRUPTION;
      case SQLITE_IOERR:
      case SQLITE_CANTOPEN:
      case SQLITE_FULL:
      case SQLITE_READONLY:
        return DatabaseError::IO_ERROR;
      case SQLITE_NOTFOUND:
        return DatabaseError::NOT_FOUND;
      case SQLITE_ERROR:
      case SQLITE_RANGE:
      case SQLITE_MISMATCH:
        return DatabaseError::INVALID_ARGUMENT;
      default:
        return DatabaseError::UNKNOWN;
    }
  }

  template <typename T>
  outcome::result<T> error_as_result(int rc) {
    return error_from_sqlite(rc);
  }

  template <typename T>
  outcome::result<T> error_as_result(int rc,
                                     sqlite3 *db,
                                     const base::Logger &logger) {
    logger->error("sqlite: {} ({})", sqlite3_errmsg(db), rc);
    return error_as_result<T>(rc);
  }

  /**
   * @brief Prepared statement, finalized on destruction
   */
  class Statement {
   public:
    Statement(sqlite3 *db, std::string_view sql) {
      rc_ = sqlite3_prepare_v2(
          db, sql.data(), static_cast<int>(sql.size()), &stmt_, nullptr);
    }

    ~Statement() {
      sqlite3_finalize(stmt_);
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    /// @return sqlite code of the preparation
    int prepared() const {
      return rc_;
    }

    Statement &bind(int index, int64_t value) {
      remember(sqlite3_bind_int64(stmt_, index, value));
      return *this;
    }

    Statement &bind(int index, const std::string &value) {
      remember(sqlite3_bind_text(stmt_,
                                 index,
                                 value.data(),
                                 static_cast<int>(value.size()),
                                 SQLITE_TRANSIENT));
      return *this;
    }

    Statement &bind(int index, const std::optional<std::string> &value) {
      if (value) {
        return bind(index, *value);
      }
      remember(sqlite3_bind_null(stmt_, index));
      return *this;
    }

    /// @return SQLITE_ROW, SQLITE_DONE or an error code
    int step() {
      if (rc_ != SQLITE_OK) {
        return rc_;
      }
      return sqlite3_step(stmt_);
    }

    int64_t columnInt(int index) const {
      return sqlite3_column_int64(stmt_, index);
    }

    std::string columnText(int index) const {
      const auto *text = sqlite3_column_text(stmt_, index);
      if (text == nullptr) {
        return {};
      }
      // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
      return std::string(reinterpret_cast<const char *>(text),
                         static_cast<size_t>(sqlite3_column_bytes(stmt_, index)));
    }

    std::optional<std::string> columnOptText(int index) const {
      if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
        return std::nullopt;
      }
      return columnText(index);
    }

   private:
    void remember(int rc) {
      if (rc_ == SQLITE_OK && rc != SQLITE_OK) {
        rc_ = rc;
      }
    }

    sqlite3_stmt *stmt_ = nullptr;
    int rc_ = SQLITE_OK;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_SQLITE_UTIL_HPP
