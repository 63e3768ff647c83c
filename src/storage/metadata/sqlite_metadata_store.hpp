#ifndef CALCFLOW_STORAGE_SQLITE_METADATA_STORE_HPP
#define CALCFLOW_STORAGE_SQLITE_METADATA_STORE_HPP

#include <memory>
#include <mutex>

#include <sqlite3.h>

#include "base/logger.hpp"
#include "storage/metadata/metadata_store.hpp"

namespace calcflow::storage {

  /**
   * @brief Metadata store backed by a SQLite database file.
   * Invariants which must hold whatever the writer are enforced by the
   * schema itself (triggers and checks), the class only adds the claim
   * protocol on top of it.
   */
  class SqliteMetadataStore : public MetadataStore {
   public:
    using Connection = std::unique_ptr<sqlite3, decltype(&sqlite3_close_v2)>;

    /**
     * @brief Factory method, opens the database and creates the schema if
     * missing
     * @param path database file, or ":memory:"
     */
    static outcome::result<std::shared_ptr<SqliteMetadataStore>> create(
        const std::string &path);

    /// takes over an open connection, use create() to get a usable store
    explicit SqliteMetadataStore(Connection db);
    ~SqliteMetadataStore() override;

    outcome::result<void> transaction(
        const std::function<outcome::result<void>()> &body) override;

    outcome::result<int64_t> insertClient(
        const primitives::Client &client) override;
    outcome::result<int64_t> insertCode(const primitives::Code &code) override;
    outcome::result<int64_t> insertCalcJob(
        const primitives::CalcJob &calcjob) override;

    outcome::result<primitives::Client> getClient(int64_t pk) const override;
    outcome::result<primitives::Client> getClientByLabel(
        const std::string &label) const override;
    outcome::result<primitives::Code> getCode(int64_t pk) const override;
    outcome::result<primitives::Code> getCodeByLabel(
        const std::string &label) const override;
    outcome::result<primitives::CalcJob> getCalcJob(int64_t pk) const override;
    outcome::result<primitives::Processing> getProcessing(
        int64_t calcjob_pk) const override;

    outcome::result<std::vector<primitives::Client>> listClients()
        const override;
    outcome::result<std::vector<primitives::Code>> listCodes() const override;

    outcome::result<std::vector<CalcJobRow>> queryCalcJobs(
        const CalcJobQuery &query) const override;
    outcome::result<size_t> countCalcJobs(
        const CalcJobQuery &query) const override;

    outcome::result<void> claimCalcJob(int64_t calcjob_pk,
                                       const std::string &owner,
                                       Lease lease) override;
    outcome::result<void> renewClaim(int64_t calcjob_pk,
                                     const std::string &owner,
                                     Lease lease) override;
    outcome::result<void> releaseClaim(int64_t calcjob_pk,
                                       const std::string &owner) override;

    outcome::result<void> updateProcessing(
        const primitives::Processing &processing,
        const std::string &owner) override;

    /// @return owner of the claim on a calcjob, if any and not expired
    outcome::result<std::optional<std::string>> claimOwner(
        int64_t calcjob_pk) const;

   private:
    outcome::result<void> execute(const std::string &sql) const;
    outcome::result<void> initSchema();

    /// @return DatabaseError::NOT_FOUND if the calcjob has no processing row
    outcome::result<void> ensureProcessingExists(int64_t calcjob_pk) const;

    Connection db_;
    mutable std::recursive_mutex mutex_;
    int transaction_depth_ = 0;
    base::Logger logger_;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_SQLITE_METADATA_STORE_HPP
