#ifndef CALCFLOW_STORAGE_METADATA_STORE_HPP
#define CALCFLOW_STORAGE_METADATA_STORE_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/calcjob.hpp"
#include "primitives/client.hpp"
#include "primitives/code.hpp"
#include "primitives/processing.hpp"

namespace calcflow::storage {

  /// attributes of a calcjob and of its processing record a query can use
  enum class CalcJobField {
    kPk,
    kLabel,
    kUuid,
    kCodePk,
    kCodeLabel,
    kClientPk,
    kClientLabel,
    kState,
    kStep,
    kJobId,
    kException,
  };

  enum class Comparison {
    kEq,
    kNe,
    kLt,
    kLe,
    kGt,
    kGe,
    kLike,
    kIsNull,
    kIsNotNull,
  };

  /// one already parsed condition: <field> <op> <value>
  struct CalcJobPredicate {
    CalcJobField field;
    Comparison op;
    std::string value;  ///< ignored by kIsNull and kIsNotNull
  };

  /**
   * @brief Conjunction of predicates, with an ordering and a page.
   * Rows with equal ordering keys are returned in primary key order.
   */
  struct CalcJobQuery {
    std::vector<CalcJobPredicate> where;
    CalcJobField order_by = CalcJobField::kPk;
    bool descending = false;
    std::optional<size_t> limit;
    size_t offset = 0;

    /// convenience: all calcjobs which are still playing
    static CalcJobQuery playing(std::optional<size_t> limit = std::nullopt);
  };

  /// a calcjob joined with its processing record
  struct CalcJobRow {
    primitives::CalcJob calcjob;
    primitives::Processing processing;
  };

  /**
   * @brief Durable relational record of clients, codes, calcjobs and their
   * processing state.
   * Clients, codes and calcjobs are insert only. The processing record of a
   * calcjob is only rewritten by the driver holding its claim.
   */
  class MetadataStore {
   public:
    using Lease = std::chrono::milliseconds;

    virtual ~MetadataStore() = default;

    /**
     * @brief Runs @param body in a transaction, committed if body succeeds
     * and rolled back otherwise. Transactions may be nested.
     */
    virtual outcome::result<void> transaction(
        const std::function<outcome::result<void>()> &body) = 0;

    /// @return primary key of the new row
    virtual outcome::result<int64_t> insertClient(
        const primitives::Client &client) = 0;

    /// @return primary key of the new row
    virtual outcome::result<int64_t> insertCode(
        const primitives::Code &code) = 0;

    /**
     * @brief Inserts a calcjob together with its processing record, in step
     * created
     * @return primary key of the new calcjob
     */
    virtual outcome::result<int64_t> insertCalcJob(
        const primitives::CalcJob &calcjob) = 0;

    virtual outcome::result<primitives::Client> getClient(int64_t pk) const = 0;
    virtual outcome::result<primitives::Client> getClientByLabel(
        const std::string &label) const = 0;
    virtual outcome::result<primitives::Code> getCode(int64_t pk) const = 0;
    virtual outcome::result<primitives::Code> getCodeByLabel(
        const std::string &label) const = 0;
    virtual outcome::result<primitives::CalcJob> getCalcJob(
        int64_t pk) const = 0;
    virtual outcome::result<primitives::Processing> getProcessing(
        int64_t calcjob_pk) const = 0;

    virtual outcome::result<std::vector<primitives::Client>> listClients()
        const = 0;
    virtual outcome::result<std::vector<primitives::Code>> listCodes()
        const = 0;

    virtual outcome::result<std::vector<CalcJobRow>> queryCalcJobs(
        const CalcJobQuery &query) const = 0;

    /// @return number of rows matching the predicates, ignoring the page
    virtual outcome::result<size_t> countCalcJobs(
        const CalcJobQuery &query) const = 0;

    /**
     * @brief Claims a playing calcjob for @param owner until the lease ends.
     * Succeeds if the calcjob is unclaimed, already claimed by owner, or its
     * previous lease expired.
     * @return DatabaseError::CONCURRENCY_VIOLATION if claimed by another
     * owner or not playing anymore
     */
    virtual outcome::result<void> claimCalcJob(int64_t calcjob_pk,
                                               const std::string &owner,
                                               Lease lease) = 0;

    /// extends the lease of a claim held by @param owner
    virtual outcome::result<void> renewClaim(int64_t calcjob_pk,
                                             const std::string &owner,
                                             Lease lease) = 0;

    /// drops the claim of @param owner, no-op if not held
    virtual outcome::result<void> releaseClaim(int64_t calcjob_pk,
                                               const std::string &owner) = 0;

    /**
     * @brief Writes the mutable tuple of a processing record in one
     * statement. Terminal records release their claim in the same write.
     * @return DatabaseError::CONCURRENCY_VIOLATION if @param owner does not
     * hold the claim, CONSTRAINT_VIOLATION for a forbidden transition
     */
    virtual outcome::result<void> updateProcessing(
        const primitives::Processing &processing,
        const std::string &owner) = 0;
  };

}  // namespace calcflow::storage

#endif  // CALCFLOW_STORAGE_METADATA_STORE_HPP
