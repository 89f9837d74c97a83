// ecr/ecr-db/src/Transaction.hpp
#ifndef ECR_DB_TRANSACTION_HPP
#define ECR_DB_TRANSACTION_HPP

namespace ecr_db
{

class Database;

/**
 * @brief Scoped write transaction
 *
 * Begins an immediate transaction on construction. The transaction is
 * committed only by an explicit commit(); leaving the scope any other way,
 * including by exception, rolls it back.
 */
class Transaction
{
public:
  /**
   * @throws DatabaseError if the transaction cannot be started
   */
  explicit Transaction(Database& database);

  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;
  Transaction(Transaction&&) = delete;
  Transaction& operator=(Transaction&&) = delete;

  /**
   * @throws DatabaseError if the commit fails (the transaction is then
   * rolled back by the destructor)
   */
  void commit();

  [[nodiscard]] bool isActive() const { return active_; }

private:
  Database& database_;
  bool active_{false};
};

}  // namespace ecr_db

#endif  // ECR_DB_TRANSACTION_HPP
