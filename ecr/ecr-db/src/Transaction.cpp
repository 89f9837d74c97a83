// ecr/ecr-db/src/Transaction.cpp
#include "ecr-db/src/Transaction.hpp"

#include "ecr-db/src/Database.hpp"

namespace ecr_db
{

Transaction::Transaction(Database& database)
  : database_{database}
{
  if (!database_.beginTransaction(true))
  {
    throw DatabaseError("Failed to begin transaction on " + database_.getUrl());
  }
  active_ = true;
}

Transaction::~Transaction()
{
  if (active_)
  {
    database_.getLogger()->warn("Transaction left without commit, rolling back");
    if (!database_.rollbackTransaction())
    {
      database_.getLogger()->error("Rollback failed on {}", database_.getUrl());
    }
  }
}

void Transaction::commit()
{
  if (!active_)
  {
    throw DatabaseError("Commit on an inactive transaction");
  }
  if (!database_.commitTransaction())
  {
    throw DatabaseError("Failed to commit transaction on " + database_.getUrl());
  }
  active_ = false;
}

}  // namespace ecr_db
