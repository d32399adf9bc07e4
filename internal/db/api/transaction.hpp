#pragma once

namespace netcrawl::db {

/*
  Unit of work against the inventory.

  Every backend guarantees:

  - a claim check and the claim insert made in one transaction are atomic
    with respect to other workers' transactions
  - writes become visible to others only at Commit()
  - a transaction destroyed without Commit() is rolled back, so an
    exception thrown mid-visit never leaves a half-written device

  sqlite takes the write lock at BEGIN IMMEDIATE; the memory backend works on
  a private snapshot and rejects Commit() if another commit landed first.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace netcrawl::db
