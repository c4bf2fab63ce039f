#pragma once
#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "landledger/core/transaction.hpp"

namespace landledger { namespace storage { class MempoolStore; } }

namespace landledger::core {

  /**
   * Pending transactions keyed by txid, kept in arrival order so block
   * assembly is deterministic. Entries leave the pool only through commit(),
   * i.e. after the block holding them was appended.
   *
   * When a store is attached every mutation is written through; a failed
   * write throws after the in-memory change has been applied.
   * Not synchronized; the owning node serializes access.
   */
  class TransactionPool {
    public:
      explicit TransactionPool(landledger::storage::MempoolStore* store = nullptr);
      TransactionPool(const TransactionPool&) = delete;
      TransactionPool& operator=(const TransactionPool&) = delete;

      // Assigns a txid when empty. Throws InvalidTransactionError on a duplicate txid.
      const Transaction& add(Transaction tx);

      std::vector<Transaction> snapshot() const;

      // Removes exactly the listed txids; returns how many were present.
      size_t commit(const std::unordered_set<std::string>& included_txids);

      // Union by txid; an existing entry always wins. Returns the number added.
      size_t merge(const std::vector<Transaction>& remote_transactions);

      // Replace contents with what the attached store holds, skipping duplicates.
      void restore_from_store();

      const Transaction* find(const std::string& txid) const;
      bool contains(const std::string& txid) const { return index_.count(txid) != 0; }
      size_t size() const { return entries_.size(); }
      bool empty() const { return entries_.empty(); }

    private:
      void persist();

      landledger::storage::MempoolStore* store_;
      std::list<Transaction> entries_;
      std::unordered_map<std::string, std::list<Transaction>::iterator> index_;
  };
}
