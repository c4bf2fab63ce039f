#include "landledger/core/mempool.hpp"
#include "landledger/storage/mempool_store.hpp"

namespace landledger::core {

  TransactionPool::TransactionPool(landledger::storage::MempoolStore* store) : store_(store) {}

  const Transaction& TransactionPool::add(Transaction tx) {
    if (tx.txid.empty()) tx.txid = new_txid();
    if (contains(tx.txid)) throw InvalidTransactionError("duplicate txid: " + tx.txid);

    auto it = entries_.insert(entries_.end(), std::move(tx));
    index_.emplace(it->txid, it);
    persist();
    return *it;
  }

  std::vector<Transaction> TransactionPool::snapshot() const {
    return std::vector<Transaction>(entries_.begin(), entries_.end());
  }

  size_t TransactionPool::commit(const std::unordered_set<std::string>& included_txids) {
    size_t removed = 0;
    for (const auto& txid : included_txids) {
      auto found = index_.find(txid);
      if (found == index_.end()) continue;
      entries_.erase(found->second);
      index_.erase(found);
      ++removed;
    }
    if (removed > 0) persist();
    return removed;
  }

  size_t TransactionPool::merge(const std::vector<Transaction>& remote_transactions) {
    size_t added = 0;
    for (const auto& tx : remote_transactions) {
      if (tx.txid.empty() || contains(tx.txid)) continue;
      auto it = entries_.insert(entries_.end(), tx);
      index_.emplace(it->txid, it);
      ++added;
    }
    if (added > 0) persist();
    return added;
  }

  void TransactionPool::restore_from_store() {
    if (!store_) return;
    entries_.clear();
    index_.clear();
    for (auto& tx : store_->load()) {
      if (tx.txid.empty() || contains(tx.txid)) continue;
      auto it = entries_.insert(entries_.end(), std::move(tx));
      index_.emplace(it->txid, it);
    }
  }

  const Transaction* TransactionPool::find(const std::string& txid) const {
    auto found = index_.find(txid);
    return found == index_.end() ? nullptr : &*found->second;
  }

  void TransactionPool::persist() {
    if (store_) store_->save(snapshot());
  }
}
