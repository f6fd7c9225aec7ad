#pragma once
#include "packwerk/indexer.hpp"

#include <mutex>
#include <set>
#include <vector>

// Gate для тестов: множество заявленных id + журнал принятых дескрипторов.
class RecordingGate : public packwerk::IndexGate {
public:
  bool reserve(const packwerk::BlobId& id) override {
    std::lock_guard lk(mu_);
    return reserved_.insert(id).second;
  }

  void accept(packwerk::IndexPack pack, bool is_removal) override {
    std::lock_guard lk(mu_);
    accepted_.push_back({std::move(pack), is_removal});
  }

  struct Entry {
    packwerk::IndexPack pack;
    bool is_removal;
  };

  std::vector<Entry> accepted() const {
    std::lock_guard lk(mu_);
    return accepted_;
  }

  size_t reserved() const {
    std::lock_guard lk(mu_);
    return reserved_.size();
  }

private:
  mutable std::mutex mu_;
  std::set<packwerk::BlobId> reserved_;
  std::vector<Entry> accepted_;
};
