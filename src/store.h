#pragma once
#include "customer.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// In-memory customer records in insertion order.
//
// Every accessor returns copies; nothing outside the store can reach a
// stored record. One mutex guards the records, both indexes and the id
// counter, so each operation (including its uniqueness checks) is atomic.
//
// create/update throw ValidationError or ConflictError; an unknown id is
// reported as std::nullopt.
class CustomerStore {
 public:
  using Clock = std::function<int64_t()>;

  CustomerStore();
  explicit CustomerStore(Clock clock);

  std::vector<Customer> list() const;
  std::optional<Customer> get(const std::string& id) const;
  Customer create(const NewCustomer& in);
  std::optional<Customer> update(const std::string& id, const CustomerPatch& patch);
  std::optional<Customer> remove(const std::string& id);
  std::vector<Customer> by_status(const std::string& status) const;
  std::vector<Customer> search(const std::string& query) const;
  size_t size() const;

 private:
  Clock clock_;
  mutable std::mutex mu_;
  std::vector<Customer> customers_;
  std::unordered_map<std::string, size_t> pos_by_id_;
  std::unordered_map<std::string, std::string> id_by_email_;
  uint64_t counter_ = 1;

  std::string next_id(int64_t t);
};
