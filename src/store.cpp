#include "store.h"
#include "errors.h"
#include "util.h"

#include <algorithm>
#include <cstddef>
#include <utility>

CustomerStore::CustomerStore() : clock_(now_ms) {}

CustomerStore::CustomerStore(Clock clock) : clock_(std::move(clock)) {}

std::string CustomerStore::next_id(int64_t t) {
  return "CUST-" + std::to_string(t) + "-" + std::to_string(counter_++);
}

std::vector<Customer> CustomerStore::list() const {
  std::lock_guard<std::mutex> lk(mu_);
  return customers_;
}

std::optional<Customer> CustomerStore::get(const std::string& id) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = pos_by_id_.find(id);
  if (it == pos_by_id_.end()) return std::nullopt;
  return customers_[it->second];
}

Customer CustomerStore::create(const NewCustomer& in) {
  if (in.name.empty() || in.email.empty()) {
    throw ValidationError("Missing required fields: name and email");
  }

  std::lock_guard<std::mutex> lk(mu_);
  if (auto it = id_by_email_.find(in.email); it != id_by_email_.end()) {
    throw ConflictError("Customer with this email already exists", it->second);
  }

  int64_t t = clock_();
  Customer c;
  c.id = next_id(t);
  c.name = in.name;
  c.email = in.email;
  c.phone = in.phone;
  c.address = in.address;
  c.company = in.company;
  c.status = "active";
  c.created_at_ms = t;
  c.updated_at_ms = t;

  pos_by_id_[c.id] = customers_.size();
  id_by_email_[c.email] = c.id;
  customers_.push_back(c);
  return c;
}

std::optional<Customer> CustomerStore::update(const std::string& id, const CustomerPatch& patch) {
  std::lock_guard<std::mutex> lk(mu_);
  auto pit = pos_by_id_.find(id);
  if (pit == pos_by_id_.end()) return std::nullopt;
  Customer& cur = customers_[pit->second];

  if (patch.name && patch.name->empty()) {
    throw ValidationError("Field 'name' must not be empty");
  }
  if (patch.email && patch.email->empty()) {
    throw ValidationError("Field 'email' must not be empty");
  }

  bool email_changed = patch.email && *patch.email != cur.email;
  if (email_changed) {
    auto eit = id_by_email_.find(*patch.email);
    if (eit != id_by_email_.end() && eit->second != id) {
      throw ConflictError("Another customer with this email already exists", eit->second);
    }
  }

  Customer next = cur;
  if (patch.name) next.name = *patch.name;
  if (patch.email) next.email = *patch.email;
  if (patch.phone) next.phone = *patch.phone;
  if (patch.address) next.address = *patch.address;
  if (patch.company) next.company = *patch.company;
  if (patch.status) next.status = *patch.status;
  // A clock that steps backwards must not break createdAt <= updatedAt.
  next.updated_at_ms = std::max(clock_(), next.created_at_ms);

  if (email_changed) {
    id_by_email_.erase(cur.email);
    id_by_email_[next.email] = id;
  }
  cur = std::move(next);
  return cur;
}

std::optional<Customer> CustomerStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = pos_by_id_.find(id);
  if (it == pos_by_id_.end()) return std::nullopt;

  size_t pos = it->second;
  Customer removed = std::move(customers_[pos]);
  customers_.erase(customers_.begin() + static_cast<std::ptrdiff_t>(pos));
  pos_by_id_.erase(it);
  id_by_email_.erase(removed.email);
  for (size_t i = pos; i < customers_.size(); i++) pos_by_id_[customers_[i].id] = i;
  return removed;
}

std::vector<Customer> CustomerStore::by_status(const std::string& status) const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Customer> out;
  for (const auto& c : customers_) {
    if (c.status == status) out.push_back(c);
  }
  return out;
}

std::vector<Customer> CustomerStore::search(const std::string& query) const {
  std::string q = to_lower(query);
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<Customer> out;
  for (const auto& c : customers_) {
    if (contains_icase(c.name, q) || contains_icase(c.email, q) ||
        (c.company && contains_icase(*c.company, q))) {
      out.push_back(c);
    }
  }
  return out;
}

size_t CustomerStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return customers_.size();
}
