#pragma once
#include "store.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

struct ApiResponse {
  int status = 200;
  nlohmann::json body;

  // For the event log.
  std::string event;
  std::string customer_id;
};

// Maps each route to a status code and JSON body. Holds no state of its own;
// the store is owned by whoever constructs the api.
class CustomerApi {
 public:
  explicit CustomerApi(CustomerStore& store);

  ApiResponse info() const;
  ApiResponse list_all() const;
  ApiResponse get_one(const std::string& id) const;
  ApiResponse create(const std::string& body);
  ApiResponse update(const std::string& id, const std::string& body);
  ApiResponse remove(const std::string& id);
  ApiResponse list_by_status(const std::string& status) const;
  ApiResponse search(const std::string& query) const;

  ApiResponse route_not_found() const;
  ApiResponse internal_error(const std::string& what) const;

  static const std::vector<std::string>& endpoints();

 private:
  CustomerStore& store_;
};
