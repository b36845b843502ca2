#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Absent value is serialized as null.
using NullableField = std::optional<std::string>;

struct Customer {
  std::string id;
  std::string name;
  std::string email;
  NullableField phone;
  NullableField address;
  NullableField company;
  std::string status = "active";
  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
};

bool operator==(const Customer& a, const Customer& b);
bool operator!=(const Customer& a, const Customer& b);

// Body of a create request.
struct NewCustomer {
  std::string name;
  std::string email;
  NullableField phone;
  NullableField address;
  NullableField company;
};

// Body of an update request. Only engaged members are applied; for the
// nullable fields an engaged nullopt clears the stored value.
struct CustomerPatch {
  std::optional<std::string> name;
  std::optional<std::string> email;
  std::optional<NullableField> phone;
  std::optional<NullableField> address;
  std::optional<NullableField> company;
  std::optional<std::string> status;
};

void to_json(nlohmann::json& j, const Customer& c);

// Both throw ValidationError when a field has the wrong JSON type.
NewCustomer new_customer_from_json(const nlohmann::json& body);
CustomerPatch patch_from_json(const nlohmann::json& body);
