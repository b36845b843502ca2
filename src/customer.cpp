#include "customer.h"
#include "errors.h"
#include "util.h"

using json = nlohmann::json;

bool operator==(const Customer& a, const Customer& b) {
  return a.id == b.id && a.name == b.name && a.email == b.email &&
         a.phone == b.phone && a.address == b.address && a.company == b.company &&
         a.status == b.status && a.created_at_ms == b.created_at_ms &&
         a.updated_at_ms == b.updated_at_ms;
}

bool operator!=(const Customer& a, const Customer& b) { return !(a == b); }

static json nullable(const NullableField& v) {
  if (!v) return nullptr;
  return *v;
}

void to_json(json& j, const Customer& c) {
  j = json{{"id", c.id},
           {"name", c.name},
           {"email", c.email},
           {"phone", nullable(c.phone)},
           {"address", nullable(c.address)},
           {"company", nullable(c.company)},
           {"status", c.status},
           {"createdAt", iso_time(c.created_at_ms)},
           {"updatedAt", iso_time(c.updated_at_ms)}};
}

// Missing and null both read as "", which the store rejects for required fields.
static std::string read_string(const json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) return "";
  if (!it->is_string()) throw ValidationError(std::string("Field '") + key + "' must be a string");
  return it->get<std::string>();
}

// Empty string collapses to null, same as an omitted value.
static NullableField read_nullable(const json& v, const char* key) {
  if (v.is_null()) return std::nullopt;
  if (!v.is_string()) throw ValidationError(std::string("Field '") + key + "' must be a string");
  auto s = v.get<std::string>();
  if (s.empty()) return std::nullopt;
  return s;
}

static NullableField read_optional(const json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end()) return std::nullopt;
  return read_nullable(*it, key);
}

NewCustomer new_customer_from_json(const json& body) {
  NewCustomer in;
  in.name = read_string(body, "name");
  in.email = read_string(body, "email");
  in.phone = read_optional(body, "phone");
  in.address = read_optional(body, "address");
  in.company = read_optional(body, "company");
  return in;
}

// Present-but-null reads as "", which the store rejects for name and email.
static std::optional<std::string> read_present(const json& body, const char* key) {
  auto it = body.find(key);
  if (it == body.end()) return std::nullopt;
  if (it->is_null()) return std::string();
  if (!it->is_string()) throw ValidationError(std::string("Field '") + key + "' must be a string");
  return it->get<std::string>();
}

CustomerPatch patch_from_json(const json& body) {
  CustomerPatch p;
  // Only the mutable fields are read; id, createdAt, updatedAt and anything
  // else in the body are ignored.
  p.name = read_present(body, "name");
  p.email = read_present(body, "email");

  if (auto it = body.find("status"); it != body.end()) {
    if (!it->is_string()) throw ValidationError("Field 'status' must be a string");
    p.status = it->get<std::string>();
  }

  if (auto it = body.find("phone"); it != body.end()) p.phone.emplace(read_nullable(*it, "phone"));
  if (auto it = body.find("address"); it != body.end()) p.address.emplace(read_nullable(*it, "address"));
  if (auto it = body.find("company"); it != body.end()) p.company.emplace(read_nullable(*it, "company"));
  return p;
}
