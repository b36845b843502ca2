#include "api.h"
#include "errors.h"

using json = nlohmann::json;

static ApiResponse fail(int status, const std::string& message, const std::string& event) {
  ApiResponse r;
  r.status = status;
  r.body = json({{"success", false}, {"message", message}});
  r.event = event;
  return r;
}

static ApiResponse not_found(const std::string& id) {
  auto r = fail(404, "Customer not found", "customer_not_found");
  r.body["requestedId"] = id;
  r.customer_id = id;
  return r;
}

static ApiResponse conflict(const ConflictError& e) {
  auto r = fail(409, e.what(), "customer_email_conflict");
  r.body["existingCustomerId"] = e.existing_id();
  r.customer_id = e.existing_id();
  return r;
}

// Empty body reads as {}. Malformed JSON throws json::parse_error, which the
// server's route boundary reports as a 500. Returns false and fills err for
// valid JSON that is not an object.
static bool parse_body(const std::string& text, json& out, ApiResponse& err) {
  if (text.empty()) {
    out = json::object();
    return true;
  }
  out = json::parse(text);
  if (!out.is_object()) {
    err = fail(400, "Request body must be a JSON object", "bad_request");
    return false;
  }
  return true;
}

static json list_body(const std::vector<Customer>& cs) {
  return json({{"success", true}, {"count", cs.size()}, {"data", cs}});
}

CustomerApi::CustomerApi(CustomerStore& store) : store_(store) {}

const std::vector<std::string>& CustomerApi::endpoints() {
  static const std::vector<std::string> eps = {
      "GET /api/customers",
      "GET /api/customers/:id",
      "POST /api/customers",
      "PUT /api/customers/:id",
      "DELETE /api/customers/:id",
      "GET /api/customers/status/:status",
      "GET /api/customers/search/:query",
  };
  return eps;
}

ApiResponse CustomerApi::info() const {
  ApiResponse r;
  r.body = json({{"message", "Welcome to Customer Management API"},
                 {"version", "1.0.0"},
                 {"endpoints",
                  {{"GET /api/customers", "Get all customers"},
                   {"GET /api/customers/:id", "Get specific customer"},
                   {"POST /api/customers", "Create new customer"},
                   {"PUT /api/customers/:id", "Update customer"},
                   {"DELETE /api/customers/:id", "Delete customer"},
                   {"GET /api/customers/status/:status", "Get customers by status"},
                   {"GET /api/customers/search/:query", "Search customers"}}}});
  r.event = "service_info";
  return r;
}

ApiResponse CustomerApi::list_all() const {
  ApiResponse r;
  r.body = list_body(store_.list());
  r.event = "customer_list";
  return r;
}

ApiResponse CustomerApi::get_one(const std::string& id) const {
  auto c = store_.get(id);
  if (!c) return not_found(id);

  ApiResponse r;
  r.body = json({{"success", true}, {"customer", *c}});
  r.event = "customer_found";
  r.customer_id = c->id;
  return r;
}

ApiResponse CustomerApi::create(const std::string& body) {
  json j;
  ApiResponse err;
  if (!parse_body(body, j, err)) return err;

  try {
    Customer c = store_.create(new_customer_from_json(j));
    ApiResponse r;
    r.status = 201;
    r.body = json({{"success", true}, {"message", "Customer created successfully"}, {"customer", c}});
    r.event = "customer_created";
    r.customer_id = c.id;
    return r;
  } catch (const ValidationError& e) {
    return fail(400, e.what(), "customer_validation_failed");
  } catch (const ConflictError& e) {
    return conflict(e);
  }
}

ApiResponse CustomerApi::update(const std::string& id, const std::string& body) {
  json j;
  ApiResponse err;
  if (!parse_body(body, j, err)) return err;

  try {
    auto c = store_.update(id, patch_from_json(j));
    if (!c) return not_found(id);

    ApiResponse r;
    r.body = json({{"success", true}, {"message", "Customer updated successfully"}, {"customer", *c}});
    r.event = "customer_updated";
    r.customer_id = c->id;
    return r;
  } catch (const ValidationError& e) {
    auto r = fail(400, e.what(), "customer_validation_failed");
    r.customer_id = id;
    return r;
  } catch (const ConflictError& e) {
    return conflict(e);
  }
}

ApiResponse CustomerApi::remove(const std::string& id) {
  auto c = store_.remove(id);
  if (!c) return not_found(id);

  ApiResponse r;
  r.body = json({{"success", true}, {"message", "Customer deleted successfully"}, {"customer", *c}});
  r.event = "customer_deleted";
  r.customer_id = c->id;
  return r;
}

ApiResponse CustomerApi::list_by_status(const std::string& status) const {
  auto cs = store_.by_status(status);
  ApiResponse r;
  r.body = json({{"success", true}, {"count", cs.size()}, {"status", status}, {"data", cs}});
  r.event = "customer_status_filter";
  return r;
}

ApiResponse CustomerApi::search(const std::string& query) const {
  auto cs = store_.search(query);
  ApiResponse r;
  r.body = json({{"success", true}, {"count", cs.size()}, {"query", query}, {"data", cs}});
  r.event = "customer_search";
  return r;
}

ApiResponse CustomerApi::route_not_found() const {
  auto r = fail(404, "Endpoint not found", "route_not_found");
  r.body["availableEndpoints"] = endpoints();
  return r;
}

ApiResponse CustomerApi::internal_error(const std::string& what) const {
  auto r = fail(500, "Internal server error", "internal_error");
  r.body["error"] = what;
  return r;
}
