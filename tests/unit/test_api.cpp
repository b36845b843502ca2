#include <gtest/gtest.h>
#include "api.h"

#include <regex>

using json = nlohmann::json;

class CustomerApiTest : public ::testing::Test {
 protected:
  int64_t clock_ms_ = 1700000000000;
  CustomerStore store{[this]() { return clock_ms_; }};
  CustomerApi api{store};

  std::string create_ok(const std::string& name, const std::string& email) {
    auto r = api.create(json({{"name", name}, {"email", email}}).dump());
    EXPECT_EQ(r.status, 201);
    return r.body["customer"]["id"].get<std::string>();
  }
};


TEST_F(CustomerApiTest, InfoListsEndpoints) {
  auto r = api.info();
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body["message"], "Welcome to Customer Management API");
  EXPECT_EQ(r.body["version"], "1.0.0");
  EXPECT_TRUE(r.body["endpoints"].contains("POST /api/customers"));
}

TEST_F(CustomerApiTest, ListAllEmpty) {
  auto r = api.list_all();
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body["success"], true);
  EXPECT_EQ(r.body["count"], 0);
  EXPECT_TRUE(r.body["data"].is_array());
  EXPECT_TRUE(r.body["data"].empty());
}

TEST_F(CustomerApiTest, CreateReturnsFullRecord) {
  auto r = api.create(R"({"name":"Ahmed Mohamed","email":"ahmed@example.com","phone":"+201000000000","company":"Acme"})");
  EXPECT_EQ(r.status, 201);
  EXPECT_EQ(r.body["success"], true);
  EXPECT_EQ(r.body["message"], "Customer created successfully");
  const auto& c = r.body["customer"];
  EXPECT_TRUE(std::regex_match(c["id"].get<std::string>(), std::regex(R"(CUST-\d+-\d+)")));
  EXPECT_EQ(c["phone"], "+201000000000");
  EXPECT_TRUE(c["address"].is_null());
  EXPECT_EQ(c["company"], "Acme");
  EXPECT_EQ(c["status"], "active");
  EXPECT_EQ(c["createdAt"], c["updatedAt"]);
  EXPECT_EQ(r.event, "customer_created");
  EXPECT_EQ(r.customer_id, c["id"].get<std::string>());
}

TEST_F(CustomerApiTest, CreateMissingFieldsIs400) {
  for (const char* body : {R"({"name":"Only Name"})", R"({"email":"only@x.com"})",
                           R"({"name":"","email":"a@x.com"})", "{}", ""}) {
    auto r = api.create(body);
    EXPECT_EQ(r.status, 400) << body;
    EXPECT_EQ(r.body["success"], false);
    EXPECT_EQ(r.body["message"], "Missing required fields: name and email");
  }
  EXPECT_EQ(store.size(), 0u);
}

TEST_F(CustomerApiTest, CreateMalformedJsonThrowsParseError) {
  // Reported as a 500 by the server's route boundary.
  EXPECT_THROW(api.create("{not json"), json::parse_error);
  EXPECT_EQ(store.size(), 0u);
}

TEST_F(CustomerApiTest, CreateNonObjectOrWrongTypeIs400) {
  EXPECT_EQ(api.create("[1,2]").status, 400);
  EXPECT_EQ(api.create(R"({"name":1,"email":"a@x.com"})").status, 400);
  EXPECT_EQ(store.size(), 0u);
}

TEST_F(CustomerApiTest, CreateDuplicateEmailIs409) {
  std::string first = create_ok("Ahmed", "ahmed@example.com");
  auto r = api.create(R"({"name":"Other","email":"ahmed@example.com"})");
  EXPECT_EQ(r.status, 409);
  EXPECT_EQ(r.body["success"], false);
  EXPECT_EQ(r.body["message"], "Customer with this email already exists");
  EXPECT_EQ(r.body["existingCustomerId"], first);
  EXPECT_EQ(store.size(), 1u);
}

TEST_F(CustomerApiTest, GetOneAndNotFound) {
  std::string id = create_ok("Ahmed", "ahmed@example.com");
  auto r = api.get_one(id);
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body["customer"]["id"], id);

  auto missing = api.get_one("FAKE-ID");
  EXPECT_EQ(missing.status, 404);
  EXPECT_EQ(missing.body["success"], false);
  EXPECT_EQ(missing.body["message"], "Customer not found");
  EXPECT_EQ(missing.body["requestedId"], "FAKE-ID");
}

TEST_F(CustomerApiTest, UpdateIgnoresImmutableFields) {
  std::string id = create_ok("Ahmed", "ahmed@example.com");
  auto before = api.get_one(id).body["customer"];

  clock_ms_ += 1000;
  auto r = api.update(id, R"({"id":"HACKED","createdAt":"1999-01-01T00:00:00.000Z","phone":"555","role":"admin"})");
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body["message"], "Customer updated successfully");
  const auto& c = r.body["customer"];
  EXPECT_EQ(c["id"], id);
  EXPECT_EQ(c["createdAt"], before["createdAt"]);
  EXPECT_NE(c["updatedAt"], before["updatedAt"]);
  EXPECT_EQ(c["phone"], "555");
  EXPECT_FALSE(c.contains("role"));
  EXPECT_TRUE(api.get_one("HACKED").status == 404);
}

TEST_F(CustomerApiTest, UpdateErrors) {
  std::string a = create_ok("A", "a@x.com");
  std::string b = create_ok("B", "b@x.com");

  auto missing = api.update("FAKE-ID", R"({"name":"X"})");
  EXPECT_EQ(missing.status, 404);
  EXPECT_EQ(missing.body["requestedId"], "FAKE-ID");

  auto dup = api.update(b, R"({"email":"a@x.com"})");
  EXPECT_EQ(dup.status, 409);
  EXPECT_EQ(dup.body["message"], "Another customer with this email already exists");
  EXPECT_EQ(dup.body["existingCustomerId"], a);

  EXPECT_EQ(api.update(a, R"({"name":""})").status, 400);
  EXPECT_EQ(api.update(a, R"({"email":null})").status, 400);
  EXPECT_THROW(api.update(a, "not json"), json::parse_error);
  EXPECT_EQ(api.get_one(a).body["customer"]["name"], "A");
}

TEST_F(CustomerApiTest, DeleteReturnsRemovedRecord) {
  std::string id = create_ok("Ahmed", "ahmed@example.com");
  auto r = api.remove(id);
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body["message"], "Customer deleted successfully");
  EXPECT_EQ(r.body["customer"]["email"], "ahmed@example.com");

  EXPECT_EQ(api.remove(id).status, 404);
  EXPECT_EQ(api.get_one(id).status, 404);
}

TEST_F(CustomerApiTest, ListByStatusNeverErrors) {
  create_ok("A", "a@x.com");
  auto active = api.list_by_status("active");
  EXPECT_EQ(active.status, 200);
  EXPECT_EQ(active.body["count"], 1);
  EXPECT_EQ(active.body["status"], "active");

  auto none = api.list_by_status("suspended");
  EXPECT_EQ(none.status, 200);
  EXPECT_EQ(none.body["success"], true);
  EXPECT_EQ(none.body["count"], 0);
  EXPECT_TRUE(none.body["data"].empty());
}

TEST_F(CustomerApiTest, SearchEchoesQuery) {
  create_ok("Ahmed Mohamed", "am@example.com");
  create_ok("Sara", "sara@example.com");
  auto r = api.search("ahmed");
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(r.body["query"], "ahmed");
  EXPECT_EQ(r.body["count"], 1);
  EXPECT_EQ(r.body["data"][0]["name"], "Ahmed Mohamed");

  auto none = api.search("zzz");
  EXPECT_EQ(none.status, 200);
  EXPECT_EQ(none.body["count"], 0);
}

TEST_F(CustomerApiTest, RouteNotFoundListsEndpoints) {
  auto r = api.route_not_found();
  EXPECT_EQ(r.status, 404);
  EXPECT_EQ(r.body["success"], false);
  EXPECT_EQ(r.body["message"], "Endpoint not found");
  EXPECT_EQ(r.body["availableEndpoints"].size(), CustomerApi::endpoints().size());
}

TEST_F(CustomerApiTest, InternalErrorCarriesMessage) {
  auto r = api.internal_error("boom");
  EXPECT_EQ(r.status, 500);
  EXPECT_EQ(r.body["success"], false);
  EXPECT_EQ(r.body["message"], "Internal server error");
  EXPECT_EQ(r.body["error"], "boom");
}

TEST_F(CustomerApiTest, CreateDuplicateUpdateDeleteScenario) {
  auto created = api.create(R"({"name":"Ahmed Mohamed","email":"ahmed@example.com"})");
  ASSERT_EQ(created.status, 201);
  std::string id = created.body["customer"]["id"].get<std::string>();
  EXPECT_TRUE(std::regex_match(id, std::regex(R"(CUST-\d+-\d+)")));

  auto dup = api.create(R"({"name":"Someone","email":"ahmed@example.com"})");
  EXPECT_EQ(dup.status, 409);
  EXPECT_EQ(dup.body["existingCustomerId"], id);

  auto updated = api.update(id, R"({"name":"X"})");
  EXPECT_EQ(updated.status, 200);
  EXPECT_EQ(updated.body["customer"]["name"], "X");
  EXPECT_EQ(updated.body["customer"]["email"], "ahmed@example.com");

  auto deleted = api.remove(id);
  EXPECT_EQ(deleted.status, 200);
  EXPECT_EQ(deleted.body["customer"]["email"], "ahmed@example.com");

  EXPECT_EQ(api.get_one(id).status, 404);
}
