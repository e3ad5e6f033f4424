#include "services/api/RequestHandler.hpp"
#include "services/api/MutationGuard.hpp"
#include "test_db.hpp"

#include <httplib.h>

#include <regex>
#include <string>

#include <gtest/gtest.h>

using nlohmann::json;

namespace jds {

namespace {

struct Reply {
    int         status;
    std::string body;
    std::string content_type;

    json parsed() const { return json::parse(body); }
};

// Blocks mutations unconditionally.
class AlwaysProduction : public MutationGuard {
public:
    bool mutationsDisabled(const httplib::Request&) const override { return true; }
};

// Store that fails every call, to drive the 500 paths.
class BrokenStore : public RecordStore {
public:
    void applySchema(const std::string&) override { fail(); }
    std::vector<RecordSummary> listRecords() override { fail(); return {}; }
    std::optional<Record> findRecord(const std::string&) override { fail(); return {}; }
    void insertRecord(const Record&) override { fail(); }
    bool updateRecord(const std::string&, const std::string&, int64_t) override { fail(); return false; }
    bool deleteRecord(const std::string&) override { fail(); return false; }

private:
    [[noreturn]] static void fail() { throw StoreError("disk I/O error"); }
};

} // namespace

// ── parseTarget() ─────────────────────────────────────────────────────────────

TEST(ParseTargetTest, StripsBasePathAndQuery) {
    EXPECT_FALSE(parseTarget("/api", "/api").id.has_value());
    EXPECT_FALSE(parseTarget("/api/", "/api").id.has_value());
    EXPECT_FALSE(parseTarget("/api?x=1", "/api").id.has_value());
    EXPECT_EQ(parseTarget("/api/abc", "/api").id, "abc");
    EXPECT_EQ(parseTarget("/api/abc?x=1", "/api").id, "abc");
}

TEST(ParseTargetTest, SkipsEmptySegmentsAndIgnoresTrailingOnes) {
    EXPECT_EQ(parseTarget("/api//abc/def/ghi", "/api").id, "abc");
    EXPECT_EQ(parseTarget("///abc//", "/api").id, "abc");
}

TEST(ParseTargetTest, BasePathOnlyStrippedAtSegmentBoundary) {
    EXPECT_EQ(parseTarget("/apiary/x", "/api").id, "apiary");
    EXPECT_EQ(parseTarget("/other/abc", "/api").id, "other");
}

TEST(ParseTargetTest, EmptyBasePathKeepsWholePath) {
    EXPECT_FALSE(parseTarget("/", "").id.has_value());
    EXPECT_EQ(parseTarget("/abc", "").id, "abc");
}

// ── Fixture ───────────────────────────────────────────────────────────────────

class RequestHandlerTest : public ::testing::Test {
protected:
    test::TempDb db_;
    test::FakeClock clock_;
    RecordService service_{db_.store(), clock_.fn()};
    AllowAllGuard guard_;
    RequestHandler handler_{service_, guard_, "/api"};

    Reply call(const RequestHandler& h,
               const std::string& method,
               const std::string& path,
               const std::string& body = "",
               const httplib::Headers& headers = {}) {
        httplib::Request req;
        req.method  = method;
        req.path    = path;
        req.body    = body;
        req.headers = headers;
        httplib::Response res;
        h.handle(req, res);
        return Reply{res.status, res.body, res.get_header_value("Content-Type")};
    }

    Reply call(const std::string& method, const std::string& path, const std::string& body = "") {
        return call(handler_, method, path, body);
    }

    std::string create(const json& data) {
        auto r = call("POST", "/api", json{{"data", data}}.dump());
        EXPECT_EQ(r.status, 200) << r.body;
        return r.parsed().at("id").get<std::string>();
    }
};

// ── OPTIONS ───────────────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, OptionsIsEmptySuccessOnAnyPath) {
    for (const char* path : {"/api", "/api/whatever", "/elsewhere/x/y"}) {
        auto r = call("OPTIONS", path);
        EXPECT_EQ(r.status, 200);
        EXPECT_TRUE(r.body.empty());
        EXPECT_EQ(r.content_type, "application/json");
    }
}

TEST_F(RequestHandlerTest, OptionsBypassesProductionGate) {
    AlwaysProduction prod;
    RequestHandler gated(service_, prod, "/api");
    EXPECT_EQ(call(gated, "OPTIONS", "/api").status, 200);
}

// ── POST ──────────────────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, CreateReturnsRecordWithHexIdAndEqualTimestamps) {
    auto r = call("POST", "/api", R"({"data": {"x": 1}})");
    ASSERT_EQ(r.status, 200) << r.body;
    EXPECT_EQ(r.content_type, "application/json");

    auto j = r.parsed();
    EXPECT_EQ(j["data"], (json{{"x", 1}}));
    EXPECT_TRUE(std::regex_match(j["id"].get<std::string>(), std::regex("^[0-9a-f]{32}$")));
    EXPECT_EQ(j["created_at"], j["updated_at"]);
    EXPECT_EQ(j["created_at"], formatTimestamp(clock_.now()));
}

TEST_F(RequestHandlerTest, CreateIgnoresIdInPath) {
    auto r = call("POST", "/api/ffffffffffffffffffffffffffffffff", R"({"data": 1})");
    ASSERT_EQ(r.status, 200);
    EXPECT_NE(r.parsed()["id"], "ffffffffffffffffffffffffffffffff");
}

TEST_F(RequestHandlerTest, CreateWithNullDataIsAccepted) {
    auto r = call("POST", "/api", R"({"data": null})");
    ASSERT_EQ(r.status, 200) << r.body;
    EXPECT_TRUE(r.parsed()["data"].is_null());
}

TEST_F(RequestHandlerTest, CreateWithoutDataIs400AndStoresNothing) {
    for (const char* body : {R"({"payload": 1})", "[1,2]", "\"data\"", "{}"}) {
        auto r = call("POST", "/api", body);
        EXPECT_EQ(r.status, 400) << body;
        EXPECT_EQ(r.parsed()["error"], "Data field is required");
    }
    EXPECT_TRUE(service_.list().empty());
}

TEST_F(RequestHandlerTest, CreateWithInvalidJsonIs400) {
    for (const char* body : {"", "{", "data=1"}) {
        auto r = call("POST", "/api", body);
        EXPECT_EQ(r.status, 400) << body;
        EXPECT_TRUE(r.parsed().contains("error"));
    }
    EXPECT_TRUE(service_.list().empty());
}

TEST_F(RequestHandlerTest, CreateWithOverflowingNumberIs400) {
    auto r = call("POST", "/api", R"({"data": 1e400})");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.parsed()["error"], "Invalid JSON body");
    EXPECT_TRUE(service_.list().empty());
}

TEST_F(RequestHandlerTest, CreateWithDeeplyNestedBodyIs400) {
    const int depth = 100000;
    const std::string body = R"({"data": )" + std::string(depth, '[') + std::string(depth, ']') + "}";
    auto r = call("POST", "/api", body);
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.parsed()["error"], "Invalid JSON body");
    EXPECT_TRUE(service_.list().empty());
}

TEST_F(RequestHandlerTest, NestingUpToLimitIsAccepted) {
    // the wrapping {"data": ...} object is one of the kMaxJsonDepth levels
    const int depth = kMaxJsonDepth - 1;
    const std::string body = R"({"data": )" + std::string(depth, '[') + std::string(depth, ']') + "}";
    auto r = call("POST", "/api", body);
    ASSERT_EQ(r.status, 200) << r.body;
    EXPECT_EQ(jsonDepth(r.parsed()["data"]), depth);

    const std::string tooDeep = R"({"data": )" + std::string(depth + 1, '[') + std::string(depth + 1, ']') + "}";
    EXPECT_EQ(call("POST", "/api", tooDeep).status, 400);
}

// ── GET ───────────────────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, GetReturnsFullRecord) {
    const std::string id = create(json::array({1, "two"}));
    auto r = call("GET", "/api/" + id);
    ASSERT_EQ(r.status, 200);
    auto j = r.parsed();
    EXPECT_EQ(j["id"], id);
    EXPECT_EQ(j["data"], json::array({1, "two"}));
    EXPECT_TRUE(j.contains("created_at"));
    EXPECT_TRUE(j.contains("updated_at"));
}

TEST_F(RequestHandlerTest, GetIgnoresExtraSegmentsAndQuery) {
    const std::string id = create(json(5));
    auto r = call("GET", "/api/" + id + "/extra/stuff?pretty=1");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.parsed()["data"], 5);
}

TEST_F(RequestHandlerTest, GetMissingIs404WithError) {
    auto r = call("GET", "/api/" + newRecordId());
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(r.parsed()["error"], "Record not found");
}

TEST_F(RequestHandlerTest, RepeatedGetIsByteIdentical) {
    const std::string id = create(json{{"b", 2}, {"a", {1, 2, 3}}, {"c", nullptr}});
    const auto first = call("GET", "/api/" + id).body;
    clock_.advance(5000);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(call("GET", "/api/" + id).body, first);
    }
}

// ── GET list ──────────────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, ListOnEmptyStoreIs200EmptyArray) {
    auto r = call("GET", "/api");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.parsed(), json::array());
}

TEST_F(RequestHandlerTest, ListOmitsDataAndOrdersByLastTouch) {
    const std::string a = create(json("a"));
    clock_.advance(1);
    const std::string b = create(json("b"));
    clock_.advance(1);
    ASSERT_EQ(call("PUT", "/api/" + a, R"({"data": "a2"})").status, 200);

    auto list = call("GET", "/api/").parsed();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]["id"], a);
    EXPECT_EQ(list[1]["id"], b);
    for (const auto& item : list) {
        EXPECT_FALSE(item.contains("data"));
        EXPECT_TRUE(item.contains("created_at"));
        EXPECT_TRUE(item.contains("updated_at"));
    }
}

// ── PUT ───────────────────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, UpdateChangesDataAndAdvancesUpdatedAt) {
    const std::string id = create(json{{"v", 1}});
    const auto before = call("GET", "/api/" + id).parsed();
    clock_.advance(1500);

    auto r = call("PUT", "/api/" + id, R"({"data": {"v": 2}})");
    ASSERT_EQ(r.status, 200) << r.body;
    auto after = r.parsed();
    EXPECT_EQ(after["id"], id);
    EXPECT_EQ(after["data"], (json{{"v", 2}}));
    EXPECT_EQ(after["created_at"], before["created_at"]);
    EXPECT_GT(after["updated_at"].get<std::string>(), before["updated_at"].get<std::string>());
}

TEST_F(RequestHandlerTest, UpdateWithoutIdIs400) {
    auto r = call("PUT", "/api", R"({"data": 1})");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.parsed()["error"], "ID is required for update");
}

TEST_F(RequestHandlerTest, UpdateMissingIs404AndCreatesNothing) {
    const std::string id = newRecordId();
    auto r = call("PUT", "/api/" + id, R"({"data": 1})");
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(call("GET", "/api/" + id).status, 404);
    EXPECT_EQ(call("GET", "/api").parsed(), json::array());
}

TEST_F(RequestHandlerTest, UpdateWithoutDataIs400AndLeavesRecordAlone) {
    const std::string id = create(json{{"keep", true}});
    const auto before = call("GET", "/api/" + id).body;
    clock_.advance(10);

    auto r = call("PUT", "/api/" + id, R"({"other": 1})");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(call("GET", "/api/" + id).body, before);
}

TEST_F(RequestHandlerTest, UpdateWithDeeplyNestedBodyIs400AndLeavesRecordAlone) {
    const std::string id = create(json{{"keep", 1}});
    const auto before = call("GET", "/api/" + id).body;

    const int depth = 100000;
    const std::string body = R"({"data": )" + std::string(depth, '[') + std::string(depth, ']') + "}";
    auto r = call("PUT", "/api/" + id, body);
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(call("GET", "/api/" + id).body, before);
}

// ── DELETE ────────────────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, DeleteIs204ThenGoneThen404) {
    const std::string id = create(json(1));
    auto r = call("DELETE", "/api/" + id);
    EXPECT_EQ(r.status, 204);
    EXPECT_TRUE(r.body.empty());

    EXPECT_EQ(call("GET", "/api/" + id).status, 404);
    auto again = call("DELETE", "/api/" + id);
    EXPECT_EQ(again.status, 404);
    EXPECT_EQ(again.parsed()["error"], "Record not found");
}

TEST_F(RequestHandlerTest, DeleteWithoutIdIs400) {
    auto r = call("DELETE", "/api/");
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(r.parsed()["error"], "ID is required for delete");
}

// ── other methods ─────────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, UnsupportedMethodIs405) {
    auto r = call("PATCH", "/api/abc", R"({"data": 1})");
    EXPECT_EQ(r.status, 405);
    EXPECT_EQ(r.parsed()["error"], "Method not allowed");
}

// ── production gate ───────────────────────────────────────────────────────────

TEST_F(RequestHandlerTest, GateRejectsMutationsBeforeTouchingStore) {
    const std::string id = create(json("orig"));
    AlwaysProduction prod;
    RequestHandler gated(service_, prod, "/api");

    auto post = call(gated, "POST", "/api", R"({"data": 1})");
    EXPECT_EQ(post.status, 403);
    EXPECT_EQ(post.parsed()["error"], "POST is disabled in production");

    EXPECT_EQ(call(gated, "PUT", "/api/" + id, R"({"data": 2})").status, 403);
    // gate wins over the missing-id check
    EXPECT_EQ(call(gated, "PUT", "/api", R"({"data": 2})").status, 403);
    EXPECT_EQ(call(gated, "DELETE", "/api/" + id).status, 403);

    auto list = call(gated, "GET", "/api").parsed();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(call(gated, "GET", "/api/" + id).parsed()["data"], "orig");
}

TEST_F(RequestHandlerTest, ProductionGateUsesClientHeader) {
    ProductionGate gate("production", "X-Client-Id", "public-site");
    RequestHandler gated(service_, gate, "/api");

    auto blocked = call(gated, "POST", "/api", R"({"data": 1})", {{"X-Client-Id", "public-site"}});
    EXPECT_EQ(blocked.status, 403);

    auto allowed = call(gated, "POST", "/api", R"({"data": 1})", {{"X-Client-Id", "admin-tool"}});
    EXPECT_EQ(allowed.status, 200);
}

// ── storage failures ──────────────────────────────────────────────────────────

TEST(RequestHandlerFailureTest, StoreErrorsBecome500WithReason) {
    BrokenStore broken;
    RecordService service(broken);
    AllowAllGuard guard;
    RequestHandler handler(service, guard, "/api");

    struct Case { const char* method; const char* path; const char* body; const char* prefix; };
    const Case cases[] = {
        {"GET",    "/api",     "",              "Failed to list records: "},
        {"GET",    "/api/abc", "",              "Failed to retrieve record: "},
        {"POST",   "/api",     R"({"data":1})", "Failed to create record: "},
        {"PUT",    "/api/abc", R"({"data":1})", "Failed to update record: "},
        {"DELETE", "/api/abc", "",              "Failed to delete record: "},
    };
    for (const auto& c : cases) {
        httplib::Request req;
        req.method = c.method;
        req.path   = c.path;
        req.body   = c.body;
        httplib::Response res;
        handler.handle(req, res);

        EXPECT_EQ(res.status, 500) << c.method << " " << c.path;
        auto err = json::parse(res.body)["error"].get<std::string>();
        EXPECT_EQ(err, std::string(c.prefix) + "disk I/O error");
    }
}

} // namespace jds
