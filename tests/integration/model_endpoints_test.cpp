#include <gtest/gtest.h>
#include <httplib.h>
#include <nlohmann/json.hpp>

#include "test_service.h"

using namespace modelcat;
using modelcat::test::TestService;
using modelcat::test::makeRow;

TEST(ModelEndpointsTest, ModelListIsEmptyBeforeRefresh) {
    TestService svc(18221);
    ASSERT_TRUE(svc.start());

    httplib::Client cli("127.0.0.1", 18221);
    auto res = cli.Get("/api/model-list");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body), nlohmann::json::array());
}

TEST(ModelEndpointsTest, ModelListInRegistryOrder) {
    TestService svc(18222);
    svc.addStore("a.sqlite", {makeRow(1, "RiskPaths", "d-rp"), makeRow(2, "IDMM", "d-idmm")});
    svc.addStore("b.sqlite", {makeRow(1, "NewCaseBased", "d-ncb")});
    ASSERT_TRUE(svc.start());
    ASSERT_TRUE(svc.catalog().refresh(svc.modelsDir().str(), "").ok());

    httplib::Client cli("127.0.0.1", 18222);
    auto res = cli.Get("/api/model-list");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto list = nlohmann::json::parse(res->body);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0]["name"], "RiskPaths");
    EXPECT_EQ(list[1]["digest"], "d-idmm");
    EXPECT_EQ(list[2]["name"], "NewCaseBased");
    EXPECT_EQ(list[2]["bin_dir"], svc.modelsDir().str());
    EXPECT_EQ(list[2]["is_log_dir"], false);
}

TEST(ModelEndpointsTest, ModelByNameOrDigestWithLanguage) {
    TestService svc(18223);
    svc.addStore("a.sqlite", {makeRow(1, "RiskPaths", "d-rp", "FR")}, {"EN", "FR"});
    ASSERT_TRUE(svc.start());
    ASSERT_TRUE(svc.catalog().refresh(svc.modelsDir().str(), "").ok());

    httplib::Client cli("127.0.0.1", 18223);

    auto by_name = cli.Get("/api/model/RiskPaths");
    ASSERT_TRUE(by_name);
    EXPECT_EQ(by_name->status, 200);
    auto body = nlohmann::json::parse(by_name->body);
    EXPECT_EQ(body["model"]["digest"], "d-rp");
    EXPECT_EQ(body["lang_codes"], nlohmann::json::array({"FR", "EN"}));
    EXPECT_EQ(body["lang"], "FR");

    httplib::Headers headers = {{"Accept-Language", "de;q=0.9, en-US;q=0.8"}};
    auto by_digest = cli.Get("/api/model/d-rp", headers);
    ASSERT_TRUE(by_digest);
    EXPECT_EQ(by_digest->status, 200);
    EXPECT_EQ(nlohmann::json::parse(by_digest->body)["lang"], "EN");
    EXPECT_EQ(by_digest->get_header_value("Content-Language"), "EN");
}

TEST(ModelEndpointsTest, UnknownModelIsNotFound) {
    TestService svc(18224);
    ASSERT_TRUE(svc.start());

    httplib::Client cli("127.0.0.1", 18224);
    auto res = cli.Get("/api/model/nothing");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(nlohmann::json::parse(res->body)["model"], "nothing");
}

TEST(ModelEndpointsTest, ModelListSurvivesNonUtf8ModelName) {
    TestService svc(18225);
    svc.addStore("a.sqlite", {makeRow(1, "Road\xFF", "d-road"), makeRow(2, "RiskPaths", "d-rp")});
    ASSERT_TRUE(svc.start());
    ASSERT_TRUE(svc.catalog().refresh(svc.modelsDir().str(), "").ok());

    httplib::Client cli("127.0.0.1", 18225);
    auto res = cli.Get("/api/model-list");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);

    auto list = nlohmann::json::parse(res->body);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0]["name"], "Road\xEF\xBF\xBD");
    EXPECT_EQ(list[1]["name"], "RiskPaths");

    auto one = cli.Get("/api/model/d-road");
    ASSERT_TRUE(one);
    EXPECT_EQ(one->status, 200);
}
