#include "../include/cloud_server.hpp"

#include <gtest/gtest.h>

#include <string>

namespace http = boost::beast::http;

namespace {

CloudServer::Response send(http::verb method, const std::string& target, const std::string& body = "")
{
    CloudServer server(SeparatorSet::defaults(), RenderOptions());
    CloudServer::Request req{method, target, 11};
    req.body() = body;
    req.prepare_payload();

    CloudServer::Response res{http::status::ok, 11};
    server.handle(req, res);
    return res;
}

} // namespace

TEST(CloudServer, ServesForm) {
    auto res = send(http::verb::get, "/");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("action='/cloud'"), std::string::npos);
    EXPECT_EQ(std::string(res[http::field::content_type]), "text/html; charset=utf-8");
}

TEST(CloudServer, RendersCloud) {
    auto res = send(http::verb::post, "/cloud", "title=pets&count=2&text=the+cat+the+dog+the+cat");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("Top 2 words in pets"), std::string::npos);
    EXPECT_NE(res.body().find("class=\"f11\" title=\"count: 2\">cat</span>"), std::string::npos);
    EXPECT_NE(res.body().find("class=\"f48\" title=\"count: 3\">the</span>"), std::string::npos);
}

TEST(CloudServer, DecodesFormFields) {
    auto res = send(http::verb::post, "/cloud", "count=5&text=a%2Cb%20A&title=My%20Doc");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("Top 2 words in My Doc"), std::string::npos);
    EXPECT_NE(res.body().find("title=\"count: 2\">a</span>"), std::string::npos);
}

TEST(CloudServer, MissingTitleUsesPlaceholder) {
    auto res = send(http::verb::post, "/cloud", "count=1&text=");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("Top 0 words in untitled"), std::string::npos);
}

TEST(CloudServer, RejectsNegativeCount) {
    auto res = send(http::verb::post, "/cloud", "title=x&count=-2&text=a");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_NE(res.body().find("non-negative"), std::string::npos);
}

TEST(CloudServer, RejectsNonNumericCount) {
    auto res = send(http::verb::post, "/cloud", "title=x&count=many&text=a");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST(CloudServer, UnknownRoute) {
    EXPECT_EQ(send(http::verb::get, "/nope").result(), http::status::not_found);
    EXPECT_EQ(send(http::verb::get, "/cloud").result(), http::status::not_found);
}

TEST(FormFields, ExactNameMatch) {
    EXPECT_EQ(extractFormField("subtitle=a&title=b", "title"), "b");
    EXPECT_EQ(extractFormField("title=", "title"), "");
    EXPECT_EQ(extractFormField("count=3", "title"), "");
    EXPECT_EQ(extractFormField("text=x+y%21", "text"), "x y!");
}
