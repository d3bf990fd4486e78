#include <gtest/gtest.h>
#include "session/Cookie.hpp"

#include <string>
#include <vector>

using namespace sk::session;

namespace {

std::string header(const Request& req, const http::field f) {
    const auto v = req[f];
    return {v.data(), v.size()};
}

}

class CookieTest : public ::testing::Test {
protected:
    Request req{http::verb::get, "/", 11};
    Response res{http::status::ok, 11};
};

TEST_F(CookieTest, ToStringWithoutExpiry) {
    const Cookie c{"session", "abc"};
    EXPECT_EQ(c.toString(), "session=abc");
}

TEST_F(CookieTest, ToStringWithExpiry) {
    const Cookie c{"session", "abc", 784111777};
    EXPECT_EQ(c.toString(), "session=abc; Expires=Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST_F(CookieTest, ExtractMissingHeader) {
    EXPECT_FALSE(extractCookie(req, "session").has_value());
}

TEST_F(CookieTest, ExtractMissingName) {
    req.set(http::field::cookie, "theme=dark; lang=en");
    EXPECT_FALSE(extractCookie(req, "session").has_value());
}

TEST_F(CookieTest, ExtractEmptyValueIsPresent) {
    req.set(http::field::cookie, "theme=dark; session=");
    const auto value = extractCookie(req, "session");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "");
}

TEST_F(CookieTest, ExtractTrimsAndStripsQuotes) {
    req.set(http::field::cookie, "  theme=dark ;session = \"abc\" ; x=1");
    EXPECT_EQ(extractCookie(req, "session"), std::optional<std::string>("abc"));
}

TEST_F(CookieTest, ExtractDoesNotMatchNamePrefix) {
    req.set(http::field::cookie, "session_old=zzz; session=abc");
    EXPECT_EQ(extractCookie(req, "session"), std::optional<std::string>("abc"));
}

TEST_F(CookieTest, ExtractSearchesEveryCookieHeader) {
    req.insert(http::field::cookie, "theme=dark");
    req.insert(http::field::cookie, "session=second");
    EXPECT_EQ(extractCookie(req, "session"), std::optional<std::string>("second"));
}

TEST_F(CookieTest, ExtractReturnsFirstMatch) {
    req.set(http::field::cookie, "session=first; session=second");
    EXPECT_EQ(extractCookie(req, "session"), std::optional<std::string>("first"));
}

TEST_F(CookieTest, AttachCreatesHeader) {
    attachCookie(req, Cookie{"session", "abc", 784111777});
    EXPECT_EQ(header(req, http::field::cookie), "session=abc");
}

TEST_F(CookieTest, AttachAppendsToExistingHeader) {
    req.set(http::field::cookie, "theme=dark");
    attachCookie(req, Cookie{"session", "abc"});
    EXPECT_EQ(header(req, http::field::cookie), "theme=dark; session=abc");
    EXPECT_EQ(extractCookie(req, "session"), std::optional<std::string>("abc"));
}

TEST_F(CookieTest, SetCookieKeepsExistingHeaders) {
    res.insert(http::field::set_cookie, "theme=dark");
    setCookie(res, Cookie{"session", "abc", 784111777});
    EXPECT_EQ(res.count(http::field::set_cookie), 2u);

    std::vector<std::string> values;
    const auto [begin, end] = res.equal_range(http::field::set_cookie);
    for (auto it = begin; it != end; ++it) values.emplace_back(it->value().data(), it->value().size());
    EXPECT_EQ(values.back(), "session=abc; Expires=Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(CookieValueTest, AcceptsCookieOctets) {
    EXPECT_TRUE(isValidCookieValue("sess-1"));
    EXPECT_TRUE(isValidCookieValue("ABC123_xyz.5bdc"));
    EXPECT_TRUE(isValidCookieValue("!#$%&'()*+-./:<=>?@[]^_`{|}~"));
}

TEST(CookieValueTest, RejectsSeparatorsAndControls) {
    EXPECT_FALSE(isValidCookieValue(""));
    EXPECT_FALSE(isValidCookieValue("a b"));
    EXPECT_FALSE(isValidCookieValue("a;Domain=evil"));
    EXPECT_FALSE(isValidCookieValue("a,b"));
    EXPECT_FALSE(isValidCookieValue("a\"b"));
    EXPECT_FALSE(isValidCookieValue("a\\b"));
    EXPECT_FALSE(isValidCookieValue("a\r\nSet-Cookie: x=y"));
    EXPECT_FALSE(isValidCookieValue("a\tb"));
    EXPECT_FALSE(isValidCookieValue("caf\xc3\xa9"));
}
