#include "connection/payload.hpp"

#include <gtest/gtest.h>

using comserver::connection::compose_payload;

TEST(PayloadTest, JoinsFragmentsThenAppendsEnding) {
    EXPECT_EQ("a b c\r\n", compose_payload({"a", "b", "c"}, " ", "\r\n"));
    EXPECT_EQ("1,2\n", compose_payload({"1", "2"}, ",", "\n"));
}

TEST(PayloadTest, SingleFragmentIgnoresSeparator) {
    EXPECT_EQ("ping;", compose_payload({"ping"}, "--", ";"));
}

TEST(PayloadTest, EmptyEndingAndSeparator) {
    EXPECT_EQ("abc", compose_payload({"a", "b", "c"}, "", ""));
}

TEST(PayloadTest, FragmentWhitespaceIsPreserved) {
    EXPECT_EQ(" x  y \r\n", compose_payload({" x ", " y "}, "", "\r\n"));
}

TEST(PayloadTest, DefaultsMatchSendEndpoint) {
    EXPECT_STREQ("\r\n", comserver::connection::kDefaultEnding);
    EXPECT_STREQ(" ", comserver::connection::kDefaultConcatenate);
}
