// Copyright (c) 2019 EPI-ONE Core Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <gtest/gtest.h>

#include "keypath.h"

class TestKeypath : public testing::Test {};

TEST_F(TestKeypath, parse_keypath) {
    auto path = ParseKeypath("m/12381/3600/0/0/0");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, std::vector<uint32_t>({12381, 3600, 0, 0, 0}));

    path = ParseKeypath("m/44'/0h/7");
    ASSERT_TRUE(path);
    EXPECT_EQ(*path, std::vector<uint32_t>({44 | HARDENED_BIT, 0 | HARDENED_BIT, 7}));

    path = ParseKeypath("m");
    ASSERT_TRUE(path);
    EXPECT_TRUE(path->empty());

    path = ParseKeypath("m/2147483647");
    ASSERT_TRUE(path);
    EXPECT_EQ(path->front(), HARDENED_BIT - 1);
}

TEST_F(TestKeypath, parse_invalid_keypath) {
    for (const std::string& bad : {"", "/1", "1/2", "n/1", "m/", "m//1", "m/1/", "m/-1", "m/+1", "m/ 1", "m/1x",
                                   "m/'", "m/1''", "m/2147483648", "m/99999999999", "mm/1", "m1"}) {
        EXPECT_FALSE(ParseKeypath(bad)) << bad;
    }
}

TEST_F(TestKeypath, format_keypath) {
    std::vector<uint32_t> path = {44 | HARDENED_BIT, 1, 2 | HARDENED_BIT};
    EXPECT_EQ(FormatKeypath(path), "44'/1/2'");
    EXPECT_EQ(FormatKeypath(path, true), "44h/1/2h");
    EXPECT_EQ(WriteKeypath(path), "m/44'/1/2'");
    EXPECT_EQ(WriteKeypath({}), "m");

    EXPECT_EQ(*ParseKeypath(WriteKeypath(path, true)), path);
}

TEST_F(TestKeypath, account_keypath) {
    EXPECT_EQ(AccountKeypath(0, 0), "m/12381/3600/0/0/0");
    EXPECT_EQ(AccountKeypath(3, 17), "m/12381/3600/3/17/0");
    EXPECT_EQ(AccountKeypath(HARDENED_BIT - 1, 1), "m/12381/3600/2147483647/1/0");
    EXPECT_TRUE(ParseKeypath(AccountKeypath(5, 6)));
}
