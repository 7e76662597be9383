/******************************************************************************
 * Copyright (c) Huawei Technologies Co., Ltd. 2026. All rights reserved.
 * crishim licensed under the Mulan PSL v2.
 * You can use this software according to the terms and conditions of the Mulan PSL v2.
 * You may obtain a copy of Mulan PSL v2 at:
 *     http://license.coscl.org.cn/MulanPSL2
 * THIS SOFTWARE IS PROVIDED ON AN "AS IS" BASIS, WITHOUT WARRANTIES OF ANY KIND, EITHER EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO NON-INFRINGEMENT, MERCHANTABILITY OR FIT FOR A PARTICULAR
 * PURPOSE.
 * See the Mulan PSL v2 for more details.
 * Create: 2026-10-18
 * Description: cxxutils unit test
 *********************************************************************************/

#include <gtest/gtest.h>
#include "cxxutils.h"

TEST(cxxutils, test_split)
{
    std::vector<std::string> ret = CXXUtils::Split("a/b//c", '/');

    ASSERT_EQ(ret.size(), 4U);
    ASSERT_EQ(ret[0], "a");
    ASSERT_EQ(ret[2], "");
    ASSERT_EQ(ret[3], "c");
    ASSERT_TRUE(CXXUtils::Split("", '/').empty());
}

TEST(cxxutils, test_strings_join)
{
    ASSERT_EQ(CXXUtils::StringsJoin({ "a", "b", "c" }, ","), "a,b,c");
    ASSERT_EQ(CXXUtils::StringsJoin({ "a" }, ","), "a");
    ASSERT_EQ(CXXUtils::StringsJoin({}, ","), "");
}

TEST(cxxutils, test_has_prefix)
{
    ASSERT_TRUE(CXXUtils::HasPrefix("io.crishim.type", "io.crishim."));
    ASSERT_TRUE(CXXUtils::HasPrefix("abc", ""));
    ASSERT_FALSE(CXXUtils::HasPrefix("io.crishi", "io.crishim."));
    ASSERT_FALSE(CXXUtils::HasPrefix("abc.xyz", "io.crishim."));
}

TEST(cxxutils, test_safe_uint32)
{
    uint32_t out = 7;

    ASSERT_TRUE(CXXUtils::SafeUint32("0", out));
    ASSERT_EQ(out, 0U);
    ASSERT_TRUE(CXXUtils::SafeUint32("4294967295", out));
    ASSERT_EQ(out, 4294967295U);

    out = 7;
    ASSERT_FALSE(CXXUtils::SafeUint32("4294967296", out));
    ASSERT_FALSE(CXXUtils::SafeUint32("", out));
    ASSERT_FALSE(CXXUtils::SafeUint32("-1", out));
    ASSERT_FALSE(CXXUtils::SafeUint32("+1", out));
    ASSERT_FALSE(CXXUtils::SafeUint32(" 1", out));
    ASSERT_FALSE(CXXUtils::SafeUint32("1x", out));
    ASSERT_EQ(out, 7U);
}

TEST(cxxutils, test_clean_path)
{
    ASSERT_EQ(CXXUtils::CleanPath(""), ".");
    ASSERT_EQ(CXXUtils::CleanPath("/"), "/");
    ASSERT_EQ(CXXUtils::CleanPath("/var/log/pods//ctr/./0.log"), "/var/log/pods/ctr/0.log");
    ASSERT_EQ(CXXUtils::CleanPath("/var/log/../0.log"), "/var/0.log");
    ASSERT_EQ(CXXUtils::CleanPath("/../0.log"), "/0.log");
    ASSERT_EQ(CXXUtils::CleanPath("a/../../b"), "../b");
    ASSERT_EQ(CXXUtils::CleanPath("a/.."), ".");
    ASSERT_EQ(CXXUtils::CleanPath("ctr/0.log/"), "ctr/0.log");
}
