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
 * Description: provide c++ common utils functions
 *******************************************************************************/

#include "cxxutils.h"

#include <limits>
#include <numeric>
#include <sstream>

namespace CXXUtils {
std::vector<std::string> Split(const std::string &str, char delimiter)
{
    std::vector<std::string> ret_vec;
    std::string tmpstr;
    std::istringstream istream(str);
    while (std::getline(istream, tmpstr, delimiter)) {
        ret_vec.push_back(tmpstr);
    }
    return ret_vec;
}

// Join concatenates the elements of a to create a single string. The separator string
// sep is placed between elements in the resulting string.
std::string StringsJoin(const std::vector<std::string> &vec, const std::string &sep)
{
    auto func = [&sep](const std::string & a, const std::string & b) -> std::string {
        return a + (a.length() > 0 ? sep : "") + b;
    };
    return std::accumulate(vec.begin(), vec.end(), std::string(), func);
}

bool HasPrefix(const std::string &str, const std::string &prefix)
{
    return str.compare(0, prefix.size(), prefix) == 0;
}

bool SafeUint32(const std::string &str, uint32_t &out)
{
    uint64_t value { 0 };

    if (str.empty()) {
        return false;
    }

    for (const char c : str) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
    }

    out = static_cast<uint32_t>(value);
    return true;
}

std::string CleanPath(const std::string &path)
{
    if (path.empty()) {
        return ".";
    }

    const bool rooted = path[0] == '/';
    std::vector<std::string> parts;
    for (const auto &item : Split(path, '/')) {
        if (item.empty() || item == ".") {
            continue;
        }
        if (item == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(item);
            }
            continue;
        }
        parts.push_back(item);
    }

    std::string cleaned = StringsJoin(parts, "/");

    if (rooted) {
        return "/" + cleaned;
    }
    return cleaned.empty() ? "." : cleaned;
}

} // namespace CXXUtils
