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

#ifndef UTILS_CPPUTILS_CXXUTILS_H
#define UTILS_CPPUTILS_CXXUTILS_H

#include <cstdint>
#include <string>
#include <vector>

namespace CXXUtils {
std::vector<std::string> Split(const std::string &str, char delimiter);

std::string StringsJoin(const std::vector<std::string> &vec, const std::string &sep);

bool HasPrefix(const std::string &str, const std::string &prefix);

// Parses a plain decimal unsigned 32 bit number; signs, blanks and
// out of range values are rejected.
bool SafeUint32(const std::string &str, uint32_t &out);

// Lexically cleans a slash separated path, like filepath.Clean.
std::string CleanPath(const std::string &path);
}; // namespace CXXUtils

#endif // UTILS_CPPUTILS_CXXUTILS_H
