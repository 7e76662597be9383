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
 * Description: provide err function definition
 *********************************************************************************/
#ifndef UTILS_CPPUTILS_ERRORS_H
#define UTILS_CPPUTILS_ERRORS_H

#include <cstdarg>
#include <string>

class Errors {
public:
    Errors();
    Errors(const Errors &copy)
        : m_message(copy.m_message), m_code(copy.m_code)
    {
    }
    Errors &operator=(const Errors &);
    virtual ~Errors();

    void Clear();
    std::string &GetMessage();
    const char *GetCMessage() const;
    int GetCode() const;
    void SetCode(int code);
    bool Empty() const;
    bool NotEmpty() const;

    void SetError(const std::string &msg);
    void SetError(const char *msg);
    void SetError(int code, const std::string &msg);
    void Errorf(const char *fmt, ...) __attribute__((format(printf, 2, 3)));
    void Errorf(int code, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

private:
    void VErrorf(const char *fmt, va_list argp);

    std::string m_message;
    int m_code{0};
};

#endif // UTILS_CPPUTILS_ERRORS_H
