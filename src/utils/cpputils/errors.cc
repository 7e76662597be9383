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
 * Description: provide err functions
 ********************************************************************************/

#include <cstdarg>
#include <cstdio>

#include "errors.h"

Errors::Errors()
{
    m_message.clear();
    m_code = 0;
}

Errors &Errors::operator=(const Errors &other)
{
    if (&other == this) {
        return *this;
    }

    m_message = other.m_message;
    m_code = other.m_code;
    return *this;
}

Errors::~Errors()
{
    Clear();
}

void Errors::Clear()
{
    m_message.clear();
    m_code = 0;
}

std::string &Errors::GetMessage()
{
    return m_message;
}

const char *Errors::GetCMessage() const
{
    return m_message.empty() ? "" : m_message.c_str();
}

int Errors::GetCode() const
{
    return m_code;
}

void Errors::SetCode(int code)
{
    m_code = code;
}

bool Errors::Empty() const
{
    return (m_message.empty() && (m_code == 0));
}

bool Errors::NotEmpty() const
{
    return !Empty();
}

void Errors::SetError(const char *msg)
{
    m_message = msg ? msg : "";
}

void Errors::SetError(const std::string &msg)
{
    m_message = msg;
}

void Errors::SetError(int code, const std::string &msg)
{
    m_code = code;
    m_message = msg;
}

void Errors::VErrorf(const char *fmt, va_list argp)
{
    int ret { 0 };
    char errbuf[BUFSIZ + 1] { 0 };

    ret = vsnprintf(errbuf, BUFSIZ, fmt, argp);
    if (ret < 0 || ret >= BUFSIZ) {
        m_message = "Error message is too long";
        return;
    }

    m_message = errbuf;
}

// The code of a previous error is kept, so callers may re-wrap a message
// without losing the kind of failure.
void Errors::Errorf(const char *fmt, ...)
{
    va_list argp;

    va_start(argp, fmt);
    VErrorf(fmt, argp);
    va_end(argp);
}

void Errors::Errorf(int code, const char *fmt, ...)
{
    va_list argp;

    m_code = code;
    va_start(argp, fmt);
    VErrorf(fmt, argp);
    va_end(argp);
}
