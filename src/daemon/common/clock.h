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
 * Description: provide clock definition
 *********************************************************************************/
#ifndef DAEMON_COMMON_CLOCK_H
#define DAEMON_COMMON_CLOCK_H

#include <cstdint>

namespace CRIShim {

class Clock {
public:
    virtual ~Clock() = default;
    // nanoseconds since the epoch
    virtual auto NowNanos() const -> int64_t = 0;
};

class SystemClock : public Clock {
public:
    SystemClock() = default;
    virtual ~SystemClock() = default;

    auto NowNanos() const -> int64_t override;
};

} // namespace CRIShim

#endif // DAEMON_COMMON_CLOCK_H
