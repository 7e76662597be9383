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
 * Description: provide cri shim configuration definition
 *********************************************************************************/
#ifndef DAEMON_CONFIG_CRI_SHIM_CONFIG_H
#define DAEMON_CONFIG_CRI_SHIM_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "cri_constants.h"
#include "errors.h"

namespace CRIShim {

#define CRISHIM_DEFAULT_LOG_NAME "crishim"
#define CRISHIM_DEFAULT_LOG_LEVEL "INFO"
#define CRISHIM_DEFAULT_LOG_DRIVER "stdout"

struct ShimConfig {
    std::string logName { CRISHIM_DEFAULT_LOG_NAME };
    // FATAL, ALERT, CRIT, ERROR, WARN, NOTICE, INFO, DEBUG, TRACE
    std::string logLevel { CRISHIM_DEFAULT_LOG_LEVEL };
    // stdout, file, fifo or syslog
    std::string logDriver { CRISHIM_DEFAULT_LOG_DRIVER };
    // required by the file and fifo drivers
    std::string logFile;
    // upper bound for labels and annotations of one container
    size_t maxLabels { Constants::DEFAULT_LIST_SIZE_MAX };
    // stop grace periods above this are cut down, in seconds
    int64_t maxStopTimeout { 3600 };
};

void ValidateShimConfig(const ShimConfig &config, Errors &error);

// Enables isula_libutils logging with the log settings of config.
void ShimLogInit(const ShimConfig &config, Errors &error);

} // namespace CRIShim

#endif // DAEMON_CONFIG_CRI_SHIM_CONFIG_H
