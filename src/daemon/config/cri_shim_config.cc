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
 * Description: provide cri shim configuration functions
 *********************************************************************************/
#include "cri_shim_config.h"

#include <cstdint>
#include <set>

#include <isula_libutils/log.h>

#include "cri_errors.h"

namespace CRIShim {
namespace {
const std::set<std::string> g_logLevels { "FATAL", "ALERT", "CRIT", "ERROR", "WARN", "NOTICE", "INFO", "DEBUG",
                                          "TRACE" };
const std::set<std::string> g_logDrivers { "stdout", "file", "fifo", "syslog" };
}

void ValidateShimConfig(const ShimConfig &config, Errors &error)
{
    if (config.logName.empty()) {
        error.SetError(CRISHIM_ERR_INVALID_CONFIG, "log name must not be empty");
        return;
    }

    if (g_logLevels.count(config.logLevel) == 0) {
        error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "invalid log level: %s", config.logLevel.c_str());
        return;
    }

    if (g_logDrivers.count(config.logDriver) == 0) {
        error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "invalid log driver: %s", config.logDriver.c_str());
        return;
    }

    if ((config.logDriver == "file" || config.logDriver == "fifo") && config.logFile.empty()) {
        error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "log driver %s requires a log file", config.logDriver.c_str());
        return;
    }

    if (config.maxLabels == 0) {
        error.SetError(CRISHIM_ERR_INVALID_CONFIG, "maximum label count must be positive");
        return;
    }

    if (config.maxStopTimeout < 0 || config.maxStopTimeout > INT32_MAX) {
        error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "invalid maximum stop timeout: %lld",
                     static_cast<long long>(config.maxStopTimeout));
        return;
    }
}

void ShimLogInit(const ShimConfig &config, Errors &error)
{
    struct isula_libutils_log_config lconf = { 0 };

    ValidateShimConfig(config, error);
    if (error.NotEmpty()) {
        return;
    }

    lconf.name = config.logName.c_str();
    lconf.file = config.logFile.empty() ? nullptr : config.logFile.c_str();
    lconf.priority = config.logLevel.c_str();
    lconf.driver = config.logDriver.c_str();
    if (isula_libutils_log_enable(&lconf) != 0) {
        error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "failed to init log with driver %s", config.logDriver.c_str());
        return;
    }
}

} // namespace CRIShim
