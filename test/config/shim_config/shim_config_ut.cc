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
 * Description: shim config unit test
 *********************************************************************************/

#include <cstdint>
#include <vector>

#include <gtest/gtest.h>
#include "cri_shim_config.h"
#include "cri_errors.h"

using CRIShim::ShimConfig;

TEST(shim_config, test_default_config)
{
    Errors err;
    ShimConfig config;

    CRIShim::ValidateShimConfig(config, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
    ASSERT_EQ(config.logName, "crishim");
    ASSERT_EQ(config.logLevel, "INFO");
    ASSERT_EQ(config.logDriver, "stdout");
    ASSERT_EQ(config.maxLabels, 1000U);
}

TEST(shim_config, test_invalid_config)
{
    std::vector<ShimConfig> configs(7);
    configs[0].logName.clear();
    configs[1].logLevel = "VERBOSE";
    configs[2].logDriver = "journald";
    configs[3].logDriver = "file";
    configs[4].maxLabels = 0;
    configs[5].maxStopTimeout = -1;
    configs[6].maxStopTimeout = INT64_MAX;

    for (size_t i = 0; i < configs.size(); i++) {
        Errors err;
        CRIShim::ValidateShimConfig(configs[i], err);
        ASSERT_EQ(err.GetCode(), CRISHIM_ERR_INVALID_CONFIG) << i;
    }
}

TEST(shim_config, test_max_stop_timeout_upper_bound)
{
    Errors err;
    ShimConfig config;

    config.maxStopTimeout = INT32_MAX;
    CRIShim::ValidateShimConfig(config, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();

    config.maxStopTimeout = static_cast<int64_t>(INT32_MAX) + 1;
    CRIShim::ValidateShimConfig(config, err);
    ASSERT_EQ(err.GetCode(), CRISHIM_ERR_INVALID_CONFIG);
}

TEST(shim_config, test_file_driver)
{
    Errors err;
    ShimConfig config;
    config.logDriver = "file";
    config.logFile = "/tmp/crishim_shim_config_ut.log";

    CRIShim::ValidateShimConfig(config, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();
}

TEST(shim_config, test_log_init)
{
    Errors err;
    ShimConfig config;
    config.logLevel = "DEBUG";

    CRIShim::ShimLogInit(config, err);
    ASSERT_TRUE(err.Empty()) << err.GetMessage();

    ShimConfig invalid;
    invalid.logLevel = "LOUD";
    CRIShim::ShimLogInit(invalid, err);
    ASSERT_EQ(err.GetCode(), CRISHIM_ERR_INVALID_CONFIG);
}
