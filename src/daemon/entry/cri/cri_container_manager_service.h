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
 * Description: provide cri container manager service interface definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CONTAINER_MANAGER_H
#define DAEMON_ENTRY_CRI_CONTAINER_MANAGER_H
#include <memory>
#include <string>
#include <vector>

#include "crishim.pb.h"
#include "errors.h"

namespace CRIShim {
class ContainerManagerService {
public:
    ContainerManagerService() = default;
    virtual ~ContainerManagerService() = default;

    virtual auto CreateContainer(const std::string &podSandboxID,
                                 const crishim::v1::ContainerConfig &containerConfig,
                                 const crishim::v1::PodSandboxConfig &podSandboxConfig,
                                 Errors &error) -> std::string = 0;

    virtual void StartContainer(const std::string &containerID, Errors &error) = 0;

    virtual void StopContainer(const std::string &containerID, int64_t timeout, Errors &error) = 0;

    virtual void RemoveContainer(const std::string &containerID, Errors &error) = 0;

    virtual void ListContainers(const crishim::v1::ContainerFilter *filter,
                                std::vector<std::unique_ptr<crishim::v1::Container>> *containers,
                                Errors &error) = 0;

    virtual auto ContainerStatus(const std::string &containerID,
                                 Errors &error) -> std::unique_ptr<crishim::v1::ContainerStatus> = 0;
};
} // namespace CRIShim

#endif // DAEMON_ENTRY_CRI_CONTAINER_MANAGER_H
