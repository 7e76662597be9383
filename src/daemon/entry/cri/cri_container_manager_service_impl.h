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
 * Description: provide cri container manager service implementation definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CONTAINER_MANAGER_IMPL_H
#define DAEMON_ENTRY_CRI_CONTAINER_MANAGER_IMPL_H
#include "cri_container_manager_service.h"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "clock.h"
#include "cri_metadata.h"
#include "cri_shim_config.h"
#include "crishim.pb.h"
#include "engine_api.h"
#include "errors.h"

namespace CRIShim {
class ContainerManagerServiceImpl : public ContainerManagerService {
public:
    ContainerManagerServiceImpl(std::shared_ptr<EngineAdapter> engine, std::shared_ptr<Clock> clock,
                                const ShimConfig &config)
        : m_engine(std::move(engine)), m_clock(std::move(clock)), m_config(config) {};
    virtual ~ContainerManagerServiceImpl() = default;

    auto CreateContainer(const std::string &podSandboxID,
                         const crishim::v1::ContainerConfig &containerConfig,
                         const crishim::v1::PodSandboxConfig &podSandboxConfig,
                         Errors &error) -> std::string override;

    void StartContainer(const std::string &containerID, Errors &error) override;

    void StopContainer(const std::string &containerID, int64_t timeout, Errors &error) override;

    void RemoveContainer(const std::string &containerID, Errors &error) override;

    void ListContainers(const crishim::v1::ContainerFilter *filter,
                        std::vector<std::unique_ptr<crishim::v1::Container>> *containers,
                        Errors &error) override;

    auto ContainerStatus(const std::string &containerID,
                         Errors &error) -> std::unique_ptr<crishim::v1::ContainerStatus> override;

private:
    void ValidateCreateRequest(const std::string &podSandboxID, const crishim::v1::ContainerConfig &containerConfig,
                               Errors &error);
    auto GenerateCreateContainerLabels(const std::string &podSandboxID,
                                       const crishim::v1::ContainerConfig &containerConfig,
                                       const crishim::v1::PodSandboxConfig &podSandboxConfig)
    -> std::map<std::string, std::string>;
    auto GenerateCreateContainerParams(const std::string &podSandboxID,
                                       const crishim::v1::ContainerConfig &containerConfig,
                                       const crishim::v1::PodSandboxConfig &podSandboxConfig) -> EngineCreateParams;
    auto GetRealContainer(const std::string &containerID, int failCode, Errors &error)
    -> std::unique_ptr<EngineRecord>;
    void CreateContainerLogSymlink(const EngineRecord &record, Errors &error);
    void RemoveContainerLogSymlink(const EngineRecord &record, Errors &error);
    void UpdateBaseStatusFromRecord(const EngineRecord &record,
                                    std::unique_ptr<crishim::v1::ContainerStatus> &contStatus);
    void ContainerRecordToStatus(const EngineRecord &record, const CRIMetadata::ContainerIdentity &identity,
                                 std::unique_ptr<crishim::v1::ContainerStatus> &contStatus);
    auto ContainerRecordToSummary(const EngineRecord &record, const CRIMetadata::ContainerIdentity &identity)
    -> std::unique_ptr<crishim::v1::Container>;

private:
    std::shared_ptr<EngineAdapter> m_engine;
    std::shared_ptr<Clock> m_clock;
    ShimConfig m_config;
};
} // namespace CRIShim

#endif // DAEMON_ENTRY_CRI_CONTAINER_MANAGER_IMPL_H
