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
 * Description: provide cri container manager service implementation
 *********************************************************************************/
#include "cri_container_manager_service_impl.h"

#include <cerrno>
#include <cstring>
#include <new>
#include <unistd.h>

#include "cri_constants.h"
#include "cri_container_filter.h"
#include "cri_errors.h"
#include "cri_helpers.h"
#include "cxxutils.h"
#include "isula_libutils/log.h"
#include "naming.h"

namespace CRIShim {
void ContainerManagerServiceImpl::ValidateCreateRequest(const std::string &podSandboxID,
                                                        const crishim::v1::ContainerConfig &containerConfig,
                                                        Errors &error)
{
    if (podSandboxID.empty()) {
        error.SetError(CRISHIM_ERR_INVALID_CONFIG, "Invalid empty pod sandbox id");
        return;
    }

    if (!containerConfig.has_metadata() || containerConfig.metadata().name().empty()) {
        error.SetError(CRISHIM_ERR_INVALID_CONFIG, "Invalid empty container name");
        return;
    }

    if (containerConfig.image().image().empty()) {
        error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "Invalid empty image of container %s",
                     containerConfig.metadata().name().c_str());
        return;
    }

    CRIMetadata::ValidateUserKeys(containerConfig.labels(), "label", m_config.maxLabels, error);
    if (error.NotEmpty()) {
        return;
    }

    CRIMetadata::ValidateUserKeys(containerConfig.annotations(), "annotation", m_config.maxLabels, error);
}

auto ContainerManagerServiceImpl::GenerateCreateContainerLabels(const std::string &podSandboxID,
                                                                const crishim::v1::ContainerConfig &containerConfig,
                                                                const crishim::v1::PodSandboxConfig &podSandboxConfig)
-> std::map<std::string, std::string>
{
    std::map<std::string, std::string> labels;
    CRIMetadata::ContainerIdentity identity;

    for (const auto &iter : containerConfig.labels()) {
        labels[iter.first] = iter.second;
    }
    CRIMetadata::EncodeAnnotations(containerConfig.annotations(), labels);

    identity.kind = Constants::CONTAINER_TYPE_LABEL_CONTAINER;
    identity.name = containerConfig.metadata().name();
    identity.attempt = containerConfig.metadata().attempt();
    identity.sandboxID = podSandboxID;
    // Write the container log path relative to the sandbox log directory.
    if (!containerConfig.log_path().empty()) {
        std::string logPath = podSandboxConfig.log_directory().empty() ? containerConfig.log_path() :
                              podSandboxConfig.log_directory() + "/" + containerConfig.log_path();
        identity.logPath = CXXUtils::CleanPath(logPath);
    }

    for (const auto &iter : CRIMetadata::Encode(identity)) {
        labels[iter.first] = iter.second;
    }

    return labels;
}

auto ContainerManagerServiceImpl::GenerateCreateContainerParams(const std::string &podSandboxID,
                                                                const crishim::v1::ContainerConfig &containerConfig,
                                                                const crishim::v1::PodSandboxConfig &podSandboxConfig)
-> EngineCreateParams
{
    EngineCreateParams params;

    params.name = CRINaming::MakeContainerName(podSandboxConfig, containerConfig);
    params.image = containerConfig.image().image();
    params.labels = GenerateCreateContainerLabels(podSandboxID, containerConfig, podSandboxConfig);
    params.entrypoint.assign(containerConfig.command().begin(), containerConfig.command().end());
    params.cmd.assign(containerConfig.args().begin(), containerConfig.args().end());
    params.env = CRIHelpers::GenerateEnvList(containerConfig.envs());
    params.workingDir = containerConfig.working_dir();
    params.mounts = CRIHelpers::GenerateEngineMounts(containerConfig.mounts());

    return params;
}

auto ContainerManagerServiceImpl::CreateContainer(const std::string &podSandboxID,
                                                  const crishim::v1::ContainerConfig &containerConfig,
                                                  const crishim::v1::PodSandboxConfig &podSandboxConfig,
                                                  Errors &error) -> std::string
{
    std::string responseID;
    Errors engineErr;

    ValidateCreateRequest(podSandboxID, containerConfig, error);
    if (error.NotEmpty()) {
        ERROR("Invalid create container request: %s", error.GetCMessage());
        return responseID;
    }

    EngineCreateParams params = GenerateCreateContainerParams(podSandboxID, containerConfig, podSandboxConfig);

    responseID = m_engine->Create(params, engineErr);
    if (engineErr.NotEmpty()) {
        ERROR("Failed to create container %s: %s", params.name.c_str(), engineErr.GetCMessage());
        error.Errorf(CRISHIM_ERR_CREATE_FAILED, "Failed to create container %s: %s", params.name.c_str(),
                     engineErr.GetCMessage());
        return "";
    }
    if (responseID.empty()) {
        ERROR("Engine returned an empty id for container %s", params.name.c_str());
        error.Errorf(CRISHIM_ERR_CREATE_FAILED, "Failed to create container %s: empty container id",
                     params.name.c_str());
        return "";
    }

    INFO("Created container %s with id %s in sandbox %s", params.name.c_str(), responseID.c_str(),
         podSandboxID.c_str());
    return responseID;
}

auto ContainerManagerServiceImpl::GetRealContainer(const std::string &containerID, int failCode, Errors &error)
-> std::unique_ptr<EngineRecord>
{
    Errors engineErr;

    if (containerID.empty()) {
        error.SetError(CRISHIM_ERR_NOT_FOUND, "Invalid empty container id.");
        return nullptr;
    }

    auto record = m_engine->Inspect(containerID, engineErr);
    if (engineErr.NotEmpty() || record == nullptr) {
        int code = (CRIHelpers::IsContainerNotFoundError(engineErr) || engineErr.Empty()) ? CRISHIM_ERR_NOT_FOUND :
                   failCode;
        error.Errorf(code, "Failed to find container id %s: %s", containerID.c_str(),
                     engineErr.Empty() ? ErrnoToErrorMessage(CRISHIM_ERR_NOT_FOUND) : engineErr.GetCMessage());
        return nullptr;
    }

    auto kind = record->labels.find(Constants::CONTAINER_TYPE_LABEL_KEY);
    if (kind == record->labels.end() || kind->second != Constants::CONTAINER_TYPE_LABEL_CONTAINER) {
        error.Errorf(CRISHIM_ERR_NOT_FOUND, "Failed to find container id %s: not a container", containerID.c_str());
        return nullptr;
    }

    return record;
}

void ContainerManagerServiceImpl::CreateContainerLogSymlink(const EngineRecord &record, Errors &error)
{
    auto label = record.labels.find(Constants::CONTAINER_LOGPATH_LABEL_KEY);

    if (label == record.labels.end() || label->second.empty()) {
        INFO("Container %s log path isn't specified, will not create the symlink", record.id.c_str());
        return;
    }
    const std::string &path = label->second;

    if (record.logPath.empty()) {
        WARN("Cannot create symbolic link because container %s log file doesn't exist!", record.id.c_str());
        return;
    }

    if (unlink(path.c_str()) == 0) {
        WARN("Deleted previously existing symlink file: %s", path.c_str());
    }
    if (symlink(record.logPath.c_str(), path.c_str()) != 0) {
        SYSERROR("Failed to create symbolic link %s", path.c_str());
        error.Errorf(CRISHIM_ERR_START_FAILED,
                     "failed to create symbolic link %s to the container log file %s for container %s: %s",
                     path.c_str(), record.logPath.c_str(), record.id.c_str(), strerror(errno));
    }
}

void ContainerManagerServiceImpl::RemoveContainerLogSymlink(const EngineRecord &record, Errors &error)
{
    auto label = record.labels.find(Constants::CONTAINER_LOGPATH_LABEL_KEY);

    // Only remove the symlink when container log path is specified.
    if (label == record.labels.end() || label->second.empty()) {
        return;
    }

    if (unlink(label->second.c_str()) != 0 && errno != ENOENT) {
        SYSERROR("Failed to remove symlink %s", label->second.c_str());
        error.Errorf(CRISHIM_ERR_REMOVE_FAILED, "Failed to remove container %s log symlink %s: %s",
                     record.id.c_str(), label->second.c_str(), strerror(errno));
    }
}

void ContainerManagerServiceImpl::StartContainer(const std::string &containerID, Errors &error)
{
    Errors engineErr;

    auto record = GetRealContainer(containerID, CRISHIM_ERR_START_FAILED, error);
    if (error.NotEmpty()) {
        ERROR("%s", error.GetCMessage());
        return;
    }

    m_engine->Start(record->id, engineErr);

    // Create container log symlink for all containers (including failed ones)
    // unless the engine no longer knows the container.
    if (!CRIHelpers::IsContainerNotFoundError(engineErr)) {
        CreateContainerLogSymlink(*record, error);
        if (error.NotEmpty()) {
            return;
        }
    }

    if (engineErr.NotEmpty()) {
        ERROR("Failed to start container %s: %s", record->id.c_str(), engineErr.GetCMessage());
        error.Errorf(CRIHelpers::IsContainerNotFoundError(engineErr) ? CRISHIM_ERR_NOT_FOUND :
                     CRISHIM_ERR_START_FAILED,
                     "Failed to start container %s: %s", record->id.c_str(), engineErr.GetCMessage());
        return;
    }

    INFO("Started container %s", record->id.c_str());
}

void ContainerManagerServiceImpl::StopContainer(const std::string &containerID, int64_t timeout, Errors &error)
{
    Errors engineErr;

    auto record = GetRealContainer(containerID, CRISHIM_ERR_STOP_FAILED, error);
    if (error.NotEmpty()) {
        ERROR("%s", error.GetCMessage());
        return;
    }

    if (timeout < 0) {
        timeout = 0;
    }
    if (timeout > m_config.maxStopTimeout) {
        WARN("Stop timeout %lld of container %s is cut down to %lld", static_cast<long long>(timeout),
             record->id.c_str(), static_cast<long long>(m_config.maxStopTimeout));
        timeout = m_config.maxStopTimeout;
    }

    int32_t grace = CRIHelpers::ToInt32Timeout(timeout);
    int64_t begin = m_clock->NowNanos();
    m_engine->Stop(record->id, grace, engineErr);
    int64_t elapsed = m_clock->NowNanos() - begin;
    if (engineErr.NotEmpty()) {
        ERROR("Failed to stop container %s: %s", record->id.c_str(), engineErr.GetCMessage());
        error.Errorf(CRIHelpers::IsContainerNotFoundError(engineErr) ? CRISHIM_ERR_NOT_FOUND :
                     CRISHIM_ERR_STOP_FAILED,
                     "Failed to stop container %s: %s", record->id.c_str(), engineErr.GetCMessage());
        return;
    }

    if (elapsed / Constants::SECOND_TO_NANOS > grace) {
        WARN("Container %s took %lld ms to stop, longer than the grace period of %d s", record->id.c_str(),
             static_cast<long long>(elapsed / 1000000), grace);
    }
    INFO("Stopped container %s", record->id.c_str());
}

void ContainerManagerServiceImpl::RemoveContainer(const std::string &containerID, Errors &error)
{
    Errors engineErr;

    auto record = GetRealContainer(containerID, CRISHIM_ERR_REMOVE_FAILED, error);
    if (error.NotEmpty()) {
        ERROR("%s", error.GetCMessage());
        return;
    }

    RemoveContainerLogSymlink(*record, error);
    if (error.NotEmpty()) {
        return;
    }

    m_engine->Remove(record->id, engineErr);
    if (engineErr.NotEmpty()) {
        ERROR("Failed to remove container %s: %s", record->id.c_str(), engineErr.GetCMessage());
        error.Errorf(CRIHelpers::IsContainerNotFoundError(engineErr) ? CRISHIM_ERR_NOT_FOUND :
                     CRISHIM_ERR_REMOVE_FAILED,
                     "Failed to remove container %s: %s", record->id.c_str(), engineErr.GetCMessage());
        return;
    }

    INFO("Removed container %s", record->id.c_str());
}

void ContainerManagerServiceImpl::UpdateBaseStatusFromRecord(const EngineRecord &record,
                                                             std::unique_ptr<crishim::v1::ContainerStatus> &contStatus)
{
    int64_t createdAt { 0 };
    int64_t startedAt { 0 };
    int64_t finishedAt { 0 };
    std::string reason;
    crishim::v1::ContainerState state = CRIHelpers::ContainerStateToRuntime(record.state);

    CRIHelpers::GetContainerTimeStamps(record, &createdAt, &startedAt, &finishedAt);

    if (state == crishim::v1::CONTAINER_EXITED) {
        if (record.oomKilled) {
            reason = Constants::REASON_OOM_KILLED;
        } else if (startedAt == 0 && record.exitCode != 0) {
            // The process never ran, report it as exited at creation time.
            reason = Constants::REASON_CANNOT_RUN;
            startedAt = createdAt;
            finishedAt = createdAt;
        } else if (record.exitCode == 0) {
            reason = Constants::REASON_COMPLETED;
        } else {
            reason = Constants::REASON_ERROR;
        }
        contStatus->set_exit_code(record.exitCode);
        contStatus->set_reason(reason);
        contStatus->set_message(record.error);
    }

    contStatus->set_state(state);
    contStatus->set_created_at(createdAt);
    contStatus->set_started_at(startedAt);
    contStatus->set_finished_at(finishedAt);
}

void ContainerManagerServiceImpl::ContainerRecordToStatus(const EngineRecord &record,
                                                          const CRIMetadata::ContainerIdentity &identity,
                                                          std::unique_ptr<crishim::v1::ContainerStatus> &contStatus)
{
    contStatus->set_id(record.id);
    contStatus->mutable_metadata()->set_name(identity.name);
    contStatus->mutable_metadata()->set_attempt(identity.attempt);

    UpdateBaseStatusFromRecord(record, contStatus);

    contStatus->mutable_image()->set_image(record.image);
    contStatus->set_image_ref(CRIHelpers::ToPullableImageID(record.imageID, record.repoDigest));

    CRIMetadata::ExtractLabels(record.labels, *contStatus->mutable_labels());
    CRIMetadata::ExtractAnnotations(record.labels, *contStatus->mutable_annotations());
    CRIHelpers::ConvertMountsToStatus(record.mounts, contStatus->mutable_mounts());
    contStatus->set_log_path(identity.logPath);
}

auto ContainerManagerServiceImpl::ContainerStatus(const std::string &containerID, Errors &error)
-> std::unique_ptr<crishim::v1::ContainerStatus>
{
    CRIMetadata::ContainerIdentity identity;

    auto record = GetRealContainer(containerID, CRISHIM_ERR_ENGINE, error);
    if (error.NotEmpty()) {
        ERROR("%s", error.GetCMessage());
        return nullptr;
    }

    CRIMetadata::Decode(record->labels, identity, error);
    if (error.NotEmpty()) {
        ERROR("Failed to decode metadata of container %s: %s", record->id.c_str(), error.GetCMessage());
        error.Errorf("Failed to decode metadata of container %s: %s", record->id.c_str(), error.GetCMessage());
        return nullptr;
    }

    std::unique_ptr<crishim::v1::ContainerStatus> contStatus(new (std::nothrow) crishim::v1::ContainerStatus);
    if (contStatus == nullptr) {
        ERROR("Out of memory");
        error.SetError(CRISHIM_ERR_UNKNOWN, "Out of memory");
        return nullptr;
    }

    ContainerRecordToStatus(*record, identity, contStatus);
    return contStatus;
}

auto ContainerManagerServiceImpl::ContainerRecordToSummary(const EngineRecord &record,
                                                           const CRIMetadata::ContainerIdentity &identity)
-> std::unique_ptr<crishim::v1::Container>
{
    int64_t createdAt { 0 };

    std::unique_ptr<crishim::v1::Container> container(new (std::nothrow) crishim::v1::Container);
    if (container == nullptr) {
        return nullptr;
    }

    CRIHelpers::GetContainerTimeStamps(record, &createdAt, nullptr, nullptr);

    container->set_id(record.id);
    container->set_pod_sandbox_id(identity.sandboxID);
    container->mutable_metadata()->set_name(identity.name);
    container->mutable_metadata()->set_attempt(identity.attempt);
    container->mutable_image()->set_image(record.image);
    container->set_image_ref(CRIHelpers::ToPullableImageID(record.imageID, record.repoDigest));
    container->set_state(CRIHelpers::ContainerStateToRuntime(record.state));
    container->set_created_at(createdAt);
    CRIMetadata::ExtractLabels(record.labels, *container->mutable_labels());
    CRIMetadata::ExtractAnnotations(record.labels, *container->mutable_annotations());

    return container;
}

void ContainerManagerServiceImpl::ListContainers(const crishim::v1::ContainerFilter *filter,
                                                 std::vector<std::unique_ptr<crishim::v1::Container>> *containers,
                                                 Errors &error)
{
    std::vector<EngineRecord> records;
    std::vector<ContainerFilters::ListEntry> entries;
    Errors engineErr;

    if (containers == nullptr) {
        error.SetError(CRISHIM_ERR_UNKNOWN, "Invalid arguments");
        return;
    }

    m_engine->List(ContainerFilters::MakeEngineLabelFilter(filter), records, engineErr);
    if (engineErr.NotEmpty()) {
        ERROR("Failed to list containers: %s", engineErr.GetCMessage());
        error.Errorf(CRISHIM_ERR_LIST_FAILED, "Failed to list containers: %s", engineErr.GetCMessage());
        return;
    }

    // Newer records come last from the engine.
    for (auto iter = records.rbegin(); iter != records.rend(); ++iter) {
        CRIMetadata::ContainerIdentity identity;
        Errors decodeErr;

        CRIMetadata::Decode(iter->labels, identity, decodeErr);
        if (decodeErr.NotEmpty()) {
            WARN("Skip container %s: %s", iter->id.c_str(), decodeErr.GetCMessage());
            continue;
        }
        if (identity.kind != Constants::CONTAINER_TYPE_LABEL_CONTAINER) {
            DEBUG("Skip non-container record %s", iter->id.c_str());
            continue;
        }

        auto container = ContainerRecordToSummary(*iter, identity);
        if (container == nullptr) {
            ERROR("Out of memory");
            error.SetError(CRISHIM_ERR_UNKNOWN, "Out of memory");
            return;
        }
        if (!ContainerFilters::Match(filter, *container)) {
            continue;
        }

        ContainerFilters::ListEntry entry;
        entry.container = std::move(container);
        entry.createdNanos = iter->createdAt;
        entries.push_back(std::move(entry));
    }

    ContainerFilters::SortByRecency(entries);
    for (auto &entry : entries) {
        containers->push_back(std::move(entry.container));
    }
}
} // namespace CRIShim
