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
 * Description: provide cri helpers functions
 *********************************************************************************/

#include "cri_helpers.h"

#include <algorithm>
#include <climits>

#include "cri_constants.h"
#include "cri_errors.h"

namespace CRIHelpers {
using CRIShim::Constants;

auto ContainerStateToRuntime(const std::string &engineState) -> crishim::v1::ContainerState
{
    if (engineState == Constants::ENGINE_STATE_CREATED) {
        return crishim::v1::CONTAINER_CREATED;
    }
    if (engineState == Constants::ENGINE_STATE_RUNNING) {
        return crishim::v1::CONTAINER_RUNNING;
    }
    if (engineState == Constants::ENGINE_STATE_EXITED || engineState == Constants::ENGINE_STATE_DEAD) {
        return crishim::v1::CONTAINER_EXITED;
    }
    return crishim::v1::CONTAINER_UNKNOWN;
}

auto ToPullableImageID(const std::string &imageID, const std::string &repoDigest) -> std::string
{
    // Default to the image ID, but if RepoDigests is not empty, use
    // the first digest instead.
    if (!repoDigest.empty()) {
        return Constants::DOCKER_PULLABLE_IMAGEID_PREFIX + repoDigest;
    }

    if (!imageID.empty()) {
        return Constants::DOCKER_IMAGEID_PREFIX + imageID;
    }

    return "";
}

auto ToInt32Timeout(int64_t timeout) -> int32_t
{
    if (timeout > INT32_MAX) {
        return INT32_MAX;
    } else if (timeout < INT32_MIN) {
        return INT32_MIN;
    }

    return (int32_t)timeout;
}

auto NanosToSeconds(int64_t nanos) -> int64_t
{
    if (nanos <= 0) {
        return 0;
    }
    return nanos / Constants::SECOND_TO_NANOS;
}

void GetContainerTimeStamps(const CRIShim::EngineRecord &record, int64_t *createdAt, int64_t *startedAt,
                            int64_t *finishedAt)
{
    int64_t created = NanosToSeconds(record.createdAt);
    int64_t started = NanosToSeconds(record.startedAt);
    int64_t finished = NanosToSeconds(record.finishedAt);

    if (started != 0 && started < created) {
        started = created;
    }
    if (finished != 0 && finished < started) {
        finished = started;
    }
    if (finished != 0 && finished < created) {
        finished = created;
    }

    if (createdAt != nullptr) {
        *createdAt = created;
    }
    if (startedAt != nullptr) {
        *startedAt = started;
    }
    if (finishedAt != nullptr) {
        *finishedAt = finished;
    }
}

auto GenerateEnvList(const ::google::protobuf::RepeatedPtrField<::crishim::v1::KeyValue> &envs)
-> std::vector<std::string>
{
    std::vector<std::string> vect;
    std::for_each(envs.begin(), envs.end(), [&vect](const ::crishim::v1::KeyValue & elem) {
        vect.push_back(elem.key() + "=" + elem.value());
    });
    return vect;
}

auto GenerateEngineMounts(const google::protobuf::RepeatedPtrField<crishim::v1::Mount> &mounts)
-> std::vector<CRIShim::EngineMount>
{
    std::vector<CRIShim::EngineMount> result;

    for (const auto &mount : mounts) {
        CRIShim::EngineMount engineMount;
        engineMount.source = mount.host_path();
        engineMount.destination = mount.container_path();
        engineMount.rw = !mount.readonly();
        switch (mount.propagation()) {
            case crishim::v1::PROPAGATION_HOST_TO_CONTAINER:
                engineMount.propagation = "rslave";
                break;
            case crishim::v1::PROPAGATION_BIDIRECTIONAL:
                engineMount.propagation = "rshared";
                break;
            default:
                engineMount.propagation = "rprivate";
                break;
        }
        result.push_back(engineMount);
    }

    return result;
}

void ConvertMountsToStatus(const std::vector<CRIShim::EngineMount> &mounts,
                           google::protobuf::RepeatedPtrField<crishim::v1::Mount> *statusMounts)
{
    for (const auto &engineMount : mounts) {
        crishim::v1::Mount *mount = statusMounts->Add();
        mount->set_host_path(engineMount.source);
        mount->set_container_path(engineMount.destination);
        mount->set_readonly(!engineMount.rw);
        if (engineMount.propagation.empty() || engineMount.propagation == "rprivate") {
            mount->set_propagation(crishim::v1::PROPAGATION_PRIVATE);
        } else if (engineMount.propagation == "rslave") {
            mount->set_propagation(crishim::v1::PROPAGATION_HOST_TO_CONTAINER);
        } else if (engineMount.propagation == "rshared") {
            mount->set_propagation(crishim::v1::PROPAGATION_BIDIRECTIONAL);
        }
    }
}

auto IsContainerNotFoundError(const Errors &err) -> bool
{
    return err.GetCode() == CRISHIM_ERR_NOT_FOUND;
}
} // namespace CRIHelpers
