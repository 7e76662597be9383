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
#ifndef DAEMON_ENTRY_CRI_CRI_HELPERS_H
#define DAEMON_ENTRY_CRI_CRI_HELPERS_H
#include <cstdint>
#include <string>
#include <vector>

#include "crishim.pb.h"
#include "engine_api.h"
#include "errors.h"

namespace CRIHelpers {
auto ContainerStateToRuntime(const std::string &engineState) -> crishim::v1::ContainerState;

auto ToPullableImageID(const std::string &imageID, const std::string &repoDigest) -> std::string;

auto ToInt32Timeout(int64_t timeout) -> int32_t;

// 0 and negative engine times mean the event has not happened.
auto NanosToSeconds(int64_t nanos) -> int64_t;

// Converts the engine times to seconds, raising a later stage that precedes
// an earlier one so that created <= started <= finished holds once set.
void GetContainerTimeStamps(const CRIShim::EngineRecord &record, int64_t *createdAt, int64_t *startedAt,
                            int64_t *finishedAt);

auto GenerateEnvList(const ::google::protobuf::RepeatedPtrField<::crishim::v1::KeyValue> &envs)
-> std::vector<std::string>;

auto GenerateEngineMounts(const google::protobuf::RepeatedPtrField<crishim::v1::Mount> &mounts)
-> std::vector<CRIShim::EngineMount>;

void ConvertMountsToStatus(const std::vector<CRIShim::EngineMount> &mounts,
                           google::protobuf::RepeatedPtrField<crishim::v1::Mount> *statusMounts);

auto IsContainerNotFoundError(const Errors &err) -> bool;
}; // namespace CRIHelpers

#endif // DAEMON_ENTRY_CRI_CRI_HELPERS_H
