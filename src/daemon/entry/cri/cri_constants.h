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
 * Description: provide cri constants definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CRI_CONSTANTS_H
#define DAEMON_ENTRY_CRI_CRI_CONSTANTS_H
#include <cstddef>
#include <cstdint>
#include <string>

namespace CRIShim {
class Constants {
public:
    // engine container name values
    const static std::string nameDelimiter;
    const static std::string kubePrefix;

    // every label key under this prefix belongs to the shim
    const static std::string RESERVED_LABEL_PREFIX;
    const static std::string CONTAINER_TYPE_LABEL_KEY;
    const static std::string CONTAINER_TYPE_LABEL_SANDBOX;
    const static std::string CONTAINER_TYPE_LABEL_CONTAINER;
    const static std::string SANDBOX_ID_LABEL_KEY;
    const static std::string CONTAINER_NAME_LABEL_KEY;
    const static std::string CONTAINER_ATTEMPT_LABEL_KEY;
    const static std::string CONTAINER_LOGPATH_LABEL_KEY;
    const static std::string ANNOTATION_LABEL_PREFIX;

    // engine native states
    const static std::string ENGINE_STATE_CREATED;
    const static std::string ENGINE_STATE_RUNNING;
    const static std::string ENGINE_STATE_EXITED;
    const static std::string ENGINE_STATE_DEAD;

    // DOCKER_IMAGEID_PREFIX is the prefix of image id in container status.
    const static std::string DOCKER_IMAGEID_PREFIX;
    // DOCKER_PULLABLE_IMAGEID_PREFIX is the prefix of pullable image id in container status.
    const static std::string DOCKER_PULLABLE_IMAGEID_PREFIX;

    // container status reasons
    const static std::string REASON_COMPLETED;
    const static std::string REASON_ERROR;
    const static std::string REASON_OOM_KILLED;
    const static std::string REASON_CANNOT_RUN;

    constexpr static size_t DEFAULT_LIST_SIZE_MAX { 1000 };
    constexpr static int64_t SECOND_TO_NANOS { 1000000000LL };
};
} // namespace CRIShim

#endif // DAEMON_ENTRY_CRI_CRI_CONSTANTS_H
