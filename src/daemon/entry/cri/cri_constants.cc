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
#include "cri_constants.h"

namespace CRIShim {
const std::string Constants::nameDelimiter { "_" };
const std::string Constants::kubePrefix { "k8s" };

const std::string Constants::RESERVED_LABEL_PREFIX { "io.crishim." };
const std::string Constants::CONTAINER_TYPE_LABEL_KEY { "io.crishim.type" };
const std::string Constants::CONTAINER_TYPE_LABEL_SANDBOX { "podsandbox" };
const std::string Constants::CONTAINER_TYPE_LABEL_CONTAINER { "container" };
const std::string Constants::SANDBOX_ID_LABEL_KEY { "io.crishim.sandbox.id" };
const std::string Constants::CONTAINER_NAME_LABEL_KEY { "io.crishim.container.name" };
const std::string Constants::CONTAINER_ATTEMPT_LABEL_KEY { "io.crishim.container.attempt" };
const std::string Constants::CONTAINER_LOGPATH_LABEL_KEY { "io.crishim.container.logpath" };
const std::string Constants::ANNOTATION_LABEL_PREFIX { "io.crishim.annotation." };

const std::string Constants::ENGINE_STATE_CREATED { "created" };
const std::string Constants::ENGINE_STATE_RUNNING { "running" };
const std::string Constants::ENGINE_STATE_EXITED { "exited" };
const std::string Constants::ENGINE_STATE_DEAD { "dead" };

const std::string Constants::DOCKER_IMAGEID_PREFIX { "docker://" };
const std::string Constants::DOCKER_PULLABLE_IMAGEID_PREFIX { "docker-pullable://" };

const std::string Constants::REASON_COMPLETED { "Completed" };
const std::string Constants::REASON_ERROR { "Error" };
const std::string Constants::REASON_OOM_KILLED { "OOMKilled" };
const std::string Constants::REASON_CANNOT_RUN { "ContainerCannotRun" };
} // namespace CRIShim
