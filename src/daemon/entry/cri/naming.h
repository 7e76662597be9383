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
 * Description: provide naming function definition
 *********************************************************************************/

#ifndef DAEMON_ENTRY_CRI_NAMING_H
#define DAEMON_ENTRY_CRI_NAMING_H

#include <string>

#include "crishim.pb.h"

namespace CRINaming {
// k8s_<container>_<pod>_<namespace>_<uid>_<attempt>
std::string MakeContainerName(const crishim::v1::PodSandboxConfig &s, const crishim::v1::ContainerConfig &c);
} // namespace CRINaming

#endif // DAEMON_ENTRY_CRI_NAMING_H
