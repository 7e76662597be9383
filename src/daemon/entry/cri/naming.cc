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
 * Description: provide naming functions
 *********************************************************************************/
#include "naming.h"

#include "cri_constants.h"

namespace CRINaming {
std::string MakeContainerName(const crishim::v1::PodSandboxConfig &s, const crishim::v1::ContainerConfig &c)
{
    std::string sname;

    sname.append(CRIShim::Constants::kubePrefix);
    sname.append(CRIShim::Constants::nameDelimiter);
    sname.append(c.metadata().name());
    sname.append(CRIShim::Constants::nameDelimiter);
    sname.append(s.metadata().name());
    sname.append(CRIShim::Constants::nameDelimiter);
    sname.append(s.metadata().namespace_());
    sname.append(CRIShim::Constants::nameDelimiter);
    sname.append(s.metadata().uid());
    sname.append(CRIShim::Constants::nameDelimiter);
    sname.append(std::to_string(c.metadata().attempt()));

    return sname;
}
} // namespace CRINaming
