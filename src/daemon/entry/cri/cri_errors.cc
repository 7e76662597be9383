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
 * Description: provide cri shim error codes
 *********************************************************************************/
#include "cri_errors.h"

namespace CRIShim {
auto ErrnoToErrorMessage(int err) -> const char *
{
    switch (err) {
#define CRISHIM_ERRNO_MSG(n, s) \
    case CRISHIM_##n:          \
        return s;
            CRISHIM_ERRNO_MAP(CRISHIM_ERRNO_MSG)
#undef CRISHIM_ERRNO_MSG
        default:
            return "Unknown error";
    }
}
} // namespace CRIShim
