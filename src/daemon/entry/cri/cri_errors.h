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
#ifndef DAEMON_ENTRY_CRI_CRI_ERRORS_H
#define DAEMON_ENTRY_CRI_CRI_ERRORS_H

#define DEF_SUCCESS_STR "Success"

#define CRISHIM_ERRNO_MAP(XX)                                                         \
    XX(SUCCESS, DEF_SUCCESS_STR)                                                      \
    \
    /* the id does not resolve to an extant container record */                     \
    XX(ERR_NOT_FOUND, "No such container")                                            \
    /* reserved labels of an engine record are missing or corrupt */                  \
    XX(ERR_MALFORMED_METADATA, "Malformed container metadata")                        \
    XX(ERR_INVALID_CONFIG, "Invalid container config")                                \
    \
    /* engine call failed */                                                          \
    XX(ERR_CREATE_FAILED, "Create container failed")                                  \
    XX(ERR_START_FAILED, "Start container failed")                                    \
    XX(ERR_STOP_FAILED, "Stop container failed")                                      \
    XX(ERR_REMOVE_FAILED, "Remove container failed")                                  \
    XX(ERR_LIST_FAILED, "List containers failed")                                     \
    XX(ERR_ENGINE, "Container engine error")                                          \
    \
    /* err max */                                                                     \
    XX(ERR_UNKNOWN, "Unknown error")

#define CRISHIM_ERRNO_GEN(n, s) CRISHIM_##n,
typedef enum { CRISHIM_ERRNO_MAP(CRISHIM_ERRNO_GEN) } crishim_errno_t;
#undef CRISHIM_ERRNO_GEN

namespace CRIShim {
auto ErrnoToErrorMessage(int err) -> const char *;
} // namespace CRIShim

#endif // DAEMON_ENTRY_CRI_CRI_ERRORS_H
