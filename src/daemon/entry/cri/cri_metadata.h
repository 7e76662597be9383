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
 * Description: provide encoding of cri metadata into engine labels
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CRI_METADATA_H
#define DAEMON_ENTRY_CRI_CRI_METADATA_H

#include <cstdint>
#include <map>
#include <string>

#include <google/protobuf/map.h>

#include "errors.h"

/*
 * The engine has no notion of pod sandbox, so the cri identity of a record
 * travels in its label map under the reserved "io.crishim." namespace.
 * Caller labels are stored verbatim beside it, caller annotations under
 * "io.crishim.annotation.".
 */
namespace CRIMetadata {
struct ContainerIdentity {
    // CONTAINER_TYPE_LABEL_CONTAINER or CONTAINER_TYPE_LABEL_SANDBOX
    std::string kind;
    std::string name;
    uint32_t attempt { 0 };
    std::string sandboxID;
    std::string logPath;
};

auto operator==(const ContainerIdentity &a, const ContainerIdentity &b) -> bool;

auto IsReservedKey(const std::string &key) -> bool;

auto Encode(const ContainerIdentity &identity) -> std::map<std::string, std::string>;

void EncodeAnnotations(const google::protobuf::Map<std::string, std::string> &annotations,
                       std::map<std::string, std::string> &labels);

void Decode(const std::map<std::string, std::string> &labels, ContainerIdentity &identity, Errors &error);

auto Strip(const std::map<std::string, std::string> &labels) -> std::map<std::string, std::string>;

void ExtractLabels(const std::map<std::string, std::string> &input,
                   google::protobuf::Map<std::string, std::string> &labels);

void ExtractAnnotations(const std::map<std::string, std::string> &input,
                        google::protobuf::Map<std::string, std::string> &annotations);

// Rejects empty keys, keys in the reserved namespace and maps longer than limit.
void ValidateUserKeys(const google::protobuf::Map<std::string, std::string> &input, const std::string &what,
                      size_t limit, Errors &error);
} // namespace CRIMetadata

#endif // DAEMON_ENTRY_CRI_CRI_METADATA_H
