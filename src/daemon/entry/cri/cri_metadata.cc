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
#include "cri_metadata.h"

#include "cri_constants.h"
#include "cri_errors.h"
#include "cxxutils.h"
#include "isula_libutils/log.h"

namespace CRIMetadata {
using CRIShim::Constants;

auto operator==(const ContainerIdentity &a, const ContainerIdentity &b) -> bool
{
    return a.kind == b.kind && a.name == b.name && a.attempt == b.attempt && a.sandboxID == b.sandboxID &&
           a.logPath == b.logPath;
}

auto IsReservedKey(const std::string &key) -> bool
{
    return CXXUtils::HasPrefix(key, Constants::RESERVED_LABEL_PREFIX);
}

auto Encode(const ContainerIdentity &identity) -> std::map<std::string, std::string>
{
    std::map<std::string, std::string> labels;

    labels[Constants::CONTAINER_TYPE_LABEL_KEY] = identity.kind;
    labels[Constants::CONTAINER_NAME_LABEL_KEY] = identity.name;
    labels[Constants::CONTAINER_ATTEMPT_LABEL_KEY] = std::to_string(identity.attempt);
    if (!identity.sandboxID.empty()) {
        labels[Constants::SANDBOX_ID_LABEL_KEY] = identity.sandboxID;
    }
    if (!identity.logPath.empty()) {
        labels[Constants::CONTAINER_LOGPATH_LABEL_KEY] = identity.logPath;
    }

    return labels;
}

void EncodeAnnotations(const google::protobuf::Map<std::string, std::string> &annotations,
                       std::map<std::string, std::string> &labels)
{
    for (const auto &iter : annotations) {
        labels[Constants::ANNOTATION_LABEL_PREFIX + iter.first] = iter.second;
    }
}

static auto LookupLabel(const std::map<std::string, std::string> &labels, const std::string &key,
                        std::string &value) -> bool
{
    auto iter = labels.find(key);
    if (iter == labels.end()) {
        return false;
    }
    value = iter->second;
    return true;
}

void Decode(const std::map<std::string, std::string> &labels, ContainerIdentity &identity, Errors &error)
{
    std::string kind;
    std::string attempt;

    if (!LookupLabel(labels, Constants::CONTAINER_TYPE_LABEL_KEY, kind)) {
        error.Errorf(CRISHIM_ERR_MALFORMED_METADATA, "label %s is missing",
                     Constants::CONTAINER_TYPE_LABEL_KEY.c_str());
        return;
    }

    if (kind == Constants::CONTAINER_TYPE_LABEL_SANDBOX) {
        // sandbox records share the label space but carry no container identity
        identity.kind = kind;
        return;
    }

    if (kind != Constants::CONTAINER_TYPE_LABEL_CONTAINER) {
        error.Errorf(CRISHIM_ERR_MALFORMED_METADATA, "unknown record type %s", kind.c_str());
        return;
    }

    if (!LookupLabel(labels, Constants::CONTAINER_NAME_LABEL_KEY, identity.name) || identity.name.empty()) {
        error.Errorf(CRISHIM_ERR_MALFORMED_METADATA, "label %s is missing",
                     Constants::CONTAINER_NAME_LABEL_KEY.c_str());
        return;
    }

    if (!LookupLabel(labels, Constants::CONTAINER_ATTEMPT_LABEL_KEY, attempt)) {
        error.Errorf(CRISHIM_ERR_MALFORMED_METADATA, "label %s is missing",
                     Constants::CONTAINER_ATTEMPT_LABEL_KEY.c_str());
        return;
    }

    if (!CXXUtils::SafeUint32(attempt, identity.attempt)) {
        error.Errorf(CRISHIM_ERR_MALFORMED_METADATA, "invalid container attempt: %s", attempt.c_str());
        return;
    }

    if (!LookupLabel(labels, Constants::SANDBOX_ID_LABEL_KEY, identity.sandboxID) || identity.sandboxID.empty()) {
        error.Errorf(CRISHIM_ERR_MALFORMED_METADATA, "container %s has no sandbox id", identity.name.c_str());
        return;
    }

    (void)LookupLabel(labels, Constants::CONTAINER_LOGPATH_LABEL_KEY, identity.logPath);
    identity.kind = kind;
}

auto Strip(const std::map<std::string, std::string> &labels) -> std::map<std::string, std::string>
{
    std::map<std::string, std::string> result;

    for (const auto &iter : labels) {
        if (IsReservedKey(iter.first)) {
            continue;
        }
        result.insert(iter);
    }

    return result;
}

void ExtractLabels(const std::map<std::string, std::string> &input,
                   google::protobuf::Map<std::string, std::string> &labels)
{
    for (const auto &iter : Strip(input)) {
        labels[iter.first] = iter.second;
    }
}

void ExtractAnnotations(const std::map<std::string, std::string> &input,
                        google::protobuf::Map<std::string, std::string> &annotations)
{
    const std::string &prefix = Constants::ANNOTATION_LABEL_PREFIX;

    for (const auto &iter : input) {
        if (!CXXUtils::HasPrefix(iter.first, prefix)) {
            continue;
        }
        annotations[iter.first.substr(prefix.length())] = iter.second;
    }
}

void ValidateUserKeys(const google::protobuf::Map<std::string, std::string> &input, const std::string &what,
                      size_t limit, Errors &error)
{
    if (input.size() > limit) {
        error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "%s list is too long, the limit is %zu", what.c_str(), limit);
        return;
    }

    for (const auto &iter : input) {
        if (iter.first.empty()) {
            error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "%s key must not be empty", what.c_str());
            return;
        }
        if (IsReservedKey(iter.first)) {
            ERROR("%s key %s uses the reserved prefix %s", what.c_str(), iter.first.c_str(),
                  Constants::RESERVED_LABEL_PREFIX.c_str());
            error.Errorf(CRISHIM_ERR_INVALID_CONFIG, "%s key %s is reserved", what.c_str(), iter.first.c_str());
            return;
        }
    }
}
} // namespace CRIMetadata
