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
 * Description: provide container engine adapter definition
 *********************************************************************************/
#ifndef DAEMON_MODULES_API_ENGINE_API_H
#define DAEMON_MODULES_API_ENGINE_API_H

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "errors.h"

namespace CRIShim {

struct EngineMount {
    std::string source;
    std::string destination;
    bool rw { true };
    // rprivate, rslave or rshared, empty means rprivate
    std::string propagation;
};

struct EngineCreateParams {
    std::string name;
    std::string image;
    std::map<std::string, std::string> labels;
    std::vector<std::string> entrypoint;
    std::vector<std::string> cmd;
    std::vector<std::string> env;
    std::string workingDir;
    std::vector<EngineMount> mounts;
};

// Engine side view of a container, as persisted by the engine.
// Timestamps are nanoseconds since the epoch, 0 when the event did not happen.
struct EngineRecord {
    std::string id;
    std::string name;
    std::string image;
    std::string imageID;
    std::string repoDigest;
    // engine vocabulary: created, running, paused, restarting, exited, dead
    std::string state;
    std::map<std::string, std::string> labels;
    int64_t createdAt { 0 };
    int64_t startedAt { 0 };
    int64_t finishedAt { 0 };
    int32_t exitCode { 0 };
    bool oomKilled { false };
    std::string error;
    // log file written by the engine
    std::string logPath;
    std::vector<EngineMount> mounts;
};

/*
 * EngineAdapter is the boundary to the underlying container engine.
 * Implementations set CRISHIM_ERR_NOT_FOUND on the error when the id does not
 * resolve to a record; any other failure carries the engine message verbatim.
 */
class EngineAdapter {
public:
    virtual ~EngineAdapter() = default;

    virtual auto Create(const EngineCreateParams &params, Errors &error) -> std::string = 0;
    virtual void Start(const std::string &id, Errors &error) = 0;
    virtual void Stop(const std::string &id, int32_t timeoutSecs, Errors &error) = 0;
    virtual void Remove(const std::string &id, Errors &error) = 0;
    virtual auto Inspect(const std::string &id, Errors &error) -> std::unique_ptr<EngineRecord> = 0;
    // List returns the records carrying every label of labelFilter, in engine enumeration order.
    virtual void List(const std::map<std::string, std::string> &labelFilter, std::vector<EngineRecord> &records,
                      Errors &error) = 0;
};

} // namespace CRIShim

#endif // DAEMON_MODULES_API_ENGINE_API_H
