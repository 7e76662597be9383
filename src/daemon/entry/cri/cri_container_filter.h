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
 * Description: provide container list filter definition
 *********************************************************************************/
#ifndef DAEMON_ENTRY_CRI_CRI_CONTAINER_FILTER_H
#define DAEMON_ENTRY_CRI_CRI_CONTAINER_FILTER_H
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "crishim.pb.h"

namespace CRIShim {
namespace ContainerFilters {
struct ListEntry {
    std::unique_ptr<crishim::v1::Container> container;
    // engine creation time, finer than the summary created_at
    int64_t createdNanos { 0 };
};

// Labels every listed record must carry, handed to EngineAdapter::List.
auto MakeEngineLabelFilter(const crishim::v1::ContainerFilter *filter) -> std::map<std::string, std::string>;

auto Match(const crishim::v1::ContainerFilter *filter, const crishim::v1::Container &container) -> bool;

// Newest first. Entries with equal creation time keep their relative order.
void SortByRecency(std::vector<ListEntry> &entries);
} // namespace ContainerFilters
} // namespace CRIShim

#endif // DAEMON_ENTRY_CRI_CRI_CONTAINER_FILTER_H
