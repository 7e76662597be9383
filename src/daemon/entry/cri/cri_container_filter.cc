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
 * Description: provide container list filter functions
 *********************************************************************************/
#include "cri_container_filter.h"

#include <algorithm>

#include "cri_constants.h"

namespace CRIShim {
namespace ContainerFilters {
auto MakeEngineLabelFilter(const crishim::v1::ContainerFilter *filter) -> std::map<std::string, std::string>
{
    std::map<std::string, std::string> labels;

    // Add filter to get only non-sandbox containers
    labels[Constants::CONTAINER_TYPE_LABEL_KEY] = Constants::CONTAINER_TYPE_LABEL_CONTAINER;

    if (filter == nullptr) {
        return labels;
    }

    if (!filter->pod_sandbox_id().empty()) {
        labels[Constants::SANDBOX_ID_LABEL_KEY] = filter->pod_sandbox_id();
    }

    for (const auto &iter : filter->label_selector()) {
        labels[iter.first] = iter.second;
    }

    return labels;
}

auto Match(const crishim::v1::ContainerFilter *filter, const crishim::v1::Container &container) -> bool
{
    if (filter == nullptr) {
        return true;
    }

    if (!filter->id().empty() && filter->id() != container.id()) {
        return false;
    }

    if (!filter->pod_sandbox_id().empty() && filter->pod_sandbox_id() != container.pod_sandbox_id()) {
        return false;
    }

    if (filter->has_state() && filter->state().state() != container.state()) {
        return false;
    }

    for (const auto &iter : filter->label_selector()) {
        auto label = container.labels().find(iter.first);
        if (label == container.labels().end() || label->second != iter.second) {
            return false;
        }
    }

    return true;
}

void SortByRecency(std::vector<ListEntry> &entries)
{
    std::stable_sort(entries.begin(), entries.end(), [](const ListEntry & a, const ListEntry & b) {
        return a.createdNanos > b.createdNanos;
    });
}
} // namespace ContainerFilters
} // namespace CRIShim
