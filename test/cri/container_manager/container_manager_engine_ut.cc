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
 * Description: container manager service engine failure unit test
 *********************************************************************************/

#include <climits>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "gtest/gtest.h"
#include "cri_constants.h"
#include "cri_container_manager_service_impl.h"
#include "cri_errors.h"
#include "engine_adapter_mock.h"
#include "fake_clock.h"

using namespace CRIShim;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

const std::string DUMMY_SANDBOX_ID = "604db93a33ec4c7787e4f369338f5887";
const std::string DUMMY_CONTAINER_ID = "504db93a32ec4c9789e4d369a38f3889";
const int64_t SECOND_TO_NANOS = 1000000000;

static std::unique_ptr<EngineRecord> CreateTestRecord(const std::string &id)
{
    std::unique_ptr<EngineRecord> record(new EngineRecord);
    record->id = id;
    record->name = "k8s_nginx_test-pod_default_uid_0";
    record->image = "nginx:latest";
    record->state = Constants::ENGINE_STATE_RUNNING;
    record->labels[Constants::CONTAINER_TYPE_LABEL_KEY] = Constants::CONTAINER_TYPE_LABEL_CONTAINER;
    record->labels[Constants::CONTAINER_NAME_LABEL_KEY] = "nginx";
    record->labels[Constants::CONTAINER_ATTEMPT_LABEL_KEY] = "0";
    record->labels[Constants::SANDBOX_ID_LABEL_KEY] = DUMMY_SANDBOX_ID;
    record->createdAt = 1588 * SECOND_TO_NANOS;
    record->startedAt = 1589 * SECOND_TO_NANOS;
    return record;
}

static void SetEngineError(Errors &error, int code, const std::string &msg)
{
    error.SetError(code, msg);
}

class ContainerManagerEngineTest : public testing::Test {
protected:
    void SetUp() override
    {
        m_engineMock = std::make_shared<MockEngineAdapter>();
        m_clock = std::make_shared<FakeClock>(1600 * SECOND_TO_NANOS);
        m_service.reset(new ContainerManagerServiceImpl(m_engineMock, m_clock, m_config));
    }

    void TearDown() override
    {
        m_service.reset(nullptr);
    }

    void ExpectInspectSucceed()
    {
        EXPECT_CALL(*m_engineMock, Inspect(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
        Invoke([](const std::string & id, Errors & error) {
            return CreateTestRecord(id);
        }));
    }

    ShimConfig m_config;
    std::shared_ptr<MockEngineAdapter> m_engineMock;
    std::shared_ptr<FakeClock> m_clock;
    std::unique_ptr<ContainerManagerServiceImpl> m_service;
};

/************* Unit tests for CreateContainer *************/
TEST_F(ContainerManagerEngineTest, CreateTestFailed)
{
    Errors err;
    crishim::v1::PodSandboxConfig sandboxConfig;
    crishim::v1::ContainerConfig config;
    config.mutable_metadata()->set_name("nginx");
    config.mutable_image()->set_image("nginx:latest");

    EXPECT_CALL(*m_engineMock, Create(_, _)).Times(1).WillOnce(
    Invoke([](const EngineCreateParams & params, Errors & error) {
        SetEngineError(error, CRISHIM_ERR_ENGINE, "pull access denied for nginx");
        return std::string();
    }));
    std::string id = m_service->CreateContainer(DUMMY_SANDBOX_ID, config, sandboxConfig, err);
    EXPECT_TRUE(id.empty());
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_CREATE_FAILED);
    EXPECT_NE(err.GetMessage().find("pull access denied for nginx"), std::string::npos);
}

TEST_F(ContainerManagerEngineTest, CreateTestEmptyID)
{
    Errors err;
    crishim::v1::PodSandboxConfig sandboxConfig;
    crishim::v1::ContainerConfig config;
    config.mutable_metadata()->set_name("nginx");
    config.mutable_image()->set_image("nginx:latest");

    EXPECT_CALL(*m_engineMock, Create(_, _)).Times(1).WillOnce(Return(std::string()));
    std::string id = m_service->CreateContainer(DUMMY_SANDBOX_ID, config, sandboxConfig, err);
    EXPECT_TRUE(id.empty());
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_CREATE_FAILED);
}

TEST_F(ContainerManagerEngineTest, CreateTestNoEngineCallOnInvalidConfig)
{
    Errors err;
    crishim::v1::PodSandboxConfig sandboxConfig;
    crishim::v1::ContainerConfig config;
    config.mutable_metadata()->set_name("nginx");

    EXPECT_CALL(*m_engineMock, Create(_, _)).Times(0);
    std::string id = m_service->CreateContainer(DUMMY_SANDBOX_ID, config, sandboxConfig, err);
    EXPECT_TRUE(id.empty());
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_INVALID_CONFIG);
}

/************* Unit tests for Start *************/
TEST_F(ContainerManagerEngineTest, StartTestFailed)
{
    Errors err;
    ExpectInspectSucceed();
    EXPECT_CALL(*m_engineMock, Start(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
    Invoke([](const std::string & id, Errors & error) {
        SetEngineError(error, CRISHIM_ERR_ENGINE, "OCI runtime create failed");
    }));

    m_service->StartContainer(DUMMY_CONTAINER_ID, err);
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_START_FAILED);
    EXPECT_EQ(err.GetMessage(), "Failed to start container " + DUMMY_CONTAINER_ID + ": OCI runtime create failed");
}

TEST_F(ContainerManagerEngineTest, StartTestRacedRemove)
{
    Errors err;
    ExpectInspectSucceed();
    EXPECT_CALL(*m_engineMock, Start(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
    Invoke([](const std::string & id, Errors & error) {
        SetEngineError(error, CRISHIM_ERR_NOT_FOUND, "No such container");
    }));

    m_service->StartContainer(DUMMY_CONTAINER_ID, err);
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_NOT_FOUND);
}

TEST_F(ContainerManagerEngineTest, StartTestLogSymlink)
{
    char tmpl[] = "/tmp/crishim_container_manager_engine_ut_XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    const std::string tmpDir = tmpl;
    const std::string linkPath = tmpDir + "/nginx_0.log";
    const std::string logPath = tmpDir + "/" + DUMMY_CONTAINER_ID + "-json.log";
    struct stat st;

    auto recordWithLogPath = [linkPath, logPath](const std::string & id, Errors & error) {
        std::unique_ptr<EngineRecord> record = CreateTestRecord(id);
        record->labels[Constants::CONTAINER_LOGPATH_LABEL_KEY] = linkPath;
        record->logPath = logPath;
        return record;
    };

    // the engine lost the container, nothing to link
    {
        Errors err;
        EXPECT_CALL(*m_engineMock, Inspect(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(Invoke(recordWithLogPath));
        EXPECT_CALL(*m_engineMock, Start(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
        Invoke([](const std::string & id, Errors & error) {
            SetEngineError(error, CRISHIM_ERR_NOT_FOUND, "No such container");
        }));

        m_service->StartContainer(DUMMY_CONTAINER_ID, err);
        EXPECT_EQ(err.GetCode(), CRISHIM_ERR_NOT_FOUND);
        EXPECT_NE(lstat(linkPath.c_str(), &st), 0);
    }

    // a failed start still links the log file
    {
        Errors err;
        EXPECT_CALL(*m_engineMock, Inspect(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(Invoke(recordWithLogPath));
        EXPECT_CALL(*m_engineMock, Start(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
        Invoke([](const std::string & id, Errors & error) {
            SetEngineError(error, CRISHIM_ERR_ENGINE, "OCI runtime create failed");
        }));

        m_service->StartContainer(DUMMY_CONTAINER_ID, err);
        EXPECT_EQ(err.GetCode(), CRISHIM_ERR_START_FAILED);
        ASSERT_EQ(lstat(linkPath.c_str(), &st), 0);
        EXPECT_TRUE(S_ISLNK(st.st_mode));
    }

    std::string rm_command = "rm -rf " + tmpDir;
    ASSERT_EQ(system(rm_command.c_str()), 0);
}

TEST_F(ContainerManagerEngineTest, StartTestInspectFailed)
{
    Errors err;
    EXPECT_CALL(*m_engineMock, Inspect(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
    Invoke([](const std::string & id, Errors & error) {
        SetEngineError(error, CRISHIM_ERR_ENGINE, "engine is not reachable");
        return std::unique_ptr<EngineRecord>();
    }));
    EXPECT_CALL(*m_engineMock, Start(_, _)).Times(0);

    m_service->StartContainer(DUMMY_CONTAINER_ID, err);
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_START_FAILED);
}

/************* Unit tests for Stop *************/
TEST_F(ContainerManagerEngineTest, StopTestFailed)
{
    Errors err;
    ExpectInspectSucceed();
    EXPECT_CALL(*m_engineMock, Stop(DUMMY_CONTAINER_ID, 30, _)).Times(1).WillOnce(
    Invoke([](const std::string & id, int32_t timeout, Errors & error) {
        SetEngineError(error, CRISHIM_ERR_ENGINE, "cannot kill container");
    }));

    m_service->StopContainer(DUMMY_CONTAINER_ID, 30, err);
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_STOP_FAILED);
    EXPECT_NE(err.GetMessage().find("cannot kill container"), std::string::npos);
}

TEST_F(ContainerManagerEngineTest, StopTestHugeTimeout)
{
    Errors err;
    ShimConfig config;
    config.maxStopTimeout = INT64_MAX;
    ContainerManagerServiceImpl service(m_engineMock, m_clock, config);
    std::shared_ptr<FakeClock> clock = m_clock;

    ExpectInspectSucceed();
    EXPECT_CALL(*m_engineMock, Stop(DUMMY_CONTAINER_ID, INT32_MAX, _)).Times(1).WillOnce(
    Invoke([clock](const std::string & id, int32_t timeout, Errors & error) {
        clock->Advance(SECOND_TO_NANOS);
    }));

    service.StopContainer(DUMMY_CONTAINER_ID, INT64_MAX / 2, err);
    EXPECT_TRUE(err.Empty()) << err.GetMessage();
}

TEST_F(ContainerManagerEngineTest, StopTestSlowEngine)
{
    Errors err;
    ExpectInspectSucceed();
    std::shared_ptr<FakeClock> clock = m_clock;
    EXPECT_CALL(*m_engineMock, Stop(DUMMY_CONTAINER_ID, 2, _)).Times(1).WillOnce(
    Invoke([clock](const std::string & id, int32_t timeout, Errors & error) {
        clock->Advance(5 * SECOND_TO_NANOS);
    }));

    // a late stop is logged, not failed
    m_service->StopContainer(DUMMY_CONTAINER_ID, 2, err);
    EXPECT_TRUE(err.Empty());
}

/************* Unit tests for Remove *************/
TEST_F(ContainerManagerEngineTest, RemoveTestFailed)
{
    Errors err;
    ExpectInspectSucceed();
    EXPECT_CALL(*m_engineMock, Remove(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
    Invoke([](const std::string & id, Errors & error) {
        SetEngineError(error, CRISHIM_ERR_ENGINE, "device or resource busy");
    }));

    m_service->RemoveContainer(DUMMY_CONTAINER_ID, err);
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_REMOVE_FAILED);
}

/************* Unit tests for ContainerStatus *************/
TEST_F(ContainerManagerEngineTest, StatusTestInspectFailed)
{
    Errors err;
    EXPECT_CALL(*m_engineMock, Inspect(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
    Invoke([](const std::string & id, Errors & error) {
        SetEngineError(error, CRISHIM_ERR_ENGINE, "engine is not reachable");
        return std::unique_ptr<EngineRecord>();
    }));

    auto status = m_service->ContainerStatus(DUMMY_CONTAINER_ID, err);
    EXPECT_EQ(status, nullptr);
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_ENGINE);
}

TEST_F(ContainerManagerEngineTest, StatusTestSkewedTimestamps)
{
    Errors err;
    EXPECT_CALL(*m_engineMock, Inspect(DUMMY_CONTAINER_ID, _)).Times(1).WillOnce(
    Invoke([](const std::string & id, Errors & error) {
        std::unique_ptr<EngineRecord> record = CreateTestRecord(id);
        record->state = Constants::ENGINE_STATE_EXITED;
        record->startedAt = 1500 * SECOND_TO_NANOS;
        record->finishedAt = 1400 * SECOND_TO_NANOS;
        return record;
    }));

    auto status = m_service->ContainerStatus(DUMMY_CONTAINER_ID, err);
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->created_at(), 1588);
    EXPECT_EQ(status->started_at(), 1588);
    EXPECT_EQ(status->finished_at(), 1588);
    EXPECT_EQ(status->reason(), "Completed");
}

/************* Unit tests for ListContainers *************/
TEST_F(ContainerManagerEngineTest, ListTestFailed)
{
    Errors err;
    std::vector<std::unique_ptr<crishim::v1::Container>> containers;
    EXPECT_CALL(*m_engineMock, List(_, _, _)).Times(1).WillOnce(
        Invoke([](const std::map<std::string, std::string> &labelFilter, std::vector<EngineRecord> &records,
    Errors & error) {
        SetEngineError(error, CRISHIM_ERR_ENGINE, "engine is not reachable");
    }));

    m_service->ListContainers(nullptr, &containers, err);
    EXPECT_EQ(err.GetCode(), CRISHIM_ERR_LIST_FAILED);
    EXPECT_TRUE(containers.empty());
}

TEST_F(ContainerManagerEngineTest, ListTestPushDownFilter)
{
    Errors err;
    crishim::v1::ContainerFilter filter;
    std::vector<std::unique_ptr<crishim::v1::Container>> containers;
    std::map<std::string, std::string> expected {
        { Constants::CONTAINER_TYPE_LABEL_KEY, Constants::CONTAINER_TYPE_LABEL_CONTAINER },
        { Constants::SANDBOX_ID_LABEL_KEY, DUMMY_SANDBOX_ID },
    };
    filter.set_pod_sandbox_id(DUMMY_SANDBOX_ID);
    EXPECT_CALL(*m_engineMock, List(expected, _, _)).Times(1).WillOnce(
        Invoke([](const std::map<std::string, std::string> &labelFilter, std::vector<EngineRecord> &records,
    Errors & error) {
        records.push_back(*CreateTestRecord(DUMMY_CONTAINER_ID));
    }));

    m_service->ListContainers(&filter, &containers, err);
    ASSERT_TRUE(err.Empty());
    ASSERT_EQ(containers.size(), 1U);
    EXPECT_EQ(containers[0]->id(), DUMMY_CONTAINER_ID);
    EXPECT_EQ(containers[0]->metadata().name(), "nginx");
    EXPECT_EQ(containers[0]->created_at(), 1588);
}
