/**
 * @file test_provision_engine.cpp
 * @date 2025
 */

#include "ctforge/core/provision_engine.hpp"
#include "ctforge/utils/temp_directory.hpp"

#include "fake_host.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;
using namespace ctforge::core;
using ctforge::tests::FakeHost;
using ctforge::utils::TempDirectory;

namespace {

class ProvisionEngineTest : public testing::Test {
protected:
    void SetUp() override {
        config.setup_script = workdir.GetPath() / "setup.sh";
        std::ofstream script(config.setup_script);
        script << "#!/bin/sh\nexit 0\n";

        config.prepare_host = false;
        config.report_path = workdir.GetPath() / "report.json";
    }

    json ReadReport() const {
        std::ifstream file(config.report_path);
        return json::parse(file);
    }

    TempDirectory workdir{"ctforge-test"};
    ProvisionConfig config;
    FakeHost host;
};

std::optional<std::string> NoPrompt(const StorageMenu&) {
    return std::nullopt;
}

} // namespace

TEST_F(ProvisionEngineTest, EndToEndOnSingleDirectoryPool) {
    ProvisionEngine engine(host, config, NoPrompt);
    auto result = engine.Run();

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(Stage::COMPLETE, result.stage_reached);
    EXPECT_EQ("local", result.storage_tag);
    EXPECT_EQ("debian-10-standard_10.7-1_amd64.tar.gz", result.template_name);
    EXPECT_EQ((std::vector<std::string>{"https://192.168.1.50:8443",
                                        "https://UnifiNetworkController:8443"}),
              result.endpoints);

    EXPECT_EQ((std::vector<std::string>{"debian-10-standard_10.7-1_amd64.tar.gz"}), host.downloads);
    EXPECT_EQ(1u, host.containers.size());

    auto report = ReadReport();
    EXPECT_TRUE(report["result"]["success"].get<bool>());
    EXPECT_EQ(100, report["result"]["container_id"]);
}

TEST_F(ProvisionEngineTest, CachedTemplateSkipsDownload) {
    host.cached_templates.insert("local:debian-10-standard_10.7-1_amd64.tar.gz");

    ProvisionEngine engine(host, config, NoPrompt);
    ASSERT_TRUE(engine.Run().success);
    EXPECT_TRUE(host.downloads.empty());
}

TEST_F(ProvisionEngineTest, PromptPicksAmongSeveralPools) {
    StoragePool zfs;
    zfs.tag = "local-zfs";
    zfs.type_name = "zfspool";
    zfs.kind = StorageKind::ZFSPOOL;
    zfs.supports_rootdir = true;
    host.pools.push_back(zfs);

    ProvisionEngine engine(host, config, [](const StorageMenu& menu) -> std::optional<std::string> {
        return menu.rows.back().tag;
    });
    auto result = engine.Run();

    ASSERT_TRUE(result.success);
    EXPECT_EQ("local-zfs", result.storage_tag);
    EXPECT_TRUE(host.formatted_paths.empty());
}

TEST_F(ProvisionEngineTest, FailureBeforeSessionNeedsNoRollback) {
    host.pools.front().supports_rootdir = false;

    ProvisionEngine engine(host, config, NoPrompt);
    auto result = engine.Run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorKind::NO_ELIGIBLE_STORAGE, result.error_kind);
    EXPECT_EQ(1, result.exit_code);
    EXPECT_EQ(host.calls.end(), std::find(host.calls.begin(), host.calls.end(), "NextContainerId"));
    EXPECT_EQ(host.calls.end(), std::find(host.calls.begin(), host.calls.end(), "Status"));

    auto report = ReadReport();
    EXPECT_EQ("NoEligibleStorage", report["error"]["kind"]);
}

TEST_F(ProvisionEngineTest, MissingTemplate) {
    config.os_version = "12";

    ProvisionEngine engine(host, config, NoPrompt);
    auto result = engine.Run();

    EXPECT_EQ(ErrorKind::TEMPLATE_NOT_FOUND, result.error_kind);
    EXPECT_TRUE(host.IsClean());
}

TEST_F(ProvisionEngineTest, StoragePoolQueryFailure) {
    host.FailOn("ListStoragePools", 7);

    ProvisionEngine engine(host, config, NoPrompt);
    auto result = engine.Run();

    EXPECT_EQ(ErrorKind::HOST_CAPABILITY_UNAVAILABLE, result.error_kind);
    EXPECT_EQ(7, result.exit_code);
}

TEST_F(ProvisionEngineTest, SessionFailureIsRolledBackAndReported) {
    host.FailOn("Exec", 9);

    ProvisionEngine engine(host, config, NoPrompt);
    auto result = engine.Run();

    EXPECT_EQ(ErrorKind::SETUP_EXECUTION_FAILED, result.error_kind);
    EXPECT_EQ(9, result.exit_code);
    EXPECT_TRUE(host.IsClean());

    auto report = ReadReport();
    EXPECT_EQ("SetupPushed", report["result"]["stage"]);
    EXPECT_EQ(9, report["error"]["exit_code"]);
}

TEST_F(ProvisionEngineTest, UnexpectedErrorIsReportedNotThrown) {
    StoragePool second = host.pools.front();
    second.tag = "backup";
    host.pools.push_back(second);

    ProvisionEngine engine(host, config, [](const StorageMenu&) -> std::optional<std::string> {
        throw std::runtime_error("terminal went away");
    });

    ProvisionResult result;
    ASSERT_NO_THROW(result = engine.Run());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorKind::HOST_CAPABILITY_UNAVAILABLE, result.error_kind);
    EXPECT_EQ(1, result.exit_code);
    EXPECT_EQ("terminal went away", result.error_message);

    auto report = ReadReport();
    EXPECT_EQ("provisioning", report["error"]["context"]);
}

TEST_F(ProvisionEngineTest, MissingSetupScriptIsReported) {
    config.setup_script = workdir.GetPath() / "absent.sh";

    ProvisionEngine engine(host, config, NoPrompt);
    auto result = engine.Run();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(ErrorKind::HOST_CAPABILITY_UNAVAILABLE, result.error_kind);
    EXPECT_TRUE(host.calls.empty());
}

TEST(ProvisionEngineStagingTest, StagedScriptIsExecutable) {
    TempDirectory source("ctforge-test");
    TempDirectory target("ctforge-test");

    auto script = source.GetPath() / "setup.sh";
    {
        std::ofstream file(script);
        file << "#!/bin/sh\n";
    }
    std::filesystem::permissions(script, std::filesystem::perms::owner_read |
                                         std::filesystem::perms::owner_write);

    auto staged = ProvisionEngine::StageSetupScript(script, target.GetPath());

    EXPECT_EQ(target.GetPath() / "setup.sh", staged);
    auto perms = std::filesystem::status(staged).permissions();
    EXPECT_NE(std::filesystem::perms::none, perms & std::filesystem::perms::owner_exec);
    EXPECT_NE(std::filesystem::perms::none, perms & std::filesystem::perms::others_exec);
}
