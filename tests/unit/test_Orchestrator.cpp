#include <gtest/gtest.h>
#include "sync/Orchestrator.hpp"
#include "backup/Store.hpp"
#include "util/files.hpp"
#include "FakeSession.hpp"

#include <filesystem>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace rs::sync;
using namespace rs::sync::model;
using namespace rs::types;
using namespace rs::test;
using namespace std::chrono;

class OrchestratorTest : public ::testing::Test {
protected:
    fs::path scratch;
    FakeNetwork network;

    static constexpr sys_seconds T0{seconds{1700000000}};

    void SetUp() override {
        scratch = fs::temp_directory_path() / "retrosync_orchestrator_test";
        fs::remove_all(scratch);
    }

    void TearDown() override {
        fs::remove_all(scratch);
    }

    [[nodiscard]] RunContext context(std::vector<Device> devices, const unsigned int maxBackups = 10) const {
        return {
            .devices = std::move(devices),
            .save_folder = scratch / "Saves",
            .backup_root = scratch / "Backups",
            .max_backups = maxBackups,
            .connect_timeout = seconds(1)
        };
    }

    static std::vector<Device> twoDevices() {
        return {
            Device("A", "10.0.0.1", 21, "/saves/"),
            Device("B", "10.0.0.2", 21, "/saves/", Credentials{"retro", "pass"})
        };
    }

    RunReport runWith(std::vector<Device> devices, const unsigned int maxBackups = 10) {
        Orchestrator orchestrator(context(std::move(devices), maxBackups), network.factory());
        auto report = orchestrator.run();
        EXPECT_EQ(orchestrator.phase(), Orchestrator::Phase::Done);
        return report;
    }

    [[nodiscard]] fs::path saves() const { return scratch / "Saves"; }
};

TEST_F(OrchestratorTest, NewestSaveWinsAndIsUploadedEverywhere) {
    network.remote("A").put("save1.srm", "A's save", T0);
    network.remote("B").put("save1.srm", "B's save", T0 + hours(1));

    const auto report = runWith(twoDevices());

    EXPECT_EQ(rs::util::readFileToString(saves() / "save1.srm"), "B's save");
    EXPECT_EQ(rs::util::getModTime(saves() / "save1.srm"), T0 + hours(1));

    ASSERT_EQ(report.winners.size(), 1u);
    EXPECT_EQ(report.winners[0].candidate.device, "B");

    EXPECT_EQ(network.remote("A").files.at("save1.srm").contents, "B's save");
    EXPECT_EQ(network.remote("B").files.at("save1.srm").contents, "B's save");
    EXPECT_EQ(network.remote("A").uploads, std::vector<std::string>{"save1.srm"});
    EXPECT_EQ(report.failedDeviceCount(), 0u);
}

TEST_F(OrchestratorTest, DayNewerSaveFromSecondDeviceWins) {
    // 2024-01-01T10:00:00Z and 2024-01-02T09:00:00Z
    const sys_seconds t1{seconds{1704103200}};
    const sys_seconds t2{seconds{1704186000}};
    network.remote("A").put("game.srm", "A", t1);
    network.remote("B").put("game.srm", "B", t2);

    runWith(twoDevices());

    EXPECT_EQ(rs::util::readFileToString(saves() / "game.srm"), "B");
    EXPECT_EQ(network.remote("A").files.at("game.srm").contents, "B");
    EXPECT_EQ(network.remote("B").uploads, std::vector<std::string>{"game.srm"});
}

TEST_F(OrchestratorTest, BackupSetHoldsEveryDeviceCopy) {
    network.remote("A").put("save1.srm", "A's save", T0);
    network.remote("B").put("save1.srm", "B's save", T0 + hours(1));

    const auto report = runWith(twoDevices());

    EXPECT_EQ(rs::util::readFileToString(report.backup_set / "A" / "save1.srm"), "A's save");
    EXPECT_EQ(rs::util::getModTime(report.backup_set / "A" / "save1.srm"), T0);
    EXPECT_EQ(rs::util::readFileToString(report.backup_set / "B" / "save1.srm"), "B's save");
    EXPECT_EQ(rs::util::readFileToString(report.backup_set / "Latest Saves" / "save1.srm"), "B's save");
}

TEST_F(OrchestratorTest, UnreachableDeviceDoesNotStopTheRun) {
    network.remote("A").connectFailure = rs::transport::ConnectError::Kind::Unreachable;
    network.remote("B").put("save2.srm", "B's save", T0);

    const auto report = runWith(twoDevices());

    EXPECT_EQ(rs::util::readFileToString(saves() / "save2.srm"), "B's save");
    EXPECT_EQ(network.remote("B").uploads, std::vector<std::string>{"save2.srm"});
    EXPECT_TRUE(network.remote("A").uploads.empty());

    ASSERT_EQ(report.devices.size(), 2u);
    EXPECT_EQ(report.devices[0].status, DeviceStatus::ConnectFailed);
    EXPECT_FALSE(report.devices[0].error.empty());
    EXPECT_EQ(report.devices[1].status, DeviceStatus::Ready);
    EXPECT_EQ(report.failedDeviceCount(), 1u);
    EXPECT_FALSE(fs::exists(report.backup_set / "A"));
}

TEST_F(OrchestratorTest, BadCredentialsIsolateTheDevice) {
    network.remote("A").put("a.srm", "a", T0);
    network.remote("B").rejectLogin = true;
    network.remote("B").put("b.srm", "b", T0);

    const auto report = runWith(twoDevices());

    EXPECT_EQ(report.devices[0].status, DeviceStatus::Ready);
    EXPECT_EQ(report.devices[1].status, DeviceStatus::AuthFailed);
    EXPECT_TRUE(fs::exists(saves() / "a.srm"));
    EXPECT_FALSE(fs::exists(saves() / "b.srm"));
    EXPECT_TRUE(network.remote("B").uploads.empty());
}

TEST_F(OrchestratorTest, MissingRemotePathIsolatesTheDevice) {
    network.remote("A").missingPath = true;
    network.remote("A").put("a.srm", "a", T0);
    network.remote("B").put("b.srm", "b", T0);

    const auto report = runWith(twoDevices());

    EXPECT_EQ(report.devices[0].status, DeviceStatus::PathFailed);
    EXPECT_EQ(report.devices[1].status, DeviceStatus::Ready);
    EXPECT_TRUE(network.remote("A").uploads.empty());
    EXPECT_EQ(network.remote("A").sessionsOpened, network.remote("A").sessionsClosed);
}

TEST_F(OrchestratorTest, FailedListingIsolatesTheDevice) {
    network.remote("A").failList = true;
    network.remote("B").put("b.srm", "b", T0);

    const auto report = runWith(twoDevices());

    EXPECT_EQ(report.devices[0].status, DeviceStatus::TransferFailed);
    EXPECT_TRUE(network.remote("A").uploads.empty());
    EXPECT_TRUE(fs::exists(saves() / "b.srm"));
}

TEST_F(OrchestratorTest, SingleFileFailuresKeepTheDevice) {
    auto& a = network.remote("A");
    a.put("good.srm", "good", T0);
    a.put("broken.srm", "broken", T0);
    a.failDownloads.insert("broken.srm");
    a.failUploads.insert("good.srm");

    const auto report = runWith({Device("A", "10.0.0.1", 21, "/saves/")});

    ASSERT_EQ(report.devices.size(), 1u);
    const auto& d = report.devices[0];
    EXPECT_EQ(d.status, DeviceStatus::Ready);
    EXPECT_EQ(d.downloaded, std::vector<std::string>{"good.srm"});
    EXPECT_EQ(d.failed_downloads, std::vector<std::string>{"broken.srm"});
    EXPECT_EQ(d.failed_uploads, std::vector<std::string>{"good.srm"});
    EXPECT_FALSE(fs::exists(saves() / "broken.srm"));
}

TEST_F(OrchestratorTest, UploadsWholeCanonicalFolderInNameOrder) {
    fs::create_directories(saves());
    rs::util::writeFile(saves() / "older-game.srm", "kept from an earlier run");
    network.remote("A").put("new.srm", "n", T0);

    runWith({Device("A", "10.0.0.1", 21, "/saves/")});

    const std::vector<std::string> expected{"new.srm", "older-game.srm"};
    EXPECT_EQ(network.remote("A").uploads, expected);
}

TEST_F(OrchestratorTest, AllDevicesDownStillCompletes) {
    network.remote("A").connectFailure = rs::transport::ConnectError::Kind::Refused;
    network.remote("B").connectFailure = rs::transport::ConnectError::Kind::TimedOut;

    const auto report = runWith(twoDevices());

    EXPECT_EQ(report.failedDeviceCount(), 2u);
    EXPECT_TRUE(report.winners.empty());
    EXPECT_TRUE(fs::is_directory(report.backup_set / "Latest Saves"));
    EXPECT_TRUE(fs::is_directory(saves()));
}

TEST_F(OrchestratorTest, RetentionStaysAtCap) {
    fs::create_directories(scratch / "Backups");
    for (int i = 0; i < 10; ++i)
        fs::create_directory(scratch / "Backups" / fmt::format("2020.01.{:02} 00-00-00", i + 1));

    const auto report = runWith({Device("A", "10.0.0.1", 21, "/saves/")}, 10);

    const auto sets = rs::backup::Store(scratch / "Backups").list();
    EXPECT_EQ(sets.size(), 10u);
    EXPECT_FALSE(fs::exists(scratch / "Backups" / "2020.01.01 00-00-00"));
    EXPECT_TRUE(fs::exists(scratch / "Backups" / "2020.01.02 00-00-00"));
    ASSERT_EQ(report.pruned.size(), 1u);
    EXPECT_EQ(sets.back(), report.backup_set);
}

TEST_F(OrchestratorTest, CredentialsAndPathReachTheSession) {
    network.remote("B").put("b.srm", "b", T0);

    runWith(twoDevices());

    EXPECT_FALSE(network.remote("A").loggedInWith.has_value());
    ASSERT_TRUE(network.remote("B").loggedInWith.has_value());
    EXPECT_EQ(network.remote("B").loggedInWith->username, "retro");
    EXPECT_EQ(network.remote("B").cwd, "/saves/");
}

TEST_F(OrchestratorTest, SessionsAreClosedAfterTheRun) {
    network.remote("A").put("a.srm", "a", T0);
    network.remote("B").put("b.srm", "b", T0);

    Orchestrator orchestrator(context(twoDevices()), network.factory());
    orchestrator.run();

    EXPECT_EQ(network.remote("A").sessionsClosed, 1u);
    EXPECT_EQ(network.remote("B").sessionsClosed, 1u);
    for (const auto& outcome : orchestrator.outcomes()) EXPECT_FALSE(outcome.hasRetainedSession());
}

TEST_F(OrchestratorTest, RunsOnlyOnce) {
    Orchestrator orchestrator(context({Device("A", "10.0.0.1", 21, "/saves/")}), network.factory());
    orchestrator.run();
    EXPECT_THROW(orchestrator.run(), std::logic_error);
}

TEST_F(OrchestratorTest, ManifestDescribesTheRun) {
    network.remote("A").connectFailure = rs::transport::ConnectError::Kind::Unreachable;
    network.remote("B").put("save2.srm", "B's save", T0);

    const auto report = runWith(twoDevices());

    const auto path = report.backup_set / Orchestrator::MANIFEST_FILE;
    ASSERT_TRUE(fs::exists(path));
    const auto j = nlohmann::json::parse(rs::util::readFileToString(path));

    EXPECT_EQ(j.at("backup_set").get<std::string>(), report.backup_set.filename().string());
    ASSERT_EQ(j.at("devices").size(), 2u);
    EXPECT_EQ(j.at("devices")[0].at("device"), "A");
    EXPECT_EQ(j.at("devices")[0].at("status"), "connect_failed");
    EXPECT_TRUE(j.at("devices")[0].contains("error"));
    EXPECT_EQ(j.at("devices")[1].at("status"), "ready");
    EXPECT_EQ(j.at("devices")[1].at("uploaded")[0], "save2.srm");

    ASSERT_EQ(j.at("winners").size(), 1u);
    EXPECT_EQ(j.at("winners")[0].at("filename"), "save2.srm");
    EXPECT_EQ(j.at("winners")[0].at("device"), "B");
    EXPECT_EQ(j.at("winners")[0].at("last_modified"), "2023-11-14T22:13:20Z");
}

TEST_F(OrchestratorTest, BackupRootThatIsAFileAbortsTheRun) {
    fs::create_directories(scratch);
    rs::util::writeFile(scratch / "Backups", "oops");

    Orchestrator orchestrator(context(twoDevices()), network.factory());
    EXPECT_THROW(orchestrator.run(), rs::backup::BackupError);
    EXPECT_EQ(network.remote("A").sessionsOpened, 0u);
}

TEST_F(OrchestratorTest, LocalWriteFailureDuringDownloadAbortsTheRun) {
    network.remote("A").put("a.srm", "a", T0);
    network.remote("A").failLocalWrites.insert("a.srm");
    network.remote("B").put("b.srm", "b", T0);

    Orchestrator orchestrator(context(twoDevices()), network.factory());
    EXPECT_THROW(orchestrator.run(), fs::filesystem_error);
    EXPECT_EQ(orchestrator.phase(), Orchestrator::Phase::Downloading);
    EXPECT_EQ(network.remote("B").sessionsOpened, 0u);
    EXPECT_FALSE(fs::exists(saves() / "a.srm"));
}

TEST_F(OrchestratorTest, UnexpectedErrorWhileOpeningIsolatesTheDevice) {
    network.remote("A").connectCrash = "curl_easy_init failed";
    network.remote("B").put("b.srm", "b", T0);

    const auto report = runWith(twoDevices());

    EXPECT_EQ(report.devices[0].status, DeviceStatus::TransferFailed);
    EXPECT_EQ(report.devices[0].error, "curl_easy_init failed");
    EXPECT_EQ(report.devices[1].status, DeviceStatus::Ready);
    EXPECT_TRUE(fs::exists(saves() / "b.srm"));
}

TEST_F(OrchestratorTest, ListingFilterDecidesWhatIsDownloaded) {
    auto& a = network.remote("A");
    a.extraListingLines = {
        "type=cdir;modify=20240101000000; .",
        "type=dir;modify=20240101000000; states",
        "type=file;modify=20240101000000; /saves/",
        "type=file;size=3; undated.srm"
    };
    a.put("real.srm", "r", T0);

    const auto report = runWith({Device("A", "10.0.0.1", 21, "/saves/")});

    ASSERT_EQ(report.devices.size(), 1u);
    EXPECT_EQ(report.devices[0].downloaded, std::vector<std::string>{"real.srm"});
    EXPECT_TRUE(report.devices[0].failed_downloads.empty());
    ASSERT_EQ(report.winners.size(), 1u);
    EXPECT_EQ(report.winners[0].filename, "real.srm");
}
