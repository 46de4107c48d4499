/**
 * @file test_singleton_lock.cpp
 * @brief Tests for the cross-process SingletonLock.
 *
 * Single-process behaviour runs in one worker per scenario. Contention tests start
 * several workers that race for the same lock file.
 */
#include "mcg_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>

using namespace mcpguard::tests::helper;
using namespace ::testing;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class SingletonLockTest : public mcpguard::tests::IsolatedProcessTest
{
  protected:
    void SetUp() override
    {
        IsolatedProcessTest::SetUp();
        dir_ = unique_temp_path("singleton_lock");
        fs::create_directories(dir_);
        lock_path_ = (dir_ / "mcpguard.lock").string();
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    std::string lock_path_;
};

TEST_F(SingletonLockTest, AcquireWritesRecordAndReleaseRemovesIt)
{
    auto proc = SpawnWorker("singleton_lock.test_acquire_and_release", {lock_path_});
    ExpectWorkerOk(proc, {"SingletonLock: acquired", "SingletonLock: released"});
}

TEST_F(SingletonLockTest, AcquireAndReleaseAreIdempotent)
{
    auto proc = SpawnWorker("singleton_lock.test_idempotent_acquire_release", {lock_path_});
    ExpectWorkerOk(proc);
}

TEST_F(SingletonLockTest, CreatesMissingLockDirectory)
{
    const auto nested = (dir_ / "a" / "b" / "mcpguard.lock").string();
    auto proc = SpawnWorker("singleton_lock.test_idempotent_acquire_release", {nested});
    ExpectWorkerOk(proc);
}

TEST_F(SingletonLockTest, ReclaimsLockOfDeadProcess)
{
    auto proc = SpawnWorker("singleton_lock.test_reclaims_dead_owner", {lock_path_});
    ExpectWorkerOk(proc, {"SingletonLock: reclaiming stale lock"});
}

TEST_F(SingletonLockTest, ReclaimsLeftoverRecordWithOwnPid)
{
    auto proc = SpawnWorker("singleton_lock.test_reclaims_own_pid_leftover", {lock_path_});
    ExpectWorkerOk(proc, {"SingletonLock: reclaiming stale lock"});
}

TEST_F(SingletonLockTest, SecondInstanceInSameProcessIsRefused)
{
    auto proc =
        SpawnWorker("singleton_lock.test_second_instance_in_process_refused", {lock_path_});
    ExpectWorkerOk(proc, {"already held within this process"});
}

TEST_F(SingletonLockTest, LeftoverTempFileDoesNotBlockAcquire)
{
    auto proc = SpawnWorker("singleton_lock.test_ignores_leftover_temp_file", {lock_path_});
    ExpectWorkerOk(proc, {});
}

TEST_F(SingletonLockTest, ReclaimsUnparsableLockFile)
{
    auto proc = SpawnWorker("singleton_lock.test_reclaims_garbage_file", {lock_path_});
    ExpectWorkerOk(proc, {"SingletonLock: reclaiming unreadable lock file"});
}

TEST_F(SingletonLockTest, ReclaimsLockOfLiveProcessWithoutSignature)
{
    auto proc = SpawnWorker("singleton_lock.test_reclaims_recycled_pid", {lock_path_});
    ExpectWorkerOk(proc, {"SingletonLock: reclaiming stale lock"});
}

TEST_F(SingletonLockTest, LiveOwnerBlocksAcquire)
{
    auto proc = SpawnWorker("singleton_lock.test_live_owner_blocks", {lock_path_});
    ExpectWorkerOk(proc);
}

TEST_F(SingletonLockTest, ForceReleaseRemovesAnyFile)
{
    auto proc = SpawnWorker("singleton_lock.test_force_release", {lock_path_});
    ExpectWorkerOk(proc, {"SingletonLock: force-released"});
}

TEST_F(SingletonLockTest, ReleaseAsyncCompletes)
{
    auto proc = SpawnWorker("singleton_lock.test_release_async", {lock_path_});
    ExpectWorkerOk(proc);
}

TEST_F(SingletonLockTest, ReleaseLeavesForeignRecord)
{
    auto proc = SpawnWorker("singleton_lock.test_release_leaves_foreign_file", {lock_path_});
    ExpectWorkerOk(proc, {"left in place"});
}

TEST_F(SingletonLockTest, DirectoryCreationFailureThrows)
{
    const auto blocker = dir_ / "not_a_dir";
    std::ofstream(blocker) << "x";
    const auto path = (blocker / "mcpguard.lock").string();
    auto proc = SpawnWorker("singleton_lock.test_directory_creation_failure", {path});
    ExpectWorkerOk(proc);
}

TEST_F(SingletonLockTest, ThreadRaceHasSingleWinner)
{
    auto proc = SpawnWorker("singleton_lock.test_thread_race_single_winner",
                            {lock_path_, std::to_string(scaled_value(8, 4))});
    ExpectWorkerOk(proc);
}

TEST_F(SingletonLockTest, ModuleShutdownReleasesHeldLocks)
{
    auto proc = SpawnWorker("singleton_lock.test_released_on_finalize", {lock_path_});
    ExpectWorkerOk(proc);
    EXPECT_FALSE(fs::exists(lock_path_));
}

TEST_F(SingletonLockTest, TerminateReleasesHeldLocks)
{
    auto proc = SpawnWorker("singleton_lock.test_released_on_terminate", {lock_path_});
    proc.wait_for_exit();
    EXPECT_EQ(proc.term_signal(), SIGABRT) << proc.get_stderr();
    EXPECT_FALSE(fs::exists(lock_path_));
}

TEST_F(SingletonLockTest, ConstructBeforeInitPanics)
{
    auto proc = SpawnWorker("singleton_lock.test_construct_before_init_panics", {lock_path_});
    proc.wait_for_exit();
    EXPECT_NE(proc.term_signal(), 0);
    EXPECT_THAT(proc.get_stderr(),
                HasSubstr("SingletonLock created before its module was initialized"));
}

// ============================================================================
// Cross-process
// ============================================================================

/**
 * While one process holds the lock, another process is refused; a third acquires it
 * once the holder has exited.
 */
TEST_F(SingletonLockTest, SecondProcessIsRefusedWhileHolderRuns)
{
    const auto ready = (dir_ / "ready").string();
    auto holder = SpawnWorker("singleton_lock.hold", {lock_path_, ready, "3000"});
    ASSERT_TRUE(wait_for_string_in_file(ready, "ready", 10s));

    auto contender = SpawnWorker("singleton_lock.expect_busy", {lock_path_});
    ExpectWorkerOk(contender);

    ExpectWorkerOk(holder);
    EXPECT_FALSE(fs::exists(lock_path_));

    auto after = SpawnWorker("singleton_lock.test_acquire_and_release", {lock_path_});
    ExpectWorkerOk(after);
}

TEST_F(SingletonLockTest, SigtermRemovesLockFile)
{
    const auto ready = (dir_ / "ready").string();
    auto holder = SpawnWorker("singleton_lock.hold", {lock_path_, ready, "30000"});
    ASSERT_TRUE(wait_for_string_in_file(ready, "ready", 10s));
    ASSERT_TRUE(fs::exists(lock_path_));

    ASSERT_TRUE(holder.send_signal(SIGTERM));
    holder.wait_for_exit();
    EXPECT_EQ(holder.term_signal(), SIGTERM);
    EXPECT_FALSE(fs::exists(lock_path_));
}

/**
 * A holder killed with SIGKILL leaves its file behind; the next process reclaims it.
 */
TEST_F(SingletonLockTest, SigkillLeavesStaleLockThatIsReclaimed)
{
    const auto ready = (dir_ / "ready").string();
    auto holder = SpawnWorker("singleton_lock.hold", {lock_path_, ready, "30000"});
    ASSERT_TRUE(wait_for_string_in_file(ready, "ready", 10s));

    ASSERT_TRUE(holder.send_signal(SIGKILL));
    holder.wait_for_exit();
    ASSERT_TRUE(fs::exists(lock_path_));

    auto next = SpawnWorker("singleton_lock.test_acquire_and_release", {lock_path_});
    ExpectWorkerOk(next, {"SingletonLock: reclaiming stale lock"});
}

TEST_F(SingletonLockTest, MultiProcessContentionHasSingleWinner)
{
    const int contenders = scaled_value(6, 3);
    const auto result_dir = dir_ / "results";
    fs::create_directories(result_dir);

    std::vector<std::pair<std::string, std::vector<std::string>>> scenarios;
    for (int i = 0; i < contenders; ++i)
        scenarios.push_back({"singleton_lock.try_acquire_once", {lock_path_, result_dir.string()}});
    auto workers = SpawnWorkers(scenarios);

    auto count_results = [&]()
    {
        int n = 0;
        for (const auto &entry : fs::directory_iterator(result_dir))
        {
            if (entry.path().extension() == ".result")
                ++n;
        }
        return n;
    };
    ASSERT_TRUE(wait_until([&]() { return count_results() == contenders; }, 30s));

    int winners = 0;
    for (const auto &entry : fs::directory_iterator(result_dir))
    {
        if (entry.path().extension() != ".result")
            continue;
        std::string content;
        ASSERT_TRUE(read_file_contents(entry.path().string(), content));
        if (content == "1")
            ++winners;
    }
    std::ofstream(result_dir / "go") << "go";

    ExpectAllWorkersOk(workers);
    EXPECT_EQ(winners, 1);
    EXPECT_FALSE(fs::exists(lock_path_));
}
