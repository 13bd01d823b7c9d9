#include <gtest/gtest.h>
#include "storage/vlock_record_store.hpp"
#include "transaction/vlock_lock_table.hpp"
#include "transaction/vlock_transaction.hpp"
#include "transaction/vlock_transaction_manager.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using namespace vlock;
using namespace std::chrono_literals;

class TransactionTest : public ::testing::Test {
protected:
    RecordStore store_;
    LockTable locks_;
    TransactionManager manager_{store_, locks_, Milliseconds(1000)};

    void SetUp() override {
        store_.forceSet("acct:1", "100");
    }
};

TEST_F(TransactionTest, BeginAssignsIncreasingIds) {
    auto a = manager_.begin();
    auto b = manager_.begin();
    EXPECT_LT(a->id(), b->id());
    EXPECT_NE(a->id(), NO_TX);
    EXPECT_EQ(a->state(), TransactionState::ACTIVE);
    EXPECT_TRUE(manager_.isActive(a->id()));
    EXPECT_EQ(manager_.getActiveTransactions().size(), 2u);
}

// acct:1 乐观并发场景
TEST_F(TransactionTest, OptimisticConflictScenario) {
    auto tx_a = manager_.begin();
    auto tx_b = manager_.begin();

    ReadResult ra = tx_a->read("acct:1", ReadMode::OPTIMISTIC);
    ReadResult rb = tx_b->read("acct:1", ReadMode::OPTIMISTIC);
    EXPECT_EQ(ra.payload, "100");
    EXPECT_EQ(ra.version, 1u);
    EXPECT_EQ(rb.version, 1u);

    ASSERT_TRUE(tx_a->write("acct:1", "150").ok());
    ConflictResult ca = tx_a->commit();
    ASSERT_TRUE(ca.ok());
    EXPECT_EQ(ca.version, 2u);
    EXPECT_EQ(tx_a->committedVersion("acct:1"), 2u);
    EXPECT_EQ(tx_a->state(), TransactionState::COMMITTED);

    ASSERT_TRUE(tx_b->write("acct:1", "200").ok());
    ConflictResult cb = tx_b->commit();
    EXPECT_EQ(cb.kind, ConflictKind::VERSION_MISMATCH);
    EXPECT_EQ(cb.expected, 1u);
    EXPECT_EQ(cb.actual, 2u);
    EXPECT_EQ(tx_b->state(), TransactionState::ROLLED_BACK);

    EXPECT_EQ(store_.get("acct:1")->payload, "150");
}

// 悲观锁场景：TxD 200ms后超时，TxC释放后TxD立即获取成功
TEST_F(TransactionTest, PessimisticTimeoutScenario) {
    TransactionManager manager(store_, locks_, Milliseconds(200));
    auto tx_c = manager.begin();
    ReadResult rc = tx_c->read("acct:1", ReadMode::PESSIMISTIC, Milliseconds(1000));
    ASSERT_TRUE(rc.found());

    auto releaser = std::async(std::launch::async, [&tx_c]() {
        std::this_thread::sleep_for(500ms);
        return tx_c->commit();
    });

    auto tx_d = manager.begin();
    auto start = std::chrono::steady_clock::now();
    ReadResult rd = tx_d->read("acct:1", ReadMode::PESSIMISTIC);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_EQ(rd.status.kind, ConflictKind::LOCK_TIMEOUT);
    EXPECT_GE(elapsed, 190ms);
    EXPECT_LT(elapsed, 450ms);
    // 加锁失败导致事务隐式回滚
    EXPECT_EQ(tx_d->state(), TransactionState::ROLLED_BACK);

    EXPECT_TRUE(releaser.get().ok());
    EXPECT_FALSE(locks_.isLocked("acct:1"));

    auto tx_d2 = manager.begin();
    start = std::chrono::steady_clock::now();
    EXPECT_TRUE(tx_d2->read("acct:1", ReadMode::PESSIMISTIC).found());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 50ms);
    EXPECT_TRUE(tx_d2->rollback().ok());
}

TEST_F(TransactionTest, DoubleRollbackIsNoOp) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->read("acct:1", ReadMode::PESSIMISTIC).found());
    EXPECT_TRUE(tx->rollback().ok());
    EXPECT_FALSE(locks_.isLocked("acct:1"));

    // 另一个事务拿到同一把锁，第二次rollback不能释放它
    auto other = manager_.begin();
    ASSERT_TRUE(other->read("acct:1", ReadMode::PESSIMISTIC).found());

    ConflictResult second = tx->rollback();
    EXPECT_EQ(second.kind, ConflictKind::INVALID_STATE);
    EXPECT_TRUE(locks_.isHeldBy("acct:1", other->id()));
    EXPECT_TRUE(other->rollback().ok());
}

TEST_F(TransactionTest, TerminalContextRejectsOperations) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->commit().ok());
    EXPECT_EQ(tx->commit().kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(tx->write("acct:1", "x").kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(tx->read("acct:1", ReadMode::OPTIMISTIC).status.kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(tx->rollback().kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(store_.get("acct:1")->payload, "100");
}

// 写入在提交前不可见，回滚后永远不可见
TEST_F(TransactionTest, RolledBackWritesAreInvisible) {
    auto tx = manager_.begin();
    tx->read("acct:1", ReadMode::OPTIMISTIC);
    ASSERT_TRUE(tx->write("acct:1", "999").ok());
    ASSERT_TRUE(tx->write("acct:2", "1").ok());
    EXPECT_EQ(tx->pendingWrites(), 2u);
    EXPECT_EQ(store_.get("acct:1")->payload, "100");

    ASSERT_TRUE(tx->rollback().ok());
    EXPECT_EQ(store_.get("acct:1")->payload, "100");
    EXPECT_EQ(store_.get("acct:1")->version, 1u);
    EXPECT_FALSE(store_.exists("acct:2"));
}

// 多键提交中任一冲突，整个写集合都不生效
TEST_F(TransactionTest, CommitIsAllOrNothingAcrossKeys) {
    store_.forceSet("acct:2", "50");

    auto tx = manager_.begin();
    tx->read("acct:1", ReadMode::OPTIMISTIC);
    tx->read("acct:2", ReadMode::OPTIMISTIC);
    tx->write("acct:1", "90");
    tx->write("acct:2", "60");

    store_.forceSet("acct:2", "55");  // 并发修改

    ConflictResult result = tx->commit();
    EXPECT_EQ(result.kind, ConflictKind::VERSION_MISMATCH);
    EXPECT_EQ(result.key, "acct:2");
    EXPECT_EQ(store_.get("acct:1")->payload, "100");
    EXPECT_EQ(store_.get("acct:2")->payload, "55");
}

TEST_F(TransactionTest, MultiKeyCommitReportsVersions) {
    auto tx = manager_.begin();
    tx->read("acct:1", ReadMode::OPTIMISTIC);
    tx->write("acct:1", "90");
    tx->write("acct:9", "10");
    ASSERT_TRUE(tx->commit().ok());
    EXPECT_EQ(tx->committedVersion("acct:1"), 2u);
    EXPECT_EQ(tx->committedVersion("acct:9"), 1u);
    EXPECT_EQ(tx->committedVersion("acct:5"), NO_VERSION);
}

// 未读过的键在write时记录版本，提交时仍做校验
TEST_F(TransactionTest, BlindWriteIsVersionChecked) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->write("acct:1", "1").ok());
    store_.forceSet("acct:1", "concurrent");
    EXPECT_EQ(tx->commit().kind, ConflictKind::VERSION_MISMATCH);
    EXPECT_EQ(store_.get("acct:1")->payload, "concurrent");
}

TEST_F(TransactionTest, ReadYourOwnWrites) {
    auto tx = manager_.begin();
    tx->read("acct:1", ReadMode::OPTIMISTIC);
    tx->write("acct:1", "123");
    ReadResult again = tx->read("acct:1", ReadMode::OPTIMISTIC);
    EXPECT_EQ(again.payload, "123");
    EXPECT_EQ(again.version, 1u);
}

TEST_F(TransactionTest, ReadMissingKey) {
    auto tx = manager_.begin();
    ReadResult read = tx->read("ghost", ReadMode::OPTIMISTIC);
    EXPECT_EQ(read.status.kind, ConflictKind::NOT_FOUND);
    EXPECT_TRUE(tx->isActive());
    tx->write("ghost", "boo");
    ConflictResult result = tx->commit();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.version, 1u);
}

// 悲观读持有锁期间的提交不做版本校验，并在提交后释放锁
TEST_F(TransactionTest, PessimisticCommitReleasesLock) {
    auto tx = manager_.begin();
    ReadResult read = tx->read("acct:1", ReadMode::PESSIMISTIC);
    ASSERT_TRUE(read.found());
    EXPECT_TRUE(locks_.isHeldBy("acct:1", tx->id()));
    std::vector<Key> locked = {"acct:1"};
    EXPECT_EQ(tx->lockedKeys(), locked);

    tx->write("acct:1", "200");
    ConflictResult result = tx->commit();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.version, 2u);
    EXPECT_FALSE(locks_.isLocked("acct:1"));
}

TEST_F(TransactionTest, LocksReleasedOnVersionMismatch) {
    store_.forceSet("acct:2", "1");
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->read("acct:1", ReadMode::PESSIMISTIC).found());
    tx->read("acct:2", ReadMode::OPTIMISTIC);
    tx->write("acct:1", "x");
    tx->write("acct:2", "x");
    store_.forceSet("acct:2", "2");

    EXPECT_EQ(tx->commit().kind, ConflictKind::VERSION_MISMATCH);
    EXPECT_FALSE(locks_.isLocked("acct:1"));
    EXPECT_EQ(store_.get("acct:1")->payload, "100");
}

// 锁被回收后提交退化为版本校验
TEST_F(TransactionTest, EvictedLockFallsBackToVersionCheck) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->read("acct:1", ReadMode::PESSIMISTIC).found());
    tx->write("acct:1", "mine");

    std::this_thread::sleep_for(20ms);
    EXPECT_EQ(manager_.reapExpiredLocks(Milliseconds(10)), 1u);
    store_.forceSet("acct:1", "theirs");

    EXPECT_EQ(tx->commit().kind, ConflictKind::VERSION_MISMATCH);
    EXPECT_EQ(store_.get("acct:1")->payload, "theirs");
}

TEST_F(TransactionTest, NoWaitPessimisticReadRollsBack) {
    auto holder = manager_.begin();
    ASSERT_TRUE(holder->read("acct:1", ReadMode::PESSIMISTIC).found());
    holder->read("acct:1", ReadMode::OPTIMISTIC);

    auto tx = manager_.begin();
    tx->write("acct:7", "pending");
    ReadResult read = tx->read("acct:1", ReadMode::PESSIMISTIC, Milliseconds(0));
    EXPECT_EQ(read.status.kind, ConflictKind::LOCK_HELD_BY_OTHER);
    EXPECT_EQ(read.status.holder, holder->id());
    EXPECT_EQ(tx->state(), TransactionState::ROLLED_BACK);
    EXPECT_EQ(tx->pendingWrites(), 0u);
    EXPECT_TRUE(holder->rollback().ok());
}

// rollback可以从另一个线程取消正在等锁的读
TEST_F(TransactionTest, RollbackCancelsPendingLockWait) {
    auto holder = manager_.begin();
    ASSERT_TRUE(holder->read("acct:1", ReadMode::PESSIMISTIC).found());

    auto waiter = manager_.begin();
    auto pending = std::async(std::launch::async, [&waiter]() {
        return waiter->read("acct:1", ReadMode::PESSIMISTIC, Milliseconds(5000));
    });
    std::this_thread::sleep_for(50ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(waiter->rollback().ok());
    ReadResult read = pending.get();
    EXPECT_EQ(read.status.kind, ConflictKind::CANCELLED);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1000ms);
    EXPECT_FALSE(locks_.isHeldBy("acct:1", waiter->id()));
    EXPECT_TRUE(locks_.isHeldBy("acct:1", holder->id()));
    EXPECT_TRUE(holder->commit().ok());
}

TEST_F(TransactionTest, DestructorRollsBackActiveContext) {
    TransactionID id;
    {
        auto tx = manager_.begin();
        id = tx->id();
        ASSERT_TRUE(tx->read("acct:1", ReadMode::PESSIMISTIC).found());
        tx->write("acct:1", "lost");
    }
    EXPECT_FALSE(locks_.isLocked("acct:1"));
    EXPECT_FALSE(manager_.isActive(id));
    EXPECT_EQ(store_.get("acct:1")->payload, "100");
}

// 外部存活检测判定持有者失效
TEST_F(TransactionTest, AbortHolderReleasesLocks) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->read("acct:1", ReadMode::PESSIMISTIC).found());
    EXPECT_TRUE(manager_.abortHolder(tx->id()));
    EXPECT_EQ(tx->state(), TransactionState::ROLLED_BACK);
    EXPECT_FALSE(locks_.isLocked("acct:1"));

    // 没有上下文的遗留锁
    ASSERT_TRUE(locks_.acquire("orphan", 4242, Milliseconds(0)).ok());
    EXPECT_TRUE(manager_.abortHolder(4242));
    EXPECT_FALSE(locks_.isLocked("orphan"));
    EXPECT_FALSE(manager_.abortHolder(4242));
}

TEST_F(TransactionTest, ReadOnlyCommitSucceeds) {
    auto tx = manager_.begin();
    tx->read("acct:1", ReadMode::OPTIMISTIC);
    store_.forceSet("acct:1", "changed");
    ConflictResult result = tx->commit();
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.version, NO_VERSION);
}

// 已有缓冲写入的键做悲观读时仍然要先加锁
TEST_F(TransactionTest, PessimisticReadAfterWriteTakesLock) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->write("acct:1", "150").ok());

    ReadResult read = tx->read("acct:1", ReadMode::PESSIMISTIC);
    ASSERT_TRUE(read.found());
    EXPECT_EQ(read.payload, "150");
    EXPECT_EQ(read.version, 1u);
    EXPECT_TRUE(locks_.isHeldBy("acct:1", tx->id()));

    auto other = manager_.begin();
    ReadResult blocked = other->read("acct:1", ReadMode::PESSIMISTIC, Milliseconds(0));
    EXPECT_EQ(blocked.status.kind, ConflictKind::LOCK_HELD_BY_OTHER);
    EXPECT_EQ(blocked.status.holder, tx->id());

    ConflictResult result = tx->commit();
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.version, 2u);
    EXPECT_EQ(store_.get("acct:1")->payload, "150");
    EXPECT_FALSE(locks_.isLocked("acct:1"));
}

TEST_F(TransactionTest, PessimisticReadAfterOptimisticReadTakesLock) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->read("acct:1", ReadMode::OPTIMISTIC).found());
    ASSERT_TRUE(tx->read("acct:1", ReadMode::PESSIMISTIC).found());
    EXPECT_TRUE(locks_.isHeldBy("acct:1", tx->id()));
    EXPECT_TRUE(tx->rollback().ok());
}

// 写缓冲存在时加锁超时同样导致隐式回滚
TEST_F(TransactionTest, PessimisticReadAfterWriteFailsWhenLocked) {
    auto holder = manager_.begin();
    ASSERT_TRUE(holder->read("acct:1", ReadMode::PESSIMISTIC).found());

    auto tx = manager_.begin();
    ASSERT_TRUE(tx->write("acct:1", "150").ok());
    ReadResult read = tx->read("acct:1", ReadMode::PESSIMISTIC, Milliseconds(0));
    EXPECT_EQ(read.status.kind, ConflictKind::LOCK_HELD_BY_OTHER);
    EXPECT_EQ(tx->state(), TransactionState::ROLLED_BACK);
    EXPECT_TRUE(holder->commit().ok());
    EXPECT_EQ(store_.get("acct:1")->payload, "100");
}

TEST_F(TransactionTest, InvalidStateCarriesStateNotKey) {
    auto tx = manager_.begin();
    ASSERT_TRUE(tx->commit().ok());
    ConflictResult result = tx->rollback();
    EXPECT_EQ(result.kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(result.state, TransactionState::COMMITTED);
    EXPECT_TRUE(result.key.empty());
    EXPECT_EQ(result.toString(), "INVALID_STATE{state=COMMITTED}");
}

// 管理器销毁时回滚存活的事务，之后的调用不再访问已销毁的锁表
TEST(TransactionLifetimeTest, ContextOutlivesManager) {
    RecordStore store;
    store.forceSet("acct:1", "100");
    auto locks = std::make_unique<LockTable>();
    auto manager = std::make_unique<TransactionManager>(store, *locks, Milliseconds(100));

    auto tx = manager->begin();
    ASSERT_TRUE(tx->read("acct:1", ReadMode::PESSIMISTIC).found());
    ASSERT_TRUE(tx->write("acct:1", "lost").ok());

    manager.reset();
    EXPECT_EQ(tx->state(), TransactionState::ROLLED_BACK);
    EXPECT_FALSE(locks->isLocked("acct:1"));
    locks.reset();

    EXPECT_EQ(tx->read("acct:1", ReadMode::PESSIMISTIC).status.kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(tx->write("acct:1", "x").kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(tx->commit().kind, ConflictKind::INVALID_STATE);
    EXPECT_EQ(tx->rollback().kind, ConflictKind::INVALID_STATE);
    tx.reset();
    EXPECT_EQ(store.get("acct:1")->payload, "100");
}
