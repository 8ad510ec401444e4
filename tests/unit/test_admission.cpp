#include <gtest/gtest.h>
#include "gatekv/admission_controller.hpp"
#include "gatekv/logger.hpp"

#include <atomic>
#include <barrier>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace gatekv;

namespace {

std::string ip(int n) {
    return "192.168.0." + std::to_string(n);
}

// Log sink that reads the controller's counters on every write.
// active_total() takes the admission lock, so a log line emitted while
// that lock is held would deadlock here.
class CounterReadingBuf : public std::stringbuf {
public:
    explicit CounterReadingBuf(const AdmissionController& controller)
        : controller_(controller) {}

    size_t writes() const { return writes_; }
    size_t last_total() const { return last_total_; }

protected:
    std::streamsize xsputn(const char* s, std::streamsize n) override {
        last_total_ = controller_.active_total();
        ++writes_;
        return std::stringbuf::xsputn(s, n);
    }

private:
    const AdmissionController& controller_;
    size_t writes_{0};
    size_t last_total_{0};
};

// Points std::clog at buf and sets the log level for one test
class ScopedLogCapture {
public:
    ScopedLogCapture(std::streambuf* buf, LogLevel level)
        : previous_buf_(std::clog.rdbuf(buf)), previous_level_(Logger::instance().level()) {
        Logger::instance().set_level(level);
    }

    ~ScopedLogCapture() {
        std::clog.rdbuf(previous_buf_);
        Logger::instance().set_level(previous_level_);
    }

private:
    std::streambuf* previous_buf_;
    LogLevel previous_level_;
};

} // namespace


TEST(AdmissionTest, RejectsZeroLimits) {
    EXPECT_THROW(AdmissionController(0, 10), std::invalid_argument);
    EXPECT_THROW(AdmissionController(1, 0), std::invalid_argument);
}

TEST(AdmissionTest, ExposesLimits) {
    AdmissionController controller{2, 7};
    EXPECT_EQ(controller.max_per_address(), 2u);
    EXPECT_EQ(controller.max_total(), 7u);
    EXPECT_EQ(controller.active_total(), 0u);
}

TEST(AdmissionTest, PerAddressLimit) {
    AdmissionController controller{1, 10};
    EXPECT_TRUE(controller.try_accept(ip(1)));
    EXPECT_FALSE(controller.try_accept(ip(1)));
    EXPECT_FALSE(controller.try_accept(ip(1)));

    EXPECT_EQ(controller.active_for(ip(1)), 1u);
    EXPECT_EQ(controller.active_total(), 1u);
    EXPECT_EQ(controller.rejected_total(), 2u);

    // other addresses are unaffected
    EXPECT_TRUE(controller.try_accept(ip(2)));
}

TEST(AdmissionTest, PerAddressLimitAboveOne) {
    AdmissionController controller{3, 10};
    EXPECT_TRUE(controller.try_accept("::1"));
    EXPECT_TRUE(controller.try_accept("::1"));
    EXPECT_TRUE(controller.try_accept("::1"));
    EXPECT_FALSE(controller.try_accept("::1"));
    EXPECT_EQ(controller.active_for("::1"), 3u);
}

TEST(AdmissionTest, TotalLimitElevenDistinctAddresses) {
    AdmissionController controller{1, 10};

    std::vector<std::string> accepted;
    std::vector<std::string> refused;
    for (int i = 1; i <= 11; i++) {
        if (controller.try_accept(ip(i)))
            accepted.push_back(ip(i));
        else
            refused.push_back(ip(i));
    }

    EXPECT_EQ(accepted.size(), 10u);
    ASSERT_EQ(refused.size(), 1u);
    EXPECT_EQ(refused[0], ip(11));
    EXPECT_EQ(controller.active_total(), 10u);
    EXPECT_EQ(controller.active_for(ip(11)), 0u);
}

TEST(AdmissionTest, ReleaseFreesSlotImmediately) {
    AdmissionController controller{1, 10};
    for (int i = 1; i <= 10; i++)
        ASSERT_TRUE(controller.try_accept(ip(i)));
    ASSERT_FALSE(controller.try_accept(ip(11)));

    controller.release(ip(1));
    EXPECT_EQ(controller.active_total(), 9u);
    EXPECT_TRUE(controller.try_accept(ip(11)));
    EXPECT_EQ(controller.active_total(), 10u);
}

TEST(AdmissionTest, ReleaseLetsSameAddressBackIn) {
    AdmissionController controller{1, 10};
    ASSERT_TRUE(controller.try_accept(ip(5)));
    ASSERT_FALSE(controller.try_accept(ip(5)));
    controller.release(ip(5));
    EXPECT_TRUE(controller.try_accept(ip(5)));
}

TEST(AdmissionTest, TotalLimitCheckedBeforePerAddress) {
    AdmissionController controller{5, 2};
    EXPECT_TRUE(controller.try_accept(ip(1)));
    EXPECT_TRUE(controller.try_accept(ip(1)));
    // address has room, service does not
    EXPECT_FALSE(controller.try_accept(ip(1)));
    EXPECT_FALSE(controller.try_accept(ip(2)));
}

TEST(AdmissionTest, ReleaseOfIdleAddressIsNoOp) {
    AdmissionController controller{1, 10};
    ASSERT_TRUE(controller.try_accept(ip(1)));

    controller.release(ip(2));
    EXPECT_EQ(controller.active_total(), 1u);

    controller.release(ip(1));
    controller.release(ip(1));
    EXPECT_EQ(controller.active_total(), 0u);
    EXPECT_EQ(controller.active_for(ip(1)), 0u);
}


// Logging

TEST(AdmissionLoggingTest, DecisionsAreLoggedAfterUnlocking) {
    AdmissionController controller{1, 2};
    CounterReadingBuf sink{controller};
    ScopedLogCapture capture{&sink, LogLevel::DEBUG};

    ASSERT_TRUE(controller.try_accept(ip(1)));
    EXPECT_EQ(sink.last_total(), 1u);

    EXPECT_FALSE(controller.try_accept(ip(1)));
    ASSERT_TRUE(controller.try_accept(ip(2)));
    EXPECT_FALSE(controller.try_accept(ip(3)));

    controller.release(ip(1));
    EXPECT_EQ(sink.last_total(), 1u);
    controller.release(ip(9));

    EXPECT_GT(sink.writes(), 0u);

    std::string out = sink.str();
    EXPECT_NE(out.find("Admitted " + ip(1) + " (address: 1, total: 1/2)"), std::string::npos);
    EXPECT_NE(out.find("Rejecting " + ip(1) + ": per-address limit reached (1/1)"), std::string::npos);
    EXPECT_NE(out.find("Rejecting " + ip(3) + ": total limit reached (2/2)"), std::string::npos);
    EXPECT_NE(out.find("Released " + ip(1) + " (total: 1/2)"), std::string::npos);
    EXPECT_NE(out.find("Release for " + ip(9) + " which holds no slot"), std::string::npos);
}

TEST(AdmissionLoggingTest, SlotResetLogsOutsideTheLock) {
    static_assert(noexcept(std::declval<AdmissionSlot&>().reset()));

    AdmissionController controller{1, 10};
    CounterReadingBuf sink{controller};
    ScopedLogCapture capture{&sink, LogLevel::DEBUG};

    auto slot = controller.try_acquire(ip(1));
    ASSERT_TRUE(slot);
    slot->reset();

    EXPECT_FALSE(slot->held());
    EXPECT_EQ(controller.active_total(), 0u);
    EXPECT_EQ(sink.last_total(), 0u);
    EXPECT_NE(sink.str().find("Released " + ip(1)), std::string::npos);
}


// AdmissionSlot

TEST(AdmissionSlotTest, ReleasesOnDestruction) {
    AdmissionController controller{1, 10};
    {
        auto slot = controller.try_acquire(ip(1));
        ASSERT_TRUE(slot.has_value());
        EXPECT_TRUE(slot->held());
        EXPECT_EQ(slot->address(), ip(1));
        EXPECT_EQ(controller.active_total(), 1u);
        EXPECT_FALSE(controller.try_acquire(ip(1)).has_value());
    }
    EXPECT_EQ(controller.active_total(), 0u);
    EXPECT_TRUE(controller.try_acquire(ip(1)).has_value());
}

TEST(AdmissionSlotTest, RejectedAcquireHoldsNothing) {
    AdmissionController controller{1, 1};
    auto first = controller.try_acquire(ip(1));
    ASSERT_TRUE(first);
    auto second = controller.try_acquire(ip(2));
    EXPECT_FALSE(second);
    EXPECT_EQ(controller.active_total(), 1u);
}

TEST(AdmissionSlotTest, MoveTransfersOwnership) {
    AdmissionController controller{1, 10};
    auto slot = controller.try_acquire(ip(1));
    ASSERT_TRUE(slot);

    AdmissionSlot moved{std::move(*slot)};
    EXPECT_FALSE(slot->held());
    EXPECT_TRUE(moved.held());

    slot.reset(); // moved-from slot must not release
    EXPECT_EQ(controller.active_total(), 1u);

    moved.reset();
    EXPECT_EQ(controller.active_total(), 0u);
}

TEST(AdmissionSlotTest, MoveAssignReleasesPreviousSlot) {
    AdmissionController controller{1, 10};
    auto a = controller.try_acquire(ip(1));
    auto b = controller.try_acquire(ip(2));
    ASSERT_TRUE(a && b);

    *a = std::move(*b);
    EXPECT_EQ(controller.active_for(ip(1)), 0u);
    EXPECT_EQ(controller.active_for(ip(2)), 1u);
    EXPECT_EQ(a->address(), ip(2));
}

TEST(AdmissionSlotTest, ResetTwiceReleasesOnce) {
    AdmissionController controller{2, 10};
    ASSERT_TRUE(controller.try_accept(ip(1)));
    auto slot = controller.try_acquire(ip(1));
    ASSERT_TRUE(slot);
    EXPECT_EQ(controller.active_for(ip(1)), 2u);

    slot->reset();
    slot->reset();
    EXPECT_EQ(controller.active_for(ip(1)), 1u);
}

TEST(AdmissionSlotTest, ReleasedWhenScopeUnwinds) {
    AdmissionController controller{1, 10};
    try {
        auto slot = controller.try_acquire(ip(1));
        ASSERT_TRUE(slot);
        throw std::runtime_error("handler blew up");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(controller.active_total(), 0u);
}


// Concurrency: every thread waits at a barrier, then all race for the slots

TEST(AdmissionConcurrencyTest, SameAddressOnlyOneWins) {
    for (int round = 0; round < 200; round++) {
        AdmissionController controller{1, 10};
        const int threads = 2;
        std::barrier start{threads};
        std::atomic<int> accepted{0};

        std::vector<std::jthread> racers;
        for (int t = 0; t < threads; t++) {
            racers.emplace_back([&]() {
                start.arrive_and_wait();
                if (controller.try_accept("10.0.0.1"))
                    ++accepted;
            });
        }
        racers.clear();

        ASSERT_EQ(accepted.load(), 1) << "round " << round;
        ASSERT_EQ(controller.active_total(), 1u);
    }
}

TEST(AdmissionConcurrencyTest, TotalLimitHoldsUnderContention) {
    const int max_total = 10;
    for (int round = 0; round < 100; round++) {
        AdmissionController controller{1, max_total};
        const int threads = max_total + 1;
        std::barrier start{threads};
        std::atomic<int> accepted{0};
        std::atomic<int> refused{0};

        std::vector<std::jthread> racers;
        for (int t = 0; t < threads; t++) {
            racers.emplace_back([&, t]() {
                start.arrive_and_wait();
                if (controller.try_accept(ip(t + 1)))
                    ++accepted;
                else
                    ++refused;
            });
        }
        racers.clear();

        ASSERT_EQ(accepted.load(), max_total) << "round " << round;
        ASSERT_EQ(refused.load(), 1) << "round " << round;
        ASSERT_EQ(controller.active_total(), static_cast<size_t>(max_total));
    }
}

// Many threads open and close slots in a loop; the limit must never be
// exceeded at any instant and every count must come back to zero.
TEST(AdmissionConcurrencyTest, ChurnNeverExceedsLimits) {
    const size_t max_total = 4;
    AdmissionController controller{2, max_total};
    std::atomic<size_t> holding{0};
    std::atomic<size_t> peak{0};
    std::atomic<int> per_address_violations{0};

    std::vector<std::jthread> workers;
    for (int t = 0; t < 8; t++) {
        workers.emplace_back([&, t]() {
            const std::string address = ip(t % 3);
            for (int i = 0; i < 2000; i++) {
                auto slot = controller.try_acquire(address);
                if (!slot)
                    continue;

                size_t now = ++holding;
                size_t seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
                if (controller.active_for(address) > 2)
                    ++per_address_violations;

                --holding;
            }
        });
    }
    workers.clear();

    EXPECT_LE(peak.load(), max_total);
    EXPECT_EQ(per_address_violations.load(), 0);
    EXPECT_EQ(controller.active_total(), 0u);
    for (int a = 0; a < 3; a++)
        EXPECT_EQ(controller.active_for(ip(a)), 0u);
}
