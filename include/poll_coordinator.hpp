#ifndef POLL_COORDINATOR_H
#define POLL_COORDINATOR_H

#include "heat_pump_types.hpp"
#include "modbus_error.hpp"
#include "register_catalog.hpp"
#include "transport_session.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/// @brief What a subscriber is being told.
enum class NotificationKind {
    SnapshotUpdated,  ///< A new snapshot was published
    PollFailed,       ///< A cycle failed; the previous snapshot is still served
    PersistentFailure ///< failure_threshold consecutive cycles have failed
};

/**
 * @struct Notification
 * @brief Delivered to every subscriber, in publication order.
 *
 * All subscribers of one publication receive the same snapshot instance. On
 * failures the snapshot is the last good one (possibly the empty initial one).
 */
struct Notification {
    NotificationKind kind = NotificationKind::SnapshotUpdated;
    std::shared_ptr<const Snapshot> snapshot;
    ConnectionState state = ConnectionState::Disconnected;
    ErrorKind error = ErrorKind::None;
    std::string message;
    int consecutive_failures = 0;
    bool recovered = false; ///< First snapshot after a persistent failure
};

using SubscriberCallback = std::function<void(const Notification&)>;
using SubscriptionId = uint64_t;

/**
 * @struct SnapshotView
 * @brief Last published snapshot together with the current connection state.
 */
struct SnapshotView {
    std::shared_ptr<const Snapshot> snapshot;
    ConnectionState state;
};

/**
 * @struct ReadBlock
 * @brief One read request covering contiguous catalog registers.
 */
struct ReadBlock {
    uint16_t address;
    uint16_t count;
    std::vector<std::pair<std::string, uint16_t>> members; ///< key, word offset in the block
};

struct CoordinatorStats {
    uint64_t successful_cycles = 0;
    uint64_t failed_cycles = 0;
    uint64_t writes = 0;
};

/**
 * @class PollCoordinator
 * @brief Polls the catalog on a timer, publishes snapshots and serializes writes.
 *
 * A worker thread owns the schedule. Refresh and write requests are queued to
 * it and run in arrival order; each returns a future resolved when the request
 * is done. Poll cycles and writes never overlap on the transport session.
 * Snapshot readers never block on the link: publication swaps a
 * std::shared_ptr<const Snapshot>.
 *
 * Notifications are delivered in publication order on a separate notifier
 * thread, outside the cycle lock. A callback may call back into the
 * coordinator, including waiting on write() or requestRefresh().
 */
class PollCoordinator {
public:
    /**
     * @param config Scheduling, write-enable flag and failure threshold.
     * @param catalog The registers to poll.
     * @param transport Connection to the device, wrapped in a TransportSession.
     * @throw std::invalid_argument if the scan interval or threshold is not positive.
     */
    PollCoordinator(const PollerConfig& config, std::shared_ptr<const Catalog> catalog,
                    std::unique_ptr<ModbusTransport> transport);
    ~PollCoordinator();

    PollCoordinator(const PollCoordinator&) = delete;
    PollCoordinator& operator=(const PollCoordinator&) = delete;

    /**
     * @brief Starts the worker thread. The first scheduled cycle runs one scan
     * interval after start; call pollNow() or requestRefresh() for an immediate one.
     */
    void start();

    /**
     * @brief Stops the worker thread and closes the connection. Queued requests
     * resolve with ConnectionError. Returns once pending notifications are delivered.
     */
    void stop();

    bool isRunning() const { return running; }

    SnapshotView currentSnapshot() const;
    ConnectionState connectionState() const { return state; }

    SubscriptionId subscribe(SubscriberCallback callback);
    void unsubscribe(SubscriptionId id);

    /**
     * @brief Blocks until every notification published so far has been delivered.
     * Returns immediately when called from a subscriber callback.
     */
    void waitForNotifications();

    /// @brief Queues a poll cycle.
    std::future<OperationResult> requestRefresh();

    /**
     * @brief Validates, encodes and queues a write, followed by a poll cycle.
     *
     * WriteDisabled, UnknownKey, ReadOnlyViolation and RangeError are returned
     * immediately in a ready future; nothing is sent to the device.
     */
    std::future<OperationResult> write(const std::string& key, const Value& value);

    /// @brief Runs one poll cycle on the calling thread.
    OperationResult pollNow();

    const std::vector<ReadBlock>& readPlan() const { return read_plan; }
    const Catalog& catalog() const { return *registers; }
    bool isReadOnly() const { return config.read_only; }

    CoordinatorStats stats() const;
    SessionStats sessionStats() const { return session.stats(); }

    /// @brief Groups contiguous registers into requests of at most kMaxReadWords.
    static std::vector<ReadBlock> buildReadPlan(const Catalog& catalog);

private:
    struct Job {
        enum class Type { Refresh, Write } type;
        std::string key;
        uint16_t address = 0;
        std::vector<uint16_t> words;
        std::promise<OperationResult> promise;
    };

    void run();
    void process(Job& job);
    std::future<OperationResult> enqueue(Job job);

    OperationResult runCycle();
    OperationResult cycleFailed(ErrorKind kind, const std::string& message);
    OperationResult executeWrite(const Job& job);
    void publish(const Notification& notification);
    void deliver();

    PollerConfig config;
    std::shared_ptr<const Catalog> registers;
    std::vector<ReadBlock> read_plan;
    TransportSession session;

    // Serializes poll cycles and writes.
    std::mutex cycle_mutex;
    std::shared_ptr<const Snapshot> snapshot;
    std::atomic<ConnectionState> state;
    uint64_t sequence;
    int consecutive_failures;
    bool persistent_failure;

    std::mutex subscribers_mutex;
    std::map<SubscriptionId, SubscriberCallback> subscribers;
    SubscriptionId next_subscription;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Job> jobs;
    bool stopping;
    std::thread worker;
    std::atomic<bool> running;

    std::atomic<uint64_t> successful_cycles;
    std::atomic<uint64_t> failed_cycles;
    std::atomic<uint64_t> write_count;

    std::mutex notify_mutex;
    std::condition_variable notify_cv;
    std::deque<Notification> pending;
    uint64_t published_count;
    uint64_t delivered_count;
    bool notifier_stopping;
    std::thread notifier;
};

#endif // POLL_COORDINATOR_H
