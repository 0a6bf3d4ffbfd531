#include "poll_coordinator.hpp"
#include "value_codec.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <stdexcept>

namespace {

std::future<OperationResult> ready(OperationResult result) {
    std::promise<OperationResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

PollCoordinator::PollCoordinator(const PollerConfig& cfg, std::shared_ptr<const Catalog> catalog,
                                 std::unique_ptr<ModbusTransport> transport)
    : config(cfg), registers(std::move(catalog)), session(std::move(transport)),
      snapshot(std::make_shared<const Snapshot>()), state(ConnectionState::Disconnected), sequence(0),
      consecutive_failures(0), persistent_failure(false), next_subscription(1), stopping(false), running(false),
      successful_cycles(0), failed_cycles(0), write_count(0), published_count(0), delivered_count(0),
      notifier_stopping(false) {
    if (!registers) {
        throw std::invalid_argument("PollCoordinator requires a catalog");
    }
    if (config.scan_interval.count() <= 0) {
        throw std::invalid_argument("Scan interval must be positive");
    }
    if (config.failure_threshold < 1) {
        throw std::invalid_argument("Failure threshold must be at least 1");
    }
    read_plan = buildReadPlan(*registers);
    notifier = std::thread(&PollCoordinator::deliver, this);
}

PollCoordinator::~PollCoordinator() {
    stop();
    {
        std::lock_guard<std::mutex> lock(notify_mutex);
        notifier_stopping = true;
    }
    notify_cv.notify_all();
    if (notifier.joinable()) {
        notifier.join();
    }
}

std::vector<ReadBlock> PollCoordinator::buildReadPlan(const Catalog& catalog) {
    std::vector<std::pair<std::string, RegisterDescriptor>> sorted(catalog.all().begin(), catalog.all().end());
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second.address < b.second.address;
    });

    std::vector<ReadBlock> plan;
    for (const auto& entry : sorted) {
        const RegisterDescriptor& d = entry.second;
        bool extend = !plan.empty() && plan.back().address + plan.back().count == d.address &&
                      plan.back().count + d.word_count <= kMaxReadWords;
        if (!extend) {
            plan.push_back(ReadBlock{d.address, 0, {}});
        }
        ReadBlock& block = plan.back();
        block.members.emplace_back(entry.first, block.count);
        block.count = static_cast<uint16_t>(block.count + d.word_count);
    }
    return plan;
}

void PollCoordinator::start() {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (running) return;
    stopping = false;
    running = true;
    worker = std::thread(&PollCoordinator::run, this);
}

void PollCoordinator::stop() {
    bool was_running;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        was_running = running;
        stopping = true;
    }
    if (was_running) {
        queue_cv.notify_all();
        if (worker.joinable()) {
            worker.join();
        }
        running = false;
        session.close();
    }
    waitForNotifications();
}

void PollCoordinator::run() {
    std::cout << "Polling coordinator started, scan interval " << config.scan_interval.count() << "s" << std::endl;
    auto next_poll = std::chrono::steady_clock::now() + config.scan_interval;

    while (true) {
        std::unique_lock<std::mutex> lock(queue_mutex);
        queue_cv.wait_until(lock, next_poll, [this] { return stopping || !jobs.empty(); });
        if (stopping) break;

        if (!jobs.empty()) {
            Job job = std::move(jobs.front());
            jobs.pop_front();
            lock.unlock();
            process(job);
            continue;
        }
        lock.unlock();

        auto now = std::chrono::steady_clock::now();
        if (now >= next_poll) {
            pollNow();
            next_poll += config.scan_interval;
            if (next_poll <= now) {
                next_poll = now + config.scan_interval;
            }
        }
    }

    // Resolve whatever is still queued.
    std::deque<Job> abandoned;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        abandoned.swap(jobs);
    }
    for (auto& job : abandoned) {
        job.promise.set_value(OperationResult::failure(ErrorKind::ConnectionError, "coordinator stopped"));
    }
    std::cout << "Polling coordinator stopped." << std::endl;
}

void PollCoordinator::process(Job& job) {
    OperationResult result;
    if (job.type == Job::Type::Write) {
        result = executeWrite(job);
    } else {
        result = pollNow();
    }
    job.promise.set_value(std::move(result));
}

std::future<OperationResult> PollCoordinator::enqueue(Job job) {
    std::future<OperationResult> future = job.promise.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (!running || stopping) {
            return ready(OperationResult::failure(ErrorKind::ConnectionError, "coordinator is not running"));
        }
        jobs.push_back(std::move(job));
    }
    queue_cv.notify_one();
    return future;
}

std::future<OperationResult> PollCoordinator::requestRefresh() {
    Job job;
    job.type = Job::Type::Refresh;
    return enqueue(std::move(job));
}

std::future<OperationResult> PollCoordinator::write(const std::string& key, const Value& value) {
    if (config.read_only) {
        return ready(OperationResult::failure(ErrorKind::WriteDisabled,
                                              "Cannot write " + key + ": coordinator is in read-only mode"));
    }

    Job job;
    job.type = Job::Type::Write;
    job.key = key;
    try {
        const RegisterDescriptor& descriptor = registers->lookup(key);
        if (descriptor.access != RegisterAccess::ReadWrite) {
            return ready(OperationResult::failure(ErrorKind::ReadOnlyViolation, "Register " + key + " is read-only"));
        }
        job.address = descriptor.address;
        job.words = ValueCodec::encode(value, descriptor);
    } catch (const ModbusError& e) {
        std::cerr << "Rejected write to " << key << ": " << e.what() << std::endl;
        return ready(OperationResult::from(e));
    }
    return enqueue(std::move(job));
}

OperationResult PollCoordinator::executeWrite(const Job& job) {
    std::lock_guard<std::mutex> lock(cycle_mutex);
    try {
        session.writeWords(job.address, job.words);
    } catch (const ModbusError& e) {
        std::cerr << "Write to " << job.key << " failed: " << e.what() << std::endl;
        return OperationResult::from(e);
    }
    ++write_count;
    std::cout << "Wrote " << job.key << " (0x" << std::hex << job.address << std::dec << ", "
              << job.words.size() << " words)" << std::endl;

    // Refresh before the caller hears back so the next snapshot reflects the write.
    OperationResult refresh = runCycle();
    if (!refresh.ok()) {
        return OperationResult{ErrorKind::None, "written; refresh failed: " + refresh.message};
    }
    return OperationResult::success();
}

OperationResult PollCoordinator::pollNow() {
    std::lock_guard<std::mutex> lock(cycle_mutex);
    return runCycle();
}

OperationResult PollCoordinator::runCycle() {
    std::map<std::string, Value> values;
    try {
        for (const ReadBlock& block : read_plan) {
            std::vector<uint16_t> words = session.readWords(block.address, block.count);
            for (const auto& member : block.members) {
                values[member.first] = ValueCodec::decodeAt(words, member.second, registers->lookup(member.first));
            }
        }
    } catch (const ModbusError& e) {
        return cycleFailed(e.kind(), e.what());
    }

    auto next = std::make_shared<Snapshot>();
    next->values = std::move(values);
    next->sequence = ++sequence;
    next->timestamp = std::chrono::system_clock::now();
    std::shared_ptr<const Snapshot> published = next;
    std::atomic_store(&snapshot, published);

    bool recovered = persistent_failure;
    if (recovered) {
        std::cout << "Device reachable again after " << consecutive_failures << " failed cycles" << std::endl;
    }
    consecutive_failures = 0;
    persistent_failure = false;
    state = ConnectionState::Connected;
    ++successful_cycles;

    Notification n;
    n.kind = NotificationKind::SnapshotUpdated;
    n.snapshot = published;
    n.state = ConnectionState::Connected;
    n.recovered = recovered;
    publish(n);
    return OperationResult::success();
}

OperationResult PollCoordinator::cycleFailed(ErrorKind kind, const std::string& message) {
    ++consecutive_failures;
    ++failed_cycles;
    std::shared_ptr<const Snapshot> last = std::atomic_load(&snapshot);
    // Degraded only makes sense once there is something to serve.
    state = last->sequence > 0 ? ConnectionState::Degraded : ConnectionState::Disconnected;
    std::cerr << "Poll cycle failed (" << errorKindName(kind) << ", " << consecutive_failures
              << " consecutive): " << message << std::endl;

    Notification n;
    n.kind = NotificationKind::PollFailed;
    n.snapshot = last;
    n.state = state;
    n.error = kind;
    n.message = message;
    n.consecutive_failures = consecutive_failures;
    publish(n);

    if (consecutive_failures == config.failure_threshold) {
        persistent_failure = true;
        std::cerr << "Device unreachable for " << consecutive_failures << " consecutive cycles" << std::endl;
        n.kind = NotificationKind::PersistentFailure;
        publish(n);
    }
    return OperationResult::failure(kind, message);
}

void PollCoordinator::publish(const Notification& notification) {
    {
        std::lock_guard<std::mutex> lock(notify_mutex);
        pending.push_back(notification);
        ++published_count;
    }
    notify_cv.notify_all();
}

void PollCoordinator::deliver() {
    std::unique_lock<std::mutex> lock(notify_mutex);
    while (true) {
        notify_cv.wait(lock, [this] { return notifier_stopping || !pending.empty(); });
        if (pending.empty()) break;

        Notification notification = std::move(pending.front());
        pending.pop_front();
        lock.unlock();

        std::vector<SubscriberCallback> targets;
        {
            std::lock_guard<std::mutex> guard(subscribers_mutex);
            for (const auto& entry : subscribers) {
                targets.push_back(entry.second);
            }
        }
        for (const auto& callback : targets) {
            try {
                callback(notification);
            } catch (const std::exception& e) {
                std::cerr << "Subscriber callback threw: " << e.what() << std::endl;
            }
        }

        lock.lock();
        ++delivered_count;
        notify_cv.notify_all();
    }
}

void PollCoordinator::waitForNotifications() {
    if (std::this_thread::get_id() == notifier.get_id()) return;

    std::unique_lock<std::mutex> lock(notify_mutex);
    uint64_t target = published_count;
    notify_cv.wait(lock, [&] { return delivered_count >= target; });
}

SnapshotView PollCoordinator::currentSnapshot() const {
    return SnapshotView{std::atomic_load(&snapshot), state.load()};
}

SubscriptionId PollCoordinator::subscribe(SubscriberCallback callback) {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    SubscriptionId id = next_subscription++;
    subscribers.emplace(id, std::move(callback));
    return id;
}

void PollCoordinator::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(subscribers_mutex);
    subscribers.erase(id);
}

CoordinatorStats PollCoordinator::stats() const {
    CoordinatorStats s;
    s.successful_cycles = successful_cycles.load();
    s.failed_cycles = failed_cycles.load();
    s.writes = write_count.load();
    return s;
}
