#include "scheduler.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <unordered_map>
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "judge/aggregator.hpp"
#include "judge/harness.hpp"

namespace grader {
using namespace std;

/**
 * @brief 调度器的全部可变状态，只能在持有 mut 时访问
 * worker 线程和票据通过 shared_ptr / weak_ptr 引用它
 */
struct scheduler_state {
    explicit scheduler_state(const scheduler_options &options)
        : options(options), scratch_prefixes(scratch_path_prefixes(SCRATCH_DIR)) {}

    const scheduler_options options;

    // 汇总结果时从输出中去掉的临时目录路径
    const vector<string> scratch_prefixes;

    mutable mutex mut;
    condition_variable cond;

    // 排队中的请求，按提交顺序
    deque<shared_ptr<grading_ticket>> queue;

    // 运行中的请求
    vector<shared_ptr<grading_ticket>> running;

    // 每个调用方排队中和运行中的请求数，为 0 时删除
    unordered_map<string, size_t> in_flight;

    bool stopping = false;
    uint64_t next_id = 0;

    /**
     * @brief 归还调用方的一个名额，调用前必须持有 mut
     */
    void release_caller(const string &caller_id) {
        auto it = in_flight.find(caller_id);
        if (it == in_flight.end()) return;
        if (--it->second == 0) in_flight.erase(it);
    }

    bool cancel(grading_ticket &ticket);

    void worker_loop(shared_ptr<sandbox> box, size_t worker_id);
};

static grading_result cancelled_result(const exercise &ex) {
    harness_outcome outcome;
    outcome.cancelled = true;
    return aggregate(ex, {}, outcome, 0);
}

bool scheduler_state::cancel(grading_ticket &ticket) {
    shared_ptr<grading_ticket> removed;
    request_state state;
    {
        scoped_lock guard(mut);
        switch (state = ticket.state_.load()) {
            case request_state::QUEUED: {
                auto it = find_if(queue.begin(), queue.end(),
                                  [&](const shared_ptr<grading_ticket> &t) { return t.get() == &ticket; });
                if (it == queue.end()) return false;
                removed = *it;
                queue.erase(it);
                release_caller(ticket.caller_id_);
                ticket.state_ = request_state::CANCELLED;
                break;
            }
            case request_state::RUNNING:
                ticket.cancellation.cancel();
                break;
            default:
                break;
        }
    }

    if (state != request_state::QUEUED && state != request_state::RUNNING) {
        DLOG(INFO) << "request " << ticket.id_ << " is already " << get_state_name(state) << ", nothing to cancel";
        return false;
    }
    if (removed) {
        removed->promise.set_value(cancelled_result(*removed->ex));
        LOG(INFO) << "request " << ticket.id_ << " of " << ticket.caller_id_ << " cancelled while queued";
    } else {
        LOG(INFO) << "request " << ticket.id_ << " of " << ticket.caller_id_ << " cancelling while running";
    }
    return true;
}

grading_ticket::grading_ticket(string caller_id, shared_ptr<const exercise> ex, string code,
                               weak_ptr<scheduler_state> owner)
    : caller_id_(move(caller_id)), ex(move(ex)), code(move(code)), owner(move(owner)) {
    future = promise.get_future().share();
}

uint64_t grading_ticket::id() const {
    return id_;
}

const string &grading_ticket::caller_id() const {
    return caller_id_;
}

request_state grading_ticket::state() const {
    return state_.load();
}

grading_result grading_ticket::wait() const {
    return future.get();
}

bool grading_ticket::wait_for(chrono::milliseconds timeout) const {
    return future.wait_for(timeout) == future_status::ready;
}

bool grading_ticket::cancel() {
    auto state = owner.lock();
    if (!state) return false;
    return state->cancel(*this);
}

/**
 * @brief 在当前线程运行一个请求的所有测试点
 */
static grading_result run_request(sandbox &box, const exercise &ex, const string &code,
                                  const cancellation_token &cancellation, const vector<string> &scratch_prefixes) {
    elapsed_time timer;
    test_harness harness(box);
    harness_run run = harness.run(ex, code, cancellation);

    vector<test_verdict> verdicts;
    test_verdict verdict;
    while (run.next(verdict))
        verdicts.push_back(move(verdict));

    harness_outcome outcome;
    outcome.truncated = run.truncated();
    outcome.infrastructure_error = run.infrastructure_failed();
    outcome.cancelled = run.cancelled();
    return aggregate(ex, move(verdicts), outcome, timer.duration<chrono::milliseconds>().count(), scratch_prefixes);
}

void scheduler_state::worker_loop(shared_ptr<sandbox> box, size_t worker_id) {
    while (true) {
        shared_ptr<grading_ticket> ticket;
        {
            unique_lock<mutex> lock(mut);
            cond.wait(lock, [&] { return stopping || !queue.empty(); });
            if (queue.empty()) break;  // stopping
            ticket = queue.front();
            queue.pop_front();
            ticket->state_ = request_state::RUNNING;
            running.push_back(ticket);
        }

        grading_result result;
        try {
            result = run_request(*box, *ticket->ex, ticket->code, ticket->cancellation, scratch_prefixes);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed when grading request " << ticket->id_
                       << ", " << ex.what();
            harness_outcome outcome;
            outcome.infrastructure_error = true;
            outcome.truncated = true;
            result = aggregate(*ticket->ex, {}, outcome, 0);
        }

        {
            scoped_lock guard(mut);
            running.erase(find(running.begin(), running.end(), ticket));
            release_caller(ticket->caller_id_);
            ticket->state_ = result.overall_status == grading_status::CANCELLED
                                 ? request_state::CANCELLED
                                 : request_state::COMPLETED;
        }

        LOG(INFO) << fmt::format("Worker {} finished request {} of {}: {}, score {}/{}, {}ms",
                                 worker_id, ticket->id_, ticket->caller_id_,
                                 get_status_name(result.overall_status), result.score, result.max_score,
                                 result.total_duration_ms);
        ticket->promise.set_value(move(result));
    }
}

grading_scheduler::grading_scheduler(shared_ptr<sandbox> box, scheduler_options options)
    : box(move(box)) {
    if (options.workers == 0 || options.queue_depth == 0 || options.per_caller_limit == 0)
        throw configuration_error("scheduler workers, queue depth and per-caller limit must be positive");
    if (!this->box)
        throw configuration_error("scheduler requires a sandbox");

    state = make_shared<scheduler_state>(options);
    for (size_t i = 0; i < options.workers; ++i)
        workers.emplace_back(&scheduler_state::worker_loop, state, this->box, i);
    LOG(INFO) << fmt::format("Scheduler started with {} workers, queue depth {}, per-caller limit {}",
                             options.workers, options.queue_depth, options.per_caller_limit);
}

grading_scheduler::~grading_scheduler() {
    stop();
}

shared_ptr<grading_ticket> grading_scheduler::submit(shared_ptr<const exercise> ex, string code,
                                                     const string &caller_id) {
    if (!ex) throw configuration_error("exercise must not be null");
    validate_exercise(*ex);

    shared_ptr<grading_ticket> ticket(new grading_ticket(caller_id, move(ex), move(code), state));
    optional<rejection_error::reason> rejected;
    size_t depth = 0;
    {
        scoped_lock guard(state->mut);
        auto it = state->in_flight.find(caller_id);
        size_t caller_count = it == state->in_flight.end() ? 0 : it->second;
        if (state->stopping)
            rejected = rejection_error::reason::STOPPED;
        else if (state->queue.size() >= state->options.queue_depth)
            rejected = rejection_error::reason::QUEUE_FULL;
        else if (caller_count >= state->options.per_caller_limit)
            rejected = rejection_error::reason::CALLER_LIMIT;
        else {
            ticket->id_ = ++state->next_id;
            state->queue.push_back(ticket);
            ++state->in_flight[caller_id];
            depth = state->queue.size();
        }
    }

    if (rejected) {
        string message;
        switch (*rejected) {
            case rejection_error::reason::STOPPED: message = "grading scheduler is stopped"; break;
            case rejection_error::reason::QUEUE_FULL: message = "grading queue is full, try again later"; break;
            case rejection_error::reason::CALLER_LIMIT:
                message = fmt::format("caller {} already has {} request(s) in flight, try again later",
                                      caller_id, state->options.per_caller_limit);
                break;
        }
        LOG(WARNING) << "Rejected request of " << caller_id << ": " << message;
        throw rejection_error(*rejected, message);
    }

    state->cond.notify_one();
    LOG(INFO) << "Accepted request " << ticket->id_ << " of " << caller_id << ", " << depth << " queued";
    return ticket;
}

grading_result grading_scheduler::grade(shared_ptr<const exercise> ex, string code, const string &caller_id) {
    return submit(move(ex), move(code), caller_id)->wait();
}

bool grading_scheduler::cancel(grading_ticket &ticket) {
    return state->cancel(ticket);
}

void grading_scheduler::stop() {
    deque<shared_ptr<grading_ticket>> dropped;
    {
        scoped_lock guard(state->mut);
        state->stopping = true;
        dropped.swap(state->queue);
        for (auto &ticket : dropped) {
            state->release_caller(ticket->caller_id_);
            ticket->state_ = request_state::CANCELLED;
        }
    }
    state->cond.notify_all();

    for (auto &ticket : dropped)
        ticket->promise.set_value(cancelled_result(*ticket->ex));
    if (!dropped.empty())
        LOG(INFO) << "Scheduler stopping, cancelled " << dropped.size() << " queued request(s)";

    for (auto &worker : workers)
        if (worker.joinable()) worker.join();
}

size_t grading_scheduler::queued() const {
    scoped_lock guard(state->mut);
    return state->queue.size();
}

size_t grading_scheduler::in_flight(const string &caller_id) const {
    scoped_lock guard(state->mut);
    auto it = state->in_flight.find(caller_id);
    return it == state->in_flight.end() ? 0 : it->second;
}

}  // namespace grader
