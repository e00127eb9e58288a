/**
 * @file example_threads.cpp
 * @brief Concurrent transactions on threads and on explicitly bound contexts.
 *
 * Shows:
 * - Worker threads each running their own transactions
 * - ContextBinding carrying a task's scope stack across threads
 * - Stats printed at exit via Config::print_stats
 */

#include <txn-scope/txn_scope.hpp>
#include <chrono>
#include <cstdio>
#include <string>
#include <thread>
#include <vector>

void charge_card() {
    TXN_TRACE("External/payments/charge");
    std::this_thread::sleep_for(std::chrono::milliseconds(4));
}

void process_job(int worker, int n) {
    txn::ActiveEngine& engine = txn::stats_engine();
    engine.start_transaction();
    engine.push_transaction_stats();
    {
        TXN_TRACE("OtherTransaction/Job/checkout");
        charge_card();
    }
    std::string name = "Job/checkout/" + std::to_string(worker % 2);
    engine.pop_transaction_stats(name);
    engine.end_transaction();
    txn::log::debug("worker %d finished job %d", worker, n);
}

int main() {
    txn::get_config().print_stats = true;
    txn::get_config().stats_out = stdout;

    std::vector<std::thread> workers;
    for (int w = 0; w < 4; ++w) {
        workers.emplace_back([w] {
            for (int n = 0; n < 5; ++n) process_job(w, n);
        });
    }
    for (auto& t : workers) t.join();

    // A task that starts on one thread and resumes on another
    const txn::ContextId task_id = 0x7a5c;
    txn::ScopeFrame* frame = nullptr;
    std::thread start([&] {
        txn::ContextBinding bind(task_id);
        txn::stats_engine().push_transaction_stats();
        frame = txn::stats_engine().push_scope("resumable_task");
    });
    start.join();

    std::thread resume([&] {
        txn::ContextBinding bind(task_id);
        charge_card();
        std::unique_ptr<txn::ScopeFrame> done = txn::stats_engine().pop_scope(frame, "OtherTransaction/Task/resume");
        double elapsed = txn::now() - done->start_time;
        txn::stats_engine().record_metrics({txn::MetricSpec("OtherTransaction/Task/resume", txn::kScopePlaceholder)},
                                           elapsed, elapsed - done->children_time);
        txn::stats_engine().pop_transaction_stats("Task/resume");
        txn::stats_engine().end_transaction();
    });
    resume.join();

    std::printf("Ran %d transactions\n", 4 * 5 + 1);
    return 0;  // metric table printed by the exit handler
}
