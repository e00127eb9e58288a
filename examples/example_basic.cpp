/**
 * @file example_basic.cpp
 * @brief Basic example: one request-like transaction with nested traced calls.
 *
 * Shows:
 * - Opening a transaction recording and naming it once dispatch is done
 * - Nested TXN_TRACE scopes with exclusive time
 * - A background frame that is not charged to its caller
 * - A TransactionSampler receiving push/pop notifications
 * - Printing the engine-wide metric table
 */

#include <txn-scope/txn_scope.hpp>
#include <chrono>
#include <cstdio>
#include <thread>

/**
 * @brief Sampler that prints each segment as it closes.
 */
struct PrintingSampler : txn::TransactionSampler {
    int depth = 0;

    void notice_push_scope(double) override { ++depth; }
    void notice_pop_scope(const std::string& name, double) override {
        --depth;
        std::printf("%*s<- %s\n", depth * 2, "", name.c_str());
    }
};

void find_order(int id) {
    TXN_TRACE("Database/Order/find");
    std::this_thread::sleep_for(std::chrono::milliseconds(2 + id));
}

void render_order() {
    TXN_TRACE("View/orders/show");
    std::this_thread::sleep_for(std::chrono::milliseconds(3));
}

/**
 * @brief Cache warm-up kicked off from the action; its own elapsed time is
 *        not deducted from the caller.
 */
void warm_cache() {
    txn::ActiveEngine& engine = txn::stats_engine();
    txn::ScopeFrame* frame = engine.push_scope("warm_cache", txn::now(), false);
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    engine.pop_scope(frame, "Custom/cache/warm");
}

void show_order() {
    TXN_TRACE("Controller/orders/show");
    for (int id = 0; id < 3; ++id) {
        find_order(id);
    }
    warm_cache();
    render_order();
}

int main() {
    PrintingSampler sampler;
    txn::set_transaction_sampler(&sampler);
    txn::get_config().log_level = txn::LogLevel::Info;

    txn::ActiveEngine& engine = txn::stats_engine();

    engine.start_transaction();
    engine.push_transaction_stats();
    show_order();

    // The route is only known once dispatch has finished
    engine.set_current_transaction_name("OrdersController#show");
    engine.pop_transaction_stats(engine.current_transaction_name().value_or("Unknown"));
    engine.end_transaction();

    txn::set_transaction_sampler(nullptr);
    txn::stats::print_stats(stdout);
    return 0;
}
