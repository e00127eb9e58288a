/**
 * @file test_dll_library.cpp
 * @brief Shared library whose traced functions feed the process-wide engine.
 *
 * Built with TXN_SCOPE_SHARED and linked against txn_scope_shared, so every
 * call below lands on the same Config, scope stacks and metric store as the
 * test executable.
 */

#include "test_dll_library.h"
#include <txn-scope/txn_scope.hpp>

void dll_load_order(int id) {
    TXN_TRACE("Database/Order/find");
    txn::log::debug("dll_load_order id=%d", id);
}

void dll_render_order() {
    TXN_TRACE("View/orders/show");
    dll_load_order(1);
}

txn::ScopeFrame* dll_push_frame(const char* tag, double time) {
    return txn::stats_engine().push_scope(tag, time);
}

bool dll_pop_frame(txn::ScopeFrame* frame, const char* name, double time) {
    try {
        return txn::stats_engine().pop_scope(frame, name, time) != nullptr;
    } catch (const txn::StackCorruptionError& e) {
        txn::log::error("%s", e.what());
        return false;
    }
}

bool dll_tracer_enabled() {
    return txn::get_config().transaction_tracer_enabled;
}
