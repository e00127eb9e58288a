/**
 * @file txn_scope_impl.cpp
 * @brief Single definition point for txn-scope state shared across DLLs.
 *
 * By default txn-scope is header-only and every module gets its own
 * Config and Agent (engine, listeners, sampler). Building this file into
 * one shared library, with TXN_SCOPE_SHARED defined for every module that
 * includes txn_scope.hpp, gives the whole process a single engine: scope
 * stacks pushed in one module can be popped in another, and every module
 * merges into the same metric store.
 *
 * ## Build Examples
 *
 * ### Linux/Mac (GCC/Clang) - Shared library
 * @code{.sh}
 * g++ -std=c++17 -DTXN_SCOPE_SHARED -fPIC -shared \
 *     src/txn_scope_impl.cpp -Iinclude -o libtxn_scope_shared.so
 * g++ -std=c++17 -DTXN_SCOPE_SHARED your_main.cpp -Iinclude -L. -ltxn_scope_shared -o app
 * @endcode
 *
 * ### Windows (MSVC)
 * @code{.sh}
 * cl /std:c++17 /DTXN_SCOPE_SHARED /LD /Iinclude src/txn_scope_impl.cpp /Fe:txn_scope_shared.dll
 * @endcode
 *
 * ## Notes
 * - Only this file defines TXN_SCOPE_IMPLEMENTATION
 * - Define TXN_SCOPE_SHARED everywhere txn_scope.hpp is used
 */

#define TXN_SCOPE_IMPLEMENTATION
#include <txn-scope/txn_scope.hpp>

#if defined(TXN_SCOPE_SHARED)
namespace txn {

/**
 * @brief Get the process-wide Agent (DLL-shared version).
 *
 * Checks for external state first (set via set_external_state()),
 * otherwise returns the static instance.
 */
Agent& agent() {
    if (g_external_agent) return *g_external_agent;
    static Agent a;
    return a;
}

} // namespace txn
#endif
