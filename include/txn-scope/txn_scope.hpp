#pragma once
/**
 * @file txn_scope.hpp
 * @brief Header-only nested scope tracking and time attribution for transactions.
 *
 * Features:
 *  - push_scope()/pop_scope(): per-context LIFO stack of in-flight traced
 *    operations with exclusive (self) time bookkeeping.
 *  - push_transaction_stats()/pop_transaction_stats(): per-context stack of
 *    metric accumulators; placeholder scopes are resolved to the transaction
 *    name at pop and merged into the engine-wide store.
 *  - TXN_TRACE(name): RAII traced scope that records call/exclusive time.
 *  - Execution contexts: one state per thread by default, or per explicit
 *    id bound with ContextBinding (fibers, tasks, pooled work items).
 *  - INI configuration, leveled logging, stats report at exit.
 *
 * Build-time defines:
 *   TXN_ENABLED   (default 1)  // 0 selects StatsEngineShim, TXN_TRACE expands to nothing
 *
 * DLL Boundary Support:
 *   By default, this is a header-only library. Each DLL/executable gets its own
 *   copy of the engine state.
 *
 *   To share engine state across DLL boundaries:
 *   1. Build src/txn_scope_impl.cpp (defines TXN_SCOPE_IMPLEMENTATION) into
 *      your main executable or one shared library.
 *   2. Define TXN_SCOPE_SHARED everywhere txn_scope.hpp is included.
 */

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

// DLL export/import macros for shared state across DLL boundaries
#ifndef TXN_SCOPE_API
  #if defined(TXN_SCOPE_SHARED)
    #if defined(_WIN32) || defined(__CYGWIN__)
      #if defined(TXN_SCOPE_IMPLEMENTATION)
        #define TXN_SCOPE_API __declspec(dllexport)
      #else
        #define TXN_SCOPE_API __declspec(dllimport)
      #endif
    #elif defined(__GNUC__) && __GNUC__ >= 4
      #define TXN_SCOPE_API __attribute__((visibility("default")))
    #else
      #define TXN_SCOPE_API
    #endif
  #else
    #define TXN_SCOPE_API
  #endif
#endif

// Storage class for variables: inline for header-only, extern for DLL shared,
// a plain exported definition in the one implementation file
#if defined(TXN_SCOPE_SHARED) && !defined(TXN_SCOPE_IMPLEMENTATION)
  #define TXN_SCOPE_VAR extern TXN_SCOPE_API
#elif defined(TXN_SCOPE_SHARED)
  #define TXN_SCOPE_VAR TXN_SCOPE_API
#else
  #define TXN_SCOPE_VAR inline
#endif

#ifndef TXN_ENABLED
#define TXN_ENABLED 1
#endif

// Version information
#define TXN_SCOPE_VERSION "0.3.0"
#define TXN_SCOPE_VERSION_MAJOR 0
#define TXN_SCOPE_VERSION_MINOR 3
#define TXN_SCOPE_VERSION_PATCH 0

namespace txn {

// Forward declarations
struct Config;
struct Agent;
class StatsEngine;

/** @brief Severity of a diagnostic line written by txn::log. */
enum class LogLevel {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3
};

/**
 * @brief INI file parser utilities for configuration loading.
 *
 * Supports comments (# and ;), [sections], key = value pairs,
 * quoted strings and the usual boolean spellings.
 */
namespace ini_parser {

/**
 * @brief Trim whitespace from both ends of a string.
 */
inline std::string trim(const std::string& str) {
    size_t start = 0;
    size_t end = str.length();

    while (start < end && std::isspace((unsigned char)str[start])) ++start;
    while (end > start && std::isspace((unsigned char)str[end - 1])) --end;

    return str.substr(start, end - start);
}

/**
 * @brief Lowercase copy of a trimmed string.
 */
inline std::string lower(const std::string& str) {
    std::string v = trim(str);
    for (char& c : v) {
        c = (char)std::tolower((unsigned char)c);
    }
    return v;
}

/**
 * @brief Parse boolean value from string.
 *
 * Accepts: true/false, 1/0, on/off, yes/no (case-insensitive)
 */
inline bool parse_bool(const std::string& value) {
    std::string v = lower(value);

    if (v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "off" || v == "no") return false;

    return false;  // Default to false on parse error
}

/**
 * @brief Remove quotes from string if present.
 */
inline std::string unquote(const std::string& str) {
    std::string s = trim(str);
    if (s.length() >= 2 && s[0] == '"' && s[s.length()-1] == '"') {
        return s.substr(1, s.length() - 2);
    }
    return s;
}

/**
 * @brief Parse a log level name (error, warn/warning, info, debug).
 * @return true if @p value named a level; @p out is left untouched otherwise.
 */
inline bool parse_log_level(const std::string& value, LogLevel& out) {
    std::string v = lower(value);
    if (v == "error") out = LogLevel::Error;
    else if (v == "warn" || v == "warning") out = LogLevel::Warn;
    else if (v == "info") out = LogLevel::Info;
    else if (v == "debug") out = LogLevel::Debug;
    else return false;
    return true;
}

} // namespace ini_parser

/**
 * @brief Global configuration for the agent core.
 *
 * All settings can be modified at runtime. The tracing flags are atomics
 * read once per push/pop, so flipping them mid-transaction (from any
 * thread) only affects later events.
 */
struct Config {
    bool agent_enabled = true;               ///< Instrumentation on/off (TracedScope becomes a no-op when false)
    std::atomic<bool> developer_mode{false};             ///< Developer mode also feeds the sampler
    std::atomic<bool> transaction_tracer_enabled{true};  ///< Notify the TransactionSampler on push/pop

    // Logging
    LogLevel log_level = LogLevel::Warn;     ///< Lines above this level are dropped
    FILE* log_out = stderr;                  ///< Log sink (default: stderr)

    // Reporting
    bool print_stats = false;                ///< Print the engine-wide metric table at program exit
    FILE* stats_out = stderr;                ///< Stats report destination

    /**
     * @brief True when push/pop events should reach the TransactionSampler.
     */
    bool sampler_enabled() const {
        return transaction_tracer_enabled.load(std::memory_order_relaxed) ||
               developer_mode.load(std::memory_order_relaxed);
    }

    /**
     * @brief Load configuration from INI file.
     *
     * Supports sections: [agent], [transaction_tracer], [log], [performance]
     *
     * @param path Path to INI file (relative or absolute)
     * @return true on success, false if the file could not be opened
     *
     * Example INI format:
     * @code
     * [agent]
     * enabled = true
     * developer_mode = off
     *
     * [transaction_tracer]
     * enabled = yes
     *
     * [log]
     * level = info
     * file = "agent.log"
     * @endcode
     */
    inline bool load_from_file(const char* path);
};
TXN_SCOPE_VAR Config config;

// External state pointers for DLL-safe cross-boundary sharing (header-only solution)
// When set, these override the default instances
inline Config* g_external_config = nullptr;
inline Agent* g_external_agent = nullptr;

/**
 * @brief Get the active config instance.
 *
 * Returns external config if set via set_external_state(),
 * otherwise returns the default inline instance.
 */
inline Config& get_config() {
    return g_external_config ? *g_external_config : config;
}

/**
 * @brief Leveled diagnostics written to Config::log_out.
 *
 * Lines look like "txn-scope: Warning: <message>". None of these are on
 * the push/pop hot path.
 */
namespace log {

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Error: return "Error";
    case LogLevel::Warn:  return "Warning";
    case LogLevel::Info:  return "Info";
    case LogLevel::Debug: return "Debug";
    }
    return "Unknown";
}

inline bool enabled(LogLevel level) {
    return (int)level <= (int)get_config().log_level;
}

inline void vwrite(LogLevel level, const char* fmt, va_list ap) {
    if (!enabled(level)) return;

    char buf[1024];
    int n = std::vsnprintf(buf, sizeof(buf), fmt, ap);
    if (n < 0) buf[0] = 0;

    std::lock_guard<std::mutex> lock(log_mutex());
    FILE* out = get_config().log_out ? get_config().log_out : stderr;
    std::fprintf(out, "txn-scope: %s: %s\n", level_name(level), buf);
    std::fflush(out);
}

inline void error(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vwrite(LogLevel::Error, fmt, ap);
    va_end(ap);
}

inline void warn(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vwrite(LogLevel::Warn, fmt, ap);
    va_end(ap);
}

inline void info(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vwrite(LogLevel::Info, fmt, ap);
    va_end(ap);
}

inline void debug(const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    vwrite(LogLevel::Debug, fmt, ap);
    va_end(ap);
}

} // namespace log

namespace internal {

/**
 * @brief Swap @p sink to @p replacement under the log lock, then close the old stream.
 *
 * Writers only touch a sink while holding the lock, so nothing can still
 * be using the old stream once the swap returns.
 */
inline void replace_sink(FILE*& sink, FILE* replacement) {
    FILE* old = nullptr;
    {
        std::lock_guard<std::mutex> lock(log::log_mutex());
        old = sink;
        sink = replacement;
    }
    if (old && old != stderr && old != stdout) std::fclose(old);
}

} // namespace internal

/**
 * @brief Config::load_from_file() implementation.
 */
inline bool Config::load_from_file(const char* path) {
    FILE* f = std::fopen(path, "r");
    if (!f) {
        log::warn("Could not open config file: %s", path);
        return false;
    }

    std::string current_section;
    char line_buf[512];
    int line_num = 0;

    while (std::fgets(line_buf, sizeof(line_buf), f)) {
        ++line_num;
        std::string line = ini_parser::trim(line_buf);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Parse section header [section_name]
        if (line[0] == '[' && line[line.length()-1] == ']') {
            current_section = ini_parser::trim(line.substr(1, line.length() - 2));
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            log::warn("Invalid line in %s:%d (no '=')", path, line_num);
            continue;
        }

        std::string key = ini_parser::trim(line.substr(0, eq_pos));
        std::string value = ini_parser::trim(line.substr(eq_pos + 1));

        // Remove inline comments from value
        size_t comment_pos = value.find('#');
        if (comment_pos == std::string::npos) {
            comment_pos = value.find(';');
        }
        if (comment_pos != std::string::npos) {
            value = ini_parser::trim(value.substr(0, comment_pos));
        }

        if (current_section == "agent") {
            if (key == "enabled") agent_enabled = ini_parser::parse_bool(value);
            else if (key == "developer_mode") developer_mode = ini_parser::parse_bool(value);
        }
        else if (current_section == "transaction_tracer") {
            if (key == "enabled") transaction_tracer_enabled = ini_parser::parse_bool(value);
        }
        else if (current_section == "log") {
            if (key == "level") {
                if (!ini_parser::parse_log_level(value, log_level)) {
                    log::warn("Unknown log level '%s' in %s:%d", value.c_str(), path, line_num);
                }
            }
            else if (key == "file") {
                FILE* new_out = std::fopen(ini_parser::unquote(value).c_str(), "a");
                if (new_out) {
                    internal::replace_sink(log_out, new_out);
                } else {
                    log::warn("Could not open log file '%s' from %s:%d", value.c_str(), path, line_num);
                }
            }
        }
        else if (current_section == "performance") {
            if (key == "print_stats") print_stats = ini_parser::parse_bool(value);
            else if (key == "file") {
                FILE* new_out = std::fopen(ini_parser::unquote(value).c_str(), "w");
                if (new_out) {
                    internal::replace_sink(stats_out, new_out);
                } else {
                    log::warn("Could not open stats file '%s' from %s:%d", value.c_str(), path, line_num);
                }
            }
        }
        else {
            log::debug("Ignoring key '%s' in section [%s] of %s", key.c_str(), current_section.c_str(), path);
        }
    }

    std::fclose(f);
    return true;
}

/**
 * @brief Load configuration from file into the active config.
 */
inline bool load_config(const char* path) {
    return get_config().load_from_file(path);
}

/**
 * @brief Current wall-clock time in seconds since the epoch.
 */
inline double now() {
    const auto t = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(t).count();
}

// ---------------------------------------------------------------------------
// Execution contexts
// ---------------------------------------------------------------------------

/** @brief Identity of one logical unit of work (thread, fiber, task). */
using ContextId = uint64_t;

namespace internal {

/** @brief Per-thread override installed by ContextBinding. */
struct Binding {
    bool      bound = false;
    ContextId id    = 0;
};

inline Binding& binding() {
    static thread_local Binding b;
    return b;
}

} // namespace internal

/// Bit set on every thread-derived context id; explicit bindings must leave it clear.
constexpr ContextId kThreadContextBit = 1ULL << 63;

/**
 * @brief Context id of the calling thread.
 *
 * Drawn once per thread from a process-wide counter, so an id is never
 * handed to a second thread even after the first one exits and the
 * runtime recycles its std::thread::id.
 */
inline ContextId thread_context_id() {
    static std::atomic<ContextId> next{1};
    static thread_local ContextId cached = kThreadContextBit | next.fetch_add(1, std::memory_order_relaxed);
    return cached;
}

/**
 * @brief Context id of the caller: the bound id if any, else the thread's.
 */
inline ContextId current_context_id() {
    const internal::Binding& b = internal::binding();
    return b.bound ? b.id : thread_context_id();
}

/**
 * @brief RAII rebinding of the calling thread to an explicit context id.
 *
 * Work that migrates between threads (fibers, coroutines, pooled tasks)
 * binds its own id while it runs so its scope stack follows it. Bindings
 * nest; the previous one is restored on destruction.
 *
 * @code
 * void run_task(Task& t) {
 *     txn::ContextBinding bind(t.id);
 *     t.resume();   // push/pop land on t's stack, whichever thread runs it
 * }
 * @endcode
 */
class ContextBinding {
public:
    explicit ContextBinding(ContextId id) : prev_(internal::binding()) {
        if (id & kThreadContextBit) {
            throw std::invalid_argument("context id " + std::to_string(id) + " is reserved for threads");
        }
        internal::binding() = internal::Binding{true, id};
    }
    ~ContextBinding() {
        internal::binding() = prev_;
    }
    ContextBinding(const ContextBinding&) = delete;
    ContextBinding& operator=(const ContextBinding&) = delete;

private:
    internal::Binding prev_;
};

// ---------------------------------------------------------------------------
// Scope frames
// ---------------------------------------------------------------------------

/**
 * @brief One in-flight traced operation on a scope stack.
 *
 * children_time only grows when a frame directly above this one is popped.
 */
struct ScopeFrame {
    const char* const tag;                ///< Debug identifier, only used in corruption errors (must outlive the frame)
    const double      start_time;         ///< Wall-clock seconds at push
    const bool        deduct_from_parent; ///< Charge full elapsed time to the parent (false: pass children_time through)
    double            children_time = 0.0;///< Seconds attributed to direct children
    std::optional<std::string> name;      ///< Assigned once, at pop

    ScopeFrame(const char* t, double start, bool deduct)
        : tag(t), start_time(start), deduct_from_parent(deduct) {}
};

/** @brief LIFO of in-flight frames for one execution context. */
using ScopeStack = std::vector<std::unique_ptr<ScopeFrame>>;

/**
 * @brief Raised by pop_scope() when the popped frame is not the expected one.
 *
 * Signals a push/pop pairing bug at an instrumentation call site.
 */
class StackCorruptionError : public std::runtime_error {
public:
    StackCorruptionError(const char* actual, const char* expected)
        : std::runtime_error(describe(actual, expected)),
          actual_(actual ? actual : ""),
          expected_(expected ? expected : "") {}

    const std::string& actual_tag() const { return actual_; }
    const std::string& expected_tag() const { return expected_; }

private:
    static std::string describe(const char* actual, const char* expected) {
        std::string msg = "unbalanced pop from scope stack, got ";
        msg += actual ? actual : "(none)";
        msg += ", expected ";
        msg += expected ? expected : "(none)";
        return msg;
    }

    std::string actual_;
    std::string expected_;
};

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

/// Scope value meaning "the enclosing transaction's name, once known".
inline const std::string kScopePlaceholder = "__SCOPE__";

/**
 * @brief (name, scope) key of one statistic bucket.
 *
 * An empty scope means unscoped; kScopePlaceholder is resolved by
 * pop_transaction_stats().
 */
struct MetricSpec {
    std::string name;
    std::string scope;

    MetricSpec() = default;
    explicit MetricSpec(std::string n, std::string s = std::string())
        : name(std::move(n)), scope(std::move(s)) {}

    bool has_placeholder_scope() const {
        return !scope.empty() && scope == kScopePlaceholder;
    }

    bool operator<(const MetricSpec& o) const {
        return std::tie(name, scope) < std::tie(o.name, o.scope);
    }
    bool operator==(const MetricSpec& o) const {
        return name == o.name && scope == o.scope;
    }
    bool operator!=(const MetricSpec& o) const { return !(*this == o); }
};

/**
 * @brief Aggregate timing record for one metric (all times in seconds).
 */
struct Stats {
    uint64_t call_count = 0;            ///< Number of data points
    double   total_call_time = 0.0;     ///< Sum of elapsed times
    double   total_exclusive_time = 0.0;///< Sum of self times
    double   min_call_time = 0.0;       ///< Smallest elapsed time
    double   max_call_time = 0.0;       ///< Largest elapsed time
    double   sum_of_squares = 0.0;      ///< Sum of elapsed time squared

    void record_data_point(double value, double exclusive) {
        if (call_count == 0) {
            min_call_time = value;
            max_call_time = value;
        } else {
            min_call_time = std::min(min_call_time, value);
            max_call_time = std::max(max_call_time, value);
        }
        ++call_count;
        total_call_time += value;
        total_exclusive_time += exclusive;
        sum_of_squares += value * value;
    }

    void merge(const Stats& other) {
        if (other.call_count == 0) return;
        if (call_count == 0) {
            min_call_time = other.min_call_time;
            max_call_time = other.max_call_time;
        } else {
            min_call_time = std::min(min_call_time, other.min_call_time);
            max_call_time = std::max(max_call_time, other.max_call_time);
        }
        call_count += other.call_count;
        total_call_time += other.total_call_time;
        total_exclusive_time += other.total_exclusive_time;
        sum_of_squares += other.sum_of_squares;
    }

    double average_call_time() const {
        return call_count > 0 ? total_call_time / (double)call_count : 0.0;
    }

    bool is_reset() const { return call_count == 0; }
};

/**
 * @brief Mapping from MetricSpec to Stats; one per open transaction and one engine-wide.
 */
class StatsHash {
public:
    using Map = std::map<MetricSpec, Stats>;
    using const_iterator = Map::const_iterator;

    /** @brief Stats for @p spec, created empty on first use. */
    Stats& at_spec(const MetricSpec& spec) { return stats_[spec]; }

    const Stats* find(const MetricSpec& spec) const {
        auto it = stats_.find(spec);
        return it != stats_.end() ? &it->second : nullptr;
    }

    void record(const MetricSpec& spec, double duration, double exclusive) {
        stats_[spec].record_data_point(duration, exclusive);
    }

    /** @brief Fold every entry of @p other into this hash, merging equal keys. */
    void merge(const StatsHash& other) {
        for (const auto& [spec, stats] : other.stats_) {
            stats_[spec].merge(stats);
        }
    }

    void clear() { stats_.clear(); }
    size_t size() const { return stats_.size(); }
    bool empty() const { return stats_.empty(); }
    const_iterator begin() const { return stats_.begin(); }
    const_iterator end() const { return stats_.end(); }

private:
    Map stats_;
};

/** @brief One StatsHash per nested transaction recording in a context. */
using StatsStack = std::vector<StatsHash>;

/**
 * @brief Everything bound to one execution context.
 *
 * Both stacks are created lazily and may be dropped independently.
 */
struct ContextState {
    std::unique_ptr<ScopeStack> scope_stack;
    std::unique_ptr<StatsStack> stats_stack;
    std::optional<std::string>  transaction_name;

    /** @brief Nothing left worth keeping; the entry can be erased. */
    bool disposable() const {
        return !scope_stack && !transaction_name && (!stats_stack || stats_stack->empty());
    }
};

/**
 * @brief Process-wide table of per-context state.
 *
 * The mutex guards the table structure only. Node storage keeps every
 * ContextState at a stable address, and a state is only touched by the
 * context that owns it.
 */
struct ContextStore {
    std::mutex mtx;
    std::unordered_map<ContextId, ContextState> states;

    /** @brief State for @p id, created empty if absent. */
    inline ContextState& get_or_create(ContextId id) {
        std::lock_guard<std::mutex> lock(mtx);
        return states[id];
    }

    /** @brief State for @p id, or nullptr when none was ever created. */
    inline ContextState* find(ContextId id) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = states.find(id);
        return it != states.end() ? &it->second : nullptr;
    }

    /** @brief Erase the entry for @p id when it holds nothing. */
    inline void erase_if_disposable(ContextId id) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = states.find(id);
        if (it != states.end() && it->second.disposable()) {
            states.erase(it);
        }
    }

    inline size_t size() {
        std::lock_guard<std::mutex> lock(mtx);
        return states.size();
    }
};

// ---------------------------------------------------------------------------
// Collaborators
// ---------------------------------------------------------------------------

/**
 * @brief Receives push/pop notifications to build transaction traces.
 *
 * Only called while Config::sampler_enabled() is true.
 */
class TransactionSampler {
public:
    virtual ~TransactionSampler() = default;
    virtual void notice_push_scope(double time) = 0;
    virtual void notice_pop_scope(const std::string& name, double time) = 0;
};

/** @brief Lifecycle events delivered to EventListeners subscribers. */
enum class Event : uint8_t {
    StartTransaction = 0,
    EndTransaction   = 1
};

/**
 * @brief Subscriber lists for lifecycle events.
 *
 * Callbacks run on the notifying thread, outside the lock.
 */
struct EventListeners {
    std::mutex mtx;
    std::map<Event, std::vector<std::function<void()>>> callbacks;

    inline void subscribe(Event e, std::function<void()> cb) {
        std::lock_guard<std::mutex> lock(mtx);
        callbacks[e].push_back(std::move(cb));
    }

    inline void notify(Event e) {
        std::vector<std::function<void()>> snapshot;
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto it = callbacks.find(e);
            if (it == callbacks.end()) return;
            snapshot = it->second;
        }
        for (auto& cb : snapshot) cb();
    }

    inline void clear() {
        std::lock_guard<std::mutex> lock(mtx);
        callbacks.clear();
    }
};

// ---------------------------------------------------------------------------
// Engine
// ---------------------------------------------------------------------------

/**
 * @brief Scope stacks, transaction stats layers and the engine-wide store.
 *
 * Every per-context operation acts on the caller's execution context
 * (current_context_id()). The engine-wide store is the only state shared
 * between contexts and is guarded by its own mutex.
 */
class StatsEngine {
public:
    StatsEngine() = default;
    StatsEngine(const StatsEngine&) = delete;
    StatsEngine& operator=(const StatsEngine&) = delete;

    /**
     * @brief Push a frame for a traced operation that is starting.
     *
     * @param tag Debug identifier reported if the stack gets corrupted
     * @param time Start time in seconds
     * @param deduct_from_parent When false, the parent is only charged for
     *        this frame's children_time, not its elapsed time
     * @return Frame to hand back to the matching pop_scope() (owned by the stack)
     */
    inline ScopeFrame* push_scope(const char* tag, double time = now(), bool deduct_from_parent = true);

    /**
     * @brief Pop the top frame, attribute its time to the parent and name it.
     *
     * @param expected Frame returned by the matching push_scope()
     * @param name Name given to the finished frame (and to the trace segment)
     * @param time End time in seconds
     * @return The popped frame, now owned by the caller
     * @throws StackCorruptionError if the top frame is not @p expected;
     *         the stack is left unchanged
     */
    inline std::unique_ptr<ScopeFrame> pop_scope(const ScopeFrame* expected, std::string name, double time = now());

    inline void start_transaction();
    inline void end_transaction();

    inline void push_transaction_stats();
    inline std::optional<StatsHash> pop_transaction_stats(const std::string& transaction_name);
    inline StatsHash* transaction_stats_hash();

    inline void set_current_transaction_name(std::string name);
    inline std::optional<std::string> current_transaction_name();

    inline ScopeStack& current_scope_stack();
    inline StatsStack& current_stats_stack();

    /** @brief Deprecated: the sampler is registered process-wide. Logs a warning. */
    inline void set_transaction_sampler(TransactionSampler* sampler);

    bool sampler_enabled() const { return get_config().sampler_enabled(); }

    /**
     * @brief Copy of @p stats with placeholder scopes replaced by @p resolved_name.
     */
    static inline StatsHash apply_scopes(const StatsHash& stats, const std::string& resolved_name);

    // Engine-wide store
    inline void record_metrics(const std::vector<MetricSpec>& specs, double duration, double exclusive);
    inline void merge(const StatsHash& stats);
    inline StatsHash snapshot() const;
    inline StatsHash harvest();
    inline std::optional<Stats> lookup(const MetricSpec& spec) const;

    size_t context_count() { return contexts_.size(); }

private:
    ContextState& context() { return contexts_.get_or_create(current_context_id()); }

    ContextStore       contexts_;
    mutable std::mutex stats_mtx_;   ///< Protects stats_hash_
    StatsHash          stats_hash_;
};

/**
 * @brief Same surface as StatsEngine, every call a no-op.
 *
 * Selected when TXN_ENABLED is 0 so call sites compile unchanged.
 */
class StatsEngineShim {
public:
    ScopeFrame* push_scope(const char*, double = 0.0, bool = true) { return nullptr; }
    std::unique_ptr<ScopeFrame> pop_scope(const ScopeFrame*, std::string, double = 0.0) { return nullptr; }
    void start_transaction() {}
    void end_transaction() {}
    void push_transaction_stats() {}
    std::optional<StatsHash> pop_transaction_stats(const std::string&) { return std::nullopt; }
    StatsHash* transaction_stats_hash() { return nullptr; }
    void set_current_transaction_name(std::string) {}
    std::optional<std::string> current_transaction_name() { return std::nullopt; }
    void set_transaction_sampler(TransactionSampler*) {}
    bool sampler_enabled() const { return false; }
    void record_metrics(const std::vector<MetricSpec>&, double, double) {}
    void merge(const StatsHash&) {}
    StatsHash snapshot() const { return StatsHash(); }
    StatsHash harvest() { return StatsHash(); }
    std::optional<Stats> lookup(const MetricSpec&) const { return std::nullopt; }
};

#if TXN_ENABLED
using ActiveEngine = StatsEngine;
#else
using ActiveEngine = StatsEngineShim;
#endif

/**
 * @brief Process-wide collaborators: listeners, sampler and the engine.
 */
struct Agent {
    EventListeners                   events;
    std::atomic<TransactionSampler*> sampler{nullptr};
    ActiveEngine                     stats_engine;
};

/**
 * @brief Set external state for DLL-safe cross-boundary sharing.
 *
 * Call once from the main executable before any tracing. Both objects
 * must outlive all tracing.
 */
inline void set_external_state(Config* cfg, Agent* ag) {
    g_external_config = cfg;
    g_external_agent = ag;
}

#if defined(TXN_SCOPE_SHARED)
// For DLL sharing: defined once in src/txn_scope_impl.cpp
TXN_SCOPE_API Agent& agent();
#else
/**
 * @brief Get the process-wide Agent (header-only version).
 */
inline Agent& agent() {
    if (g_external_agent) return *g_external_agent;
    static Agent a;
    return a;
}
#endif

inline EventListeners& events() { return agent().events; }
inline ActiveEngine& stats_engine() { return agent().stats_engine; }
inline TransactionSampler* transaction_sampler() { return agent().sampler.load(std::memory_order_acquire); }

/**
 * @brief Register the sampler notified on push/pop (nullptr to detach).
 */
inline void set_transaction_sampler(TransactionSampler* sampler) {
    agent().sampler.store(sampler, std::memory_order_release);
}

/**
 * @brief Runtime instrumentation switch read by TracedScope.
 */
inline bool engine_enabled() {
    return TXN_ENABLED && get_config().agent_enabled;
}

namespace internal {
inline void ensure_stats_registered();
} // namespace internal

// ---------------------------------------------------------------------------
// StatsEngine implementation
// ---------------------------------------------------------------------------

inline ScopeStack& StatsEngine::current_scope_stack() {
    ContextState& state = context();
    if (!state.scope_stack) state.scope_stack = std::make_unique<ScopeStack>();
    return *state.scope_stack;
}

inline StatsStack& StatsEngine::current_stats_stack() {
    ContextState& state = context();
    if (!state.stats_stack) state.stats_stack = std::make_unique<StatsStack>();
    return *state.stats_stack;
}

inline ScopeFrame* StatsEngine::push_scope(const char* tag, double time, bool deduct_from_parent) {
    ScopeStack& stack = current_scope_stack();
    if (sampler_enabled()) {
        if (TransactionSampler* sampler = transaction_sampler()) sampler->notice_push_scope(time);
    }
    stack.push_back(std::make_unique<ScopeFrame>(tag, time, deduct_from_parent));
    return stack.back().get();
}

inline std::unique_ptr<ScopeFrame> StatsEngine::pop_scope(const ScopeFrame* expected, std::string name, double time) {
    ScopeStack& stack = current_scope_stack();

    // Nothing is removed on a mismatch; every frame stays alive for the
    // pops its owners still have to make.
    if (stack.empty() || stack.back().get() != expected) {
        const char* actual_tag = stack.empty() ? nullptr : stack.back()->tag;
        const char* expected_tag = nullptr;
        if (expected) {
            expected_tag = "(unknown)";
            for (const auto& frame : stack) {
                if (frame.get() == expected) {
                    expected_tag = frame->tag;
                    break;
                }
            }
        }
        throw StackCorruptionError(actual_tag, expected_tag);
    }

    std::unique_ptr<ScopeFrame> scope = std::move(stack.back());
    stack.pop_back();

    if (!stack.empty()) {
        ScopeFrame& parent = *stack.back();
        if (scope->deduct_from_parent) {
            parent.children_time += time - scope->start_time;
        } else {
            parent.children_time += scope->children_time;
        }
    }

    if (sampler_enabled()) {
        if (TransactionSampler* sampler = transaction_sampler()) sampler->notice_pop_scope(name, time);
    }
    scope->name = std::move(name);
    return scope;
}

inline void StatsEngine::set_transaction_sampler(TransactionSampler*) {
    log::warn("StatsEngine::set_transaction_sampler is deprecated, use txn::set_transaction_sampler");
}

inline void StatsEngine::set_current_transaction_name(std::string name) {
    context().transaction_name = std::move(name);
}

inline std::optional<std::string> StatsEngine::current_transaction_name() {
    ContextState* state = contexts_.find(current_context_id());
    return state ? state->transaction_name : std::nullopt;
}

inline void StatsEngine::start_transaction() {
    internal::ensure_stats_registered();
    events().notify(Event::StartTransaction);
}

// A non-empty stack means an outer transaction is still running on this
// context; its state is left alone.
inline void StatsEngine::end_transaction() {
    const ContextId id = current_context_id();
    ContextState* state = contexts_.find(id);
    if (state && (!state->scope_stack || state->scope_stack->empty())) {
        state->scope_stack.reset();
        state->transaction_name.reset();
        contexts_.erase_if_disposable(id);
    }
    events().notify(Event::EndTransaction);
}

inline StatsHash* StatsEngine::transaction_stats_hash() {
    ContextState* state = contexts_.find(current_context_id());
    if (!state || !state->stats_stack || state->stats_stack->empty()) return nullptr;
    return &state->stats_stack->back();
}

inline void StatsEngine::push_transaction_stats() {
    current_stats_stack().emplace_back();
}

inline std::optional<StatsHash> StatsEngine::pop_transaction_stats(const std::string& transaction_name) {
    // Later pushes expect the scope stack container to exist
    current_scope_stack();

    StatsStack& layer = current_stats_stack();
    if (layer.empty()) return std::nullopt;

    StatsHash stats = std::move(layer.back());
    layer.pop_back();
    merge(apply_scopes(stats, transaction_name));
    return stats;
}

inline StatsHash StatsEngine::apply_scopes(const StatsHash& stats, const std::string& resolved_name) {
    StatsHash resolved;
    for (const auto& [spec, s] : stats) {
        if (spec.has_placeholder_scope()) {
            resolved.at_spec(MetricSpec(spec.name, resolved_name)).merge(s);
        } else {
            resolved.at_spec(spec).merge(s);
        }
    }
    return resolved;
}

// Outside a transaction there is no name to resolve placeholders to, so
// placeholder-scoped specs are dropped.
inline void StatsEngine::record_metrics(const std::vector<MetricSpec>& specs, double duration, double exclusive) {
    if (StatsHash* txn_stats = transaction_stats_hash()) {
        for (const auto& spec : specs) txn_stats->record(spec, duration, exclusive);
        return;
    }

    std::lock_guard<std::mutex> lock(stats_mtx_);
    for (const auto& spec : specs) {
        if (spec.has_placeholder_scope()) continue;
        stats_hash_.record(spec, duration, exclusive);
    }
}

inline void StatsEngine::merge(const StatsHash& stats) {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    stats_hash_.merge(stats);
}

inline StatsHash StatsEngine::snapshot() const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    return stats_hash_;
}

inline StatsHash StatsEngine::harvest() {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    StatsHash out;
    std::swap(out, stats_hash_);
    return out;
}

inline std::optional<Stats> StatsEngine::lookup(const MetricSpec& spec) const {
    std::lock_guard<std::mutex> lock(stats_mtx_);
    const Stats* s = stats_hash_.find(spec);
    if (!s) return std::nullopt;
    return *s;
}

// ---------------------------------------------------------------------------
// Traced scopes
// ---------------------------------------------------------------------------

/**
 * @brief RAII traced operation on an engine.
 *
 * Pushes a frame on construction. On destruction pops it, computes
 * exclusive time (elapsed minus children_time) and records both the
 * unscoped metric and the placeholder-scoped one, which is resolved to the
 * transaction name when the transaction's stats are popped.
 *
 * A StackCorruptionError cannot leave a destructor; it is logged and
 * transaction tracing is switched off in the active config.
 *
 * Use via the TXN_TRACE() macro, not directly.
 */
template <typename Engine>
class BasicTracedScope {
public:
    BasicTracedScope(Engine& engine, std::string metric_name, const char* tag, bool deduct_from_parent = true)
        : engine_(engine), metric_name_(std::move(metric_name)), frame_(nullptr) {
        if (engine_enabled()) {
            frame_ = engine_.push_scope(tag, now(), deduct_from_parent);
        }
    }

    ~BasicTracedScope() {
        if (!frame_) return;
        const double end = now();
        try {
            std::unique_ptr<ScopeFrame> popped = engine_.pop_scope(frame_, metric_name_, end);
            if (!popped) return;
            const double duration = end - popped->start_time;
            const double exclusive = std::max(0.0, duration - popped->children_time);
            engine_.record_metrics({MetricSpec(metric_name_), MetricSpec(metric_name_, kScopePlaceholder)},
                                   duration, exclusive);
        } catch (const StackCorruptionError& e) {
            log::error("%s; disabling transaction tracing", e.what());
            get_config().transaction_tracer_enabled.store(false, std::memory_order_relaxed);
            get_config().developer_mode.store(false, std::memory_order_relaxed);
        }
    }

    BasicTracedScope(const BasicTracedScope&) = delete;
    BasicTracedScope& operator=(const BasicTracedScope&) = delete;

    /** @brief Frame being timed, nullptr when instrumentation is off. */
    const ScopeFrame* frame() const { return frame_; }

private:
    Engine&     engine_;
    std::string metric_name_;
    ScopeFrame* frame_;
};

using TracedScope = BasicTracedScope<ActiveEngine>;

// ---------------------------------------------------------------------------
// Stats report
// ---------------------------------------------------------------------------

/**
 * @brief Human-readable metric tables.
 */
namespace stats {

/**
 * @brief Format a duration given in seconds with auto-scaled units.
 *
 * @return Formatted string (e.g., "1.23 ms", "456.00 µs", "2.500 s")
 */
inline std::string format_duration_str(double seconds) {
    char buf[64];
    const double ns = seconds * 1e9;
    if (ns < 1000.0) {
        std::snprintf(buf, sizeof(buf), "%.0f ns", ns);
    } else if (ns < 1000000.0) {
        std::snprintf(buf, sizeof(buf), "%.2f µs", ns / 1000.0);
    } else if (ns < 1000000000.0) {
        std::snprintf(buf, sizeof(buf), "%.2f ms", ns / 1000000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%.3f s", seconds);
    }
    return buf;
}

/**
 * @brief Print one table row per metric, sorted by total time descending.
 */
inline void print_stats(const StatsHash& hash, FILE* out = stderr) {
    if (hash.empty()) return;

    std::vector<std::pair<MetricSpec, Stats>> sorted(hash.begin(), hash.end());
    std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
        return a.second.total_call_time > b.second.total_call_time;
    });

    std::fprintf(out, "\n");
    std::fprintf(out, "==============================================================================================================\n");
    std::fprintf(out, " Transaction Metrics Summary\n");
    std::fprintf(out, "==============================================================================================================\n");
    std::fprintf(out, "%-30s %-20s %8s %12s %12s %12s %12s %12s\n",
                 "Metric", "Scope", "Calls", "Total", "Exclusive", "Avg", "Min", "Max");
    std::fprintf(out, "--------------------------------------------------------------------------------------------------------------\n");

    for (const auto& [spec, s] : sorted) {
        std::fprintf(out, "%-30s %-20s %8lu %12s %12s %12s %12s %12s\n",
                     spec.name.c_str(),
                     spec.scope.empty() ? "-" : spec.scope.c_str(),
                     (unsigned long)s.call_count,
                     format_duration_str(s.total_call_time).c_str(),
                     format_duration_str(s.total_exclusive_time).c_str(),
                     format_duration_str(s.average_call_time()).c_str(),
                     format_duration_str(s.min_call_time).c_str(),
                     format_duration_str(s.max_call_time).c_str());
    }

    std::fprintf(out, "==============================================================================================================\n\n");
}

/**
 * @brief Print the process-wide engine's store.
 */
inline void print_stats(FILE* out = stderr) {
    print_stats(stats_engine().snapshot(), out);
}

} // namespace stats

/**
 * @brief Automatic exit statistics using atexit().
 */
namespace internal {

inline std::atomic<bool> stats_registered{false};

inline void stats_exit_handler() {
    if (get_config().print_stats) {
        StatsHash store = stats_engine().snapshot();
        // Held so a concurrent config reload cannot close the sink mid-report
        std::lock_guard<std::mutex> lock(log::log_mutex());
        stats::print_stats(store, get_config().stats_out ? get_config().stats_out : stderr);
    }
}

// Registers once, the first time a transaction starts with print_stats on
inline void ensure_stats_registered() {
    if (get_config().print_stats && !stats_registered.exchange(true)) {
        std::atexit(stats_exit_handler);
    }
}

} // namespace internal

} // namespace txn

/**
 * @def TXN_TRACE(metric_name)
 * @brief Trace the rest of the enclosing block as metric @p metric_name.
 *
 * Example:
 * @code
 * void load_order(int id) {
 *     TXN_TRACE("Database/Order/find");
 *     // ...
 * }
 * @endcode
 */
#if TXN_ENABLED
#define TXN_TRACE(metric_name) \
    ::txn::TracedScope _txn_traced_scope_obj(::txn::stats_engine(), (metric_name), __func__)
#else
#define TXN_TRACE(metric_name) ((void)0)
#endif
