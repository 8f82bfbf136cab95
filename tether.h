// Tether version: 0.1.0
//
// Tether is a header only observer library built from two primitives that share one subscriber
// registry:
//  - tether::event<Args...> - fire and forget notification, emit() pushes a payload to every hook
//  - tether::property<T>    - observable value, every set() notifies hooks with the new value
//
// To use tether you don't need to define an implementation macro but there are configuration
// macros which you can define before including tether:
//  - #define TETHER_THREAD_SAFE     - guards registries and property values with mutexes
//  - #define TETHER_METHODS         - includes methods on event and property, for oop like usage
//  - #define TETHER_DEBUG_LOG       - compiles in the logger, see set_logger()
//  - #define TETHER_SHORT_NAMESPACE - shortens the tether:: namespace to tt::
//
// NOTE: the macros change the layout of the types, so define them the same way in every
//  translation unit of a program, the cmake options do that for you
//
// Hooks are invoked synchronously, in registration order, on the thread that calls emit() or
// set(). A notification pass works on a snapshot of the hooks taken when it starts: hooks added
// during the pass first fire on the next one, hooks removed during the pass are skipped if they
// did not run yet. The first exception thrown by a hook aborts the pass and is rethrown to the
// caller, the registry itself stays intact.
//
// With TETHER_THREAD_SAFE the locks are only held while the value and the hook list are
// snapshotted, never while hooks run, so a hook may freely call back into the same event or
// property. Two concurrent writers can therefore have their notifications interleave.
//
// Basic usage example:
//  tether::event<std::string> changed;
//  auto h = tether::hook(&changed, [](const std::string& s) {
//      std::printf("changed: %s\n", s.c_str());
//  });
//
//  tether::emit(&changed, "hello");
//  h.unhook();  // or let h go out of scope

#ifndef TETHER_H
#define TETHER_H

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-               I N C L U D E S               -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

#include <version>

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-   M A C R O   C H E C K S / D E F I N E S   -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

#define tether_function std::move_only_function
#if !defined(__cpp_lib_move_only_function)
#warning \
    "c++23 std::move_only_function was not found, tether will use std::function instead, hooks will have to be copyable"
#undef tether_function
#define tether_function std::function
#endif

#if !defined(__cpp_lib_concepts) || __cpp_lib_concepts < 202002LL
#error "tether requires a full c++20 concepts implementation"
#endif

#define TETHER_CONCAT_IMPL(a, b) a##b
#define TETHER_CONCAT(a, b) TETHER_CONCAT_IMPL(a, b)

// keeping these empty allows us to not stub the mutexes when thread safety is off
#define mutex_scope(mutex)
#define shared_scope(mutex)

#if defined(TETHER_THREAD_SAFE)
#include <mutex>
#include <shared_mutex>
#undef mutex_scope
#undef shared_scope
#define mutex_scope(mutex) std::lock_guard TETHER_CONCAT(lock_, __LINE__)(mutex)
#define shared_scope(mutex) std::shared_lock TETHER_CONCAT(shared_lock_, __LINE__)(mutex)
#endif

#if defined(TETHER_DEBUG_LOG)
#include <cstdio>
#include <string>
#define tether_log(...) detail::log(__VA_ARGS__)
#else
#define tether_log(...)
#endif

#if defined(TETHER_SHORT_NAMESPACE)
#define TETHER_NS tt
#else
#define TETHER_NS tether
#endif

namespace TETHER_NS {

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-               S T A T U S E S               -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

// results of hook management, none of these are faults, a stale handle is always safe to release
enum e_status {
    OK,
    NO_HOOK_WITH_ID,
    REGISTRY_EXPIRED,
    INVALID_HOOK,
};

inline const char* status_string(e_status status) {
    switch (status) {
        case OK:
            return "OK";
        case NO_HOOK_WITH_ID:
            return "NO_HOOK_WITH_ID";
        case REGISTRY_EXPIRED:
            return "REGISTRY_EXPIRED";
        case INVALID_HOOK:
            return "INVALID_HOOK";
    }
    return "UNKNOWN";
}

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-                L O G G I N G                -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

#if defined(TETHER_DEBUG_LOG)
enum log_level {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL,
};

inline const char* level_string(log_level level) {
    switch (level) {
        case DEBUG:
            return "DEBUG";
        case INFO:
            return "INFO";
        case WARNING:
            return "WARN";
        case ERROR:
            return "ERROR";
        case FATAL:
            return "FATAL";
    }
    return "LOG";
}

// a single log record, id is -1 when the message is not about a specific hook
struct log_data {
    log_level level;
    const char* message;
    int64_t id = -1;
    size_t count = 0;

    // formats the message with the captured data, eg: "hook added (id: 3, hooks: 4)"
    std::string format() const {
        char buf[256];
        if (id >= 0) {
            std::snprintf(buf,
                sizeof(buf),
                "%s (id: %lld, hooks: %zu)",
                message,
                static_cast<long long>(id),
                count);
        } else {
            std::snprintf(buf, sizeof(buf), "%s (hooks: %zu)", message, count);
        }
        return buf;
    }
};

using logger_fn = std::function<void(log_data)>;

namespace detail {

inline void default_logger(log_data data) {
    std::fprintf(stderr, "[tether] %-5s | %s\n", level_string(data.level), data.format().c_str());
}

struct logger_state {
    logger_fn fn = default_logger;
#if defined(TETHER_THREAD_SAFE)
    std::mutex mu;
#endif
};

inline logger_state& logger() {
    static logger_state state;
    return state;
}

inline void log(log_level level, const char* message, int64_t id = -1, size_t count = 0) {
    logger_fn fn;
    {
        mutex_scope(logger().mu);
        fn = logger().fn;
    }
    if (fn) {
        fn(log_data{level, message, id, count});
    }
}

}  // namespace detail

// replaces the process wide logger, passing nullptr silences logging
inline void set_logger(logger_fn fn) {
    mutex_scope(detail::logger().mu);
    detail::logger().fn = std::move(fn);
}
#endif

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-               R E G I S T R Y               -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

namespace detail {

// the part of a registry a hook handle needs, lets handles stay independent of the payload types
struct registry_base {
    virtual ~registry_base() = default;
    // owned is set when the caller is an owned_hook, for it a hook that is already gone is the
    // normal case (a fired once hook, unhook_all) and is only logged at debug level
    virtual e_status remove(int64_t id, bool owned = false) = 0;
};

template <typename... Args>
struct registry final : registry_base {
    using callback_type = tether_function<void(const Args&...)>;

    struct slot {
        slot(int64_t id, callback_type callback) : id(id), callback(std::move(callback)) {}

        int64_t id;
        callback_type callback;
        // cleared on removal so passes that snapshotted this slot skip it
        std::atomic<bool> live{true};
    };

    using pass_type = std::vector<std::shared_ptr<slot>>;

    pass_type slots;
    std::atomic<int64_t> id_counter{0};

#if defined(TETHER_THREAD_SAFE)
    std::mutex mu;
#endif

    template <typename F>
    int64_t add(F&& func) {
        int64_t id = id_counter.fetch_add(1);
        [[maybe_unused]] size_t count;
        {
            mutex_scope(mu);
            slots.push_back(std::make_shared<slot>(id, callback_type(std::forward<F>(func))));
            count = slots.size();
        }

        tether_log(DEBUG, "hook added", id, count);
        return id;
    }

    // the callback removes its own slot before running, so it fires at most once even when two
    // passes race for it
    template <typename F>
    int64_t add_once(F&& func) {
        int64_t id = id_counter.fetch_add(1);
        callback_type callback([this, id, fn = std::forward<F>(func)](const Args&... args) mutable {
            if (erase(id)) {
                tether_log(DEBUG, "once hook fired", id);
                fn(args...);
            }
        });

        [[maybe_unused]] size_t count;
        {
            mutex_scope(mu);
            slots.push_back(std::make_shared<slot>(id, std::move(callback)));
            count = slots.size();
        }

        tether_log(DEBUG, "once hook added", id, count);
        return id;
    }

    e_status remove(int64_t id, [[maybe_unused]] bool owned = false) override {
        if (!erase(id)) {
            tether_log(owned ? DEBUG : WARNING, "unhook of unknown id", id, size());
            return NO_HOOK_WITH_ID;
        }

        tether_log(DEBUG, "hook removed", id, size());
        return OK;
    }

    void clear() {
        pass_type removed;
        {
            mutex_scope(mu);
            removed.swap(slots);
        }

        for (auto& s : removed) {
            s->live.store(false);
        }

        tether_log(INFO, "all hooks removed", -1, removed.size());
    }

    size_t size() {
        mutex_scope(mu);
        return slots.size();
    }

    // copies the current hooks, the copy keeps callbacks alive even if they get removed mid pass
    pass_type snapshot() {
        mutex_scope(mu);
        return slots;
    }

    void notify_all(const Args&... args) { notify(snapshot(), -1, args...); }

    // runs a pass over an already taken snapshot, skipping the hook with the excluded id, no lock
    // is held while hooks run
    static void notify(const pass_type& pass, int64_t excluded, const Args&... args) {
        if (pass.empty()) {
            tether_log(DEBUG, "notify with no hooks");
            return;
        }

        for (const auto& s : pass) {
            if (s->id == excluded || !s->live.load()) {
                continue;
            }

#if defined(TETHER_DEBUG_LOG)
            try {
                s->callback(args...);
            } catch (...) {
                tether_log(ERROR, "hook threw, notification pass aborted", s->id, pass.size());
                throw;
            }
#else
            s->callback(args...);
#endif
        }
    }

private:
    bool erase(int64_t id) {
        mutex_scope(mu);

        auto it =
            std::find_if(slots.begin(), slots.end(), [id](const auto& s) { return s->id == id; });
        if (it == slots.end()) {
            return false;
        }

        (*it)->live.store(false);
        slots.erase(it);
        return true;
    }
};

}  // namespace detail

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-                  H O O K S                  -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

class owned_hook;

// a plain reference to a registration, copying it does not copy the registration and dropping it
// does not remove it, by default hook_id is invalid and will fail any operations
struct hook_id {
    int64_t id = -1;
    std::weak_ptr<detail::registry_base> registry;

    bool valid() const { return id >= 0; }

    // true once the event or property the hook was registered on is gone
    bool expired() const { return registry.expired(); }

    e_status unhook() const { return remove(false); }

    // ties the registration to the lifetime of the returned owned_hook
    owned_hook scoped() const;

private:
    friend class owned_hook;

    e_status remove([[maybe_unused]] bool owned) const {
        if (!valid()) {
            return INVALID_HOOK;
        }

        auto reg = registry.lock();
        if (!reg) {
            tether_log(owned ? DEBUG : WARNING, "unhook on expired registry", id);
            return REGISTRY_EXPIRED;
        }

        return reg->remove(id, owned);
    }
};

// owns a registration, unhooks when destroyed, every hook() call returns one
class owned_hook {
public:
    owned_hook() = default;
    explicit owned_hook(hook_id handle) : handle(std::move(handle)) {}

    ~owned_hook() { static_cast<void>(unhook()); }

    owned_hook(owned_hook&& other) noexcept : handle(other.release()) {}

    owned_hook& operator=(owned_hook&& other) noexcept {
        if (this != &other) {
            static_cast<void>(unhook());
            handle = other.release();
        }
        return *this;
    }

    owned_hook(const owned_hook&) = delete;
    owned_hook& operator=(const owned_hook&) = delete;

    // safe to call any number of times, only the first call can return OK
    e_status unhook() { return release().remove(true); }

    // gives up ownership, the registration stays until unhooked by id or its registry dies
    hook_id release() { return std::exchange(handle, hook_id{}); }

    bool valid() const { return handle.valid(); }

    int64_t id() const { return handle.id; }

private:
    hook_id handle;
};

inline owned_hook hook_id::scoped() const { return owned_hook(*this); }

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-        A P I   D E F I N I T I O N S        -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

template <typename... Args>
struct event;

template <typename T>
struct property;

template <typename T>
class binding;

template <typename T>
class read_guard;

template <typename... Args, typename F>
    requires std::invocable<F&, const Args&...>
[[nodiscard]] owned_hook hook(event<Args...>* e, F&& func);

template <typename... Args, typename F>
    requires std::invocable<F&, const Args&...>
[[nodiscard]] owned_hook once(event<Args...>* e, F&& func);

template <typename... Args>
void emit(event<Args...>* e, const std::type_identity_t<Args>&... args);

template <typename... Args>
e_status unhook(event<Args...>* e, int64_t id);

template <typename... Args>
e_status unhook_all(event<Args...>* e);

template <typename... Args>
size_t hook_count(event<Args...>* e);

template <typename T, typename F>
    requires std::invocable<F&, const T&>
[[nodiscard]] owned_hook hook(property<T>* p, F&& func);

template <typename T, typename F>
    requires std::invocable<F&, const T&>
[[nodiscard]] owned_hook once(property<T>* p, F&& func);

template <typename T, typename F>
    requires std::invocable<F&, const T&>
[[nodiscard]] binding<T> bind(property<T>* p, F&& func);

template <typename T>
T get(property<T>* p);

template <typename T>
read_guard<T> read(property<T>* p);

template <typename T>
void set(property<T>* p, std::type_identity_t<T> value);

template <typename T, typename F>
    requires std::invocable<F&, T&>
void update(property<T>* p, F&& func);

template <typename T>
e_status unhook(property<T>* p, int64_t id);

template <typename T>
e_status unhook_all(property<T>* p);

template <typename T>
size_t hook_count(property<T>* p);

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-                  E V E N T                  -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

// stateless apart from its hooks, event<> is a signal without payload
template <typename... Args>
struct event {
    // shared so a pass in flight keeps the registry alive, hooks only hold weak references
    std::shared_ptr<detail::registry<Args...>> state;

    event() : state(std::make_shared<detail::registry<Args...>>()) {}

    event(event&&) noexcept = default;
    event& operator=(event&&) noexcept = default;

    event(const event&) = delete;
    event& operator=(const event&) = delete;

#if defined(TETHER_METHODS)
    template <typename F>
        requires std::invocable<F&, const Args&...>
    [[nodiscard]] owned_hook hook(F&& func) {
        return TETHER_NS::hook(this, std::forward<F>(func));
    }

    template <typename F>
        requires std::invocable<F&, const Args&...>
    [[nodiscard]] owned_hook once(F&& func) {
        return TETHER_NS::once(this, std::forward<F>(func));
    }

    void emit(const Args&... args) { TETHER_NS::emit(this, args...); }

    e_status unhook(int64_t id) { return TETHER_NS::unhook(this, id); }

    e_status unhook_all() { return TETHER_NS::unhook_all(this); }

    size_t hook_count() { return TETHER_NS::hook_count(this); }
#endif
};

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-               P R O P E R T Y               -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

namespace detail {

template <typename T>
struct property_data {
    explicit property_data(T value) : value(std::move(value)) {}

    T value;
    registry<T> callbacks;

#if defined(TETHER_THREAD_SAFE)
    std::shared_mutex mu;
#endif

    // the value to notify with and the hooks to notify, both captured under the same lock
    struct pending {
        T value;
        typename registry<T>::pass_type pass;
    };

    T load() {
        shared_scope(mu);
        return value;
    }

    template <typename F>
    pending commit(F&& mutate) {
        mutex_scope(mu);
        mutate(value);
        return pending{value, callbacks.snapshot()};
    }
};

}  // namespace detail

// a value that notifies its hooks on every write, equal writes included, hooking does not replay
// the current value
template <typename T>
struct property {
    std::shared_ptr<detail::property_data<T>> data;

    property()
        requires std::default_initializable<T>
        : data(std::make_shared<detail::property_data<T>>(T{})) {}

    explicit property(T value)
        : data(std::make_shared<detail::property_data<T>>(std::move(value))) {}

    property(property&&) noexcept = default;
    property& operator=(property&&) noexcept = default;

    property(const property&) = delete;
    property& operator=(const property&) = delete;

#if defined(TETHER_METHODS)
    template <typename F>
        requires std::invocable<F&, const T&>
    [[nodiscard]] owned_hook hook(F&& func) {
        return TETHER_NS::hook(this, std::forward<F>(func));
    }

    template <typename F>
        requires std::invocable<F&, const T&>
    [[nodiscard]] owned_hook once(F&& func) {
        return TETHER_NS::once(this, std::forward<F>(func));
    }

    template <typename F>
        requires std::invocable<F&, const T&>
    [[nodiscard]] binding<T> bind(F&& func) {
        return TETHER_NS::bind(this, std::forward<F>(func));
    }

    T get() { return TETHER_NS::get(this); }

    read_guard<T> read() { return TETHER_NS::read(this); }

    void set(std::type_identity_t<T> value) { TETHER_NS::set(this, std::move(value)); }

    template <typename F>
        requires std::invocable<F&, T&>
    void update(F&& func) {
        TETHER_NS::update(this, std::forward<F>(func));
    }

    e_status unhook(int64_t id) { return TETHER_NS::unhook(this, id); }

    e_status unhook_all() { return TETHER_NS::unhook_all(this); }

    size_t hook_count() { return TETHER_NS::hook_count(this); }
#endif
};

// Gives access to the value without copying it.
//
// With TETHER_THREAD_SAFE this holds a shared lock for its whole lifetime, so writing to the same
// property from the thread holding the guard deadlocks.
template <typename T>
class read_guard {
public:
    explicit read_guard(std::shared_ptr<detail::property_data<T>> data)
        : data(std::move(data))
#if defined(TETHER_THREAD_SAFE)
          ,
          lock(this->data->mu)
#endif
    {
    }

    const T& get() const { return data->value; }
    const T& operator*() const { return data->value; }
    const T* operator->() const { return &data->value; }

private:
    std::shared_ptr<detail::property_data<T>> data;
#if defined(TETHER_THREAD_SAFE)
    std::shared_lock<std::shared_mutex> lock;
#endif
};

// A read/write hook on a property.
//
// Writes made through the binding notify every other hook of the property but not the binding's
// own callback, which lets two sides of a two way binding stay in sync without echoing. The
// binding keeps the property's state alive, so it can outlive the property object itself.
template <typename T>
class binding {
public:
    binding() = default;

    binding(std::shared_ptr<detail::property_data<T>> data, owned_hook hook)
        : data(std::move(data)), hook(std::move(hook)) {}

    // only for bindings returned by bind(), a default constructed binding has no value to read
    T get() const { return data->load(); }

    e_status set(std::type_identity_t<T> value) {
        if (!data) {
            return INVALID_HOOK;
        }

        auto pending = data->commit([&value](T& v) { v = std::move(value); });
        detail::registry<T>::notify(pending.pass, hook.id(), pending.value);
        return OK;
    }

    // false only for a default constructed binding
    bool bound() const { return data != nullptr; }

    // after unhooking, the binding still reads and writes but no longer receives notifications
    e_status unhook() { return hook.unhook(); }

    bool valid() const { return hook.valid(); }

    int64_t id() const { return hook.id(); }

private:
    // declared first so the hook is released while the state is still alive
    std::shared_ptr<detail::property_data<T>> data;
    owned_hook hook;
};

// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=
// =-              A P I   I M P L S              -=
// =-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=-=

// registers func on the event, it runs on every emit until the returned hook is released
template <typename... Args, typename F>
    requires std::invocable<F&, const Args&...>
[[nodiscard]] owned_hook hook(event<Args...>* e, F&& func) {
    int64_t id = e->state->add(std::forward<F>(func));
    return owned_hook(hook_id{id, e->state});
}

// registers func for the next emit only
template <typename... Args, typename F>
    requires std::invocable<F&, const Args&...>
[[nodiscard]] owned_hook once(event<Args...>* e, F&& func) {
    int64_t id = e->state->add_once(std::forward<F>(func));
    return owned_hook(hook_id{id, e->state});
}

// invokes every hook of the event on the current thread, in registration order
template <typename... Args>
void emit(event<Args...>* e, const std::type_identity_t<Args>&... args) {
    auto state = e->state;
    state->notify_all(args...);
}

template <typename... Args>
e_status unhook(event<Args...>* e, int64_t id) {
    return e->state->remove(id);
}

// removes every hook, handles still held by consumers become stale
template <typename... Args>
e_status unhook_all(event<Args...>* e) {
    e->state->clear();
    return OK;
}

template <typename... Args>
size_t hook_count(event<Args...>* e) {
    return e->state->size();
}

namespace detail {

// the registry inside a property shares ownership with the whole property state
template <typename T>
std::shared_ptr<registry_base> registry_of(const std::shared_ptr<property_data<T>>& data) {
    return std::shared_ptr<registry_base>(data, &data->callbacks);
}

}  // namespace detail

// registers a change hook, it is not called with the current value, only with future writes
template <typename T, typename F>
    requires std::invocable<F&, const T&>
[[nodiscard]] owned_hook hook(property<T>* p, F&& func) {
    int64_t id = p->data->callbacks.add(std::forward<F>(func));
    return owned_hook(hook_id{id, detail::registry_of(p->data)});
}

// registers a change hook for the next write only
template <typename T, typename F>
    requires std::invocable<F&, const T&>
[[nodiscard]] owned_hook once(property<T>* p, F&& func) {
    int64_t id = p->data->callbacks.add_once(std::forward<F>(func));
    return owned_hook(hook_id{id, detail::registry_of(p->data)});
}

template <typename T, typename F>
    requires std::invocable<F&, const T&>
[[nodiscard]] binding<T> bind(property<T>* p, F&& func) {
    owned_hook h = TETHER_NS::hook(p, std::forward<F>(func));
    return binding<T>(p->data, std::move(h));
}

template <typename T>
T get(property<T>* p) {
    return p->data->load();
}

template <typename T>
read_guard<T> read(property<T>* p) {
    return read_guard<T>(p->data);
}

// stores the value, then notifies every hook with it before returning
template <typename T>
void set(property<T>* p, std::type_identity_t<T> value) {
    auto data = p->data;
    auto pending = data->commit([&value](T& v) { v = std::move(value); });
    detail::registry<T>::notify(pending.pass, -1, pending.value);
}

// mutates the value in place under the write lock, then notifies with the result, if func throws
// nobody is notified
//
// With TETHER_THREAD_SAFE func runs while the write lock is held, so calling get, read, set or
// update on the same property from inside func deadlocks.
template <typename T, typename F>
    requires std::invocable<F&, T&>
void update(property<T>* p, F&& func) {
    auto data = p->data;
    auto pending = data->commit(func);
    detail::registry<T>::notify(pending.pass, -1, pending.value);
}

template <typename T>
e_status unhook(property<T>* p, int64_t id) {
    return p->data->callbacks.remove(id);
}

template <typename T>
e_status unhook_all(property<T>* p) {
    p->data->callbacks.clear();
    return OK;
}

template <typename T>
size_t hook_count(property<T>* p) {
    return p->data->callbacks.size();
}

}  // namespace TETHER_NS

#endif /* TETHER_H */
