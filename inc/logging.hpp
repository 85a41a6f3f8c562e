//SPDX-License-Identifier: MIT
//Author: Blayne Dennis
#ifndef KCORE_LOGGING
#define KCORE_LOGGING

#include <cstddef>
#include <cstdint>
#include <string>
#include <sstream>
#include <ostream>
#include <coroutine>
#include <memory>
#include <optional>
#include <vector>
#include <typeinfo>

#include "loguru.hpp"
#include "utility.hpp"

/**
 Compile time macro determining which log statements are compiled at all.
 Statements beneath the limit resolve to an empty statement, so a kernel built
 with KCORELOGLIMIT at -1 pays nothing for its debug logging.

 The `CONSTRUCTOR`, `DESTRUCTOR`, and `METHOD` macros can *only* be called from
 implementations of `kcore::printable`, because they print the object's name,
 address and optional content. `FUNCTION` and `LOG` macros can be called
 anywhere.

 `ENTER` and `CONSTRUCTOR` macros treat their trailing arguments as function
 arguments:
 KCORE_INFO_FUNCTION_ENTER("spawn", "task", 3);
 prints: spawn(task, 3)

 `BODY` macros concatenate their trailing arguments into one logline:
 KCORE_INFO_FUNCTION_BODY("spawn", "queued ", 3);
 prints: spawn():queued 3

 `LOG` macros accept a `printf()` style format string.
 */
#ifndef KCORELOGLIMIT
#define KCORELOGLIMIT -1
#endif

#if KCORELOGLIMIT < -9
#undef KCORELOGLIMIT
#define KCORELOGLIMIT -9
#endif

#if KCORELOGLIMIT > 9
#undef KCORELOGLIMIT
#define KCORELOGLIMIT 9
#endif

// shared expansions, the level specific macros below select a verbosity
#define KCORE_LOG_CONSTRUCTOR_(v, ...) kcore::logger::constructor(this, v, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOG_DESTRUCTOR_(v) kcore::logger::destructor(this, v, __FILE__, __LINE__)
#define KCORE_LOG_METHOD_ENTER_(v, ...) kcore::logger::method_enter(this, v, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOG_METHOD_BODY_(v, ...) kcore::logger::method_body(this, v, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOG_FUNCTION_ENTER_(v, ...) kcore::logger::function_enter(v, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOG_FUNCTION_BODY_(v, ...) kcore::logger::function_body(v, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOG_PRINTF_(v, ...) loguru::log(v, __FILE__, __LINE__ __VA_OPT__(,) __VA_ARGS__)

#if KCORELOGLIMIT >= -3
#define KCORE_FATAL_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(loguru::Verbosity_FATAL __VA_OPT__(,) __VA_ARGS__)
#define KCORE_FATAL_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(loguru::Verbosity_FATAL)
#define KCORE_FATAL_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define KCORE_FATAL_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(loguru::Verbosity_FATAL __VA_OPT__(,) __VA_ARGS__)
#define KCORE_FATAL_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(loguru::Verbosity_FATAL __VA_OPT__(,) __VA_ARGS__)
#define KCORE_FATAL_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(loguru::Verbosity_FATAL __VA_OPT__(,) __VA_ARGS__)
#define KCORE_FATAL_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(loguru::Verbosity_FATAL __VA_OPT__(,) __VA_ARGS__)
#define KCORE_FATAL_LOG(...) KCORE_LOG_PRINTF_(loguru::Verbosity_FATAL __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_FATAL_CONSTRUCTOR(...) (void)0
#define KCORE_FATAL_DESTRUCTOR() (void)0
#define KCORE_FATAL_GUARD(...) (void)0
#define KCORE_FATAL_METHOD_ENTER(...) (void)0
#define KCORE_FATAL_METHOD_BODY(...) (void)0
#define KCORE_FATAL_FUNCTION_ENTER(...) (void)0
#define KCORE_FATAL_FUNCTION_BODY(...) (void)0
#define KCORE_FATAL_LOG(...) (void)0
#endif

#if KCORELOGLIMIT >= -2
#define KCORE_ERROR_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(loguru::Verbosity_ERROR __VA_OPT__(,) __VA_ARGS__)
#define KCORE_ERROR_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(loguru::Verbosity_ERROR)
#define KCORE_ERROR_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define KCORE_ERROR_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(loguru::Verbosity_ERROR __VA_OPT__(,) __VA_ARGS__)
#define KCORE_ERROR_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(loguru::Verbosity_ERROR __VA_OPT__(,) __VA_ARGS__)
#define KCORE_ERROR_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(loguru::Verbosity_ERROR __VA_OPT__(,) __VA_ARGS__)
#define KCORE_ERROR_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(loguru::Verbosity_ERROR __VA_OPT__(,) __VA_ARGS__)
#define KCORE_ERROR_LOG(...) KCORE_LOG_PRINTF_(loguru::Verbosity_ERROR __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_ERROR_CONSTRUCTOR(...) (void)0
#define KCORE_ERROR_DESTRUCTOR() (void)0
#define KCORE_ERROR_GUARD(...) (void)0
#define KCORE_ERROR_METHOD_ENTER(...) (void)0
#define KCORE_ERROR_METHOD_BODY(...) (void)0
#define KCORE_ERROR_FUNCTION_ENTER(...) (void)0
#define KCORE_ERROR_FUNCTION_BODY(...) (void)0
#define KCORE_ERROR_LOG(...) (void)0
#endif

#if KCORELOGLIMIT >= -1
#define KCORE_WARNING_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(loguru::Verbosity_WARNING __VA_OPT__(,) __VA_ARGS__)
#define KCORE_WARNING_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(loguru::Verbosity_WARNING)
#define KCORE_WARNING_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define KCORE_WARNING_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(loguru::Verbosity_WARNING __VA_OPT__(,) __VA_ARGS__)
#define KCORE_WARNING_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(loguru::Verbosity_WARNING __VA_OPT__(,) __VA_ARGS__)
#define KCORE_WARNING_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(loguru::Verbosity_WARNING __VA_OPT__(,) __VA_ARGS__)
#define KCORE_WARNING_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(loguru::Verbosity_WARNING __VA_OPT__(,) __VA_ARGS__)
#define KCORE_WARNING_LOG(...) KCORE_LOG_PRINTF_(loguru::Verbosity_WARNING __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_WARNING_CONSTRUCTOR(...) (void)0
#define KCORE_WARNING_DESTRUCTOR() (void)0
#define KCORE_WARNING_GUARD(...) (void)0
#define KCORE_WARNING_METHOD_ENTER(...) (void)0
#define KCORE_WARNING_METHOD_BODY(...) (void)0
#define KCORE_WARNING_FUNCTION_ENTER(...) (void)0
#define KCORE_WARNING_FUNCTION_BODY(...) (void)0
#define KCORE_WARNING_LOG(...) (void)0
#endif

#if KCORELOGLIMIT >= 0
#define KCORE_INFO_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(loguru::Verbosity_INFO __VA_OPT__(,) __VA_ARGS__)
#define KCORE_INFO_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(loguru::Verbosity_INFO)
#define KCORE_INFO_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define KCORE_INFO_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(loguru::Verbosity_INFO __VA_OPT__(,) __VA_ARGS__)
#define KCORE_INFO_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(loguru::Verbosity_INFO __VA_OPT__(,) __VA_ARGS__)
#define KCORE_INFO_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(loguru::Verbosity_INFO __VA_OPT__(,) __VA_ARGS__)
#define KCORE_INFO_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(loguru::Verbosity_INFO __VA_OPT__(,) __VA_ARGS__)
#define KCORE_INFO_LOG(...) KCORE_LOG_PRINTF_(loguru::Verbosity_INFO __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_INFO_CONSTRUCTOR(...) (void)0
#define KCORE_INFO_DESTRUCTOR() (void)0
#define KCORE_INFO_GUARD(...) (void)0
#define KCORE_INFO_METHOD_ENTER(...) (void)0
#define KCORE_INFO_METHOD_BODY(...) (void)0
#define KCORE_INFO_FUNCTION_ENTER(...) (void)0
#define KCORE_INFO_FUNCTION_BODY(...) (void)0
#define KCORE_INFO_LOG(...) (void)0
#endif

// high criticality lifecycle
#if KCORELOGLIMIT >= 1
#define KCORE_HIGH_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(1 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_HIGH_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(1)
#define KCORE_HIGH_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define KCORE_HIGH_CONSTRUCTOR(...) (void)0
#define KCORE_HIGH_DESTRUCTOR() (void)0
#define KCORE_HIGH_GUARD(...) (void)0
#endif

// high criticality functions and methods
#if KCORELOGLIMIT >= 2
#define KCORE_HIGH_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(2 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_HIGH_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(2 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_HIGH_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(2 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_HIGH_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(2 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_HIGH_LOG(...) KCORE_LOG_PRINTF_(2 __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_HIGH_METHOD_ENTER(...) (void)0
#define KCORE_HIGH_METHOD_BODY(...) (void)0
#define KCORE_HIGH_FUNCTION_ENTER(...) (void)0
#define KCORE_HIGH_FUNCTION_BODY(...) (void)0
#define KCORE_HIGH_LOG(...) (void)0
#endif

// medium criticality lifecycle
#if KCORELOGLIMIT >= 3
#define KCORE_MED_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(3 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MED_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(3)
#define KCORE_MED_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define KCORE_MED_CONSTRUCTOR(...) (void)0
#define KCORE_MED_DESTRUCTOR() (void)0
#define KCORE_MED_GUARD(...) (void)0
#endif

// medium criticality functions and methods
#if KCORELOGLIMIT >= 4
#define KCORE_MED_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(4 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MED_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(4 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MED_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(4 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MED_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(4 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MED_LOG(...) KCORE_LOG_PRINTF_(4 __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_MED_METHOD_ENTER(...) (void)0
#define KCORE_MED_METHOD_BODY(...) (void)0
#define KCORE_MED_FUNCTION_ENTER(...) (void)0
#define KCORE_MED_FUNCTION_BODY(...) (void)0
#define KCORE_MED_LOG(...) (void)0
#endif

// low criticality lifecycle
#if KCORELOGLIMIT >= 5
#define KCORE_LOW_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(5 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOW_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(5)
#define KCORE_LOW_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define KCORE_LOW_CONSTRUCTOR(...) (void)0
#define KCORE_LOW_DESTRUCTOR() (void)0
#define KCORE_LOW_GUARD(...) (void)0
#endif

// low criticality functions and methods
#if KCORELOGLIMIT >= 6
#define KCORE_LOW_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(6 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOW_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(6 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOW_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(6 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOW_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(6 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_LOW_LOG(...) KCORE_LOG_PRINTF_(6 __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_LOW_METHOD_ENTER(...) (void)0
#define KCORE_LOW_METHOD_BODY(...) (void)0
#define KCORE_LOW_FUNCTION_ENTER(...) (void)0
#define KCORE_LOW_FUNCTION_BODY(...) (void)0
#define KCORE_LOW_LOG(...) (void)0
#endif

// minimal criticality lifecycle
#if KCORELOGLIMIT >= 7
#define KCORE_MIN_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(7 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MIN_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(7)
#define KCORE_MIN_GUARD(test, ...) if(test) { __VA_ARGS__; }
#else
#define KCORE_MIN_CONSTRUCTOR(...) (void)0
#define KCORE_MIN_DESTRUCTOR() (void)0
#define KCORE_MIN_GUARD(...) (void)0
#endif

// minimal criticality functions and methods
#if KCORELOGLIMIT >= 8
#define KCORE_MIN_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(8 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MIN_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(8 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MIN_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(8 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MIN_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(8 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_MIN_LOG(...) KCORE_LOG_PRINTF_(8 __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_MIN_METHOD_ENTER(...) (void)0
#define KCORE_MIN_METHOD_BODY(...) (void)0
#define KCORE_MIN_FUNCTION_ENTER(...) (void)0
#define KCORE_MIN_FUNCTION_BODY(...) (void)0
#define KCORE_MIN_LOG(...) (void)0
#endif

// only for stepping through scheduling decisions when a debugger won't do
#if KCORELOGLIMIT >= 9
#define KCORE_TRACE_CONSTRUCTOR(...) KCORE_LOG_CONSTRUCTOR_(9 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_TRACE_DESTRUCTOR() KCORE_LOG_DESTRUCTOR_(9)
#define KCORE_TRACE_GUARD(test, ...) if(test) { __VA_ARGS__; }
#define KCORE_TRACE_METHOD_ENTER(...) KCORE_LOG_METHOD_ENTER_(9 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_TRACE_METHOD_BODY(...) KCORE_LOG_METHOD_BODY_(9 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_TRACE_FUNCTION_ENTER(...) KCORE_LOG_FUNCTION_ENTER_(9 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_TRACE_FUNCTION_BODY(...) KCORE_LOG_FUNCTION_BODY_(9 __VA_OPT__(,) __VA_ARGS__)
#define KCORE_TRACE_LOG(...) KCORE_LOG_PRINTF_(9 __VA_OPT__(,) __VA_ARGS__)
#else
#define KCORE_TRACE_CONSTRUCTOR(...) (void)0
#define KCORE_TRACE_DESTRUCTOR() (void)0
#define KCORE_TRACE_GUARD(...) (void)0
#define KCORE_TRACE_METHOD_ENTER(...) (void)0
#define KCORE_TRACE_METHOD_BODY(...) (void)0
#define KCORE_TRACE_FUNCTION_ENTER(...) (void)0
#define KCORE_TRACE_FUNCTION_BODY(...) (void)0
#define KCORE_TRACE_LOG(...) (void)0
#endif

namespace kcore {

/**
 @brief type name strings for logging templates

 `kcore::type::name<T>()` produces a readable name for `T` without needing an
 instance. Types opt in either by specializing `kcore::type::info<T>` or by
 providing `static std::string T::info_name()`. Anything else falls back to
 `typeid(T).name()`.
 */
namespace type {

/// return a string representing the cv type qualifier
template <typename T>
std::string cv_name() {
    if constexpr (std::is_const_v<T>) {
        if constexpr (std::is_volatile_v<T>) {
            return "const volatile";
        } else {
            return "const";
        }
    } else if constexpr (std::is_volatile_v<T>) {
        return "volatile";
    } else {
        return "";
    }
}

/// return a string representing the reference type qualifier
template <typename T>
std::string reference_name() {
    if constexpr (std::is_pointer_v<T>) {
        return "*";
    } else if constexpr (std::is_lvalue_reference_v<T>) {
        return "&";
    } else if constexpr (std::is_rvalue_reference_v<T>) {
        return "&&";
    } else {
        return "";
    }
}

/// strip namespaces and template arguments from a type name
inline std::string basename(std::string name) {
    size_t pos = name.rfind("::");

    if (pos != std::string::npos) [[likely]] {
        name = name.substr(pos + 2);
    }

    size_t open_pos = name.rfind('<');
    size_t close_pos = name.rfind('>');

    if (open_pos != std::string::npos &&
        close_pos != std::string::npos &&
        open_pos < close_pos)
    {
        name = name.substr(0, open_pos);
    }

    return name;
}

/// fallback name of an unknown `T`
template <typename T, typename = void>
struct info {
    static inline std::string name(){ return typeid(T).name(); }
};

/// selected when `T` provides `static std::string info_name()`
template <typename T>
struct info<T, std::void_t<decltype(T::info_name())>> {
    static inline std::string name() { return T::info_name(); }
};

#define KCORE_TYPE_INFO_(T, STR) \
    template <> struct info<T,void> { static inline std::string name(){ return STR; } }

KCORE_TYPE_INFO_(void, "void");
KCORE_TYPE_INFO_(bool, "bool");
KCORE_TYPE_INFO_(char, "char");
KCORE_TYPE_INFO_(signed char, "signed char");
KCORE_TYPE_INFO_(unsigned char, "unsigned char");
KCORE_TYPE_INFO_(short int, "short int");
KCORE_TYPE_INFO_(unsigned short int, "unsigned short int");
KCORE_TYPE_INFO_(int, "int");
KCORE_TYPE_INFO_(unsigned int, "unsigned int");
KCORE_TYPE_INFO_(long int, "long int");
KCORE_TYPE_INFO_(unsigned long int, "unsigned long int");
KCORE_TYPE_INFO_(long long int, "long long int");
KCORE_TYPE_INFO_(unsigned long long int, "unsigned long long int");
KCORE_TYPE_INFO_(float, "float");
KCORE_TYPE_INFO_(double, "double");
KCORE_TYPE_INFO_(std::byte, "std::byte");
KCORE_TYPE_INFO_(std::string, "std::string");

#undef KCORE_TYPE_INFO_

/// acquire a runtime accessible name string of a type T
template <typename T>
inline std::string name() {
    std::stringstream ss;
    ss << cv_name<T>()
       << info<unqualified<std::remove_pointer_t<T>>>::name()
       << reference_name<T>();
    return ss.str();
};

namespace detail {

template <typename T>
inline void templatize(std::stringstream& ss) { ss << name<T>(); }

template <typename T, typename T2, typename... Ts>
inline void templatize(std::stringstream& ss) {
    ss << name<T>() << ",";
    templatize<T2,Ts...>(ss);
}

}

/**
 @brief append template tags with the real names of `T, Ts...` to `s`

 `templatize<int,std::string>("kcore::box")` returns
 "kcore::box<int,std::string>".
 */
template <typename T, typename... Ts>
inline std::string templatize(const std::string& s) {
    std::stringstream ss;
    ss << s << "<";
    detail::templatize<T,Ts...>(ss);
    ss << ">";
    return ss.str();
}

template <typename T>
struct info<std::coroutine_handle<T>,void> {
    static inline std::string name(){
        return templatize<T>("std::coroutine_handle");
    }
};

template <typename T>
struct info<std::shared_ptr<T>,void> {
    static inline std::string name(){ return templatize<T>("std::shared_ptr"); }
};

template <typename T>
struct info<std::optional<T>,void> {
    static inline std::string name(){ return templatize<T>("std::optional"); }
};

template <typename T>
struct info<std::vector<T>,void> {
    static inline std::string name(){ return templatize<T>("std::vector"); }
};

}

/*
 @brief interface for allowing an object instance to be printable

 Objects which implement printable can passed to streams and converted to
 `std::string` representation.
 */
struct printable {
    virtual ~printable() { }

    /// the namespaced and templatized object name
    virtual std::string name() const = 0;

    /// optional description of this object's state
    virtual inline std::string content() const { return {}; }

    /// string conversion
    inline std::string to_string() const {
        std::stringstream ss;
        ss << this->name() << "@" << (const void*)this;

        std::string c = this->content();

        if(!(c.empty())) {
            ss << "[" << c << "]";
        }

        return ss.str();
    }

    inline operator std::string() const { return to_string(); }
};

}

namespace std {

inline std::string to_string(const kcore::printable& p) { return p.to_string(); }

}

inline std::ostream& operator<<(std::ostream& out, const kcore::printable& p) {
    out << p.to_string();
    return out;
}

inline std::ostream& operator<<(std::ostream& out, const kcore::printable* p) {
    if(p) { out << *p; }
    else { out << "kcore::printable@nullptr"; }
    return out;
}

template <typename PROMISE>
inline std::ostream& operator<<(std::ostream& out, const std::coroutine_handle<PROMISE>& h) {
    out << kcore::type::name<std::coroutine_handle<PROMISE>>()
        << "@"
        << h.address();
    return out;
}

namespace kcore {
namespace config {
namespace logging {

/**
 @brief the process wide default log level

 Set by compiler define KCORELOGLEVEL. Threads inherit this log level.
 */
int default_log_level();

/**
 @brief initialize loguru once for the process

 Safe to call repeatedly, only the first call has an effect.
 */
void initialize();

}
}

/**
 @brief namespace object for the underlying logging functions

 Rarely called directly, the `KCORE_*` macros decide at compile time whether a
 call is written at all.
 */
struct logger {
    /// the calling thread's log level
    static int thread_log_level();

    /// set the calling thread's log level, clamped to [-9,9]
    static void thread_log_level(int level);

    template <typename... As>
    static inline void constructor(const printable* p,
                                   int verbosity,
                                   const char* file,
                                   int line,
                                   As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());
            std::string name_str(type::basename(p->name()));

            loguru::log(verbosity, file, line, "%s::%s(%s)",
                        self.c_str(), name_str.c_str(), ingested.c_str());
        }
    }

    static inline void destructor(const printable* p,
                                  int verbosity,
                                  const char* file,
                                  int line) {
        if(verbosity <= logger::thread_log_level()) {
            std::string self(*p);
            std::string name_str(type::basename(p->name()));

            loguru::log(verbosity, file, line, "%s::~%s()",
                        self.c_str(), name_str.c_str());
        }
    }

    template <typename... As>
    static inline void method_enter(const printable* p,
                                    int verbosity,
                                    const char* file,
                                    int line,
                                    const std::string& method_name,
                                    As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s::%s(%s)",
                        self.c_str(), method_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void method_body(const printable* p,
                                   int verbosity,
                                   const char* file,
                                   int line,
                                   const std::string& method_name,
                                   As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_(ss, std::forward<As>(as)...);
            std::string self(*p);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s::%s():%s",
                        self.c_str(), method_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void function_enter(int verbosity,
                                      const char* file,
                                      int line,
                                      const std::string& function_name,
                                      As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_parameters_(ss, std::forward<As>(as)...);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s(%s)",
                        function_name.c_str(), ingested.c_str());
        }
    }

    template <typename... As>
    static inline void function_body(int verbosity,
                                     const char* file,
                                     int line,
                                     const std::string& function_name,
                                     As&&... as) {
        if(verbosity <= logger::thread_log_level()) {
            std::stringstream ss;
            logger::ingest_(ss, std::forward<As>(as)...);
            std::string ingested(ss.str());

            loguru::log(verbosity, file, line, "%s():%s",
                        function_name.c_str(), ingested.c_str());
        }
    }

private:
    logger(){}

    static int& tl_loglevel();

    static inline void ingest_rest_of_args_(std::stringstream&) { }

    template <typename A, typename... As>
    static inline void ingest_rest_of_args_(std::stringstream& ss, A&& a, As&&... as) {
        ss << ", " << std::forward<A>(a);
        ingest_rest_of_args_(ss, std::forward<As>(as)...);
    }

    static inline void ingest_parameters_(std::stringstream&) { }

    // comma separated function arguments
    template <typename A, typename... As>
    static inline void ingest_parameters_(std::stringstream& ss, A&& a, As&&... as) {
        ss << std::forward<A>(a);
        ingest_rest_of_args_(ss, std::forward<As>(as)...);
    }

    static inline void ingest_(std::stringstream&) { }

    // arbitrary concatenated logline data
    template <typename A, typename... As>
    static inline void ingest_(std::stringstream& ss, A&& a, As&&... as) {
        ss << std::forward<A>(a);
        ingest_(ss, std::forward<As>(as)...);
    }
};

}

#endif
