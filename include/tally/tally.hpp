#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <compare>
#include <concepts>
#include <coroutine>
#include <cstddef>
#include <cstdio>
#include <deque>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <span>
#include <stdexcept>
#include <string_view>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <version>


// --- CONFIGURATION MACROS ---

// NOTE: Unless otherwise specified, those should have the same value in every translation unit, or you risk ODR violations!

// Whether we're building as a shared library.
#ifndef CFG_TALLY_SHARED
#define CFG_TALLY_SHARED 0
#endif
// The import/export macro we use on all non-inline functions.
// Probably shouldn't define this directly, prefer setting `CFG_TALLY_SHARED`.
#ifndef CFG_TALLY_API
#  if CFG_TALLY_SHARED
#    ifdef _WIN32
#      define CFG_TALLY_API __declspec(dllimport)
#    else
#      define CFG_TALLY_API __attribute__((__visibility__("default")))
#    endif
#  else
#    define CFG_TALLY_API
#  endif
#endif

// C++ standard release date.
#ifndef CFG_TALLY_CXX_STANDARD_DATE
#ifdef _MSC_VER
#define CFG_TALLY_CXX_STANDARD_DATE _MSVC_LANG
#else
#define CFG_TALLY_CXX_STANDARD_DATE __cplusplus
#endif
#endif
#if CFG_TALLY_CXX_STANDARD_DATE < 202002
#error Need C++20 or newer.
#endif

// Whether to use `<cxxabi.h>` to demangle names from `typeid(...).name()`.
// Otherwise the names are used as is.
#ifndef CFG_TALLY_CXXABI_DEMANGLE
#ifndef _MSC_VER
#define CFG_TALLY_CXXABI_DEMANGLE 1
#else
#define CFG_TALLY_CXXABI_DEMANGLE 0
#endif
#endif

// Whether to use libfmt instead of `std::format`.
// If you manually override the formatting function using other macros below, this will be ignored.
#ifndef CFG_TALLY_USE_LIBFMT
#  define CFG_TALLY_USE_LIBFMT 0
#endif
#if CFG_TALLY_USE_LIBFMT
#  if !__has_include(<fmt/format.h>)
#    error Tally was configured to use libfmt, but it's not installed.
#  endif
#else
#  ifndef __cpp_lib_format
#    error Tally was configured to use `std::format`, but your standard library doesn't support it. Switch to libfmt with `-DCFG_TALLY_USE_LIBFMT=1`.
#  endif
#endif

// The namespace of the formatting library.
// Spelled without the leading `::`, because we specialize `formatter` through it, and GCC rejects `struct ::ns::name<...>`.
#ifndef CFG_TALLY_FMT_NAMESPACE
#if CFG_TALLY_USE_LIBFMT
#include <fmt/format.h>
#define CFG_TALLY_FMT_NAMESPACE fmt
#else
#include <format>
#define CFG_TALLY_FMT_NAMESPACE std
#endif
#endif

// Whether the formatting library has a `vprint(FILE *, ...)`. If it's not there, we format to a temporary buffer first.
// 0 = none, 1 = `vprint_[non]unicode`, 2 = `vprint`.
#ifndef CFG_TALLY_FMT_HAS_FILE_VPRINT
#  if CFG_TALLY_USE_LIBFMT
#    define CFG_TALLY_FMT_HAS_FILE_VPRINT 2
#  else
#    ifdef __cpp_lib_print
#      define CFG_TALLY_FMT_HAS_FILE_VPRINT 1
#    else
#      define CFG_TALLY_FMT_HAS_FILE_VPRINT 0
#    endif
#  endif
#endif
// Whether the formatting library uses its own non-standard `string_view`-like type.
#ifndef CFG_TALLY_FMT_USES_CUSTOM_STRING_VIEW
#  if CFG_TALLY_USE_LIBFMT
#    define CFG_TALLY_FMT_USES_CUSTOM_STRING_VIEW 1
#  else
#    define CFG_TALLY_FMT_USES_CUSTOM_STRING_VIEW 0
#  endif
#endif

// Whether we should try to detect stdout or stderr being attached to an interactive terminal.
// If this is disabled, we assume not having a terminal, so the colored output is disabled by default.
#ifndef CFG_TALLY_DETECT_TERMINAL
#define CFG_TALLY_DETECT_TERMINAL 1
#endif

// The prefix of the environment variables that provide defaults for the command line flags, e.g. `TALLY_VERBOSE`.
#ifndef CFG_TALLY_ENV_PREFIX
#define CFG_TALLY_ENV_PREFIX "TALLY_"
#endif


// --- INTERFACE MACROS ---

// Check a condition. If it's false, the test stops and is reported as a failed check.
// Usage:
//     TALLY_CHECK( x == 42 );
#define TALLY_CHECK(...) DETAIL_TALLY_CHECK(#__VA_ARGS__, __VA_ARGS__)
// Check that two values compare equal. On failure both values are printed, so they must be formattable.
#define TALLY_CHECK_EQ(a, b) ::tally::detail::CheckEqual(::tally::SourceLoc(__FILE__, __LINE__), #a, #b, a, b)
// Fail the current test with a formatted message.
// Usage:
//     TALLY_FAIL("Stuff failed!");
//     TALLY_FAIL("Stuff {}!", "failed");
#define TALLY_FAIL(...) ::tally::detail::FailCheck(::tally::SourceLoc(__FILE__, __LINE__), CFG_TALLY_FMT_NAMESPACE::format(__VA_ARGS__))
// Mark the current test as not implemented yet. It stops the test, and counts as a failure, but not as a run test.
#define TALLY_TODO(...) throw ::tally::TodoSignal{CFG_TALLY_FMT_NAMESPACE::format(__VA_ARGS__)}
// Stop the current test and report it as skipped.
#define TALLY_SKIP() throw ::tally::SkipSignal{}

// Prints a formatted line to the standard output, which normally ends up in the test's output file.
#define TALLY_LOG(...) ::tally::detail::PrintLogLine(CFG_TALLY_FMT_NAMESPACE::format(__VA_ARGS__))
// Creates a scoped context message. If a failure unwinds through this scope, the message is appended to the failure.
// Usage:
//     TALLY_CONTEXT("i = {}", i);
#define TALLY_CONTEXT(...) ::tally::detail::ContextGuard DETAIL_TALLY_CAT(_tally_context_, __LINE__)(CFG_TALLY_FMT_NAMESPACE::format(__VA_ARGS__))


// --- INTERNAL MACROS ---

#define DETAIL_TALLY_CAT(x, y) DETAIL_TALLY_CAT_(x, y)
#define DETAIL_TALLY_CAT_(x, y) x##y

#define DETAIL_TALLY_CHECK(str_, ...) \
    do \
    { \
        if (!static_cast<bool>(__VA_ARGS__)) \
            ::tally::detail::FailCheck(::tally::SourceLoc(__FILE__, __LINE__), "Check failed: " str_); \
    } \
    while (false)


namespace tally
{
    class BasicRunner;
    struct BasicModule;

    namespace output
    {
        struct Terminal;
    }

    // The exit codes we're using.
    // On a normal run the exit code is the number of failed tests, clamped to `max_failure_count`.
    // The other codes are above that, so they can't be confused with a failure count.
    enum class ExitCode
    {
        ok = 0,
        max_failure_count = 100,
        bad_command_line_arguments = 120, // A generic issue with command line arguments or environment variables.
        invalid_test_names = 121, // Some group names didn't pass the validation.
        empty_selection = 122, // `test NAME_REGEX CASES` didn't match any tests.
        output_error = 123, // Couldn't prepare the run directory or capture the output.
    };

    // We try to classify the hard errors into interal ones and user-induced ones, but this is only an approximation.
    enum class HardErrorKind {internal, user};
    // Aborts the application with an error. Mostly for internal use.
    [[noreturn]] CFG_TALLY_API void HardError(std::string_view message, HardErrorKind kind = HardErrorKind::internal);

    // A simple source location.
    struct SourceLoc
    {
        std::string_view file;
        int line = 0;

        constexpr SourceLoc() {}
        constexpr SourceLoc(std::string_view file, int line) : file(file), line(line) {}

        friend auto operator<=>(const SourceLoc &, const SourceLoc &) = default;
    };

    // --- TEST SIGNALS ---

    // Thrown by `TALLY_CHECK(...)` and friends.
    // Doesn't inherit from `std::exception`, so that `catch (std::exception &)` in the tests doesn't intercept it.
    struct CheckFailure
    {
        SourceLoc loc;
        std::string message;
    };
    // Thrown by `TALLY_TODO(...)`.
    struct TodoSignal
    {
        std::string message;
    };
    // Thrown by `TALLY_SKIP()`.
    struct SkipSignal {};

    // Thrown when two tests in one suite have the same identity.
    struct DuplicateTestError : std::runtime_error
    {
        // The group name of the rejected test.
        std::string name;

        explicit DuplicateTestError(std::string name)
            : std::runtime_error("Duplicate test name: " + name), name(std::move(name))
        {}
    };

    // Thrown when the output of a test can't be redirected to its file.
    struct OutputCaptureError : std::system_error
    {
        using std::system_error::system_error;
    };

    // --- TEST IDENTITY ---

    // Identifies a single test case: the group name and the index in the group.
    struct TestPath
    {
        std::string name;
        std::size_t index = 0;

        // `name.000`.
        [[nodiscard]] CFG_TALLY_API std::string Display() const;
        // Same as `Display()`, but with the group name in lowercase. Two tests with the same key are the same test.
        [[nodiscard]] CFG_TALLY_API std::string FileKey() const;
        // The name of the file that receives the output of this test.
        [[nodiscard]] std::string OutputFileName() const {return FileKey() + ".output";}

        // Ordered by name, then by index.
        friend bool operator==(const TestPath &, const TestPath &) = default;
        friend std::strong_ordering operator<=>(const TestPath &, const TestPath &) = default;
    };

    // How expensive a test is.
    enum class SpeedLevel {quick, slow};

    // Whether a test of speed `test` runs when the run is limited to `minimum`.
    // Quick tests always run, slow tests only run when everything is requested.
    [[nodiscard]] constexpr bool IsSpeedSelected(SpeedLevel test, SpeedLevel minimum)
    {
        return test == SpeedLevel::quick || minimum == SpeedLevel::slow;
    }

    // --- OUTCOMES ---

    namespace outcome
    {
        // The test completed normally.
        struct Ok
        {
            friend bool operator==(const Ok &, const Ok &) = default;
        };
        // A check failed.
        struct CheckFailed
        {
            std::string message;
            friend bool operator==(const CheckFailed &, const CheckFailed &) = default;
        };
        // An unexpected exception escaped the test.
        // `kind` is `failure` for `std::runtime_error`, `invalid` for `std::invalid_argument`, and `exception` for everything else.
        struct Fault
        {
            std::string kind;
            std::string message;
            friend bool operator==(const Fault &, const Fault &) = default;
        };
        // The test didn't run.
        struct Skipped
        {
            friend bool operator==(const Skipped &, const Skipped &) = default;
        };
        // The test is marked as not implemented.
        struct Pending
        {
            std::string message;
            friend bool operator==(const Pending &, const Pending &) = default;
        };
    }
    using Outcome = std::variant<outcome::Ok, outcome::CheckFailed, outcome::Fault, outcome::Skipped, outcome::Pending>;

    // Whether the outcome counts as a failure. Note that pending tests are failures.
    [[nodiscard]] CFG_TALLY_API bool IsFailure(const Outcome &outcome);
    // Whether the outcome means that the test body actually ran.
    [[nodiscard]] CFG_TALLY_API bool HasRun(const Outcome &outcome);
    // `OK`, `FAIL`, `ERROR`, `SKIP` or `TODO`.
    [[nodiscard]] CFG_TALLY_API std::string_view OutcomeLabel(const Outcome &outcome);
    // The compact progress character: `.`, `F`, `E`, `S` or `T`.
    [[nodiscard]] CFG_TALLY_API char OutcomeChar(const Outcome &outcome);
    // The failure message for failed checks and faults, null otherwise.
    [[nodiscard]] CFG_TALLY_API std::optional<std::string> FailureText(const Outcome &outcome);

    // Converts an exception that escaped a test into an outcome.
    // Also consumes the context messages unwound by that exception.
    [[nodiscard]] CFG_TALLY_API Outcome ClassifyException(const std::exception_ptr &e);

    // The counts of a finished run.
    struct RunSummary
    {
        // How many tests actually ran.
        std::size_t ran = 0;
        // How many tests failed, including the pending ones.
        std::size_t failed = 0;
        std::chrono::duration<double> elapsed{};

        friend bool operator==(const RunSummary &, const RunSummary &) = default;
    };

    [[nodiscard]] CFG_TALLY_API RunSummary Summarize(std::span<const Outcome> outcomes, std::chrono::duration<double> elapsed);

    namespace text
    {
        // Demangles output from `typeid(...).name()`.
        class Demangler
        {
            #if CFG_TALLY_CXXABI_DEMANGLE
            char *buf_ptr = nullptr;
            std::size_t buf_size = 0;
            #endif

          public:
            CFG_TALLY_API Demangler();
            Demangler(const Demangler &) = delete;
            Demangler &operator=(const Demangler &) = delete;
            CFG_TALLY_API ~Demangler();

            // Demangles a name.
            // On GCC ang Clang invokes `__cxa_demangle()`, on MSVC returns the string unchanged.
            // The returned pointer remains as long as both the passed string and the class instance are alive.
            [[nodiscard]] CFG_TALLY_API const char *operator()(const char *name);
        };
    }

    namespace platform
    {
        // Returns true if the specified stream is attached to a terminal.
        // The result is cached.
        [[nodiscard]] CFG_TALLY_API bool IsTerminalAttached(bool is_stderr);
    }

    // --- REGISTRATION ---

    // Returns an error message if `name` can't be used as a group name, or null if it's fine.
    // Group names can contain letters, digits, `_`, `-` and spaces.
    [[nodiscard]] CFG_TALLY_API std::optional<std::string> ValidateGroupName(std::string_view name);
    // Adds a trailing period to a non-empty description that doesn't have one.
    [[nodiscard]] CFG_TALLY_API std::string NormalizeDescription(std::string description);

    // The test argument type, for tests that don't need one.
    struct Unit {};

    namespace coop
    {
        template <typename T = void>
        class Task;
    }

    // --- COOPERATIVE EXECUTION ---

    namespace coop
    {
        namespace detail
        {
            struct BasicPromise
            {
                // Resumed when the coroutine finishes.
                std::coroutine_handle<> continuation;
                std::exception_ptr exception;

                std::suspend_always initial_suspend() noexcept {return {};}

                struct FinalAwaiter
                {
                    bool await_ready() noexcept {return false;}

                    template <typename P>
                    std::coroutine_handle<> await_suspend(std::coroutine_handle<P> handle) noexcept
                    {
                        if (auto next = handle.promise().continuation)
                            return next;
                        return std::noop_coroutine();
                    }

                    void await_resume() noexcept {}
                };
                FinalAwaiter final_suspend() noexcept {return {};}

                void unhandled_exception() noexcept {exception = std::current_exception();}
            };

            template <typename T>
            struct Promise : BasicPromise
            {
                std::optional<T> value;

                Task<T> get_return_object() noexcept;
                void return_value(T new_value) {value.emplace(std::move(new_value));}
            };

            template <>
            struct Promise<void> : BasicPromise
            {
                Task<void> get_return_object() noexcept;
                void return_void() noexcept {}
            };
        }

        // A lazily started coroutine. It starts running when awaited, or when passed to `EventLoop::RunUntilComplete()`.
        template <typename T>
        class [[nodiscard]] Task
        {
          public:
            using promise_type = detail::Promise<T>;

          private:
            std::coroutine_handle<promise_type> handle;

            static T GetResult(std::coroutine_handle<promise_type> handle)
            {
                if (handle.promise().exception)
                    std::rethrow_exception(handle.promise().exception);
                if constexpr (!std::is_void_v<T>)
                    return std::move(*handle.promise().value);
            }

          public:
            Task() {}
            explicit Task(std::coroutine_handle<promise_type> handle) : handle(handle) {}

            Task(Task &&other) noexcept : handle(std::exchange(other.handle, {})) {}
            Task &operator=(Task other) noexcept
            {
                std::swap(handle, other.handle);
                return *this;
            }

            ~Task()
            {
                if (handle)
                    handle.destroy();
            }

            [[nodiscard]] bool IsDone() const {return handle && handle.done();}
            [[nodiscard]] std::coroutine_handle<> Handle() const {return handle;}

            // Returns the result or rethrows the exception. The task must be done.
            T TakeResult()
            {
                if (!IsDone())
                    HardError("The task isn't finished yet.");
                return GetResult(handle);
            }

            auto operator co_await() noexcept
            {
                struct Awaiter
                {
                    std::coroutine_handle<promise_type> handle;

                    bool await_ready() noexcept {return handle.done();}

                    std::coroutine_handle<> await_suspend(std::coroutine_handle<> awaiting) noexcept
                    {
                        handle.promise().continuation = awaiting;
                        return handle;
                    }

                    T await_resume() {return GetResult(handle);}
                };
                if (!handle)
                    HardError("Awaiting an empty task.", HardErrorKind::user);
                return Awaiter{handle};
            }
        };

        template <typename T>
        Task<T> detail::Promise<T>::get_return_object() noexcept
        {
            return Task<T>(std::coroutine_handle<Promise>::from_promise(*this));
        }

        inline Task<void> detail::Promise<void>::get_return_object() noexcept
        {
            return Task<void>(std::coroutine_handle<Promise>::from_promise(*this));
        }

        // A single-threaded scheduler. Runs the queued coroutines one by one, in FIFO order.
        class EventLoop
        {
            std::deque<std::coroutine_handle<>> queue;

            // Resumes queued coroutines until `root` finishes.
            CFG_TALLY_API void RunUntilDone(std::coroutine_handle<> root);

          public:
            EventLoop() {}
            EventLoop(const EventLoop &) = delete;
            EventLoop &operator=(const EventLoop &) = delete;

            // Queues a suspended coroutine to be resumed later.
            CFG_TALLY_API void Schedule(std::coroutine_handle<> handle);

            // Runs `task` to completion and returns its result.
            // If the task suspends with nothing left to resume it, that's a hard error.
            template <typename T>
            T RunUntilComplete(Task<T> task)
            {
                RunUntilDone(task.Handle());
                return task.TakeResult();
            }

            // The loop running on this thread, or null if none.
            [[nodiscard]] CFG_TALLY_API static EventLoop *Current();
        };

        // `co_await Yield()` lets the other queued coroutines run before continuing.
        struct YieldAwaiter
        {
            bool await_ready() const noexcept {return false;}
            CFG_TALLY_API void await_suspend(std::coroutine_handle<> handle) const;
            void await_resume() const noexcept {}
        };
        [[nodiscard]] inline YieldAwaiter Yield() {return {};}
    }

    // --- TEST BODIES ---

    // The effect of a test body, i.e. what calling it returns.
    namespace effects
    {
        // Test bodies run to completion when called.
        struct Immediate
        {
            template <typename T>
            using Wrap = T;
        };
        // Test bodies are coroutines returning `coop::Task`, and may suspend.
        struct Suspendable
        {
            template <typename T>
            using Wrap = coop::Task<T>;
        };
    }
    template <typename Effect>
    concept EffectType = std::same_as<Effect, effects::Immediate> || std::same_as<Effect, effects::Suspendable>;

    // A test body as written by the user.
    template <EffectType Effect, typename Arg>
    using TestBody = std::function<typename Effect::template Wrap<void>(const Arg &)>;
    // A test body that always produces an outcome.
    template <EffectType Effect, typename Arg>
    using ProtectedTest = std::function<typename Effect::template Wrap<Outcome>(const Arg &)>;

    template <EffectType Effect, typename Arg>
    struct TestCase
    {
        std::string description;
        SpeedLevel speed = SpeedLevel::slow;
        TestBody<Effect, Arg> body;

        using Result = typename Effect::template Wrap<void>;

        TestCase() {}

        // `func` either accepts the test argument, or nothing.
        template <typename F>
        requires std::is_invocable_r_v<Result, F &, const Arg &> || std::is_invocable_r_v<Result, F &>
        TestCase(std::string description, SpeedLevel speed, F func)
            : description(std::move(description)), speed(speed)
        {
            if constexpr (std::is_invocable_r_v<Result, F &, const Arg &>)
                body = std::move(func);
            else
                body = [func = std::move(func)](const Arg &) mutable -> Result {return func();};
        }
    };

    template <EffectType Effect, typename Arg>
    struct TestEntry
    {
        TestPath path;
        ProtectedTest<Effect, Arg> test;
    };

    // Everything about a test that the reporting needs.
    struct TestInfo
    {
        TestPath path;
        std::string description;
        SpeedLevel speed = SpeedLevel::slow;
    };

    // The registered tests, in registration order.
    template <EffectType Effect, typename Arg>
    class Suite
    {
        std::vector<TestEntry<Effect, Arg>> entries;
        std::set<std::string, std::less<>> file_keys;
        std::map<TestPath, std::string> descriptions;
        std::map<TestPath, SpeedLevel> speeds;

      public:
        // Throws `DuplicateTestError` if a test with the same `FileKey()` is already registered. Then nothing is changed.
        void Add(TestPath path, std::string description, SpeedLevel speed, ProtectedTest<Effect, Arg> test)
        {
            std::string key = path.FileKey();
            if (file_keys.contains(key))
                throw DuplicateTestError(path.name);
            file_keys.insert(std::move(key));

            descriptions.try_emplace(path, std::move(description));
            speeds.try_emplace(path, speed);
            entries.push_back({std::move(path), std::move(test)});
        }

        [[nodiscard]] const std::vector<TestEntry<Effect, Arg>> &Tests() const {return entries;}

        // Returns an empty string if the test is unknown.
        [[nodiscard]] std::string_view Description(const TestPath &path) const
        {
            auto it = descriptions.find(path);
            return it == descriptions.end() ? std::string_view{} : std::string_view(it->second);
        }

        // Returns `slow` if the test is unknown.
        [[nodiscard]] SpeedLevel Speed(const TestPath &path) const
        {
            auto it = speeds.find(path);
            return it == speeds.end() ? SpeedLevel::slow : it->second;
        }

        [[nodiscard]] TestInfo Info(const TestPath &path) const
        {
            return {.path = path, .description = std::string(Description(path)), .speed = Speed(path)};
        }
    };

    // --- PROTECTED EXECUTION ---

    namespace detail
    {
        // The context messages unwound by the exception that is currently propagating through a test.
        [[nodiscard]] CFG_TALLY_API std::vector<std::string> &UnwoundContext();

        [[noreturn]] CFG_TALLY_API void FailCheck(SourceLoc loc, std::string message);

        template <typename A, typename B>
        void CheckEqual(SourceLoc loc, std::string_view a_str, std::string_view b_str, const A &a, const B &b)
        {
            if (a == b)
                return;
            FailCheck(loc, CFG_TALLY_FMT_NAMESPACE::format("Check failed: {} == {}\n  left:  {}\n  right: {}", a_str, b_str, a, b));
        }

        CFG_TALLY_API void PrintLogLine(std::string_view line);

        // Remembers its message if destroyed by an exception.
        class ContextGuard
        {
            std::string message;
            int exception_counter = 0;

          public:
            CFG_TALLY_API explicit ContextGuard(std::string message);
            ContextGuard(const ContextGuard &) = delete;
            ContextGuard &operator=(const ContextGuard &) = delete;
            CFG_TALLY_API ~ContextGuard();
        };
    }

    // Wraps a test body so that it never throws, and instead returns an outcome.
    template <EffectType Effect, typename Arg>
    [[nodiscard]] ProtectedTest<Effect, Arg> ProtectTest(TestBody<Effect, Arg> body)
    {
        if constexpr (std::is_same_v<Effect, effects::Immediate>)
        {
            return [body = std::move(body)](const Arg &arg) -> Outcome
            {
                detail::UnwoundContext().clear();
                try
                {
                    body(arg);
                    return outcome::Ok{};
                }
                catch (...)
                {
                    return ClassifyException(std::current_exception());
                }
            };
        }
        else
        {
            return [body = std::move(body)](const Arg &arg) -> coop::Task<Outcome>
            {
                detail::UnwoundContext().clear();
                std::exception_ptr e;
                try
                {
                    co_await body(arg);
                }
                catch (...)
                {
                    e = std::current_exception();
                }
                if (e)
                    co_return ClassifyException(e);
                co_return outcome::Ok{};
            };
        }
    }

    // A test that does nothing and reports itself as skipped.
    template <EffectType Effect, typename Arg>
    [[nodiscard]] ProtectedTest<Effect, Arg> SkipTest()
    {
        if constexpr (std::is_same_v<Effect, effects::Immediate>)
            return [](const Arg &) -> Outcome {return outcome::Skipped{};};
        else
            return [](const Arg &) -> coop::Task<Outcome> {co_return outcome::Skipped{};};
    }

    // Replaces `test` with a skipped one if its speed is below the minimum.
    template <EffectType Effect, typename Arg>
    [[nodiscard]] ProtectedTest<Effect, Arg> SelectSpeed(SpeedLevel speed, SpeedLevel minimum, ProtectedTest<Effect, Arg> test)
    {
        if (IsSpeedSelected(speed, minimum))
            return test;
        return SkipTest<Effect, Arg>();
    }

    // --- OUTPUT CAPTURE ---

    // Redirects the process-wide stdout and stderr to a file, for as long as this object is alive.
    // Only one instance can exist at a time, creating a second one is a hard error.
    class OutputCapture
    {
        int saved_stdout = -1;
        int saved_stderr = -1;

      public:
        // Truncates or creates `file`. Throws `OutputCaptureError` on failure.
        CFG_TALLY_API explicit OutputCapture(const std::filesystem::path &file);
        OutputCapture(const OutputCapture &) = delete;
        OutputCapture &operator=(const OutputCapture &) = delete;
        CFG_TALLY_API ~OutputCapture();

        // Whether an instance currently exists.
        [[nodiscard]] CFG_TALLY_API static bool IsActive();
    };

    struct CaptureSettings
    {
        // If false, the output isn't redirected at all.
        bool enabled = true;
        // Where the output files go.
        std::filesystem::path directory;
        // Receives the failure text after the output is restored. Can be null.
        std::function<void(const TestPath &path, std::string_view text)> echo;
    };

    namespace detail
    {
        // Writes the failure text to the captured output.
        CFG_TALLY_API void WriteCapturedFailure(std::string_view text);
    }

    // Wraps `test` to redirect its output to `<directory>/<path.OutputFileName()>`.
    // If the test fails, the failure text is written to the end of that file, and then passed to `settings.echo`.
    template <EffectType Effect, typename Arg>
    [[nodiscard]] ProtectedTest<Effect, Arg> RedirectTestOutput(const TestPath &path, const CaptureSettings &settings, ProtectedTest<Effect, Arg> test)
    {
        if (!settings.enabled)
            return test;

        if constexpr (std::is_same_v<Effect, effects::Immediate>)
        {
            return [path, file = settings.directory / path.OutputFileName(), echo = settings.echo, test = std::move(test)](const Arg &arg) -> Outcome
            {
                Outcome ret;
                std::optional<std::string> text;
                {
                    OutputCapture capture(file);
                    ret = test(arg);
                    text = FailureText(ret);
                    if (text)
                        detail::WriteCapturedFailure(*text);
                }
                if (text && echo)
                    echo(path, *text);
                return ret;
            };
        }
        else
        {
            return [path, file = settings.directory / path.OutputFileName(), echo = settings.echo, test = std::move(test)](const Arg &arg) -> coop::Task<Outcome>
            {
                Outcome ret;
                std::optional<std::string> text;
                {
                    OutputCapture capture(file);
                    ret = co_await test(arg);
                    text = FailureText(ret);
                    if (text)
                        detail::WriteCapturedFailure(*text);
                }
                if (text && echo)
                    echo(path, *text);
                co_return ret;
            };
        }
    }

    // --- FILTERING ---

    // A set of indices, stored as inclusive ranges.
    class IndexSet
    {
        // Sorted, without overlapping or adjacent ranges.
        std::vector<std::pair<std::size_t, std::size_t>> ranges;

      public:
        IndexSet() {}
        // Each element is an inclusive range `{first, last}`.
        IndexSet(std::initializer_list<std::pair<std::size_t, std::size_t>> list)
        {
            for (const auto &[first, last] : list)
                Add(first, last);
        }

        // Adds `[first, last]`. Does nothing if `first > last`.
        CFG_TALLY_API void Add(std::size_t first, std::size_t last);

        [[nodiscard]] CFG_TALLY_API bool Contains(std::size_t index) const;

        [[nodiscard]] const std::vector<std::pair<std::size_t, std::size_t>> &Ranges() const {return ranges;}

        friend bool operator==(const IndexSet &, const IndexSet &) = default;
    };

    // Selects tests by group name and index.
    struct Filter
    {
        // Searched for in the group name (doesn't have to match the whole name).
        std::optional<std::regex> name;
        std::optional<IndexSet> cases;

        [[nodiscard]] CFG_TALLY_API bool Matches(const TestPath &path) const;
    };

    enum class FilterMode
    {
        drop, // Remove the tests that don't match.
        substitute, // Replace the tests that don't match with skipped ones.
    };

    // Parses a comma-separated list of indices and inclusive ranges, such as `4,6-10,19`. Ranges can also be written as `6..10`.
    // Returns an error message on failure, or an empty string on success.
    [[nodiscard]] CFG_TALLY_API std::string ParseIndexSet(std::string_view source, IndexSet &target);

    // Returns the tests matching the filter, preserving the order.
    template <EffectType Effect, typename Arg>
    [[nodiscard]] std::vector<TestEntry<Effect, Arg>> FilterTests(const std::vector<TestEntry<Effect, Arg>> &tests, const Filter &filter, FilterMode mode)
    {
        std::vector<TestEntry<Effect, Arg>> ret;
        for (const TestEntry<Effect, Arg> &entry : tests)
        {
            if (filter.Matches(entry.path))
                ret.push_back(entry);
            else if (mode == FilterMode::substitute)
                ret.push_back({entry.path, SkipTest<Effect, Arg>()});
        }
        return ret;
    }

    // --- SEQUENTIAL EXECUTION ---

    // Receives the progress of a run. Indices refer to the list of tests that is being run.
    struct RunObserver
    {
        virtual ~RunObserver() = default;

        virtual void OnTestStart(std::size_t index, const TestPath &path) = 0;
        virtual void OnTestResult(std::size_t index, const TestPath &path, const Outcome &outcome) = 0;
    };

    // Runs the tests one at a time, in order. Each test finishes completely before the next one starts.
    template <EffectType Effect, typename Arg>
    struct SequentialStrategy;

    template <typename Arg>
    struct SequentialStrategy<effects::Immediate, Arg>
    {
        [[nodiscard]] std::vector<Outcome> Run(const std::vector<TestEntry<effects::Immediate, Arg>> &tests, const Arg &arg, RunObserver &observer) const
        {
            std::vector<Outcome> ret;
            ret.reserve(tests.size());
            for (std::size_t i = 0; i < tests.size(); i++)
            {
                observer.OnTestStart(i, tests[i].path);
                Outcome outcome = tests[i].test(arg);
                observer.OnTestResult(i, tests[i].path, outcome);
                ret.push_back(std::move(outcome));
            }
            return ret;
        }
    };

    template <typename Arg>
    struct SequentialStrategy<effects::Suspendable, Arg>
    {
        [[nodiscard]] coop::Task<std::vector<Outcome>> Run(const std::vector<TestEntry<effects::Suspendable, Arg>> &tests, const Arg &arg, RunObserver &observer) const
        {
            std::vector<Outcome> ret;
            ret.reserve(tests.size());
            for (std::size_t i = 0; i < tests.size(); i++)
            {
                observer.OnTestStart(i, tests[i].path);
                Outcome outcome = co_await tests[i].test(arg);
                observer.OnTestResult(i, tests[i].path, outcome);
                ret.push_back(std::move(outcome));
            }
            co_return ret;
        }
    };

    // Collects the registered tests, or the group name errors if there are any.
    template <EffectType Effect, typename Arg>
    class Registration
    {
        std::variant<Suite<Effect, Arg>, std::vector<std::string>> state;
        std::size_t max_label = 0;

      public:
        // Registers a group of tests. Test `i` of the group gets the path `{name, i}`.
        // An invalid name switches to the error state. In the error state, only further name errors are collected.
        // Throws `DuplicateTestError` on duplicate tests.
        void Register(std::string_view name, std::vector<TestCase<Effect, Arg>> cases)
        {
            if (auto error = ValidateGroupName(name))
            {
                if (auto errors = std::get_if<std::vector<std::string>>(&state))
                    errors->push_back(std::move(*error));
                else
                    state = std::vector<std::string>{std::move(*error)};
                return;
            }

            auto suite = std::get_if<Suite<Effect, Arg>>(&state);
            if (!suite)
                return;

            max_label = std::max(max_label, name.size());
            for (std::size_t i = 0; i < cases.size(); i++)
            {
                TestCase<Effect, Arg> &test = cases[i];
                suite->Add(TestPath{std::string(name), i}, NormalizeDescription(std::move(test.description)), test.speed, ProtectTest<Effect, Arg>(std::move(test.body)));
            }
        }

        [[nodiscard]] bool HasErrors() const {return std::holds_alternative<std::vector<std::string>>(state);}
        // The group name errors, in the order they were found.
        [[nodiscard]] std::span<const std::string> Errors() const
        {
            if (auto errors = std::get_if<std::vector<std::string>>(&state))
                return *errors;
            return {};
        }
        // Null in the error state.
        [[nodiscard]] const Suite<Effect, Arg> *GetSuite() const {return std::get_if<Suite<Effect, Arg>>(&state);}

        // The length of the longest group name.
        [[nodiscard]] std::size_t MaxLabel() const {return max_label;}
    };

    // --- RUNNING TESTS ---

    // The run-time configuration.
    struct RunConfig
    {
        // The name printed in the header.
        std::string name = "tally";
        // The name of the executable, used for a symlink to the run directory.
        std::string executable_name = "tally";
        // The run directories are created in here.
        std::filesystem::path test_dir;
        std::string run_id;

        // Don't capture the output.
        bool verbose = false;
        // One character per test.
        bool compact = false;
        // Print all error reports at the end, not only the last one.
        bool show_errors = false;
        // Print only a JSON summary.
        bool json = false;
        SpeedLevel speed_level = SpeedLevel::slow;

        [[nodiscard]] std::filesystem::path OutputDir() const {return test_dir / run_id;}
        [[nodiscard]] std::filesystem::path OutputFile(const TestPath &path) const {return OutputDir() / path.OutputFileName();}
    };

    // Generates a random uppercase UUID (version 4).
    [[nodiscard]] CFG_TALLY_API std::string GenerateRunId();

    // Creates `config.OutputDir()`. If it didn't exist, also points the `latest` and `<executable name>` symlinks at it.
    // Throws `std::filesystem::filesystem_error` on failure.
    CFG_TALLY_API void PrepareRunDirectory(const RunConfig &config);

    // Reads the output file of a failed test and formats the error report.
    [[nodiscard]] CFG_TALLY_API std::string MakeErrorReport(const RunConfig &config, const TestInfo &test, std::string_view failure_text);

    namespace flags
    {
        struct BasicFlag;
    }

    // A pointer to a class derived from `BasicModule`.
    class ModulePtr
    {
        std::unique_ptr<BasicModule> ptr;

        template <std::derived_from<BasicModule> T, typename ...P>
        requires std::constructible_from<T, P &&...>
        friend ModulePtr MakeModule(P &&... params);

      public:
        CFG_TALLY_API ModulePtr();
        ModulePtr(std::nullptr_t) : ModulePtr() {}

        ModulePtr(ModulePtr &&) = default;
        ModulePtr &operator=(ModulePtr &&) = default;

        CFG_TALLY_API ~ModulePtr();

        [[nodiscard]] explicit operator bool() const {return bool(ptr);}

        [[nodiscard]] BasicModule *get() const {return ptr.get();}
        [[nodiscard]] BasicModule &operator*() const {return *ptr;}
        [[nodiscard]] BasicModule *operator->() const {return ptr.get();}
    };

    // The part of the runner that doesn't depend on the test type.
    class BasicRunner : public RunObserver
    {
      public:
        enum class Command
        {
            run, // Run everything.
            test, // Run the tests matching `filter`, skip the rest.
            list, // Print the tests.
        };

        std::vector<ModulePtr> modules;
        RunConfig config;

        Command command = Command::run;
        Filter filter;

        // Error reports of the current run, most recent first.
        std::vector<std::string> error_reports;

        // Fills `config` with the defaults: a new run ID, and `_build/_tests` in the current directory.
        CFG_TALLY_API BasicRunner();

        // Fills `modules` arrays with all the default modules. Old contents are destroyed.
        CFG_TALLY_API void SetDefaultModules();

        // Applies the environment variables associated with the flags.
        // If `ok` is null and something goes wrong, exits the application. If `ok` isn't null, sets it to true on success or to false on failure.
        CFG_TALLY_API void ProcessEnvironment(bool *ok = nullptr);

        // Handles the command line arguments in argc&argv style. `argv[0]` is used as the executable name.
        // If `ok` is null and something goes wrong, exits the application. If `ok` isn't null, sets it to true on success or to false on failure.
        void ProcessFlags(int argc, const char *const *argv, bool *ok = nullptr)
        {
            if (argc > 0 && argv && argv[0])
                config.executable_name = std::filesystem::path(argv[0]).filename().string();

            ProcessFlags([argc = argc-1, argv = argv ? argv+1 : argv]() mutable -> std::optional<std::string_view>
            {
                if (argc <= 0)
                    return {};
                argc--;
                return *argv++;
            }, ok);
        }
        // Handles command line arguments from a list of strings, e.g. `ProcessFlags({"test", "math", "--verbose"});`.
        // The first element is not considered to be the program name.
        void ProcessFlags(std::initializer_list<std::string_view> list, bool *ok = nullptr)
        {
            ProcessFlags([it = list.begin(), end = list.end()]() mutable -> std::optional<std::string_view>
            {
                if (it == end)
                    return {};
                return *it++;
            }, ok);
        }
        // The most low-level function to process command line flags.
        // `next_flag()` should return the next flag, or null if none.
        // Arguments not starting with `-` select the command.
        CFG_TALLY_API void ProcessFlags(std::function<std::optional<std::string_view>()> next_flag, bool *ok = nullptr);

        // Removes all modules of type `T` or derived from `T`.
        template <typename T>
        void RemoveModule()
        {
            std::erase_if(modules, [](const ModulePtr &ptr){return dynamic_cast<const T *>(ptr.get());});
        }

        // Calls `func` for every module of type `T` or derived from `T`.
        // `func` is `(T &module) -> bool`. If `func` returns true, the function stops immediately and also returns true.
        template <typename T, typename F>
        bool FindModule(F &&func) const
        {
            for (const auto &m : modules)
            {
                if (auto base = dynamic_cast<T *>(m.get()))
                {
                    if (func(*base))
                        return true;
                }
            }
            return false;
        }

        // Configures every `BasicPrintingModule` to print to `stream`.
        // Also automatically enables/disables color.
        CFG_TALLY_API void SetOutputStream(FILE *stream) const;

        // Enables or disables color in every `BasicPrintingModule`.
        CFG_TALLY_API void SetEnableColor(bool enable) const;

        // Calls `func` on `Terminal` of every `BasicPrintingModule`.
        CFG_TALLY_API void SetTerminalSettings(std::function<void(output::Terminal &terminal)> func) const;

      protected:
        // The tests of the current run, in the same order as the tests being executed.
        std::vector<TestInfo> run_tests;
        std::size_t max_label = 0;
        std::vector<Outcome> outcomes;
        std::chrono::steady_clock::time_point start_time;

        // Prints `message` as a fatal error, and returns `code` as an int.
        CFG_TALLY_API int Fatal(ExitCode code, std::string_view message) const;
        // Reports the group name errors.
        CFG_TALLY_API int ReportInvalidNames(std::span<const std::string> errors) const;
        // Notifies the modules that a command is about to run.
        CFG_TALLY_API void BeginCommand() const;
        // Prints the tests sorted by path.
        CFG_TALLY_API int ListTests(std::vector<TestInfo> tests, std::size_t new_max_label) const;
        // Creates the run directory and notifies the modules.
        CFG_TALLY_API void BeginRun(std::vector<TestInfo> tests, std::size_t new_max_label);
        // Where and how to capture the test output.
        [[nodiscard]] CFG_TALLY_API CaptureSettings MakeCaptureSettings() const;
        // Computes the summary, notifies the modules, and returns the exit code.
        CFG_TALLY_API int FinishRun(std::vector<Outcome> new_outcomes);

      public:
        CFG_TALLY_API void OnTestStart(std::size_t index, const TestPath &path) override;
        CFG_TALLY_API void OnTestResult(std::size_t index, const TestPath &path, const Outcome &outcome) override;

        // The summary of the last run.
        [[nodiscard]] const std::vector<Outcome> &Outcomes() const {return outcomes;}
    };

    // Use this to register and run tests.
    // `Effect` is either `effects::Immediate` or `effects::Suspendable`. `Arg` is passed to every test.
    template <EffectType Effect = effects::Immediate, typename Arg = Unit>
    class Runner : public BasicRunner
    {
        Registration<Effect, Arg> registration;

      public:
        using Case = TestCase<Effect, Arg>;

        Runner() {}
        explicit Runner(std::string name)
        {
            config.name = std::move(name);
        }

        // Registers a group of tests. See `Registration::Register()`.
        Runner &Register(std::string_view name, std::vector<Case> cases)
        {
            registration.Register(name, std::move(cases));
            return *this;
        }

        [[nodiscard]] const Registration<Effect, Arg> &GetRegistration() const {return registration;}

        // Runs the command selected by `ProcessFlags()`. Returns the exit code.
        int Run(const Arg &arg = {})
        {
            if (registration.HasErrors())
                return ReportInvalidNames(registration.Errors());

            const Suite<Effect, Arg> &suite = *registration.GetSuite();

            BeginCommand();

            if (command == Command::list)
            {
                std::vector<TestInfo> infos;
                for (const auto &entry : suite.Tests())
                    infos.push_back(suite.Info(entry.path));
                return ListTests(std::move(infos), registration.MaxLabel());
            }

            std::vector<TestEntry<Effect, Arg>> tests = suite.Tests();
            if (command == Command::test)
            {
                if (FilterTests(suite.Tests(), filter, FilterMode::drop).empty())
                    return Fatal(ExitCode::empty_selection, "Invalid request (no tests to run, filter skipped everything)!");
                tests = FilterTests(suite.Tests(), filter, FilterMode::substitute);
            }

            try
            {
                std::vector<TestInfo> infos;
                for (const auto &entry : tests)
                    infos.push_back(suite.Info(entry.path));

                BeginRun(std::move(infos), registration.MaxLabel());

                CaptureSettings capture = MakeCaptureSettings();
                for (auto &entry : tests)
                {
                    entry.test = RedirectTestOutput<Effect, Arg>(entry.path, capture, std::move(entry.test));
                    entry.test = SelectSpeed<Effect, Arg>(suite.Speed(entry.path), config.speed_level, std::move(entry.test));
                }

                SequentialStrategy<Effect, Arg> strategy;
                if constexpr (std::is_same_v<Effect, effects::Immediate>)
                {
                    return FinishRun(strategy.Run(tests, arg, *this));
                }
                else
                {
                    coop::EventLoop loop;
                    return FinishRun(loop.RunUntilComplete(strategy.Run(tests, arg, *this)));
                }
            }
            catch (const OutputCaptureError &e)
            {
                return Fatal(ExitCode::output_error, e.what());
            }
            catch (const std::filesystem::filesystem_error &e)
            {
                return Fatal(ExitCode::output_error, e.what());
            }
        }

        // Processes the environment and the flags, then runs. Returns the exit code.
        int Run(int argc, const char *const *argv, const Arg &arg = {})
        {
            bool ok = true;
            ProcessEnvironment(&ok);
            if (ok)
                ProcessFlags(argc, argv, &ok);
            if (!ok)
                return int(ExitCode::bad_command_line_arguments);
            return Run(arg);
        }
    };

    template <EffectType Effect, typename Arg>
    using TestGroup = std::pair<std::string, std::vector<TestCase<Effect, Arg>>>;

    // A simple way to run the tests.
    // Copypaste the body into your code if you need more customization.
    template <EffectType Effect = effects::Immediate, typename Arg = Unit>
    int RunSimple(std::string name, int argc, const char *const *argv, std::vector<TestGroup<Effect, Arg>> groups, const Arg &arg = {})
    {
        Runner<Effect, Arg> runner(std::move(name));
        runner.SetDefaultModules();
        for (auto &[group_name, cases] : groups)
            runner.Register(group_name, std::move(cases));
        return runner.Run(argc, argv, arg);
    }
}
