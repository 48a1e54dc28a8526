#if CFG_TALLY_SHARED
#ifdef _WIN32
#define CFG_TALLY_API __declspec(dllexport)
#endif
#endif

#include <tally/internals.hpp>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <iostream>

#if CFG_TALLY_CXXABI_DEMANGLE
#include <cxxabi.h>
#endif

#if CFG_TALLY_DETECT_TERMINAL
#if defined(__linux__) || defined(__APPLE__)
#define DETAIL_TALLY_USE_ISATTY 1
#include <unistd.h>
#endif
#endif

void tally::HardError(std::string_view message, HardErrorKind kind)
{
    // A threadsafe once flag.
    bool once = false;
    [[maybe_unused]] static const auto once_trigger = [&]
    {
        once = true;
        return nullptr;
    }();

    if (!once)
        std::terminate(); // We've already been there.

    std::fprintf(stderr, "%stally: %s: %.*s\n",
        output::Terminal(stderr).AnsiResetString().data(),
        kind == HardErrorKind::internal ? "Internal error" : "Error",
        int(message.size()), message.data()
    );

    std::terminate();
}

tally::text::Demangler::Demangler() {}

tally::text::Demangler::~Demangler()
{
    #if CFG_TALLY_CXXABI_DEMANGLE
    // Freeing a nullptr is a no-op.
    std::free(buf_ptr);
    #endif
}

const char *tally::text::Demangler::operator()(const char *name)
{
    #if CFG_TALLY_CXXABI_DEMANGLE
    int status = -4;
    buf_ptr = abi::__cxa_demangle(name, buf_ptr, &buf_size, &status);
    if (status != 0) // -1 = out of memory, -2 = invalid string, -3 = invalid usage
        return name;
    return buf_ptr;
    #else
    return name;
    #endif
}

bool tally::platform::IsTerminalAttached(bool is_stderr)
{
    #if CFG_TALLY_DETECT_TERMINAL
    // We cache the return value.
    auto lambda = []<bool IsStderr>
    {
        static bool ret = []{
            #if defined(DETAIL_TALLY_USE_ISATTY)
            return isatty(IsStderr ? STDERR_FILENO : STDOUT_FILENO) == 1;
            #else
            return false;
            #endif
        }();
        return ret;
    };
    if (is_stderr)
        return lambda.operator()<true>();
    else
        return lambda.operator()<false>();
    #else
    (void)is_stderr;
    return false;
    #endif
}

// --- TestPath ---

std::string tally::TestPath::Display() const
{
    return CFG_TALLY_FMT_NAMESPACE::format("{}.{:03}", name, index);
}

std::string tally::TestPath::FileKey() const
{
    std::string ret = Display();
    for (char &ch : ret)
        ch = char(std::tolower((unsigned char)ch));
    return ret;
}

// --- Outcomes ---

bool tally::IsFailure(const Outcome &outcome)
{
    return std::visit([]<typename T>(const T &) -> bool
    {
        return std::is_same_v<T, outcome::CheckFailed> || std::is_same_v<T, outcome::Fault> || std::is_same_v<T, outcome::Pending>;
    }, outcome);
}

bool tally::HasRun(const Outcome &outcome)
{
    return std::visit([]<typename T>(const T &) -> bool
    {
        return std::is_same_v<T, outcome::Ok> || std::is_same_v<T, outcome::CheckFailed> || std::is_same_v<T, outcome::Fault>;
    }, outcome);
}

std::string_view tally::OutcomeLabel(const Outcome &outcome)
{
    switch (outcome.index())
    {
        case 0: return "OK";
        case 1: return "ERROR";
        case 2: return "FAIL";
        case 3: return "SKIP";
        case 4: return "TODO";
    }
    HardError("Unknown outcome.");
}

char tally::OutcomeChar(const Outcome &outcome)
{
    switch (outcome.index())
    {
        case 0: return '.';
        case 1: return 'E';
        case 2: return 'F';
        case 3: return 'S';
        case 4: return 'T';
    }
    HardError("Unknown outcome.");
}

std::optional<std::string> tally::FailureText(const Outcome &outcome)
{
    if (auto check = std::get_if<outcome::CheckFailed>(&outcome))
        return check->message;
    if (auto fault = std::get_if<outcome::Fault>(&outcome))
        return CFG_TALLY_FMT_NAMESPACE::format("[{}] {}", fault->kind, fault->message);
    return {};
}

tally::RunSummary tally::Summarize(std::span<const Outcome> outcomes, std::chrono::duration<double> elapsed)
{
    RunSummary ret;
    ret.elapsed = elapsed;
    for (const Outcome &outcome : outcomes)
    {
        if (HasRun(outcome))
            ret.ran++;
        if (IsFailure(outcome))
            ret.failed++;
    }
    return ret;
}

// --- Protected execution ---

std::vector<std::string> &tally::detail::UnwoundContext()
{
    thread_local std::vector<std::string> ret;
    return ret;
}

void tally::detail::FailCheck(SourceLoc loc, std::string message)
{
    throw CheckFailure{.loc = loc, .message = std::move(message)};
}

void tally::detail::PrintLogLine(std::string_view line)
{
    std::fwrite(line.data(), 1, line.size(), stdout);
    std::fputc('\n', stdout);
}

tally::detail::ContextGuard::ContextGuard(std::string message)
    : message(std::move(message)), exception_counter(std::uncaught_exceptions())
{}

tally::detail::ContextGuard::~ContextGuard()
{
    if (std::uncaught_exceptions() > exception_counter)
        UnwoundContext().push_back(std::move(message));
}

tally::Outcome tally::ClassifyException(const std::exception_ptr &e)
{
    // The innermost scope is unwound first.
    std::string trace;
    std::vector<std::string> &context = detail::UnwoundContext();
    if (!context.empty())
    {
        trace = "\nContext:";
        for (const std::string &entry : context)
        {
            trace += "\n  ";
            trace += entry;
        }
        context.clear();
    }

    try
    {
        std::rethrow_exception(e);
    }
    catch (const CheckFailure &failure)
    {
        return outcome::CheckFailed{CFG_TALLY_FMT_NAMESPACE::format("Test error: {}:{}: {}{}", failure.loc.file, failure.loc.line, failure.message, trace)};
    }
    catch (const TodoSignal &todo)
    {
        return outcome::Pending{todo.message};
    }
    catch (const SkipSignal &)
    {
        return outcome::Skipped{};
    }
    catch (const std::invalid_argument &ex)
    {
        return outcome::Fault{"invalid", ex.what() + trace};
    }
    catch (const std::runtime_error &ex)
    {
        return outcome::Fault{"failure", ex.what() + trace};
    }
    catch (const std::exception &ex)
    {
        return outcome::Fault{"exception", CFG_TALLY_FMT_NAMESPACE::format("{}: {}{}", text::Demangler{}(typeid(ex).name()), ex.what(), trace)};
    }
    catch (...)
    {
        return outcome::Fault{"exception", "Unknown exception." + trace};
    }
}

// --- Registration ---

std::optional<std::string> tally::ValidateGroupName(std::string_view name)
{
    bool ok = !name.empty() && std::all_of(name.begin(), name.end(), [](char ch)
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_' || ch == '-' || ch == ' ';
    });
    if (ok)
        return {};
    return CFG_TALLY_FMT_NAMESPACE::format("Error: \"{}\" is not a valid test label (must match ^[a-zA-Z0-9_- ]+$).", name);
}

std::string tally::NormalizeDescription(std::string description)
{
    if (!description.empty() && !description.ends_with('.'))
        description += '.';
    return description;
}

// --- Filtering ---

void tally::IndexSet::Add(std::size_t first, std::size_t last)
{
    if (first > last)
        return;

    // The first range that ends at `first - 1` or later, i.e. the first one that can be merged.
    auto begin = std::lower_bound(ranges.begin(), ranges.end(), first, [](const std::pair<std::size_t, std::size_t> &range, std::size_t value)
    {
        return range.second < value && value - range.second > 1;
    });
    // Past the last range that starts at `last + 1` or earlier.
    auto end = begin;
    while (end != ranges.end() && (end->first <= last || end->first - last == 1))
    {
        first = std::min(first, end->first);
        last = std::max(last, end->second);
        ++end;
    }

    begin = ranges.erase(begin, end);
    ranges.insert(begin, {first, last});
}

bool tally::IndexSet::Contains(std::size_t index) const
{
    // The first range starting after `index`.
    auto it = std::upper_bound(ranges.begin(), ranges.end(), index, [](std::size_t value, const std::pair<std::size_t, std::size_t> &range)
    {
        return value < range.first;
    });
    if (it == ranges.begin())
        return false;
    --it;
    return index <= it->second;
}

bool tally::Filter::Matches(const TestPath &path) const
{
    if (name && !std::regex_search(path.name, *name))
        return false;
    if (cases && !cases->Contains(path.index))
        return false;
    return true;
}

std::string tally::ParseIndexSet(std::string_view source, IndexSet &target)
{
    const std::string error = "must be a comma-separated list of integers / integer ranges";

    auto ParseNumber = [](std::string_view string, std::size_t &number) -> bool
    {
        if (string.empty())
            return false;
        auto [ptr, ec] = std::from_chars(string.data(), string.data() + string.size(), number);
        return ec == std::errc{} && ptr == string.data() + string.size();
    };

    IndexSet ret;

    while (true)
    {
        std::size_t comma = source.find(',');
        std::string_view range = source.substr(0, comma);

        std::string_view lower_str = range, upper_str;
        std::size_t sep_len = 2;
        std::size_t sep = range.find("..");
        if (sep == std::string_view::npos)
        {
            sep = range.find('-');
            sep_len = 1;
        }
        if (sep != std::string_view::npos)
        {
            lower_str = range.substr(0, sep);
            upper_str = range.substr(sep + sep_len);
        }

        std::size_t lower = 0;
        if (!ParseNumber(lower_str, lower))
            return error;

        if (sep == std::string_view::npos)
        {
            ret.Add(lower, lower);
        }
        else
        {
            std::size_t upper = 0;
            if (!ParseNumber(upper_str, upper) || lower > upper)
                return error;
            ret.Add(lower, upper);
        }

        if (comma == std::string_view::npos)
            break;
        source.remove_prefix(comma + 1);
    }

    target = std::move(ret);
    return "";
}

// --- ModulePtr ---

tally::ModulePtr::ModulePtr() {}
tally::ModulePtr::~ModulePtr() = default;
