// The main test program.
// It uses the library to test itself: most tests build a separate runner, run it in a temporary directory, and inspect the results.

#include <tally/tally.hpp>
#include <tally/internals.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

using Case = tally::Runner<>::Case;

namespace
{
    [[nodiscard]] bool Contains(std::string_view haystack, std::string_view needle)
    {
        return haystack.find(needle) != std::string_view::npos;
    }

    [[nodiscard]] std::string ReadFile(const fs::path &path)
    {
        std::ifstream input(path, std::ios::binary);
        if (!input)
            TALLY_FAIL("Unable to open `{}`.", path.string());
        std::ostringstream ss;
        ss << input.rdbuf();
        return ss.str();
    }

    void WriteFile(const fs::path &path, std::string_view contents)
    {
        std::ofstream output(path, std::ios::binary);
        output << contents;
        if (!output)
            TALLY_FAIL("Unable to write `{}`.", path.string());
    }

    // Runs a test body the same way the runner does, and returns the outcome.
    [[nodiscard]] tally::Outcome RunProtected(std::function<void()> body)
    {
        return tally::ProtectTest<tally::effects::Immediate, tally::Unit>([body](const tally::Unit &){body();})(tally::Unit{});
    }

    // A temporary directory, removed with all contents when destroyed.
    class TempDir
    {
        fs::path path;

      public:
        TempDir()
        {
            path = fs::temp_directory_path() / ("tally-tests-" + tally::GenerateRunId());
            fs::create_directories(path);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        ~TempDir()
        {
            std::error_code ec;
            fs::remove_all(path, ec);
        }

        [[nodiscard]] const fs::path &Path() const {return path;}
    };

    // Sets an environment variable, and restores the old value when destroyed.
    class EnvGuard
    {
        std::string name;
        std::optional<std::string> old_value;

      public:
        EnvGuard(std::string new_name, const std::string &value) : name(std::move(new_name))
        {
            if (const char *old = std::getenv(name.c_str()))
                old_value = old;
            setenv(name.c_str(), value.c_str(), 1);
        }

        EnvGuard(const EnvGuard &) = delete;
        EnvGuard &operator=(const EnvGuard &) = delete;

        ~EnvGuard()
        {
            if (old_value)
                setenv(name.c_str(), old_value->c_str(), 1);
            else
                unsetenv(name.c_str());
        }
    };

    // Collects everything the printing modules of a runner print.
    class TerminalToString
    {
      public:
        std::string value;

        TerminalToString() {}
        TerminalToString(const TerminalToString &) = delete;
        TerminalToString &operator=(const TerminalToString &) = delete;

        void Attach(const tally::BasicRunner &runner)
        {
            runner.SetTerminalSettings([this](tally::output::Terminal &terminal)
            {
                terminal.enable_color = false;
                terminal.output_func = [this](std::string_view fmt, CFG_TALLY_FMT_NAMESPACE::format_args args)
                {
                    CFG_TALLY_FMT_NAMESPACE::vformat_to(std::back_inserter(value), fmt, args);
                };
            });
        }
    };

    // A runner with the default modules, that writes to a temporary directory and prints to a string.
    template <typename Effect = tally::effects::Immediate>
    struct InnerRunner
    {
        TempDir dir;
        TerminalToString out;
        tally::Runner<Effect> runner{"inner"};

        InnerRunner()
        {
            runner.SetDefaultModules();
            runner.config.test_dir = dir.Path();
            runner.config.executable_name = "inner";
            out.Attach(runner);
        }

        InnerRunner(const InnerRunner &) = delete;
        InnerRunner &operator=(const InnerRunner &) = delete;

        int Run(std::initializer_list<std::string_view> flags)
        {
            bool ok = false;
            runner.ProcessFlags(flags, &ok);
            if (!ok)
                TALLY_FAIL("Bad flags for the inner runner.");
            return runner.Run();
        }
    };

    // One test of each outcome: pass, check failure, fault, skip, todo.
    [[nodiscard]] std::vector<Case> MixedCases()
    {
        return {
            {"Passes", tally::SpeedLevel::quick, []{}},
            {"Logs then fails", tally::SpeedLevel::quick, []
            {
                TALLY_LOG("hello");
                TALLY_CHECK( 1 + 1 == 3 );
            }},
            {"Throws", tally::SpeedLevel::quick, []{throw std::runtime_error("boom");}},
            {"Skips", tally::SpeedLevel::quick, []{TALLY_SKIP();}},
            {"Not done", tally::SpeedLevel::quick, []{TALLY_TODO("later");}},
        };
    }
}

// --- test_path ---

std::vector<Case> TestPathTests()
{
    return {
        {"Display form pads the index", tally::SpeedLevel::quick, []
        {
            tally::TestPath path{"Math", 3};
            TALLY_CHECK_EQ( path.Display(), "Math.003" );
            TALLY_CHECK_EQ( path.FileKey(), "math.003" );
            TALLY_CHECK_EQ( path.OutputFileName(), "math.003.output" );
            TALLY_CHECK_EQ( (tally::TestPath{"x", 1234}.Display()), "x.1234" );
        }},
        {"Paths are ordered by name then index", tally::SpeedLevel::quick, []
        {
            TALLY_CHECK( tally::TestPath{"a", 2} < tally::TestPath{"b", 0} );
            TALLY_CHECK( tally::TestPath{"a", 1} < tally::TestPath{"a", 2} );
            TALLY_CHECK( tally::TestPath{"a", 1} == tally::TestPath{"a", 1} );
            TALLY_CHECK( tally::TestPath{"A", 1} != tally::TestPath{"a", 1} );
        }},
    };
}

// --- registration ---

std::vector<Case> RegistrationTests()
{
    return {
        {"Group names are validated", tally::SpeedLevel::quick, []
        {
            TALLY_CHECK( !tally::ValidateGroupName("Foo bar_1-2") );
            TALLY_CHECK( tally::ValidateGroupName("") );
            TALLY_CHECK( tally::ValidateGroupName("foo/bar") );
            TALLY_CHECK_EQ( tally::ValidateGroupName("a.b").value_or(""), R"(Error: "a.b" is not a valid test label (must match ^[a-zA-Z0-9_- ]+$).)" );
        }},
        {"Descriptions get a trailing period", tally::SpeedLevel::quick, []
        {
            TALLY_CHECK_EQ( tally::NormalizeDescription("Adds"), "Adds." );
            TALLY_CHECK_EQ( tally::NormalizeDescription("Done."), "Done." );
            TALLY_CHECK_EQ( tally::NormalizeDescription(""), "" );
        }},
        {"Registration assigns paths and metadata", tally::SpeedLevel::quick, []
        {
            tally::Registration<tally::effects::Immediate, tally::Unit> reg;
            reg.Register("math", {
                {"adds", tally::SpeedLevel::quick, []{}},
                {"subtracts", tally::SpeedLevel::slow, []{}},
            });
            reg.Register("io", {{"", tally::SpeedLevel::quick, []{}}});

            TALLY_CHECK( !reg.HasErrors() );
            TALLY_CHECK_EQ( reg.MaxLabel(), std::size_t(4) );

            const auto *suite = reg.GetSuite();
            TALLY_CHECK( suite );
            TALLY_CHECK_EQ( suite->Tests().size(), std::size_t(3) );
            TALLY_CHECK( (suite->Tests()[1].path == tally::TestPath{"math", 1}) );
            TALLY_CHECK( (suite->Tests()[2].path == tally::TestPath{"io", 0}) );
            TALLY_CHECK_EQ( suite->Description({"math", 0}), "adds." );
            TALLY_CHECK_EQ( suite->Description({"io", 0}), "" );
            TALLY_CHECK( suite->Speed({"math", 0}) == tally::SpeedLevel::quick );
            TALLY_CHECK( suite->Speed({"math", 1}) == tally::SpeedLevel::slow );

            // Unknown paths.
            TALLY_CHECK_EQ( suite->Description({"nope", 0}), "" );
            TALLY_CHECK( suite->Speed({"nope", 0}) == tally::SpeedLevel::slow );
        }},
        {"Duplicate paths are rejected case-insensitively", tally::SpeedLevel::quick, []
        {
            tally::Runner<> runner;
            runner.Register("Math", {{"", tally::SpeedLevel::quick, []{}}});

            bool thrown = false;
            try
            {
                runner.Register("math", {{"", tally::SpeedLevel::quick, []{}}});
            }
            catch (const tally::DuplicateTestError &e)
            {
                thrown = true;
                TALLY_CHECK_EQ( std::string(e.what()), "Duplicate test name: math" );
            }
            TALLY_CHECK( thrown );
            TALLY_CHECK_EQ( runner.GetRegistration().GetSuite()->Tests().size(), std::size_t(1) );
        }},
        {"Invalid names are accumulated", tally::SpeedLevel::quick, []
        {
            tally::Registration<tally::effects::Immediate, tally::Unit> reg;
            reg.Register("ok", {{"", tally::SpeedLevel::quick, []{}}});
            reg.Register("bad.name", {});
            reg.Register("fine", {});
            reg.Register("also/bad", {});

            TALLY_CHECK( reg.HasErrors() );
            TALLY_CHECK( reg.GetSuite() == nullptr );
            TALLY_CHECK_EQ( reg.Errors().size(), std::size_t(2) );
            TALLY_CHECK( Contains(reg.Errors()[0], "\"bad.name\"") );
            TALLY_CHECK( Contains(reg.Errors()[1], "\"also/bad\"") );
        }},
    };
}

// --- protect ---

std::vector<Case> ProtectTests()
{
    return {
        {"A normal return is Ok", tally::SpeedLevel::quick, []
        {
            TALLY_CHECK( std::holds_alternative<tally::outcome::Ok>(RunProtected([]{})) );
        }},
        {"Failed checks are CheckFailed", tally::SpeedLevel::quick, []
        {
            tally::Outcome outcome = RunProtected([]{TALLY_CHECK( 1 == 2 );});
            auto check = std::get_if<tally::outcome::CheckFailed>(&outcome);
            TALLY_CHECK( check );
            TALLY_CHECK( check->message.starts_with("Test error: ") );
            TALLY_CHECK( check->message.ends_with(": Check failed: 1 == 2") );

            outcome = RunProtected([]{TALLY_FAIL("x {}", 42);});
            check = std::get_if<tally::outcome::CheckFailed>(&outcome);
            TALLY_CHECK( check );
            TALLY_CHECK( check->message.ends_with(": x 42") );

            outcome = RunProtected([]{TALLY_CHECK_EQ( 1, 2 );});
            check = std::get_if<tally::outcome::CheckFailed>(&outcome);
            TALLY_CHECK( check );
            TALLY_CHECK( check->message.ends_with("Check failed: 1 == 2\n  left:  1\n  right: 2") );
        }},
        {"Exceptions are classified by type", tally::SpeedLevel::quick, []
        {
            TALLY_CHECK( (RunProtected([]{throw std::runtime_error("boom");}) == tally::Outcome(tally::outcome::Fault{"failure", "boom"})) );
            TALLY_CHECK( (RunProtected([]{throw std::invalid_argument("bad");}) == tally::Outcome(tally::outcome::Fault{"invalid", "bad"})) );
            TALLY_CHECK( (RunProtected([]{throw std::logic_error("oops");}) == tally::Outcome(tally::outcome::Fault{"exception", "std::logic_error: oops"})) );
            TALLY_CHECK( (RunProtected([]{throw 42;}) == tally::Outcome(tally::outcome::Fault{"exception", "Unknown exception."})) );
        }},
        {"Skip and todo signals", tally::SpeedLevel::quick, []
        {
            TALLY_CHECK( std::holds_alternative<tally::outcome::Skipped>(RunProtected([]{TALLY_SKIP();})) );
            TALLY_CHECK( (RunProtected([]{TALLY_TODO("later {}", 1);}) == tally::Outcome(tally::outcome::Pending{"later 1"})) );
        }},
        {"Context of unwound scopes is appended", tally::SpeedLevel::quick, []
        {
            tally::Outcome outcome = RunProtected([]
            {
                TALLY_CONTEXT("outer {}", 1);
                {
                    TALLY_CONTEXT("inner");
                    TALLY_FAIL("no");
                }
            });
            auto check = std::get_if<tally::outcome::CheckFailed>(&outcome);
            TALLY_CHECK( check );
            TALLY_CHECK( check->message.ends_with(": no\nContext:\n  inner\n  outer 1") );

            // Scopes that exited normally don't show up, and nothing leaks into the next test.
            outcome = RunProtected([]
            {
                {
                    TALLY_CONTEXT("finished");
                }
                throw std::runtime_error("boom");
            });
            TALLY_CHECK( (outcome == tally::Outcome(tally::outcome::Fault{"failure", "boom"})) );
        }},
        {"Outcome properties", tally::SpeedLevel::quick, []
        {
            struct Row
            {
                tally::Outcome outcome;
                bool failure = false;
                bool has_run = false;
                std::string_view label;
                char ch = 0;
                std::optional<std::string> text;
            };
            const Row rows[] = {
                {tally::outcome::Ok{}, false, true, "OK", '.', {}},
                {tally::outcome::CheckFailed{"msg"}, true, true, "ERROR", 'E', "msg"},
                {tally::outcome::Fault{"failure", "boom"}, true, true, "FAIL", 'F', "[failure] boom"},
                {tally::outcome::Skipped{}, false, false, "SKIP", 'S', {}},
                {tally::outcome::Pending{"later"}, true, false, "TODO", 'T', {}},
            };
            for (const Row &row : rows)
            {
                TALLY_CONTEXT("outcome #{}", row.outcome.index());
                TALLY_CHECK( tally::IsFailure(row.outcome) == row.failure );
                TALLY_CHECK( tally::HasRun(row.outcome) == row.has_run );
                TALLY_CHECK( tally::OutcomeLabel(row.outcome) == row.label );
                TALLY_CHECK( tally::OutcomeChar(row.outcome) == row.ch );
                TALLY_CHECK( tally::FailureText(row.outcome) == row.text );
            }
        }},
    };
}

// --- summary ---

std::vector<Case> SummaryTests()
{
    return {
        {"Counts run and failed tests", tally::SpeedLevel::quick, []
        {
            std::vector<tally::Outcome> outcomes = {
                tally::outcome::Ok{},
                tally::outcome::CheckFailed{"a"},
                tally::outcome::Fault{"failure", "b"},
                tally::outcome::Skipped{},
                tally::outcome::Pending{"c"},
            };
            tally::RunSummary summary = tally::Summarize(outcomes, std::chrono::duration<double>(1.5));
            TALLY_CHECK_EQ( summary.ran, std::size_t(3) );
            TALLY_CHECK_EQ( summary.failed, std::size_t(3) );
            TALLY_CHECK( summary.elapsed.count() == 1.5 );

            // Pure.
            TALLY_CHECK( summary == tally::Summarize(outcomes, std::chrono::duration<double>(1.5)) );

            tally::RunSummary empty = tally::Summarize({}, {});
            TALLY_CHECK( empty.ran == 0 && empty.failed == 0 );
        }},
    };
}

// --- speed ---

std::vector<Case> SpeedTests()
{
    return {
        {"Quick tests always run", tally::SpeedLevel::quick, []
        {
            static_assert(tally::IsSpeedSelected(tally::SpeedLevel::quick, tally::SpeedLevel::quick));
            static_assert(tally::IsSpeedSelected(tally::SpeedLevel::quick, tally::SpeedLevel::slow));
            static_assert(!tally::IsSpeedSelected(tally::SpeedLevel::slow, tally::SpeedLevel::quick));
            static_assert(tally::IsSpeedSelected(tally::SpeedLevel::slow, tally::SpeedLevel::slow));
        }},
        {"Deselected tests are skipped without running", tally::SpeedLevel::quick, []
        {
            int calls = 0;
            tally::ProtectedTest<tally::effects::Immediate, tally::Unit> test = [&](const tally::Unit &) -> tally::Outcome
            {
                calls++;
                return tally::outcome::Ok{};
            };

            auto skipped = tally::SelectSpeed<tally::effects::Immediate, tally::Unit>(tally::SpeedLevel::slow, tally::SpeedLevel::quick, test);
            TALLY_CHECK( std::holds_alternative<tally::outcome::Skipped>(skipped(tally::Unit{})) );
            TALLY_CHECK_EQ( calls, 0 );

            auto kept = tally::SelectSpeed<tally::effects::Immediate, tally::Unit>(tally::SpeedLevel::slow, tally::SpeedLevel::slow, test);
            TALLY_CHECK( std::holds_alternative<tally::outcome::Ok>(kept(tally::Unit{})) );
            TALLY_CHECK_EQ( calls, 1 );
        }},
    };
}

// --- filter ---

std::vector<Case> FilterTests()
{
    return {
        {"Drop and substitute modes", tally::SpeedLevel::quick, []
        {
            using Entry = tally::TestEntry<tally::effects::Immediate, tally::Unit>;
            auto ok = [](const tally::Unit &) -> tally::Outcome {return tally::outcome::Ok{};};
            std::vector<Entry> tests = {
                {{"math", 0}, ok},
                {{"math", 1}, ok},
                {{"io", 0}, ok},
                {{"io", 1}, ok},
            };

            tally::Filter filter{.name = std::regex("at"), .cases = tally::IndexSet{{1, 1}}};

            auto dropped = tally::FilterTests(tests, filter, tally::FilterMode::drop);
            TALLY_CHECK_EQ( dropped.size(), std::size_t(1) );
            TALLY_CHECK( (dropped.at(0).path == tally::TestPath{"math", 1}) );

            auto substituted = tally::FilterTests(tests, filter, tally::FilterMode::substitute);
            TALLY_CHECK_EQ( substituted.size(), tests.size() );
            for (std::size_t i = 0; i < tests.size(); i++)
            {
                TALLY_CONTEXT("test #{}", i);
                TALLY_CHECK( substituted[i].path == tests[i].path );
                bool expect_ok = i == 1;
                TALLY_CHECK( std::holds_alternative<tally::outcome::Ok>(substituted[i].test(tally::Unit{})) == expect_ok );
            }

            // An empty filter matches everything.
            TALLY_CHECK_EQ( tally::FilterTests(tests, tally::Filter{}, tally::FilterMode::drop).size(), tests.size() );
        }},
        {"Index set parsing", tally::SpeedLevel::quick, []
        {
            tally::IndexSet set;
            TALLY_CHECK_EQ( tally::ParseIndexSet("4,6-10,19", set), "" );
            TALLY_CHECK( (set == tally::IndexSet{{4, 4}, {6, 10}, {19, 19}}) );
            TALLY_CHECK( set.Contains(4) && set.Contains(6) && set.Contains(10) && set.Contains(19) );
            TALLY_CHECK( !set.Contains(0) && !set.Contains(5) && !set.Contains(11) && !set.Contains(20) );

            TALLY_CHECK_EQ( tally::ParseIndexSet("1..3", set), "" );
            TALLY_CHECK( (set == tally::IndexSet{{1, 3}}) );

            // Overlapping and adjacent ranges are merged.
            TALLY_CHECK_EQ( tally::ParseIndexSet("5,1-2,3..4,8-9,7", set), "" );
            TALLY_CHECK( (set == tally::IndexSet{{1, 5}, {7, 9}}) );

            for (std::string_view bad : {"", "a", "3-1", "1,,2", "1-", "-1", "1.5", "2..x", "18446744073709551616"})
            {
                TALLY_CONTEXT("input `{}`", bad);
                set = tally::IndexSet{{42, 42}};
                TALLY_CHECK_EQ( tally::ParseIndexSet(bad, set), "must be a comma-separated list of integers / integer ranges" );
                TALLY_CHECK( (set == tally::IndexSet{{42, 42}}) );
            }
        }},
        {"Huge index ranges are stored as ranges", tally::SpeedLevel::quick, []
        {
            constexpr std::size_t max = std::numeric_limits<std::size_t>::max();

            tally::IndexSet set;
            TALLY_CHECK_EQ( tally::ParseIndexSet("0-18446744073709551615", set), "" );
            TALLY_CHECK_EQ( set.Ranges().size(), std::size_t(1) );
            TALLY_CHECK( set.Contains(0) && set.Contains(12345) && set.Contains(max) );

            TALLY_CHECK_EQ( tally::ParseIndexSet("18446744073709551614..18446744073709551615,3", set), "" );
            TALLY_CHECK( (set == tally::IndexSet{{3, 3}, {max - 1, max}}) );
            TALLY_CHECK( !set.Contains(4) && set.Contains(max) );

            // Through the command line too.
            tally::Runner<> runner;
            runner.SetDefaultModules();
            bool ok = false;
            runner.ProcessFlags({"test", "math", "2-18446744073709551615"}, &ok);
            TALLY_CHECK( ok );
            TALLY_CHECK( runner.filter.Matches({"math", 2}) );
            TALLY_CHECK( !runner.filter.Matches({"math", 1}) );
        }},
    };
}

// --- capture ---

std::vector<Case> CaptureTests()
{
    return {
        {"Output goes to the file and is then restored", tally::SpeedLevel::quick, []
        {
            TempDir dir;
            fs::path outer_file = dir.Path() / "outer.txt";
            fs::path captured_file = dir.Path() / "captured.txt";

            // Point stdout at our own file, to see where the output goes after the capture.
            std::fflush(stdout);
            int saved = dup(STDOUT_FILENO);
            int outer = open(outer_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0660);
            TALLY_CHECK( saved != -1 && outer != -1 );
            dup2(outer, STDOUT_FILENO);
            close(outer);

            {
                tally::OutputCapture capture(captured_file);
                TALLY_CHECK( tally::OutputCapture::IsActive() );
                std::printf("printf\n");
                std::cout << "cout\n";
                std::fprintf(stderr, "stderr\n");
            }
            std::printf("after\n");
            std::fflush(stdout);

            dup2(saved, STDOUT_FILENO);
            close(saved);

            TALLY_CHECK( !tally::OutputCapture::IsActive() );
            TALLY_CHECK_EQ( ReadFile(captured_file), "printf\ncout\nstderr\n" );
            TALLY_CHECK_EQ( ReadFile(outer_file), "after\n" );
        }},
        {"Output is restored after a failing test", tally::SpeedLevel::quick, []
        {
            TempDir dir;
            fs::path outer_file = dir.Path() / "outer.txt";

            std::fflush(stdout);
            int saved = dup(STDOUT_FILENO);
            int outer = open(outer_file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0660);
            TALLY_CHECK( saved != -1 && outer != -1 );
            dup2(outer, STDOUT_FILENO);
            close(outer);

            tally::CaptureSettings settings{.enabled = true, .directory = dir.Path(), .echo = nullptr};
            auto test = tally::ProtectTest<tally::effects::Immediate, tally::Unit>([](const tally::Unit &)
            {
                std::printf("inside\n");
                throw std::runtime_error("boom");
            });
            tally::TestPath path{"Broken", 1};
            tally::Outcome outcome = tally::RedirectTestOutput<tally::effects::Immediate, tally::Unit>(path, settings, test)(tally::Unit{});

            std::printf("after\n");
            std::fflush(stdout);

            dup2(saved, STDOUT_FILENO);
            close(saved);

            TALLY_CHECK( tally::IsFailure(outcome) );
            TALLY_CHECK( !tally::OutputCapture::IsActive() );
            TALLY_CHECK_EQ( ReadFile(dir.Path() / path.OutputFileName()), "inside\n[failure] boom\n" );
            TALLY_CHECK_EQ( ReadFile(outer_file), "after\n" );
        }},
        {"Failures are written to the file and echoed", tally::SpeedLevel::quick, []
        {
            TempDir dir;

            std::vector<std::string> echoed;
            tally::CaptureSettings settings{
                .enabled = true,
                .directory = dir.Path(),
                .echo = [&](const tally::TestPath &path, std::string_view text)
                {
                    // The output is already restored at this point.
                    TALLY_CHECK( !tally::OutputCapture::IsActive() );
                    echoed.push_back(path.Display() + ": " + std::string(text));
                },
            };

            auto test = tally::ProtectTest<tally::effects::Immediate, tally::Unit>([](const tally::Unit &)
            {
                std::printf("working\n");
                throw std::runtime_error("boom");
            });
            tally::TestPath path{"Group", 1};
            auto redirected = tally::RedirectTestOutput<tally::effects::Immediate, tally::Unit>(path, settings, test);

            tally::Outcome outcome = redirected(tally::Unit{});
            TALLY_CHECK( (outcome == tally::Outcome(tally::outcome::Fault{"failure", "boom"})) );
            TALLY_CHECK( !tally::OutputCapture::IsActive() );
            TALLY_CHECK_EQ( ReadFile(dir.Path() / "group.001.output"), "working\n[failure] boom\n" );
            TALLY_CHECK( (echoed == std::vector<std::string>{"Group.001: [failure] boom"}) );

            // Passing tests are not echoed.
            auto passing = tally::RedirectTestOutput<tally::effects::Immediate, tally::Unit>({"Group", 2}, settings,
                tally::ProtectTest<tally::effects::Immediate, tally::Unit>([](const tally::Unit &){std::printf("fine\n");})
            );
            TALLY_CHECK( std::holds_alternative<tally::outcome::Ok>(passing(tally::Unit{})) );
            TALLY_CHECK_EQ( ReadFile(dir.Path() / "group.002.output"), "fine\n" );
            TALLY_CHECK_EQ( echoed.size(), std::size_t(1) );
        }},
        {"Disabled capture leaves the test alone", tally::SpeedLevel::quick, []
        {
            TempDir dir;
            tally::CaptureSettings settings{.enabled = false, .directory = dir.Path(), .echo = nullptr};
            auto test = tally::RedirectTestOutput<tally::effects::Immediate, tally::Unit>({"a", 0}, settings,
                tally::ProtectTest<tally::effects::Immediate, tally::Unit>([](const tally::Unit &){TALLY_FAIL("no");})
            );
            TALLY_CHECK( std::holds_alternative<tally::outcome::CheckFailed>(test(tally::Unit{})) );
            TALLY_CHECK( fs::is_empty(dir.Path()) );
        }},
        {"Unopenable files throw", tally::SpeedLevel::quick, []
        {
            TempDir dir;
            bool thrown = false;
            try
            {
                tally::OutputCapture capture(dir.Path() / "missing" / "file.output");
            }
            catch (const tally::OutputCaptureError &e)
            {
                thrown = true;
                TALLY_CHECK( Contains(e.what(), "file.output") );
            }
            TALLY_CHECK( thrown );
            TALLY_CHECK( !tally::OutputCapture::IsActive() );
        }},
    };
}

// --- coop ---

std::vector<Case> CoopTests()
{
    return {
        {"Tasks return values through the loop", tally::SpeedLevel::quick, []
        {
            auto inner = [](int x) -> tally::coop::Task<int>
            {
                co_await tally::coop::Yield();
                co_return x * 2;
            };
            auto outer = [&inner]() -> tally::coop::Task<int>
            {
                int a = co_await inner(1);
                int b = co_await inner(2);
                co_return a + b;
            };

            tally::coop::EventLoop loop;
            TALLY_CHECK_EQ( loop.RunUntilComplete(outer()), 6 );
            TALLY_CHECK( tally::coop::EventLoop::Current() == nullptr );
        }},
        {"Exceptions propagate out of tasks", tally::SpeedLevel::quick, []
        {
            auto task = []() -> tally::coop::Task<>
            {
                co_await tally::coop::Yield();
                throw std::runtime_error("boom");
            };

            tally::coop::EventLoop loop;
            bool thrown = false;
            try
            {
                loop.RunUntilComplete(task());
            }
            catch (const std::runtime_error &e)
            {
                thrown = true;
                TALLY_CHECK_EQ( std::string(e.what()), "boom" );
            }
            TALLY_CHECK( thrown );
        }},
        {"Suspending tests run strictly in order", tally::SpeedLevel::quick, []
        {
            InnerRunner<tally::effects::Suspendable> inner;
            std::vector<int> log;
            std::vector<tally::Runner<tally::effects::Suspendable>::Case> cases;
            for (int i = 0; i < 3; i++)
            {
                cases.push_back({"", tally::SpeedLevel::quick, [&log, i]() -> tally::coop::Task<>
                {
                    log.push_back(i * 10);
                    co_await tally::coop::Yield();
                    log.push_back(i * 10 + 1);
                }});
            }
            cases.push_back({"Fails after yielding", tally::SpeedLevel::quick, []() -> tally::coop::Task<>
            {
                co_await tally::coop::Yield();
                throw std::runtime_error("late");
            }});
            inner.runner.Register("coop", std::move(cases));

            TALLY_CHECK_EQ( inner.Run({}), 1 );
            TALLY_CHECK( (log == std::vector<int>{0, 1, 10, 11, 20, 21}) );
            TALLY_CHECK( (inner.runner.Outcomes().back() == tally::Outcome(tally::outcome::Fault{"failure", "late"})) );
            TALLY_CHECK( Contains(ReadFile(inner.runner.config.OutputFile({"coop", 3})), "[failure] late\n") );
        }},
        {"Both effects give the same outcomes", tally::SpeedLevel::quick, []
        {
            InnerRunner<> immediate;
            immediate.runner.Register("math", MixedCases());
            TALLY_CHECK_EQ( immediate.Run({}), 3 );

            InnerRunner<tally::effects::Suspendable> suspendable;
            std::vector<tally::Runner<tally::effects::Suspendable>::Case> cases;
            for (Case &c : MixedCases())
            {
                cases.push_back({c.description, c.speed, [body = c.body]() -> tally::coop::Task<>
                {
                    co_await tally::coop::Yield();
                    body(tally::Unit{});
                }});
            }
            suspendable.runner.Register("math", std::move(cases));
            TALLY_CHECK_EQ( suspendable.Run({}), 3 );

            const auto &a = immediate.runner.Outcomes();
            const auto &b = suspendable.runner.Outcomes();
            TALLY_CHECK_EQ( a.size(), b.size() );
            for (std::size_t i = 0; i < a.size(); i++)
                TALLY_CHECK_EQ( a[i].index(), b[i].index() );
        }},
    };
}

// --- runner ---

std::vector<Case> RunnerTests()
{
    return {
        {"All tests pass", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.Register("math", {
                {"Adds", tally::SpeedLevel::quick, []{TALLY_CHECK( 1 + 1 == 2 );}},
                {"Subtracts", tally::SpeedLevel::slow, []{TALLY_CHECK( 2 - 1 == 1 );}},
                {"Logs", tally::SpeedLevel::quick, []{TALLY_LOG("value = {}", 42);}},
            });
            TALLY_CHECK_EQ( inner.Run({}), 0 );

            const tally::RunConfig &config = inner.runner.config;
            TALLY_CHECK( Contains(inner.out.value, "Testing inner.\nThis run has ID `" + config.run_id + "`.\n") );
            TALLY_CHECK( Contains(inner.out.value, "[OK]                math          0   Adds.\n") );
            TALLY_CHECK( Contains(inner.out.value, "The full test results are available in `" + config.OutputDir().string() + "`.\n") );
            TALLY_CHECK( Contains(inner.out.value, "Test Successful in ") );
            TALLY_CHECK( inner.out.value.ends_with("s. 3 tests run.\n") );

            TALLY_CHECK_EQ( ReadFile(config.OutputFile({"math", 2})), "value = 42\n" );
            TALLY_CHECK( fs::exists(config.OutputFile({"math", 0})) );

            // The symlinks point to the run directory.
            TALLY_CHECK( fs::is_symlink(config.test_dir / "latest") );
            TALLY_CHECK( fs::is_symlink(config.test_dir / "inner") );
            TALLY_CHECK( fs::equivalent(config.test_dir / "latest", config.OutputDir()) );
        }},
        {"Failures are reported", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.Register("math", MixedCases());
            TALLY_CHECK_EQ( inner.Run({}), 3 );

            const tally::RunConfig &config = inner.runner.config;
            std::string check_text = tally::FailureText(inner.runner.Outcomes().at(1)).value_or("");

            // The captured output ends with the failure.
            TALLY_CHECK_EQ( ReadFile(config.OutputFile({"math", 1})), "hello\n" + check_text + "\n" );
            TALLY_CHECK_EQ( ReadFile(config.OutputFile({"math", 2})), "[failure] boom\n" );

            // Most recent first.
            const auto &reports = inner.runner.error_reports;
            TALLY_CHECK_EQ( reports.size(), std::size_t(2) );
            TALLY_CHECK_EQ( reports.at(0), "-- math.002 [Throws.] Failed --\nin `" + config.OutputFile({"math", 2}).string() + "`:\n[failure] boom\n" );
            TALLY_CHECK( reports.at(1).starts_with("-- math.001 [Logs then fails.] Failed --\n") );

            // Only the most recent report is printed.
            TALLY_CHECK( Contains(inner.out.value, reports.at(0)) );
            TALLY_CHECK( !Contains(inner.out.value, reports.at(1)) );

            // The failures are echoed.
            TALLY_CHECK( Contains(inner.out.value, "\n[failure] boom\n") );

            TALLY_CHECK( Contains(inner.out.value, "[ERROR]             math          1   Logs then fails.\n") );
            TALLY_CHECK( Contains(inner.out.value, "[FAIL]              math          2   Throws.\n") );
            TALLY_CHECK( Contains(inner.out.value, "[SKIP]              math          3   Skips.\n") );
            TALLY_CHECK( Contains(inner.out.value, "[TODO]              math          4   Not done.\n") );
            TALLY_CHECK( Contains(inner.out.value, "3 errors! in ") );
            TALLY_CHECK( inner.out.value.ends_with("s. 3 tests run.\n") );
        }},
        {"All reports are printed on request", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.Register("math", MixedCases());
            TALLY_CHECK_EQ( inner.Run({"--show-errors"}), 3 );

            const auto &reports = inner.runner.error_reports;
            std::size_t older = inner.out.value.find(reports.at(1));
            std::size_t newer = inner.out.value.find(reports.at(0));
            TALLY_CHECK( older != std::string::npos && newer != std::string::npos );
            TALLY_CHECK( older < newer );
        }},
        {"Verbose mode doesn't capture", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.Register("math", {{"Fails", tally::SpeedLevel::quick, []{TALLY_FAIL("nope");}}});
            TALLY_CHECK_EQ( inner.Run({"-v"}), 1 );

            const tally::RunConfig &config = inner.runner.config;
            TALLY_CHECK( config.verbose );
            TALLY_CHECK( fs::is_directory(config.OutputDir()) );
            TALLY_CHECK( !fs::exists(config.OutputFile({"math", 0})) );

            std::string text = tally::FailureText(inner.runner.Outcomes().at(0)).value_or("");
            TALLY_CHECK_EQ( inner.runner.error_reports.at(0), "-- math.000 [Fails.] Failed --\n" + text + "\n" );
            TALLY_CHECK( !Contains(inner.out.value, "The full test results") );
        }},
        {"JSON output", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.Register("math", MixedCases());
            TALLY_CHECK_EQ( inner.Run({"--json"}), 3 );
            TALLY_CHECK( std::regex_match(inner.out.value, std::regex(R"(\{"success":3,"failures":3,"time":[0-9]+\.[0-9]+\}\n)")) );
        }},
        {"Compact output", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.RemoveModule<tally::modules::FailureEchoPrinter>();
            inner.runner.RemoveModule<tally::modules::HeaderPrinter>();

            inner.runner.Register("math", MixedCases());
            TALLY_CHECK_EQ( inner.Run({"-c"}), 3 );
            TALLY_CHECK( inner.out.value.starts_with(".EFST\n-- math.002 [Throws.] Failed --\n") );

            // Nothing is printed for a successful compact run, except the progress.
            InnerRunner<> passing;
            passing.runner.RemoveModule<tally::modules::HeaderPrinter>();
            passing.runner.Register("math", {{"", tally::SpeedLevel::quick, []{}}, {"", tally::SpeedLevel::quick, []{}}});
            TALLY_CHECK_EQ( passing.Run({"--compact"}), 0 );
            TALLY_CHECK_EQ( passing.out.value, "..\n" );
        }},
        {"Subset selection", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.Register("math", {
                {"", tally::SpeedLevel::quick, []{}},
                {"", tally::SpeedLevel::quick, []{}},
                {"", tally::SpeedLevel::quick, []{}},
            });
            inner.runner.Register("io", {{"", tally::SpeedLevel::quick, []{}}});
            TALLY_CHECK_EQ( inner.Run({"test", "ma", "1..2"}), 0 );

            const auto &outcomes = inner.runner.Outcomes();
            TALLY_CHECK_EQ( outcomes.size(), std::size_t(4) );
            TALLY_CHECK( std::holds_alternative<tally::outcome::Skipped>(outcomes.at(0)) );
            TALLY_CHECK( std::holds_alternative<tally::outcome::Ok>(outcomes.at(1)) );
            TALLY_CHECK( std::holds_alternative<tally::outcome::Ok>(outcomes.at(2)) );
            TALLY_CHECK( std::holds_alternative<tally::outcome::Skipped>(outcomes.at(3)) );
            TALLY_CHECK( inner.out.value.ends_with("s. 2 tests run.\n") );
        }},
        {"Empty selection is an error", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.Register("math", {{"", tally::SpeedLevel::quick, []{}}});
            TALLY_CHECK_EQ( inner.Run({"test", "nothing"}), int(tally::ExitCode::empty_selection) );
            TALLY_CHECK( inner.out.value.ends_with("Invalid request (no tests to run, filter skipped everything)!\n") );
            TALLY_CHECK( !fs::exists(inner.runner.config.OutputDir()) );
        }},
        {"Selecting only missing indices is an error", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            int calls = 0;
            inner.runner.Register("math", {
                {"", tally::SpeedLevel::quick, [&]{calls++;}},
                {"", tally::SpeedLevel::quick, [&]{calls++;}},
                {"", tally::SpeedLevel::quick, [&]{calls++;}},
            });
            TALLY_CHECK_EQ( inner.Run({"test", "math", "5"}), int(tally::ExitCode::empty_selection) );
            TALLY_CHECK( inner.out.value.ends_with("Invalid request (no tests to run, filter skipped everything)!\n") );
            TALLY_CHECK_EQ( calls, 0 );
            TALLY_CHECK( !fs::exists(inner.runner.config.OutputDir()) );
        }},
        {"Invalid names stop the run", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            int calls = 0;
            inner.runner.Register("fine", {{"", tally::SpeedLevel::quick, [&]{calls++;}}});
            inner.runner.Register("bad.name", {});
            inner.runner.Register("bad!", {});
            TALLY_CHECK_EQ( inner.Run({}), int(tally::ExitCode::invalid_test_names) );

            TALLY_CHECK_EQ( inner.out.value,
                "Error: \"bad.name\" is not a valid test label (must match ^[a-zA-Z0-9_- ]+$).\n"
                "Error: \"bad!\" is not a valid test label (must match ^[a-zA-Z0-9_- ]+$).\n"
            );
            TALLY_CHECK_EQ( calls, 0 );
        }},
        {"Listing is sorted by path", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            inner.runner.RemoveModule<tally::modules::HeaderPrinter>();
            int calls = 0;
            inner.runner.Register("beta", {{"B0", tally::SpeedLevel::quick, [&]{calls++;}}});
            inner.runner.Register("alpha", {
                {"A0", tally::SpeedLevel::quick, [&]{calls++;}},
                {"A1", tally::SpeedLevel::slow, [&]{calls++;}},
            });
            TALLY_CHECK_EQ( inner.Run({"list"}), 0 );

            TALLY_CHECK_EQ( inner.out.value,
                "alpha          0    A0.\n"
                "alpha          1    A1.\n"
                "beta           0    B0.\n"
            );
            TALLY_CHECK_EQ( calls, 0 );
            TALLY_CHECK( !fs::exists(inner.runner.config.OutputDir()) );
        }},
        {"Quick mode skips slow tests", tally::SpeedLevel::quick, []
        {
            InnerRunner<> inner;
            int slow_calls = 0;
            inner.runner.Register("math", {
                {"", tally::SpeedLevel::quick, []{}},
                {"", tally::SpeedLevel::slow, [&]{slow_calls++;}},
            });
            TALLY_CHECK_EQ( inner.Run({"-q"}), 0 );
            TALLY_CHECK_EQ( slow_calls, 0 );
            TALLY_CHECK( std::holds_alternative<tally::outcome::Skipped>(inner.runner.Outcomes().at(1)) );
            TALLY_CHECK( inner.out.value.ends_with("s. 1 test run.\n") );
        }},
        {"The exit code is clamped", tally::SpeedLevel::slow, []
        {
            InnerRunner<> inner;
            std::vector<Case> cases;
            for (int i = 0; i < 120; i++)
                cases.push_back({"", tally::SpeedLevel::quick, []{TALLY_FAIL("no");}});
            inner.runner.Register("many", std::move(cases));
            TALLY_CHECK_EQ( inner.Run({"--json"}), int(tally::ExitCode::max_failure_count) );
            TALLY_CHECK( Contains(inner.out.value, "\"failures\":120") );
        }},
        {"Run directory errors", tally::SpeedLevel::quick, []
        {
            {
                InnerRunner<> inner;
                inner.runner.Register("math", {{"", tally::SpeedLevel::quick, []{}}});
                WriteFile(inner.dir.Path() / "blocker", "");
                inner.runner.config.test_dir = inner.dir.Path() / "blocker" / "sub";
                TALLY_CHECK_EQ( inner.Run({}), int(tally::ExitCode::output_error) );
            }

            {
                InnerRunner<> inner;
                inner.runner.Register("math", {{"", tally::SpeedLevel::quick, []{}}});
                WriteFile(inner.runner.config.OutputDir(), "");
                TALLY_CHECK_EQ( inner.Run({}), int(tally::ExitCode::output_error) );
                TALLY_CHECK( Contains(inner.out.value, "Exists, but is not a directory") );
            }
        }},
    };
}

// --- config ---

std::vector<Case> ConfigTests()
{
    return {
        {"Styled output", tally::SpeedLevel::quick, []
        {
            std::string value;
            tally::output::Terminal terminal;
            terminal.enable_color = true;
            terminal.output_func = [&](std::string_view fmt, CFG_TALLY_FMT_NAMESPACE::format_args args)
            {
                CFG_TALLY_FMT_NAMESPACE::vformat_to(std::back_inserter(value), fmt, args);
            };

            {
                auto cur_style = terminal.MakeStyleGuard();
                tally::output::PrintTestPath(terminal, cur_style, {.color = tally::output::TextColor::light_red, .bold = true}, {"math", 3}, 4);
            }
            TALLY_CHECK_EQ( value, "\033[0m\033[91;1mmath\033[39;22m          3\033[0m" );

            value.clear();
            terminal.enable_color = false;
            {
                auto cur_style = terminal.MakeStyleGuard();
                tally::output::PrintTestPath(terminal, cur_style, {.color = tally::output::TextColor::light_red}, {"math", 3}, 4);
            }
            TALLY_CHECK_EQ( value, "math          3" );
        }},
        {"Flags", tally::SpeedLevel::quick, []
        {
            tally::Runner<> runner;
            runner.SetDefaultModules();
            TerminalToString out;
            out.Attach(runner);

            const char *argv[] = {"/some/path/my_tests", "-o", "/tmp/out", "--verbose", "-c", "-e", "--quick-tests", "--json", "--no-color"};
            bool ok = false;
            runner.ProcessFlags(int(std::size(argv)), argv, &ok);
            TALLY_CHECK( ok );
            TALLY_CHECK_EQ( runner.config.executable_name, "my_tests" );
            TALLY_CHECK( runner.config.test_dir == fs::path("/tmp/out") );
            TALLY_CHECK( runner.config.verbose && runner.config.compact && runner.config.show_errors && runner.config.json );
            TALLY_CHECK( runner.config.speed_level == tally::SpeedLevel::quick );
            TALLY_CHECK( runner.command == tally::BasicRunner::Command::run );

            runner.ProcessFlags({"--output-dir=/tmp/other", "--no-verbose"}, &ok);
            TALLY_CHECK( ok );
            TALLY_CHECK( runner.config.test_dir == fs::path("/tmp/other") );
            TALLY_CHECK( !runner.config.verbose );
        }},
        {"Bad command lines", tally::SpeedLevel::quick, []
        {
            struct Row
            {
                std::vector<std::string_view> flags;
                std::string_view message;
            };
            const Row rows[] = {
                {{"--nope"}, "Unknown flag `--nope`"},
                {{"-o"}, "Flag `-o` wasn't given enough arguments"},
                {{"frobnicate"}, "Unknown command `frobnicate`"},
                {{"list", "extra"}, "Unexpected argument `extra`"},
                {{"test", "("}, "Invalid NAME_REGEX `(`"},
                {{"test", "math", "x"}, "Invalid TESTCASES `x`"},
                {{"test", "math", "1", "2"}, "Unexpected argument `2`"},
            };
            for (const Row &row : rows)
            {
                tally::Runner<> runner;
                runner.SetDefaultModules();
                TerminalToString out;
                out.Attach(runner);

                TALLY_CONTEXT("expected `{}`", row.message);
                bool ok = true;
                runner.ProcessFlags([it = row.flags.begin(), end = row.flags.end()]() mutable -> std::optional<std::string_view>
                {
                    if (it == end)
                        return {};
                    return *it++;
                }, &ok);
                TALLY_CHECK( !ok );
                TALLY_CHECK( Contains(out.value, row.message) );
            }
        }},
        {"Commands", tally::SpeedLevel::quick, []
        {
            tally::Runner<> runner;
            runner.SetDefaultModules();
            bool ok = false;

            runner.ProcessFlags({"list"}, &ok);
            TALLY_CHECK( ok && runner.command == tally::BasicRunner::Command::list );

            runner.ProcessFlags({"test", "^ma", "1,3"}, &ok);
            TALLY_CHECK( ok && runner.command == tally::BasicRunner::Command::test );
            TALLY_CHECK( runner.filter.Matches({"math", 3}) );
            TALLY_CHECK( !runner.filter.Matches({"math", 2}) );
            TALLY_CHECK( !runner.filter.Matches({"amath", 1}) );

            runner.ProcessFlags({"test"}, &ok);
            TALLY_CHECK( ok && runner.command == tally::BasicRunner::Command::test );
            TALLY_CHECK( runner.filter.Matches({"anything", 42}) );
        }},
        {"Environment variables", tally::SpeedLevel::quick, []
        {
            tally::Runner<> runner;
            runner.SetDefaultModules();
            TerminalToString out;
            out.Attach(runner);

            {
                EnvGuard compact("TALLY_COMPACT", "yes");
                EnvGuard quick("TALLY_QUICK_TESTS", "1");
                EnvGuard dir("TALLY_OUTPUT_DIR", "/tmp/env-dir");
                bool ok = false;
                runner.ProcessEnvironment(&ok);
                TALLY_CHECK( ok );
                TALLY_CHECK( runner.config.compact );
                TALLY_CHECK( runner.config.speed_level == tally::SpeedLevel::quick );
                TALLY_CHECK( runner.config.test_dir == fs::path("/tmp/env-dir") );

                // Flags override the environment.
                runner.ProcessFlags({"--no-compact"}, &ok);
                TALLY_CHECK( ok && !runner.config.compact );
            }

            {
                EnvGuard verbose("TALLY_VERBOSE", "maybe");
                bool ok = true;
                runner.ProcessEnvironment(&ok);
                TALLY_CHECK( !ok );
                TALLY_CHECK( Contains(out.value, "Invalid value `maybe` of the environment variable `TALLY_VERBOSE`.") );
            }
        }},
        {"Run IDs are uppercase version 4 UUIDs", tally::SpeedLevel::quick, []
        {
            std::string id = tally::GenerateRunId();
            TALLY_CONTEXT("id = {}", id);
            TALLY_CHECK( std::regex_match(id, std::regex("[0-9A-F]{8}-[0-9A-F]{4}-4[0-9A-F]{3}-[89AB][0-9A-F]{3}-[0-9A-F]{12}")) );
            TALLY_CHECK( id != tally::GenerateRunId() );
        }},
    };
}

int main(int argc, char **argv)
{
    tally::Runner<> runner("tally self-test");
    runner.SetDefaultModules();

    runner.Register("test_path", TestPathTests());
    runner.Register("registration", RegistrationTests());
    runner.Register("protect", ProtectTests());
    runner.Register("summary", SummaryTests());
    runner.Register("speed", SpeedTests());
    runner.Register("filter", FilterTests());
    runner.Register("capture", CaptureTests());
    runner.Register("coop", CoopTests());
    runner.Register("runner", RunnerTests());
    runner.Register("config", ConfigTests());

    bool ok = true;
    runner.ProcessEnvironment(&ok);
    if (ok)
        runner.ProcessFlags(argc, argv, &ok);
    if (!ok)
        return int(tally::ExitCode::bad_command_line_arguments);

    // Many of the tests capture the output themselves, and the capture can't be nested.
    runner.config.verbose = true;

    return runner.Run();
}
