#if CFG_TALLY_SHARED
#ifdef _WIN32
#define CFG_TALLY_API __declspec(dllexport)
#endif
#endif

#include <tally/internals.hpp>

#include <cstdlib>

namespace
{
    [[nodiscard]] std::string_view Plural(std::size_t n)
    {
        return n <= 1 ? "" : "s";
    }
}

// --- modules::HelpPrinter ---

tally::modules::HelpPrinter::HelpPrinter()
    : expected_flag_width(24),
    flag_help("help", 'h', "Show usage.", [](BasicRunner &runner, BasicModule &this_module)
    {
        std::vector<flags::BasicFlag *> flags;
        for (const auto &m : runner.modules)
        {
            auto more_flags = m->GetFlags();
            flags.insert(flags.end(), more_flags.begin(), more_flags.end());
        }

        // The case should never fail.
        HelpPrinter &self = dynamic_cast<HelpPrinter &>(this_module);

        self.terminal.Print("This is a test runner based on tally.\nUsage: {} [COMMAND] [OPTIONS]\n", runner.config.executable_name);
        self.terminal.Print("Commands:\n");
        self.terminal.Print("  {:<{}} - {}\n", "(none)", self.expected_flag_width, "Run all the tests.");
        self.terminal.Print("  {:<{}} - {}\n", "test [NAME_REGEX] [TESTCASES]", self.expected_flag_width,
            "Run the tests whose group names match the regex, and their indices are in the list (such as `4,6-10,19`). Skip the rest."
        );
        self.terminal.Print("  {:<{}} - {}\n", "list", self.expected_flag_width, "List all available tests.");
        self.terminal.Print("Available options:\n");
        for (flags::BasicFlag *flag : flags)
        {
            self.terminal.Print("  {:<{}} - {}", flag->HelpFlagSpelling(), self.expected_flag_width, flag->help_desc);
            if (!flag->env_var.empty())
                self.terminal.Print(" Env: `{}{}`.", CFG_TALLY_ENV_PREFIX, flag->env_var);
            self.terminal.Print("\n");
        }

        std::exit(int(ExitCode::ok));
    })
{}

std::vector<tally::flags::BasicFlag *> tally::modules::HelpPrinter::GetFlags() noexcept
{
    return {&flag_help};
}

void tally::modules::HelpPrinter::OnUnknownFlag(std::string_view flag, bool &abort) noexcept
{
    (void)abort;
    terminal.Print("Unknown flag `{}`, run with `{}` for usage.\n", flag, flag_help.HelpFlagSpelling());
    // Don't exit, rely on `abort`.
}

void tally::modules::HelpPrinter::OnMissingFlagArgument(std::string_view flag, const flags::BasicFlag &flag_obj, bool &abort) noexcept
{
    (void)flag_obj;
    (void)abort;
    terminal.Print("Flag `{}` wasn't given enough arguments, run with `{}` for usage.\n", flag, flag_help.HelpFlagSpelling());
    // Don't exit, rely on `abort`.
}

// --- modules::RunConfigurator ---

tally::modules::RunConfigurator::RunConfigurator()
    : flag_output_dir("output-dir", 'o', "Where to store the output files of the tests. Defaults to `_build/_tests` in the current directory.",
        [](BasicRunner &runner, BasicModule &this_module, std::string_view value)
        {
            (void)this_module;
            runner.config.test_dir = std::filesystem::path(value);
        }
    ),
    flag_verbose("verbose", 'v', "Don't capture the output of the tests. The output files won't be available for inspection.",
        [](BasicRunner &runner, BasicModule &this_module, bool enable)
        {
            (void)this_module;
            runner.config.verbose = enable;
        }
    ),
    flag_compact("compact", 'c', "Print one character per test.",
        [](BasicRunner &runner, BasicModule &this_module, bool enable)
        {
            (void)this_module;
            runner.config.compact = enable;
        }
    ),
    flag_show_errors("show-errors", 'e', "Print all error reports at the end, not only the most recent one.",
        [](BasicRunner &runner, BasicModule &this_module, bool enable)
        {
            (void)this_module;
            runner.config.show_errors = enable;
        }
    ),
    flag_quick_tests("quick-tests", 'q', "Run only the quick tests, skip the slow ones.",
        [](BasicRunner &runner, BasicModule &this_module, bool enable)
        {
            (void)this_module;
            runner.config.speed_level = enable ? SpeedLevel::quick : SpeedLevel::slow;
        }
    ),
    flag_json("json", "Print only a JSON summary of the results, to be used by scripts.",
        [](BasicRunner &runner, BasicModule &this_module, bool enable)
        {
            (void)this_module;
            runner.config.json = enable;
        }
    )
{
    flag_output_dir.env_var = "OUTPUT_DIR";
    flag_verbose.env_var = "VERBOSE";
    flag_compact.env_var = "COMPACT";
    flag_show_errors.env_var = "SHOW_ERRORS";
    flag_quick_tests.env_var = "QUICK_TESTS";
    flag_json.env_var = "JSON";
}

std::vector<tally::flags::BasicFlag *> tally::modules::RunConfigurator::GetFlags() noexcept
{
    return {&flag_output_dir, &flag_verbose, &flag_compact, &flag_show_errors, &flag_quick_tests, &flag_json};
}

// --- modules::PrintingConfigurator ---

tally::modules::PrintingConfigurator::PrintingConfigurator()
    : flag_color("color", "Color output using ANSI escape sequences (by default enabled when printing to terminal).",
        [](BasicRunner &runner, BasicModule &this_module, bool enable)
        {
            (void)this_module;
            runner.SetEnableColor(enable);
        }
    )
{
    flag_color.env_var = "COLOR";
}

std::vector<tally::flags::BasicFlag *> tally::modules::PrintingConfigurator::GetFlags() noexcept
{
    return {&flag_color};
}

// --- modules::HeaderPrinter ---

void tally::modules::HeaderPrinter::OnPreCommand(const RunConfig &config) noexcept
{
    if (config.json)
        return;

    auto cur_style = terminal.MakeStyleGuard();
    terminal.Print(cur_style, "Testing {}{}{}.\n", style_name, config.name, output::TextStyle{});
    terminal.Print("This run has ID `{}`.\n", config.run_id);
}

// --- modules::TestLister ---

void tally::modules::TestLister::OnListTests(const data::ListTestsInfo &data) noexcept
{
    auto cur_style = terminal.MakeStyleGuard();
    for (const TestInfo &test : data.tests)
    {
        output::PrintTestPath(terminal, cur_style, style_path, test.path, data.max_label);
        terminal.Print("    {}\n", test.description);
    }
}

// --- modules::ProgressPrinter ---

void tally::modules::ProgressPrinter::PrintInfo(output::Terminal::StyleGuard &cur_style, const data::RunSingleTestInfo &data) const
{
    output::PrintTestPath(terminal, cur_style, style_path, data.test.path, data.all_tests.max_label);
    terminal.Print("   {}", data.test.description);
}

void tally::modules::ProgressPrinter::OnPreRunSingleTest(const data::RunSingleTestInfo &data) noexcept
{
    if (data.all_tests.config.json || data.all_tests.config.compact)
        return;

    auto cur_style = terminal.MakeStyleGuard();
    output::PrintPadded(terminal, cur_style, style_running, chars_running, label_width);
    PrintInfo(cur_style, data);
}

void tally::modules::ProgressPrinter::OnPostRunSingleTest(const data::RunSingleTestResults &data) noexcept
{
    const RunConfig &config = data.all_tests.config;
    if (config.json)
        return;

    const output::TextStyle &style =
        std::holds_alternative<outcome::Ok>(data.outcome) ? style_ok :
        IsFailure(data.outcome) && !std::holds_alternative<outcome::Pending>(data.outcome) ? style_failed :
        style_skipped;

    auto cur_style = terminal.MakeStyleGuard();

    if (config.compact)
    {
        terminal.Print(cur_style, "{}{}", style, OutcomeChar(data.outcome));
        return;
    }

    terminal.Print("\r");
    output::PrintPadded(terminal, cur_style, style, CFG_TALLY_FMT_NAMESPACE::format("[{}]", OutcomeLabel(data.outcome)), label_width);
    PrintInfo(cur_style, data);
    terminal.Print("\n");
}

void tally::modules::ProgressPrinter::OnPostRunTests(const data::RunTestsResults &data) noexcept
{
    // Finish the line of characters.
    if (!data.config.json && data.config.compact)
        terminal.Print("\n");
}

// --- modules::FailureEchoPrinter ---

void tally::modules::FailureEchoPrinter::OnOutputRestored(const RunConfig &config, const TestPath &path, std::string_view text) noexcept
{
    (void)path;

    if (config.json)
        return;

    auto cur_style = terminal.MakeStyleGuard();
    terminal.Print(cur_style, "\n{}{}{}\n", style_text, text, output::TextStyle{});
}

// --- modules::ErrorReportPrinter ---

void tally::modules::ErrorReportPrinter::OnPostRunTests(const data::RunTestsResults &data) noexcept
{
    // Pending tests are failures without a report.
    if (data.config.json || data.summary.failed == 0 || data.error_reports.empty())
        return;

    if (data.config.verbose || data.config.show_errors)
    {
        // Oldest first.
        for (auto it = data.error_reports.rbegin(); it != data.error_reports.rend(); ++it)
            terminal.Print("{}\n", *it);
    }
    else
    {
        terminal.Print("{}\n", data.error_reports.front());
    }
}

// --- modules::ResultsPrinter ---

void tally::modules::ResultsPrinter::OnPostRunTests(const data::RunTestsResults &data) noexcept
{
    const RunConfig &config = data.config;
    const RunSummary &summary = data.summary;

    if (config.json || (config.compact && summary.failed == 0))
        return;

    auto cur_style = terminal.MakeStyleGuard();

    if (!config.verbose)
        terminal.Print("The full test results are available in `{}`.\n", config.OutputDir().string());

    if (summary.failed == 0)
        terminal.Print(cur_style, "{}Test Successful{}", style_success, output::TextStyle{});
    else
        terminal.Print(cur_style, "{}{} error{}!{}", style_failure, summary.failed, Plural(summary.failed), output::TextStyle{});

    terminal.Print(" in {:.3f}s. {} test{} run.\n", summary.elapsed.count(), summary.ran, Plural(summary.ran));
}

// --- modules::JsonPrinter ---

void tally::modules::JsonPrinter::OnPostRunTests(const data::RunTestsResults &data) noexcept
{
    if (!data.config.json)
        return;

    terminal.Print("{{\"success\":{},\"failures\":{},\"time\":{:f}}}\n", data.summary.ran, data.summary.failed, data.summary.elapsed.count());
}

// --- modules::FatalErrorPrinter ---

tally::modules::FatalErrorPrinter::FatalErrorPrinter()
{
    terminal = output::Terminal(stderr);
}

void tally::modules::FatalErrorPrinter::OnFatalError(std::string_view message) noexcept
{
    auto cur_style = terminal.MakeStyleGuard();
    terminal.Print(cur_style, "{}{}{}\n", style_error, message, output::TextStyle{});
}
