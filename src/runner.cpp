#if CFG_TALLY_SHARED
#ifdef _WIN32
#define CFG_TALLY_API __declspec(dllexport)
#endif
#endif

#include <tally/internals.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

std::string tally::GenerateRunId()
{
    std::random_device device;
    std::seed_seq seed{device(), device(), device(), device()};
    std::mt19937_64 engine(seed);

    std::uint64_t hi = engine();
    std::uint64_t lo = engine();

    // Version 4, variant 1.
    hi = (hi & ~(std::uint64_t(0xf) << 12)) | (std::uint64_t(0x4) << 12);
    lo = (lo & ~(std::uint64_t(0x3) << 62)) | (std::uint64_t(0x2) << 62);

    return CFG_TALLY_FMT_NAMESPACE::format("{:08X}-{:04X}-{:04X}-{:04X}-{:012X}",
        hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff, lo >> 48, lo & 0xffffffffffff
    );
}

void tally::PrepareRunDirectory(const RunConfig &config)
{
    namespace fs = std::filesystem;

    fs::path dir = config.OutputDir();
    fs::file_status status = fs::status(dir);
    if (fs::exists(status))
    {
        if (!fs::is_directory(status))
            throw fs::filesystem_error("Exists, but is not a directory", dir, std::make_error_code(std::errc::not_a_directory));
        return;
    }

    fs::create_directories(dir);

    #ifndef _WIN32
    // Relative targets, so that the test directory can be moved around.
    for (const std::string &link_name : {config.executable_name, std::string("latest")})
    {
        fs::path link = config.test_dir / link_name;
        if (fs::exists(fs::symlink_status(link)))
            fs::remove(link);
        fs::create_directory_symlink(config.run_id, link);
    }
    #endif
}

std::string tally::MakeErrorReport(const RunConfig &config, const TestInfo &test, std::string_view failure_text)
{
    std::string logs;

    std::filesystem::path file = config.OutputFile(test.path);
    std::error_code ec;
    std::ifstream input;
    if (!config.verbose && std::filesystem::exists(file, ec))
        input.open(file, std::ios::binary);

    if (input)
    {
        std::ostringstream contents;
        contents << input.rdbuf();
        logs = CFG_TALLY_FMT_NAMESPACE::format("in `{}`:\n{}", file.string(), contents.str());
    }
    else
    {
        logs = CFG_TALLY_FMT_NAMESPACE::format("{}\n", failure_text);
    }

    return CFG_TALLY_FMT_NAMESPACE::format("-- {} [{}] Failed --\n{}", test.path.Display(), test.description, logs);
}

// --- BasicRunner ---

tally::BasicRunner::BasicRunner()
{
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    config.test_dir = cwd / "_build" / "_tests";
    config.run_id = GenerateRunId();
}

void tally::BasicRunner::SetDefaultModules()
{
    modules.clear();
    // Those are ordered in a certain way to print the `--help` page in the nice order: [
    modules.push_back(MakeModule<modules::HelpPrinter>());
    modules.push_back(MakeModule<modules::RunConfigurator>());
    modules.push_back(MakeModule<modules::PrintingConfigurator>());
    // ]
    modules.push_back(MakeModule<modules::HeaderPrinter>());
    modules.push_back(MakeModule<modules::TestLister>());
    modules.push_back(MakeModule<modules::ProgressPrinter>());
    modules.push_back(MakeModule<modules::FailureEchoPrinter>());
    modules.push_back(MakeModule<modules::ErrorReportPrinter>());
    modules.push_back(MakeModule<modules::ResultsPrinter>());
    modules.push_back(MakeModule<modules::JsonPrinter>());
    modules.push_back(MakeModule<modules::FatalErrorPrinter>());
}

void tally::BasicRunner::ProcessEnvironment(bool *ok)
{
    if (ok)
        *ok = true;

    for (const auto &m : modules)
    {
        for (flags::BasicFlag *f : m->GetFlags())
        {
            if (f->env_var.empty())
                continue;

            std::string name = CFG_TALLY_ENV_PREFIX + f->env_var;
            const char *value = std::getenv(name.c_str());
            if (!value)
                continue;

            if (!f->ProcessEnvVar(*this, *m, value))
            {
                for (const auto &m2 : modules)
                    m2->OnFatalError(CFG_TALLY_FMT_NAMESPACE::format("Invalid value `{}` of the environment variable `{}`.", value, name));
                if (ok)
                    *ok = false;
                else
                    std::exit(int(ExitCode::bad_command_line_arguments));
                return;
            }
        }
    }
}

void tally::BasicRunner::ProcessFlags(std::function<std::optional<std::string_view>()> next_flag, bool *ok)
{
    if (ok)
        *ok = true;

    auto Fail = [&]
    {
        if (ok)
            *ok = false;
        else
            std::exit(int(ExitCode::bad_command_line_arguments));
    };

    auto FailWithMessage = [&](std::string_view message)
    {
        for (const auto &m : modules)
            m->OnFatalError(message);
        Fail();
    };

    // The command and its arguments.
    std::vector<std::string> positional;

    while (true)
    {
        std::optional<std::string_view> flag = next_flag();
        if (!flag)
            break;

        if (!flag->starts_with('-') || *flag == "-")
        {
            positional.emplace_back(*flag);
            continue;
        }

        std::optional<std::string_view> arg;

        // Handle arguments embedded in the flag.

        // Short form.
        if (flag->size() > 2 && flag->starts_with('-') && (*flag)[1] != '-')
        {
            arg = flag->substr(2);
            flag = flag->substr(0, 2);
        }
        // Long form.
        else if (auto sep = flag->find_first_of('='); sep != std::string_view::npos)
        {
            arg = flag->substr(sep + 1);
            flag = flag->substr(0, sep);
        }

        bool unknown = true;
        for (const auto &m : modules)
        {
            auto flags = m->GetFlags();

            for (auto &f : flags)
            {
                bool already_used_single_arg = false;
                bool missing_arg = false;
                unknown = !f->ProcessFlag(*this, *m, *flag, [&]() -> std::optional<std::string_view>
                {
                    if (arg)
                    {
                        if (already_used_single_arg)
                        {
                            // If the argument was specified with `=`, we don't allow additional arguments after that.
                            missing_arg = true;
                            return {};
                        }
                        already_used_single_arg = true;
                        return *arg;
                    }
                    else
                    {
                        if (missing_arg)
                            return {};
                        auto ret = next_flag();
                        if (!ret)
                            missing_arg = true;
                        return ret;
                    }
                });

                // If we're missing an argument...
                if (missing_arg)
                {
                    for (const auto &m2 : modules)
                        m2->OnMissingFlagArgument(*flag, *f, missing_arg);
                    if (missing_arg)
                    {
                        Fail();
                        break;
                    }
                }

                if (!unknown)
                    break;
            }

            if (!unknown)
                break;
            if (ok && !*ok)
                break;
        }

        if (ok && !*ok)
            return;

        // If the argument is unknown...
        if (unknown)
        {
            for (const auto &m2 : modules)
                m2->OnUnknownFlag(*flag, unknown);
            if (unknown)
            {
                Fail();
                return;
            }
        }
    }

    // Interpret the command.
    if (positional.empty())
    {
        command = Command::run;
    }
    else if (positional[0] == "list")
    {
        if (positional.size() > 1)
            return FailWithMessage(CFG_TALLY_FMT_NAMESPACE::format("Unexpected argument `{}` after `list`.", positional[1]));
        command = Command::list;
    }
    else if (positional[0] == "test")
    {
        if (positional.size() > 3)
            return FailWithMessage(CFG_TALLY_FMT_NAMESPACE::format("Unexpected argument `{}`, `test` expects at most NAME_REGEX and TESTCASES.", positional[3]));

        Filter new_filter;
        if (positional.size() > 1)
        {
            try
            {
                new_filter.name = std::regex(positional[1], std::regex_constants::ECMAScript/*the default syntax*/ | std::regex_constants::optimize);
            }
            catch (const std::regex_error &e)
            {
                return FailWithMessage(CFG_TALLY_FMT_NAMESPACE::format("Invalid NAME_REGEX `{}`: {}", positional[1], e.what()));
            }
        }
        if (positional.size() > 2)
        {
            IndexSet cases;
            std::string error = ParseIndexSet(positional[2], cases);
            if (!error.empty())
                return FailWithMessage(CFG_TALLY_FMT_NAMESPACE::format("Invalid TESTCASES `{}`: {}.", positional[2], error));
            new_filter.cases = std::move(cases);
        }

        command = Command::test;
        filter = std::move(new_filter);
    }
    else
    {
        return FailWithMessage(CFG_TALLY_FMT_NAMESPACE::format("Unknown command `{}`, run with `--help` for usage.", positional[0]));
    }
}

void tally::BasicRunner::SetOutputStream(FILE *stream) const
{
    FindModule<BasicPrintingModule>([&](BasicPrintingModule &module)
    {
        module.terminal = output::Terminal(stream);
        return false;
    });
}

void tally::BasicRunner::SetEnableColor(bool enable) const
{
    FindModule<BasicPrintingModule>([&](BasicPrintingModule &module)
    {
        module.terminal.enable_color = enable;
        return false;
    });
}

void tally::BasicRunner::SetTerminalSettings(std::function<void(output::Terminal &terminal)> func) const
{
    FindModule<BasicPrintingModule>([&](BasicPrintingModule &module)
    {
        func(module.terminal);
        return false;
    });
}

int tally::BasicRunner::Fatal(ExitCode code, std::string_view message) const
{
    for (const auto &m : modules)
        m->OnFatalError(message);
    return int(code);
}

int tally::BasicRunner::ReportInvalidNames(std::span<const std::string> errors) const
{
    for (const std::string &error : errors)
    {
        for (const auto &m : modules)
            m->OnFatalError(error);
    }
    return int(ExitCode::invalid_test_names);
}

void tally::BasicRunner::BeginCommand() const
{
    for (const auto &m : modules)
        m->OnPreCommand(config);
}

int tally::BasicRunner::ListTests(std::vector<TestInfo> tests, std::size_t new_max_label) const
{
    std::sort(tests.begin(), tests.end(), [](const TestInfo &a, const TestInfo &b){return a.path < b.path;});

    data::ListTestsInfo info{.config = config, .tests = tests, .max_label = new_max_label};
    for (const auto &m : modules)
        m->OnListTests(info);
    return int(ExitCode::ok);
}

void tally::BasicRunner::BeginRun(std::vector<TestInfo> tests, std::size_t new_max_label)
{
    run_tests = std::move(tests);
    max_label = new_max_label;
    outcomes.clear();
    error_reports.clear();

    PrepareRunDirectory(config);

    start_time = std::chrono::steady_clock::now();

    data::RunTestsInfo info{.config = config, .tests = run_tests, .max_label = max_label};
    for (const auto &m : modules)
        m->OnPreRunTests(info);
}

tally::CaptureSettings tally::BasicRunner::MakeCaptureSettings() const
{
    CaptureSettings ret;
    ret.enabled = !config.verbose;
    ret.directory = config.OutputDir();
    ret.echo = [this](const TestPath &path, std::string_view text)
    {
        for (const auto &m : modules)
            m->OnOutputRestored(config, path, text);
    };
    return ret;
}

int tally::BasicRunner::FinishRun(std::vector<Outcome> new_outcomes)
{
    outcomes = std::move(new_outcomes);
    RunSummary summary = Summarize(outcomes, std::chrono::steady_clock::now() - start_time);

    data::RunTestsResults results{
        {.config = config, .tests = run_tests, .max_label = max_label},
        summary,
        outcomes,
        error_reports,
    };
    for (const auto &m : modules)
        m->OnPostRunTests(results);

    return int(std::min(summary.failed, std::size_t(ExitCode::max_failure_count)));
}

void tally::BasicRunner::OnTestStart(std::size_t index, const TestPath &path)
{
    (void)path;

    data::RunSingleTestInfo info{
        .all_tests = {.config = config, .tests = run_tests, .max_label = max_label},
        .index = index,
        .test = run_tests.at(index),
    };
    for (const auto &m : modules)
        m->OnPreRunSingleTest(info);
}

void tally::BasicRunner::OnTestResult(std::size_t index, const TestPath &path, const Outcome &outcome)
{
    (void)path;

    const TestInfo &test = run_tests.at(index);

    if (auto text = FailureText(outcome))
        error_reports.insert(error_reports.begin(), MakeErrorReport(config, test, *text));

    data::RunSingleTestResults results{
        {
            .all_tests = {.config = config, .tests = run_tests, .max_label = max_label},
            .index = index,
            .test = test,
        },
        outcome,
    };
    for (const auto &m : modules)
        m->OnPostRunSingleTest(results);
}
