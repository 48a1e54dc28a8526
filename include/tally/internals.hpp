#pragma once

#include <tally/tally.hpp>

#include <array>

// The modules, the flags and the terminal output. Include this to configure the built-in modules or to write new ones.

namespace tally
{
    // Command line flags. The modules own them, and the runner feeds them the arguments.
    namespace flags
    {
        struct BasicFlag
        {
            // Shown by `--help`.
            std::string help_desc;

            // If not empty, the environment variable `CFG_TALLY_ENV_PREFIX + env_var` provides the default value for this flag.
            std::string env_var;

            BasicFlag(std::string help_desc) : help_desc(std::move(help_desc)) {}

            virtual ~BasicFlag() = default;

            // How `--help` spells this flag, such as `-v,--[no-]verbose`.
            virtual std::string HelpFlagSpelling() const = 0;

            // Returns true if `input` is this flag. If it needs a value, it calls `request_arg` to get it.
            // If `request_arg` returns null, return false, the runner reports the missing argument anyway.
            virtual bool ProcessFlag(BasicRunner &runner, BasicModule &this_module, std::string_view input, std::function<std::optional<std::string_view>()> request_arg) = 0;

            // Applies the value of the environment variable. Return false if the value is invalid.
            virtual bool ProcessEnvVar(BasicRunner &runner, BasicModule &this_module, std::string_view value)
            {
                (void)runner;
                (void)this_module;
                (void)value;
                return false;
            }
        };

        // A flag with a long name and an optional one-letter name.
        struct NamedFlag : BasicFlag
        {
            // Without the leading `--`.
            std::string flag;
            // Zero if none.
            char short_flag = '\0';

            NamedFlag(std::string flag, char short_flag, std::string help_desc)
                : BasicFlag(std::move(help_desc)), flag(std::move(flag)), short_flag(short_flag)
            {}

          protected:
            // `-x,` or nothing.
            [[nodiscard]] std::string ShortSpellingPrefix() const
            {
                if (!short_flag)
                    return "";
                return {'-', short_flag, ','};
            }

            [[nodiscard]] bool IsShortForm(std::string_view input) const
            {
                return short_flag && input.size() == 2 && input[0] == '-' && input[1] == short_flag;
            }

            // If `input` is `--<prefix><flag>`, returns true.
            [[nodiscard]] bool IsLongForm(std::string_view input, std::string_view prefix = "") const
            {
                if (!input.starts_with("--"))
                    return false;
                input.remove_prefix(2);
                if (!input.starts_with(prefix))
                    return false;
                input.remove_prefix(prefix.size());
                return input == flag;
            }
        };

        // A flag without a value, such as `--help`.
        struct SimpleFlag : NamedFlag
        {
            using Callback = std::function<void(BasicRunner &runner, BasicModule &this_module)>;
            Callback callback;

            SimpleFlag(std::string flag, char short_flag, std::string help_desc, Callback callback)
                : NamedFlag(std::move(flag), short_flag, std::move(help_desc)), callback(std::move(callback))
            {}

            std::string HelpFlagSpelling() const override
            {
                return ShortSpellingPrefix() + "--" + flag;
            }

            bool ProcessFlag(BasicRunner &runner, BasicModule &this_module, std::string_view input, std::function<std::optional<std::string_view>()> request_arg) override
            {
                (void)request_arg;
                if (!IsShortForm(input) && !IsLongForm(input))
                    return false;
                callback(runner, this_module);
                return true;
            }
        };

        // A boolean flag: `--foo` and `--no-foo`. The short form, if any, means `--foo`.
        struct BoolFlag : NamedFlag
        {
            using Callback = std::function<void(BasicRunner &runner, BasicModule &this_module, bool value)>;
            Callback callback;

            BoolFlag(std::string flag, std::string help_desc, Callback callback)
                : BoolFlag(std::move(flag), '\0', std::move(help_desc), std::move(callback))
            {}
            BoolFlag(std::string flag, char short_flag, std::string help_desc, Callback callback)
                : NamedFlag(std::move(flag), short_flag, std::move(help_desc)), callback(std::move(callback))
            {}

            std::string HelpFlagSpelling() const override
            {
                return ShortSpellingPrefix() + "--[no-]" + flag;
            }

            bool ProcessFlag(BasicRunner &runner, BasicModule &this_module, std::string_view input, std::function<std::optional<std::string_view>()> request_arg) override
            {
                (void)request_arg;
                if (IsShortForm(input) || IsLongForm(input))
                    callback(runner, this_module, true);
                else if (IsLongForm(input, "no-"))
                    callback(runner, this_module, false);
                else
                    return false;
                return true;
            }

            // Accepts `1`, `true`, `yes`, `on` and `0`, `false`, `no`, `off`.
            bool ProcessEnvVar(BasicRunner &runner, BasicModule &this_module, std::string_view value) override
            {
                for (std::string_view yes : {"1", "true", "yes", "on"})
                {
                    if (value == yes)
                    {
                        callback(runner, this_module, true);
                        return true;
                    }
                }
                for (std::string_view no : {"0", "false", "no", "off"})
                {
                    if (value == no)
                    {
                        callback(runner, this_module, false);
                        return true;
                    }
                }
                return false;
            }
        };

        // A flag with a string value: `-x VALUE`, `-xVALUE`, `--foo VALUE` or `--foo=VALUE`.
        struct StringFlag : NamedFlag
        {
            using Callback = std::function<void(BasicRunner &runner, BasicModule &this_module, std::string_view value)>;
            Callback callback;

            StringFlag(std::string flag, char short_flag, std::string help_desc, Callback callback)
                : NamedFlag(std::move(flag), short_flag, std::move(help_desc)), callback(std::move(callback))
            {}

            std::string HelpFlagSpelling() const override
            {
                return ShortSpellingPrefix() + "--" + flag + " ...";
            }

            bool ProcessFlag(BasicRunner &runner, BasicModule &this_module, std::string_view input, std::function<std::optional<std::string_view>()> request_arg) override
            {
                if (!IsShortForm(input) && !IsLongForm(input))
                    return false;
                auto value = request_arg();
                if (!value)
                    return false;
                callback(runner, this_module, *value);
                return true;
            }

            // An empty value is an error.
            bool ProcessEnvVar(BasicRunner &runner, BasicModule &this_module, std::string_view value) override
            {
                if (value.empty())
                    return false;
                callback(runner, this_module, value);
                return true;
            }
        };
    }

    // The information passed to the modules.
    namespace data
    {
        struct ListTestsInfo
        {
            const RunConfig &config;
            // Sorted by path.
            std::span<const TestInfo> tests;
            // The length of the longest group name.
            std::size_t max_label = 0;
        };

        struct RunTestsInfo
        {
            const RunConfig &config;
            // In the execution order. Includes the tests that will be skipped.
            std::span<const TestInfo> tests;
            // The length of the longest group name.
            std::size_t max_label = 0;
        };

        struct RunTestsResults : RunTestsInfo
        {
            RunSummary summary;
            std::span<const Outcome> outcomes;
            // Most recent first.
            std::span<const std::string> error_reports;
        };

        struct RunSingleTestInfo
        {
            RunTestsInfo all_tests;
            // The index in `all_tests.tests`.
            std::size_t index = 0;
            const TestInfo &test;
        };

        struct RunSingleTestResults : RunSingleTestInfo
        {
            const Outcome &outcome;
        };
    }

    // Modules customize the runner. They receive callbacks at every stage, and can own command line flags.
    struct BasicModule
    {
        virtual ~BasicModule() = default;

        // --- COMMAND LINE ---

        // The flags of this module. They must live as long as the module, usually as members.
        [[nodiscard]] virtual std::vector<flags::BasicFlag *> GetFlags() noexcept {return {};}
        // An argument didn't match any flag. `abort` starts as true. Set it to false to ignore the flag.
        virtual void OnUnknownFlag(std::string_view flag, bool &abort) noexcept {(void)flag; (void)abort;}
        // A flag didn't get its value. `abort` works as above.
        virtual void OnMissingFlagArgument(std::string_view flag, const flags::BasicFlag &flag_obj, bool &abort) noexcept {(void)flag; (void)flag_obj; (void)abort;}

        // --- COMMANDS ---

        // Before any command runs.
        virtual void OnPreCommand(const RunConfig &config) noexcept {(void)config;}

        // The `list` command.
        virtual void OnListTests(const data::ListTestsInfo &data) noexcept {(void)data;}

        // Before the first test, the run directory exists at this point.
        virtual void OnPreRunTests(const data::RunTestsInfo &data) noexcept {(void)data;}
        // After the last test.
        virtual void OnPostRunTests(const data::RunTestsResults &data) noexcept {(void)data;}

        virtual void OnPreRunSingleTest(const data::RunSingleTestInfo &data) noexcept {(void)data;}
        virtual void OnPostRunSingleTest(const data::RunSingleTestResults &data) noexcept {(void)data;}

        // A failed test finished, and stdout and stderr point to the original streams again.
        // `text` was also appended to the captured output.
        virtual void OnOutputRestored(const RunConfig &config, const TestPath &path, std::string_view text) noexcept {(void)config; (void)path; (void)text;}

        // The runner is about to exit with an error code.
        virtual void OnFatalError(std::string_view message) noexcept {(void)message;}
    };

    namespace output
    {
        // ANSI foreground colors. Only the ones we use.
        enum class TextColor
        {
            none = 39,
            light_red = 91,
            light_green = 92,
            light_yellow = 93,
            light_cyan = 96,
        };

        // Text style.
        struct TextStyle
        {
            TextColor color = TextColor::none;
            bool bold = false;

            friend bool operator==(const TextStyle &, const TextStyle &) = default;
        };

        // Configuration for printing text.
        struct Terminal
        {
            bool enable_color = false;

            // The characters are written to this `std::vprintf`-style callback.
            std::function<void(std::string_view fmt, CFG_TALLY_FMT_NAMESPACE::format_args args)> output_func;

            // Default to stdout.
            Terminal() : Terminal(stdout) {}

            // Sets `output_func` to print to `stream`.
            // Also guesses `enable_color` (always false when `stream` is neither `stdout` nor `stderr`).
            CFG_TALLY_API Terminal(FILE *stream);

            // Prints a message using `output_func`. Unlike `Print`, doesn't accept `TextStyle`s directly.
            // Prefer `Print()`.
            CFG_TALLY_API void PrintLow(std::string_view fmt, CFG_TALLY_FMT_NAMESPACE::format_args args) const;

            // Stores the current text style. Resets the text style when constructed and when destructed.
            // Can't be constructed manually, use `MakeStyleGuard()`.
            class StyleGuard
            {
                friend Terminal;

                Terminal &terminal;
                int exception_counter = 0;
                TextStyle cur_style;

                CFG_TALLY_API StyleGuard(Terminal &terminal);

              public:
                StyleGuard(const StyleGuard &) = delete;
                StyleGuard &operator=(const StyleGuard &) = delete;

                CFG_TALLY_API ~StyleGuard();

                // Pokes the terminal to reset the style. This is called automatically in the constructor and in the destructor.
                CFG_TALLY_API void ResetStyle();

                [[nodiscard]] const TextStyle &GetCurrentStyle() const {return cur_style;}
            };

            [[nodiscard]] StyleGuard MakeStyleGuard()
            {
                return StyleGuard(*this);
            }

            // --- MANUAL ANSI ESCAPE SEQUENCE API ---

            // Printing this string resets the text styles. It's always null-terminated.
            [[nodiscard]] CFG_TALLY_API std::string_view AnsiResetString() const;

            // Should be large enough.
            using AnsiDeltaStringBuffer = std::array<char, 32>;

            // Produces a string to switch between text styles, from `prev` to `cur`.
            // If the styles are the same, does nothing.
            [[nodiscard]] CFG_TALLY_API AnsiDeltaStringBuffer AnsiDeltaString(const StyleGuard &&cur, const TextStyle &next) const;

            // This overload additionally performs `cur = next`.
            [[nodiscard]] AnsiDeltaStringBuffer AnsiDeltaString(StyleGuard &cur, const TextStyle &next) const
            {
                AnsiDeltaStringBuffer ret = AnsiDeltaString(std::move(cur), next);
                cur.cur_style = next;
                return ret;
            }

            // --- HIGH-LEVEL PRINTING ---

            // Prints all arguments using `output_func`. This overload doesn't support text styles.
            template <typename ...P>
            void Print(CFG_TALLY_FMT_NAMESPACE::format_string<P...> fmt, P &&... args) const
            {
                PrintLow(
                    FormatStringView(fmt),
                    // It seems we don't need to forward `args...`.
                    CFG_TALLY_FMT_NAMESPACE::make_format_args(args...)
                );
            }

            // For internal use! Not `private` only because we need to write a formatter for it.
            // This is generated internally by `Print`, and is fed to `std::format()`.
            // When printed, it prints the delta between `cur_style` and `new_style`, then does `cur_style = new_style`.
            struct PrintableAnsiDelta
            {
                const Terminal &terminal;
                Terminal::StyleGuard &cur_style;
                TextStyle new_style;
            };

          private:
            // libfmt 9 has no `format_string::get()`, but converts it to its own `string_view`.
            #if CFG_TALLY_FMT_USES_CUSTOM_STRING_VIEW
            [[nodiscard]] static std::string_view FormatStringView(CFG_TALLY_FMT_NAMESPACE::string_view fmt) {return {fmt.data(), fmt.size()};}
            #else
            template <typename T>
            [[nodiscard]] static std::string_view FormatStringView(const T &fmt) {return fmt.get();}
            #endif

            // Replaces `TextStyle` with `PrintableAnsiDelta` for the template arguments of `std::format_string<...>`.
            template <typename T>
            using WrapStyleTypeForFormatString = std::conditional_t<std::is_same_v<std::remove_cvref_t<T>, TextStyle>, PrintableAnsiDelta, T>;

            // Replaces objects of type `TextStyle` with `PrintableAnsiDelta` for `std::format(...)`.
            template <typename T>
            static decltype(auto) WrapStyleForFormatString(const Terminal &terminal, StyleGuard &cur_style, T &&target)
            {
                if constexpr (std::is_same_v<std::remove_cvref_t<T>, TextStyle>)
                    return PrintableAnsiDelta{.terminal = terminal, .cur_style = cur_style, .new_style = target};
                else
                    return std::forward<T>(target);
            }

            // Converts rvalues to lvalues, because in new C++ `make_format_args` no longer accepts rvalues.
            // It's safe to do in our case, since the format args are used immediately.
            template <typename T>
            static T &UnmoveFormatArg(T &&value)
            {
                // Need the cast to work around the simplified implicit move in C++23.
                return static_cast<T &>(value);
            }

          public:
            // Prints all arguments using `output_func`. This overload supports text styles.
            template <typename ...P>
            void Print(StyleGuard &cur_style, CFG_TALLY_FMT_NAMESPACE::format_string<WrapStyleTypeForFormatString<P>...> fmt, P &&... args) const
            {
                // It seems we don't need to forward `args...`.
                PrintLow(
                    FormatStringView(fmt),
                    CFG_TALLY_FMT_NAMESPACE::make_format_args(UnmoveFormatArg(WrapStyleForFormatString(*this, cur_style, args))...)
                );
            }
        };

        // Prints `string` in `style`, padded with spaces to `width`.
        CFG_TALLY_API void PrintPadded(const Terminal &terminal, Terminal::StyleGuard &cur_style, const TextStyle &style, std::string_view string, std::size_t width);

        // Prints the group name in `style` padded to `max_label + 8`, then the test index, as in `math          3`.
        CFG_TALLY_API void PrintTestPath(const Terminal &terminal, Terminal::StyleGuard &cur_style, const TextStyle &style, const TestPath &path, std::size_t max_label);
    }

    // A module that prints. `BasicRunner::SetOutputStream()` and friends configure all of them at once.
    struct BasicPrintingModule : virtual BasicModule
    {
      protected:
        ~BasicPrintingModule() = default;

      public:
        output::Terminal terminal;

        // Group names.
        output::TextStyle style_path = {.color = output::TextColor::light_cyan};
    };

    // Allocates a new module as a `ModulePtr`.
    template <std::derived_from<BasicModule> T, typename ...P>
    requires std::constructible_from<T, P &&...>
    [[nodiscard]] ModulePtr MakeModule(P &&... params)
    {
        ModulePtr ret;
        ret.ptr = std::make_unique<T>(std::forward<P>(params)...);
        return ret;
    }


    // --- BUILT-IN MODULES ---

    namespace modules
    {
        // Handles `--help`, and reports unknown flags.
        struct HelpPrinter : BasicPrintingModule
        {
            // The flag spellings are padded to this width.
            int expected_flag_width = 0;

            flags::SimpleFlag flag_help;

            CFG_TALLY_API HelpPrinter();
            std::vector<flags::BasicFlag *> GetFlags() noexcept override;
            void OnUnknownFlag(std::string_view flag, bool &abort) noexcept override;
            void OnMissingFlagArgument(std::string_view flag, const flags::BasicFlag &flag_obj, bool &abort) noexcept override;
        };

        // Responds to the flags that fill `RunConfig`.
        struct RunConfigurator : BasicModule
        {
            flags::StringFlag flag_output_dir;
            flags::BoolFlag flag_verbose;
            flags::BoolFlag flag_compact;
            flags::BoolFlag flag_show_errors;
            flags::BoolFlag flag_quick_tests;
            flags::BoolFlag flag_json;

            CFG_TALLY_API RunConfigurator();
            std::vector<flags::BasicFlag *> GetFlags() noexcept override;
        };

        // Handles `--[no-]color`.
        struct PrintingConfigurator : BasicModule
        {
            flags::BoolFlag flag_color;

            CFG_TALLY_API PrintingConfigurator();
            std::vector<flags::BasicFlag *> GetFlags() noexcept override;
        };

        // Prints the name of the test program and the run ID.
        struct HeaderPrinter : BasicPrintingModule
        {
            output::TextStyle style_name = {.bold = true};

            void OnPreCommand(const RunConfig &config) noexcept override;
        };

        // Prints the tests for the `list` command.
        struct TestLister : BasicPrintingModule
        {
            void OnListTests(const data::ListTestsInfo &data) noexcept override;
        };

        // Prints the tests as they're being run.
        struct ProgressPrinter : BasicPrintingModule
        {
            // The labels are padded to this width.
            std::size_t label_width = 20;

            output::TextStyle style_running = {.color = output::TextColor::light_yellow};
            output::TextStyle style_ok = {.color = output::TextColor::light_green};
            output::TextStyle style_failed = {.color = output::TextColor::light_red};
            output::TextStyle style_skipped = {.color = output::TextColor::light_yellow};

            std::string chars_running = " ...";

            void OnPreRunSingleTest(const data::RunSingleTestInfo &data) noexcept override;
            void OnPostRunSingleTest(const data::RunSingleTestResults &data) noexcept override;
            void OnPostRunTests(const data::RunTestsResults &data) noexcept override;

          private:
            void PrintInfo(output::Terminal::StyleGuard &cur_style, const data::RunSingleTestInfo &data) const;
        };

        // Prints the failure text of a test once its output is restored.
        struct FailureEchoPrinter : BasicPrintingModule
        {
            output::TextStyle style_text = {.color = output::TextColor::light_red};

            void OnOutputRestored(const RunConfig &config, const TestPath &path, std::string_view text) noexcept override;
        };

        // Prints the error reports at the end of a run.
        struct ErrorReportPrinter : BasicPrintingModule
        {
            void OnPostRunTests(const data::RunTestsResults &data) noexcept override;
        };

        // Prints the results of a run.
        struct ResultsPrinter : BasicPrintingModule
        {
            output::TextStyle style_success = {.color = output::TextColor::light_green};
            output::TextStyle style_failure = {.color = output::TextColor::light_red};

            void OnPostRunTests(const data::RunTestsResults &data) noexcept override;
        };

        // Prints the results of a run as JSON, when requested.
        struct JsonPrinter : BasicPrintingModule
        {
            void OnPostRunTests(const data::RunTestsResults &data) noexcept override;
        };

        // Prints the errors that stop the run. Prints to stderr by default.
        struct FatalErrorPrinter : BasicPrintingModule
        {
            output::TextStyle style_error = {.color = output::TextColor::light_red};

            CFG_TALLY_API FatalErrorPrinter();

            void OnFatalError(std::string_view message) noexcept override;
        };
    }
}

template <>
struct CFG_TALLY_FMT_NAMESPACE::formatter<tally::output::Terminal::PrintableAnsiDelta, char>
{
    constexpr auto parse(CFG_TALLY_FMT_NAMESPACE::basic_format_parse_context<char> &parse_ctx)
    {
        return parse_ctx.begin();
    }

    template <typename OutputIt>
    constexpr auto format(const tally::output::Terminal::PrintableAnsiDelta &arg, CFG_TALLY_FMT_NAMESPACE::basic_format_context<OutputIt, char> &format_ctx) const
    {
        return CFG_TALLY_FMT_NAMESPACE::format_to(format_ctx.out(), "{}", arg.terminal.AnsiDeltaString(arg.cur_style, arg.new_style).data());
    }
};
