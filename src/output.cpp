#if CFG_TALLY_SHARED
#ifdef _WIN32
#define CFG_TALLY_API __declspec(dllexport)
#endif
#endif

#include <tally/internals.hpp>

#include <cstring>

tally::output::Terminal::Terminal(FILE *stream)
{
    bool is_terminal =
        stream == stdout ? platform::IsTerminalAttached(false) :
        stream == stderr ? platform::IsTerminalAttached(true) : false;

    output_func = [stream](std::string_view fmt, CFG_TALLY_FMT_NAMESPACE::format_args args)
    {
        #if CFG_TALLY_FMT_HAS_FILE_VPRINT == 2
        CFG_TALLY_FMT_NAMESPACE::vprint(stream, fmt, args);
        #elif CFG_TALLY_FMT_HAS_FILE_VPRINT == 1
        CFG_TALLY_FMT_NAMESPACE::vprint_unicode(stream, fmt, args);
        #elif CFG_TALLY_FMT_HAS_FILE_VPRINT == 0
        std::string buffer = CFG_TALLY_FMT_NAMESPACE::vformat(fmt, args);
        std::fwrite(buffer.c_str(), buffer.size(), 1, stream);
        #else
        #error Invalid value of `CFG_TALLY_FMT_HAS_FILE_VPRINT`.
        #endif
    };

    enable_color = is_terminal;
}

void tally::output::Terminal::PrintLow(std::string_view fmt, CFG_TALLY_FMT_NAMESPACE::format_args args) const
{
    if (output_func)
        output_func(fmt, args);
}

tally::output::Terminal::StyleGuard::StyleGuard(Terminal &terminal)
    : terminal(terminal)
{
    if (terminal.enable_color)
    {
        ResetStyle();
        exception_counter = std::uncaught_exceptions(); // Don't need this without color.
    }
}

tally::output::Terminal::StyleGuard::~StyleGuard()
{
    if (terminal.enable_color && exception_counter == std::uncaught_exceptions())
        ResetStyle();
}

void tally::output::Terminal::StyleGuard::ResetStyle()
{
    if (terminal.enable_color)
        terminal.Print("{}", terminal.AnsiResetString().data());
    cur_style = {};
}

std::string_view tally::output::Terminal::AnsiResetString() const
{
    if (enable_color)
        return "\033[0m";
    else
        return "";
}

tally::output::Terminal::AnsiDeltaStringBuffer tally::output::Terminal::AnsiDeltaString(const StyleGuard &&cur, const TextStyle &next) const
{
    AnsiDeltaStringBuffer ret;
    ret[0] = '\0';

    if (!enable_color)
        return ret;

    std::strcpy(ret.data(), "\033[");
    char *ptr = ret.data() + 2;
    if (next.color != cur.cur_style.color)
        ptr += std::sprintf(ptr, "%d;", int(next.color));
    if (next.bold != cur.cur_style.bold)
        ptr += std::sprintf(ptr, "%s;", next.bold ? "1" : "22"); // Bold text is a little weird.

    if (ptr != ret.data() + 2)
    {
        // `sprintf` automatically null-terminates the buffer.
        ptr[-1] = 'm';

        return ret;
    }

    // Nothing useful in the buffer.
    ret[0] = '\0';
    return ret;
}

void tally::output::PrintPadded(const Terminal &terminal, Terminal::StyleGuard &cur_style, const TextStyle &style, std::string_view string, std::size_t width)
{
    terminal.Print(cur_style, "{}{}{}", style, string, TextStyle{});
    if (string.size() < width)
        terminal.Print("{:{}}", "", width - string.size());
}

void tally::output::PrintTestPath(const Terminal &terminal, Terminal::StyleGuard &cur_style, const TextStyle &style, const TestPath &path, std::size_t max_label)
{
    PrintPadded(terminal, cur_style, style, path.name, max_label + 8);
    terminal.Print("{:3}", path.index);
}
