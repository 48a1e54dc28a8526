#if CFG_TALLY_SHARED
#ifdef _WIN32
#define CFG_TALLY_API __declspec(dllexport)
#endif
#endif

#include <tally/tally.hpp>

#include <cerrno>
#include <iostream>

#include <fcntl.h>
#include <unistd.h>

namespace
{
    std::atomic_bool capture_active = false;

    // Flushes both the C++ streams and the C streams, so nothing buffered crosses the redirection.
    void FlushAll()
    {
        std::cout << std::flush;
        std::cerr << std::flush;
        std::fflush(stdout);
        std::fflush(stderr);
    }

    [[nodiscard]] std::error_code LastError()
    {
        return std::error_code(errno, std::generic_category());
    }
}

tally::OutputCapture::OutputCapture(const std::filesystem::path &file)
{
    if (capture_active.exchange(true))
        HardError("The output is already being captured.", HardErrorKind::user);

    // Sync C++ streams with C stdio, so they go through the same descriptors.
    std::ios_base::sync_with_stdio(true);
    FlushAll();

    int file_fd = -1;
    auto Fail = [&](std::string_view what)
    {
        std::error_code error = LastError();
        if (file_fd != -1)
            close(file_fd);
        if (saved_stdout != -1)
            close(saved_stdout);
        if (saved_stderr != -1)
            close(saved_stderr);
        capture_active = false;
        throw OutputCaptureError(error, CFG_TALLY_FMT_NAMESPACE::format("{} `{}`", what, file.string()));
    };

    saved_stdout = dup(STDOUT_FILENO);
    if (saved_stdout == -1)
        Fail("Unable to save stdout before capturing to");
    saved_stderr = dup(STDERR_FILENO);
    if (saved_stderr == -1)
        Fail("Unable to save stderr before capturing to");

    file_fd = open(file.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0660);
    if (file_fd == -1)
        Fail("Unable to open the output file");

    if (dup2(file_fd, STDOUT_FILENO) == -1 || dup2(file_fd, STDERR_FILENO) == -1)
    {
        // Undo the partial redirection before reporting.
        dup2(saved_stdout, STDOUT_FILENO);
        dup2(saved_stderr, STDERR_FILENO);
        Fail("Unable to redirect the output to");
    }

    close(file_fd);
}

tally::OutputCapture::~OutputCapture()
{
    FlushAll();

    dup2(saved_stdout, STDOUT_FILENO);
    dup2(saved_stderr, STDERR_FILENO);
    close(saved_stdout);
    close(saved_stderr);

    capture_active = false;
}

bool tally::OutputCapture::IsActive()
{
    return capture_active;
}

void tally::detail::WriteCapturedFailure(std::string_view text)
{
    std::fwrite(text.data(), 1, text.size(), stdout);
    std::fputc('\n', stdout);
}
