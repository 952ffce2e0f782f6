// src/term/term_io.cpp
// @brief stdout/stdin and in-memory TermIO implementations.
// @invariant RealTermIO emits bytes only on flush(); an EINTR read reports interrupted().
// @ownership RealTermIO borrows the process standard streams.

#include "morlock/term/term_io.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

namespace morlock::term
{

void RealTermIO::write(std::string_view data)
{
    out_.append(data);
}

void RealTermIO::flush()
{
    if (out_.empty())
    {
        return;
    }
    std::fwrite(out_.data(), 1, out_.size(), stdout);
    std::fflush(stdout);
    out_.clear();
}

std::size_t RealTermIO::read(char *buf, std::size_t max)
{
#if defined(_WIN32)
    int n = ::_read(0, buf, static_cast<unsigned>(max));
    return n > 0 ? static_cast<std::size_t>(n) : 0;
#else
    interrupted_ = false;
    ssize_t n = ::read(STDIN_FILENO, buf, max);
    if (n > 0)
    {
        return static_cast<std::size_t>(n);
    }
    if (n < 0 && errno == EINTR)
    {
        interrupted_ = true;
    }
    return 0;
#endif
}

std::size_t StringTermIO::read(char *buf, std::size_t max)
{
    const std::size_t avail = input_.size() - inputPos_;
    const std::size_t n = std::min(avail, max);
    std::memcpy(buf, input_.data() + inputPos_, n);
    inputPos_ += n;
    return n;
}

} // namespace morlock::term
