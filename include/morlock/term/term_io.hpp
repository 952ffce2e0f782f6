// include/morlock/term/term_io.hpp
// @brief Byte-level terminal I/O seam used by the renderer and input polling.
// @invariant StringTermIO captures writes verbatim and serves scripted input in order.
// @ownership Implementations own only their internal buffers.
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace morlock::term
{

/// @brief Abstract terminal byte stream.
class TermIO
{
  public:
    virtual ~TermIO() = default;

    /// @brief Queue @p data for output.
    virtual void write(std::string_view data) = 0;

    /// @brief Push queued output to the terminal.
    virtual void flush() = 0;

    /// @brief Read up to @p max bytes of input into @p buf.
    /// @return Number of bytes read; 0 at end of input or when interrupted().
    virtual std::size_t read(char *buf, std::size_t max) = 0;

    /// @brief Whether the last read() returned early because a signal arrived.
    [[nodiscard]] virtual bool interrupted() const
    {
        return false;
    }
};

/// @brief Writes to stdout and reads from stdin.
class RealTermIO final : public TermIO
{
  public:
    void write(std::string_view data) override;
    void flush() override;
    std::size_t read(char *buf, std::size_t max) override;

    [[nodiscard]] bool interrupted() const override
    {
        return interrupted_;
    }

  private:
    std::string out_{};
    bool interrupted_{false};
};

/// @brief In-memory TermIO for tests and headless rendering.
class StringTermIO final : public TermIO
{
  public:
    void write(std::string_view data) override
    {
        buffer_.append(data);
    }

    void flush() override
    {
        ++flushes_;
    }

    std::size_t read(char *buf, std::size_t max) override;

    /// @brief Append bytes to the scripted input stream.
    void feedInput(std::string_view data)
    {
        input_.append(data);
    }

    [[nodiscard]] const std::string &buffer() const
    {
        return buffer_;
    }

    [[nodiscard]] int flushCount() const
    {
        return flushes_;
    }

    void clear()
    {
        buffer_.clear();
    }

  private:
    std::string buffer_{};
    std::string input_{};
    std::size_t inputPos_{0};
    int flushes_{0};
};

} // namespace morlock::term
