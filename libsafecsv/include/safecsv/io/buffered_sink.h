#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <safecsv/io/sink.h>

namespace safecsv::io {

    // Write-combining buffer in front of a ByteSink.
    // The first failure is sticky: every later write/flush returns it and
    // leaves the sink alone.
    class BufferedSink {
    public:
        static constexpr std::size_t k_default_size = 4096;

        // Throws std::invalid_argument if capacity is 0.
        explicit BufferedSink(ByteSink& sink, std::size_t capacity = k_default_size);

        BufferedSink(const BufferedSink&) = delete;
        BufferedSink& operator=(const BufferedSink&) = delete;

        std::error_code write(std::string_view bytes);
        std::error_code write_byte(char c);
        // UTF-8 encode CP into the buffer.
        std::error_code write_code_point(char32_t cp);

        // Drain the buffer into the sink, then flush the sink.
        std::error_code flush();

        const std::error_code& error() const noexcept { return err_; }
        std::size_t buffered() const noexcept { return buf_.size(); }
        std::size_t available() const noexcept { return capacity_ - buf_.size(); }
        std::size_t capacity() const noexcept { return capacity_; }

    private:
        std::error_code drain();

        ByteSink& sink_;
        std::size_t capacity_;
        std::string buf_;
        std::error_code err_;
    };

} // namespace safecsv::io
