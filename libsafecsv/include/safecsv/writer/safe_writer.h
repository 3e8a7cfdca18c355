#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <safecsv/io/buffered_sink.h>
#include <safecsv/io/sink.h>
#include <safecsv/policy/safety_policy.h>
#include <safecsv/writer/config.h>

namespace safecsv::writer {

    // One row; field order is column order.
    using Record = std::vector<std::string>;

    // Writes records as CSV while neutralizing spreadsheet formula triggers.
    // Usage:
    //   io::StringSink sink;
    //   SafeWriter w(sink, policy::full_safety());
    //   w.write({"userId", "=A1"});
    //   w.flush();
    //   if (auto ec = w.error()) ...
    //
    // Delimiter and line terminator may be changed only before the first
    // write. Output is buffered; call flush() (or hold a ScopedFlush) to
    // push it to the sink. The first error of any call is latched and
    // returned by error() and by every later write.
    //
    // Not thread-safe: confine an instance to one thread or guard it with a
    // mutex. The sink is never closed.
    class SafeWriter {
    public:
        SafeWriter(io::ByteSink& sink, policy::SafetyPolicy p, WriterConfig cfg = {});

        SafeWriter(const SafeWriter&) = delete;
        SafeWriter& operator=(const SafeWriter&) = delete;

        void set_delimiter(char32_t d) noexcept { cfg_.delimiter = d; }
        void set_line_terminator(LineTerminator t) noexcept { cfg_.terminator = t; }
        void set_use_crlf(bool on) noexcept { cfg_.terminator = on ? LineTerminator::crlf : LineTerminator::lf; }

        char32_t delimiter() const noexcept { return cfg_.delimiter; }
        LineTerminator line_terminator() const noexcept { return cfg_.terminator; }
        bool use_crlf() const noexcept { return cfg_.terminator == LineTerminator::crlf; }
        const policy::SafetyPolicy& safety_policy() const noexcept { return policy_; }

        // Encode one record followed by the line terminator.
        // errc::invalid_delimiter is reported before anything is written.
        std::error_code write(const Record& record);
        // Same, over borrowed fields.
        std::error_code write_view(std::span<const std::string_view> record);

        // Drain buffered output to the sink. Failures land in error().
        void flush();

        // The latched error, if any.
        std::error_code error() const noexcept { return err_; }

        // Write every record (stopping at the first failure), then flush.
        std::error_code write_all(const std::vector<Record>& records);

        // Records fully encoded into the buffer so far.
        std::uint64_t records_written() const noexcept { return records_written_; }

    private:
        template <typename Fields>
        std::error_code write_fields(const Fields& fields);

        std::error_code write_field(std::string_view field);
        std::error_code latch(std::error_code ec) noexcept;

        policy::SafetyPolicy policy_;
        WriterConfig cfg_;
        io::BufferedSink out_;
        std::string scratch_;
        std::error_code err_;
        std::uint64_t records_written_{ 0 };
    };

    // Flushes W on every exit path of the enclosing scope.
    class ScopedFlush {
    public:
        explicit ScopedFlush(SafeWriter& w) noexcept : w_(w) {}
        ~ScopedFlush() { w_.flush(); }

        ScopedFlush(const ScopedFlush&) = delete;
        ScopedFlush& operator=(const ScopedFlush&) = delete;

    private:
        SafeWriter& w_;
    };

} // namespace safecsv::writer
