#include <safecsv/writer/safe_writer.h>
#include <safecsv/encoder/delimiter.h>
#include <safecsv/encoder/quoted_field.h>
#include <safecsv/encoder/quoting.h>
#include <safecsv/encoder/sanitizer.h>
#include <safecsv/error.h>

namespace safecsv::writer {

    SafeWriter::SafeWriter(io::ByteSink& sink, policy::SafetyPolicy p, WriterConfig cfg)
        : policy_(p), cfg_(cfg), out_(sink, cfg.buffer_size) {
    }

    std::error_code SafeWriter::latch(std::error_code ec) noexcept {
        if (ec && !err_) err_ = ec;
        return ec;
    }

    std::error_code SafeWriter::write_field(std::string_view field) {
        field = encoder::sanitize_field(field, policy_, scratch_);

        if (!encoder::field_needs_quotes(field, cfg_.delimiter, policy_)) {
            return out_.write(field);
        }
        return encoder::write_quoted_field(out_, field, cfg_.terminator);
    }

    template <typename Fields>
    std::error_code SafeWriter::write_fields(const Fields& fields) {
        if (!encoder::valid_delimiter(cfg_.delimiter)) {
            return latch(make_error_code(errc::invalid_delimiter));
        }
        if (err_) return err_;

        bool first = true;
        for (const auto& f : fields) {
            if (!first) {
                if (auto ec = out_.write_code_point(cfg_.delimiter); ec) return latch(ec);
            }
            first = false;
            if (auto ec = write_field(std::string_view{ f }); ec) return latch(ec);
        }
        if (auto ec = out_.write(terminator_bytes(cfg_.terminator)); ec) return latch(ec);

        ++records_written_;
        return {};
    }

    std::error_code SafeWriter::write(const Record& record) {
        return write_fields(record);
    }

    std::error_code SafeWriter::write_view(std::span<const std::string_view> record) {
        return write_fields(record);
    }

    void SafeWriter::flush() {
        // Records encoded before a configuration error still go out; after an
        // I/O error the buffered sink refuses to touch the sink again.
        latch(out_.flush());
    }

    std::error_code SafeWriter::write_all(const std::vector<Record>& records) {
        for (const auto& r : records) {
            if (auto ec = write(r); ec) return ec;
        }
        if (err_) return err_;
        return latch(out_.flush());
    }

} // namespace safecsv::writer
