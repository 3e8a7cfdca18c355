#include <safecsv/io/buffered_sink.h>
#include <safecsv/encoding/utf8.h>

#include <stdexcept>

namespace safecsv::io {

    BufferedSink::BufferedSink(ByteSink& sink, std::size_t capacity)
        : sink_(sink), capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BufferedSink: capacity must be non-zero");
        }
        buf_.reserve(capacity_);
    }

    std::error_code BufferedSink::drain() {
        if (err_) return err_;
        if (buf_.empty()) return {};
        if (auto ec = sink_.write(buf_); ec) {
            err_ = ec;
            return err_;
        }
        buf_.clear();
        return {};
    }

    std::error_code BufferedSink::write(std::string_view bytes) {
        if (err_) return err_;
        while (bytes.size() > available()) {
            if (buf_.empty()) {
                // Larger than the whole buffer: skip the copy.
                if (auto ec = sink_.write(bytes); ec) {
                    err_ = ec;
                    return err_;
                }
                return {};
            }
            const std::size_t n = available();
            buf_.append(bytes.substr(0, n));
            bytes.remove_prefix(n);
            if (auto ec = drain(); ec) return ec;
        }
        buf_.append(bytes);
        return {};
    }

    std::error_code BufferedSink::write_byte(char c) {
        if (err_) return err_;
        if (available() == 0) {
            if (auto ec = drain(); ec) return ec;
        }
        buf_.push_back(c);
        return {};
    }

    std::error_code BufferedSink::write_code_point(char32_t cp) {
        if (cp < 0x80u) return write_byte(static_cast<char>(cp));
        std::string tmp;
        encoding::append_utf8(tmp, cp);
        return write(tmp);
    }

    std::error_code BufferedSink::flush() {
        if (auto ec = drain(); ec) return ec;
        if (auto ec = sink_.flush(); ec) {
            err_ = ec;
            return err_;
        }
        return {};
    }

} // namespace safecsv::io
