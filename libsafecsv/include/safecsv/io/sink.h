#pragma once
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace safecsv::io {

    // Destination for encoded bytes. Owned by the caller; writers never close it.
    class ByteSink {
    public:
        virtual ~ByteSink() = default;

        // Write all of BYTES or report why not.
        virtual std::error_code write(std::string_view bytes) = 0;

        // Push anything the sink itself buffers further down.
        virtual std::error_code flush() { return {}; }
    };

    // Collects output in memory.
    class StringSink final : public ByteSink {
    public:
        std::error_code write(std::string_view bytes) override {
            buf_.append(bytes);
            return {};
        }

        const std::string& str() const noexcept { return buf_; }
        void clear() noexcept { buf_.clear(); }

    private:
        std::string buf_;
    };

    // Adapter over a caller-owned std::ostream (file, stringstream, std::cout).
    class OstreamSink final : public ByteSink {
    public:
        explicit OstreamSink(std::ostream& os) : os_(os) {}

        std::error_code write(std::string_view bytes) override;
        std::error_code flush() override;

    private:
        std::ostream& os_;
    };

} // namespace safecsv::io
