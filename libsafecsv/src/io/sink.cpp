#include <safecsv/io/sink.h>
#include <safecsv/error.h>

#include <ios>

namespace safecsv::io {

    // The caller may have enabled exceptions() on the stream; a failure is
    // reported as errc::io_error either way.
    std::error_code OstreamSink::write(std::string_view bytes) {
        if (!os_) return make_error_code(errc::io_error);
        try {
            os_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        }
        catch (const std::ios_base::failure&) {
            return make_error_code(errc::io_error);
        }
        if (!os_) return make_error_code(errc::io_error);
        return {};
    }

    std::error_code OstreamSink::flush() {
        try {
            os_.flush();
        }
        catch (const std::ios_base::failure&) {
            return make_error_code(errc::io_error);
        }
        if (!os_) return make_error_code(errc::io_error);
        return {};
    }

} // namespace safecsv::io
