#pragma once
#include <string_view>
#include <system_error>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <safecsv/io/sink.h>

namespace safecsv::io {

    namespace net = boost::asio;

    // Blocking writes to a caller-owned POSIX file descriptor (stdout, a pipe,
    // an open file). The descriptor is released, not closed, on destruction.
    class FdSink final : public ByteSink {
    public:
        FdSink(net::io_context& io, int fd);
        ~FdSink() override;

        FdSink(const FdSink&) = delete;
        FdSink& operator=(const FdSink&) = delete;

        std::error_code write(std::string_view bytes) override;

    private:
        net::posix::stream_descriptor desc_;
    };

} // namespace safecsv::io
