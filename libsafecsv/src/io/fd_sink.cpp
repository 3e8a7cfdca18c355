#include <safecsv/io/fd_sink.h>
#include <safecsv/error.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

namespace safecsv::io {

    FdSink::FdSink(net::io_context& io, int fd) : desc_(io, fd) {}

    FdSink::~FdSink() {
        // Hand the descriptor back to its owner.
        desc_.release();
    }

    std::error_code FdSink::write(std::string_view bytes) {
        boost::system::error_code bec;
        const auto n = net::write(desc_, net::buffer(bytes.data(), bytes.size()), bec);
        if (bec) return std::error_code(bec.value(), std::generic_category());
        if (n != bytes.size()) return make_error_code(errc::short_write);
        return {};
    }

} // namespace safecsv::io
