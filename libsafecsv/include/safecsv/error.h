#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace safecsv {

    // Library error codes. Sink failures coming from the OS or Boost.Asio
    // keep their own category and are classified as I/O by kind_of().
    enum class errc {
        invalid_delimiter = 1, // ConfigurationError: no byte of the record was written
        io_error,              // sink reported a failure
        short_write,           // sink accepted fewer bytes than requested
    };

    enum class error_kind {
        none,
        configuration,
        io,
    };

    const std::error_category& error_category() noexcept;

    inline std::error_code make_error_code(errc e) noexcept {
        return { static_cast<int>(e), error_category() };
    }

    error_kind kind_of(const std::error_code& ec) noexcept;

    const char* to_string(error_kind k) noexcept;

} // namespace safecsv

namespace std {
    template <>
    struct is_error_code_enum<safecsv::errc> : true_type {};
} // namespace std
