#include <safecsv/error.h>

namespace safecsv {

    namespace {

        class SafecsvCategory final : public std::error_category {
        public:
            const char* name() const noexcept override { return "safecsv"; }

            std::string message(int ev) const override {
                switch (static_cast<errc>(ev)) {
                case errc::invalid_delimiter: return "invalid field delimiter";
                case errc::io_error:          return "write to underlying sink failed";
                case errc::short_write:       return "short write to underlying sink";
                }
                return "unknown safecsv error";
            }
        };

    } // namespace

    const std::error_category& error_category() noexcept {
        static const SafecsvCategory cat;
        return cat;
    }

    error_kind kind_of(const std::error_code& ec) noexcept {
        if (!ec) return error_kind::none;
        if (ec == errc::invalid_delimiter) return error_kind::configuration;
        return error_kind::io;
    }

    const char* to_string(error_kind k) noexcept {
        switch (k) {
        case error_kind::none:          return "none";
        case error_kind::configuration: return "configuration";
        case error_kind::io:            return "io";
        }
        return "?";
    }

} // namespace safecsv
