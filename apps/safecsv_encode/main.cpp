// apps/safecsv_encode/main.cpp
#include <iostream>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>
#include <memory>
#include <unistd.h>

#include <boost/asio/io_context.hpp>
#include <boost/program_options.hpp>

#include <safecsv/version.h>
#include <safecsv/error.h>
#include <safecsv/io/sink.h>
#include <safecsv/io/fd_sink.h>
#include <safecsv/policy/safety_policy.h>
#include <safecsv/writer/config.h>
#include <safecsv/writer/safe_writer.h>
#include <safecsv/writer/split.h>

using namespace safecsv;
using writer::Record;
using writer::SafeWriter;
namespace po = boost::program_options;

// Same rows the library's examples use: one formula-looking value per column.
static std::vector<Record> demo_records() {
    return {
        { "userId", "secret", "comment" },
        { "-21+63", "=A1", "foo, bar" },
        { "+42", "\tsecret", "\nplop" },
        { "123", "blablabla", "@foobar" },
    };
}

static int report(const char* what, const std::error_code& ec) {
    std::cerr << "error: " << what << " (" << to_string(kind_of(ec)) << "): " << ec.message() << "\n";
    return kind_of(ec) == error_kind::configuration ? 2 : 4;
}

static int run_demo(io::ByteSink& sink, const writer::WriterConfig& cfg) {
    struct Variant {
        const char* label;
        policy::SafetyPolicy p;
    };
    const Variant variants[] = {
        { "none", policy::no_safety() },
        { "force-quotes", policy::SafetyPolicy{ .force_quoting = true } },
        { "escape-all", policy::escape_all_characters() },
    };

    for (const auto& v : variants) {
        std::cerr << "# policy: " << v.label << "\n";
        SafeWriter w(sink, v.p, cfg);
        if (auto ec = w.write_all(demo_records()); ec) return report("demo write failed", ec);
        // Blank line between variants.
        if (auto ec = sink.write("\n"); ec) return report("demo write failed", ec);
    }
    return 0;
}

int main(int argc, char** argv) {
    std::string input = "-";
    std::string output;
    std::string policy_s = "full";
    std::string delim_s = ",";
    std::string in_sep_s = "\\t";

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "Show help")
        ("version,v", "Show version")
        ("input,i", po::value<std::string>(&input)->default_value(input), "Input file of separated lines ('-' = stdin)")
        ("output,o", po::value<std::string>(&output), "Output CSV file (default: stdout)")
        ("input-sep", po::value<std::string>(&in_sep_s)->default_value(in_sep_s), "Input field separator, one byte ('\\t' = tab)")
        ("policy,p", po::value<std::string>(&policy_s)->default_value(policy_s),
            "full | escape-all | none | comma list of force-quotes,equals,plus,minus,at,tab,line-feed")
        ("delimiter,d", po::value<std::string>(&delim_s)->default_value(delim_s),
            "Output delimiter: one character, or tab|comma|semicolon|pipe")
        ("crlf", "Terminate records with \\r\\n instead of \\n")
        ("demo", "Print the sample dataset under the none, force-quotes and escape-all policies")
        ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    }
    catch (const std::exception& e) {
        std::cerr << "arg error: " << e.what() << "\n\n" << desc << "\n";
        return 2;
    }

    if (vm.count("help")) {
        std::cout << "safecsv_encode " << safecsv::version() << "\n" << desc << "\n";
        return 0;
    }
    if (vm.count("version")) {
        std::cout << safecsv::version() << "\n";
        return 0;
    }

    policy::SafetyPolicy pol{};
    if (!policy::parse_policy(policy_s, pol)) {
        std::cerr << "error: invalid --policy '" << policy_s << "'\n";
        return 2;
    }

    writer::WriterConfig cfg{};
    if (!writer::parse_delimiter(delim_s, cfg.delimiter)) {
        std::cerr << "error: invalid --delimiter '" << delim_s << "'\n";
        return 2;
    }
    if (vm.count("crlf")) cfg.terminator = writer::LineTerminator::crlf;

    char in_sep = '\t';
    if (!writer::parse_input_separator(in_sep_s, in_sep)) {
        std::cerr << "error: --input-sep must be a single byte\n";
        return 2;
    }

    // Sink: a file through iostreams, or stdout through the descriptor sink.
    boost::asio::io_context ioc;
    std::ofstream ofs;
    std::unique_ptr<io::ByteSink> sink;
    if (!output.empty()) {
        ofs.open(output, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            std::cerr << "error: cannot open --output '" << output << "'\n";
            return 4;
        }
        sink = std::make_unique<io::OstreamSink>(ofs);
    }
    else {
        sink = std::make_unique<io::FdSink>(ioc, STDOUT_FILENO);
    }

    if (vm.count("demo")) return run_demo(*sink, cfg);

    std::ifstream ifs;
    std::istream* in = &std::cin;
    if (input != "-") {
        ifs.open(input, std::ios::binary);
        if (!ifs) {
            std::cerr << "error: cannot open --input '" << input << "'\n";
            return 3;
        }
        in = &ifs;
    }

    SafeWriter w(*sink, pol, cfg);
    std::error_code ec;
    {
        writer::ScopedFlush guard(w);
        std::string line;
        while (std::getline(*in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (ec = w.write(writer::split_fields(line, in_sep)); ec) break;
        }
    }
    if (!ec) ec = w.error();
    if (ec) return report("write failed", ec);

    if (in->bad()) {
        std::cerr << "error: read failure on input\n";
        return 3;
    }

    std::cerr << "wrote " << w.records_written() << " records (policy=" << policy::to_string(pol) << ")\n";
    return 0;
}
