#include "csv2json/chunk_reader.hpp"
#include "csv2json/line_converter.hpp"
#include "csv2json/line_runner.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

struct Cli {
  bool header = false;
  bool failfast = false;
  bool verbose = false;
  std::size_t max_line_bytes = 4096;
  std::string input; // empty -> stdin
};

const char* kUsage =
  "Usage: csv2json [options...]\n"
  "\n"
  "Convert csv data from stdin into json\n"
  "\n"
  "Options:\n"
  "  -h, --help              Display this help and exit.\n"
  "  -i, --header            Read header line.\n"
  "      --failfast          Exit on error.\n"
  "      --max-line-bytes=N  Longest accepted input line (default 4096, 0 = no limit).\n"
  "      --input=PATH        Read PATH instead of stdin.\n"
  "  -v, --verbose           Debug log on stderr.\n";

// Returns false on a usage error (already reported).
bool parse_cli(int argc, char** argv, Cli& c) {
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    std::string v;
    if (a == "-i" || a == "--header") { c.header = true; continue; }
    if (a == "--failfast")            { c.failfast = true; continue; }
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (eat("--input=", &c.input)) continue;
    if (eat("--max-line-bytes=", &v)) {
      char* end = nullptr;
      errno = 0;
      const unsigned long long n = std::strtoull(v.c_str(), &end, 10);
      if (v.empty() || *end != '\0' || v[0] == '-' || errno == ERANGE) {
        std::cerr << "[csv2json] invalid --max-line-bytes: " << v << "\n";
        return false;
      }
      c.max_line_bytes = static_cast<std::size_t>(n);
      continue;
    }
    if (a == "-h" || a == "--help") {
      std::cerr << kUsage;
      std::exit(kExitOk);
    }
    std::cerr << "[csv2json] unknown option: " << a << "\n" << kUsage;
    return false;
  }
  return true;
}

}

int main(int argc, char** argv) {
  Cli cli;
  if (!parse_cli(argc, argv, cli)) return kExitUsage;

  std::ios::sync_with_stdio(false);

  c2j::ChunkReader::Config rcfg;
  rcfg.max_record_bytes = cli.max_line_bytes;
  auto reader = cli.input.empty()
      ? std::make_unique<c2j::ChunkReader>(stdin, rcfg)
      : std::make_unique<c2j::ChunkReader>(cli.input, rcfg);

  c2j::LineConverter conv;

  if (cli.header) {
    std::string_view line;
    if (!reader->read_next(line)) {
      if (!c2j::ok(reader->error())) {
        std::cerr << "[csv2json] read error: " << c2j::errc_name(reader->error()) << "\n";
        return kExitFailed;
      }
      return kExitOk; // no input, no header, nothing to do
    }
    const c2j::Errc e = conv.build_header(line);
    if (!c2j::ok(e)) {
      std::cerr << "[csv2json] header " << line << " " << c2j::errc_name(e) << "\n";
      return kExitFailed;
    }
    if (cli.verbose) {
      std::cerr << "[csv2json] header columns=" << conv.header()->size() << "\n";
    }
  }

  c2j::RunConfig cfg;
  cfg.exit_on_error = cli.failfast;
  cfg.verbose = cli.verbose;

  auto summary = c2j::run_lines(
      *reader,
      [&](std::string_view line, std::string& out){ return conv.convert(line, out); },
      std::cout, std::cerr, cfg);
  std::cout.flush();

  if (cli.verbose) {
    std::cerr << "[csv2json] done: lines=" << summary.lines
              << " rows=" << conv.rows()
              << " written=" << summary.written
              << " failed=" << summary.failed
              << " bytes=" << reader->bytes_read() << "\n";
  }
  return c2j::ok(summary.error) ? kExitOk : kExitFailed;
}
