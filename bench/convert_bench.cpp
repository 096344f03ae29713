#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

#include "csv2json/chunk_reader.hpp"
#include "csv2json/line_converter.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_csv(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "c2j_bench_synth.csv";
  std::ofstream out(p, std::ios::binary);
  // header
  for (size_t c = 0; c < cols; ++c) { out << "col" << c; if (c+1<cols) out << ","; }
  out << "\n";
  // rows: mix of float, int, plain text and quoted text
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      switch (c % 4) {
        case 0: out << (r%10) << "." << (c*37%1000); break;
        case 1: out << r; break;
        case 2: out << "name" << (r%97); break;
        default: out << "\"q, \"\"" << (r%13) << "\"\"\""; break;
      }
      if (c+1<cols) out << ",";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string csv_path;        // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  int iters = 3;
  bool header = true;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--csv") a.csv_path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--no-header") a.header = false;
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: c2j_bench_convert [--csv=path] [--rows=N] [--cols=M] [--iters=K] [--no-header]\n"
        "If --csv is omitted, a synthetic CSV is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_convert(const std::string& path, int iters, bool header) {
  std::cout << "\n[convert] file=" << path << " iters=" << iters
            << " header=" << (header ? "on" : "off") << "\n";
  for (int k=1;k<=iters;++k) {
    c2j::ChunkReader::Config rcfg;
    rcfg.max_record_bytes = 0;
    c2j::ChunkReader rd(path, rcfg);
    c2j::LineConverter conv;
    std::string out;
    std::uint64_t nrec=0, nerr=0, out_bytes=0;

    auto t0 = clk::now();
    std::string_view line;
    if (header && rd.read_next(line)) (void)conv.build_header(line);
    while (rd.read_next(line)) {
      if (c2j::ok(conv.convert(line, out))) { ++nrec; out_bytes += out.size() + 1; }
      else ++nerr;
    }
    auto t1 = clk::now();

    const double sec = std::chrono::duration<double>(t1-t0).count();
    const double mib = rd.bytes_read() / (1024.0*1024.0);
    std::cout << "  iter " << k
              << ": rows=" << nrec
              << " errors=" << nerr
              << " bytes_in=" << rd.bytes_read()
              << " bytes_out=" << out_bytes
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s"
              << "  rows/s=" << (nrec/sec) << "\n";
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string csv = a.csv_path;
  if (csv.empty() || !fs::exists(csv)) csv = make_synth_csv(a.rows, a.cols);
  bench_convert(csv, a.iters, a.header);
  return 0;
}
