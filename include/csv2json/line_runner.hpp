#pragma once
#include "csv2json/errc.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace c2j {

class ChunkReader;

struct RunConfig {
  bool exit_on_error = false;  // stop at the first failing line
  bool verbose       = false;  // "[csv2json] ..." debug lines on the error stream
};

struct RunSummary {
  std::uint64_t lines   = 0;
  std::uint64_t written = 0;
  std::uint64_t failed  = 0;
  Errc error = Errc::Ok;  // set when the run stopped early or the reader failed
};

// Produces the output for one line, or an error.
using LineFunc = std::function<Errc(std::string_view line, std::string& out)>;

// Map every remaining line of `reader` through `fn`, writing each result and
// '\n' to `out`. A failing line is reported on `err` as
// "Line <n> <line> <ErrorName>" and skipped, or ends the run when
// cfg.exit_on_error is set. Lines are numbered from 1.
RunSummary run_lines(ChunkReader& reader, const LineFunc& fn,
                     std::ostream& out, std::ostream& err, const RunConfig& cfg);

}
