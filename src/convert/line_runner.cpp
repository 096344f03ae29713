#include "csv2json/line_runner.hpp"
#include "csv2json/chunk_reader.hpp"

namespace c2j {

RunSummary run_lines(ChunkReader& reader, const LineFunc& fn,
                     std::ostream& out, std::ostream& err, const RunConfig& cfg) {
  RunSummary s;
  std::string result;
  std::string_view line;

  while (reader.read_next(line)) {
    ++s.lines;
    if (cfg.verbose) err << "[csv2json] line " << s.lines << ": " << line << "\n";

    const Errc e = fn(line, result);
    if (!ok(e)) {
      ++s.failed;
      if (cfg.verbose) err << "[csv2json] line " << s.lines << " failed: " << errc_name(e) << "\n";
      err << "Line " << s.lines << " " << line << " " << errc_name(e) << "\n";
      if (cfg.exit_on_error) { s.error = e; return s; }
      continue;
    }

    if (cfg.verbose) err << "[csv2json] line " << s.lines << " -> " << result << "\n";
    out << result << '\n';
    if (!out) {
      err << "Failed to write result, line " << s.lines << " " << line << " " << result << "\n";
      out.clear();
      ++s.failed;
      if (cfg.exit_on_error) { s.error = Errc::WriteFailed; return s; }
      continue;
    }
    ++s.written;
  }

  if (!ok(reader.error())) {
    err << "[csv2json] read error after line " << s.lines << ": " << errc_name(reader.error()) << "\n";
    s.error = reader.error();
  }
  return s;
}

}
