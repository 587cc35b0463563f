#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <iostream>
#include <string>
#include <vector>

#include "stream_ingest/pipeline.hpp"
#include "stream_ingest/positional_reader.hpp"
#include "stream_ingest/record_reassembler.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "si_bench_synth.txt";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      out << (r%10) << "." << (c*37%1000);
      if (c+1<cols) out << ",";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::size_t rows = 200'000;  // for synth
  std::size_t cols = 8;        // for synth
  std::vector<std::size_t> chunks{64, 512, 4096, 65536};
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--file") a.path = val;
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--chunk") a.chunks = {static_cast<std::size_t>(std::stoull(val))};
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: reassembly_bench [--file=path] [--rows=N] [--cols=M] [--chunk=BYTES] [--iters=K]\n"
        "If --file is omitted, a synthetic comma-delimited file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

// Reassembler alone: chunks are cut from an in-memory copy, no threads.
static void bench_feed(const std::string& data, std::size_t chunk, int iters) {
  for (int k=1;k<=iters;++k) {
    std::uint64_t nrec=0;
    si::RecordReassembler r({}, [&](const si::RecordView&, std::string*){ ++nrec; return true; });

    auto t0 = clk::now();
    for (std::size_t i = 0; i < data.size(); i += chunk)
      r.feed(std::string_view(data).substr(i, chunk));
    r.finish();
    auto t1 = clk::now();

    const double sec = std::chrono::duration<double>(t1-t0).count();
    const double mib = data.size() / (1024.0*1024.0);
    std::cout << "  feed  chunk=" << chunk << " iter " << k
              << ": rows=" << nrec
              << " carry_hw=" << r.carry_high_water()
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s"
              << "  rows/s=" << (nrec/sec) << "\n";
  }
}

// Full pipeline: pread producer thread + channel + reassembler.
static void bench_pipeline(const std::string& path, std::size_t chunk, int iters) {
  for (int k=1;k<=iters;++k) {
    si::LocalFileReader reader(path);
    si::IngestConfig cfg;
    cfg.chunk_bytes = chunk;
    cfg.digest = false;
    si::IngestPipeline pipeline(reader, cfg);
    si::CancelToken cancel;
    si::RunResult res = pipeline.run([](const si::RecordView&, std::string*){ return true; }, cancel);
    std::cout << "  pipe  chunk=" << chunk << " iter " << k
              << ": rows=" << res.stats.records
              << " chunks=" << res.stats.chunks
              << " time=" << res.stats.wall_ms / 1000.0 << "s"
              << "  throughput=" << res.stats.throughput_mb_s << " MiB/s"
              << "  rows/s=" << res.stats.records_per_sec << "\n";
  }
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth(a.rows, a.cols);

  std::ifstream in(path, std::ios::binary);
  std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  std::cout << "[REASSEMBLY] file=" << path << " bytes=" << data.size() << " iters=" << a.iters << "\n";

  for (std::size_t chunk : a.chunks) {
    bench_feed(data, chunk, a.iters);
    bench_pipeline(path, chunk, a.iters);
  }
  return 0;
}
