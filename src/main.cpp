// ============================================================================
// `main.cpp` -- End-to-end driver for stdin → Reader → Processor → Rotator
//
// Usage:
//   some_producer | ./gzrotate --file_size KB --num_files N --file_prefix P
//                              [options] [--config config.toml]
//
//  - Parses and validates the configuration before touching the disk.
//  - Optionally adopts files left by a previous run (--resume_existing).
//  - Opens the first output file, then runs the reader and processor threads
//    until stdin is exhausted or a termination signal asks for a drain.
//  - Prints pipeline stats on exit unless --quiet or --stats=false.
// ============================================================================
#include <cstdio>
#include <exception>
#include <utility>
#include <unistd.h>

#include "block_format.hpp"
#include "chunk_processor.hpp"
#include "chunk_queue.hpp"
#include "config.hpp"
#include "file_sink.hpp"
#include "log.hpp"
#include "metrics.hpp"
#include "rotator.hpp"
#include "shutdown.hpp"
#include "stream_reader.hpp"

using gzrotate::ChunkProcessor;
using gzrotate::ChunkQueue;
using gzrotate::CancellationToken;
using gzrotate::Config;
using gzrotate::PipelineMetrics;
using gzrotate::ReaderConfig;
using gzrotate::Rotator;
using gzrotate::RotatorConfig;
using gzrotate::ShutdownCoordinator;
using gzrotate::StreamReader;

// ============================================================================
// Main
// ============================================================================
int main(int argc, char** argv) {
  if (argc < 2) {
    gzrotate::print_usage(stderr, argv[0]);
    return 0;
  }

  Config cfg;
  try {
    auto cl = gzrotate::parse_command_line(argc, argv);
    if (cl.help) {
      gzrotate::print_usage(stderr, argv[0]);
      return 0;
    }
    gzrotate::validate_config(cl.cfg);
    cfg = std::move(cl.cfg);
  } catch (const gzrotate::ConfigError& ex) {
    std::fprintf(stderr, "MAIN: Error: %s\n", ex.what());
    std::fprintf(stderr, "MAIN: Run '%s --help' for usage information\n", argv[0]);
    return 1;
  }

  gzrotate::log::set_quiet(cfg.QUIET);

  try {
    const RotatorConfig rcfg = gzrotate::make_rotator_config(cfg);

    if (rcfg.block_format) {
      GZROT_INFO("MAIN: Block header: %zu bytes, %zu fields, %s-endian\n",
                 rcfg.block_format->total_bytes,
                 rcfg.block_format->fields.size(),
                 gzrotate::to_string(rcfg.block_format->byte_order));
    }
    if (cfg.USE_IO_URING && !gzrotate::uring_available()) {
      GZROT_WARN("MAIN: io_uring requested but not built in, using stdio\n");
    }

    // ========================================================================
    // Signals are blocked here, before any pipeline thread exists, so every
    // thread inherits the mask and only the coordinator ever sees them.
    // ========================================================================
    CancellationToken token;
    ShutdownCoordinator shutdown(token);

    // ========================================================================
    // Rotator setup: resume, then open the first file eagerly so a bad
    // output path fails before any input is consumed.
    // ========================================================================
    Rotator rot(rcfg);
    if (cfg.RESUME_EXISTING) {
      rot.resume_existing();
    }
    rot.open_file();

    // ========================================================================
    // Pipeline: reader → queue → processor → rotator
    // ========================================================================
    ChunkQueue queue;
    PipelineMetrics metrics;

    ChunkProcessor proc(queue, rot, cfg.READ_BUFFER_SIZE);

    ReaderConfig rdcfg;
    rdcfg.fd                = STDIN_FILENO;
    rdcfg.read_buffer_bytes = cfg.READ_BUFFER_SIZE;
    StreamReader reader(queue, rdcfg, token);

    GZROT_INFO("MAIN: Starting pipeline (file size: %llu KB, files: %u, "
               "chunk: %zu bytes)\n",
               static_cast<unsigned long long>(cfg.FILE_SIZE_KB),
               cfg.NUM_FILES, cfg.READ_BUFFER_SIZE);

    shutdown.start();
    proc.start();
    reader.start();

    reader.join();
    proc.join();
    shutdown.stop();

    // ========================================================================
    // Stats
    // ========================================================================
    const auto& rs = reader.stats();
    const auto& ps = proc.stats();
    const auto& os = rot.stats();

    metrics.mark_read(rs.reads.load(), rs.bytes.load());
    metrics.mark_read_error(rs.read_errors.load());
    metrics.mark_proc(ps.chunks_in.load(), ps.chunks_written.load(),
                      ps.bytes_written.load());
    metrics.mark_files_opened(os.files_opened.load());
    metrics.mark_rotation(os.rotations.load());
    metrics.mark_forced_rotation(os.forced_rotations.load());
    metrics.mark_eviction(os.evictions.load());
    metrics.mark_io_error(os.io_errors.load());

    if (cfg.PRINT_STATS && !cfg.QUIET) {
      metrics.print(stderr);
    }

    if (proc.failed()) {
      std::fprintf(stderr, "MAIN: FATAL: output failed, stopped early\n");
      return 1;
    }

    GZROT_INFO("\nMAIN: Shutdown cleanly.\n");
    return 0;
  } catch (const std::exception& ex) {
    std::fprintf(stderr, "MAIN: FATAL: %s\n", ex.what());
    return 1;
  }
}
