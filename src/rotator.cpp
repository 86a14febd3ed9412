// ============================================================================
// rotator.cpp -- implementation of the Rotator class
// ============================================================================
#include "rotator.hpp"

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <regex>
#include <stdexcept>

#include "block_scanner.hpp"
#include "log.hpp"

namespace fs = std::filesystem;

namespace gzrotate {

std::pair<std::string, std::string> split_prefix(const std::string& prefix) {
  const std::string ext = fs::path(prefix).extension().string();
  return { prefix.substr(0, prefix.size() - ext.size()), ext };
}

std::string format_timestamp(const std::string& layout,
                             std::chrono::system_clock::time_point tp,
                             bool local_time) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                    tp.time_since_epoch()).count() % 1000;
  char ms_buf[4];
  std::snprintf(ms_buf, sizeof(ms_buf), "%03d", static_cast<int>(ms));

  // Expand %L ourselves; everything else is left to strftime.
  std::string fmt;
  fmt.reserve(layout.size() + 8);
  for (std::size_t i = 0; i < layout.size(); ++i) {
    if (layout[i] == '%' && i + 1 < layout.size()) {
      if (layout[i + 1] == 'L') { fmt += ms_buf; ++i; continue; }
      fmt += layout[i];
      fmt += layout[++i];
      continue;
    }
    fmt += layout[i];
  }

  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_buf{};
  if (local_time) {
    localtime_r(&t, &tm_buf);
  } else {
    gmtime_r(&t, &tm_buf);
  }

  std::vector<char> out(64 + fmt.size() * 4);
  for (int attempt = 0; attempt < 4; ++attempt) {
    const std::size_t n = std::strftime(out.data(), out.size(), fmt.c_str(),
                                        &tm_buf);
    if (n > 0 || fmt.empty()) return std::string(out.data(), n);
    out.resize(out.size() * 4);
  }
  return std::string();
}

/// Escape regex metacharacters in a literal.
static std::string regex_escape(const std::string& s) {
  static const std::string meta = R"(\^$.|?*+()[]{})";
  std::string out;
  for (char c : s) {
    if (meta.find(c) != std::string::npos) out += '\\';
    out += c;
  }
  return out;
}

static int64_t now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
           std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// `Rotator` class
// ============================================================================
Rotator::Rotator(RotatorConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.max_files == 0) {
    throw std::invalid_argument("Rotator: max_files must be positive");
  }
}

Rotator::~Rotator() { finish(); }

std::string Rotator::next_filename() const {
  const auto [base, ext] = split_prefix(cfg_.file_prefix);
  const std::string ts = format_timestamp(cfg_.time_format,
                                          std::chrono::system_clock::now(),
                                          cfg_.local_time);
  char counter[32];
  std::snprintf(counter, sizeof(counter), "%06llu",
                static_cast<unsigned long long>(state_.file_counter));
  return base + "_" + counter + "_" + ts + ext + ".gz";
}

void Rotator::resume_existing() {
  const auto [base, ext] = split_prefix(cfg_.file_prefix);
  const fs::path base_path(base);
  const fs::path dir = base_path.parent_path();
  const fs::path scan_dir = dir.empty() ? fs::path(".") : dir;

  const std::regex re("^" + regex_escape(base_path.filename().string())
                      + R"(_(\d{6})_.*)" + regex_escape(ext) + R"(\.gz$)");

  std::error_code ec;
  if (!fs::exists(scan_dir, ec)) return;

  struct Found { std::string path; uint64_t counter; };
  std::vector<Found> found;

  for (fs::directory_iterator it(scan_dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (!it->is_regular_file(ec)) continue;
    const std::string name = it->path().filename().string();
    std::smatch m;
    if (!std::regex_match(name, m, re)) continue;
    const uint64_t counter = std::stoull(m[1].str());
    found.push_back({ dir.empty() ? name : (dir / name).string(), counter });
  }
  if (ec) {
    GZROT_ERROR("ROT: error reading directory %s: %s\n",
                scan_dir.string().c_str(), ec.message().c_str());
    return;
  }

  std::sort(found.begin(), found.end(),
            [](const Found& a, const Found& b){ return a.counter < b.counter; });

  if (found.size() > cfg_.max_files) {
    const std::size_t excess = found.size() - cfg_.max_files;
    for (std::size_t i = 0; i < excess; ++i) {
      std::error_code rm_ec;
      fs::remove(found[i].path, rm_ec);
      if (rm_ec) {
        GZROT_WARN("ROT: failed to delete excess file %s: %s\n",
                   found[i].path.c_str(), rm_ec.message().c_str());
      } else {
        GZROT_INFO("ROT: Deleted excess file: %s\n", found[i].path.c_str());
      }
    }
    found.erase(found.begin(), found.begin() + static_cast<std::ptrdiff_t>(excess));
  }

  state_.active_files.clear();
  for (const auto& f : found) state_.active_files.push_back(f.path);
  if (!found.empty()) {
    state_.file_counter = found.back().counter + 1;
    GZROT_INFO("ROT: Loaded %zu existing file(s), resuming from counter %llu\n",
               state_.active_files.size(),
               static_cast<unsigned long long>(state_.file_counter));
  }
}

void Rotator::open_file() {
  close_file();

  // Retention: make room for the file about to be created.
  while (state_.active_files.size() >= cfg_.max_files) {
    const std::string oldest = state_.active_files.front();
    state_.active_files.pop_front();
    std::error_code ec;
    fs::remove(oldest, ec);
    if (ec) {
      GZROT_WARN("ROT: failed to delete oldest file %s: %s\n",
                 oldest.c_str(), ec.message().c_str());
    } else {
      stats_.evictions.fetch_add(1, std::memory_order_relaxed);
      GZROT_INFO("ROT: Deleted oldest file: %s\n", oldest.c_str());
    }
  }

  const std::string path = next_filename();
  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      throw std::runtime_error("Rotator: failed to create output dir "
                               + parent.string() + ": " + ec.message());
    }
  }

  auto sink = open_file_sink(path, cfg_.sink);
  if (!sink) {
    throw std::runtime_error("Rotator: failed to create file " + path);
  }
  state_.current = std::make_unique<GzipWriter>(std::move(sink),
                                                cfg_.compression_level);
  state_.current_path = path;
  state_.active_files.push_back(path);
  ++state_.file_counter;
  stats_.files_opened.fetch_add(1, std::memory_order_relaxed);

  GZROT_INFO("ROT: Created new file: %s (counter: %llu, compression: %d, io: %s)\n",
             path.c_str(), static_cast<unsigned long long>(state_.file_counter),
             cfg_.compression_level, state_.current->sink().name());

  if (state_.header_captured && !state_.header.empty()) {
    if (!state_.current->write(state_.header)) {
      stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
      GZROT_ERROR("ROT: failed writing header to %s\n", path.c_str());
    } else {
      GZROT_INFO("ROT: Wrote %zu header bytes to file\n", state_.header.size());
    }
  }
}

void Rotator::close_file() {
  if (!state_.current) return;
  if (!state_.current->close()) {
    stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
    GZROT_ERROR("ROT: error closing %s\n", state_.current_path.c_str());
  }
  state_.current.reset();
  state_.current_path.clear();
}

void Rotator::rotate() {
  close_file();
  open_file();
  stats_.rotations.fetch_add(1, std::memory_order_relaxed);
}

void Rotator::capture_header(std::span<const uint8_t> data) {
  if (state_.header_captured || cfg_.header_bytes == 0) return;
  std::size_t n = cfg_.header_bytes;
  if (data.size() < n) {
    GZROT_ERROR("ROT: insufficient data to capture header: need %zu bytes, "
                "got %zu bytes\n", n, data.size());
    n = data.size();
  }
  state_.header.assign(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(n));
  state_.header_captured = true;
  GZROT_INFO("ROT: Captured %zu header bytes from stream\n", n);
}

bool Rotator::size_limit_reached() {
  if (!state_.current->flush()) {
    stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
    GZROT_ERROR("ROT: error flushing %s\n", state_.current_path.c_str());
  }
  const auto size = state_.current->sink().size_on_disk();
  if (!size) {
    stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
    GZROT_ERROR("ROT: error getting file stats for %s\n",
                state_.current_path.c_str());
    return false;
  }
  return *size >= cfg_.max_file_bytes;
}

void Rotator::write_current(std::span<const uint8_t> data) {
  if (data.empty()) return;
  if (!state_.current || !state_.current->write(data)) {
    stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
    GZROT_ERROR("ROT: error writing %zu bytes to %s\n", data.size(),
                state_.current_path.c_str());
  }
}

void Rotator::write_chunk(std::span<const uint8_t> data) {
  if (data.empty()) return;
  if (!state_.current) open_file();
  capture_header(data);
  stats_.bytes_in.fetch_add(data.size(), std::memory_order_relaxed);

  if (state_.rotating) {
    state_.pending.insert(state_.pending.end(), data.begin(), data.end());
    scan_pending();
    return;
  }

  if (!size_limit_reached()) {
    write_current(data);
    return;
  }

  if (!cfg_.block_format) {
    rotate();
    write_current(data);
    return;
  }

  state_.rotating  = true;
  state_.scan_from = 0;
  state_.pending.assign(data.begin(), data.end());
  scan_pending();
}

/// Look for the first validated block whose payload is fully buffered and cut
/// after it. Headers whose payload is still arriving are skipped; the earliest
/// of them is where the next scan restarts. Without a complete block, keep
/// buffering until the scan window is exhausted.
void Rotator::scan_pending() {
  const BlockFormat& fmt = *cfg_.block_format;
  const std::span<const uint8_t> buf(state_.pending);
  const int64_t now = now_seconds();

  std::optional<std::size_t> first_incomplete;
  std::size_t from = state_.scan_from;
  for (;;) {
    const std::size_t off = find_block_boundary(buf, fmt, cfg_.max_block_bytes,
                                                now, from);
    if (off >= buf.size()) break;

    const auto payload = validate_block_header(buf.subspan(off), fmt,
                                               cfg_.max_block_bytes, now);
    const uint64_t end = off + fmt.total_bytes + payload.value_or(0);
    if (end <= buf.size()) {
      cut_pending_at(static_cast<std::size_t>(end), false);
      return;
    }
    if (!first_incomplete) first_incomplete = off;
    from = off + 1;
  }

  if (first_incomplete) {
    state_.scan_from = *first_incomplete;
  } else {
    state_.scan_from = buf.size() >= fmt.total_bytes
                         ? buf.size() - fmt.total_bytes + 1 : 0;
  }

  if (buf.size() > cfg_.max_block_bytes + fmt.total_bytes) {
    GZROT_WARN("ROT: no complete block found in %zu bytes, forcing rotation\n",
               buf.size());
    cut_pending_at(buf.size(), true);
  }
}

void Rotator::cut_pending_at(std::size_t end, bool forced) {
  std::vector<uint8_t> pending;
  pending.swap(state_.pending);
  state_.rotating  = false;
  state_.scan_from = 0;

  const std::span<const uint8_t> buf(pending);
  write_current(buf.first(end));
  rotate();
  if (forced) stats_.forced_rotations.fetch_add(1, std::memory_order_relaxed);
  write_current(buf.subspan(end));
}

void Rotator::finish() {
  if (state_.rotating) {
    if (!state_.pending.empty()) {
      GZROT_INFO("ROT: Writing %zu held-back bytes before close\n",
                 state_.pending.size());
      write_current(state_.pending);
    }
    state_.pending.clear();
    state_.rotating  = false;
    state_.scan_from = 0;
  }
  close_file();
}

} // namespace gzrotate
