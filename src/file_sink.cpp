// ============================================================================
// file_sink.cpp -- stdio and io_uring output backends
// ============================================================================
#include "file_sink.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#if GZROT_HAS_URING
  #include <liburing.h>
#endif

#include "log.hpp"

namespace gzrotate {

// ============================================================================
// StdioFileSink
// ============================================================================
class StdioFileSink final : public FileSink {
public:
  StdioFileSink(std::FILE* fp, std::size_t io_buffer_bytes) : fp_(fp) {
    if (io_buffer_bytes > 0) {
      buf_.resize(io_buffer_bytes);
      std::setvbuf(fp_, buf_.data(), _IOFBF, buf_.size());
    }
  }
  ~StdioFileSink() override { close(); }

  const char* name() const noexcept override { return "stdio"; }

  bool write(std::span<const uint8_t> data) override {
    if (!fp_) return false;
    if (data.empty()) return true;
    return std::fwrite(data.data(), 1, data.size(), fp_) == data.size();
  }

  bool flush() override {
    if (!fp_) return false;
    return std::fflush(fp_) == 0;
  }

  std::optional<uint64_t> size_on_disk() override {
    if (!fp_) return std::nullopt;
    struct stat st{};
    if (::fstat(::fileno(fp_), &st) != 0) return std::nullopt;
    return static_cast<uint64_t>(st.st_size);
  }

  bool close() override {
    if (!fp_) return true;
    bool ok = std::fflush(fp_) == 0;
    ok = (std::fclose(fp_) == 0) && ok;
    fp_ = nullptr;
    return ok;
  }

private:
  std::FILE*        fp_{nullptr};
  std::vector<char> buf_;
};

#if GZROT_HAS_URING
// ============================================================================
// UringFileSink
// Each write is copied into an owned slot so the caller can reuse its buffer
// immediately; slots are recycled as completions arrive.
// ============================================================================
class UringFileSink final : public FileSink {
public:
  UringFileSink(int fd, const SinkConfig& cfg)
  : fd_(fd), max_inflight_(cfg.max_inflight ? cfg.max_inflight : 1),
    slots_(max_inflight_) {
    for (unsigned i = 0; i < max_inflight_; ++i) free_.push_back(i);
    if (io_uring_queue_init(cfg.uring_qd, &ring_, 0) == 0) {
      ring_ok_ = true;
    }
  }
  ~UringFileSink() override { close(); }

  bool ready() const noexcept { return ring_ok_; }

  const char* name() const noexcept override { return "io_uring"; }

  bool write(std::span<const uint8_t> data) override {
    if (fd_ < 0) return false;
    if (data.empty()) return true;

    while (free_.empty()) {
      if (!reap_one()) return false;
    }
    io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    while (!sqe) {
      io_uring_submit(&ring_);
      if (inflight_ > 0 && !reap_one()) return false;
      sqe = io_uring_get_sqe(&ring_);
    }

    const unsigned slot = free_.back();
    free_.pop_back();
    auto& buf = slots_[slot];
    buf.assign(data.begin(), data.end());

    io_uring_prep_write(sqe, fd_, buf.data(), static_cast<unsigned>(buf.size()),
                        static_cast<off_t>(offset_));
    io_uring_sqe_set_data64(sqe, slot);
    offset_ += buf.size();

    if (io_uring_submit(&ring_) < 0) {
      free_.push_back(slot);
      return false;
    }
    ++inflight_;
    return true;
  }

  bool flush() override {
    if (fd_ < 0) return false;
    bool ok = !failed_;
    while (inflight_ > 0) {
      if (!reap_one()) ok = false;
    }
    failed_ = false;
    return ok;
  }

  std::optional<uint64_t> size_on_disk() override {
    if (fd_ < 0) return std::nullopt;
    struct stat st{};
    if (::fstat(fd_, &st) != 0) return std::nullopt;
    return static_cast<uint64_t>(st.st_size);
  }

  bool close() override {
    if (fd_ < 0) return true;
    bool ok = flush();
    if (ring_ok_) {
      io_uring_queue_exit(&ring_);
      ring_ok_ = false;
    }
    ok = (::close(fd_) == 0) && ok;
    fd_ = -1;
    return ok;
  }

private:
  /// Wait for one completion and recycle its slot.
  bool reap_one() {
    io_uring_cqe* cqe = nullptr;
    if (io_uring_wait_cqe(&ring_, &cqe) != 0) return false;
    const auto slot = static_cast<unsigned>(io_uring_cqe_get_data64(cqe));
    const bool ok = cqe->res >= 0
                    && static_cast<std::size_t>(cqe->res) == slots_[slot].size();
    io_uring_cqe_seen(&ring_, cqe);
    free_.push_back(slot);
    --inflight_;
    if (!ok) failed_ = true;
    return ok;
  }

  int      fd_{-1};
  io_uring ring_{};
  bool     ring_ok_{false};
  bool     failed_{false};
  unsigned max_inflight_;
  unsigned inflight_{0};
  uint64_t offset_{0};
  std::vector<std::vector<uint8_t>> slots_;
  std::vector<unsigned>             free_;
};
#endif

bool uring_available() noexcept {
#if GZROT_HAS_URING
  return true;
#else
  return false;
#endif
}

std::unique_ptr<FileSink> open_file_sink(const std::string& path,
                                         const SinkConfig& cfg) {
#if GZROT_HAS_URING
  if (cfg.use_io_uring) {
    int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) return nullptr;
    auto sink = std::make_unique<UringFileSink>(fd, cfg);
    if (sink->ready()) return sink;
    GZROT_WARN("ROT: io_uring setup failed, falling back to stdio\n");
    sink.reset();   // closes fd
  }
#endif
  std::FILE* fp = std::fopen(path.c_str(), "wb");
  if (!fp) return nullptr;
  return std::make_unique<StdioFileSink>(fp, cfg.io_buffer_bytes);
}

} // namespace gzrotate
