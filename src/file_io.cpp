#include "file_io.hpp"
#include "config.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <glog/logging.h>

bool mmap_read_text(const std::filesystem::path& path, std::string& out, std::string& msg) {
  out.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { msg = std::string("opened file: ") + path.string(); return true; }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);

  out.reserve(n);
  for (size_t i = 0; i < n; ++i) {
    // CRLF -> LF
    if (data[i] == '\r' && i + 1 < n && data[i + 1] == '\n') continue;
    out.push_back(data[i]);
  }
  ::munmap(mem, n);
  msg = std::string("opened file: ") + path.string();
  return true;
}

bool write_file_atomic(const std::filesystem::path& path, std::string_view data, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    LOG(WARNING) << msg;
    return false;
  }
  // the temporary never outlives a failed write
  auto fail = [&](const std::string& what, int err) {
    msg = std::string("write file failed: ") + what;
    LOG(WARNING) << msg << ": " << std::strerror(err);
    ufd.reset();
    ::unlink(tmp.string().c_str());
    return false;
  };
  const char* p = data.data();
  size_t remain = data.size();
  while (remain > 0) {
    size_t chunk = std::min<size_t>(remain, TB_WRITE_CHUNK_SIZE);
    ssize_t w = ::write(ufd.get(), p, chunk);
    if (w < 0) {
      if (errno == EINTR) continue;
      return fail(tmp.string(), errno);
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail(tmp.string(), errno);
#else
  if (::fdatasync(ufd.get()) != 0) return fail(tmp.string(), errno);
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) return fail(path.string(), ec.value());
  msg = std::string("saved file: ") + path.string();
  return true;
}
