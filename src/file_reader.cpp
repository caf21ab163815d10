#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>

namespace {
class Mapping {
public:
  Mapping(void* p, size_t n) : p_(p), n_(n) {}
  Mapping(const Mapping&) = delete;
  Mapping& operator=(const Mapping&) = delete;
  ~Mapping() { if (p_ != MAP_FAILED) ::munmap(p_, n_); }
  bool ok() const { return p_ != MAP_FAILED; }
  const char* data() const { return static_cast<const char*>(p_); }
private:
  void* p_;
  size_t n_;
};
}

static void push_line(std::vector<std::string>& out, const char* data, size_t start, size_t end) {
  if (end > start && data[end - 1] == '\r') end--;
  out.emplace_back(data + start, end - start);
}

bool mmapReadLines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = std::string("not a regular file: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) { out_lines.emplace_back(""); msg = std::string("opened file: ") + path.string(); return true; }
  Mapping map(::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0), n);
  if (!map.ok()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  const char* data = map.data();
  (void)::madvise(const_cast<char*>(data), n, MADV_SEQUENTIAL);
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') { push_line(out_lines, data, start, i); start = i + 1; }
  }
  if (start < n) push_line(out_lines, data, start, n);
  if (out_lines.empty()) out_lines.emplace_back("");
  msg = std::string("opened file: ") + path.string();
  return true;
}
