#ifdef __linux__

#include "process_memory.hpp"
#include "process_memory_common.hpp"
#include "utils/hex_utils.hpp"
#include <redlog.hpp>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace p33k::engine::platform {

namespace {

std::string proc_path(int pid, const char* leaf) { return "/proc/" + std::to_string(pid) + "/" + leaf; }

// owns a read-only descriptor on /proc/<pid>/mem
class proc_memory_reader final : public memory_reader {
public:
  proc_memory_reader(int pid, int fd) : pid_(pid), fd_(fd) {}
  ~proc_memory_reader() override {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  proc_memory_reader(const proc_memory_reader&) = delete;
  proc_memory_reader& operator=(const proc_memory_reader&) = delete;

  result<std::vector<uint8_t>> read(uint64_t address, size_t size) const override {
    std::vector<uint8_t> buffer(size);
    if (size == 0) {
      return ok_result(buffer);
    }

    size_t done = 0;
    while (done < size) {
      ssize_t got = ::pread(fd_, buffer.data() + done, size - done, static_cast<off_t>(address + done));
      if (got < 0 && errno == EINTR) {
        continue;
      }
      if (got <= 0) {
        int err = got < 0 ? errno : 0;
        std::string message = "read failed at " + utils::format_address(address + done) + " (pid " +
                              std::to_string(pid_) + ")";
        if (err != 0) {
          message += ": ";
          message += std::strerror(err);
        } else {
          message += ": short read";
        }
        return error_result<std::vector<uint8_t>>(error_code::read_fault, message);
      }
      done += static_cast<size_t>(got);
    }
    return ok_result(std::move(buffer));
  }

private:
  int pid_ = 0;
  int fd_ = -1;
};

bool is_pid_name(const std::string& name) {
  return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string read_first_line(const std::string& path) {
  std::ifstream in(path);
  std::string line;
  if (in) {
    std::getline(in, line);
  }
  return line;
}

} // namespace

result<std::vector<memory_region>> parse_memory_map(std::istream& maps) {
  std::vector<memory_region> regions;
  std::string line;
  size_t line_number = 0;
  while (std::getline(maps, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }

    std::stringstream ss(line);
    uint64_t start = 0;
    uint64_t end = 0;
    char dash = 0;
    std::string perms_str;
    std::string offset_str;
    std::string dev_str;
    std::string inode_str;
    std::string path_str;

    ss >> std::hex >> start >> dash >> end >> perms_str >> offset_str >> dev_str >> inode_str;
    if (!ss || dash != '-' || perms_str.size() < 4 || start >= end) {
      return error_result<std::vector<memory_region>>(
          error_code::parse_error, "malformed maps line " + std::to_string(line_number)
      );
    }
    std::getline(ss, path_str);
    auto first = path_str.find_first_not_of(" \t");
    if (first != std::string::npos) {
      path_str.erase(0, first);
    } else {
      path_str.clear();
    }

    memory_region region;
    region.start = start;
    region.end = end;
    region.path = path_str;
    if (perms_str[0] == 'r') {
      region.protection = region.protection | memory_protection::read;
    }
    if (perms_str[1] == 'w') {
      region.protection = region.protection | memory_protection::write;
    }
    if (perms_str[2] == 'x') {
      region.protection = region.protection | memory_protection::execute;
    }
    region.is_private = perms_str[3] == 'p';
    region.is_system = is_system_region(region);
    regions.push_back(std::move(region));
  }

  return ok_result(std::move(regions));
}

result<std::vector<memory_region>> enumerate_regions(int pid) {
  std::ifstream maps(proc_path(pid, "maps"));
  if (!maps) {
    if (!process_exists(pid)) {
      return error_result<std::vector<memory_region>>(
          error_code::process_not_found, "no process with pid " + std::to_string(pid)
      );
    }
    return error_result<std::vector<memory_region>>(
        error_code::io_error, "failed to open " + proc_path(pid, "maps")
    );
  }
  return parse_memory_map(maps);
}

result<std::unique_ptr<memory_reader>> open_process_memory(int pid) {
  std::string path = proc_path(pid, "mem");
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    int err = errno;
    if (err == ENOENT || err == ESRCH) {
      return error_result<std::unique_ptr<memory_reader>>(
          error_code::process_not_found, "no process with pid " + std::to_string(pid)
      );
    }
    return error_result<std::unique_ptr<memory_reader>>(
        error_code::io_error, "failed to open " + path + ": " + std::strerror(err)
    );
  }
  return ok_result<std::unique_ptr<memory_reader>>(std::make_unique<proc_memory_reader>(pid, fd));
}

result<int> find_process(std::string_view name) {
  auto log = redlog::get_logger("p33k.platform");
  if (name.empty()) {
    return error_result<int>(error_code::invalid_argument, "process name is empty");
  }

  std::string wanted(name);

  std::vector<int> matches;
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
    std::string leaf = entry.path().filename().string();
    if (!is_pid_name(leaf)) {
      continue;
    }
    int pid = std::stoi(leaf);

    // exe is unreadable for kernel threads and for processes owned by other users
    std::error_code exe_ec;
    auto exe = std::filesystem::read_symlink(proc_path(pid, "exe"), exe_ec);
    std::string exe_name = exe.filename().string();
    std::optional<std::string_view> readable;
    std::string comm;
    if (exe_ec) {
      comm = read_first_line(proc_path(pid, "comm"));
    } else {
      readable = exe_name;
    }
    if (process_name_matches(wanted, readable, comm)) {
      matches.push_back(pid);
    }
  }
  if (ec) {
    return error_result<int>(error_code::io_error, "failed to list /proc: " + ec.message());
  }
  if (matches.empty()) {
    return error_result<int>(error_code::process_not_found, "no process named " + wanted);
  }

  std::sort(matches.begin(), matches.end());
  if (matches.size() > 1) {
    log.dbg("multiple processes match, using lowest pid", redlog::field("name", wanted),
            redlog::field("matches", matches.size()), redlog::field("pid", matches.front()));
  }
  return ok_result(matches.front());
}

result<process_identity> query_process(int pid) {
  std::string stat = read_first_line(proc_path(pid, "stat"));
  if (stat.empty()) {
    return error_result<process_identity>(error_code::process_not_found, "no process with pid " + std::to_string(pid));
  }

  // fields after the parenthesized comm; starttime is field 22 overall
  auto close_paren = stat.rfind(')');
  if (close_paren == std::string::npos) {
    return error_result<process_identity>(error_code::parse_error, "malformed stat for pid " + std::to_string(pid));
  }
  std::stringstream ss(stat.substr(close_paren + 1));
  std::string field;
  uint64_t start_time = 0;
  for (int index = 3; index <= 22 && ss >> field; ++index) {
    if (index == 22) {
      try {
        start_time = std::stoull(field);
      } catch (const std::exception&) {
        return error_result<process_identity>(
            error_code::parse_error, "malformed starttime for pid " + std::to_string(pid)
        );
      }
    }
  }

  process_identity identity;
  identity.pid = pid;
  identity.start_time = start_time;
  return ok_result(identity);
}

bool process_exists(int pid) {
  if (pid <= 0) {
    return false;
  }
  if (::kill(pid, 0) == 0) {
    return true;
  }
  return errno == EPERM;
}

} // namespace p33k::engine::platform

#endif // __linux__
