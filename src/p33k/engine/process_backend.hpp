#pragma once

#include "engine/memory_reader.hpp"
#include "engine/region_catalog.hpp"
#include "engine/result.hpp"
#include "engine/types.hpp"
#include <memory>
#include <string_view>

namespace p33k::engine {

// everything the scanner needs from the operating system
class process_backend {
public:
  virtual ~process_backend() = default;

  virtual result<int> find_process(std::string_view name) const = 0;
  virtual result<process_identity> identity(int pid) const = 0;
  virtual result<std::unique_ptr<memory_reader>> open_reader(int pid) const = 0;
  virtual result<std::unique_ptr<region_catalog>> open_catalog(int pid) const = 0;
  virtual bool is_alive(int pid) const = 0;
};

// backend over the platform process layer (/proc on linux)
class native_process_backend final : public process_backend {
public:
  result<int> find_process(std::string_view name) const override;
  result<process_identity> identity(int pid) const override;
  result<std::unique_ptr<memory_reader>> open_reader(int pid) const override;
  result<std::unique_ptr<region_catalog>> open_catalog(int pid) const override;
  bool is_alive(int pid) const override;
};

} // namespace p33k::engine
