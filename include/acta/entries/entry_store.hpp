#pragma once

#include "acta/common/result.hpp"
#include "acta/common/time.hpp"
#include "acta/entries/entry.hpp"
#include "acta/entries/record_codec.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace acta::entries {

inline constexpr std::string_view kDayFileExtension = ".md";

[[nodiscard]] bool is_day_file_name(const std::string &name);

class EntryStore {
public:
  explicit EntryStore(std::filesystem::path data_dir, common::Clock clock = common::system_clock());

  [[nodiscard]] const std::filesystem::path &data_dir() const { return data_dir_; }

  [[nodiscard]] std::vector<Entry> list() const;

  [[nodiscard]] common::Result<Entry> add(const std::string &body,
                                          const std::vector<std::string> &tags);

  [[nodiscard]] common::Result<bool> update(const std::string &id, const std::string &body,
                                            const std::vector<std::string> &tags);

  [[nodiscard]] common::Result<bool> remove(const std::string &id);

private:
  struct Match {
    std::filesystem::path path;
    DecodedFile file;
    std::size_t index = 0;
  };

  [[nodiscard]] common::Status ensure_data_dir() const;
  [[nodiscard]] std::vector<std::filesystem::path> day_files() const;
  [[nodiscard]] std::optional<Match> find_entry(const std::string &id) const;

  std::filesystem::path data_dir_;
  common::Clock clock_;
  mutable std::mutex write_mutex_;
};

} // namespace acta::entries
