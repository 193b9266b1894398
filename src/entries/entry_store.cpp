#include "acta/entries/entry_store.hpp"

#include "acta/common/fs.hpp"
#include "acta/common/random.hpp"
#include "acta/observability/global.hpp"

#include <algorithm>

namespace acta::entries {

namespace {

constexpr const char *kComponent = "entries";

std::string date_of(const std::filesystem::path &path) {
  return path.filename().string().substr(0, 10);
}

} // namespace

bool is_day_file_name(const std::string &name) {
  return name.size() == 10 + kDayFileExtension.size() && common::is_iso_date(name.substr(0, 10)) &&
         name.compare(10, std::string::npos, kDayFileExtension) == 0;
}

EntryStore::EntryStore(std::filesystem::path data_dir, common::Clock clock)
    : data_dir_(std::move(data_dir)), clock_(std::move(clock)) {
  if (!clock_) {
    clock_ = common::system_clock();
  }
}

common::Status EntryStore::ensure_data_dir() const {
  auto ensured = common::ensure_dir(data_dir_);
  if (!ensured.ok()) {
    return ensured.status();
  }
  return common::Status::success();
}

std::vector<std::filesystem::path> EntryStore::day_files() const {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  std::filesystem::directory_iterator it(data_dir_, ec);
  if (ec) {
    observability::record_error(kComponent, "cannot read " + data_dir_.string() + ": " +
                                                ec.message());
    return files;
  }
  for (const auto end = std::filesystem::directory_iterator(); it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    if (is_day_file_name(it->path().filename().string())) {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end(), [](const auto &a, const auto &b) {
    return a.filename().string() < b.filename().string();
  });
  return files;
}

std::optional<EntryStore::Match> EntryStore::find_entry(const std::string &id) const {
  for (const auto &path : day_files()) {
    auto text = common::read_text_file(path);
    if (!text.ok()) {
      continue;
    }
    DecodedFile file = decode_day_file(text.value(), date_of(path), path);
    if (const auto index = file.find(id); index.has_value()) {
      return Match{path, std::move(file), *index};
    }
  }
  return std::nullopt;
}

std::vector<Entry> EntryStore::list() const {
  if (auto status = ensure_data_dir(); !status.ok()) {
    observability::record_error(kComponent, status.error());
    return {};
  }

  std::vector<Entry> entries;
  for (const auto &path : day_files()) {
    auto text = common::read_text_file(path);
    if (!text.ok()) {
      observability::record_error(kComponent, text.error());
      continue;
    }
    auto file = decode_day_file(text.value(), date_of(path), path);
    for (auto &block : file.blocks) {
      entries.push_back(std::move(block.entry));
    }
  }

  std::stable_sort(entries.begin(), entries.end(), [](const Entry &a, const Entry &b) {
    return a.created_at_ms > b.created_at_ms;
  });
  return entries;
}

common::Result<Entry> EntryStore::add(const std::string &body,
                                      const std::vector<std::string> &tags) {
  const std::string clean_body = common::trim(body);
  if (clean_body.empty()) {
    return common::Result<Entry>::failure("entry body is empty", common::ErrorCode::Validation);
  }
  Entry entry;
  entry.tags = normalize_tags(tags);
  entry.body = common::normalize_newlines(clean_body);
  if (auto encodable = check_encodable(entry); !encodable.ok()) {
    return common::Result<Entry>::failure(encodable);
  }
  if (auto status = ensure_data_dir(); !status.ok()) {
    return common::Result<Entry>::failure(status);
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  const auto now = clock_();
  const std::string date = common::format_date(now);
  const auto path = data_dir_ / (date + std::string(kDayFileExtension));

  std::error_code ec;
  const bool exists = std::filesystem::exists(path, ec);
  if (ec) {
    return common::Result<Entry>::failure("cannot stat " + path.string() + ": " + ec.message(),
                                          common::ErrorCode::Io);
  }

  // The new block is written in the day file's own line-ending style.
  common::LineEnding ending = common::LineEnding::Lf;
  std::string prefix;
  if (exists) {
    const auto current = common::read_text_file(path);
    if (!current.ok()) {
      return common::Result<Entry>::failure(current.status());
    }
    ending = common::detect_line_ending(current.value());
    if (!current.value().empty() && current.value().back() != '\n') {
      prefix = "\n";
    }
  } else if (auto created = common::append_text_file(path, "# " + date + "\n\n"); !created.ok()) {
    return common::Result<Entry>::failure(created);
  }

  entry.id = common::random_uuid();
  entry.date = date;
  entry.created = exists ? common::format_date_time(now) : date;
  entry.created_at_ms = common::to_epoch_ms(now);
  entry.source_file = path;

  const std::string block = common::apply_line_ending(prefix + encode_entry_block(entry), ending);
  if (auto appended = common::append_text_file(path, block); !appended.ok()) {
    return common::Result<Entry>::failure(appended);
  }
  observability::record_entry_written("add", path.string(), entry.id);
  return common::Result<Entry>::success(std::move(entry));
}

common::Result<bool> EntryStore::update(const std::string &id, const std::string &body,
                                        const std::vector<std::string> &tags) {
  const std::string clean_body = common::trim(body);
  if (clean_body.empty()) {
    return common::Result<bool>::failure("entry body is empty", common::ErrorCode::Validation);
  }
  Entry changes;
  changes.body = common::normalize_newlines(clean_body);
  changes.tags = normalize_tags(tags);
  if (auto encodable = check_encodable(changes); !encodable.ok()) {
    return common::Result<bool>::failure(encodable);
  }
  if (auto status = ensure_data_dir(); !status.ok()) {
    return common::Result<bool>::failure(status);
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  auto match = find_entry(id);
  if (!match.has_value()) {
    return common::Result<bool>::success(false);
  }

  Entry updated = match->file.blocks[match->index].entry;
  updated.body = std::move(changes.body);
  updated.tags = std::move(changes.tags);

  auto written =
      common::write_text_file_atomic(match->path, replace_block(match->file, match->index, updated));
  if (!written.ok()) {
    return common::Result<bool>::failure(written);
  }
  observability::record_entry_written("update", match->path.string(), id);
  return common::Result<bool>::success(true);
}

common::Result<bool> EntryStore::remove(const std::string &id) {
  if (auto status = ensure_data_dir(); !status.ok()) {
    return common::Result<bool>::failure(status);
  }

  std::lock_guard<std::mutex> lock(write_mutex_);
  auto match = find_entry(id);
  if (!match.has_value()) {
    return common::Result<bool>::success(false);
  }

  auto written = common::write_text_file_atomic(match->path, remove_block(match->file, match->index));
  if (!written.ok()) {
    return common::Result<bool>::failure(written);
  }
  observability::record_entry_written("delete", match->path.string(), id);
  return common::Result<bool>::success(true);
}

} // namespace acta::entries
