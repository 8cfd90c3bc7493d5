#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <scrip/storage/rocksdb/storage.hpp>

namespace scrip::storage {

namespace {

ROCKSDB_NAMESPACE::Slice to_slice(const scrip::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

ROCKSDB_NAMESPACE::Slice to_slice(const std::string_view text) {
  return ROCKSDB_NAMESPACE::Slice{text.data(), text.size()};
}

scrip::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  auto begin = reinterpret_cast<const uint8_t*>(slice.data());
  return scrip::schema::bytes_t{begin, begin + slice.size()};
}

void check_format(ROCKSDB_NAMESPACE::DB& database,
                  const std::string_view path) {
  auto marker = std::string{};
  auto status = database.Get(ROCKSDB_NAMESPACE::ReadOptions{},
                             to_slice(kFormatMarkerKey), &marker);
  if (status.IsNotFound()) {
    auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
    write_options.sync = true;
    status = database.Put(write_options, to_slice(kFormatMarkerKey),
                          to_slice(kFormatMarker));
    if (!status.ok()) {
      scrip::common::critical("Failed to initialize state at {}: {}", path,
                              status.ToString());
    }
    spdlog::info("Initialized new state store at {}", path);
    return;
  }
  if (!status.ok()) {
    scrip::common::critical("Failed to read state format at {}: {}", path,
                            status.ToString());
  }
  if (marker != kFormatMarker) {
    scrip::common::critical("State at {} has format '{}', expected '{}'", path,
                            marker, kFormatMarker);
  }
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    scrip::common::critical("Failed to open RocksDB at {}: {}", path,
                            status.ToString());
  }
  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(database);
  check_format(*store.database, path);
  spdlog::debug("Opened RocksDB state at {}", path);
  return store;
}

std::optional<std::string> storage<rocksdb_storage_tag>::get_raw(
    const scrip::schema::bytes_view_t& key) const {
  if (!database) {
    scrip::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    scrip::common::critical("Failed to read key {}: {}",
                            scrip::schema::to_hex(key), status.ToString());
  }
  return value;
}

void storage<rocksdb_storage_tag>::erase(
    const scrip::schema::bytes_view_t& key) const {
  auto writes = write_set{};
  writes.deletes.emplace_back(std::begin(key), std::end(key));
  write(writes);
}

void storage<rocksdb_storage_tag>::write(const write_set& writes) const {
  if (!database) {
    scrip::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : writes.deletes) {
    if (auto status = batch.Delete(to_slice(scrip::schema::make_bytes_view(key)));
        !status.ok()) {
      scrip::common::critical("Failed to stage delete: {}", status.ToString());
    }
  }
  for (const auto& [key, value] : writes.puts) {
    if (auto status =
            batch.Put(to_slice(scrip::schema::make_bytes_view(key)),
                      to_slice(scrip::schema::make_bytes_view(value)));
        !status.ok()) {
      scrip::common::critical("Failed to stage put: {}", status.ToString());
    }
  }

  // Claims must be durable before any credit is attempted.
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  if (auto status = database->Write(write_options, &batch); !status.ok()) {
    scrip::common::critical("Failed to commit {} put(s) and {} delete(s): {}",
                            writes.puts.size(), writes.deletes.size(),
                            status.ToString());
  }
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const scrip::schema::bytes_view_t& prefix) const {
  if (!database) {
    scrip::common::critical("RocksDB database is not initialized");
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = to_slice(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.emplace_back(to_bytes(iterator->key()),
                         to_bytes(iterator->value()));
  }
  if (!iterator->status().ok()) {
    scrip::common::critical("RocksDB prefix scan failed: {}",
                            iterator->status().ToString());
  }
  return entries;
}

}  // namespace scrip::storage
