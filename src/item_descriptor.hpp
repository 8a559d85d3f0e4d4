#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace docsync {

class Logger;

enum class DownloadState {
  NotDownloaded,
  DownloadedStale,
  Current,
  Unknown
};

const char* to_string(DownloadState state);
// Maps the store's downloadStatus strings; anything unrecognised is Unknown.
DownloadState parse_download_state(const std::string& value);

using WallTime = std::chrono::system_clock::time_point;

// Immutable snapshot of one item as the index currently reports it.
struct ItemDescriptor {
  std::string relative_path;
  bool is_directory = false;
  std::optional<uint64_t> size_in_bytes;
  std::optional<WallTime> creation_time;
  std::optional<WallTime> content_change_time;
  DownloadState download_state = DownloadState::Unknown;
  bool is_downloading = false;
  bool is_uploading = false;
  bool is_uploaded = false;
  bool has_unresolved_conflicts = false;
};

// A raw record that could not be mapped, kept for diagnosis.
struct InvalidEntry {
  std::string error;
  nlohmann::json raw;
  std::size_t index = 0;
};

struct ItemListing {
  std::vector<ItemDescriptor> items;
  std::vector<InvalidEntry> invalid_entries;
};

// Transfer fields of a raw record that are not part of the descriptor.
// Empty for a record map_item rejects.
struct TransferFields {
  std::optional<double> percent_downloaded;
  std::optional<double> percent_uploaded;
  std::string download_error;
  std::string upload_error;
};

bool map_item(const nlohmann::json& raw, ItemDescriptor& out, std::string& error, Logger* logger = nullptr);
TransferFields read_transfer_fields(const nlohmann::json& raw);
ItemListing map_listing(const std::vector<nlohmann::json>& raw_results, Logger* logger = nullptr);

nlohmann::json to_json(const ItemDescriptor& item);
nlohmann::json to_json(const InvalidEntry& entry);
nlohmann::json to_json(const ItemListing& listing);

double to_epoch_seconds(WallTime t);
WallTime from_epoch_seconds(double seconds);

} // namespace docsync
