#include "item_descriptor.hpp"

#include <cmath>

#include "log.hpp"

namespace docsync {

namespace {

bool read_bool(const nlohmann::json& raw, const char* key, bool& out, std::string& error) {
  auto it = raw.find(key);
  if(it == raw.end() || it->is_null()) return true;
  if(!it->is_boolean()) {
    error = fmt::format("{} must be a bool (got {})", key, it->type_name());
    return false;
  }
  out = it->get<bool>();
  return true;
}

bool read_time(const nlohmann::json& raw, const char* key, std::optional<WallTime>& out, std::string& error) {
  auto it = raw.find(key);
  if(it == raw.end() || it->is_null()) return true;
  if(!it->is_number()) {
    error = fmt::format("{} must be seconds since epoch (got {})", key, it->type_name());
    return false;
  }
  out = from_epoch_seconds(it->get<double>());
  return true;
}

bool read_percent(const nlohmann::json& raw, const char* key, std::optional<double>& out, std::string& error) {
  auto it = raw.find(key);
  if(it == raw.end() || it->is_null()) return true;
  if(!it->is_number()) {
    error = fmt::format("{} must be a number (got {})", key, it->type_name());
    return false;
  }
  out = it->get<double>();
  return true;
}

bool read_string(const nlohmann::json& raw, const char* key, std::string& out, std::string& error) {
  auto it = raw.find(key);
  if(it == raw.end() || it->is_null()) return true;
  if(!it->is_string()) {
    error = fmt::format("{} must be a string (got {})", key, it->type_name());
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool read_fields(const nlohmann::json& raw, TransferFields& out, std::string& error) {
  return read_percent(raw, "percentDownloaded", out.percent_downloaded, error) &&
         read_percent(raw, "percentUploaded", out.percent_uploaded, error) &&
         read_string(raw, "downloadError", out.download_error, error) &&
         read_string(raw, "uploadError", out.upload_error, error);
}

} // namespace

const char* to_string(DownloadState state) {
  switch(state) {
    case DownloadState::NotDownloaded: return "notDownloaded";
    case DownloadState::DownloadedStale: return "downloaded";
    case DownloadState::Current: return "current";
    case DownloadState::Unknown: return "unknown";
  }
  return "unknown";
}

DownloadState parse_download_state(const std::string& value) {
  if(value == "current") return DownloadState::Current;
  if(value == "downloaded") return DownloadState::DownloadedStale;
  if(value == "notDownloaded") return DownloadState::NotDownloaded;
  return DownloadState::Unknown;
}

double to_epoch_seconds(WallTime t) {
  using namespace std::chrono;
  return duration_cast<duration<double>>(t.time_since_epoch()).count();
}

WallTime from_epoch_seconds(double seconds) {
  using namespace std::chrono;
  auto ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
  return WallTime(duration_cast<system_clock::duration>(milliseconds(ms)));
}

bool map_item(const nlohmann::json& raw, ItemDescriptor& out, std::string& error, Logger* logger) {
  if(!raw.is_object()) {
    error = fmt::format("metadata record must be an object (got {})", raw.type_name());
    return false;
  }
  auto path_it = raw.find("relativePath");
  if(path_it == raw.end() || !path_it->is_string()) {
    error = fmt::format("relativePath is required and must be a string (got {})",
                        path_it == raw.end() ? "nothing" : path_it->type_name());
    return false;
  }

  ItemDescriptor item;
  item.relative_path = path_it->get<std::string>();
  if(!read_bool(raw, "isDirectory", item.is_directory, error)) return false;
  if(!item.relative_path.empty() && item.relative_path.back() == '/') {
    item.is_directory = true;
  }

  auto size_it = raw.find("sizeInBytes");
  if(size_it != raw.end() && !size_it->is_null()) {
    if(!size_it->is_number() || size_it->get<double>() < 0) {
      error = fmt::format("sizeInBytes must be a non-negative number (got {})", size_it->dump());
      return false;
    }
    item.size_in_bytes = static_cast<uint64_t>(std::llround(size_it->get<double>()));
  }

  if(!read_time(raw, "creationDate", item.creation_time, error)) return false;
  if(!read_time(raw, "contentChangeDate", item.content_change_time, error)) return false;

  auto status_it = raw.find("downloadStatus");
  if(status_it != raw.end() && !status_it->is_null()) {
    if(!status_it->is_string()) {
      error = fmt::format("downloadStatus must be a string (got {})", status_it->type_name());
      return false;
    }
    auto status = status_it->get<std::string>();
    item.download_state = parse_download_state(status);
    if(item.download_state == DownloadState::Unknown) {
      log_warn(logger, "Unknown download status '{}' for {}", status, item.relative_path);
    }
  }

  if(!read_bool(raw, "isDownloading", item.is_downloading, error)) return false;
  if(!read_bool(raw, "isUploading", item.is_uploading, error)) return false;
  if(!read_bool(raw, "isUploaded", item.is_uploaded, error)) return false;
  if(!read_bool(raw, "hasUnresolvedConflicts", item.has_unresolved_conflicts, error)) return false;

  TransferFields fields;
  if(!read_fields(raw, fields, error)) return false;

  out = std::move(item);
  return true;
}

TransferFields read_transfer_fields(const nlohmann::json& raw) {
  TransferFields fields;
  std::string error;
  if(!raw.is_object() || !read_fields(raw, fields, error)) return TransferFields();
  return fields;
}

ItemListing map_listing(const std::vector<nlohmann::json>& raw_results, Logger* logger) {
  ItemListing listing;
  listing.items.reserve(raw_results.size());
  for(std::size_t i = 0; i < raw_results.size(); ++i) {
    ItemDescriptor item;
    std::string error;
    if(map_item(raw_results[i], item, error, logger)) {
      listing.items.push_back(std::move(item));
    } else {
      log_debug(logger, "Skipping malformed metadata record #{}: {}", i, error);
      listing.invalid_entries.push_back(InvalidEntry{std::move(error), raw_results[i], i});
    }
  }
  return listing;
}

nlohmann::json to_json(const ItemDescriptor& item) {
  nlohmann::json j;
  j["relativePath"] = item.relative_path;
  j["isDirectory"] = item.is_directory;
  j["sizeInBytes"] = item.size_in_bytes ? nlohmann::json(*item.size_in_bytes) : nlohmann::json();
  j["creationDate"] = item.creation_time ? nlohmann::json(to_epoch_seconds(*item.creation_time)) : nlohmann::json();
  j["contentChangeDate"] = item.content_change_time
    ? nlohmann::json(to_epoch_seconds(*item.content_change_time))
    : nlohmann::json();
  j["downloadStatus"] = to_string(item.download_state);
  j["isDownloading"] = item.is_downloading;
  j["isUploading"] = item.is_uploading;
  j["isUploaded"] = item.is_uploaded;
  j["hasUnresolvedConflicts"] = item.has_unresolved_conflicts;
  return j;
}

nlohmann::json to_json(const InvalidEntry& entry) {
  return {{"error", entry.error}, {"index", entry.index}, {"raw", entry.raw}};
}

nlohmann::json to_json(const ItemListing& listing) {
  nlohmann::json files = nlohmann::json::array();
  for(const auto& item : listing.items) files.push_back(to_json(item));
  nlohmann::json invalid = nlohmann::json::array();
  for(const auto& entry : listing.invalid_entries) invalid.push_back(to_json(entry));
  return {{"files", files}, {"invalidEntries", invalid}};
}

} // namespace docsync
