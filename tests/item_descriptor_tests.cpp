#include "item_descriptor.hpp"
#include "test_runner_utils.hpp"

#include <cmath>

namespace docsync::test {

namespace {

nlohmann::json valid_record(const std::string& path) {
  return {
    {"relativePath", path},
    {"isDirectory", false},
    {"sizeInBytes", 42},
    {"creationDate", 1700000000.0},
    {"contentChangeDate", 1700000100.5},
    {"downloadStatus", "current"},
    {"isDownloading", false},
    {"isUploading", true},
    {"isUploaded", false},
    {"hasUnresolvedConflicts", false},
    {"percentDownloaded", 100},
    {"percentUploaded", 35.5}
  };
}

bool test_maps_complete_record(TestContext& ctx) {
  ItemDescriptor item;
  std::string error;
  bool ok = expect(map_item(valid_record("notes/today.md"), item, error, ctx.logger.get()), "record maps: " + error);
  ok &= expect(item.relative_path == "notes/today.md", "relative path");
  ok &= expect(item.size_in_bytes && *item.size_in_bytes == 42, "size");
  ok &= expect(item.download_state == DownloadState::Current, "download state");
  ok &= expect(item.is_uploading && !item.is_uploaded, "upload flags");
  ok &= expect(item.content_change_time &&
               std::abs(to_epoch_seconds(*item.content_change_time) - 1700000100.5) < 0.001,
               "content change time");

  auto fields = read_transfer_fields(valid_record("x"));
  ok &= expect(fields.percent_uploaded && *fields.percent_uploaded == 35.5, "percent uploaded");
  ok &= expect(fields.download_error.empty(), "no download error");
  return ok;
}

bool test_rejects_malformed_records(TestContext& ctx) {
  ItemDescriptor item;
  std::string error;
  bool ok = expect(!map_item(nlohmann::json::array({1, 2}), item, error, ctx.logger.get()), "array is malformed");

  auto missing_path = valid_record("a");
  missing_path.erase("relativePath");
  error.clear();
  ok &= expect(!map_item(missing_path, item, error, ctx.logger.get()), "missing path is malformed");
  ok &= expect(error.find("relativePath") != std::string::npos, "error names the field");

  auto bad_size = valid_record("a");
  bad_size["sizeInBytes"] = "12";
  ok &= expect(!map_item(bad_size, item, error, ctx.logger.get()), "string size is malformed");

  auto bad_flag = valid_record("a");
  bad_flag["isUploaded"] = 1;
  ok &= expect(!map_item(bad_flag, item, error, ctx.logger.get()), "numeric flag is malformed");

  nlohmann::json text_percent = {{"relativePath", "a.bin"}, {"percentDownloaded", "50"}};
  ok &= expect(!map_item(text_percent, item, error, ctx.logger.get()), "text percentage is malformed");
  ok &= expect(error.find("percentDownloaded") != std::string::npos, "error names the percentage: " + error);

  nlohmann::json numeric_error = {{"relativePath", "a.bin"}, {"downloadError", 42}};
  ok &= expect(!map_item(numeric_error, item, error, ctx.logger.get()), "numeric download error is malformed");
  ok &= expect(error.find("downloadError") != std::string::npos, "error names the download error: " + error);

  auto bad_upload = valid_record("a");
  bad_upload["percentUploaded"] = false;
  ok &= expect(!map_item(bad_upload, item, error, ctx.logger.get()), "bool upload percentage is malformed");
  bad_upload["percentUploaded"] = nullptr;
  bad_upload["uploadError"] = nlohmann::json::array({"quota"});
  ok &= expect(!map_item(bad_upload, item, error, ctx.logger.get()), "array upload error is malformed");
  ok &= expect(error.find("uploadError") != std::string::npos, "error names the upload error: " + error);

  auto fields = read_transfer_fields(numeric_error);
  ok &= expect(!fields.percent_downloaded && fields.download_error.empty(), "rejected record has no transfer fields");
  return ok;
}

bool test_listing_reports_mistyped_transfer_fields(TestContext& ctx) {
  std::vector<nlohmann::json> records;
  records.push_back(valid_record("good.txt"));
  records.push_back(nlohmann::json{{"relativePath", "a.bin"}, {"percentDownloaded", "50"}});
  records.push_back(nlohmann::json{{"relativePath", "b.bin"}, {"downloadError", 42}});
  auto listing = map_listing(records, ctx.logger.get());
  bool ok = expect(listing.items.size() == 1, "only the well-typed record is listed");
  ok &= expect(listing.invalid_entries.size() == 2, "both mistyped records are diagnostics");
  if(listing.invalid_entries.size() == 2) {
    ok &= expect(listing.invalid_entries[0].index == 1 && listing.invalid_entries[1].index == 2, "indices kept");
    ok &= expect(listing.invalid_entries[1].error.find("downloadError") != std::string::npos,
                 "diagnostic names the field");
  }
  return ok;
}

bool test_unknown_download_status_is_kept(TestContext& ctx) {
  auto record = valid_record("a.txt");
  record["downloadStatus"] = "evicted";
  ItemDescriptor item;
  std::string error;
  bool ok = expect(map_item(record, item, error, ctx.logger.get()), "record still maps");
  ok &= expect(item.download_state == DownloadState::Unknown, "state is unknown");
  ok &= expect(ctx.logs.count_substring("Unknown download status 'evicted'") == 1, "warning logged");
  return ok;
}

bool test_listing_isolates_malformed_entry(TestContext& ctx) {
  std::vector<nlohmann::json> records;
  for(int i = 0; i < 100; ++i) {
    records.push_back(valid_record("file" + std::to_string(i) + ".txt"));
  }
  records.insert(records.begin() + 57, nlohmann::json{{"relativePath", 7}});

  auto listing = map_listing(records, ctx.logger.get());
  bool ok = expect(listing.items.size() == 100, "all valid items listed");
  ok &= expect(listing.invalid_entries.size() == 1, "one diagnostic");
  if(listing.invalid_entries.size() == 1) {
    ok &= expect(listing.invalid_entries[0].index == 57, "diagnostic keeps its index");
    ok &= expect(listing.invalid_entries[0].raw["relativePath"] == 7, "diagnostic keeps the raw record");
  }

  auto j = to_json(listing);
  ok &= expect(j["files"].size() == 100 && j["invalidEntries"].size() == 1, "json shape");
  ok &= expect(j["files"][0]["relativePath"] == "file0.txt", "json keeps store order");
  return ok;
}

bool test_trailing_slash_marks_directory(TestContext& ctx) {
  ItemDescriptor item;
  std::string error;
  nlohmann::json record = {{"relativePath", "photos/"}};
  bool ok = expect(map_item(record, item, error, ctx.logger.get()), "maps");
  ok &= expect(item.is_directory, "directory");
  ok &= expect(!item.size_in_bytes, "no size");
  return ok;
}

} // namespace

std::vector<TestCase> item_descriptor_tests() {
  return {
    {"item_maps_complete_record", test_maps_complete_record},
    {"item_rejects_malformed_records", test_rejects_malformed_records},
    {"item_unknown_download_status_is_kept", test_unknown_download_status_is_kept},
    {"item_listing_isolates_malformed_entry", test_listing_isolates_malformed_entry},
    {"item_listing_reports_mistyped_transfer_fields", test_listing_reports_mistyped_transfer_fields},
    {"item_trailing_slash_marks_directory", test_trailing_slash_marks_directory},
  };
}

} // namespace docsync::test
