#include "utils.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace docsync {

std::string hex_from_bytes(const std::vector<unsigned char>& b) {
  std::ostringstream oss;
  for(auto c : b) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
  return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string& data) {
  std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
  return out;
}

std::string sha256_hex(const std::string& data) {
  return hex_from_bytes(sha256_bytes(data));
}

std::string sha256_file_hex(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return {};
  SHA256_CTX ctx;
  SHA256_Init(&ctx);
  std::vector<char> buffer(64 * 1024);
  while(in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = in.gcount();
    if(got > 0) SHA256_Update(&ctx, buffer.data(), static_cast<std::size_t>(got));
  }
  if(in.bad()) return {};
  std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
  SHA256_Final(digest.data(), &ctx);
  return hex_from_bytes(digest);
}

std::string normalize_relative_path(const std::string& input) {
  std::string out = input;
  out.erase(out.begin(), std::find_if(out.begin(), out.end(), [](unsigned char ch){ return !std::isspace(ch); }));
  out.erase(std::find_if(out.rbegin(), out.rend(), [](unsigned char ch){ return !std::isspace(ch); }).base(), out.end());
  while(!out.empty() && out.front() == '/') out.erase(out.begin());
  while(out.rfind("./", 0) == 0) out.erase(0, 2);
  if(out == ".") return "";
  return out;
}

std::string strip_trailing_slash(std::string path) {
  while(!path.empty() && path.back() == '/') path.pop_back();
  return path;
}

std::string relative_to(const std::filesystem::path& root, const std::filesystem::path& absolute) {
  auto root_str = root.lexically_normal().generic_string();
  auto abs_str = absolute.lexically_normal().generic_string();
  root_str = strip_trailing_slash(root_str);
  if(abs_str.compare(0, root_str.size(), root_str) != 0) return {};
  auto rest = abs_str.substr(root_str.size());
  while(!rest.empty() && rest.front() == '/') rest.erase(rest.begin());
  return rest;
}

std::vector<std::chrono::milliseconds> parse_schedule(const std::string& text, std::string& error) {
  std::vector<std::chrono::milliseconds> out;
  std::stringstream ss(text);
  std::string token;
  while(std::getline(ss, token, ',')) {
    token.erase(std::remove_if(token.begin(), token.end(), [](unsigned char ch){ return std::isspace(ch); }),
                token.end());
    if(token.empty()) continue;
    double seconds = 0;
    try {
      std::size_t used = 0;
      seconds = std::stod(token, &used);
      if(used != token.size()) throw std::invalid_argument(token);
    } catch(const std::exception&) {
      error = "invalid schedule entry '" + token + "'";
      return {};
    }
    if(seconds < 0) {
      error = "schedule entries must not be negative";
      return {};
    }
    out.emplace_back(static_cast<int64_t>(std::llround(seconds * 1000.0)));
  }
  if(out.empty()) error = "schedule is empty";
  return out;
}

std::string format_schedule(const std::vector<std::chrono::milliseconds>& schedule) {
  std::ostringstream oss;
  for(std::size_t i = 0; i < schedule.size(); ++i) {
    if(i > 0) oss << ",";
    auto ms = schedule[i].count();
    if(ms % 1000 == 0) {
      oss << ms / 1000;
    } else {
      oss << std::fixed << std::setprecision(3) << static_cast<double>(ms) / 1000.0;
    }
  }
  return oss.str();
}

} // namespace docsync
