#include "kata/ManglingCache.h"

namespace kata {

const char *const kReservedPrefix = "__kata_";

bool isReservedName(const std::string &name) {
  return name.compare(0, std::char_traits<char>::length(kReservedPrefix), kReservedPrefix) == 0;
}

ManglingCache::ManglingCache() : random_(std::random_device{}()) {}

ManglingCache::ManglingCache(uint64_t seed) : random_(seed) {}

std::string ManglingCache::mangle(uint64_t salt, const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto key = std::make_pair(salt, name);
  auto it = names_.find(key);
  if (it != names_.end()) {
    return it->second;
  }
  std::string mangled = freshName(name);
  names_.emplace(std::move(key), mangled);
  return mangled;
}

uint64_t ManglingCache::freshSalt() {
  std::lock_guard<std::mutex> lock(mutex_);
  return random_();
}

size_t ManglingCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return names_.size();
}

// `_k<16 hex digits>_<name without prefix>`; never starts with the reserved
// prefix, so mangling an already mangled tree leaves it unchanged.
std::string ManglingCache::freshName(const std::string &name) {
  static const char *hex = "0123456789abcdef";
  std::string stem = isReservedName(name) ? name.substr(std::char_traits<char>::length(kReservedPrefix)) : name;
  while (true) {
    uint64_t bits = random_();
    std::string candidate = "_k";
    for (int shift = 60; shift >= 0; shift -= 4) {
      candidate.push_back(hex[(bits >> shift) & 0xF]);
    }
    candidate += "_" + stem;
    if (issued_.insert(candidate).second) {
      return candidate;
    }
  }
}

} // namespace kata
