#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <utility>

namespace kata {

// Identifiers starting with this prefix are private to trusted fragments.
extern const char *const kReservedPrefix;

bool isReservedName(const std::string &name);

// Append-only mapping from (salt, reserved name) to a fresh identifier. One
// instance lives for the whole process and is shared by every evaluation.
class ManglingCache {
public:
  ManglingCache();
  explicit ManglingCache(uint64_t seed);

  ManglingCache(const ManglingCache &) = delete;
  ManglingCache &operator=(const ManglingCache &) = delete;

  // Returns the mangled spelling of `name`, creating it on first use.
  std::string mangle(uint64_t salt, const std::string &name);
  uint64_t freshSalt();
  size_t size() const;

private:
  std::string freshName(const std::string &name);

  mutable std::mutex mutex_;
  std::map<std::pair<uint64_t, std::string>, std::string> names_;
  std::set<std::string> issued_;
  std::mt19937_64 random_;
};

} // namespace kata
