/**
 * @file config.hpp
 * @brief Sectioned key/value store filled from INI text by inih.
 *
 * Parsing is selected per format through ConfigParser<Format>. Only the INI
 * format has a parser, and only when built with SBENCH_CONFIG_INI_ENABLED;
 * otherwise loading reports ConfigError::kFormatNotSupported and the store
 * can still be filled programmatically with Set().
 *
 * Usage:
 * @code
 *   sbench::IniConfig ini;
 *   if (ini.LoadFile("stomp_bench.ini").has_value()) {
 *     int64_t n = ini.GetInt("load", "producers", 1);
 *   }
 * @endcode
 */

#ifndef SBENCH_CONFIG_HPP_
#define SBENCH_CONFIG_HPP_

#include "sbench/log.hpp"
#include "sbench/platform.hpp"
#include "sbench/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

#ifdef SBENCH_CONFIG_INI_ENABLED
#include <ini.h>
#endif

namespace sbench {

namespace detail {

inline char AsciiLower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool CaseEqual(const std::string& a, const char* b) noexcept {
  size_t i = 0U;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (AsciiLower(a[i]) != AsciiLower(b[i])) return false;
  }
  return i == a.size() && b[i] == '\0';
}

}  // namespace detail

// ============================================================================
// ConfigStore
// ============================================================================

/**
 * @brief Ordered (section, key, value) entries. Section and key lookups are
 *        case-insensitive; a later Set() of the same pair replaces the value
 *        in place.
 */
class ConfigStore {
 public:
  struct Entry {
    std::string section;
    std::string key;
    std::string value;
  };

  void Set(const char* section, const char* key, const char* value) {
    for (Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section) &&
          detail::CaseEqual(e.key, key)) {
        e.value = value;
        return;
      }
    }
    entries_.push_back(Entry{section, key, value});
  }

  const std::string* Find(const char* section, const char* key) const {
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section) &&
          detail::CaseEqual(e.key, key)) {
        return &e.value;
      }
    }
    return nullptr;
  }

  std::string GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const std::string* v = Find(section, key);
    return v != nullptr ? *v : std::string(default_val);
  }

  /// The whole value must be a base-10 integer within int64_t.
  optional<int64_t> FindInt(const char* section, const char* key) const {
    const std::string* v = Find(section, key);
    if (v == nullptr || v->empty()) return {};
    errno = 0;
    char* end = nullptr;
    const long long n = std::strtoll(v->c_str(), &end, 10);
    if (errno != 0 || *end != '\0') return {};
    return optional<int64_t>(static_cast<int64_t>(n));
  }

  int64_t GetInt(const char* section, const char* key,
                 int64_t default_val = 0) const {
    return FindInt(section, key).value_or(default_val);
  }

  /// Accepts true/false, yes/no, on/off and 1/0 in any case.
  optional<bool> FindBool(const char* section, const char* key) const {
    const std::string* v = Find(section, key);
    if (v == nullptr) return {};
    bool b = false;
    if (!ParseBool(*v, b)) return {};
    return optional<bool>(b);
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    return FindBool(section, key).value_or(default_val);
  }

  bool HasSection(const char* section) const {
    for (const Entry& e : entries_) {
      if (detail::CaseEqual(e.section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  size_t EntryCount() const noexcept { return entries_.size(); }
  const std::vector<Entry>& entries() const noexcept { return entries_; }
  void Clear() noexcept { entries_.clear(); }

  static bool ParseBool(const std::string& s, bool& out) noexcept {
    static const char* const kTrue[] = {"true", "yes", "on", "1"};
    static const char* const kFalse[] = {"false", "no", "off", "0"};
    for (const char* t : kTrue) {
      if (detail::CaseEqual(s, t)) {
        out = true;
        return true;
      }
    }
    for (const char* f : kFalse) {
      if (detail::CaseEqual(s, f)) {
        out = false;
        return true;
      }
    }
    return false;
  }

 private:
  std::vector<Entry> entries_;
};

// ============================================================================
// ConfigParser<Format>
// ============================================================================

/// Tag selecting the inih parser.
struct IniFormat {};

/** Formats without a parser compiled in refuse to load. */
template <typename Format>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseString(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef SBENCH_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniFormat> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    const int rc = ini_parse(path, &OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return Check(rc, path);
  }

  static expected<void, ConfigError> ParseString(ConfigStore& store,
                                                 const char* text) {
    return Check(ini_parse_string(text, &OnEntry, &store), "<string>");
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name,
                     const char* value) {
    static_cast<ConfigStore*>(user)->Set(section != nullptr ? section : "",
                                         name != nullptr ? name : "",
                                         value != nullptr ? value : "");
    return 1;
  }

  // inih: 0 on success, the first failing line number, or a negative code.
  static expected<void, ConfigError> Check(int rc, const char* origin) {
    if (rc == 0) return expected<void, ConfigError>::success();
    if (rc > 0) {
      SBENCH_LOG_ERROR("CONFIG", "%s:%d: malformed line", origin, rc);
    }
    return expected<void, ConfigError>::error(ConfigError::kParseError);
  }
};
#endif

// ============================================================================
// Config<Format>
// ============================================================================

/**
 * @brief A ConfigStore that loads itself through ConfigParser<Format>.
 *        Loading adds to (and overrides) what is already stored.
 */
template <typename Format>
class Config final : public ConfigStore {
 public:
  expected<void, ConfigError> LoadFile(const char* path) {
    SBENCH_ASSERT(path != nullptr);
    return ConfigParser<Format>::ParseFile(*this, path);
  }

  expected<void, ConfigError> LoadString(const char* text) {
    SBENCH_ASSERT(text != nullptr);
    return ConfigParser<Format>::ParseString(*this, text);
  }
};

using IniConfig = Config<IniFormat>;

inline constexpr bool IniConfigEnabled() noexcept {
#ifdef SBENCH_CONFIG_INI_ENABLED
  return true;
#else
  return false;
#endif
}

}  // namespace sbench

#endif  // SBENCH_CONFIG_HPP_
