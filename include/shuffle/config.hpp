/**
 * @file config.hpp
 * @brief Configuration reader for shuffle options, with pluggable formats.
 *
 * Every format is flattened into "section + key = value" entries held by a
 * ConfigStore. Parsers are selected by backend tag at compile time:
 *   - IniBackend  : inih library   (SHUFFLE_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json  (SHUFFLE_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML         (SHUFFLE_CONFIG_YAML_ENABLED)
 *
 * Example (INI):
 * @code
 *   [bounded]
 *   segment_size = 32768
 *   read_ahead_segments = 4
 *   zero_copy = true
 *
 *   [log]
 *   level = info
 * @endcode
 *
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef SHUFFLE_CONFIG_HPP_
#define SHUFFLE_CONFIG_HPP_

#include "shuffle/platform.hpp"
#include "shuffle/vocabulary.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef SHUFFLE_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef SHUFFLE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef SHUFFLE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef SHUFFLE_CONFIG_MAX_FILE_SIZE
#define SHUFFLE_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace shuffle {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

class ConfigStore {
 public:
  // --- Getters with defaults ---

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  bool GetBool(const char* section, const char* key,
               bool default_val = false) const {
    auto v = FindBool(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  int64_t GetInt(const char* section, const char* key,
                 int64_t default_val = 0) const {
    auto v = FindInt(section, key);
    return v.has_value() ? v.value() : default_val;
  }

  double GetDouble(const char* section, const char* key,
                   double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    double val = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : val;
  }

  // --- Strict lookups: absent is empty, malformed is an error ---

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /// @brief Whole-string integer; trailing garbage is kInvalidValue.
  expected<optional<int64_t>, ConfigError> ParseInt(const char* section,
                                                    const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<optional<int64_t>, ConfigError>::success(
          optional<int64_t>());
    }
    errno = 0;
    char* end = nullptr;
    long long val = std::strtoll(e->value, &end, 10);
    if (end == e->value || *end != '\0' || errno == ERANGE) {
      return expected<optional<int64_t>, ConfigError>::error(
          ConfigError::kInvalidValue);
    }
    return expected<optional<int64_t>, ConfigError>::success(
        optional<int64_t>(static_cast<int64_t>(val)));
  }

  /// @brief true/false, yes/no, on/off, 1/0; anything else is kInvalidValue.
  expected<optional<bool>, ConfigError> ParseBool(const char* section,
                                                  const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<optional<bool>, ConfigError>::success(optional<bool>());
    }
    bool out = false;
    if (!ToBool(e->value, out)) {
      return expected<optional<bool>, ConfigError>::error(
          ConfigError::kInvalidValue);
    }
    return expected<optional<bool>, ConfigError>::success(optional<bool>(out));
  }

  optional<int64_t> FindInt(const char* section, const char* key) const {
    auto r = ParseInt(section, key);
    return r.has_value() ? r.value() : optional<int64_t>();
  }

  optional<bool> FindBool(const char* section, const char* key) const {
    auto r = ParseBool(section, key);
    return r.has_value() ? r.value() : optional<bool>();
  }

  uint32_t EntryCount() const noexcept { return count_; }

  /// @brief Insert or overwrite one entry.
  /// @return kBufferFull when the store has no room left.
  expected<void, ConfigError> Set(const char* section, const char* key,
                                  const char* value) {
    if (!AddEntry(section, key, value)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

 protected:
  static constexpr uint32_t kMaxEntries = 64;
  static constexpr uint32_t kMaxKeyLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxKeyLen);
    SafeCopy(e.key, key, kMaxKeyLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    SHUFFLE_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key))
        return &entries_[i];
    }
    return nullptr;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(const char* path,
                                                          char* buf,
                                                          uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr)
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    bool truncated = (bytes == buf_size - 1) && (std::fgetc(f) != EOF);
    std::fclose(f);
    if (truncated)
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(
        static_cast<uint32_t>(bytes));
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) {
      dst[0] = '\0';
      return;
    }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') {
      dst[i] = src[i];
      ++i;
    }
    dst[i] = '\0';
  }

  static bool ToBool(const char* str, bool& out) noexcept {
    if (detail::CaseEqual(str, "true") || detail::CaseEqual(str, "1") ||
        detail::CaseEqual(str, "yes") || detail::CaseEqual(str, "on")) {
      out = true;
      return true;
    }
    if (detail::CaseEqual(str, "false") || detail::CaseEqual(str, "0") ||
        detail::CaseEqual(str, "no") || detail::CaseEqual(str, "off")) {
      out = false;
      return true;
    }
    return false;
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend compiled out: format not supported. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                 uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef SHUFFLE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    Context ctx{&store, false};
    int result = ini_parse(path, Handler, &ctx);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    return Finish(ctx, result);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    Context ctx{&store, false};
    return Finish(ctx, ini_parse_string(data, Handler, &ctx));
  }

 private:
  struct Context {
    ConfigStore* store;
    bool full;
  };

  static expected<void, ConfigError> Finish(const Context& ctx, int result) {
    if (ctx.full)
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    if (result != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* ctx = static_cast<Context*>(user);
    if (!ctx->store->AddEntry(section ? section : "", name ? name : "",
                              value ? value : "")) {
      ctx->full = true;
      return 0;
    }
    return 1;
  }
};
#endif

#ifdef SHUFFLE_CONFIG_JSON_ENABLED
/// Objects become sections; top-level scalars land in section "".
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[SHUFFLE_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data, uint32_t) {
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = j.begin(); it != j.end(); ++it) {
      if (it->is_object()) {
        for (auto kit = it->begin(); kit != it->end(); ++kit) {
          if (!Add(store, it.key().c_str(), kit.key().c_str(), *kit))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else if (!Add(store, "", it.key().c_str(), *it)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const nlohmann::json& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      ConfigStore::SafeCopy(val, n.get_ref<const std::string&>().c_str(),
                            sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get<bool>() ? "true" : "false", sizeof(val));
    } else if (n.is_number_integer()) {
      std::snprintf(val, sizeof(val), "%lld",
                    static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      std::snprintf(val, sizeof(val), "%g", n.get<double>());
    } else {
      ConfigStore::SafeCopy(val, n.dump().c_str(), sizeof(val));
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

#ifdef SHUFFLE_CONFIG_YAML_ENABLED
/// Mappings become sections; top-level scalars land in section "".
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                               const char* path) {
    char buf[SHUFFLE_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                 const char* data,
                                                 uint32_t size) {
    std::string yaml_str(data, size);
    auto root = fkyaml::node::deserialize(yaml_str);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);

    for (auto it = root.begin(); it != root.end(); ++it) {
      auto sec = it.key().get_value<std::string>();
      auto& node = *it;
      if (node.is_mapping()) {
        for (auto kit = node.begin(); kit != node.end(); ++kit) {
          auto key = kit.key().get_value<std::string>();
          if (!Add(store, sec.c_str(), key.c_str(), *kit))
            return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      } else if (!Add(store, "", sec.c_str(), node)) {
        return expected<void, ConfigError>::error(ConfigError::kBufferFull);
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Add(ConfigStore& store, const char* section, const char* key,
                  const fkyaml::node& n) {
    char val[ConfigStore::kMaxValueLen];
    if (n.is_string()) {
      auto s = n.get_value<std::string>();
      ConfigStore::SafeCopy(val, s.c_str(), sizeof(val));
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(val, n.get_value<bool>() ? "true" : "false",
                            sizeof(val));
    } else if (n.is_integer()) {
      std::snprintf(val, sizeof(val), "%lld",
                    static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      std::snprintf(val, sizeof(val), "%g", n.get_value<double>());
    } else {
      val[0] = '\0';
    }
    return store.AddEntry(section, key, val);
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  /// @brief Parse @p path; the format follows the extension unless given.
  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    SHUFFLE_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                         ConfigFormat format) {
    SHUFFLE_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                           ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                             ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

#ifdef SHUFFLE_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef SHUFFLE_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef SHUFFLE_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

}  // namespace shuffle

#endif  // SHUFFLE_CONFIG_HPP_
