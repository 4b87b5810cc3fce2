#pragma once

#include <folly/Optional.h>
#include <migration/codec/Uuid.h>
#include <map>
#include <string>

namespace migration {

enum class SettingType : uint8_t { BOOLEAN, INTEGER, LONG, FLOAT, STRING };

/**
 * Application settings, identified by uuid. Values are exchanged in their
 * textual form and installed through the typed setters.
 */
class SettingsStore {
 public:
  virtual ~SettingsStore() = default;

  virtual std::map<Uuid, std::string> exportSettings() const = 0;

  /**
   * Returns the declared type of a setting, or none if the setting is
   * unknown to this store.
   */
  virtual folly::Optional<SettingType> settingType(
      const Uuid& settingId) const = 0;

  virtual void setBoolean(const Uuid& settingId, bool value) = 0;
  virtual void setInteger(const Uuid& settingId, int32_t value) = 0;
  virtual void setLong(const Uuid& settingId, int64_t value) = 0;
  virtual void setFloat(const Uuid& settingId, float value) = 0;
  virtual void setString(const Uuid& settingId, const std::string& value) = 0;

  virtual void save() = 0;
};

} // namespace migration
