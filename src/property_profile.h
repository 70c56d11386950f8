#pragma once

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace bacproxy {

/**
 * Which properties read_device_all fetches for each object type.
 *
 * Starts out with the built-in defaults. An XML profile may replace them:
 *
 *   <profile>
 *     <object type="*"><property name="object-name"/></object>
 *     <object type="analog-input"><property name="present-value"/></object>
 *   </profile>
 */
class PropertyProfile {
  public:
    static PropertyProfile &instance();

    PropertyProfile();

    PropertyProfile(const PropertyProfile &) = delete;
    PropertyProfile &operator=(const PropertyProfile &) = delete;

    // On failure the current profile is kept and false is returned.
    bool loadFromXml(const std::string &xmlPath);
    void resetToDefaults();

    // Properties common to every object first, then the type-specific ones.
    [[nodiscard]] std::vector<std::uint32_t> propertiesFor(std::uint16_t objectType) const;

  private:
    mutable std::shared_mutex mtx;
    std::vector<std::uint32_t> common;
    std::map<std::uint16_t, std::vector<std::uint32_t>> perType;
};

} // namespace bacproxy
