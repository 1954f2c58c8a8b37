#pragma once

#include "audio_backend.h"
#include <string>
#include <vector>
#include <optional>

namespace call_relay {

/**
 * @brief Resolves human-readable device names to handles
 *
 * Resolution happens once at startup; the registry itself keeps no state
 * beyond the backend pointer.
 */
class DeviceRegistry {
public:
    explicit DeviceRegistry(IAudioBackend& backend);

    /// Enumerated devices in platform order
    std::vector<DeviceInfo> devices() const;

    /**
     * @brief First device whose name contains `name` (case-insensitive)
     *        and which has channels in `direction`
     */
    std::optional<int> find_device(const std::string& name, DeviceDirection direction) const;

    /**
     * @brief Resolve a name to a handle; never fails
     *
     * Empty or "default" selects the system default. An unmatched name logs a
     * warning and falls back to the default. With no default either the handle
     * has index -1 and the backend picks.
     */
    DeviceHandle resolve(const std::string& name, DeviceDirection direction) const;

    /// Log the device listing (one line per device)
    void log_devices() const;

private:
    DeviceHandle default_handle(DeviceDirection direction, const std::vector<DeviceInfo>& all) const;

    IAudioBackend& backend_;
};

/**
 * @brief Device listing payload: {"devices": [{index, name, input_channels,
 *        output_channels, default_samplerate}]}
 */
std::string devices_to_json(const std::vector<DeviceInfo>& devices);

} // namespace call_relay
