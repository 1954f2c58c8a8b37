#include "device_registry.h"
#include "logger.h"
#include "utils.h"
#include <sstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace call_relay {

DeviceRegistry::DeviceRegistry(IAudioBackend& backend)
    : backend_(backend) {}

std::vector<DeviceInfo> DeviceRegistry::devices() const {
    return backend_.devices();
}

std::optional<int> DeviceRegistry::find_device(const std::string& name, DeviceDirection direction) const {
    for (const auto& info : backend_.devices()) {
        if (info.channels(direction) > 0 && utils::contains_ignore_case(info.name, name)) {
            return info.index;
        }
    }
    return std::nullopt;
}

DeviceHandle DeviceRegistry::default_handle(DeviceDirection direction, const std::vector<DeviceInfo>& all) const {
    DeviceHandle handle;
    handle.direction = direction;
    handle.is_default = true;

    int idx = backend_.default_device(direction);
    for (const auto& info : all) {
        if (info.index == idx) {
            handle.info = info;
            return handle;
        }
    }
    // No default reported: backend opens whatever it considers default
    handle.info.index = -1;
    handle.info.name = "system default";
    return handle;
}

DeviceHandle DeviceRegistry::resolve(const std::string& name, DeviceDirection direction) const {
    std::vector<DeviceInfo> all = backend_.devices();
    std::string wanted = utils::trim_copy(name);

    if (wanted.empty() || utils::normalize_copy(wanted) == "default") {
        DeviceHandle handle = default_handle(direction, all);
        LOG_DEVICE(std::string("Using default ") + direction_name(direction) +
                   " device: [" + std::to_string(handle.index()) + "] " + handle.info.name);
        return handle;
    }

    if (std::optional<int> idx = find_device(wanted, direction)) {
        for (const auto& info : all) {
            if (info.index != *idx) {
                continue;
            }
            DeviceHandle handle;
            handle.info = info;
            handle.direction = direction;
            handle.is_default = false;
            LOG_DEVICE(std::string("Using ") + direction_name(direction) + " device: [" +
                       std::to_string(info.index) + "] " + info.name);
            return handle;
        }
    }

    DeviceHandle handle = default_handle(direction, all);
    Logger::warn(std::string("[Device] No ") + direction_name(direction) + " device matches '" + wanted +
                 "'; falling back to default [" + std::to_string(handle.index()) + "] " + handle.info.name);
    return handle;
}

void DeviceRegistry::log_devices() const {
    auto all = backend_.devices();
    Logger::info("Available audio devices (" + std::to_string(all.size()) + "):");
    for (const auto& info : all) {
        std::ostringstream oss;
        oss << "  [" << info.index << "] " << info.name
            << " (in: " << info.max_input_channels
            << ", out: " << info.max_output_channels
            << ", " << info.default_sample_rate << " Hz)";
        Logger::info(oss.str());
    }
}

std::string devices_to_json(const std::vector<DeviceInfo>& devices) {
    json list = json::array();
    for (const auto& info : devices) {
        list.push_back({
            {"index", info.index},
            {"name", info.name},
            {"input_channels", info.max_input_channels},
            {"output_channels", info.max_output_channels},
            {"default_samplerate", info.default_sample_rate}
        });
    }
    json body;
    body["devices"] = list;
    return body.dump();
}

} // namespace call_relay
