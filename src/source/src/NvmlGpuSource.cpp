/**
 * @file NvmlGpuSource.cpp
 * @brief GPU telemetry collection via NVML.
 * @note Queries utilization, power draw and limit, and GPU temperature per device.
 */

#include "src/source/inc/NvmlGpuSource.hpp"

#include <array>   // std::array
#include <utility> // std::move
#include <vector>  // std::vector

#include <fmt/core.h>

#include "src/source/inc/compat_nvml_detect.hpp"

namespace gpumon {

namespace source {

namespace {

#if COMPAT_NVML_AVAILABLE

constexpr double BYTES_PER_MIB = 1024.0 * 1024.0;

/// Format an NVML return code for diagnostics.
std::string nvmlError(const char* call, nvmlReturn_t rc) {
  return fmt::format("{} failed: {}", call, nvmlErrorString(rc));
}

/// Query one device's telemetry via NVML. Returns nullopt values for unsupported queries.
QueryOutcome queryNvmlDevice(nvmlDevice_t device, const std::string& uuid) {
  RawDeviceReading reading{};
  reading.id = uuid;
  bool any = false;
  nvmlReturn_t lastError = NVML_SUCCESS;

  // Device name
  std::array<char, NVML_DEVICE_NAME_V2_BUFFER_SIZE> name{};
  if (nvmlDeviceGetName(device, name.data(), static_cast<unsigned int>(name.size())) ==
      NVML_SUCCESS) {
    reading.name = name.data();
  } else {
    reading.name = uuid;
  }

  // Utilization
  nvmlUtilization_t util{};
  nvmlReturn_t rc = nvmlDeviceGetUtilizationRates(device, &util);
  if (rc == NVML_SUCCESS) {
    reading.gpuUtilPct = static_cast<double>(util.gpu);
    reading.memUtilPct = static_cast<double>(util.memory);
    any = true;
  } else if (rc != NVML_ERROR_NOT_SUPPORTED) {
    lastError = rc;
  }

  // Power (milliwatts)
  unsigned int power = 0;
  rc = nvmlDeviceGetPowerUsage(device, &power);
  if (rc == NVML_SUCCESS) {
    reading.powerDrawW = static_cast<double>(power) / 1000.0;
    any = true;
  } else if (rc != NVML_ERROR_NOT_SUPPORTED) {
    lastError = rc;
  }

  // Rated maximum: upper power-management constraint, else the enforced limit.
  unsigned int minLimit = 0, maxLimit = 0;
  if (nvmlDeviceGetPowerManagementLimitConstraints(device, &minLimit, &maxLimit) ==
          NVML_SUCCESS &&
      maxLimit > 0) {
    reading.ratedMaxPowerW = static_cast<double>(maxLimit) / 1000.0;
  } else if (nvmlDeviceGetEnforcedPowerLimit(device, &power) == NVML_SUCCESS && power > 0) {
    reading.ratedMaxPowerW = static_cast<double>(power) / 1000.0;
  }

  // Framebuffer memory (bytes)
  nvmlMemory_t memory{};
  rc = nvmlDeviceGetMemoryInfo(device, &memory);
  if (rc == NVML_SUCCESS) {
    reading.memUsedMiB = static_cast<double>(memory.used) / BYTES_PER_MIB;
    reading.memTotalMiB = static_cast<double>(memory.total) / BYTES_PER_MIB;
  } else if (rc != NVML_ERROR_NOT_SUPPORTED) {
    lastError = rc;
  }

  // Temperature
#if COMPAT_NVML_API_VERSION >= 13
  nvmlTemperature_t tempQuery{};
  tempQuery.version = nvmlTemperature_v1;
  tempQuery.sensorType = NVML_TEMPERATURE_GPU;
  rc = nvmlDeviceGetTemperatureV(device, &tempQuery);
  if (rc == NVML_SUCCESS) {
    reading.temperatureC = static_cast<double>(tempQuery.temperature);
    any = true;
  }
#else
  unsigned int temp = 0;
  rc = nvmlDeviceGetTemperature(device, NVML_TEMPERATURE_GPU, &temp);
  if (rc == NVML_SUCCESS) {
    reading.temperatureC = static_cast<double>(temp);
    any = true;
  }
#endif
  if (rc != NVML_SUCCESS && rc != NVML_ERROR_NOT_SUPPORTED) {
    lastError = rc;
  }

  if (!any) {
    return QueryOutcome::failure(lastError != NVML_SUCCESS
                                     ? nvmlError("telemetry query", lastError)
                                     : std::string("device reports no supported metrics"));
  }
  return QueryOutcome::success(std::move(reading));
}

#endif // COMPAT_NVML_AVAILABLE

} // namespace

/* ----------------------------- Lifecycle ----------------------------- */

NvmlGpuSource::~NvmlGpuSource() {
#if COMPAT_NVML_AVAILABLE
  if (session_.load()) {
    nvmlShutdown();
  }
#endif
}

bool NvmlGpuSource::compiledIn() noexcept { return COMPAT_NVML_AVAILABLE != 0; }

std::string NvmlGpuSource::ensureSession() noexcept {
#if COMPAT_NVML_AVAILABLE
  std::lock_guard<std::mutex> lock(sessionMutex_);
  if (session_.load()) {
    return {};
  }
  const nvmlReturn_t RC = nvmlInit_v2();
  if (RC != NVML_SUCCESS) {
    return nvmlError("nvmlInit", RC);
  }
  session_.store(true);
  return {};
#else
  return "built without NVML";
#endif
}

/* ----------------------------- API ----------------------------- */

Inventory NvmlGpuSource::inventory() noexcept {
  std::string error = ensureSession();
  if (!error.empty()) {
    return Inventory::unavailableBecause(name(), std::move(error));
  }

#if COMPAT_NVML_AVAILABLE
  unsigned int count = 0;
  const nvmlReturn_t RC = nvmlDeviceGetCount_v2(&count);
  if (RC != NVML_SUCCESS) {
    return Inventory::unavailableBecause(name(), nvmlError("nvmlDeviceGetCount", RC));
  }
  if (count == 0) {
    return Inventory::unavailableBecause(name(), "no devices");
  }

  std::vector<std::string> uuids;
  uuids.reserve(count);
  for (unsigned int i = 0; i < count; ++i) {
    nvmlDevice_t device{};
    if (nvmlDeviceGetHandleByIndex_v2(i, &device) != NVML_SUCCESS) {
      continue;
    }
    std::array<char, NVML_DEVICE_UUID_V2_BUFFER_SIZE> uuid{};
    if (nvmlDeviceGetUUID(device, uuid.data(), static_cast<unsigned int>(uuid.size())) ==
        NVML_SUCCESS) {
      uuids.emplace_back(uuid.data());
    }
  }
  if (uuids.empty()) {
    return Inventory::unavailableBecause(name(), "no device handle could be resolved");
  }
  return Inventory::of(std::move(uuids));
#else
  return Inventory::unavailableBecause(name(), "built without NVML");
#endif
}

QueryOutcome NvmlGpuSource::query(const std::string& target) noexcept {
#if COMPAT_NVML_AVAILABLE
  if (!session_.load()) {
    return QueryOutcome::failure("NVML session not initialized");
  }
  nvmlDevice_t device{};
  const nvmlReturn_t RC = nvmlDeviceGetHandleByUUID(target.c_str(), &device);
  if (RC != NVML_SUCCESS) {
    return QueryOutcome::failure(nvmlError("nvmlDeviceGetHandleByUUID", RC));
  }
  return queryNvmlDevice(device, target);
#else
  (void)target;
  return QueryOutcome::failure("built without NVML");
#endif
}

} // namespace source

} // namespace gpumon
