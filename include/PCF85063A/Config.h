/**
 * @file Config.h
 * @brief Configuration for PCF85063A RTC library
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Status.h"

namespace PCF85063A {

/**
 * @enum LoadCapacitance
 * @brief Quartz load capacitance selection (Control_1 CAP_SEL)
 */
enum class LoadCapacitance : uint8_t {
  Pf7 = 0,     ///< 7 pF (power-on default)
  Pf12_5 = 1   ///< 12.5 pF
};

/// @brief I2C write callback signature.
using I2cWriteFn = Status (*)(uint8_t addr, const uint8_t* data, size_t len,
                              uint32_t timeoutMs, void* user);

/// @brief I2C write-read callback signature.
using I2cWriteReadFn = Status (*)(uint8_t addr, const uint8_t* tx, size_t txLen,
                                  uint8_t* rx, size_t rxLen, uint32_t timeoutMs,
                                  void* user);

/// @brief Bus lock callback signature. Return OK once the lock is held.
using BusLockFn = Status (*)(uint32_t timeoutMs, void* user);

/// @brief Bus unlock callback signature.
using BusUnlockFn = void (*)(void* user);

/**
 * @struct Config
 * @brief RTC configuration parameters
 *
 * All hardware resources are application-provided. Library does not
 * define any pin defaults - board-specific values must be passed by user.
 */
struct Config {
  /// @brief I2C write callback (required).
  I2cWriteFn i2cWrite = nullptr;

  /// @brief I2C write-read callback (required).
  I2cWriteReadFn i2cWriteRead = nullptr;

  /// @brief User context passed to I2C callbacks (e.g., TwoWire*).
  void* i2cUser = nullptr;

  /// @brief I2C address of PCF85063A (fixed 0x51 on hardware)
  uint8_t i2cAddress = 0x51;

  /// @brief I2C transaction timeout in milliseconds (default: 50ms)
  /// @note Passed to the transport callback. The library never configures the bus.
  uint32_t i2cTimeoutMs = 50;

  /// @brief Optional bus lock, taken once per logical operation.
  /// @note busLock and busUnlock must be set together or both left null.
  ///       Use when the bus is shared with other tasks.
  BusLockFn busLock = nullptr;

  /// @brief Optional bus unlock, called on every exit path after busLock succeeded.
  BusUnlockFn busUnlock = nullptr;

  /// @brief User context passed to lock callbacks (e.g., SemaphoreHandle_t).
  void* lockUser = nullptr;

  /// @brief Maximum time to wait for the bus lock in milliseconds (default: 100ms)
  uint32_t lockTimeoutMs = 100;

  /// @brief Write capacitance to Control_1 during begin() (default: false)
  /// @note When false the CAP_SEL bit is left as found on the device.
  bool applyCapacitance = false;

  /// @brief Quartz load capacitance applied when applyCapacitance is true
  LoadCapacitance capacitance = LoadCapacitance::Pf7;
};

}  // namespace PCF85063A
