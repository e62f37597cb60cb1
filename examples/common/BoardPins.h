/**
 * @file BoardPins.h
 * @brief Example default pin mapping for the PCF85063A bring-up board (ESP32-S3).
 *
 * NOT part of the library API. Override for your hardware.
 *
 * @warning The library itself is pin-agnostic. The bus is owned by the
 *          application and reaches the driver only through Config callbacks.
 */

#pragma once

#include <stdint.h>

namespace pins {

/// @brief I2C SDA pin (data line).
static constexpr int I2C_SDA = 21;

/// @brief I2C SCL pin (clock line).
static constexpr int I2C_SCL = 22;

/// @brief RTC INT output (open-drain, active low). Needs a pull-up.
/// Set to -1 to poll the alarm flag over I2C instead.
static constexpr int RTC_INT = 4;

/// @brief I2C clock in Hz. The PCF85063A is a Fast-mode (400 kHz) device.
static constexpr uint32_t I2C_FREQ_HZ = 400000;

}  // namespace pins
