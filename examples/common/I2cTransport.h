/**
 * @file I2cTransport.h
 * @brief Wire-based I2C transport adapter for PCF85063A examples.
 *
 * Provides the two Config callbacks on top of Arduino TwoWire.
 * The library does not depend on Wire directly; this adapter bridges them.
 *
 * NOT part of the library API. Example-only.
 */

#pragma once

#include <Arduino.h>
#include <Wire.h>

#include "PCF85063A/Status.h"

namespace transport {

/// @brief Largest transfer the driver issues (alarm/time blocks fit easily).
static constexpr size_t kMaxTransfer = 32;

/**
 * @brief Translate a TwoWire::endTransmission() result into a Status.
 *
 * Code 5 (timeout) is reported as Err::TIMEOUT so callers can tell a
 * stuck bus from a missing device.
 */
inline PCF85063A::Status wireResultToStatus(uint8_t result) {
  switch (result) {
    case 0:
      return PCF85063A::Status::Ok();
    case 1:
      return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C data too long", result);
    case 2:
      return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C address NACK", result);
    case 3:
      return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C data NACK", result);
    case 4:
      return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C bus error", result);
    case 5:
      return PCF85063A::Status::Error(PCF85063A::Err::TIMEOUT, "I2C timeout", result);
    default:
      return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C unknown error", result);
  }
}

inline void applyTimeout(TwoWire* wire, uint32_t timeoutMs) {
#if defined(ARDUINO_ARCH_ESP32)
  wire->setTimeOut(static_cast<uint16_t>(timeoutMs));
#else
  (void)wire;
  (void)timeoutMs;
#endif
}

/**
 * @brief Wire-based I2C write implementation.
 *
 * Pass to Config::i2cWrite, and pass &Wire (or custom TwoWire*) to i2cUser.
 * data[0] is the register address, followed by the payload.
 */
inline PCF85063A::Status wireWrite(uint8_t addr, const uint8_t* data, size_t len,
                                   uint32_t timeoutMs, void* user) {
  TwoWire* wire = static_cast<TwoWire*>(user);
  if (wire == nullptr) {
    return PCF85063A::Status::Error(PCF85063A::Err::INVALID_CONFIG, "Wire instance is null");
  }
  if (!data || len == 0) {
    return PCF85063A::Status::Error(PCF85063A::Err::INVALID_PARAM, "Invalid I2C write params");
  }
  if (len > kMaxTransfer) {
    return PCF85063A::Status::Error(PCF85063A::Err::INVALID_PARAM, "Write exceeds I2C buffer",
                                    static_cast<int32_t>(len));
  }

  applyTimeout(wire, timeoutMs);

  wire->beginTransmission(addr);
  size_t written = wire->write(data, len);
  if (written != len) {
    return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C write incomplete",
                                    static_cast<int32_t>(written));
  }
  return wireResultToStatus(wire->endTransmission(true));
}

/**
 * @brief Wire-based I2C write-read implementation.
 *
 * Pass to Config::i2cWriteRead. Writes the register address, then reads
 * rxLen bytes after a repeated start. The PCF85063A auto-increments the
 * register pointer, so block reads return consecutive registers.
 */
inline PCF85063A::Status wireWriteRead(uint8_t addr, const uint8_t* tx, size_t txLen,
                                       uint8_t* rx, size_t rxLen, uint32_t timeoutMs,
                                       void* user) {
  TwoWire* wire = static_cast<TwoWire*>(user);
  if (wire == nullptr) {
    return PCF85063A::Status::Error(PCF85063A::Err::INVALID_CONFIG, "Wire instance is null");
  }
  if (tx == nullptr || rx == nullptr || txLen == 0 || rxLen == 0) {
    return PCF85063A::Status::Error(PCF85063A::Err::INVALID_PARAM, "Invalid I2C read params");
  }
  if (txLen > kMaxTransfer || rxLen > kMaxTransfer) {
    return PCF85063A::Status::Error(PCF85063A::Err::INVALID_PARAM, "I2C read exceeds buffer");
  }

  applyTimeout(wire, timeoutMs);

  wire->beginTransmission(addr);
  size_t written = wire->write(tx, txLen);
  if (written != txLen) {
    return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C write incomplete",
                                    static_cast<int32_t>(written));
  }

  PCF85063A::Status st = wireResultToStatus(wire->endTransmission(false));  // Repeated start
  if (!st.ok()) {
    return st;
  }

  size_t read = wire->requestFrom(addr, static_cast<uint8_t>(rxLen));
  if (read != rxLen) {
    return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C read length mismatch",
                                    static_cast<int32_t>(read));
  }

  for (size_t i = 0; i < rxLen; ++i) {
    if (!wire->available()) {
      return PCF85063A::Status::Error(PCF85063A::Err::I2C_ERROR, "I2C data not available",
                                      static_cast<int32_t>(i));
    }
    rx[i] = static_cast<uint8_t>(wire->read());
  }

  return PCF85063A::Status::Ok();
}

/**
 * @brief Clock out a stuck slave with 9 SCL pulses and a STOP.
 *
 * Needed after a reset in the middle of a read, when the RTC may still
 * hold SDA low.
 */
inline void recoverBus(int sda, int scl) {
  pinMode(scl, OUTPUT);
  pinMode(sda, INPUT_PULLUP);
  for (int i = 0; i < 9; i++) {
    digitalWrite(scl, LOW);
    delayMicroseconds(5);
    digitalWrite(scl, HIGH);
    delayMicroseconds(5);
  }
  pinMode(sda, OUTPUT);
  digitalWrite(sda, LOW);
  delayMicroseconds(5);
  digitalWrite(scl, HIGH);
  delayMicroseconds(5);
  digitalWrite(sda, HIGH);
  delayMicroseconds(5);
}

/**
 * @brief Initialize Wire for the RTC.
 *
 * @param sda SDA pin number
 * @param scl SCL pin number
 * @param freq I2C clock frequency in Hz (PCF85063A supports up to 400 kHz)
 * @param timeoutMs I2C timeout in milliseconds
 */
inline bool initWire(int sda, int scl, uint32_t freq = 400000, uint16_t timeoutMs = 50) {
  recoverBus(sda, scl);

#if defined(ARDUINO_ARCH_ESP32)
  if (!Wire.begin(sda, scl, freq)) {
    return false;
  }
  Wire.setTimeOut(timeoutMs);
#else
  (void)sda;
  (void)scl;
  (void)timeoutMs;
  Wire.begin();
  Wire.setClock(freq);
#endif
  return true;
}

}  // namespace transport
