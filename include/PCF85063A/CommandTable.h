/**
 * @file CommandTable.h
 * @brief PCF85063A register addresses and bit definitions.
 *
 * Contains the PCF85063A register map from the NXP datasheet.
 * Use for direct register access via the driver's low-level API.
 *
 * @note Time and alarm registers are BCD unless noted.
 */

#pragma once

#include <stdint.h>

namespace PCF85063A {

/**
 * @brief PCF85063A register and bit definitions.
 *
 * All registers from the PCF85063A data sheet (Rev. 7, 2018).
 */
namespace cmd {

// ========== Control / Status Registers (0x00–0x03) ==========

/// @brief Control 1 register (0x00)
/// Bits: EXT_TEST, STOP, SR, CIE, 12_24, CAP_SEL
static constexpr uint8_t REG_CONTROL1 = 0x00;

/// @brief Control 2 register (0x01)
/// Bits: AIE, AF, MI, HMI, TF, COF[2:0]
static constexpr uint8_t REG_CONTROL2 = 0x01;

/// @brief Offset register (0x02)
/// Bit 7 = MODE, b6-b0 = offset (two's complement, -64..63)
static constexpr uint8_t REG_OFFSET = 0x02;

/// @brief RAM byte (0x03)
/// Free for application use, 0x00 after power-on reset
static constexpr uint8_t REG_RAM_BYTE = 0x03;

// ========== Time / Calendar Registers (0x04–0x0A) ==========

/// @brief Seconds register (0x04)
/// Bit 7 = OS (oscillator stopped), b6-b0 = BCD seconds (0–59)
static constexpr uint8_t REG_SECONDS = 0x04;

/// @brief Minutes register (0x05)
/// BCD: b7=unused, b6-b0 = 0–59
static constexpr uint8_t REG_MINUTES = 0x05;

/// @brief Hours register (0x06)
/// BCD: b7-b6=unused, b5-b0 = 0–23 (24-hour mode)
static constexpr uint8_t REG_HOURS = 0x06;

/// @brief Days register (0x07)
/// BCD: b7-b6=unused, b5-b0 = 1–31
static constexpr uint8_t REG_DAYS = 0x07;

/// @brief Weekdays register (0x08)
/// b7-b3=unused, b2-b0 = 0–6 (not BCD, stored verbatim)
static constexpr uint8_t REG_WEEKDAYS = 0x08;

/// @brief Months register (0x09)
/// Bit 7 = century, b4-b0 = BCD month (1–12)
static constexpr uint8_t REG_MONTHS = 0x09;

/// @brief Years register (0x0A)
/// BCD: b7-b0 = 00–99
static constexpr uint8_t REG_YEARS = 0x0A;

/// @brief Length of the time block starting at REG_SECONDS
static constexpr uint8_t TIME_BLOCK_LEN = 7;

// ========== Alarm Registers (0x0B–0x0F) ==========

/// @brief Second alarm register (0x0B)
/// Bit 7 = AEN_S (1 = disabled), b6-b0 = BCD seconds (0–59)
static constexpr uint8_t REG_ALARM_SECOND = 0x0B;

/// @brief Minute alarm register (0x0C)
/// Bit 7 = AEN_M (1 = disabled), b6-b0 = BCD minutes (0–59)
static constexpr uint8_t REG_ALARM_MINUTE = 0x0C;

/// @brief Hour alarm register (0x0D)
/// Bit 7 = AEN_H (1 = disabled), b5-b0 = BCD hours (0–23)
static constexpr uint8_t REG_ALARM_HOUR = 0x0D;

/// @brief Day alarm register (0x0E)
/// Bit 7 = AEN_D (1 = disabled), b5-b0 = BCD day (1–31)
static constexpr uint8_t REG_ALARM_DAY = 0x0E;

/// @brief Weekday alarm register (0x0F)
/// Bit 7 = AEN_W (1 = disabled), b2-b0 = weekday (0–6)
static constexpr uint8_t REG_ALARM_WEEKDAY = 0x0F;

/// @brief Length of the alarm block starting at REG_ALARM_SECOND
static constexpr uint8_t ALARM_BLOCK_LEN = 5;

// ========== Timer Registers (0x10–0x11) ==========

/// @brief Timer value register (0x10)
/// 8-bit countdown value (0–255)
static constexpr uint8_t REG_TIMER_VALUE = 0x10;

/// @brief Timer mode register (0x11)
/// Bits: TCF[1:0], TE, TIE, TI_TP
static constexpr uint8_t REG_TIMER_MODE = 0x11;

// ========== Register Bit Masks ==========

// Control 1 register bits (REG_CONTROL1, 0x00)
static constexpr uint8_t CTRL1_EXT_TEST_BIT = 7;      ///< External clock test mode
static constexpr uint8_t CTRL1_STOP_BIT = 5;          ///< RTC clock stop
static constexpr uint8_t CTRL1_SR_BIT = 4;            ///< Software reset
static constexpr uint8_t CTRL1_CIE_BIT = 2;           ///< Correction interrupt enable
static constexpr uint8_t CTRL1_12_24_BIT = 1;         ///< 12/24 hour mode (0 = 24h)
static constexpr uint8_t CTRL1_CAP_SEL_BIT = 0;       ///< Load capacitance (1 = 12.5 pF)

// Control 2 register bits (REG_CONTROL2, 0x01)
static constexpr uint8_t CTRL2_AIE_BIT = 7;           ///< Alarm interrupt enable
static constexpr uint8_t CTRL2_AF_BIT = 6;            ///< Alarm flag
static constexpr uint8_t CTRL2_MI_BIT = 5;            ///< Minute interrupt
static constexpr uint8_t CTRL2_HMI_BIT = 4;           ///< Half-minute interrupt
static constexpr uint8_t CTRL2_TF_BIT = 3;            ///< Timer flag
static constexpr uint8_t CTRL2_COF_MASK = 0x07;       ///< CLKOUT frequency (3 bits)

// Offset register bits (REG_OFFSET, 0x02)
static constexpr uint8_t OFFSET_MODE_BIT = 7;         ///< 0 = every 2 h, 1 = every 4 min
static constexpr uint8_t OFFSET_VALUE_MASK = 0x7F;    ///< Signed 7-bit offset

// Time register bits
static constexpr uint8_t SECONDS_OS_BIT = 7;          ///< Oscillator stopped
static constexpr uint8_t MONTHS_CENTURY_BIT = 7;      ///< Century (1 = 19xx)
static constexpr uint8_t SECONDS_MASK = 0x7F;
static constexpr uint8_t MINUTES_MASK = 0x7F;
static constexpr uint8_t HOURS_MASK = 0x3F;
static constexpr uint8_t DAYS_MASK = 0x3F;
static constexpr uint8_t WEEKDAYS_MASK = 0x07;
static constexpr uint8_t MONTHS_MASK = 0x1F;

// Alarm register bits
static constexpr uint8_t ALARM_DISABLE = 0x80;        ///< AEN_x: 1 = field ignored
static constexpr uint8_t ALARM_VALUE_MASK = 0x7F;

// Timer mode register bits (REG_TIMER_MODE, 0x11)
static constexpr uint8_t TIMER_TCF_MASK = 0x18;       ///< Timer clock frequency (2 bits)
static constexpr uint8_t TIMER_TCF_SHIFT = 3;
static constexpr uint8_t TIMER_TE_BIT = 2;            ///< Timer enable
static constexpr uint8_t TIMER_TIE_BIT = 1;           ///< Timer interrupt enable
static constexpr uint8_t TIMER_TI_TP_BIT = 0;         ///< 1 = pulsed interrupt

// I2C Address
static constexpr uint8_t I2C_ADDR_7BIT = 0x51;        ///< 7-bit I2C slave address

}  // namespace cmd

}  // namespace PCF85063A
