/**
 * SuperKit - Display Pattern Tables
 *
 * Every table below is authored for MSB_FIRST shifting, i.e. bit n of a
 * code drives output Qn. Feed them through patternFor() so a driver
 * configured LSB_FIRST still lights the intended segments.
 */

#ifndef DISPLAY_PATTERNS_HPP
#define DISPLAY_PATTERNS_HPP

#include <cstdint>
#include <cstddef>

#include "shift_register_driver.hpp"

constexpr ShiftRegisterDriver::BitOrder PATTERN_AUTHORED_ORDER = ShiftRegisterDriver::BitOrder::MSB_FIRST;

// LED bar (Q0..Q7 -> LED1..LED8): four chase modes
constexpr size_t LED_BAR_MODE_COUNT = 4;
constexpr size_t LED_BAR_STEP_COUNT = 8;
constexpr uint8_t LED_BAR_MODES[LED_BAR_MODE_COUNT][LED_BAR_STEP_COUNT] = {
    {0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0x40, 0x80},  // single LED walk
    {0x01, 0x03, 0x07, 0x0f, 0x1f, 0x3f, 0x7f, 0xff},  // fill
    {0x01, 0x05, 0x15, 0x55, 0xb5, 0xf5, 0xfb, 0xff},  // alternate fill
    {0x02, 0x03, 0x0b, 0x0f, 0x2f, 0x3f, 0xbf, 0xff},  // pairwise fill
};

// Common-cathode 7-segment, Q0..Q7 = a,b,c,d,e,f,g,dp
constexpr size_t SEGMENT_CODE_COUNT = 17;
constexpr uint8_t SEGMENT_HEX_CODES[SEGMENT_CODE_COUNT] = {
    0x3f, 0x06, 0x5b, 0x4f, 0x66, 0x6d, 0x7d, 0x07,  // 0-7
    0x7f, 0x6f, 0x77, 0x7c, 0x39, 0x5e, 0x79, 0x71,  // 8-F
    0x80,                                            // decimal point
};

// Dice faces 1-6
constexpr size_t DICE_FACE_COUNT = 6;
constexpr uint8_t DICE_FACE_CODES[DICE_FACE_COUNT] = {0x06, 0x5b, 0x4f, 0x66, 0x6d, 0x7d};

// 8x8 dot matrix on two chained registers: row byte (anodes) and
// column byte (cathodes, active low)
constexpr size_t DOT_MATRIX_FRAME_COUNT = 20;
constexpr uint8_t DOT_MATRIX_ROWS[DOT_MATRIX_FRAME_COUNT] = {
    0x01, 0xff, 0x80, 0xff, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20,
    0x40, 0x80, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
};
constexpr uint8_t DOT_MATRIX_COLUMNS[DOT_MATRIX_FRAME_COUNT] = {
    0x00, 0x7f, 0x00, 0xfe, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x00, 0xfe, 0xfd, 0xfb, 0xf7, 0xef, 0xdf, 0xbf, 0x7f,
};

/**
 * Pattern code expressed in the order the driver shifts.
 */
inline uint8_t patternFor(uint8_t code, ShiftRegisterDriver::BitOrder driver_order) {
    return ShiftRegisterDriver::convertOrder(code, PATTERN_AUTHORED_ORDER, driver_order);
}

#endif // DISPLAY_PATTERNS_HPP
