#ifndef SUPERKIT_PINS_H
#define SUPERKIT_PINS_H

// Default header wiring (BCM numbering). Overridden by config.json.

// 74HC595 shift register
#define HC595_PIN_SDI         17   // DS, serial data
#define HC595_PIN_RCLK        18   // ST_CP, latch clock
#define HC595_PIN_SRCLK       27   // SH_CP, shift clock
#define HC595_PULSE_US        1    // SH_CP/ST_CP high time, chip needs ~20 ns
#define HC595_CHAIN_MAX       8

// Rotary encoder (KY-040 style)
#define ENCODER_PIN_CLK       18   // channel A
#define ENCODER_PIN_DT        17   // channel B
#define ENCODER_PIN_SW        27   // push switch, active low
#define ENCODER_POLL_MS       10

// Dice roll button, active low
#define DICE_PIN_BUTTON       22

// Demo timing
#define LED_BAR_DELAY_MS      100
#define SEGMENT_DELAY_MS      500
#define DOT_MATRIX_DELAY_MS   100
#define DICE_FLASH_MS         10
#define DICE_HOLD_MS          2000

#endif // SUPERKIT_PINS_H
