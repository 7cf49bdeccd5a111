#pragma once

// Waveshare 2.13" V4 HAT on a Raspberry Pi (BCM numbering)
constexpr int PIN_EPD_RST  = 17;
constexpr int PIN_EPD_DC   = 25;
constexpr int PIN_EPD_BUSY = 24;
constexpr int PIN_EPD_PWR  = 18;   // HAT power enable, -1 if not fitted
// CS is driven by spidev (CE0)

// Buttons to GND, internal pull-ups
constexpr int PIN_BTN_RETURN = 6;
constexpr int PIN_BTN_ACTION = 13;
constexpr int PIN_BTN_GO     = 19;

constexpr const char* EPD_SPI_DEVICE  = "/dev/spidev0.0";
constexpr const char* GPIO_CHIP_PATH  = "/dev/gpiochip0";
constexpr unsigned    EPD_SPI_SPEED_HZ = 4000000;

// Landscape geometry used by the renderer
constexpr int DISPLAY_WIDTH  = 250;
constexpr int DISPLAY_HEIGHT = 122;
// Native controller geometry (portrait)
constexpr int EPD_NATIVE_WIDTH  = 122;
constexpr int EPD_NATIVE_HEIGHT = 250;
