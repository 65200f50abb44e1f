#ifndef PicoOV7670_sensor_H
#define PicoOV7670_sensor_H

#include <stdint.h>
#include <stddef.h>

#include "PicoOV7670_port.h"
#include "PicoOV7670_regs.h"


// supported color formats, both use 2 bytes per pixel
enum PicoOV7670_colorspace {
	OV7670_COLOR_RGB = 0,	// RGB565 big-endian
	OV7670_COLOR_YUV = 1,	// YUV/YCbCr 422 big-endian
};

// supported sizes (VGA division factor)
enum PicoOV7670_size {
	OV7670_SIZE_DIV1 = 0,	// 640 x 480
	OV7670_SIZE_DIV2 = 1,	// 320 x 240
	OV7670_SIZE_DIV4 = 2,	// 160 x 120
	OV7670_SIZE_DIV8 = 3,	// 80 x 60
	OV7670_SIZE_DIV16 = 4,	// 40 x 30
};

enum PicoOV7670_test_pattern {
	OV7670_TEST_PATTERN_NONE = 0,		// normal operation
	OV7670_TEST_PATTERN_SHIFTING_1 = 1,	// "shifting 1" pattern
	OV7670_TEST_PATTERN_COLOR_BAR = 2,	// 8 color bars
	OV7670_TEST_PATTERN_COLOR_BAR_FADE = 3,	// color bars w/fade to white
};

// the values are the COM11 bits 7:5 patterns. There's also a "same frame
// rate" night mode, but it doesn't seem to do anything useful
enum PicoOV7670_night_mode {
	OV7670_NIGHT_MODE_OFF = 0x00,
	OV7670_NIGHT_MODE_2 = 0xA0,	// 1/2 frame rate
	OV7670_NIGHT_MODE_4 = 0xC0,	// 1/4 frame rate
	OV7670_NIGHT_MODE_8 = 0xE0,	// 1/8 frame rate
};


class PicoOV7670_config {
public:
	// pin definitions
	uint32_t i2c_dat_gpio;	// control bus pins
	uint32_t i2c_clk_gpio;
	// D0 pin: D1..D7 must be consecutive after this one
	uint32_t d0_gpio;
	uint32_t pclk_gpio;
	uint32_t vsync_gpio;
	uint32_t href_gpio;
	// MCLK pin, -1 means MCLK is provided by the circuit, not the mcu
	int mclk_gpio;
	// shutdown (power down) and reset pins, -1 if not wired
	int shutdown_gpio;
	int reset_gpio;

	// MCLK frequency in Hz, only used if mclk_gpio is set
	uint32_t mclk_freq;

	// 7 bit control bus address
	uint8_t i2c_address;

	// image settings applied by begin
	PicoOV7670_colorspace colorspace;
	PicoOV7670_size size;
	PicoOV7670_test_pattern test_pattern;
	bool flip_x, flip_y;
	PicoOV7670_night_mode night;

	PicoOV7670_config() {
		i2c_dat_gpio = 0;
		i2c_clk_gpio = 0;
		d0_gpio = 0;
		pclk_gpio = 0;
		vsync_gpio = 0;
		href_gpio = 0;
		mclk_gpio = -1;
		shutdown_gpio = -1;
		reset_gpio = -1;
		mclk_freq = 16000000;
		i2c_address = OV7670_ADDR;
		colorspace = OV7670_COLOR_RGB;
		size = OV7670_SIZE_DIV8;
		test_pattern = OV7670_TEST_PATTERN_NONE;
		flip_x = false;
		flip_y = false;
		night = OV7670_NIGHT_MODE_OFF;
	}
};


// Register level control of the sensor. All the methods returning int
// return 1 on success and 0 if a bus transaction failed, except the raw
// register reads that return the value or -1. A failed call leaves the
// registers written so far in place and doesn't update the cached state.
class PicoOV7670_sensor {
public:
	// reset the sensor, load the baseline configuration and apply the image
	// settings from config. The port must outlive the sensor or the next
	// call to deinit
	int begin(PicoOV7670_port *port, const PicoOV7670_config &config);

	// forget the port, setters fail until begin is called again
	void deinit(void);

	bool is_ready(void) const {
		return state == STATE_READY;
	}

	// capture one frame, dest must hold get_frame_bytes() bytes
	int capture(uint8_t *dest);

	int set_colorspace(PicoOV7670_colorspace colorspace);
	PicoOV7670_colorspace get_colorspace(void) const {
		return colorspace;
	}

	int set_size(PicoOV7670_size size);
	PicoOV7670_size get_size(void) const {
		return size;
	}

	int get_width(void) const {
		return 640 >> size;
	}
	int get_height(void) const {
		return 480 >> size;
	}
	uint32_t get_frame_bytes(void) const {
		return 2 * get_width() * get_height();
	}

	int set_test_pattern(PicoOV7670_test_pattern pattern);
	PicoOV7670_test_pattern get_test_pattern(void) const {
		return test_pattern;
	}

	// mirror and flip share the MVFP register, set_flip writes both with a
	// single read-modify-write
	int set_flip(bool flip_x, bool flip_y);
	int set_flip_x(bool value) {
		return set_flip(value, flip_y);
	}
	int set_flip_y(bool value) {
		return set_flip(flip_x, value);
	}
	bool get_flip_x(void) const {
		return flip_x;
	}
	bool get_flip_y(void) const {
		return flip_y;
	}

	int set_night(PicoOV7670_night_mode mode);
	PicoOV7670_night_mode get_night(void) const {
		return night;
	}

	// identification registers, expected OV7670_PID and OV7670_VER
	int get_product_id(void);
	int get_product_version(void);

	// raw access, for debug purposes
	int read_register(uint8_t reg);
	int write_register(uint8_t reg, uint8_t value);

	PicoOV7670_sensor() {
		state = STATE_UNINITIALIZED;
		port = NULL;
		colorspace = OV7670_COLOR_RGB;
		size = OV7670_SIZE_DIV8;
		test_pattern = OV7670_TEST_PATTERN_NONE;
		flip_x = flip_y = false;
		night = OV7670_NIGHT_MODE_OFF;
	}

private:
	enum state_t {
		STATE_UNINITIALIZED = 0,
		STATE_RESETTING = 1,
		STATE_BASELINE_LOADED = 2,
		STATE_READY = 3,
	};

	state_t state;

	PicoOV7670_port *port;

	// mirror of the sensor configuration
	PicoOV7670_colorspace colorspace;
	PicoOV7670_size size;
	PicoOV7670_test_pattern test_pattern;
	bool flip_x, flip_y;
	PicoOV7670_night_mode night;

	// pulse the shutdown and reset lines, or do a soft reset
	int reset_sensor(void);

	// write a table of registers, waiting a bit after each one
	int regs_write(const sensor_reg *regs, size_t count);

	// every write to a register shared between features goes through here:
	// bits outside mask keep the value currently in the sensor
	int modify_reg(uint8_t reg, uint8_t mask, uint8_t bits);

	// program scaling, clock division and window for a size class
	int frame_control(PicoOV7670_size size);

	bool can_configure(void) const {
		return port != NULL && state >= STATE_BASELINE_LOADED;
	}
};

#endif
