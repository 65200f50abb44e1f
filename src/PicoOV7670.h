#ifndef PicoOV7670_H
#define PicoOV7670_H

#include <Arduino.h>

#ifdef ARDUINO_ARCH_RP2040

#include "hardware/pio.h"
#include "pico/mutex.h"

#include "PicoOV7670_sensor.h"


class PicoOV7670 : public PicoOV7670_sensor, private PicoOV7670_port {
public:
	// call begin to start the master clock, claim the PIO and DMA resources
	// and initialize the camera chip. Returns 1 on success, 0 on error; on
	// error everything claimed so far is released again
	int begin(const PicoOV7670_config &config);

	// release the capture engine, the master clock and the control lines.
	// Called by the destructor, calling it twice is harmless
	void deinit(void);

	// start capturing a frame. The function returns immediately, the PIO
	// code waits for the vertical sync and then uses DMA to do the actual
	// transfer, so the mcu is free to run other code while the frame is
	// being transferred. dest must hold get_frame_bytes() bytes and be 4
	// byte aligned. Returns 0 if the camera is not initialized. A frame
	// still being transferred from a previous call is abandoned, its buffer
	// is left partially written.
	// capture() is the blocking version of start_capture + wait_for_frame
	int start_capture(uint8_t *dest);

	// non-blocking call to check if the frame that is being currently
	// transferred is already finished
	bool is_frame_ready(void);

	// blocks waiting for the completion of a previous call to start_capture
	void wait_for_frame(void);

	// the master clock frequency actually generated, which differs from the
	// requested one because of the PWM divider resolution. 0 if the clock
	// is provided externally
	uint32_t get_mclk_frequency(void) const {
		return actual_mclk_freq;
	}

	PicoOV7670() {
		claimed = false;
		capturing = false;
		actual_mclk_freq = 0;
		mutex_init(&bus_mutex);
	}

	~PicoOV7670() {
		deinit();
	}

private:
	// current active configuration
	PicoOV7670_config config;

	// true between a successful resource setup in begin and deinit
	bool claimed;
	// true while a DMA transfer may be running
	bool capturing;

	uint32_t actual_mclk_freq;
	uint mclk_slice;

	// serializes control bus transactions
	mutex_t bus_mutex;

	// RP2040 resources
	PIO data_pio;
	uint data_pio_sm;
	uint data_pio_offset;
	uint dma_channel;

	// the capture program, patched with the sync pin numbers
	uint16_t capture_instructions[8];
	pio_program_t capture_program;

	int capture_init(void);
	void capture_deinit(void);
	int arm_capture(uint8_t *dest, uint32_t length);

	int mclk_init(void);
	void mclk_deinit(void);

	// the camera code only uses the control bus for configuration, so we
	// just do a bit-bang SCCB to allow full flexibility in the pin
	// selection
	void i2c_bus_start(void);
	void i2c_bus_stop(void);
	int i2c_bus_write_byte(int data);
	int i2c_bus_read_byte(void);
	int i2c_write_reg(int regID, int regDat);
	int i2c_read_reg(int regID, uint8_t *regDat);

	// PicoOV7670_port
	int write_reg(uint8_t reg, uint8_t value) override;
	int read_reg(uint8_t reg, uint8_t *value) override;
	bool has_shutdown_pin(void) const override;
	void set_shutdown_pin(bool level) override;
	bool has_reset_pin(void) const override;
	void set_reset_pin(bool level) override;
	void sleep_ms(uint32_t ms) override;
	int capture_frame(uint8_t *dest, uint32_t length) override;
};

#else // ARCH
#error PicoOV7670 library requires a PIO peripheral and only works on the RP2040 architecture
#endif

#endif
