#include <stdint.h>

#include <hardware/clocks.h>
#include <hardware/dma.h>
#include <hardware/gpio.h>
#include <hardware/pio.h>
#include <hardware/pwm.h>
#include <pico/mutex.h>
#include <pico/time.h>

#include "PicoOV7670.h"
#include "PicoOV7670_mclk.h"
#include "ov7670_capture.pio.h"


// ------------------------------
//     image PIO

// instructions of ov7670_capture that wait on a gpio, and the pin each one
// waits on
enum {
	CAPTURE_WAIT_VSYNC_LOW = 0,
	CAPTURE_WAIT_VSYNC_HIGH = 1,
	CAPTURE_WAIT_HREF = 2,
	CAPTURE_WAIT_PCLK_HIGH = 3,
	CAPTURE_WAIT_PCLK_LOW = 5,
};

static uint16_t patch_wait_gpio(uint16_t instruction, uint pin)
{
	return (instruction & ~0x1F) | (pin & 0x1F);
}

int PicoOV7670::capture_init(void)
{
	// to set the sync pins independently of the data pins, we need to
	// re-write the PIO code for each instance
	for (uint i = 0; i < ov7670_capture_program.length; i++)
		capture_instructions[i] = ov7670_capture_program_instructions[i];
	capture_instructions[CAPTURE_WAIT_VSYNC_LOW] = patch_wait_gpio(capture_instructions[CAPTURE_WAIT_VSYNC_LOW], config.vsync_gpio);
	capture_instructions[CAPTURE_WAIT_VSYNC_HIGH] = patch_wait_gpio(capture_instructions[CAPTURE_WAIT_VSYNC_HIGH], config.vsync_gpio);
	capture_instructions[CAPTURE_WAIT_HREF] = patch_wait_gpio(capture_instructions[CAPTURE_WAIT_HREF], config.href_gpio);
	capture_instructions[CAPTURE_WAIT_PCLK_HIGH] = patch_wait_gpio(capture_instructions[CAPTURE_WAIT_PCLK_HIGH], config.pclk_gpio);
	capture_instructions[CAPTURE_WAIT_PCLK_LOW] = patch_wait_gpio(capture_instructions[CAPTURE_WAIT_PCLK_LOW], config.pclk_gpio);

	capture_program = ov7670_capture_program;
	capture_program.instructions = capture_instructions;

	if (!pio_claim_free_sm_and_add_program(&capture_program, &data_pio, &data_pio_sm, &data_pio_offset))
		return 0;

	for (uint i = 0; i < 8; i++)
		pio_gpio_init(data_pio, config.d0_gpio + i);
	pio_sm_set_consecutive_pindirs(data_pio, data_pio_sm, config.d0_gpio, 8, false);

	gpio_init(config.pclk_gpio);
	gpio_set_dir(config.pclk_gpio, GPIO_IN);
	gpio_init(config.href_gpio);
	gpio_set_dir(config.href_gpio, GPIO_IN);
	gpio_init(config.vsync_gpio);
	gpio_set_dir(config.vsync_gpio, GPIO_IN);

	// bytes are shifted in from the right, so the first byte of each
	// 32 bit word ends up at the lowest address
	pio_sm_config c = ov7670_capture_program_get_default_config(data_pio_offset);
	sm_config_set_in_pins(&c, config.d0_gpio);
	sm_config_set_in_shift(&c, true, true, 32);
	sm_config_set_fifo_join(&c, PIO_FIFO_JOIN_RX);
	pio_sm_init(data_pio, data_pio_sm, data_pio_offset, &c);

	return 1;
}

void PicoOV7670::capture_deinit(void)
{
	pio_sm_set_enabled(data_pio, data_pio_sm, false);
	pio_remove_program_and_unclaim_sm(&capture_program, data_pio, data_pio_sm, data_pio_offset);

	for (uint i = 0; i < 8; i++)
		gpio_deinit(config.d0_gpio + i);
	gpio_deinit(config.pclk_gpio);
	gpio_deinit(config.href_gpio);
	gpio_deinit(config.vsync_gpio);
}


// ------------------------------
//     master clock

int PicoOV7670::mclk_init(void)
{
	PicoOV7670_mclk_pwm pwm;
	if (!PicoOV7670_mclk_setup(clock_get_hz(clk_sys), config.mclk_freq, &pwm))
		return 0;

	mclk_slice = pwm_gpio_to_slice_num(config.mclk_gpio);
	gpio_set_function(config.mclk_gpio, GPIO_FUNC_PWM);
	pwm_set_clkdiv_int_frac(mclk_slice, pwm.div, 0);
	pwm_set_wrap(mclk_slice, pwm.period - 1);
	pwm_set_gpio_level(config.mclk_gpio, pwm.period / 2);	// 50%
	pwm_set_enabled(mclk_slice, true);

	actual_mclk_freq = pwm.freq;
	return 1;
}

void PicoOV7670::mclk_deinit(void)
{
	if (config.mclk_gpio < 0)
		return;
	pwm_set_enabled(mclk_slice, false);
	gpio_deinit(config.mclk_gpio);
	actual_mclk_freq = 0;
}


// -----------------------------------------------------------------------------------
//     bit banging SCCB code

namespace {

// holds the bus for one register transaction
class bus_lock {
public:
	explicit bus_lock(mutex_t *mutex) : mutex(mutex) {
		mutex_enter_blocking(mutex);
	}
	~bus_lock() {
		mutex_exit(mutex);
	}

private:
	mutex_t *mutex;
};

}

static void small_pause(void)
{
	sleep_us(1);
}

static void slow_gpio_put(int pin, int value)
{
	gpio_put(pin, value);
	small_pause();
}

void PicoOV7670::i2c_bus_start(void)
{
	slow_gpio_put(config.i2c_dat_gpio, 1);
	slow_gpio_put(config.i2c_clk_gpio, 1);
	slow_gpio_put(config.i2c_dat_gpio, 0);
	slow_gpio_put(config.i2c_clk_gpio, 0);
}

void PicoOV7670::i2c_bus_stop(void)
{
	slow_gpio_put(config.i2c_dat_gpio, 0);
	slow_gpio_put(config.i2c_clk_gpio, 1);
	slow_gpio_put(config.i2c_dat_gpio, 1);
}

int PicoOV7670::i2c_bus_write_byte(int data)
{
	int i, tem;

	for (i = 0; i < 8; i++) {
		slow_gpio_put(config.i2c_dat_gpio, ((data << i) & 0x80) != 0);
		slow_gpio_put(config.i2c_clk_gpio, 1);
		slow_gpio_put(config.i2c_clk_gpio, 0);
	}

	gpio_set_dir(config.i2c_dat_gpio, GPIO_IN);
	small_pause();
	slow_gpio_put(config.i2c_clk_gpio, 1);
	tem = !gpio_get(config.i2c_dat_gpio);
	slow_gpio_put(config.i2c_clk_gpio, 0);
	gpio_set_dir(config.i2c_dat_gpio, GPIO_OUT);
	return tem;
}

int PicoOV7670::i2c_bus_read_byte(void)
{
	int i, data = 0;

	gpio_set_dir(config.i2c_dat_gpio, GPIO_IN);
	small_pause();
	for (i = 0; i < 8; i++) {
		slow_gpio_put(config.i2c_clk_gpio, 1);
		data = (data << 1) | gpio_get(config.i2c_dat_gpio);
		slow_gpio_put(config.i2c_clk_gpio, 0);
	}
	gpio_set_dir(config.i2c_dat_gpio, GPIO_OUT);

	// SCCB reads are a single byte, always answered with a NACK
	slow_gpio_put(config.i2c_dat_gpio, 1);
	slow_gpio_put(config.i2c_clk_gpio, 1);
	slow_gpio_put(config.i2c_clk_gpio, 0);
	return data;
}

// both return 0 on a NACK, leaving the stop condition to the caller
int PicoOV7670::i2c_write_reg(int regID, int regDat)
{
	i2c_bus_start();
	if (i2c_bus_write_byte(config.i2c_address << 1) == 0)
		return 0;
	sleep_us(10);
	if (i2c_bus_write_byte(regID) == 0)
		return 0;
	sleep_us(10);
	if (i2c_bus_write_byte(regDat) == 0)
		return 0;
	i2c_bus_stop();
	return 1;
}

int PicoOV7670::i2c_read_reg(int regID, uint8_t *regDat)
{
	// SCCB doesn't do repeated starts: a 2 phase write to set the address,
	// then a 2 phase read
	i2c_bus_start();
	if (i2c_bus_write_byte(config.i2c_address << 1) == 0)
		return 0;
	sleep_us(10);
	if (i2c_bus_write_byte(regID) == 0)
		return 0;
	i2c_bus_stop();
	sleep_us(10);

	i2c_bus_start();
	if (i2c_bus_write_byte((config.i2c_address << 1) | 1) == 0)
		return 0;
	sleep_us(10);
	*regDat = i2c_bus_read_byte();
	i2c_bus_stop();
	return 1;
}


// -----------------------------------------------------------------------------------
//     port implementation

int PicoOV7670::write_reg(uint8_t reg, uint8_t value)
{
	bus_lock lock(&bus_mutex);
	if (i2c_write_reg(reg, value) == 0) {
		i2c_bus_stop();
		return 0;
	}
	return 1;
}

int PicoOV7670::read_reg(uint8_t reg, uint8_t *value)
{
	bus_lock lock(&bus_mutex);
	if (i2c_read_reg(reg, value) == 0) {
		i2c_bus_stop();
		return 0;
	}
	return 1;
}

bool PicoOV7670::has_shutdown_pin(void) const
{
	return config.shutdown_gpio >= 0;
}

void PicoOV7670::set_shutdown_pin(bool level)
{
	gpio_put(config.shutdown_gpio, level);
}

bool PicoOV7670::has_reset_pin(void) const
{
	return config.reset_gpio >= 0;
}

void PicoOV7670::set_reset_pin(bool level)
{
	gpio_put(config.reset_gpio, level);
}

void PicoOV7670::sleep_ms(uint32_t ms)
{
	::sleep_ms(ms);
}

int PicoOV7670::capture_frame(uint8_t *dest, uint32_t length)
{
	if (arm_capture(dest, length) == 0)
		return 0;
	wait_for_frame();
	return 1;
}


// -----------------------------------------------------------------------------------
//     camera code

int PicoOV7670::begin(const PicoOV7670_config &config)
{
	// start from scratch if begin was already called
	deinit();

	// save a copy of the configuration
	this->config = config;

	// setup a master clock, if the hardware doesn't provide one: the camera
	// doesn't answer on the control bus without it
	if (config.mclk_gpio >= 0 && !mclk_init())
		return 0;

	// allocate the PIO code to transfer image data
	if (!capture_init()) {
		mclk_deinit();
		return 0;
	}

	// allocate DMA channel dynamically
	int channel = dma_claim_unused_channel(false);
	if (channel < 0) {
		capture_deinit();
		mclk_deinit();
		return 0;
	}
	dma_channel = channel;

	// set the i2c pins as outputs by default, both pins at level high (idle)
	gpio_init(config.i2c_clk_gpio);
	gpio_set_dir(config.i2c_clk_gpio, GPIO_OUT);
	gpio_put(config.i2c_clk_gpio, 1);
	gpio_init(config.i2c_dat_gpio);
	gpio_set_dir(config.i2c_dat_gpio, GPIO_OUT);
	gpio_put(config.i2c_dat_gpio, 1);

	// the camera starts shut down and out of reset, reset_sensor pulses
	// both lines
	if (config.shutdown_gpio >= 0) {
		gpio_init(config.shutdown_gpio);
		gpio_set_dir(config.shutdown_gpio, GPIO_OUT);
		gpio_put(config.shutdown_gpio, 1);
	}
	if (config.reset_gpio >= 0) {
		gpio_init(config.reset_gpio);
		gpio_set_dir(config.reset_gpio, GPIO_OUT);
		gpio_put(config.reset_gpio, 1);
	}

	claimed = true;

	// give a few milliseconds with the MCLK already running to initialize
	// the camera's internal circuits
	::sleep_ms(50);

	if (PicoOV7670_sensor::begin(this, config) == 0) {
		deinit();
		return 0;
	}

	return 1;
}

void PicoOV7670::deinit(void)
{
	PicoOV7670_sensor::deinit();

	if (!claimed)
		return;

	if (capturing) {
		dma_channel_abort(dma_channel);
		capturing = false;
	}
	dma_channel_unclaim(dma_channel);
	capture_deinit();
	mclk_deinit();

	gpio_deinit(config.i2c_clk_gpio);
	gpio_deinit(config.i2c_dat_gpio);
	if (config.shutdown_gpio >= 0)
		gpio_deinit(config.shutdown_gpio);
	if (config.reset_gpio >= 0)
		gpio_deinit(config.reset_gpio);

	claimed = false;
}

int PicoOV7670::arm_capture(uint8_t *dest, uint32_t length)
{
	// frame sizes are always a multiple of 4 bytes, so we transfer 32 bits
	// at a time to make better use of the bus
	if (!claimed || (length & 3) != 0)
		return 0;

	// a transfer still in flight is dropped, the channel can't be
	// reprogrammed while it runs
	if (capturing) {
		dma_channel_abort(dma_channel);
		capturing = false;
	}

	// restart the program, so that it waits for the next vsync
	pio_sm_set_enabled(data_pio, data_pio_sm, false);
	pio_sm_clear_fifos(data_pio, data_pio_sm);
	pio_sm_restart(data_pio, data_pio_sm);
	pio_sm_exec(data_pio, data_pio_sm, pio_encode_jmp(data_pio_offset));

	// setup the DMA transfer
	dma_channel_config c = dma_channel_get_default_config(dma_channel);
	channel_config_set_read_increment(&c, false);
	channel_config_set_write_increment(&c, true);
	channel_config_set_dreq(&c, pio_get_dreq(data_pio, data_pio_sm, false));
	channel_config_set_transfer_data_size(&c, DMA_SIZE_32);

	dma_channel_configure(dma_channel, &c, dest, &data_pio->rxf[data_pio_sm], length / 4, true);
	capturing = true;

	pio_sm_set_enabled(data_pio, data_pio_sm, true);
	return 1;
}

int PicoOV7670::start_capture(uint8_t *dest)
{
	if (!is_ready())
		return 0;
	return arm_capture(dest, get_frame_bytes());
}

bool PicoOV7670::is_frame_ready(void)
{
	return !capturing || !dma_channel_is_busy(dma_channel);
}

void PicoOV7670::wait_for_frame(void)
{
	if (!capturing)
		return;

	// wait for DMA to finish
	dma_channel_wait_for_finish_blocking(dma_channel);
	// disable the image transfer PIO
	pio_sm_set_enabled(data_pio, data_pio_sm, false);
	capturing = false;
}
