#ifndef PicoOV7670_port_H
#define PicoOV7670_port_H

#include <stdint.h>


// Hardware seen by the sensor logic: the control bus, the two optional
// control lines, a delay source and the parallel capture engine. The RP2040
// implementation lives in PicoOV7670.cc; anything else (a simulated register
// file for instance) can drive PicoOV7670_sensor too.
class PicoOV7670_port {
public:
	virtual ~PicoOV7670_port() {}

	// single byte register access. Both return 1 on success, 0 if the
	// sensor didn't acknowledge. Each call owns the bus for its whole
	// duration
	virtual int write_reg(uint8_t reg, uint8_t value) = 0;
	virtual int read_reg(uint8_t reg, uint8_t *value) = 0;

	// optional shutdown (power down) and reset lines. The setters are
	// only called when the matching has_ method returns true
	virtual bool has_shutdown_pin(void) const = 0;
	virtual void set_shutdown_pin(bool level) = 0;
	virtual bool has_reset_pin(void) const = 0;
	virtual void set_reset_pin(bool level) = 0;

	// wait at least this long
	virtual void sleep_ms(uint32_t ms) = 0;

	// capture one frame of exactly length bytes into dest, blocking.
	// Returns 1 on success, 0 if the capture engine refused the request
	virtual int capture_frame(uint8_t *dest, uint32_t length) = 0;
};

#endif
