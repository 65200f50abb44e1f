#ifndef PicoOV7670_mclk_H
#define PicoOV7670_mclk_H

#include <stdint.h>


// PWM slice settings for the master clock: the counter runs at
// sys_freq / div and wraps every period counts
struct PicoOV7670_mclk_pwm {
	uint32_t div;		// integer divider, 1..255
	uint32_t period;	// 2..65536
	uint32_t freq;		// resulting frequency in Hz
};

// find the PWM settings closest to mclk_freq. Frequencies above sys_freq / 2
// are clamped to sys_freq / 2, frequencies too low for the 8 bit divider are
// clamped to the slowest clock the slice can make. Returns 0 if mclk_freq is 0
int PicoOV7670_mclk_setup(uint32_t sys_freq, uint32_t mclk_freq, PicoOV7670_mclk_pwm *pwm);

#endif
