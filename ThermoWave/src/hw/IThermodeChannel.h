/*
==============================================================================
	File: IThermodeChannel.h
	Desc: Abstract interface for thermode channels with different
	implementations (real TCS device over serial & simulated thermode for
	testing / dry runs). The block controller only ever talks to this.
	Note: channel is selected by configuration (--simulate), not by type.

	Errors: any communication failure throws thermode_fault (TcsCheck.h).
	close() never throws.
==============================================================================
*/

#pragma once
#include "../utils/Types.h"

struct IThermodeChannel_S {
	virtual ~IThermodeChannel_S() = default; // virtual destructor for proper cleanup of derived classes
	virtual void connect() = 0; // open device, push init sequence, enter follow mode
	virtual void set_zone_temperatures(const zoneTemps_T& temps) = 0;
	virtual zoneTemps_T read_zone_temperatures() = 0;
	virtual void return_to_baseline() = 0; // all zones back to the configured baseline
	virtual void close() noexcept = 0;
	virtual const char* backend_name() const = 0;
}; // IThermodeChannel_S
