/*
==============================================================================
	File: IBlockSink.h
	Desc: Where the block controller hands off everything it produces.
	Called synchronously from inside the tick, in order:
	  on_block_start -> (on_record | on_cycle_summary | on_phase)* -> on_block_end
	on_block_end is called exactly once for every terminal state (completed,
	aborted, faulted) and must leave everything durable on disk.
==============================================================================
*/

#pragma once
#include "../utils/Types.h"
#include "../config/BlockConfig.hpp"

struct IBlockSink_S {
	virtual ~IBlockSink_S() = default;
	virtual void on_block_start(const blockConfig_S& cfg) = 0;
	virtual void on_record(const record_S& rec) = 0;
	virtual void on_cycle_summary(const qcSummary_S& summary) = 0;
	virtual void on_phase(const phaseTiming_S& phase) = 0;
	virtual void on_block_end(const blockResult_S& result) = 0;
}; // IBlockSink_S
