/*
 * -----------------------------------------------------------------------------
 * Filename:      interrupt.cpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-20
 *
 * Last Modified: 2026-09-20
 *
 * Description:
 *  SIGINT/SIGTERM handling
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#include <interrupt.hpp>
#include <atomic>
#include <csignal>
#include <stdexcept>

namespace bramble {
	namespace {
		std::atomic<bool> interruptFlag{ false };

		void onSignal(int) {
			interruptFlag.store(true, std::memory_order_relaxed);
		}
	}

	void installInterruptHandler() {
		std::signal(SIGINT, onSignal);
		std::signal(SIGTERM, onSignal);
	}

	bool interrupted() noexcept {
		return interruptFlag.load(std::memory_order_relaxed);
	}

	void requestInterrupt() noexcept {
		interruptFlag.store(true, std::memory_order_relaxed);
	}

	void clearInterrupt() noexcept {
		interruptFlag.store(false, std::memory_order_relaxed);
	}

	void throwIfInterrupted(const std::string& stage) {
		if (interrupted()) {
			throw std::runtime_error(stage + " interrupted, no output written");
		}
	}
}
