/*
 * -----------------------------------------------------------------------------
 * Filename:      interrupt.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-20
 *
 * Last Modified: 2026-09-20
 *
 * Description:
 *  Process-level interruption between independent work units.
 *	Workers test interrupted() before starting a unit; the stage calls
 *	throwIfInterrupted() before it promotes any artifact.
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef INTERRUPT_HPP
#define INTERRUPT_HPP
#include <string>

namespace bramble {
	void installInterruptHandler();
	bool interrupted() noexcept;
	void requestInterrupt() noexcept;
	void clearInterrupt() noexcept;
	void throwIfInterrupted(const std::string& stage);
}

#endif // INTERRUPT_HPP
