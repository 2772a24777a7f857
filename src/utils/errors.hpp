/*
 * -----------------------------------------------------------------------------
 * Filename:      errors.hpp
 *
 * Author:        MalabZ
 *
 * Created Date:  2026-09-03
 *
 * Last Modified: 2026-09-03
 *
 * Description:
 *  Exception types for the fatal error classes of Bramble
 *
 * Version:
 *  1.0
 * -----------------------------------------------------------------------------
 */
#pragma once
#ifndef ERRORS_HPP
#define ERRORS_HPP
#include <stdexcept>
#include <string>

namespace bramble {
	// k, smer size or syncmer offset differ between an artifact and the requested configuration
	class ConfigMismatchError : public std::runtime_error {
	public:
		explicit ConfigMismatchError(const std::string& what) : std::runtime_error(what) {}
	};

	// A structural invariant of an artifact is broken (ordering, keys, positions)
	class InvariantError : public std::logic_error {
	public:
		explicit InvariantError(const std::string& what) : std::logic_error(what) {}
	};

	// Missing input or unwritable output
	class ResourceError : public std::runtime_error {
	public:
		explicit ResourceError(const std::string& what) : std::runtime_error(what) {}
	};
}

#endif // ERRORS_HPP
