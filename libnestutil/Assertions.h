/*
	This file is part of evmnest.

	evmnest is free software: you can redistribute it and/or modify
	it under the terms of the GNU General Public License as published by
	the Free Software Foundation, either version 3 of the License, or
	(at your option) any later version.

	evmnest is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
	GNU General Public License for more details.

	You should have received a copy of the GNU General Public License
	along with evmnest.  If not, see <http://www.gnu.org/licenses/>.
*/
// SPDX-License-Identifier: GPL-3.0
/**
 * Assertion macros that throw exceptions carrying a description.
 */

#pragma once

#include <libnestutil/Exceptions.h>

#include <string>

namespace evmnest::util
{

namespace assertions
{

inline std::string stringOrDefault(std::string _string, std::string _defaultString)
{
	// NOTE: Putting this in a function rather than directly in a macro prevents the string from
	// being evaluated multiple times if it's not just a literal.
	return (!_string.empty() ? _string : _defaultString);
}

}

/// Base macro that can be used to implement assertion macros.
/// Throws an exception containing the given description if the condition is not met.
/// Allows you to provide the default description for the case where the user of your macro does
/// not provide any.
/// The second parameter must be an exception class (rather than an instance).
#define assertThrowWithDefaultDescription(_condition, _exceptionType, _description, _defaultDescription) \
	do \
	{ \
		if (!(_condition)) \
			nestThrow( \
				_exceptionType, \
				::evmnest::util::assertions::stringOrDefault((_description), (_defaultDescription)) \
			); \
	} \
	while (false)

/// Helper for dispatching on the number of arguments of nestAssert.
#define GENERIC_EVMNEST_MACRO_DISPATCHER(_1, _2, NAME, ...) NAME

#define nestAssert_1(CONDITION) \
	nestAssert_2((CONDITION), "")

#define nestAssert_2(CONDITION, DESCRIPTION) \
	assertThrowWithDefaultDescription( \
		(CONDITION), \
		::evmnest::util::InternalError, \
		(DESCRIPTION), \
		"evmnest assertion failed" \
	)

/// Assertion that throws an InternalError containing the given description if it is not met.
#define nestAssert(...) GENERIC_EVMNEST_MACRO_DISPATCHER(__VA_ARGS__, nestAssert_2, nestAssert_1, 0)(__VA_ARGS__)

}
