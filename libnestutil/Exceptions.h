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

#pragma once

#include <boost/exception/diagnostic_information.hpp>
#include <boost/exception/exception.hpp>
#include <boost/exception/info.hpp>
#include <boost/throw_exception.hpp>

#include <exception>
#include <string>

#if defined(_MSC_VER)
#define NEST_FUNC __FUNCSIG__
#elif defined(__GNUC__)
#define NEST_FUNC __PRETTY_FUNCTION__
#else
#define NEST_FUNC __func__
#endif

namespace evmnest::util
{

/// Base class for all exceptions.
struct Exception: virtual std::exception, virtual boost::exception
{
	char const* what() const noexcept override;

	/// @returns "FileName:LineNumber" referring to the point where the exception was thrown.
	std::string lineInfo() const;

	/// @returns the errinfo_comment of this exception.
	std::string const* comment() const noexcept;
};

/// Throws an exception with a given description.
#define nestThrow(_exceptionType, _description) \
	::boost::throw_exception( \
		_exceptionType() << \
		::evmnest::util::errinfo_comment((_description)) << \
		::boost::throw_function(NEST_FUNC) << \
		::boost::throw_file(__FILE__) << \
		::boost::throw_line(__LINE__) \
	)

/// Thrown when an internal invariant of an evmnest library does not hold.
struct InternalError: virtual Exception {};

using errinfo_comment = boost::error_info<struct tag_comment, std::string>;

}
