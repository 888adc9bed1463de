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

#include <libnestcodec/CodecErrors.h>
#include <libnestcodec/NestedArray.h>

#include <boost/test/tools/assertion_result.hpp>

#include <cstdint>
#include <functional>

namespace evmnest::test
{

/// Passes if @a _operation throws a CodecError of kind @a _expected. The message names the kind that
/// was thrown instead, if any.
boost::test_tools::predicate_result failsWith(std::function<void()> const& _operation, codec::CodecErrorKind _expected);

/// Passes if @a _actual equals @a _expected, printing both arrays otherwise.
boost::test_tools::predicate_result sameArray(codec::NestedArray const& _actual, codec::NestedArray const& _expected);

/// Passes if @a _actual equals @a _expected, printing both buffers otherwise.
boost::test_tools::predicate_result sameBuffer(codec::WordsConstRef _actual, codec::WordsConstRef _expected);

/// @returns a ragged array with up to @a _maxArrays inner arrays of up to @a _maxLength elements each.
/// The result depends on @a _seed only.
codec::NestedArray randomNestedArray(uint64_t _seed, size_t _maxArrays = 6, size_t _maxLength = 5);

}
