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

#include <test/Common.h>

#include <libnestcodec/LayoutPrinter.h>

#include <fmt/format.h>

#include <algorithm>
#include <random>

using namespace evmnest;
using namespace evmnest::codec;

boost::test_tools::predicate_result evmnest::test::failsWith(std::function<void()> const& _operation, CodecErrorKind _expected)
{
	boost::test_tools::predicate_result result{false};
	try
	{
		_operation();
		result.message() << fmt::format("Expected {}, but no error was thrown.", errorKindName(_expected));
	}
	catch (CodecError const& _error)
	{
		if (_error.kind() == _expected)
			return true;
		result.message() << fmt::format(
			"Expected {}, got {}: {}",
			errorKindName(_expected),
			errorKindName(_error.kind()),
			_error.what()
		);
	}
	return result;
}

boost::test_tools::predicate_result evmnest::test::sameArray(NestedArray const& _actual, NestedArray const& _expected)
{
	if (_actual == _expected)
		return true;
	boost::test_tools::predicate_result result{false};
	result.message() << fmt::format("Expected {}, got {}", toString(_expected), toString(_actual));
	return result;
}

boost::test_tools::predicate_result evmnest::test::sameBuffer(WordsConstRef _actual, WordsConstRef _expected)
{
	if (std::equal(_actual.begin(), _actual.end(), _expected.begin(), _expected.end()))
		return true;
	boost::test_tools::predicate_result result{false};
	result.message() << "Expected:\n" << LayoutPrinter{_expected} << "Got:\n" << LayoutPrinter{_actual};
	return result;
}

NestedArray evmnest::test::randomNestedArray(uint64_t _seed, size_t _maxArrays, size_t _maxLength)
{
	std::mt19937_64 generator{_seed};
	std::uniform_int_distribution<size_t> arrayCount{0, _maxArrays};
	std::uniform_int_distribution<size_t> length{0, _maxLength};
	// Mostly small values, with an occasional full-width word.
	std::uniform_int_distribution<int> wide{0, 3};

	NestedArray result(arrayCount(generator));
	for (auto& innerArray: result)
	{
		innerArray.resize(length(generator));
		for (auto& element: innerArray)
		{
			element = generator();
			if (wide(generator) == 0)
				for (int i = 0; i < 3; ++i)
					element = (element << 64) | u256(generator());
		}
	}
	return result;
}
