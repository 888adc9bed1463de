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
/** @file CommonData.h
 * Shared algorithms and data types for byte strings and words.
 */

#pragma once

#include <libnestutil/Common.h>

#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace evmnest::util
{

enum class HexPrefix
{
	DontAdd = 0,
	Add = 1,
};

enum class HexCase
{
	Lower = 0,
	Upper = 1,
};

/// Convert a series of bytes to the corresponding string of hex duplets,
/// optionally with "0x" prefix and in uppercase.
/// @example toHex("A\x69") == "4169"
std::string toHex(bytesConstRef _data, HexPrefix _prefix = HexPrefix::DontAdd, HexCase _case = HexCase::Lower);

/// @returns the shortest hex representation of @a _value prefixed by "0x", i.e. "0x0" for zero.
std::string toCompactHexWithPrefix(u256 const& _value);

/// Converts a big-endian byte-stream represented on a templated collection to a templated integer value.
/// @a _In will typically be either std::string or bytes.
/// @a T will typically by unsigned, u160, u256 or bigint.
template <class T, class _In>
inline T fromBigEndian(_In const& _bytes)
{
	T ret = static_cast<T>(0);
	for (auto i: _bytes)
		ret = static_cast<T>((ret << 8) | static_cast<uint8_t>(static_cast<typename std::make_unsigned<typename _In::value_type>::type>(i)));
	return ret;
}

/// Converts a templated integer value to the big-endian byte-stream represented on a templated collection.
/// The size of the collection object will be unchanged. If it is too small, it will not represent the
/// value properly, if too big then the additional elements will be zeroed out.
/// @a Out will typically be either std::string or bytes.
/// @a T will typically by unsigned, u160, u256 or bigint.
template <class T, class Out>
inline void toBigEndian(T _val, Out&& o_out)
{
	static_assert(std::is_same<bigint, T>::value || !std::numeric_limits<T>::is_signed, "only unsigned types or bigint supported");
	for (auto i = o_out.size(); i != 0; _val >>= 8, i--)
	{
		T v = _val & static_cast<T>(0xff);
		o_out[i - 1] = static_cast<typename std::remove_reference_t<Out>::value_type>(static_cast<uint8_t>(v));
	}
}

/// @returns the number of bytes needed to represent @a _value, zero for zero.
unsigned bytesRequired(u256 _value);

/// @returns @a _a + @a _b or nullopt if the sum does not fit into size_t.
std::optional<size_t> checkedAdd(size_t _a, size_t _b);

}
