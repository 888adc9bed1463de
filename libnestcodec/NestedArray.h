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
 * Data model of the nested array codec: a ragged sequence of word sequences and its flat
 * word-buffer encoding.
 */

#pragma once

#include <libnestutil/Common.h>

#include <span>
#include <string>
#include <vector>

namespace evmnest::codec
{

/// One element of the outer sequence.
using InnerArray = std::vector<u256>;
/// Ordered sequence of inner arrays. Inner arrays may have differing lengths.
using NestedArray = std::vector<InnerArray>;

/// Flat, self-contained encoding of a NestedArray. Word 0 holds the number of inner arrays N,
/// words 1..N hold the offset table, everything after that is the data region. Every offset
/// table entry is a word index relative to the start of the data region and points at the
/// length word of its inner array, which is followed by the elements.
using EncodedBuffer = std::vector<u256>;
using WordsConstRef = std::span<u256 const>;

/// Renders @a _array as "[[1,2,3],[4,5,6]]" with decimal elements.
std::string toString(NestedArray const& _array);

}
