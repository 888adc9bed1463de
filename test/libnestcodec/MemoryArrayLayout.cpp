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

#include <libnestcodec/MemoryArrayLayout.h>

#include <libnestcodec/NestedArrayCodec.h>

#include <test/Common.h>
#include <test/libnestcodec/NestedArrayParser.h>

#include <boost/test/unit_test.hpp>

#include <limits>
#include <sstream>
#include <string>

using namespace evmnest;
using namespace evmnest::codec;

using evmnest::test::failsWith;
using evmnest::test::randomNestedArray;
using evmnest::test::sameArray;
using evmnest::test::sameBuffer;

namespace evmnest::codec::test
{

BOOST_AUTO_TEST_SUITE(MemoryArrayLayoutTest)

BOOST_AUTO_TEST_CASE(initial_memory)
{
	MemoryImage memory;
	BOOST_CHECK_EQUAL(memory.size(), MemoryImage::initialFreeMemory);
	BOOST_CHECK_EQUAL(memory.freeMemoryPointer(), u256(0x80));
	BOOST_CHECK_EQUAL(memory.load(MemoryImage::zeroSlot), u256(0));
}

BOOST_AUTO_TEST_CASE(load_and_store)
{
	MemoryImage memory;
	memory.store(0x100, 0x2a00);
	BOOST_CHECK_EQUAL(memory.size(), size_t(0x120));
	BOOST_CHECK_EQUAL(memory.load(0x100), u256(0x2a00));
	// unaligned access spans two words
	BOOST_CHECK_EQUAL(memory.load(0xff), u256(0x2a));

	BOOST_CHECK(failsWith([&] { memory.load(0x101); }, CodecErrorKind::OffsetOutOfRange));
	BOOST_CHECK(failsWith([&] { memory.load(std::numeric_limits<u256>::max()); }, CodecErrorKind::OffsetOutOfRange));
	BOOST_CHECK(failsWith([&] { memory.store(std::numeric_limits<u256>::max(), 1); }, CodecErrorKind::CapacityExceeded));
}

BOOST_AUTO_TEST_CASE(allocation)
{
	MemoryImage memory;
	BOOST_CHECK_EQUAL(memory.allocate(1), u256(0x80));
	BOOST_CHECK_EQUAL(memory.freeMemoryPointer(), u256(0xa0));
	BOOST_CHECK_EQUAL(memory.allocate(64), u256(0xa0));
	BOOST_CHECK_EQUAL(memory.freeMemoryPointer(), u256(0xe0));
	BOOST_CHECK_EQUAL(memory.size(), size_t(0xe0));

	memory.store(MemoryImage::freeMemoryPointerSlot, std::numeric_limits<u256>::max());
	BOOST_CHECK(failsWith([&] { memory.allocate(32); }, CodecErrorKind::CapacityExceeded));
}

BOOST_AUTO_TEST_CASE(contents_are_padded)
{
	MemoryImage memory{bytes{1, 2, 3}};
	BOOST_CHECK_EQUAL(memory.size(), wordSize);
	BOOST_CHECK_EQUAL(memory.load(0), (u256(0x010203) << (29 * 8)));
}

BOOST_AUTO_TEST_CASE(memory_layout)
{
	MemoryImage memory;
	u256 const pointer = storeNestedArray(memory, nestedArray("[[1, 2, 3], [4, 5, 6]]"));
	BOOST_CHECK_EQUAL(pointer, u256(0x80));
	// outer array: length and one pointer per inner array
	BOOST_CHECK_EQUAL(memory.load(0x80), u256(2));
	BOOST_CHECK_EQUAL(memory.load(0xa0), u256(0xe0));
	BOOST_CHECK_EQUAL(memory.load(0xc0), u256(0x160));
	// inner arrays
	BOOST_CHECK_EQUAL(memory.load(0xe0), u256(3));
	BOOST_CHECK_EQUAL(memory.load(0x100), u256(1));
	BOOST_CHECK_EQUAL(memory.load(0x140), u256(3));
	BOOST_CHECK_EQUAL(memory.load(0x160), u256(3));
	BOOST_CHECK_EQUAL(memory.load(0x1c0), u256(6));
	BOOST_CHECK_EQUAL(memory.freeMemoryPointer(), u256(0x1e0));
}

BOOST_AUTO_TEST_CASE(empty_inner_arrays_share_zero_slot)
{
	MemoryImage memory;
	u256 const pointer = storeNestedArray(memory, nestedArray("[[], [9], []]"));
	BOOST_CHECK_EQUAL(memory.load(pointer + 0x20), u256(MemoryImage::zeroSlot));
	BOOST_CHECK_EQUAL(memory.load(pointer + 0x60), u256(MemoryImage::zeroSlot));
	BOOST_CHECK(sameArray(loadNestedArray(memory, pointer), nestedArray("[[], [9], []]")));

	// Once the zero slot is dirty, empty arrays get their own length word.
	memory.store(MemoryImage::zeroSlot, 5);
	u256 const otherPointer = storeNestedArray(memory, nestedArray("[[]]"));
	BOOST_CHECK(memory.load(otherPointer + 0x20) != u256(MemoryImage::zeroSlot));
	BOOST_CHECK(sameArray(loadNestedArray(memory, otherPointer), nestedArray("[[]]")));
}

BOOST_AUTO_TEST_CASE(encode_from_memory_rewrites_pointers)
{
	MemoryImage memory;
	NestedArray const array = nestedArray("[[1, 2, 3], [4, 5, 6]]");
	u256 const pointer = storeNestedArray(memory, array);
	MemoryImage const before = memory;

	EncodedBuffer const buffer = encodeFromMemory(memory, pointer);
	BOOST_CHECK(sameBuffer(buffer, words("2  0 4  3 1 2 3  3 4 5 6")));
	BOOST_CHECK(memory == before);
}

BOOST_AUTO_TEST_CASE(memory_round_trip)
{
	for (uint64_t seed = 1; seed <= 16; ++seed)
	{
		NestedArray const array = randomNestedArray(seed);
		MemoryImage memory;
		// something already allocated
		memory.allocate(seed * 7);
		u256 const pointer = decodeToMemory(memory, NestedArrayCodec{}.encode(array));
		BOOST_CHECK(sameArray(loadNestedArray(memory, pointer), array));
		BOOST_CHECK(sameBuffer(encodeFromMemory(memory, pointer), NestedArrayCodec{}.encode(array)));
	}
}

BOOST_AUTO_TEST_CASE(decode_failure_leaves_memory_untouched)
{
	MemoryImage memory;
	MemoryImage const before = memory;
	BOOST_CHECK(failsWith([&] { decodeToMemory(memory, words("2  0 4  3 1 2")); }, CodecErrorKind::TruncatedBuffer));
	BOOST_CHECK(memory == before);
}

BOOST_AUTO_TEST_CASE(invalid_pointers)
{
	MemoryImage memory;
	u256 const pointer = storeNestedArray(memory, nestedArray("[[1, 2], [3]]"));

	BOOST_CHECK(failsWith([&] { loadNestedArray(memory, memory.size()); }, CodecErrorKind::OffsetOutOfRange));
	BOOST_CHECK(failsWith([&] { loadNestedArray(memory, std::numeric_limits<u256>::max()); }, CodecErrorKind::OffsetOutOfRange));

	MemoryImage corruptPointer = memory;
	corruptPointer.store(pointer + 0x40, std::numeric_limits<u256>::max() - 8);
	BOOST_CHECK(failsWith([&] { encodeFromMemory(corruptPointer, pointer); }, CodecErrorKind::OffsetOutOfRange));

	MemoryImage corruptInnerLength = memory;
	corruptInnerLength.store(corruptInnerLength.load(pointer + 0x20), 1000);
	BOOST_CHECK(failsWith([&] { encodeFromMemory(corruptInnerLength, pointer); }, CodecErrorKind::MalformedLength));

	MemoryImage corruptOuterLength = memory;
	corruptOuterLength.store(pointer, std::numeric_limits<u256>::max());
	BOOST_CHECK(failsWith([&] { encodeFromMemory(corruptOuterLength, pointer); }, CodecErrorKind::MalformedLength));
}

BOOST_AUTO_TEST_CASE(capacity_limit)
{
	MemoryImage memory;
	u256 const pointer = storeNestedArray(memory, nestedArray("[[1, 2, 3]]"));
	CodecSettings settings;
	settings.maxTotalWords = 5;
	BOOST_CHECK(failsWith([&] { encodeFromMemory(memory, pointer, settings); }, CodecErrorKind::CapacityExceeded));
	settings.maxTotalWords = 6;
	BOOST_CHECK_EQUAL(encodeFromMemory(memory, pointer, settings).size(), size_t(6));
}

BOOST_AUTO_TEST_CASE(decode_overlapping_inner_arrays_beyond_limit)
{
	size_t const arrayCount = 2000;
	EncodedBuffer buffer(1 + arrayCount, 0);
	buffer[0] = arrayCount;
	buffer.push_back(arrayCount - 1);
	buffer.resize(buffer.size() + arrayCount - 1, 7);

	CodecSettings settings;
	settings.maxTotalWords = buffer.size();
	MemoryImage memory;
	MemoryImage const before = memory;
	BOOST_CHECK(failsWith([&] { decodeToMemory(memory, buffer, settings); }, CodecErrorKind::CapacityExceeded));
	BOOST_CHECK(memory == before);

	u256 const pointer = decodeToMemory(memory, words("2  0 0  2 8 9"));
	BOOST_CHECK(sameArray(loadNestedArray(memory, pointer), nestedArray("[[8, 9], [8, 9]]")));
}

BOOST_AUTO_TEST_CASE(hex_dump)
{
	MemoryImage memory;
	std::ostringstream out;
	out << memory;
	std::string const dump = out.str();
	BOOST_CHECK(dump.starts_with("0x0000: " + std::string(64, '0') + "\n"));
	BOOST_CHECK(dump.find("0x0040: " + std::string(62, '0') + "80\n") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()

}
