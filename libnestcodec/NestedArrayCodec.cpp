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

#include <libnestcodec/NestedArrayCodec.h>

#include <libnestutil/Assertions.h>
#include <libnestutil/CommonData.h>

#include <fmt/format.h>

#include <range/v3/view/enumerate.hpp>

#include <algorithm>
#include <optional>
#include <utility>

using namespace evmnest;
using namespace evmnest::codec;
using namespace evmnest::util;

NestedArrayCodec::NestedArrayCodec(CodecSettings _settings):
	m_settings(std::move(_settings))
{}

size_t NestedArrayCodec::wordCount(NestedArray const& _array) const
{
	// header word
	size_t total = 1;
	for (auto const& [index, innerArray]: _array | ranges::views::enumerate)
	{
		// offset table entry, length word and elements
		std::optional<size_t> next = checkedAdd(total, 2);
		if (next)
			next = checkedAdd(*next, innerArray.size());
		if (!next || *next > m_settings.maxTotalWords)
			BOOST_THROW_EXCEPTION(
				CapacityExceeded() <<
				errinfo_comment(fmt::format(
					"Encoding inner array {} exceeds the limit of {} words.",
					index,
					m_settings.maxTotalWords
				)) <<
				errinfo_arrayIndex(index)
			);
		total = *next;
	}
	if (total > m_settings.maxTotalWords)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format("The header alone exceeds the limit of {} words.", m_settings.maxTotalWords))
		);
	return total;
}

EncodedBuffer NestedArrayCodec::encode(NestedArray const& _array) const
{
	size_t const totalWords = wordCount(_array);
	if (_array.empty())
		return EncodedBuffer{u256(0)};

	EncodedBuffer buffer;
	buffer.reserve(totalWords);
	buffer.emplace_back(_array.size());

	// Offset table. The offsets are bounded by totalWords, which was checked above.
	size_t offset = 0;
	for (auto const& innerArray: _array)
	{
		buffer.emplace_back(offset);
		offset += 1 + innerArray.size();
	}

	// Data region.
	for (auto const& innerArray: _array)
	{
		buffer.emplace_back(innerArray.size());
		buffer.insert(buffer.end(), innerArray.begin(), innerArray.end());
	}

	nestAssert(buffer.size() == totalWords, "Encoded buffer size does not match the precomputed word count.");
	return buffer;
}

NestedArray NestedArrayCodec::decode(WordsConstRef _buffer) const
{
	NestedArray result;
	std::vector<InnerArrayLocation> const locations = locateInnerArrays(_buffer);
	result.reserve(locations.size());
	for (auto const& location: locations)
	{
		auto const elements = _buffer.subspan(location.start, location.length);
		result.emplace_back(elements.begin(), elements.end());
	}
	return result;
}

void NestedArrayCodec::validate(WordsConstRef _buffer) const
{
	locateInnerArrays(_buffer);
}

bool NestedArrayCodec::isCanonical(WordsConstRef _buffer)
{
	CodecSettings settings = CodecSettings::strict();
	settings.maxTotalWords = std::max<size_t>(_buffer.size(), 1);
	try
	{
		NestedArrayCodec{settings}.validate(_buffer);
	}
	catch (CodecError const&)
	{
		return false;
	}
	// The empty buffer decodes to the empty array, which is encoded as a single zero word.
	return !_buffer.empty();
}

std::vector<NestedArrayCodec::InnerArrayLocation> NestedArrayCodec::locateInnerArrays(WordsConstRef _buffer) const
{
	if (_buffer.size() > m_settings.maxTotalWords)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format(
				"Buffer of {} words exceeds the limit of {} words.",
				_buffer.size(),
				m_settings.maxTotalWords
			)) <<
			errinfo_wordIndex(m_settings.maxTotalWords)
		);

	if (_buffer.empty() || _buffer[0] == 0)
	{
		if (m_settings.strictCanonical && _buffer.size() > 1)
			BOOST_THROW_EXCEPTION(
				NonCanonicalBuffer() <<
				errinfo_comment(fmt::format("{} words follow the header of an empty nested array.", _buffer.size() - 1)) <<
				errinfo_wordIndex(1)
			);
		return {};
	}

	if (_buffer[0] > _buffer.size() - 1)
		BOOST_THROW_EXCEPTION(
			TruncatedBuffer() <<
			errinfo_comment(fmt::format(
				"Buffer of {} words cannot hold the offset table of {} inner arrays.",
				_buffer.size(),
				_buffer[0].str()
			)) <<
			errinfo_wordIndex(_buffer.size())
		);

	size_t const arrayCount = static_cast<size_t>(_buffer[0]);
	WordsConstRef const offsetTable = _buffer.subspan(1, arrayCount);
	size_t const dataStart = 1 + arrayCount;
	size_t const dataSize = _buffer.size() - dataStart;

	// Start of the inner array that begins last inside the buffer. If only that one runs past the end,
	// the buffer was cut short rather than carrying a corrupt length word.
	std::optional<size_t> lastStart;
	for (u256 const& offset: offsetTable)
		if (offset < dataSize)
			lastStart = std::max(lastStart.value_or(0), static_cast<size_t>(offset));

	std::vector<InnerArrayLocation> locations;
	locations.reserve(arrayCount);
	// Where the previous inner array in table order ends, i.e. where canonical form continues.
	size_t expectedOffset = 0;
	// Size of the canonical encoding of the result. Overlapping inner arrays make it grow beyond the buffer.
	size_t resultWords = 1 + 2 * arrayCount;
	for (auto const& [index, offset]: offsetTable | ranges::views::enumerate)
	{
		if (offset >= dataSize)
		{
			if (offset == expectedOffset)
				BOOST_THROW_EXCEPTION(
					TruncatedBuffer() <<
					errinfo_comment(fmt::format(
						"Inner array {} starts at data word {}, but the data region ends after {} words.",
						index,
						offset.str(),
						dataSize
					)) <<
					errinfo_wordIndex(_buffer.size()) <<
					errinfo_arrayIndex(index)
				);
			BOOST_THROW_EXCEPTION(
				OffsetOutOfRange() <<
				errinfo_comment(fmt::format(
					"Offset table entry {} points to data word {}, outside of the data region of {} words.",
					index,
					offset.str(),
					dataSize
				)) <<
				errinfo_wordIndex(1 + index) <<
				errinfo_arrayIndex(index)
			);
		}

		size_t const start = static_cast<size_t>(offset);
		if (m_settings.strictCanonical && start != expectedOffset)
			BOOST_THROW_EXCEPTION(
				NonCanonicalBuffer() <<
				errinfo_comment(fmt::format(
					"Offset table entry {} is {}, but the previous inner array ends at {}.",
					index,
					start,
					expectedOffset
				)) <<
				errinfo_wordIndex(1 + index) <<
				errinfo_arrayIndex(index)
			);

		u256 const& length = _buffer[dataStart + start];
		size_t const available = dataSize - start - 1;
		if (length > available)
		{
			if (start == lastStart)
				BOOST_THROW_EXCEPTION(
					TruncatedBuffer() <<
					errinfo_comment(fmt::format(
						"Inner array {} has {} elements, but only {} words follow its length word.",
						index,
						length.str(),
						available
					)) <<
					errinfo_wordIndex(_buffer.size()) <<
					errinfo_arrayIndex(index)
				);
			BOOST_THROW_EXCEPTION(
				MalformedLength() <<
				errinfo_comment(fmt::format(
					"Length word {} of inner array {} runs past the end of the buffer ({} words available).",
					length.str(),
					index,
					available
				)) <<
				errinfo_wordIndex(dataStart + start) <<
				errinfo_arrayIndex(index)
			);
		}

		std::optional<size_t> const total = checkedAdd(resultWords, static_cast<size_t>(length));
		if (!total || *total > m_settings.maxTotalWords)
			BOOST_THROW_EXCEPTION(
				CapacityExceeded() <<
				errinfo_comment(fmt::format(
					"Decoding inner array {} exceeds the limit of {} words.",
					index,
					m_settings.maxTotalWords
				)) <<
				errinfo_arrayIndex(index)
			);
		resultWords = *total;

		locations.push_back({dataStart + start + 1, static_cast<size_t>(length)});
		expectedOffset = start + 1 + static_cast<size_t>(length);
	}

	if (m_settings.strictCanonical && expectedOffset != dataSize)
		BOOST_THROW_EXCEPTION(
			NonCanonicalBuffer() <<
			errinfo_comment(fmt::format(
				"{} words follow the last inner array.",
				dataSize - expectedOffset
			)) <<
			errinfo_wordIndex(dataStart + expectedOffset)
		);

	return locations;
}
