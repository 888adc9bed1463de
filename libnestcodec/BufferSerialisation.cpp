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

#include <libnestcodec/BufferSerialisation.h>

#include <libnestcodec/CodecErrors.h>
#include <libnestcodec/NestedArrayCodec.h>

#include <libnestutil/Assertions.h>
#include <libnestutil/CommonData.h>

#include <fmt/format.h>

using namespace evmnest;
using namespace evmnest::codec;
using namespace evmnest::util;

namespace
{

void assertValidWordWidth(size_t _wordWidth)
{
	nestAssert(_wordWidth > 0 && _wordWidth <= wordSize, fmt::format("Invalid word width of {} bytes.", _wordWidth));
}

}

bytes evmnest::codec::toBytes(WordsConstRef _words, size_t _wordWidth)
{
	assertValidWordWidth(_wordWidth);

	bytes result(_words.size() * _wordWidth);
	for (size_t i = 0; i < _words.size(); ++i)
	{
		if (bytesRequired(_words[i]) > _wordWidth)
			BOOST_THROW_EXCEPTION(
				CapacityExceeded() <<
				errinfo_comment(fmt::format(
					"Word {} ({}) does not fit into {} bytes.",
					i,
					toCompactHexWithPrefix(_words[i]),
					_wordWidth
				)) <<
				errinfo_wordIndex(i)
			);
		toBigEndian(_words[i], std::span<uint8_t>(result).subspan(i * _wordWidth, _wordWidth));
	}
	return result;
}

EncodedBuffer evmnest::codec::fromBytes(bytesConstRef _data, size_t _wordWidth)
{
	assertValidWordWidth(_wordWidth);

	if (_data.size() % _wordWidth != 0)
		BOOST_THROW_EXCEPTION(
			TruncatedBuffer() <<
			errinfo_comment(fmt::format(
				"Byte string of length {} ends inside a word of {} bytes.",
				_data.size(),
				_wordWidth
			)) <<
			errinfo_wordIndex(_data.size() / _wordWidth)
		);

	EncodedBuffer words;
	words.reserve(_data.size() / _wordWidth);
	for (size_t offset = 0; offset < _data.size(); offset += _wordWidth)
		words.emplace_back(fromBigEndian<u256>(_data.subspan(offset, _wordWidth)));
	return words;
}

bytes evmnest::codec::encodeToBytes(NestedArray const& _array, CodecSettings const& _settings, size_t _wordWidth)
{
	return toBytes(NestedArrayCodec{_settings}.encode(_array), _wordWidth);
}

NestedArray evmnest::codec::decodeFromBytes(bytesConstRef _data, CodecSettings const& _settings, size_t _wordWidth)
{
	assertValidWordWidth(_wordWidth);
	if (_data.size() / _wordWidth > _settings.maxTotalWords)
		BOOST_THROW_EXCEPTION(
			CapacityExceeded() <<
			errinfo_comment(fmt::format(
				"Byte string of length {} holds more than {} words.",
				_data.size(),
				_settings.maxTotalWords
			)) <<
			errinfo_wordIndex(_settings.maxTotalWords)
		);
	return NestedArrayCodec{_settings}.decode(fromBytes(_data, _wordWidth));
}
