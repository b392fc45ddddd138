#include "ZlibInflate.hh"
#include "FileException.hh"

#include "narrow.hh"
#include "xrange.hh"

#include <limits>

namespace flashkit {

ZlibInflate::ZlibInflate(std::span<const uint8_t> input)
{
	if (input.size() > std::numeric_limits<decltype(s.avail_in)>::max()) {
		throw FileException("Error while decompressing: input file too big");
	}
	s.zalloc = nullptr;
	s.zfree  = nullptr;
	s.opaque = nullptr;
	s.next_in  = const_cast<uint8_t*>(input.data());
	s.avail_in = static_cast<decltype(s.avail_in)>(input.size());
	s.total_out = 0;
}

ZlibInflate::~ZlibInflate()
{
	if (wasInit) {
		inflateEnd(&s);
	}
}

void ZlibInflate::skip(size_t num)
{
	for ([[maybe_unused]] auto i : xrange(num)) (void)getByte();
}

uint8_t ZlibInflate::getByte()
{
	if (s.avail_in == 0) {
		throw FileException("Error while decompressing: unexpected end of file.");
	}
	--s.avail_in;
	return *(s.next_in++);
}

unsigned ZlibInflate::get16LE()
{
	unsigned result = getByte();
	result += getByte() << 8;
	return result;
}

std::string ZlibInflate::getCString()
{
	std::string result;
	while (auto c = narrow_cast<char>(getByte())) {
		result.push_back(c);
	}
	return result;
}

std::vector<uint8_t> ZlibInflate::inflate(size_t sizeHint)
{
	if (int err = inflateInit2(&s, -MAX_WBITS); err != Z_OK) {
		throw FileException("Error initializing inflate struct: ", zError(err));
	}
	wasInit = true;

	size_t outSize = sizeHint;
	std::vector<uint8_t> output(outSize);
	s.avail_out = uInt(outSize);
	while (true) {
		s.next_out = output.data() + s.total_out;
		int err = ::inflate(&s, Z_NO_FLUSH);
		if (err == Z_STREAM_END) {
			break;
		}
		if (err != Z_OK) {
			throw FileException("Error decompressing gzip: ", zError(err));
		}
		auto oldSize = outSize;
		outSize = oldSize * 2;
		output.resize(outSize);
		s.avail_out = uInt(outSize - oldSize);
	}

	output.resize(s.total_out);
	return output;
}

} // namespace flashkit
