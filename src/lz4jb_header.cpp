#include <string.h>
#include "lz4jb_header.h"


namespace {

const int LZ4JB_TOKEN_METHOD_MASK = 0xf0;
const int LZ4JB_TOKEN_LEVEL_MASK = 0x0f;

int ceilLog2(uint32_t v) {
	int r = 0;
	for(uint32_t x = v - 1; x; x >>= 1) {
		++r;
	}
	return r;
}

bool isMethod(int m) {
	return static_cast<int>(Lz4Jb::Method::RAW) == m
		|| static_cast<int>(Lz4Jb::Method::LZ4) == m;
}

char methodToChar(Lz4Jb::Method method, int compressionLevel) {
	return static_cast<char>(
		  (static_cast<int>(method) & LZ4JB_TOKEN_METHOD_MASK)
		| (compressionLevel & LZ4JB_TOKEN_LEVEL_MASK)
	);
}

} // anonymous namespace


namespace Lz4Jb {

const char LZ4JB_MAGIC[LZ4JB_MAGIC_SIZE] = { 'L', 'Z', '4', 'B', 'l', 'o', 'c', 'k' };


Header makeEosHeader(int compressionLevel) {
	Header h;
	h.method			= Method::RAW;
	h.compressionLevel	= compressionLevel;
	h.compressedSize	= 0;
	h.originalSize		= 0;
	h.checksum			= 0;
	return h;
}


bool isValidBlockSize(int blockSize) {
	return blockSize >= LZ4JB_BLOCK_SIZE_MIN && blockSize <= LZ4JB_BLOCK_SIZE_MAX;
}


int compressionLevelFromBlockSize(int blockSize) {
	const auto level = ceilLog2(static_cast<uint32_t>(blockSize)) - LZ4JB_COMPRESSION_LEVEL_BASE;
	return level > 0 ? level : 0;
}


int maxBlockSizeFromCompressionLevel(int compressionLevel) {
	return 1 << (LZ4JB_COMPRESSION_LEVEL_BASE + compressionLevel);
}


int maxCompressionLevel() {
	return compressionLevelFromBlockSize(LZ4JB_BLOCK_SIZE_MAX);
}


size_t storeU32(void* p, uint32_t v) {
	auto* q = reinterpret_cast<char*>(p);
	q[0] = static_cast<char>(v >> (8*0));
	q[1] = static_cast<char>(v >> (8*1));
	q[2] = static_cast<char>(v >> (8*2));
	q[3] = static_cast<char>(v >> (8*3));
	return sizeof(v);
}


uint32_t loadU32(const void* p) {
	auto* q = reinterpret_cast<const uint8_t*>(p);
	return (static_cast<uint32_t>(q[0]) << (8*0))
		 | (static_cast<uint32_t>(q[1]) << (8*1))
		 | (static_cast<uint32_t>(q[2]) << (8*2))
		 | (static_cast<uint32_t>(q[3]) << (8*3));
}


size_t storeHeader(void* dst, const Header& header) {
	auto* p = reinterpret_cast<char*>(dst);
	memcpy(p, LZ4JB_MAGIC, LZ4JB_MAGIC_SIZE);
	p += LZ4JB_MAGIC_SIZE;
	*p++ = methodToChar(header.method, header.compressionLevel);
	p += storeU32(p, header.compressedSize);
	p += storeU32(p, header.originalSize);
	p += storeU32(p, header.checksum);
	return static_cast<size_t>(p - reinterpret_cast<char*>(dst));
}


Lz4JbResult loadHeader(const void* src, Header* header) {
	const auto* p = reinterpret_cast<const char*>(src);

	if(0 != memcmp(p, LZ4JB_MAGIC, LZ4JB_MAGIC_SIZE)) {
		return LZ4JB_RESULT_INVALID_MAGIC_NUMBER;
	}
	p += LZ4JB_MAGIC_SIZE;

	const auto token = static_cast<uint8_t>(*p++);
	const int method = token & LZ4JB_TOKEN_METHOD_MASK;
	const int compressionLevel = token & LZ4JB_TOKEN_LEVEL_MASK;
	if(!isMethod(method) || compressionLevel > maxCompressionLevel()) {
		return LZ4JB_RESULT_INVALID_TOKEN;
	}

	Header h;
	h.method			= static_cast<Method>(method);
	h.compressionLevel	= compressionLevel;
	h.compressedSize	= loadU32(p + 0);
	h.originalSize		= loadU32(p + 4);
	h.checksum			= loadU32(p + 8);

	const auto maxBlockSize = static_cast<uint32_t>(maxBlockSizeFromCompressionLevel(compressionLevel));
	if(   h.originalSize > maxBlockSize
	   || (0 == h.originalSize) != (0 == h.compressedSize)
	   || (Method::RAW == h.method && h.originalSize != h.compressedSize)
	   || (h.isEos() && 0 != h.checksum)
	) {
		return LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER;
	}

	*header = h;
	return LZ4JB_RESULT_OK;
}

} // namespace Lz4Jb
