#ifndef LZ4JB_HEADER_H
#define LZ4JB_HEADER_H

#include <stddef.h>
#include <stdint.h>
#include "lz4jb.h"

namespace Lz4Jb {

const size_t LZ4JB_MAGIC_SIZE = 8;
const size_t LZ4JB_HEADER_SIZE = LZ4JB_MAGIC_SIZE + 1 + 4 + 4 + 4;
const int LZ4JB_COMPRESSION_LEVEL_BASE = 10;

extern const char LZ4JB_MAGIC[LZ4JB_MAGIC_SIZE];

enum class Method {
	  RAW	= 0x10
	, LZ4	= 0x20
};


struct Header {
	Method		method;
	int			compressionLevel;
	uint32_t	compressedSize;
	uint32_t	originalSize;
	uint32_t	checksum;

	bool isEos() const {
		return 0 == compressedSize && 0 == originalSize;
	}
};


Header makeEosHeader(int compressionLevel);

bool isValidBlockSize(int blockSize);

// ceil(log2(blockSize)) - LZ4JB_COMPRESSION_LEVEL_BASE, clamped at 0.
int compressionLevelFromBlockSize(int blockSize);
int maxBlockSizeFromCompressionLevel(int compressionLevel);
int maxCompressionLevel();

size_t storeU32(void* p, uint32_t v);
uint32_t loadU32(const void* p);

// Writes exactly LZ4JB_HEADER_SIZE bytes.
size_t storeHeader(void* dst, const Header& header);

// Parses and validates LZ4JB_HEADER_SIZE bytes. header is only written on
// LZ4JB_RESULT_OK.
Lz4JbResult loadHeader(const void* src, Header* header);

} // namespace Lz4Jb

#endif
