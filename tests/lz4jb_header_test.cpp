#include <gtest/gtest.h>

#include <string.h>
#include <vector>

#include "lz4jb_header.h"

using namespace Lz4Jb;

namespace {

const unsigned char rawDotsHeader[] = {
	  0x4c, 0x5a, 0x34, 0x42, 0x6c, 0x6f, 0x63, 0x6b	// "LZ4Block"
	, 0x10												// RAW, level 0
	, 0x03, 0x00, 0x00, 0x00							// compressed
	, 0x03, 0x00, 0x00, 0x00							// original
	, 0x52, 0xe4, 0x77, 0x06							// checksum of "..."
};

std::vector<char> headerBytes(int token, uint32_t compressedSize, uint32_t originalSize, uint32_t checksum) {
	std::vector<char> d(LZ4JB_HEADER_SIZE);
	memcpy(d.data(), LZ4JB_MAGIC, LZ4JB_MAGIC_SIZE);
	d[LZ4JB_MAGIC_SIZE] = static_cast<char>(token);
	storeU32(&d[LZ4JB_MAGIC_SIZE + 1], compressedSize);
	storeU32(&d[LZ4JB_MAGIC_SIZE + 5], originalSize);
	storeU32(&d[LZ4JB_MAGIC_SIZE + 9], checksum);
	return d;
}

Lz4JbResult load(const std::vector<char>& d) {
	Header h;
	return loadHeader(d.data(), &h);
}

} // namespace

TEST(Header, SizeIs21Bytes) {
	EXPECT_EQ(LZ4JB_HEADER_SIZE, 21u);
	EXPECT_EQ(0, memcmp(LZ4JB_MAGIC, "LZ4Block", 8));
}

TEST(Header, CompressionLevelFromBlockSize) {
	EXPECT_EQ(compressionLevelFromBlockSize(64), 0);
	EXPECT_EQ(compressionLevelFromBlockSize(1024), 0);
	EXPECT_EQ(compressionLevelFromBlockSize(1025), 1);
	EXPECT_EQ(compressionLevelFromBlockSize(2048), 1);
	EXPECT_EQ(compressionLevelFromBlockSize(65536), 6);
	EXPECT_EQ(compressionLevelFromBlockSize(1 << 25), 15);
	EXPECT_EQ(maxCompressionLevel(), 15);
}

TEST(Header, LevelBoundsEveryBlockSize) {
	for(int blockSize = LZ4JB_BLOCK_SIZE_MIN; blockSize <= LZ4JB_BLOCK_SIZE_MAX; blockSize = blockSize * 2 + 1) {
		if(!isValidBlockSize(blockSize)) {
			break;
		}
		const auto level = compressionLevelFromBlockSize(blockSize);
		EXPECT_GE(maxBlockSizeFromCompressionLevel(level), blockSize);
	}
	EXPECT_EQ(maxBlockSizeFromCompressionLevel(6), 65536);
	EXPECT_EQ(maxBlockSizeFromCompressionLevel(15), 1 << 25);
}

TEST(Header, BlockSizeRange) {
	EXPECT_FALSE(isValidBlockSize(0));
	EXPECT_FALSE(isValidBlockSize(63));
	EXPECT_TRUE(isValidBlockSize(64));
	EXPECT_TRUE(isValidBlockSize(LZ4JB_BLOCK_SIZE_DEFAULT));
	EXPECT_TRUE(isValidBlockSize(1 << 25));
	EXPECT_FALSE(isValidBlockSize((1 << 25) + 1));
	EXPECT_FALSE(isValidBlockSize(-1));
}

TEST(Header, StoreRawBlockHeader) {
	Header h;
	h.method			= Method::RAW;
	h.compressionLevel	= 0;
	h.compressedSize	= 3;
	h.originalSize		= 3;
	h.checksum			= 0x0677e452;

	char d[LZ4JB_HEADER_SIZE];
	EXPECT_EQ(storeHeader(d, h), LZ4JB_HEADER_SIZE);
	EXPECT_EQ(0, memcmp(d, rawDotsHeader, sizeof(rawDotsHeader)));
}

TEST(Header, StoreEosHeader) {
	char d[LZ4JB_HEADER_SIZE];
	storeHeader(d, makeEosHeader(6));
	EXPECT_EQ(0, memcmp(d, "LZ4Block", 8));
	EXPECT_EQ(static_cast<unsigned char>(d[8]), 0x16);
	for(size_t i = 9; i < LZ4JB_HEADER_SIZE; ++i) {
		EXPECT_EQ(d[i], 0) << "offset " << i;
	}
}

TEST(Header, LoadRawBlockHeader) {
	Header h;
	ASSERT_EQ(loadHeader(rawDotsHeader, &h), LZ4JB_RESULT_OK);
	EXPECT_EQ(h.method, Method::RAW);
	EXPECT_EQ(h.compressionLevel, 0);
	EXPECT_EQ(h.compressedSize, 3u);
	EXPECT_EQ(h.originalSize, 3u);
	EXPECT_EQ(h.checksum, 0x0677e452u);
	EXPECT_FALSE(h.isEos());
}

TEST(Header, LoadCompressedBlockHeader) {
	Header h;
	const auto d = headerBytes(0x26, 1000, 65536, 0x01234567);
	ASSERT_EQ(loadHeader(d.data(), &h), LZ4JB_RESULT_OK);
	EXPECT_EQ(h.method, Method::LZ4);
	EXPECT_EQ(h.compressionLevel, 6);
	EXPECT_EQ(h.compressedSize, 1000u);
	EXPECT_EQ(h.originalSize, 65536u);
	EXPECT_EQ(h.checksum, 0x01234567u);
}

TEST(Header, LoadEosHeader) {
	Header h;
	const auto d = headerBytes(0x16, 0, 0, 0);
	ASSERT_EQ(loadHeader(d.data(), &h), LZ4JB_RESULT_OK);
	EXPECT_TRUE(h.isEos());
}

TEST(Header, BadMagic) {
	auto d = headerBytes(0x10, 3, 3, 0);
	d[3] = 'b';
	EXPECT_EQ(load(d), LZ4JB_RESULT_INVALID_MAGIC_NUMBER);
}

TEST(Header, InvalidMethod) {
	EXPECT_EQ(load(headerBytes(0x00, 3, 3, 0)), LZ4JB_RESULT_INVALID_TOKEN);
	EXPECT_EQ(load(headerBytes(0x30, 3, 3, 0)), LZ4JB_RESULT_INVALID_TOKEN);
	EXPECT_EQ(load(headerBytes(0xf6, 3, 3, 0)), LZ4JB_RESULT_INVALID_TOKEN);
}

TEST(Header, OriginalSizeAboveLevelBound) {
	EXPECT_EQ(load(headerBytes(0x20, 100, 1024, 0)), LZ4JB_RESULT_OK);
	EXPECT_EQ(load(headerBytes(0x20, 100, 1025, 0)), LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER);
}

TEST(Header, InconsistentLengths) {
	EXPECT_EQ(load(headerBytes(0x20, 0, 10, 0)), LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER);
	EXPECT_EQ(load(headerBytes(0x20, 10, 0, 0)), LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER);
	EXPECT_EQ(load(headerBytes(0x10, 9, 10, 0)), LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER);
}

TEST(Header, EosWithChecksumIsCorrupted) {
	EXPECT_EQ(load(headerBytes(0x10, 0, 0, 1)), LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER);
}

TEST(Header, U32IsLittleEndian) {
	unsigned char d[4];
	EXPECT_EQ(storeU32(d, 0x11223344), 4u);
	EXPECT_EQ(d[0], 0x44);
	EXPECT_EQ(d[1], 0x33);
	EXPECT_EQ(d[2], 0x22);
	EXPECT_EQ(d[3], 0x11);
	EXPECT_EQ(loadU32(d), 0x11223344u);
}
