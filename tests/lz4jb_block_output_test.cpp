#include <gtest/gtest.h>

#include <string>

#include "lz4jb_header.h"
#include "lz4jb_test_util.h"
#include "lz4jb_xxh32.h"

using namespace Lz4Jb;
using namespace Lz4Jb::Test;

namespace {

const unsigned char dotsStream[] = {
	// "..." as a RAW block, blockSize 128 (level 0)
	  0x4c, 0x5a, 0x34, 0x42, 0x6c, 0x6f, 0x63, 0x6b
	, 0x10
	, 0x03, 0x00, 0x00, 0x00
	, 0x03, 0x00, 0x00, 0x00
	, 0x52, 0xe4, 0x77, 0x06
	, 0x2e, 0x2e, 0x2e
	// end marker
	, 0x4c, 0x5a, 0x34, 0x42, 0x6c, 0x6f, 0x63, 0x6b
	, 0x10
	, 0x00, 0x00, 0x00, 0x00
	, 0x00, 0x00, 0x00, 0x00
	, 0x00, 0x00, 0x00, 0x00
};

Bytes dotsBlock() {
	return Bytes(dotsStream, dotsStream + 24);
}

Bytes eosBytes(int token) {
	Bytes b(LZ4JB_HEADER_SIZE, 0);
	memcpy(b.data(), "LZ4Block", 8);
	b[8] = static_cast<char>(token);
	return b;
}

size_t countMagic(const Bytes& b) {
	const std::string s(b.begin(), b.end());
	size_t n = 0;
	for(auto p = s.find("LZ4Block"); p != std::string::npos; p = s.find("LZ4Block", p + 1)) {
		++n;
	}
	return n;
}

// Walks the block headers of a well formed stream.
std::vector<Header> headersOf(const Bytes& b) {
	std::vector<Header> hs;
	size_t pos = 0;
	while(pos + LZ4JB_HEADER_SIZE <= b.size()) {
		Header h;
		if(LZ4JB_RESULT_OK != loadHeader(&b[pos], &h)) {
			break;
		}
		hs.push_back(h);
		pos += LZ4JB_HEADER_SIZE + h.compressedSize;
	}
	return hs;
}

int failingCompress(const char*, char*, int, int, int) {
	return -1;
}

int refusingCompress(const char*, char*, int, int, int) {
	return 0;
}

} // namespace

TEST(BlockOutput, SmallRawBlock) {
	const auto out = encode(toBytes("..."), 128);
	EXPECT_EQ(out, Bytes(dotsStream, dotsStream + sizeof(dotsStream)));
}

TEST(BlockOutput, SmallRawBlockDefaultBlockSize) {
	const auto out = encode(toBytes("..."));
	ASSERT_EQ(out.size(), 24u + LZ4JB_HEADER_SIZE);
	EXPECT_EQ(static_cast<unsigned char>(out[8]), 0x16);
	EXPECT_EQ(Bytes(out.begin() + 24, out.end()), eosBytes(0x16));
}

TEST(BlockOutput, EmptyInputIsOnlyEndMarker) {
	EXPECT_EQ(encode(Bytes()), eosBytes(0x16));
	EXPECT_EQ(encode(Bytes(), 64), eosBytes(0x10));
	EXPECT_EQ(encode(Bytes(), 1 << 25), eosBytes(0x1f));
}

TEST(BlockOutput, CompressionLevelFollowsBlockSize) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 2048);
	EXPECT_EQ(o.getBlockSize(), 2048);
	EXPECT_EQ(o.getCompressionLevel(), 1);
	EXPECT_EQ(o.result(), LZ4JB_RESULT_OK);
	EXPECT_FALSE(o.isClosed());
}

TEST(BlockOutput, CloseIsIdempotent) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 128);
	ASSERT_EQ(o.write("...", 3), LZ4JB_RESULT_OK);
	ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);
	const auto first = out.data;
	EXPECT_EQ(o.close(), LZ4JB_RESULT_OK);
	EXPECT_TRUE(o.isClosed());
	EXPECT_EQ(out.data, first);
}

TEST(BlockOutput, WriteAfterClose) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 128);
	ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);
	const auto size = out.data.size();
	EXPECT_EQ(o.write("...", 3), LZ4JB_RESULT_STREAM_CLOSED);
	EXPECT_EQ(o.flush(), LZ4JB_RESULT_STREAM_CLOSED);
	EXPECT_EQ(out.data.size(), size);
}

TEST(BlockOutput, DestructionWithoutCloseWritesNothing) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	{
		BlockOutput o(&ctx, 128);
		ASSERT_EQ(o.write("...", 3), LZ4JB_RESULT_OK);
	}
	EXPECT_TRUE(out.data.empty());
}

TEST(BlockOutput, FlushEmitsBufferedBytes) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 128);
	ASSERT_EQ(o.write("...", 3), LZ4JB_RESULT_OK);
	EXPECT_TRUE(out.data.empty());
	ASSERT_EQ(o.flush(), LZ4JB_RESULT_OK);
	EXPECT_EQ(out.data, dotsBlock());

	// nothing buffered, nothing written
	ASSERT_EQ(o.flush(), LZ4JB_RESULT_OK);
	EXPECT_EQ(out.data, dotsBlock());

	ASSERT_EQ(o.write("...", 3), LZ4JB_RESULT_OK);
	ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);

	Bytes expected = dotsBlock();
	expected.insert(expected.end(), dotsStream, dotsStream + sizeof(dotsStream));
	EXPECT_EQ(out.data, expected);
}

TEST(BlockOutput, FullBlockIsEmittedImmediately) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 64);
	const auto src = randomBytes(64);
	ASSERT_EQ(o.write(src.data(), 63), LZ4JB_RESULT_OK);
	EXPECT_TRUE(out.data.empty());
	ASSERT_EQ(o.write(&src[63], 1), LZ4JB_RESULT_OK);
	EXPECT_EQ(out.data.size(), LZ4JB_HEADER_SIZE + 64);
}

TEST(BlockOutput, IncompressibleBlockIsRaw) {
	const auto src = randomBytes(1024);
	const auto out = encode(src, 1024);
	const auto hs = headersOf(out);
	ASSERT_EQ(hs.size(), 2u);
	EXPECT_EQ(hs[0].method, Method::RAW);
	EXPECT_EQ(hs[0].compressedSize, 1024u);
	EXPECT_EQ(hs[0].originalSize, 1024u);
	EXPECT_EQ(hs[0].checksum, blockChecksum(src.data(), src.size()));
	EXPECT_EQ(Bytes(out.begin() + LZ4JB_HEADER_SIZE, out.begin() + LZ4JB_HEADER_SIZE + 1024), src);
	EXPECT_TRUE(hs[1].isEos());
}

TEST(BlockOutput, CompressibleBlockIsLz4) {
	const Bytes src(1024, '.');
	const auto out = encode(src, 1024);
	const auto hs = headersOf(out);
	ASSERT_EQ(hs.size(), 2u);
	EXPECT_EQ(static_cast<unsigned char>(out[8]), 0x20);
	EXPECT_EQ(hs[0].method, Method::LZ4);
	EXPECT_LT(hs[0].compressedSize, 1024u);
	EXPECT_EQ(hs[0].originalSize, 1024u);
	EXPECT_LT(out.size(), src.size());
}

TEST(BlockOutput, ZeroFromCompressorMeansRaw) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	ctx.compress = refusingCompress;
	BlockOutput o(&ctx, 128);
	ASSERT_EQ(o.write("...", 3), LZ4JB_RESULT_OK);
	ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);
	EXPECT_EQ(out.data, Bytes(dotsStream, dotsStream + sizeof(dotsStream)));
}

TEST(BlockOutput, CompressorFailure) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	ctx.compress = failingCompress;
	BlockOutput o(&ctx, 128);
	ASSERT_EQ(o.write("...", 3), LZ4JB_RESULT_OK);
	EXPECT_EQ(o.close(), LZ4JB_RESULT_COMPRESS_FAIL);
	EXPECT_TRUE(o.isClosed());
	EXPECT_EQ(ctx.result, LZ4JB_RESULT_COMPRESS_FAIL);
	EXPECT_TRUE(out.data.empty());
}

TEST(BlockOutput, BlockCountFollowsInputSize) {
	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 128);
	const Bytes chunk(128, '.');
	for(int i = 0; i < 1234; ++i) {
		ASSERT_EQ(o.write(chunk.data(), chunk.size()), LZ4JB_RESULT_OK);
	}
	ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);
	EXPECT_EQ(countMagic(out.data), 1235u);
}

TEST(BlockOutput, ChunkingDoesNotChangeOutput) {
	const int blockSize = 1024;
	const auto src = textBytes(3 * blockSize + 77);
	const auto expected = encode(src, blockSize);

	const size_t splits[] = {
		0, 1, blockSize - 1, blockSize, blockSize + 1, src.size() / 2, src.size() - 1, src.size()
	};
	for(const auto split : splits) {
		MemoryStream out;
		auto ctx = makeContext(nullptr, &out);
		BlockOutput o(&ctx, blockSize);
		ASSERT_EQ(o.write(src.data(), split), LZ4JB_RESULT_OK);
		ASSERT_EQ(o.write(src.data() + split, src.size() - split), LZ4JB_RESULT_OK);
		ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);
		EXPECT_EQ(out.data, expected) << "split at " << split;
	}

	MemoryStream out;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, blockSize);
	for(const auto c : src) {
		ASSERT_EQ(o.write(&c, 1), LZ4JB_RESULT_OK);
	}
	ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);
	EXPECT_EQ(out.data, expected);
}

TEST(BlockOutput, InvalidBlockSize) {
	const int sizes[] = { 0, 63, LZ4JB_BLOCK_SIZE_MAX + 1, -1 };
	for(const auto blockSize : sizes) {
		MemoryStream out;
		auto ctx = makeContext(nullptr, &out);
		BlockOutput o(&ctx, blockSize);
		EXPECT_EQ(o.result(), LZ4JB_RESULT_BAD_ARG);
		EXPECT_TRUE(o.isClosed());
		EXPECT_EQ(ctx.result, LZ4JB_RESULT_BAD_ARG);
		EXPECT_EQ(o.write("...", 3), LZ4JB_RESULT_STREAM_CLOSED);
		EXPECT_EQ(o.close(), LZ4JB_RESULT_BAD_ARG);
		EXPECT_TRUE(out.data.empty());
	}
}

TEST(BlockOutput, MissingSink) {
	auto ctx = makeContext(nullptr, nullptr);
	BlockOutput o(&ctx, 128);
	EXPECT_EQ(o.result(), LZ4JB_RESULT_BAD_ARG);
	EXPECT_TRUE(o.isClosed());
}

TEST(BlockOutput, SinkFailureOnBlock) {
	MemoryStream out;
	out.writeLimit = 10;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 64);
	const auto src = randomBytes(64);
	EXPECT_EQ(o.write(src.data(), src.size()), LZ4JB_RESULT_CANNOT_WRITE_BLOCK);
	EXPECT_TRUE(o.isClosed());
	EXPECT_EQ(ctx.result, LZ4JB_RESULT_CANNOT_WRITE_BLOCK);
	EXPECT_EQ(o.write(src.data(), src.size()), LZ4JB_RESULT_STREAM_CLOSED);
	EXPECT_EQ(o.close(), LZ4JB_RESULT_CANNOT_WRITE_BLOCK);
}

TEST(BlockOutput, SinkFailureOnEndMarker) {
	MemoryStream out;
	out.writeLimit = 24 + 5;
	auto ctx = makeContext(nullptr, &out);
	BlockOutput o(&ctx, 128);
	ASSERT_EQ(o.write("...", 3), LZ4JB_RESULT_OK);
	EXPECT_EQ(o.close(), LZ4JB_RESULT_CANNOT_WRITE_EOS);
	EXPECT_TRUE(o.isClosed());
	EXPECT_EQ(o.result(), LZ4JB_RESULT_CANNOT_WRITE_EOS);
	EXPECT_EQ(o.close(), LZ4JB_RESULT_CANNOT_WRITE_EOS);
}

TEST(BlockOutput, EverySplitPoint) {
	const int blockSize = 64;
	const auto src = textBytes(3 * blockSize + 17);
	const auto expected = encode(src, blockSize);

	for(size_t a = 0; a <= src.size(); ++a) {
		for(size_t b = a; b <= src.size(); b += 13) {
			MemoryStream out;
			auto ctx = makeContext(nullptr, &out);
			BlockOutput o(&ctx, blockSize);
			ASSERT_EQ(o.write(src.data(), a), LZ4JB_RESULT_OK);
			ASSERT_EQ(o.write(src.data() + a, b - a), LZ4JB_RESULT_OK);
			ASSERT_EQ(o.write(src.data() + b, src.size() - b), LZ4JB_RESULT_OK);
			ASSERT_EQ(o.close(), LZ4JB_RESULT_OK);
			ASSERT_EQ(out.data, expected) << "split at " << a << ", " << b;
		}
	}
}
