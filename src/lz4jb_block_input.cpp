#include <string.h>
#include "lz4jb_block_input.h"
#include "lz4jb_header.h"
#include "lz4jb_xxh32.h"


namespace {

bool isUsableContext(const Lz4JbContext* ctx) {
	return ctx
		&& ctx->read
		&& ctx->decompress
		&& ctx->compressBound;
}

} // anonymous namespace


namespace Lz4Jb {

BlockInput::BlockInput(Lz4JbContext* ctx)
	: ctx(ctx)
	, srcBuffer()
	, dstBuffer()
	, dstPos(0)
	, dstSize(0)
	, ended(false)
	, res(LZ4JB_RESULT_OK)
	, streamInfo(lz4jbInitStreamInfo())
{
	if(!isUsableContext(ctx)) {
		quit(LZ4JB_RESULT_BAD_ARG);
	}
}


BlockInput::~BlockInput() {
}


int BlockInput::read(void* dst, int dstCapacity) {
	auto* p = reinterpret_cast<char*>(dst);
	int total = 0;

	while(total < dstCapacity) {
		if(dstPos == dstSize && !refill()) {
			break;
		}

		const auto avail = dstSize - dstPos;
		const auto want = static_cast<size_t>(dstCapacity - total);
		const auto n = want < avail ? want : avail;
		memcpy(p + total, &dstBuffer[dstPos], n);
		dstPos += n;
		total  += static_cast<int>(n);
	}

	return total;
}


bool BlockInput::refill() {
	if(ended || LZ4JB_RESULT_OK != res) {
		return false;
	}

	char d[LZ4JB_HEADER_SIZE];
	const auto headerSize = readBin(d, sizeof(d));
	if(headerSize < 0) {
		return quit(LZ4JB_RESULT_CANNOT_READ);
	}
	if(sizeof(d) != static_cast<size_t>(headerSize)) {
		return quit(LZ4JB_RESULT_TRUNCATED);
	}

	Header h;
	const auto r = loadHeader(d, &h);
	if(LZ4JB_RESULT_OK != r) {
		return quit(r);
	}
	streamInfo.compressedSize += LZ4JB_HEADER_SIZE;

	if(h.isEos()) {
		ended = true;
		return false;
	}

	const auto maxBlockSize = maxBlockSizeFromCompressionLevel(h.compressionLevel);
	const auto cmpBound = static_cast<uint32_t>(ctx->compressBound(maxBlockSize));
	if(h.compressedSize > cmpBound) {
		return quit(LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER);
	}

	const auto srcSize = static_cast<int>(h.compressedSize);
	const auto orgSize = static_cast<int>(h.originalSize);

	if(dstBuffer.size() < h.originalSize) {
		dstBuffer.resize(h.originalSize);
	}

	if(Method::RAW == h.method) {
		const auto readSize = readBin(dstBuffer.data(), srcSize);
		if(readSize < 0) {
			return quit(LZ4JB_RESULT_CANNOT_READ);
		}
		if(srcSize != readSize) {
			return quit(LZ4JB_RESULT_TRUNCATED);
		}
	} else {
		if(srcBuffer.size() < h.compressedSize) {
			srcBuffer.resize(h.compressedSize);
		}
		const auto readSize = readBin(srcBuffer.data(), srcSize);
		if(readSize < 0) {
			return quit(LZ4JB_RESULT_CANNOT_READ);
		}
		if(srcSize != readSize) {
			return quit(LZ4JB_RESULT_TRUNCATED);
		}

		const auto decSize = ctx->decompress(srcBuffer.data(), dstBuffer.data(), srcSize, orgSize);
		if(decSize != orgSize) {
			return quit(LZ4JB_RESULT_DECOMPRESS_FAIL);
		}
	}

	if(blockChecksum(dstBuffer.data(), h.originalSize) != h.checksum) {
		return quit(LZ4JB_RESULT_BLOCK_CHECKSUM_MISMATCH);
	}

	streamInfo.blocks += 1;
	streamInfo.rawBlocks += (Method::RAW == h.method) ? 1 : 0;
	streamInfo.compressedSize += h.compressedSize;
	streamInfo.originalSize += h.originalSize;

	dstPos  = 0;
	dstSize = h.originalSize;
	return true;
}


int BlockInput::readBin(void* dst, int size) {
	auto* p = reinterpret_cast<char*>(dst);
	int total = 0;
	while(total < size) {
		const auto n = ctx->read(ctx, p + total, size - total);
		if(n < 0) {
			return n;
		}
		if(0 == n) {
			break;
		}
		total += n;
	}
	return total;
}


bool BlockInput::quit(Lz4JbResult result) {
	if(LZ4JB_RESULT_OK == res) {
		res = result;
	}
	dstPos  = 0;
	dstSize = 0;
	if(ctx && LZ4JB_RESULT_OK == ctx->result) {
		ctx->result = res;
	}
	return false;
}

} // namespace Lz4Jb
