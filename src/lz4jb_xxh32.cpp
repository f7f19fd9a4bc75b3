#include "xxhash.h"
#include "lz4jb_xxh32.h"


namespace Lz4Jb {

Xxh32::Xxh32(uint32_t seed)
	: st(XXH32_createState())
{
	reset(seed);
}


Xxh32::Xxh32(const void* input, size_t len, uint32_t seed)
	: st(XXH32_createState())
{
	reset(seed);
	update(input, len);
}


Xxh32::~Xxh32() {
	if(st) {
		XXH32_freeState(st);
	}
}


bool Xxh32::reset(uint32_t seed) {
	if(st) {
		return XXH_OK == XXH32_reset(st, seed);
	} else {
		return false;
	}
}


bool Xxh32::update(const void* input, size_t len) {
	if(st && 0 == len) {
		return true;
	} else if(st) {
		return XXH_OK == XXH32_update(st, input, len);
	} else {
		return false;
	}
}


uint32_t Xxh32::digest() const {
	if(st) {
		return XXH32_digest(st);
	} else {
		return 0;
	}
}


uint32_t blockChecksum(const void* input, size_t len) {
	return Xxh32(input, len, LZ4JB_CHECKSUM_SEED).digest() & LZ4JB_CHECKSUM_MASK;
}

} // namespace Lz4Jb
