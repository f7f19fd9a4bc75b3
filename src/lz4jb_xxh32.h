#ifndef LZ4JB_XXH32_H
#define LZ4JB_XXH32_H

#include <stddef.h>
#include <stdint.h>

struct XXH32_state_s;

namespace Lz4Jb {

const uint32_t LZ4JB_CHECKSUM_SEED = 0x9747b28c;
const uint32_t LZ4JB_CHECKSUM_MASK = 0x0fffffff;

class Xxh32 {
public:
	Xxh32(uint32_t seed);
	Xxh32(const void* input, size_t len, uint32_t seed);
	~Xxh32();
	bool reset(uint32_t seed);
	bool update(const void* input, size_t len);
	uint32_t digest() const;

private:
	Xxh32(const Xxh32&);
	const Xxh32& operator=(const Xxh32&);

	XXH32_state_s* st;
};

// Checksum stored in a block header: only the low 28 bits of the hash
// are kept, as written by LZ4BlockOutputStream.
uint32_t blockChecksum(const void* input, size_t len);

} // namespace Lz4Jb

#endif
