/**
 * @file Memory.cpp
 * @brief Aligned heap allocation
 */

#include <CircFit/Platform/Memory.h>

#include <cstdlib>
#include <new>

#ifdef _MSC_VER
#include <malloc.h>
#endif

namespace Circ::Fit::Platform {

void* AlignedAlloc(size_t size, size_t alignment) {
    if (size == 0) return nullptr;

#ifdef _MSC_VER
    void* ptr = _aligned_malloc(size, alignment);
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    return ptr;
#else
    void* ptr = nullptr;
    if (posix_memalign(&ptr, alignment, size) != 0) {
        throw std::bad_alloc();
    }
    return ptr;
#endif
}

void AlignedFree(void* ptr) {
    if (ptr == nullptr) return;

#ifdef _MSC_VER
    _aligned_free(ptr);
#else
    free(ptr);
#endif
}

} // namespace Circ::Fit::Platform
