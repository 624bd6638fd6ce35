#pragma once

/**
 * @file Memory.h
 * @brief Aligned memory management for dynamic matrices
 */

#include <CircFit/Core/Constants.h>

#include <cstddef>
#include <cstdint>

namespace Circ::Fit::Platform {

/**
 * @brief Allocate aligned memory
 * @param size Size in bytes
 * @param alignment Alignment in bytes (default: 64)
 * @return Pointer to aligned memory, or nullptr for size 0
 * @throws std::bad_alloc if the allocation fails
 */
void* AlignedAlloc(size_t size, size_t alignment = MEMORY_ALIGNMENT);

/**
 * @brief Free aligned memory
 * @param ptr Pointer previously returned by AlignedAlloc
 */
void AlignedFree(void* ptr);

/**
 * @brief Check if pointer is aligned
 */
inline bool IsAligned(const void* ptr, size_t alignment = MEMORY_ALIGNMENT) {
    return (reinterpret_cast<uintptr_t>(ptr) % alignment) == 0;
}

} // namespace Circ::Fit::Platform
