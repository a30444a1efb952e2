// Copyright (c) 2025 The Polyvault Core developers
// Distributed under the MIT software license

#ifndef POLYVAULT_UTIL_SECURE_ALLOCATOR_H
#define POLYVAULT_UTIL_SECURE_ALLOCATOR_H

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <new>

#ifdef _WIN32
    #include <windows.h>
#else
    #include <sys/mman.h>
    #include <unistd.h>
#endif

/**
 * Secure memory for seeds, derived keys and decrypted mnemonics
 *
 * Pages handed out by SecureAllocator are locked (mlock / VirtualLock) so
 * they are not written to swap, and are overwritten with zeros before they
 * are returned to the heap. Locking is best-effort: an unprivileged process
 * with a low RLIMIT_MEMLOCK still gets working (but swappable) memory.
 *
 *   std::vector<uint8_t, SecureAllocator<uint8_t>> seed(64);
 */

/**
 * Zero memory in a way the optimizer cannot elide
 */
inline void secure_memory_cleanse(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) return;

#if defined(_MSC_VER)
    SecureZeroMemory(ptr, len);
#elif defined(__GNUC__) || defined(__clang__)
    std::memset(ptr, 0, len);
    __asm__ __volatile__("" : : "r"(ptr) : "memory");
#else
    volatile uint8_t* volatile_ptr = static_cast<volatile uint8_t*>(ptr);
    for (size_t i = 0; i < len; ++i) {
        volatile_ptr[i] = 0;
    }
#endif
}

/**
 * Pin pages in RAM. Returns false if the OS refused (not fatal).
 */
inline bool LockMemory(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) {
        return false;
    }
#ifdef _WIN32
    return VirtualLock(ptr, len) != 0;
#else
    return mlock(ptr, len) == 0;
#endif
}

inline bool UnlockMemory(void* ptr, size_t len) {
    if (ptr == nullptr || len == 0) {
        return false;
    }
#ifdef _WIN32
    return VirtualUnlock(ptr, len) != 0;
#else
    return munlock(ptr, len) == 0;
#endif
}

template <typename T>
class SecureAllocator {
public:
    typedef T value_type;
    typedef T* pointer;
    typedef const T* const_pointer;
    typedef T& reference;
    typedef const T& const_reference;
    typedef size_t size_type;
    typedef ptrdiff_t difference_type;

    template <typename U>
    struct rebind {
        typedef SecureAllocator<U> other;
    };

    SecureAllocator() noexcept {}
    SecureAllocator(const SecureAllocator&) noexcept {}
    template <typename U>
    SecureAllocator(const SecureAllocator<U>&) noexcept {}
    ~SecureAllocator() noexcept {}

    pointer allocate(size_type n) {
        if (n > max_size()) {
            throw std::bad_alloc();
        }

        size_type bytes = n * sizeof(T);
        void* ptr = ::operator new(bytes);

        // Touch the pages before locking so mlock sees initialised memory
        std::memset(ptr, 0, bytes);
        LockMemory(ptr, bytes);

        return static_cast<pointer>(ptr);
    }

    void deallocate(pointer ptr, size_type n) noexcept {
        if (ptr == nullptr) {
            return;
        }

        size_type bytes = n * sizeof(T);
        secure_memory_cleanse(ptr, bytes);
        UnlockMemory(ptr, bytes);
        ::operator delete(ptr);
    }

    size_type max_size() const noexcept {
        return std::numeric_limits<size_type>::max() / sizeof(T);
    }
};

template <typename T, typename U>
bool operator==(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept {
    return true;
}

template <typename T, typename U>
bool operator!=(const SecureAllocator<T>&, const SecureAllocator<U>&) noexcept {
    return false;
}

#endif // POLYVAULT_UTIL_SECURE_ALLOCATOR_H
