#pragma once

#include <stddef.h> // size_t
#include <stdint.h> // uint32_t
#include <memory>
#include <new>
#include <vector>

namespace ttraster {
    namespace detail {

        using Handle = uint32_t;
        constexpr Handle kNullHandle = 0xFFFFFFFFu;

        // Object pool addressed by handle. Objects are carved out of chunks
        // whose length depends on sizeof(T); released objects go on a free
        // list threaded through their `next` handle. T must expose a
        // `Handle next` member. A pool lives for one rasterization call.
        template <class T>
        struct HandlePool {
            // smaller objects -> more per chunk, larger -> fewer
            static constexpr uint32_t kPerChunk =
                sizeof(T) < 32 ? 2000 : sizeof(T) < 128 ? 800 : 100;

            std::vector<std::unique_ptr<T[]>> chunks; // chunk list
            Handle first_free{ kNullHandle };          // free list head
            uint32_t used_in_head_chunk{ kPerChunk };  // blocks handed out from the last chunk

            inline Handle Alloc() noexcept;
            inline void Free(Handle h) noexcept;

            inline T& operator[](Handle h) noexcept {
                return chunks[h / kPerChunk][h % kPerChunk];
            }
            inline const T& operator[](Handle h) const noexcept {
                return chunks[h / kPerChunk][h % kPerChunk];
            }
        };



        template <class T>
        inline Handle HandlePool<T>::Alloc() noexcept {
            if (first_free != kNullHandle) {
                const Handle h = first_free;
                first_free = (*this)[h].next;
                return h;
            }
            // no free space left
            if (used_in_head_chunk == kPerChunk) {
                if (chunks.size() >= kNullHandle / kPerChunk)
                    return kNullHandle;
                std::unique_ptr<T[]> c(new (std::nothrow) T[kPerChunk]);
                if (!c) return kNullHandle;
                try {
                    chunks.push_back(std::move(c));
                } catch (const std::bad_alloc&) {
                    return kNullHandle;
                }
                used_in_head_chunk = 0;
            }
            // return a block from the current chunk
            const Handle h = static_cast<Handle>(chunks.size() - 1) * kPerChunk + used_in_head_chunk;
            ++used_in_head_chunk;
            return h;
        } // Alloc


        template <class T>
        inline void HandlePool<T>::Free(Handle h) noexcept {
            (*this)[h].next = first_free;
            first_free = h;
        }

    } // namespace detail
} // namespace ttraster
