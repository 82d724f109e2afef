#pragma once

#include <stddef.h> // size_t
#include <stdint.h> // uint32_t

namespace ttraster {
    namespace detail {

        // Read-only big-endian cursor over a byte slice. Reads past the end
        // return 0 and set `overrun`, which stays set for the lifetime of the
        // cursor; callers check Ok() once after a group of reads.
        struct Buf {
            const uint8_t* data{};
            size_t cursor{};
            size_t size{};
            bool overrun{};

            Buf() = default;
            Buf(const uint8_t* data_, size_t size_) noexcept
                : data{ data_ }, size{ size_ } {}

            inline bool Ok() const noexcept { return !overrun; }
            inline bool Fits(size_t o, size_t n) const noexcept {
                return o <= size && n <= size - o;
            }
            inline size_t Remaining() const noexcept { return size - cursor; }

            inline uint8_t Get8() noexcept;
            inline void Seek(size_t o) noexcept;
            inline void Skip(size_t n) noexcept;
            inline uint32_t Get(int n) noexcept;
            inline uint16_t Get16() noexcept { return static_cast<uint16_t>(Get(2)); }
            inline uint32_t Get32() noexcept { return Get(4); }
            inline int8_t GetI8() noexcept { return static_cast<int8_t>(Get8()); }
            inline int16_t GetI16() noexcept { return static_cast<int16_t>(Get16()); }

            // Cursor positioned at `o`; flagged when `o` is past the end.
            inline Buf At(size_t o) const noexcept { Buf b = *this; b.Seek(o); return b; }

            // Random access helpers. A failed read marks `ok` false.
            inline uint16_t U16(size_t o, bool& ok) const noexcept;
            inline int16_t  I16(size_t o, bool& ok) const noexcept {
                return static_cast<int16_t>(U16(o, ok));
            }
            inline uint32_t U32(size_t o, bool& ok) const noexcept;

            inline Buf Range(size_t o, size_t s) const noexcept;
            inline bool Tag(size_t o, const char* tag) const noexcept;
        }; // struct Buf



        inline uint8_t Buf::Get8() noexcept {
            if (cursor >= size) {
                overrun = true;
                return 0;
            }
            return data[cursor++];
        }

        inline void Buf::Seek(size_t o) noexcept {
            if (o > size) {
                overrun = true;
                o = size;
            }
            cursor = o;
        }

        inline void Buf::Skip(size_t n) noexcept {
            if (n > size - cursor) {
                overrun = true;
                cursor = size;
                return;
            }
            cursor += n;
        }

        inline uint32_t Buf::Get(int n) noexcept {
            uint32_t v = 0;
            for (int i = 0; i < n; ++i)
                v = (v << 8) | Get8();
            return v;
        }

        inline uint16_t Buf::U16(size_t o, bool& ok) const noexcept {
            if (!Fits(o, 2)) {
                ok = false;
                return 0;
            }
            return static_cast<uint16_t>(data[o] << 8 | data[o + 1]);
        }

        inline uint32_t Buf::U32(size_t o, bool& ok) const noexcept {
            if (!Fits(o, 4)) {
                ok = false;
                return 0;
            }
            return (static_cast<uint32_t>(data[o]) << 24) |
                   (static_cast<uint32_t>(data[o + 1]) << 16) |
                   (static_cast<uint32_t>(data[o + 2]) << 8) |
                    static_cast<uint32_t>(data[o + 3]);
        }

        inline Buf Buf::Range(size_t o, size_t s) const noexcept {
            Buf r{};
            if (!Fits(o, s)) {
                r.overrun = true;
                return r;
            }
            r.data = data + o;
            r.size = s;
            return r;
        }

        inline bool Buf::Tag(size_t o, const char* tag) const noexcept {
            if (!Fits(o, 4)) return false;
            return data[o] == static_cast<uint8_t>(tag[0]) &&
                   data[o + 1] == static_cast<uint8_t>(tag[1]) &&
                   data[o + 2] == static_cast<uint8_t>(tag[2]) &&
                   data[o + 3] == static_cast<uint8_t>(tag[3]);
        }

    } // namespace detail
} // namespace ttraster
