#pragma once

#include <stddef.h> // size_t
#include <stdint.h> // uint32_t

#include "../error.hpp"
#include "buf.hpp"
#include "enums.hpp"
#include "table_dir.hpp"

namespace ttraster {
    namespace detail {

        // The encoding subtable chosen at load time.
        struct IndexMap {
            uint32_t offset{}; // from the start of the file
            uint32_t size{};   // bytes up to the end of the cmap table
            uint16_t format{};
        };

        // Checks that the fixed part and the declared arrays of a subtable fit.
        inline Error ValidateIndexMap(const Buf& sub, uint16_t format) noexcept {
            bool ok = true;
            switch (format) {
            case 0:
                return sub.Fits(0, 6 + 256) ? Error::None : Error::Malformed;
            case 4: {
                const size_t seg_count = sub.U16(6, ok) >> 1;
                if (!ok) return Error::Malformed;
                return sub.Fits(0, 16 + seg_count * 8) ? Error::None : Error::Malformed;
            }
            case 6: {
                const size_t count = sub.U16(8, ok);
                if (!ok) return Error::Malformed;
                return sub.Fits(0, 10 + count * 2) ? Error::None : Error::Malformed;
            }
            case 12:
            case 13: {
                const size_t n_groups = sub.U32(12, ok);
                if (!ok) return Error::Malformed;
                if (n_groups > sub.size / 12) return Error::Malformed;
                return sub.Fits(0, 16 + n_groups * 12) ? Error::None : Error::Malformed;
            }
            default:
                // @TODO format 2 (high-byte mapping for japanese/chinese/korean)
                return Error::CmapFormatUnsupported;
            }
        }

        // Picks the best encoding record of a cmap table and validates its subtable.
        inline Error SelectIndexMap(const Buf& file, const TableRecord& cmap,
                                    IndexMap& out) noexcept {
            out = IndexMap{};
            const Buf table = cmap.Slice(file);
            if (!table.Ok()) return Error::Malformed;

            bool ok = true;
            const size_t num_tables = table.U16(2, ok);
            if (!ok || !table.Fits(4, num_tables * 8))
                return Error::Malformed;

            int best_rank = -1;
            uint32_t best_offset = 0;
            for (size_t i = 0; i < num_tables; ++i) {
                const size_t record = 4 + 8 * i;
                const uint16_t platform = table.U16(record, ok);
                const uint16_t encoding = table.U16(record + 2, ok);
                int rank;
                if (!EncodingRank(platform, encoding, rank))
                    continue;
                // ties keep the earliest record
                if (best_rank < 0 || rank < best_rank) {
                    best_rank = rank;
                    best_offset = table.U32(record + 4, ok);
                }
            }
            if (!ok) return Error::Malformed;
            if (best_rank < 0) return Error::CmapEncodingUnsupported;

            if (!table.Fits(best_offset, 2))
                return Error::Malformed;
            const Buf sub = table.Range(best_offset, table.size - best_offset);
            const uint16_t format = sub.U16(0, ok);
            if (!ok) return Error::Malformed;

            const Error err = ValidateIndexMap(sub, format);
            if (err != Error::None) return err;

            out.offset = cmap.offset + best_offset;
            out.size = static_cast<uint32_t>(sub.size);
            out.format = format;
            return Error::None;
        }

        // Maps a codepoint through a validated subtable. Unmapped codes give glyph 0.
        inline Error LookupGlyph(const Buf& sub, uint16_t format, int codepoint,
                                 int& glyph) noexcept {
            glyph = 0;
            if (codepoint < 0) return Error::None;
            const uint32_t code = static_cast<uint32_t>(codepoint);
            bool ok = true;

            if (format == 0) { // Apple byte encoding
                if (code < 256) {
                    if (!sub.Fits(6 + code, 1)) return Error::Malformed;
                    glyph = sub.data[6 + code];
                }
                return Error::None;
            }
            else if (format == 6) {
                const uint32_t first = sub.U16(6, ok);
                const uint32_t count = sub.U16(8, ok);
                if (!ok) return Error::Malformed;
                if (code >= first && code < first + count) {
                    glyph = sub.U16(10 + (code - first) * 2, ok);
                    if (!ok) return Error::Malformed;
                }
                return Error::None;
            }
            // standard mapping for windows fonts: binary search collection of ranges
            else if (format == 4) {
                if (code > 0xFFFF) return Error::None;

                const size_t seg_count = sub.U16(6, ok) >> 1;
                if (!ok) return Error::Malformed;
                const size_t end_codes = 14;
                const size_t start_codes = 16 + seg_count * 2;
                const size_t id_deltas = 16 + seg_count * 4;
                const size_t id_range_offsets = 16 + seg_count * 6;

                // first segment whose endCode >= code
                size_t low = 0, high = seg_count;
                while (low < high) {
                    const size_t mid = low + ((high - low) >> 1);
                    const uint16_t end = sub.U16(end_codes + mid * 2, ok);
                    if (!ok) return Error::Malformed;
                    if (code > end) low = mid + 1;
                    else            high = mid;
                }
                if (low == seg_count) return Error::None;

                const size_t item = low;
                const uint16_t start = sub.U16(start_codes + item * 2, ok);
                const uint16_t delta = sub.U16(id_deltas + item * 2, ok);
                const size_t range_pos = id_range_offsets + item * 2;
                const uint16_t range_offset = sub.U16(range_pos, ok);
                if (!ok) return Error::Malformed;
                if (code < start) return Error::None;

                if (range_offset == 0) {
                    glyph = static_cast<uint16_t>(code + delta);
                    return Error::None;
                }
                const uint16_t g = sub.U16(range_pos + range_offset + (code - start) * 2, ok);
                if (!ok) return Error::Malformed;
                glyph = g == 0 ? 0 : static_cast<uint16_t>(g + delta);
                return Error::None;
            }
            else if (format == 12 || format == 13) {
                const uint32_t n_groups = sub.U32(12, ok);
                if (!ok) return Error::Malformed;
                uint32_t low = 0, high = n_groups;
                // Binary search the right group.
                while (low < high) {
                    const uint32_t mid = low + ((high - low) >> 1); // low <= mid < high
                    const size_t group = 16 + static_cast<size_t>(mid) * 12;
                    const uint32_t start_char = sub.U32(group, ok);
                    const uint32_t end_char = sub.U32(group + 4, ok);
                    if (!ok) return Error::Malformed;
                    if (code < start_char)
                        high = mid;
                    else if (code > end_char)
                        low = mid + 1;
                    else {
                        const uint32_t start_glyph = sub.U32(group + 8, ok);
                        if (!ok) return Error::Malformed;
                        // format 13: one glyph for the whole group
                        uint64_t g = start_glyph;
                        if (format == 12)
                            g += code - start_char;
                        // glyph ids are 16 bit; anything larger maps to the missing glyph
                        glyph = g > 0xFFFF ? 0 : static_cast<int>(g);
                        return Error::None;
                    }
                }
                return Error::None; // not found
            }
            return Error::CmapFormatUnsupported;
        }

    } // namespace detail
} // namespace ttraster
