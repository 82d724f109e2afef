#pragma once

#include <stdint.h> // uint32_t

#include "../error.hpp"
#include "buf.hpp"

namespace ttraster {
    namespace detail {

        // Location of one table, as an offset from the start of the file.
        struct TableRecord {
            bool present{};
            uint32_t offset{};
            uint32_t length{};

            inline Buf Slice(const Buf& file) const noexcept { return file.Range(offset, length); }
        };

        // Scans the sfnt directory of the font that begins at `fontstart`.
        // A missing tag is not an error here (`out.present` stays false).
        inline Error FindTable(const Buf& file, size_t fontstart, const char* tag,
                               TableRecord& out) noexcept {
            out = TableRecord{};

            bool ok = true;
            const uint16_t num_tables = file.U16(fontstart + 4, ok);
            if (!ok) return Error::Malformed;

            const size_t table_dir = fontstart + 12;
            if (!file.Fits(table_dir, static_cast<size_t>(num_tables) * 16))
                return Error::Malformed;

            for (size_t i = 0; i < num_tables; ++i) {
                const size_t loc = table_dir + 16 * i;
                if (!file.Tag(loc, tag))
                    continue;

                const uint32_t offset = file.U32(loc + 8, ok);
                const uint32_t length = file.U32(loc + 12, ok);
                if (!ok || !file.Fits(offset, length))
                    return Error::Malformed;

                out.present = true;
                out.offset = offset;
                out.length = length;
                return Error::None;
            }
            return Error::None;
        }

        inline Error FindRequiredTable(const Buf& file, size_t fontstart, const char* tag,
                                       TableRecord& out) noexcept {
            const Error err = FindTable(file, fontstart, tag, out);
            if (err != Error::None) return err;
            return out.present ? Error::None : Error::MissingTable;
        }

    } // namespace detail
} // namespace ttraster
