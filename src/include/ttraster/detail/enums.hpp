#pragma once

#include <stdint.h> // uint16_t

namespace ttraster {
    namespace detail {
        // some of the values for the IDs are below; for more see the OpenType spec:
        //      https://learn.microsoft.com/en-us/typography/opentype/spec/cmap
        enum class PlatformId : uint16_t {
            Unicode = 0,
            Mac = 1,
            Iso = 2,
            Microsoft = 3
        };


        enum class EncodingIdUnicode : uint16_t {
            Unicode          = 0,
            Unicode_1_1      = 1,
            Iso_10646        = 2,
            Unicode_2_0_Bmp  = 3,
            Unicode_2_0_Full = 4,
            Variation        = 5,
            Full_Repertoire  = 6  // last-resort fonts (format 13)
        };


        enum class EncodingIdMicrosoft : uint16_t {
            Symbol       = 0,
            Unicode_Bmp  = 1,
            ShiftJis     = 2,
            Unicode_Full = 10
        };


        // Selection priority of a cmap encoding record, lower wins.
        // Returns false for pairs we do not decode.
        inline bool EncodingRank(uint16_t platform, uint16_t encoding, int& rank) noexcept {
            switch (static_cast<PlatformId>(platform)) {
            case PlatformId::Unicode:
                switch (static_cast<EncodingIdUnicode>(encoding)) {
                case EncodingIdUnicode::Unicode_2_0_Full: rank = 0; return true;
                case EncodingIdUnicode::Unicode:
                case EncodingIdUnicode::Unicode_1_1:
                case EncodingIdUnicode::Unicode_2_0_Bmp:  rank = 1; return true;
                case EncodingIdUnicode::Full_Repertoire:  rank = 5; return true;
                default: return false;
                }
            case PlatformId::Microsoft:
                switch (static_cast<EncodingIdMicrosoft>(encoding)) {
                case EncodingIdMicrosoft::Unicode_Full: rank = 2; return true;
                case EncodingIdMicrosoft::Unicode_Bmp:  rank = 3; return true;
                case EncodingIdMicrosoft::Symbol:       rank = 4; return true;
                default: return false;
                }
            default:
                return false;
            }
        }
    } // namespace detail
} // namespace ttraster
