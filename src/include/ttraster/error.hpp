#pragma once

namespace ttraster {

    // Result of every fallible decode operation. `None` means success.
    enum class Error {
        None = 0,
        Malformed,                 // out-of-bounds read or inconsistent structure
        MissingTable,              // a required table tag is absent from the directory
        HeadVersionUnsupported,
        HheaVersionUnsupported,
        MaxpVersionUnsupported,
        CmapEncodingUnsupported,   // no recognized platform/encoding pair
        CmapFormatUnsupported,     // recognized subtable with an undecodable format
        UnknownLocationFormat      // head.indexToLocFormat is neither 0 nor 1
    };

    inline const char* ErrorString(Error e) noexcept {
        switch (e) {
        case Error::None:                    return "no error";
        case Error::Malformed:               return "malformed font data";
        case Error::MissingTable:            return "required table is missing";
        case Error::HeadVersionUnsupported:  return "unsupported 'head' table version";
        case Error::HheaVersionUnsupported:  return "unsupported 'hhea' table version";
        case Error::MaxpVersionUnsupported:  return "unsupported 'maxp' table version";
        case Error::CmapEncodingUnsupported: return "no supported 'cmap' encoding subtable";
        case Error::CmapFormatUnsupported:   return "unsupported 'cmap' subtable format";
        case Error::UnknownLocationFormat:   return "unknown 'loca' index format";
        }
        return "unknown error";
    }

} // namespace ttraster
