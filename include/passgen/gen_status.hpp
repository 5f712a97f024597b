#pragma once

#include <string_view>

namespace passgen {

enum class GenStatus {
    Ok = 0,
    InvalidLength,
    FileIOError,
    EmptyPool,
    MissingRngBytes
};

inline std::string_view ToString(const GenStatus status) {
    switch (status) {
        case GenStatus::Ok:
            return "Ok";
        case GenStatus::InvalidLength:
            return "InvalidLength";
        case GenStatus::FileIOError:
            return "FileIOError";
        case GenStatus::EmptyPool:
            return "EmptyPool";
        case GenStatus::MissingRngBytes:
            return "MissingRngBytes";
    }
    return "UnknownStatus";
}

}  // namespace passgen
