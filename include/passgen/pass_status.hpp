#pragma once

#include <string_view>

namespace passgen {

enum class PassStatus {
    Ok = 0,
    NotFound,
    InvalidData,
    InvalidArgument,
    EmptyPool,
    InsufficientData,
    FileIOError,
    MissingRngBytes
};

inline std::string_view ToString(const PassStatus status) {
    switch (status) {
        case PassStatus::Ok:
            return "Ok";
        case PassStatus::NotFound:
            return "NotFound";
        case PassStatus::InvalidData:
            return "InvalidData";
        case PassStatus::InvalidArgument:
            return "InvalidArgument";
        case PassStatus::EmptyPool:
            return "EmptyPool";
        case PassStatus::InsufficientData:
            return "InsufficientData";
        case PassStatus::FileIOError:
            return "FileIOError";
        case PassStatus::MissingRngBytes:
            return "MissingRngBytes";
    }
    return "UnknownStatus";
}

inline std::string_view Describe(const PassStatus status) {
    switch (status) {
        case PassStatus::Ok:
            return "success";
        case PassStatus::NotFound:
            return "word list file not found";
        case PassStatus::InvalidData:
            return "word list looks invalid or too small";
        case PassStatus::InvalidArgument:
            return "argument out of range or not recognized";
        case PassStatus::EmptyPool:
            return "no characters left after exclusions";
        case PassStatus::InsufficientData:
            return "not enough distinct words to sample from";
        case PassStatus::FileIOError:
            return "could not write password log";
        case PassStatus::MissingRngBytes:
            return "random source unavailable";
    }
    return "unknown status";
}

}  // namespace passgen
